// File: src/analysis/temporal_pattern_analyzer.cpp
#include "analysis/temporal_pattern_analyzer.hpp"
#include "analysis/statistics.hpp"
#include <algorithm>
#include <stdexcept>

namespace recur {

namespace {

void CheckThreshold(double value, const char* name) {
    if (!(value > 0.0 && value <= 1.0)) {
        throw std::invalid_argument(std::string(name) + " must be in (0, 1]");
    }
}

} // anonymous namespace

TemporalPatternAnalyzer::TemporalPatternAnalyzer(
    const Config& config, std::shared_ptr<const HolidayCalendar> holidays)
    : config_(config), calendar_(std::move(holidays)) {
    CheckThreshold(config_.consistency_threshold, "consistency_threshold");
    CheckThreshold(config_.weekday_threshold, "weekday_threshold");
    CheckThreshold(config_.day_threshold, "day_threshold");
}

TemporalPatternResult TemporalPatternAnalyzer::Analyze(
    const std::vector<Transaction>& transactions) const {
    if (transactions.empty()) {
        return TemporalPatternResult{};
    }

    std::vector<Date> dates;
    dates.reserve(transactions.size());
    for (const auto& tx : transactions) {
        dates.push_back(ToDate(tx.date));
    }
    std::sort(dates.begin(), dates.end());

    if (auto result = CheckWorkingDay(dates, true)) return *result;
    if (auto result = CheckWorkingDay(dates, false)) return *result;
    if (auto result = CheckWeekdayOfMonth(dates, true)) return *result;
    if (auto result = CheckWeekdayOfMonth(dates, false)) return *result;
    if (auto result = CheckDayOfMonth(dates)) return *result;
    if (auto result = CheckDayOfWeek(dates)) return *result;

    return TemporalPatternResult{};
}

std::optional<TemporalPatternResult> TemporalPatternAnalyzer::CheckWorkingDay(
    const std::vector<Date>& dates, bool last) const {
    size_t matches = static_cast<size_t>(std::count_if(
        dates.begin(), dates.end(), [this, last](const Date& date) {
            return last ? calendar_.IsLastWorkingDay(date)
                        : calendar_.IsFirstWorkingDay(date);
        }));

    double share = static_cast<double>(matches) / dates.size();
    if (share < config_.consistency_threshold) {
        return std::nullopt;
    }

    TemporalPatternResult result;
    result.pattern_type = last ? TemporalPatternType::LAST_WORKING_DAY
                               : TemporalPatternType::FIRST_WORKING_DAY;
    result.consistency = share;
    return result;
}

std::optional<TemporalPatternResult> TemporalPatternAnalyzer::CheckWeekdayOfMonth(
    const std::vector<Date>& dates, bool last) const {
    if (dates.size() < config_.min_weekday_samples) {
        return std::nullopt;
    }

    std::vector<int> weekdays;
    for (const auto& date : dates) {
        bool edge = last ? BusinessCalendar::IsLastWeekdayOccurrence(date)
                         : BusinessCalendar::IsFirstWeekdayOccurrence(date);
        if (edge) {
            weekdays.push_back(DayOfWeek(date));
        }
    }
    if (weekdays.empty()) {
        return std::nullopt;
    }

    // The same weekday must carry the share, not merely the last/first week
    size_t count = 0;
    int weekday = stats::Mode(weekdays, &count);
    double share = static_cast<double>(count) / dates.size();
    if (share < config_.weekday_threshold) {
        return std::nullopt;
    }

    TemporalPatternResult result;
    result.pattern_type = last ? TemporalPatternType::LAST_WEEKDAY_OF_MONTH
                               : TemporalPatternType::FIRST_WEEKDAY_OF_MONTH;
    result.day_of_week = weekday;
    result.consistency = share;
    return result;
}

std::optional<TemporalPatternResult> TemporalPatternAnalyzer::CheckDayOfMonth(
    const std::vector<Date>& dates) const {
    std::vector<int> days;
    for (const auto& date : dates) {
        days.push_back(date.day());
    }

    size_t count = 0;
    int day = stats::Mode(days, &count);
    double share = static_cast<double>(count) / dates.size();
    if (share < config_.day_threshold) {
        return std::nullopt;
    }

    TemporalPatternResult result;
    result.pattern_type = TemporalPatternType::DAY_OF_MONTH;
    result.day_of_month = day;
    result.consistency = share;
    return result;
}

std::optional<TemporalPatternResult> TemporalPatternAnalyzer::CheckDayOfWeek(
    const std::vector<Date>& dates) const {
    std::vector<int> weekdays;
    for (const auto& date : dates) {
        weekdays.push_back(DayOfWeek(date));
    }

    size_t count = 0;
    int weekday = stats::Mode(weekdays, &count);
    double share = static_cast<double>(count) / dates.size();
    if (share < config_.day_threshold) {
        return std::nullopt;
    }

    TemporalPatternResult result;
    result.pattern_type = TemporalPatternType::DAY_OF_WEEK;
    result.day_of_week = weekday;
    result.consistency = share;
    return result;
}

} // namespace recur
