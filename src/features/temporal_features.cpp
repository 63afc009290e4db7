// File: src/features/temporal_features.cpp
#include "features/temporal_features.hpp"
#include <cmath>

namespace recur {

namespace {

constexpr double kTwoPi = 2.0 * 3.14159265358979323846;

inline float Flag(bool value) { return value ? 1.0f : 0.0f; }

} // anonymous namespace

TemporalFeatureExtractor::TemporalFeatureExtractor(
    std::shared_ptr<const HolidayCalendar> holidays)
    : calendar_(std::move(holidays)) {}

FeatureBlock TemporalFeatureExtractor::ExtractBatch(
    const std::vector<Transaction>& transactions) {
    FeatureBlock block;
    block.reserve(transactions.size());
    for (const auto& tx : transactions) {
        block.push_back(Extract(tx));
    }
    return block;
}

FeatureVector TemporalFeatureExtractor::Extract(const Transaction& transaction) const {
    Date date = ToDate(transaction.date);

    int day_of_week = DayOfWeek(date);
    int day_of_month = date.day();
    int days_in_month = DaysInMonth(date);
    int week_of_month = (day_of_month - 1) / 7 + 1;

    double dow_angle = kTwoPi * day_of_week / 7.0;
    double dom_angle = kTwoPi * day_of_month / 31.0;
    double position_angle = kTwoPi * (day_of_month - 1) / days_in_month;
    double week_angle = kTwoPi * week_of_month / 5.0;

    double normalized_position = days_in_month > 1
        ? static_cast<double>(day_of_month - 1) / (days_in_month - 1)
        : 0.5;

    FeatureVector features(kFeatureSize);
    size_t i = 0;

    // Circular encodings
    features[i++] = static_cast<float>(std::sin(dow_angle));
    features[i++] = static_cast<float>(std::cos(dow_angle));
    features[i++] = static_cast<float>(std::sin(dom_angle));
    features[i++] = static_cast<float>(std::cos(dom_angle));
    features[i++] = static_cast<float>(std::sin(position_angle));
    features[i++] = static_cast<float>(std::cos(position_angle));
    features[i++] = static_cast<float>(std::sin(week_angle));
    features[i++] = static_cast<float>(std::cos(week_angle));

    // Flags
    features[i++] = Flag(calendar_.IsWorkingDay(date));
    features[i++] = Flag(calendar_.IsFirstWorkingDay(date));
    features[i++] = Flag(calendar_.IsLastWorkingDay(date));
    features[i++] = Flag(BusinessCalendar::IsFirstWeekdayOccurrence(date));
    features[i++] = Flag(BusinessCalendar::IsLastWeekdayOccurrence(date));
    features[i++] = Flag(IsWeekend(date));
    features[i++] = Flag(day_of_month == 1);
    features[i++] = Flag(day_of_month == days_in_month);

    features[i++] = static_cast<float>(normalized_position);
    return features;
}

std::vector<std::string> TemporalFeatureExtractor::FeatureNames() {
    return {
        "day_of_week_sin", "day_of_week_cos",
        "day_of_month_sin", "day_of_month_cos",
        "month_position_sin", "month_position_cos",
        "week_of_month_sin", "week_of_month_cos",
        "is_working_day", "is_first_working_day", "is_last_working_day",
        "is_first_weekday", "is_last_weekday", "is_weekend",
        "is_first_day", "is_last_day",
        "normalized_day_position",
    };
}

} // namespace recur
