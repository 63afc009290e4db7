// File: src/detection/prediction_service.cpp
#include "detection/prediction_service.hpp"
#include "analysis/frequency_analyzer.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace recur {

namespace bg = boost::gregorian;

namespace {

Date MonthStart(const Date& date) {
    return Date(date.year(), date.month(), 1);
}

Date NextMonthStart(const Date& date) {
    return MonthStart(date) + bg::months(1);
}

Date ClampedDay(const Date& month, int day) {
    int actual = std::min(std::max(day, 1), DaysInMonth(month));
    return Date(month.year(), month.month(), static_cast<unsigned short>(actual));
}

Date WeekdayInMonth(const Date& month, int day_of_week, bool last) {
    if (last) {
        Date end = month.end_of_month();
        int back = (DayOfWeek(end) - day_of_week + 7) % 7;
        return end - bg::days(back);
    }
    Date start = MonthStart(month);
    int ahead = (day_of_week - DayOfWeek(start) + 7) % 7;
    return start + bg::days(ahead);
}

} // namespace

PredictionService::PredictionService(std::shared_ptr<const HolidayCalendar> holidays)
    : calendar_(std::move(holidays)) {}

int PredictionService::IntervalDays(RecurrenceFrequency frequency) {
    double nominal = FrequencyAnalyzer::NominalDays(frequency);
    return nominal > 0.0 ? static_cast<int>(nominal) : 30;
}

Prediction PredictionService::PredictNext(const RecurringChargePattern& pattern,
                                          EpochMillis from) const {
    std::vector<Prediction> predictions = PredictMany(pattern, from, 1);
    return predictions.front();
}

std::vector<Prediction> PredictionService::PredictMany(const RecurringChargePattern& pattern,
                                                       EpochMillis from, size_t count) const {
    const Date from_date = ToDate(from);
    const AmountCriteria& amount = pattern.GetAmountCriteria();
    const double tolerance = amount.tolerance_pct / 100.0;
    const double confidence = PredictionConfidence(pattern, from_date);

    std::vector<Prediction> predictions;
    predictions.reserve(count);

    Date cursor = from_date;
    for (size_t i = 0; i < count; ++i) {
        Date next = NextDate(pattern, cursor);

        Prediction prediction;
        prediction.pattern_id = pattern.GetID();
        prediction.next_expected_date = ToEpochMillis(next);
        prediction.days_until_due = DaysBetween(from_date, next);
        prediction.expected_amount = amount.mean;
        prediction.min_amount = amount.mean * (1.0 - tolerance);
        prediction.max_amount = amount.mean * (1.0 + tolerance);
        prediction.confidence = confidence;
        predictions.push_back(prediction);

        cursor = next;
    }
    return predictions;
}

Date PredictionService::NextDate(const RecurringChargePattern& pattern, const Date& from) const {
    const TemporalCriteria& temporal = pattern.GetTemporalCriteria();
    const Date last_occurrence = ToDate(pattern.GetLastOccurrence());

    switch (temporal.pattern_type) {
        case TemporalPatternType::DAY_OF_MONTH:
            if (temporal.day_of_month) {
                return NextDayOfMonth(from, *temporal.day_of_month);
            }
            break;
        case TemporalPatternType::DAY_OF_WEEK:
            if (temporal.day_of_week) {
                return NextDayOfWeek(from, *temporal.day_of_week, temporal.frequency);
            }
            break;
        case TemporalPatternType::FIRST_WORKING_DAY:
            return NextWorkingDay(from, false);
        case TemporalPatternType::LAST_WORKING_DAY:
            return NextWorkingDay(from, true);
        case TemporalPatternType::FIRST_WEEKDAY_OF_MONTH:
            if (temporal.day_of_week) {
                return NextWeekdayOfMonth(from, *temporal.day_of_week, false);
            }
            return NextDayOfMonth(from, 1);
        case TemporalPatternType::LAST_WEEKDAY_OF_MONTH:
            if (temporal.day_of_week) {
                return NextWeekdayOfMonth(from, *temporal.day_of_week, true);
            }
            return NextDayOfMonth(from, 31);
        case TemporalPatternType::WEEKEND: {
            Date next = from + bg::days(1);
            while (!IsWeekend(next)) next += bg::days(1);
            return next;
        }
        case TemporalPatternType::WEEKDAY: {
            Date next = from + bg::days(1);
            while (IsWeekend(next)) next += bg::days(1);
            return next;
        }
        case TemporalPatternType::FLEXIBLE:
        default:
            break;
    }
    return NextByFrequency(from, last_occurrence, temporal.frequency);
}

Date PredictionService::NextDayOfMonth(const Date& from, int day) const {
    Date candidate = ClampedDay(from, day);
    if (candidate > from) {
        return candidate;
    }
    return ClampedDay(NextMonthStart(from), day);
}

Date PredictionService::NextDayOfWeek(const Date& from, int day_of_week,
                                      RecurrenceFrequency frequency) const {
    int ahead = (day_of_week - DayOfWeek(from) + 7) % 7;
    if (ahead == 0) {
        ahead = frequency == RecurrenceFrequency::BI_WEEKLY ? 14 : 7;
    }
    return from + bg::days(ahead);
}

Date PredictionService::NextWorkingDay(const Date& from, bool last) const {
    Date month = MonthStart(from);
    // A month without any working day does not occur with real calendars,
    // but bound the search anyway
    for (int i = 0; i < 3; ++i) {
        std::optional<Date> candidate = last ? calendar_.LastWorkingDayOfMonth(month)
                                             : calendar_.FirstWorkingDayOfMonth(month);
        if (candidate && *candidate > from) {
            return *candidate;
        }
        month = NextMonthStart(month);
    }
    return last ? NextMonthStart(from).end_of_month() : NextMonthStart(from);
}

Date PredictionService::NextWeekdayOfMonth(const Date& from, int day_of_week, bool last) const {
    Date candidate = WeekdayInMonth(from, day_of_week, last);
    if (candidate > from) {
        return candidate;
    }
    return WeekdayInMonth(NextMonthStart(from), day_of_week, last);
}

Date PredictionService::NextByFrequency(const Date& from, const Date& last_occurrence,
                                        RecurrenceFrequency frequency) const {
    const bg::days step(IntervalDays(frequency));
    Date next = last_occurrence + step;
    if (next <= from) {
        // Jump close to `from` instead of stepping one interval at a time
        long behind = (from - next).days() / step.days();
        next += bg::days(behind * step.days());
        while (next <= from) next += step;
    }
    return next;
}

double PredictionService::PredictionConfidence(const RecurringChargePattern& pattern,
                                               const Date& from) {
    const int days_since_last = DaysBetween(ToDate(pattern.GetLastOccurrence()), from);
    const double expected = IntervalDays(pattern.GetTemporalCriteria().frequency);

    double time_factor = 0.7;
    if (days_since_last <= expected * 1.5) {
        time_factor = 1.0;
    } else if (days_since_last <= expected * 2.0) {
        time_factor = 0.9;
    } else if (days_since_last <= expected * 3.0) {
        time_factor = 0.8;
    }

    double sample_factor = 0.90;
    if (pattern.GetTransactionCount() >= 12) {
        sample_factor = 1.0;
    } else if (pattern.GetTransactionCount() >= 6) {
        sample_factor = 0.95;
    }

    double confidence = std::min(1.0, pattern.GetConfidence() * time_factor * sample_factor);
    return std::round(confidence * 100.0) / 100.0;
}

} // namespace recur
