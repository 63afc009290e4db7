// File: src/detection/prediction_service.hpp
#pragma once

#include "calendar/holiday_calendar.hpp"
#include "core/recurring_charge_pattern.hpp"
#include <memory>
#include <vector>

namespace recur {

/// Expected next occurrence of a recurring charge
struct Prediction {
    PatternID pattern_id;
    EpochMillis next_expected_date{0};   // Midnight UTC
    int days_until_due{0};

    double expected_amount{0.0};
    double min_amount{0.0};
    double max_amount{0.0};

    /// Pattern confidence discounted by staleness and sample size
    double confidence{0.0};
};

/// PredictionService - projects a pattern's next occurrences
///
/// The next date follows the temporal shape when it pins one down (day of
/// month, weekday, working day, weekday-of-month, weekend/weekday) and
/// otherwise steps the nominal frequency interval forward from the last
/// occurrence. Day 31 in a shorter month falls on the month's last day.
class PredictionService {
public:
    /// @throws std::invalid_argument if holidays is null
    explicit PredictionService(std::shared_ptr<const HolidayCalendar> holidays);

    /// First expected occurrence strictly after the day of `from`
    Prediction PredictNext(const RecurringChargePattern& pattern, EpochMillis from) const;

    /// `count` consecutive occurrences starting after `from`
    std::vector<Prediction> PredictMany(const RecurringChargePattern& pattern,
                                        EpochMillis from, size_t count) const;

    /// Next date for the pattern's criteria, after `from`
    Date NextDate(const RecurringChargePattern& pattern, const Date& from) const;

    /// Interval used for frequency stepping; 30 days when irregular
    static int IntervalDays(RecurrenceFrequency frequency);

    static double PredictionConfidence(const RecurringChargePattern& pattern, const Date& from);

private:
    Date NextDayOfMonth(const Date& from, int day) const;
    Date NextDayOfWeek(const Date& from, int day_of_week, RecurrenceFrequency frequency) const;
    Date NextWorkingDay(const Date& from, bool last) const;
    Date NextWeekdayOfMonth(const Date& from, int day_of_week, bool last) const;
    Date NextByFrequency(const Date& from, const Date& last_occurrence,
                         RecurrenceFrequency frequency) const;

    BusinessCalendar calendar_;
};

} // namespace recur
