// File: src/analysis/temporal_pattern_analyzer.hpp
#pragma once

#include "calendar/holiday_calendar.hpp"
#include "core/transaction.hpp"
#include "core/types.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace recur {

/// Recurrence shape found for a cluster
struct TemporalPatternResult {
    TemporalPatternType pattern_type{TemporalPatternType::FLEXIBLE};
    std::optional<int> day_of_week;   // 0 = Monday
    std::optional<int> day_of_month;  // 1..31
    double consistency{0.5};          // Fraction of dates fitting the shape
};

/// TemporalPatternAnalyzer - finds the within-month shape of a recurrence
///
/// Shapes are tried in priority order and the first one whose share of
/// matching dates reaches its threshold wins:
///  1. last working day of month
///  2. first working day of month
///  3. last given weekday of month (e.g. last Friday)
///  4. first given weekday of month (e.g. first Monday)
///  5. fixed day of month
///  6. fixed day of week
/// Anything else is FLEXIBLE with consistency 0.5.
class TemporalPatternAnalyzer {
public:
    struct Config {
        /// Share required for the working-day shapes
        double consistency_threshold{0.70};

        /// Share required for the weekday-of-month shapes
        double weekday_threshold{0.70};

        /// Share required for fixed day of month / day of week
        double day_threshold{0.60};

        /// Weekday-of-month shapes need at least this many dates
        size_t min_weekday_samples{3};
    };

    /// @throws std::invalid_argument if a threshold is outside (0, 1]
    TemporalPatternAnalyzer(const Config& config,
                            std::shared_ptr<const HolidayCalendar> holidays);

    TemporalPatternResult Analyze(const std::vector<Transaction>& transactions) const;

    const Config& GetConfig() const { return config_; }

private:
    std::optional<TemporalPatternResult> CheckWorkingDay(const std::vector<Date>& dates,
                                                         bool last) const;
    std::optional<TemporalPatternResult> CheckWeekdayOfMonth(const std::vector<Date>& dates,
                                                             bool last) const;
    std::optional<TemporalPatternResult> CheckDayOfMonth(const std::vector<Date>& dates) const;
    std::optional<TemporalPatternResult> CheckDayOfWeek(const std::vector<Date>& dates) const;

    Config config_;
    BusinessCalendar calendar_;
};

} // namespace recur
