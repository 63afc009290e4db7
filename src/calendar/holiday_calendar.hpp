// File: src/calendar/holiday_calendar.hpp
#pragma once

#include "core/types.hpp"
#include <boost/date_time/gregorian/gregorian.hpp>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace recur {

using Date = boost::gregorian::date;

// ============================================================================
// Date helpers (all dates are UTC calendar days)
// ============================================================================

/// Calendar day containing the given instant
Date ToDate(EpochMillis millis);

/// Midnight UTC of the given day
EpochMillis ToEpochMillis(const Date& date);

/// 0 = Monday .. 6 = Sunday
int DayOfWeek(const Date& date);

int DaysInMonth(const Date& date);

/// Whole days from a to b (negative when b precedes a)
int DaysBetween(const Date& a, const Date& b);

bool IsWeekend(const Date& date);

// ============================================================================
// Holiday calendars
// ============================================================================

/// Abstract holiday source used to decide working days
class HolidayCalendar {
public:
    virtual ~HolidayCalendar() = default;

    virtual bool IsHoliday(const Date& date) const = 0;

    virtual std::string GetName() const = 0;
};

/// United States federal holidays with weekend observance
///
/// A holiday falling on Saturday is also observed the preceding Friday and
/// one falling on Sunday the following Monday. Juneteenth is included from
/// 2021. Holiday sets are computed per year on first use and cached.
class UsFederalHolidayCalendar : public HolidayCalendar {
public:
    bool IsHoliday(const Date& date) const override;
    std::string GetName() const override { return "US"; }

    /// All holiday dates (actual and observed) that fall in the year
    std::set<Date> HolidaysForYear(int year) const;

private:
    static std::set<Date> ComputeYear(int year);

    mutable std::mutex mutex_;
    mutable std::map<int, std::set<Date>> cache_;
};

/// Calendar without holidays, only weekends are non-working
class NoHolidayCalendar : public HolidayCalendar {
public:
    bool IsHoliday(const Date&) const override { return false; }
    std::string GetName() const override { return "NONE"; }
};

/// Explicit list of holiday dates
class FixedHolidayCalendar : public HolidayCalendar {
public:
    explicit FixedHolidayCalendar(std::set<Date> holidays)
        : holidays_(std::move(holidays)) {}

    bool IsHoliday(const Date& date) const override {
        return holidays_.count(date) > 0;
    }
    std::string GetName() const override { return "FIXED"; }

private:
    std::set<Date> holidays_;
};

/// Create a holiday calendar by name ("US" or "NONE")
/// @throws std::invalid_argument for unknown names
std::shared_ptr<const HolidayCalendar> CreateHolidayCalendar(const std::string& name);

// ============================================================================
// Working day rules
// ============================================================================

/// Working-day predicates over a holiday calendar
class BusinessCalendar {
public:
    explicit BusinessCalendar(std::shared_ptr<const HolidayCalendar> holidays);

    /// Weekday that is not a holiday
    bool IsWorkingDay(const Date& date) const;

    /// First/last working day in the month of the given date
    std::optional<Date> FirstWorkingDayOfMonth(const Date& date) const;
    std::optional<Date> LastWorkingDayOfMonth(const Date& date) const;

    bool IsFirstWorkingDay(const Date& date) const;
    bool IsLastWorkingDay(const Date& date) const;

    /// First occurrence of this weekday in its month (e.g. first Monday)
    static bool IsFirstWeekdayOccurrence(const Date& date);

    /// Last occurrence of this weekday in its month (e.g. last Friday)
    static bool IsLastWeekdayOccurrence(const Date& date);

    const HolidayCalendar& Holidays() const { return *holidays_; }

private:
    std::shared_ptr<const HolidayCalendar> holidays_;
};

} // namespace recur
