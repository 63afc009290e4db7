// File: src/calendar/holiday_calendar.cpp
#include "calendar/holiday_calendar.hpp"
#include <stdexcept>

namespace recur {

namespace bg = boost::gregorian;

namespace {

const Date kEpoch(1970, 1, 1);

int64_t FloorDiv(int64_t value, int64_t divisor) {
    int64_t quotient = value / divisor;
    if ((value % divisor != 0) && ((value < 0) != (divisor < 0))) {
        --quotient;
    }
    return quotient;
}

// Add the holiday and its weekend observance
void AddObserved(std::set<Date>& out, const Date& holiday) {
    out.insert(holiday);
    int dow = DayOfWeek(holiday);
    if (dow == 5) {
        out.insert(holiday - bg::days(1));
    } else if (dow == 6) {
        out.insert(holiday + bg::days(1));
    }
}

} // anonymous namespace

// ============================================================================
// Date helpers
// ============================================================================

Date ToDate(EpochMillis millis) {
    return kEpoch + bg::days(FloorDiv(millis, kMillisPerDay));
}

EpochMillis ToEpochMillis(const Date& date) {
    return static_cast<EpochMillis>((date - kEpoch).days()) * kMillisPerDay;
}

int DayOfWeek(const Date& date) {
    // boost numbers Sunday as 0
    return (date.day_of_week().as_number() + 6) % 7;
}

int DaysInMonth(const Date& date) {
    return bg::gregorian_calendar::end_of_month_day(date.year(), date.month());
}

int DaysBetween(const Date& a, const Date& b) {
    return static_cast<int>((b - a).days());
}

bool IsWeekend(const Date& date) {
    return DayOfWeek(date) >= 5;
}

// ============================================================================
// UsFederalHolidayCalendar
// ============================================================================

bool UsFederalHolidayCalendar::IsHoliday(const Date& date) const {
    std::lock_guard<std::mutex> lock(mutex_);

    int year = date.year();
    auto it = cache_.find(year);
    if (it == cache_.end()) {
        it = cache_.emplace(year, ComputeYear(year)).first;
    }
    return it->second.count(date) > 0;
}

std::set<Date> UsFederalHolidayCalendar::HolidaysForYear(int year) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = cache_.find(year);
    if (it == cache_.end()) {
        it = cache_.emplace(year, ComputeYear(year)).first;
    }
    return it->second;
}

std::set<Date> UsFederalHolidayCalendar::ComputeYear(int year) {
    using nth = bg::nth_day_of_the_week_in_month;
    using last = bg::last_day_of_the_week_in_month;

    std::set<Date> all;

    // Fixed-date holidays, observed on the nearest weekday
    AddObserved(all, Date(year, bg::Jan, 1));
    AddObserved(all, Date(year + 1, bg::Jan, 1));  // may be observed Dec 31
    if (year >= 2021) {
        AddObserved(all, Date(year, bg::Jun, 19));
    }
    AddObserved(all, Date(year, bg::Jul, 4));
    AddObserved(all, Date(year, bg::Nov, 11));
    AddObserved(all, Date(year, bg::Dec, 25));

    // Floating Monday/Thursday holidays
    if (year >= 1986) {
        all.insert(nth(nth::third, bg::Monday, bg::Jan).get_date(year));
    }
    all.insert(nth(nth::third, bg::Monday, bg::Feb).get_date(year));
    all.insert(last(bg::Monday, bg::May).get_date(year));
    all.insert(nth(nth::first, bg::Monday, bg::Sep).get_date(year));
    all.insert(nth(nth::second, bg::Monday, bg::Oct).get_date(year));
    all.insert(nth(nth::fourth, bg::Thursday, bg::Nov).get_date(year));

    std::set<Date> in_year;
    for (const auto& date : all) {
        if (date.year() == year) {
            in_year.insert(date);
        }
    }
    return in_year;
}

std::shared_ptr<const HolidayCalendar> CreateHolidayCalendar(const std::string& name) {
    if (name == "US") {
        return std::make_shared<UsFederalHolidayCalendar>();
    }
    if (name == "NONE") {
        return std::make_shared<NoHolidayCalendar>();
    }
    throw std::invalid_argument("Unknown holiday calendar: " + name);
}

// ============================================================================
// BusinessCalendar
// ============================================================================

BusinessCalendar::BusinessCalendar(std::shared_ptr<const HolidayCalendar> holidays)
    : holidays_(std::move(holidays)) {
    if (!holidays_) {
        throw std::invalid_argument("BusinessCalendar requires a holiday calendar");
    }
}

bool BusinessCalendar::IsWorkingDay(const Date& date) const {
    return !IsWeekend(date) && !holidays_->IsHoliday(date);
}

std::optional<Date> BusinessCalendar::FirstWorkingDayOfMonth(const Date& date) const {
    Date day(date.year(), date.month(), 1);
    Date end = date.end_of_month();
    for (; day <= end; day += bg::days(1)) {
        if (IsWorkingDay(day)) {
            return day;
        }
    }
    return std::nullopt;
}

std::optional<Date> BusinessCalendar::LastWorkingDayOfMonth(const Date& date) const {
    Date start(date.year(), date.month(), 1);
    for (Date day = date.end_of_month(); day >= start; day -= bg::days(1)) {
        if (IsWorkingDay(day)) {
            return day;
        }
    }
    return std::nullopt;
}

bool BusinessCalendar::IsFirstWorkingDay(const Date& date) const {
    auto first = FirstWorkingDayOfMonth(date);
    return first && *first == date;
}

bool BusinessCalendar::IsLastWorkingDay(const Date& date) const {
    auto last = LastWorkingDayOfMonth(date);
    return last && *last == date;
}

bool BusinessCalendar::IsFirstWeekdayOccurrence(const Date& date) {
    return date.day() <= 7;
}

bool BusinessCalendar::IsLastWeekdayOccurrence(const Date& date) {
    return date.day() + 7 > DaysInMonth(date);
}

} // namespace recur
