// File: src/criteria/criteria_matcher.cpp
#include "criteria/criteria_matcher.hpp"
#include "analysis/merchant_pattern_analyzer.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>
#include <unordered_map>

namespace recur {

namespace {

constexpr size_t kMaxCachedRegexes = 256;
constexpr const char* kInlineIgnoreCase = "(?i)";

// Compiled merchant expressions per thread, keyed by case folding and source.
// An invalid expression is cached as null so it is reported once.
std::shared_ptr<const std::regex> CompiledRegex(const std::string& source, bool fold) {
    thread_local std::unordered_map<std::string, std::shared_ptr<const std::regex>> cache;

    const std::string key = (fold ? "i:" : "s:") + source;
    auto it = cache.find(key);
    if (it != cache.end()) {
        return it->second;
    }
    if (cache.size() >= kMaxCachedRegexes) {
        cache.clear();
    }

    std::shared_ptr<const std::regex> compiled;
    try {
        auto flags = std::regex::ECMAScript;
        if (fold) {
            flags |= std::regex::icase;
        }
        compiled = std::make_shared<const std::regex>(source, flags);
    } catch (const std::regex_error& e) {
        spdlog::warn("Invalid merchant regex '{}': {}", source, e.what());
    }
    cache.emplace(key, compiled);
    return compiled;
}

}  // namespace

CriteriaMatcher::CriteriaMatcher(std::shared_ptr<const HolidayCalendar> holidays)
    : calendar_(std::move(holidays)) {}

bool CriteriaMatcher::Matches(const RecurringChargePattern& pattern,
                              const Transaction& transaction) const {
    return MatchesMerchant(pattern.GetMerchantCriteria(), transaction.description) &&
           MatchesAmount(pattern.GetAmountCriteria(), transaction.amount) &&
           MatchesTemporal(pattern.GetTemporalCriteria(), transaction.date);
}

bool CriteriaMatcher::MatchesMerchant(const MerchantCriteria& criteria,
                                      const std::string& description) {
    const bool fold = !criteria.case_sensitive;
    const std::string text = TrimWhitespace(fold ? ToUpperAscii(description) : description);

    for (const auto& exclusion : criteria.exclusions) {
        const std::string needle = fold ? ToUpperAscii(exclusion) : exclusion;
        if (!needle.empty() && text.find(needle) != std::string::npos) {
            return false;
        }
    }

    if (criteria.match_type == MatchType::REGEX) {
        // ECMAScript has no inline flags; an exported (?i) prefix selects icase
        std::string source = criteria.pattern;
        bool icase = fold;
        if (source.compare(0, 4, kInlineIgnoreCase) == 0) {
            source.erase(0, 4);
            icase = true;
        }
        auto compiled = CompiledRegex(source, icase);
        return compiled && std::regex_search(description, *compiled);
    }

    const std::string pattern = fold ? ToUpperAscii(criteria.pattern) : criteria.pattern;
    switch (criteria.match_type) {
        case MatchType::EXACT:
            return text == pattern;
        case MatchType::CONTAINS:
            return text.find(pattern) != std::string::npos;
        case MatchType::PREFIX:
            return text.compare(0, pattern.size(), pattern) == 0;
        case MatchType::SUFFIX:
            return text.size() >= pattern.size() &&
                   text.compare(text.size() - pattern.size(), pattern.size(), pattern) == 0;
        default:
            return false;
    }
}

bool CriteriaMatcher::MatchesAmount(const AmountCriteria& criteria, double amount) {
    const double magnitude = std::abs(amount);
    const double tolerance = criteria.mean * (criteria.tolerance_pct / 100.0);
    return magnitude >= criteria.mean - tolerance && magnitude <= criteria.mean + tolerance;
}

bool CriteriaMatcher::MatchesTemporal(const TemporalCriteria& criteria, EpochMillis date) const {
    const Date day = ToDate(date);
    const int tolerance = criteria.tolerance_days;

    switch (criteria.pattern_type) {
        case TemporalPatternType::DAY_OF_WEEK: {
            if (!criteria.day_of_week) {
                return true;
            }
            int diff = std::abs(DayOfWeek(day) - *criteria.day_of_week);
            diff = std::min(diff, 7 - diff);
            return diff <= tolerance;
        }
        case TemporalPatternType::DAY_OF_MONTH: {
            if (!criteria.day_of_month) {
                return true;
            }
            return std::abs(static_cast<int>(day.day()) - *criteria.day_of_month) <= tolerance;
        }
        case TemporalPatternType::FIRST_WORKING_DAY: {
            auto target = calendar_.FirstWorkingDayOfMonth(day);
            return target && std::abs(DaysBetween(*target, day)) <= tolerance;
        }
        case TemporalPatternType::LAST_WORKING_DAY: {
            auto target = calendar_.LastWorkingDayOfMonth(day);
            return target && std::abs(DaysBetween(*target, day)) <= tolerance;
        }
        case TemporalPatternType::FIRST_WEEKDAY_OF_MONTH:
            return BusinessCalendar::IsFirstWeekdayOccurrence(day) &&
                   (!criteria.day_of_week || DayOfWeek(day) == *criteria.day_of_week);
        case TemporalPatternType::LAST_WEEKDAY_OF_MONTH:
            return BusinessCalendar::IsLastWeekdayOccurrence(day) &&
                   (!criteria.day_of_week || DayOfWeek(day) == *criteria.day_of_week);
        case TemporalPatternType::WEEKEND:
            return IsWeekend(day);
        case TemporalPatternType::WEEKDAY:
            return !IsWeekend(day);
        case TemporalPatternType::FLEXIBLE:
        default:
            return true;
    }
}

std::vector<const RecurringChargePattern*> CriteriaMatcher::FindEligibleMatches(
    const Transaction& transaction,
    const std::vector<RecurringChargePattern>& patterns) const {
    std::vector<const RecurringChargePattern*> result;
    for (const auto& pattern : patterns) {
        if (pattern.IsEligibleForCategorization() && Matches(pattern, transaction)) {
            result.push_back(&pattern);
        }
    }
    return result;
}

std::string CriteriaMatcher::EscapeRegex(const std::string& text) {
    static const std::string kSpecial = "\\^$.|?*+()[]{}";
    std::string escaped;
    escaped.reserve(text.size() * 2);
    for (char c : text) {
        if (kSpecial.find(c) != std::string::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

std::string CriteriaMatcher::ToRegex(const MerchantCriteria& criteria) {
    std::string body = criteria.match_type == MatchType::REGEX
                           ? criteria.pattern
                           : EscapeRegex(criteria.pattern);

    // Exclusions become a lookahead anchored at the start of the description
    std::string lookahead;
    if (!criteria.exclusions.empty()) {
        std::string alternatives;
        for (size_t i = 0; i < criteria.exclusions.size(); ++i) {
            if (i > 0) alternatives += "|";
            alternatives += EscapeRegex(criteria.exclusions[i]);
        }
        lookahead = "(?!.*(" + alternatives + "))";
    }
    const std::string anchor = lookahead.empty() ? "" : "^" + lookahead + ".*";

    std::string regex;
    switch (criteria.match_type) {
        case MatchType::EXACT: regex = "^" + lookahead + body + "$"; break;
        case MatchType::PREFIX: regex = "^" + lookahead + body; break;
        case MatchType::SUFFIX: regex = anchor + body + "$"; break;
        case MatchType::CONTAINS:
        case MatchType::REGEX:
        default: regex = anchor + body; break;
    }

    if (!criteria.case_sensitive) {
        regex = kInlineIgnoreCase + regex;
    }
    return regex;
}

} // namespace recur
