// File: src/criteria/criteria_matcher.hpp
#pragma once

#include "calendar/holiday_calendar.hpp"
#include "core/recurring_charge_pattern.hpp"
#include "core/transaction.hpp"
#include <memory>
#include <string>
#include <vector>

namespace recur {

/// CriteriaMatcher - deterministic evaluation of a pattern's criteria
///
/// A transaction matches when its description satisfies the merchant rule,
/// its absolute amount lies within mean ± tolerance_pct, and its date fits
/// the temporal rule. This is the only matching logic used after detection;
/// the originating cluster is never consulted again.
///
/// Example usage:
/// @code
///   CriteriaMatcher matcher(CreateHolidayCalendar("US"));
///   if (matcher.Matches(pattern, tx)) { ... }
/// @endcode
class CriteriaMatcher {
public:
    explicit CriteriaMatcher(std::shared_ptr<const HolidayCalendar> holidays);

    bool Matches(const RecurringChargePattern& pattern, const Transaction& transaction) const;

    /// Exclusions are checked first. Surrounding whitespace in the description
    /// is ignored for the literal match types. REGEX uses ECMAScript syntax,
    /// with a leading (?i) as produced by ToRegex turning on case folding.
    /// An invalid regular expression never matches.
    static bool MatchesMerchant(const MerchantCriteria& criteria, const std::string& description);

    static bool MatchesAmount(const AmountCriteria& criteria, double amount);

    bool MatchesTemporal(const TemporalCriteria& criteria, EpochMillis date) const;

    /// Patterns allowed to categorize the transaction: Active, enabled and matching
    std::vector<const RecurringChargePattern*> FindEligibleMatches(
        const Transaction& transaction,
        const std::vector<RecurringChargePattern>& patterns) const;

    /// Storage form of a merchant rule as a single regular expression.
    /// Exclusions become a leading negative lookahead and case-insensitive
    /// rules carry an inline (?i) flag, which MatchesMerchant accepts back as
    /// a REGEX criterion.
    static std::string ToRegex(const MerchantCriteria& criteria);

    /// Backslash-escape regular expression metacharacters
    static std::string EscapeRegex(const std::string& text);

private:
    BusinessCalendar calendar_;
};

} // namespace recur
