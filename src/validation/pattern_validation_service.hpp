// File: src/validation/pattern_validation_service.hpp
#pragma once

#include "criteria/criteria_matcher.hpp"
#include "core/recurring_charge_pattern.hpp"
#include "core/transaction.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace recur {

/// Outcome of re-evaluating a pattern's criteria against the transaction universe
struct PatternCriteriaValidation {
    PatternID pattern_id;

    /// All original members still match (extra matches are tolerated)
    bool is_valid{false};

    size_t original_count{0};         // Original members present in the input
    size_t criteria_match_count{0};

    bool all_original_match_criteria{false};
    bool no_false_positives{false};
    bool perfect_match{false};

    /// Original members the criteria no longer match, in snapshot order
    std::vector<std::string> missing_from_criteria;

    /// Matches outside the original cluster, in input order
    std::vector<std::string> extra_from_criteria;

    std::vector<std::string> warnings;
    std::vector<std::string> suggestions;
};

/// PatternValidationService - bridges an unstable cluster and a stable rule
///
/// Validation evaluates the pattern's current criteria over every
/// transaction dated within [first_occurrence, last_occurrence] and diffs
/// the result against the matched transaction snapshot. Neither the pattern
/// nor the transactions are modified.
class PatternValidationService {
public:
    explicit PatternValidationService(std::shared_ptr<const HolidayCalendar> holidays);

    /// @throws std::invalid_argument if the pattern has no matched transactions
    PatternCriteriaValidation Validate(const RecurringChargePattern& pattern,
                                       const std::vector<Transaction>& all_transactions) const;

    /// Every transaction matching the criteria, regardless of date range.
    /// Stops after limit matches when one is given.
    std::vector<Transaction> GetMatchingTransactions(
        const RecurringChargePattern& pattern,
        const std::vector<Transaction>& transactions,
        std::optional<size_t> limit = std::nullopt) const;

    const CriteriaMatcher& GetMatcher() const { return matcher_; }

private:
    CriteriaMatcher matcher_;
};

} // namespace recur
