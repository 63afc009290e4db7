// File: src/validation/pattern_validation_service.cpp
#include "validation/pattern_validation_service.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <unordered_set>

namespace recur {

PatternValidationService::PatternValidationService(
    std::shared_ptr<const HolidayCalendar> holidays)
    : matcher_(std::move(holidays)) {}

PatternCriteriaValidation PatternValidationService::Validate(
    const RecurringChargePattern& pattern,
    const std::vector<Transaction>& all_transactions) const {
    const auto& original_ids = pattern.GetMatchedTransactionIDs();
    if (original_ids.empty()) {
        throw std::invalid_argument("Pattern " + pattern.GetID().ToString() +
                                    " has no matched transactions to validate against");
    }

    std::unordered_set<std::string> known_ids;
    std::unordered_set<std::string> criteria_ids;
    std::vector<std::string> criteria_order;
    for (const auto& tx : all_transactions) {
        known_ids.insert(tx.id);
        if (tx.date < pattern.GetFirstOccurrence() || tx.date > pattern.GetLastOccurrence()) {
            continue;
        }
        if (matcher_.Matches(pattern, tx) && criteria_ids.insert(tx.id).second) {
            criteria_order.push_back(tx.id);
        }
    }

    PatternCriteriaValidation result;
    result.pattern_id = pattern.GetID();
    result.criteria_match_count = criteria_ids.size();

    std::unordered_set<std::string> original_set(original_ids.begin(), original_ids.end());
    for (const auto& id : original_ids) {
        if (known_ids.count(id) > 0) {
            ++result.original_count;
        }
        if (criteria_ids.count(id) == 0) {
            result.missing_from_criteria.push_back(id);
        }
    }
    for (const auto& id : criteria_order) {
        if (original_set.count(id) == 0) {
            result.extra_from_criteria.push_back(id);
        }
    }

    if (result.original_count != original_ids.size()) {
        spdlog::warn("Pattern {}: {} original transactions not found",
                     pattern.GetID().ToString(), original_ids.size() - result.original_count);
    }

    result.all_original_match_criteria = result.missing_from_criteria.empty();
    result.no_false_positives = result.extra_from_criteria.empty();
    result.perfect_match = result.all_original_match_criteria && result.no_false_positives;
    result.is_valid = result.all_original_match_criteria;

    if (!result.missing_from_criteria.empty()) {
        result.warnings.push_back(std::to_string(result.missing_from_criteria.size()) +
                                  " original transactions don't match criteria");
        result.suggestions.push_back("Consider loosening amount tolerance or date tolerance");
    }
    if (!result.extra_from_criteria.empty()) {
        result.warnings.push_back(std::to_string(result.extra_from_criteria.size()) +
                                  " additional transactions match criteria");
        result.suggestions.push_back("Consider tightening merchant pattern or amount tolerance");
    }
    if (result.perfect_match) {
        result.suggestions.push_back("Criteria perfectly match original cluster - ready to activate");
    }

    spdlog::info("Validation for pattern {}: original={}, criteria={}, missing={}, extra={}",
                 pattern.GetID().ToString(), result.original_count,
                 result.criteria_match_count, result.missing_from_criteria.size(),
                 result.extra_from_criteria.size());
    return result;
}

std::vector<Transaction> PatternValidationService::GetMatchingTransactions(
    const RecurringChargePattern& pattern,
    const std::vector<Transaction>& transactions,
    std::optional<size_t> limit) const {
    std::vector<Transaction> matches;
    for (const auto& tx : transactions) {
        if (limit && matches.size() >= *limit) {
            break;
        }
        if (matcher_.Matches(pattern, tx)) {
            matches.push_back(tx);
        }
    }
    return matches;
}

} // namespace recur
