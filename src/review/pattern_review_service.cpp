// File: src/review/pattern_review_service.cpp
#include "review/pattern_review_service.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace recur {

const char* ToString(ReviewActionType type) {
    switch (type) {
        case ReviewActionType::CONFIRM: return "CONFIRM";
        case ReviewActionType::REJECT: return "REJECT";
        case ReviewActionType::EDIT: return "EDIT";
        default: return "UNKNOWN";
    }
}

bool CriteriaEdits::HasChanges() const {
    return merchant_pattern || match_type || exclusions || amount_tolerance_pct ||
           tolerance_days || suggested_category_id || auto_categorize;
}

ReviewAction ReviewAction::Confirm(std::string reviewer, bool activate_immediately) {
    ReviewAction action;
    action.type = ReviewActionType::CONFIRM;
    action.reviewer = std::move(reviewer);
    action.activate_immediately = activate_immediately;
    return action;
}

ReviewAction ReviewAction::Reject(std::string reviewer, std::optional<std::string> notes) {
    ReviewAction action;
    action.type = ReviewActionType::REJECT;
    action.reviewer = std::move(reviewer);
    action.notes = std::move(notes);
    return action;
}

ReviewAction ReviewAction::Edit(std::string reviewer, CriteriaEdits edits) {
    ReviewAction action;
    action.type = ReviewActionType::EDIT;
    action.reviewer = std::move(reviewer);
    action.edits = std::move(edits);
    return action;
}

// ============================================================================
// PatternReviewService
// ============================================================================

PatternReviewService::PatternReviewService(
    std::shared_ptr<PatternRepository> repository,
    std::shared_ptr<const PatternValidationService> validator,
    Clock clock)
    : repository_(std::move(repository)),
      validator_(std::move(validator)),
      clock_(std::move(clock)) {
    if (!repository_) {
        throw std::invalid_argument("PatternReviewService requires a repository");
    }
    if (!validator_) {
        throw std::invalid_argument("PatternReviewService requires a validation service");
    }
    if (!clock_) {
        throw std::invalid_argument("PatternReviewService requires a clock");
    }
}

ReviewResult PatternReviewService::Review(const RecurringChargePattern& pattern,
                                          const ReviewAction& action,
                                          const std::vector<Transaction>& all_transactions) {
    if (!PatternLifecycle::IsReviewable(pattern.GetStatus())) {
        PatternStatus attempted = action.type == ReviewActionType::REJECT
                                      ? PatternStatus::REJECTED
                                      : PatternStatus::CONFIRMED;
        throw InvalidTransition(pattern.GetStatus(), attempted,
                                std::string("cannot ") + ToString(action.type) +
                                    " a pattern that is not DETECTED or CONFIRMED");
    }

    const EpochMillis now = clock_();
    ReviewResult result{pattern, std::nullopt};
    RecurringChargePattern& updated = result.pattern;

    switch (action.type) {
        case ReviewActionType::REJECT:
            PatternLifecycle::Transition(updated, PatternStatus::REJECTED, action.reviewer, now);
            if (action.notes) {
                spdlog::info("Pattern {} rejected by {}: {}", pattern.GetID().ToString(),
                             action.reviewer, *action.notes);
            } else {
                spdlog::info("Pattern {} rejected by {}", pattern.GetID().ToString(),
                             action.reviewer);
            }
            break;
        case ReviewActionType::EDIT:
            Edit(updated, action, all_transactions, result, now);
            break;
        case ReviewActionType::CONFIRM:
            Confirm(updated, action, all_transactions, result, now);
            break;
        default:
            throw std::invalid_argument("Unknown review action");
    }

    result.pattern = Commit(std::move(result.pattern), pattern);
    return result;
}

void PatternReviewService::Confirm(RecurringChargePattern& pattern, const ReviewAction& action,
                                   const std::vector<Transaction>& all_transactions,
                                   ReviewResult& result, EpochMillis now) const {
    PatternCriteriaValidation validation = validator_->Validate(pattern, all_transactions);
    pattern.SetCriteriaValidation(validation.is_valid, validation.warnings);

    if (!validation.is_valid) {
        pattern.RecordReview(action.reviewer, now);
        spdlog::warn("Pattern {} not confirmed, criteria miss {} original transactions",
                     pattern.GetID().ToString(), validation.missing_from_criteria.size());
        result.validation = std::move(validation);
        return;
    }

    if (pattern.GetStatus() == PatternStatus::DETECTED) {
        PatternLifecycle::Transition(pattern, PatternStatus::CONFIRMED, action.reviewer, now);
    } else {
        pattern.RecordReview(action.reviewer, now);
    }

    if (action.activate_immediately) {
        PatternLifecycle::Transition(pattern, PatternStatus::ACTIVE, action.reviewer, now);
        spdlog::info("Pattern {} confirmed and activated by {}", pattern.GetID().ToString(),
                     action.reviewer);
    } else {
        spdlog::info("Pattern {} confirmed by {}", pattern.GetID().ToString(), action.reviewer);
    }
    result.validation = std::move(validation);
}

void PatternReviewService::Edit(RecurringChargePattern& pattern, const ReviewAction& action,
                                const std::vector<Transaction>& all_transactions,
                                ReviewResult& result, EpochMillis now) const {
    const CriteriaEdits& edits = action.edits;

    MerchantCriteria merchant = pattern.GetMerchantCriteria();
    if (edits.merchant_pattern) merchant.pattern = *edits.merchant_pattern;
    if (edits.match_type) merchant.match_type = *edits.match_type;
    if (edits.exclusions) merchant.exclusions = *edits.exclusions;
    pattern.SetMerchantCriteria(merchant);

    AmountCriteria amount = pattern.GetAmountCriteria();
    if (edits.amount_tolerance_pct) {
        const double tolerance = *edits.amount_tolerance_pct;
        if (!std::isfinite(tolerance) || tolerance < 0.0) {
            throw std::invalid_argument("Amount tolerance must be a finite non-negative percentage");
        }
        amount.tolerance_pct = *edits.amount_tolerance_pct;
    }
    pattern.SetAmountCriteria(amount);

    TemporalCriteria temporal = pattern.GetTemporalCriteria();
    if (edits.tolerance_days) {
        if (*edits.tolerance_days < 0) {
            throw std::invalid_argument("Tolerance days must not be negative");
        }
        temporal.tolerance_days = *edits.tolerance_days;
    }
    pattern.SetTemporalCriteria(temporal);

    if (edits.suggested_category_id) pattern.SetSuggestedCategoryID(*edits.suggested_category_id);
    if (edits.auto_categorize) pattern.SetAutoCategorize(*edits.auto_categorize);

    pattern.SetCriteriaValidation(false, {});
    PatternCriteriaValidation validation = validator_->Validate(pattern, all_transactions);
    pattern.SetCriteriaValidation(validation.is_valid, validation.warnings);
    pattern.RecordReview(action.reviewer, now);

    spdlog::info("Pattern {} criteria edited by {} (valid={})", pattern.GetID().ToString(),
                 action.reviewer, validation.is_valid);
    result.validation = std::move(validation);
}

RecurringChargePattern PatternReviewService::Activate(const RecurringChargePattern& pattern,
                                                      const std::string& reviewer) {
    if (pattern.GetStatus() == PatternStatus::CONFIRMED && !pattern.IsCriteriaValidated()) {
        throw InvalidTransition(PatternStatus::CONFIRMED, PatternStatus::ACTIVE,
                                "criteria must be validated before activation");
    }
    if (pattern.GetStatus() != PatternStatus::CONFIRMED) {
        throw InvalidTransition(pattern.GetStatus(), PatternStatus::ACTIVE,
                                "only CONFIRMED patterns can be activated");
    }
    return ChangeStatus(pattern, PatternStatus::ACTIVE, reviewer);
}

RecurringChargePattern PatternReviewService::Pause(const RecurringChargePattern& pattern,
                                                   const std::string& reviewer) {
    return ChangeStatus(pattern, PatternStatus::PAUSED, reviewer);
}

RecurringChargePattern PatternReviewService::Resume(const RecurringChargePattern& pattern,
                                                    const std::string& reviewer) {
    if (pattern.GetStatus() != PatternStatus::PAUSED) {
        throw InvalidTransition(pattern.GetStatus(), PatternStatus::ACTIVE,
                                "only PAUSED patterns can be resumed");
    }
    return ChangeStatus(pattern, PatternStatus::ACTIVE, reviewer);
}

RecurringChargePattern PatternReviewService::ChangeStatus(const RecurringChargePattern& pattern,
                                                          PatternStatus to,
                                                          const std::string& reviewer) {
    RecurringChargePattern updated = pattern;
    PatternLifecycle::Transition(updated, to, reviewer, clock_());

    RecurringChargePattern committed = Commit(std::move(updated), pattern);
    spdlog::info("Pattern {} {} -> {} by {}", pattern.GetID().ToString(),
                 ToString(pattern.GetStatus()), ToString(to), reviewer);
    return committed;
}

RecurringChargePattern PatternReviewService::Commit(RecurringChargePattern updated,
                                                    const RecurringChargePattern& original) {
    CommitResult result = repository_->UpdateIfCurrent(updated, original.GetStatus(),
                                                       original.GetVersion());
    switch (result) {
        case CommitResult::COMMITTED:
            updated.SetVersion(original.GetVersion() + 1);
            return updated;
        case CommitResult::CONFLICT:
            spdlog::warn("Pattern {} changed concurrently, expected {} v{}",
                         original.GetID().ToString(), ToString(original.GetStatus()),
                         original.GetVersion());
            throw TransitionConflict(original.GetID(), original.GetStatus(),
                                     original.GetVersion());
        case CommitResult::NOT_FOUND:
        default:
            throw std::invalid_argument("Pattern " + original.GetID().ToString() +
                                        " is not stored in the repository");
    }
}

} // namespace recur
