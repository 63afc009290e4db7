// File: src/review/pattern_review_service.hpp
#pragma once

#include "review/pattern_lifecycle.hpp"
#include "storage/pattern_repository.hpp"
#include "validation/pattern_validation_service.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace recur {

enum class ReviewActionType : uint8_t {
    CONFIRM = 0,
    REJECT = 1,
    EDIT = 2,
};

const char* ToString(ReviewActionType type);

/// User changes to a pattern's matching rule; unset fields are left alone
struct CriteriaEdits {
    std::optional<std::string> merchant_pattern;
    std::optional<MatchType> match_type;
    std::optional<std::vector<std::string>> exclusions;
    std::optional<double> amount_tolerance_pct;
    std::optional<int> tolerance_days;
    std::optional<std::string> suggested_category_id;
    std::optional<bool> auto_categorize;

    bool HasChanges() const;
};

/// A reviewer's decision on a pattern
struct ReviewAction {
    ReviewActionType type{ReviewActionType::CONFIRM};
    std::string reviewer;
    std::optional<std::string> notes;
    CriteriaEdits edits;
    bool activate_immediately{false};

    static ReviewAction Confirm(std::string reviewer, bool activate_immediately = false);
    static ReviewAction Reject(std::string reviewer, std::optional<std::string> notes = std::nullopt);
    static ReviewAction Edit(std::string reviewer, CriteriaEdits edits);
};

/// Pattern after a review, with the validation run it triggered
struct ReviewResult {
    RecurringChargePattern pattern;
    std::optional<PatternCriteriaValidation> validation;
};

/// PatternReviewService - applies review actions and lifecycle changes
///
/// Every operation takes the caller's copy of a pattern, derives the new
/// state and commits it with PatternRepository::UpdateIfCurrent using the
/// copy's status and version as the precondition. Two reviewers working
/// from the same copy therefore cannot both succeed: the second one gets a
/// TransitionConflict.
///
/// Review semantics:
///  - confirm: validate the criteria; CONFIRMED with criteria_validated when
///    every original transaction matches (optionally straight to ACTIVE),
///    otherwise the pattern stays DETECTED with the validation warnings
///    recorded as errors
///  - reject: REJECTED, active = false
///  - edit: apply the edits, reset criteria_validated and re-validate; the
///    status is unchanged
class PatternReviewService {
public:
    using Clock = std::function<EpochMillis()>;

    /// @throws std::invalid_argument if repository or validator is null
    PatternReviewService(std::shared_ptr<PatternRepository> repository,
                         std::shared_ptr<const PatternValidationService> validator,
                         Clock clock = &NowMillis);

    /// @throws InvalidTransition if the pattern is not DETECTED or CONFIRMED
    /// @throws TransitionConflict if the stored pattern changed
    ReviewResult Review(const RecurringChargePattern& pattern,
                        const ReviewAction& action,
                        const std::vector<Transaction>& all_transactions);

    /// CONFIRMED -> ACTIVE; requires validated criteria
    RecurringChargePattern Activate(const RecurringChargePattern& pattern,
                                    const std::string& reviewer);

    /// ACTIVE -> PAUSED
    RecurringChargePattern Pause(const RecurringChargePattern& pattern,
                                 const std::string& reviewer);

    /// PAUSED -> ACTIVE
    RecurringChargePattern Resume(const RecurringChargePattern& pattern,
                                  const std::string& reviewer);

private:
    void Confirm(RecurringChargePattern& pattern, const ReviewAction& action,
                 const std::vector<Transaction>& all_transactions,
                 ReviewResult& result, EpochMillis now) const;
    void Edit(RecurringChargePattern& pattern, const ReviewAction& action,
              const std::vector<Transaction>& all_transactions,
              ReviewResult& result, EpochMillis now) const;

    /// Persist under the original copy's status and version
    RecurringChargePattern Commit(RecurringChargePattern updated,
                                  const RecurringChargePattern& original);

    RecurringChargePattern ChangeStatus(const RecurringChargePattern& pattern,
                                        PatternStatus to, const std::string& reviewer);

    std::shared_ptr<PatternRepository> repository_;
    std::shared_ptr<const PatternValidationService> validator_;
    Clock clock_;
};

} // namespace recur
