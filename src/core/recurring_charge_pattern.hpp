// File: src/core/recurring_charge_pattern.hpp
#pragma once

#include "core/types.hpp"
#include "core/feature_vector.hpp"
#include <optional>
#include <string>
#include <vector>

namespace recur {

class PatternLifecycle;

/// Rule that decides whether a description belongs to the merchant
struct MerchantCriteria {
    std::string pattern;
    MatchType match_type{MatchType::CONTAINS};
    std::vector<std::string> exclusions;
    bool case_sensitive{false};

    bool operator==(const MerchantCriteria& other) const;
    bool operator!=(const MerchantCriteria& other) const { return !(*this == other); }
};

/// Expected amount distribution; matching uses mean ± tolerance_pct
struct AmountCriteria {
    double mean{0.0};
    double std_dev{0.0};
    double min{0.0};
    double max{0.0};
    double tolerance_pct{10.0};

    bool operator==(const AmountCriteria& other) const;
    bool operator!=(const AmountCriteria& other) const { return !(*this == other); }
};

/// When occurrences are expected
struct TemporalCriteria {
    RecurrenceFrequency frequency{RecurrenceFrequency::IRREGULAR};
    TemporalPatternType pattern_type{TemporalPatternType::FLEXIBLE};
    std::optional<int> day_of_week;    // 0 = Monday .. 6 = Sunday
    std::optional<int> day_of_month;   // 1..31
    int tolerance_days{2};

    bool operator==(const TemporalCriteria& other) const;
    bool operator!=(const TemporalCriteria& other) const { return !(*this == other); }
};

// RecurringChargePattern: A detected recurring charge and its matching rule
//
// The originating cluster's transaction ids are captured once at
// construction and exposed read-only. Status changes go exclusively
// through PatternLifecycle.
class RecurringChargePattern {
public:
    RecurringChargePattern() = default;
    RecurringChargePattern(PatternID id, std::string user_id,
                           std::vector<std::string> matched_transaction_ids);

    // Identity
    const PatternID& GetID() const { return id_; }
    const std::string& GetUserID() const { return user_id_; }
    const std::vector<std::string>& GetMatchedTransactionIDs() const {
        return matched_transaction_ids_;
    }

    // Criteria
    const MerchantCriteria& GetMerchantCriteria() const { return merchant_; }
    const AmountCriteria& GetAmountCriteria() const { return amount_; }
    const TemporalCriteria& GetTemporalCriteria() const { return temporal_; }
    void SetMerchantCriteria(const MerchantCriteria& criteria) { merchant_ = criteria; }
    void SetAmountCriteria(const AmountCriteria& criteria) { amount_ = criteria; }
    void SetTemporalCriteria(const TemporalCriteria& criteria) { temporal_ = criteria; }

    // Statistics
    double GetConfidence() const { return confidence_; }
    /// @throws std::invalid_argument if confidence is outside [0, 1]
    void SetConfidence(double confidence);

    size_t GetTransactionCount() const { return transaction_count_; }
    void SetTransactionCount(size_t count) { transaction_count_ = count; }

    EpochMillis GetFirstOccurrence() const { return first_occurrence_; }
    EpochMillis GetLastOccurrence() const { return last_occurrence_; }
    void SetOccurrenceRange(EpochMillis first, EpochMillis last);

    const FeatureVector& GetFeatureVector() const { return feature_vector_; }
    FeatureMode GetFeatureMode() const { return feature_mode_; }
    /// @throws std::invalid_argument if the vector width does not match mode
    void SetFeatureVector(FeatureVector vector, FeatureMode mode);

    int GetClusterID() const { return cluster_id_; }
    void SetClusterID(int cluster_id) { cluster_id_ = cluster_id; }

    // Categorization
    const std::optional<std::string>& GetSuggestedCategoryID() const { return suggested_category_id_; }
    void SetSuggestedCategoryID(std::optional<std::string> id) { suggested_category_id_ = std::move(id); }
    bool GetAutoCategorize() const { return auto_categorize_; }
    void SetAutoCategorize(bool value) { auto_categorize_ = value; }

    // Validation state
    bool IsCriteriaValidated() const { return criteria_validated_; }
    const std::vector<std::string>& GetCriteriaValidationErrors() const {
        return criteria_validation_errors_;
    }
    void SetCriteriaValidation(bool validated, std::vector<std::string> errors);

    // Lifecycle
    PatternStatus GetStatus() const { return status_; }
    bool IsActive() const { return active_; }
    const std::optional<std::string>& GetReviewedBy() const { return reviewed_by_; }
    const std::optional<EpochMillis>& GetReviewedAt() const { return reviewed_at_; }
    void RecordReview(const std::string& reviewer, EpochMillis at);

    /// Only Active and enabled patterns may drive live categorization
    bool IsEligibleForCategorization() const {
        return status_ == PatternStatus::ACTIVE && active_;
    }

    // Bookkeeping
    EpochMillis GetCreatedAt() const { return created_at_; }
    EpochMillis GetUpdatedAt() const { return updated_at_; }
    void SetCreatedAt(EpochMillis at) { created_at_ = at; }
    void Touch(EpochMillis at) { updated_at_ = at; }

    /// Incremented by repositories on every committed update
    uint64_t GetVersion() const { return version_; }
    void SetVersion(uint64_t version) { version_ = version; }

    // Serialization
    void Serialize(std::ostream& out) const;
    static RecurringChargePattern Deserialize(std::istream& in);

    // String representation
    std::string ToString() const;

    bool operator==(const RecurringChargePattern& other) const;
    bool operator!=(const RecurringChargePattern& other) const { return !(*this == other); }

private:
    friend class PatternLifecycle;

    void SetStatus(PatternStatus status) { status_ = status; }
    void SetActive(bool active) { active_ = active; }

    PatternID id_;
    std::string user_id_;
    std::vector<std::string> matched_transaction_ids_;

    MerchantCriteria merchant_;
    AmountCriteria amount_;
    TemporalCriteria temporal_;

    double confidence_{0.0};
    size_t transaction_count_{0};
    EpochMillis first_occurrence_{0};
    EpochMillis last_occurrence_{0};
    FeatureVector feature_vector_;
    FeatureMode feature_mode_{FeatureMode::BASE};
    int cluster_id_{-1};

    std::optional<std::string> suggested_category_id_;
    bool auto_categorize_{true};

    bool criteria_validated_{false};
    std::vector<std::string> criteria_validation_errors_;

    PatternStatus status_{PatternStatus::DETECTED};
    std::optional<std::string> reviewed_by_;
    std::optional<EpochMillis> reviewed_at_;
    bool active_{false};

    EpochMillis created_at_{0};
    EpochMillis updated_at_{0};
    uint64_t version_{0};
};

} // namespace recur
