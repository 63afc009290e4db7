// File: src/detection/detection_service.hpp
#pragma once

#include "analysis/confidence_scorer.hpp"
#include "analysis/frequency_analyzer.hpp"
#include "analysis/merchant_pattern_analyzer.hpp"
#include "analysis/temporal_pattern_analyzer.hpp"
#include "calendar/holiday_calendar.hpp"
#include "core/recurring_charge_pattern.hpp"
#include "core/transaction.hpp"
#include "criteria/criteria_builders.hpp"
#include "features/feature_service.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace recur {

/// Counters describing one detection run
struct DetectionStats {
    size_t transactions_in{0};
    size_t transactions_used{0};     // Rows that made it into a feature matrix
    size_t batches{0};
    size_t clusters_found{0};
    size_t noise_points{0};
    size_t clusters_too_small{0};    // Fewer members than min_occurrences
    size_t clusters_low_confidence{0};
    size_t patterns_detected{0};
    FeatureMode feature_mode{FeatureMode::BASE};
};

/// Output of DetectionService::Detect
struct DetectionResult {
    /// Draft patterns, status DETECTED, ordered by first occurrence
    std::vector<RecurringChargePattern> patterns;

    /// Skipped transactions, vectorizer fallbacks, batch splits
    std::vector<std::string> warnings;

    DetectionStats stats;
};

/// DetectionService - main entry point of recurring charge detection
///
/// Pipeline per batch: feature extraction (67 or 91 columns) -> DBSCAN ->
/// per cluster frequency, temporal shape, merchant pattern and confidence
/// -> criteria builders -> draft RecurringChargePattern.
///
/// Clusters smaller than min_occurrences or scoring below min_confidence
/// produce no pattern. An input with no qualifying cluster yields an empty
/// result, which is a normal outcome.
///
/// Example usage:
/// @code
///   DetectionService::Config config;
///   config.eps = 2.5;
///   DetectionService service(config, CreateHolidayCalendar("US"));
///   DetectionResult result = service.Detect("user-1", transactions);
/// @endcode
class DetectionService {
public:
    struct Config {
        /// DBSCAN radius; no usable default exists for 67/91 columns
        double eps{0.0};

        /// min_samples = max(min_cluster_size, floor(n * min_samples_ratio))
        double min_samples_ratio{0.01};
        size_t min_cluster_size{3};

        size_t min_occurrences{3};
        double min_confidence{0.6};

        /// Upper bound on transactions per detection pass
        size_t max_batch_size{5000};

        /// Use the accounts map for features and confidence when one is given
        bool use_account_features{true};

        FrequencyAnalyzer::Config frequency;
        TemporalPatternAnalyzer::Config temporal;
        MerchantPatternAnalyzer::Config merchant;
        ConfidenceScorer::Config confidence;
    };

    using Clock = std::function<EpochMillis()>;

    /// @throws std::invalid_argument on invalid configuration or null calendar
    DetectionService(const Config& config,
                     std::shared_ptr<const HolidayCalendar> holidays,
                     ConfidenceAdjustmentTable adjustments = ConfidenceAdjustmentTable::Default());

    /// Detect recurring patterns in one user's history
    /// @param accounts Optional account context (account-aware mode)
    DetectionResult Detect(const std::string& user_id,
                           const std::vector<Transaction>& transactions,
                           const AccountsMap* accounts = nullptr) const;

    /// Timestamp source for created_at/updated_at
    void SetClock(Clock clock);

    const Config& GetConfig() const { return config_; }

private:
    void DetectBatch(const std::string& user_id,
                     const std::vector<Transaction>& transactions,
                     const AccountsMap* accounts,
                     DetectionResult& result) const;

    /// Build a pattern from one cluster; false when it falls below min_confidence
    bool AnalyzeCluster(const std::string& user_id,
                        std::vector<Transaction> members,
                        const FeatureMatrix& matrix,
                        const std::vector<size_t>& rows,
                        int cluster_label,
                        const AccountsMap* accounts,
                        RecurringChargePattern& out) const;

    size_t MinSamples(size_t row_count) const;

    Config config_;
    std::shared_ptr<const HolidayCalendar> holidays_;
    FeatureService features_;
    MerchantPatternAnalyzer merchant_;
    ConfidenceScorer scorer_;
    TemporalCriteriaBuilder temporal_criteria_;
    Clock clock_;
};

} // namespace recur
