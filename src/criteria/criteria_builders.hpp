// File: src/criteria/criteria_builders.hpp
#pragma once

#include "analysis/frequency_analyzer.hpp"
#include "analysis/temporal_pattern_analyzer.hpp"
#include "core/recurring_charge_pattern.hpp"
#include "core/transaction.hpp"
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace recur {

// ============================================================================
// Merchant
// ============================================================================

/// Result of analysing the descriptions of a cluster
struct MerchantAnalysis {
    std::string common_substring;
    std::string common_prefix;
    std::string common_suffix;
    std::vector<std::string> variations;       // Sorted, unique
    std::string suggested_pattern;
    std::vector<std::string> suggested_exclusions;
    MatchType match_type{MatchType::CONTAINS};
    double confidence{0.0};                    // Discriminative power, [0, 1]

    MerchantCriteria ToCriteria() const;
};

/// MerchantCriteriaBuilder - suggests an editable merchant rule
///
/// Descriptions are uppercased and trimmed. A common prefix of at least
/// kMinPrefixLength characters is preferred (PREFIX), otherwise the longest
/// substring shared by every description (CONTAINS).
class MerchantCriteriaBuilder {
public:
    static constexpr size_t kMinPrefixLength = 5;

    static MerchantAnalysis Analyze(const std::vector<std::string>& descriptions);

    /// Longest substring contained in every string; earliest in the shortest wins ties
    static std::string LongestCommonSubstring(const std::vector<std::string>& strings);

    static std::string CommonPrefix(const std::vector<std::string>& strings);
    static std::string CommonSuffix(const std::vector<std::string>& strings);

    /// Words left after removing the common part, split on space, '.' and '-'
    static std::vector<std::string> Variations(const std::vector<std::string>& strings,
                                               const std::string& common);

    /// (min(len/10, 1) + max(0, 1 - position spread / 100)) / 2
    static double PatternConfidence(const std::vector<std::string>& strings,
                                    const std::string& pattern);
};

// ============================================================================
// Amount
// ============================================================================

/// Result of analysing the absolute amounts of a cluster
struct AmountAnalysis {
    double mean{0.0};
    double std_dev{0.0};
    double min{0.0};
    double max{0.0};
    double suggested_tolerance_pct{10.0};
    bool all_identical{false};
    bool has_outliers{false};
    std::vector<size_t> outlier_indices;       // |z| > 2

    AmountCriteria ToCriteria() const;
};

/// How many amounts a tolerance would accept
struct ToleranceCoverage {
    size_t total{0};
    size_t within_range{0};
    size_t outside_range{0};
    double coverage_pct{0.0};
    std::vector<double> outside_amounts;
    double min_allowed{0.0};
    double max_allowed{0.0};
};

/// AmountCriteriaBuilder - suggests amount tolerance from observed amounts
///
/// The suggested tolerance is 5% for identical amounts, otherwise the
/// coefficient of variation in percent rounded up to a multiple of 5 and
/// kept within [5, 25].
class AmountCriteriaBuilder {
public:
    static AmountAnalysis Analyze(const std::vector<double>& amounts);

    /// [mean - mean*pct/100, mean + mean*pct/100]
    static std::pair<double, double> ToleranceRange(double mean, double tolerance_pct);

    static ToleranceCoverage TestCoverage(const std::vector<double>& amounts,
                                          double mean, double tolerance_pct);
};

// ============================================================================
// Temporal
// ============================================================================

/// Result of analysing the dates of a cluster
struct TemporalAnalysis {
    RecurrenceFrequency frequency{RecurrenceFrequency::IRREGULAR};
    TemporalPatternType pattern_type{TemporalPatternType::FLEXIBLE};
    std::optional<int> day_of_month;
    std::optional<int> day_of_week;
    int suggested_tolerance_days{2};
    double consistency{0.5};
    double day_of_month_std{0.0};
    IntervalStatistics intervals;

    TemporalCriteria ToCriteria() const;
};

/// TemporalCriteriaBuilder - combines frequency and shape into a date rule
class TemporalCriteriaBuilder {
public:
    TemporalCriteriaBuilder(FrequencyAnalyzer frequency, TemporalPatternAnalyzer shape);

    TemporalAnalysis Analyze(const std::vector<Transaction>& transactions) const;

    /// max(2, floor(2 * day-of-month std)) for DAY_OF_MONTH,
    /// max(2, floor(interval std / 7)) otherwise
    static int SuggestToleranceDays(TemporalPatternType type,
                                    double day_of_month_std,
                                    double interval_std);

private:
    FrequencyAnalyzer frequency_;
    TemporalPatternAnalyzer shape_;
};

} // namespace recur
