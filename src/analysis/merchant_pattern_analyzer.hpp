// File: src/analysis/merchant_pattern_analyzer.hpp
#pragma once

#include "core/transaction.hpp"
#include <string>
#include <vector>

namespace recur {

/// MerchantPatternAnalyzer - canonical merchant token of a cluster
///
/// The pattern is the longest common substring of the uppercased
/// descriptions, folded left to right. When descriptions share nothing, or
/// the result is shorter than min_pattern_length, the first word of the
/// first description is used instead.
class MerchantPatternAnalyzer {
public:
    struct Config {
        size_t min_pattern_length{3};
        size_t max_pattern_length{50};
    };

    MerchantPatternAnalyzer();

    /// @throws std::invalid_argument if min > max or max == 0
    explicit MerchantPatternAnalyzer(const Config& config);

    /// Canonical uppercase merchant pattern, "UNKNOWN" for an empty cluster
    std::string ExtractPattern(const std::vector<Transaction>& transactions) const;

    /// Fraction of descriptions containing the pattern (case-insensitive)
    static double PatternCoverage(const std::vector<Transaction>& transactions,
                                  const std::string& pattern);

    /// Longest common substring; earliest occurrence in a wins ties
    static std::string LongestCommonSubstring(const std::string& a, const std::string& b);

    const Config& GetConfig() const { return config_; }

private:
    Config config_;
};

/// Uppercase copy (ASCII)
std::string ToUpperAscii(std::string value);

/// Copy without leading/trailing whitespace
std::string TrimWhitespace(const std::string& value);

} // namespace recur
