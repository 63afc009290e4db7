// File: src/criteria/criteria_builders.cpp
#include "criteria/criteria_builders.hpp"
#include "analysis/merchant_pattern_analyzer.hpp"
#include "analysis/statistics.hpp"
#include "calendar/holiday_calendar.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

namespace recur {

// ============================================================================
// MerchantCriteriaBuilder
// ============================================================================

MerchantCriteria MerchantAnalysis::ToCriteria() const {
    MerchantCriteria criteria;
    criteria.pattern = suggested_pattern;
    criteria.match_type = match_type;
    criteria.exclusions = suggested_exclusions;
    return criteria;
}

MerchantAnalysis MerchantCriteriaBuilder::Analyze(const std::vector<std::string>& descriptions) {
    MerchantAnalysis analysis;
    if (descriptions.empty()) {
        return analysis;
    }

    std::vector<std::string> normalized;
    normalized.reserve(descriptions.size());
    for (const auto& description : descriptions) {
        normalized.push_back(TrimWhitespace(ToUpperAscii(description)));
    }

    analysis.common_substring = LongestCommonSubstring(normalized);
    analysis.common_prefix = CommonPrefix(normalized);
    analysis.common_suffix = CommonSuffix(normalized);
    analysis.variations = Variations(normalized, analysis.common_substring);

    std::string prefix = TrimWhitespace(analysis.common_prefix);
    if (prefix.size() >= kMinPrefixLength) {
        analysis.match_type = MatchType::PREFIX;
        analysis.suggested_pattern = prefix;
    } else {
        analysis.match_type = MatchType::CONTAINS;
        analysis.suggested_pattern = TrimWhitespace(analysis.common_substring);
    }

    analysis.confidence = PatternConfidence(normalized, analysis.suggested_pattern);
    return analysis;
}

std::string MerchantCriteriaBuilder::LongestCommonSubstring(
    const std::vector<std::string>& strings) {
    if (strings.empty()) {
        return "";
    }

    const std::string& shortest = *std::min_element(
        strings.begin(), strings.end(),
        [](const std::string& a, const std::string& b) { return a.size() < b.size(); });

    for (size_t length = shortest.size(); length > 0; --length) {
        for (size_t start = 0; start + length <= shortest.size(); ++start) {
            const std::string candidate = shortest.substr(start, length);
            bool everywhere = std::all_of(
                strings.begin(), strings.end(),
                [&candidate](const std::string& s) { return s.find(candidate) != std::string::npos; });
            if (everywhere) {
                return candidate;
            }
        }
    }
    return "";
}

std::string MerchantCriteriaBuilder::CommonPrefix(const std::vector<std::string>& strings) {
    if (strings.empty()) {
        return "";
    }

    size_t length = strings.front().size();
    for (size_t i = 1; i < strings.size(); ++i) {
        const std::string& s = strings[i];
        size_t j = 0;
        while (j < length && j < s.size() && s[j] == strings.front()[j]) {
            ++j;
        }
        length = j;
    }
    return strings.front().substr(0, length);
}

std::string MerchantCriteriaBuilder::CommonSuffix(const std::vector<std::string>& strings) {
    std::vector<std::string> reversed;
    reversed.reserve(strings.size());
    for (const auto& s : strings) {
        reversed.emplace_back(s.rbegin(), s.rend());
    }
    std::string suffix = CommonPrefix(reversed);
    return std::string(suffix.rbegin(), suffix.rend());
}

std::vector<std::string> MerchantCriteriaBuilder::Variations(
    const std::vector<std::string>& strings, const std::string& common) {
    std::set<std::string> variations;
    for (std::string s : strings) {
        if (!common.empty()) {
            size_t pos;
            while ((pos = s.find(common)) != std::string::npos) {
                s.erase(pos, common.size());
            }
        }
        std::replace(s.begin(), s.end(), '.', ' ');
        std::replace(s.begin(), s.end(), '-', ' ');

        std::istringstream in(s);
        std::string word;
        while (in >> word) {
            variations.insert(word);
        }
    }
    return std::vector<std::string>(variations.begin(), variations.end());
}

double MerchantCriteriaBuilder::PatternConfidence(const std::vector<std::string>& strings,
                                                  const std::string& pattern) {
    if (pattern.empty() || strings.empty()) {
        return 0.0;
    }

    double length_score = std::min(static_cast<double>(pattern.size()) / 10.0, 1.0);

    size_t min_pos = std::string::npos;
    size_t max_pos = 0;
    for (const auto& s : strings) {
        size_t pos = s.find(pattern);
        if (pos == std::string::npos) {
            // Pattern absent from a member: position carries no signal
            return length_score / 2.0;
        }
        min_pos = std::min(min_pos, pos);
        max_pos = std::max(max_pos, pos);
    }

    double spread = static_cast<double>(max_pos - min_pos);
    double position_score = std::max(0.0, 1.0 - spread / 100.0);
    return (length_score + position_score) / 2.0;
}

// ============================================================================
// AmountCriteriaBuilder
// ============================================================================

AmountCriteria AmountAnalysis::ToCriteria() const {
    AmountCriteria criteria;
    criteria.mean = mean;
    criteria.std_dev = std_dev;
    criteria.min = min;
    criteria.max = max;
    criteria.tolerance_pct = suggested_tolerance_pct;
    return criteria;
}

AmountAnalysis AmountCriteriaBuilder::Analyze(const std::vector<double>& amounts) {
    AmountAnalysis analysis;
    if (amounts.empty()) {
        return analysis;
    }

    analysis.mean = stats::Mean(amounts);
    analysis.std_dev = stats::StdDev(amounts);
    auto range = std::minmax_element(amounts.begin(), amounts.end());
    analysis.min = *range.first;
    analysis.max = *range.second;
    analysis.all_identical = analysis.min == analysis.max;

    if (analysis.all_identical) {
        analysis.suggested_tolerance_pct = 5.0;
    } else {
        double variation_pct = analysis.mean > 0.0
                                   ? analysis.std_dev / analysis.mean * 100.0
                                   : 10.0;
        double rounded = std::floor((variation_pct + 4.99) / 5.0) * 5.0;
        analysis.suggested_tolerance_pct = std::max(5.0, std::min(rounded, 25.0));
    }

    if (analysis.std_dev > 0.0) {
        for (size_t i = 0; i < amounts.size(); ++i) {
            double z = std::abs((amounts[i] - analysis.mean) / analysis.std_dev);
            if (z > 2.0) {
                analysis.outlier_indices.push_back(i);
            }
        }
    }
    analysis.has_outliers = !analysis.outlier_indices.empty();
    return analysis;
}

std::pair<double, double> AmountCriteriaBuilder::ToleranceRange(double mean,
                                                                double tolerance_pct) {
    double tolerance = mean * (tolerance_pct / 100.0);
    return {mean - tolerance, mean + tolerance};
}

ToleranceCoverage AmountCriteriaBuilder::TestCoverage(const std::vector<double>& amounts,
                                                      double mean, double tolerance_pct) {
    ToleranceCoverage coverage;
    auto range = ToleranceRange(mean, tolerance_pct);
    coverage.min_allowed = range.first;
    coverage.max_allowed = range.second;
    coverage.total = amounts.size();

    for (double amount : amounts) {
        if (amount >= range.first && amount <= range.second) {
            ++coverage.within_range;
        } else {
            coverage.outside_amounts.push_back(amount);
        }
    }
    coverage.outside_range = coverage.outside_amounts.size();
    coverage.coverage_pct = amounts.empty()
                                ? 0.0
                                : 100.0 * coverage.within_range / amounts.size();
    return coverage;
}

// ============================================================================
// TemporalCriteriaBuilder
// ============================================================================

TemporalCriteria TemporalAnalysis::ToCriteria() const {
    TemporalCriteria criteria;
    criteria.frequency = frequency;
    criteria.pattern_type = pattern_type;
    criteria.day_of_week = day_of_week;
    criteria.day_of_month = day_of_month;
    criteria.tolerance_days = suggested_tolerance_days;
    return criteria;
}

TemporalCriteriaBuilder::TemporalCriteriaBuilder(FrequencyAnalyzer frequency,
                                                 TemporalPatternAnalyzer shape)
    : frequency_(std::move(frequency)), shape_(std::move(shape)) {}

TemporalAnalysis TemporalCriteriaBuilder::Analyze(
    const std::vector<Transaction>& transactions) const {
    TemporalAnalysis analysis;
    if (transactions.empty()) {
        return analysis;
    }

    analysis.frequency = frequency_.Analyze(transactions);
    analysis.intervals = frequency_.GetIntervalStatistics(transactions);

    TemporalPatternResult shape = shape_.Analyze(transactions);
    analysis.pattern_type = shape.pattern_type;
    analysis.day_of_month = shape.day_of_month;
    analysis.day_of_week = shape.day_of_week;
    analysis.consistency = shape.consistency;

    std::vector<double> days;
    days.reserve(transactions.size());
    for (const auto& tx : transactions) {
        days.push_back(ToDate(tx.date).day());
    }
    analysis.day_of_month_std = stats::StdDev(days);

    analysis.suggested_tolerance_days = SuggestToleranceDays(
        analysis.pattern_type, analysis.day_of_month_std, analysis.intervals.std_dev);
    return analysis;
}

int TemporalCriteriaBuilder::SuggestToleranceDays(TemporalPatternType type,
                                                  double day_of_month_std,
                                                  double interval_std) {
    if (type == TemporalPatternType::DAY_OF_MONTH) {
        return std::max(2, static_cast<int>(day_of_month_std * 2.0));
    }
    return std::max(2, static_cast<int>(interval_std / 7.0));
}

} // namespace recur
