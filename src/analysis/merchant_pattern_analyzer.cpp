// File: src/analysis/merchant_pattern_analyzer.cpp
#include "analysis/merchant_pattern_analyzer.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace recur {

namespace {

std::string FirstWord(const std::string& value) {
    std::istringstream in(value);
    std::string word;
    if (in >> word) {
        return word;
    }
    return "UNKNOWN";
}

} // anonymous namespace

std::string ToUpperAscii(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

std::string TrimWhitespace(const std::string& value) {
    auto not_space = [](unsigned char c) { return !std::isspace(c); };
    auto begin = std::find_if(value.begin(), value.end(), not_space);
    auto end = std::find_if(value.rbegin(), value.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

MerchantPatternAnalyzer::MerchantPatternAnalyzer() : MerchantPatternAnalyzer(Config{}) {}

MerchantPatternAnalyzer::MerchantPatternAnalyzer(const Config& config) : config_(config) {
    if (config_.max_pattern_length == 0 ||
        config_.min_pattern_length > config_.max_pattern_length) {
        throw std::invalid_argument("Invalid merchant pattern length bounds");
    }
}

std::string MerchantPatternAnalyzer::LongestCommonSubstring(const std::string& a,
                                                            const std::string& b) {
    const size_t m = a.size();
    const size_t n = b.size();
    if (m == 0 || n == 0) {
        return "";
    }

    // Rolling rows of the DP table
    std::vector<size_t> previous(n + 1, 0);
    std::vector<size_t> current(n + 1, 0);
    size_t best_length = 0;
    size_t best_end = 0;

    for (size_t i = 1; i <= m; ++i) {
        for (size_t j = 1; j <= n; ++j) {
            if (a[i - 1] == b[j - 1]) {
                current[j] = previous[j - 1] + 1;
                if (current[j] > best_length) {
                    best_length = current[j];
                    best_end = i;
                }
            } else {
                current[j] = 0;
            }
        }
        std::swap(previous, current);
    }

    return a.substr(best_end - best_length, best_length);
}

std::string MerchantPatternAnalyzer::ExtractPattern(
    const std::vector<Transaction>& transactions) const {
    if (transactions.empty()) {
        return "UNKNOWN";
    }

    const std::string first = ToUpperAscii(transactions.front().description);
    std::string common = first;
    for (size_t i = 1; i < transactions.size(); ++i) {
        std::string next = LongestCommonSubstring(common, ToUpperAscii(transactions[i].description));
        if (next.empty()) {
            common = FirstWord(first);
            break;
        }
        common = std::move(next);
    }

    common = TrimWhitespace(common);
    if (common.size() < config_.min_pattern_length) {
        common = FirstWord(first);
    }
    return common.substr(0, config_.max_pattern_length);
}

double MerchantPatternAnalyzer::PatternCoverage(const std::vector<Transaction>& transactions,
                                                const std::string& pattern) {
    if (transactions.empty() || pattern.empty()) {
        return 0.0;
    }

    const std::string needle = ToUpperAscii(pattern);
    size_t matches = static_cast<size_t>(std::count_if(
        transactions.begin(), transactions.end(), [&needle](const Transaction& tx) {
            return ToUpperAscii(tx.description).find(needle) != std::string::npos;
        }));
    return static_cast<double>(matches) / transactions.size();
}

} // namespace recur
