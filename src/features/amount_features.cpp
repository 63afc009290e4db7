// File: src/features/amount_features.cpp
#include "features/amount_features.hpp"
#include <algorithm>
#include <cmath>

namespace recur {

FeatureBlock AmountFeatureExtractor::ExtractBatch(
    const std::vector<Transaction>& transactions) {
    std::vector<double> log_amounts;
    log_amounts.reserve(transactions.size());
    for (const auto& tx : transactions) {
        log_amounts.push_back(std::log1p(std::abs(tx.amount)));
    }

    FeatureBlock block;
    block.reserve(transactions.size());
    if (log_amounts.empty()) {
        return block;
    }

    auto [min_it, max_it] = std::minmax_element(log_amounts.begin(), log_amounts.end());
    double min_val = *min_it;
    double range = *max_it - min_val;

    for (double value : log_amounts) {
        FeatureVector row(kFeatureSize);
        row[0] = range > 0.0 ? static_cast<float>((value - min_val) / range) : 0.5f;
        block.push_back(std::move(row));
    }
    return block;
}

} // namespace recur
