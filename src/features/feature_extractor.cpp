// File: src/features/feature_extractor.cpp
#include "features/feature_extractor.hpp"

namespace recur {

FeatureBlock FeatureExtractorSlot::ExtractBatch(
    const std::vector<Transaction>& transactions) const {
    FeatureBlock block = extract_(transactions);

    if (block.size() != transactions.size()) {
        throw std::logic_error(
            "Extractor '" + name_ + "' produced " + std::to_string(block.size()) +
            " rows for " + std::to_string(transactions.size()) + " transactions");
    }
    for (const auto& row : block) {
        if (row.Dimension() != feature_size_) {
            throw std::logic_error(
                "Extractor '" + name_ + "' produced a row of width " +
                std::to_string(row.Dimension()) + ", declared " +
                std::to_string(feature_size_));
        }
    }
    return block;
}

} // namespace recur
