// File: src/features/amount_features.hpp
#pragma once

#include "features/feature_extractor.hpp"
#include <vector>

namespace recur {

/// AmountFeatureExtractor - log-scaled absolute amount, min-max normalized
/// over the batch. A batch of one, or of identical amounts, maps to 0.5.
class AmountFeatureExtractor {
public:
    static constexpr size_t kFeatureSize = 1;

    size_t FeatureSize() const { return kFeatureSize; }

    FeatureBlock ExtractBatch(const std::vector<Transaction>& transactions);
};

} // namespace recur
