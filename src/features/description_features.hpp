// File: src/features/description_features.hpp
#pragma once

#include "features/feature_extractor.hpp"
#include "features/tfidf_vectorizer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace recur {

/// DescriptionFeatureExtractor - TF-IDF encoding of merchant descriptions
///
/// Without a supplied vectorizer, one is fitted on each batch, so columns
/// mean different terms in independently fitted batches. Pass the
/// vectorizer returned by FittedVectorizer() to a new extractor to encode
/// later batches in the same space.
///
/// When fitting fails (no term survives pruning) every row is zero, a
/// warning is recorded and no vectorizer is produced.
class DescriptionFeatureExtractor {
public:
    static constexpr size_t kFeatureSize = 49;

    DescriptionFeatureExtractor();

    /// Reuse an already fitted vocabulary instead of fitting per batch
    explicit DescriptionFeatureExtractor(std::shared_ptr<const TfidfVectorizer> fitted);

    size_t FeatureSize() const { return kFeatureSize; }

    FeatureBlock ExtractBatch(const std::vector<Transaction>& transactions);

    /// Vectorizer used by the last ExtractBatch call, null if fitting failed
    std::shared_ptr<const TfidfVectorizer> FittedVectorizer() const { return vectorizer_; }

    /// Warnings from the last ExtractBatch call
    const std::vector<std::string>& Warnings() const { return warnings_; }

private:
    bool reuse_vectorizer_{false};
    std::shared_ptr<const TfidfVectorizer> vectorizer_;
    std::vector<std::string> warnings_;
};

} // namespace recur
