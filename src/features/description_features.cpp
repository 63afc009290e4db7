// File: src/features/description_features.cpp
#include "features/description_features.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace recur {

DescriptionFeatureExtractor::DescriptionFeatureExtractor() = default;

DescriptionFeatureExtractor::DescriptionFeatureExtractor(
    std::shared_ptr<const TfidfVectorizer> fitted)
    : reuse_vectorizer_(true), vectorizer_(std::move(fitted)) {
    if (!vectorizer_ || !vectorizer_->IsFitted()) {
        throw std::invalid_argument("DescriptionFeatureExtractor requires a fitted vectorizer");
    }
    if (vectorizer_->VocabularySize() > kFeatureSize) {
        throw std::invalid_argument("vectorizer vocabulary exceeds description feature width");
    }
}

FeatureBlock DescriptionFeatureExtractor::ExtractBatch(
    const std::vector<Transaction>& transactions) {
    warnings_.clear();

    FeatureBlock block(transactions.size(), FeatureVector(kFeatureSize));
    if (transactions.empty()) {
        return block;
    }

    std::vector<std::string> documents;
    documents.reserve(transactions.size());
    for (const auto& tx : transactions) {
        documents.push_back(tx.description);
    }

    std::vector<FeatureVector> encoded;
    if (reuse_vectorizer_) {
        encoded = vectorizer_->Transform(documents);
    } else {
        TfidfVectorizer::Config config;
        config.max_features = kFeatureSize;
        auto vectorizer = std::make_shared<TfidfVectorizer>(config);
        try {
            encoded = vectorizer->FitTransform(documents);
            vectorizer_ = vectorizer;
        } catch (const std::invalid_argument& e) {
            vectorizer_.reset();
            std::string message =
                std::string("TF-IDF vectorization failed: ") + e.what() + ". Using zero vectors.";
            spdlog::warn("{}", message);
            warnings_.push_back(std::move(message));
            return block;
        }
    }

    // Pad to the fixed width
    for (size_t row = 0; row < encoded.size(); ++row) {
        for (size_t col = 0; col < encoded[row].Dimension(); ++col) {
            block[row][col] = encoded[row][col];
        }
    }
    return block;
}

} // namespace recur
