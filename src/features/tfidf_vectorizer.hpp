// File: src/features/tfidf_vectorizer.hpp
#pragma once

#include "core/feature_vector.hpp"
#include <map>
#include <string>
#include <vector>

namespace recur {

/// TfidfVectorizer - term frequency / inverse document frequency encoder
///
/// Tokens are lowercase alphabetic words of two or more letters that stand
/// alone between word boundaries ("netflix.com" gives "netflix" and "com",
/// "abc123" gives nothing). N-grams are built over the token sequence.
/// IDF is smoothed, ln((1 + n) / (1 + df)) + 1, and every row is scaled to
/// unit L2 norm. Columns are the retained terms in lexicographic order.
///
/// A fitted vectorizer is a plain value; reusing a vocabulary across batches
/// means keeping the instance and calling Transform().
class TfidfVectorizer {
public:
    struct Config {
        /// Keep at most this many terms, by total count across the corpus
        size_t max_features{49};

        /// Longest n-gram (1 = unigrams only)
        size_t max_ngram{2};

        /// Drop terms found in fewer documents than this
        size_t min_df{1};

        /// Drop terms found in more than this fraction of documents
        double max_df{0.95};
    };

    TfidfVectorizer();
    explicit TfidfVectorizer(const Config& config);

    /// Learn vocabulary and idf weights
    /// @throws std::invalid_argument if the corpus is empty or no term
    ///         survives document-frequency pruning
    void Fit(const std::vector<std::string>& documents);

    /// Encode documents with the fitted vocabulary
    /// @return One row per document, VocabularySize() wide
    /// @throws std::logic_error if not fitted
    std::vector<FeatureVector> Transform(const std::vector<std::string>& documents) const;

    std::vector<FeatureVector> FitTransform(const std::vector<std::string>& documents);

    bool IsFitted() const { return !vocabulary_.empty(); }
    size_t VocabularySize() const { return vocabulary_.size(); }

    /// Term to column index
    const std::map<std::string, size_t>& Vocabulary() const { return vocabulary_; }

    /// Idf weight per column
    const std::vector<double>& Idf() const { return idf_; }

    const Config& GetConfig() const { return config_; }

    /// Split into tokens and n-grams as used for counting
    std::vector<std::string> Analyze(const std::string& document) const;

    /// Alphabetic tokens only
    static std::vector<std::string> Tokenize(const std::string& document);

private:
    Config config_;
    std::map<std::string, size_t> vocabulary_;
    std::vector<double> idf_;
};

} // namespace recur
