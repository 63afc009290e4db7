// File: src/features/tfidf_vectorizer.cpp
#include "features/tfidf_vectorizer.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <set>
#include <stdexcept>

namespace recur {

namespace {

// Matches the regex notion of a word character, treating non-ASCII bytes as
// letters so accented words are not split
bool IsWordChar(unsigned char c) {
    return std::isalnum(c) || c == '_' || c >= 0x80;
}

} // anonymous namespace

TfidfVectorizer::TfidfVectorizer() : TfidfVectorizer(Config{}) {}

TfidfVectorizer::TfidfVectorizer(const Config& config) : config_(config) {
    if (config_.max_features == 0) {
        throw std::invalid_argument("max_features must be > 0");
    }
    if (config_.max_ngram == 0) {
        throw std::invalid_argument("max_ngram must be >= 1");
    }
    if (config_.max_df <= 0.0 || config_.max_df > 1.0) {
        throw std::invalid_argument("max_df must be in (0, 1]");
    }
}

std::vector<std::string> TfidfVectorizer::Tokenize(const std::string& document) {
    std::vector<std::string> tokens;

    size_t i = 0;
    while (i < document.size()) {
        if (!IsWordChar(static_cast<unsigned char>(document[i]))) {
            ++i;
            continue;
        }

        size_t start = i;
        bool alphabetic = true;
        while (i < document.size() && IsWordChar(static_cast<unsigned char>(document[i]))) {
            if (!std::isalpha(static_cast<unsigned char>(document[i]))) {
                alphabetic = false;
            }
            ++i;
        }

        if (alphabetic && i - start >= 2) {
            std::string word = document.substr(start, i - start);
            std::transform(word.begin(), word.end(), word.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            tokens.push_back(std::move(word));
        }
    }
    return tokens;
}

std::vector<std::string> TfidfVectorizer::Analyze(const std::string& document) const {
    std::vector<std::string> tokens = Tokenize(document);
    std::vector<std::string> terms = tokens;

    for (size_t n = 2; n <= config_.max_ngram; ++n) {
        for (size_t start = 0; start + n <= tokens.size(); ++start) {
            std::string gram = tokens[start];
            for (size_t k = 1; k < n; ++k) {
                gram += ' ';
                gram += tokens[start + k];
            }
            terms.push_back(std::move(gram));
        }
    }
    return terms;
}

void TfidfVectorizer::Fit(const std::vector<std::string>& documents) {
    vocabulary_.clear();
    idf_.clear();

    if (documents.empty()) {
        throw std::invalid_argument("cannot fit TF-IDF on an empty corpus");
    }

    const double n_docs = static_cast<double>(documents.size());
    const double max_doc_count = config_.max_df * n_docs;
    if (max_doc_count < static_cast<double>(config_.min_df)) {
        throw std::invalid_argument("max_df corresponds to fewer documents than min_df");
    }

    std::map<std::string, size_t> term_counts;
    std::map<std::string, size_t> doc_counts;
    for (const auto& doc : documents) {
        std::set<std::string> seen;
        for (auto& term : Analyze(doc)) {
            ++term_counts[term];
            if (seen.insert(term).second) {
                ++doc_counts[term];
            }
        }
    }

    // Document-frequency pruning
    std::vector<std::pair<std::string, size_t>> candidates;
    for (const auto& [term, df] : doc_counts) {
        if (df >= config_.min_df && static_cast<double>(df) <= max_doc_count) {
            candidates.emplace_back(term, term_counts[term]);
        }
    }
    if (candidates.empty()) {
        throw std::invalid_argument("After pruning, no terms remain");
    }

    // Most frequent terms first, alphabetical among equals
    if (candidates.size() > config_.max_features) {
        std::stable_sort(candidates.begin(), candidates.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });
        candidates.resize(config_.max_features);
    }

    std::vector<std::string> terms;
    terms.reserve(candidates.size());
    for (const auto& candidate : candidates) {
        terms.push_back(candidate.first);
    }
    std::sort(terms.begin(), terms.end());

    idf_.reserve(terms.size());
    for (size_t col = 0; col < terms.size(); ++col) {
        vocabulary_[terms[col]] = col;
        double df = static_cast<double>(doc_counts[terms[col]]);
        idf_.push_back(std::log((1.0 + n_docs) / (1.0 + df)) + 1.0);
    }
}

std::vector<FeatureVector> TfidfVectorizer::Transform(
    const std::vector<std::string>& documents) const {
    if (!IsFitted()) {
        throw std::logic_error("TfidfVectorizer must be fitted before Transform");
    }

    std::vector<FeatureVector> rows;
    rows.reserve(documents.size());
    for (const auto& doc : documents) {
        FeatureVector row(vocabulary_.size());
        for (const auto& term : Analyze(doc)) {
            auto it = vocabulary_.find(term);
            if (it != vocabulary_.end()) {
                row[it->second] += 1.0f;
            }
        }
        for (size_t col = 0; col < row.Dimension(); ++col) {
            row[col] = static_cast<float>(row[col] * idf_[col]);
        }
        rows.push_back(row.Normalized());
    }
    return rows;
}

std::vector<FeatureVector> TfidfVectorizer::FitTransform(
    const std::vector<std::string>& documents) {
    Fit(documents);
    return Transform(documents);
}

} // namespace recur
