// File: src/features/feature_service.hpp
#pragma once

#include "calendar/holiday_calendar.hpp"
#include "core/feature_vector.hpp"
#include "core/transaction.hpp"
#include "features/feature_extractor.hpp"
#include "features/tfidf_vectorizer.hpp"
#include <memory>
#include <string>
#include <vector>

namespace recur {

/// Output of one feature extraction run
struct FeatureBatch {
    explicit FeatureBatch(FeatureMode mode) : matrix(mode) {}

    /// One row per accepted transaction
    FeatureMatrix matrix;

    /// Indices into the input of the transactions behind each row
    std::vector<size_t> source_indices;

    /// Vocabulary used for the description block, null if fitting failed
    std::shared_ptr<const TfidfVectorizer> vectorizer;

    /// Skipped transactions and extractor fallbacks
    std::vector<std::string> warnings;
};

/// FeatureService - turns a transaction batch into a feature matrix
///
/// Composes the temporal (17), amount (1) and description (49) extractors,
/// plus the account extractor (24) when an accounts map is given, giving 67
/// or 91 columns. Malformed transactions are skipped with a warning and an
/// empty batch gives an empty matrix.
class FeatureService {
public:
    /// @param holidays Calendar used for working-day features
    explicit FeatureService(std::shared_ptr<const HolidayCalendar> holidays);

    /// Extract features for a batch
    /// @param transactions Input batch
    /// @param accounts Optional account context; selects account-aware mode
    /// @param vectorizer Optional fitted vectorizer to reuse
    FeatureBatch ExtractBatch(
        const std::vector<Transaction>& transactions,
        const AccountsMap* accounts = nullptr,
        std::shared_ptr<const TfidfVectorizer> vectorizer = nullptr) const;

    /// Column names for the given mode, in matrix order
    std::vector<std::string> FeatureNames(FeatureMode mode) const;

private:
    std::shared_ptr<const HolidayCalendar> holidays_;
};

} // namespace recur
