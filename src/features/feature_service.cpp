// File: src/features/feature_service.cpp
#include "features/feature_service.hpp"
#include "features/account_features.hpp"
#include "features/amount_features.hpp"
#include "features/description_features.hpp"
#include "features/temporal_features.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace recur {

FeatureService::FeatureService(std::shared_ptr<const HolidayCalendar> holidays)
    : holidays_(std::move(holidays)) {
    if (!holidays_) {
        throw std::invalid_argument("FeatureService requires a holiday calendar");
    }
}

FeatureBatch FeatureService::ExtractBatch(
    const std::vector<Transaction>& transactions,
    const AccountsMap* accounts,
    std::shared_ptr<const TfidfVectorizer> vectorizer) const {

    FeatureMode mode = accounts ? FeatureMode::ACCOUNT_AWARE : FeatureMode::BASE;
    FeatureBatch batch(mode);

    // Drop malformed records, remembering where accepted rows came from
    std::vector<Transaction> accepted;
    accepted.reserve(transactions.size());
    for (size_t i = 0; i < transactions.size(); ++i) {
        if (transactions[i].IsWellFormed()) {
            accepted.push_back(transactions[i]);
            batch.source_indices.push_back(i);
        } else {
            std::string message = "Skipping malformed transaction at index " +
                                  std::to_string(i) + " (id '" + transactions[i].id + "')";
            spdlog::warn("{}", message);
            batch.warnings.push_back(std::move(message));
        }
    }

    if (accepted.empty()) {
        return batch;
    }

    auto description = vectorizer
        ? std::make_shared<DescriptionFeatureExtractor>(std::move(vectorizer))
        : std::make_shared<DescriptionFeatureExtractor>();

    std::vector<FeatureExtractorSlot> slots;
    slots.push_back(FeatureExtractorSlot::Wrap(
        "temporal", std::make_shared<TemporalFeatureExtractor>(holidays_)));
    slots.push_back(FeatureExtractorSlot::Wrap(
        "amount", std::make_shared<AmountFeatureExtractor>()));
    slots.push_back(FeatureExtractorSlot::Wrap("description", description));
    if (accounts) {
        slots.push_back(FeatureExtractorSlot::Wrap(
            "account", std::make_shared<AccountFeatureExtractor>(*accounts)));
    }

    std::vector<FeatureVector> rows(accepted.size());
    for (const auto& slot : slots) {
        FeatureBlock block = slot.ExtractBatch(accepted);
        for (size_t i = 0; i < rows.size(); ++i) {
            rows[i].Append(block[i]);
        }
    }

    batch.matrix = FeatureMatrix(mode, std::move(rows));
    batch.vectorizer = description->FittedVectorizer();
    for (const auto& warning : description->Warnings()) {
        batch.warnings.push_back(warning);
    }

    spdlog::debug("Extracted {}x{} feature matrix ({} mode, {} skipped)",
                  batch.matrix.Rows(), batch.matrix.Cols(), ToString(mode),
                  transactions.size() - accepted.size());
    return batch;
}

std::vector<std::string> FeatureService::FeatureNames(FeatureMode mode) const {
    std::vector<std::string> names = TemporalFeatureExtractor::FeatureNames();
    names.push_back("log_amount");
    for (size_t i = 0; i < DescriptionFeatureExtractor::kFeatureSize; ++i) {
        names.push_back("tfidf_" + std::to_string(i));
    }

    if (mode == FeatureMode::ACCOUNT_AWARE) {
        for (size_t t = 0; t < kAccountTypeCount; ++t) {
            names.push_back(std::string("account_type_") +
                            ToString(static_cast<AccountType>(t)));
        }
        for (const auto& keyword : AccountFeatureExtractor::NameKeywords()) {
            names.push_back("account_name_" + keyword);
        }
        for (size_t i = 0; i < AccountFeatureExtractor::kInstitutionSlots; ++i) {
            names.push_back("institution_" + std::to_string(i));
        }
        names.push_back("institution_other");
        names.push_back("account_tx_count");
        names.push_back("account_amount_ratio");
        names.push_back("account_age");
        names.push_back("account_tx_frequency");
        names.push_back("account_active");
    }
    return names;
}

} // namespace recur
