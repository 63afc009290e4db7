// File: src/features/account_features.hpp
#pragma once

#include "features/feature_extractor.hpp"
#include <string>
#include <vector>

namespace recur {

/// AccountFeatureExtractor - account context for account-aware detection
///
/// Produces 24 values per transaction:
/// - 6: one-hot account type (checking, savings, credit card, investment,
///   loan, other); transactions whose account is unknown count as other
/// - 8: keyword flags over the account name
/// - 5: one-hot of the four most frequent institutions in the batch, then other
/// - 5: activity signals computed per account over the batch: transaction
///   count, amount relative to the account's batch average, account age,
///   transaction frequency, active flag
class AccountFeatureExtractor {
public:
    static constexpr size_t kFeatureSize = 24;
    static constexpr size_t kInstitutionSlots = 4;

    /// @param accounts Lookup used for every batch; must outlive the extractor
    explicit AccountFeatureExtractor(const AccountsMap& accounts);

    size_t FeatureSize() const { return kFeatureSize; }

    FeatureBlock ExtractBatch(const std::vector<Transaction>& transactions);

    /// Keywords searched in account names, in column order
    static const std::vector<std::string>& NameKeywords();

    /// Institutions selected for the one-hot block, most frequent first
    std::vector<std::string> TopInstitutions(const std::vector<Transaction>& transactions) const;

private:
    const Account* FindAccount(const std::string& account_id) const;

    const AccountsMap& accounts_;
};

} // namespace recur
