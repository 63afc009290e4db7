// File: src/core/transaction.hpp
#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace recur {

/// A ledger entry owned by the transaction storage collaborator.
/// Read-only to the detection engine.
struct Transaction {
    std::string id;
    std::string account_id;
    std::string user_id;
    EpochMillis date{0};
    std::string description;
    double amount{0.0};           // Signed: negative for debits
    std::string currency{"USD"};
    std::vector<std::string> category_ids;

    /// True when the record can be turned into a feature row
    bool IsWellFormed() const;
};

/// Activity statistics maintained by the account collaborator
struct AccountActivity {
    size_t transaction_count{0};
    double average_amount{0.0};
    std::optional<EpochMillis> first_transaction_date;
    bool is_active{true};
};

/// A financial account, supplied as context for account-aware detection
struct Account {
    std::string id;
    AccountType type{AccountType::OTHER};
    std::string name;
    std::string institution;
    std::optional<AccountActivity> activity;
};

/// Lookup of accounts keyed by account id
using AccountsMap = std::unordered_map<std::string, Account>;

} // namespace recur
