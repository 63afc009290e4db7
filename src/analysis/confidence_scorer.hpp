// File: src/analysis/confidence_scorer.hpp
#pragma once

#include "core/transaction.hpp"
#include "core/types.hpp"
#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace recur {

// MerchantCategory: Coarse purpose of a recurring charge, from its merchant
enum class MerchantCategory : uint8_t {
    INCOME = 0,
    DEPOSIT = 1,
    SUBSCRIPTION = 2,
    SERVICE = 3,
    UTILITY = 4,
    BILL = 5,
    TRANSFER = 6,
    CONTRIBUTION = 7,
    PAYMENT = 8,
    FEE = 9,
    INTEREST = 10,
    INTEREST_CHARGE = 11,
    DIVIDEND = 12,
    EXPENSE = 13,
};

const char* ToString(MerchantCategory category);
MerchantCategory ParseMerchantCategory(const std::string& str);

/// Classify a merchant pattern by keyword; positive average amounts are
/// treated as money coming in
MerchantCategory CategorizeMerchant(const std::string& merchant_pattern, double average_amount);

/// Key of one confidence adjustment
struct AdjustmentKey {
    AccountType account_type;
    RecurrenceFrequency frequency;
    MerchantCategory category;

    bool operator<(const AdjustmentKey& other) const {
        return std::tie(account_type, frequency, category) <
               std::tie(other.account_type, other.frequency, other.category);
    }
    bool operator==(const AdjustmentKey& other) const {
        return account_type == other.account_type &&
               frequency == other.frequency &&
               category == other.category;
    }
};

/// ConfidenceAdjustmentTable - additive priors keyed by
/// (account type, frequency, merchant category)
///
/// Missing keys adjust by 0. Entries may push a score outside [0, 1];
/// the scorer clamps after applying them.
class ConfidenceAdjustmentTable {
public:
    ConfidenceAdjustmentTable() = default;

    /// Built-in priors (e.g. monthly subscriptions on credit cards are likely)
    static ConfidenceAdjustmentTable Default();

    void Set(const AdjustmentKey& key, double adjustment) { entries_[key] = adjustment; }
    void Remove(const AdjustmentKey& key) { entries_.erase(key); }

    /// Adjustment for the key, 0 when absent
    double Lookup(const AdjustmentKey& key) const;

    bool Contains(const AdjustmentKey& key) const { return entries_.count(key) > 0; }
    size_t Size() const { return entries_.size(); }
    const std::map<AdjustmentKey, double>& Entries() const { return entries_; }

private:
    std::map<AdjustmentKey, double> entries_;
};

/// Relative weight of each confidence factor
struct ConfidenceWeights {
    double interval_regularity{0.30};
    double amount_regularity{0.20};
    double sample_size{0.20};
    double temporal_consistency{0.30};

    /// Non-negative and summing to 1 within 0.001
    bool IsValid() const;
};

/// Every term behind a confidence score
struct ConfidenceBreakdown {
    double interval_regularity{0.0};
    double amount_regularity{0.0};
    double sample_size{0.0};
    double temporal_consistency{0.0};
    double base{0.0};
    double adjustment{0.0};
    double final_score{0.0};
    std::optional<AccountType> primary_account_type;
    std::optional<MerchantCategory> category;
};

/// ConfidenceScorer - single trust score for a candidate pattern
///
/// base = weighted sum of interval regularity, amount regularity, a
/// saturating sample-size score min(1, n / saturation_count) and the
/// temporal consistency, rounded to two decimals. With account context an
/// adjustment from the table is added. The final score is clamped to [0, 1]
/// as the very last step.
class ConfidenceScorer {
public:
    struct Config {
        ConfidenceWeights weights;

        /// Occurrence count at which the sample-size term saturates
        size_t saturation_count{12};
    };

    ConfidenceScorer();

    /// @throws std::invalid_argument if weights are invalid or saturation_count is 0
    explicit ConfidenceScorer(const Config& config,
                              ConfidenceAdjustmentTable table = ConfidenceAdjustmentTable::Default());

    /// Base score without account context
    double CalculateBase(const std::vector<Transaction>& transactions,
                         double temporal_consistency) const;

    /// Full score; accounts may be null
    ConfidenceBreakdown Score(const std::vector<Transaction>& transactions,
                              double temporal_consistency,
                              RecurrenceFrequency frequency,
                              const std::string& merchant_pattern,
                              const AccountsMap* accounts) const;

    /// Add the table adjustment to a base score and clamp to [0, 1]
    double ApplyAccountAdjustment(double base,
                                  const std::vector<Transaction>& transactions,
                                  RecurrenceFrequency frequency,
                                  const std::string& merchant_pattern,
                                  const AccountsMap& accounts) const;

    /// Most common type among the transactions' known accounts
    static std::optional<AccountType> PrimaryAccountType(
        const std::vector<Transaction>& transactions, const AccountsMap& accounts);

    const ConfidenceAdjustmentTable& GetAdjustmentTable() const { return table_; }
    const Config& GetConfig() const { return config_; }

private:
    double SampleSizeScore(size_t count) const;

    Config config_;
    ConfidenceAdjustmentTable table_;
};

} // namespace recur
