// File: src/analysis/confidence_scorer.cpp
#include "analysis/confidence_scorer.hpp"
#include "analysis/frequency_analyzer.hpp"
#include "analysis/merchant_pattern_analyzer.hpp"
#include "analysis/statistics.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cmath>
#include <initializer_list>
#include <sstream>
#include <stdexcept>

namespace recur {

namespace {

bool ContainsAny(const std::string& text, std::initializer_list<const char*> keywords) {
    for (const char* keyword : keywords) {
        if (text.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Short keywords like "TO" would match inside unrelated merchant names
bool ContainsWord(const std::string& text, std::initializer_list<const char*> words) {
    std::istringstream in(text);
    std::string token;
    while (in >> token) {
        for (const char* word : words) {
            if (token == word) {
                return true;
            }
        }
    }
    return false;
}

double Clamp01(double value) {
    return std::max(0.0, std::min(1.0, value));
}

} // anonymous namespace

// ============================================================================
// MerchantCategory
// ============================================================================

const char* ToString(MerchantCategory category) {
    switch (category) {
        case MerchantCategory::INCOME: return "INCOME";
        case MerchantCategory::DEPOSIT: return "DEPOSIT";
        case MerchantCategory::SUBSCRIPTION: return "SUBSCRIPTION";
        case MerchantCategory::SERVICE: return "SERVICE";
        case MerchantCategory::UTILITY: return "UTILITY";
        case MerchantCategory::BILL: return "BILL";
        case MerchantCategory::TRANSFER: return "TRANSFER";
        case MerchantCategory::CONTRIBUTION: return "CONTRIBUTION";
        case MerchantCategory::PAYMENT: return "PAYMENT";
        case MerchantCategory::FEE: return "FEE";
        case MerchantCategory::INTEREST: return "INTEREST";
        case MerchantCategory::INTEREST_CHARGE: return "INTEREST_CHARGE";
        case MerchantCategory::DIVIDEND: return "DIVIDEND";
        case MerchantCategory::EXPENSE: return "EXPENSE";
        default: return "UNKNOWN";
    }
}

MerchantCategory ParseMerchantCategory(const std::string& str) {
    static const MerchantCategory kAll[] = {
        MerchantCategory::INCOME, MerchantCategory::DEPOSIT, MerchantCategory::SUBSCRIPTION,
        MerchantCategory::SERVICE, MerchantCategory::UTILITY, MerchantCategory::BILL,
        MerchantCategory::TRANSFER, MerchantCategory::CONTRIBUTION, MerchantCategory::PAYMENT,
        MerchantCategory::FEE, MerchantCategory::INTEREST, MerchantCategory::INTEREST_CHARGE,
        MerchantCategory::DIVIDEND, MerchantCategory::EXPENSE};
    for (MerchantCategory category : kAll) {
        if (str == ToString(category)) {
            return category;
        }
    }
    throw std::invalid_argument("Unknown merchant category: " + str);
}

MerchantCategory CategorizeMerchant(const std::string& merchant_pattern, double average_amount) {
    const std::string pattern = ToUpperAscii(merchant_pattern);

    if (average_amount > 0.0) {
        if (ContainsAny(pattern, {"SALARY", "PAYROLL", "DEPOSIT", "PAYMENT RECEIVED"})) {
            return MerchantCategory::INCOME;
        }
        if (ContainsAny(pattern, {"DIVIDEND"})) {
            return MerchantCategory::DIVIDEND;
        }
        if (ContainsAny(pattern, {"INTEREST", "EARNINGS"})) {
            return MerchantCategory::INTEREST;
        }
        return MerchantCategory::DEPOSIT;
    }

    if (ContainsAny(pattern, {"NETFLIX", "SPOTIFY", "HULU", "DISNEY", "HBO", "AMAZON PRIME",
                              "APPLE", "GOOGLE", "MICROSOFT", "ADOBE", "ZOOM", "SLACK",
                              "SUBSCRIPTION", "MEMBERSHIP", "PREMIUM"})) {
        return MerchantCategory::SUBSCRIPTION;
    }
    if (ContainsAny(pattern, {"ELECTRIC", "GAS", "WATER", "UTILITY", "POWER", "ENERGY",
                              "INTERNET", "CABLE", "PHONE", "WIRELESS", "MOBILE"})) {
        return MerchantCategory::UTILITY;
    }
    if (ContainsAny(pattern, {"INSURANCE", "RENT", "MORTGAGE", "HOA", "ASSOCIATION", "BILL",
                              "INVOICE"})) {
        return MerchantCategory::BILL;
    }
    if (ContainsAny(pattern, {"TRANSFER", "XFER"}) || ContainsWord(pattern, {"FROM", "TO"})) {
        return MerchantCategory::TRANSFER;
    }
    if (ContainsAny(pattern, {"CONTRIBUTION", "401K", "IRA", "RETIREMENT", "INVEST", "SAVINGS",
                              "DEPOSIT"})) {
        return MerchantCategory::CONTRIBUTION;
    }
    if (ContainsAny(pattern, {"LOAN", "CREDIT", "PAYMENT", "FINANCING"})) {
        return MerchantCategory::PAYMENT;
    }
    if (ContainsAny(pattern, {"FEE", "CHARGE", "MAINTENANCE"})) {
        return MerchantCategory::FEE;
    }
    if (ContainsAny(pattern, {"INTEREST", "DIVIDEND", "EARNINGS"})) {
        return MerchantCategory::INTEREST_CHARGE;
    }
    return MerchantCategory::EXPENSE;
}

// ============================================================================
// ConfidenceAdjustmentTable
// ============================================================================

ConfidenceAdjustmentTable ConfidenceAdjustmentTable::Default() {
    using A = AccountType;
    using F = RecurrenceFrequency;
    using C = MerchantCategory;

    ConfidenceAdjustmentTable table;

    table.Set({A::CREDIT_CARD, F::MONTHLY, C::SUBSCRIPTION}, 0.10);
    table.Set({A::CREDIT_CARD, F::ANNUALLY, C::SUBSCRIPTION}, 0.10);
    table.Set({A::CREDIT_CARD, F::MONTHLY, C::SERVICE}, 0.08);
    table.Set({A::CREDIT_CARD, F::WEEKLY, C::EXPENSE}, -0.05);

    table.Set({A::CHECKING, F::MONTHLY, C::UTILITY}, 0.12);
    table.Set({A::CHECKING, F::MONTHLY, C::BILL}, 0.12);
    table.Set({A::CHECKING, F::BI_WEEKLY, C::INCOME}, 0.15);
    table.Set({A::CHECKING, F::MONTHLY, C::SUBSCRIPTION}, -0.03);
    table.Set({A::CHECKING, F::SEMI_MONTHLY, C::INCOME}, 0.15);

    table.Set({A::SAVINGS, F::MONTHLY, C::TRANSFER}, 0.10);
    table.Set({A::SAVINGS, F::MONTHLY, C::INTEREST}, 0.12);
    table.Set({A::SAVINGS, F::WEEKLY, C::EXPENSE}, -0.15);
    table.Set({A::SAVINGS, F::DAILY, C::EXPENSE}, -0.20);

    table.Set({A::INVESTMENT, F::MONTHLY, C::CONTRIBUTION}, 0.15);
    table.Set({A::INVESTMENT, F::BI_WEEKLY, C::CONTRIBUTION}, 0.15);
    table.Set({A::INVESTMENT, F::QUARTERLY, C::DIVIDEND}, 0.12);
    table.Set({A::INVESTMENT, F::MONTHLY, C::FEE}, 0.10);

    table.Set({A::LOAN, F::MONTHLY, C::PAYMENT}, 0.20);
    table.Set({A::LOAN, F::MONTHLY, C::INTEREST}, 0.15);
    table.Set({A::LOAN, F::IRREGULAR, C::PAYMENT}, -0.15);

    return table;
}

double ConfidenceAdjustmentTable::Lookup(const AdjustmentKey& key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? 0.0 : it->second;
}

// ============================================================================
// ConfidenceScorer
// ============================================================================

bool ConfidenceWeights::IsValid() const {
    if (interval_regularity < 0.0 || amount_regularity < 0.0 ||
        sample_size < 0.0 || temporal_consistency < 0.0) {
        return false;
    }
    double sum = interval_regularity + amount_regularity + sample_size + temporal_consistency;
    return std::abs(sum - 1.0) <= 0.001;
}

ConfidenceScorer::ConfidenceScorer() : ConfidenceScorer(Config{}) {}

ConfidenceScorer::ConfidenceScorer(const Config& config, ConfidenceAdjustmentTable table)
    : config_(config), table_(std::move(table)) {
    if (!config_.weights.IsValid()) {
        throw std::invalid_argument("Confidence weights must be non-negative and sum to 1");
    }
    if (config_.saturation_count == 0) {
        throw std::invalid_argument("saturation_count must be positive");
    }
}

double ConfidenceScorer::SampleSizeScore(size_t count) const {
    return std::min(1.0, static_cast<double>(count) / config_.saturation_count);
}

double ConfidenceScorer::CalculateBase(const std::vector<Transaction>& transactions,
                                       double temporal_consistency) const {
    return Score(transactions, temporal_consistency, RecurrenceFrequency::IRREGULAR, "",
                 nullptr).base;
}

ConfidenceBreakdown ConfidenceScorer::Score(const std::vector<Transaction>& transactions,
                                            double temporal_consistency,
                                            RecurrenceFrequency frequency,
                                            const std::string& merchant_pattern,
                                            const AccountsMap* accounts) const {
    ConfidenceBreakdown breakdown;
    if (transactions.empty()) {
        return breakdown;
    }

    std::vector<double> amounts;
    amounts.reserve(transactions.size());
    for (const auto& tx : transactions) {
        amounts.push_back(std::abs(tx.amount));
    }

    breakdown.interval_regularity =
        stats::Regularity(FrequencyAnalyzer::CalculateIntervals(transactions));
    breakdown.amount_regularity = stats::Regularity(amounts);
    breakdown.sample_size = SampleSizeScore(transactions.size());
    breakdown.temporal_consistency = Clamp01(temporal_consistency);

    const ConfidenceWeights& w = config_.weights;
    double base = w.interval_regularity * breakdown.interval_regularity +
                  w.amount_regularity * breakdown.amount_regularity +
                  w.sample_size * breakdown.sample_size +
                  w.temporal_consistency * breakdown.temporal_consistency;
    breakdown.base = std::round(base * 100.0) / 100.0;

    double score = breakdown.base;
    if (accounts != nullptr) {
        breakdown.primary_account_type = PrimaryAccountType(transactions, *accounts);
        if (breakdown.primary_account_type) {
            std::vector<double> signed_amounts;
            signed_amounts.reserve(transactions.size());
            for (const auto& tx : transactions) {
                signed_amounts.push_back(tx.amount);
            }
            breakdown.category = CategorizeMerchant(merchant_pattern, stats::Mean(signed_amounts));
            breakdown.adjustment = table_.Lookup(
                {*breakdown.primary_account_type, frequency, *breakdown.category});
            score += breakdown.adjustment;
        }
    }

    breakdown.final_score = Clamp01(score);

    if (std::abs(breakdown.adjustment) >= 0.05) {
        spdlog::info("Confidence adjusted {:+.2f} for {} {} {} ({:.2f} -> {:.2f})",
                     breakdown.adjustment,
                     ToString(*breakdown.primary_account_type),
                     ToString(frequency),
                     ToString(*breakdown.category),
                     breakdown.base, breakdown.final_score);
    }
    return breakdown;
}

double ConfidenceScorer::ApplyAccountAdjustment(double base,
                                                const std::vector<Transaction>& transactions,
                                                RecurrenceFrequency frequency,
                                                const std::string& merchant_pattern,
                                                const AccountsMap& accounts) const {
    auto account_type = PrimaryAccountType(transactions, accounts);
    if (!account_type) {
        return Clamp01(base);
    }

    std::vector<double> signed_amounts;
    signed_amounts.reserve(transactions.size());
    for (const auto& tx : transactions) {
        signed_amounts.push_back(tx.amount);
    }
    MerchantCategory category = CategorizeMerchant(merchant_pattern, stats::Mean(signed_amounts));
    return Clamp01(base + table_.Lookup({*account_type, frequency, category}));
}

std::optional<AccountType> ConfidenceScorer::PrimaryAccountType(
    const std::vector<Transaction>& transactions, const AccountsMap& accounts) {
    std::vector<int> types;
    for (const auto& tx : transactions) {
        auto it = accounts.find(tx.account_id);
        if (it != accounts.end()) {
            types.push_back(static_cast<int>(it->second.type));
        }
    }
    if (types.empty()) {
        return std::nullopt;
    }
    return static_cast<AccountType>(stats::Mode(types));
}

} // namespace recur
