// File: src/features/account_features.cpp
#include "features/account_features.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <unordered_map>

namespace recur {

namespace {

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

struct AccountBatchStats {
    size_t count{0};
    double amount_sum{0.0};
    EpochMillis latest_date{0};
};

} // anonymous namespace

AccountFeatureExtractor::AccountFeatureExtractor(const AccountsMap& accounts)
    : accounts_(accounts) {}

const std::vector<std::string>& AccountFeatureExtractor::NameKeywords() {
    static const std::vector<std::string> kKeywords = {
        "business", "personal", "checking", "savings",
        "credit", "joint", "emergency", "investment",
    };
    return kKeywords;
}

const Account* AccountFeatureExtractor::FindAccount(const std::string& account_id) const {
    auto it = accounts_.find(account_id);
    return it != accounts_.end() ? &it->second : nullptr;
}

std::vector<std::string> AccountFeatureExtractor::TopInstitutions(
    const std::vector<Transaction>& transactions) const {
    // Counts in first-seen order so ties keep a stable ranking
    std::vector<std::pair<std::string, size_t>> counts;
    for (const auto& tx : transactions) {
        const Account* account = FindAccount(tx.account_id);
        if (!account || account->institution.empty()) {
            continue;
        }
        std::string name = ToLower(account->institution);
        auto it = std::find_if(counts.begin(), counts.end(),
                               [&name](const auto& entry) { return entry.first == name; });
        if (it == counts.end()) {
            counts.emplace_back(name, 1);
        } else {
            ++it->second;
        }
    }

    std::stable_sort(counts.begin(), counts.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });

    std::vector<std::string> top;
    for (size_t i = 0; i < counts.size() && i < kInstitutionSlots; ++i) {
        top.push_back(counts[i].first);
    }
    return top;
}

FeatureBlock AccountFeatureExtractor::ExtractBatch(
    const std::vector<Transaction>& transactions) {
    std::vector<std::string> top_institutions = TopInstitutions(transactions);

    std::unordered_map<std::string, AccountBatchStats> stats;
    for (const auto& tx : transactions) {
        auto& entry = stats[tx.account_id];
        ++entry.count;
        entry.amount_sum += std::abs(tx.amount);
        entry.latest_date = entry.count == 1 ? tx.date : std::max(entry.latest_date, tx.date);
    }

    const auto& keywords = NameKeywords();

    FeatureBlock block;
    block.reserve(transactions.size());
    for (const auto& tx : transactions) {
        FeatureVector row(kFeatureSize);
        const Account* account = FindAccount(tx.account_id);

        // Account type one-hot
        AccountType type = account ? account->type : AccountType::OTHER;
        row[static_cast<size_t>(type)] = 1.0f;

        // Name keywords
        if (account && !account->name.empty()) {
            std::string name = ToLower(account->name);
            for (size_t k = 0; k < keywords.size(); ++k) {
                if (name.find(keywords[k]) != std::string::npos) {
                    row[kAccountTypeCount + k] = 1.0f;
                }
            }
        }

        // Institution one-hot
        size_t institution_base = kAccountTypeCount + keywords.size();
        size_t institution_slot = kInstitutionSlots;
        if (account && !account->institution.empty()) {
            auto it = std::find(top_institutions.begin(), top_institutions.end(),
                                ToLower(account->institution));
            if (it != top_institutions.end()) {
                institution_slot = static_cast<size_t>(it - top_institutions.begin());
            }
        }
        row[institution_base + institution_slot] = 1.0f;

        // Activity
        const AccountBatchStats& batch = stats.at(tx.account_id);
        double avg_amount = batch.amount_sum / static_cast<double>(batch.count);
        double amount_ratio = avg_amount > 0.0 ? std::abs(tx.amount) / avg_amount : 0.0;

        double age_days = 0.0;
        bool is_active = true;
        if (account && account->activity) {
            if (account->activity->first_transaction_date) {
                age_days = static_cast<double>(
                    batch.latest_date - *account->activity->first_transaction_date) /
                    static_cast<double>(kMillisPerDay);
            }
            is_active = account->activity->is_active;
        }
        double frequency = age_days > 0.0 ? batch.count / age_days : 0.0;

        size_t activity_base = institution_base + kInstitutionSlots + 1;
        row[activity_base + 0] = static_cast<float>(std::min(1.0, batch.count / 1000.0));
        row[activity_base + 1] = static_cast<float>(std::min(1.0, amount_ratio / 10.0));
        row[activity_base + 2] = static_cast<float>(std::min(1.0, age_days / 3650.0));
        row[activity_base + 3] = static_cast<float>(std::min(1.0, frequency * 10.0));
        row[activity_base + 4] = is_active ? 1.0f : 0.0f;

        block.push_back(std::move(row));
    }
    return block;
}

} // namespace recur
