// File: src/detection/batch_partitioner.cpp
#include "detection/batch_partitioner.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace recur {

BatchPartitioner::BatchPartitioner(size_t max_batch_size)
    : max_batch_size_(max_batch_size) {
    if (max_batch_size_ == 0) {
        throw std::invalid_argument("max_batch_size must be positive");
    }
}

std::string BatchPartitioner::MerchantKey(const std::string& description) {
    std::string cleaned;
    cleaned.reserve(description.size());
    for (unsigned char c : description) {
        cleaned.push_back(std::isalpha(c) ? static_cast<char>(std::toupper(c)) : ' ');
    }

    std::istringstream in(cleaned);
    std::string token;
    in >> token;
    return token;
}

BatchPlan BatchPartitioner::Partition(const std::vector<Transaction>& transactions) const {
    BatchPlan plan;
    if (transactions.empty()) {
        return plan;
    }

    // Group by merchant key, keeping first-seen order of keys
    std::vector<std::string> keys;
    std::unordered_map<std::string, std::vector<const Transaction*>> groups;
    for (const auto& tx : transactions) {
        std::string key = MerchantKey(tx.description);
        auto it = groups.find(key);
        if (it == groups.end()) {
            keys.push_back(key);
            it = groups.emplace(key, std::vector<const Transaction*>{}).first;
        }
        it->second.push_back(&tx);
    }

    if (transactions.size() <= max_batch_size_) {
        TransactionBatch batch;
        batch.transactions = transactions;
        batch.merchant_keys = keys;
        plan.batches.push_back(std::move(batch));
        return plan;
    }

    TransactionBatch current;
    auto flush = [&plan, &current]() {
        if (!current.transactions.empty()) {
            plan.batches.push_back(std::move(current));
            current = TransactionBatch{};
        }
    };

    for (const auto& key : keys) {
        std::vector<const Transaction*>& group = groups[key];

        if (group.size() > max_batch_size_) {
            flush();
            std::stable_sort(group.begin(), group.end(),
                             [](const Transaction* a, const Transaction* b) {
                                 return a->date < b->date;
                             });
            size_t chunks = (group.size() + max_batch_size_ - 1) / max_batch_size_;
            plan.warnings.push_back("Merchant '" + key + "' has " +
                                    std::to_string(group.size()) +
                                    " transactions and was split into " +
                                    std::to_string(chunks) +
                                    " chronological chunks; clusters may be broken at the cuts");
            for (size_t start = 0; start < group.size(); start += max_batch_size_) {
                size_t end = std::min(group.size(), start + max_batch_size_);
                TransactionBatch chunk;
                chunk.merchant_keys.push_back(key);
                for (size_t i = start; i < end; ++i) {
                    chunk.transactions.push_back(*group[i]);
                }
                plan.batches.push_back(std::move(chunk));
            }
            continue;
        }

        if (current.transactions.size() + group.size() > max_batch_size_) {
            flush();
        }
        current.merchant_keys.push_back(key);
        for (const Transaction* tx : group) {
            current.transactions.push_back(*tx);
        }
    }
    flush();

    return plan;
}

} // namespace recur
