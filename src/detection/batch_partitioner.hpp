// File: src/detection/batch_partitioner.hpp
#pragma once

#include "core/transaction.hpp"
#include <string>
#include <vector>

namespace recur {

/// Transactions processed together in one detection pass
struct TransactionBatch {
    std::vector<Transaction> transactions;

    /// Merchant keys whose transactions are in this batch
    std::vector<std::string> merchant_keys;
};

/// Partition result
struct BatchPlan {
    std::vector<TransactionBatch> batches;

    /// One entry per merchant series that had to be split
    std::vector<std::string> warnings;
};

/// BatchPartitioner - bounds the size of a detection pass
///
/// Transactions are grouped by merchant key and whole groups are packed
/// into batches of at most max_batch_size, in order of first appearance.
/// A recurring series is therefore never split across batches, unless its
/// own group exceeds the bound: then it is cut chronologically into chunks
/// and a warning is recorded, since clusters may be broken at the cut.
class BatchPartitioner {
public:
    /// @throws std::invalid_argument if max_batch_size is 0
    explicit BatchPartitioner(size_t max_batch_size);

    BatchPlan Partition(const std::vector<Transaction>& transactions) const;

    /// Uppercase alphabetic tokens of the description, digits and punctuation
    /// dropped, first token only ("NETFLIX.COM 8443" -> "NETFLIX")
    static std::string MerchantKey(const std::string& description);

    size_t GetMaxBatchSize() const { return max_batch_size_; }

private:
    size_t max_batch_size_;
};

} // namespace recur
