// File: src/storage/memory_pattern_repository.hpp
#pragma once

#include "storage/pattern_repository.hpp"
#include <atomic>
#include <shared_mutex>
#include <unordered_map>

namespace recur {

/// In-memory pattern repository backed by a hash map
///
/// Thread-safe with shared_mutex (multiple readers, single writer).
/// Conditional updates compare status and version under the exclusive lock.
class MemoryPatternRepository : public PatternRepository {
public:
    struct Config {
        /// Initial capacity for the hash map
        size_t initial_capacity{1024};
    };

    MemoryPatternRepository();
    explicit MemoryPatternRepository(const Config& config);

    bool Store(const RecurringChargePattern& pattern) override;
    std::optional<RecurringChargePattern> Retrieve(const PatternID& id) override;
    bool Update(const RecurringChargePattern& pattern) override;
    CommitResult UpdateIfCurrent(const RecurringChargePattern& pattern,
                                 PatternStatus expected_status,
                                 uint64_t expected_version) override;
    bool Delete(const PatternID& id) override;
    bool Exists(const PatternID& id) const override;
    size_t StoreBatch(const std::vector<RecurringChargePattern>& patterns) override;

    std::vector<RecurringChargePattern> FindByUser(const std::string& user_id,
                                                   const QueryOptions& options) override;
    std::vector<RecurringChargePattern> FindActive(const std::string& user_id) override;

    size_t Count() const override;
    RepositoryStats GetStats() const override;
    void Clear() override;

private:
    Config config_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<PatternID, RecurringChargePattern, PatternID::Hash> patterns_;

    mutable std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> total_writes_{0};
    std::atomic<uint64_t> conflicts_{0};
};

} // namespace recur
