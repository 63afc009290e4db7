// File: src/storage/memory_pattern_repository.cpp
#include "storage/memory_pattern_repository.hpp"
#include <algorithm>
#include <limits>
#include <mutex>

namespace recur {

namespace {

void SortByCreation(std::vector<RecurringChargePattern>& patterns) {
    std::sort(patterns.begin(), patterns.end(),
              [](const RecurringChargePattern& a, const RecurringChargePattern& b) {
                  if (a.GetCreatedAt() != b.GetCreatedAt()) {
                      return a.GetCreatedAt() < b.GetCreatedAt();
                  }
                  return a.GetID() < b.GetID();
              });
}

} // anonymous namespace

MemoryPatternRepository::MemoryPatternRepository()
    : MemoryPatternRepository(Config{}) {}

MemoryPatternRepository::MemoryPatternRepository(const Config& config)
    : config_(config) {
    patterns_.reserve(config_.initial_capacity);
}

// ============================================================================
// Core CRUD Operations
// ============================================================================

bool MemoryPatternRepository::Store(const RecurringChargePattern& pattern) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    bool inserted = patterns_.emplace(pattern.GetID(), pattern).second;
    if (inserted) {
        total_writes_.fetch_add(1, std::memory_order_relaxed);
    }
    return inserted;
}

std::optional<RecurringChargePattern> MemoryPatternRepository::Retrieve(const PatternID& id) {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    auto it = patterns_.find(id);
    if (it != patterns_.end()) {
        return it->second;
    }
    return std::nullopt;
}

bool MemoryPatternRepository::Update(const RecurringChargePattern& pattern) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = patterns_.find(pattern.GetID());
    if (it == patterns_.end()) {
        return false;
    }

    uint64_t next_version = it->second.GetVersion() + 1;
    it->second = pattern;
    it->second.SetVersion(next_version);
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

CommitResult MemoryPatternRepository::UpdateIfCurrent(const RecurringChargePattern& pattern,
                                                      PatternStatus expected_status,
                                                      uint64_t expected_version) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    auto it = patterns_.find(pattern.GetID());
    if (it == patterns_.end()) {
        return CommitResult::NOT_FOUND;
    }
    if (it->second.GetStatus() != expected_status ||
        it->second.GetVersion() != expected_version) {
        conflicts_.fetch_add(1, std::memory_order_relaxed);
        return CommitResult::CONFLICT;
    }

    it->second = pattern;
    it->second.SetVersion(expected_version + 1);
    total_writes_.fetch_add(1, std::memory_order_relaxed);
    return CommitResult::COMMITTED;
}

bool MemoryPatternRepository::Delete(const PatternID& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return patterns_.erase(id) > 0;
}

bool MemoryPatternRepository::Exists(const PatternID& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return patterns_.find(id) != patterns_.end();
}

size_t MemoryPatternRepository::StoreBatch(const std::vector<RecurringChargePattern>& patterns) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    size_t stored_count = 0;
    for (const auto& pattern : patterns) {
        if (patterns_.emplace(pattern.GetID(), pattern).second) {
            ++stored_count;
        }
    }
    total_writes_.fetch_add(stored_count, std::memory_order_relaxed);
    return stored_count;
}

// ============================================================================
// Query Operations
// ============================================================================

std::vector<RecurringChargePattern> MemoryPatternRepository::FindByUser(
    const std::string& user_id, const QueryOptions& options) {
    std::vector<RecurringChargePattern> results;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& entry : patterns_) {
            const RecurringChargePattern& pattern = entry.second;
            if (pattern.GetUserID() != user_id) {
                continue;
            }
            if (options.status && pattern.GetStatus() != *options.status) {
                continue;
            }
            results.push_back(pattern);
        }
    }
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    SortByCreation(results);
    if (results.size() > options.max_results) {
        results.resize(options.max_results);
    }
    return results;
}

std::vector<RecurringChargePattern> MemoryPatternRepository::FindActive(
    const std::string& user_id) {
    QueryOptions options;
    options.status = PatternStatus::ACTIVE;
    options.max_results = std::numeric_limits<size_t>::max();

    std::vector<RecurringChargePattern> results = FindByUser(user_id, options);
    results.erase(std::remove_if(results.begin(), results.end(),
                                 [](const RecurringChargePattern& p) {
                                     return !p.IsEligibleForCategorization();
                                 }),
                  results.end());
    return results;
}

// ============================================================================
// Statistics and Maintenance
// ============================================================================

size_t MemoryPatternRepository::Count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return patterns_.size();
}

RepositoryStats MemoryPatternRepository::GetStats() const {
    RepositoryStats stats;
    stats.total_patterns = Count();
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);
    stats.conflicts = conflicts_.load(std::memory_order_relaxed);
    return stats;
}

void MemoryPatternRepository::Clear() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    patterns_.clear();
}

} // namespace recur
