// File: src/storage/pattern_repository.hpp
#pragma once

#include "core/recurring_charge_pattern.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace recur {

/// Repository statistics for monitoring
struct RepositoryStats {
    /// Total number of patterns stored
    size_t total_patterns{0};

    uint64_t total_reads{0};
    uint64_t total_writes{0};

    /// Conditional updates rejected because the stored state moved on
    uint64_t conflicts{0};
};

/// Query options for repository searches
struct QueryOptions {
    /// Maximum number of results to return
    size_t max_results{1000};

    /// Only return patterns in this status
    std::optional<PatternStatus> status;
};

/// Outcome of a conditional update
enum class CommitResult : uint8_t {
    COMMITTED = 0,
    NOT_FOUND = 1,
    CONFLICT = 2,
};

const char* ToString(CommitResult result);

/// Abstract interface for recurring charge pattern storage
///
/// Every stored pattern carries a version. Update and UpdateIfCurrent write
/// the pattern with version = stored version + 1, so a caller holding a
/// stale copy can be detected.
///
/// Thread Safety: All methods must be thread-safe.
class PatternRepository {
public:
    virtual ~PatternRepository() = default;

    // ========================================================================
    // Core CRUD Operations
    // ========================================================================

    /// Store a new pattern
    /// @return true if stored, false if a pattern with the same ID exists
    virtual bool Store(const RecurringChargePattern& pattern) = 0;

    /// Retrieve a pattern by its ID
    /// @return The pattern if found, std::nullopt otherwise
    virtual std::optional<RecurringChargePattern> Retrieve(const PatternID& id) = 0;

    /// Unconditionally replace a stored pattern
    /// @return true if updated, false if the pattern doesn't exist
    virtual bool Update(const RecurringChargePattern& pattern) = 0;

    /// Replace a stored pattern only while it still has the expected status
    /// and version. The check and the write are atomic.
    virtual CommitResult UpdateIfCurrent(const RecurringChargePattern& pattern,
                                         PatternStatus expected_status,
                                         uint64_t expected_version) = 0;

    /// @return true if deleted, false if the pattern doesn't exist
    virtual bool Delete(const PatternID& id) = 0;

    virtual bool Exists(const PatternID& id) const = 0;

    /// Store several patterns; existing IDs are skipped
    /// @return Number of patterns stored
    virtual size_t StoreBatch(const std::vector<RecurringChargePattern>& patterns) = 0;

    // ========================================================================
    // Query Operations
    // ========================================================================

    /// Patterns of one user ordered by creation time
    virtual std::vector<RecurringChargePattern> FindByUser(
        const std::string& user_id,
        const QueryOptions& options = {}) = 0;

    /// Patterns of one user that may drive categorization (Active and enabled)
    virtual std::vector<RecurringChargePattern> FindActive(const std::string& user_id) = 0;

    // ========================================================================
    // Statistics and Maintenance
    // ========================================================================

    virtual size_t Count() const = 0;

    virtual RepositoryStats GetStats() const = 0;

    /// Remove all patterns
    virtual void Clear() = 0;
};

} // namespace recur
