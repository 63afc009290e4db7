// File: src/storage/sqlite_pattern_repository.hpp
#pragma once

#include "storage/pattern_repository.hpp"
#include <atomic>
#include <mutex>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace recur {

/// Persistent pattern repository using SQLite
///
/// Each pattern is stored as a serialized blob next to the columns used
/// for lookups (user, status, active flag, version, creation time).
/// UpdateIfCurrent is a single conditional UPDATE, so the precondition
/// also holds across processes sharing the database file.
class SqlitePatternRepository : public PatternRepository {
public:
    struct Config {
        /// Path to the SQLite database file (":memory:" for a private database)
        std::string db_path;

        /// Enable Write-Ahead Logging for better concurrency
        bool enable_wal{true};

        /// Milliseconds to wait on a locked database
        int busy_timeout_ms{5000};

        /// Synchronous mode: FULL, NORMAL, or OFF
        std::string synchronous{"NORMAL"};
    };

    /// @throws std::runtime_error if the database cannot be opened or initialized
    explicit SqlitePatternRepository(const Config& config);

    ~SqlitePatternRepository() override;

    SqlitePatternRepository(const SqlitePatternRepository&) = delete;
    SqlitePatternRepository& operator=(const SqlitePatternRepository&) = delete;

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

    /// Checkpoint the WAL into the main database file
    void Flush();

private:
    Config config_;
    sqlite3* db_{nullptr};
    mutable std::mutex mutex_;

    mutable std::atomic<uint64_t> total_reads_{0};
    std::atomic<uint64_t> total_writes_{0};
    std::atomic<uint64_t> conflicts_{0};

    void InitializeDatabase();
    void CreateTables();

    /// @throws std::runtime_error with the SQLite error message
    void ExecuteSQL(const std::string& sql);

    /// @throws std::runtime_error if the statement cannot be prepared
    sqlite3_stmt* Prepare(const char* sql) const;

    /// Insert without taking the lock; false if the id already exists
    bool InsertUnlocked(const RecurringChargePattern& pattern);

    std::vector<RecurringChargePattern> QueryPatterns(sqlite3_stmt* stmt) const;

    static std::vector<uint8_t> SerializePattern(const RecurringChargePattern& pattern);
    static RecurringChargePattern DeserializePattern(const void* data, int size);
};

} // namespace recur
