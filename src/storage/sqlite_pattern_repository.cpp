// File: src/storage/sqlite_pattern_repository.cpp
#include "storage/sqlite_pattern_repository.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <sstream>
#include <stdexcept>

namespace recur {

// ============================================================================
// Constructor and Destructor
// ============================================================================

SqlitePatternRepository::SqlitePatternRepository(const Config& config)
    : config_(config) {
    int rc = sqlite3_open(config_.db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open database: " + error);
    }

    try {
        InitializeDatabase();
    } catch (const std::exception&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }
}

SqlitePatternRepository::~SqlitePatternRepository() {
    if (db_) {
        int rc = sqlite3_close_v2(db_);
        if (rc != SQLITE_OK) {
            spdlog::warn("Closing pattern database failed: {}", sqlite3_errstr(rc));
        }
        db_ = nullptr;
    }
}

// ============================================================================
// Database Initialization
// ============================================================================

void SqlitePatternRepository::InitializeDatabase() {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    if (config_.enable_wal && config_.db_path != ":memory:") {
        ExecuteSQL("PRAGMA journal_mode=WAL;");
    }
    ExecuteSQL("PRAGMA synchronous=" + config_.synchronous + ";");

    CreateTables();
}

void SqlitePatternRepository::CreateTables() {
    ExecuteSQL(R"(
        CREATE TABLE IF NOT EXISTS recurring_patterns (
            id TEXT PRIMARY KEY,
            user_id TEXT NOT NULL,
            status INTEGER NOT NULL,
            active INTEGER NOT NULL,
            version INTEGER NOT NULL,
            created_at INTEGER NOT NULL,
            data BLOB NOT NULL
        );
    )");

    ExecuteSQL("CREATE INDEX IF NOT EXISTS idx_user_status "
               "ON recurring_patterns(user_id, status);");
}

void SqlitePatternRepository::ExecuteSQL(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);

    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        throw std::runtime_error("SQL error: " + error);
    }
}

sqlite3_stmt* SqlitePatternRepository::Prepare(const char* sql) const {
    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("Failed to prepare statement: ") +
                                 sqlite3_errmsg(db_));
    }
    return stmt;
}

// ============================================================================
// Core CRUD Operations
// ============================================================================

bool SqlitePatternRepository::InsertUnlocked(const RecurringChargePattern& pattern) {
    sqlite3_stmt* stmt = Prepare(
        "INSERT OR IGNORE INTO recurring_patterns "
        "(id, user_id, status, active, version, created_at, data) "
        "VALUES (?, ?, ?, ?, ?, ?, ?);");

    std::vector<uint8_t> blob = SerializePattern(pattern);
    sqlite3_bind_text(stmt, 1, pattern.GetID().value().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 2, pattern.GetUserID().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 3, static_cast<int>(pattern.GetStatus()));
    sqlite3_bind_int(stmt, 4, pattern.IsActive() ? 1 : 0);
    sqlite3_bind_int64(stmt, 5, static_cast<sqlite3_int64>(pattern.GetVersion()));
    sqlite3_bind_int64(stmt, 6, pattern.GetCreatedAt());
    sqlite3_bind_blob(stmt, 7, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to store pattern: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

bool SqlitePatternRepository::Store(const RecurringChargePattern& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);

    bool stored = InsertUnlocked(pattern);
    if (stored) {
        total_writes_.fetch_add(1, std::memory_order_relaxed);
    }
    return stored;
}

std::optional<RecurringChargePattern> SqlitePatternRepository::Retrieve(const PatternID& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    sqlite3_stmt* stmt = Prepare("SELECT data, version FROM recurring_patterns WHERE id = ?;");
    sqlite3_bind_text(stmt, 1, id.value().c_str(), -1, SQLITE_TRANSIENT);

    std::vector<RecurringChargePattern> found = QueryPatterns(stmt);
    if (found.empty()) {
        return std::nullopt;
    }
    return found.front();
}

bool SqlitePatternRepository::Update(const RecurringChargePattern& pattern) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = Prepare(
        "UPDATE recurring_patterns "
        "SET user_id = ?, status = ?, active = ?, version = version + 1, data = ? "
        "WHERE id = ?;");

    std::vector<uint8_t> blob = SerializePattern(pattern);
    sqlite3_bind_text(stmt, 1, pattern.GetUserID().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, static_cast<int>(pattern.GetStatus()));
    sqlite3_bind_int(stmt, 3, pattern.IsActive() ? 1 : 0);
    sqlite3_bind_blob(stmt, 4, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 5, pattern.GetID().value().c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to update pattern: ") + sqlite3_errmsg(db_));
    }

    bool updated = sqlite3_changes(db_) > 0;
    if (updated) {
        total_writes_.fetch_add(1, std::memory_order_relaxed);
    }
    return updated;
}

CommitResult SqlitePatternRepository::UpdateIfCurrent(const RecurringChargePattern& pattern,
                                                      PatternStatus expected_status,
                                                      uint64_t expected_version) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = Prepare(
        "UPDATE recurring_patterns "
        "SET user_id = ?, status = ?, active = ?, version = ?, data = ? "
        "WHERE id = ? AND status = ? AND version = ?;");

    std::vector<uint8_t> blob = SerializePattern(pattern);
    sqlite3_bind_text(stmt, 1, pattern.GetUserID().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, static_cast<int>(pattern.GetStatus()));
    sqlite3_bind_int(stmt, 3, pattern.IsActive() ? 1 : 0);
    sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(expected_version + 1));
    sqlite3_bind_blob(stmt, 5, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt, 6, pattern.GetID().value().c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 7, static_cast<int>(expected_status));
    sqlite3_bind_int64(stmt, 8, static_cast<sqlite3_int64>(expected_version));

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to update pattern: ") + sqlite3_errmsg(db_));
    }

    if (sqlite3_changes(db_) > 0) {
        total_writes_.fetch_add(1, std::memory_order_relaxed);
        return CommitResult::COMMITTED;
    }

    sqlite3_stmt* probe = Prepare("SELECT 1 FROM recurring_patterns WHERE id = ? LIMIT 1;");
    sqlite3_bind_text(probe, 1, pattern.GetID().value().c_str(), -1, SQLITE_TRANSIENT);
    bool exists = sqlite3_step(probe) == SQLITE_ROW;
    sqlite3_finalize(probe);

    if (!exists) {
        return CommitResult::NOT_FOUND;
    }
    conflicts_.fetch_add(1, std::memory_order_relaxed);
    return CommitResult::CONFLICT;
}

bool SqlitePatternRepository::Delete(const PatternID& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = Prepare("DELETE FROM recurring_patterns WHERE id = ?;");
    sqlite3_bind_text(stmt, 1, id.value().c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to delete pattern: ") + sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

bool SqlitePatternRepository::Exists(const PatternID& id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = Prepare("SELECT 1 FROM recurring_patterns WHERE id = ? LIMIT 1;");
    sqlite3_bind_text(stmt, 1, id.value().c_str(), -1, SQLITE_TRANSIENT);

    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    return rc == SQLITE_ROW;
}

size_t SqlitePatternRepository::StoreBatch(const std::vector<RecurringChargePattern>& patterns) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (patterns.empty()) {
        return 0;
    }

    ExecuteSQL("BEGIN TRANSACTION;");
    size_t stored_count = 0;
    try {
        for (const auto& pattern : patterns) {
            if (InsertUnlocked(pattern)) {
                ++stored_count;
            }
        }
        ExecuteSQL("COMMIT;");
    } catch (const std::exception&) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }

    total_writes_.fetch_add(stored_count, std::memory_order_relaxed);
    return stored_count;
}

// ============================================================================
// Query Operations
// ============================================================================

std::vector<RecurringChargePattern> SqlitePatternRepository::FindByUser(
    const std::string& user_id, const QueryOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    sqlite3_stmt* stmt = Prepare(
        "SELECT data, version FROM recurring_patterns "
        "WHERE user_id = ?1 AND (?2 IS NULL OR status = ?2) "
        "ORDER BY created_at, id LIMIT ?3;");

    sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    if (options.status) {
        sqlite3_bind_int(stmt, 2, static_cast<int>(*options.status));
    } else {
        sqlite3_bind_null(stmt, 2);
    }
    // LIMIT -1 means no limit in SQLite
    sqlite3_int64 limit = options.max_results > static_cast<size_t>(INT64_MAX)
                              ? -1
                              : static_cast<sqlite3_int64>(options.max_results);
    sqlite3_bind_int64(stmt, 3, limit);

    return QueryPatterns(stmt);
}

std::vector<RecurringChargePattern> SqlitePatternRepository::FindActive(
    const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    total_reads_.fetch_add(1, std::memory_order_relaxed);

    sqlite3_stmt* stmt = Prepare(
        "SELECT data, version FROM recurring_patterns "
        "WHERE user_id = ? AND status = ? AND active = 1 "
        "ORDER BY created_at, id;");
    sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int(stmt, 2, static_cast<int>(PatternStatus::ACTIVE));

    return QueryPatterns(stmt);
}

std::vector<RecurringChargePattern> SqlitePatternRepository::QueryPatterns(
    sqlite3_stmt* stmt) const {
    std::vector<RecurringChargePattern> results;

    int rc;
    try {
        while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
            RecurringChargePattern pattern = DeserializePattern(
                sqlite3_column_blob(stmt, 0), sqlite3_column_bytes(stmt, 0));
            // The version column is authoritative over the blob copy
            pattern.SetVersion(static_cast<uint64_t>(sqlite3_column_int64(stmt, 1)));
            results.push_back(std::move(pattern));
        }
    } catch (const std::exception&) {
        sqlite3_finalize(stmt);
        throw;
    }
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        throw std::runtime_error(std::string("Failed to read patterns: ") + sqlite3_errmsg(db_));
    }
    return results;
}

// ============================================================================
// Statistics and Maintenance
// ============================================================================

size_t SqlitePatternRepository::Count() const {
    std::lock_guard<std::mutex> lock(mutex_);

    sqlite3_stmt* stmt = Prepare("SELECT COUNT(*) FROM recurring_patterns;");
    size_t count = 0;
    if (sqlite3_step(stmt) == SQLITE_ROW) {
        count = static_cast<size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
    return count;
}

RepositoryStats SqlitePatternRepository::GetStats() const {
    RepositoryStats stats;
    stats.total_patterns = Count();
    stats.total_reads = total_reads_.load(std::memory_order_relaxed);
    stats.total_writes = total_writes_.load(std::memory_order_relaxed);
    stats.conflicts = conflicts_.load(std::memory_order_relaxed);
    return stats;
}

void SqlitePatternRepository::Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    ExecuteSQL("DELETE FROM recurring_patterns;");
}

void SqlitePatternRepository::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_wal && config_.db_path != ":memory:") {
        ExecuteSQL("PRAGMA wal_checkpoint(FULL);");
    }
}

// ============================================================================
// Helper Methods
// ============================================================================

std::vector<uint8_t> SqlitePatternRepository::SerializePattern(
    const RecurringChargePattern& pattern) {
    std::ostringstream oss(std::ios::binary);
    pattern.Serialize(oss);
    std::string str = oss.str();
    return std::vector<uint8_t>(str.begin(), str.end());
}

RecurringChargePattern SqlitePatternRepository::DeserializePattern(const void* data, int size) {
    std::string str(static_cast<const char*>(data), static_cast<size_t>(size));
    std::istringstream iss(str, std::ios::binary);
    return RecurringChargePattern::Deserialize(iss);
}

} // namespace recur
