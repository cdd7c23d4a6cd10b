#include "panxfer/transfer_ledger.hpp"
#include "panxfer/log.hpp"
#include "panxfer/remote_types.hpp"

#include <chrono>
#include <sqlite3.h>
#include <thread>

namespace panxfer {

namespace {

constexpr const char* LEDGER_SCHEMA = R"(
CREATE TABLE IF NOT EXISTS sessions (
    session_id TEXT PRIMARY KEY,
    parent_id TEXT NOT NULL,
    name TEXT NOT NULL,
    size INTEGER NOT NULL,
    content_hash TEXT NOT NULL DEFAULT '',
    chunk_size INTEGER NOT NULL DEFAULT 0,
    total_chunks INTEGER NOT NULL DEFAULT 0,
    state TEXT NOT NULL,
    file_id TEXT NOT NULL DEFAULT '',
    error TEXT NOT NULL DEFAULT '',
    created_at INTEGER NOT NULL,
    updated_at INTEGER NOT NULL,
    remote_name TEXT NOT NULL DEFAULT ''
) WITHOUT ROWID;

CREATE INDEX IF NOT EXISTS idx_resume
    ON sessions(parent_id, name, size, content_hash, updated_at);
)";

// Execute a SQL statement with retry on SQLITE_BUSY
bool sql_exec(sqlite3* db, const char* sql) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        char* err = nullptr;
        int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err);
        if (rc == SQLITE_OK) return true;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            if (err) sqlite3_free(err);
            std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
            continue;
        }
        if (err) {
            log_error("SQL error: %s (rc=%d)", err, rc);
            sqlite3_free(err);
        }
        return false;
    }
    log_error("SQL timed out after retries");
    return false;
}

// Step a prepared statement with SQLITE_BUSY retry
int sql_step_retry(sqlite3_stmt* stmt) {
    for (int attempt = 0; attempt < 10; ++attempt) {
        int rc = sqlite3_step(stmt);
        if (rc != SQLITE_BUSY && rc != SQLITE_LOCKED) return rc;
        sqlite3_reset(stmt);
        std::this_thread::sleep_for(std::chrono::milliseconds(10 * (attempt + 1)));
    }
    return SQLITE_BUSY;
}

std::string column_text(sqlite3_stmt* stmt, int col) {
    auto p = sqlite3_column_text(stmt, col);
    return p ? reinterpret_cast<const char*>(p) : "";
}

void bind_text(sqlite3_stmt* stmt, int idx, const std::string& value) {
    sqlite3_bind_text(stmt, idx, value.c_str(), -1, SQLITE_TRANSIENT);
}

constexpr const char* ROW_COLUMNS =
    "session_id, parent_id, name, size, content_hash, chunk_size, total_chunks, "
    "state, file_id, error, created_at, updated_at, remote_name";

}  // namespace

TransferLedger::~TransferLedger() {
    if (stmt_insert_) sqlite3_finalize(stmt_insert_);
    if (stmt_update_state_) sqlite3_finalize(stmt_update_state_);
    if (stmt_get_) sqlite3_finalize(stmt_get_);
    if (stmt_find_resumable_) sqlite3_finalize(stmt_find_resumable_);
    if (stmt_counts_) sqlite3_finalize(stmt_counts_);

    if (db_) {
        sqlite3_exec(db_, "PRAGMA wal_checkpoint(TRUNCATE)", nullptr, nullptr, nullptr);
        sqlite3_close(db_);
    }
}

std::string TransferLedger::open(const std::filesystem::path& db_path) {
    std::lock_guard lock(mutex_);
    if (db_) return "ledger already open";

    std::error_code ec;
    if (db_path.has_parent_path()) std::filesystem::create_directories(db_path.parent_path(), ec);

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string err = "Cannot open ledger: " + std::string(sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return err;
    }

    // WAL mode for concurrent readers (panxfer sessions while an upload runs)
    sql_exec(db_, "PRAGMA journal_mode=WAL");
    sql_exec(db_, "PRAGMA synchronous=NORMAL");
    sql_exec(db_, "PRAGMA busy_timeout=5000");
    if (!sql_exec(db_, LEDGER_SCHEMA)) return "Cannot create ledger schema";

    std::string select_cols = ROW_COLUMNS;
    struct Prepared {
        sqlite3_stmt** stmt;
        std::string sql;
    } statements[] = {
        {&stmt_insert_,
         "INSERT OR REPLACE INTO sessions (" + select_cols + ") "
         "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13)"},
        {&stmt_update_state_,
         "UPDATE sessions SET state = ?2, file_id = CASE WHEN ?3 = '' THEN file_id ELSE ?3 END, "
         "error = ?4, updated_at = ?5 WHERE session_id = ?1"},
        {&stmt_get_, "SELECT " + select_cols + " FROM sessions WHERE session_id = ?1"},
        {&stmt_find_resumable_,
         "SELECT " + select_cols + " FROM sessions WHERE parent_id = ?1 AND name = ?2 "
         "AND size = ?3 AND content_hash = ?4 AND state != 'done' "
         "ORDER BY updated_at DESC LIMIT 1"},
        {&stmt_counts_, "SELECT state, COUNT(*) FROM sessions GROUP BY state"},
    };
    for (auto& p : statements) {
        if (sqlite3_prepare_v2(db_, p.sql.c_str(), -1, p.stmt, nullptr) != SQLITE_OK) {
            return "Cannot prepare ledger statement: " + std::string(sqlite3_errmsg(db_));
        }
    }
    return {};
}

LedgerRow TransferLedger::read_row(sqlite3_stmt* stmt) const {
    LedgerRow row;
    row.session_id = column_text(stmt, 0);
    row.parent_id = column_text(stmt, 1);
    row.name = column_text(stmt, 2);
    row.size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    row.content_hash = column_text(stmt, 4);
    row.chunk_size = static_cast<uint64_t>(sqlite3_column_int64(stmt, 5));
    row.total_chunks = static_cast<uint64_t>(sqlite3_column_int64(stmt, 6));
    row.state = column_text(stmt, 7);
    row.file_id = column_text(stmt, 8);
    row.error = column_text(stmt, 9);
    row.created_at = sqlite3_column_int64(stmt, 10);
    row.updated_at = sqlite3_column_int64(stmt, 11);
    row.remote_name = column_text(stmt, 12);
    return row;
}

bool TransferLedger::record_session(const LedgerRow& row) {
    std::lock_guard lock(mutex_);
    if (!db_) return false;

    int64_t now = now_epoch_seconds();
    sqlite3_reset(stmt_insert_);
    bind_text(stmt_insert_, 1, row.session_id);
    bind_text(stmt_insert_, 2, row.parent_id);
    bind_text(stmt_insert_, 3, row.name);
    sqlite3_bind_int64(stmt_insert_, 4, static_cast<int64_t>(row.size));
    bind_text(stmt_insert_, 5, row.content_hash);
    sqlite3_bind_int64(stmt_insert_, 6, static_cast<int64_t>(row.chunk_size));
    sqlite3_bind_int64(stmt_insert_, 7, static_cast<int64_t>(row.total_chunks));
    bind_text(stmt_insert_, 8, row.state);
    bind_text(stmt_insert_, 9, row.file_id);
    bind_text(stmt_insert_, 10, row.error);
    sqlite3_bind_int64(stmt_insert_, 11, row.created_at ? row.created_at : now);
    sqlite3_bind_int64(stmt_insert_, 12, now);
    bind_text(stmt_insert_, 13, row.remote_name.empty() ? row.name : row.remote_name);
    int rc = sql_step_retry(stmt_insert_);
    if (rc != SQLITE_DONE) {
        log_error("Ledger insert failed for %s: %s", row.session_id.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

bool TransferLedger::update_state(const std::string& session_id, const std::string& state,
                                  const std::string& file_id, const std::string& error) {
    std::lock_guard lock(mutex_);
    if (!db_) return false;

    sqlite3_reset(stmt_update_state_);
    bind_text(stmt_update_state_, 1, session_id);
    bind_text(stmt_update_state_, 2, state);
    bind_text(stmt_update_state_, 3, file_id);
    bind_text(stmt_update_state_, 4, error);
    sqlite3_bind_int64(stmt_update_state_, 5, now_epoch_seconds());
    int rc = sql_step_retry(stmt_update_state_);
    if (rc != SQLITE_DONE) {
        log_error("Ledger update failed for %s: %s", session_id.c_str(), sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

std::optional<LedgerRow> TransferLedger::find_resumable(const std::string& parent_id,
                                                        const std::string& name, uint64_t size,
                                                        const std::string& content_hash) {
    std::lock_guard lock(mutex_);
    if (!db_) return std::nullopt;

    sqlite3_reset(stmt_find_resumable_);
    bind_text(stmt_find_resumable_, 1, parent_id);
    bind_text(stmt_find_resumable_, 2, name);
    sqlite3_bind_int64(stmt_find_resumable_, 3, static_cast<int64_t>(size));
    bind_text(stmt_find_resumable_, 4, content_hash);
    if (sql_step_retry(stmt_find_resumable_) != SQLITE_ROW) return std::nullopt;
    return read_row(stmt_find_resumable_);
}

std::optional<LedgerRow> TransferLedger::get(const std::string& session_id) {
    std::lock_guard lock(mutex_);
    if (!db_) return std::nullopt;

    sqlite3_reset(stmt_get_);
    bind_text(stmt_get_, 1, session_id);
    if (sql_step_retry(stmt_get_) != SQLITE_ROW) return std::nullopt;
    return read_row(stmt_get_);
}

std::vector<LedgerRow> TransferLedger::list(size_t limit) {
    std::lock_guard lock(mutex_);
    std::vector<LedgerRow> rows;
    if (!db_) return rows;

    std::string sql = std::string("SELECT ") + ROW_COLUMNS + " FROM sessions ORDER BY updated_at DESC";
    if (limit > 0) sql += " LIMIT " + std::to_string(limit);

    sqlite3_stmt* stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
        log_error("Ledger list failed: %s", sqlite3_errmsg(db_));
        return rows;
    }
    while (sql_step_retry(stmt) == SQLITE_ROW) {
        rows.push_back(read_row(stmt));
    }
    sqlite3_finalize(stmt);
    return rows;
}

std::map<std::string, uint64_t> TransferLedger::counts() {
    std::lock_guard lock(mutex_);
    std::map<std::string, uint64_t> result;
    if (!db_) return result;

    sqlite3_reset(stmt_counts_);
    while (sql_step_retry(stmt_counts_) == SQLITE_ROW) {
        result[column_text(stmt_counts_, 0)] =
            static_cast<uint64_t>(sqlite3_column_int64(stmt_counts_, 1));
    }
    return result;
}

size_t TransferLedger::purge_finished(int64_t older_than_secs) {
    std::lock_guard lock(mutex_);
    if (!db_) return 0;

    sqlite3_stmt* stmt = nullptr;
    sqlite3_prepare_v2(db_,
        "DELETE FROM sessions WHERE state IN ('done', 'aborted') AND updated_at <= ?1",
        -1, &stmt, nullptr);
    if (!stmt) return 0;
    sqlite3_bind_int64(stmt, 1, now_epoch_seconds() - older_than_secs);
    size_t removed = 0;
    if (sql_step_retry(stmt) == SQLITE_DONE) {
        removed = static_cast<size_t>(sqlite3_changes(db_));
    }
    sqlite3_finalize(stmt);
    return removed;
}

}  // namespace panxfer
