#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward declarations
struct sqlite3;
struct sqlite3_stmt;

namespace panxfer {

/// One upload session as recorded in the ledger.
struct LedgerRow {
    std::string session_id;
    std::string parent_id;
    std::string name;         // requested name (resume lookup key)
    std::string remote_name;  // name the object is created under
    uint64_t size = 0;
    std::string content_hash;
    uint64_t chunk_size = 0;
    uint64_t total_chunks = 0;
    std::string state;  // session_state_name() values
    std::string file_id;
    std::string error;
    int64_t created_at = 0;
    int64_t updated_at = 0;
};

/// SQLite record of upload sessions. Lets a new process find the session a
/// previous run left unfinished for the same (parent, name, size, hash), and
/// reports session counts by state.
class TransferLedger {
public:
    TransferLedger() = default;
    ~TransferLedger();

    TransferLedger(const TransferLedger&) = delete;
    TransferLedger& operator=(const TransferLedger&) = delete;

    /// Open or create the database. Returns error message or empty string.
    std::string open(const std::filesystem::path& db_path);
    bool is_open() const { return db_ != nullptr; }

    /// Insert or replace a session row.
    bool record_session(const LedgerRow& row);

    bool update_state(const std::string& session_id, const std::string& state,
                      const std::string& file_id = {}, const std::string& error = {});

    /// Most recent session for the key that never reached done (aborted
    /// sessions stay resumable until purged).
    std::optional<LedgerRow> find_resumable(const std::string& parent_id, const std::string& name,
                                            uint64_t size, const std::string& content_hash);

    std::optional<LedgerRow> get(const std::string& session_id);

    /// Rows ordered by last update, newest first (limit 0 = all).
    std::vector<LedgerRow> list(size_t limit = 0);

    /// Number of sessions per state.
    std::map<std::string, uint64_t> counts();

    /// Delete done/aborted rows not updated for `older_than_secs`. Returns rows removed.
    size_t purge_finished(int64_t older_than_secs);

private:
    LedgerRow read_row(sqlite3_stmt* stmt) const;

    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    sqlite3_stmt* stmt_insert_ = nullptr;
    sqlite3_stmt* stmt_update_state_ = nullptr;
    sqlite3_stmt* stmt_get_ = nullptr;
    sqlite3_stmt* stmt_find_resumable_ = nullptr;
    sqlite3_stmt* stmt_counts_ = nullptr;
};

}  // namespace panxfer
