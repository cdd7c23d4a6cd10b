#pragma once

#include "panxfer/engine_config.hpp"
#include "panxfer/errors.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <unordered_map>

namespace panxfer {

class CancelToken;
class MetadataCache;
class RemoteApi;
class TransferLedger;
class TransferSource;

enum class SessionState {
    Initializing,
    Transferring,
    Completing,
    Done,
    Aborted,
};

const char* session_state_name(SessionState state);

enum class UploadStrategy {
    Instant,     // provider already had the content; no bytes sent
    SingleShot,  // one-request upload, chunked fallback on failure
    Chunked,
};

const char* upload_strategy_name(UploadStrategy strategy);

/// One in-flight file transfer. Size and chunk geometry are fixed once the
/// session leaves the manager.
struct UploadSession {
    std::string session_id;  // provider upload id; empty for instant uploads
    std::string key;         // idempotence key (parent, name, size, hash)
    std::string target_path;
    std::string parent_id;
    std::string requested_name;
    std::string name;        // collision-free name the object is created under
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    uint64_t total_chunks = 0;
    std::string content_hash;
    int64_t created_at = 0;
    UploadStrategy strategy = UploadStrategy::Chunked;
    bool resumed = false;    // picked up from the ledger of an earlier run
    std::string file_id;     // set when the provider confirms the object

    std::atomic<SessionState> state{SessionState::Initializing};
};

/// EWMA of observed per-stream chunk throughput.
class ThroughputEstimator {
public:
    explicit ThroughputEstimator(double alpha = 0.3) : alpha_(alpha) {}

    void record(uint64_t bytes, std::chrono::steady_clock::duration elapsed);

    /// Bytes per second, 0 before the first sample.
    uint64_t bytes_per_second() const;
    uint64_t samples() const;

private:
    const double alpha_;
    mutable std::mutex mutex_;
    double estimate_ = 0.0;
    uint64_t samples_ = 0;
};

/// Chunk size for `total_size`. A provider-dictated slice size wins; otherwise
/// roughly target_chunk_duration of transfer at `throughput` (or the default
/// size before any measurement), clamped to [min, max] and grown within max so
/// the count stays under max_chunks. Returns 0 and fills `error` with
/// resource_exhausted when no allowed size fits.
uint64_t plan_chunk_size(uint64_t total_size, uint64_t server_slice, uint64_t throughput,
                         const UploadSettings& settings, TransferError& error);

/// Workers for one session: min(optimal for the measured throughput,
/// configured ceiling, chunks remaining). Optimal is the number of streams at
/// the measured rate needed to reach ceiling * per_worker_throughput.
size_t plan_worker_count(uint64_t remaining_chunks, uint64_t throughput,
                         const UploadSettings& settings);

struct OpenRequest {
    std::string parent_id;
    std::string name;
    std::string target_path;
    uint64_t size = 0;
    std::string known_hash;  // MD5 hex if the caller already has it
};

struct OpenResult {
    bool success = false;
    std::shared_ptr<UploadSession> session;
    bool existing = false;  // an identical open is already in flight; this is its session
    TransferError error;
};

/// Opens upload sessions: verifies the parent, makes sure a content hash is
/// available, asks the provider for an instant upload, resolves name
/// collisions and picks the transfer strategy and chunk geometry.
///
/// Identical opens (same parent, name, size and hash) return the same live
/// session; across processes the ledger hands back the unfinished session.
class UploadSessionManager {
public:
    UploadSessionManager(RemoteApi& api, MetadataCache& cache, TransferLedger* ledger,
                         const UploadSettings& settings, const CacheSettings& cache_settings,
                         std::string root_id, ThroughputEstimator& throughput);

    /// `source` must be seekable when `known_hash` is empty.
    OpenResult open(const OpenRequest& request, TransferSource* source, const CancelToken* cancel);

    /// Drop a finished or aborted session from the live registry.
    void finish(const std::shared_ptr<UploadSession>& session);

    size_t live_sessions() const;

    /// Per-key open locks currently held or waited on.
    size_t open_locks() const;

    /// Verify `parent_id` is an existing directory, through the parent-validity cache.
    TransferError verify_parent(const std::string& parent_id, const CancelToken* cancel);

    static std::string session_key(const std::string& parent_id, const std::string& name,
                                   uint64_t size, const std::string& hash);

private:
    struct NameIndex;

    /// Serializes opens of one key; the map entry goes with its last holder.
    class KeyLock {
    public:
        KeyLock(UploadSessionManager& manager, std::string key);
        ~KeyLock();
        KeyLock(const KeyLock&) = delete;
        KeyLock& operator=(const KeyLock&) = delete;

    private:
        UploadSessionManager& manager_;
        std::string key_;
        std::shared_ptr<std::mutex> mutex_;
    };

    bool load_names(const std::string& parent_id, NameIndex& index, const CancelToken* cancel,
                    TransferError& error);
    std::string compute_hash(TransferSource& source, uint64_t size, const CancelToken* cancel,
                             TransferError& error);
    std::shared_ptr<UploadSession> resume_from_ledger(const OpenRequest& request,
                                                      const std::string& name,
                                                      const std::string& hash,
                                                      const std::string& key);

    RemoteApi& api_;
    MetadataCache& cache_;
    TransferLedger* ledger_;
    UploadSettings settings_;
    CacheSettings cache_settings_;
    std::string root_id_;
    ThroughputEstimator& throughput_;

    mutable std::mutex registry_mutex_;
    std::unordered_map<std::string, std::shared_ptr<UploadSession>> registry_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> key_mutexes_;
};

}  // namespace panxfer
