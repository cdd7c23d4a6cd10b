#pragma once

#include "panxfer/chunk_progress.hpp"
#include "panxfer/completion.hpp"
#include "panxfer/engine_config.hpp"
#include "panxfer/errors.hpp"
#include "panxfer/http_remote_api.hpp"
#include "panxfer/metadata_cache.hpp"
#include "panxfer/remote_api.hpp"
#include "panxfer/sync.hpp"
#include "panxfer/transfer_ledger.hpp"
#include "panxfer/transfer_selector.hpp"
#include "panxfer/upload_session.hpp"

#include <atomic>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace panxfer {

class ChunkedUploader;
class CredentialProvider;
class KvStore;
class MetricsExporter;
class RetryPolicy;
class TransferSource;

namespace net {
class HttpClient;
}

struct UploadResult {
    bool success = false;
    TransferObject object;
    UploadStrategy strategy = UploadStrategy::Chunked;
    bool deduplicated = false;  // no content bytes were sent
    BufferStrategy buffering = BufferStrategy::Direct;
    uint64_t chunks_uploaded = 0;
    uint64_t chunks_skipped = 0;
    uint64_t bytes_uploaded = 0;
    TransferError error;
};

struct ResolveResult {
    bool success = false;
    PathEntry entry;
    TransferError error;
};

struct DownloadResult {
    bool success = false;
    uint64_t bytes = 0;
    std::string content_hash;
    TransferError error;
};

/// Snapshot for the metrics exporter and the stats log line.
struct EngineStats {
    RemoteApiStats api;  // zero unless the engine built its own HTTP client
    CacheStats cache;
    size_t active_sessions = 0;
    size_t active_downloads = 0;
    uint64_t resumable_sessions = 0;
    uint64_t uploads_completed = 0;
    uint64_t uploads_failed = 0;
    uint64_t uploads_deduplicated = 0;
    uint64_t downloads_completed = 0;
};

/// Engine context: owns the pacers, retry policy, caches, ledger and session
/// manager for one provider account, and runs uploads, downloads and namespace
/// mutations through them.
///
/// Two modes:
///   - TransferEngine(config): start() builds the libcurl transport, LMDB
///     store, SQLite ledger and HTTP API client from the configuration.
///   - TransferEngine(config, api, kv): the provider and store are supplied by
///     the caller (tests, embedding); the ledger is opened only when
///     config.ledger_path is set.
///
/// Every successful mutation (upload, mkdir, remove, move, rename)
/// invalidates the affected cache entries before returning.
class TransferEngine {
public:
    explicit TransferEngine(const EngineConfig& config);
    TransferEngine(const EngineConfig& config, RemoteApi& api, KvStore& kv);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    /// Build collaborators and open stores. Returns error message or empty string.
    std::string start();

    /// Stop accepting work and close stores. Running transfers are not interrupted.
    void stop();

    bool running() const { return running_; }

    /// Must be called before start(); not owned.
    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    // --- Uploads ---

    UploadResult upload(const std::filesystem::path& local_path, const std::string& remote_path,
                        const CancelToken* cancel = nullptr);

    /// Upload from any source; non-seekable sources are staged by the
    /// cross-store selector, after a dedup attempt when their hash is known.
    UploadResult upload_from(TransferSource& source, const std::string& remote_path,
                             const CancelToken* cancel = nullptr);

    /// Copy an object already on the provider to another path.
    UploadResult copy(const std::string& src_path, const std::string& dst_path,
                      const CancelToken* cancel = nullptr);

    // --- Downloads ---

    DownloadResult download(const std::string& remote_path, const std::filesystem::path& local_path,
                            const CancelToken* cancel = nullptr);

    // --- Namespace ---

    ResolveResult resolve(const std::string& remote_path, const CancelToken* cancel = nullptr);
    ListResult list(const std::string& remote_path, const CancelToken* cancel = nullptr);
    OpResult make_directory(const std::string& remote_path, const CancelToken* cancel = nullptr);
    OpResult remove(const std::string& remote_path, const CancelToken* cancel = nullptr);
    /// Move `remote_path` into directory `dst_dir`.
    OpResult move(const std::string& remote_path, const std::string& dst_dir,
                  const CancelToken* cancel = nullptr);
    OpResult rename(const std::string& remote_path, const std::string& new_name,
                    const CancelToken* cancel = nullptr);

    // --- State ---

    /// Ledger rows, newest first. Empty without a ledger.
    std::vector<LedgerRow> sessions(size_t limit = 0);

    EngineStats stats() const;

    MetadataCache& cache() { return *cache_; }
    ProgressStore& progress() { return *progress_; }
    UploadSessionManager& session_manager() { return *sessions_; }
    TransferLedger* ledger() { return ledger_.is_open() ? &ledger_ : nullptr; }
    MemoryBudget& memory_budget() { return *memory_budget_; }
    const EngineConfig& config() const { return config_; }

private:
    struct PendingUpload {
        std::shared_future<UploadResult> result;
    };

    bool resolve_parent(const std::string& path, std::string& parent_id,
                        const CancelToken* cancel, TransferError& error);
    std::optional<RemoteEntry> find_child(const std::string& parent_id, const std::string& name,
                                          const CancelToken* cancel, TransferError& error);
    OpenResult open_session(const std::string& parent_id, const std::string& name,
                            const std::string& target, uint64_t size, const std::string& hash,
                            TransferSource* source, const CancelToken* cancel);

    /// Run the transfer for an opened session once, sharing the result with
    /// concurrent callers that opened the same session.
    UploadResult transfer_shared(const std::shared_ptr<UploadSession>& session,
                                 TransferSource& source, const CancelToken* cancel);
    UploadResult transfer(UploadSession& session, TransferSource& source,
                          const CancelToken* cancel);
    bool try_single_shot(UploadSession& session, TransferSource& source, UploadResult& result,
                         const CancelToken* cancel);
    void finish_upload(UploadSession& session, UploadResult& result);
    void record_outcome(const UploadResult& result);

    EngineConfig config_;
    std::atomic<bool> running_{false};

    // Owned collaborators (owning mode only)
    std::unique_ptr<net::HttpClient> http_;
    std::unique_ptr<KvStore> owned_kv_;
    std::unique_ptr<RateLimiterRegistry> limiters_;
    std::unique_ptr<RetryPolicy> retry_;
    std::unique_ptr<CredentialProvider> credentials_;
    std::unique_ptr<HttpRemoteApi> http_api_;

    RemoteApi* api_ = nullptr;
    KvStore* kv_ = nullptr;
    MetricsExporter* metrics_ = nullptr;

    mutable TransferLedger ledger_;
    ThroughputEstimator throughput_;
    std::unique_ptr<MetadataCache> cache_;
    std::unique_ptr<ProgressStore> progress_;
    std::unique_ptr<UploadSessionManager> sessions_;
    std::unique_ptr<ChunkedUploader> uploader_;
    std::unique_ptr<CompletionPoller> poller_;
    std::unique_ptr<MemoryBudget> memory_budget_;
    std::unique_ptr<TransferSelector> selector_;

    ConcurrencyGate uploads_gate_;
    ConcurrencyGate downloads_gate_;

    // In-flight upload deduplication, keyed by session key
    std::mutex pending_mutex_;
    std::unordered_map<std::string, PendingUpload> pending_uploads_;

    std::atomic<uint64_t> uploads_completed_{0};
    std::atomic<uint64_t> uploads_failed_{0};
    std::atomic<uint64_t> uploads_deduplicated_{0};
    std::atomic<uint64_t> downloads_completed_{0};
};

}  // namespace panxfer
