#include "panxfer/transfer_engine.hpp"
#include "panxfer/chunked_upload.hpp"
#include "panxfer/credentials.hpp"
#include "panxfer/hash_util.hpp"
#include "panxfer/http.hpp"
#include "panxfer/kv_store.hpp"
#include "panxfer/log.hpp"
#include "panxfer/metrics.hpp"
#include "panxfer/retry_policy.hpp"
#include "panxfer/transfer_source.hpp"

#include <algorithm>
#include <fstream>
#include <new>

namespace panxfer {

namespace {

// Finished ledger rows older than this are purged at start-up
constexpr int64_t kLedgerRetentionSecs = 7 * 24 * 3600;

bool is_resumable_state(const std::string& state) {
    return state != session_state_name(SessionState::Done);
}

}  // namespace

// ============================================================================
// Construction / lifecycle
// ============================================================================

TransferEngine::TransferEngine(const EngineConfig& config)
    : config_(config)
    , uploads_gate_(config.upload.max_concurrent_uploads)
    , downloads_gate_(config.upload.max_concurrent_downloads) {}

TransferEngine::TransferEngine(const EngineConfig& config, RemoteApi& api, KvStore& kv)
    : config_(config)
    , api_(&api)
    , kv_(&kv)
    , uploads_gate_(config.upload.max_concurrent_uploads)
    , downloads_gate_(config.upload.max_concurrent_downloads) {}

TransferEngine::~TransferEngine() {
    stop();
}

std::string TransferEngine::start() {
    if (running_) return {};

    auto err = config_.validate();
    if (!err.empty()) return err;

    std::error_code ec;
    std::filesystem::create_directories(config_.state_dir, ec);
    if (ec) return "Failed to create state_dir: " + ec.message();
    if (config_.cross_store.temp_dir.empty()) {
        config_.cross_store.temp_dir = config_.state_dir / "buffers";
    }

    // Durable store
    if (!kv_) {
        try {
            std::filesystem::create_directories(config_.cache_db_path, ec);
            owned_kv_ = std::make_unique<LmdbKvStore>(config_.cache_db_path,
                                                      config_.cache_mapsize_mb);
        } catch (const std::exception& e) {
            return std::string("Failed to open cache store: ") + e.what();
        }
        kv_ = owned_kv_.get();
    }
    size_t expired = kv_->purge_expired();
    if (expired > 0) log_debug("Purged %zu expired cache entries", expired);

    // Session ledger
    if (!config_.ledger_path.empty()) {
        err = ledger_.open(config_.ledger_path);
        if (!err.empty()) return "Failed to open ledger: " + err;
        size_t purged = ledger_.purge_finished(kLedgerRetentionSecs);
        if (purged > 0) log_debug("Purged %zu finished ledger rows", purged);
    }

    // Provider client; the retry policy also paces chunk retries
    retry_ = std::make_unique<RetryPolicy>(config_.retry);
    if (!api_) {
        net::HttpClientConfig http_config;
        http_config.verbose = config_.verbose && verbose_enabled();
        http_ = std::make_unique<net::HttpClient>(http_config);
        limiters_ = std::make_unique<RateLimiterRegistry>(config_.pacer);
        credentials_ = std::make_unique<TokenCredentialProvider>(
            TokenCredentialProvider::Token{config_.access_token, config_.token_expiry});
        http_api_ = std::make_unique<HttpRemoteApi>(config_, *http_, *limiters_, *retry_,
                                                    *credentials_);
        api_ = http_api_.get();
    }

    TransferLedger* ledger = ledger_.is_open() ? &ledger_ : nullptr;
    cache_ = std::make_unique<MetadataCache>(*kv_, config_.cache);
    progress_ = std::make_unique<ProgressStore>(
        *kv_, std::chrono::duration_cast<std::chrono::milliseconds>(config_.upload.progress_ttl));
    sessions_ = std::make_unique<UploadSessionManager>(*api_, *cache_, ledger, config_.upload,
                                                       config_.cache, config_.root_id,
                                                       throughput_);
    uploader_ = std::make_unique<ChunkedUploader>(*api_, *progress_, ledger, config_.upload,
                                                  *retry_, throughput_, metrics_);
    poller_ = std::make_unique<CompletionPoller>(*api_, config_.completion);
    memory_budget_ = std::make_unique<MemoryBudget>(config_.cross_store.memory_budget);
    selector_ = std::make_unique<TransferSelector>(config_.cross_store, *memory_budget_);

    size_t pending = progress_->list_sessions().size();
    log_info("Transfer engine started: provider=%s store=%s ledger=%s, %zu resumable session(s)",
             api_->type_name().c_str(), kv_->type_name().c_str(),
             ledger ? config_.ledger_path.c_str() : "none", pending);

    running_ = true;
    return {};
}

void TransferEngine::stop() {
    if (!running_.exchange(false)) return;
    log_debug("Transfer engine stopped");
}

// ============================================================================
// Path resolution
// ============================================================================

std::optional<RemoteEntry> TransferEngine::find_child(const std::string& parent_id,
                                                      const std::string& name,
                                                      const CancelToken* cancel,
                                                      TransferError& error) {
    auto listing = list_all_children(*api_, *cache_, parent_id, config_.cache.list_page_size,
                                     cancel);
    if (!listing.success) {
        error = std::move(listing.error);
        return std::nullopt;
    }
    for (auto& e : listing.entries) {
        if (e.name == name) return std::move(e);
    }
    return std::nullopt;
}

ResolveResult TransferEngine::resolve(const std::string& remote_path, const CancelToken* cancel) {
    ResolveResult out;
    const std::string path = normalize_path(remote_path);

    if (path == "/") {
        out.success = true;
        out.entry = PathEntry{config_.root_id, true, {}};
        return out;
    }
    if (auto cached = cache_->path(path)) {
        out.success = true;
        out.entry = std::move(*cached);
        return out;
    }

    // Walk from the deepest cached ancestor
    const auto parts = split_path(path);
    PathEntry current{config_.root_id, true, {}};
    std::string walked = "/";
    size_t start = 0;
    for (size_t i = parts.size(); i-- > 1;) {
        std::string prefix;
        for (size_t k = 0; k < i; ++k) prefix += "/" + parts[k];
        if (auto cached = cache_->path(prefix)) {
            current = std::move(*cached);
            walked = prefix;
            start = i;
            break;
        }
    }

    for (size_t i = start; i < parts.size(); ++i) {
        if (!current.is_directory) {
            out.error = TransferError::make(ErrorCategory::NotFound, "resolve", path,
                                            walked + " is not a directory");
            return out;
        }
        const uint64_t generation = cache_->generation();
        TransferError err;
        auto child = find_child(current.id, parts[i], cancel, err);
        if (!err.empty()) {
            out.error = std::move(err);
            out.error.operation = "resolve";
            out.error.target = path;
            return out;
        }
        if (!child) {
            out.error = TransferError::make(ErrorCategory::NotFound, "resolve", path,
                                            "no entry named \"" + parts[i] + "\" in " + walked);
            return out;
        }
        walked = join_path(walked, parts[i]);
        PathEntry next{child->id, child->is_directory, current.id};
        cache_->set_path(walked, next, generation);
        current = std::move(next);
    }

    out.success = true;
    out.entry = std::move(current);
    return out;
}

bool TransferEngine::resolve_parent(const std::string& path, std::string& parent_id,
                                    const CancelToken* cancel, TransferError& error) {
    auto parent = resolve(parent_path_of(path), cancel);
    if (!parent.success) {
        error = std::move(parent.error);
        return false;
    }
    if (!parent.entry.is_directory) {
        error = TransferError::make(ErrorCategory::NotFound, "resolve", parent_path_of(path),
                                    "not a directory");
        return false;
    }
    parent_id = parent.entry.id;
    return true;
}

ListResult TransferEngine::list(const std::string& remote_path, const CancelToken* cancel) {
    ListResult out;
    auto dir = resolve(remote_path, cancel);
    if (!dir.success) {
        out.error = std::move(dir.error);
        out.error.operation = "list";
        return out;
    }
    if (!dir.entry.is_directory) {
        out.error = TransferError::make(ErrorCategory::NotFound, "list",
                                        normalize_path(remote_path), "not a directory");
        return out;
    }
    out = list_all_children(*api_, *cache_, dir.entry.id, config_.cache.list_page_size, cancel);
    if (!out.success) {
        out.error.operation = "list";
        out.error.target = normalize_path(remote_path);
    }
    return out;
}

// ============================================================================
// Uploads
// ============================================================================

UploadResult TransferEngine::upload(const std::filesystem::path& local_path,
                                    const std::string& remote_path, const CancelToken* cancel) {
    std::unique_ptr<LocalFileSource> source;
    try {
        source = std::make_unique<LocalFileSource>(local_path);
    } catch (const std::runtime_error& e) {
        UploadResult out;
        out.error = TransferError::make(ErrorCategory::NotFound, "upload", local_path.string(),
                                        e.what());
        record_outcome(out);
        return out;
    }
    return upload_from(*source, remote_path, cancel);
}

OpenResult TransferEngine::open_session(const std::string& parent_id, const std::string& name,
                                        const std::string& target, uint64_t size,
                                        const std::string& hash, TransferSource* source,
                                        const CancelToken* cancel) {
    OpenRequest request;
    request.parent_id = parent_id;
    request.name = name;
    request.target_path = target;
    request.size = size;
    request.known_hash = hash;
    return sessions_->open(request, source, cancel);
}

UploadResult TransferEngine::upload_from(TransferSource& source, const std::string& remote_path,
                                         const CancelToken* cancel) {
    UploadResult out;
    const std::string target = normalize_path(remote_path);
    const std::string name = base_name_of(target);
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->upload_duration());

    auto fail = [&](TransferError error) {
        out.error = std::move(error);
        if (out.error.operation.empty()) out.error.operation = "upload";
        if (out.error.target.empty()) out.error.target = target;
        record_outcome(out);
        return out;
    };

    if (!running_) {
        return fail(TransferError::make(ErrorCategory::Unknown, "upload", target,
                                        "engine not started"));
    }
    if (name.empty()) {
        return fail(TransferError::make(ErrorCategory::NotFound, "upload", target,
                                        "destination has no file name"));
    }

    std::string parent_id;
    TransferError err;
    if (!resolve_parent(target, parent_id, cancel, err)) return fail(std::move(err));

    ConcurrencyGate::Slot slot(uploads_gate_, cancel);
    if (!slot.held()) {
        return fail(TransferError::make(ErrorCategory::Cancelled, "upload", target,
                                        "cancelled while waiting for an upload slot"));
    }

    const auto caps = source.capabilities();
    const auto size = source.size();

    if (caps.seekable && size) {
        auto opened = open_session(parent_id, name, target, *size, source.known_hash(), &source,
                                   cancel);
        if (!opened.success) return fail(std::move(opened.error));
        out = transfer_shared(opened.session, source, cancel);
        record_outcome(out);
        return out;
    }

    // Not re-readable: try the instant path before reading a single byte
    std::shared_ptr<UploadSession> session;
    if (caps.hash_known && size && !source.known_hash().empty()) {
        auto opened = open_session(parent_id, name, target, *size, source.known_hash(), nullptr,
                                   cancel);
        if (!opened.success) return fail(std::move(opened.error));
        if (opened.session->strategy == UploadStrategy::Instant) {
            out = transfer_shared(opened.session, source, cancel);
            record_outcome(out);
            return out;
        }
        session = std::move(opened.session);
    }

    auto prepared = selector_->prepare(source, cancel);
    if (!prepared.success) {
        if (session) {
            session->state = SessionState::Aborted;
            sessions_->finish(session);
        }
        prepared.error.target = target;
        return fail(std::move(prepared.error));
    }
    log_debug("Staged %s for %s via %s buffer (%llu bytes)", source.describe().c_str(),
              target.c_str(), buffer_strategy_name(prepared.strategy),
              static_cast<unsigned long long>(prepared.size));

    if (!session) {
        // The buffered copy has a hash now; this open is the dedup attempt
        auto opened = open_session(parent_id, name, target, prepared.size, prepared.content_hash,
                                   prepared.source, cancel);
        if (!opened.success) return fail(std::move(opened.error));
        session = std::move(opened.session);
    }

    out = transfer_shared(session, *prepared.source, cancel);
    out.buffering = prepared.strategy;
    record_outcome(out);
    return out;
}

UploadResult TransferEngine::copy(const std::string& src_path, const std::string& dst_path,
                                  const CancelToken* cancel) {
    UploadResult out;
    auto src = resolve(src_path, cancel);
    if (!src.success || src.entry.is_directory) {
        out.error = src.success ? TransferError::make(ErrorCategory::NotFound, "copy",
                                                      normalize_path(src_path), "is a directory")
                                : std::move(src.error);
        out.error.operation = "copy";
        return out;
    }
    auto entry = api_->get_entry(src.entry.id, cancel);
    if (!entry.success) {
        out.error = std::move(entry.error);
        out.error.operation = "copy";
        out.error.target = normalize_path(src_path);
        return out;
    }
    RemoteObjectSource source(*api_, entry.entry, cancel);
    return upload_from(source, dst_path, cancel);
}

UploadResult TransferEngine::transfer_shared(const std::shared_ptr<UploadSession>& session,
                                             TransferSource& source, const CancelToken* cancel) {
    std::shared_future<UploadResult> future;
    std::shared_ptr<std::promise<UploadResult>> promise;
    {
        std::lock_guard lock(pending_mutex_);
        auto it = pending_uploads_.find(session->key);
        if (it != pending_uploads_.end()) {
            future = it->second.result;
        } else {
            promise = std::make_shared<std::promise<UploadResult>>();
            future = promise->get_future().share();
            pending_uploads_[session->key] = {future};
        }
    }

    if (!promise) {
        log_debug("Joining in-flight upload of %s", session->target_path.c_str());
        return future.get();
    }

    // Joiners wait on the promise, so it is fulfilled even when the transfer throws
    UploadResult result;
    auto aborted = [&](ErrorCategory category, const char* what) {
        log_error("Upload of %s failed: %s", session->target_path.c_str(), what);
        session->state = SessionState::Aborted;
        result = UploadResult{};
        result.strategy = session->strategy;
        result.error = TransferError::make(category, "upload", session->target_path, what);
        if (ledger_.is_open() && !session->session_id.empty()) {
            ledger_.update_state(session->session_id, session_state_name(session->state), {},
                                 result.error.to_string());
        }
    };
    try {
        result = transfer(*session, source, cancel);
    } catch (const std::bad_alloc& e) {
        aborted(ErrorCategory::ResourceExhausted, e.what());
    } catch (const std::exception& e) {
        aborted(ErrorCategory::Unknown, e.what());
    }
    sessions_->finish(session);
    promise->set_value(result);
    {
        std::lock_guard lock(pending_mutex_);
        pending_uploads_.erase(session->key);
    }
    return result;
}

UploadResult TransferEngine::transfer(UploadSession& session, TransferSource& source,
                                      const CancelToken* cancel) {
    UploadResult out;
    out.strategy = session.strategy;
    out.object.remote_path = session.target_path;
    out.object.size = session.total_size;
    out.object.content_hash = session.content_hash;

    if (session.state == SessionState::Done) {
        // Instant upload, or a session another caller already finished
        out.deduplicated = session.strategy == UploadStrategy::Instant;
        finish_upload(session, out);
        return out;
    }

    if (session.strategy == UploadStrategy::SingleShot) {
        if (try_single_shot(session, source, out, cancel)) {
            finish_upload(session, out);
            return out;
        }
        if (out.error.category == ErrorCategory::Cancelled) {
            session.state = SessionState::Aborted;
            if (ledger_.is_open()) {
                ledger_.update_state(session.session_id, session_state_name(session.state), {},
                                     out.error.to_string());
            }
            return out;
        }
        log_warn("Single-shot upload of %s failed (%s), falling back to chunked upload",
                 session.target_path.c_str(), out.error.to_string().c_str());
        out.error = {};
        session.strategy = UploadStrategy::Chunked;
        out.strategy = UploadStrategy::Chunked;
    }

    auto run = uploader_->run(session, source, cancel);
    out.chunks_uploaded = run.chunks_uploaded;
    out.chunks_skipped = run.chunks_skipped;
    out.bytes_uploaded = run.bytes_uploaded;
    if (!run.success) {
        out.error = std::move(run.error);
        return out;
    }

    CompletionOutcome done;
    {
        std::optional<ScopedTimer> timer;
        if (metrics_) timer.emplace(metrics_->completion_duration());
        done = poller_->complete(session.session_id, session.total_size, session.target_path,
                                 cancel);
    }
    if (!done.success) {
        session.state = SessionState::Aborted;
        out.error = std::move(done.error);
        out.error.chunks_done = session.total_chunks;
        out.error.chunks_total = session.total_chunks;
        if (ledger_.is_open()) {
            ledger_.update_state(session.session_id, session_state_name(session.state), {},
                                 out.error.to_string());
        }
        return out;
    }
    if (!done.content_hash.empty() && done.content_hash != session.content_hash) {
        session.state = SessionState::Aborted;
        out.error = TransferError::make(ErrorCategory::DataIntegrity, "complete",
                                        session.target_path,
                                        "provider reports hash " + done.content_hash +
                                            ", expected " + session.content_hash);
        if (ledger_.is_open()) {
            ledger_.update_state(session.session_id, session_state_name(session.state), {},
                                 out.error.to_string());
        }
        return out;
    }

    session.file_id = done.file_id;
    session.state = SessionState::Done;
    finish_upload(session, out);
    return out;
}

bool TransferEngine::try_single_shot(UploadSession& session, TransferSource& source,
                                     UploadResult& result, const CancelToken* cancel) {
    std::vector<uint8_t> data(session.total_size);
    if (session.total_size > 0 && !source.read_at(0, data.data(), data.size())) {
        result.error = TransferError::make(ErrorCategory::DataIntegrity, "upload",
                                           session.target_path,
                                           "source read failed: " + source.last_error());
        return false;
    }
    if (Hasher::md5_hex(std::span<const uint8_t>(data)) != session.content_hash) {
        result.error = TransferError::make(ErrorCategory::DataIntegrity, "upload",
                                           session.target_path,
                                           "source content changed since it was hashed");
        return false;
    }

    session.state = SessionState::Transferring;
    CreateSessionRequest request{session.parent_id, session.name, session.total_size,
                                 session.content_hash};
    auto r = api_->upload_single(request, data, cancel);
    if (!r.success) {
        result.error = std::move(r.error);
        return false;
    }
    if (!r.completed) {
        result.error = TransferError::make(ErrorCategory::Unknown, "upload", session.target_path,
                                           "single-shot upload not confirmed");
        return false;
    }
    if (!r.content_hash.empty() && r.content_hash != session.content_hash) {
        result.error = TransferError::make(ErrorCategory::DataIntegrity, "upload",
                                           session.target_path,
                                           "provider reports hash " + r.content_hash);
        return false;
    }

    session.file_id = r.file_id;
    session.state = SessionState::Done;
    result.bytes_uploaded = session.total_size;
    if (metrics_) metrics_->upload_bytes_total().Increment(static_cast<double>(session.total_size));
    return true;
}

void TransferEngine::finish_upload(UploadSession& session, UploadResult& result) {
    result.success = true;
    result.object.file_id = session.file_id;
    result.object.remote_path = session.target_path;
    result.object.size = session.total_size;
    result.object.content_hash = session.content_hash;
    result.object.modified = now_epoch_seconds();

    if (!session.session_id.empty()) {
        if (ledger_.is_open()) {
            ledger_.update_state(session.session_id, session_state_name(SessionState::Done),
                                 session.file_id);
        }
        progress_->remove(session.session_id);
    }
    if (session.name != session.requested_name && !session.name.empty()) {
        result.object.remote_path = join_path(parent_path_of(session.target_path), session.name);
    }

    cache_->invalidate_mutation(result.object.remote_path, session.parent_id);
    log_info("Uploaded %s (%s, %llu bytes, file id %s)", result.object.remote_path.c_str(),
             upload_strategy_name(session.strategy),
             static_cast<unsigned long long>(session.total_size), session.file_id.c_str());
}

void TransferEngine::record_outcome(const UploadResult& result) {
    if (result.success) {
        ++uploads_completed_;
        if (result.deduplicated) ++uploads_deduplicated_;
    } else {
        ++uploads_failed_;
        log_error("%s", result.error.to_string().c_str());
    }
    if (!metrics_) return;
    if (result.success) {
        metrics_->uploads_success().Increment();
        if (result.deduplicated) metrics_->uploads_deduplicated().Increment();
    } else if (result.error.category == ErrorCategory::Cancelled) {
        metrics_->uploads_cancelled().Increment();
    } else {
        metrics_->uploads_failure().Increment();
    }
}

// ============================================================================
// Downloads
// ============================================================================

DownloadResult TransferEngine::download(const std::string& remote_path,
                                        const std::filesystem::path& local_path,
                                        const CancelToken* cancel) {
    DownloadResult out;
    const std::string target = normalize_path(remote_path);
    auto fail = [&](TransferError error) {
        out.error = std::move(error);
        out.error.operation = "download";
        if (out.error.target.empty()) out.error.target = target;
        log_error("%s", out.error.to_string().c_str());
        return out;
    };

    auto resolved = resolve(target, cancel);
    if (!resolved.success) return fail(std::move(resolved.error));
    if (resolved.entry.is_directory) {
        return fail(TransferError::make(ErrorCategory::NotFound, "download", target,
                                        "is a directory"));
    }
    auto entry = api_->get_entry(resolved.entry.id, cancel);
    if (!entry.success) return fail(std::move(entry.error));

    ConcurrencyGate::Slot slot(downloads_gate_, cancel);
    if (!slot.held()) {
        return fail(TransferError::make(ErrorCategory::Cancelled, "download", target,
                                        "cancelled while waiting for a download slot"));
    }

    auto part_path = local_path;
    part_path += ".part";
    std::ofstream ofs(part_path, std::ios::binary | std::ios::trunc);
    if (!ofs) {
        return fail(TransferError::make(ErrorCategory::ResourceExhausted, "download",
                                        part_path.string(), "cannot create local file"));
    }

    Hasher hasher;
    const uint64_t size = entry.entry.size;
    const uint64_t step = std::max<uint64_t>(config_.cross_store.range_size, 1);
    uint64_t offset = 0;
    std::error_code ec;
    while (offset < size) {
        uint64_t len = std::min(step, size - offset);
        auto r = api_->read_range(entry.entry.id, offset, len, cancel);
        if (!r.success || r.data.size() != len) {
            ofs.close();
            std::filesystem::remove(part_path, ec);
            if (r.success) {
                return fail(TransferError::make(ErrorCategory::DataIntegrity, "download", target,
                                                "short read at offset " + std::to_string(offset)));
            }
            return fail(std::move(r.error));
        }
        ofs.write(reinterpret_cast<const char*>(r.data.data()),
                  static_cast<std::streamsize>(r.data.size()));
        hasher.update(r.data.data(), r.data.size());
        offset += len;
        if (metrics_) metrics_->download_bytes_total().Increment(static_cast<double>(len));
    }
    ofs.close();
    if (!ofs.good()) {
        std::filesystem::remove(part_path, ec);
        return fail(TransferError::make(ErrorCategory::ResourceExhausted, "download",
                                        part_path.string(), "write failed"));
    }

    out.content_hash = hasher.final_hex();
    if (!entry.entry.hash.empty() && entry.entry.hash != out.content_hash) {
        std::filesystem::remove(part_path, ec);
        return fail(TransferError::make(ErrorCategory::DataIntegrity, "download", target,
                                        "content hash " + out.content_hash + " != " +
                                            entry.entry.hash));
    }

    std::filesystem::rename(part_path, local_path, ec);
    if (ec) {
        std::filesystem::remove(part_path, ec);
        return fail(TransferError::make(ErrorCategory::ResourceExhausted, "download",
                                        local_path.string(), "rename failed"));
    }

    out.success = true;
    out.bytes = size;
    ++downloads_completed_;
    log_info("Downloaded %s -> %s (%llu bytes)", target.c_str(), local_path.c_str(),
             static_cast<unsigned long long>(size));
    return out;
}

// ============================================================================
// Namespace mutations
// ============================================================================

OpResult TransferEngine::make_directory(const std::string& remote_path, const CancelToken* cancel) {
    OpResult out;
    const std::string path = normalize_path(remote_path);
    const std::string name = clean_file_name(base_name_of(path));
    if (name.empty()) {
        out.error = TransferError::make(ErrorCategory::Conflict, "mkdir", path, "invalid name");
        return out;
    }

    std::string parent_id;
    if (!resolve_parent(path, parent_id, cancel, out.error)) {
        out.error.operation = "mkdir";
        return out;
    }

    TransferError err;
    auto existing = find_child(parent_id, name, cancel, err);
    if (!err.empty()) {
        out.error = std::move(err);
        out.error.operation = "mkdir";
        out.error.target = path;
        return out;
    }
    if (existing) {
        if (!existing->is_directory) {
            out.error = TransferError::make(ErrorCategory::Conflict, "mkdir", path,
                                            "a file with this name exists");
            return out;
        }
        out.success = true;
        out.id = existing->id;
        return out;
    }

    out = api_->make_directory(parent_id, name, cancel);
    if (!out.success) {
        out.error.operation = "mkdir";
        out.error.target = path;
        log_error("%s", out.error.to_string().c_str());
        return out;
    }
    cache_->invalidate_mutation(join_path(parent_path_of(path), name), parent_id);
    log_info("Created directory %s (id %s)", path.c_str(), out.id.c_str());
    return out;
}

OpResult TransferEngine::remove(const std::string& remote_path, const CancelToken* cancel) {
    OpResult out;
    const std::string path = normalize_path(remote_path);
    if (path == "/") {
        out.error = TransferError::make(ErrorCategory::Permission, "remove", path,
                                        "refusing to remove the root");
        return out;
    }
    auto resolved = resolve(path, cancel);
    if (!resolved.success) {
        out.error = std::move(resolved.error);
        out.error.operation = "remove";
        return out;
    }

    out = api_->remove({resolved.entry.id}, cancel);
    if (!out.success) {
        out.error.operation = "remove";
        out.error.target = path;
        log_error("%s", out.error.to_string().c_str());
        return out;
    }
    cache_->invalidate_mutation(path, resolved.entry.parent_id, resolved.entry.id);
    log_info("Removed %s", path.c_str());
    return out;
}

OpResult TransferEngine::move(const std::string& remote_path, const std::string& dst_dir,
                              const CancelToken* cancel) {
    OpResult out;
    const std::string path = normalize_path(remote_path);
    auto src = resolve(path, cancel);
    if (!src.success) {
        out.error = std::move(src.error);
        out.error.operation = "move";
        return out;
    }
    auto dst = resolve(dst_dir, cancel);
    if (!dst.success || !dst.entry.is_directory) {
        out.error = dst.success ? TransferError::make(ErrorCategory::NotFound, "move",
                                                      normalize_path(dst_dir), "not a directory")
                                : std::move(dst.error);
        out.error.operation = "move";
        return out;
    }

    out = api_->move({src.entry.id}, dst.entry.id, cancel);
    if (!out.success) {
        out.error.operation = "move";
        out.error.target = path;
        log_error("%s", out.error.to_string().c_str());
        return out;
    }
    cache_->invalidate_mutation(path, src.entry.parent_id, src.entry.id);
    cache_->invalidate_mutation(join_path(normalize_path(dst_dir), base_name_of(path)),
                                dst.entry.id);
    log_info("Moved %s -> %s", path.c_str(), normalize_path(dst_dir).c_str());
    return out;
}

OpResult TransferEngine::rename(const std::string& remote_path, const std::string& new_name,
                                const CancelToken* cancel) {
    OpResult out;
    const std::string path = normalize_path(remote_path);
    const std::string name = clean_file_name(new_name);
    if (name.empty()) {
        out.error = TransferError::make(ErrorCategory::Conflict, "rename", path, "invalid name");
        return out;
    }
    auto src = resolve(path, cancel);
    if (!src.success) {
        out.error = std::move(src.error);
        out.error.operation = "rename";
        return out;
    }

    out = api_->rename(src.entry.id, name, cancel);
    if (!out.success) {
        out.error.operation = "rename";
        out.error.target = path;
        log_error("%s", out.error.to_string().c_str());
        return out;
    }
    cache_->invalidate_mutation(path, src.entry.parent_id, src.entry.id);
    cache_->invalidate_mutation(join_path(parent_path_of(path), name), src.entry.parent_id);
    log_info("Renamed %s -> %s", path.c_str(), name.c_str());
    return out;
}

// ============================================================================
// State
// ============================================================================

std::vector<LedgerRow> TransferEngine::sessions(size_t limit) {
    if (!ledger_.is_open()) return {};
    return ledger_.list(limit);
}

EngineStats TransferEngine::stats() const {
    EngineStats s;
    if (http_api_) s.api = http_api_->stats();
    if (cache_) s.cache = cache_->stats();
    if (sessions_) s.active_sessions = sessions_->live_sessions();
    s.active_downloads = downloads_gate_.active();
    if (ledger_.is_open()) {
        for (const auto& [state, count] : ledger_.counts()) {
            if (is_resumable_state(state)) s.resumable_sessions += count;
        }
    }
    s.uploads_completed = uploads_completed_;
    s.uploads_failed = uploads_failed_;
    s.uploads_deduplicated = uploads_deduplicated_;
    s.downloads_completed = downloads_completed_;
    return s;
}

}  // namespace panxfer
