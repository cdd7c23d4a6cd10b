#include "panxfer/upload_session.hpp"
#include "panxfer/hash_util.hpp"
#include "panxfer/log.hpp"
#include "panxfer/metadata_cache.hpp"
#include "panxfer/remote_api.hpp"
#include "panxfer/sync.hpp"
#include "panxfer/transfer_ledger.hpp"
#include "panxfer/transfer_source.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <vector>

namespace panxfer {

namespace {

uint64_t ceil_div(uint64_t a, uint64_t b) {
    return b == 0 ? 0 : (a + b - 1) / b;
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

constexpr int kMaxConflictRetries = 3;

}  // namespace

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Initializing: return "initializing";
        case SessionState::Transferring: return "transferring";
        case SessionState::Completing: return "completing";
        case SessionState::Done: return "done";
        case SessionState::Aborted: return "aborted";
    }
    return "unknown";
}

const char* upload_strategy_name(UploadStrategy strategy) {
    switch (strategy) {
        case UploadStrategy::Instant: return "instant";
        case UploadStrategy::SingleShot: return "single_shot";
        case UploadStrategy::Chunked: return "chunked";
    }
    return "unknown";
}

// ============================================================================
// Throughput and chunk geometry
// ============================================================================

void ThroughputEstimator::record(uint64_t bytes, std::chrono::steady_clock::duration elapsed) {
    double secs = std::chrono::duration<double>(elapsed).count();
    if (secs <= 0.0) secs = 0.001;
    double bps = static_cast<double>(bytes) / secs;

    std::lock_guard lock(mutex_);
    estimate_ = samples_ == 0 ? bps : alpha_ * bps + (1.0 - alpha_) * estimate_;
    ++samples_;
}

uint64_t ThroughputEstimator::bytes_per_second() const {
    std::lock_guard lock(mutex_);
    return static_cast<uint64_t>(estimate_);
}

uint64_t ThroughputEstimator::samples() const {
    std::lock_guard lock(mutex_);
    return samples_;
}

uint64_t plan_chunk_size(uint64_t total_size, uint64_t server_slice, uint64_t throughput,
                         const UploadSettings& settings, TransferError& error) {
    error = {};
    if (server_slice > 0) {
        if (total_size > 0 && ceil_div(total_size, server_slice) > settings.max_chunks) {
            error = TransferError::make(
                ErrorCategory::ResourceExhausted, "plan_chunks", "",
                std::to_string(ceil_div(total_size, server_slice)) + " chunks of " +
                    std::to_string(server_slice) + " bytes exceeds the ceiling of " +
                    std::to_string(settings.max_chunks));
            return 0;
        }
        return server_slice;
    }

    uint64_t chunk = throughput > 0
        ? throughput * static_cast<uint64_t>(settings.target_chunk_duration.count())
        : settings.default_chunk_size;
    chunk = std::clamp(chunk, settings.min_chunk_size, settings.max_chunk_size);

    if (total_size > 0 && ceil_div(total_size, chunk) > settings.max_chunks) {
        chunk = ceil_div(total_size, settings.max_chunks);
        if (chunk > settings.max_chunk_size) {
            error = TransferError::make(
                ErrorCategory::ResourceExhausted, "plan_chunks", "",
                "file of " + std::to_string(total_size) + " bytes needs more than " +
                    std::to_string(settings.max_chunks) + " chunks of the maximum size " +
                    std::to_string(settings.max_chunk_size));
            return 0;
        }
    }
    return chunk;
}

size_t plan_worker_count(uint64_t remaining_chunks, uint64_t throughput,
                         const UploadSettings& settings) {
    const uint64_t ceiling = std::max<uint64_t>(1, settings.workers_per_session);
    uint64_t optimal = ceiling;
    if (throughput > 0) {
        uint64_t target = settings.per_worker_throughput * ceiling;
        optimal = std::clamp<uint64_t>(ceil_div(target, throughput), 1, ceiling);
    }
    return static_cast<size_t>(std::min({optimal, ceiling, remaining_chunks}));
}

// ============================================================================
// UploadSessionManager
// ============================================================================

struct UploadSessionManager::NameIndex {
    std::map<std::string, RemoteEntry> by_name;

    bool taken(const std::string& name) const { return by_name.count(name) > 0; }
};

UploadSessionManager::UploadSessionManager(RemoteApi& api, MetadataCache& cache,
                                           TransferLedger* ledger, const UploadSettings& settings,
                                           const CacheSettings& cache_settings,
                                           std::string root_id, ThroughputEstimator& throughput)
    : api_(api)
    , cache_(cache)
    , ledger_(ledger)
    , settings_(settings)
    , cache_settings_(cache_settings)
    , root_id_(std::move(root_id))
    , throughput_(throughput) {}

std::string UploadSessionManager::session_key(const std::string& parent_id,
                                              const std::string& name, uint64_t size,
                                              const std::string& hash) {
    return parent_id + "\x1f" + name + "\x1f" + std::to_string(size) + "\x1f" + hash;
}

UploadSessionManager::KeyLock::KeyLock(UploadSessionManager& manager, std::string key)
    : manager_(manager), key_(std::move(key)) {
    {
        std::lock_guard lock(manager_.registry_mutex_);
        auto& m = manager_.key_mutexes_[key_];
        if (!m) m = std::make_shared<std::mutex>();
        mutex_ = m;
    }
    mutex_->lock();
}

UploadSessionManager::KeyLock::~KeyLock() {
    mutex_->unlock();
    mutex_.reset();
    std::lock_guard lock(manager_.registry_mutex_);
    auto it = manager_.key_mutexes_.find(key_);
    if (it != manager_.key_mutexes_.end() && it->second.use_count() == 1) {
        manager_.key_mutexes_.erase(it);
    }
}

size_t UploadSessionManager::live_sessions() const {
    std::lock_guard lock(registry_mutex_);
    return registry_.size();
}

size_t UploadSessionManager::open_locks() const {
    std::lock_guard lock(registry_mutex_);
    return key_mutexes_.size();
}

void UploadSessionManager::finish(const std::shared_ptr<UploadSession>& session) {
    if (!session) return;
    std::lock_guard lock(registry_mutex_);
    auto it = registry_.find(session->key);
    if (it != registry_.end() && it->second == session) {
        registry_.erase(it);
    }
}

TransferError UploadSessionManager::verify_parent(const std::string& parent_id,
                                                  const CancelToken* cancel) {
    if (parent_id == root_id_) return {};

    if (auto cached = cache_.parent_valid(parent_id)) {
        if (*cached) return {};
        return TransferError::make(ErrorCategory::NotFound, "verify_parent", parent_id,
                                   "parent directory does not exist (cached)");
    }

    auto r = api_.get_entry(parent_id, cancel);
    if (r.success) {
        cache_.set_parent_valid(parent_id, r.entry.is_directory);
        if (r.entry.is_directory) return {};
        return TransferError::make(ErrorCategory::NotFound, "verify_parent", parent_id,
                                   "parent is not a directory");
    }
    if (r.error.category == ErrorCategory::NotFound) {
        cache_.set_parent_valid(parent_id, false);
    }
    return r.error;
}

bool UploadSessionManager::load_names(const std::string& parent_id, NameIndex& index,
                                      const CancelToken* cancel, TransferError& error) {
    auto listing = list_all_children(api_, cache_, parent_id, cache_settings_.list_page_size, cancel);
    if (!listing.success) {
        error = std::move(listing.error);
        return false;
    }
    for (auto& e : listing.entries) index.by_name[e.name] = std::move(e);
    return true;
}

std::string UploadSessionManager::compute_hash(TransferSource& source, uint64_t size,
                                               const CancelToken* cancel, TransferError& error) {
    if (!source.capabilities().seekable) {
        error = TransferError::make(ErrorCategory::DataIntegrity, "hash", source.describe(),
                                    "content hash unknown and the source cannot be re-read");
        return {};
    }

    Hasher hasher;
    std::vector<uint8_t> buf(4 * MiB);
    uint64_t offset = 0;
    while (offset < size) {
        if (is_cancelled(cancel)) {
            error = TransferError::make(ErrorCategory::Cancelled, "hash", source.describe(),
                                        "cancelled");
            return {};
        }
        size_t n = static_cast<size_t>(std::min<uint64_t>(buf.size(), size - offset));
        if (!source.read_at(offset, buf.data(), n)) {
            error = TransferError::make(ErrorCategory::DataIntegrity, "hash", source.describe(),
                                        source.last_error());
            return {};
        }
        hasher.update(buf.data(), n);
        offset += n;
    }
    return hasher.final_hex();
}

std::shared_ptr<UploadSession> UploadSessionManager::resume_from_ledger(
    const OpenRequest& request, const std::string& name, const std::string& hash,
    const std::string& key) {
    if (!ledger_) return nullptr;

    auto row = ledger_->find_resumable(request.parent_id, name, request.size, hash);
    if (!row || row->session_id.empty() || row->chunk_size == 0) return nullptr;

    auto s = std::make_shared<UploadSession>();
    s->session_id = row->session_id;
    s->key = key;
    s->target_path = request.target_path;
    s->parent_id = request.parent_id;
    s->requested_name = name;
    s->name = row->remote_name.empty() ? row->name : row->remote_name;
    s->total_size = request.size;
    s->chunk_size = row->chunk_size;
    s->total_chunks = ceil_div(request.size, row->chunk_size);
    s->content_hash = hash;
    s->created_at = row->created_at;
    s->strategy = UploadStrategy::Chunked;
    s->resumed = true;

    log_info("Resuming upload session %s for %s (%llu chunks of %llu bytes, last state %s)",
             s->session_id.c_str(), request.target_path.c_str(),
             static_cast<unsigned long long>(s->total_chunks),
             static_cast<unsigned long long>(s->chunk_size), row->state.c_str());
    return s;
}

OpenResult UploadSessionManager::open(const OpenRequest& request, TransferSource* source,
                                      const CancelToken* cancel) {
    OpenResult out;
    const std::string& target = request.target_path.empty() ? request.name : request.target_path;

    const std::string name = clean_file_name(request.name);
    if (name.empty()) {
        out.error = TransferError::make(ErrorCategory::Unknown, "open", target,
                                        "file name is empty after cleaning");
        return out;
    }
    if (name != request.name) {
        log_debug("Cleaned file name \"%s\" -> \"%s\"", request.name.c_str(), name.c_str());
    }

    // 1. Parent must exist
    out.error = verify_parent(request.parent_id, cancel);
    if (!out.error.empty()) {
        out.error.operation = "open";
        out.error.target = target;
        return out;
    }

    // 2. Content hash: known, or computed from a re-readable source
    std::string hash = lower(request.known_hash);
    if (hash.empty()) {
        if (!source) {
            out.error = TransferError::make(ErrorCategory::DataIntegrity, "open", target,
                                            "no content hash and no source to compute it");
            return out;
        }
        hash = compute_hash(*source, request.size, cancel, out.error);
        if (hash.empty()) return out;
    }

    // 3. Identical opens share one session
    const std::string key = session_key(request.parent_id, name, request.size, hash);
    KeyLock key_lock(*this, key);
    {
        std::lock_guard lock(registry_mutex_);
        auto it = registry_.find(key);
        if (it != registry_.end() && it->second->state != SessionState::Aborted) {
            out.success = true;
            out.existing = true;
            out.session = it->second;
            return out;
        }
    }

    // 4. Unfinished session from an earlier run
    if (auto resumed = resume_from_ledger(request, name, hash, key)) {
        std::lock_guard lock(registry_mutex_);
        registry_[key] = resumed;
        out.success = true;
        out.session = std::move(resumed);
        return out;
    }

    // 5. Collisions with existing children
    NameIndex names;
    if (!load_names(request.parent_id, names, cancel, out.error)) {
        out.error.operation = "open";
        out.error.target = target;
        return out;
    }

    auto s = std::make_shared<UploadSession>();
    s->key = key;
    s->target_path = target;
    s->parent_id = request.parent_id;
    s->requested_name = name;
    s->total_size = request.size;
    s->content_hash = hash;
    s->created_at = now_epoch_seconds();

    auto same = names.by_name.find(name);
    if (same != names.by_name.end() && !same->second.is_directory &&
        same->second.size == request.size && lower(same->second.hash) == hash) {
        s->name = name;
        s->strategy = UploadStrategy::Instant;
        s->file_id = same->second.id;
        s->state = SessionState::Done;
        log_info("Skipping upload of %s: identical content already present", target.c_str());
        out.success = true;
        out.session = std::move(s);
        return out;
    }

    // 6. Create the provider session (instant upload when content is known)
    SessionOpenResult created;
    std::string final_name = name;
    for (int conflicts = 0;; ++conflicts) {
        if (names.taken(final_name)) {
            final_name.clear();
            for (size_t i = 1; i <= settings_.max_name_attempts; ++i) {
                std::string candidate = numbered_name(name, i);
                if (!names.taken(candidate)) {
                    final_name = std::move(candidate);
                    break;
                }
            }
            if (final_name.empty()) final_name = timestamped_name(name, now_epoch_seconds());
            log_debug("Name %s taken in %s, using %s", name.c_str(), request.parent_id.c_str(),
                      final_name.c_str());
        }

        created = api_.create_session({request.parent_id, final_name, request.size, hash}, cancel);
        if (created.success) break;
        if (created.error.category == ErrorCategory::Conflict && conflicts < kMaxConflictRetries) {
            names.by_name[final_name] = RemoteEntry{};
            continue;
        }
        out.error = std::move(created.error);
        out.error.operation = "open";
        out.error.target = target;
        return out;
    }
    s->name = final_name;

    if (created.reused) {
        s->strategy = UploadStrategy::Instant;
        s->file_id = created.file_id;
        s->state = SessionState::Done;
        log_info("Instant upload: %s (%llu bytes, md5 %s)", target.c_str(),
                 static_cast<unsigned long long>(request.size), hash.c_str());
        if (ledger_) {
            LedgerRow row;
            row.session_id = "instant:" + hash + ":" + std::to_string(s->created_at);
            row.parent_id = request.parent_id;
            row.name = name;
            row.remote_name = final_name;
            row.size = request.size;
            row.content_hash = hash;
            row.state = session_state_name(SessionState::Done);
            row.file_id = created.file_id;
            ledger_->record_session(row);
        }
        out.success = true;
        out.session = std::move(s);
        return out;
    }

    // 7. Strategy and chunk geometry
    s->session_id = created.session_id;
    TransferError plan_error;
    s->chunk_size = plan_chunk_size(request.size, created.slice_size, throughput_.bytes_per_second(),
                                    settings_, plan_error);
    if (s->chunk_size == 0) {
        out.error = std::move(plan_error);
        out.error.operation = "open";
        out.error.target = target;
        return out;
    }
    s->total_chunks = ceil_div(request.size, s->chunk_size);
    s->strategy = request.size < settings_.single_shot_limit ? UploadStrategy::SingleShot
                                                             : UploadStrategy::Chunked;

    if (ledger_) {
        LedgerRow row;
        row.session_id = s->session_id;
        row.parent_id = request.parent_id;
        row.name = name;
        row.remote_name = final_name;
        row.size = request.size;
        row.content_hash = hash;
        row.chunk_size = s->chunk_size;
        row.total_chunks = s->total_chunks;
        row.state = session_state_name(SessionState::Initializing);
        row.created_at = s->created_at;
        ledger_->record_session(row);
    }

    log_debug("Opened session %s for %s: %s, %llu chunks of %llu bytes", s->session_id.c_str(),
              target.c_str(), upload_strategy_name(s->strategy),
              static_cast<unsigned long long>(s->total_chunks),
              static_cast<unsigned long long>(s->chunk_size));

    {
        std::lock_guard lock(registry_mutex_);
        registry_[key] = s;
    }
    out.success = true;
    out.session = std::move(s);
    return out;
}

}  // namespace panxfer
