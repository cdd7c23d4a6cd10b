// Test suite for panxfer.
//
// Tests:
//   1. Path helpers and error formatting
//   2. EngineConfig CLI parsing, JSON loading and validation
//   3. Pacer spacing, backoff decay and rate-limit holds; endpoint table
//   4. RetryPolicy classification and backoff
//   5. Token credential refresh
//   6. HttpRemoteApi against a scripted transport
//      - envelope parsing, 429 pacing, 401 refresh, 403/404 surfacing,
//        5xx retries, signed download URL caching
//   7. KvStore (memory and LMDB): TTL, prefixes, persistence
//   8. MetadataCache: TTL, invalidation, generation guard, corruption
//   9. StreamingHashAccumulator
//  10. Chunk progress store and SQLite transfer ledger
//  11. Chunk geometry and worker planning
//  12. ChunkedUploader: resume, retry, re-verification, cancellation
//  13. UploadSessionManager: instant upload, idempotence, collisions
//  14. CompletionPoller: interval schedule, budget, failure tolerance
//  15. TransferSelector: strategy table, memory budget, staging errors
//  16. TransferEngine integration against an in-memory provider
//  17. Metrics exporter
//  18. panxfer-cache tool

#include "panxfer/chunk_progress.hpp"
#include "panxfer/chunked_upload.hpp"
#include "panxfer/completion.hpp"
#include "panxfer/credentials.hpp"
#include "panxfer/engine_config.hpp"
#include "panxfer/errors.hpp"
#include "panxfer/hash_accumulator.hpp"
#include "panxfer/hash_util.hpp"
#include "panxfer/http.hpp"
#include "panxfer/http_remote_api.hpp"
#include "panxfer/kv_store.hpp"
#include "panxfer/metadata_cache.hpp"
#include "panxfer/metrics.hpp"
#include "panxfer/rate_limiter.hpp"
#include "panxfer/remote_api.hpp"
#include "panxfer/remote_types.hpp"
#include "panxfer/retry_policy.hpp"
#include "panxfer/sync.hpp"
#include "panxfer/transfer_engine.hpp"
#include "panxfer/transfer_ledger.hpp"
#include "panxfer/transfer_selector.hpp"
#include "panxfer/transfer_source.hpp"
#include "panxfer/upload_session.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iostream>
#include <lmdb.h>
#include <map>
#include <mutex>
#include <new>
#include <nlohmann/json.hpp>
#include <string>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace fs = std::filesystem;
using namespace panxfer;
using namespace std::chrono_literals;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                    \
    do {                                                              \
        std::cout << "  " << #name << "... " << std::flush;          \
    } while (0)

#define PASS()                                                        \
    do {                                                              \
        std::cout << "OK" << std::endl;                               \
        ++tests_passed;                                               \
    } while (0)

#define FAIL(msg)                                                     \
    do {                                                              \
        std::cout << "FAIL: " << msg << std::endl;                    \
        ++tests_failed;                                               \
    } while (0)

#define ASSERT_TRUE(cond, msg)                                        \
    do {                                                              \
        if (!(cond)) { FAIL(msg); return; }                           \
    } while (0)

#define ASSERT_EQ(a, b, msg)                                          \
    do {                                                              \
        if ((a) != (b)) {                                             \
            std::cout << "FAIL: " << msg << " (got \"" << (a)        \
                      << "\", expected \"" << (b) << "\")"            \
                      << std::endl;                                   \
            ++tests_failed;                                           \
            return;                                                   \
        }                                                             \
    } while (0)

#define ASSERT_EMPTY(s, msg)                                          \
    ASSERT_TRUE((s).empty(), msg ": " + (s))

#define ASSERT_NOT_EMPTY(s, msg)                                      \
    ASSERT_TRUE(!(s).empty(), msg)

/// Create a unique temp directory under /tmp.
static fs::path make_temp_dir(const std::string& prefix) {
    auto path = fs::temp_directory_path() / (prefix + "-XXXXXX");
    std::string tpl = path.string();
    char* result = mkdtemp(tpl.data());
    if (!result) throw std::runtime_error("mkdtemp failed");
    return fs::path(result);
}

/// Write binary content to a file.
static void write_file(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(content.data(), content.size());
}

/// Read entire file into a string.
static std::string read_file(const fs::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)),
                       std::istreambuf_iterator<char>());
}

/// Wait for a condition with timeout (milliseconds). Returns true if met.
static bool wait_for(std::function<bool()> cond, int timeout_ms = 5000) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (cond()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return cond();
}

/// Deterministic pseudo-random content.
static std::string pattern(size_t size, unsigned seed) {
    std::string out(size, '\0');
    uint32_t x = seed * 2654435761u + 1;
    for (auto& c : out) {
        x = x * 1664525u + 1013904223u;
        c = static_cast<char>(x >> 24);
    }
    return out;
}

static std::vector<uint8_t> to_bytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

static std::string md5(const std::string& s) {
    return Hasher::md5_hex(s);
}

static int64_t elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

static std::string str(ErrorCategory c) { return error_category_name(c); }
static std::string str(SessionState s) { return session_state_name(s); }
static std::string str(UploadStrategy s) { return upload_strategy_name(s); }
static std::string str(BufferStrategy s) { return buffer_strategy_name(s); }

/// Sequential reader over a shared string, for StreamSource.
static StreamSource::Reader string_reader(std::shared_ptr<std::string> data) {
    auto pos = std::make_shared<size_t>(0);
    return [data, pos](uint8_t* buf, size_t len) -> int64_t {
        size_t n = std::min(len, data->size() - *pos);
        if (n > 0) std::memcpy(buf, data->data() + *pos, n);
        *pos += n;
        return static_cast<int64_t>(n);
    };
}

// ---------------------------------------------------------------------------
// In-memory provider
// ---------------------------------------------------------------------------

/// Provider double with the semantics the engine relies on: directory tree,
/// content-addressed instant upload, sessions assembled from MD5-checked
/// slices, optional asynchronous completion, and injectable failures.
class FakeRemote : public RemoteApi {
public:
    struct Node {
        RemoteEntry entry;
        std::string data;
    };

    FakeRemote() {
        RemoteEntry root;
        root.id = "0";
        root.is_directory = true;
        nodes_["0"] = Node{root, {}};
    }

    std::string type_name() const override { return "fake"; }

    // --- Knobs ---
    std::atomic<uint64_t> slice_size{0};
    std::atomic<bool> instant_enabled{true};
    std::atomic<bool> fail_single{false};
    std::atomic<bool> throw_single{false};  // single-shot body allocation fails
    std::atomic<int> async_polls{0};
    std::atomic<int> chunk_delay_ms{0};
    std::function<void(uint64_t)> on_chunk;
    std::function<void(uint64_t)> on_range;  // called with the range offset

    // --- Call counters ---
    std::atomic<int> list_calls{0};
    std::atomic<int> get_calls{0};
    std::atomic<int> create_calls{0};
    std::atomic<int> chunk_calls{0};
    std::atomic<int> complete_calls{0};
    std::atomic<int> poll_calls{0};
    std::atomic<int> single_calls{0};
    std::atomic<int> range_calls{0};
    std::atomic<int> mkdir_calls{0};

    /// Send times of every request for chunk `index`, in order.
    std::vector<std::chrono::steady_clock::time_point> chunk_times(uint64_t index) {
        std::lock_guard lock(mutex_);
        return chunk_times_[index];
    }

    std::string add_dir(const std::string& parent, const std::string& name) {
        std::lock_guard lock(mutex_);
        return add_node_locked(parent, name, true, {});
    }

    std::string add_file(const std::string& parent, const std::string& name,
                         const std::string& data) {
        std::lock_guard lock(mutex_);
        return add_node_locked(parent, name, false, data);
    }

    std::optional<RemoteEntry> find(const std::string& parent, const std::string& name) {
        std::lock_guard lock(mutex_);
        auto id = child_named_locked(parent, name);
        if (id.empty()) return std::nullopt;
        return nodes_[id].entry;
    }

    std::string content_of(const std::string& id) {
        std::lock_guard lock(mutex_);
        auto it = nodes_.find(id);
        return it == nodes_.end() ? std::string() : it->second.data;
    }

    size_t child_count(const std::string& parent) {
        std::lock_guard lock(mutex_);
        size_t n = 0;
        for (const auto& [id, node] : nodes_) {
            if (id != "0" && node.entry.parent_id == parent) ++n;
        }
        return n;
    }

    void set_hash(const std::string& id, const std::string& hash) {
        std::lock_guard lock(mutex_);
        nodes_[id].entry.hash = hash;
    }

    /// Fail uploads of chunk `index` `times` times (-1 = always).
    void fail_chunk(uint64_t index, ErrorCategory category, int times) {
        std::lock_guard lock(mutex_);
        chunk_failures_[index] = Failure{category, times};
    }

    void fail_polls(int n) {
        std::lock_guard lock(mutex_);
        poll_failures_ = n;
    }

    void clear_failures() {
        std::lock_guard lock(mutex_);
        chunk_failures_.clear();
        poll_failures_ = 0;
    }

    // --- RemoteApi ---

    ListResult list_children(const std::string& parent_id, const std::string& page_token,
                             size_t limit, const CancelToken*) override {
        ++list_calls;
        std::lock_guard lock(mutex_);
        ListResult out;
        auto it = nodes_.find(parent_id);
        if (it == nodes_.end() || !it->second.entry.is_directory) {
            out.error = TransferError::make(ErrorCategory::NotFound, "list", parent_id,
                                            "directory not found");
            return out;
        }
        std::vector<RemoteEntry> children;
        for (const auto& [id, node] : nodes_) {
            if (id != "0" && node.entry.parent_id == parent_id) children.push_back(node.entry);
        }
        std::sort(children.begin(), children.end(),
                  [](const RemoteEntry& a, const RemoteEntry& b) {
                      return std::stoull(a.id) < std::stoull(b.id);
                  });
        size_t offset = page_token.empty() ? 0 : std::stoul(page_token);
        size_t end = std::min(children.size(), offset + std::max<size_t>(limit, 1));
        for (size_t i = offset; i < end; ++i) out.entries.push_back(children[i]);
        if (end < children.size()) out.next_page_token = std::to_string(end);
        out.success = true;
        return out;
    }

    EntryResult get_entry(const std::string& id, const CancelToken*) override {
        ++get_calls;
        std::lock_guard lock(mutex_);
        EntryResult out;
        auto it = nodes_.find(id);
        if (it == nodes_.end()) {
            out.error = TransferError::make(ErrorCategory::NotFound, "stat", id, "file not found");
            return out;
        }
        out.success = true;
        out.entry = it->second.entry;
        return out;
    }

    SessionOpenResult create_session(const CreateSessionRequest& request,
                                     const CancelToken*) override {
        ++create_calls;
        std::lock_guard lock(mutex_);
        SessionOpenResult out;
        auto parent = nodes_.find(request.parent_id);
        if (parent == nodes_.end() || !parent->second.entry.is_directory) {
            out.error = TransferError::make(ErrorCategory::NotFound, "create_session",
                                            request.parent_id, "parent not found");
            return out;
        }
        if (!child_named_locked(request.parent_id, request.name).empty()) {
            out.error = TransferError::make(ErrorCategory::Conflict, "create_session",
                                            request.name, "file name already exists");
            return out;
        }
        if (instant_enabled) {
            std::optional<std::string> stored;
            for (const auto& [id, node] : nodes_) {
                if (!node.entry.is_directory && node.entry.size == request.size &&
                    node.entry.hash == request.content_hash) {
                    stored = node.data;
                    break;
                }
            }
            if (stored) {
                out.success = true;
                out.reused = true;
                out.file_id = add_node_locked(request.parent_id, request.name, false, *stored);
                return out;
            }
        }
        std::string session_id = "pre-" + std::to_string(next_session_++);
        sessions_[session_id] = Pending{request, {}, {}, 0};
        out.success = true;
        out.session_id = session_id;
        out.slice_size = slice_size;
        return out;
    }

    OpResult upload_chunk(const std::string& session_id, uint64_t index,
                          std::span<const uint8_t> data, const std::string& chunk_hash,
                          const CancelToken* cancel) override {
        ++chunk_calls;
        {
            std::lock_guard lock(mutex_);
            chunk_times_[index].push_back(std::chrono::steady_clock::now());
        }
        OpResult out;
        if (chunk_delay_ms > 0) std::this_thread::sleep_for(std::chrono::milliseconds(chunk_delay_ms));
        if (is_cancelled(cancel)) {
            out.error = TransferError::make(ErrorCategory::Cancelled, "upload_chunk", session_id,
                                            "cancelled");
            return out;
        }
        {
            std::lock_guard lock(mutex_);
            auto f = chunk_failures_.find(index);
            if (f != chunk_failures_.end() && f->second.remaining != 0) {
                if (f->second.remaining > 0) --f->second.remaining;
                out.error = TransferError::make(f->second.category, "upload_chunk", session_id,
                                                "injected failure");
                if (f->second.category == ErrorCategory::ServerOverload) out.error.http_status = 503;
                return out;
            }
            auto s = sessions_.find(session_id);
            if (s == sessions_.end()) {
                out.error = TransferError::make(ErrorCategory::NotFound, "upload_chunk",
                                                session_id, "upload session not found");
                return out;
            }
            if (Hasher::md5_hex(data) != chunk_hash) {
                out.error = TransferError::make(ErrorCategory::DataIntegrity, "upload_chunk",
                                                session_id, "slice md5 mismatch");
                return out;
            }
            s->second.chunks[index] =
                std::string(reinterpret_cast<const char*>(data.data()), data.size());
        }
        if (on_chunk) on_chunk(index);
        out.success = true;
        return out;
    }

    CompleteResult complete_session(const std::string& session_id, const CancelToken*) override {
        ++complete_calls;
        std::lock_guard lock(mutex_);
        CompleteResult out;
        auto s = sessions_.find(session_id);
        if (s == sessions_.end()) {
            out.error = TransferError::make(ErrorCategory::NotFound, "complete", session_id,
                                            "upload session not found");
            return out;
        }
        std::string assembled;
        uint64_t expected = 0;
        for (const auto& [index, data] : s->second.chunks) {
            if (index != expected++) break;
            assembled += data;
        }
        if (assembled.size() != s->second.request.size ||
            md5(assembled) != s->second.request.content_hash) {
            out.error = TransferError::make(ErrorCategory::DataIntegrity, "complete", session_id,
                                            "assembled content does not match");
            return out;
        }
        s->second.data = std::move(assembled);
        out.success = true;
        if (async_polls > 0) {
            s->second.polls_left = async_polls;
            out.async = true;
            return out;
        }
        finish_locked(s->second, out);
        sessions_.erase(s);
        return out;
    }

    CompleteResult poll_session(const std::string& session_id, const CancelToken*) override {
        ++poll_calls;
        std::lock_guard lock(mutex_);
        CompleteResult out;
        if (poll_failures_ > 0) {
            --poll_failures_;
            out.error = TransferError::make(ErrorCategory::NetworkTimeout, "poll_complete",
                                            session_id, "connection reset");
            return out;
        }
        auto s = sessions_.find(session_id);
        if (s == sessions_.end()) {
            out.error = TransferError::make(ErrorCategory::NotFound, "poll_complete", session_id,
                                            "upload session not found");
            return out;
        }
        out.success = true;
        out.async = true;
        if (--s->second.polls_left > 0) return out;
        finish_locked(s->second, out);
        sessions_.erase(s);
        return out;
    }

    CompleteResult upload_single(const CreateSessionRequest& request,
                                 std::span<const uint8_t> data, const CancelToken*) override {
        ++single_calls;
        if (throw_single) throw std::bad_alloc();
        CompleteResult out;
        if (fail_single) {
            out.error = TransferError::make(ErrorCategory::ServerOverload, "upload_single",
                                            request.name, "injected failure");
            out.error.http_status = 503;
            return out;
        }
        std::lock_guard lock(mutex_);
        std::string content(reinterpret_cast<const char*>(data.data()), data.size());
        if (md5(content) != request.content_hash) {
            out.error = TransferError::make(ErrorCategory::DataIntegrity, "upload_single",
                                            request.name, "etag mismatch");
            return out;
        }
        out.success = true;
        out.completed = true;
        out.file_id = add_node_locked(request.parent_id, request.name, false, content);
        out.content_hash = request.content_hash;
        return out;
    }

    ReadResult read_range(const std::string& file_id, uint64_t offset, uint64_t length,
                          const CancelToken*) override {
        ++range_calls;
        if (on_range) on_range(offset);
        std::lock_guard lock(mutex_);
        ReadResult out;
        auto it = nodes_.find(file_id);
        if (it == nodes_.end() || it->second.entry.is_directory) {
            out.error = TransferError::make(ErrorCategory::NotFound, "read_range", file_id,
                                            "file not found");
            return out;
        }
        const std::string& d = it->second.data;
        size_t start = static_cast<size_t>(std::min<uint64_t>(offset, d.size()));
        size_t n = static_cast<size_t>(std::min<uint64_t>(length, d.size() - start));
        out.data.assign(d.begin() + start, d.begin() + start + n);
        out.success = true;
        return out;
    }

    OpResult make_directory(const std::string& parent_id, const std::string& name,
                            const CancelToken*) override {
        ++mkdir_calls;
        std::lock_guard lock(mutex_);
        OpResult out;
        auto parent = nodes_.find(parent_id);
        if (parent == nodes_.end() || !parent->second.entry.is_directory) {
            out.error = TransferError::make(ErrorCategory::NotFound, "mkdir", parent_id,
                                            "parent not found");
            return out;
        }
        if (!child_named_locked(parent_id, name).empty()) {
            out.error = TransferError::make(ErrorCategory::Conflict, "mkdir", name,
                                            "name already exists");
            return out;
        }
        out.success = true;
        out.id = add_node_locked(parent_id, name, true, {});
        return out;
    }

    OpResult remove(const std::vector<std::string>& ids, const CancelToken*) override {
        std::lock_guard lock(mutex_);
        OpResult out;
        for (const auto& id : ids) {
            if (id == "0" || !nodes_.count(id)) {
                out.error = TransferError::make(ErrorCategory::NotFound, "remove", id,
                                                "file not found");
                return out;
            }
            remove_locked(id);
        }
        out.success = true;
        return out;
    }

    OpResult move(const std::vector<std::string>& ids, const std::string& to_parent_id,
                  const CancelToken*) override {
        std::lock_guard lock(mutex_);
        OpResult out;
        auto target = nodes_.find(to_parent_id);
        if (target == nodes_.end() || !target->second.entry.is_directory) {
            out.error = TransferError::make(ErrorCategory::NotFound, "move", to_parent_id,
                                            "target not found");
            return out;
        }
        for (const auto& id : ids) {
            auto it = nodes_.find(id);
            if (it == nodes_.end()) {
                out.error = TransferError::make(ErrorCategory::NotFound, "move", id,
                                                "file not found");
                return out;
            }
            if (!child_named_locked(to_parent_id, it->second.entry.name).empty()) {
                out.error = TransferError::make(ErrorCategory::Conflict, "move", id,
                                                "name already exists in target");
                return out;
            }
            it->second.entry.parent_id = to_parent_id;
        }
        out.success = true;
        return out;
    }

    OpResult rename(const std::string& id, const std::string& new_name,
                    const CancelToken*) override {
        std::lock_guard lock(mutex_);
        OpResult out;
        auto it = nodes_.find(id);
        if (it == nodes_.end()) {
            out.error = TransferError::make(ErrorCategory::NotFound, "rename", id,
                                            "file not found");
            return out;
        }
        if (!child_named_locked(it->second.entry.parent_id, new_name).empty()) {
            out.error = TransferError::make(ErrorCategory::Conflict, "rename", id,
                                            "name already exists");
            return out;
        }
        it->second.entry.name = new_name;
        out.success = true;
        return out;
    }

private:
    struct Pending {
        CreateSessionRequest request;
        std::map<uint64_t, std::string> chunks;
        std::string data;
        int polls_left = 0;
    };

    struct Failure {
        ErrorCategory category = ErrorCategory::Unknown;
        int remaining = 0;
    };

    std::string add_node_locked(const std::string& parent, const std::string& name, bool dir,
                                const std::string& data) {
        RemoteEntry e;
        e.id = std::to_string(next_id_++);
        e.name = name;
        e.parent_id = parent;
        e.size = data.size();
        e.hash = dir ? std::string() : md5(data);
        e.is_directory = dir;
        e.modified = now_epoch_seconds();
        nodes_[e.id] = Node{e, data};
        return e.id;
    }

    std::string child_named_locked(const std::string& parent, const std::string& name) const {
        for (const auto& [id, node] : nodes_) {
            if (id != "0" && node.entry.parent_id == parent && node.entry.name == name) return id;
        }
        return {};
    }

    void remove_locked(const std::string& id) {
        std::vector<std::string> children;
        for (const auto& [cid, node] : nodes_) {
            if (cid != "0" && node.entry.parent_id == id) children.push_back(cid);
        }
        for (const auto& c : children) remove_locked(c);
        nodes_.erase(id);
    }

    void finish_locked(Pending& p, CompleteResult& out) {
        out.completed = true;
        out.file_id = add_node_locked(p.request.parent_id, p.request.name, false, p.data);
        out.content_hash = p.request.content_hash;
    }

    std::mutex mutex_;
    std::map<std::string, Node> nodes_;
    std::map<std::string, Pending> sessions_;
    std::map<uint64_t, Failure> chunk_failures_;
    std::map<uint64_t, std::vector<std::chrono::steady_clock::time_point>> chunk_times_;
    int poll_failures_ = 0;
    uint64_t next_id_ = 100;
    uint64_t next_session_ = 1;
};

/// Open a provider session for `data` and upload every slice of it, so the
/// completion step can be exercised on its own.
static std::string stage_session(FakeRemote& remote, const std::string& name,
                                 const std::string& data, uint64_t chunk) {
    bool instant = remote.instant_enabled;
    remote.instant_enabled = false;
    auto created = remote.create_session({"0", name, data.size(), md5(data)}, nullptr);
    remote.instant_enabled = instant;
    if (!created.success) return {};
    for (uint64_t off = 0, i = 0; off < data.size(); off += chunk, ++i) {
        std::string slice = data.substr(off, chunk);
        auto bytes = to_bytes(slice);
        remote.upload_chunk(created.session_id, i, bytes, md5(slice), nullptr);
    }
    return created.session_id;
}

// ---------------------------------------------------------------------------
// Scripted HTTP transport
// ---------------------------------------------------------------------------

class ScriptedTransport : public net::HttpTransport {
public:
    struct Seen {
        net::HttpMethod method = net::HttpMethod::GET;
        std::string url;
        std::string authorization;
        std::optional<std::pair<uint64_t, uint64_t>> byte_range;
    };

    void push(int status, const std::string& body) {
        net::HttpResponse r;
        r.status_code = status;
        r.body.assign(body.begin(), body.end());
        std::lock_guard lock(mutex_);
        script_.push_back(std::move(r));
    }

    void push_network_error(const std::string& message) {
        net::HttpResponse r;
        r.error = message;
        r.is_network_error = true;
        std::lock_guard lock(mutex_);
        script_.push_back(std::move(r));
    }

    net::HttpResponse execute(const net::HttpRequest& request) override {
        std::lock_guard lock(mutex_);
        seen_.push_back(Seen{request.method, request.url,
                             request.headers.get("Authorization").value_or(""),
                             request.byte_range});
        if (script_.empty()) {
            net::HttpResponse r;
            r.status_code = 500;
            std::string body = "script exhausted";
            r.body.assign(body.begin(), body.end());
            return r;
        }
        net::HttpResponse r = std::move(script_.front());
        script_.pop_front();
        return r;
    }

    std::vector<Seen> seen() const {
        std::lock_guard lock(mutex_);
        return seen_;
    }

    size_t requests() const {
        std::lock_guard lock(mutex_);
        return seen_.size();
    }

private:
    mutable std::mutex mutex_;
    std::deque<net::HttpResponse> script_;
    std::vector<Seen> seen_;
};

/// {code: 0, data: ...} envelope.
static std::string ok(const std::string& data) {
    return R"({"code":0,"message":"ok","data":)" + data + "}";
}

/// HttpRemoteApi wired to a scripted transport with millisecond pacing.
struct ApiRig {
    EngineConfig config;
    ScriptedTransport transport;
    std::unique_ptr<RateLimiterRegistry> limiters;
    std::unique_ptr<RetryPolicy> retry;
    std::unique_ptr<TokenCredentialProvider> credentials;
    std::unique_ptr<HttpRemoteApi> api;

    ApiRig() {
        config.api_base_url = "https://api.test";
        config.upload_base_url = "https://upload.test";
        config.retry.base_delay = 1ms;
        config.retry.max_delay = 20ms;
        config.retry.jitter = 0.0;
        config.retry.rate_limit_delay = 150ms;
        config.retry.max_attempts = 4;
        config.pacer.list_min_sleep = 1ms;
        config.pacer.download_min_sleep = 1ms;
        config.pacer.upload_min_sleep = 1ms;
        config.pacer.strict_min_sleep = 1ms;
        config.pacer.batch_min_sleep = 1ms;
        config.pacer.token_min_sleep = 1ms;

        limiters = std::make_unique<RateLimiterRegistry>(config.pacer);
        retry = std::make_unique<RetryPolicy>(config.retry);
        credentials = std::make_unique<TokenCredentialProvider>(
            TokenCredentialProvider::Token{"stale", std::nullopt}, [] {
                return std::optional<TokenCredentialProvider::Token>(
                    TokenCredentialProvider::Token{"fresh", std::nullopt});
            });
        api = std::make_unique<HttpRemoteApi>(config, transport, *limiters, *retry, *credentials);
    }
};

/// Engine configuration scaled down to kilobyte chunks and millisecond polls.
static EngineConfig engine_config(const fs::path& dir) {
    EngineConfig c;
    c.state_dir = dir;
    c.upload.min_chunk_size = 512;
    c.upload.default_chunk_size = 1024;
    c.upload.max_chunk_size = 64 * KiB;
    c.upload.single_shot_limit = 0;
    c.upload.workers_per_session = 1;
    c.retry.base_delay = 1ms;
    c.retry.max_delay = 20ms;
    c.completion.step = 1ms;
    c.completion.plateau = 1ms;
    c.completion.late_start = 1ms;
    c.completion.max_interval = 2ms;
    c.cross_store.memory_limit = 1 * KiB;
    c.cross_store.hybrid_limit = 1 * MiB;
    c.cross_store.range_size = 1024;
    c.cross_store.range_readers = 3;
    c.cross_store.temp_dir = dir / "buffers";
    return c;
}

/// Chunk retry pacing for uploader tests: 30 ms doubling, no jitter.
static RetrySettings chunk_retry_settings() {
    RetrySettings s;
    s.base_delay = 30ms;
    s.max_delay = 200ms;
    s.jitter = 0.0;
    return s;
}

/// Upload settings matching engine_config().
static UploadSettings small_upload_settings() {
    UploadSettings s;
    s.min_chunk_size = 512;
    s.default_chunk_size = 1024;
    s.max_chunk_size = 64 * KiB;
    s.single_shot_limit = 0;
    s.workers_per_session = 1;
    return s;
}

// ---------------------------------------------------------------------------
// Path helpers and errors
// ---------------------------------------------------------------------------

static void test_remote_types() {
    std::cout << "\n=== Path Helpers and Errors ===" << std::endl;

    {
        TEST(normalize_path);
        ASSERT_EQ(normalize_path("/a//b/"), std::string("/a/b"), "double and trailing slash");
        ASSERT_EQ(normalize_path(""), std::string("/"), "empty is root");
        ASSERT_EQ(normalize_path("a/b"), std::string("/a/b"), "relative gets leading slash");
        PASS();
    }

    {
        TEST(parent_and_base_name);
        ASSERT_EQ(parent_path_of("/a/b.bin"), std::string("/a"), "nested parent");
        ASSERT_EQ(parent_path_of("/a"), std::string("/"), "top-level parent");
        ASSERT_EQ(base_name_of("/a/b.bin"), std::string("b.bin"), "base name");
        ASSERT_EQ(base_name_of("/"), std::string(""), "root has no base name");
        ASSERT_EQ(join_path("/", "x"), std::string("/x"), "join under root");
        ASSERT_EQ(join_path("/a", "x"), std::string("/a/x"), "join under dir");
        PASS();
    }

    {
        TEST(numbered_name_keeps_extension);
        ASSERT_EQ(numbered_name("report.pdf", 2), std::string("report (2).pdf"), "extension kept");
        ASSERT_EQ(numbered_name("README", 1), std::string("README (1)"), "no extension");
        ASSERT_EQ(numbered_name(".bashrc", 1), std::string(".bashrc (1)"), "leading dot");
        PASS();
    }

    {
        TEST(clean_file_name_replaces_forbidden);
        ASSERT_EQ(clean_file_name("a:b*c?.txt  "), std::string("a_b_c_.txt"), "forbidden and trailing spaces");
        ASSERT_EQ(clean_file_name("x\"y<z>|w"), std::string("x_y_z__w"), "quotes and brackets");
        ASSERT_EQ(clean_file_name(std::string(300, 'n')).size(), size_t(255), "capped at 255 bytes");
        PASS();
    }

    {
        TEST(error_to_string);
        auto e = TransferError::make(ErrorCategory::RateLimit, "upload", "/a/b.bin", "throttled");
        e.http_status = 429;
        e.attempts = 8;
        e.chunks_done = 3;
        e.chunks_total = 6;
        ASSERT_EQ(e.to_string(),
                  std::string("upload /a/b.bin: rate_limit after 8 attempts: HTTP 429 throttled (chunks 3/6)"),
                  "full form");

        auto c = TransferError::make(ErrorCategory::Permission, "upload_chunk", "pre-1", "denied");
        c.attempts = 1;
        c.failed_chunk = 4;
        ASSERT_EQ(c.to_string(), std::string("upload_chunk pre-1: permission_error: denied [chunk 4]"),
                  "single attempt omits count");
        ASSERT_TRUE(TransferError{}.empty(), "default error is empty");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

static std::optional<EngineConfig> parse_args(std::vector<std::string> args, int* first) {
    std::vector<char*> argv;
    static std::string prog = "panxfer";
    argv.push_back(prog.data());
    for (auto& a : args) argv.push_back(a.data());
    return EngineConfig::from_args(static_cast<int>(argv.size()), argv.data(), first);
}

static void test_config() {
    std::cout << "\n=== Configuration ===" << std::endl;

    auto dir = make_temp_dir("panxfer-config");

    {
        TEST(from_args_basic);
        int first = 0;
        auto c = parse_args({"--api-url", "https://api.example/", "--state-dir", dir.string(),
                             "--cache-ttl", "30", "--chunk-size-mb", "32", "--workers", "6",
                             "ls", "/docs"},
                            &first);
        ASSERT_TRUE(c.has_value(), "parse succeeded");
        ASSERT_EQ(c->api_base_url, std::string("https://api.example"), "trailing slash stripped");
        ASSERT_EQ(c->upload_base_url, std::string("https://api.example"), "upload url defaults to api");
        ASSERT_EQ(c->cache.listing_ttl.count(), 30000, "listing ttl from --cache-ttl");
        ASSERT_EQ(c->cache.path_ttl.count(), 30000, "path ttl from --cache-ttl");
        ASSERT_EQ(c->cache.parent_valid_ttl.count(), 30000, "parent ttl from --cache-ttl");
        ASSERT_EQ(c->upload.default_chunk_size, 32 * MiB, "chunk size in MiB");
        ASSERT_EQ(c->upload.workers_per_session, size_t(6), "workers");
        ASSERT_EQ(c->cache_db_path, dir / "kv", "derived kv path");
        ASSERT_EQ(c->ledger_path, dir / "ledger.db", "derived ledger path");
        ASSERT_EQ(c->cross_store.temp_dir, dir / "buffers", "derived temp dir");
        ASSERT_EQ(first, 11, "first positional is the command");
        PASS();
    }

    {
        TEST(from_args_rejects_bad_input);
        int first = 0;
        ASSERT_TRUE(!parse_args({"--no-such-flag"}, &first).has_value(), "unknown option");
        ASSERT_TRUE(!parse_args({"--workers", "many"}, &first).has_value(), "bad number");
        ASSERT_TRUE(!parse_args({"--workers"}, &first).has_value(), "missing value");
        PASS();
    }

    {
        TEST(env_fills_unset_values_only);
        setenv("PANXFER_ACCESS_TOKEN", "from-env", 1);
        int first = 0;
        auto with_flag = parse_args({"--state-dir", dir.string(), "--access-token", "from-cli"}, &first);
        auto without = parse_args({"--state-dir", dir.string()}, &first);
        unsetenv("PANXFER_ACCESS_TOKEN");
        ASSERT_TRUE(with_flag && without, "both parsed");
        ASSERT_EQ(with_flag->access_token, std::string("from-cli"), "command line wins");
        ASSERT_EQ(without->access_token, std::string("from-env"), "env fills the gap");
        PASS();
    }

    {
        TEST(load_json_overlays_values);
        auto path = dir / "config.json";
        write_file(path, R"({
            "root_id": "42",
            "retry": {"base_delay_ms": 250, "max_attempts": 5, "jitter": 0.1},
            "cache": {"listing_ttl_ms": 1500, "list_page_size": 50},
            "upload": {"min_chunk_size": 1048576, "workers_per_session": 3},
            "completion": {"step_ms": 400},
            "cross_store": {"memory_limit": 2048, "temp_dir": "/tmp/stage"}
        })");
        EngineConfig c;
        ASSERT_TRUE(c.load_json(path), "load succeeded");
        ASSERT_EQ(c.root_id, std::string("42"), "root id");
        ASSERT_EQ(c.retry.base_delay.count(), 250, "base delay");
        ASSERT_EQ(c.retry.max_attempts, 5, "max attempts");
        ASSERT_EQ(c.cache.listing_ttl.count(), 1500, "listing ttl");
        ASSERT_EQ(c.cache.list_page_size, size_t(50), "page size");
        ASSERT_EQ(c.upload.min_chunk_size, MiB, "min chunk");
        ASSERT_EQ(c.upload.workers_per_session, size_t(3), "workers");
        ASSERT_EQ(c.completion.step.count(), 400, "completion step");
        ASSERT_EQ(c.cross_store.memory_limit, uint64_t(2048), "memory limit");
        ASSERT_EQ(c.cross_store.temp_dir, fs::path("/tmp/stage"), "temp dir");
        ASSERT_EQ(c.upload.max_chunk_size, 512 * MiB, "untouched value keeps default");
        PASS();
    }

    {
        TEST(load_json_rejects_malformed);
        auto path = dir / "broken.json";
        write_file(path, "{ not json");
        EngineConfig c;
        ASSERT_TRUE(!c.load_json(path), "parse failure reported");
        ASSERT_TRUE(!c.load_json(dir / "missing.json"), "missing file reported");
        PASS();
    }

    {
        TEST(validate_messages);
        EngineConfig c;
        c.state_dir = dir;
        ASSERT_EMPTY(c.validate(), "defaults are valid");

        auto bad = c;
        bad.root_id.clear();
        ASSERT_EQ(bad.validate(), std::string("root_id must not be empty"), "root id");

        bad = c;
        bad.upload.min_chunk_size = 1 * GiB;
        ASSERT_EQ(bad.validate(), std::string("min_chunk_size must be <= max_chunk_size"), "chunk bounds");

        bad = c;
        bad.retry.jitter = 1.0;
        ASSERT_EQ(bad.validate(), std::string("retry jitter must lie within [0, 1)"), "jitter");

        bad = c;
        bad.cross_store.memory_limit = 2 * GiB;
        ASSERT_EQ(bad.validate(), std::string("cross_store memory_limit must be <= hybrid_limit"),
                  "cross-store limits");

        bad = c;
        bad.state_dir.clear();
        ASSERT_TRUE(bad.validate().find("state_dir is required") == 0, "state dir required");
        PASS();
    }

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Pacer and endpoint table
// ---------------------------------------------------------------------------

static void test_pacer() {
    std::cout << "\n=== Pacer ===" << std::endl;

    {
        TEST(spaces_requests_by_min_sleep);
        Pacer pacer(PacerClass{EndpointClass::List, 20ms, 1000ms, 2});
        auto start = std::chrono::steady_clock::now();
        for (int i = 0; i < 4; ++i) ASSERT_TRUE(pacer.acquire(), "permit granted");
        ASSERT_TRUE(elapsed_ms(start) >= 55, "three gaps of ~20ms");
        ASSERT_EQ(pacer.permits_granted(), uint64_t(4), "permit count");
        PASS();
    }

    {
        TEST(rate_limit_forces_wait);
        Pacer pacer(PacerClass{EndpointClass::Upload, 5ms, 1000ms, 2});
        ASSERT_TRUE(pacer.acquire(), "first permit");
        pacer.on_rate_limited(200ms);
        auto start = std::chrono::steady_clock::now();
        ASSERT_TRUE(pacer.acquire(), "permit after hold");
        ASSERT_TRUE(elapsed_ms(start) >= 190, "held for the forced minimum");
        ASSERT_EQ(pacer.rate_limit_signals(), uint64_t(1), "signal counted");
        PASS();
    }

    {
        TEST(backoff_doubles_and_success_decays);
        Pacer pacer(PacerClass{EndpointClass::Strict, 20ms, 1000ms, 2});
        ASSERT_EQ(pacer.current_sleep().count(), 20, "starts at min");
        pacer.on_backoff();
        ASSERT_EQ(pacer.current_sleep().count(), 40, "doubled");
        pacer.on_backoff();
        ASSERT_EQ(pacer.current_sleep().count(), 80, "doubled again");
        pacer.on_success();
        ASSERT_EQ(pacer.current_sleep().count(), 60, "decayed by a quarter");
        pacer.on_success();
        ASSERT_EQ(pacer.current_sleep().count(), 45, "decayed again");
        for (int i = 0; i < 20; ++i) pacer.on_success();
        ASSERT_EQ(pacer.current_sleep().count(), 20, "floored at min");
        for (int i = 0; i < 20; ++i) pacer.on_backoff();
        ASSERT_EQ(pacer.current_sleep().count(), 1000, "capped at max");
        PASS();
    }

    {
        TEST(cancelled_wait_returns_false);
        Pacer pacer(PacerClass{EndpointClass::Batch, 500ms, 1000ms, 2});
        ASSERT_TRUE(pacer.acquire(), "first permit is immediate");
        CancelToken cancel;
        std::thread t([&] {
            std::this_thread::sleep_for(30ms);
            cancel.cancel();
        });
        auto start = std::chrono::steady_clock::now();
        bool granted = pacer.acquire(&cancel);
        t.join();
        ASSERT_TRUE(!granted, "cancelled wait refused");
        ASSERT_TRUE(elapsed_ms(start) < 400, "returned before the slot");
        PASS();
    }

    {
        TEST(endpoint_routing);
        RateLimiterRegistry reg{PacerSettings{}};
        auto cls = [&](const char* ep) { return std::string(endpoint_class_name(reg.classify_endpoint(ep))); };
        auto name = [](EndpointClass c) { return std::string(endpoint_class_name(c)); };
        ASSERT_EQ(cls("/api/v2/file/list"), name(EndpointClass::List), "list");
        ASSERT_EQ(cls("/api/v1/file/detail"), name(EndpointClass::List), "detail");
        ASSERT_EQ(cls("/upload/v2/file/slice"), name(EndpointClass::Upload), "slice");
        ASSERT_EQ(cls("/upload/v2/file/upload_complete"), name(EndpointClass::Download), "complete");
        ASSERT_EQ(cls("/upload/v1/file/upload_async_result"), name(EndpointClass::Download), "poll");
        ASSERT_EQ(cls("/api/v1/file/download_info"), name(EndpointClass::Download), "download info");
        ASSERT_EQ(cls("/upload/v2/file/create"), name(EndpointClass::Strict), "create");
        ASSERT_EQ(cls("/upload/v1/file/mkdir"), name(EndpointClass::Strict), "mkdir");
        ASSERT_EQ(cls("/api/v1/file/delete"), name(EndpointClass::Batch), "delete");
        ASSERT_EQ(cls("/api/v1/access_token"), name(EndpointClass::Token), "token");
        ASSERT_TRUE(!RateLimiterRegistry::lookup_endpoint("/api/v9/unknown").has_value(), "unknown lookup");
        ASSERT_EQ(cls("/api/v9/unknown"), name(EndpointClass::Batch), "unknown maps to strictest");
        ASSERT_EQ(name(reg.strictest()), name(EndpointClass::Batch), "strictest class");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Retry policy
// ---------------------------------------------------------------------------

static void test_retry_policy() {
    std::cout << "\n=== Retry Policy ===" << std::endl;

    RetrySettings s;
    s.base_delay = 100ms;
    s.multiplier = 2.0;
    s.max_delay = 1000ms;
    s.rate_limit_delay = 500ms;
    s.max_attempts = 5;
    s.jitter = 0.0;
    RetryPolicy policy(s);

    {
        TEST(categorize_table);
        auto cat = [](int status, const char* msg, bool net = false) {
            return str(RetryPolicy::categorize(AttemptFailure{msg, status, net}));
        };
        ASSERT_EQ(cat(429, ""), str(ErrorCategory::RateLimit), "429");
        ASSERT_EQ(cat(0, "rate limit exceeded"), str(ErrorCategory::RateLimit), "rate text");
        ASSERT_EQ(cat(401, ""), str(ErrorCategory::Auth), "401");
        ASSERT_EQ(cat(403, ""), str(ErrorCategory::Permission), "403");
        ASSERT_EQ(cat(409, ""), str(ErrorCategory::Conflict), "409");
        ASSERT_EQ(cat(0, "file already exists"), str(ErrorCategory::Conflict), "exists text");
        ASSERT_EQ(cat(404, ""), str(ErrorCategory::NotFound), "404");
        ASSERT_EQ(cat(0, "url expired"), str(ErrorCategory::UrlExpired), "expired url");
        ASSERT_EQ(cat(503, ""), str(ErrorCategory::ServerOverload), "503");
        ASSERT_EQ(cat(0, "connection reset by peer", true), str(ErrorCategory::NetworkTimeout), "reset");
        ASSERT_EQ(cat(418, "teapot"), str(ErrorCategory::Unknown), "other");
        PASS();
    }

    {
        TEST(classify_retryability_and_delay);
        auto rl = policy.classify(AttemptFailure{"", 429, false}, 0);
        ASSERT_TRUE(rl.retryable, "rate limit retryable");
        ASSERT_EQ(rl.delay.count(), 500, "rate limit waits the forced minimum");
        auto rl_late = policy.classify(AttemptFailure{"", 429, false}, 3);
        ASSERT_EQ(rl_late.delay.count(), 800, "backoff exceeds the forced minimum");

        auto auth = policy.classify(AttemptFailure{"", 401, false}, 0);
        ASSERT_TRUE(auth.retryable, "auth retried after refresh");
        ASSERT_EQ(auth.delay.count(), 0, "auth retry is immediate");

        ASSERT_TRUE(!policy.classify(AttemptFailure{"", 403, false}, 0).retryable, "403 fatal");
        ASSERT_TRUE(!policy.classify(AttemptFailure{"", 404, false}, 0).retryable, "404 fatal");

        auto overload = policy.classify(AttemptFailure{"", 502, false}, 2);
        ASSERT_TRUE(overload.retryable, "5xx retryable");
        ASSERT_EQ(overload.delay.count(), 400, "exponential backoff");

        auto capped = policy.classify(AttemptFailure{"", 500, false}, 3);
        ASSERT_EQ(capped.delay.count(), 800, "still under cap");
        ASSERT_EQ(policy.backoff_delay(6).count(), 1000, "capped at max_delay");

        ASSERT_TRUE(!policy.classify(AttemptFailure{"", 503, false}, 4).retryable,
                    "attempt budget exhausted");
        ASSERT_TRUE(!policy.classify(AttemptFailure{"teapot", 418, false}, 0).retryable,
                    "unknown 4xx not retried");
        ASSERT_TRUE(policy.classify(AttemptFailure{"weird", 0, true}, 0).retryable,
                    "unknown network error retried");
        PASS();
    }

    {
        TEST(delay_by_category);
        ASSERT_EQ(policy.delay_for(ErrorCategory::ServerOverload, 0).count(), 100, "first retry");
        ASSERT_EQ(policy.delay_for(ErrorCategory::NetworkTimeout, 1).count(), 200, "second retry");
        ASSERT_EQ(policy.delay_for(ErrorCategory::DataIntegrity, 2).count(), 400, "integrity");
        ASSERT_EQ(policy.delay_for(ErrorCategory::RateLimit, 0).count(), 500, "forced minimum");
        ASSERT_EQ(policy.delay_for(ErrorCategory::Auth, 3).count(), 0, "auth immediate");
        PASS();
    }

    {
        TEST(jitter_stays_in_band);
        RetrySettings js = s;
        js.jitter = 0.2;
        RetryPolicy jittered(js);
        for (int i = 0; i < 200; ++i) {
            auto d = jittered.backoff_delay(0).count();
            ASSERT_TRUE(d >= 80 && d <= 120, "delay within +/-20%");
        }
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Credentials
// ---------------------------------------------------------------------------

static void test_credentials() {
    std::cout << "\n=== Credentials ===" << std::endl;

    auto now = std::chrono::system_clock::now();
    auto refresher = [] {
        return std::optional<TokenCredentialProvider::Token>(
            TokenCredentialProvider::Token{"fresh", std::chrono::system_clock::now() + std::chrono::hours(2)});
    };

    {
        TEST(no_refresh_far_from_expiry);
        TokenCredentialProvider p({"current", now + std::chrono::hours(1)}, refresher);
        ASSERT_TRUE(p.ensure_valid(), "valid");
        ASSERT_EQ(p.bearer_token(), std::string("current"), "token unchanged");
        ASSERT_EQ(p.refresh_count(), uint64_t(0), "no refresh");
        PASS();
    }

    {
        TEST(refresh_within_margin);
        TokenCredentialProvider p({"current", now + std::chrono::seconds(60)}, refresher);
        ASSERT_TRUE(p.ensure_valid(), "valid after refresh");
        ASSERT_EQ(p.bearer_token(), std::string("fresh"), "token replaced");
        ASSERT_EQ(p.refresh_count(), uint64_t(1), "one refresh");
        PASS();
    }

    {
        TEST(expired_without_refresher_fails);
        TokenCredentialProvider p({"old", now - std::chrono::seconds(1)});
        ASSERT_TRUE(!p.ensure_valid(), "expired token rejected");
        ASSERT_TRUE(!p.force_refresh(), "no refresher");

        TokenCredentialProvider soon({"soon", now + std::chrono::seconds(60)});
        ASSERT_TRUE(soon.ensure_valid(), "near expiry but still usable");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// HttpRemoteApi
// ---------------------------------------------------------------------------

static void test_http_remote_api() {
    std::cout << "\n=== HttpRemoteApi ===" << std::endl;

    {
        TEST(list_parses_entries);
        ApiRig rig;
        rig.transport.push(200, ok(R"({"lastFileId":-1,"fileList":[
            {"fileId":11,"filename":"a.bin","parentFileId":0,"type":0,"size":5,
             "etag":"ABCDEF0123456789ABCDEF0123456789","updateAt":"2024-05-01 12:30:00","trashed":0},
            {"fileId":12,"filename":"docs","parentFileId":0,"type":1,"size":0,"etag":"","trashed":0},
            {"fileId":13,"filename":"gone.txt","parentFileId":0,"type":0,"size":1,"etag":"x","trashed":1}
        ]})"));
        auto r = rig.api->list_children("0", "", 100, nullptr);
        ASSERT_TRUE(r.success, "list succeeded: " + r.error.to_string());
        ASSERT_EQ(r.entries.size(), size_t(2), "trashed entry skipped");
        ASSERT_EQ(r.entries[0].id, std::string("11"), "numeric id as string");
        ASSERT_EQ(r.entries[0].hash, std::string("abcdef0123456789abcdef0123456789"), "etag lowercased");
        ASSERT_EQ(r.entries[0].modified, int64_t(1714566600), "timestamp parsed as UTC");
        ASSERT_TRUE(r.entries[1].is_directory, "type 1 is a directory");
        ASSERT_EMPTY(r.next_page_token, "-1 is the terminal cursor");
        auto seen = rig.transport.seen();
        ASSERT_EQ(seen[0].url, std::string("https://api.test/api/v2/file/list?parentFileId=0&limit=100"),
                  "list url");
        ASSERT_EQ(seen[0].authorization, std::string("Bearer stale"), "bearer token sent");
        PASS();
    }

    {
        TEST(rate_limit_waits_before_retry);
        ApiRig rig;
        rig.transport.push(429, "too many requests");
        rig.transport.push(200, ok(R"({"lastFileId":-1,"fileList":[]})"));
        auto start = std::chrono::steady_clock::now();
        auto r = rig.api->list_children("0", "", 100, nullptr);
        ASSERT_TRUE(r.success, "succeeded after throttle");
        ASSERT_TRUE(elapsed_ms(start) >= 140, "pacer held the retry");
        ASSERT_EQ(rig.api->stats().rate_limited, uint64_t(1), "rate limit counted");
        ASSERT_EQ(rig.transport.requests(), size_t(2), "one retry");
        PASS();
    }

    {
        TEST(unauthorized_refreshes_once);
        ApiRig rig;
        rig.transport.push(401, "unauthorized");
        rig.transport.push(200, ok(R"({"lastFileId":-1,"fileList":[]})"));
        auto r = rig.api->list_children("0", "", 100, nullptr);
        ASSERT_TRUE(r.success, "succeeded after refresh");
        auto seen = rig.transport.seen();
        ASSERT_EQ(seen[1].authorization, std::string("Bearer fresh"), "retry carries new token");
        ASSERT_EQ(rig.api->stats().auth_refreshes, uint64_t(1), "one refresh");

        ApiRig twice;
        twice.transport.push(401, "unauthorized");
        twice.transport.push(401, "unauthorized");
        auto r2 = twice.api->list_children("0", "", 100, nullptr);
        ASSERT_TRUE(!r2.success, "second 401 surfaces");
        ASSERT_EQ(str(r2.error.category), str(ErrorCategory::Auth), "auth error");
        ASSERT_EQ(twice.transport.requests(), size_t(2), "no third attempt");
        PASS();
    }

    {
        TEST(forbidden_is_not_retried);
        ApiRig rig;
        rig.transport.push(403, "forbidden");
        auto r = rig.api->get_entry("7", nullptr);
        ASSERT_TRUE(!r.success, "failed");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::Permission), "permission error");
        ASSERT_EQ(r.error.http_status, 403, "status kept");
        ASSERT_EQ(rig.transport.requests(), size_t(1), "single request");
        PASS();
    }

    {
        TEST(server_errors_retry_with_backoff);
        ApiRig rig;
        rig.transport.push(503, "unavailable");
        rig.transport.push(502, "bad gateway");
        rig.transport.push(200, ok(R"({"fileId":7,"filename":"x","parentFileId":0,"size":3,"etag":"aa","type":0})"));
        auto r = rig.api->get_entry("7", nullptr);
        ASSERT_TRUE(r.success, "succeeded on third attempt");
        ASSERT_EQ(r.entry.name, std::string("x"), "entry parsed");
        ASSERT_EQ(rig.transport.requests(), size_t(3), "three requests");
        ASSERT_EQ(rig.api->stats().retries, uint64_t(2), "two retries");
        PASS();
    }

    {
        TEST(network_errors_exhaust_attempts);
        ApiRig rig;
        for (int i = 0; i < 4; ++i) rig.transport.push_network_error("connection reset by peer");
        auto r = rig.api->get_entry("7", nullptr);
        ASSERT_TRUE(!r.success, "failed");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::NetworkTimeout), "network category");
        ASSERT_EQ(r.error.attempts, 4, "all attempts used");
        PASS();
    }

    {
        TEST(envelope_error_code);
        ApiRig rig;
        rig.transport.push(200, R"({"code":1,"message":"file not found","data":null})");
        auto r = rig.api->get_entry("9", nullptr);
        ASSERT_TRUE(!r.success, "failed");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::NotFound), "not found from message");
        ASSERT_TRUE(r.error.message.find("API error 1") == 0, "envelope code in message");
        ASSERT_EQ(rig.transport.requests(), size_t(1), "not retried");
        PASS();
    }

    {
        TEST(create_session_reuse_and_preupload);
        ApiRig rig;
        rig.transport.push(200, ok(R"({"fileID":77,"reuse":true})"));
        auto reused = rig.api->create_session({"0", "a.bin", 10, md5("0123456789")}, nullptr);
        ASSERT_TRUE(reused.success, "create succeeded");
        ASSERT_TRUE(reused.reused, "reuse flag");
        ASSERT_EQ(reused.file_id, std::string("77"), "file id");

        rig.transport.push(200, ok(R"({"reuse":false,"preuploadID":"pre-abc","sliceSize":16777216})"));
        auto fresh = rig.api->create_session({"0", "b.bin", 10, md5("abcdefghij")}, nullptr);
        ASSERT_TRUE(fresh.success, "create succeeded");
        ASSERT_TRUE(!fresh.reused, "not reused");
        ASSERT_EQ(fresh.session_id, std::string("pre-abc"), "preupload id");
        ASSERT_EQ(fresh.slice_size, 16 * MiB, "slice size");

        rig.transport.push(200, ok(R"({"reuse":false})"));
        auto broken = rig.api->create_session({"0", "c.bin", 1, md5("c")}, nullptr);
        ASSERT_TRUE(!broken.success, "neither reuse nor session is an error");
        auto seen = rig.transport.seen();
        ASSERT_EQ(seen[0].url, std::string("https://api.test/upload/v2/file/create"), "create on api domain");
        PASS();
    }

    {
        TEST(chunk_upload_single_attempt);
        ApiRig rig;
        rig.transport.push(500, "internal error");
        auto data = to_bytes("slice-bytes");
        auto r = rig.api->upload_chunk("pre-1", 0, data, md5("slice-bytes"), nullptr);
        ASSERT_TRUE(!r.success, "failed");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::ServerOverload), "server overload");
        ASSERT_EQ(rig.transport.requests(), size_t(1), "chunk retries belong to the uploader");
        auto seen = rig.transport.seen();
        ASSERT_EQ(seen[0].url, std::string("https://upload.test/upload/v2/file/slice"), "upload domain");
        PASS();
    }

    {
        TEST(read_range_caches_download_url);
        ApiRig rig;
        rig.transport.push(200, ok(R"({"downloadUrl":"https://cdn.test/f1?sig=a"})"));
        rig.transport.push(206, "hello");
        rig.transport.push(206, "world");
        auto first = rig.api->read_range("f1", 0, 5, nullptr);
        auto second = rig.api->read_range("f1", 5, 5, nullptr);
        ASSERT_TRUE(first.success && second.success, "both reads succeeded");
        ASSERT_EQ(std::string(second.data.begin(), second.data.end()), std::string("world"), "body");
        auto seen = rig.transport.seen();
        ASSERT_EQ(seen.size(), size_t(3), "download info fetched once");
        ASSERT_EQ(seen[2].url, std::string("https://cdn.test/f1?sig=a"), "signed url used as-is");
        ASSERT_EMPTY(seen[2].authorization, "no bearer on signed url");
        ASSERT_TRUE(seen[2].byte_range.has_value(), "range requested");
        ASSERT_EQ(seen[2].byte_range->first, uint64_t(5), "range start");
        ASSERT_EQ(seen[2].byte_range->second, uint64_t(9), "range end inclusive");
        PASS();
    }

    {
        TEST(read_range_refreshes_rejected_url);
        ApiRig rig;
        rig.transport.push(200, ok(R"({"downloadUrl":"https://cdn.test/f1?sig=old"})"));
        rig.transport.push(403, "signature expired");
        rig.transport.push(200, ok(R"({"downloadUrl":"https://cdn.test/f1?sig=new"})"));
        rig.transport.push(206, "hello");
        auto r = rig.api->read_range("f1", 0, 5, nullptr);
        ASSERT_TRUE(r.success, "succeeded with new url: " + r.error.to_string());
        auto seen = rig.transport.seen();
        ASSERT_EQ(seen.size(), size_t(4), "url fetched twice");
        ASSERT_EQ(seen[3].url, std::string("https://cdn.test/f1?sig=new"), "fresh url used");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// KvStore
// ---------------------------------------------------------------------------

static void test_kv_store() {
    std::cout << "\n=== KvStore ===" << std::endl;

    {
        TEST(memory_ttl_and_purge);
        MemoryKvStore kv;
        ASSERT_TRUE(kv.set("short", "x", 30ms), "set short");
        ASSERT_TRUE(kv.set("long", "y", 60000ms), "set long");
        ASSERT_TRUE(kv.set("forever", "z", 0ms), "set without expiry");
        std::this_thread::sleep_for(60ms);
        ASSERT_EQ(kv.purge_expired(), size_t(1), "one expired entry purged");
        ASSERT_EQ(kv.size(), size_t(2), "two left");
        ASSERT_TRUE(!kv.get("short").has_value(), "expired value gone");
        ASSERT_EQ(kv.get("forever").value_or(""), std::string("z"), "no-expiry value kept");
        PASS();
    }

    {
        TEST(memory_expired_get_misses);
        MemoryKvStore kv;
        kv.set("k", "v", 20ms);
        std::this_thread::sleep_for(40ms);
        ASSERT_TRUE(!kv.get("k").has_value(), "miss after expiry");
        ASSERT_EQ(kv.size(), size_t(0), "expired entry erased on read");
        PASS();
    }

    {
        TEST(memory_prefix_operations);
        MemoryKvStore kv;
        kv.set("ls/5/", "a", 60000ms);
        kv.set("ls/5/cur", "b", 60000ms);
        kv.set("ls/6/", "c", 60000ms);
        kv.set("pv/5", "1", 60000ms);
        auto keys = kv.keys_with_prefix("ls/5/");
        ASSERT_EQ(keys.size(), size_t(2), "two keys under prefix");
        ASSERT_EQ(kv.remove_prefix("ls/"), size_t(3), "three removed");
        ASSERT_EQ(kv.get("pv/5").value_or(""), std::string("1"), "other namespace untouched");
        ASSERT_TRUE(kv.clear(), "clear");
        ASSERT_EQ(kv.size(), size_t(0), "empty after clear");
        PASS();
    }

    {
        TEST(lmdb_persists_across_reopen);
        auto dir = make_temp_dir("panxfer-lmdb");
        {
            LmdbKvStore kv(dir / "kv", 64);
            ASSERT_TRUE(kv.set("path//a/b", R"({"id":"9"})", 60000ms), "set");
            ASSERT_TRUE(kv.set("pv/9", "1", 60000ms), "set");
            ASSERT_EQ(kv.entry_count(), uint64_t(2), "two entries");
        }
        {
            LmdbKvStore kv(dir / "kv", 64);
            ASSERT_EQ(kv.get("pv/9").value_or(""), std::string("1"), "value survived reopen");
            ASSERT_TRUE(kv.remove("pv/9"), "remove");
            ASSERT_TRUE(!kv.get("pv/9").has_value(), "removed");
            ASSERT_EQ(kv.entry_count(), uint64_t(1), "one left");
        }
        fs::remove_all(dir);
        PASS();
    }

    {
        TEST(lmdb_ttl_and_prefix);
        auto dir = make_temp_dir("panxfer-lmdb");
        LmdbKvStore kv(dir / "kv", 64);
        kv.set("ls/1/", "a", 20ms);
        kv.set("ls/1/x", "b", 60000ms);
        kv.set("ls/2/", "c", 60000ms);
        std::this_thread::sleep_for(40ms);
        auto keys = kv.keys_with_prefix("ls/1/");
        ASSERT_EQ(keys.size(), size_t(1), "expired key not listed");
        ASSERT_EQ(kv.purge_expired(), size_t(1), "expired purged");
        ASSERT_TRUE(!kv.get("ls/1/").has_value(), "expired miss");
        ASSERT_EQ(kv.remove_prefix("ls/"), size_t(2), "prefix removed");
        ASSERT_EQ(kv.entry_count(), uint64_t(0), "empty");
        fs::remove_all(dir);
        PASS();
    }
}

// ---------------------------------------------------------------------------
// MetadataCache
// ---------------------------------------------------------------------------

static RemoteEntry entry(const std::string& id, const std::string& name, bool dir = false) {
    RemoteEntry e;
    e.id = id;
    e.name = name;
    e.parent_id = "5";
    e.is_directory = dir;
    e.size = dir ? 0 : 10;
    e.hash = dir ? "" : md5(name);
    return e;
}

static void test_metadata_cache() {
    std::cout << "\n=== MetadataCache ===" << std::endl;

    CacheSettings settings;

    {
        TEST(parent_validity_positive_and_negative);
        MemoryKvStore kv;
        MetadataCache cache(kv, settings);
        ASSERT_TRUE(!cache.parent_valid("5").has_value(), "unknown at first");
        cache.set_parent_valid("5", true);
        cache.set_parent_valid("6", false);
        ASSERT_TRUE(cache.parent_valid("5").value_or(false), "positive answer");
        ASSERT_TRUE(!cache.parent_valid("6").value_or(true), "negative answer cached");
        auto s = cache.stats();
        ASSERT_EQ(s.hits, uint64_t(2), "two hits");
        ASSERT_EQ(s.misses, uint64_t(1), "one miss");
        PASS();
    }

    {
        TEST(entries_expire);
        MemoryKvStore kv;
        CacheSettings quick = settings;
        quick.listing_ttl = 30ms;
        quick.parent_valid_ttl = 30ms;
        MetadataCache cache(kv, quick);
        cache.set_parent_valid("5", true);
        cache.set_listing("5", "", ListingPage{{entry("11", "a")}, ""});
        ASSERT_TRUE(cache.listing("5", "").has_value(), "fresh listing");
        std::this_thread::sleep_for(60ms);
        ASSERT_TRUE(!cache.listing("5", "").has_value(), "listing expired");
        ASSERT_TRUE(!cache.parent_valid("5").has_value(), "validity expired");
        PASS();
    }

    {
        TEST(listing_round_trip_keeps_fields);
        MemoryKvStore kv;
        MetadataCache cache(kv, settings);
        auto dir = entry("12", "docs", true);
        dir.modified = 1700000000;
        cache.set_listing("5", "cur-1", ListingPage{{entry("11", "a"), dir}, "cur-2"});
        auto page = cache.listing("5", "cur-1");
        ASSERT_TRUE(page.has_value(), "hit");
        ASSERT_EQ(page->entries.size(), size_t(2), "two entries");
        ASSERT_EQ(page->next_cursor, std::string("cur-2"), "cursor kept");
        ASSERT_TRUE(page->entries[1].is_directory, "directory flag");
        ASSERT_EQ(page->entries[1].modified, int64_t(1700000000), "mtime");
        ASSERT_EQ(page->entries[0].hash, md5("a"), "hash");
        ASSERT_TRUE(kv.get("ls/5/cur-1").has_value(), "stored under listing namespace");
        PASS();
    }

    {
        TEST(mutation_invalidates_related_entries);
        MemoryKvStore kv;
        MetadataCache cache(kv, settings);
        cache.set_listing("5", "", ListingPage{{entry("9", "b", true)}, ""});
        cache.set_listing("5", "next", ListingPage{{}, ""});
        cache.set_listing("9", "", ListingPage{{entry("20", "c")}, ""});
        cache.set_listing("7", "", ListingPage{{}, ""});
        cache.set_parent_valid("9", true);
        cache.set_path("/a", PathEntry{"5", true, "0"});
        cache.set_path("/a/b", PathEntry{"9", true, "5"});
        cache.set_path("/a/b/c", PathEntry{"20", false, "9"});
        cache.set_path("/z", PathEntry{"7", true, "0"});

        cache.invalidate_mutation("/a/b", "5", "9");

        ASSERT_TRUE(!cache.listing("5", "").has_value(), "parent listing dropped");
        ASSERT_TRUE(!cache.listing("5", "next").has_value(), "every parent page dropped");
        ASSERT_TRUE(!cache.listing("9", "").has_value(), "object listing dropped");
        ASSERT_TRUE(!cache.parent_valid("9").has_value(), "object validity dropped");
        ASSERT_TRUE(!cache.path("/a/b").has_value(), "path dropped");
        ASSERT_TRUE(!cache.path("/a/b/c").has_value(), "descendant path dropped");
        ASSERT_TRUE(!cache.path("/a").has_value(), "parent path dropped");
        ASSERT_TRUE(cache.listing("7", "").has_value(), "unrelated listing kept");
        ASSERT_TRUE(cache.path("/z").has_value(), "unrelated path kept");
        ASSERT_EQ(cache.generation(), uint64_t(1), "generation bumped");
        PASS();
    }

    {
        TEST(stale_fill_is_discarded);
        MemoryKvStore kv;
        MetadataCache cache(kv, settings);
        uint64_t observed = cache.generation();
        cache.invalidate_mutation("/a/x", "5");
        ASSERT_TRUE(!cache.set_listing("5", "", ListingPage{{entry("11", "a")}, ""}, observed),
                    "listing fill refused");
        ASSERT_TRUE(!cache.set_path("/a/x", PathEntry{"11", false, "5"}, observed),
                    "path fill refused");
        ASSERT_TRUE(!cache.listing("5", "").has_value(), "nothing stored");
        ASSERT_TRUE(cache.set_listing("5", "", ListingPage{{}, ""}, cache.generation()),
                    "current generation accepted");
        PASS();
    }

    {
        TEST(corrupt_entries_are_evicted);
        MemoryKvStore kv;
        MetadataCache cache(kv, settings);
        kv.set("ls/5/", "{not json", 60000ms);
        kv.set("pv/5", "maybe", 60000ms);
        kv.set("path//q", "[1,2]", 60000ms);
        ASSERT_TRUE(!cache.listing("5", "").has_value(), "corrupt listing is a miss");
        ASSERT_TRUE(!cache.parent_valid("5").has_value(), "corrupt validity is a miss");
        ASSERT_TRUE(!cache.path("/q").has_value(), "corrupt path is a miss");
        ASSERT_TRUE(!kv.get("ls/5/").has_value(), "listing evicted");
        ASSERT_TRUE(!kv.get("pv/5").has_value(), "validity evicted");
        ASSERT_EQ(cache.stats().corrupt, uint64_t(3), "three corrupt entries");
        PASS();
    }

    {
        TEST(checksum_detects_tampering);
        MemoryKvStore kv;
        CacheSettings strict = settings;
        strict.listing_checksum_threshold = 0;
        MetadataCache cache(kv, strict);
        cache.set_listing("5", "", ListingPage{{entry("11", "a"), entry("12", "b")}, ""});
        ASSERT_TRUE(cache.listing("5", "").has_value(), "intact page verifies");

        auto j = nlohmann::json::parse(*kv.get("ls/5/"));
        j["s"] = std::string(16, '0');
        kv.set("ls/5/", j.dump(), 60000ms);
        ASSERT_TRUE(!cache.listing("5", "").has_value(), "tampered page rejected");
        ASSERT_EQ(cache.stats().corrupt, uint64_t(1), "counted as corrupt");

        cache.set_listing("5", "", ListingPage{{entry("11", "a")}, ""});
        auto k = nlohmann::json::parse(*kv.get("ls/5/"));
        k["c"] = 5;
        kv.set("ls/5/", k.dump(), 60000ms);
        ASSERT_TRUE(!cache.listing("5", "").has_value(), "count mismatch rejected");
        PASS();
    }

    {
        TEST(list_all_children_pages_through_cache);
        MemoryKvStore kv;
        MetadataCache cache(kv, settings);
        FakeRemote remote;
        for (int i = 0; i < 5; ++i) remote.add_file("0", "f" + std::to_string(i), pattern(10, i));
        auto r = list_all_children(remote, cache, "0", 2, nullptr);
        ASSERT_TRUE(r.success, "listing succeeded");
        ASSERT_EQ(r.entries.size(), size_t(5), "all entries");
        ASSERT_EQ(remote.list_calls.load(), 3, "three pages fetched");
        auto again = list_all_children(remote, cache, "0", 2, nullptr);
        ASSERT_EQ(again.entries.size(), size_t(5), "same entries");
        ASSERT_EQ(remote.list_calls.load(), 3, "served from cache");

        cache.invalidate_mutation("/f0", "0");
        list_all_children(remote, cache, "0", 2, nullptr);
        ASSERT_EQ(remote.list_calls.load(), 6, "refetched after invalidation");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// StreamingHashAccumulator
// ---------------------------------------------------------------------------

static void test_hash_accumulator() {
    std::cout << "\n=== StreamingHashAccumulator ===" << std::endl;

    const std::string data = pattern(5000, 7);
    auto slice = [&](uint64_t i) {
        auto s = data.substr(i * 1024, 1024);
        return to_bytes(s);
    };

    {
        TEST(out_of_order_chunks_match_whole_digest);
        StreamingHashAccumulator acc(data.size(), 1024);
        ASSERT_EQ(acc.total_chunks(), uint64_t(5), "five chunks");
        ASSERT_EQ(acc.expected_size(4), uint64_t(904), "short tail");
        for (uint64_t i : {3, 0, 4, 2}) {
            auto b = slice(i);
            ASSERT_EQ(acc.write_chunk(i, b), b.size(), "chunk accepted");
        }
        ASSERT_TRUE(!acc.complete(), "not complete yet");
        ASSERT_TRUE(!acc.finalize().has_value(), "no digest before completion");
        ASSERT_TRUE(acc.pending_bytes() > 0, "later chunks buffered");
        auto b1 = slice(1);
        acc.write_chunk(1, b1);
        ASSERT_TRUE(acc.complete(), "complete");
        ASSERT_EQ(acc.pending_bytes(), uint64_t(0), "buffer drained");
        ASSERT_EQ(acc.finalize().value_or(""), md5(data), "digest matches");
        ASSERT_EQ(acc.finalize().value_or(""), md5(data), "finalize is repeatable");
        PASS();
    }

    {
        TEST(rejects_duplicate_and_malformed_chunks);
        StreamingHashAccumulator acc(data.size(), 1024);
        auto b0 = slice(0);
        ASSERT_EQ(acc.write_chunk(0, b0), size_t(1024), "first write");
        ASSERT_EQ(acc.write_chunk(0, b0), size_t(0), "duplicate of hashed chunk");
        auto b2 = slice(2);
        acc.write_chunk(2, b2);
        ASSERT_EQ(acc.write_chunk(2, b2), size_t(0), "duplicate of buffered chunk");
        ASSERT_EQ(acc.write_chunk(3, to_bytes("short")), size_t(0), "wrong size");
        ASSERT_EQ(acc.write_chunk(9, b0), size_t(0), "index out of range");
        ASSERT_EQ(acc.covered_bytes(), uint64_t(2048), "only accepted bytes counted");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Progress store and ledger
// ---------------------------------------------------------------------------

static void test_progress_and_ledger() {
    std::cout << "\n=== Progress Store and Ledger ===" << std::endl;

    {
        TEST(progress_geometry);
        auto p = SessionProgress::create("pre-1", 5000, 1024);
        ASSERT_EQ(p.total_chunks, uint64_t(5), "chunk count");
        ASSERT_EQ(p.chunks[4].offset, uint64_t(4096), "last offset");
        ASSERT_EQ(p.chunks[4].size, uint64_t(904), "last size");
        ASSERT_EQ(p.uploaded_count(), uint64_t(0), "nothing uploaded");
        PASS();
    }

    {
        TEST(progress_save_and_load);
        MemoryKvStore kv;
        ProgressStore store(kv, std::chrono::hours(1));
        auto p = SessionProgress::create("pre-1", 5000, 1024);
        p.target_path = "/a.bin";
        p.content_hash = md5("x");
        p.chunks[1].uploaded = true;
        p.chunks[1].hash = md5("chunk1");
        p.chunks[1].attempts = 2;
        ASSERT_TRUE(store.save(p), "saved");
        auto loaded = store.load("pre-1");
        ASSERT_TRUE(loaded.has_value(), "loaded");
        ASSERT_EQ(loaded->uploaded_count(), uint64_t(1), "one uploaded");
        ASSERT_EQ(loaded->uploaded_bytes(), uint64_t(1024), "uploaded bytes");
        ASSERT_EQ(loaded->chunks[1].hash, md5("chunk1"), "chunk hash");
        ASSERT_EQ(loaded->target_path, std::string("/a.bin"), "target path");
        ASSERT_EQ(store.list_sessions().size(), size_t(1), "listed");
        ASSERT_TRUE(store.remove("pre-1"), "removed");
        ASSERT_TRUE(!store.load("pre-1").has_value(), "gone");
        PASS();
    }

    {
        TEST(progress_rejects_malformed_records);
        MemoryKvStore kv;
        ProgressStore store(kv, std::chrono::hours(1));
        ASSERT_TRUE(!SessionProgress::from_json("garbage").has_value(), "not json");
        ASSERT_TRUE(!SessionProgress::from_json(R"({"session":"x"})").has_value(), "missing fields");
        kv.set(std::string(ProgressStore::kPrefix) + "bad", "{}", 60000ms);
        ASSERT_TRUE(!store.load("bad").has_value(), "malformed record discarded");
        ASSERT_TRUE(!kv.get(std::string(ProgressStore::kPrefix) + "bad").has_value(), "record removed");
        PASS();
    }

    auto dir = make_temp_dir("panxfer-ledger");

    auto row = [](const std::string& id, const std::string& name, const std::string& state) {
        LedgerRow r;
        r.session_id = id;
        r.parent_id = "0";
        r.name = name;
        r.remote_name = name;
        r.size = 6000;
        r.content_hash = md5(name);
        r.chunk_size = 1024;
        r.total_chunks = 6;
        r.state = state;
        return r;
    };

    {
        TEST(ledger_finds_resumable_sessions);
        TransferLedger ledger;
        ASSERT_EMPTY(ledger.open(dir / "ledger.db"), "opened");
        ASSERT_TRUE(ledger.record_session(row("pre-1", "a.bin", "initializing")), "recorded");
        ASSERT_TRUE(ledger.update_state("pre-1", "transferring"), "updated");
        auto found = ledger.find_resumable("0", "a.bin", 6000, md5("a.bin"));
        ASSERT_TRUE(found.has_value(), "resumable");
        ASSERT_EQ(found->session_id, std::string("pre-1"), "session id");
        ASSERT_EQ(found->chunk_size, uint64_t(1024), "chunk size");
        ASSERT_TRUE(!ledger.find_resumable("0", "a.bin", 6001, md5("a.bin")).has_value(),
                    "size must match");

        ASSERT_TRUE(ledger.update_state("pre-1", "done", "900"), "done");
        ASSERT_TRUE(!ledger.find_resumable("0", "a.bin", 6000, md5("a.bin")).has_value(),
                    "finished sessions are not resumable");
        ASSERT_EQ(ledger.get("pre-1")->file_id, std::string("900"), "file id stored");
        PASS();
    }

    {
        TEST(ledger_aborted_sessions_resume);
        TransferLedger ledger;
        ASSERT_EMPTY(ledger.open(dir / "ledger.db"), "reopened");
        ledger.record_session(row("pre-2", "b.bin", "transferring"));
        ledger.update_state("pre-2", "aborted", "", "upload_chunk pre-2: permission_error");
        auto found = ledger.find_resumable("0", "b.bin", 6000, md5("b.bin"));
        ASSERT_TRUE(found.has_value(), "aborted session is resumable");
        ASSERT_NOT_EMPTY(found->error, "error kept");
        PASS();
    }

    {
        TEST(ledger_counts_and_purge);
        TransferLedger ledger;
        ASSERT_EMPTY(ledger.open(dir / "ledger.db"), "reopened");
        ledger.record_session(row("pre-3", "c.bin", "transferring"));
        auto counts = ledger.counts();
        ASSERT_EQ(counts["done"], uint64_t(1), "one done");
        ASSERT_EQ(counts["aborted"], uint64_t(1), "one aborted");
        ASSERT_EQ(counts["transferring"], uint64_t(1), "one transferring");
        ASSERT_EQ(ledger.list().size(), size_t(3), "three rows");
        ASSERT_EQ(ledger.purge_finished(0), size_t(2), "finished rows purged");
        ASSERT_EQ(ledger.list().size(), size_t(1), "live row kept");
        PASS();
    }

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Chunk geometry and worker planning
// ---------------------------------------------------------------------------

static void test_planning() {
    std::cout << "\n=== Chunk and Worker Planning ===" << std::endl;

    UploadSettings s;

    {
        TEST(chunk_size_from_throughput);
        TransferError err;
        ASSERT_EQ(plan_chunk_size(1 * GiB, 0, 0, s, err), 64 * MiB, "default without samples");
        ASSERT_EQ(plan_chunk_size(1 * GiB, 0, 4 * MiB, s, err), 40 * MiB, "ten seconds of transfer");
        ASSERT_EQ(plan_chunk_size(1 * GiB, 0, 1 * MiB, s, err), 16 * MiB, "clamped to minimum");
        ASSERT_EQ(plan_chunk_size(1 * GiB, 0, 100 * MiB, s, err), 512 * MiB, "clamped to maximum");
        ASSERT_TRUE(err.empty(), "no error");
        PASS();
    }

    {
        TEST(server_slice_wins);
        TransferError err;
        ASSERT_EQ(plan_chunk_size(1 * GiB, 16 * MiB, 100 * MiB, s, err), 16 * MiB, "slice used");
        ASSERT_EQ(plan_chunk_size(1 * GiB, 1 * KiB, 0, s, err), uint64_t(0), "slice too small");
        ASSERT_EQ(str(err.category), str(ErrorCategory::ResourceExhausted), "chunk ceiling");
        PASS();
    }

    {
        TEST(chunk_ceiling_grows_chunk_size);
        TransferError err;
        ASSERT_EQ(plan_chunk_size(1024 * GiB, 0, 0, s, err), uint64_t(109951163),
                  "grown to fit 10000 chunks");
        ASSERT_TRUE(err.empty(), "fits under the maximum");
        ASSERT_EQ(plan_chunk_size(10240 * GiB, 0, 0, s, err), uint64_t(0), "too large");
        ASSERT_EQ(str(err.category), str(ErrorCategory::ResourceExhausted), "resource exhausted");
        PASS();
    }

    {
        TEST(worker_count);
        ASSERT_EQ(plan_worker_count(100, 0, s), size_t(4), "ceiling without samples");
        ASSERT_EQ(plan_worker_count(2, 0, s), size_t(2), "capped by remaining chunks");
        ASSERT_EQ(plan_worker_count(100, 32 * MiB, s), size_t(1), "one fast stream suffices");
        ASSERT_EQ(plan_worker_count(100, 16 * MiB, s), size_t(2), "two streams");
        ASSERT_EQ(plan_worker_count(100, 8 * MiB, s), size_t(4), "four streams");
        ASSERT_EQ(plan_worker_count(100, 1, s), size_t(4), "slow link capped at ceiling");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// ChunkedUploader
// ---------------------------------------------------------------------------

/// Memory store whose writes can be switched off, like a full LMDB map.
class FlakyKvStore : public MemoryKvStore {
public:
    std::atomic<bool> fail_sets{false};

    bool set(const std::string& key, const std::string& value,
             std::chrono::milliseconds ttl) override {
        if (fail_sets) return false;
        return MemoryKvStore::set(key, value, ttl);
    }
};

/// Open a provider session for `data` and describe it the way the session
/// manager would, with 1 KiB chunks.
static std::shared_ptr<UploadSession> chunked_session(FakeRemote& remote, const std::string& name,
                                                      const std::string& data) {
    remote.instant_enabled = false;
    auto created = remote.create_session({"0", name, data.size(), md5(data)}, nullptr);
    remote.instant_enabled = true;
    if (!created.success) return nullptr;
    auto s = std::make_shared<UploadSession>();
    s->session_id = created.session_id;
    s->key = UploadSessionManager::session_key("0", name, data.size(), md5(data));
    s->target_path = "/" + name;
    s->parent_id = "0";
    s->requested_name = name;
    s->name = name;
    s->total_size = data.size();
    s->chunk_size = 1024;
    s->total_chunks = (data.size() + 1023) / 1024;
    s->content_hash = md5(data);
    s->created_at = now_epoch_seconds();
    return s;
}

static void test_chunked_upload() {
    std::cout << "\n=== ChunkedUploader ===" << std::endl;

    const std::string data = pattern(6000, 11);
    const UploadSettings settings = small_upload_settings();
    const RetryPolicy retry(chunk_retry_settings());

    {
        TEST(fatal_chunk_then_resume);
        FakeRemote remote;
        MemoryKvStore kv;
        ProgressStore progress(kv, std::chrono::hours(1));
        ThroughputEstimator tp;
        ChunkedUploader uploader(remote, progress, nullptr, settings, retry, tp);
        auto session = chunked_session(remote, "big.bin", data);
        ASSERT_TRUE(session != nullptr, "session created");
        MemorySource source(to_bytes(data));

        remote.fail_chunk(5, ErrorCategory::Permission, -1);
        auto first = uploader.run(*session, source, nullptr);
        ASSERT_TRUE(!first.success, "first run failed");
        ASSERT_EQ(str(first.error.category), str(ErrorCategory::Permission), "fatal category");
        ASSERT_EQ(first.error.failed_chunk, int64_t(5), "failed chunk");
        ASSERT_EQ(first.error.chunks_done, uint64_t(5), "chunks done");
        ASSERT_EQ(first.error.chunks_total, uint64_t(6), "chunks total");
        ASSERT_EQ(str(session->state.load()), str(SessionState::Aborted), "session aborted");
        ASSERT_EQ(progress.load(session->session_id)->uploaded_count(), uint64_t(5),
                  "progress kept for resume");

        remote.clear_failures();
        auto second = uploader.run(*session, source, nullptr);
        ASSERT_TRUE(second.success, "resumed run succeeded: " + second.error.to_string());
        ASSERT_EQ(second.chunks_skipped, uint64_t(5), "verified chunks skipped");
        ASSERT_EQ(second.chunks_uploaded, uint64_t(1), "only the missing chunk sent");
        ASSERT_EQ(second.digest, md5(data), "digest assembled from both runs");
        ASSERT_EQ(str(session->state.load()), str(SessionState::Completing), "ready to complete");
        PASS();
    }

    {
        TEST(transient_chunk_failure_is_retried);
        FakeRemote remote;
        MemoryKvStore kv;
        ProgressStore progress(kv, std::chrono::hours(1));
        ThroughputEstimator tp;
        ChunkedUploader uploader(remote, progress, nullptr, settings, retry, tp);
        auto session = chunked_session(remote, "flaky.bin", data);
        MemorySource source(to_bytes(data));

        remote.fail_chunk(2, ErrorCategory::ServerOverload, 1);
        auto r = uploader.run(*session, source, nullptr);
        ASSERT_TRUE(r.success, "succeeded: " + r.error.to_string());
        ASSERT_EQ(r.chunks_retried, uint64_t(1), "one retry");
        ASSERT_EQ(r.chunks_uploaded, uint64_t(6), "all chunks uploaded");
        ASSERT_EQ(r.bytes_uploaded, uint64_t(6000), "all bytes");
        ASSERT_EQ(remote.chunk_calls.load(), 7, "seven chunk requests");

        auto sends = remote.chunk_times(2);
        ASSERT_EQ(sends.size(), size_t(2), "chunk 2 sent twice");
        ASSERT_TRUE(sends[1] - sends[0] >= 30ms, "retry waited the backoff delay");
        PASS();
    }

    {
        TEST(retry_budget_is_per_chunk);
        FakeRemote remote;
        MemoryKvStore kv;
        ProgressStore progress(kv, std::chrono::hours(1));
        ThroughputEstimator tp;
        ChunkedUploader uploader(remote, progress, nullptr, settings, retry, tp);
        auto session = chunked_session(remote, "dead.bin", data);
        MemorySource source(to_bytes(data));

        remote.fail_chunk(5, ErrorCategory::NetworkTimeout, -1);
        auto r = uploader.run(*session, source, nullptr);
        ASSERT_TRUE(!r.success, "failed");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::NetworkTimeout), "last error kept");
        ASSERT_EQ(r.chunks_retried, uint64_t(2), "retried up to the attempt budget");
        ASSERT_EQ(r.error.failed_chunk, int64_t(5), "failed chunk");
        ASSERT_EQ(r.error.attempts, 3, "attempt count surfaced");

        auto sends = remote.chunk_times(5);
        ASSERT_EQ(sends.size(), size_t(3), "three sends");
        ASSERT_TRUE(sends[2] - sends[1] >= 60ms, "second retry backs off further");
        PASS();
    }

    {
        TEST(reverify_requeues_mismatched_chunks);
        FakeRemote remote;
        MemoryKvStore kv;
        ProgressStore progress(kv, std::chrono::hours(1));
        ThroughputEstimator tp;
        ChunkedUploader uploader(remote, progress, nullptr, settings, retry, tp);
        auto session = chunked_session(remote, "verify.bin", data);
        MemorySource source(to_bytes(data));

        remote.fail_chunk(5, ErrorCategory::Permission, -1);
        uploader.run(*session, source, nullptr);
        remote.clear_failures();

        auto saved = progress.load(session->session_id);
        ASSERT_TRUE(saved.has_value(), "progress saved");
        saved->chunks[1].hash = md5("not the chunk");
        progress.save(*saved);

        auto r = uploader.run(*session, source, nullptr);
        ASSERT_TRUE(r.success, "succeeded: " + r.error.to_string());
        ASSERT_EQ(r.chunks_skipped, uint64_t(4), "four verified");
        ASSERT_EQ(r.chunks_reverify_failed, uint64_t(1), "one failed verification");
        ASSERT_EQ(r.chunks_uploaded, uint64_t(2), "re-queued and missing chunk sent");
        ASSERT_EQ(r.digest, md5(data), "digest");
        PASS();
    }

    {
        TEST(cancel_keeps_progress);
        FakeRemote remote;
        MemoryKvStore kv;
        ProgressStore progress(kv, std::chrono::hours(1));
        ThroughputEstimator tp;
        ChunkedUploader uploader(remote, progress, nullptr, settings, retry, tp);
        auto session = chunked_session(remote, "cancel.bin", data);
        MemorySource source(to_bytes(data));

        CancelToken cancel;
        remote.on_chunk = [&](uint64_t index) {
            if (index == 1) cancel.cancel();
        };
        auto r = uploader.run(*session, source, &cancel);
        ASSERT_TRUE(!r.success, "cancelled run fails");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::Cancelled), "cancelled");
        ASSERT_EQ(progress.load(session->session_id)->uploaded_count(), uint64_t(2),
                  "accepted chunks recorded");
        ASSERT_EQ(r.error.chunks_done, uint64_t(2), "chunks done in error");
        PASS();
    }

    {
        TEST(unsaved_progress_aborts_upload);
        FakeRemote remote;
        FlakyKvStore kv;
        ProgressStore progress(kv, std::chrono::hours(1));
        ThroughputEstimator tp;
        ChunkedUploader uploader(remote, progress, nullptr, settings, retry, tp);
        auto session = chunked_session(remote, "full.bin", data);
        MemorySource source(to_bytes(data));

        remote.on_chunk = [&](uint64_t index) {
            if (index == 2) kv.fail_sets = true;
        };
        auto r = uploader.run(*session, source, nullptr);
        ASSERT_TRUE(!r.success, "run aborted");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::ResourceExhausted), "category");
        ASSERT_EQ(r.error.failed_chunk, int64_t(2), "chunk whose progress was lost");
        ASSERT_TRUE(r.error.chunks_done >= 3, "chunks done reported");
        ASSERT_EQ(r.error.chunks_total, uint64_t(6), "chunks total reported");
        ASSERT_TRUE(remote.chunk_calls.load() < 6, "remaining chunks not sent");
        ASSERT_EQ(str(session->state.load()), str(SessionState::Aborted), "session aborted");
        PASS();
    }

    {
        TEST(unsaved_initial_progress_sends_nothing);
        FakeRemote remote;
        FlakyKvStore kv;
        kv.fail_sets = true;
        ProgressStore progress(kv, std::chrono::hours(1));
        ThroughputEstimator tp;
        ChunkedUploader uploader(remote, progress, nullptr, settings, retry, tp);
        auto session = chunked_session(remote, "full2.bin", data);
        MemorySource source(to_bytes(data));

        auto r = uploader.run(*session, source, nullptr);
        ASSERT_TRUE(!r.success, "run refused");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::ResourceExhausted), "category");
        ASSERT_EQ(remote.chunk_calls.load(), 0, "nothing sent");
        PASS();
    }

    {
        TEST(source_size_mismatch_rejected);
        FakeRemote remote;
        MemoryKvStore kv;
        ProgressStore progress(kv, std::chrono::hours(1));
        ThroughputEstimator tp;
        ChunkedUploader uploader(remote, progress, nullptr, settings, retry, tp);
        auto session = chunked_session(remote, "size.bin", data);
        MemorySource source(to_bytes(data.substr(0, 100)));
        auto r = uploader.run(*session, source, nullptr);
        ASSERT_TRUE(!r.success, "rejected");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::DataIntegrity), "integrity error");
        ASSERT_EQ(remote.chunk_calls.load(), 0, "nothing sent");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// UploadSessionManager
// ---------------------------------------------------------------------------

struct SessionRig {
    FakeRemote remote;
    MemoryKvStore kv;
    MetadataCache cache{kv, CacheSettings{}};
    ThroughputEstimator tp;
    UploadSettings settings = small_upload_settings();
    std::unique_ptr<UploadSessionManager> mgr;

    void build() {
        mgr = std::make_unique<UploadSessionManager>(remote, cache, nullptr, settings,
                                                     CacheSettings{}, "0", tp);
    }

    OpenResult open(const std::string& name, const std::string& data,
                    const std::string& parent = "0") {
        MemorySource source(to_bytes(data));
        return mgr->open(OpenRequest{parent, name, "/" + name, data.size(), {}}, &source, nullptr);
    }
};

static void test_session_manager() {
    std::cout << "\n=== UploadSessionManager ===" << std::endl;

    {
        TEST(provider_reuse_is_instant);
        SessionRig rig;
        rig.build();
        const std::string data = pattern(3000, 21);
        rig.remote.add_file("0", "orig.bin", data);
        auto r = rig.open("copy.bin", data);
        ASSERT_TRUE(r.success, "opened: " + r.error.to_string());
        ASSERT_EQ(str(r.session->strategy), str(UploadStrategy::Instant), "instant");
        ASSERT_EQ(str(r.session->state.load()), str(SessionState::Done), "done");
        ASSERT_EQ(r.session->total_chunks, uint64_t(0), "no chunks");
        ASSERT_NOT_EMPTY(r.session->file_id, "file id");
        ASSERT_EQ(rig.remote.create_calls.load(), 1, "one create");
        ASSERT_EQ(rig.mgr->live_sessions(), size_t(0), "instant sessions are not registered");
        PASS();
    }

    {
        TEST(identical_child_skips_create);
        SessionRig rig;
        rig.build();
        const std::string data = pattern(3000, 22);
        auto id = rig.remote.add_file("0", "same.bin", data);
        auto r = rig.open("same.bin", data);
        ASSERT_TRUE(r.success, "opened");
        ASSERT_EQ(str(r.session->strategy), str(UploadStrategy::Instant), "instant");
        ASSERT_EQ(r.session->file_id, id, "existing object");
        ASSERT_EQ(rig.remote.create_calls.load(), 0, "no create call");
        PASS();
    }

    {
        TEST(identical_opens_share_a_session);
        SessionRig rig;
        rig.build();
        const std::string data = pattern(3000, 23);
        auto a = rig.open("idem.bin", data);
        auto b = rig.open("idem.bin", data);
        ASSERT_TRUE(a.success && b.success, "both opened");
        ASSERT_EQ(str(a.session->strategy), str(UploadStrategy::Chunked), "chunked");
        ASSERT_TRUE(!a.existing, "first open is new");
        ASSERT_TRUE(b.existing, "second open joins");
        ASSERT_TRUE(a.session == b.session, "same session object");
        ASSERT_EQ(rig.remote.create_calls.load(), 1, "one provider session");
        ASSERT_EQ(rig.mgr->live_sessions(), size_t(1), "registered");
        rig.mgr->finish(a.session);
        ASSERT_EQ(rig.mgr->live_sessions(), size_t(0), "released");
        PASS();
    }

    {
        TEST(open_locks_released_after_open);
        SessionRig rig;
        rig.build();
        for (int i = 0; i < 20; ++i) {
            auto r = rig.open("many" + std::to_string(i) + ".bin", pattern(3000, 100 + i));
            ASSERT_TRUE(r.success, "opened");
            rig.mgr->finish(r.session);
        }
        std::vector<std::thread> openers;
        const std::string same = pattern(3000, 99);
        for (int i = 0; i < 4; ++i) {
            openers.emplace_back([&] { rig.open("same.bin", same); });
        }
        for (auto& t : openers) t.join();
        rig.open("orphan.bin", pattern(100, 98), "555");
        ASSERT_EQ(rig.mgr->open_locks(), size_t(0), "no per-key lock outlives its opens");
        ASSERT_EQ(rig.mgr->live_sessions(), size_t(1), "shared session still registered");
        PASS();
    }

    {
        TEST(name_collision_gets_numbered);
        SessionRig rig;
        rig.build();
        rig.remote.add_file("0", "report.pdf", pattern(100, 1));
        rig.remote.add_file("0", "report (1).pdf", pattern(100, 2));
        auto r = rig.open("report.pdf", pattern(3000, 24));
        ASSERT_TRUE(r.success, "opened");
        ASSERT_EQ(r.session->name, std::string("report (2).pdf"), "first free number");
        ASSERT_EQ(r.session->requested_name, std::string("report.pdf"), "requested name kept");
        PASS();
    }

    {
        TEST(missing_parent_is_cached);
        SessionRig rig;
        rig.build();
        auto first = rig.open("x.bin", pattern(100, 3), "555");
        ASSERT_TRUE(!first.success, "missing parent");
        ASSERT_EQ(str(first.error.category), str(ErrorCategory::NotFound), "not found");
        auto second = rig.open("x.bin", pattern(100, 3), "555");
        ASSERT_EQ(str(second.error.category), str(ErrorCategory::NotFound), "still not found");
        ASSERT_EQ(rig.remote.get_calls.load(), 1, "answered from cache");
        ASSERT_EQ(rig.remote.create_calls.load(), 0, "no create");
        PASS();
    }

    {
        TEST(stream_without_hash_rejected);
        SessionRig rig;
        rig.build();
        auto content = std::make_shared<std::string>(pattern(100, 4));
        StreamSource source(string_reader(content), content->size());
        auto r = rig.mgr->open(OpenRequest{"0", "s.bin", "/s.bin", content->size(), {}}, &source, nullptr);
        ASSERT_TRUE(!r.success, "rejected");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::DataIntegrity), "integrity error");
        ASSERT_EQ(source.bytes_read(), uint64_t(0), "stream untouched");
        PASS();
    }

    {
        TEST(small_files_use_single_shot);
        SessionRig rig;
        rig.settings.single_shot_limit = 4096;
        rig.build();
        auto r = rig.open("small.bin", pattern(2000, 5));
        ASSERT_TRUE(r.success, "opened");
        ASSERT_EQ(str(r.session->strategy), str(UploadStrategy::SingleShot), "single shot");
        auto big = rig.open("big.bin", pattern(5000, 6));
        ASSERT_EQ(str(big.session->strategy), str(UploadStrategy::Chunked), "chunked above limit");
        ASSERT_EQ(big.session->total_chunks, uint64_t(5), "five chunks");
        PASS();
    }

    {
        TEST(chunk_ceiling_rejects_session);
        SessionRig rig;
        rig.settings.max_chunks = 2;
        rig.remote.slice_size = 1024;
        rig.build();
        auto r = rig.open("many.bin", pattern(6000, 7));
        ASSERT_TRUE(!r.success, "rejected");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::ResourceExhausted), "resource exhausted");
        PASS();
    }

    {
        TEST(stale_listing_conflict_renames);
        SessionRig rig;
        rig.build();
        auto warm = list_all_children(rig.remote, rig.cache, "0", 100, nullptr);
        ASSERT_TRUE(warm.success, "listing cached");
        rig.remote.add_file("0", "late.bin", pattern(100, 8));
        auto r = rig.open("late.bin", pattern(3000, 9));
        ASSERT_TRUE(r.success, "opened: " + r.error.to_string());
        ASSERT_EQ(r.session->name, std::string("late (1).bin"), "renamed after conflict");
        ASSERT_EQ(rig.remote.create_calls.load(), 2, "one conflict then success");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Completion polling
// ---------------------------------------------------------------------------

static CompletionSettings fast_completion() {
    CompletionSettings s;
    s.step = 1ms;
    s.plateau = 1ms;
    s.late_start = 1ms;
    s.max_interval = 2ms;
    return s;
}

static void test_completion() {
    std::cout << "\n=== CompletionPoller ===" << std::endl;

    {
        TEST(default_interval_schedule);
        FakeRemote remote;
        CompletionPoller poller(remote, CompletionSettings{});
        ASSERT_EQ(poller.interval_for(0).count(), 1000, "first wait");
        ASSERT_EQ(poller.interval_for(4).count(), 5000, "end of ramp");
        ASSERT_EQ(poller.interval_for(5).count(), 5000, "plateau start");
        ASSERT_EQ(poller.interval_for(9).count(), 5000, "plateau end");
        ASSERT_EQ(poller.interval_for(10).count(), 10000, "late start");
        ASSERT_EQ(poller.interval_for(12).count(), 12000, "late growth");
        ASSERT_EQ(poller.interval_for(40).count(), 15000, "capped");
        PASS();
    }

    {
        TEST(budget_grows_with_size);
        FakeRemote remote;
        CompletionPoller poller(remote, CompletionSettings{});
        ASSERT_EQ(poller.max_polls_for(0), 30, "empty file");
        ASSERT_EQ(poller.max_polls_for(1), 40, "one byte");
        ASSERT_EQ(poller.max_polls_for(GiB + 1), 50, "just over a GiB");
        ASSERT_EQ(poller.max_polls_for(100 * GiB), 300, "capped");
        PASS();
    }

    {
        TEST(synchronous_completion_skips_polling);
        FakeRemote remote;
        const std::string data = pattern(3000, 21);
        auto id = stage_session(remote, "sync.bin", data, 1024);
        ASSERT_NOT_EMPTY(id, "session staged");
        CompletionPoller poller(remote, fast_completion());
        auto r = poller.complete(id, data.size(), "/sync.bin", nullptr);
        ASSERT_TRUE(r.success, "completed: " + r.error.to_string());
        ASSERT_TRUE(!r.async, "synchronous");
        ASSERT_EQ(r.polls, 0, "no polls");
        ASSERT_EQ(r.content_hash, md5(data), "hash reported");
        ASSERT_EQ(remote.poll_calls.load(), 0, "provider not polled");
        PASS();
    }

    {
        TEST(tolerates_transient_poll_failures);
        FakeRemote remote;
        const std::string data = pattern(2000, 22);
        auto id = stage_session(remote, "async.bin", data, 1024);
        remote.async_polls = 1;
        remote.fail_polls(3);
        CompletionPoller poller(remote, fast_completion());
        auto r = poller.complete(id, data.size(), "/async.bin", nullptr);
        ASSERT_TRUE(r.success, "completed: " + r.error.to_string());
        ASSERT_TRUE(r.async, "asynchronous");
        ASSERT_EQ(r.network_failures, 3, "failures counted");
        ASSERT_EQ(r.polls, 4, "polled until confirmed");
        ASSERT_TRUE(remote.find("0", "async.bin").has_value(), "file materialized");
        PASS();
    }

    {
        TEST(too_many_consecutive_failures);
        FakeRemote remote;
        const std::string data = pattern(2000, 23);
        auto id = stage_session(remote, "down.bin", data, 1024);
        remote.async_polls = 1;
        remote.fail_polls(10);
        CompletionPoller poller(remote, fast_completion());
        auto r = poller.complete(id, data.size(), "/down.bin", nullptr);
        ASSERT_TRUE(!r.success, "gave up");
        ASSERT_TRUE(r.error.message.find("provider unreachable") != std::string::npos,
                    "unreachable message: " + r.error.message);
        ASSERT_EQ(r.polls, 6, "limit plus one");
        PASS();
    }

    {
        TEST(budget_exhausted_is_timeout);
        FakeRemote remote;
        const std::string data = pattern(2000, 24);
        auto id = stage_session(remote, "slow.bin", data, 1024);
        remote.async_polls = 100;
        auto settings = fast_completion();
        settings.base_polls = 3;
        settings.max_polls = 3;
        CompletionPoller poller(remote, settings);
        auto r = poller.complete(id, data.size(), "/slow.bin", nullptr);
        ASSERT_TRUE(!r.success, "not confirmed");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::NetworkTimeout), "timeout");
        ASSERT_EQ(r.error.message, std::string("provider still processing after 3 polls"),
                  "message");
        ASSERT_EQ(remote.poll_calls.load(), 3, "three polls");
        PASS();
    }

    {
        TEST(cancel_while_waiting);
        FakeRemote remote;
        const std::string data = pattern(2000, 25);
        auto id = stage_session(remote, "cancel.bin", data, 1024);
        remote.async_polls = 100;
        CancelToken cancel;
        cancel.cancel();
        CompletionPoller poller(remote, fast_completion());
        auto r = poller.complete(id, data.size(), "/cancel.bin", &cancel);
        ASSERT_TRUE(!r.success, "stopped");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::Cancelled), "cancelled");
        ASSERT_EQ(remote.poll_calls.load(), 0, "no polls after cancel");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Cross-store selector
// ---------------------------------------------------------------------------

static CrossStoreSettings small_cross_store(const fs::path& dir) {
    CrossStoreSettings s;
    s.memory_limit = 1 * KiB;
    s.hybrid_limit = 1 * MiB;
    s.range_size = 1024;
    s.range_readers = 3;
    s.temp_dir = dir;
    return s;
}

static void test_selector() {
    std::cout << "\n=== TransferSelector ===" << std::endl;

    auto dir = make_temp_dir("selector");

    {
        TEST(strategy_table);
        MemoryBudget budget(1 * MiB);
        TransferSelector selector(small_cross_store(dir), budget);
        SourceCapabilities local{true, true, false, false};
        SourceCapabilities stream{true, false, false, false};
        SourceCapabilities unsized{false, false, false, false};
        SourceCapabilities remote{true, false, true, true};
        ASSERT_EQ(str(selector.choose(local, 50 * MiB)), str(BufferStrategy::Direct), "local file");
        ASSERT_EQ(str(selector.choose(unsized, std::nullopt)), str(BufferStrategy::Disk), "unsized");
        ASSERT_EQ(str(selector.choose(stream, 500)), str(BufferStrategy::Memory), "small stream");
        ASSERT_EQ(str(selector.choose(remote, 5000)), str(BufferStrategy::Hybrid), "mid remote");
        ASSERT_EQ(str(selector.choose(stream, 5000)), str(BufferStrategy::Disk), "mid stream");
        ASSERT_EQ(str(selector.choose(remote, 2 * MiB)), str(BufferStrategy::Disk), "large remote");
        PASS();
    }

    {
        TEST(direct_passes_source_through);
        MemoryBudget budget(1 * MiB);
        TransferSelector selector(small_cross_store(dir), budget);
        MemorySource src(to_bytes(pattern(5000, 31)));
        auto p = selector.prepare(src, nullptr);
        ASSERT_TRUE(p.success, "prepared");
        ASSERT_EQ(str(p.strategy), str(BufferStrategy::Direct), "direct");
        ASSERT_TRUE(p.source == &src, "same source");
        ASSERT_EQ(p.bytes_read, uint64_t(0), "nothing read");
        PASS();
    }

    {
        TEST(memory_buffer_reads_once_and_hashes);
        MemoryBudget budget(1 * MiB);
        TransferSelector selector(small_cross_store(dir), budget);
        auto data = std::make_shared<std::string>(pattern(600, 32));
        StreamSource src(string_reader(data), data->size());
        auto p = selector.prepare(src, nullptr);
        ASSERT_TRUE(p.success, "prepared: " + p.error.to_string());
        ASSERT_EQ(str(p.strategy), str(BufferStrategy::Memory), "memory");
        ASSERT_EQ(p.content_hash, md5(*data), "hash");
        ASSERT_EQ(src.bytes_read(), uint64_t(600), "read exactly once");
        ASSERT_TRUE(p.source && p.source->capabilities().seekable, "buffer is seekable");
        std::string again(600, '\0');
        ASSERT_TRUE(p.source->read_at(0, reinterpret_cast<uint8_t*>(again.data()), 600), "re-read");
        ASSERT_EQ(again, *data, "buffered bytes");
        PASS();
    }

    {
        TEST(reservation_held_while_prepared);
        MemoryBudget budget(1 * MiB);
        TransferSelector selector(small_cross_store(dir), budget);
        auto data = std::make_shared<std::string>(pattern(600, 33));
        StreamSource src(string_reader(data), data->size());
        {
            auto p = selector.prepare(src, nullptr);
            ASSERT_TRUE(p.success, "prepared");
            ASSERT_EQ(budget.in_use(), uint64_t(600), "reserved");
        }
        ASSERT_EQ(budget.in_use(), uint64_t(0), "released");
        PASS();
    }

    {
        TEST(exhausted_budget_falls_back_to_disk);
        MemoryBudget budget(1000);
        ASSERT_TRUE(budget.try_reserve(800), "pre-reserve");
        TransferSelector selector(small_cross_store(dir), budget);
        auto data = std::make_shared<std::string>(pattern(500, 34));
        StreamSource src(string_reader(data), data->size());
        auto p = selector.prepare(src, nullptr);
        ASSERT_TRUE(p.success, "prepared: " + p.error.to_string());
        ASSERT_EQ(str(p.strategy), str(BufferStrategy::Disk), "disk fallback");
        ASSERT_EQ(budget.in_use(), uint64_t(800), "budget untouched");
        ASSERT_EQ(p.content_hash, md5(*data), "hash");
        budget.release(800);
        PASS();
    }

    {
        TEST(disk_buffer_for_unsized_stream);
        MemoryBudget budget(1 * MiB);
        TransferSelector selector(small_cross_store(dir), budget);
        auto data = std::make_shared<std::string>(pattern(7000, 35));
        StreamSource src(string_reader(data), std::nullopt);
        fs::path buffer;
        {
            auto p = selector.prepare(src, nullptr);
            ASSERT_TRUE(p.success, "prepared: " + p.error.to_string());
            ASSERT_EQ(str(p.strategy), str(BufferStrategy::Disk), "disk");
            ASSERT_EQ(p.size, uint64_t(7000), "size learned");
            ASSERT_EQ(p.content_hash, md5(*data), "hash");
            buffer = p.source->describe();
            ASSERT_TRUE(fs::exists(buffer), "buffer file exists");
        }
        ASSERT_TRUE(!fs::exists(buffer), "buffer file removed");
        PASS();
    }

    {
        TEST(known_hash_mismatch);
        MemoryBudget budget(1 * MiB);
        TransferSelector selector(small_cross_store(dir), budget);
        auto data = std::make_shared<std::string>(pattern(600, 36));
        StreamSource src(string_reader(data), data->size(), md5("something else"));
        auto p = selector.prepare(src, nullptr);
        ASSERT_TRUE(!p.success, "rejected");
        ASSERT_EQ(str(p.error.category), str(ErrorCategory::DataIntegrity), "integrity");
        ASSERT_TRUE(p.source == nullptr, "no source");
        PASS();
    }

    {
        TEST(short_stream_is_integrity_error);
        MemoryBudget budget(1 * MiB);
        TransferSelector selector(small_cross_store(dir), budget);
        auto data = std::make_shared<std::string>(pattern(400, 37));
        StreamSource src(string_reader(data), 600);
        auto p = selector.prepare(src, nullptr);
        ASSERT_TRUE(!p.success, "rejected");
        ASSERT_EQ(str(p.error.category), str(ErrorCategory::DataIntegrity), "integrity");
        ASSERT_EQ(p.error.message, std::string("source ended after 400 of 600 bytes"), "message");
        ASSERT_EQ(budget.in_use(), uint64_t(0), "reservation released");
        PASS();
    }

    {
        TEST(hybrid_ranged_reads);
        FakeRemote remote;
        const std::string data = pattern(5000, 38);
        auto id = remote.add_file("0", "remote.bin", data);
        auto e = remote.get_entry(id, nullptr);
        ASSERT_TRUE(e.success, "entry");
        RemoteObjectSource src(remote, e.entry);
        MemoryBudget budget(1 * MiB);
        TransferSelector selector(small_cross_store(dir), budget);
        auto p = selector.prepare(src, nullptr);
        ASSERT_TRUE(p.success, "prepared: " + p.error.to_string());
        ASSERT_EQ(str(p.strategy), str(BufferStrategy::Hybrid), "hybrid");
        ASSERT_EQ(remote.range_calls.load(), 5, "one request per range");
        ASSERT_EQ(p.content_hash, md5(data), "hash");
        PASS();
    }

    {
        TEST(hybrid_hashes_ranges_arriving_out_of_order);
        FakeRemote remote;
        const std::string data = pattern(5000, 39);
        auto id = remote.add_file("0", "slow.bin", data);
        auto e = remote.get_entry(id, nullptr);
        ASSERT_TRUE(e.success, "entry");
        remote.on_range = [](uint64_t offset) {
            if (offset == 0) std::this_thread::sleep_for(50ms);
        };
        RemoteObjectSource src(remote, e.entry);
        MemoryBudget budget(1 * MiB);
        TransferSelector selector(small_cross_store(dir), budget);
        auto p = selector.prepare(src, nullptr);
        ASSERT_TRUE(p.success, "prepared: " + p.error.to_string());
        ASSERT_EQ(str(p.strategy), str(BufferStrategy::Hybrid), "hybrid");
        ASSERT_EQ(p.content_hash, md5(data), "digest independent of arrival order");
        ASSERT_EQ(remote.range_calls.load(), 5, "buffer not read back from the network");
        PASS();
    }

    {
        TEST(failed_range_read_aborts);
        FakeRemote remote;
        RemoteEntry ghost;
        ghost.id = "999";
        ghost.name = "ghost.bin";
        ghost.size = 3000;
        RemoteObjectSource src(remote, ghost);
        MemoryBudget budget(1 * MiB);
        TransferSelector selector(small_cross_store(dir), budget);
        auto p = selector.prepare(src, nullptr);
        ASSERT_TRUE(!p.success, "rejected");
        ASSERT_EQ(str(p.error.category), str(ErrorCategory::NetworkTimeout), "read failure");
        ASSERT_TRUE(p.error.message.find("ranged read failed") != std::string::npos,
                    "message: " + p.error.message);
        PASS();
    }

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Engine integration
// ---------------------------------------------------------------------------

struct EngineRig {
    fs::path dir = make_temp_dir("engine");
    FakeRemote remote;
    MemoryKvStore kv;
    EngineConfig config = engine_config(dir);
    std::unique_ptr<TransferEngine> engine;

    ~EngineRig() {
        engine.reset();
        fs::remove_all(dir);
    }

    std::string start() {
        engine = std::make_unique<TransferEngine>(config, remote, kv);
        return engine->start();
    }

    fs::path local(const std::string& name, const std::string& content) {
        auto p = dir / name;
        write_file(p, content);
        return p;
    }

    bool listed(const std::string& path, const std::string& name) {
        auto l = engine->list(path);
        if (!l.success) return false;
        for (const auto& e : l.entries) {
            if (e.name == name) return true;
        }
        return false;
    }
};

static void test_engine() {
    std::cout << "\n=== TransferEngine ===" << std::endl;

    {
        TEST(not_started_rejects_uploads);
        EngineRig rig;
        rig.engine = std::make_unique<TransferEngine>(rig.config, rig.remote, rig.kv);
        auto r = rig.engine->upload(rig.local("a.bin", "abc"), "/a.bin");
        ASSERT_TRUE(!r.success, "rejected");
        ASSERT_TRUE(r.error.message.find("not started") != std::string::npos,
                    "message: " + r.error.message);
        PASS();
    }

    {
        TEST(upload_visible_after_warm_listing);
        EngineRig rig;
        ASSERT_EMPTY(rig.start(), "started");
        ASSERT_TRUE(!rig.listed("/", "new.bin"), "absent before");
        const std::string data = pattern(3000, 41);
        auto r = rig.engine->upload(rig.local("new.bin", data), "/new.bin");
        ASSERT_TRUE(r.success, "uploaded: " + r.error.to_string());
        ASSERT_EQ(str(r.strategy), str(UploadStrategy::Chunked), "chunked");
        ASSERT_EQ(r.chunks_uploaded, uint64_t(3), "three chunks");
        ASSERT_EQ(r.object.remote_path, std::string("/new.bin"), "path");
        ASSERT_EQ(r.object.content_hash, md5(data), "hash");
        ASSERT_TRUE(rig.listed("/", "new.bin"), "listing refreshed");
        ASSERT_EQ(rig.remote.content_of(r.object.file_id), data, "content stored");
        ASSERT_EQ(rig.engine->stats().uploads_completed, uint64_t(1), "counted");
        PASS();
    }

    {
        TEST(identical_content_is_deduplicated);
        EngineRig rig;
        ASSERT_EMPTY(rig.start(), "started");
        const std::string data = pattern(3000, 42);
        auto first = rig.engine->upload(rig.local("a.bin", data), "/a.bin");
        ASSERT_TRUE(first.success, "first upload: " + first.error.to_string());
        int chunks = rig.remote.chunk_calls.load();
        auto second = rig.engine->upload(rig.local("a.bin", data), "/copy.bin");
        ASSERT_TRUE(second.success, "second upload: " + second.error.to_string());
        ASSERT_TRUE(second.deduplicated, "deduplicated");
        ASSERT_EQ(rig.remote.chunk_calls.load(), chunks, "no chunks sent");
        ASSERT_EQ(rig.remote.content_of(second.object.file_id), data, "content linked");
        ASSERT_EQ(rig.engine->stats().uploads_deduplicated, uint64_t(1), "counted");
        PASS();
    }

    {
        TEST(small_file_single_shot);
        EngineRig rig;
        rig.config.upload.single_shot_limit = 4096;
        ASSERT_EMPTY(rig.start(), "started");
        const std::string data = pattern(2000, 43);
        auto r = rig.engine->upload(rig.local("s.bin", data), "/s.bin");
        ASSERT_TRUE(r.success, "uploaded: " + r.error.to_string());
        ASSERT_EQ(str(r.strategy), str(UploadStrategy::SingleShot), "single shot");
        ASSERT_EQ(rig.remote.single_calls.load(), 1, "one request");
        ASSERT_EQ(rig.remote.chunk_calls.load(), 0, "no chunks");
        ASSERT_EQ(rig.remote.content_of(r.object.file_id), data, "content stored");
        PASS();
    }

    {
        TEST(single_shot_failure_falls_back_to_chunks);
        EngineRig rig;
        rig.config.upload.single_shot_limit = 4096;
        rig.remote.fail_single = true;
        ASSERT_EMPTY(rig.start(), "started");
        const std::string data = pattern(2000, 44);
        auto r = rig.engine->upload(rig.local("f.bin", data), "/f.bin");
        ASSERT_TRUE(r.success, "uploaded: " + r.error.to_string());
        ASSERT_TRUE(rig.remote.single_calls.load() >= 1, "single shot tried");
        ASSERT_EQ(rig.remote.chunk_calls.load(), 2, "chunked fallback");
        ASSERT_TRUE(rig.remote.find("0", "f.bin").has_value(), "stored");
        PASS();
    }

    {
        TEST(throwing_transfer_releases_waiters);
        EngineRig rig;
        rig.config.upload.single_shot_limit = 4096;
        rig.remote.throw_single = true;
        ASSERT_EMPTY(rig.start(), "started");
        const std::string data = pattern(2000, 45);
        auto path = rig.local("t.bin", data);
        auto first = rig.engine->upload(path, "/t.bin");
        ASSERT_TRUE(!first.success, "allocation failure reported");
        ASSERT_EQ(str(first.error.category), str(ErrorCategory::ResourceExhausted), "category");

        rig.remote.throw_single = false;
        auto second = rig.engine->upload(path, "/t.bin");
        ASSERT_TRUE(second.success, "same upload runs again: " + second.error.to_string());
        ASSERT_TRUE(rig.remote.find("0", "t.bin").has_value(), "stored");
        PASS();
    }

    {
        TEST(name_collision_gets_numbered_name);
        EngineRig rig;
        rig.remote.add_file("0", "report.pdf", pattern(500, 45));
        ASSERT_EMPTY(rig.start(), "started");
        const std::string data = pattern(2500, 46);
        auto r = rig.engine->upload(rig.local("report.pdf", data), "/report.pdf");
        ASSERT_TRUE(r.success, "uploaded: " + r.error.to_string());
        ASSERT_EQ(r.object.remote_path, std::string("/report (1).pdf"), "numbered");
        ASSERT_EQ(rig.remote.child_count("0"), size_t(2), "original kept");
        PASS();
    }

    {
        TEST(asynchronous_completion_is_polled);
        EngineRig rig;
        rig.remote.async_polls = 2;
        ASSERT_EMPTY(rig.start(), "started");
        const std::string data = pattern(2500, 47);
        auto r = rig.engine->upload(rig.local("async.bin", data), "/async.bin");
        ASSERT_TRUE(r.success, "uploaded: " + r.error.to_string());
        ASSERT_EQ(rig.remote.poll_calls.load(), 2, "polled twice");
        ASSERT_NOT_EMPTY(r.object.file_id, "file id");
        PASS();
    }

    {
        TEST(namespace_mutations);
        EngineRig rig;
        ASSERT_EMPTY(rig.start(), "started");
        auto docs = rig.engine->make_directory("/docs");
        ASSERT_TRUE(docs.success, "mkdir: " + docs.error.to_string());
        auto again = rig.engine->make_directory("/docs");
        ASSERT_TRUE(again.success, "mkdir is idempotent");
        ASSERT_EQ(again.id, docs.id, "same directory");
        ASSERT_EQ(rig.remote.mkdir_calls.load(), 1, "one provider call");
        ASSERT_TRUE(rig.engine->make_directory("/archive").success, "second dir");

        auto up = rig.engine->upload(rig.local("a.bin", pattern(1500, 48)), "/docs/a.bin");
        ASSERT_TRUE(up.success, "upload into dir: " + up.error.to_string());
        ASSERT_TRUE(rig.engine->resolve("/docs/a.bin").success, "resolves");

        auto ren = rig.engine->rename("/docs/a.bin", "b.bin");
        ASSERT_TRUE(ren.success, "rename: " + ren.error.to_string());
        ASSERT_TRUE(!rig.engine->resolve("/docs/a.bin").success, "old name gone");
        ASSERT_TRUE(rig.engine->resolve("/docs/b.bin").success, "new name resolves");

        auto mv = rig.engine->move("/docs/b.bin", "/archive");
        ASSERT_TRUE(mv.success, "move: " + mv.error.to_string());
        ASSERT_TRUE(!rig.listed("/docs", "b.bin"), "left source dir");
        ASSERT_TRUE(rig.listed("/archive", "b.bin"), "in target dir");

        auto rm = rig.engine->remove("/archive/b.bin");
        ASSERT_TRUE(rm.success, "remove: " + rm.error.to_string());
        auto gone = rig.engine->resolve("/archive/b.bin");
        ASSERT_TRUE(!gone.success, "removed");
        ASSERT_EQ(str(gone.error.category), str(ErrorCategory::NotFound), "not found");

        auto root = rig.engine->remove("/");
        ASSERT_TRUE(!root.success, "root protected");
        ASSERT_EQ(str(root.error.category), str(ErrorCategory::Permission), "permission");
        PASS();
    }

    {
        TEST(mkdir_over_file_conflicts);
        EngineRig rig;
        rig.remote.add_file("0", "plain", "data");
        ASSERT_EMPTY(rig.start(), "started");
        auto r = rig.engine->make_directory("/plain");
        ASSERT_TRUE(!r.success, "rejected");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::Conflict), "conflict");
        PASS();
    }

    {
        TEST(upload_into_missing_parent);
        EngineRig rig;
        ASSERT_EMPTY(rig.start(), "started");
        auto r = rig.engine->upload(rig.local("x.bin", "xyz"), "/nowhere/x.bin");
        ASSERT_TRUE(!r.success, "rejected");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::NotFound), "not found");
        ASSERT_EQ(rig.engine->stats().uploads_failed, uint64_t(1), "counted");
        PASS();
    }

    {
        TEST(download_verifies_content);
        EngineRig rig;
        const std::string data = pattern(2500, 49);
        rig.remote.add_file("0", "dl.bin", data);
        ASSERT_EMPTY(rig.start(), "started");
        auto out = rig.dir / "dl.out";
        auto r = rig.engine->download("/dl.bin", out);
        ASSERT_TRUE(r.success, "downloaded: " + r.error.to_string());
        ASSERT_EQ(r.bytes, uint64_t(2500), "size");
        ASSERT_EQ(rig.remote.range_calls.load(), 3, "one request per range");
        ASSERT_EQ(read_file(out), data, "content");
        ASSERT_TRUE(!fs::exists(rig.dir / "dl.out.part"), "no partial file");
        PASS();
    }

    {
        TEST(download_hash_mismatch_leaves_nothing);
        EngineRig rig;
        auto id = rig.remote.add_file("0", "bad.bin", pattern(2500, 50));
        rig.remote.set_hash(id, md5("not the content"));
        ASSERT_EMPTY(rig.start(), "started");
        auto out = rig.dir / "bad.out";
        auto r = rig.engine->download("/bad.bin", out);
        ASSERT_TRUE(!r.success, "rejected");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::DataIntegrity), "integrity");
        ASSERT_TRUE(!fs::exists(out), "no file");
        ASSERT_TRUE(!fs::exists(rig.dir / "bad.out.part"), "no partial file");
        PASS();
    }

    {
        TEST(download_directory_rejected);
        EngineRig rig;
        rig.remote.add_dir("0", "folder");
        ASSERT_EMPTY(rig.start(), "started");
        auto r = rig.engine->download("/folder", rig.dir / "folder.out");
        ASSERT_TRUE(!r.success, "rejected");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::NotFound), "not a file");
        PASS();
    }

    {
        TEST(small_stream_buffered_in_memory);
        EngineRig rig;
        ASSERT_EMPTY(rig.start(), "started");
        auto data = std::make_shared<std::string>(pattern(600, 51));
        StreamSource src(string_reader(data), data->size());
        auto r = rig.engine->upload_from(src, "/pipe.bin");
        ASSERT_TRUE(r.success, "uploaded: " + r.error.to_string());
        ASSERT_EQ(str(r.buffering), str(BufferStrategy::Memory), "memory buffer");
        ASSERT_EQ(src.bytes_read(), uint64_t(600), "read once");
        ASSERT_EQ(rig.engine->memory_budget().in_use(), uint64_t(0), "budget released");
        ASSERT_EQ(rig.remote.content_of(r.object.file_id), *data, "content stored");
        PASS();
    }

    {
        TEST(unsized_stream_buffered_on_disk);
        EngineRig rig;
        ASSERT_EMPTY(rig.start(), "started");
        auto data = std::make_shared<std::string>(pattern(5000, 52));
        StreamSource src(string_reader(data), std::nullopt);
        auto r = rig.engine->upload_from(src, "/unsized.bin");
        ASSERT_TRUE(r.success, "uploaded: " + r.error.to_string());
        ASSERT_EQ(str(r.buffering), str(BufferStrategy::Disk), "disk buffer");
        ASSERT_EQ(r.object.content_hash, md5(*data), "hash");
        ASSERT_EQ(rig.remote.content_of(r.object.file_id), *data, "content stored");
        PASS();
    }

    {
        TEST(known_hash_stream_deduplicated_without_reading);
        EngineRig rig;
        const std::string data = pattern(5000, 53);
        rig.remote.add_file("0", "orig.bin", data);
        ASSERT_EMPTY(rig.start(), "started");
        auto bytes = std::make_shared<std::string>(data);
        StreamSource src(string_reader(bytes), data.size(), md5(data));
        auto r = rig.engine->upload_from(src, "/dup.bin");
        ASSERT_TRUE(r.success, "uploaded: " + r.error.to_string());
        ASSERT_TRUE(r.deduplicated, "deduplicated");
        ASSERT_EQ(src.read_calls(), uint64_t(0), "stream untouched");
        PASS();
    }

    {
        TEST(copy_between_paths_uses_ranged_buffer);
        EngineRig rig;
        const std::string data = pattern(3000, 54);
        rig.remote.add_file("0", "src.bin", data);
        rig.remote.instant_enabled = false;
        ASSERT_EMPTY(rig.start(), "started");
        auto r = rig.engine->copy("/src.bin", "/dst.bin");
        ASSERT_TRUE(r.success, "copied: " + r.error.to_string());
        ASSERT_EQ(str(r.buffering), str(BufferStrategy::Hybrid), "hybrid buffer");
        ASSERT_EQ(rig.remote.range_calls.load(), 3, "three ranges");
        ASSERT_EQ(rig.remote.content_of(r.object.file_id), data, "content copied");
        PASS();
    }

    {
        TEST(copy_with_instant_upload);
        EngineRig rig;
        const std::string data = pattern(3000, 55);
        rig.remote.add_file("0", "src.bin", data);
        ASSERT_EMPTY(rig.start(), "started");
        auto r = rig.engine->copy("/src.bin", "/twin.bin");
        ASSERT_TRUE(r.success, "copied: " + r.error.to_string());
        ASSERT_TRUE(r.deduplicated, "no bytes moved");
        ASSERT_EQ(rig.remote.range_calls.load(), 0, "nothing read");
        PASS();
    }

    {
        TEST(concurrent_identical_uploads_share_session);
        EngineRig rig;
        rig.remote.chunk_delay_ms = 20;
        ASSERT_EMPTY(rig.start(), "started");
        const std::string data = pattern(3000, 56);
        auto path = rig.local("same.bin", data);
        UploadResult a, b;
        std::thread t1([&] { a = rig.engine->upload(path, "/same.bin"); });
        std::thread t2([&] { b = rig.engine->upload(path, "/same.bin"); });
        t1.join();
        t2.join();
        ASSERT_TRUE(a.success, "first: " + a.error.to_string());
        ASSERT_TRUE(b.success, "second: " + b.error.to_string());
        ASSERT_EQ(rig.remote.create_calls.load(), 1, "one provider session");
        ASSERT_EQ(rig.remote.child_count("0"), size_t(1), "one file");
        PASS();
    }

    {
        TEST(cancel_keeps_progress);
        EngineRig rig;
        CancelToken cancel;
        rig.remote.on_chunk = [&](uint64_t index) {
            if (index == 1) cancel.cancel();
        };
        ASSERT_EMPTY(rig.start(), "started");
        auto r = rig.engine->upload(rig.local("c.bin", pattern(3000, 57)), "/c.bin", &cancel);
        ASSERT_TRUE(!r.success, "interrupted");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::Cancelled), "cancelled");
        ASSERT_EQ(rig.engine->progress().list_sessions().size(), size_t(1), "progress kept");
        ASSERT_TRUE(!rig.remote.find("0", "c.bin").has_value(), "not materialized");
        PASS();
    }

    {
        TEST(fatal_chunk_failure_reported);
        EngineRig rig;
        rig.remote.fail_chunk(2, ErrorCategory::Permission, -1);
        ASSERT_EMPTY(rig.start(), "started");
        auto r = rig.engine->upload(rig.local("p.bin", pattern(3000, 58)), "/p.bin");
        ASSERT_TRUE(!r.success, "failed");
        ASSERT_EQ(str(r.error.category), str(ErrorCategory::Permission), "permission");
        ASSERT_EQ(rig.engine->stats().uploads_failed, uint64_t(1), "counted");
        PASS();
    }

    {
        TEST(ledger_resume_across_engines);
        EngineRig rig;
        rig.config.ledger_path = rig.dir / "ledger.db";
        const std::string data = pattern(3000, 59);
        auto path = rig.local("resume.bin", data);

        rig.remote.fail_chunk(2, ErrorCategory::Permission, -1);
        ASSERT_EMPTY(rig.start(), "first engine started");
        auto first = rig.engine->upload(path, "/resume.bin");
        ASSERT_TRUE(!first.success, "first attempt failed");
        ASSERT_EQ(rig.engine->stats().resumable_sessions, uint64_t(1), "resumable");
        rig.engine.reset();

        rig.remote.clear_failures();
        int created = rig.remote.create_calls.load();
        ASSERT_EMPTY(rig.start(), "second engine started");
        auto second = rig.engine->upload(path, "/resume.bin");
        ASSERT_TRUE(second.success, "resumed: " + second.error.to_string());
        ASSERT_EQ(second.chunks_skipped, uint64_t(2), "finished chunks skipped");
        ASSERT_EQ(second.chunks_uploaded, uint64_t(1), "only the last chunk sent");
        ASSERT_EQ(rig.remote.create_calls.load(), created, "provider session reused");
        ASSERT_EQ(rig.engine->stats().resumable_sessions, uint64_t(0), "nothing left to resume");
        auto rows = rig.engine->sessions();
        ASSERT_EQ(rows.size(), size_t(1), "one ledger row");
        ASSERT_EQ(rows[0].state, std::string("done"), "row finished");
        ASSERT_EQ(rig.remote.content_of(second.object.file_id), data, "content assembled");
        PASS();
    }
}

// ---------------------------------------------------------------------------
// Metrics
// ---------------------------------------------------------------------------

static void test_metrics() {
    std::cout << "\n=== MetricsExporter ===" << std::endl;

    {
        TEST(textfile_carries_labels);
        auto dir = make_temp_dir("metrics");
        auto prom = dir / "panxfer.prom";
        {
            MetricsExporter exporter(prom, std::chrono::seconds(60), {{"account", "test"}});
            exporter.uploads_success().Increment();
            exporter.flush();
            ASSERT_TRUE(fs::exists(prom), "file written");
            auto text = read_file(prom);
            ASSERT_TRUE(text.find("account=\"test\"") != std::string::npos, "label present");
            ASSERT_TRUE(!fs::exists(dir / "panxfer.prom.tmp"), "temp file renamed");
        }
        fs::remove_all(dir);
        PASS();
    }

    {
        TEST(engine_updates_counters);
        EngineRig rig;
        auto prom = rig.dir / "engine.prom";
        MetricsExporter exporter(prom, std::chrono::seconds(60), {});
        rig.engine = std::make_unique<TransferEngine>(rig.config, rig.remote, rig.kv);
        rig.engine->set_metrics(&exporter);
        exporter.set_engine(rig.engine.get());
        ASSERT_EMPTY(rig.engine->start(), "started");

        auto r = rig.engine->upload(rig.local("m.bin", pattern(2500, 61)), "/m.bin");
        ASSERT_TRUE(r.success, "uploaded: " + r.error.to_string());
        ASSERT_EQ(exporter.uploads_success().Value(), 1.0, "upload counted");
        ASSERT_TRUE(exporter.chunks_uploaded().Value() >= 1.0, "chunks counted");
        ASSERT_TRUE(exporter.upload_bytes_total().Value() >= 2500.0, "bytes counted");

        exporter.flush();
        auto text = read_file(prom);
        ASSERT_TRUE(text.find("panxfer_uploads_total") != std::string::npos, "family written");
        exporter.set_engine(nullptr);
        PASS();
    }
}

// ---------------------------------------------------------------------------
// panxfer-cache tool
// ---------------------------------------------------------------------------

/// Run the cache tool against `db`; returns its exit status.
static int run_tool(const fs::path& db, const std::string& args, std::string& output) {
    std::string cmd = std::string(PANXFER_CACHE_TOOL) + " --db " + db.string() + " " + args +
                      " 2>/dev/null";
    output.clear();
    FILE* pipe = popen(cmd.c_str(), "r");
    if (!pipe) return -1;
    char buf[512];
    while (fgets(buf, sizeof(buf), pipe)) output += buf;
    int status = pclose(pipe);
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

static void test_cache_tool() {
    std::cout << "\n=== panxfer-cache ===" << std::endl;

    auto dir = make_temp_dir("cachetool");
    {
        LmdbKvStore store(dir, 64);
        store.set("pv/5", "1", std::chrono::milliseconds(0));
        store.set("ls/5/", "[]", std::chrono::milliseconds(0));
        store.set("path//a", "{}", std::chrono::milliseconds(20));
    }
    std::this_thread::sleep_for(50ms);

    {
        TEST(get_prints_value);
        std::string out;
        ASSERT_EQ(run_tool(dir, "get pv/5", out), 0, "exit status");
        ASSERT_EQ(out, std::string("1\n"), "value");
        PASS();
    }

    {
        TEST(get_missing_key);
        std::string out;
        ASSERT_EQ(run_tool(dir, "get pv/404", out), 1, "exit status");
        ASSERT_EQ(out, std::string("NOTFOUND\n"), "not found");
        PASS();
    }

    {
        TEST(stat_counts_namespaces);
        std::string out;
        ASSERT_EQ(run_tool(dir, "stat", out), 0, "exit status");
        ASSERT_TRUE(out.find("ns pv/") != std::string::npos, "pv namespace: " + out);
        ASSERT_TRUE(out.find("live=1") != std::string::npos, "live count: " + out);
        ASSERT_TRUE(out.find("expired=1") != std::string::npos, "expired count: " + out);
        PASS();
    }

    {
        TEST(keys_by_prefix);
        std::string out;
        ASSERT_EQ(run_tool(dir, "keys ls/", out), 0, "exit status");
        ASSERT_TRUE(out.find("ls/5/") != std::string::npos, "listed: " + out);
        ASSERT_TRUE(out.find("pv/5") == std::string::npos, "prefix respected");
        PASS();
    }

    {
        TEST(purge_expired_removes_stale_entries);
        std::string out;
        ASSERT_EQ(run_tool(dir, "purge-expired", out), 0, "exit status");
        ASSERT_EQ(out, std::string("removed 1\n"), "one removed");
        ASSERT_EQ(run_tool(dir, "get path//a --all", out), 1, "gone even with --all");
        PASS();
    }

    {
        TEST(value_layout_on_disk);
        MDB_env* env = nullptr;
        ASSERT_EQ(mdb_env_create(&env), 0, "env");
        ASSERT_EQ(mdb_env_set_mapsize(env, 64ULL * 1024 * 1024), 0, "mapsize");
        if (mdb_env_open(env, dir.c_str(), MDB_RDONLY, 0664) != 0) {
            mdb_env_close(env);
            FAIL("open env");
            return;
        }
        MDB_txn* txn = nullptr;
        mdb_txn_begin(env, nullptr, MDB_RDONLY, &txn);
        MDB_dbi dbi;
        mdb_dbi_open(txn, nullptr, 0, &dbi);
        std::string key = "pv/5";
        MDB_val k = {key.size(), key.data()};
        MDB_val v;
        int rc = mdb_get(txn, dbi, &k, &v);
        size_t size = rc == 0 ? v.mv_size : 0;
        uint64_t stamp = 1;
        if (rc == 0 && v.mv_size >= sizeof(stamp)) std::memcpy(&stamp, v.mv_data, sizeof(stamp));
        mdb_txn_abort(txn);
        mdb_env_close(env);
        ASSERT_EQ(rc, 0, "key present");
        ASSERT_EQ(size, size_t(9), "stamp plus value");
        ASSERT_EQ(stamp, uint64_t(0), "no expiry");
        PASS();
    }

    fs::remove_all(dir);
}

// ---------------------------------------------------------------------------
// Main
// ---------------------------------------------------------------------------

int main() {
    std::cout << "panxfer test suite" << std::endl;
    std::cout << "==================" << std::endl;

    test_remote_types();
    test_config();
    test_pacer();
    test_retry_policy();
    test_credentials();
    test_http_remote_api();
    test_kv_store();
    test_metadata_cache();
    test_hash_accumulator();
    test_progress_and_ledger();
    test_planning();
    test_chunked_upload();
    test_session_manager();
    test_completion();
    test_selector();
    test_engine();
    test_metrics();
    test_cache_tool();

    std::cout << "\n==================" << std::endl;
    std::cout << "Results: " << tests_passed << " passed, "
              << tests_failed << " failed" << std::endl;

    return tests_failed > 0 ? 1 : 0;
}
