#include "panxfer/http_remote_api.hpp"
#include "panxfer/credentials.hpp"
#include "panxfer/kv_store.hpp"
#include "panxfer/log.hpp"
#include "panxfer/retry_policy.hpp"
#include "panxfer/sync.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <memory>
#include <nlohmann/json.hpp>

namespace panxfer {

using json = nlohmann::json;
using net::HttpMethod;

struct HttpRemoteApi::CallSpec {
    std::string operation;
    std::string target;
    HttpMethod method = HttpMethod::GET;
    std::string endpoint;      // provider path; selects the pacer
    std::string query;         // encoded, without '?'
    std::string absolute_url;  // signed download URLs bypass the API base
    bool upload_domain = false;
    bool authenticated = true;
    bool envelope = true;      // false: raw body (ranged downloads)
    std::string json_body;
    std::vector<uint8_t> raw_body;
    std::string content_type;
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;
    std::chrono::milliseconds timeout{30000};
    int max_attempts = 0;      // 0 = policy default
    std::optional<EndpointClass> pacer_class;
};

struct HttpRemoteApi::CallResult {
    bool success = false;
    json data;
    std::vector<uint8_t> body;
    TransferError error;
};

namespace {

// Provider ids are int64; the engine keeps them as strings.
json id_json(const std::string& id) {
    if (!id.empty() && id.size() < 19 &&
        std::all_of(id.begin(), id.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::stoll(id);
    }
    return id;
}

std::string id_string(const json& v) {
    if (v.is_number_integer()) return std::to_string(v.get<int64_t>());
    if (v.is_string()) return v.get<std::string>();
    return {};
}

json field(const json& obj, std::initializer_list<const char*> names) {
    for (const char* n : names) {
        auto it = obj.find(n);
        if (it != obj.end() && !it->is_null()) return *it;
    }
    return nullptr;
}

// "2024-05-01 12:30:00" (or epoch seconds) -> epoch seconds
int64_t parse_timestamp(const json& v) {
    if (v.is_number()) return v.get<int64_t>();
    if (!v.is_string()) return 0;
    std::tm tm{};
    if (std::sscanf(v.get<std::string>().c_str(), "%d-%d-%d %d:%d:%d", &tm.tm_year, &tm.tm_mon,
                    &tm.tm_mday, &tm.tm_hour, &tm.tm_min, &tm.tm_sec) != 6) {
        return 0;
    }
    tm.tm_year -= 1900;
    tm.tm_mon -= 1;
    return static_cast<int64_t>(timegm(&tm));
}

RemoteEntry parse_entry(const json& f) {
    RemoteEntry e;
    e.id = id_string(field(f, {"fileId", "fileID"}));
    auto name = field(f, {"filename", "fileName"});
    e.name = name.is_string() ? name.get<std::string>() : "";
    e.parent_id = id_string(field(f, {"parentFileId", "parentFileID"}));
    auto size = field(f, {"size"});
    e.size = size.is_number() ? size.get<uint64_t>() : 0;
    auto etag = field(f, {"etag"});
    e.hash = etag.is_string() ? etag.get<std::string>() : "";
    std::transform(e.hash.begin(), e.hash.end(), e.hash.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    auto type = field(f, {"type"});
    e.is_directory = type.is_number() && type.get<int>() == 1;
    e.modified = parse_timestamp(field(f, {"updateAt", "updatedAt"}));
    return e;
}

bool is_trashed(const json& f) {
    auto t = field(f, {"trashed"});
    return (t.is_number() && t.get<int>() != 0) || (t.is_boolean() && t.get<bool>());
}

/// multipart/form-data body with text fields followed by one file part.
std::vector<uint8_t> multipart_body(const std::string& boundary,
                                    const std::vector<std::pair<std::string, std::string>>& fields,
                                    const std::string& file_field, const std::string& file_name,
                                    std::span<const uint8_t> data) {
    std::string head;
    for (const auto& [name, value] : fields) {
        head += "--" + boundary + "\r\n";
        head += "Content-Disposition: form-data; name=\"" + name + "\"\r\n\r\n";
        head += value + "\r\n";
    }
    head += "--" + boundary + "\r\n";
    head += "Content-Disposition: form-data; name=\"" + file_field + "\"; filename=\"" +
            file_name + "\"\r\n";
    head += "Content-Type: application/octet-stream\r\n\r\n";
    std::string tail = "\r\n--" + boundary + "--\r\n";

    std::vector<uint8_t> body;
    body.reserve(head.size() + data.size() + tail.size());
    body.insert(body.end(), head.begin(), head.end());
    body.insert(body.end(), data.begin(), data.end());
    body.insert(body.end(), tail.begin(), tail.end());
    return body;
}

std::string make_boundary() {
    static std::atomic<uint64_t> counter{0};
    char buf[64];
    std::snprintf(buf, sizeof(buf), "panxfer-%016llx-%llu",
                  static_cast<unsigned long long>(now_epoch_ms()),
                  static_cast<unsigned long long>(counter++));
    return buf;
}

std::string body_excerpt(const std::vector<uint8_t>& body) {
    std::string s(body.begin(), body.begin() + std::min<size_t>(body.size(), 200));
    for (auto& c : s) {
        if (c == '\n' || c == '\r') c = ' ';
    }
    return s;
}

TransferError cancelled_error(const std::string& op, const std::string& target) {
    return TransferError::make(ErrorCategory::Cancelled, op, target, "cancelled");
}

}  // namespace

HttpRemoteApi::HttpRemoteApi(const EngineConfig& config, net::HttpTransport& transport,
                             RateLimiterRegistry& limiters, const RetryPolicy& retry,
                             CredentialProvider& credentials)
    : config_(config)
    , transport_(transport)
    , limiters_(limiters)
    , retry_(retry)
    , credentials_(credentials) {}

HttpRemoteApi::~HttpRemoteApi() = default;

RemoteApiStats HttpRemoteApi::stats() const {
    RemoteApiStats s;
    s.requests = requests_;
    s.retries = retries_;
    s.rate_limited = rate_limited_;
    s.auth_refreshes = auth_refreshes_;
    return s;
}

// ============================================================================
// Call loop
// ============================================================================

HttpRemoteApi::CallResult HttpRemoteApi::call(const CallSpec& spec, const CancelToken* cancel) {
    CallResult result;
    Pacer& pacer = spec.pacer_class ? limiters_.pacer(*spec.pacer_class)
                                    : limiters_.pacer_for_endpoint(spec.endpoint);
    const int max_attempts = spec.max_attempts > 0 ? spec.max_attempts : retry_.max_attempts();
    bool refreshed = false;

    for (int attempt = 0;; ++attempt) {
        if (is_cancelled(cancel) || !pacer.acquire(cancel)) {
            result.error = cancelled_error(spec.operation, spec.target);
            return result;
        }
        if (spec.authenticated && !credentials_.ensure_valid()) {
            result.error = TransferError::make(ErrorCategory::Auth, spec.operation, spec.target,
                                               "access token expired and could not be refreshed");
            result.error.attempts = attempt + 1;
            return result;
        }

        net::HttpRequest req;
        req.method = spec.method;
        if (!spec.absolute_url.empty()) {
            req.url = spec.absolute_url;
        } else {
            req.url = (spec.upload_domain ? config_.upload_base_url : config_.api_base_url) +
                      spec.endpoint;
            if (!spec.query.empty()) req.url += "?" + spec.query;
        }
        if (spec.authenticated) {
            req.headers.set_bearer_token(credentials_.bearer_token());
            req.headers.set("Platform", config_.platform);
        }
        if (!spec.json_body.empty()) {
            req.set_json_body(spec.json_body);
        } else if (!spec.raw_body.empty()) {
            // Stream from the prepared body; no per-attempt copy
            req.headers.set_content_type(spec.content_type);
            auto pos = std::make_shared<size_t>(0);
            const std::vector<uint8_t>* body = &spec.raw_body;
            req.body_reader = [body, pos](char* buf, size_t len) -> size_t {
                size_t n = std::min(len, body->size() - *pos);
                std::memcpy(buf, body->data() + *pos, n);
                *pos += n;
                return n;
            };
            req.body_size = spec.raw_body.size();
        }
        req.connect_timeout = config_.timeouts.connect;
        req.total_timeout = spec.timeout;
        req.byte_range = spec.byte_range;
        req.cancel = cancel;

        ++requests_;
        net::HttpResponse resp = transport_.execute(req);
        if (resp.cancelled) {
            result.error = cancelled_error(spec.operation, spec.target);
            return result;
        }

        AttemptFailure failure;
        if (resp.is_network_error || resp.status_code == 0) {
            failure.message = resp.error.empty() ? "no response" : resp.error;
            failure.network_error = true;
        } else if (!resp.ok()) {
            failure.message = body_excerpt(resp.body);
            failure.http_status = resp.status_code;
        } else if (!spec.envelope) {
            pacer.on_success();
            result.success = true;
            result.body = std::move(resp.body);
            return result;
        } else {
            json j = json::parse(resp.body.begin(), resp.body.end(), nullptr, false);
            if (j.is_discarded() || !j.is_object()) {
                failure.message = "invalid JSON response: " + body_excerpt(resp.body);
            } else {
                int code = j.value("code", 0);
                if (code == 0) {
                    pacer.on_success();
                    result.success = true;
                    auto it = j.find("data");
                    result.data = (it != j.end() && !it->is_null()) ? *it : json::object();
                    return result;
                }
                failure.message = "API error " + std::to_string(code) + ": " +
                                  j.value("message", std::string());
                // Envelope codes reuse HTTP numbering for auth/throttle/not-found
                if (code >= 100 && code < 600) failure.http_status = code;
            }
        }

        Classification c = retry_.classify(failure, attempt);
        if (attempt + 1 >= max_attempts) c.retryable = false;

        if (c.category == ErrorCategory::Auth) {
            c.retryable = !refreshed;
            if (!refreshed) {
                refreshed = true;
                ++auth_refreshes_;
                log_debug("%s %s: auth failure, refreshing credential", spec.operation.c_str(),
                          spec.target.c_str());
                if (!credentials_.force_refresh()) c.retryable = false;
            }
        } else if (c.category == ErrorCategory::RateLimit) {
            ++rate_limited_;
            pacer.on_rate_limited(c.delay);
        } else if (c.retryable) {
            pacer.on_backoff();
        }

        if (!c.retryable) {
            result.error = TransferError::make(c.category, spec.operation, spec.target,
                                               failure.message);
            result.error.http_status = failure.http_status;
            result.error.attempts = attempt + 1;
            return result;
        }

        ++retries_;
        log_debug("%s %s: %s (attempt %d/%d, %s, retry in %lldms)", spec.operation.c_str(),
                  spec.target.c_str(), failure.message.c_str(), attempt + 1, max_attempts,
                  error_category_name(c.category), static_cast<long long>(c.delay.count()));

        // Rate-limit waits are enforced by the pacer on the next acquire
        if (c.category != ErrorCategory::RateLimit && c.delay.count() > 0 &&
            !cancellable_sleep(cancel, c.delay)) {
            result.error = cancelled_error(spec.operation, spec.target);
            return result;
        }
    }
}

// ============================================================================
// Metadata
// ============================================================================

ListResult HttpRemoteApi::list_children(const std::string& parent_id,
                                        const std::string& page_token, size_t limit,
                                        const CancelToken* cancel) {
    CallSpec spec;
    spec.operation = "list";
    spec.target = parent_id;
    spec.endpoint = "/api/v2/file/list";
    spec.query = "parentFileId=" + net::url_encode(parent_id) + "&limit=" + std::to_string(limit);
    if (!page_token.empty()) spec.query += "&lastFileId=" + net::url_encode(page_token);
    spec.timeout = config_.timeouts.metadata;

    ListResult out;
    auto r = call(spec, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        return out;
    }
    auto list = field(r.data, {"fileList"});
    if (list.is_array()) {
        for (const auto& f : list) {
            if (is_trashed(f)) continue;
            out.entries.push_back(parse_entry(f));
        }
    }
    std::string last = id_string(field(r.data, {"lastFileId"}));
    out.next_page_token = (last == "-1") ? "" : last;
    out.success = true;
    return out;
}

EntryResult HttpRemoteApi::get_entry(const std::string& id, const CancelToken* cancel) {
    CallSpec spec;
    spec.operation = "stat";
    spec.target = id;
    spec.endpoint = "/api/v1/file/detail";
    spec.query = "fileID=" + net::url_encode(id);
    spec.timeout = config_.timeouts.metadata;

    EntryResult out;
    auto r = call(spec, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        return out;
    }
    if (is_trashed(r.data)) {
        out.error = TransferError::make(ErrorCategory::NotFound, "stat", id, "entry is in trash");
        return out;
    }
    out.entry = parse_entry(r.data);
    if (out.entry.id.empty()) out.entry.id = id;
    out.success = true;
    return out;
}

// ============================================================================
// Uploads
// ============================================================================

SessionOpenResult HttpRemoteApi::create_session(const CreateSessionRequest& request,
                                                const CancelToken* cancel) {
    CallSpec spec;
    spec.operation = "create_session";
    spec.target = request.parent_id + "/" + request.name;
    spec.method = HttpMethod::POST;
    spec.endpoint = "/upload/v2/file/create";
    spec.json_body = json{{"parentFileID", id_json(request.parent_id)},
                          {"filename", request.name},
                          {"etag", request.content_hash},
                          {"size", request.size}}.dump();
    spec.timeout = config_.timeouts.metadata;

    SessionOpenResult out;
    auto r = call(spec, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        return out;
    }
    out.reused = r.data.value("reuse", false);
    out.file_id = id_string(field(r.data, {"fileID", "fileId"}));
    auto pre = field(r.data, {"preuploadID"});
    out.session_id = pre.is_string() ? pre.get<std::string>() : "";
    auto slice = field(r.data, {"sliceSize"});
    out.slice_size = slice.is_number() ? slice.get<uint64_t>() : 0;
    if (!out.reused && out.session_id.empty()) {
        out.error = TransferError::make(ErrorCategory::Unknown, spec.operation, spec.target,
                                        "provider returned neither reuse nor preuploadID");
        return out;
    }
    out.success = true;
    return out;
}

OpResult HttpRemoteApi::upload_chunk(const std::string& session_id, uint64_t index,
                                     std::span<const uint8_t> data, const std::string& chunk_hash,
                                     const CancelToken* cancel) {
    // Provider slice numbers are 1-based
    const std::string slice_no = std::to_string(index + 1);
    const std::string boundary = make_boundary();

    CallSpec spec;
    spec.operation = "upload_chunk";
    spec.target = session_id + "#" + std::to_string(index);
    spec.method = HttpMethod::POST;
    spec.endpoint = "/upload/v2/file/slice";
    spec.upload_domain = true;
    spec.raw_body = multipart_body(boundary,
                                   {{"preuploadID", session_id},
                                    {"sliceNo", slice_no},
                                    {"sliceMD5", chunk_hash}},
                                   "slice", "chunk_" + slice_no, data);
    spec.content_type = "multipart/form-data; boundary=" + boundary;
    spec.timeout = config_.timeouts.upload;
    // Chunk-level retries are owned by the upload engine
    spec.max_attempts = 1;

    OpResult out;
    auto r = call(spec, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        return out;
    }
    out.success = true;
    return out;
}

CompleteResult HttpRemoteApi::complete_session(const std::string& session_id,
                                               const CancelToken* cancel) {
    CallSpec spec;
    spec.operation = "complete";
    spec.target = session_id;
    spec.method = HttpMethod::POST;
    spec.endpoint = "/upload/v2/file/upload_complete";
    spec.json_body = json{{"preuploadID", session_id}}.dump();
    spec.timeout = config_.timeouts.metadata;

    CompleteResult out;
    auto r = call(spec, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        return out;
    }
    out.success = true;
    out.completed = r.data.value("completed", false);
    out.async = !out.completed;
    out.file_id = id_string(field(r.data, {"fileID", "fileId"}));
    auto etag = field(r.data, {"etag"});
    if (etag.is_string()) out.content_hash = etag.get<std::string>();
    return out;
}

CompleteResult HttpRemoteApi::poll_session(const std::string& session_id,
                                           const CancelToken* cancel) {
    CallSpec spec;
    spec.operation = "poll_complete";
    spec.target = session_id;
    spec.method = HttpMethod::POST;
    spec.endpoint = "/upload/v1/file/upload_async_result";
    spec.json_body = json{{"preuploadID", session_id}}.dump();
    spec.timeout = config_.timeouts.metadata;
    spec.max_attempts = 1;

    CompleteResult out;
    auto r = call(spec, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        return out;
    }
    out.success = true;
    out.async = true;
    out.completed = r.data.value("completed", false);
    out.file_id = id_string(field(r.data, {"fileID", "fileId"}));
    return out;
}

CompleteResult HttpRemoteApi::upload_single(const CreateSessionRequest& request,
                                            std::span<const uint8_t> data,
                                            const CancelToken* cancel) {
    const std::string boundary = make_boundary();

    CallSpec spec;
    spec.operation = "upload_single";
    spec.target = request.parent_id + "/" + request.name;
    spec.method = HttpMethod::POST;
    spec.endpoint = "/upload/v2/file/single/create";
    spec.upload_domain = true;
    spec.raw_body = multipart_body(boundary,
                                   {{"parentFileID", request.parent_id},
                                    {"filename", request.name},
                                    {"etag", request.content_hash},
                                    {"size", std::to_string(request.size)}},
                                   "file", request.name, data);
    spec.content_type = "multipart/form-data; boundary=" + boundary;
    spec.timeout = config_.timeouts.upload;

    CompleteResult out;
    auto r = call(spec, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        return out;
    }
    out.completed = r.data.value("completed", false);
    out.file_id = id_string(field(r.data, {"fileID", "fileId"}));
    if (!out.completed || out.file_id.empty()) {
        out.error = TransferError::make(ErrorCategory::Unknown, spec.operation, spec.target,
                                        "single-shot upload not confirmed by provider");
        return out;
    }
    out.success = true;
    out.content_hash = request.content_hash;
    return out;
}

// ============================================================================
// Downloads
// ============================================================================

std::string HttpRemoteApi::download_url(const std::string& file_id, bool refresh,
                                        const CancelToken* cancel, TransferError& error) {
    if (!refresh) {
        std::lock_guard lock(url_mutex_);
        auto it = download_urls_.find(file_id);
        if (it != download_urls_.end()) return it->second;
    }

    CallSpec spec;
    spec.operation = "download_info";
    spec.target = file_id;
    spec.endpoint = "/api/v1/file/download_info";
    spec.query = "fileId=" + net::url_encode(file_id);
    spec.timeout = config_.timeouts.metadata;

    auto r = call(spec, cancel);
    if (!r.success) {
        error = std::move(r.error);
        return {};
    }
    auto url = field(r.data, {"downloadUrl"});
    if (!url.is_string() || url.get<std::string>().empty()) {
        error = TransferError::make(ErrorCategory::Unknown, spec.operation, file_id,
                                    "provider returned no download URL");
        return {};
    }
    std::lock_guard lock(url_mutex_);
    download_urls_[file_id] = url.get<std::string>();
    return url.get<std::string>();
}

ReadResult HttpRemoteApi::read_range(const std::string& file_id, uint64_t offset, uint64_t length,
                                     const CancelToken* cancel) {
    ReadResult out;
    if (length == 0) {
        out.success = true;
        return out;
    }

    for (int round = 0; round < 2; ++round) {
        std::string url = download_url(file_id, round > 0, cancel, out.error);
        if (url.empty()) return out;

        CallSpec spec;
        spec.operation = "read_range";
        spec.target = file_id;
        spec.absolute_url = url;
        spec.authenticated = false;
        spec.envelope = false;
        spec.byte_range = std::make_pair(offset, offset + length - 1);
        spec.timeout = config_.timeouts.download;
        spec.pacer_class = EndpointClass::Download;

        auto r = call(spec, cancel);
        if (r.success) {
            out.success = true;
            out.data = std::move(r.body);
            out.error = {};
            return out;
        }
        out.error = std::move(r.error);
        // A rejected signed URL is re-fetched once
        if (out.error.category != ErrorCategory::UrlExpired &&
            out.error.category != ErrorCategory::Permission) {
            return out;
        }
        log_debug("read_range %s: download URL rejected, refreshing", file_id.c_str());
    }
    return out;
}

// ============================================================================
// Mutations
// ============================================================================

OpResult HttpRemoteApi::make_directory(const std::string& parent_id, const std::string& name,
                                       const CancelToken* cancel) {
    CallSpec spec;
    spec.operation = "mkdir";
    spec.target = parent_id + "/" + name;
    spec.method = HttpMethod::POST;
    spec.endpoint = "/upload/v1/file/mkdir";
    spec.json_body = json{{"name", name}, {"parentID", id_json(parent_id)}}.dump();
    spec.timeout = config_.timeouts.metadata;

    OpResult out;
    auto r = call(spec, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        return out;
    }
    out.id = id_string(field(r.data, {"dirID", "dirId"}));
    out.success = true;
    return out;
}

OpResult HttpRemoteApi::remove(const std::vector<std::string>& ids, const CancelToken* cancel) {
    json id_list = json::array();
    for (const auto& id : ids) id_list.push_back(id_json(id));

    CallSpec spec;
    spec.operation = "remove";
    spec.target = ids.empty() ? "" : ids.front();
    spec.method = HttpMethod::POST;
    spec.endpoint = "/api/v1/file/trash";
    spec.json_body = json{{"fileIDs", id_list}}.dump();
    spec.timeout = config_.timeouts.metadata;

    OpResult out;
    auto r = call(spec, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        return out;
    }
    out.success = true;
    return out;
}

OpResult HttpRemoteApi::move(const std::vector<std::string>& ids, const std::string& to_parent_id,
                             const CancelToken* cancel) {
    json id_list = json::array();
    for (const auto& id : ids) id_list.push_back(id_json(id));

    CallSpec spec;
    spec.operation = "move";
    spec.target = ids.empty() ? to_parent_id : ids.front() + "->" + to_parent_id;
    spec.method = HttpMethod::POST;
    spec.endpoint = "/api/v1/file/move";
    spec.json_body = json{{"fileIDs", id_list}, {"toParentFileID", id_json(to_parent_id)}}.dump();
    spec.timeout = config_.timeouts.metadata;

    OpResult out;
    auto r = call(spec, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        return out;
    }
    out.success = true;
    return out;
}

OpResult HttpRemoteApi::rename(const std::string& id, const std::string& new_name,
                               const CancelToken* cancel) {
    CallSpec spec;
    spec.operation = "rename";
    spec.target = id;
    spec.method = HttpMethod::PUT;
    spec.endpoint = "/api/v1/file/name";
    spec.json_body = json{{"fileId", id_json(id)}, {"fileName", new_name}}.dump();
    spec.timeout = config_.timeouts.metadata;

    OpResult out;
    auto r = call(spec, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        return out;
    }
    out.success = true;
    return out;
}

}  // namespace panxfer
