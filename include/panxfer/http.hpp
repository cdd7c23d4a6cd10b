#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace panxfer {
class CancelToken;
}

namespace panxfer::net {

enum class HttpMethod {
    GET,
    POST,
    PUT,
    DELETE,
};

bool is_success_status(int status);

/// Percent-encode for query strings (RFC 3986 unreserved set kept).
std::string url_encode(const std::string& str);

// HTTP headers (case-insensitive)
class HttpHeaders {
public:
    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    std::optional<std::string> get(const std::string& name) const;

    using HeaderPair = std::pair<std::string, std::string>;
    std::vector<HeaderPair> all() const;

    void set_content_type(const std::string& content_type);
    void set_bearer_token(const std::string& token);

private:
    // Headers stored as lowercase name -> values
    std::map<std::string, std::vector<std::string>> headers_;

    static std::string normalize_name(const std::string& name);
};

/// Pull-style body source for streaming uploads. Fill up to `len` bytes into
/// `buf` and return the count; 0 ends the body.
using BodyReader = std::function<size_t(char* buf, size_t len)>;

struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    std::string url;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    // Streaming body; takes precedence over `body` when set.
    BodyReader body_reader;
    uint64_t body_size = 0;

    // Timeouts are per call; callers pick them by operation size class.
    std::chrono::milliseconds connect_timeout{10000};
    std::chrono::milliseconds total_timeout{30000};

    // Range request: start, end (inclusive)
    std::optional<std::pair<uint64_t, uint64_t>> byte_range;

    // Polled during transfer; a fired token aborts the request.
    const CancelToken* cancel = nullptr;

    void set_json_body(const std::string& json);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::vector<uint8_t> body;

    bool ok() const { return is_success_status(status_code); }

    // Error info (for failed requests)
    std::string error;
    bool is_network_error = false;  // network-level failure, not an HTTP status
    bool cancelled = false;
};

/// Request/response executor. The engine talks to providers only through this
/// interface so tests can script responses.
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResponse execute(const HttpRequest& request) = 0;
};

struct HttpClientConfig {
    size_t max_total_connections = 64;
    size_t max_idle_connections = 16;

    // TCP keep-alive to prevent idle connections from being dropped by firewalls/LBs
    bool tcp_keepalive = true;
    std::chrono::seconds tcp_keepalive_idle{60};
    std::chrono::seconds tcp_keepalive_interval{15};

    // Response size limit (0 = unlimited). Ranged reads are bounded by the chunk size.
    size_t max_response_size = 1024ULL * 1024 * 1024;

    bool verify_ssl = true;
    std::string ca_bundle;
    std::string user_agent = "panxfer/0.1";
    std::string proxy_url;
    std::chrono::seconds dns_cache_timeout{60};
    bool verbose = false;
};

/// libcurl-backed transport with a pool of reusable easy handles.
class HttpClient : public HttpTransport {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse execute(const HttpRequest& request) override;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace panxfer::net
