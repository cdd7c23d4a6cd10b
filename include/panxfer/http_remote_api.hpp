#pragma once

#include "panxfer/engine_config.hpp"
#include "panxfer/http.hpp"
#include "panxfer/rate_limiter.hpp"
#include "panxfer/remote_api.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace panxfer {

class CredentialProvider;
class RetryPolicy;

/// Counters for the metrics exporter.
struct RemoteApiStats {
    uint64_t requests = 0;
    uint64_t retries = 0;
    uint64_t rate_limited = 0;
    uint64_t auth_refreshes = 0;
};

/// RemoteApi over the provider's open-platform HTTP API.
///
/// Every call goes through one loop: wait for the endpoint class pacer, make
/// sure the credential is valid, execute, then classify failures (HTTP status
/// or the {code, message} envelope) with the shared RetryPolicy. Rate limits
/// are handed to the pacer, which holds back the next permit for that class;
/// an auth failure forces one credential refresh.
class HttpRemoteApi : public RemoteApi {
public:
    HttpRemoteApi(const EngineConfig& config, net::HttpTransport& transport,
                  RateLimiterRegistry& limiters, const RetryPolicy& retry,
                  CredentialProvider& credentials);
    ~HttpRemoteApi() override;

    std::string type_name() const override { return "http"; }

    ListResult list_children(const std::string& parent_id, const std::string& page_token,
                             size_t limit, const CancelToken* cancel) override;
    EntryResult get_entry(const std::string& id, const CancelToken* cancel) override;

    SessionOpenResult create_session(const CreateSessionRequest& request,
                                     const CancelToken* cancel) override;
    OpResult upload_chunk(const std::string& session_id, uint64_t index,
                          std::span<const uint8_t> data, const std::string& chunk_hash,
                          const CancelToken* cancel) override;
    CompleteResult complete_session(const std::string& session_id,
                                    const CancelToken* cancel) override;
    CompleteResult poll_session(const std::string& session_id, const CancelToken* cancel) override;
    CompleteResult upload_single(const CreateSessionRequest& request,
                                 std::span<const uint8_t> data,
                                 const CancelToken* cancel) override;

    ReadResult read_range(const std::string& file_id, uint64_t offset, uint64_t length,
                          const CancelToken* cancel) override;

    OpResult make_directory(const std::string& parent_id, const std::string& name,
                            const CancelToken* cancel) override;
    OpResult remove(const std::vector<std::string>& ids, const CancelToken* cancel) override;
    OpResult move(const std::vector<std::string>& ids, const std::string& to_parent_id,
                  const CancelToken* cancel) override;
    OpResult rename(const std::string& id, const std::string& new_name,
                    const CancelToken* cancel) override;

    RemoteApiStats stats() const;

private:
    struct CallSpec;
    struct CallResult;

    CallResult call(const CallSpec& spec, const CancelToken* cancel);
    std::string download_url(const std::string& file_id, bool refresh, const CancelToken* cancel,
                             TransferError& error);

    EngineConfig config_;
    net::HttpTransport& transport_;
    RateLimiterRegistry& limiters_;
    const RetryPolicy& retry_;
    CredentialProvider& credentials_;

    // Signed download URLs, reused until the CDN rejects them
    std::mutex url_mutex_;
    std::unordered_map<std::string, std::string> download_urls_;

    std::atomic<uint64_t> requests_{0};
    std::atomic<uint64_t> retries_{0};
    std::atomic<uint64_t> rate_limited_{0};
    std::atomic<uint64_t> auth_refreshes_{0};
};

}  // namespace panxfer
