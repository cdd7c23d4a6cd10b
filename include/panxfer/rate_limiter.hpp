#pragma once

#include "panxfer/engine_config.hpp"

#include <array>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

namespace panxfer {

class CancelToken;

/// Endpoint families with independent provider quotas.
enum class EndpointClass {
    List,      // listing, entry detail
    Download,  // download info, completion, async polling
    Upload,    // chunk uploads
    Strict,    // create, mkdir, trash, move, rename
    Batch,     // permanent delete
    Token,     // access token
};

constexpr size_t kEndpointClassCount = 6;

const char* endpoint_class_name(EndpointClass cls);

/// Pacing parameters for one endpoint class.
struct PacerClass {
    EndpointClass id = EndpointClass::Strict;
    std::chrono::milliseconds min_sleep{250};
    std::chrono::milliseconds max_sleep{30000};
    unsigned decay_constant = 2;
};

/// Minimum-spacing gate for one endpoint class. Permits are granted in FIFO
/// order; each grant pushes the next permit out by the current sleep. Backoff
/// signals double the sleep up to max_sleep, successes decay it back toward
/// min_sleep by a factor of (2^d - 1) / 2^d.
class Pacer {
public:
    explicit Pacer(const PacerClass& cls);

    Pacer(const Pacer&) = delete;
    Pacer& operator=(const Pacer&) = delete;

    /// Block until this caller may issue a request. Returns false if the
    /// token fired while waiting (no permit consumed).
    bool acquire(const CancelToken* cancel = nullptr);

    void on_success();
    void on_backoff();

    /// Provider throttled us: no permit is granted before `forced_min` elapses.
    void on_rate_limited(std::chrono::milliseconds forced_min);

    std::chrono::milliseconds current_sleep() const;
    const PacerClass& pacer_class() const { return class_; }
    uint64_t permits_granted() const;
    uint64_t rate_limit_signals() const;

private:
    void skip_abandoned_locked();

    const PacerClass class_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    uint64_t next_ticket_ = 0;
    uint64_t serving_ = 0;
    std::set<uint64_t> abandoned_;
    std::chrono::steady_clock::time_point next_allowed_{};
    std::chrono::milliseconds sleep_;
    uint64_t permits_ = 0;
    uint64_t rate_limits_ = 0;
};

/// One pacer per endpoint class, built from PacerSettings. Owned by the engine
/// context; nothing here is global.
class RateLimiterRegistry {
public:
    explicit RateLimiterRegistry(const PacerSettings& settings);

    /// Static endpoint table lookup (substring match on the request path).
    static std::optional<EndpointClass> lookup_endpoint(const std::string& endpoint);

    /// Like lookup_endpoint, but unknown endpoints map to the strictest class.
    EndpointClass classify_endpoint(const std::string& endpoint) const;

    /// Class with the largest minimum sleep.
    EndpointClass strictest() const { return strictest_; }

    Pacer& pacer(EndpointClass cls);
    Pacer& pacer_for_endpoint(const std::string& endpoint);

private:
    std::array<std::unique_ptr<Pacer>, kEndpointClassCount> pacers_;
    EndpointClass strictest_ = EndpointClass::Strict;
};

}  // namespace panxfer
