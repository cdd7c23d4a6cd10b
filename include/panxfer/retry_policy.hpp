#pragma once

#include "panxfer/engine_config.hpp"
#include "panxfer/errors.hpp"

#include <chrono>
#include <mutex>
#include <random>
#include <string>

namespace panxfer {

/// Outcome of classifying one failed attempt.
struct Classification {
    ErrorCategory category = ErrorCategory::Unknown;
    bool retryable = false;
    std::chrono::milliseconds delay{0};
};

/// Raw description of a failed attempt, as seen by a network call site.
struct AttemptFailure {
    std::string message;
    int http_status = 0;        // HTTP status or provider envelope code
    bool network_error = false; // transport-level failure (no HTTP exchange)
};

/// Single retry policy consulted by every network call site.
///
/// - server overload, network timeout, expired URL and network-shaped unknown
///   errors back off exponentially with jitter;
/// - rate limits wait at least the forced minimum regardless of attempt count;
/// - auth errors are retryable once, after the caller forces a credential refresh;
/// - permission and not-found errors surface immediately.
class RetryPolicy {
public:
    explicit RetryPolicy(const RetrySettings& settings);

    Classification classify(const AttemptFailure& failure, int attempt) const;

    /// Map an error to its category without deciding on retry.
    static ErrorCategory categorize(const AttemptFailure& failure);

    /// Wait before retrying an error of `category` after zero-based `attempt`.
    /// Rate limits never wait less than the forced minimum.
    std::chrono::milliseconds delay_for(ErrorCategory category, int attempt) const;

    /// Exponential delay for zero-based `attempt`, jittered, capped at max_delay.
    std::chrono::milliseconds backoff_delay(int attempt) const;

    int max_attempts() const { return settings_.max_attempts; }
    std::chrono::milliseconds rate_limit_delay() const { return settings_.rate_limit_delay; }
    const RetrySettings& settings() const { return settings_; }

private:
    RetrySettings settings_;
    mutable std::mutex rng_mutex_;
    mutable std::mt19937_64 rng_;
};

}  // namespace panxfer
