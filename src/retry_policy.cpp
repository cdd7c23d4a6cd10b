#include "panxfer/retry_policy.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>

namespace panxfer {

namespace {

std::string lower(const std::string& s) {
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return out;
}

bool contains_any(const std::string& haystack, std::initializer_list<const char*> needles) {
    for (const char* n : needles) {
        if (haystack.find(n) != std::string::npos) return true;
    }
    return false;
}

}  // namespace

RetryPolicy::RetryPolicy(const RetrySettings& settings)
    : settings_(settings), rng_(std::random_device{}()) {}

ErrorCategory RetryPolicy::categorize(const AttemptFailure& failure) {
    const int status = failure.http_status;
    const std::string text = lower(failure.message);

    if (status == 429 || contains_any(text, {"too many requests", "rate limit", "throttl"})) {
        return ErrorCategory::RateLimit;
    }
    if (status == 401 || contains_any(text, {"unauthorized", "token expired",
                                            "invalid token", "access_token"})) {
        return ErrorCategory::Auth;
    }
    if (status == 403 || contains_any(text, {"forbidden", "permission denied"})) {
        return ErrorCategory::Permission;
    }
    if (status == 409 || contains_any(text, {"already exists", "same name", "name conflict"})) {
        return ErrorCategory::Conflict;
    }
    if (status == 404 || contains_any(text, {"not found", "no such file", "does not exist"})) {
        return ErrorCategory::NotFound;
    }
    if (contains_any(text, {"url expired", "link expired", "signature expired",
                            "request has expired", "expired url"})) {
        return ErrorCategory::UrlExpired;
    }
    if (status == 500 || status == 502 || status == 503 || status == 504 ||
        contains_any(text, {"bad gateway", "service unavailable", "gateway timeout",
                            "server overload", "server busy"})) {
        return ErrorCategory::ServerOverload;
    }
    if (contains_any(text, {"timeout", "timed out", "connection reset", "connection refused",
                            "couldn't connect", "broken pipe", "failure when receiving",
                            "failure when sending", "could not resolve", "unexpected eof"})) {
        return ErrorCategory::NetworkTimeout;
    }
    return ErrorCategory::Unknown;
}

Classification RetryPolicy::classify(const AttemptFailure& failure, int attempt) const {
    Classification c;
    c.category = categorize(failure);

    switch (c.category) {
        case ErrorCategory::RateLimit:
        case ErrorCategory::ServerOverload:
        case ErrorCategory::NetworkTimeout:
        case ErrorCategory::UrlExpired:
            c.retryable = true;
            break;
        case ErrorCategory::Auth:
            // Caller retries once after a forced refresh
            c.retryable = true;
            break;
        case ErrorCategory::Permission:
        case ErrorCategory::NotFound:
            c.retryable = false;
            break;
        default:
            // Unknown errors are retried only when they look network-shaped
            c.retryable = failure.network_error || (failure.http_status >= 500);
            break;
    }
    if (c.retryable) c.delay = delay_for(c.category, attempt);

    if (attempt + 1 >= settings_.max_attempts) c.retryable = false;
    return c;
}

std::chrono::milliseconds RetryPolicy::delay_for(ErrorCategory category, int attempt) const {
    switch (category) {
        case ErrorCategory::RateLimit:
            return std::max(settings_.rate_limit_delay, backoff_delay(attempt));
        case ErrorCategory::Auth:
        case ErrorCategory::Permission:
        case ErrorCategory::NotFound:
        case ErrorCategory::Cancelled:
            return std::chrono::milliseconds(0);
        default:
            return backoff_delay(attempt);
    }
}

std::chrono::milliseconds RetryPolicy::backoff_delay(int attempt) const {
    double base = static_cast<double>(settings_.base_delay.count());
    double raw = base * std::pow(settings_.multiplier, std::max(attempt, 0));
    double capped = std::min(raw, static_cast<double>(settings_.max_delay.count()));

    double factor = 1.0;
    if (settings_.jitter > 0.0) {
        std::lock_guard lock(rng_mutex_);
        std::uniform_real_distribution<double> dist(1.0 - settings_.jitter, 1.0 + settings_.jitter);
        factor = dist(rng_);
    }
    double jittered = std::min(capped * factor, static_cast<double>(settings_.max_delay.count()));
    return std::chrono::milliseconds(static_cast<int64_t>(jittered));
}

}  // namespace panxfer
