#include "panxfer/rate_limiter.hpp"
#include "panxfer/sync.hpp"

#include <algorithm>

namespace panxfer {

namespace {

struct EndpointRoute {
    const char* path;
    EndpointClass cls;
};

// First match wins. Quotas per family as published by the provider.
constexpr EndpointRoute kEndpointRoutes[] = {
    {"/api/v2/file/list", EndpointClass::List},
    {"/api/v1/file/detail", EndpointClass::List},
    {"/api/v1/user/info", EndpointClass::List},
    {"/upload/v2/file/slice", EndpointClass::Upload},
    {"/upload/v2/file/upload_complete", EndpointClass::Download},
    {"/upload/v1/file/upload_async_result", EndpointClass::Download},
    {"/api/v1/file/download_info", EndpointClass::Download},
    {"/upload/v2/file/single/create", EndpointClass::Strict},
    {"/upload/v2/file/create", EndpointClass::Strict},
    {"/upload/v1/file/mkdir", EndpointClass::Strict},
    {"/api/v1/file/trash", EndpointClass::Strict},
    {"/api/v1/file/move", EndpointClass::Strict},
    {"/api/v1/file/name", EndpointClass::Strict},
    {"/api/v1/file/delete", EndpointClass::Batch},
    {"/api/v1/access_token", EndpointClass::Token},
};

constexpr auto kPollSlice = std::chrono::milliseconds(50);

size_t index_of(EndpointClass cls) { return static_cast<size_t>(cls); }

}  // namespace

const char* endpoint_class_name(EndpointClass cls) {
    switch (cls) {
        case EndpointClass::List: return "list";
        case EndpointClass::Download: return "download";
        case EndpointClass::Upload: return "upload";
        case EndpointClass::Strict: return "strict";
        case EndpointClass::Batch: return "batch";
        case EndpointClass::Token: return "token";
    }
    return "strict";
}

// ============================================================================
// Pacer
// ============================================================================

Pacer::Pacer(const PacerClass& cls) : class_(cls), sleep_(cls.min_sleep) {}

void Pacer::skip_abandoned_locked() {
    while (!abandoned_.empty() && *abandoned_.begin() == serving_) {
        abandoned_.erase(abandoned_.begin());
        ++serving_;
    }
}

bool Pacer::acquire(const CancelToken* cancel) {
    std::unique_lock lock(mutex_);
    const uint64_t ticket = next_ticket_++;

    while (true) {
        skip_abandoned_locked();
        auto now = std::chrono::steady_clock::now();

        if (serving_ == ticket) {
            if (now >= next_allowed_) {
                next_allowed_ = now + sleep_;
                ++serving_;
                ++permits_;
                skip_abandoned_locked();
                cv_.notify_all();
                return true;
            }
            if (is_cancelled(cancel)) {
                ++serving_;
                skip_abandoned_locked();
                cv_.notify_all();
                return false;
            }
            cv_.wait_until(lock, std::min(next_allowed_, now + kPollSlice));
        } else {
            if (is_cancelled(cancel)) {
                abandoned_.insert(ticket);
                return false;
            }
            cv_.wait_for(lock, kPollSlice);
        }
    }
}

void Pacer::on_success() {
    std::lock_guard lock(mutex_);
    auto decayed = sleep_ - std::chrono::milliseconds(sleep_.count() >> class_.decay_constant);
    sleep_ = std::max(class_.min_sleep, decayed);
}

void Pacer::on_backoff() {
    std::lock_guard lock(mutex_);
    sleep_ = std::clamp(sleep_ * 2, class_.min_sleep, class_.max_sleep);
    next_allowed_ = std::max(next_allowed_, std::chrono::steady_clock::now() + sleep_);
}

void Pacer::on_rate_limited(std::chrono::milliseconds forced_min) {
    {
        std::lock_guard lock(mutex_);
        sleep_ = std::clamp(sleep_ * 2, class_.min_sleep, class_.max_sleep);
        next_allowed_ = std::max(next_allowed_,
                                 std::chrono::steady_clock::now() + std::max(forced_min, sleep_));
        ++rate_limits_;
    }
    cv_.notify_all();
}

std::chrono::milliseconds Pacer::current_sleep() const {
    std::lock_guard lock(mutex_);
    return sleep_;
}

uint64_t Pacer::permits_granted() const {
    std::lock_guard lock(mutex_);
    return permits_;
}

uint64_t Pacer::rate_limit_signals() const {
    std::lock_guard lock(mutex_);
    return rate_limits_;
}

// ============================================================================
// RateLimiterRegistry
// ============================================================================

RateLimiterRegistry::RateLimiterRegistry(const PacerSettings& settings) {
    auto make = [&](EndpointClass id, std::chrono::milliseconds min_sleep) {
        PacerClass cls;
        cls.id = id;
        cls.min_sleep = min_sleep;
        cls.max_sleep = std::max(settings.max_sleep, min_sleep);
        cls.decay_constant = settings.decay_constant;
        pacers_[index_of(id)] = std::make_unique<Pacer>(cls);
    };
    make(EndpointClass::List, settings.list_min_sleep);
    make(EndpointClass::Download, settings.download_min_sleep);
    make(EndpointClass::Upload, settings.upload_min_sleep);
    make(EndpointClass::Strict, settings.strict_min_sleep);
    make(EndpointClass::Batch, settings.batch_min_sleep);
    make(EndpointClass::Token, settings.token_min_sleep);

    auto strictest_sleep = std::chrono::milliseconds::min();
    for (const auto& p : pacers_) {
        if (p->pacer_class().min_sleep > strictest_sleep) {
            strictest_sleep = p->pacer_class().min_sleep;
            strictest_ = p->pacer_class().id;
        }
    }
}

std::optional<EndpointClass> RateLimiterRegistry::lookup_endpoint(const std::string& endpoint) {
    for (const auto& route : kEndpointRoutes) {
        if (endpoint.find(route.path) != std::string::npos) return route.cls;
    }
    return std::nullopt;
}

EndpointClass RateLimiterRegistry::classify_endpoint(const std::string& endpoint) const {
    return lookup_endpoint(endpoint).value_or(strictest_);
}

Pacer& RateLimiterRegistry::pacer(EndpointClass cls) {
    return *pacers_[index_of(cls)];
}

Pacer& RateLimiterRegistry::pacer_for_endpoint(const std::string& endpoint) {
    return pacer(classify_endpoint(endpoint));
}

}  // namespace panxfer
