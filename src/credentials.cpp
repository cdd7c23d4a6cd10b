#include "panxfer/credentials.hpp"
#include "panxfer/log.hpp"

namespace panxfer {

TokenCredentialProvider::TokenCredentialProvider(Token token, Refresher refresher,
                                                 std::chrono::seconds refresh_margin)
    : token_(std::move(token))
    , refresher_(std::move(refresher))
    , refresh_margin_(refresh_margin) {}

bool TokenCredentialProvider::refresh_locked() {
    if (!refresher_) return false;
    auto fresh = refresher_();
    if (!fresh || fresh->value.empty()) {
        log_warn("Credential refresh failed");
        return false;
    }
    token_ = std::move(*fresh);
    ++refreshes_;
    log_debug("Credential refreshed (refresh #%llu)", static_cast<unsigned long long>(refreshes_));
    return true;
}

bool TokenCredentialProvider::ensure_valid() {
    std::lock_guard lock(mutex_);
    bool near_expiry = token_.expiry &&
        std::chrono::system_clock::now() + refresh_margin_ >= *token_.expiry;
    if (token_.value.empty() || near_expiry) {
        if (refresh_locked()) return true;
        // A token within the margin is still usable until it actually expires
        return !token_.value.empty() &&
               (!token_.expiry || std::chrono::system_clock::now() < *token_.expiry);
    }
    return true;
}

bool TokenCredentialProvider::force_refresh() {
    std::lock_guard lock(mutex_);
    return refresh_locked();
}

std::string TokenCredentialProvider::bearer_token() const {
    std::lock_guard lock(mutex_);
    return token_.value;
}

std::optional<std::chrono::system_clock::time_point> TokenCredentialProvider::expiry() const {
    std::lock_guard lock(mutex_);
    return token_.expiry;
}

uint64_t TokenCredentialProvider::refresh_count() const {
    std::lock_guard lock(mutex_);
    return refreshes_;
}

}  // namespace panxfer
