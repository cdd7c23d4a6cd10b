#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace panxfer {

/// Supplies the bearer credential for API calls. Acquisition and renewal
/// scheduling live outside the engine; the engine only asks for a valid token
/// before each request and forces one refresh after an auth failure.
class CredentialProvider {
public:
    virtual ~CredentialProvider() = default;

    /// Make sure the current token is usable, refreshing if it is near expiry.
    virtual bool ensure_valid() = 0;

    /// Refresh unconditionally (after the provider rejected the token).
    virtual bool force_refresh() = 0;

    virtual std::string bearer_token() const = 0;
    virtual std::optional<std::chrono::system_clock::time_point> expiry() const = 0;
};

/// Token plus optional refresh hook. Without a hook, refreshes fail and an
/// expired token stays expired.
class TokenCredentialProvider : public CredentialProvider {
public:
    struct Token {
        std::string value;
        std::optional<std::chrono::system_clock::time_point> expiry;
    };
    using Refresher = std::function<std::optional<Token>()>;

    TokenCredentialProvider(Token token, Refresher refresher = nullptr,
                            std::chrono::seconds refresh_margin = std::chrono::seconds(300));

    bool ensure_valid() override;
    bool force_refresh() override;
    std::string bearer_token() const override;
    std::optional<std::chrono::system_clock::time_point> expiry() const override;

    uint64_t refresh_count() const;

private:
    bool refresh_locked();

    mutable std::mutex mutex_;
    Token token_;
    Refresher refresher_;
    std::chrono::seconds refresh_margin_;
    uint64_t refreshes_ = 0;
};

}  // namespace panxfer
