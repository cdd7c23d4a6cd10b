#pragma once

#include <cstdint>
#include <string>

namespace panxfer {

/// Terminal error categories. Names returned by error_category_name() are stable
/// and appear in logs, metrics labels and ledger rows.
enum class ErrorCategory {
    None,
    ServerOverload,     // 5xx
    NetworkTimeout,     // timeout, reset, refused
    RateLimit,          // 429 or provider throttling code
    UrlExpired,         // signed upload/download URL no longer valid
    Auth,               // 401, credential expiry
    Permission,         // 403
    NotFound,           // 404
    DataIntegrity,      // hash/size mismatch, corrupted cache entry
    ResourceExhausted,  // too many chunks, memory/disk denied
    Cancelled,
    Conflict,           // name already taken
    Unknown,
};

const char* error_category_name(ErrorCategory category);

/// User-visible failure description. Every terminal failure carries the
/// operation name, the affected path or identifier, and the category.
struct TransferError {
    ErrorCategory category = ErrorCategory::None;
    std::string operation;
    std::string target;
    std::string message;
    int http_status = 0;
    int attempts = 0;

    // Chunked transfers only (chunks_total == 0 otherwise).
    uint64_t chunks_done = 0;
    uint64_t chunks_total = 0;
    int64_t failed_chunk = -1;

    bool empty() const { return category == ErrorCategory::None; }

    /// e.g. "upload /a/b.bin: rate_limit after 8 attempts: HTTP 429 throttled (chunks 3/6)"
    std::string to_string() const;

    static TransferError make(ErrorCategory category, std::string operation,
                              std::string target, std::string message);
};

}  // namespace panxfer
