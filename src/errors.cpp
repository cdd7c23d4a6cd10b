#include "panxfer/errors.hpp"

namespace panxfer {

const char* error_category_name(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "none";
        case ErrorCategory::ServerOverload: return "server_overload";
        case ErrorCategory::NetworkTimeout: return "network_timeout";
        case ErrorCategory::RateLimit: return "rate_limit";
        case ErrorCategory::UrlExpired: return "url_expired";
        case ErrorCategory::Auth: return "auth_error";
        case ErrorCategory::Permission: return "permission_error";
        case ErrorCategory::NotFound: return "not_found";
        case ErrorCategory::DataIntegrity: return "data_integrity";
        case ErrorCategory::ResourceExhausted: return "resource_exhausted";
        case ErrorCategory::Cancelled: return "cancelled";
        case ErrorCategory::Conflict: return "conflict";
        case ErrorCategory::Unknown: return "unknown";
    }
    return "unknown";
}

std::string TransferError::to_string() const {
    std::string out = operation.empty() ? "operation" : operation;
    if (!target.empty()) out += " " + target;
    out += ": ";
    out += error_category_name(category);
    if (attempts > 1) out += " after " + std::to_string(attempts) + " attempts";
    if (!message.empty() || http_status != 0) {
        out += ":";
        if (http_status != 0) out += " HTTP " + std::to_string(http_status);
        if (!message.empty()) out += " " + message;
    }
    if (failed_chunk >= 0) out += " [chunk " + std::to_string(failed_chunk) + "]";
    if (chunks_total > 0) {
        out += " (chunks " + std::to_string(chunks_done) + "/" +
               std::to_string(chunks_total) + ")";
    }
    return out;
}

TransferError TransferError::make(ErrorCategory category, std::string operation,
                                  std::string target, std::string message) {
    TransferError err;
    err.category = category;
    err.operation = std::move(operation);
    err.target = std::move(target);
    err.message = std::move(message);
    return err;
}

}  // namespace panxfer
