#include "panxfer/completion.hpp"
#include "panxfer/log.hpp"
#include "panxfer/remote_api.hpp"
#include "panxfer/sync.hpp"

#include <algorithm>

namespace panxfer {

namespace {

// Errors that mean "could not ask", as opposed to "asked and it failed"
bool transient(const TransferError& error) {
    switch (error.category) {
        case ErrorCategory::NetworkTimeout:
        case ErrorCategory::ServerOverload:
        case ErrorCategory::RateLimit:
            return true;
        case ErrorCategory::Unknown:
            return error.http_status == 0 || error.http_status >= 500;
        default:
            return false;
    }
}

}  // namespace

CompletionPoller::CompletionPoller(RemoteApi& api, const CompletionSettings& settings)
    : api_(api), settings_(settings) {}

std::chrono::milliseconds CompletionPoller::interval_for(int poll) const {
    using std::chrono::milliseconds;
    if (poll < settings_.ramp_polls) {
        return settings_.step * (poll + 1);
    }
    if (poll < settings_.late_after) {
        return settings_.plateau;
    }
    milliseconds grown = settings_.late_start + settings_.step * (poll - settings_.late_after);
    return std::min(grown, settings_.max_interval);
}

int CompletionPoller::max_polls_for(uint64_t size) const {
    uint64_t gib = (size + GiB - 1) / GiB;
    uint64_t budget = static_cast<uint64_t>(settings_.base_polls) +
                      static_cast<uint64_t>(settings_.polls_per_gib) * gib;
    return static_cast<int>(std::min<uint64_t>(budget, static_cast<uint64_t>(settings_.max_polls)));
}

CompletionOutcome CompletionPoller::complete(const std::string& session_id, uint64_t total_size,
                                             const std::string& target,
                                             const CancelToken* cancel) {
    CompletionOutcome out;

    auto r = api_.complete_session(session_id, cancel);
    if (!r.success) {
        out.error = std::move(r.error);
        out.error.operation = "complete";
        out.error.target = target;
        return out;
    }
    if (r.completed) {
        out.success = true;
        out.file_id = r.file_id;
        out.content_hash = r.content_hash;
        return out;
    }

    out.async = true;
    const int budget = max_polls_for(total_size);
    int consecutive_failures = 0;
    log_debug("Completion of %s is asynchronous, polling (budget %d)", target.c_str(), budget);

    for (int poll = 0; poll < budget; ++poll) {
        if (!cancellable_sleep(cancel, interval_for(poll))) {
            out.error = TransferError::make(ErrorCategory::Cancelled, "complete", target,
                                            "cancelled while waiting for completion");
            return out;
        }

        ++out.polls;
        auto p = api_.poll_session(session_id, cancel);
        if (p.success) {
            consecutive_failures = 0;
            if (p.completed) {
                out.success = true;
                out.file_id = p.file_id;
                out.content_hash = p.content_hash;
                log_debug("Completion of %s confirmed after %d polls", target.c_str(), out.polls);
                return out;
            }
            continue;
        }

        if (p.error.category == ErrorCategory::Cancelled) {
            out.error = std::move(p.error);
            out.error.operation = "complete";
            out.error.target = target;
            return out;
        }
        if (!transient(p.error)) {
            out.error = std::move(p.error);
            out.error.operation = "complete";
            out.error.target = target;
            out.error.attempts = out.polls;
            return out;
        }

        ++out.network_failures;
        if (++consecutive_failures > settings_.max_consecutive_failures) {
            out.error = std::move(p.error);
            out.error.operation = "complete";
            out.error.target = target;
            out.error.attempts = out.polls;
            out.error.message = "provider unreachable while polling: " + out.error.message;
            return out;
        }
        log_debug("Poll %d for %s failed (%s), tolerated %d/%d", out.polls, target.c_str(),
                  p.error.to_string().c_str(), consecutive_failures,
                  settings_.max_consecutive_failures);
    }

    out.error = TransferError::make(ErrorCategory::NetworkTimeout, "complete", target,
                                    "provider still processing after " +
                                        std::to_string(out.polls) + " polls");
    out.error.attempts = out.polls;
    return out;
}

}  // namespace panxfer
