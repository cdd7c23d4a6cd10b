#pragma once

#include "panxfer/engine_config.hpp"
#include "panxfer/errors.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace panxfer {

class CancelToken;
class RemoteApi;

struct CompletionOutcome {
    bool success = false;
    std::string file_id;
    std::string content_hash;
    bool async = false;   // provider asked us to poll
    int polls = 0;
    int network_failures = 0;
    TransferError error;
};

/// Closes an upload session. Synchronous completions return immediately;
/// asynchronous ones are polled with a ramp (step * n), a plateau, then a slow
/// growth up to max_interval. The poll budget grows with the file size.
/// Transient failures are tolerated up to max_consecutive_failures in a row;
/// a "still processing" answer resets that count.
class CompletionPoller {
public:
    CompletionPoller(RemoteApi& api, const CompletionSettings& settings);

    CompletionOutcome complete(const std::string& session_id, uint64_t total_size,
                               const std::string& target, const CancelToken* cancel);

    /// Wait before poll number `poll` (zero-based).
    std::chrono::milliseconds interval_for(int poll) const;

    /// Poll budget for a file of `size` bytes.
    int max_polls_for(uint64_t size) const;

    const CompletionSettings& settings() const { return settings_; }

private:
    RemoteApi& api_;
    CompletionSettings settings_;
};

}  // namespace panxfer
