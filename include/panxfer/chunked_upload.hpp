#pragma once

#include "panxfer/chunk_progress.hpp"
#include "panxfer/engine_config.hpp"
#include "panxfer/errors.hpp"
#include "panxfer/upload_session.hpp"

#include <cstdint>
#include <string>

namespace panxfer {

class CancelToken;
class MetricsExporter;
class RemoteApi;
class RetryPolicy;
class TransferLedger;
class TransferSource;

struct ChunkRunResult {
    bool success = false;
    std::string digest;            // whole-file MD5 assembled from the chunks
    uint64_t chunks_uploaded = 0;  // transferred by this run
    uint64_t chunks_skipped = 0;   // uploaded by an earlier run and re-verified
    uint64_t chunks_retried = 0;
    uint64_t chunks_reverify_failed = 0;
    uint64_t bytes_uploaded = 0;
    TransferError error;
};

/// Transfers the chunks of one session with a bounded worker pool.
///
/// Per chunk: pending -> uploading -> uploaded, or failed -> pending while
/// attempts remain, after the retry policy's delay for the error. Progress is
/// saved after every transition so a restarted process skips chunks the
/// provider already accepted; those are re-hashed from the source first and
/// re-queued if they no longer match. The first
/// non-retryable failure, or a progress write that does not persist, cancels the
/// remaining workers and is reported with the failing chunk index and the
/// completed/total counts.
class ChunkedUploader {
public:
    ChunkedUploader(RemoteApi& api, ProgressStore& progress, TransferLedger* ledger,
                    const UploadSettings& settings, const RetryPolicy& retry,
                    ThroughputEstimator& throughput, MetricsExporter* metrics = nullptr);

    /// Upload every pending chunk of `session` from `source`, which must be
    /// seekable or range-readable. Leaves the session in Completing on success
    /// and Aborted otherwise.
    ChunkRunResult run(UploadSession& session, TransferSource& source, const CancelToken* cancel);

    /// Whether a failed chunk upload with this error is worth another attempt.
    static bool retryable_chunk_error(const TransferError& error);

private:
    SessionProgress load_or_create(const UploadSession& session);

    RemoteApi& api_;
    ProgressStore& progress_;
    TransferLedger* ledger_;
    UploadSettings settings_;
    const RetryPolicy& retry_;
    ThroughputEstimator& throughput_;
    MetricsExporter* metrics_;
};

}  // namespace panxfer
