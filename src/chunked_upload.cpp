#include "panxfer/chunked_upload.hpp"
#include "panxfer/hash_accumulator.hpp"
#include "panxfer/hash_util.hpp"
#include "panxfer/log.hpp"
#include "panxfer/metrics.hpp"
#include "panxfer/remote_api.hpp"
#include "panxfer/retry_policy.hpp"
#include "panxfer/sync.hpp"
#include "panxfer/transfer_ledger.hpp"
#include "panxfer/transfer_source.hpp"

#include <chrono>
#include <thread>
#include <vector>

namespace panxfer {

namespace {

/// Outcome a worker reports for one chunk.
struct ChunkOutcome {
    uint64_t index = 0;
    bool success = false;
    bool cancelled = false;
    bool source_failed = false;  // local read error, not worth retrying
    std::string hash;
    std::chrono::steady_clock::duration elapsed{};
    TransferError error;
};

/// Queued chunk; retries carry the earliest time they may be sent again.
struct ChunkTask {
    uint64_t index = 0;
    std::chrono::steady_clock::time_point not_before{};
};

}  // namespace

ChunkedUploader::ChunkedUploader(RemoteApi& api, ProgressStore& progress, TransferLedger* ledger,
                                 const UploadSettings& settings, const RetryPolicy& retry,
                                 ThroughputEstimator& throughput, MetricsExporter* metrics)
    : api_(api)
    , progress_(progress)
    , ledger_(ledger)
    , settings_(settings)
    , retry_(retry)
    , throughput_(throughput)
    , metrics_(metrics) {}

bool ChunkedUploader::retryable_chunk_error(const TransferError& error) {
    switch (error.category) {
        case ErrorCategory::ServerOverload:
        case ErrorCategory::NetworkTimeout:
        case ErrorCategory::RateLimit:
        case ErrorCategory::UrlExpired:
        case ErrorCategory::DataIntegrity:
            return true;
        case ErrorCategory::Unknown:
            return error.http_status == 0 || error.http_status >= 500;
        default:
            return false;
    }
}

SessionProgress ChunkedUploader::load_or_create(const UploadSession& session) {
    if (auto loaded = progress_.load(session.session_id)) {
        if (loaded->total_size == session.total_size && loaded->chunk_size == session.chunk_size &&
            loaded->content_hash == session.content_hash) {
            return std::move(*loaded);
        }
        log_warn("Progress for session %s has different geometry, starting over",
                 session.session_id.c_str());
    }

    auto p = SessionProgress::create(session.session_id, session.total_size, session.chunk_size);
    p.target_path = session.target_path;
    p.parent_id = session.parent_id;
    p.name = session.name;
    p.content_hash = session.content_hash;
    p.created_at = session.created_at;
    return p;
}

ChunkRunResult ChunkedUploader::run(UploadSession& session, TransferSource& source,
                                    const CancelToken* cancel) {
    ChunkRunResult result;
    const std::string& target = session.target_path;

    auto fail = [&](ErrorCategory category, std::string message) {
        result.error = TransferError::make(category, "upload", target, std::move(message));
        session.state = SessionState::Aborted;
        return result;
    };

    auto caps = source.capabilities();
    if (!caps.seekable && !caps.range_readable) {
        return fail(ErrorCategory::DataIntegrity,
                    "chunked upload needs a seekable or range-readable source");
    }
    if (auto size = source.size(); size && *size != session.total_size) {
        return fail(ErrorCategory::DataIntegrity,
                    "source size " + std::to_string(*size) + " differs from session size " +
                        std::to_string(session.total_size));
    }

    session.state = SessionState::Transferring;
    if (ledger_) ledger_->update_state(session.session_id, session_state_name(session.state));

    SessionProgress progress = load_or_create(session);
    StreamingHashAccumulator accumulator(session.total_size, session.chunk_size);

    // Re-verify chunks an earlier run uploaded; this also feeds the digest
    bool changed = false;
    std::vector<uint8_t> buf;
    for (auto& rec : progress.chunks) {
        if (!rec.uploaded) continue;
        if (is_cancelled(cancel)) break;
        buf.resize(rec.size);
        bool ok = source.read_at(rec.offset, buf.data(), buf.size()) &&
                  Hasher::md5_hex(std::span<const uint8_t>(buf)) == rec.hash;
        if (ok) {
            accumulator.write_chunk(rec.index, buf);
            ++result.chunks_skipped;
            if (metrics_) metrics_->chunks_skipped().Increment();
        } else {
            log_warn("Chunk %llu of %s failed verification, re-queuing",
                     static_cast<unsigned long long>(rec.index), target.c_str());
            rec.uploaded = false;
            rec.hash.clear();
            changed = true;
            ++result.chunks_reverify_failed;
            if (metrics_) metrics_->chunks_reverify_failed().Increment();
        }
    }
    buf.clear();
    buf.shrink_to_fit();
    if ((changed || result.chunks_skipped == 0) && !progress_.save(progress)) {
        fail(ErrorCategory::ResourceExhausted, "could not persist chunk progress");
        result.error.chunks_done = progress.uploaded_count();
        result.error.chunks_total = progress.total_chunks;
        return result;
    }

    std::vector<uint64_t> pending;
    for (const auto& rec : progress.chunks) {
        if (!rec.uploaded) pending.push_back(rec.index);
    }
    if (result.chunks_skipped > 0) {
        log_info("Resuming %s: %llu of %llu chunks already uploaded", target.c_str(),
                 static_cast<unsigned long long>(result.chunks_skipped),
                 static_cast<unsigned long long>(progress.total_chunks));
    }

    // Session-scoped token: fires on the caller's cancel or on a fatal chunk error
    CancelToken session_cancel(cancel);
    Channel<ChunkTask> work;
    Channel<ChunkOutcome> results;
    std::vector<std::thread> workers;

    const size_t worker_count =
        plan_worker_count(pending.size(), throughput_.bytes_per_second(), settings_);
    for (uint64_t index : pending) work.push(ChunkTask{index, {}});

    for (size_t w = 0; w < worker_count; ++w) {
        workers.emplace_back([&] {
            std::vector<uint8_t> data;
            while (auto task = work.pop()) {
                ChunkOutcome out;
                out.index = task->index;
                auto wait = task->not_before - std::chrono::steady_clock::now();
                if (session_cancel.cancelled() ||
                    (wait.count() > 0 && !session_cancel.sleep_for(wait))) {
                    out.cancelled = true;
                    results.push(std::move(out));
                    continue;
                }
                const uint64_t index = task->index;

                const ChunkRecord& rec = progress.chunks[index];
                data.resize(rec.size);
                if (!source.read_at(rec.offset, data.data(), data.size())) {
                    out.source_failed = true;
                    out.error = TransferError::make(ErrorCategory::Unknown, "read_chunk", target,
                                                    source.last_error());
                    results.push(std::move(out));
                    continue;
                }
                out.hash = Hasher::md5_hex(std::span<const uint8_t>(data));

                auto start = std::chrono::steady_clock::now();
                auto r = api_.upload_chunk(session.session_id, index, data, out.hash,
                                           &session_cancel);
                out.elapsed = std::chrono::steady_clock::now() - start;

                if (r.success) {
                    // Accepted range feeds the whole-file digest without a re-read
                    accumulator.write_chunk(index, data);
                    out.success = true;
                } else if (r.error.category == ErrorCategory::Cancelled) {
                    out.cancelled = true;
                } else {
                    out.error = std::move(r.error);
                }
                results.push(std::move(out));
            }
        });
    }

    size_t outstanding = pending.size();
    bool aborting = false;
    TransferError fatal;

    auto abort_with = [&](TransferError error, const ChunkRecord& rec) {
        if (aborting) return;
        aborting = true;
        fatal = std::move(error);
        fatal.failed_chunk = static_cast<int64_t>(rec.index);
        fatal.attempts = rec.attempts;
        session_cancel.cancel();
    };
    // A transition that cannot be persisted would make resume lie
    auto persist = [&](const ChunkRecord& rec) {
        if (progress_.save(progress)) return;
        abort_with(TransferError::make(ErrorCategory::ResourceExhausted, "save_progress",
                                       session.session_id, "could not persist chunk progress"),
                   rec);
    };

    while (outstanding > 0) {
        auto outcome = results.pop();
        if (!outcome) break;

        ChunkRecord& rec = progress.chunks[outcome->index];
        if (outcome->cancelled) {
            --outstanding;
            continue;
        }
        ++rec.attempts;

        if (outcome->success) {
            rec.uploaded = true;
            rec.hash = outcome->hash;
            ++result.chunks_uploaded;
            result.bytes_uploaded += rec.size;
            throughput_.record(rec.size, outcome->elapsed);
            if (metrics_) {
                metrics_->chunks_uploaded().Increment();
                metrics_->upload_bytes_total().Increment(static_cast<double>(rec.size));
                metrics_->chunk_duration().Observe(
                    std::chrono::duration<double>(outcome->elapsed).count());
            }
            persist(rec);
            log_debug("Chunk %llu/%llu of %s uploaded",
                      static_cast<unsigned long long>(rec.index + 1),
                      static_cast<unsigned long long>(progress.total_chunks), target.c_str());
            --outstanding;
            continue;
        }

        if (!aborting && !outcome->source_failed && retryable_chunk_error(outcome->error) &&
            rec.attempts < settings_.max_chunk_attempts) {
            ++result.chunks_retried;
            if (metrics_) metrics_->chunks_retried().Increment();
            persist(rec);
            auto delay = retry_.delay_for(outcome->error.category, rec.attempts - 1);
            log_warn("Chunk %llu of %s failed (%s), retrying in %lld ms (attempt %d/%d)",
                     static_cast<unsigned long long>(rec.index), target.c_str(),
                     outcome->error.to_string().c_str(), static_cast<long long>(delay.count()),
                     rec.attempts, settings_.max_chunk_attempts);
            work.push(ChunkTask{outcome->index, std::chrono::steady_clock::now() + delay});
            continue;
        }

        --outstanding;
        if (metrics_) metrics_->chunks_failed().Increment();
        persist(rec);
        abort_with(outcome->error, rec);
    }

    work.close();
    for (auto& t : workers) t.join();

    const uint64_t done = progress.uploaded_count();
    if (aborting || session_cancel.cancelled()) {
        session.state = SessionState::Aborted;
        if (aborting) {
            result.error = fatal;
            result.error.operation = "upload";
            result.error.target = target;
        } else {
            result.error = TransferError::make(ErrorCategory::Cancelled, "upload", target,
                                               "cancelled");
        }
        result.error.chunks_done = done;
        result.error.chunks_total = progress.total_chunks;
        if (ledger_) {
            ledger_->update_state(session.session_id, session_state_name(session.state), {},
                                  result.error.to_string());
        }
        return result;
    }

    auto digest = accumulator.finalize();
    if (!digest) {
        result.error = TransferError::make(ErrorCategory::DataIntegrity, "upload", target,
                                           "chunk coverage incomplete");
        result.error.chunks_done = done;
        result.error.chunks_total = progress.total_chunks;
        session.state = SessionState::Aborted;
        return result;
    }
    if (!session.content_hash.empty() && *digest != session.content_hash) {
        // Source changed under us; the recorded chunks are worthless
        progress_.remove(session.session_id);
        result.error = TransferError::make(ErrorCategory::DataIntegrity, "upload", target,
                                           "content digest " + *digest +
                                               " does not match expected " + session.content_hash);
        session.state = SessionState::Aborted;
        if (ledger_) {
            ledger_->update_state(session.session_id, session_state_name(session.state), {},
                                  result.error.to_string());
        }
        return result;
    }

    result.success = true;
    result.digest = *digest;
    session.state = SessionState::Completing;
    if (ledger_) ledger_->update_state(session.session_id, session_state_name(session.state));
    return result;
}

}  // namespace panxfer
