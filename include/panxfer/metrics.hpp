#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace panxfer {

class TransferEngine;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports transfer metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename. API and cache counters are taken from engine snapshots as
/// deltas; upload and chunk counters are incremented at the call sites.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Engine to snapshot for gauges and API/cache counters (not owned).
    void set_engine(TransferEngine* engine) { engine_ = engine; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    /// Snapshot gauges and write the file now.
    void flush();

    // --- Counter accessors ---
    prometheus::Counter& uploads_success() { return *uploads_success_; }
    prometheus::Counter& uploads_failure() { return *uploads_failure_; }
    prometheus::Counter& uploads_deduplicated() { return *uploads_deduplicated_; }
    prometheus::Counter& uploads_cancelled() { return *uploads_cancelled_; }
    prometheus::Counter& upload_bytes_total() { return *upload_bytes_total_; }
    prometheus::Counter& download_bytes_total() { return *download_bytes_total_; }
    prometheus::Counter& chunks_uploaded() { return *chunks_uploaded_; }
    prometheus::Counter& chunks_retried() { return *chunks_retried_; }
    prometheus::Counter& chunks_failed() { return *chunks_failed_; }
    prometheus::Counter& chunks_skipped() { return *chunks_skipped_; }
    prometheus::Counter& chunks_reverify_failed() { return *chunks_reverify_failed_; }

    // --- Histogram accessors ---
    prometheus::Histogram& upload_duration() { return *upload_duration_; }
    prometheus::Histogram& chunk_duration() { return *chunk_duration_; }
    prometheus::Histogram& completion_duration() { return *completion_duration_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    TransferEngine* engine_ = nullptr;

    // Previous engine stats for delta computation
    uint64_t prev_api_requests_ = 0;
    uint64_t prev_api_retries_ = 0;
    uint64_t prev_rate_limited_ = 0;
    uint64_t prev_cache_hits_ = 0;
    uint64_t prev_cache_misses_ = 0;
    uint64_t prev_cache_corrupt_ = 0;

    // --- Counters ---
    prometheus::Counter* uploads_success_;
    prometheus::Counter* uploads_failure_;
    prometheus::Counter* uploads_deduplicated_;
    prometheus::Counter* uploads_cancelled_;
    prometheus::Counter* upload_bytes_total_;
    prometheus::Counter* download_bytes_total_;
    prometheus::Counter* chunks_uploaded_;
    prometheus::Counter* chunks_retried_;
    prometheus::Counter* chunks_failed_;
    prometheus::Counter* chunks_skipped_;
    prometheus::Counter* chunks_reverify_failed_;
    prometheus::Counter* api_requests_;
    prometheus::Counter* api_retries_;
    prometheus::Counter* rate_limit_signals_;
    prometheus::Counter* cache_hits_;
    prometheus::Counter* cache_misses_;
    prometheus::Counter* cache_corrupt_;

    // --- Gauges ---
    prometheus::Gauge* active_sessions_;
    prometheus::Gauge* active_downloads_;
    prometheus::Gauge* resumable_sessions_;

    // --- Histograms ---
    prometheus::Histogram* upload_duration_;
    prometheus::Histogram* chunk_duration_;
    prometheus::Histogram* completion_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
    std::mutex write_mutex_;
};

}  // namespace panxfer
