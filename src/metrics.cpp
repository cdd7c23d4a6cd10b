#include "panxfer/metrics.hpp"
#include "panxfer/transfer_engine.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace panxfer {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& uploads_family = prometheus::BuildCounter()
        .Name("panxfer_uploads_total")
        .Help("Uploads finished, by result")
        .Labels(labels)
        .Register(*registry_);
    uploads_success_ = &uploads_family.Add({{"result", "success"}});
    uploads_failure_ = &uploads_family.Add({{"result", "failure"}});
    uploads_deduplicated_ = &uploads_family.Add({{"result", "deduplicated"}});
    uploads_cancelled_ = &uploads_family.Add({{"result", "cancelled"}});

    upload_bytes_total_ = &prometheus::BuildCounter()
        .Name("panxfer_upload_bytes_total")
        .Help("Content bytes sent to the provider")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    download_bytes_total_ = &prometheus::BuildCounter()
        .Name("panxfer_download_bytes_total")
        .Help("Content bytes received from the provider")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    auto& chunks_family = prometheus::BuildCounter()
        .Name("panxfer_chunks_total")
        .Help("Chunk transfers, by result")
        .Labels(labels)
        .Register(*registry_);
    chunks_uploaded_ = &chunks_family.Add({{"result", "uploaded"}});
    chunks_retried_ = &chunks_family.Add({{"result", "retried"}});
    chunks_failed_ = &chunks_family.Add({{"result", "failed"}});
    chunks_skipped_ = &chunks_family.Add({{"result", "skipped"}});
    chunks_reverify_failed_ = &chunks_family.Add({{"result", "reverify_failed"}});

    auto counter_reg = [&](const std::string& name, const std::string& help) -> prometheus::Counter& {
        return prometheus::BuildCounter()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    api_requests_ = &counter_reg("panxfer_api_requests_total", "Provider API requests issued");
    api_retries_ = &counter_reg("panxfer_api_retries_total", "Provider API requests retried");
    rate_limit_signals_ = &counter_reg("panxfer_rate_limit_signals_total",
                                       "Rate-limit answers received from the provider");

    auto& cache_family = prometheus::BuildCounter()
        .Name("panxfer_cache_lookups_total")
        .Help("Metadata cache lookups, by result")
        .Labels(labels)
        .Register(*registry_);
    cache_hits_ = &cache_family.Add({{"result", "hit"}});
    cache_misses_ = &cache_family.Add({{"result", "miss"}});
    cache_corrupt_ = &cache_family.Add({{"result", "corrupt"}});

    // --- Gauges ---

    auto gauge_reg = [&](const std::string& name, const std::string& help) -> prometheus::Gauge& {
        return prometheus::BuildGauge()
            .Name(name)
            .Help(help)
            .Labels(labels)
            .Register(*registry_)
            .Add({});
    };

    active_sessions_ = &gauge_reg("panxfer_active_sessions", "Upload sessions in flight");
    active_downloads_ = &gauge_reg("panxfer_active_downloads", "Downloads in flight");
    resumable_sessions_ = &gauge_reg("panxfer_resumable_sessions",
                                     "Ledger sessions that have not completed");

    // --- Histograms ---

    upload_duration_ = &prometheus::BuildHistogram()
        .Name("panxfer_upload_duration_seconds")
        .Help("Upload duration in seconds, open to completion")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.05, 0.1, 0.5, 1, 2.5, 5, 10, 30, 60, 120, 300, 600, 1800});

    chunk_duration_ = &prometheus::BuildHistogram()
        .Name("panxfer_chunk_duration_seconds")
        .Help("Single chunk upload duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.05, 0.1, 0.25, 0.5, 1, 2.5, 5, 10, 30, 60, 120});

    completion_duration_ = &prometheus::BuildHistogram()
        .Name("panxfer_completion_duration_seconds")
        .Help("Session completion duration in seconds, polling included")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.01, 0.1, 0.5, 1, 5, 10, 30, 60, 300, 900});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    flush();
}

void MetricsExporter::flush() {
    std::lock_guard lock(write_mutex_);
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        flush();
    }
}

namespace {

void add_delta(prometheus::Counter* counter, uint64_t current, uint64_t& previous) {
    if (current > previous) {
        counter->Increment(static_cast<double>(current - previous));
        previous = current;
    }
}

}  // namespace

void MetricsExporter::update_gauges() {
    if (!engine_ || !engine_->running()) return;

    auto s = engine_->stats();
    active_sessions_->Set(static_cast<double>(s.active_sessions));
    active_downloads_->Set(static_cast<double>(s.active_downloads));
    resumable_sessions_->Set(static_cast<double>(s.resumable_sessions));

    // Increment counters by deltas since last snapshot
    add_delta(api_requests_, s.api.requests, prev_api_requests_);
    add_delta(api_retries_, s.api.retries, prev_api_retries_);
    add_delta(rate_limit_signals_, s.api.rate_limited, prev_rate_limited_);
    add_delta(cache_hits_, s.cache.hits, prev_cache_hits_);
    add_delta(cache_misses_, s.cache.misses, prev_cache_misses_);
    add_delta(cache_corrupt_, s.cache.corrupt, prev_cache_corrupt_);
}

void MetricsExporter::write_file() {
    if (prom_file_path_.empty()) return;
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) return;
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace panxfer
