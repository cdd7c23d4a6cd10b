#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace panxfer {

constexpr uint64_t KiB = 1024ULL;
constexpr uint64_t MiB = 1024ULL * KiB;
constexpr uint64_t GiB = 1024ULL * MiB;

/// Minimum/maximum spacing per endpoint class. Observed provider quotas differ
/// by an order of magnitude between families, hence separate pacers.
struct PacerSettings {
    std::chrono::milliseconds list_min_sleep{200};
    std::chrono::milliseconds download_min_sleep{100};  // download info, completion, polling
    std::chrono::milliseconds upload_min_sleep{20};     // chunk uploads
    std::chrono::milliseconds strict_min_sleep{250};    // create, mkdir, trash
    std::chrono::milliseconds batch_min_sleep{1000};    // permanent delete
    std::chrono::milliseconds token_min_sleep{1000};    // access token
    std::chrono::milliseconds max_sleep{30000};
    unsigned decay_constant = 2;
};

struct RetrySettings {
    int max_attempts = 8;
    std::chrono::milliseconds base_delay{1000};
    double multiplier = 2.0;
    std::chrono::milliseconds max_delay{30000};
    std::chrono::milliseconds rate_limit_delay{30000};  // forced minimum after a 429
    double jitter = 0.2;                                // +/- fraction of the delay
};

struct CacheSettings {
    std::chrono::milliseconds parent_valid_ttl{std::chrono::minutes(5)};
    std::chrono::milliseconds listing_ttl{std::chrono::minutes(5)};
    std::chrono::milliseconds path_ttl{std::chrono::minutes(5)};
    // Listing pages whose serialized entries exceed this are checksum-verified on read.
    size_t listing_checksum_threshold = 10 * KiB;
    size_t list_page_size = 100;
};

struct UploadSettings {
    uint64_t min_chunk_size = 16 * MiB;
    uint64_t max_chunk_size = 512 * MiB;
    uint64_t default_chunk_size = 64 * MiB;
    uint64_t max_chunks = 10000;
    // Chunk size targets roughly this many seconds of transfer at measured throughput.
    std::chrono::seconds target_chunk_duration{10};
    uint64_t per_worker_throughput = 8 * MiB;  // bytes/s one stream is expected to sustain
    uint64_t single_shot_limit = 100 * MiB;
    size_t workers_per_session = 4;
    size_t max_concurrent_uploads = 2;
    size_t max_concurrent_downloads = 4;
    int max_chunk_attempts = 3;
    std::chrono::hours progress_ttl{24};
    size_t max_name_attempts = 999;
};

struct CompletionSettings {
    std::chrono::milliseconds step{1000};          // attempts 1..ramp_polls wait step*n
    int ramp_polls = 5;
    std::chrono::milliseconds plateau{5000};       // until late_after polls
    int late_after = 10;
    std::chrono::milliseconds late_start{10000};   // then grows by step per poll
    std::chrono::milliseconds max_interval{15000};
    int base_polls = 30;
    int polls_per_gib = 10;
    int max_polls = 300;
    int max_consecutive_failures = 5;
};

struct CrossStoreSettings {
    uint64_t memory_limit = 100 * MiB;  // at or below: buffer in memory
    uint64_t hybrid_limit = 1 * GiB;    // at or below: parallel ranged reads
    uint64_t memory_budget = 1 * GiB;   // total bytes memory buffers may hold at once
    size_t range_readers = 4;
    uint64_t range_size = 8 * MiB;
    std::filesystem::path temp_dir;     // default: <state_dir>/buffers
};

struct TimeoutSettings {
    std::chrono::milliseconds connect{10000};
    std::chrono::milliseconds metadata{30000};
    std::chrono::milliseconds upload{300000};
    std::chrono::milliseconds download{600000};
};

/// Configuration for the transfer engine and CLI.
struct EngineConfig {
    // Provider endpoints
    std::string api_base_url = "https://open-api.123pan.com";
    std::string upload_base_url;  // Default: api_base_url
    std::string root_id = "0";
    std::string platform = "open_platform";

    // Credentials (token acquisition itself is external)
    std::string access_token;
    std::optional<std::chrono::system_clock::time_point> token_expiry;

    // State
    std::filesystem::path state_dir;       // Default: $HOME/.cache/panxfer
    std::filesystem::path cache_db_path;   // Default: <state_dir>/kv/
    std::filesystem::path ledger_path;     // Default: <state_dir>/ledger.db
    uint64_t cache_mapsize_mb = 1024;

    PacerSettings pacer;
    RetrySettings retry;
    CacheSettings cache;
    UploadSettings upload;
    CompletionSettings completion;
    CrossStoreSettings cross_store;
    TimeoutSettings timeouts;

    // Logging
    bool verbose = false;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;
    size_t metrics_interval_secs = 15;

    /// Parse options from the command line, stopping at the first positional
    /// argument. `first_positional` receives its index (argc when none).
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<EngineConfig> from_args(int argc, char* argv[], int* first_positional);

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill unset values from PANXFER_ACCESS_TOKEN and PANXFER_STATE_DIR.
    void apply_env();

    /// Fill in derived defaults (state_dir, store paths, upload URL, temp dir).
    void apply_defaults();

    /// Validate fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace panxfer
