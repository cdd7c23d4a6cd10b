#include "panxfer/engine_config.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace panxfer {

namespace {

void print_usage() {
    std::cerr <<
        "Usage: panxfer [options] <command> [args]\n"
        "\n"
        "Commands:\n"
        "  upload <local-file> <remote-path>    Upload a file (resumes interrupted sessions)\n"
        "  download <remote-path> <local-file>  Download a file\n"
        "  ls <remote-dir>                      List a directory\n"
        "  mkdir <remote-dir>                   Create a directory\n"
        "  rm <remote-path>                     Move a file or directory to trash\n"
        "  mv <remote-path> <remote-dir>        Move into another directory\n"
        "  rename <remote-path> <new-name>      Rename in place\n"
        "  sessions                             Show resumable upload sessions\n"
        "\n"
        "Provider:\n"
        "  --api-url <url>                  API base URL (default: https://open-api.123pan.com)\n"
        "  --upload-url <url>               Upload base URL (default: API base URL)\n"
        "  --root-id <id>                   Root directory identifier (default: 0)\n"
        "  --access-token <token>           Bearer token (or PANXFER_ACCESS_TOKEN env)\n"
        "\n"
        "State:\n"
        "  --config <path>                  JSON config file\n"
        "  --state-dir <path>               State directory (or PANXFER_STATE_DIR env,\n"
        "                                   default: $HOME/.cache/panxfer)\n"
        "  --cache-db <path>                LMDB cache directory (default: <state_dir>/kv/)\n"
        "  --ledger <path>                  Session ledger (default: <state_dir>/ledger.db)\n"
        "  --cache-mapsize-mb <N>           LMDB map size in MB (default: 1024)\n"
        "  --cache-ttl <secs>               TTL for all metadata caches (default: 300)\n"
        "\n"
        "Transfers:\n"
        "  --chunk-size-mb <N>              Chunk size when throughput is unknown (default: 64)\n"
        "  --min-chunk-mb <N>               Minimum chunk size (default: 16)\n"
        "  --max-chunk-mb <N>               Maximum chunk size (default: 512)\n"
        "  --max-chunks <N>                 Chunk count ceiling (default: 10000)\n"
        "  --single-shot-mb <N>             One-request upload limit (default: 100)\n"
        "  --workers <N>                    Chunk workers per session (default: 4)\n"
        "  --max-uploads <N>                Concurrent upload sessions (default: 2)\n"
        "  --max-downloads <N>              Concurrent downloads (default: 4)\n"
        "  --max-attempts <N>               Attempts per API call (default: 8)\n"
        "  --rate-limit-delay-ms <N>        Forced pause after a rate-limit signal (default: 30000)\n"
        "  --memory-limit-mb <N>            Cross-store memory buffering limit (default: 100)\n"
        "  --hybrid-limit-mb <N>            Cross-store ranged buffering limit (default: 1024)\n"
        "  --temp-dir <path>                Buffer directory (default: <state_dir>/buffers)\n"
        "\n"
        "Output:\n"
        "  --verbose                        Debug logging\n"
        "  --log-file <path>                Log file path\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n";
}

void read_ms(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key)) out = std::chrono::milliseconds(j[key].get<int64_t>());
}

template <typename T>
void read_value(const nlohmann::json& j, const char* key, T& out) {
    if (j.contains(key)) out = j[key].get<T>();
}

}  // namespace

std::optional<EngineConfig> EngineConfig::from_args(int argc, char* argv[], int* first_positional) {
    EngineConfig config;
    if (first_positional) *first_positional = argc;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg.empty() || arg[0] != '-') {
                if (first_positional) *first_positional = i;
                break;
            }

            if (arg == "--api-url") {
                auto* v = next_arg(i, "--api-url");
                if (!v) return std::nullopt;
                config.api_base_url = v;
            } else if (arg == "--upload-url") {
                auto* v = next_arg(i, "--upload-url");
                if (!v) return std::nullopt;
                config.upload_base_url = v;
            } else if (arg == "--root-id") {
                auto* v = next_arg(i, "--root-id");
                if (!v) return std::nullopt;
                config.root_id = v;
            } else if (arg == "--access-token") {
                auto* v = next_arg(i, "--access-token");
                if (!v) return std::nullopt;
                config.access_token = v;
            } else if (arg == "--config") {
                auto* v = next_arg(i, "--config");
                if (!v) return std::nullopt;
                if (!config.load_json(v)) return std::nullopt;
            } else if (arg == "--state-dir") {
                auto* v = next_arg(i, "--state-dir");
                if (!v) return std::nullopt;
                config.state_dir = v;
            } else if (arg == "--cache-db") {
                auto* v = next_arg(i, "--cache-db");
                if (!v) return std::nullopt;
                config.cache_db_path = v;
            } else if (arg == "--ledger") {
                auto* v = next_arg(i, "--ledger");
                if (!v) return std::nullopt;
                config.ledger_path = v;
            } else if (arg == "--cache-mapsize-mb") {
                auto* v = next_arg(i, "--cache-mapsize-mb");
                if (!v) return std::nullopt;
                config.cache_mapsize_mb = std::stoull(v);
            } else if (arg == "--cache-ttl") {
                auto* v = next_arg(i, "--cache-ttl");
                if (!v) return std::nullopt;
                std::chrono::milliseconds ttl = std::chrono::seconds(std::stoull(v));
                config.cache.parent_valid_ttl = ttl;
                config.cache.listing_ttl = ttl;
                config.cache.path_ttl = ttl;
            } else if (arg == "--chunk-size-mb") {
                auto* v = next_arg(i, "--chunk-size-mb");
                if (!v) return std::nullopt;
                config.upload.default_chunk_size = std::stoull(v) * MiB;
            } else if (arg == "--min-chunk-mb") {
                auto* v = next_arg(i, "--min-chunk-mb");
                if (!v) return std::nullopt;
                config.upload.min_chunk_size = std::stoull(v) * MiB;
            } else if (arg == "--max-chunk-mb") {
                auto* v = next_arg(i, "--max-chunk-mb");
                if (!v) return std::nullopt;
                config.upload.max_chunk_size = std::stoull(v) * MiB;
            } else if (arg == "--max-chunks") {
                auto* v = next_arg(i, "--max-chunks");
                if (!v) return std::nullopt;
                config.upload.max_chunks = std::stoull(v);
            } else if (arg == "--single-shot-mb") {
                auto* v = next_arg(i, "--single-shot-mb");
                if (!v) return std::nullopt;
                config.upload.single_shot_limit = std::stoull(v) * MiB;
            } else if (arg == "--workers") {
                auto* v = next_arg(i, "--workers");
                if (!v) return std::nullopt;
                config.upload.workers_per_session = std::stoull(v);
            } else if (arg == "--max-uploads") {
                auto* v = next_arg(i, "--max-uploads");
                if (!v) return std::nullopt;
                config.upload.max_concurrent_uploads = std::stoull(v);
            } else if (arg == "--max-downloads") {
                auto* v = next_arg(i, "--max-downloads");
                if (!v) return std::nullopt;
                config.upload.max_concurrent_downloads = std::stoull(v);
            } else if (arg == "--max-attempts") {
                auto* v = next_arg(i, "--max-attempts");
                if (!v) return std::nullopt;
                config.retry.max_attempts = std::stoi(v);
            } else if (arg == "--rate-limit-delay-ms") {
                auto* v = next_arg(i, "--rate-limit-delay-ms");
                if (!v) return std::nullopt;
                config.retry.rate_limit_delay = std::chrono::milliseconds(std::stoull(v));
            } else if (arg == "--memory-limit-mb") {
                auto* v = next_arg(i, "--memory-limit-mb");
                if (!v) return std::nullopt;
                config.cross_store.memory_limit = std::stoull(v) * MiB;
            } else if (arg == "--hybrid-limit-mb") {
                auto* v = next_arg(i, "--hybrid-limit-mb");
                if (!v) return std::nullopt;
                config.cross_store.hybrid_limit = std::stoull(v) * MiB;
            } else if (arg == "--temp-dir") {
                auto* v = next_arg(i, "--temp-dir");
                if (!v) return std::nullopt;
                config.cross_store.temp_dir = v;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: invalid numeric argument: " << e.what() << "\n";
        return std::nullopt;
    }

    config.apply_env();
    config.apply_defaults();
    return config;
}

bool EngineConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        read_value(j, "api_base_url", api_base_url);
        read_value(j, "upload_base_url", upload_base_url);
        read_value(j, "root_id", root_id);
        read_value(j, "platform", platform);
        read_value(j, "access_token", access_token);
        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("cache_db_path")) cache_db_path = j["cache_db_path"].get<std::string>();
        if (j.contains("ledger_path")) ledger_path = j["ledger_path"].get<std::string>();
        read_value(j, "cache_mapsize_mb", cache_mapsize_mb);
        read_value(j, "verbose", verbose);
        if (j.contains("log_file")) log_file = j["log_file"].get<std::string>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        read_value(j, "metrics_interval", metrics_interval_secs);

        if (j.contains("pacer") && j["pacer"].is_object()) {
            auto& jp = j["pacer"];
            read_ms(jp, "list_min_sleep_ms", pacer.list_min_sleep);
            read_ms(jp, "download_min_sleep_ms", pacer.download_min_sleep);
            read_ms(jp, "upload_min_sleep_ms", pacer.upload_min_sleep);
            read_ms(jp, "strict_min_sleep_ms", pacer.strict_min_sleep);
            read_ms(jp, "batch_min_sleep_ms", pacer.batch_min_sleep);
            read_ms(jp, "token_min_sleep_ms", pacer.token_min_sleep);
            read_ms(jp, "max_sleep_ms", pacer.max_sleep);
            read_value(jp, "decay_constant", pacer.decay_constant);
        }

        if (j.contains("retry") && j["retry"].is_object()) {
            auto& jr = j["retry"];
            read_value(jr, "max_attempts", retry.max_attempts);
            read_ms(jr, "base_delay_ms", retry.base_delay);
            read_value(jr, "multiplier", retry.multiplier);
            read_ms(jr, "max_delay_ms", retry.max_delay);
            read_ms(jr, "rate_limit_delay_ms", retry.rate_limit_delay);
            read_value(jr, "jitter", retry.jitter);
        }

        if (j.contains("cache") && j["cache"].is_object()) {
            auto& jc = j["cache"];
            read_ms(jc, "parent_valid_ttl_ms", cache.parent_valid_ttl);
            read_ms(jc, "listing_ttl_ms", cache.listing_ttl);
            read_ms(jc, "path_ttl_ms", cache.path_ttl);
            read_value(jc, "listing_checksum_threshold", cache.listing_checksum_threshold);
            read_value(jc, "list_page_size", cache.list_page_size);
        }

        if (j.contains("upload") && j["upload"].is_object()) {
            auto& ju = j["upload"];
            read_value(ju, "min_chunk_size", upload.min_chunk_size);
            read_value(ju, "max_chunk_size", upload.max_chunk_size);
            read_value(ju, "default_chunk_size", upload.default_chunk_size);
            read_value(ju, "max_chunks", upload.max_chunks);
            if (ju.contains("target_chunk_seconds"))
                upload.target_chunk_duration = std::chrono::seconds(ju["target_chunk_seconds"].get<int64_t>());
            read_value(ju, "per_worker_throughput", upload.per_worker_throughput);
            read_value(ju, "single_shot_limit", upload.single_shot_limit);
            read_value(ju, "workers_per_session", upload.workers_per_session);
            read_value(ju, "max_concurrent_uploads", upload.max_concurrent_uploads);
            read_value(ju, "max_concurrent_downloads", upload.max_concurrent_downloads);
            read_value(ju, "max_chunk_attempts", upload.max_chunk_attempts);
            if (ju.contains("progress_ttl_hours"))
                upload.progress_ttl = std::chrono::hours(ju["progress_ttl_hours"].get<int64_t>());
            read_value(ju, "max_name_attempts", upload.max_name_attempts);
        }

        if (j.contains("completion") && j["completion"].is_object()) {
            auto& jc = j["completion"];
            read_ms(jc, "step_ms", completion.step);
            read_value(jc, "ramp_polls", completion.ramp_polls);
            read_ms(jc, "plateau_ms", completion.plateau);
            read_value(jc, "late_after", completion.late_after);
            read_ms(jc, "late_start_ms", completion.late_start);
            read_ms(jc, "max_interval_ms", completion.max_interval);
            read_value(jc, "base_polls", completion.base_polls);
            read_value(jc, "polls_per_gib", completion.polls_per_gib);
            read_value(jc, "max_polls", completion.max_polls);
            read_value(jc, "max_consecutive_failures", completion.max_consecutive_failures);
        }

        if (j.contains("cross_store") && j["cross_store"].is_object()) {
            auto& jx = j["cross_store"];
            read_value(jx, "memory_limit", cross_store.memory_limit);
            read_value(jx, "hybrid_limit", cross_store.hybrid_limit);
            read_value(jx, "memory_budget", cross_store.memory_budget);
            read_value(jx, "range_readers", cross_store.range_readers);
            read_value(jx, "range_size", cross_store.range_size);
            if (jx.contains("temp_dir")) cross_store.temp_dir = jx["temp_dir"].get<std::string>();
        }

        if (j.contains("timeouts") && j["timeouts"].is_object()) {
            auto& jt = j["timeouts"];
            read_ms(jt, "connect_ms", timeouts.connect);
            read_ms(jt, "metadata_ms", timeouts.metadata);
            read_ms(jt, "upload_ms", timeouts.upload);
            read_ms(jt, "download_ms", timeouts.download);
        }

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void EngineConfig::apply_env() {
    if (const char* v = std::getenv("PANXFER_ACCESS_TOKEN")) {
        if (*v && access_token.empty()) access_token = v;
    }
    if (const char* v = std::getenv("PANXFER_STATE_DIR")) {
        if (*v && state_dir.empty()) state_dir = v;
    }
}

void EngineConfig::apply_defaults() {
    if (state_dir.empty()) {
        if (const char* home = std::getenv("HOME")) {
            state_dir = std::filesystem::path(home) / ".cache" / "panxfer";
        } else {
            state_dir = ".panxfer";
        }
    }
    if (cache_db_path.empty()) cache_db_path = state_dir / "kv";
    if (ledger_path.empty()) ledger_path = state_dir / "ledger.db";
    if (cross_store.temp_dir.empty()) cross_store.temp_dir = state_dir / "buffers";
    if (upload_base_url.empty()) upload_base_url = api_base_url;

    while (!api_base_url.empty() && api_base_url.back() == '/') api_base_url.pop_back();
    while (!upload_base_url.empty() && upload_base_url.back() == '/') upload_base_url.pop_back();
}

std::string EngineConfig::validate() const {
    if (api_base_url.empty()) return "api_base_url is required (--api-url)";
    if (root_id.empty()) return "root_id must not be empty";
    if (state_dir.empty()) return "state_dir is required (--state-dir)";
    if (upload.min_chunk_size == 0) return "min_chunk_size must be > 0";
    if (upload.min_chunk_size > upload.max_chunk_size)
        return "min_chunk_size must be <= max_chunk_size";
    if (upload.default_chunk_size < upload.min_chunk_size ||
        upload.default_chunk_size > upload.max_chunk_size)
        return "default_chunk_size must lie within [min_chunk_size, max_chunk_size]";
    if (upload.max_chunks == 0) return "max_chunks must be > 0";
    if (upload.workers_per_session == 0) return "workers_per_session must be > 0";
    if (upload.max_concurrent_uploads == 0) return "max_concurrent_uploads must be > 0";
    if (upload.max_concurrent_downloads == 0) return "max_concurrent_downloads must be > 0";
    if (upload.max_chunk_attempts < 1) return "max_chunk_attempts must be >= 1";
    if (retry.max_attempts < 1) return "max_attempts must be >= 1";
    if (retry.multiplier < 1.0) return "retry multiplier must be >= 1";
    if (retry.jitter < 0.0 || retry.jitter >= 1.0) return "retry jitter must lie within [0, 1)";
    if (pacer.max_sleep < pacer.list_min_sleep || pacer.max_sleep < pacer.strict_min_sleep)
        return "pacer max_sleep must be >= every class minimum";
    if (pacer.decay_constant == 0 || pacer.decay_constant > 16)
        return "pacer decay_constant must lie within [1, 16]";
    if (completion.base_polls < 1) return "completion base_polls must be >= 1";
    if (completion.max_polls < completion.base_polls) return "completion max_polls must be >= base_polls";
    if (cross_store.memory_limit > cross_store.hybrid_limit)
        return "cross_store memory_limit must be <= hybrid_limit";
    if (cross_store.range_readers == 0) return "cross_store range_readers must be > 0";
    if (cross_store.range_size == 0) return "cross_store range_size must be > 0";
    return {};
}

}  // namespace panxfer
