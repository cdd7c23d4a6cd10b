#include "panxfer/engine_config.hpp"
#include "panxfer/log.hpp"
#include "panxfer/metrics.hpp"
#include "panxfer/sync.hpp"
#include "panxfer/transfer_engine.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

std::string mask(const std::string& secret) {
    return secret.empty() ? "(none)" : "****";
}

std::string format_time(int64_t epoch_secs) {
    if (epoch_secs <= 0) return "-";
    std::time_t t = static_cast<std::time_t>(epoch_secs);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
    return buf;
}

int fail(const panxfer::TransferError& error) {
    std::cerr << "Error: " << error.to_string() << std::endl;
    return error.category == panxfer::ErrorCategory::Cancelled ? 130 : 1;
}

bool need_args(const std::vector<std::string>& args, size_t n, const char* usage) {
    if (args.size() >= n) return true;
    std::cerr << "Usage: panxfer [options] " << usage << std::endl;
    return false;
}

int run_command(panxfer::TransferEngine& engine, const std::string& command,
                const std::vector<std::string>& args, const panxfer::CancelToken* cancel) {
    using namespace panxfer;

    if (command == "upload") {
        if (!need_args(args, 2, "upload <local-file> <remote-path>")) return 2;
        auto r = engine.upload(args[0], args[1], cancel);
        if (!r.success) return fail(r.error);
        std::cout << r.object.remote_path << "\t" << r.object.file_id << "\t" << r.object.size
                  << "\t" << r.object.content_hash << "\t" << upload_strategy_name(r.strategy);
        if (r.deduplicated) std::cout << " (deduplicated)";
        if (r.chunks_skipped > 0) std::cout << " (resumed, " << r.chunks_skipped << " chunks skipped)";
        std::cout << std::endl;
        return 0;
    }

    if (command == "download") {
        if (!need_args(args, 2, "download <remote-path> <local-file>")) return 2;
        auto r = engine.download(args[0], args[1], cancel);
        if (!r.success) return fail(r.error);
        std::cout << args[1] << "\t" << r.bytes << "\t" << r.content_hash << std::endl;
        return 0;
    }

    if (command == "ls") {
        auto r = engine.list(args.empty() ? "/" : args[0], cancel);
        if (!r.success) return fail(r.error);
        for (const auto& e : r.entries) {
            std::printf("%s %12llu  %s  %-32s  %s\n", e.is_directory ? "d" : "-",
                        static_cast<unsigned long long>(e.size), format_time(e.modified).c_str(),
                        e.hash.empty() ? "-" : e.hash.c_str(), e.name.c_str());
        }
        return 0;
    }

    if (command == "mkdir") {
        if (!need_args(args, 1, "mkdir <remote-dir>")) return 2;
        auto r = engine.make_directory(args[0], cancel);
        if (!r.success) return fail(r.error);
        std::cout << r.id << std::endl;
        return 0;
    }

    if (command == "rm") {
        if (!need_args(args, 1, "rm <remote-path>")) return 2;
        auto r = engine.remove(args[0], cancel);
        return r.success ? 0 : fail(r.error);
    }

    if (command == "mv") {
        if (!need_args(args, 2, "mv <remote-path> <remote-dir>")) return 2;
        auto r = engine.move(args[0], args[1], cancel);
        return r.success ? 0 : fail(r.error);
    }

    if (command == "rename") {
        if (!need_args(args, 2, "rename <remote-path> <new-name>")) return 2;
        auto r = engine.rename(args[0], args[1], cancel);
        return r.success ? 0 : fail(r.error);
    }

    if (command == "sessions") {
        size_t limit = args.empty() ? 50 : std::strtoul(args[0].c_str(), nullptr, 10);
        auto rows = engine.sessions(limit);
        if (!engine.ledger()) {
            std::cerr << "No session ledger configured" << std::endl;
            return 1;
        }
        for (const auto& row : rows) {
            std::printf("%-12s %-40s %12llu  %4llu x %-10llu %s  %s%s%s\n", row.state.c_str(),
                        row.session_id.c_str(), static_cast<unsigned long long>(row.size),
                        static_cast<unsigned long long>(row.total_chunks),
                        static_cast<unsigned long long>(row.chunk_size),
                        format_time(row.updated_at).c_str(), row.remote_name.c_str(),
                        row.error.empty() ? "" : "  ", row.error.c_str());
        }
        return 0;
    }

    std::cerr << "Error: unknown command: " << command << " (see --help)" << std::endl;
    return 2;
}

}  // namespace

int main(int argc, char* argv[]) {
    int first = argc;
    auto config_opt = panxfer::EngineConfig::from_args(argc, argv, &first);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    if (first >= argc) {
        std::cerr << "Error: no command given (see --help)" << std::endl;
        return 2;
    }
    const std::string command = argv[first];
    std::vector<std::string> args(argv + first + 1, argv + argc);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Redirect log output if log file specified
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }
    panxfer::set_verbose(config.verbose);

    panxfer::log_debug("panxfer %s: api=%s upload=%s root=%s token=%s state=%s", command.c_str(),
                       config.api_base_url.c_str(), config.upload_base_url.c_str(),
                       config.root_id.c_str(), mask(config.access_token).c_str(),
                       config.state_dir.c_str());

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    panxfer::TransferEngine engine(config);

    std::unique_ptr<panxfer::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        metrics = std::make_unique<panxfer::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"command", command}});
        metrics->set_engine(&engine);
        engine.set_metrics(metrics.get());
    }

    err = engine.start();
    if (!err.empty()) {
        std::cerr << "Failed to start: " << err << std::endl;
        return 1;
    }
    if (metrics) metrics->start();

    // Forward the signal flag to the cancel token outside signal context
    panxfer::CancelToken cancel;
    std::atomic<bool> done{false};
    std::thread signal_watcher([&] {
        while (!done) {
            if (g_shutdown_requested) {
                panxfer::log_warn("Interrupted, cancelling (progress is kept for resume)");
                cancel.cancel();
                return;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    int rc = 2;
    try {
        rc = run_command(engine, command, args, &cancel);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        rc = 1;
    }

    done = true;
    signal_watcher.join();

    if (metrics) metrics->stop();
    engine.stop();
    return rc;
}
