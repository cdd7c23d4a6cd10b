// panxfer-cache: Standalone inspection tool for the panxfer metadata store.
//
// Opens the LMDB cache directory read-only unless a subcommand modifies it.
// Only links against LMDB.
//
// Usage: panxfer-cache --db <path> <subcommand> [args]
//
// Subcommands:
//   stat                 Entry counts per namespace, DB size
//   keys [prefix]        List keys with their expiry
//   get <key>            Print one value
//   purge-expired        Delete expired entries
//   clear <prefix>       Delete every key under a prefix

#include <chrono>
#include <cinttypes>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <lmdb.h>
#include <map>
#include <string>
#include <vector>

namespace {

constexpr size_t kStampSize = sizeof(uint64_t);

uint64_t now_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
                                     std::chrono::system_clock::now().time_since_epoch())
                                     .count());
}

void format_expiry(uint64_t expires_ms, char* buf, size_t buf_size) {
    if (expires_ms == 0) {
        snprintf(buf, buf_size, "never");
        return;
    }
    time_t t = static_cast<time_t>(expires_ms / 1000);
    struct tm tm_val;
    gmtime_r(&t, &tm_val);
    strftime(buf, buf_size, "%Y-%m-%dT%H:%M:%SZ", &tm_val);
}

bool read_stamp(const MDB_val& v, uint64_t& stamp) {
    if (v.mv_size < kStampSize) return false;
    memcpy(&stamp, v.mv_data, kStampSize);
    return true;
}

bool expired(uint64_t stamp, uint64_t now) {
    return stamp != 0 && stamp <= now;
}

/// Namespace of a key: everything up to and including the first '/'.
std::string key_namespace(const std::string& key) {
    auto pos = key.find('/');
    return pos == std::string::npos ? std::string("(none)") : key.substr(0, pos + 1);
}

void print_usage() {
    fprintf(stderr,
        "Usage: panxfer-cache --db <path> <subcommand> [args]\n"
        "\n"
        "Subcommands:\n"
        "  stat                          Entry counts per namespace, DB size\n"
        "  keys [prefix]                 List keys with expiry (pv/, ls/, path/, progress/)\n"
        "  get <key>                     Print one value\n"
        "  purge-expired                 Delete expired entries\n"
        "  clear <prefix>                Delete every key under a prefix\n"
        "\n"
        "Options:\n"
        "  --db <path>                   Path to the LMDB cache directory\n"
        "                                (default: $PANXFER_STATE_DIR/kv/\n"
        "                                 or $HOME/.cache/panxfer/kv/)\n"
        "  --all                         Include expired entries in keys/get\n"
        "  --limit <N>                   Max entries to output\n"
        "  --help                        Show this help\n"
    );
}

}  // namespace

int main(int argc, char* argv[]) {
    std::string db_path;
    std::string subcommand;
    std::string operand;
    bool include_expired = false;
    uint64_t limit = 0;

    // Parse arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--db") {
            if (++i >= argc) { fprintf(stderr, "--db requires argument\n"); return 1; }
            db_path = argv[i];
        } else if (arg == "--limit") {
            if (++i >= argc) { fprintf(stderr, "--limit requires argument\n"); return 1; }
            limit = strtoull(argv[i], nullptr, 10);
        } else if (arg == "--all") {
            include_expired = true;
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            return 0;
        } else if (arg[0] != '-' && subcommand.empty()) {
            subcommand = arg;
        } else if (!subcommand.empty() && operand.empty()) {
            operand = arg;
        } else {
            fprintf(stderr, "Unknown argument: %s\n", arg.c_str());
            print_usage();
            return 1;
        }
    }

    if (subcommand.empty()) {
        print_usage();
        return 1;
    }
    const bool writes = subcommand == "purge-expired" || subcommand == "clear";
    if (subcommand == "get" && operand.empty()) {
        fprintf(stderr, "Usage: panxfer-cache get <key>\n");
        return 1;
    }
    if (subcommand == "clear" && operand.empty()) {
        fprintf(stderr, "Usage: panxfer-cache clear <prefix>\n");
        return 1;
    }

    // Resolve default db path
    if (db_path.empty()) {
        if (const char* state = getenv("PANXFER_STATE_DIR"); state && *state) {
            db_path = std::string(state) + "/kv";
        } else if (const char* home = getenv("HOME")) {
            db_path = std::string(home) + "/.cache/panxfer/kv";
        } else {
            db_path = ".panxfer/kv";
        }
    }

    MDB_env* env = nullptr;
    int rc = mdb_env_create(&env);
    if (rc) {
        fprintf(stderr, "mdb_env_create: %s\n", mdb_strerror(rc));
        return 1;
    }

    // Must not be smaller than the map the engine created
    rc = mdb_env_set_mapsize(env, 64ULL * 1024 * 1024 * 1024);
    if (rc) {
        fprintf(stderr, "mdb_env_set_mapsize: %s\n", mdb_strerror(rc));
        mdb_env_close(env);
        return 1;
    }

    rc = mdb_env_open(env, db_path.c_str(), writes ? 0 : MDB_RDONLY, 0664);
    if (rc) {
        fprintf(stderr, "Cannot open cache DB at %s: %s\n", db_path.c_str(), mdb_strerror(rc));
        mdb_env_close(env);
        return 1;
    }

    MDB_txn* txn = nullptr;
    rc = mdb_txn_begin(env, nullptr, writes ? 0 : MDB_RDONLY, &txn);
    if (rc) {
        fprintf(stderr, "mdb_txn_begin: %s\n", mdb_strerror(rc));
        mdb_env_close(env);
        return 1;
    }

    MDB_dbi dbi;
    rc = mdb_dbi_open(txn, nullptr, 0, &dbi);
    if (rc) {
        fprintf(stderr, "mdb_dbi_open: %s\n", mdb_strerror(rc));
        mdb_txn_abort(txn);
        mdb_env_close(env);
        return 1;
    }

    const uint64_t now = now_ms();
    char time_buf[64];
    int exit_code = 0;

    // --- Subcommands ---

    if (subcommand == "stat") {
        MDB_stat stat;
        rc = mdb_stat(txn, dbi, &stat);
        if (rc) {
            fprintf(stderr, "mdb_stat: %s\n", mdb_strerror(rc));
            exit_code = 1;
        } else {
            std::map<std::string, std::pair<uint64_t, uint64_t>> per_ns;  // live, expired
            MDB_cursor* cursor = nullptr;
            if (mdb_cursor_open(txn, dbi, &cursor) == 0) {
                MDB_val k, v;
                rc = mdb_cursor_get(cursor, &k, &v, MDB_FIRST);
                while (rc == 0) {
                    std::string key(static_cast<const char*>(k.mv_data), k.mv_size);
                    uint64_t stamp = 0;
                    auto& counts = per_ns[key_namespace(key)];
                    if (read_stamp(v, stamp) && !expired(stamp, now)) {
                        ++counts.first;
                    } else {
                        ++counts.second;
                    }
                    rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
                }
                mdb_cursor_close(cursor);
            }

            MDB_envinfo info;
            mdb_env_info(env, &info);
            uint64_t total_pages = stat.ms_branch_pages + stat.ms_leaf_pages + stat.ms_overflow_pages;
            uint64_t db_bytes = total_pages * stat.ms_psize;

            printf("entries:     %zu\n", stat.ms_entries);
            printf("depth:       %u\n", stat.ms_depth);
            printf("db_size:     %" PRIu64 " bytes (%.2f MB)\n",
                   db_bytes, static_cast<double>(db_bytes) / (1024.0 * 1024));
            printf("map_size:    %" PRIu64 " bytes (%.2f GB)\n",
                   static_cast<uint64_t>(info.me_mapsize),
                   static_cast<double>(info.me_mapsize) / (1024.0 * 1024 * 1024));
            for (const auto& [ns, counts] : per_ns) {
                printf("ns %-10s live=%" PRIu64 " expired=%" PRIu64 "\n", ns.c_str(),
                       counts.first, counts.second);
            }
        }
    } else if (subcommand == "keys") {
        MDB_cursor* cursor = nullptr;
        rc = mdb_cursor_open(txn, dbi, &cursor);
        if (rc) {
            fprintf(stderr, "mdb_cursor_open: %s\n", mdb_strerror(rc));
            exit_code = 1;
        } else {
            MDB_val k = {operand.size(), const_cast<char*>(operand.data())};
            MDB_val v;
            uint64_t count = 0;

            rc = operand.empty() ? mdb_cursor_get(cursor, &k, &v, MDB_FIRST)
                                 : mdb_cursor_get(cursor, &k, &v, MDB_SET_RANGE);
            while (rc == 0) {
                std::string key(static_cast<const char*>(k.mv_data), k.mv_size);
                if (key.compare(0, operand.size(), operand) != 0) break;

                uint64_t stamp = 0;
                bool valid = read_stamp(v, stamp);
                if (include_expired || (valid && !expired(stamp, now))) {
                    format_expiry(stamp, time_buf, sizeof(time_buf));
                    printf("%s\t%zu\t%s%s\n", key.c_str(),
                           valid ? v.mv_size - kStampSize : v.mv_size, time_buf,
                           !valid ? "\tmalformed" : (expired(stamp, now) ? "\texpired" : ""));
                    ++count;
                    if (limit > 0 && count >= limit) break;
                }
                rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
            }
            mdb_cursor_close(cursor);
        }
    } else if (subcommand == "get") {
        MDB_val k = {operand.size(), const_cast<char*>(operand.data())};
        MDB_val v;
        rc = mdb_get(txn, dbi, &k, &v);
        uint64_t stamp = 0;
        if (rc == MDB_NOTFOUND) {
            printf("NOTFOUND\n");
            exit_code = 1;
        } else if (rc) {
            fprintf(stderr, "mdb_get: %s\n", mdb_strerror(rc));
            exit_code = 1;
        } else if (!read_stamp(v, stamp)) {
            fprintf(stderr, "malformed value (%zu bytes)\n", v.mv_size);
            exit_code = 1;
        } else if (expired(stamp, now) && !include_expired) {
            printf("NOTFOUND\n");
            exit_code = 1;
        } else {
            fwrite(static_cast<const char*>(v.mv_data) + kStampSize, 1, v.mv_size - kStampSize,
                   stdout);
            printf("\n");
        }
    } else if (subcommand == "purge-expired" || subcommand == "clear") {
        const bool purge = subcommand == "purge-expired";
        std::vector<std::string> doomed;
        MDB_cursor* cursor = nullptr;
        rc = mdb_cursor_open(txn, dbi, &cursor);
        if (rc) {
            fprintf(stderr, "mdb_cursor_open: %s\n", mdb_strerror(rc));
            exit_code = 1;
        } else {
            MDB_val k = {operand.size(), const_cast<char*>(operand.data())};
            MDB_val v;
            rc = operand.empty() ? mdb_cursor_get(cursor, &k, &v, MDB_FIRST)
                                 : mdb_cursor_get(cursor, &k, &v, MDB_SET_RANGE);
            while (rc == 0) {
                std::string key(static_cast<const char*>(k.mv_data), k.mv_size);
                if (key.compare(0, operand.size(), operand) != 0) break;
                uint64_t stamp = 0;
                if (!purge || !read_stamp(v, stamp) || expired(stamp, now)) {
                    doomed.push_back(std::move(key));
                }
                rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
            }
            mdb_cursor_close(cursor);

            for (auto& key : doomed) {
                MDB_val dk = {key.size(), key.data()};
                mdb_del(txn, dbi, &dk, nullptr);
            }
            rc = mdb_txn_commit(txn);
            txn = nullptr;
            if (rc) {
                fprintf(stderr, "mdb_txn_commit: %s\n", mdb_strerror(rc));
                exit_code = 1;
            } else {
                printf("removed %zu\n", doomed.size());
            }
        }
    } else {
        fprintf(stderr, "Unknown subcommand: %s\n", subcommand.c_str());
        print_usage();
        exit_code = 1;
    }

    if (txn) mdb_txn_abort(txn);
    mdb_env_close(env);
    return exit_code;
}
