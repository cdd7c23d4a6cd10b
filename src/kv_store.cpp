#include "panxfer/kv_store.hpp"
#include "panxfer/log.hpp"

#include <cstring>
#include <lmdb.h>
#include <stdexcept>

namespace panxfer {

uint64_t now_epoch_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

uint64_t expiry_after(std::chrono::milliseconds ttl) {
    if (ttl.count() <= 0) return 0;
    return now_epoch_ms() + static_cast<uint64_t>(ttl.count());
}

namespace {

bool expired(uint64_t expires_at, uint64_t now) {
    return expires_at != 0 && now >= expires_at;
}

bool has_prefix(const std::string& key, const std::string& prefix) {
    return key.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

// ============================================================================
// MemoryKvStore
// ============================================================================

std::optional<std::string> MemoryKvStore::get(const std::string& key) {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) return std::nullopt;
    if (expired(it->second.expires_at, now_epoch_ms())) {
        entries_.erase(it);
        return std::nullopt;
    }
    return it->second.value;
}

bool MemoryKvStore::set(const std::string& key, const std::string& value,
                        std::chrono::milliseconds ttl) {
    std::lock_guard lock(mutex_);
    entries_[key] = Entry{expiry_after(ttl), value};
    return true;
}

bool MemoryKvStore::remove(const std::string& key) {
    std::lock_guard lock(mutex_);
    return entries_.erase(key) > 0;
}

size_t MemoryKvStore::remove_prefix(const std::string& prefix) {
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    auto it = entries_.lower_bound(prefix);
    while (it != entries_.end() && has_prefix(it->first, prefix)) {
        it = entries_.erase(it);
        ++removed;
    }
    return removed;
}

bool MemoryKvStore::clear() {
    std::lock_guard lock(mutex_);
    entries_.clear();
    return true;
}

std::vector<std::string> MemoryKvStore::keys_with_prefix(const std::string& prefix) {
    std::lock_guard lock(mutex_);
    std::vector<std::string> keys;
    uint64_t now = now_epoch_ms();
    for (auto it = entries_.lower_bound(prefix);
         it != entries_.end() && has_prefix(it->first, prefix); ++it) {
        if (!expired(it->second.expires_at, now)) keys.push_back(it->first);
    }
    return keys;
}

size_t MemoryKvStore::purge_expired() {
    std::lock_guard lock(mutex_);
    size_t removed = 0;
    uint64_t now = now_epoch_ms();
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (expired(it->second.expires_at, now)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t MemoryKvStore::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

// ============================================================================
// LmdbKvStore
// ============================================================================

namespace {

constexpr size_t kStampSize = sizeof(uint64_t);

uint64_t read_stamp(const MDB_val& v) {
    uint64_t stamp = 0;
    if (v.mv_size >= kStampSize) std::memcpy(&stamp, v.mv_data, kStampSize);
    return stamp;
}

// RAII wrapper so every early return aborts the transaction.
class Txn {
public:
    Txn(MDB_env* env, bool read_only) {
        rc_ = mdb_txn_begin(env, nullptr, read_only ? MDB_RDONLY : 0, &txn_);
        if (rc_) txn_ = nullptr;
    }
    ~Txn() {
        if (txn_) mdb_txn_abort(txn_);
    }
    Txn(const Txn&) = delete;
    Txn& operator=(const Txn&) = delete;

    bool ok() const { return txn_ != nullptr; }
    int error() const { return rc_; }
    MDB_txn* get() const { return txn_; }

    int commit() {
        int rc = mdb_txn_commit(txn_);
        txn_ = nullptr;
        return rc;
    }

private:
    MDB_txn* txn_ = nullptr;
    int rc_ = 0;
};

}  // namespace

LmdbKvStore::LmdbKvStore(const std::filesystem::path& dir, uint64_t mapsize_mb) : dir_(dir) {
    std::error_code ec;
    std::filesystem::create_directories(dir_, ec);
    if (ec) throw std::runtime_error("cannot create cache directory " + dir_.string() + ": " + ec.message());

    int rc = mdb_env_create(&env_);
    if (rc) throw std::runtime_error(std::string("mdb_env_create: ") + mdb_strerror(rc));

    rc = mdb_env_set_mapsize(env_, static_cast<size_t>(mapsize_mb) * 1024 * 1024);
    if (rc == 0) {
        // Transfer workers open short transactions from many threads
        rc = mdb_env_open(env_, dir_.c_str(), MDB_NOTLS, 0664);
    }
    if (rc) {
        mdb_env_close(env_);
        env_ = nullptr;
        throw std::runtime_error("cannot open cache DB at " + dir_.string() + ": " + mdb_strerror(rc));
    }

    MDB_txn* txn = nullptr;
    rc = mdb_txn_begin(env_, nullptr, 0, &txn);
    if (rc == 0) {
        rc = mdb_dbi_open(txn, nullptr, 0, &dbi_);
        if (rc == 0) {
            rc = mdb_txn_commit(txn);
        } else {
            mdb_txn_abort(txn);
        }
    }
    if (rc) {
        mdb_env_close(env_);
        env_ = nullptr;
        throw std::runtime_error(std::string("mdb_dbi_open: ") + mdb_strerror(rc));
    }
}

LmdbKvStore::~LmdbKvStore() {
    if (env_) {
        mdb_env_sync(env_, 1);
        mdb_env_close(env_);
    }
}

std::optional<std::string> LmdbKvStore::get(const std::string& key) {
    bool stale = false;
    {
        Txn txn(env_, true);
        if (!txn.ok()) {
            log_error("LMDB read txn failed: %s", mdb_strerror(txn.error()));
            return std::nullopt;
        }
        MDB_val k = {key.size(), const_cast<char*>(key.data())};
        MDB_val v;
        int rc = mdb_get(txn.get(), dbi_, &k, &v);
        if (rc == MDB_NOTFOUND) return std::nullopt;
        if (rc) {
            log_error("LMDB get %s: %s", key.c_str(), mdb_strerror(rc));
            return std::nullopt;
        }
        if (v.mv_size < kStampSize) {
            stale = true;
        } else if (!expired(read_stamp(v), now_epoch_ms())) {
            return std::string(static_cast<const char*>(v.mv_data) + kStampSize,
                               v.mv_size - kStampSize);
        } else {
            stale = true;
        }
    }
    if (stale) remove_matching(key, true);
    return std::nullopt;
}

bool LmdbKvStore::set(const std::string& key, const std::string& value,
                      std::chrono::milliseconds ttl) {
    std::string buf(kStampSize + value.size(), '\0');
    uint64_t stamp = expiry_after(ttl);
    std::memcpy(buf.data(), &stamp, kStampSize);
    std::memcpy(buf.data() + kStampSize, value.data(), value.size());

    Txn txn(env_, false);
    if (!txn.ok()) {
        log_error("LMDB write txn failed: %s", mdb_strerror(txn.error()));
        return false;
    }
    MDB_val k = {key.size(), const_cast<char*>(key.data())};
    MDB_val v = {buf.size(), buf.data()};
    int rc = mdb_put(txn.get(), dbi_, &k, &v, 0);
    if (rc) {
        log_error("LMDB put %s: %s", key.c_str(), mdb_strerror(rc));
        return false;
    }
    rc = txn.commit();
    if (rc) {
        log_error("LMDB commit: %s", mdb_strerror(rc));
        return false;
    }
    return true;
}

bool LmdbKvStore::remove(const std::string& key) {
    Txn txn(env_, false);
    if (!txn.ok()) return false;
    MDB_val k = {key.size(), const_cast<char*>(key.data())};
    int rc = mdb_del(txn.get(), dbi_, &k, nullptr);
    if (rc == MDB_NOTFOUND) return false;
    if (rc) {
        log_error("LMDB del %s: %s", key.c_str(), mdb_strerror(rc));
        return false;
    }
    return txn.commit() == 0;
}

// Collect matching keys under one write transaction, then delete them.
size_t LmdbKvStore::remove_matching(const std::string& prefix, bool only_expired) {
    Txn txn(env_, false);
    if (!txn.ok()) return 0;

    MDB_cursor* cursor = nullptr;
    if (mdb_cursor_open(txn.get(), dbi_, &cursor)) return 0;

    std::vector<std::string> doomed;
    uint64_t now = now_epoch_ms();
    MDB_val k = {prefix.size(), const_cast<char*>(prefix.data())};
    MDB_val v;
    int rc = prefix.empty() ? mdb_cursor_get(cursor, &k, &v, MDB_FIRST)
                            : mdb_cursor_get(cursor, &k, &v, MDB_SET_RANGE);
    while (rc == 0) {
        std::string key(static_cast<const char*>(k.mv_data), k.mv_size);
        if (!has_prefix(key, prefix)) break;
        if (!only_expired || v.mv_size < kStampSize || expired(read_stamp(v), now)) {
            doomed.push_back(std::move(key));
        }
        rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
    }
    mdb_cursor_close(cursor);

    for (const auto& key : doomed) {
        MDB_val dk = {key.size(), const_cast<char*>(key.data())};
        mdb_del(txn.get(), dbi_, &dk, nullptr);
    }
    if (doomed.empty()) return 0;
    rc = txn.commit();
    if (rc) {
        log_error("LMDB commit: %s", mdb_strerror(rc));
        return 0;
    }
    return doomed.size();
}

size_t LmdbKvStore::remove_prefix(const std::string& prefix) {
    return remove_matching(prefix, false);
}

bool LmdbKvStore::clear() {
    Txn txn(env_, false);
    if (!txn.ok()) return false;
    int rc = mdb_drop(txn.get(), dbi_, 0);
    if (rc) {
        log_error("LMDB drop: %s", mdb_strerror(rc));
        return false;
    }
    return txn.commit() == 0;
}

std::vector<std::string> LmdbKvStore::keys_with_prefix(const std::string& prefix) {
    std::vector<std::string> keys;
    Txn txn(env_, true);
    if (!txn.ok()) return keys;

    MDB_cursor* cursor = nullptr;
    if (mdb_cursor_open(txn.get(), dbi_, &cursor)) return keys;

    uint64_t now = now_epoch_ms();
    MDB_val k = {prefix.size(), const_cast<char*>(prefix.data())};
    MDB_val v;
    int rc = prefix.empty() ? mdb_cursor_get(cursor, &k, &v, MDB_FIRST)
                            : mdb_cursor_get(cursor, &k, &v, MDB_SET_RANGE);
    while (rc == 0) {
        std::string key(static_cast<const char*>(k.mv_data), k.mv_size);
        if (!has_prefix(key, prefix)) break;
        if (v.mv_size >= kStampSize && !expired(read_stamp(v), now)) keys.push_back(std::move(key));
        rc = mdb_cursor_get(cursor, &k, &v, MDB_NEXT);
    }
    mdb_cursor_close(cursor);
    return keys;
}

size_t LmdbKvStore::purge_expired() {
    return remove_matching("", true);
}

uint64_t LmdbKvStore::entry_count() const {
    Txn txn(env_, true);
    if (!txn.ok()) return 0;
    MDB_stat stat;
    if (mdb_stat(txn.get(), dbi_, &stat)) return 0;
    return stat.ms_entries;
}

}  // namespace panxfer
