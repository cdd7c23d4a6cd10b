#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct MDB_env;

namespace panxfer {

/// Durable key-value store with per-entry TTL. Values are opaque bytes; an
/// expired entry is never returned. A ttl of zero means no expiry.
class KvStore {
public:
    virtual ~KvStore() = default;

    virtual std::string type_name() const = 0;

    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual bool set(const std::string& key, const std::string& value,
                     std::chrono::milliseconds ttl) = 0;
    virtual bool remove(const std::string& key) = 0;

    /// Remove every key starting with `prefix`. Returns the number removed.
    virtual size_t remove_prefix(const std::string& prefix) = 0;

    virtual bool clear() = 0;

    /// Live keys starting with `prefix`, in key order.
    virtual std::vector<std::string> keys_with_prefix(const std::string& prefix) = 0;

    /// Drop expired entries. Returns the number removed.
    virtual size_t purge_expired() = 0;
};

/// Milliseconds since the Unix epoch; expiry stamps are wall-clock so they
/// survive restarts.
uint64_t now_epoch_ms();

/// Expiry stamp for a ttl starting now (0 = never).
uint64_t expiry_after(std::chrono::milliseconds ttl);

/// In-process store for tests and ephemeral runs.
class MemoryKvStore : public KvStore {
public:
    std::string type_name() const override { return "memory"; }

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value,
             std::chrono::milliseconds ttl) override;
    bool remove(const std::string& key) override;
    size_t remove_prefix(const std::string& prefix) override;
    bool clear() override;
    std::vector<std::string> keys_with_prefix(const std::string& prefix) override;
    size_t purge_expired() override;

    size_t size() const;

private:
    struct Entry {
        uint64_t expires_at = 0;
        std::string value;
    };

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

/// LMDB-backed store. Each value is stored as an 8-byte expiry stamp
/// (host byte order, ms since epoch, 0 = never) followed by the payload.
/// Throws std::runtime_error if the environment cannot be opened.
class LmdbKvStore : public KvStore {
public:
    LmdbKvStore(const std::filesystem::path& dir, uint64_t mapsize_mb);
    ~LmdbKvStore() override;

    LmdbKvStore(const LmdbKvStore&) = delete;
    LmdbKvStore& operator=(const LmdbKvStore&) = delete;

    std::string type_name() const override { return "lmdb"; }

    std::optional<std::string> get(const std::string& key) override;
    bool set(const std::string& key, const std::string& value,
             std::chrono::milliseconds ttl) override;
    bool remove(const std::string& key) override;
    size_t remove_prefix(const std::string& prefix) override;
    bool clear() override;
    std::vector<std::string> keys_with_prefix(const std::string& prefix) override;
    size_t purge_expired() override;

    uint64_t entry_count() const;
    const std::filesystem::path& path() const { return dir_; }

private:
    size_t remove_matching(const std::string& prefix, bool only_expired);

    std::filesystem::path dir_;
    ::MDB_env* env_ = nullptr;
    unsigned int dbi_ = 0;
};

}  // namespace panxfer
