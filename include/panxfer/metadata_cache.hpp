#pragma once

#include "panxfer/engine_config.hpp"
#include "panxfer/kv_store.hpp"
#include "panxfer/remote_types.hpp"

#include <atomic>
#include <chrono>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace panxfer {

class CancelToken;
class RemoteApi;
struct ListResult;

/// One page of a directory listing.
struct ListingPage {
    std::vector<RemoteEntry> entries;
    std::string next_cursor;  // empty = last page
};

/// Cached path resolution.
struct PathEntry {
    std::string id;
    bool is_directory = false;
    std::string parent_id;
};

/// A keyed TTL store living under one namespace of the shared KvStore.
class CacheStore {
public:
    CacheStore(KvStore& kv, std::string ns, std::chrono::milliseconds default_ttl);

    std::optional<std::string> get(const std::string& key);
    /// ttl of zero uses the store default.
    bool set(const std::string& key, const std::string& value,
             std::chrono::milliseconds ttl = std::chrono::milliseconds(0));
    bool remove(const std::string& key);
    size_t remove_prefix(const std::string& prefix);
    size_t clear();

    const std::string& ns() const { return ns_; }
    std::string full_key(const std::string& key) const { return ns_ + key; }

private:
    KvStore& kv_;
    std::string ns_;
    std::chrono::milliseconds default_ttl_;
};

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t corrupt = 0;        // entries evicted after failing verification
    uint64_t invalidations = 0;  // mutation-triggered invalidation cycles
};

/// Parent-validity, directory-listing and path->id caches with
/// mutation-triggered invalidation. Reads take a shared lock; writes and
/// invalidation take it exclusively.
class MetadataCache {
public:
    MetadataCache(KvStore& kv, const CacheSettings& settings);

    // --- Parent validity (positive and negative answers) ---
    std::optional<bool> parent_valid(const std::string& parent_id);
    void set_parent_valid(const std::string& parent_id, bool exists);

    // --- Directory listings, keyed by (parent id, cursor) ---
    std::optional<ListingPage> listing(const std::string& parent_id, const std::string& cursor);
    /// Skipped (returns false) when an invalidation happened after
    /// `observed_generation` was read, so a fetch racing a mutation cannot
    /// re-populate the cache with the pre-mutation page.
    bool set_listing(const std::string& parent_id, const std::string& cursor,
                     const ListingPage& page,
                     std::optional<uint64_t> observed_generation = std::nullopt);

    /// Bumped by every invalidation cycle.
    uint64_t generation() const { return invalidations_; }

    // --- Path -> identifier ---
    std::optional<PathEntry> path(const std::string& path);
    bool set_path(const std::string& path, const PathEntry& entry,
                  std::optional<uint64_t> observed_generation = std::nullopt);

    /// A mutation touched `path` inside directory `parent_id`. Drops the
    /// parent's listing pages, the cached path (and anything below it) and the
    /// parent path. `object_id` names the mutated object when it may be a
    /// directory (its own listing and validity go too). An empty parent_id
    /// means the affected parent is unknown: listing and parent-validity
    /// stores are cleared entirely.
    void invalidate_mutation(const std::string& path, const std::string& parent_id,
                             const std::string& object_id = {});

    /// Clear listing and parent-validity stores.
    void invalidate_all();

    /// Drop everything, path cache included.
    void clear();

    CacheStats stats() const;

    /// Checksum stored alongside listing pages (FNV-1a 64, hex).
    static std::string checksum(const std::string& data);

    CacheStore& parent_store() { return parent_valid_; }
    CacheStore& listing_store() { return listings_; }
    CacheStore& path_store() { return paths_; }

    static std::string listing_key(const std::string& parent_id, const std::string& cursor);

private:
    std::optional<ListingPage> decode_listing(const std::string& raw, bool& corrupt) const;
    void evict_corrupt(CacheStore& store, const std::string& key);
    void invalidate_all_locked();

    CacheSettings settings_;
    CacheStore parent_valid_;
    CacheStore listings_;
    CacheStore paths_;

    mutable std::shared_mutex mutex_;
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> corrupt_{0};
    std::atomic<uint64_t> invalidations_{0};
};

/// All children of `parent_id`, page by page, served from the listing cache
/// where possible. Pages fetched from the provider are cached unless an
/// invalidation ran while they were in flight.
ListResult list_all_children(RemoteApi& api, MetadataCache& cache, const std::string& parent_id,
                             size_t page_size, const CancelToken* cancel);

}  // namespace panxfer
