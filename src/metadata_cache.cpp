#include "panxfer/metadata_cache.hpp"
#include "panxfer/log.hpp"
#include "panxfer/remote_api.hpp"

#include <cstdio>
#include <mutex>
#include <nlohmann/json.hpp>

namespace panxfer {

using json = nlohmann::json;

namespace {

json entry_to_json(const RemoteEntry& e) {
    return json{{"id", e.id}, {"name", e.name}, {"parent", e.parent_id}, {"size", e.size},
                {"hash", e.hash}, {"dir", e.is_directory}, {"mtime", e.modified}};
}

RemoteEntry entry_from_json(const json& j) {
    RemoteEntry e;
    e.id = j.at("id").get<std::string>();
    e.name = j.at("name").get<std::string>();
    e.parent_id = j.value("parent", "");
    e.size = j.value("size", uint64_t{0});
    e.hash = j.value("hash", "");
    e.is_directory = j.value("dir", false);
    e.modified = j.value("mtime", int64_t{0});
    return e;
}

}  // namespace

// ============================================================================
// CacheStore
// ============================================================================

CacheStore::CacheStore(KvStore& kv, std::string ns, std::chrono::milliseconds default_ttl)
    : kv_(kv), ns_(std::move(ns)), default_ttl_(default_ttl) {}

std::optional<std::string> CacheStore::get(const std::string& key) {
    return kv_.get(full_key(key));
}

bool CacheStore::set(const std::string& key, const std::string& value,
                     std::chrono::milliseconds ttl) {
    return kv_.set(full_key(key), value, ttl.count() > 0 ? ttl : default_ttl_);
}

bool CacheStore::remove(const std::string& key) {
    return kv_.remove(full_key(key));
}

size_t CacheStore::remove_prefix(const std::string& prefix) {
    return kv_.remove_prefix(full_key(prefix));
}

size_t CacheStore::clear() {
    return kv_.remove_prefix(ns_);
}

// ============================================================================
// MetadataCache
// ============================================================================

MetadataCache::MetadataCache(KvStore& kv, const CacheSettings& settings)
    : settings_(settings)
    , parent_valid_(kv, "pv/", settings.parent_valid_ttl)
    , listings_(kv, "ls/", settings.listing_ttl)
    , paths_(kv, "path/", settings.path_ttl) {}

std::string MetadataCache::checksum(const std::string& data) {
    uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : data) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(h));
    return buf;
}

std::string MetadataCache::listing_key(const std::string& parent_id, const std::string& cursor) {
    return parent_id + "/" + cursor;
}

void MetadataCache::evict_corrupt(CacheStore& store, const std::string& key) {
    std::unique_lock lock(mutex_);
    store.remove(key);
    ++corrupt_;
    log_warn("Evicted corrupt cache entry %s", store.full_key(key).c_str());
}

// --- Parent validity ---

std::optional<bool> MetadataCache::parent_valid(const std::string& parent_id) {
    std::optional<std::string> raw;
    {
        std::shared_lock lock(mutex_);
        raw = parent_valid_.get(parent_id);
    }
    if (!raw) {
        ++misses_;
        return std::nullopt;
    }
    if (*raw != "1" && *raw != "0") {
        evict_corrupt(parent_valid_, parent_id);
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return *raw == "1";
}

void MetadataCache::set_parent_valid(const std::string& parent_id, bool exists) {
    std::unique_lock lock(mutex_);
    parent_valid_.set(parent_id, exists ? "1" : "0");
}

// --- Listings ---

std::optional<ListingPage> MetadataCache::decode_listing(const std::string& raw, bool& corrupt) const {
    corrupt = false;
    try {
        auto j = json::parse(raw);
        const auto& entries = j.at("e");
        if (!entries.is_array() || entries.size() != j.at("c").get<size_t>()) {
            corrupt = true;
            return std::nullopt;
        }
        // Small pages get the structural check only
        size_t bytes = j.at("b").get<size_t>();
        if (bytes > settings_.listing_checksum_threshold) {
            std::string dumped = entries.dump();
            if (dumped.size() != bytes || checksum(dumped) != j.at("s").get<std::string>()) {
                corrupt = true;
                return std::nullopt;
            }
        }

        ListingPage page;
        page.next_cursor = j.at("n").get<std::string>();
        page.entries.reserve(entries.size());
        for (const auto& e : entries) page.entries.push_back(entry_from_json(e));
        return page;
    } catch (const json::exception&) {
        corrupt = true;
        return std::nullopt;
    }
}

std::optional<ListingPage> MetadataCache::listing(const std::string& parent_id,
                                                  const std::string& cursor) {
    const std::string key = listing_key(parent_id, cursor);
    std::optional<std::string> raw;
    {
        std::shared_lock lock(mutex_);
        raw = listings_.get(key);
    }
    if (!raw) {
        ++misses_;
        return std::nullopt;
    }

    bool corrupt = false;
    auto page = decode_listing(*raw, corrupt);
    if (corrupt) {
        evict_corrupt(listings_, key);
        ++misses_;
        return std::nullopt;
    }
    ++hits_;
    return page;
}

bool MetadataCache::set_listing(const std::string& parent_id, const std::string& cursor,
                                const ListingPage& page,
                                std::optional<uint64_t> observed_generation) {
    json entries = json::array();
    for (const auto& e : page.entries) entries.push_back(entry_to_json(e));
    std::string dumped = entries.dump();

    json j;
    j["e"] = std::move(entries);
    j["c"] = page.entries.size();
    j["n"] = page.next_cursor;
    j["b"] = dumped.size();
    j["s"] = checksum(dumped);

    std::unique_lock lock(mutex_);
    if (observed_generation && *observed_generation != invalidations_) return false;
    return listings_.set(listing_key(parent_id, cursor), j.dump());
}

// --- Paths ---

std::optional<PathEntry> MetadataCache::path(const std::string& path) {
    const std::string key = normalize_path(path);
    std::optional<std::string> raw;
    {
        std::shared_lock lock(mutex_);
        raw = paths_.get(key);
    }
    if (!raw) {
        ++misses_;
        return std::nullopt;
    }
    try {
        auto j = json::parse(*raw);
        PathEntry entry;
        entry.id = j.at("id").get<std::string>();
        entry.is_directory = j.at("dir").get<bool>();
        entry.parent_id = j.at("parent").get<std::string>();
        ++hits_;
        return entry;
    } catch (const json::exception&) {
        evict_corrupt(paths_, key);
        ++misses_;
        return std::nullopt;
    }
}

bool MetadataCache::set_path(const std::string& path, const PathEntry& entry,
                             std::optional<uint64_t> observed_generation) {
    json j{{"id", entry.id}, {"dir", entry.is_directory}, {"parent", entry.parent_id}};
    std::unique_lock lock(mutex_);
    if (observed_generation && *observed_generation != invalidations_) return false;
    return paths_.set(normalize_path(path), j.dump());
}

// --- Invalidation ---

void MetadataCache::invalidate_all_locked() {
    listings_.clear();
    parent_valid_.clear();
}

void MetadataCache::invalidate_mutation(const std::string& path, const std::string& parent_id,
                                        const std::string& object_id) {
    const std::string p = normalize_path(path);

    std::unique_lock lock(mutex_);
    ++invalidations_;

    if (parent_id.empty()) {
        invalidate_all_locked();
    } else {
        listings_.remove_prefix(parent_id + "/");
    }

    if (!object_id.empty()) {
        listings_.remove_prefix(object_id + "/");
        parent_valid_.remove(object_id);
    }

    paths_.remove(p);
    if (p != "/") {
        paths_.remove_prefix(p + "/");
        paths_.remove(parent_path_of(p));
    }
}

void MetadataCache::invalidate_all() {
    std::unique_lock lock(mutex_);
    ++invalidations_;
    invalidate_all_locked();
}

void MetadataCache::clear() {
    std::unique_lock lock(mutex_);
    ++invalidations_;
    invalidate_all_locked();
    paths_.clear();
}

// ============================================================================
// Paginated listing through the cache
// ============================================================================

ListResult list_all_children(RemoteApi& api, MetadataCache& cache, const std::string& parent_id,
                             size_t page_size, const CancelToken* cancel) {
    ListResult out;
    std::string cursor;
    for (size_t pages = 0;; ++pages) {
        const uint64_t generation = cache.generation();
        auto page = cache.listing(parent_id, cursor);
        if (!page) {
            auto r = api.list_children(parent_id, cursor, page_size, cancel);
            if (!r.success) {
                out.error = std::move(r.error);
                out.entries.clear();
                return out;
            }
            ListingPage fetched{std::move(r.entries), std::move(r.next_page_token)};
            cache.set_listing(parent_id, cursor, fetched, generation);
            page = std::move(fetched);
        }
        out.entries.insert(out.entries.end(), page->entries.begin(), page->entries.end());
        if (page->next_cursor.empty() || page->next_cursor == cursor) break;
        if (pages >= 100000) {
            log_warn("Listing of %s did not terminate after %zu pages", parent_id.c_str(), pages);
            break;
        }
        cursor = page->next_cursor;
    }
    out.success = true;
    return out;
}

CacheStats MetadataCache::stats() const {
    CacheStats s;
    s.hits = hits_;
    s.misses = misses_;
    s.corrupt = corrupt_;
    s.invalidations = invalidations_;
    return s;
}

}  // namespace panxfer
