#include "panxfer/chunk_progress.hpp"
#include "panxfer/log.hpp"

#include <algorithm>
#include <nlohmann/json.hpp>

namespace panxfer {

using json = nlohmann::json;

// ============================================================================
// SessionProgress
// ============================================================================

uint64_t SessionProgress::uploaded_count() const {
    uint64_t n = 0;
    for (const auto& c : chunks) {
        if (c.uploaded) ++n;
    }
    return n;
}

uint64_t SessionProgress::uploaded_bytes() const {
    uint64_t n = 0;
    for (const auto& c : chunks) {
        if (c.uploaded) n += c.size;
    }
    return n;
}

SessionProgress SessionProgress::create(std::string session_id, uint64_t total_size,
                                        uint64_t chunk_size) {
    SessionProgress p;
    p.session_id = std::move(session_id);
    p.total_size = total_size;
    p.chunk_size = chunk_size;
    p.total_chunks = chunk_size == 0 ? 0 : (total_size + chunk_size - 1) / chunk_size;
    p.chunks.reserve(p.total_chunks);
    for (uint64_t i = 0; i < p.total_chunks; ++i) {
        ChunkRecord c;
        c.index = i;
        c.offset = i * chunk_size;
        c.size = std::min(chunk_size, total_size - c.offset);
        p.chunks.push_back(c);
    }
    return p;
}

std::string SessionProgress::to_json() const {
    json cs = json::array();
    for (const auto& c : chunks) {
        cs.push_back({{"i", c.index}, {"o", c.offset}, {"s", c.size}, {"u", c.uploaded},
                      {"h", c.hash}, {"a", c.attempts}});
    }
    json j{{"session", session_id}, {"path", target_path},  {"parent", parent_id},
           {"name", name},          {"size", total_size},   {"chunk_size", chunk_size},
           {"chunks_total", total_chunks}, {"hash", content_hash}, {"created", created_at},
           {"chunks", std::move(cs)}};
    return j.dump();
}

std::optional<SessionProgress> SessionProgress::from_json(const std::string& data) {
    try {
        auto j = json::parse(data);
        SessionProgress p;
        p.session_id = j.at("session").get<std::string>();
        p.target_path = j.value("path", "");
        p.parent_id = j.value("parent", "");
        p.name = j.value("name", "");
        p.total_size = j.at("size").get<uint64_t>();
        p.chunk_size = j.at("chunk_size").get<uint64_t>();
        p.total_chunks = j.at("chunks_total").get<uint64_t>();
        p.content_hash = j.value("hash", "");
        p.created_at = j.value("created", int64_t{0});

        const auto& cs = j.at("chunks");
        if (!cs.is_array() || cs.size() != p.total_chunks || p.chunk_size == 0) {
            return std::nullopt;
        }
        uint64_t expected_offset = 0;
        for (const auto& cj : cs) {
            ChunkRecord c;
            c.index = cj.at("i").get<uint64_t>();
            c.offset = cj.at("o").get<uint64_t>();
            c.size = cj.at("s").get<uint64_t>();
            c.uploaded = cj.at("u").get<bool>();
            c.hash = cj.value("h", "");
            c.attempts = cj.value("a", 0);
            if (c.index != p.chunks.size() || c.offset != expected_offset) return std::nullopt;
            expected_offset += c.size;
            p.chunks.push_back(std::move(c));
        }
        if (expected_offset != p.total_size) return std::nullopt;
        return p;
    } catch (const json::exception&) {
        return std::nullopt;
    }
}

// ============================================================================
// ProgressStore
// ============================================================================

ProgressStore::ProgressStore(KvStore& kv, std::chrono::milliseconds ttl) : kv_(kv), ttl_(ttl) {}

std::shared_ptr<std::mutex> ProgressStore::session_mutex(const std::string& session_id) {
    std::lock_guard lock(map_mutex_);
    auto& m = session_mutexes_[session_id];
    if (!m) m = std::make_shared<std::mutex>();
    return m;
}

bool ProgressStore::save(const SessionProgress& progress) {
    auto m = session_mutex(progress.session_id);
    std::lock_guard lock(*m);
    if (!kv_.set(kPrefix + progress.session_id, progress.to_json(), ttl_)) {
        log_error("Failed to persist progress for session %s", progress.session_id.c_str());
        return false;
    }
    return true;
}

std::optional<SessionProgress> ProgressStore::load(const std::string& session_id) {
    auto m = session_mutex(session_id);
    std::lock_guard lock(*m);
    auto raw = kv_.get(kPrefix + session_id);
    if (!raw) return std::nullopt;
    auto p = SessionProgress::from_json(*raw);
    if (!p) {
        log_warn("Discarding malformed progress record for session %s", session_id.c_str());
        kv_.remove(kPrefix + session_id);
    }
    return p;
}

bool ProgressStore::remove(const std::string& session_id) {
    bool removed;
    {
        auto m = session_mutex(session_id);
        std::lock_guard lock(*m);
        removed = kv_.remove(kPrefix + session_id);
    }
    std::lock_guard lock(map_mutex_);
    session_mutexes_.erase(session_id);
    return removed;
}

std::vector<std::string> ProgressStore::list_sessions() {
    std::vector<std::string> ids;
    const std::string prefix = kPrefix;
    for (auto& key : kv_.keys_with_prefix(prefix)) {
        ids.push_back(key.substr(prefix.size()));
    }
    return ids;
}

}  // namespace panxfer
