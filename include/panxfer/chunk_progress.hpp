#pragma once

#include "panxfer/kv_store.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace panxfer {

/// Transfer state of one chunk.
struct ChunkRecord {
    uint64_t index = 0;
    uint64_t offset = 0;
    uint64_t size = 0;
    bool uploaded = false;   // set only after the provider accepted this byte range
    std::string hash;        // MD5 of the chunk bytes, set when uploaded
    int attempts = 0;
};

/// Persisted progress of one chunked upload session.
struct SessionProgress {
    std::string session_id;
    std::string target_path;
    std::string parent_id;
    std::string name;
    uint64_t total_size = 0;
    uint64_t chunk_size = 0;
    uint64_t total_chunks = 0;
    std::string content_hash;
    int64_t created_at = 0;
    std::vector<ChunkRecord> chunks;

    uint64_t uploaded_count() const;
    uint64_t uploaded_bytes() const;

    /// Build the chunk table for a fresh session.
    static SessionProgress create(std::string session_id, uint64_t total_size, uint64_t chunk_size);

    std::string to_json() const;
    /// nullopt if the record is malformed or its geometry is inconsistent.
    static std::optional<SessionProgress> from_json(const std::string& data);
};

/// Chunk progress records in the durable KvStore under "progress/<session>".
/// Saves for one session are serialized; different sessions save in parallel.
class ProgressStore {
public:
    ProgressStore(KvStore& kv, std::chrono::milliseconds ttl);

    bool save(const SessionProgress& progress);
    std::optional<SessionProgress> load(const std::string& session_id);
    bool remove(const std::string& session_id);

    /// Session ids with live progress records.
    std::vector<std::string> list_sessions();

    static constexpr const char* kPrefix = "progress/";

private:
    std::shared_ptr<std::mutex> session_mutex(const std::string& session_id);

    KvStore& kv_;
    std::chrono::milliseconds ttl_;

    std::mutex map_mutex_;
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> session_mutexes_;
};

}  // namespace panxfer
