#pragma once

#include "panxfer/hash_util.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace panxfer {

/// Computes the whole-file digest from chunks that may arrive in any order,
/// so the source is never read a second time just to hash it.
///
/// Chunks are identified by index over a fixed geometry (total size, chunk
/// size). The rolling hash advances over the contiguous prefix; chunks ahead
/// of it are held until the gap closes.
class StreamingHashAccumulator {
public:
    StreamingHashAccumulator(uint64_t total_size, uint64_t chunk_size);

    StreamingHashAccumulator(const StreamingHashAccumulator&) = delete;
    StreamingHashAccumulator& operator=(const StreamingHashAccumulator&) = delete;

    /// Feed chunk `index`. Returns the number of bytes accepted: the chunk
    /// length, or 0 for a duplicate, out-of-range or wrongly sized chunk.
    size_t write_chunk(uint64_t index, std::span<const uint8_t> data);

    /// Digest of the full stream, or nullopt while coverage is incomplete.
    std::optional<std::string> finalize();

    uint64_t covered_bytes() const;
    bool complete() const;

    uint64_t total_chunks() const { return total_chunks_; }
    uint64_t expected_size(uint64_t index) const;

    /// Bytes held for out-of-order chunks.
    uint64_t pending_bytes() const;

private:
    void drain_locked();

    const uint64_t total_size_;
    const uint64_t chunk_size_;
    const uint64_t total_chunks_;

    mutable std::mutex mutex_;
    Hasher hasher_;
    uint64_t next_index_ = 0;
    uint64_t covered_ = 0;
    uint64_t pending_bytes_ = 0;
    std::map<uint64_t, std::vector<uint8_t>> pending_;
    std::optional<std::string> digest_;
};

}  // namespace panxfer
