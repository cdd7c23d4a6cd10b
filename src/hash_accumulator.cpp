#include "panxfer/hash_accumulator.hpp"

#include <algorithm>

namespace panxfer {

StreamingHashAccumulator::StreamingHashAccumulator(uint64_t total_size, uint64_t chunk_size)
    : total_size_(total_size)
    , chunk_size_(chunk_size == 0 ? 1 : chunk_size)
    , total_chunks_(total_size == 0 ? 0 : (total_size + chunk_size_ - 1) / chunk_size_) {}

uint64_t StreamingHashAccumulator::expected_size(uint64_t index) const {
    if (index >= total_chunks_) return 0;
    uint64_t offset = index * chunk_size_;
    return std::min(chunk_size_, total_size_ - offset);
}

size_t StreamingHashAccumulator::write_chunk(uint64_t index, std::span<const uint8_t> data) {
    if (index >= total_chunks_ || data.size() != expected_size(index)) return 0;

    std::lock_guard lock(mutex_);
    if (index < next_index_ || pending_.count(index)) return 0;

    covered_ += data.size();
    if (index == next_index_) {
        hasher_.update(data);
        ++next_index_;
        drain_locked();
    } else {
        pending_bytes_ += data.size();
        pending_.emplace(index, std::vector<uint8_t>(data.begin(), data.end()));
    }
    return data.size();
}

void StreamingHashAccumulator::drain_locked() {
    auto it = pending_.begin();
    while (it != pending_.end() && it->first == next_index_) {
        hasher_.update(it->second);
        pending_bytes_ -= it->second.size();
        it = pending_.erase(it);
        ++next_index_;
    }
}

std::optional<std::string> StreamingHashAccumulator::finalize() {
    std::lock_guard lock(mutex_);
    if (digest_) return digest_;
    if (covered_ != total_size_ || next_index_ != total_chunks_) return std::nullopt;
    digest_ = hasher_.final_hex();
    return digest_;
}

uint64_t StreamingHashAccumulator::covered_bytes() const {
    std::lock_guard lock(mutex_);
    return covered_;
}

bool StreamingHashAccumulator::complete() const {
    std::lock_guard lock(mutex_);
    return covered_ == total_size_ && next_index_ == total_chunks_;
}

uint64_t StreamingHashAccumulator::pending_bytes() const {
    std::lock_guard lock(mutex_);
    return pending_bytes_;
}

}  // namespace panxfer
