#pragma once

#include "panxfer/engine_config.hpp"
#include "panxfer/errors.hpp"
#include "panxfer/transfer_source.hpp"

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace panxfer {

class CancelToken;

enum class BufferStrategy {
    Direct,  // source is local and seekable; upload straight from it
    Memory,  // read fully into memory, hashing as it arrives
    Hybrid,  // parallel ranged reads into a local file, then hash
    Disk,    // stream to a local file while hashing
};

const char* buffer_strategy_name(BufferStrategy strategy);

/// Shared cap on bytes held by memory-buffered transfers.
class MemoryBudget {
public:
    explicit MemoryBudget(uint64_t limit) : limit_(limit) {}

    bool try_reserve(uint64_t bytes);
    void release(uint64_t bytes);

    uint64_t in_use() const;
    uint64_t limit() const { return limit_; }

    /// Releases its bytes on destruction.
    class Reservation {
    public:
        Reservation() = default;
        Reservation(MemoryBudget* budget, uint64_t bytes) : budget_(budget), bytes_(bytes) {}
        ~Reservation() { reset(); }

        Reservation(Reservation&& other) noexcept
            : budget_(other.budget_), bytes_(other.bytes_) {
            other.budget_ = nullptr;
        }
        Reservation& operator=(Reservation&& other) noexcept {
            if (this != &other) {
                reset();
                budget_ = other.budget_;
                bytes_ = other.bytes_;
                other.budget_ = nullptr;
            }
            return *this;
        }
        Reservation(const Reservation&) = delete;
        Reservation& operator=(const Reservation&) = delete;

        void reset() {
            if (budget_) budget_->release(bytes_);
            budget_ = nullptr;
        }

    private:
        MemoryBudget* budget_ = nullptr;
        uint64_t bytes_ = 0;
    };

private:
    const uint64_t limit_;
    mutable std::mutex mutex_;
    uint64_t in_use_ = 0;
};

/// A source made ready for chunked upload: re-readable, sized and hashed.
struct PreparedSource {
    bool success = false;
    BufferStrategy strategy = BufferStrategy::Direct;
    TransferSource* source = nullptr;       // the original, or `owned`
    std::unique_ptr<TransferSource> owned;  // buffer created for this transfer
    MemoryBudget::Reservation reservation;
    uint64_t size = 0;
    std::string content_hash;               // empty for Direct without a known hash
    uint64_t bytes_read = 0;                // bytes pulled from the original source
    TransferError error;
};

/// Picks how to stage a source whose bytes cannot simply be re-read (another
/// remote store, a pipe). Dispatch is on capabilities and size only.
class TransferSelector {
public:
    TransferSelector(const CrossStoreSettings& settings, MemoryBudget& budget);

    /// Strategy before memory budget and disk space are consulted.
    BufferStrategy choose(const SourceCapabilities& caps, std::optional<uint64_t> size) const;

    /// Stage `source`. Every byte of a non-seekable source is read exactly once.
    PreparedSource prepare(TransferSource& source, const CancelToken* cancel);

private:
    bool buffer_in_memory(TransferSource& source, PreparedSource& out, const CancelToken* cancel);
    bool buffer_hybrid(TransferSource& source, PreparedSource& out, const CancelToken* cancel);
    bool buffer_on_disk(TransferSource& source, PreparedSource& out, const CancelToken* cancel);
    std::filesystem::path next_temp_path();

    CrossStoreSettings settings_;
    MemoryBudget& budget_;
};

}  // namespace panxfer
