#include "panxfer/transfer_selector.hpp"
#include "panxfer/hash_accumulator.hpp"
#include "panxfer/hash_util.hpp"
#include "panxfer/log.hpp"
#include "panxfer/sync.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <thread>
#include <unistd.h>
#include <vector>

namespace panxfer {

namespace {

constexpr size_t kStreamBlock = 4 * MiB;

/// Owned file descriptor for buffer files.
class FileHandle {
public:
    explicit FileHandle(int fd) : fd_(fd) {}
    ~FileHandle() {
        if (fd_ >= 0) ::close(fd_);
    }
    FileHandle(const FileHandle&) = delete;
    FileHandle& operator=(const FileHandle&) = delete;

    int get() const { return fd_; }
    bool close() {
        int fd = fd_;
        fd_ = -1;
        return fd < 0 || ::close(fd) == 0;
    }

private:
    int fd_;
};

bool write_all(int fd, const uint8_t* data, size_t len, uint64_t offset) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pwrite(fd, data + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

}  // namespace

const char* buffer_strategy_name(BufferStrategy strategy) {
    switch (strategy) {
        case BufferStrategy::Direct: return "direct";
        case BufferStrategy::Memory: return "memory";
        case BufferStrategy::Hybrid: return "hybrid";
        case BufferStrategy::Disk: return "disk";
    }
    return "unknown";
}

// ============================================================================
// MemoryBudget
// ============================================================================

bool MemoryBudget::try_reserve(uint64_t bytes) {
    std::lock_guard lock(mutex_);
    if (in_use_ + bytes > limit_) return false;
    in_use_ += bytes;
    return true;
}

void MemoryBudget::release(uint64_t bytes) {
    std::lock_guard lock(mutex_);
    in_use_ = bytes > in_use_ ? 0 : in_use_ - bytes;
}

uint64_t MemoryBudget::in_use() const {
    std::lock_guard lock(mutex_);
    return in_use_;
}

// ============================================================================
// TransferSelector
// ============================================================================

TransferSelector::TransferSelector(const CrossStoreSettings& settings, MemoryBudget& budget)
    : settings_(settings), budget_(budget) {}

BufferStrategy TransferSelector::choose(const SourceCapabilities& caps,
                                        std::optional<uint64_t> size) const {
    if (caps.seekable && caps.sized) return BufferStrategy::Direct;
    if (!size) return BufferStrategy::Disk;
    if (*size <= settings_.memory_limit) return BufferStrategy::Memory;
    if (*size <= settings_.hybrid_limit && caps.range_readable) return BufferStrategy::Hybrid;
    return BufferStrategy::Disk;
}

std::filesystem::path TransferSelector::next_temp_path() {
    static std::atomic<uint64_t> counter{0};
    return settings_.temp_dir / ("xfer-" + std::to_string(::getpid()) + "-" +
                                 std::to_string(now_epoch_seconds()) + "-" +
                                 std::to_string(counter++) + ".buf");
}

PreparedSource TransferSelector::prepare(TransferSource& source, const CancelToken* cancel) {
    PreparedSource out;
    const auto caps = source.capabilities();
    const auto size = source.size();
    out.strategy = choose(caps, size);

    if (out.strategy == BufferStrategy::Direct) {
        out.success = true;
        out.source = &source;
        out.size = *size;
        out.content_hash = source.known_hash();
        return out;
    }

    if (out.strategy == BufferStrategy::Memory) {
        if (budget_.try_reserve(*size)) {
            out.reservation = MemoryBudget::Reservation(&budget_, *size);
        } else {
            log_info("Memory budget exhausted (%llu/%llu bytes in use), buffering %s on disk",
                     static_cast<unsigned long long>(budget_.in_use()),
                     static_cast<unsigned long long>(budget_.limit()), source.describe().c_str());
            out.strategy = BufferStrategy::Disk;
        }
    }

    log_debug("Staging %s via %s buffer", source.describe().c_str(),
              buffer_strategy_name(out.strategy));

    bool ok = false;
    switch (out.strategy) {
        case BufferStrategy::Memory: ok = buffer_in_memory(source, out, cancel); break;
        case BufferStrategy::Hybrid: ok = buffer_hybrid(source, out, cancel); break;
        default: ok = buffer_on_disk(source, out, cancel); break;
    }
    if (!ok) {
        out.owned.reset();
        out.source = nullptr;
        out.reservation.reset();
        if (out.error.operation.empty()) out.error.operation = "buffer";
        if (out.error.target.empty()) out.error.target = source.describe();
        return out;
    }

    // A hash supplied by the source must agree with what we read
    const std::string known = source.known_hash();
    if (!known.empty() && known != out.content_hash) {
        out.owned.reset();
        out.source = nullptr;
        out.error = TransferError::make(ErrorCategory::DataIntegrity, "buffer", source.describe(),
                                        "content hash " + out.content_hash +
                                            " does not match source hash " + known);
        return out;
    }

    out.source = out.owned.get();
    out.success = true;
    return out;
}

bool TransferSelector::buffer_in_memory(TransferSource& source, PreparedSource& out,
                                        const CancelToken* cancel) {
    const uint64_t size = *source.size();
    std::vector<uint8_t> data(size);
    Hasher hasher;

    uint64_t filled = 0;
    while (filled < size) {
        if (is_cancelled(cancel)) {
            out.error = TransferError::make(ErrorCategory::Cancelled, "buffer", {}, "cancelled");
            return false;
        }
        size_t want = static_cast<size_t>(std::min<uint64_t>(settings_.range_size, size - filled));
        int64_t n = source.read(data.data() + filled, want);
        if (n < 0) {
            out.error = TransferError::make(ErrorCategory::NetworkTimeout, "buffer", {},
                                            "source read failed: " + source.last_error());
            return false;
        }
        if (n == 0) break;
        hasher.update(data.data() + filled, static_cast<size_t>(n));
        filled += static_cast<uint64_t>(n);
    }
    out.bytes_read = filled;
    if (filled != size) {
        out.error = TransferError::make(ErrorCategory::DataIntegrity, "buffer", {},
                                        "source ended after " + std::to_string(filled) + " of " +
                                            std::to_string(size) + " bytes");
        return false;
    }

    out.size = size;
    out.content_hash = hasher.final_hex();
    out.owned = std::make_unique<MemorySource>(std::move(data), out.content_hash,
                                               source.describe());
    return true;
}

bool TransferSelector::buffer_hybrid(TransferSource& source, PreparedSource& out,
                                     const CancelToken* cancel) {
    const uint64_t size = *source.size();
    std::error_code ec;
    std::filesystem::create_directories(settings_.temp_dir, ec);
    auto path = next_temp_path();

    FileHandle fd(::open(path.c_str(), O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
    if (fd.get() < 0) {
        out.error = TransferError::make(ErrorCategory::ResourceExhausted, "buffer", path.string(),
                                        std::string("cannot create buffer file: ") +
                                            std::strerror(errno));
        return false;
    }

    const uint64_t range = std::max<uint64_t>(settings_.range_size, 1);
    const uint64_t ranges = (size + range - 1) / range;
    std::atomic<uint64_t> next{0};
    std::atomic<bool> failed{false};
    std::mutex error_mutex;
    std::string first_error;
    // Ranges complete out of order; the accumulator hashes them as they land
    StreamingHashAccumulator accumulator(size, range);

    auto reader = [&] {
        std::vector<uint8_t> buf;
        while (!failed) {
            uint64_t i = next++;
            if (i >= ranges) return;
            if (is_cancelled(cancel)) {
                failed = true;
                return;
            }
            uint64_t offset = i * range;
            size_t len = static_cast<size_t>(std::min(range, size - offset));
            buf.resize(len);
            std::string err;
            if (!source.read_at(offset, buf.data(), len)) {
                err = "ranged read failed: " + source.last_error();
            } else if (!write_all(fd.get(), buf.data(), len, offset)) {
                err = std::string("buffer write failed: ") + std::strerror(errno);
            } else {
                accumulator.write_chunk(i, buf);
            }
            if (!err.empty()) {
                std::lock_guard lock(error_mutex);
                if (first_error.empty()) first_error = err;
                failed = true;
                return;
            }
        }
    };

    const size_t reader_count = static_cast<size_t>(
        std::min<uint64_t>(std::max<size_t>(settings_.range_readers, 1), std::max<uint64_t>(ranges, 1)));
    std::vector<std::thread> readers;
    for (size_t i = 0; i < reader_count; ++i) readers.emplace_back(reader);
    for (auto& t : readers) t.join();

    bool closed = fd.close();
    if (failed || !closed) {
        std::filesystem::remove(path, ec);
        if (is_cancelled(cancel)) {
            out.error = TransferError::make(ErrorCategory::Cancelled, "buffer", {}, "cancelled");
        } else {
            out.error = TransferError::make(ErrorCategory::NetworkTimeout, "buffer", {},
                                            first_error.empty() ? "buffer close failed" : first_error);
        }
        return false;
    }
    out.bytes_read = size;

    auto digest = accumulator.finalize();
    if (!digest) {
        std::filesystem::remove(path, ec);
        out.error = TransferError::make(ErrorCategory::DataIntegrity, "buffer", path.string(),
                                        "ranges do not cover the source");
        return false;
    }
    const std::string& hash = *digest;

    out.size = size;
    out.content_hash = hash;
    try {
        out.owned = std::make_unique<TempFileSource>(path, hash);
    } catch (const std::runtime_error& e) {
        std::filesystem::remove(path, ec);
        out.error = TransferError::make(ErrorCategory::DataIntegrity, "buffer", path.string(),
                                        e.what());
        return false;
    }
    return true;
}

bool TransferSelector::buffer_on_disk(TransferSource& source, PreparedSource& out,
                                      const CancelToken* cancel) {
    const auto size = source.size();
    std::error_code ec;
    std::filesystem::create_directories(settings_.temp_dir, ec);

    if (size) {
        auto space = std::filesystem::space(settings_.temp_dir, ec);
        if (!ec && space.available < *size) {
            out.error = TransferError::make(
                ErrorCategory::ResourceExhausted, "buffer", settings_.temp_dir.string(),
                "need " + std::to_string(*size) + " bytes of buffer space, " +
                    std::to_string(space.available) + " available");
            return false;
        }
    }

    auto path = next_temp_path();
    FileHandle fd(::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0600));
    if (fd.get() < 0) {
        out.error = TransferError::make(ErrorCategory::ResourceExhausted, "buffer", path.string(),
                                        std::string("cannot create buffer file: ") +
                                            std::strerror(errno));
        return false;
    }

    Hasher hasher;
    std::vector<uint8_t> buf(kStreamBlock);
    uint64_t written = 0;
    auto abandon = [&](ErrorCategory category, std::string message) {
        fd.close();
        std::filesystem::remove(path, ec);
        out.error = TransferError::make(category, "buffer", {}, std::move(message));
        return false;
    };

    while (true) {
        if (is_cancelled(cancel)) return abandon(ErrorCategory::Cancelled, "cancelled");
        int64_t n = source.read(buf.data(), buf.size());
        if (n < 0) {
            return abandon(ErrorCategory::NetworkTimeout, "source read failed: " + source.last_error());
        }
        if (n == 0) break;
        if (!write_all(fd.get(), buf.data(), static_cast<size_t>(n), written)) {
            return abandon(ErrorCategory::ResourceExhausted,
                           std::string("buffer write failed: ") + std::strerror(errno));
        }
        hasher.update(buf.data(), static_cast<size_t>(n));
        written += static_cast<uint64_t>(n);
    }
    out.bytes_read = written;

    if (size && written != *size) {
        return abandon(ErrorCategory::DataIntegrity,
                       "source ended after " + std::to_string(written) + " of " +
                           std::to_string(*size) + " bytes");
    }
    if (!fd.close()) {
        std::filesystem::remove(path, ec);
        out.error = TransferError::make(ErrorCategory::ResourceExhausted, "buffer", path.string(),
                                        "buffer close failed");
        return false;
    }

    out.size = written;
    out.content_hash = hasher.final_hex();
    try {
        out.owned = std::make_unique<TempFileSource>(path, out.content_hash);
    } catch (const std::runtime_error& e) {
        std::filesystem::remove(path, ec);
        out.error = TransferError::make(ErrorCategory::DataIntegrity, "buffer", path.string(),
                                        e.what());
        return false;
    }
    return true;
}

}  // namespace panxfer
