#include "panxfer/transfer_source.hpp"
#include "panxfer/remote_api.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <stdexcept>
#include <sys/stat.h>
#include <unistd.h>

namespace panxfer {

std::string TransferSource::last_error() const {
    std::lock_guard lock(error_mutex_);
    return last_error_;
}

void TransferSource::set_error(std::string message) {
    std::lock_guard lock(error_mutex_);
    last_error_ = std::move(message);
}

// ============================================================================
// MemorySource
// ============================================================================

MemorySource::MemorySource(std::vector<uint8_t> data, std::string hash, std::string name)
    : data_(std::move(data)), hash_(std::move(hash)), name_(std::move(name)) {}

SourceCapabilities MemorySource::capabilities() const {
    return {true, true, true, !hash_.empty()};
}

int64_t MemorySource::read(uint8_t* buf, size_t len) {
    size_t n = std::min(len, data_.size() - position_);
    if (n > 0) std::memcpy(buf, data_.data() + position_, n);
    position_ += n;
    return static_cast<int64_t>(n);
}

bool MemorySource::read_at(uint64_t offset, uint8_t* buf, size_t len) {
    if (offset > data_.size() || len > data_.size() - offset) {
        set_error("read beyond end of buffer");
        return false;
    }
    if (len > 0) std::memcpy(buf, data_.data() + offset, len);
    return true;
}

// ============================================================================
// LocalFileSource
// ============================================================================

LocalFileSource::LocalFileSource(const std::filesystem::path& path, std::string hash)
    : path_(path), hash_(std::move(hash)) {
    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open " + path.string() + ": " + std::strerror(errno));
    }
    struct stat st;
    if (fstat(fd_, &st) != 0 || !S_ISREG(st.st_mode)) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("Not a regular file: " + path.string());
    }
    size_ = static_cast<uint64_t>(st.st_size);
}

LocalFileSource::~LocalFileSource() {
    if (fd_ >= 0) ::close(fd_);
}

SourceCapabilities LocalFileSource::capabilities() const {
    return {true, true, true, !hash_.empty()};
}

int64_t LocalFileSource::read(uint8_t* buf, size_t len) {
    if (position_ >= size_) return 0;
    size_t want = static_cast<size_t>(std::min<uint64_t>(len, size_ - position_));
    if (!read_at(position_, buf, want)) return -1;
    position_ += want;
    return static_cast<int64_t>(want);
}

bool LocalFileSource::read_at(uint64_t offset, uint8_t* buf, size_t len) {
    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd_, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            set_error(std::string("pread failed: ") + std::strerror(errno));
            return false;
        }
        if (n == 0) {
            set_error("unexpected end of file (file changed during transfer?)");
            return false;
        }
        done += static_cast<size_t>(n);
    }
    return true;
}

TempFileSource::TempFileSource(const std::filesystem::path& path, std::string hash)
    : LocalFileSource(path, std::move(hash)) {}

TempFileSource::~TempFileSource() {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
}

// ============================================================================
// StreamSource
// ============================================================================

StreamSource::StreamSource(Reader reader, std::optional<uint64_t> size, std::string hash,
                           std::string name)
    : reader_(std::move(reader)), size_(size), hash_(std::move(hash)), name_(std::move(name)) {}

SourceCapabilities StreamSource::capabilities() const {
    return {size_.has_value(), false, false, !hash_.empty()};
}

int64_t StreamSource::read(uint8_t* buf, size_t len) {
    ++read_calls_;
    int64_t n = reader_(buf, len);
    if (n < 0) {
        set_error("stream read failed");
        return -1;
    }
    bytes_read_ += static_cast<uint64_t>(n);
    return n;
}

bool StreamSource::read_at(uint64_t, uint8_t*, size_t) {
    set_error("stream source does not support positioned reads");
    return false;
}

// ============================================================================
// RemoteObjectSource
// ============================================================================

RemoteObjectSource::RemoteObjectSource(RemoteApi& api, RemoteEntry entry, const CancelToken* cancel)
    : api_(api), entry_(std::move(entry)), cancel_(cancel) {}

SourceCapabilities RemoteObjectSource::capabilities() const {
    return {true, false, true, !entry_.hash.empty()};
}

int64_t RemoteObjectSource::read(uint8_t* buf, size_t len) {
    if (position_ >= entry_.size) return 0;
    size_t want = static_cast<size_t>(std::min<uint64_t>(len, entry_.size - position_));
    if (!read_at(position_, buf, want)) return -1;
    position_ += want;
    return static_cast<int64_t>(want);
}

bool RemoteObjectSource::read_at(uint64_t offset, uint8_t* buf, size_t len) {
    if (len == 0) return true;
    ++range_requests_;
    auto result = api_.read_range(entry_.id, offset, len, cancel_);
    if (!result.success) {
        set_error(result.error.to_string());
        return false;
    }
    if (result.data.size() != len) {
        set_error("short ranged read: got " + std::to_string(result.data.size()) +
                  " of " + std::to_string(len) + " bytes");
        return false;
    }
    std::memcpy(buf, result.data.data(), len);
    return true;
}

}  // namespace panxfer
