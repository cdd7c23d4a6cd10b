#pragma once

#include "panxfer/remote_types.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace panxfer {

class CancelToken;
class RemoteApi;

/// What a source can do. Transfer strategy is chosen from this set, never
/// from the concrete source type.
struct SourceCapabilities {
    bool sized = false;           // size() is known up front
    bool seekable = false;        // read_at is cheap and repeatable (local data)
    bool range_readable = false;  // read_at works, but each call is a remote request
    bool hash_known = false;      // known_hash() returns the content MD5
};

/// Byte source for uploads and copies.
class TransferSource {
public:
    virtual ~TransferSource() = default;

    virtual std::string describe() const = 0;
    virtual SourceCapabilities capabilities() const = 0;
    virtual std::optional<uint64_t> size() const = 0;
    virtual std::string known_hash() const { return {}; }

    /// Sequential read from the current position. Returns bytes read, 0 at
    /// end of data, -1 on error.
    virtual int64_t read(uint8_t* buf, size_t len) = 0;

    /// Read exactly `len` bytes at `offset`. Safe to call from several threads.
    /// Returns false on error or when the source is not seekable/range-readable.
    virtual bool read_at(uint64_t offset, uint8_t* buf, size_t len) = 0;

    /// Last error message from read/read_at.
    std::string last_error() const;

protected:
    void set_error(std::string message);

private:
    mutable std::mutex error_mutex_;
    std::string last_error_;
};

/// Bytes held in memory.
class MemorySource : public TransferSource {
public:
    explicit MemorySource(std::vector<uint8_t> data, std::string hash = {},
                          std::string name = "memory");

    std::string describe() const override { return name_; }
    SourceCapabilities capabilities() const override;
    std::optional<uint64_t> size() const override { return data_.size(); }
    std::string known_hash() const override { return hash_; }
    int64_t read(uint8_t* buf, size_t len) override;
    bool read_at(uint64_t offset, uint8_t* buf, size_t len) override;

    const std::vector<uint8_t>& data() const { return data_; }

private:
    std::vector<uint8_t> data_;
    std::string hash_;
    std::string name_;
    size_t position_ = 0;
};

/// Local file read with pread. Throws std::runtime_error if it cannot be opened.
class LocalFileSource : public TransferSource {
public:
    explicit LocalFileSource(const std::filesystem::path& path, std::string hash = {});
    ~LocalFileSource() override;

    LocalFileSource(const LocalFileSource&) = delete;
    LocalFileSource& operator=(const LocalFileSource&) = delete;

    std::string describe() const override { return path_.string(); }
    SourceCapabilities capabilities() const override;
    std::optional<uint64_t> size() const override { return size_; }
    std::string known_hash() const override { return hash_; }
    int64_t read(uint8_t* buf, size_t len) override;
    bool read_at(uint64_t offset, uint8_t* buf, size_t len) override;

    const std::filesystem::path& path() const { return path_; }

protected:
    std::filesystem::path path_;

private:
    int fd_ = -1;
    uint64_t size_ = 0;
    std::string hash_;
    uint64_t position_ = 0;
};

/// Buffer file owned by the transfer; removed on destruction.
class TempFileSource : public LocalFileSource {
public:
    TempFileSource(const std::filesystem::path& path, std::string hash);
    ~TempFileSource() override;
};

/// Forward-only stream (pipe, socket, HTTP body). Cannot be re-read.
class StreamSource : public TransferSource {
public:
    /// Same contract as TransferSource::read.
    using Reader = std::function<int64_t(uint8_t* buf, size_t len)>;

    StreamSource(Reader reader, std::optional<uint64_t> size, std::string hash = {},
                 std::string name = "stream");

    std::string describe() const override { return name_; }
    SourceCapabilities capabilities() const override;
    std::optional<uint64_t> size() const override { return size_; }
    std::string known_hash() const override { return hash_; }
    int64_t read(uint8_t* buf, size_t len) override;
    bool read_at(uint64_t offset, uint8_t* buf, size_t len) override;

    uint64_t bytes_read() const { return bytes_read_; }
    uint64_t read_calls() const { return read_calls_; }

private:
    Reader reader_;
    std::optional<uint64_t> size_;
    std::string hash_;
    std::string name_;
    std::atomic<uint64_t> bytes_read_{0};
    std::atomic<uint64_t> read_calls_{0};
};

/// Object on the remote store, read through ranged downloads.
class RemoteObjectSource : public TransferSource {
public:
    RemoteObjectSource(RemoteApi& api, RemoteEntry entry, const CancelToken* cancel = nullptr);

    std::string describe() const override { return "remote:" + entry_.id + "/" + entry_.name; }
    SourceCapabilities capabilities() const override;
    std::optional<uint64_t> size() const override { return entry_.size; }
    std::string known_hash() const override { return entry_.hash; }
    int64_t read(uint8_t* buf, size_t len) override;
    bool read_at(uint64_t offset, uint8_t* buf, size_t len) override;

    const RemoteEntry& entry() const { return entry_; }
    uint64_t range_requests() const { return range_requests_; }

private:
    RemoteApi& api_;
    RemoteEntry entry_;
    const CancelToken* cancel_;
    uint64_t position_ = 0;
    std::atomic<uint64_t> range_requests_{0};
};

}  // namespace panxfer
