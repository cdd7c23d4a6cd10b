#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace panxfer {

/// One child of a remote directory as reported by a listing.
struct RemoteEntry {
    std::string id;
    std::string name;
    std::string parent_id;
    uint64_t size = 0;
    std::string hash;  // provider content hash (MD5 hex), empty for directories
    bool is_directory = false;
    int64_t modified = 0;  // epoch seconds
};

/// Result handle for a completed transfer. Only built after the provider
/// confirms completion.
struct TransferObject {
    std::string remote_path;
    std::string file_id;
    uint64_t size = 0;
    std::string content_hash;
    int64_t modified = 0;
    bool is_directory = false;
};

/// "/a//b/" -> "/a/b"; "" -> "/".
std::string normalize_path(const std::string& path);

/// Parent of a normalized path ("/a/b" -> "/a", "/a" -> "/").
std::string parent_path_of(const std::string& path);

/// Last component of a normalized path ("/" -> "").
std::string base_name_of(const std::string& path);

std::string join_path(const std::string& dir, const std::string& name);

/// Components of a normalized path, root excluded.
std::vector<std::string> split_path(const std::string& path);

/// Replace characters the provider rejects and cap the name at 255 bytes on a
/// UTF-8 boundary. Returns empty when nothing usable remains.
std::string clean_file_name(const std::string& name);

/// "report.pdf", 2 -> "report (2).pdf"; keeps the result within 255 bytes.
std::string numbered_name(const std::string& name, size_t n);

/// "report.pdf", ts -> "report_<ts>.pdf".
std::string timestamped_name(const std::string& name, int64_t unix_seconds);

int64_t now_epoch_seconds();

}  // namespace panxfer
