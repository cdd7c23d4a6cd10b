#pragma once

#include "panxfer/errors.hpp"
#include "panxfer/remote_types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace panxfer {

class CancelToken;

struct ListResult {
    bool success = false;
    std::vector<RemoteEntry> entries;
    std::string next_page_token;  // empty = terminal page
    TransferError error;
};

struct EntryResult {
    bool success = false;
    RemoteEntry entry;
    TransferError error;
};

/// Answer to a create-session request.
struct SessionOpenResult {
    bool success = false;
    bool reused = false;       // provider already stores this content (instant upload)
    std::string session_id;    // provider upload id; empty when reused
    std::string file_id;       // set when reused
    uint64_t slice_size = 0;   // provider-dictated chunk size, 0 = caller chooses
    TransferError error;
};

struct OpResult {
    bool success = false;
    std::string id;  // created object id where applicable
    TransferError error;
};

/// Session close or async poll. success && !completed means the provider is
/// still assembling the object.
struct CompleteResult {
    bool success = false;
    bool completed = false;
    bool async = false;  // provider asked the caller to poll
    std::string file_id;
    std::string content_hash;
    TransferError error;
};

struct ReadResult {
    bool success = false;
    std::vector<uint8_t> data;
    TransferError error;
};

struct CreateSessionRequest {
    std::string parent_id;
    std::string name;
    uint64_t size = 0;
    std::string content_hash;  // MD5 hex; required by the provider
};

/// Provider operations used by the engine. Implementations pace, authenticate
/// and retry internally; results carry the terminal error when they fail.
class RemoteApi {
public:
    virtual ~RemoteApi() = default;

    virtual std::string type_name() const = 0;

    virtual ListResult list_children(const std::string& parent_id, const std::string& page_token,
                                     size_t limit, const CancelToken* cancel) = 0;
    virtual EntryResult get_entry(const std::string& id, const CancelToken* cancel) = 0;

    // --- Uploads ---
    virtual SessionOpenResult create_session(const CreateSessionRequest& request,
                                             const CancelToken* cancel) = 0;
    /// Upload chunk `index` (zero-based). `chunk_hash` is the MD5 of `data`.
    virtual OpResult upload_chunk(const std::string& session_id, uint64_t index,
                                  std::span<const uint8_t> data, const std::string& chunk_hash,
                                  const CancelToken* cancel) = 0;
    virtual CompleteResult complete_session(const std::string& session_id,
                                            const CancelToken* cancel) = 0;
    /// One status probe, no internal retry; the caller owns the polling budget.
    virtual CompleteResult poll_session(const std::string& session_id,
                                        const CancelToken* cancel) = 0;
    virtual CompleteResult upload_single(const CreateSessionRequest& request,
                                         std::span<const uint8_t> data,
                                         const CancelToken* cancel) = 0;

    // --- Downloads ---
    virtual ReadResult read_range(const std::string& file_id, uint64_t offset, uint64_t length,
                                  const CancelToken* cancel) = 0;

    // --- Mutations ---
    virtual OpResult make_directory(const std::string& parent_id, const std::string& name,
                                    const CancelToken* cancel) = 0;
    virtual OpResult remove(const std::vector<std::string>& ids, const CancelToken* cancel) = 0;
    virtual OpResult move(const std::vector<std::string>& ids, const std::string& to_parent_id,
                          const CancelToken* cancel) = 0;
    virtual OpResult rename(const std::string& id, const std::string& new_name,
                            const CancelToken* cancel) = 0;
};

}  // namespace panxfer
