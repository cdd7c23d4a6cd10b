#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

// Forward declare to keep OpenSSL out of public headers
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace panxfer {

/// Incremental MD5 (the provider's content hash). Produces lowercase hex.
class Hasher {
public:
    Hasher();
    ~Hasher();

    Hasher(const Hasher&) = delete;
    Hasher& operator=(const Hasher&) = delete;

    void update(const void* data, size_t len);
    void update(std::span<const uint8_t> data) { update(data.data(), data.size()); }

    /// Finish and return the digest. The hasher is reset afterwards.
    std::string final_hex();

    static std::string md5_hex(std::span<const uint8_t> data);
    static std::string md5_hex(const std::string& data);

private:
    EVP_MD_CTX* ctx_;
};

}  // namespace panxfer
