#include "panxfer/hash_util.hpp"

#include <cstdio>
#include <stdexcept>

#include <openssl/evp.h>

namespace panxfer {

namespace {

std::string to_hex(const unsigned char* bytes, unsigned int len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        out.push_back(digits[bytes[i] >> 4]);
        out.push_back(digits[bytes[i] & 0x0f]);
    }
    return out;
}

}  // namespace

Hasher::Hasher() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_ || EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("Failed to initialize MD5 context");
    }
}

Hasher::~Hasher() {
    EVP_MD_CTX_free(ctx_);
}

void Hasher::update(const void* data, size_t len) {
    if (len == 0) return;
    EVP_DigestUpdate(ctx_, data, len);
}

std::string Hasher::final_hex() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    EVP_DigestFinal_ex(ctx_, digest, &len);
    EVP_DigestInit_ex(ctx_, EVP_md5(), nullptr);
    return to_hex(digest, len);
}

std::string Hasher::md5_hex(std::span<const uint8_t> data) {
    Hasher h;
    h.update(data);
    return h.final_hex();
}

std::string Hasher::md5_hex(const std::string& data) {
    Hasher h;
    h.update(data.data(), data.size());
    return h.final_hex();
}

}  // namespace panxfer
