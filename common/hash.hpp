#pragma once

// ============================================================
// hash.hpp -- xxHash3 frame checksums and SHA-256 digests
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <array>
#include <memory>
#include <string>
#include <stdexcept>

// XXH_STATIC_LINKING_ONLY exposes the XXH3 state API
#define XXH_STATIC_LINKING_ONLY
#include "xxhash.h"

#include <openssl/evp.h>

namespace hash {

// ---- xxh3: cheap per-frame checksum ----

// Compute xxh3_32 (lower 32 bits of xxh3_64) of a memory buffer
inline u32 xxh3_32(const void* data, size_t len) {
    return (u32)(XXH3_64bits(data, len) & 0xFFFFFFFFull);
}

// ---- SHA-256: chunk and whole-file identity ----

using Digest256 = std::array<u8, 32>;

using EVP_MD_CTX_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

// Streaming SHA-256 over EVP
class Sha256 {
public:
    Sha256() : ctx_(EVP_MD_CTX_new(), &EVP_MD_CTX_free) {
        if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
        reset();
    }

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void reset() {
        if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
            throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
        }
    }

    void update(const void* data, size_t len) {
        if (len == 0) return;
        if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
            throw std::runtime_error("EVP_DigestUpdate failed");
        }
    }

    Digest256 digest() {
        Digest256 out{};
        unsigned int out_len = 0;
        if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &out_len) != 1 || out_len != out.size()) {
            throw std::runtime_error("EVP_DigestFinal_ex failed");
        }
        return out;
    }

private:
    EVP_MD_CTX_ptr ctx_;
};

inline Digest256 sha256(const void* data, size_t len) {
    Sha256 h;
    h.update(data, len);
    return h.digest();
}

// Lowercase hex, the form used in manifests
inline std::string to_hex(const Digest256& d) {
    static const char digits[] = "0123456789abcdef";
    std::string s;
    s.reserve(64);
    for (u8 b : d) {
        s += digits[b >> 4];
        s += digits[b & 0x0F];
    }
    return s;
}

inline bool is_hex_digest(const std::string& s) {
    if (s.size() != 64) return false;
    for (char c : s) {
        bool ok = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        if (!ok) return false;
    }
    return true;
}

// Parse 64 lowercase hex digits; throws on malformed input
inline Digest256 from_hex(const std::string& s) {
    if (!is_hex_digest(s)) {
        throw std::runtime_error("Invalid sha256 hex digest: '" + s + "'");
    }
    auto nibble = [](char c) -> u8 {
        return (u8)(c <= '9' ? c - '0' : c - 'a' + 10);
    };
    Digest256 d{};
    for (size_t i = 0; i < d.size(); ++i) {
        d[i] = (u8)((nibble(s[2 * i]) << 4) | nibble(s[2 * i + 1]));
    }
    return d;
}

inline void to_bytes(const Digest256& d, u8 out[32]) {
    std::copy(d.begin(), d.end(), out);
}

inline Digest256 from_bytes(const u8 in[32]) {
    Digest256 d;
    std::copy(in, in + 32, d.begin());
    return d;
}

} // namespace hash
