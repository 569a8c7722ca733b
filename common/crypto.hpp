#pragma once

// ============================================================
// crypto.hpp -- Authenticated chunk encryption
//
// Token layout (Fernet construction, binary form):
//   0x80 | timestamp u64 BE | IV[16] | AES-128-CBC ciphertext | HMAC-SHA256[32]
// The HMAC covers every byte before it. The 32-byte key is split into a
// signing half (first 16 bytes) and an encryption half (last 16 bytes).
// ============================================================

#include "platform.hpp"
#include <array>
#include <string>
#include <vector>

namespace crypto {

static constexpr u8     TOKEN_VERSION = 0x80;
static constexpr size_t KEY_LEN       = 32;
static constexpr size_t HALF_KEY_LEN  = 16;
static constexpr size_t IV_OFFSET     = 1 + 8;
static constexpr size_t CT_OFFSET     = IV_OFFSET + 16;
static constexpr size_t MAC_LEN       = 32;
// Smallest valid token: one padding block of ciphertext
static constexpr size_t MIN_TOKEN_LEN = CT_OFFSET + 16 + MAC_LEN;

struct Key {
    std::array<u8, HALF_KEY_LEN> signing{};
    std::array<u8, HALF_KEY_LEN> encryption{};
};

// Build a key from 32 raw bytes; throws std::runtime_error on wrong length
Key key_from_bytes(const std::vector<u8>& raw);

// Decode the URL-safe base64 text form (surrounding whitespace ignored)
Key parse_key(const std::string& text);

// Read and decode a key file; throws std::runtime_error if missing or invalid
Key load_key_file(const std::string& path);

// Encrypt and sign; a fresh random IV is drawn for every call
std::vector<u8> encrypt(const Key& key, const void* data, size_t len);

// Verify and decrypt.
// Throws AuthenticationError if the token is malformed or the MAC fails,
// IntegrityError if a correctly signed token does not decrypt.
std::vector<u8> decrypt(const Key& key, const u8* token, size_t len);

// Copy the IV out of a token; false if the token is too short
bool token_iv(const u8* token, size_t len, u8 iv_out[16]);

// URL-safe base64 with padding
std::string base64url_encode(const u8* data, size_t len);
std::vector<u8> base64url_decode(const std::string& text);

} // namespace crypto
