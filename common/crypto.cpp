// ============================================================
// crypto.cpp -- AES-128-CBC + HMAC-SHA256 tokens over OpenSSL
// ============================================================

#include "crypto.hpp"
#include "errors.hpp"
#include "protocol_io.hpp"
#include "file_io.hpp"
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <openssl/crypto.h>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <cstring>

namespace {

using EVP_CIPHER_CTX_ptr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

EVP_CIPHER_CTX_ptr new_cipher_ctx() {
    EVP_CIPHER_CTX_ptr ctx(EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free);
    if (!ctx) throw std::runtime_error("EVP_CIPHER_CTX_new failed");
    return ctx;
}

void compute_mac(const crypto::Key& key, const u8* data, size_t len, u8 out[32]) {
    unsigned int out_len = 0;
    if (!HMAC(EVP_sha256(), key.signing.data(), (int)key.signing.size(),
              data, len, out, &out_len) || out_len != crypto::MAC_LEN) {
        throw std::runtime_error("HMAC-SHA256 failed");
    }
}

} // namespace

namespace crypto {

// ---------------------------------------------------------------
// Keys
// ---------------------------------------------------------------

Key key_from_bytes(const std::vector<u8>& raw) {
    if (raw.size() != KEY_LEN) {
        throw std::runtime_error("Key must be " + std::to_string(KEY_LEN) +
                                 " bytes, got " + std::to_string(raw.size()));
    }
    Key k;
    std::memcpy(k.signing.data(),    raw.data(),                HALF_KEY_LEN);
    std::memcpy(k.encryption.data(), raw.data() + HALF_KEY_LEN, HALF_KEY_LEN);
    return k;
}

Key parse_key(const std::string& text) {
    return key_from_bytes(base64url_decode(text));
}

Key load_key_file(const std::string& path) {
    std::vector<u8> raw;
    try {
        raw = file_io::read_file(path);
    } catch (const std::exception& e) {
        throw std::runtime_error("Cannot read key file '" + path + "': " + e.what());
    }
    try {
        return parse_key(std::string(raw.begin(), raw.end()));
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid key file '" + path + "': " + e.what());
    }
}

// ---------------------------------------------------------------
// Tokens
// ---------------------------------------------------------------

std::vector<u8> encrypt(const Key& key, const void* data, size_t len) {
    u8 iv[16];
    if (RAND_bytes(iv, sizeof(iv)) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }

    // Ciphertext is the plaintext rounded up to the next full block
    size_t ct_cap = (len / 16 + 1) * 16;
    std::vector<u8> token(CT_OFFSET + ct_cap + MAC_LEN);

    token[0] = TOKEN_VERSION;
    u64 ts = (u64)std::chrono::duration_cast<std::chrono::seconds>(
                 std::chrono::system_clock::now().time_since_epoch()).count();
    u64 ts_be = proto::hton64(ts);
    std::memcpy(token.data() + 1, &ts_be, 8);
    std::memcpy(token.data() + IV_OFFSET, iv, 16);

    auto ctx = new_cipher_ctx();
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                           key.encryption.data(), iv) != 1) {
        throw std::runtime_error("EVP_EncryptInit_ex failed");
    }
    int out1 = 0, out2 = 0;
    u8* ct = token.data() + CT_OFFSET;
    if (EVP_EncryptUpdate(ctx.get(), ct, &out1,
                          static_cast<const u8*>(data), (int)len) != 1) {
        throw std::runtime_error("EVP_EncryptUpdate failed");
    }
    if (EVP_EncryptFinal_ex(ctx.get(), ct + out1, &out2) != 1) {
        throw std::runtime_error("EVP_EncryptFinal_ex failed");
    }
    size_t ct_len = (size_t)out1 + (size_t)out2;
    if (ct_len != ct_cap) {
        throw std::runtime_error("Unexpected ciphertext length");
    }

    compute_mac(key, token.data(), CT_OFFSET + ct_len, token.data() + CT_OFFSET + ct_len);
    return token;
}

std::vector<u8> decrypt(const Key& key, const u8* token, size_t len) {
    if (len < MIN_TOKEN_LEN) {
        throw AuthenticationError("Token too short: " + std::to_string(len) + " bytes");
    }
    if (token[0] != TOKEN_VERSION) {
        throw AuthenticationError("Bad token version byte");
    }
    size_t ct_len = len - CT_OFFSET - MAC_LEN;
    if (ct_len % 16 != 0) {
        throw AuthenticationError("Ciphertext is not block aligned");
    }

    u8 mac[32];
    compute_mac(key, token, len - MAC_LEN, mac);
    if (CRYPTO_memcmp(mac, token + len - MAC_LEN, MAC_LEN) != 0) {
        throw AuthenticationError("Token signature mismatch");
    }

    auto ctx = new_cipher_ctx();
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_cbc(), nullptr,
                           key.encryption.data(), token + IV_OFFSET) != 1) {
        throw std::runtime_error("EVP_DecryptInit_ex failed");
    }
    std::vector<u8> plain(ct_len + 16);
    int out1 = 0, out2 = 0;
    if (EVP_DecryptUpdate(ctx.get(), plain.data(), &out1,
                          token + CT_OFFSET, (int)ct_len) != 1) {
        throw IntegrityError("Token decryption failed");
    }
    if (EVP_DecryptFinal_ex(ctx.get(), plain.data() + out1, &out2) != 1) {
        throw IntegrityError("Token padding invalid");
    }
    plain.resize((size_t)out1 + (size_t)out2);
    return plain;
}

bool token_iv(const u8* token, size_t len, u8 iv_out[16]) {
    if (len < CT_OFFSET) return false;
    std::memcpy(iv_out, token + IV_OFFSET, 16);
    return true;
}

// ---------------------------------------------------------------
// URL-safe base64
// ---------------------------------------------------------------

std::string base64url_encode(const u8* data, size_t len) {
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, (int)len);
    out.resize((size_t)n);
    for (auto& c : out) {
        if (c == '+') c = '-';
        else if (c == '/') c = '_';
    }
    return out;
}

std::vector<u8> base64url_decode(const std::string& text) {
    std::string s;
    s.reserve(text.size() + 3);
    for (char c : text) {
        if (c == ' ' || c == '\n' || c == '\r' || c == '\t') continue;
        if (c == '-') c = '+';
        else if (c == '_') c = '/';
        s += c;
    }
    if (s.empty()) throw std::runtime_error("Empty base64 input");
    while (s.size() % 4 != 0) s += '=';

    size_t pad = 0;
    if (s[s.size() - 1] == '=') ++pad;
    if (s[s.size() - 2] == '=') ++pad;

    std::vector<u8> out(s.size() / 4 * 3);
    int n = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(s.data()),
                            (int)s.size());
    if (n < 0 || (size_t)n < pad) {
        throw std::runtime_error("Invalid base64 input");
    }
    out.resize((size_t)n - pad);
    return out;
}

} // namespace crypto
