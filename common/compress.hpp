#pragma once

// ============================================================
// compress.hpp -- zstd compression wrapper
// ============================================================

#include "platform.hpp"
#include <vector>
#include <string>
#include <stdexcept>

#include "zstd.h"

namespace compress {

static constexpr int DEFAULT_LEVEL = 3;

// Returns the maximum compressed size for a given input size
inline size_t max_compressed_size(size_t input_size) {
    return ZSTD_compressBound(input_size);
}

inline bool valid_level(int level) {
    return level >= 1 && level <= ZSTD_maxCLevel();
}

// Compress src -> dst (dst must be pre-sized to at least max_compressed_size(src_len))
// Returns actual compressed size
inline size_t compress(void* dst, size_t dst_cap, const void* src, size_t src_len, int level) {
    size_t result = ZSTD_compress(dst, dst_cap, src, src_len, level);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD compress error: ") + ZSTD_getErrorName(result));
    }
    return result;
}

// Decompress src -> dst (dst_cap must be original size)
// Returns actual decompressed size
inline size_t decompress(void* dst, size_t dst_cap, const void* src, size_t src_len) {
    size_t result = ZSTD_decompress(dst, dst_cap, src, src_len);
    if (ZSTD_isError(result)) {
        throw std::runtime_error(std::string("ZSTD decompress error: ") + ZSTD_getErrorName(result));
    }
    return result;
}

// Compress to a resizable buffer; returns compressed data
inline std::vector<u8> compress_to_vec(const void* src, size_t src_len, int level) {
    size_t cap = max_compressed_size(src_len);
    std::vector<u8> buf(cap);
    size_t sz = compress(buf.data(), cap, src, src_len, level);
    buf.resize(sz);
    return buf;
}

// Decompress to a buffer of known original size
inline std::vector<u8> decompress_to_vec(const void* src, size_t src_len, size_t original_size) {
    std::vector<u8> buf(original_size);
    size_t sz = decompress(buf.data(), original_size, src, src_len);
    buf.resize(sz);
    return buf;
}

// Extension blacklist: should we compress this file?
inline bool should_compress(const std::string& path) {
    // Do NOT compress already-compressed formats
    static const char* const no_compress[] = {
        ".gz", ".bz2", ".xz", ".zst", ".lz4", ".br",
        ".zip", ".7z", ".rar",
        ".jpg", ".jpeg", ".png", ".gif", ".webp", ".avif", ".heic",
        ".mp4", ".mkv", ".avi", ".mov", ".wmv", ".flv", ".webm",
        ".mp3", ".aac", ".ogg", ".flac", ".opus", ".m4a",
        ".pdf",
        nullptr
    };

    auto slash_pos = path.find_last_of('/');
    auto dot_pos = path.rfind('.');
    if (dot_pos == std::string::npos) return true;
    if (slash_pos != std::string::npos && dot_pos < slash_pos) return true;

    std::string ext = path.substr(dot_pos);
    for (auto& c : ext) {
        if (c >= 'A' && c <= 'Z') c = (char)(c + 32);
    }

    for (int i = 0; no_compress[i]; ++i) {
        if (ext == no_compress[i]) return false;
    }
    return true;
}

} // namespace compress
