#pragma once

// ============================================================
// manifest.hpp -- Per-file transfer manifest
//
// The manifest is JSON. The same bytes are stored next to the chunk
// artifacts (manifest.json) and sent as the MANIFEST frame payload.
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "priority.hpp"
#include "hash.hpp"
#include <string>
#include <vector>

enum class CompressAlgo : u8 {
    NONE = 0,
    ZSTD = 1,
};

inline const char* compress_algo_name(CompressAlgo a) {
    return a == CompressAlgo::ZSTD ? "zstd" : "none";
}

// One prepared chunk as recorded in the manifest
struct ChunkDescriptor {
    u32             index{0};
    std::string     name;             // artifact file name, echunk_<index>.bin
    u64             size{0};          // token bytes
    u64             raw_size{0};      // original bytes covered by this chunk
    hash::Digest256 hash{};           // SHA-256 of the token
    hash::Digest256 original_hash{};  // SHA-256 of the original bytes
};

struct Manifest {
    u32                          format_version{CHUNKCP_VERSION};
    std::string                  original_filename;
    u64                          original_size{0};
    hash::Digest256              original_hash{};
    u32                          chunk_size{DEFAULT_CHUNK_SIZE};
    Priority                     priority{Priority::NORMAL};
    CompressAlgo                 compression{CompressAlgo::ZSTD};
    std::vector<ChunkDescriptor> chunks;

    u32 chunk_count() const { return (u32)chunks.size(); }
    u64 chunk_offset(u32 index) const { return (u64)index * chunk_size; }

    // Directory key for the receiver's chunk store
    std::string store_key() const { return hash::to_hex(original_hash).substr(0, 16); }
};

namespace manifest {

static constexpr const char* HASH_ALGORITHM = "sha256";
static constexpr const char* ENCRYPTION     = "aes128-cbc-hmac-sha256";
static constexpr const char* FILE_NAME      = "manifest.json";

// echunk_<index>.bin
std::string chunk_name(u32 index);

// Number of chunks a file of 'size' bytes splits into
u32 expected_chunk_count(u64 size, u32 chunk_size);

// Aggregate file metadata and chunk descriptors into a manifest.
// Throws MalformedManifestError if the result would not validate.
Manifest build(const std::string& filename, u64 size, const hash::Digest256& file_hash,
               u32 chunk_size, Priority priority, CompressAlgo compression,
               std::vector<ChunkDescriptor> chunks);

// Structural checks shared by build() and parse(); throws MalformedManifestError
void validate(const Manifest& m);

std::string to_json(const Manifest& m);

// Parse and validate; throws MalformedManifestError
Manifest parse(const std::string& text);
Manifest parse(const u8* data, size_t len);

// Atomic write / read of manifest.json
void save(const Manifest& m, const std::string& path);
Manifest load(const std::string& path);

} // namespace manifest
