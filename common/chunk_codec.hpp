#pragma once

// ============================================================
// chunk_codec.hpp -- Split, compress, encrypt and hash chunks
//
// encode(): raw bytes -> zstd (optional) -> encrypted token
// restore(): token -> verify MAC -> decrypt -> decompress -> verify hash
// prepare(): one pass over a file, chunks encoded on a ThreadPool and
//            delivered to the caller strictly in index order.
// ============================================================

#include "platform.hpp"
#include "crypto.hpp"
#include "manifest.hpp"
#include "chunk_source.hpp"
#include <functional>
#include <string>
#include <vector>

struct PreparedChunk {
    ChunkDescriptor desc;
    std::vector<u8> token;
};

class ChunkCodec {
public:
    ChunkCodec(const crypto::Key& key, int compress_level);

    PreparedChunk encode(u32 index, const void* data, size_t len, CompressAlgo algo) const;

    // Throws AuthenticationError (bad token / MAC) or IntegrityError
    // (decrypt, decompress, length or original hash mismatch).
    std::vector<u8> restore(const ChunkDescriptor& desc, const u8* token, size_t len,
                            CompressAlgo algo) const;

    std::vector<u8> restore(const ChunkDescriptor& desc, const std::vector<u8>& token,
                            CompressAlgo algo) const {
        return restore(desc, token.data(), token.size(), algo);
    }

private:
    crypto::Key key_;
    int         level_;
};

struct PrepareOptions {
    u32      chunk_size{DEFAULT_CHUNK_SIZE};
    Priority priority{Priority::NORMAL};
    bool     compression_enabled{true};
    int      compress_level{3};
    size_t   threads{1};
};

namespace codec {

using ChunkSink = std::function<void(const PreparedChunk&)>;

// Prepare 'src_path'; each chunk is passed to 'sink' in ascending index
// order. Returns the validated manifest.
Manifest prepare(const std::string& src_path, const crypto::Key& key,
                 const PrepareOptions& opts, const ChunkSink& sink);

// Prepare into <out_dir>/echunk_<i>.bin plus <out_dir>/manifest.json
Manifest prepare_to_dir(const std::string& src_path, const std::string& out_dir,
                        const crypto::Key& key, const PrepareOptions& opts);

// Prepare into memory
Manifest prepare_to_memory(const std::string& src_path, const crypto::Key& key,
                           const PrepareOptions& opts, MemoryChunkSource& out);

} // namespace codec
