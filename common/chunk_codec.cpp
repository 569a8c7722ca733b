// ============================================================
// chunk_codec.cpp -- Chunk transform and file preparation
// ============================================================

#include "chunk_codec.hpp"
#include "compress.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include "hash.hpp"
#include "logger.hpp"
#include "thread_pool.hpp"
#include "utils.hpp"
#include <filesystem>
#include <iomanip>
#include <sstream>

namespace fs = std::filesystem;

ChunkCodec::ChunkCodec(const crypto::Key& key, int compress_level)
    : key_(key), level_(compress_level)
{
    if (!compress::valid_level(level_)) {
        throw std::runtime_error("Invalid zstd level: " + std::to_string(level_));
    }
}

PreparedChunk ChunkCodec::encode(u32 index, const void* data, size_t len,
                                 CompressAlgo algo) const
{
    PreparedChunk out;
    out.desc.index         = index;
    out.desc.name          = manifest::chunk_name(index);
    out.desc.raw_size      = len;
    out.desc.original_hash = hash::sha256(data, len);

    if (algo == CompressAlgo::ZSTD) {
        std::vector<u8> packed = compress::compress_to_vec(data, len, level_);
        if (Logger::get().level() <= LogLevel::DEBUG && len > 0) {
            std::ostringstream ss;
            ss << std::fixed << std::setprecision(1)
               << (double)packed.size() / (double)len * 100.0 << "%";
            LOG_DEBUG("chunk " + std::to_string(index) + ": " + std::to_string(len) +
                      " -> " + std::to_string(packed.size()) + " bytes (" + ss.str() + ")");
        }
        out.token = crypto::encrypt(key_, packed.data(), packed.size());
    } else {
        out.token = crypto::encrypt(key_, data, len);
    }

    out.desc.size = out.token.size();
    out.desc.hash = hash::sha256(out.token.data(), out.token.size());
    return out;
}

std::vector<u8> ChunkCodec::restore(const ChunkDescriptor& desc, const u8* token, size_t len,
                                    CompressAlgo algo) const
{
    std::vector<u8> plain = crypto::decrypt(key_, token, len);

    std::vector<u8> raw;
    if (algo == CompressAlgo::ZSTD) {
        try {
            raw = compress::decompress_to_vec(plain.data(), plain.size(), (size_t)desc.raw_size);
        } catch (const std::exception& e) {
            throw IntegrityError("Chunk " + std::to_string(desc.index) +
                                 " failed to decompress: " + e.what());
        }
    } else {
        raw = std::move(plain);
    }

    if (raw.size() != desc.raw_size) {
        throw IntegrityError("Chunk " + std::to_string(desc.index) + " restored " +
                             std::to_string(raw.size()) + " bytes, expected " +
                             std::to_string(desc.raw_size));
    }
    if (hash::sha256(raw.data(), raw.size()) != desc.original_hash) {
        throw IntegrityError("Chunk " + std::to_string(desc.index) +
                             " content hash mismatch");
    }
    return raw;
}

// ============================================================
// codec::prepare*
// ============================================================

namespace codec {

Manifest prepare(const std::string& src_path, const crypto::Key& key,
                 const PrepareOptions& opts, const ChunkSink& sink)
{
    if (opts.chunk_size == 0 || opts.chunk_size > MAX_CHUNK_SIZE) {
        throw std::runtime_error("Chunk size out of range: " + std::to_string(opts.chunk_size));
    }

    ChunkCodec cc(key, opts.compress_level);
    file_io::MmapReader reader(src_path);
    const u64 size = reader.size();
    const u32 n = manifest::expected_chunk_count(size, opts.chunk_size);

    CompressAlgo algo = (opts.compression_enabled && compress::should_compress(src_path))
                        ? CompressAlgo::ZSTD : CompressAlgo::NONE;

    LOG_INFO("Preparing " + src_path + ": " + utils::format_bytes(size) + ", " +
             std::to_string(n) + " chunk(s) of " + utils::format_bytes(opts.chunk_size) +
             ", compression " + compress_algo_name(algo));

    std::vector<ChunkDescriptor> descs;
    descs.reserve(n);
    hash::Sha256 whole;
    u64 stored_bytes = 0;

    ThreadPool pool(opts.threads);
    pool.map_ordered(n, pool.size() * 2,
        [&](size_t i) {
            u64 off = (u64)i * opts.chunk_size;
            return cc.encode((u32)i, reader.chunk_ptr(off),
                             (size_t)reader.chunk_len(off, opts.chunk_size), algo);
        },
        [&](size_t i, PreparedChunk pc) {
            u64 off = (u64)i * opts.chunk_size;
            whole.update(reader.chunk_ptr(off), (size_t)pc.desc.raw_size);
            stored_bytes += pc.desc.size;
            sink(pc);
            descs.push_back(std::move(pc.desc));
        });

    Manifest m = manifest::build(fs::path(src_path).filename().string(), size, whole.digest(),
                                 opts.chunk_size, opts.priority, algo, std::move(descs));

    LOG_INFO("Prepared " + m.original_filename + ": sha256 " +
             hash::to_hex(m.original_hash).substr(0, 16) + "..., " +
             utils::format_bytes(stored_bytes) + " stored");
    return m;
}

Manifest prepare_to_dir(const std::string& src_path, const std::string& out_dir,
                        const crypto::Key& key, const PrepareOptions& opts)
{
    // Start from an empty directory so stale artifacts never survive
    std::error_code ec;
    fs::remove_all(out_dir, ec);
    fs::create_directories(out_dir);

    DirChunkSource dir(out_dir);
    Manifest m = prepare(src_path, key, opts, [&](const PreparedChunk& pc) {
        file_io::write_file_atomic(dir.chunk_path(pc.desc.index), pc.token);
    });
    manifest::save(m, (fs::path(out_dir) / manifest::FILE_NAME).string());
    return m;
}

Manifest prepare_to_memory(const std::string& src_path, const crypto::Key& key,
                           const PrepareOptions& opts, MemoryChunkSource& out)
{
    out.tokens().clear();
    return prepare(src_path, key, opts, [&](const PreparedChunk& pc) {
        out.put(pc.desc.index, pc.token);
    });
}

} // namespace codec
