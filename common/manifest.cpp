// ============================================================
// manifest.cpp -- Manifest JSON encoding and validation
// ============================================================

#include "manifest.hpp"
#include "errors.hpp"
#include "file_io.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace {

u64 get_uint(const json& j, const char* key) {
    if (!j.contains(key)) {
        throw MalformedManifestError(std::string("Missing field '") + key + "'");
    }
    const json& v = j.at(key);
    if (!v.is_number_unsigned()) {
        throw MalformedManifestError(std::string("Field '") + key +
                                     "' must be a non-negative integer");
    }
    return v.get<u64>();
}

u32 get_u32(const json& j, const char* key) {
    u64 v = get_uint(j, key);
    if (v > 0xFFFFFFFFull) {
        throw MalformedManifestError(std::string("Field '") + key + "' out of range");
    }
    return (u32)v;
}

std::string get_string(const json& j, const char* key) {
    if (!j.contains(key)) {
        throw MalformedManifestError(std::string("Missing field '") + key + "'");
    }
    const json& v = j.at(key);
    if (!v.is_string()) {
        throw MalformedManifestError(std::string("Field '") + key + "' must be a string");
    }
    return v.get<std::string>();
}

hash::Digest256 get_digest(const json& j, const char* key) {
    std::string s = get_string(j, key);
    if (!hash::is_hex_digest(s)) {
        throw MalformedManifestError(std::string("Field '") + key +
                                     "' is not a lowercase sha256 hex digest");
    }
    return hash::from_hex(s);
}

json chunk_to_json(const ChunkDescriptor& c) {
    return json{
        {"index",         c.index},
        {"name",          c.name},
        {"size",          c.size},
        {"raw_size",      c.raw_size},
        {"hash",          hash::to_hex(c.hash)},
        {"original_hash", hash::to_hex(c.original_hash)},
    };
}

ChunkDescriptor chunk_from_json(const json& j) {
    if (!j.is_object()) {
        throw MalformedManifestError("Chunk entry must be an object");
    }
    ChunkDescriptor c;
    c.index         = get_u32(j, "index");
    c.name          = get_string(j, "name");
    c.size          = get_uint(j, "size");
    c.raw_size      = get_uint(j, "raw_size");
    c.hash          = get_digest(j, "hash");
    c.original_hash = get_digest(j, "original_hash");
    return c;
}

} // namespace

namespace manifest {

std::string chunk_name(u32 index) {
    return "echunk_" + std::to_string(index) + ".bin";
}

u32 expected_chunk_count(u64 size, u32 chunk_size) {
    if (chunk_size == 0) return 0;
    return (u32)((size + chunk_size - 1) / chunk_size);
}

void validate(const Manifest& m) {
    if (m.format_version != CHUNKCP_VERSION) {
        throw MalformedManifestError("Unsupported format_version " +
                                     std::to_string(m.format_version));
    }
    if (m.original_filename.empty()) {
        throw MalformedManifestError("Empty original_filename");
    }
    if (m.original_filename.find('/') != std::string::npos ||
        m.original_filename.find('\\') != std::string::npos ||
        m.original_filename.find("..") != std::string::npos ||
        m.original_filename == ".") {
        throw MalformedManifestError("Unsafe original_filename: " + m.original_filename);
    }
    if (m.chunk_size == 0) {
        throw MalformedManifestError("chunk_size must be positive");
    }
    if (!priority_valid((int)m.priority)) {
        throw MalformedManifestError("priority out of range 1..4");
    }

    u64 total = 0;
    u32 n = m.chunk_count();
    for (u32 i = 0; i < n; ++i) {
        const ChunkDescriptor& c = m.chunks[i];
        if (c.index != i) {
            throw MalformedManifestError("Chunk indices must be 0.." + std::to_string(n - 1) +
                                         " in order; found " + std::to_string(c.index) +
                                         " at position " + std::to_string(i));
        }
        if (c.name != chunk_name(i)) {
            throw MalformedManifestError("Chunk " + std::to_string(i) +
                                         " has unexpected name '" + c.name + "'");
        }
        if (c.raw_size == 0 || c.raw_size > m.chunk_size) {
            throw MalformedManifestError("Chunk " + std::to_string(i) +
                                         " raw_size " + std::to_string(c.raw_size) +
                                         " outside 1.." + std::to_string(m.chunk_size));
        }
        if (i + 1 < n && c.raw_size != m.chunk_size) {
            throw MalformedManifestError("Non-final chunk " + std::to_string(i) +
                                         " is shorter than chunk_size");
        }
        if (c.size == 0) {
            throw MalformedManifestError("Chunk " + std::to_string(i) + " has empty token");
        }
        total += c.raw_size;
    }
    if (total != m.original_size) {
        throw MalformedManifestError("Chunk sizes sum to " + std::to_string(total) +
                                     ", original_size is " + std::to_string(m.original_size));
    }
}

Manifest build(const std::string& filename, u64 size, const hash::Digest256& file_hash,
               u32 chunk_size, Priority priority, CompressAlgo compression,
               std::vector<ChunkDescriptor> chunks)
{
    Manifest m;
    m.original_filename = filename;
    m.original_size     = size;
    m.original_hash     = file_hash;
    m.chunk_size        = chunk_size;
    m.priority          = priority;
    m.compression       = compression;
    m.chunks            = std::move(chunks);
    validate(m);
    return m;
}

std::string to_json(const Manifest& m) {
    json chunks = json::array();
    for (const auto& c : m.chunks) chunks.push_back(chunk_to_json(c));

    json j = {
        {"format_version",    m.format_version},
        {"original_filename", m.original_filename},
        {"original_size",     m.original_size},
        {"original_hash",     hash::to_hex(m.original_hash)},
        {"chunk_size",        m.chunk_size},
        {"hash_algorithm",    HASH_ALGORITHM},
        {"priority",          (int)m.priority},
        {"priority_name",     priority_name(m.priority)},
        {"compression",       compress_algo_name(m.compression)},
        {"encryption",        ENCRYPTION},
        {"chunk_count",       m.chunk_count()},
        {"chunks",            chunks},
    };
    return j.dump(2);
}

Manifest parse(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedManifestError(std::string("Manifest is not valid JSON: ") + e.what());
    }
    if (!j.is_object()) {
        throw MalformedManifestError("Manifest must be a JSON object");
    }

    Manifest m;
    m.format_version    = get_u32(j, "format_version");
    m.original_filename = get_string(j, "original_filename");
    m.original_size     = get_uint(j, "original_size");
    m.original_hash     = get_digest(j, "original_hash");
    m.chunk_size        = get_u32(j, "chunk_size");

    if (get_string(j, "hash_algorithm") != HASH_ALGORITHM) {
        throw MalformedManifestError("Unsupported hash_algorithm");
    }
    if (get_string(j, "encryption") != ENCRYPTION) {
        throw MalformedManifestError("Unsupported encryption");
    }

    u64 prio = get_uint(j, "priority");
    if (!priority_valid((int)std::min<u64>(prio, 100))) {
        throw MalformedManifestError("priority out of range 1..4: " + std::to_string(prio));
    }
    m.priority = static_cast<Priority>(prio);

    std::string algo = get_string(j, "compression");
    if (algo == "zstd")      m.compression = CompressAlgo::ZSTD;
    else if (algo == "none") m.compression = CompressAlgo::NONE;
    else throw MalformedManifestError("Unknown compression '" + algo + "'");

    u64 declared = get_uint(j, "chunk_count");
    if (!j.contains("chunks") || !j.at("chunks").is_array()) {
        throw MalformedManifestError("Field 'chunks' must be an array");
    }
    const json& arr = j.at("chunks");
    if (declared != arr.size()) {
        throw MalformedManifestError("chunk_count " + std::to_string(declared) +
                                     " does not match " + std::to_string(arr.size()) +
                                     " chunk entries");
    }
    m.chunks.reserve(arr.size());
    for (const auto& cj : arr) m.chunks.push_back(chunk_from_json(cj));

    validate(m);
    return m;
}

Manifest parse(const u8* data, size_t len) {
    return parse(std::string(reinterpret_cast<const char*>(data), len));
}

void save(const Manifest& m, const std::string& path) {
    file_io::write_file_atomic(path, to_json(m));
}

Manifest load(const std::string& path) {
    auto bytes = file_io::read_file(path);
    return parse(bytes.data(), bytes.size());
}

} // namespace manifest
