// ============================================================
// chunk_source.cpp -- Directory and in-memory chunk sources
// ============================================================

#include "chunk_source.hpp"
#include "manifest.hpp"
#include "file_io.hpp"
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

std::string DirChunkSource::chunk_path(u32 index) const {
    return (fs::path(dir_) / manifest::chunk_name(index)).string();
}

bool DirChunkSource::has_chunk(u32 index) const {
    std::error_code ec;
    return fs::is_regular_file(chunk_path(index), ec);
}

std::vector<u8> DirChunkSource::load_chunk(u32 index) const {
    return file_io::read_file(chunk_path(index));
}

std::vector<u8> MemoryChunkSource::load_chunk(u32 index) const {
    if (!has_chunk(index)) {
        throw std::runtime_error("Chunk " + std::to_string(index) + " not present");
    }
    return tokens_[index];
}

void MemoryChunkSource::put(u32 index, std::vector<u8> token) {
    if (index >= tokens_.size()) tokens_.resize((size_t)index + 1);
    tokens_[index] = std::move(token);
}

void MemoryChunkSource::erase(u32 index) {
    if (index < tokens_.size()) tokens_[index].clear();
}
