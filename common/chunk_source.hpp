#pragma once

// ============================================================
// chunk_source.hpp -- Indexed access to prepared chunk tokens
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>

class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual bool has_chunk(u32 index) const = 0;

    // Token bytes of one chunk; throws std::runtime_error if absent
    virtual std::vector<u8> load_chunk(u32 index) const = 0;
};

// Artifacts stored as <dir>/echunk_<index>.bin
class DirChunkSource : public ChunkSource {
public:
    explicit DirChunkSource(std::string dir) : dir_(std::move(dir)) {}

    bool has_chunk(u32 index) const override;
    std::vector<u8> load_chunk(u32 index) const override;

    std::string chunk_path(u32 index) const;
    const std::string& dir() const { return dir_; }

private:
    std::string dir_;
};

// Tokens held in memory, position = chunk index
class MemoryChunkSource : public ChunkSource {
public:
    MemoryChunkSource() = default;
    explicit MemoryChunkSource(std::vector<std::vector<u8>> tokens)
        : tokens_(std::move(tokens)) {}

    bool has_chunk(u32 index) const override {
        return index < tokens_.size() && !tokens_[index].empty();
    }
    std::vector<u8> load_chunk(u32 index) const override;

    // Replace a slot, growing the table as needed
    void put(u32 index, std::vector<u8> token);
    // Drop a slot (simulates a lost artifact)
    void erase(u32 index);

    std::vector<std::vector<u8>>& tokens() { return tokens_; }

private:
    std::vector<std::vector<u8>> tokens_;
};
