#pragma once

// ============================================================
// file_io.hpp -- Memory-mapped and atomic file I/O
// ============================================================

#include "platform.hpp"
#include <string>
#include <vector>
#include <stdexcept>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

namespace file_io {

// ---- MmapReader: zero-copy read via mmap ----
class MmapReader {
public:
    explicit MmapReader(const std::string& path);
    ~MmapReader();

    MmapReader(const MmapReader&) = delete;
    MmapReader& operator=(const MmapReader&) = delete;

    const char* data() const { return data_; }
    u64 size() const { return size_; }

    // Get pointer to chunk at given offset, clamped to available bytes
    const char* chunk_ptr(u64 offset) const {
        if (offset >= size_) return nullptr;
        return data_ + offset;
    }

    u64 chunk_len(u64 offset, u64 max_len) const {
        if (offset >= size_) return 0;
        u64 remaining = size_ - offset;
        return remaining < max_len ? remaining : max_len;
    }

    void close();

private:
    const char* data_{nullptr};
    u64 size_{0};
    int fd_{-1};
};

// ---- MmapWriter: zero-copy write via mmap ----
class MmapWriter {
public:
    MmapWriter() = default;
    ~MmapWriter();

    MmapWriter(const MmapWriter&) = delete;
    MmapWriter& operator=(const MmapWriter&) = delete;

    // Create/truncate file, preallocate to size, then mmap.
    // A zero size yields an empty file with no mapping.
    void open(const std::string& path, u64 size);

    // Write data at given offset
    void write_at(u64 offset, const void* data, size_t len);

    // msync, unmap and close
    void close();

    bool is_open() const { return fd_ >= 0; }
    u64 size() const { return size_; }

private:
    char* data_{nullptr};
    u64   size_{0};
    int   fd_{-1};
    std::string path_;
};

// ---- Utility functions ----

// Resolve a bare file name under root_dir.
// Throws if the name is empty, absolute, contains a separator or "..".
fs::path safe_child_path(const fs::path& root_dir, const std::string& name);

// Create parent directories if they don't exist
void ensure_parent_dirs(const std::string& path);

// Get file size in bytes; returns 0 if not found
u64 get_file_size(const std::string& path);

// Get file modification time as nanoseconds since epoch; 0 if not found
u64 get_mtime_ns(const std::string& path);

// Read an entire file into memory; throws if it cannot be opened or read
std::vector<u8> read_file(const std::string& path);

// Write to "<path>.tmp", fsync, then rename over path
void write_file_atomic(const std::string& path, const void* data, size_t len);

inline void write_file_atomic(const std::string& path, const std::vector<u8>& data) {
    write_file_atomic(path, data.data(), data.size());
}

inline void write_file_atomic(const std::string& path, const std::string& text) {
    write_file_atomic(path, text.data(), text.size());
}

} // namespace file_io
