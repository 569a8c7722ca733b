// ============================================================
// file_io.cpp -- Memory-mapped and atomic file I/O implementation
// ============================================================

#include "file_io.hpp"
#include <vector>
#include <cstring>
#include <stdexcept>
#include <string>
#include <filesystem>
#include <algorithm>

#include <sys/mman.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;
using namespace file_io;

// ============================================================
// MmapReader
// ============================================================

MmapReader::MmapReader(const std::string& path) {
    fd_ = ::open(path.c_str(), O_RDONLY);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + strerror(errno));
    }

    struct stat st{};
    if (fstat(fd_, &st) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("fstat failed: " + path);
    }
    size_ = (u64)st.st_size;

    if (size_ == 0) {
        data_ = nullptr;
        return;
    }

    void* p = mmap(nullptr, (size_t)size_, PROT_READ, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap failed: " + path);
    }
    madvise(p, (size_t)size_, MADV_SEQUENTIAL);
    madvise(p, std::min((size_t)size_, (size_t)4*1024*1024), MADV_WILLNEED);
    data_ = static_cast<const char*>(p);
}

MmapReader::~MmapReader() {
    close();
}

void MmapReader::close() {
    if (data_ && size_ > 0) { munmap((void*)data_, (size_t)size_); data_ = nullptr; }
    if (fd_ >= 0) { ::close(fd_); fd_ = -1; }
    size_ = 0;
}

// ============================================================
// MmapWriter
// ============================================================

MmapWriter::~MmapWriter() {
    if (data_ && size_ > 0) {
        munmap(data_, (size_t)size_);
        data_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void MmapWriter::open(const std::string& file_path, u64 size) {
    path_ = file_path;
    size_ = size;

    ensure_parent_dirs(file_path);

    fd_ = ::open(file_path.c_str(), O_RDWR | O_CREAT | O_TRUNC, 0644);
    if (fd_ < 0) {
        throw std::runtime_error("Cannot create file: " + file_path + ": " + strerror(errno));
    }

    if (size == 0) {
        data_ = nullptr;
        return;
    }

    int rc = posix_fallocate(fd_, 0, (off_t)size);
    if (rc != 0 && ftruncate(fd_, (off_t)size) != 0) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("Cannot size file: " + file_path + ": " + strerror(errno));
    }

    void* p = mmap(nullptr, (size_t)size, PROT_WRITE, MAP_SHARED, fd_, 0);
    if (p == MAP_FAILED) {
        ::close(fd_);
        fd_ = -1;
        throw std::runtime_error("mmap(write) failed: " + path_);
    }
    data_ = static_cast<char*>(p);
}

void MmapWriter::write_at(u64 offset, const void* data, size_t len) {
    if (len == 0) return;
    if (!data_ || offset + len > size_) {
        throw std::runtime_error("MmapWriter::write_at out of bounds");
    }
    std::memcpy(data_ + offset, data, len);
}

void MmapWriter::close() {
    if (data_ && size_ > 0) {
        int rc = msync(data_, (size_t)size_, MS_SYNC);
        munmap(data_, (size_t)size_);
        data_ = nullptr;
        if (rc != 0) {
            ::close(fd_);
            fd_ = -1;
            throw std::runtime_error("msync failed: " + path_);
        }
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    size_ = 0;
}

// ============================================================
// Utility functions
// ============================================================

fs::path file_io::safe_child_path(const fs::path& root_dir, const std::string& name) {
    if (name.empty()) {
        throw std::runtime_error("Empty file name");
    }
    if (name.find('/') != std::string::npos || name.find('\\') != std::string::npos) {
        throw std::runtime_error("File name contains a path separator: " + name);
    }
    if (name == "." || name.find("..") != std::string::npos) {
        throw std::runtime_error("Path traversal rejected: " + name);
    }
    return (root_dir / name).lexically_normal();
}

void file_io::ensure_parent_dirs(const std::string& path) {
    fs::path p(path);
    auto parent = p.parent_path();
    if (!parent.empty()) {
        fs::create_directories(parent);
    }
}

u64 file_io::get_file_size(const std::string& path) {
    std::error_code ec;
    auto sz = fs::file_size(path, ec);
    if (ec) return 0;
    return (u64)sz;
}

u64 file_io::get_mtime_ns(const std::string& path) {
    struct stat st{};
    if (::stat(path.c_str(), &st) != 0) return 0;
    return (u64)st.st_mtim.tv_sec * 1000000000ULL + (u64)st.st_mtim.tv_nsec;
}

std::vector<u8> file_io::read_file(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw std::runtime_error("Cannot open file: " + path + ": " + strerror(errno));
    }
    std::vector<u8> buf;
    u8 tmp[64 * 1024];
    for (;;) {
        ssize_t n = ::read(fd, tmp, sizeof(tmp));
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            throw std::runtime_error("read failed: " + path + ": " + strerror(err));
        }
        buf.insert(buf.end(), tmp, tmp + n);
    }
    ::close(fd);
    return buf;
}

void file_io::write_file_atomic(const std::string& path, const void* data, size_t len) {
    ensure_parent_dirs(path);
    std::string tmp = path + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        throw std::runtime_error("Cannot create file: " + tmp + ": " + strerror(errno));
    }
    const char* p = static_cast<const char*>(data);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t n = ::write(fd, p, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            ::close(fd);
            ::unlink(tmp.c_str());
            throw std::runtime_error("write failed: " + tmp + ": " + strerror(err));
        }
        p += n;
        remaining -= (size_t)n;
    }
    int sync_rc = ::fsync(fd);
    int err = errno;
    if (::close(fd) != 0 && sync_rc == 0) {
        sync_rc = -1;
        err = errno;
    }
    if (sync_rc != 0) {
        ::unlink(tmp.c_str());
        throw std::runtime_error("fsync failed: " + tmp + ": " + strerror(err));
    }
    if (::rename(tmp.c_str(), path.c_str()) != 0) {
        err = errno;
        ::unlink(tmp.c_str());
        throw std::runtime_error("rename failed: " + path + ": " + strerror(err));
    }
}
