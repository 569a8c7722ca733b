// ============================================================
// chunk_store.cpp -- Artifact store and write-lease registry
// ============================================================

#include "chunk_store.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

// ---------------------------------------------------------------
// FileLockRegistry
// ---------------------------------------------------------------

void FileLockRegistry::Lease::release() {
    if (owner_) {
        owner_->release(key_);
        owner_ = nullptr;
    }
}

FileLockRegistry::Lease FileLockRegistry::try_acquire(const std::string& key) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (!held_.insert(key).second) return Lease();
    return Lease(this, key);
}

bool FileLockRegistry::is_held(const std::string& key) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return held_.count(key) != 0;
}

void FileLockRegistry::release(const std::string& key) {
    std::lock_guard<std::mutex> lk(mutex_);
    held_.erase(key);
}

// ---------------------------------------------------------------
// ChunkStore
// ---------------------------------------------------------------

std::string ChunkStore::root_dir(const std::string& out_dir) {
    return (fs::path(out_dir) / ".chunkcp").string();
}

ChunkStore::ChunkStore(const std::string& out_dir, const Manifest& m)
    : manifest_(m)
    , dir_((fs::path(root_dir(out_dir)) / m.store_key()).string())
    , source_(dir_)
    , held_(m.chunk_count(), false)
{}

void ChunkStore::open(bool resume) {
    std::error_code ec;
    if (!resume && fs::exists(dir_, ec)) {
        LOG_INFO("Resume disabled, discarding artifacts in " + dir_);
        fs::remove_all(dir_, ec);
        if (ec) throw std::runtime_error("Cannot clear " + dir_ + ": " + ec.message());
    }
    fs::create_directories(dir_, ec);
    if (ec) throw std::runtime_error("Cannot create " + dir_ + ": " + ec.message());

    manifest::save(manifest_, (fs::path(dir_) / manifest::FILE_NAME).string());
    std::fill(held_.begin(), held_.end(), false);
    held_count_ = 0;
}

std::vector<u32> ChunkStore::scan_held() {
    std::vector<u32> held;
    std::fill(held_.begin(), held_.end(), false);
    held_count_ = 0;

    for (const auto& desc : manifest_.chunks) {
        std::string path = source_.chunk_path(desc.index);
        std::error_code ec;
        if (!fs::exists(path, ec)) continue;

        bool ok = false;
        try {
            std::vector<u8> token = file_io::read_file(path);
            ok = token.size() == desc.size &&
                 hash::sha256(token.data(), token.size()) == desc.hash;
        } catch (const std::exception& e) {
            LOG_WARN("Artifact " + path + " unreadable: " + e.what());
        }

        if (!ok) {
            LOG_WARN("Discarding stale artifact " + path);
            fs::remove(path, ec);
            continue;
        }
        held_[desc.index] = true;
        ++held_count_;
        held.push_back(desc.index);
    }
    return held;
}

bool ChunkStore::is_held(u32 index) const {
    return index < held_.size() && held_[index];
}

void ChunkStore::put(u32 index, const u8* token, size_t len) {
    if (index >= held_.size()) {
        throw std::runtime_error("Chunk index out of range: " + std::to_string(index));
    }
    file_io::write_file_atomic(source_.chunk_path(index), token, len);
    if (!held_[index]) {
        held_[index] = true;
        ++held_count_;
    }
}

void ChunkStore::discard(u32 index) {
    std::error_code ec;
    fs::remove(source_.chunk_path(index), ec);
    if (ec) {
        LOG_WARN("Cannot remove " + source_.chunk_path(index) + ": " + ec.message());
    }
    if (index < held_.size() && held_[index]) {
        held_[index] = false;
        --held_count_;
    }
}

void ChunkStore::remove_all() {
    std::error_code ec;
    fs::remove_all(dir_, ec);
    if (ec) {
        LOG_WARN("Cannot remove chunk store " + dir_ + ": " + ec.message());
    }
}
