#pragma once

// ============================================================
// chunk_store.hpp -- Receiver-side artifact store and write leases
//
// Layout: <out_dir>/.chunkcp/<store_key>/
//           manifest.json
//           echunk_<i>.bin      (verified tokens, written once each)
//
// The held set is never cached between connections: open() + scan_held()
// re-hash every artifact against the manifest on each new session.
// ============================================================

#include "../common/platform.hpp"
#include "../common/manifest.hpp"
#include "../common/chunk_source.hpp"
#include <mutex>
#include <set>
#include <string>
#include <vector>

// Process-wide registry of files being written. One session per store key.
class FileLockRegistry {
public:
    // Move-only handle; releases the key when destroyed
    class Lease {
    public:
        Lease() = default;
        ~Lease() { release(); }

        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;

        Lease(Lease&& o) noexcept : owner_(o.owner_), key_(std::move(o.key_)) {
            o.owner_ = nullptr;
        }
        Lease& operator=(Lease&& o) noexcept {
            if (this != &o) {
                release();
                owner_ = o.owner_;
                key_   = std::move(o.key_);
                o.owner_ = nullptr;
            }
            return *this;
        }

        bool valid() const { return owner_ != nullptr; }
        const std::string& key() const { return key_; }

        void release();

    private:
        friend class FileLockRegistry;
        Lease(FileLockRegistry* owner, std::string key)
            : owner_(owner), key_(std::move(key)) {}

        FileLockRegistry* owner_{nullptr};
        std::string       key_;
    };

    // Returns an invalid lease if another session already holds 'key'
    Lease try_acquire(const std::string& key);

    bool is_held(const std::string& key) const;

private:
    mutable std::mutex    mutex_;
    std::set<std::string> held_;

    void release(const std::string& key);
};

class ChunkStore {
public:
    ChunkStore(const std::string& out_dir, const Manifest& m);

    // Create the store directory and persist the manifest.
    // With resume off, every existing artifact is discarded first.
    void open(bool resume);

    // Re-hash each artifact against the manifest; corrupt or stale ones
    // are deleted. Returns the verified indices in ascending order.
    std::vector<u32> scan_held();

    bool is_held(u32 index) const;
    u32  held_count() const { return held_count_; }
    bool complete() const { return held_count_ == manifest_.chunk_count(); }

    // Persist one verified token (temp file + rename) and mark it held
    void put(u32 index, const u8* token, size_t len);

    // Drop one artifact so the next connection asks for it again
    void discard(u32 index);

    const DirChunkSource& source() const { return source_; }
    const std::string& dir() const { return dir_; }

    // Delete the whole store directory
    void remove_all();

    // <out_dir>/.chunkcp
    static std::string root_dir(const std::string& out_dir);

private:
    const Manifest&   manifest_;
    std::string       dir_;
    DirChunkSource    source_;
    std::vector<bool> held_;
    u32               held_count_{0};
};
