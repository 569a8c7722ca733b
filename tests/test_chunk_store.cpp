// ============================================================
// test_chunk_store.cpp -- Write leases and the artifact store
// ============================================================

#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../common/chunk_codec.hpp"
#include "../receiver/chunk_store.hpp"

using namespace testutil;

TEST(FileLockRegistry, OneLeasePerKey) {
    FileLockRegistry locks;
    auto a = locks.try_acquire("abc");
    EXPECT_TRUE(a.valid());
    EXPECT_TRUE(locks.is_held("abc"));

    auto b = locks.try_acquire("abc");
    EXPECT_FALSE(b.valid());

    auto c = locks.try_acquire("def");
    EXPECT_TRUE(c.valid());

    a.release();
    EXPECT_FALSE(locks.is_held("abc"));
    EXPECT_TRUE(locks.try_acquire("abc").valid());
}

TEST(FileLockRegistry, LeaseReleasesOnDestructionAndMove) {
    FileLockRegistry locks;
    {
        auto a = locks.try_acquire("k");
        ASSERT_TRUE(a.valid());
        FileLockRegistry::Lease moved = std::move(a);
        EXPECT_FALSE(a.valid());
        EXPECT_TRUE(moved.valid());
        EXPECT_EQ(moved.key(), "k");
        EXPECT_TRUE(locks.is_held("k"));
    }
    EXPECT_FALSE(locks.is_held("k"));

    FileLockRegistry::Lease target = locks.try_acquire("x");
    target = locks.try_acquire("y");
    EXPECT_FALSE(locks.is_held("x"));
    EXPECT_TRUE(locks.is_held("y"));
}

class ChunkStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string src = write_sample(work_, "data.bin", 200 * 1024);
        PrepareOptions opts;
        opts.chunk_size = 64 * 1024;
        m_ = codec::prepare_to_memory(src, test_key(), opts, tokens_);
        ASSERT_EQ(m_.chunk_count(), 4u);
    }

    void put_token(ChunkStore& store, u32 i) {
        const auto& t = tokens_.tokens()[i];
        store.put(i, t.data(), t.size());
    }

    TempDir           work_;
    TempDir           out_;
    Manifest          m_;
    MemoryChunkSource tokens_;
};

TEST_F(ChunkStoreTest, OpenCreatesDirAndManifest) {
    ChunkStore store(out_.str(), m_);
    store.open(true);
    EXPECT_EQ(store.dir(), (out_.path() / ".chunkcp" / m_.store_key()).string());
    EXPECT_TRUE(fs::is_directory(store.dir()));

    Manifest saved = manifest::load((fs::path(store.dir()) / manifest::FILE_NAME).string());
    EXPECT_EQ(saved.original_hash, m_.original_hash);
    EXPECT_TRUE(store.scan_held().empty());
    EXPECT_FALSE(store.complete());
}

TEST_F(ChunkStoreTest, PutThenScanFindsArtifacts) {
    {
        ChunkStore store(out_.str(), m_);
        store.open(true);
        put_token(store, 0);
        put_token(store, 2);
        EXPECT_TRUE(store.is_held(2));
        EXPECT_FALSE(store.is_held(1));
        EXPECT_EQ(store.held_count(), 2u);
        EXPECT_EQ(store.source().load_chunk(2), tokens_.tokens()[2]);
    }

    // A fresh store over the same directory re-derives the held set
    ChunkStore again(out_.str(), m_);
    again.open(true);
    EXPECT_EQ(again.held_count(), 0u);
    std::vector<u32> held = again.scan_held();
    EXPECT_EQ(held, (std::vector<u32>{0, 2}));
    EXPECT_EQ(again.held_count(), 2u);
}

TEST_F(ChunkStoreTest, ScanDropsCorruptArtifacts) {
    ChunkStore store(out_.str(), m_);
    store.open(true);
    for (u32 i = 0; i < 4; ++i) put_token(store, i);
    EXPECT_TRUE(store.complete());

    std::vector<u8> bad = tokens_.tokens()[1];
    bad[bad.size() / 2] ^= 0x40;
    file_io::write_file_atomic(store.source().chunk_path(1), bad);

    std::vector<u8> short_token = tokens_.tokens()[3];
    short_token.resize(short_token.size() - 1);
    file_io::write_file_atomic(store.source().chunk_path(3), short_token);

    EXPECT_EQ(store.scan_held(), (std::vector<u32>{0, 2}));
    EXPECT_FALSE(fs::exists(store.source().chunk_path(1)));
    EXPECT_FALSE(fs::exists(store.source().chunk_path(3)));
    EXPECT_FALSE(store.complete());
}

TEST_F(ChunkStoreTest, OpenWithoutResumeDiscardsEverything) {
    {
        ChunkStore store(out_.str(), m_);
        store.open(true);
        put_token(store, 0);
        put_token(store, 1);
    }
    ChunkStore store(out_.str(), m_);
    store.open(false);
    EXPECT_FALSE(fs::exists(store.source().chunk_path(0)));
    EXPECT_TRUE(store.scan_held().empty());
}

TEST_F(ChunkStoreTest, DiscardAndRemoveAll) {
    ChunkStore store(out_.str(), m_);
    store.open(true);
    put_token(store, 0);
    put_token(store, 1);

    store.discard(1);
    EXPECT_FALSE(store.is_held(1));
    EXPECT_EQ(store.held_count(), 1u);
    EXPECT_FALSE(fs::exists(store.source().chunk_path(1)));

    // Discarding twice is harmless
    store.discard(1);
    EXPECT_EQ(store.held_count(), 1u);

    EXPECT_THROW(store.put(9, tokens_.tokens()[0].data(), tokens_.tokens()[0].size()),
                 std::runtime_error);

    store.remove_all();
    EXPECT_FALSE(fs::exists(store.dir()));
}
