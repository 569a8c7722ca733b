// ============================================================
// test_reassembler.cpp -- Rebuilding and verifying the output file
// ============================================================

#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../common/chunk_codec.hpp"
#include "../common/errors.hpp"
#include "../receiver/reassembler.hpp"

using namespace testutil;

class ReassemblerTest : public ::testing::Test {
protected:
    void SetUp() override {
        src_  = write_sample(work_, "payload.dat", 300 * 1024 + 17);
        PrepareOptions opts;
        opts.chunk_size = 64 * 1024;
        m_ = codec::prepare_to_memory(src_, test_key(), opts, tokens_);
        ASSERT_EQ(m_.chunk_count(), 5u);
        out_path_ = out_.str("payload.dat");
    }

    TempDir           work_;
    TempDir           out_;
    std::string       src_;
    std::string       out_path_;
    Manifest          m_;
    MemoryChunkSource tokens_;
};

TEST_F(ReassemblerTest, RebuildsFromMemory) {
    Reassembler r(test_key());
    AssemblyReport rep = r.assemble(tokens_, m_, out_path_);
    EXPECT_EQ(rep.chunks_verified, 5u);
    EXPECT_EQ(rep.computed, m_.original_hash);
    EXPECT_EQ(rep.output_path, out_path_);
    EXPECT_EQ(read_all(out_path_), read_all(src_));
    EXPECT_FALSE(fs::exists(Reassembler::part_path(out_path_)));
    EXPECT_FALSE(fs::exists(Reassembler::invalid_path(out_path_)));
}

TEST_F(ReassemblerTest, RebuildsFromPreparedDir) {
    std::string dir = work_.str("prepared");
    PrepareOptions opts;
    opts.chunk_size = 64 * 1024;
    Manifest m = codec::prepare_to_dir(src_, dir, test_key(), opts);

    Reassembler r(test_key());
    r.assemble(DirChunkSource(dir), m, out_path_);
    EXPECT_EQ(read_all(out_path_), read_all(src_));
}

TEST_F(ReassemblerTest, MissingChunkIsReported) {
    tokens_.erase(1);
    Reassembler r(test_key());
    try {
        r.assemble(tokens_, m_, out_path_);
        FAIL() << "expected ReassemblyError";
    } catch (const ReassemblyError& e) {
        EXPECT_EQ(e.faulty_chunks(), (std::vector<u32>{1}));
        EXPECT_EQ(e.code(), ErrorCode::REASSEMBLY);
    }
    EXPECT_EQ(r.last_report().chunks_verified, 4u);
    EXPECT_FALSE(fs::exists(out_path_));
    EXPECT_TRUE(fs::exists(Reassembler::invalid_path(out_path_)));
}

TEST_F(ReassemblerTest, EveryFaultyChunkIsListed) {
    auto& t = tokens_.tokens();
    t[0][t[0].size() - 3] ^= 0x01;   // MAC byte, token hash now differs
    tokens_.erase(3);

    Reassembler r(test_key());
    try {
        r.assemble(tokens_, m_, out_path_);
        FAIL() << "expected ReassemblyError";
    } catch (const ReassemblyError& e) {
        EXPECT_EQ(e.faulty_chunks(), (std::vector<u32>{0, 3}));
    }
}

TEST_F(ReassemblerTest, WrongKeyFailsEveryChunk) {
    Reassembler r(other_key());
    try {
        r.assemble(tokens_, m_, out_path_);
        FAIL() << "expected ReassemblyError";
    } catch (const ReassemblyError& e) {
        EXPECT_EQ(e.faulty_chunks().size(), 5u);
    }
    EXPECT_EQ(r.last_report().chunks_verified, 0u);
}

TEST_F(ReassemblerTest, WholeFileHashMismatch) {
    Manifest lying = m_;
    lying.original_hash[0] ^= 0xFF;

    Reassembler r(test_key());
    EXPECT_THROW(r.assemble(tokens_, lying, out_path_), IntegrityError);
    EXPECT_EQ(r.last_report().computed, m_.original_hash);
    EXPECT_FALSE(fs::exists(out_path_));
    EXPECT_TRUE(fs::exists(Reassembler::invalid_path(out_path_)));
}

TEST_F(ReassemblerTest, EmptyFile) {
    std::string empty = write_sample(work_, "empty.bin", 0);
    MemoryChunkSource none;
    Manifest m = codec::prepare_to_memory(empty, test_key(), PrepareOptions{}, none);
    ASSERT_EQ(m.chunk_count(), 0u);

    std::string out = out_.str("empty.bin");
    Reassembler r(test_key());
    r.assemble(none, m, out);
    EXPECT_TRUE(fs::exists(out));
    EXPECT_EQ(fs::file_size(out), 0u);
}
