// ============================================================
// test_manifest.cpp -- Manifest build, JSON form and validation
// ============================================================

#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../common/chunk_codec.hpp"
#include "../common/errors.hpp"
#include "../common/manifest.hpp"
#include <nlohmann/json.hpp>
#include <functional>

using namespace testutil;
using json = nlohmann::json;

namespace {

class ManifestTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string src = write_sample(dir_, "report.dat", 10000);
        PrepareOptions o;
        o.chunk_size = 4096;
        o.priority   = Priority::HIGH;
        m_ = codec::prepare_to_memory(src, test_key(), o, mem_);
    }

    // Serialise, let 'edit' corrupt the JSON, parse again
    void expect_rejected(const std::function<void(json&)>& edit) {
        json j = json::parse(manifest::to_json(m_));
        edit(j);
        EXPECT_THROW(manifest::parse(j.dump()), MalformedManifestError) << j.dump();
    }

    TempDir           dir_;
    MemoryChunkSource mem_;
    Manifest          m_;
};

} // namespace

TEST_F(ManifestTest, JsonCarriesEveryField) {
    json j = json::parse(manifest::to_json(m_));
    EXPECT_EQ(j["format_version"], 1);
    EXPECT_EQ(j["original_filename"], "report.dat");
    EXPECT_EQ(j["original_size"], 10000);
    EXPECT_EQ(j["chunk_size"], 4096);
    EXPECT_EQ(j["hash_algorithm"], "sha256");
    EXPECT_EQ(j["priority"], 2);
    EXPECT_EQ(j["priority_name"], "HIGH");
    EXPECT_EQ(j["compression"], "zstd");
    EXPECT_EQ(j["encryption"], "aes128-cbc-hmac-sha256");
    EXPECT_EQ(j["chunk_count"], 3);
    ASSERT_EQ(j["chunks"].size(), 3u);
    EXPECT_EQ(j["chunks"][2]["name"], "echunk_2.bin");
    EXPECT_EQ(j["chunks"][2]["raw_size"], 10000 - 2 * 4096);
    EXPECT_EQ(j["chunks"][0]["hash"].get<std::string>().size(), 64u);
}

TEST_F(ManifestTest, ParseAcceptsItsOwnOutput) {
    Manifest back = manifest::parse(manifest::to_json(m_));
    EXPECT_EQ(back.original_filename, m_.original_filename);
    EXPECT_EQ(back.original_hash, m_.original_hash);
    EXPECT_EQ(back.priority, Priority::HIGH);
    ASSERT_EQ(back.chunk_count(), m_.chunk_count());
    for (u32 i = 0; i < back.chunk_count(); ++i) {
        EXPECT_EQ(back.chunks[i].hash, m_.chunks[i].hash);
        EXPECT_EQ(back.chunks[i].original_hash, m_.chunks[i].original_hash);
    }
    EXPECT_EQ(back.store_key(), m_.store_key());
    EXPECT_EQ(back.store_key().size(), 16u);
}

TEST_F(ManifestTest, SaveAndLoad) {
    std::string path = dir_.str("manifest.json");
    manifest::save(m_, path);
    EXPECT_FALSE(fs::exists(path + ".tmp"));
    Manifest back = manifest::load(path);
    EXPECT_EQ(manifest::to_json(back), manifest::to_json(m_));
}

TEST_F(ManifestTest, RejectsInvalidJson) {
    EXPECT_THROW(manifest::parse(std::string("{\"format_version\": 1,")), MalformedManifestError);
    EXPECT_THROW(manifest::parse(std::string("[1,2,3]")), MalformedManifestError);
}

TEST_F(ManifestTest, RejectsMissingOrMistypedFields) {
    expect_rejected([](json& j) { j.erase("original_hash"); });
    expect_rejected([](json& j) { j["original_size"] = "10000"; });
    expect_rejected([](json& j) { j["chunks"][1].erase("raw_size"); });
    expect_rejected([](json& j) { j["chunk_size"] = -1; });
}

TEST_F(ManifestTest, RejectsIndexGapsAndDuplicates) {
    expect_rejected([](json& j) { j["chunks"][1]["index"] = 2; j["chunks"][2]["index"] = 1; });
    expect_rejected([](json& j) { j["chunks"][2]["index"] = 1; });
    expect_rejected([](json& j) { j["chunks"][0]["index"] = 1; });
}

TEST_F(ManifestTest, RejectsChunkCountMismatch) {
    expect_rejected([](json& j) { j["chunk_count"] = 4; });
    expect_rejected([](json& j) { j["chunks"].erase(2); });
}

TEST_F(ManifestTest, RejectsSizeInconsistencies) {
    expect_rejected([](json& j) { j["original_size"] = 10001; });
    expect_rejected([](json& j) { j["chunks"][0]["raw_size"] = 4000; });
    expect_rejected([](json& j) { j["chunks"][2]["raw_size"] = 0; });
    expect_rejected([](json& j) { j["chunk_size"] = 0; });
}

TEST_F(ManifestTest, RejectsBadPriorityAndAlgorithms) {
    expect_rejected([](json& j) { j["priority"] = 5; });
    expect_rejected([](json& j) { j["priority"] = 0; });
    expect_rejected([](json& j) { j["compression"] = "lzma"; });
    expect_rejected([](json& j) { j["hash_algorithm"] = "md5"; });
}

TEST_F(ManifestTest, RejectsMalformedDigests) {
    expect_rejected([](json& j) { j["original_hash"] = "abc"; });
    expect_rejected([](json& j) { j["chunks"][0]["hash"] = std::string(64, 'g'); });
    expect_rejected([](json& j) { j["chunks"][1]["original_hash"] = std::string(64, 'A'); });
}

TEST_F(ManifestTest, RejectsUnsafeFilenames) {
    expect_rejected([](json& j) { j["original_filename"] = ""; });
    expect_rejected([](json& j) { j["original_filename"] = "../etc/passwd"; });
    expect_rejected([](json& j) { j["original_filename"] = "dir/file"; });
}

TEST(Manifest, ExpectedChunkCount) {
    EXPECT_EQ(manifest::expected_chunk_count(0, 1000000), 0u);
    EXPECT_EQ(manifest::expected_chunk_count(1, 1000000), 1u);
    EXPECT_EQ(manifest::expected_chunk_count(1000000, 1000000), 1u);
    EXPECT_EQ(manifest::expected_chunk_count(2500000, 1000000), 3u);
}

TEST(Manifest, BuildValidatesItsInput) {
    std::vector<ChunkDescriptor> none;
    EXPECT_THROW(manifest::build("a.bin", 10, hash::Digest256{}, 4096, Priority::NORMAL,
                                 CompressAlgo::NONE, none),
                 MalformedManifestError);
    Manifest empty = manifest::build("a.bin", 0, hash::sha256(nullptr, 0), 4096,
                                     Priority::LOW, CompressAlgo::NONE, none);
    EXPECT_EQ(empty.chunk_count(), 0u);
}
