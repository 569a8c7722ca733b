// ============================================================
// test_end_to_end.cpp -- Sender and receiver apps over loopback TCP
// ============================================================

#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../common/chunk_source.hpp"
#include "../common/config.hpp"
#include "../common/hash.hpp"
#include "../common/socket.hpp"
#include "../receiver/receiver_app.hpp"
#include "../sender/sender_app.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <thread>

using namespace testutil;

namespace {

TransferConfig receiver_config() {
    TransferConfig c = TransferConfig::defaults(Role::RECEIVER);
    c.network.host = "127.0.0.1";
    c.network.port = 0;
    c.network.timeout_s = 10;
    c.monitoring.status_file.clear();
    c.monitoring.show_progress = false;
    return c;
}

TransferConfig sender_config(u16 port, const TempDir& work) {
    TransferConfig c = TransferConfig::defaults(Role::SENDER);
    c.network.host = "127.0.0.1";
    c.network.port = port;
    c.network.timeout_s = 10;
    c.network.connect_retry_s = 5;
    c.transfer.chunk_size_kb = 64;
    c.transfer.work_dir = work.str("prepared");
    c.transfer.prepare_threads = 2;
    c.monitoring.status_file = work.str("sender_status.json");
    c.monitoring.show_progress = false;
    return c;
}

// Receiver serving on an ephemeral port for the lifetime of the object
class RunningReceiver {
public:
    explicit RunningReceiver(const std::string& out_dir)
        : app_(receiver_config(), test_key(), out_dir)
    {
        app_.listen();
        thread_ = std::thread([this]() { app_.serve(); });
    }
    ~RunningReceiver() {
        app_.stop();
        if (thread_.joinable()) thread_.join();
    }

    ReceiverApp& app() { return app_; }
    u16 port() const { return app_.port(); }

private:
    ReceiverApp app_;
    std::thread thread_;
};

} // namespace

TEST(EndToEnd, TransfersFilesInPriorityOrder) {
    TempDir work;
    TempDir out;
    std::string low  = write_sample(work, "low.log", 300 * 1024, 7);
    std::string high = write_sample(work, "high.db", 200 * 1024 + 5, 8);

    RunningReceiver rx(out.str());
    ASSERT_NE(rx.port(), 0);

    SenderApp tx(sender_config(rx.port(), work), test_key());
    tx.add_file(low, Priority::LOW);
    tx.add_file(high, Priority::HIGH);
    EXPECT_EQ(tx.run(), 0);

    const auto& done = tx.finished_jobs();
    ASSERT_EQ(done.size(), 2u);
    EXPECT_EQ(done[0].source_path, high);
    EXPECT_EQ(done[1].source_path, low);
    for (const auto& j : done) {
        EXPECT_EQ(j.state, JobState::COMPLETED);
        EXPECT_EQ(j.attempts, 1);
        EXPECT_EQ(j.chunks_done, j.chunks_total);
    }

    EXPECT_EQ(read_all(out.str("low.log")), read_all(low));
    EXPECT_EQ(read_all(out.str("high.db")), read_all(high));
    EXPECT_EQ(rx.app().sessions_completed(), 2u);

    auto doc = nlohmann::json::parse(read_all(work.str("sender_status.json")));
    ASSERT_EQ(doc["jobs"].size(), 2u);
    for (const auto& j : doc["jobs"]) {
        EXPECT_EQ(j["state"], "completed");
        EXPECT_EQ(j["error"], "");
    }
}

TEST(EndToEnd, SecondRunReusesPreparedChunksAndReceivedArtifacts) {
    TempDir work;
    TempDir out;
    std::string src = write_sample(work, "image.raw", 150 * 1024);

    RunningReceiver rx(out.str());
    {
        SenderApp tx(sender_config(rx.port(), work), test_key());
        tx.add_file(src, Priority::NORMAL);
        ASSERT_EQ(tx.run(), 0);
    }
    std::string prepared = SenderApp::prepared_dir_for(work.str("prepared"), src);
    auto stamp = fs::last_write_time(fs::path(prepared) / manifest::FILE_NAME);

    SenderApp again(sender_config(rx.port(), work), test_key());
    again.add_file(src, Priority::NORMAL);
    EXPECT_EQ(again.run(), 0);
    EXPECT_EQ(fs::last_write_time(fs::path(prepared) / manifest::FILE_NAME), stamp);
    EXPECT_EQ(read_all(out.str("image.raw")), read_all(src));
}

TEST(EndToEnd, DamagedPreparedChunkIsRebuilt) {
    TempDir work;
    std::string src = write_sample(work, "video.bin", 200 * 1024);
    SenderApp tx(sender_config(5001, work), test_key());

    TransferJob job;
    job.source_path  = src;
    job.prepared_dir = SenderApp::prepared_dir_for(work.str("prepared"), src);
    Manifest first = tx.prepare(job);
    ASSERT_GE(first.chunk_count(), 2u);

    DirChunkSource dir(job.prepared_dir);
    std::vector<u8> token = dir.load_chunk(1);
    token[token.size() / 2] ^= 0x01;
    file_io::write_file_atomic(dir.chunk_path(1), token);

    Manifest again = tx.prepare(job);
    ASSERT_EQ(again.chunk_count(), first.chunk_count());
    std::vector<u8> rebuilt = dir.load_chunk(1);
    EXPECT_EQ(hash::sha256(rebuilt.data(), rebuilt.size()), again.chunks[1].hash);
}

TEST(EndToEnd, ChangedSourceIsPreparedAgain) {
    TempDir work;
    std::string src = write_sample(work, "table.csv", 120 * 1024, 5);
    SenderApp tx(sender_config(5001, work), test_key());

    TransferJob job;
    job.source_path  = src;
    job.prepared_dir = SenderApp::prepared_dir_for(work.str("prepared"), src);
    Manifest first = tx.prepare(job);

    // Same size, mtime moved into the past: still a different file
    auto stamp = fs::last_write_time(src);
    file_io::write_file_atomic(src, sample_bytes(120 * 1024, 6));
    fs::last_write_time(src, stamp - std::chrono::seconds(10));

    Manifest again = tx.prepare(job);
    EXPECT_NE(again.original_hash, first.original_hash);
    EXPECT_EQ(again.original_hash, hash::sha256(read_all(src).data(), 120 * 1024));
}

TEST(EndToEnd, SameBaseNameInDifferentDirectoriesKeepsSeparateChunks) {
    TempDir work;
    TempDir out;
    fs::create_directories(work.path() / "a");
    fs::create_directories(work.path() / "b");
    std::string b = (work.path() / "b" / "x.bin").string();
    std::string a = (work.path() / "a" / "x.bin").string();
    file_io::write_file_atomic(b, sample_bytes(90 * 1024, 3));
    file_io::write_file_atomic(a, sample_bytes(90 * 1024, 4));
    EXPECT_NE(SenderApp::prepared_dir_for(work.str("prepared"), a),
              SenderApp::prepared_dir_for(work.str("prepared"), b));

    RunningReceiver rx(out.str());
    {
        SenderApp tx(sender_config(rx.port(), work), test_key());
        tx.add_file(a, Priority::NORMAL);
        ASSERT_EQ(tx.run(), 0);
    }
    EXPECT_EQ(read_all(out.str("x.bin")), read_all(a));
    {
        SenderApp tx(sender_config(rx.port(), work), test_key());
        tx.add_file(b, Priority::NORMAL);
        ASSERT_EQ(tx.run(), 0);
    }
    EXPECT_EQ(read_all(out.str("x.bin")), read_all(b));
}

TEST(EndToEnd, WrongKeyExhaustsJobAttempts) {
    TempDir work;
    TempDir out;
    std::string src = write_sample(work, "secret.bin", 70 * 1024);

    RunningReceiver rx(out.str());
    TransferConfig cfg = sender_config(rx.port(), work);
    cfg.transfer.max_retries = 1;
    cfg.transfer.max_job_attempts = 2;
    SenderApp tx(cfg, other_key());
    tx.add_file(src, Priority::NORMAL);
    EXPECT_EQ(tx.run(), 1);

    ASSERT_EQ(tx.finished_jobs().size(), 1u);
    const TransferJob& j = tx.finished_jobs()[0];
    EXPECT_EQ(j.state, JobState::FAILED);
    EXPECT_EQ(j.attempts, 2);
    EXPECT_EQ(j.failed_stage, "sending_chunks");
    EXPECT_NE(j.last_error.find("AuthenticationError"), std::string::npos);
    EXPECT_FALSE(fs::exists(out.str("secret.bin")));
}

TEST(EndToEnd, UnreachableReceiverFailsJob) {
    TempDir work;
    std::string src = write_sample(work, "a.bin", 10 * 1024);

    TransferConfig cfg = sender_config(1, work);
    cfg.network.connect_retry_s = 0;
    cfg.transfer.max_job_attempts = 1;
    SenderApp tx(cfg, test_key());
    tx.add_file(src, Priority::NORMAL);
    EXPECT_EQ(tx.run(), 1);

    ASSERT_EQ(tx.finished_jobs().size(), 1u);
    EXPECT_EQ(tx.finished_jobs()[0].failed_stage, "connecting");
}

TEST(EndToEnd, AddFileRejectsMissingPath) {
    TempDir work;
    SenderApp tx(sender_config(5001, work), test_key());
    EXPECT_THROW(tx.add_file(work.str("nope.bin"), Priority::NORMAL), std::runtime_error);
}

TEST(EndToEnd, StopWakesAcceptAndClosesTheListener) {
    TempDir out;
    ReceiverApp app(receiver_config(), test_key(), out.str());
    app.listen();
    u16 port = app.port();
    ASSERT_NE(port, 0);

    std::thread serving([&app]() { app.serve(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    app.stop();
    serving.join();

    TcpSocket client;
    EXPECT_THROW(client.connect("127.0.0.1", port), std::runtime_error);
}
