// ============================================================
// test_sessions.cpp -- Sender and receiver state machines wired
//   back to back over an in-memory link
// ============================================================

#include <gtest/gtest.h>
#include "test_helpers.hpp"
#include "../common/chunk_codec.hpp"
#include "../common/errors.hpp"
#include "../common/protocol_io.hpp"
#include "../common/status.hpp"
#include "../receiver/receiver_session.hpp"
#include "../sender/sender_session.hpp"
#include <nlohmann/json.hpp>
#include <cstring>
#include <memory>

using namespace testutil;

namespace {

// One connection: a sender and a receiver joined by two queues
struct Link {
    QueueSink to_rx;
    QueueSink to_tx;
    std::unique_ptr<ReceiverSession> rx;
    std::unique_ptr<SenderSession>   tx;

    Link(const Manifest& m, const ChunkSource& src, const ReceiverOptions& ropts,
         const crypto::Key& rx_key, FileLockRegistry& locks,
         StatusReporter* rx_status = nullptr, StatusReporter* tx_status = nullptr)
    {
        rx = std::make_unique<ReceiverSession>(ropts, rx_key, locks, to_tx, rx_status);
        tx = std::make_unique<SenderSession>(m, src, to_rx, SenderOptions{3}, tx_status);
    }

    void run() {
        tx->on_connected();
        pump(to_rx, *rx, to_tx, *tx);
    }

    // Both sides notice the connection is gone
    void drop() {
        to_rx.frames.clear();
        to_tx.frames.clear();
        rx->on_connection_lost("link dropped");
        tx->on_connection_lost("link dropped");
    }
};

} // namespace

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        ropts_.out_dir = out_.str();
        prepare(2500000, 1000000);
    }

    void prepare(size_t size, u32 chunk_size) {
        src_ = write_sample(work_, "report.bin", size);
        PrepareOptions opts;
        opts.chunk_size = chunk_size;
        tokens_ = MemoryChunkSource();
        m_ = codec::prepare_to_memory(src_, test_key(), opts, tokens_);
    }

    std::unique_ptr<Link> open_link(const crypto::Key& rx_key) {
        return std::make_unique<Link>(m_, tokens_, ropts_, rx_key, locks_);
    }
    std::unique_ptr<Link> open_link() { return open_link(test_key()); }

    std::string output() const { return out_.str(m_.original_filename); }

    TempDir           work_;
    TempDir           out_;
    std::string       src_;
    Manifest          m_;
    MemoryChunkSource tokens_;
    ReceiverOptions   ropts_;
    FileLockRegistry  locks_;
};

TEST_F(SessionTest, FullTransfer) {
    ASSERT_EQ(m_.chunk_count(), 3u);
    auto l = open_link();
    l->run();

    EXPECT_EQ(l->tx->state(), SenderState::COMPLETED);
    EXPECT_EQ(l->rx->state(), ReceiverState::COMPLETED);
    EXPECT_EQ(l->tx->chunks_sent(), 3u);
    EXPECT_EQ(l->tx->chunks_acked(), 3u);
    EXPECT_EQ(l->tx->chunks_held(), 0u);
    EXPECT_EQ(read_all(output()), read_all(src_));
    EXPECT_FALSE(locks_.is_held(m_.store_key()));
}

TEST_F(SessionTest, ResumeSendsOnlyMissingChunks) {
    auto first = open_link();
    first->tx->on_connected();
    ASSERT_TRUE(deliver_one(first->to_rx, *first->rx));   // MANIFEST
    ASSERT_TRUE(deliver_one(first->to_tx, *first->tx));   // HELD_SET, chunk 0 goes out
    ASSERT_TRUE(deliver_one(first->to_rx, *first->rx));   // chunk 0 stored
    first->drop();

    EXPECT_EQ(first->tx->state(), SenderState::FAILED);
    EXPECT_EQ(first->tx->error_code(), ErrorCode::CONNECTION);
    EXPECT_TRUE(first->tx->retryable());
    EXPECT_EQ(first->rx->state(), ReceiverState::FAILED);
    EXPECT_FALSE(locks_.is_held(m_.store_key()));
    EXPECT_FALSE(fs::exists(output()));

    auto second = open_link();
    second->tx->on_connected();
    ASSERT_TRUE(deliver_one(second->to_rx, *second->rx));
    ASSERT_EQ(second->to_tx.frames.size(), 1u);

    std::vector<u32> held;
    HeldSetHdr hdr = proto::parse_held_set(second->to_tx.frames.front().payload, held);
    EXPECT_EQ(hdr.status, (u8)HeldStatus::OK);
    EXPECT_EQ(hdr.chunk_count, 3u);
    EXPECT_EQ(held, (std::vector<u32>{0}));

    pump(second->to_rx, *second->rx, second->to_tx, *second->tx);
    EXPECT_EQ(second->tx->state(), SenderState::COMPLETED);
    EXPECT_EQ(second->tx->chunks_held(), 1u);
    EXPECT_EQ(second->tx->chunks_sent(), 2u);
    EXPECT_EQ(second->tx->chunks_done(), 3u);
    EXPECT_EQ(read_all(output()), read_all(src_));
}

// Drop the link once the sender has k acks (chunk k still in flight),
// then reconnect: only chunks k..n-1 go out again
TEST_F(SessionTest, ResumeAfterEveryAckedPrefix) {
    const u32 n = m_.chunk_count();
    for (u32 k = 0; k <= n; ++k) {
        SCOPED_TRACE("acked before drop: " + std::to_string(k));
        TempDir out;
        ReceiverOptions ropts = ropts_;
        ropts.out_dir = out.str();
        FileLockRegistry locks;

        Link first(m_, tokens_, ropts, test_key(), locks);
        first.tx->on_connected();
        ASSERT_TRUE(deliver_one(first.to_rx, *first.rx));       // MANIFEST
        ASSERT_TRUE(deliver_one(first.to_tx, *first.tx));       // HELD_SET
        for (u32 i = 0; i < k; ++i) {
            ASSERT_TRUE(deliver_one(first.to_rx, *first.rx));   // chunk i stored
            ASSERT_TRUE(deliver_one(first.to_tx, *first.tx));   // ack i
        }
        EXPECT_EQ(first.tx->chunks_acked(), k);
        first.drop();
        EXPECT_EQ(first.tx->state(), SenderState::FAILED);

        Link second(m_, tokens_, ropts, test_key(), locks);
        second.tx->on_connected();
        ASSERT_TRUE(deliver_one(second.to_rx, *second.rx));
        ASSERT_TRUE(second.to_tx.has_frame());
        std::vector<u32> held;
        proto::parse_held_set(second.to_tx.frames.front().payload, held);
        std::vector<u32> want;
        for (u32 i = 0; i < k; ++i) want.push_back(i);
        EXPECT_EQ(held, want);

        pump(second.to_rx, *second.rx, second.to_tx, *second.tx);
        EXPECT_EQ(second.tx->state(), SenderState::COMPLETED);
        EXPECT_EQ(second.tx->chunks_held(), k);
        EXPECT_EQ(second.tx->chunks_sent(), n - k);
        EXPECT_EQ(read_all(out.str(m_.original_filename)), read_all(src_));
    }
}

TEST_F(SessionTest, ResumeDisabledResendsEverything) {
    auto first = open_link();
    first->tx->on_connected();
    deliver_one(first->to_rx, *first->rx);
    deliver_one(first->to_tx, *first->tx);
    deliver_one(first->to_rx, *first->rx);
    first->drop();

    ropts_.resume = false;
    auto second = open_link();
    second->run();
    EXPECT_EQ(second->tx->state(), SenderState::COMPLETED);
    EXPECT_EQ(second->tx->chunks_held(), 0u);
    EXPECT_EQ(second->tx->chunks_sent(), 3u);
}

TEST_F(SessionTest, AlreadyCompleteGoesStraightToVerdict) {
    open_link()->run();
    ASSERT_TRUE(fs::exists(output()));

    auto again = open_link();
    again->run();
    EXPECT_EQ(again->tx->state(), SenderState::COMPLETED);
    EXPECT_EQ(again->tx->chunks_held(), 3u);
    EXPECT_EQ(again->tx->chunks_sent(), 0u);
    EXPECT_EQ(read_all(output()), read_all(src_));
}

TEST_F(SessionTest, DroppedChunksRemovedWhenNotKept) {
    ropts_.keep_chunks = false;
    open_link()->run();
    ChunkStore store(out_.str(), m_);
    EXPECT_FALSE(fs::exists(store.dir()));
    EXPECT_TRUE(fs::exists(output()));
}

TEST_F(SessionTest, CorruptFrameIsResent) {
    auto l = open_link();
    int corrupted = 0;
    l->to_rx.filter = [&](Frame& f) {
        if (f.hdr.msg_type == (u16)MsgType::MT_CHUNK && corrupted == 0) {
            ++corrupted;
            flip_token_bit(f, 40);
        }
        return true;
    };
    l->run();

    EXPECT_EQ(corrupted, 1);
    EXPECT_EQ(l->tx->state(), SenderState::COMPLETED);
    EXPECT_EQ(l->tx->chunks_sent(), 4u);
    EXPECT_EQ(read_all(output()), read_all(src_));
}

TEST_F(SessionTest, PersistentCorruptionExhaustsResends) {
    auto l = open_link();
    l->to_rx.filter = [](Frame& f) {
        if (f.hdr.msg_type == (u16)MsgType::MT_CHUNK) flip_token_bit(f, 100);
        return true;
    };
    l->run();

    EXPECT_EQ(l->tx->state(), SenderState::FAILED);
    EXPECT_EQ(l->tx->failed_stage(), SenderState::SENDING_CHUNKS);
    EXPECT_EQ(l->tx->error_code(), ErrorCode::AUTHENTICATION);
    EXPECT_TRUE(l->tx->retryable());
    EXPECT_EQ(l->tx->chunks_sent(), 4u);   // first send + 3 resends
    EXPECT_EQ(l->tx->chunks_acked(), 0u);
    EXPECT_THROW(l->tx->raise(), AuthenticationError);
    EXPECT_FALSE(fs::exists(output()));
}

TEST_F(SessionTest, DamagedPreparedChunkIsNeverSent) {
    // Same length, different bytes: only the manifest digest can tell
    tokens_.tokens()[1][60] ^= 0x01;
    auto l = open_link();
    l->run();

    EXPECT_EQ(l->tx->state(), SenderState::FAILED);
    EXPECT_EQ(l->tx->failed_stage(), SenderState::SENDING_CHUNKS);
    EXPECT_EQ(l->tx->error_code(), ErrorCode::INTEGRITY);
    EXPECT_FALSE(l->tx->retryable());
    EXPECT_EQ(l->tx->chunks_acked(), 1u);
    EXPECT_EQ(l->tx->chunks_sent(), 1u);
    EXPECT_EQ(l->rx->state(), ReceiverState::FAILED);
    EXPECT_FALSE(fs::exists(output()));
}

TEST_F(SessionTest, WrongReceiverKeyFailsAuthentication) {
    auto l = open_link(other_key());
    l->run();

    EXPECT_EQ(l->tx->state(), SenderState::FAILED);
    EXPECT_EQ(l->tx->error_code(), ErrorCode::AUTHENTICATION);
    EXPECT_EQ(l->tx->chunks_sent(), 4u);
    EXPECT_EQ(l->rx->state(), ReceiverState::RECEIVING_CHUNKS);

    // Nothing unauthenticated was persisted
    l->rx->on_connection_lost("sender gave up");
    ChunkStore store(out_.str(), m_);
    store.open(true);
    EXPECT_TRUE(store.scan_held().empty());
}

TEST_F(SessionTest, AckTimeoutsResendThenFail) {
    auto l = open_link();
    l->tx->on_connected();
    deliver_one(l->to_rx, *l->rx);
    deliver_one(l->to_tx, *l->tx);
    ASSERT_EQ(l->to_rx.count(MsgType::MT_CHUNK), 1u);

    for (int i = 0; i < 3; ++i) {
        l->to_rx.frames.clear();
        l->tx->on_timeout();
        EXPECT_EQ(l->tx->state(), SenderState::SENDING_CHUNKS);
        EXPECT_EQ(l->to_rx.count(MsgType::MT_CHUNK), 1u);
    }
    l->tx->on_timeout();
    EXPECT_EQ(l->tx->state(), SenderState::FAILED);
    EXPECT_EQ(l->tx->error_code(), ErrorCode::TIMEOUT);
    EXPECT_EQ(l->tx->chunks_sent(), 4u);
    EXPECT_TRUE(l->tx->retryable());
}

TEST_F(SessionTest, VerdictWaitOutlastsSlowVerification) {
    open_link()->run();

    // Store already complete: the receiver verifies right after HELD_SET
    auto l = open_link();
    l->tx = std::make_unique<SenderSession>(m_, tokens_, l->to_rx, SenderOptions{3, 4});
    l->tx->on_connected();
    ASSERT_TRUE(deliver_one(l->to_rx, *l->rx));
    ASSERT_TRUE(deliver_one(l->to_tx, *l->tx));
    ASSERT_EQ(l->tx->state(), SenderState::AWAITING_FINAL_ACK);
    ASSERT_EQ(l->to_tx.count(MsgType::MT_FINAL_VERDICT), 1u);

    for (int i = 0; i < 3; ++i) {
        l->tx->on_timeout();
        EXPECT_EQ(l->tx->state(), SenderState::AWAITING_FINAL_ACK);
    }
    ASSERT_TRUE(deliver_one(l->to_tx, *l->tx));
    EXPECT_EQ(l->tx->state(), SenderState::COMPLETED);
}

TEST_F(SessionTest, VerdictWaitIsBounded) {
    auto l = open_link();
    l->tx = std::make_unique<SenderSession>(m_, tokens_, l->to_rx, SenderOptions{3, 2});
    l->tx->on_connected();
    std::vector<u8> all = proto::build_held_set(HeldStatus::OK, m_.chunk_count(), {0, 1, 2});
    l->tx->on_frame(FrameHeader{(u16)MsgType::MT_HELD_SET, 0, (u32)all.size()}, all);
    ASSERT_EQ(l->tx->state(), SenderState::AWAITING_FINAL_ACK);

    l->tx->on_timeout();
    EXPECT_EQ(l->tx->state(), SenderState::AWAITING_FINAL_ACK);
    l->tx->on_timeout();
    EXPECT_EQ(l->tx->state(), SenderState::FAILED);
    EXPECT_EQ(l->tx->failed_stage(), SenderState::AWAITING_FINAL_ACK);
    EXPECT_EQ(l->tx->error_code(), ErrorCode::TIMEOUT);
}

TEST(VerdictWait, GrowsWithFileSize) {
    EXPECT_EQ(verdict_wait_periods(0, 30), 1);
    EXPECT_EQ(verdict_wait_periods(10ull << 30, 0), 1);
    EXPECT_EQ(verdict_wait_periods(VERDICT_BYTES_PER_SEC * 30, 30), 2);
    // 10 GiB at 480 MiB per 30 s period
    EXPECT_EQ(verdict_wait_periods(10ull << 30, 30), 23);
}

TEST_F(SessionTest, ManifestTimeout) {
    auto l = open_link();
    l->tx->on_connected();
    l->tx->on_timeout();
    EXPECT_EQ(l->tx->state(), SenderState::FAILED);
    EXPECT_EQ(l->tx->failed_stage(), SenderState::SENDING_MANIFEST);
    EXPECT_EQ(l->tx->error_code(), ErrorCode::TIMEOUT);
    EXPECT_THROW(l->tx->raise(), TimeoutError);
}

TEST_F(SessionTest, ConnectFailureIsTransient) {
    auto l = open_link();
    l->tx->on_connect_failed("connection refused");
    EXPECT_EQ(l->tx->state(), SenderState::FAILED);
    EXPECT_EQ(l->tx->failed_stage(), SenderState::CONNECTING);
    EXPECT_TRUE(l->tx->retryable());
    EXPECT_THROW(l->tx->raise(), ConnectionError);
}

TEST_F(SessionTest, MalformedManifestIsFatal) {
    auto l = open_link();
    l->to_rx.filter = [](Frame& f) {
        if (f.hdr.msg_type == (u16)MsgType::MT_MANIFEST) {
            std::string bad = R"({"format_version": 1, "original_filename": "x"})";
            f.payload.assign(bad.begin(), bad.end());
            f.hdr.payload_len = (u32)bad.size();
        }
        return true;
    };
    l->run();

    EXPECT_EQ(l->rx->state(), ReceiverState::FAILED);
    EXPECT_EQ(l->rx->manifest(), nullptr);
    EXPECT_EQ(l->tx->state(), SenderState::FAILED);
    EXPECT_EQ(l->tx->error_code(), ErrorCode::MALFORMED_MANIFEST);
    EXPECT_FALSE(l->tx->retryable());
    EXPECT_THROW(l->tx->raise(), MalformedManifestError);
}

TEST_F(SessionTest, ConcurrentUploadOfSameFileIsBusy) {
    auto first = open_link();
    first->tx->on_connected();
    deliver_one(first->to_rx, *first->rx);
    ASSERT_EQ(first->rx->state(), ReceiverState::RECEIVING_CHUNKS);
    ASSERT_TRUE(locks_.is_held(m_.store_key()));

    auto second = open_link();
    second->run();
    EXPECT_EQ(second->rx->state(), ReceiverState::FAILED);
    EXPECT_EQ(second->tx->state(), SenderState::FAILED);
    EXPECT_EQ(second->tx->error_code(), ErrorCode::CONNECTION);
    EXPECT_TRUE(second->tx->retryable());

    // The first upload is unaffected and still owns the lease
    EXPECT_TRUE(locks_.is_held(m_.store_key()));
    pump(first->to_rx, *first->rx, first->to_tx, *first->tx);
    EXPECT_EQ(first->tx->state(), SenderState::COMPLETED);
    EXPECT_FALSE(locks_.is_held(m_.store_key()));
}

TEST_F(SessionTest, SameNameDifferentContentWaitsForTheWriter) {
    TempDir other;
    std::string src2 = write_sample(other, "report.bin", 2500000, 7);
    PrepareOptions opts;
    opts.chunk_size = 1000000;
    MemoryChunkSource tokens2;
    Manifest m2 = codec::prepare_to_memory(src2, test_key(), opts, tokens2);
    ASSERT_EQ(m2.original_filename, m_.original_filename);
    ASSERT_NE(m2.store_key(), m_.store_key());

    auto first = open_link();
    first->tx->on_connected();
    deliver_one(first->to_rx, *first->rx);
    ASSERT_EQ(first->rx->state(), ReceiverState::RECEIVING_CHUNKS);

    Link second(m2, tokens2, ropts_, test_key(), locks_);
    second.run();
    EXPECT_EQ(second.tx->state(), SenderState::FAILED);
    EXPECT_EQ(second.tx->error_code(), ErrorCode::CONNECTION);
    EXPECT_TRUE(second.tx->retryable());
    EXPECT_FALSE(locks_.is_held(m2.store_key()));

    pump(first->to_rx, *first->rx, first->to_tx, *first->tx);
    EXPECT_EQ(first->tx->state(), SenderState::COMPLETED);
    EXPECT_EQ(read_all(output()), read_all(src_));
    EXPECT_FALSE(locks_.is_held("out:" + first->rx->output_path()));

    Link retry(m2, tokens2, ropts_, test_key(), locks_);
    retry.run();
    EXPECT_EQ(retry.tx->state(), SenderState::COMPLETED);
    EXPECT_EQ(read_all(output()), read_all(src2));
}

TEST_F(SessionTest, DuplicateChunkIsAcknowledged) {
    auto l = open_link();
    l->tx->on_connected();
    deliver_one(l->to_rx, *l->rx);
    deliver_one(l->to_tx, *l->tx);
    ASSERT_EQ(l->to_rx.frames.size(), 1u);
    Frame copy = l->to_rx.frames.front();

    deliver_one(l->to_rx, *l->rx);
    l->rx->on_frame(copy.hdr, copy.payload);
    ASSERT_EQ(l->to_tx.count(MsgType::MT_CHUNK_ACK), 2u);
    for (const auto& f : l->to_tx.frames) {
        ChunkAck ack;
        ASSERT_TRUE(proto::read_struct(f.payload, ack));
        proto::decode_chunk_ack(ack);
        EXPECT_EQ(ack.chunk_index, 0u);
        EXPECT_EQ(ack.accepted, 1);
    }

    pump(l->to_rx, *l->rx, l->to_tx, *l->tx);
    EXPECT_EQ(l->tx->state(), SenderState::COMPLETED);
    EXPECT_EQ(l->tx->chunks_sent(), 3u);
}

TEST_F(SessionTest, UnexpectedFrameFailsReceiver) {
    auto l = open_link();
    std::vector<u8> junk(sizeof(ChunkHdr) + 64, 0);
    FrameHeader hdr{(u16)MsgType::MT_CHUNK, 0, (u32)junk.size()};
    l->rx->on_frame(hdr, junk);

    EXPECT_EQ(l->rx->state(), ReceiverState::FAILED);
    ASSERT_EQ(l->to_tx.count(MsgType::MT_ERROR_MSG), 1u);
    EXPECT_FALSE(l->rx->error().empty());
}

TEST_F(SessionTest, OutOfRangeChunkIsRejected) {
    auto l = open_link();
    l->tx->on_connected();
    deliver_one(l->to_rx, *l->rx);
    l->to_tx.frames.clear();

    std::vector<u8> payload(sizeof(ChunkHdr) + 80, 0);
    ChunkHdr ch{};
    ch.chunk_index = 7;
    ch.data_len    = 80;
    proto::encode_chunk_hdr(ch);
    std::memcpy(payload.data(), &ch, sizeof(ch));
    l->rx->on_frame(FrameHeader{(u16)MsgType::MT_CHUNK, 0, (u32)payload.size()}, payload);

    ASSERT_EQ(l->to_tx.frames.size(), 1u);
    ChunkAck ack;
    ASSERT_TRUE(proto::read_struct(l->to_tx.frames.front().payload, ack));
    proto::decode_chunk_ack(ack);
    EXPECT_EQ(ack.chunk_index, 7u);
    EXPECT_EQ(ack.accepted, 0);
    EXPECT_EQ(ack.reason, (u8)RejectReason::UNEXPECTED);
    EXPECT_EQ(l->rx->state(), ReceiverState::RECEIVING_CHUNKS);
}

TEST_F(SessionTest, ReceiverErrorMessageFailsSender) {
    auto l = open_link();
    l->tx->on_connected();
    std::string msg = "disk full";
    l->tx->on_frame(FrameHeader{(u16)MsgType::MT_ERROR_MSG, 0, (u32)msg.size()},
                    std::vector<u8>(msg.begin(), msg.end()));
    EXPECT_EQ(l->tx->state(), SenderState::FAILED);
    EXPECT_EQ(l->tx->error_code(), ErrorCode::CONNECTION);
    EXPECT_NE(l->tx->error().find("disk full"), std::string::npos);
}

TEST_F(SessionTest, VerdictFailureIsFatal) {
    Manifest lying = m_;
    lying.original_hash[5] ^= 0x10;
    Link l(lying, tokens_, ropts_, test_key(), locks_);
    l.run();

    EXPECT_EQ(l.rx->state(), ReceiverState::FAILED);
    EXPECT_EQ(l.tx->state(), SenderState::FAILED);
    EXPECT_EQ(l.tx->failed_stage(), SenderState::AWAITING_FINAL_ACK);
    EXPECT_EQ(l.tx->error_code(), ErrorCode::INTEGRITY);
    EXPECT_FALSE(l.tx->retryable());
    EXPECT_TRUE(fs::exists(Reassembler::invalid_path(output())));
    EXPECT_FALSE(fs::exists(output()));
}

TEST_F(SessionTest, EmptyFile) {
    prepare(0, DEFAULT_CHUNK_SIZE);
    ASSERT_EQ(m_.chunk_count(), 0u);
    auto l = open_link();
    l->run();
    EXPECT_EQ(l->tx->state(), SenderState::COMPLETED);
    EXPECT_EQ(l->rx->state(), ReceiverState::COMPLETED);
    ASSERT_TRUE(fs::exists(output()));
    EXPECT_EQ(fs::file_size(output()), 0u);
}

TEST_F(SessionTest, StatusSnapshotsFollowTheTransfer) {
    StatusReporter rx_status(Role::RECEIVER, work_.str("receiver_status.json"));
    StatusReporter tx_status(Role::SENDER, "");
    tx_status.update_job(JobStatus{m_.original_filename, m_.priority, "pending",
                                   0, m_.chunk_count(), 1, ""});
    tx_status.begin(m_.original_filename, m_.chunk_count(), m_.original_size);

    Link l(m_, tokens_, ropts_, test_key(), locks_, &rx_status, &tx_status);
    l.run();
    ASSERT_EQ(l.tx->state(), SenderState::COMPLETED);

    auto doc = nlohmann::json::parse(read_all(work_.str("receiver_status.json")));
    EXPECT_EQ(doc["role"], "receiver");
    ASSERT_EQ(doc["jobs"].size(), 1u);
    EXPECT_EQ(doc["jobs"][0]["file"], m_.original_filename);
    EXPECT_EQ(doc["jobs"][0]["state"], "completed");
    EXPECT_EQ(doc["jobs"][0]["chunks_completed"], 3);
    EXPECT_EQ(doc["jobs"][0]["chunks_total"], 3);

    auto tx_doc = nlohmann::json::parse(tx_status.snapshot_json());
    EXPECT_EQ(tx_doc["role"], "sender");
    EXPECT_EQ(tx_doc["state"], "completed");
    EXPECT_EQ(tx_doc["chunks_completed"], 3);
    EXPECT_EQ(tx_doc["bytes_transferred"], m_.original_size);
}
