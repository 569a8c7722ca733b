#pragma once

// ============================================================
// sender_session.hpp -- Sender side of one transfer attempt
//
//   CONNECTING → SENDING_MANIFEST → SENDING_CHUNKS → AWAITING_FINAL_ACK
//        │              │                 │                 │
//        └──────────────┴──── FAILED ─────┴─────────────────┴─→ COMPLETED
//
// Events come from the owner (connect result, inbound frames, ack
// timeouts, a dropped link); frames leave through a FrameSink. The
// held set is taken from the receiver on every attempt and only the
// missing chunks are sent, one at a time, in ascending index order.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/errors.hpp"
#include "../common/frame_sink.hpp"
#include "../common/chunk_source.hpp"
#include "../common/manifest.hpp"
#include "../common/status.hpp"
#include <string>
#include <vector>

enum class SenderState {
    CONNECTING,
    SENDING_MANIFEST,
    SENDING_CHUNKS,
    AWAITING_FINAL_ACK,
    COMPLETED,
    FAILED,
};

const char* sender_state_name(SenderState s);

struct SenderOptions {
    int max_retries{3};       // resends of a single chunk before the attempt fails
    int verdict_timeouts{1};  // receive timeouts tolerated while the receiver verifies
};

// Receive-timeout periods to wait for FINAL_VERDICT. The receiver rebuilds
// and re-hashes the whole file before answering, so the wait grows with
// its size at a floor rate of VERDICT_BYTES_PER_SEC.
static constexpr u64 VERDICT_BYTES_PER_SEC = 16ull * 1024 * 1024;
int verdict_wait_periods(u64 original_size, int timeout_s);

class SenderSession {
public:
    SenderSession(const Manifest& m, const ChunkSource& src, FrameSink& sink,
                  const SenderOptions& opts, StatusReporter* status = nullptr);

    SenderSession(const SenderSession&) = delete;
    SenderSession& operator=(const SenderSession&) = delete;

    // ---- Events ----
    void on_connected();
    void on_connect_failed(const std::string& why);
    void on_frame(const FrameHeader& hdr, const std::vector<u8>& payload);
    // No frame within the receive timeout
    void on_timeout();
    void on_connection_lost(const std::string& why);

    // ---- Outcome ----
    SenderState state() const { return state_; }
    bool finished() const {
        return state_ == SenderState::COMPLETED || state_ == SenderState::FAILED;
    }

    // Valid once state() == FAILED
    SenderState failed_stage() const { return failed_stage_; }
    ErrorCode error_code() const { return error_code_; }
    const std::string& error() const { return error_; }

    // A fresh connection attempt may succeed where this one failed
    bool retryable() const;

    // Throw the TransferError subclass matching error_code()
    void raise() const;

    // ---- Counters ----
    u32 chunks_held() const { return held_count_; }       // reported in HELD_SET
    u32 chunks_acked() const { return acked_; }           // accepted this attempt
    u32 chunks_sent() const { return sent_; }             // CHUNK frames incl. resends
    u32 chunks_done() const { return held_count_ + acked_; }
    u32 chunks_total() const { return manifest_.chunk_count(); }

private:
    const Manifest&    manifest_;
    std::string        manifest_json_;
    const ChunkSource& source_;
    FrameSink&         sink_;
    SenderOptions      opts_;
    StatusReporter*    status_;

    SenderState        state_{SenderState::CONNECTING};
    SenderState        failed_stage_{SenderState::CONNECTING};
    ErrorCode          error_code_{ErrorCode::CONNECTION};
    std::string        error_;

    std::vector<u32>   missing_;        // ascending
    size_t             cursor_{0};      // position in missing_
    std::vector<u8>    cur_frame_;      // CHUNK payload of missing_[cursor_]
    int                resends_{0};
    int                verdict_waits_{0};
    u32                held_count_{0};
    u32                acked_{0};
    u32                sent_{0};

    void handle_held_set(const std::vector<u8>& payload);
    void handle_ack(const std::vector<u8>& payload);
    void handle_verdict(const std::vector<u8>& payload);

    // Load, frame and send missing_[cursor_]
    void send_current();
    // Resend missing_[cursor_] or fail once the budget is spent
    void retry_current(ErrorCode code, const std::string& why);
    void advance();

    void set_state(SenderState s);
    void fail(ErrorCode code, const std::string& msg, bool notify_peer = false);
};
