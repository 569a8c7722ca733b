#pragma once

// ============================================================
// receiver_session.hpp -- Receiver side of one transfer connection
//
//   AWAIT_MANIFEST ─MANIFEST─> RECEIVING_CHUNKS ─last chunk─> VERIFYING
//        │                         │                             │
//        └──────── FAILED <────────┴──────────── COMPLETED <─────┘
//
// Event-driven: the owner feeds frames in and replies leave through a
// FrameSink. No socket lives in here, so the same object runs behind a
// TcpSocket thread or an in-memory test link.
// ============================================================

#include "../common/platform.hpp"
#include "../common/protocol.hpp"
#include "../common/frame_sink.hpp"
#include "../common/chunk_codec.hpp"
#include "../common/crypto.hpp"
#include "../common/manifest.hpp"
#include "../common/status.hpp"
#include "chunk_store.hpp"
#include "reassembler.hpp"
#include <memory>
#include <string>
#include <vector>

enum class ReceiverState {
    AWAIT_MANIFEST,
    RECEIVING_CHUNKS,
    VERIFYING,
    COMPLETED,
    FAILED,
};

const char* receiver_state_name(ReceiverState s);

struct ReceiverOptions {
    std::string out_dir{"."};
    bool        resume{true};
    bool        keep_chunks{true};
};

class ReceiverSession {
public:
    ReceiverSession(const ReceiverOptions& opts, const crypto::Key& key,
                    FileLockRegistry& locks, FrameSink& sink,
                    StatusReporter* status = nullptr);

    ReceiverSession(const ReceiverSession&) = delete;
    ReceiverSession& operator=(const ReceiverSession&) = delete;

    // One inbound frame. Transport failures from the sink propagate.
    void on_frame(const FrameHeader& hdr, const std::vector<u8>& payload);

    // Peer went away; verified artifacts stay on disk
    void on_connection_lost(const std::string& why);

    ReceiverState state() const { return state_; }
    bool finished() const {
        return state_ == ReceiverState::COMPLETED || state_ == ReceiverState::FAILED;
    }
    const std::string& error() const { return error_; }

    // Null until a valid MANIFEST arrived
    const Manifest* manifest() const { return manifest_.get(); }
    const std::string& output_path() const { return output_path_; }

private:
    ReceiverOptions                 opts_;
    FileLockRegistry&               locks_;
    FrameSink&                      sink_;
    StatusReporter*                 status_;
    ChunkCodec                      codec_;
    Reassembler                     reassembler_;

    ReceiverState                   state_{ReceiverState::AWAIT_MANIFEST};
    std::unique_ptr<Manifest>       manifest_;
    std::unique_ptr<ChunkStore>     store_;
    FileLockRegistry::Lease         lease_;          // store key
    FileLockRegistry::Lease         output_lease_;   // "out:" + output path
    std::string                     output_path_;
    std::string                     error_;

    void handle_manifest(const std::vector<u8>& payload);
    void handle_chunk(const std::vector<u8>& payload);
    void finish();

    void send_ack(u32 index, RejectReason reason);
    void reject(u32 index, RejectReason reason, const std::string& detail);
    void set_state(ReceiverState s);
    void fail(const std::string& msg, bool notify_peer);

    std::string file_label() const;
};
