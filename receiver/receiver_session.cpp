// ============================================================
// receiver_session.cpp -- Manifest intake, chunk checks, verdict
// ============================================================

#include "receiver_session.hpp"
#include "../common/compress.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include <cstring>

const char* receiver_state_name(ReceiverState s) {
    switch (s) {
        case ReceiverState::AWAIT_MANIFEST:   return "awaiting_manifest";
        case ReceiverState::RECEIVING_CHUNKS: return "receiving";
        case ReceiverState::VERIFYING:        return "verifying";
        case ReceiverState::COMPLETED:        return "completed";
        case ReceiverState::FAILED:           return "failed";
    }
    return "?";
}

ReceiverSession::ReceiverSession(const ReceiverOptions& opts, const crypto::Key& key,
                                 FileLockRegistry& locks, FrameSink& sink,
                                 StatusReporter* status)
    : opts_(opts)
    , locks_(locks)
    , sink_(sink)
    , status_(status)
    , codec_(key, compress::DEFAULT_LEVEL)
    , reassembler_(key)
{}

void ReceiverSession::on_frame(const FrameHeader& hdr, const std::vector<u8>& payload) {
    if (finished()) {
        LOG_DEBUG("Ignoring " + std::string(msg_type_name(hdr.msg_type)) +
                  " after session end");
        return;
    }

    switch ((MsgType)hdr.msg_type) {
        case MsgType::MT_MANIFEST:
            if (state_ != ReceiverState::AWAIT_MANIFEST) break;
            handle_manifest(payload);
            return;
        case MsgType::MT_CHUNK:
            if (state_ != ReceiverState::RECEIVING_CHUNKS) break;
            handle_chunk(payload);
            return;
        case MsgType::MT_ERROR_MSG:
            fail("Sender reported: " + std::string(payload.begin(), payload.end()), false);
            return;
        default:
            break;
    }
    fail(std::string("Unexpected ") + msg_type_name(hdr.msg_type) + " in state " +
         receiver_state_name(state_), true);
}

void ReceiverSession::on_connection_lost(const std::string& why) {
    if (finished()) return;
    fail("Connection lost in state " + std::string(receiver_state_name(state_)) +
         ": " + why, false);
}

// ---------------------------------------------------------------
// MANIFEST -> HELD_SET
// ---------------------------------------------------------------

void ReceiverSession::handle_manifest(const std::vector<u8>& payload) {
    try {
        manifest_ = std::make_unique<Manifest>(manifest::parse(payload.data(), payload.size()));
    } catch (const MalformedManifestError& e) {
        sink_.send_frame(MsgType::MT_HELD_SET,
                         proto::build_held_set(HeldStatus::MALFORMED, 0, {}));
        fail(std::string("Rejected manifest: ") + e.what(), false);
        return;
    }
    const Manifest& m = *manifest_;

    try {
        output_path_ = file_io::safe_child_path(opts_.out_dir, m.original_filename).string();
    } catch (const std::exception& e) {
        sink_.send_frame(MsgType::MT_HELD_SET,
                         proto::build_held_set(HeldStatus::MALFORMED, m.chunk_count(), {}));
        fail(std::string("Rejected manifest: ") + e.what(), false);
        return;
    }

    // One writer per content key and one per output path: two different
    // files with the same name would otherwise share <output>.part
    lease_ = locks_.try_acquire(m.store_key());
    if (lease_.valid()) output_lease_ = locks_.try_acquire("out:" + output_path_);
    if (!lease_.valid() || !output_lease_.valid()) {
        lease_.release();
        sink_.send_frame(MsgType::MT_HELD_SET,
                         proto::build_held_set(HeldStatus::BUSY, m.chunk_count(), {}));
        std::string name = m.original_filename;
        // The status entry for this file belongs to the session holding the lease
        manifest_.reset();
        fail(name + " is already being received by another session", false);
        return;
    }

    std::vector<u32> held;
    try {
        store_ = std::make_unique<ChunkStore>(opts_.out_dir, m);
        store_->open(opts_.resume);
        if (opts_.resume) held = store_->scan_held();
    } catch (const std::exception& e) {
        fail("Cannot open chunk store: " + std::string(e.what()), true);
        return;
    }

    sink_.send_frame(MsgType::MT_HELD_SET,
                     proto::build_held_set(HeldStatus::OK, m.chunk_count(), held));

    LOG_EVENT(LogLevel::INFO, "held_set", {
        {"file",   m.original_filename},
        {"chunks", std::to_string(m.chunk_count())},
        {"held",   std::to_string(held.size())},
        {"resume", opts_.resume ? "on" : "off"},
    });

    if (status_) {
        status_->update_job(JobStatus{m.original_filename, m.priority, "receiving",
                                      0, m.chunk_count(), 1, ""});
        status_->begin(m.original_filename, m.chunk_count(), m.original_size);
        if (!held.empty()) {
            u64 bytes = 0;
            for (u32 idx : held) bytes += m.chunks[idx].raw_size;
            status_->chunks_skipped(m.original_filename, (u32)held.size(), bytes);
        }
    }

    if (store_->complete()) {
        finish();
    } else {
        set_state(ReceiverState::RECEIVING_CHUNKS);
    }
}

// ---------------------------------------------------------------
// CHUNK -> CHUNK_ACK
// ---------------------------------------------------------------

void ReceiverSession::handle_chunk(const std::vector<u8>& payload) {
    ChunkHdr ch;
    if (!proto::read_struct(payload, ch)) {
        fail("Truncated CHUNK frame (" + std::to_string(payload.size()) + " bytes)", true);
        return;
    }
    proto::decode_chunk_hdr(ch);

    const u8* token     = payload.data() + sizeof(ChunkHdr);
    size_t    token_len = payload.size() - sizeof(ChunkHdr);
    const Manifest& m   = *manifest_;

    // 1. Frame structure
    if (ch.chunk_index >= m.chunk_count()) {
        reject(ch.chunk_index, RejectReason::UNEXPECTED, "index out of range");
        return;
    }
    u8 iv[16];
    if (ch.data_len != token_len || !crypto::token_iv(token, token_len, iv) ||
        std::memcmp(iv, ch.iv, sizeof(iv)) != 0) {
        reject(ch.chunk_index, RejectReason::FRAME_CHECKSUM, "frame/token layout mismatch");
        return;
    }

    // 2. Frame checksum
    if (hash::xxh3_32(token, token_len) != ch.xxh3_32) {
        reject(ch.chunk_index, RejectReason::FRAME_CHECKSUM, "xxh3 mismatch");
        return;
    }

    if (store_->is_held(ch.chunk_index)) {
        LOG_DEBUG("Duplicate chunk " + std::to_string(ch.chunk_index) + " acknowledged");
        send_ack(ch.chunk_index, RejectReason::NONE);
        return;
    }

    const ChunkDescriptor& desc = m.chunks[ch.chunk_index];

    // 3. Transport hash
    if (token_len != desc.size || hash::sha256(token, token_len) != desc.hash) {
        reject(ch.chunk_index, RejectReason::TRANSPORT_HASH, "token digest differs from manifest");
        return;
    }

    // 4. Authenticated decrypt and content hash
    try {
        codec_.restore(desc, token, token_len, m.compression);
    } catch (const AuthenticationError& e) {
        reject(ch.chunk_index, RejectReason::AUTH_FAILED, e.what());
        return;
    } catch (const IntegrityError& e) {
        reject(ch.chunk_index, RejectReason::INTEGRITY, e.what());
        return;
    }

    try {
        store_->put(ch.chunk_index, token, token_len);
    } catch (const std::exception& e) {
        reject(ch.chunk_index, RejectReason::STORAGE, e.what());
        return;
    }

    send_ack(ch.chunk_index, RejectReason::NONE);
    LOG_EVENT(LogLevel::DEBUG, "chunk_stored", {
        {"file",  m.original_filename},
        {"index", std::to_string(ch.chunk_index)},
        {"bytes", std::to_string(token_len)},
    });
    if (status_) status_->chunk_done(m.original_filename, desc.raw_size);

    if (store_->complete()) finish();
}

// ---------------------------------------------------------------
// Reassembly -> FINAL_VERDICT
// ---------------------------------------------------------------

void ReceiverSession::finish() {
    set_state(ReceiverState::VERIFYING);
    const Manifest& m = *manifest_;

    FinalVerdict v{};
    hash::to_bytes(m.original_hash, v.expected_sha256);
    std::string failure;

    try {
        AssemblyReport rep = reassembler_.assemble(store_->source(), m, output_path_);
        v.success         = 1;
        v.chunks_verified = rep.chunks_verified;
        hash::to_bytes(rep.computed, v.computed_sha256);
    } catch (const ReassemblyError& e) {
        failure = e.what();
        // Force a fresh upload of every bad chunk on the next connection
        for (u32 idx : e.faulty_chunks()) store_->discard(idx);
    } catch (const IntegrityError& e) {
        failure = e.what();
    } catch (const std::runtime_error& e) {
        failure = std::string("Reassembly I/O failure: ") + e.what();
    }

    if (!v.success) {
        v.chunks_verified = reassembler_.last_report().chunks_verified;
        hash::to_bytes(reassembler_.last_report().computed, v.computed_sha256);
    }

    FinalVerdict wire = v;
    proto::encode_final_verdict(wire);
    sink_.send_frame(MsgType::MT_FINAL_VERDICT, &wire, (u32)sizeof(wire));

    LOG_EVENT(v.success ? LogLevel::INFO : LogLevel::ERR, "verdict", {
        {"file",     m.original_filename},
        {"success",  v.success ? "true" : "false"},
        {"verified", std::to_string(v.chunks_verified)},
        {"expected", hash::to_hex(m.original_hash)},
        {"computed", hash::to_hex(hash::from_bytes(v.computed_sha256))},
    });

    if (!v.success) {
        fail(failure, false);
        return;
    }

    if (!opts_.keep_chunks) store_->remove_all();
    set_state(ReceiverState::COMPLETED);
    lease_.release();
    output_lease_.release();
    if (status_) status_->end(m.original_filename, true);
    LOG_INFO("Received " + m.original_filename + " -> " + output_path_);
}

// ---------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------

void ReceiverSession::send_ack(u32 index, RejectReason reason) {
    ChunkAck ack{};
    ack.chunk_index = index;
    ack.accepted    = reason == RejectReason::NONE ? 1 : 0;
    ack.reason      = static_cast<u8>(reason);
    proto::encode_chunk_ack(ack);
    sink_.send_frame(MsgType::MT_CHUNK_ACK, &ack, (u32)sizeof(ack));
}

void ReceiverSession::reject(u32 index, RejectReason reason, const std::string& detail) {
    LOG_EVENT(LogLevel::WARN, "chunk_rejected", {
        {"file",   file_label()},
        {"index",  std::to_string(index)},
        {"reason", reject_reason_name(reason)},
        {"detail", detail},
    });
    send_ack(index, reason);
}

void ReceiverSession::set_state(ReceiverState s) {
    if (s == state_) return;
    LOG_EVENT(LogLevel::DEBUG, "session_state", {
        {"role", "receiver"},
        {"file", file_label()},
        {"from", receiver_state_name(state_)},
        {"to",   receiver_state_name(s)},
    });
    state_ = s;
    if (status_ && manifest_) status_->set_state(manifest_->original_filename, receiver_state_name(s));
}

void ReceiverSession::fail(const std::string& msg, bool notify_peer) {
    set_state(ReceiverState::FAILED);
    error_ = msg;
    Logger::get().transfer_error(file_label() + ": " + msg);

    if (notify_peer) {
        try {
            sink_.send_frame(MsgType::MT_ERROR_MSG, msg.data(), (u32)msg.size());
        } catch (const std::exception& e) {
            LOG_DEBUG("ERROR_MSG not delivered: " + std::string(e.what()));
        }
    }

    lease_.release();
    output_lease_.release();
    if (status_ && manifest_) {
        status_->set_error(manifest_->original_filename, msg);
        status_->end(manifest_->original_filename, false);
    }
}

std::string ReceiverSession::file_label() const {
    return manifest_ ? manifest_->original_filename : std::string("<no manifest>");
}
