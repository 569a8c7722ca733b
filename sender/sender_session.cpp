// ============================================================
// sender_session.cpp -- Manifest, chunk and verdict exchange
// ============================================================

#include "sender_session.hpp"
#include "../common/crypto.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/protocol_io.hpp"
#include <algorithm>
#include <cstring>

const char* sender_state_name(SenderState s) {
    switch (s) {
        case SenderState::CONNECTING:         return "connecting";
        case SenderState::SENDING_MANIFEST:   return "sending_manifest";
        case SenderState::SENDING_CHUNKS:     return "sending_chunks";
        case SenderState::AWAITING_FINAL_ACK: return "awaiting_final_ack";
        case SenderState::COMPLETED:          return "completed";
        case SenderState::FAILED:             return "failed";
    }
    return "?";
}

int verdict_wait_periods(u64 original_size, int timeout_s) {
    if (timeout_s <= 0) return 1;
    u64 per_period = VERDICT_BYTES_PER_SEC * (u64)timeout_s;
    u64 extra = (original_size + per_period - 1) / per_period;
    return (int)std::min<u64>(1 + extra, 1u << 20);
}

SenderSession::SenderSession(const Manifest& m, const ChunkSource& src, FrameSink& sink,
                             const SenderOptions& opts, StatusReporter* status)
    : manifest_(m)
    , manifest_json_(manifest::to_json(m))
    , source_(src)
    , sink_(sink)
    , opts_(opts)
    , status_(status)
{}

bool SenderSession::retryable() const {
    if (state_ != SenderState::FAILED) return false;
    // Chunk-level corruption that outlived its resend budget gets a fresh connection
    return error_kind_of(error_code_) == ErrorKind::TRANSIENT ||
           error_code_ == ErrorCode::AUTHENTICATION;
}

void SenderSession::raise() const {
    switch (error_code_) {
        case ErrorCode::CONNECTION:         throw ConnectionError(error_);
        case ErrorCode::TIMEOUT:            throw TimeoutError(error_);
        case ErrorCode::AUTHENTICATION:     throw AuthenticationError(error_);
        case ErrorCode::INTEGRITY:          throw IntegrityError(error_);
        case ErrorCode::MALFORMED_MANIFEST: throw MalformedManifestError(error_);
        case ErrorCode::REASSEMBLY:         throw ReassemblyError(error_, {});
    }
    throw TransferError(error_code_, error_);
}

// ---------------------------------------------------------------
// Connection events
// ---------------------------------------------------------------

void SenderSession::on_connected() {
    if (state_ != SenderState::CONNECTING) return;
    set_state(SenderState::SENDING_MANIFEST);
    sink_.send_frame(MsgType::MT_MANIFEST, manifest_json_.data(), (u32)manifest_json_.size());
    LOG_EVENT(LogLevel::DEBUG, "manifest_sent", {
        {"file",   manifest_.original_filename},
        {"chunks", std::to_string(manifest_.chunk_count())},
        {"bytes",  std::to_string(manifest_json_.size())},
    });
}

void SenderSession::on_connect_failed(const std::string& why) {
    if (finished()) return;
    fail(ErrorCode::CONNECTION, "Cannot connect: " + why);
}

void SenderSession::on_connection_lost(const std::string& why) {
    if (finished()) return;
    fail(ErrorCode::CONNECTION, "Connection lost while " +
         std::string(sender_state_name(state_)) + ": " + why);
}

void SenderSession::on_timeout() {
    switch (state_) {
        case SenderState::SENDING_MANIFEST:
            fail(ErrorCode::TIMEOUT, "No HELD_SET reply to MANIFEST");
            break;
        case SenderState::SENDING_CHUNKS:
            retry_current(ErrorCode::TIMEOUT, "no ack");
            break;
        case SenderState::AWAITING_FINAL_ACK:
            if (++verdict_waits_ < opts_.verdict_timeouts) {
                LOG_INFO("Receiver still verifying " + manifest_.original_filename + " (" +
                         std::to_string(verdict_waits_) + "/" +
                         std::to_string(opts_.verdict_timeouts) + ")");
                break;
            }
            fail(ErrorCode::TIMEOUT, "No FINAL_VERDICT from receiver after " +
                 std::to_string(verdict_waits_) + " timeout period(s)");
            break;
        case SenderState::CONNECTING:
            fail(ErrorCode::CONNECTION, "Connect timed out");
            break;
        default:
            break;
    }
}

void SenderSession::on_frame(const FrameHeader& hdr, const std::vector<u8>& payload) {
    if (finished()) return;

    MsgType type = (MsgType)hdr.msg_type;
    if (type == MsgType::MT_ERROR_MSG) {
        fail(ErrorCode::CONNECTION, "Receiver reported: " +
             std::string(payload.begin(), payload.end()));
        return;
    }

    if (state_ == SenderState::SENDING_MANIFEST && type == MsgType::MT_HELD_SET) {
        handle_held_set(payload);
    } else if (state_ == SenderState::SENDING_CHUNKS && type == MsgType::MT_CHUNK_ACK) {
        handle_ack(payload);
    } else if (state_ == SenderState::AWAITING_FINAL_ACK && type == MsgType::MT_CHUNK_ACK) {
        // Late duplicate of an ack we already acted on
        LOG_DEBUG("Ignoring late CHUNK_ACK");
    } else if (state_ == SenderState::AWAITING_FINAL_ACK && type == MsgType::MT_FINAL_VERDICT) {
        handle_verdict(payload);
    } else {
        fail(ErrorCode::CONNECTION, std::string("Unexpected ") + msg_type_name(hdr.msg_type) +
             " while " + sender_state_name(state_), true);
    }
}

// ---------------------------------------------------------------
// HELD_SET: work out what is missing
// ---------------------------------------------------------------

void SenderSession::handle_held_set(const std::vector<u8>& payload) {
    std::vector<u32> held;
    HeldSetHdr hdr;
    try {
        hdr = proto::parse_held_set(payload, held);
    } catch (const std::exception& e) {
        fail(ErrorCode::CONNECTION, std::string("Bad HELD_SET: ") + e.what(), true);
        return;
    }

    switch ((HeldStatus)hdr.status) {
        case HeldStatus::OK:
            break;
        case HeldStatus::MALFORMED:
            fail(ErrorCode::MALFORMED_MANIFEST,
                 "Receiver rejected the manifest of " + manifest_.original_filename);
            return;
        case HeldStatus::BUSY:
            fail(ErrorCode::CONNECTION,
                 "Receiver is busy with another upload of " + manifest_.original_filename);
            return;
        default:
            fail(ErrorCode::CONNECTION, "Unknown HELD_SET status " + std::to_string(hdr.status));
            return;
    }

    const u32 n = manifest_.chunk_count();
    if (hdr.chunk_count != n) {
        fail(ErrorCode::MALFORMED_MANIFEST, "Receiver counts " + std::to_string(hdr.chunk_count) +
             " chunks, manifest has " + std::to_string(n));
        return;
    }

    std::vector<bool> have(n, false);
    u64 held_bytes = 0;
    for (u32 idx : held) {
        if (idx >= n || have[idx]) {
            LOG_WARN("Ignoring bogus held index " + std::to_string(idx));
            continue;
        }
        have[idx] = true;
        ++held_count_;
        held_bytes += manifest_.chunks[idx].raw_size;
    }

    missing_.clear();
    for (u32 i = 0; i < n; ++i) {
        if (!have[i]) missing_.push_back(i);
    }

    LOG_EVENT(LogLevel::INFO, "held_set", {
        {"file",    manifest_.original_filename},
        {"chunks",  std::to_string(n)},
        {"held",    std::to_string(held_count_)},
        {"missing", std::to_string(missing_.size())},
    });
    if (status_ && held_count_ > 0) {
        status_->chunks_skipped(manifest_.original_filename, held_count_, held_bytes);
    }

    cursor_ = 0;
    if (missing_.empty()) {
        set_state(SenderState::AWAITING_FINAL_ACK);
        return;
    }
    set_state(SenderState::SENDING_CHUNKS);
    send_current();
}

// ---------------------------------------------------------------
// CHUNK / CHUNK_ACK
// ---------------------------------------------------------------

void SenderSession::send_current() {
    const u32 index = missing_[cursor_];
    if (cur_frame_.empty()) {
        std::vector<u8> token;
        try {
            token = source_.load_chunk(index);
        } catch (const std::exception& e) {
            fail(ErrorCode::INTEGRITY, "Prepared chunk " + std::to_string(index) +
                 " unavailable: " + e.what(), true);
            return;
        }
        // A damaged artifact would be rejected on every resend; the prepared
        // directory has to be rebuilt instead
        if (token.size() != manifest_.chunks[index].size ||
            hash::sha256(token.data(), token.size()) != manifest_.chunks[index].hash) {
            fail(ErrorCode::INTEGRITY, "Prepared chunk " + std::to_string(index) +
                 " does not match the manifest", true);
            return;
        }

        ChunkHdr ch{};
        ch.chunk_index = index;
        ch.data_len    = (u32)token.size();
        ch.xxh3_32     = hash::xxh3_32(token.data(), token.size());
        crypto::token_iv(token.data(), token.size(), ch.iv);
        proto::encode_chunk_hdr(ch);

        cur_frame_.resize(sizeof(ChunkHdr) + token.size());
        std::memcpy(cur_frame_.data(), &ch, sizeof(ch));
        std::memcpy(cur_frame_.data() + sizeof(ChunkHdr), token.data(), token.size());
    }

    sink_.send_frame(MsgType::MT_CHUNK, cur_frame_);
    ++sent_;
    LOG_EVENT(LogLevel::DEBUG, "chunk_sent", {
        {"file",    manifest_.original_filename},
        {"index",   std::to_string(index)},
        {"bytes",   std::to_string(cur_frame_.size() - sizeof(ChunkHdr))},
        {"attempt", std::to_string(resends_ + 1)},
    });
}

void SenderSession::handle_ack(const std::vector<u8>& payload) {
    ChunkAck ack;
    if (!proto::read_struct(payload, ack)) {
        fail(ErrorCode::CONNECTION, "Truncated CHUNK_ACK", true);
        return;
    }
    proto::decode_chunk_ack(ack);

    const u32 index = missing_[cursor_];
    if (ack.chunk_index != index) {
        LOG_DEBUG("Stale ack for chunk " + std::to_string(ack.chunk_index) +
                  " while waiting for " + std::to_string(index));
        return;
    }

    RejectReason reason = (RejectReason)ack.reason;
    LOG_EVENT(ack.accepted ? LogLevel::DEBUG : LogLevel::WARN, "chunk_ack", {
        {"file",     manifest_.original_filename},
        {"index",    std::to_string(index)},
        {"accepted", ack.accepted ? "true" : "false"},
        {"reason",   reject_reason_name(reason)},
    });

    if (ack.accepted) {
        ++acked_;
        if (status_) status_->chunk_done(manifest_.original_filename,
                                         manifest_.chunks[index].raw_size);
        advance();
        return;
    }

    switch (reason) {
        case RejectReason::FRAME_CHECKSUM:
        case RejectReason::TRANSPORT_HASH:
        case RejectReason::AUTH_FAILED:
            retry_current(ErrorCode::AUTHENTICATION, reject_reason_name(reason));
            break;
        case RejectReason::INTEGRITY:
            fail(ErrorCode::INTEGRITY, "Receiver found chunk " + std::to_string(index) +
                 " content corrupt after decryption");
            break;
        default:
            fail(ErrorCode::INTEGRITY, "Receiver rejected chunk " + std::to_string(index) +
                 ": " + reject_reason_name(reason));
            break;
    }
}

void SenderSession::retry_current(ErrorCode code, const std::string& why) {
    const u32 index = missing_[cursor_];
    if (resends_ >= opts_.max_retries) {
        fail(code, "Chunk " + std::to_string(index) + " failed after " +
             std::to_string(resends_) + " resend(s): " + why);
        return;
    }
    ++resends_;
    LOG_WARN("Resending chunk " + std::to_string(index) + " (" + why + ", retry " +
             std::to_string(resends_) + "/" + std::to_string(opts_.max_retries) + ")");
    send_current();
}

void SenderSession::advance() {
    ++cursor_;
    resends_ = 0;
    cur_frame_.clear();
    if (cursor_ >= missing_.size()) {
        set_state(SenderState::AWAITING_FINAL_ACK);
        return;
    }
    send_current();
}

// ---------------------------------------------------------------
// FINAL_VERDICT
// ---------------------------------------------------------------

void SenderSession::handle_verdict(const std::vector<u8>& payload) {
    FinalVerdict v;
    if (!proto::read_struct(payload, v)) {
        fail(ErrorCode::CONNECTION, "Truncated FINAL_VERDICT", true);
        return;
    }
    proto::decode_final_verdict(v);

    std::string expected = hash::to_hex(hash::from_bytes(v.expected_sha256));
    std::string computed = hash::to_hex(hash::from_bytes(v.computed_sha256));
    LOG_EVENT(v.success ? LogLevel::INFO : LogLevel::ERR, "verdict", {
        {"file",     manifest_.original_filename},
        {"success",  v.success ? "true" : "false"},
        {"verified", std::to_string(v.chunks_verified)},
        {"expected", expected},
        {"computed", computed},
    });

    if (!v.success) {
        fail(ErrorCode::INTEGRITY, "Receiver verification failed for " +
             manifest_.original_filename + " (expected " + expected +
             ", computed " + computed + ")");
        return;
    }
    if (hash::from_bytes(v.expected_sha256) != manifest_.original_hash) {
        fail(ErrorCode::INTEGRITY, "Verdict names a different file hash: " + expected);
        return;
    }
    set_state(SenderState::COMPLETED);
}

// ---------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------

void SenderSession::set_state(SenderState s) {
    if (s == state_) return;
    LOG_EVENT(LogLevel::DEBUG, "session_state", {
        {"role", "sender"},
        {"file", manifest_.original_filename},
        {"from", sender_state_name(state_)},
        {"to",   sender_state_name(s)},
    });
    state_ = s;
    if (status_) status_->set_state(manifest_.original_filename, sender_state_name(s));
}

void SenderSession::fail(ErrorCode code, const std::string& msg, bool notify_peer) {
    failed_stage_ = state_;
    error_code_   = code;
    error_        = msg;
    set_state(SenderState::FAILED);

    LOG_EVENT(LogLevel::ERR, "session_failed", {
        {"file",  manifest_.original_filename},
        {"stage", sender_state_name(failed_stage_)},
        {"error", error_code_name(code)},
    });

    if (notify_peer) {
        try {
            sink_.send_frame(MsgType::MT_ERROR_MSG, msg.data(), (u32)msg.size());
        } catch (const std::exception& e) {
            LOG_DEBUG("ERROR_MSG not delivered: " + std::string(e.what()));
        }
    }
    if (status_) status_->set_error(manifest_.original_filename, msg);
}
