#pragma once

// protocol.hpp -- Wire protocol definitions for chunkcp

#include "platform.hpp"
#include <cstring>

// Manifest format_version written by this build
static constexpr u32 CHUNKCP_VERSION = 1;

static constexpr u32 MAX_PAYLOAD_LEN    = 64u * 1024u * 1024u;
static constexpr u32 DEFAULT_CHUNK_SIZE = 1u * 1024u * 1024u;
static constexpr u32 MIN_CHUNK_SIZE     = 4u * 1024u;
// A prepared token is compressed data plus padding and framing, so the chunk
// itself must leave headroom under MAX_PAYLOAD_LEN.
static constexpr u32 MAX_CHUNK_SIZE     = 48u * 1024u * 1024u;

static constexpr size_t IV_LEN     = 16;
static constexpr size_t SHA256_LEN = 32;

// ---- Message Types ----
enum class MsgType : u16 {
    MT_MANIFEST      = 0x0010,  // sender→receiver: manifest JSON
    MT_HELD_SET      = 0x0011,  // receiver→sender: HeldSetHdr + u32[held_count]

    MT_CHUNK         = 0x0020,  // sender→receiver: ChunkHdr + token
    MT_CHUNK_ACK     = 0x0021,  // receiver→sender: ChunkAck

    MT_FINAL_VERDICT = 0x0030,  // receiver→sender: FinalVerdict

    MT_ERROR_MSG     = 0x00FF,
};

inline const char* msg_type_name(u16 t) {
    switch (static_cast<MsgType>(t)) {
        case MsgType::MT_MANIFEST:      return "MANIFEST";
        case MsgType::MT_HELD_SET:      return "HELD_SET";
        case MsgType::MT_CHUNK:         return "CHUNK";
        case MsgType::MT_CHUNK_ACK:     return "CHUNK_ACK";
        case MsgType::MT_FINAL_VERDICT: return "FINAL_VERDICT";
        case MsgType::MT_ERROR_MSG:     return "ERROR_MSG";
    }
    return "UNKNOWN";
}

// ---- Frame Header (8 bytes, big-endian on wire) ----
struct FrameHeader {
    u16 msg_type;
    u16 flags;
    u32 payload_len;
};
static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be 8 bytes");

// ---- HELD_SET status codes ----
enum class HeldStatus : u8 {
    OK        = 0,
    MALFORMED = 1,  // manifest rejected by the parser
    BUSY      = 2,  // another session holds the write lease for this file
};

// ---- CHUNK_ACK rejection reasons ----
enum class RejectReason : u8 {
    NONE           = 0,
    FRAME_CHECKSUM = 1,  // xxh3 over the token did not match the header
    TRANSPORT_HASH = 2,  // token SHA-256 differs from the manifest
    AUTH_FAILED    = 3,  // HMAC check failed
    INTEGRITY      = 4,  // decrypt/decompress ok but content hash differs
    STORAGE        = 5,  // artifact could not be persisted
    UNEXPECTED     = 6,  // index out of range or malformed frame
};

inline const char* reject_reason_name(RejectReason r) {
    switch (r) {
        case RejectReason::NONE:           return "none";
        case RejectReason::FRAME_CHECKSUM: return "frame_checksum";
        case RejectReason::TRANSPORT_HASH: return "transport_hash";
        case RejectReason::AUTH_FAILED:    return "auth_failed";
        case RejectReason::INTEGRITY:      return "integrity";
        case RejectReason::STORAGE:        return "storage";
        case RejectReason::UNEXPECTED:     return "unexpected";
    }
    return "?";
}

// ============================================================
// Packed structures (wire format, big-endian)
// ============================================================
#pragma pack(push, 1)

// HeldSetHdr: 16 bytes, followed by held_count × u32 (chunk indices, ascending)
struct HeldSetHdr {
    u8  status;
    u8  pad[3];
    u32 chunk_count;
    u32 held_count;
    u32 reserved;
};
static_assert(sizeof(HeldSetHdr) == 16, "HeldSetHdr size mismatch");

// ChunkHdr: 32 bytes fixed + token
// iv duplicates the token IV so a truncated token is caught before decrypting
struct ChunkHdr {
    u32 chunk_index;
    u32 data_len;
    u32 xxh3_32;     // xxh3 over the token bytes
    u8  iv[16];
    u8  pad[4];
};
static_assert(sizeof(ChunkHdr) == 32, "ChunkHdr size mismatch");

// ChunkAck: 8 bytes
struct ChunkAck {
    u32 chunk_index;
    u8  accepted;
    u8  reason;
    u8  pad[2];
};
static_assert(sizeof(ChunkAck) == 8, "ChunkAck size mismatch");

// FinalVerdict: 72 bytes
struct FinalVerdict {
    u8  success;
    u8  pad[3];
    u32 chunks_verified;
    u8  expected_sha256[32];
    u8  computed_sha256[32];
};
static_assert(sizeof(FinalVerdict) == 72, "FinalVerdict size mismatch");

#pragma pack(pop)
