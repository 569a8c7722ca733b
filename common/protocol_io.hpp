#pragma once

// ============================================================
// protocol_io.hpp -- Frame encoding with byte-order handling
// ============================================================

#include "protocol.hpp"
#include <vector>
#include <stdexcept>
#include <string>
#include <endian.h>

namespace proto {

// ---- Byte-order helpers ----

inline u16 hton16(u16 v) { return htobe16(v); }
inline u32 hton32(u32 v) { return htobe32(v); }
inline u64 hton64(u64 v) { return htobe64(v); }
inline u16 ntoh16(u16 v) { return be16toh(v); }
inline u32 ntoh32(u32 v) { return be32toh(v); }
inline u64 ntoh64(u64 v) { return be64toh(v); }

// ---- Serialise / deserialise FrameHeader ----

inline void encode_header(const FrameHeader& h, u8 buf[8]) {
    u16 mt = hton16(h.msg_type);
    u16 fl = hton16(h.flags);
    u32 pl = hton32(h.payload_len);
    std::memcpy(buf,     &mt, 2);
    std::memcpy(buf + 2, &fl, 2);
    std::memcpy(buf + 4, &pl, 4);
}

inline FrameHeader decode_header(const u8 buf[8]) {
    FrameHeader h;
    u16 mt, fl; u32 pl;
    std::memcpy(&mt, buf,     2);
    std::memcpy(&fl, buf + 2, 2);
    std::memcpy(&pl, buf + 4, 4);
    h.msg_type    = ntoh16(mt);
    h.flags       = ntoh16(fl);
    h.payload_len = ntoh32(pl);
    return h;
}

// ---- Encode individual struct fields (in-place, host->network) ----

inline void encode_held_set_hdr(HeldSetHdr& h) {
    h.chunk_count = hton32(h.chunk_count);
    h.held_count  = hton32(h.held_count);
    h.reserved    = hton32(h.reserved);
}

inline void decode_held_set_hdr(HeldSetHdr& h) {
    h.chunk_count = ntoh32(h.chunk_count);
    h.held_count  = ntoh32(h.held_count);
    h.reserved    = ntoh32(h.reserved);
}

inline void encode_chunk_hdr(ChunkHdr& c) {
    c.chunk_index = hton32(c.chunk_index);
    c.data_len    = hton32(c.data_len);
    c.xxh3_32     = hton32(c.xxh3_32);
}

inline void decode_chunk_hdr(ChunkHdr& c) {
    c.chunk_index = ntoh32(c.chunk_index);
    c.data_len    = ntoh32(c.data_len);
    c.xxh3_32     = ntoh32(c.xxh3_32);
}

inline void encode_chunk_ack(ChunkAck& a) {
    a.chunk_index = hton32(a.chunk_index);
}

inline void decode_chunk_ack(ChunkAck& a) {
    a.chunk_index = ntoh32(a.chunk_index);
}

inline void encode_final_verdict(FinalVerdict& v) {
    v.chunks_verified = hton32(v.chunks_verified);
}

inline void decode_final_verdict(FinalVerdict& v) {
    v.chunks_verified = ntoh32(v.chunks_verified);
}

// ---- Payload builders ----

// HELD_SET payload: header followed by the big-endian index list
inline std::vector<u8> build_held_set(HeldStatus status, u32 chunk_count,
                                      const std::vector<u32>& held)
{
    HeldSetHdr hdr{};
    hdr.status      = static_cast<u8>(status);
    hdr.chunk_count = chunk_count;
    hdr.held_count  = (u32)held.size();
    encode_held_set_hdr(hdr);

    std::vector<u8> buf(sizeof(HeldSetHdr) + held.size() * 4);
    std::memcpy(buf.data(), &hdr, sizeof(hdr));
    u8* p = buf.data() + sizeof(HeldSetHdr);
    for (u32 idx : held) {
        u32 be = hton32(idx);
        std::memcpy(p, &be, 4);
        p += 4;
    }
    return buf;
}

// Parse a HELD_SET payload; throws on a truncated or inconsistent frame
inline HeldSetHdr parse_held_set(const std::vector<u8>& payload, std::vector<u32>& held_out) {
    if (payload.size() < sizeof(HeldSetHdr)) {
        throw std::runtime_error("HELD_SET payload too short");
    }
    HeldSetHdr hdr;
    std::memcpy(&hdr, payload.data(), sizeof(hdr));
    decode_held_set_hdr(hdr);
    size_t expected = sizeof(HeldSetHdr) + (size_t)hdr.held_count * 4;
    if (payload.size() != expected) {
        throw std::runtime_error("HELD_SET length mismatch: " +
                                 std::to_string(payload.size()) + " != " +
                                 std::to_string(expected));
    }
    held_out.clear();
    held_out.reserve(hdr.held_count);
    const u8* p = payload.data() + sizeof(HeldSetHdr);
    for (u32 i = 0; i < hdr.held_count; ++i) {
        u32 be;
        std::memcpy(&be, p, 4);
        held_out.push_back(ntoh32(be));
        p += 4;
    }
    return hdr;
}

// Fixed-size struct payload helpers
template<typename T>
inline bool read_struct(const std::vector<u8>& payload, T& out) {
    if (payload.size() < sizeof(T)) return false;
    std::memcpy(&out, payload.data(), sizeof(T));
    return true;
}

} // namespace proto
