#pragma once

// ============================================================
// frame_sink.hpp -- Outgoing-frame seam for the session state machines
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include "socket.hpp"
#include <vector>

class FrameSink {
public:
    virtual ~FrameSink() = default;

    // Queue or send one frame; throws on a broken transport
    virtual void send_frame(MsgType type, const void* payload, u32 len) = 0;

    void send_frame(MsgType type, const std::vector<u8>& payload) {
        send_frame(type, payload.data(), (u32)payload.size());
    }
};

// Writes straight to a connected TcpSocket
class SocketFrameSink : public FrameSink {
public:
    explicit SocketFrameSink(TcpSocket& sock) : sock_(sock) {}

    void send_frame(MsgType type, const void* payload, u32 len) override {
        sock_.write_frame(type, 0, payload, len);
    }
    using FrameSink::send_frame;

private:
    TcpSocket& sock_;
};
