#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include "protocol.hpp"
#include <string>
#include <stdexcept>
#include <vector>
#include <chrono>

// Outcome of a blocking frame read
enum class ReadResult {
    OK,
    CLOSED,   // peer closed, or the connection broke mid-frame
    TIMEOUT,  // SO_RCVTIMEO elapsed before any byte of the next frame arrived
};

class TcpSocket {
public:
    TcpSocket();
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Client: connect to remote
    void connect(const std::string& ip, u16 port);

    // Server: bind + listen (port 0 picks an ephemeral port, see local_port())
    void bind_and_listen(const std::string& ip, u16 port, int backlog = 128);

    // Accept one connection (blocking)
    TcpSocket accept();

    // Send exactly 'len' bytes; throws on error
    void send_all(const void* buf, size_t len);

    // Receive exactly 'len' bytes
    ReadResult recv_all(void* buf, size_t len);

    // Send a complete frame (header + payload)
    void write_frame(MsgType type, u16 flags, const void* payload, u32 payload_len);

    // Read next frame: fills header, resizes payload_buf and reads payload
    ReadResult read_frame(FrameHeader& hdr, std::vector<u8>& payload_buf);

    // Apply TCP performance tuning
    void tune();

    void close();

    // Wake up a thread blocked in accept()/recv() on this socket
    void shutdown();

    // Get peer address as string
    std::string peer_addr() const;

    // Locally bound port (after bind_and_listen or connect)
    u16 local_port() const;

    // Set receive timeout in milliseconds (0 = infinite)
    void set_recv_timeout_ms(int ms);

private:
    socket_t fd_{INVALID_SOCKET_VAL};

    void apply_socket_opts();
};
