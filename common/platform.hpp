#pragma once

// ============================================================
// platform.hpp -- POSIX socket/OS abstraction
// ============================================================

#include <string>
#include <cstdint>

#include <sys/types.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <fcntl.h>
#include <errno.h>
#include <cstring>
#include <netdb.h>
#include <csignal>

using socket_t = int;
#define INVALID_SOCKET_VAL (-1)
#define SOCKET_ERROR_VAL   (-1)
#define CLOSE_SOCKET(s)    ::close(s)

inline int last_socket_error() { return errno; }
inline bool would_block(int err) { return err == EAGAIN || err == EWOULDBLOCK; }
inline std::string socket_error_str(int err) {
    return std::string(strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

#include <cstddef>
#include <stdexcept>

namespace platform {

// Process-wide setup for the network binaries
inline void init() {
    // Writes to a dropped peer must surface as EPIPE, not kill the process
    std::signal(SIGPIPE, SIG_IGN);
}

inline void cleanup() {}

struct Guard {
    Guard()  { init(); }
    ~Guard() { cleanup(); }
};

} // namespace platform

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
