#pragma once

// ============================================================
// receiver_app.hpp -- chunkcp receiver: persistent daemon
//
// Concurrency model:
//   accept_loop()       → accepts one socket at a time and spawns a
//                         session thread per connection, up to
//                         network.max_sessions at once.
//   session threads     → pump frames from the socket into a
//                         ReceiverSession until it finishes or the
//                         peer goes away.
// Sessions for different files run in parallel; a second sender for a
// file that is already being received gets HELD_SET{BUSY}.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/crypto.hpp"
#include "../common/socket.hpp"
#include "../common/status.hpp"
#include "../common/tui.hpp"
#include "chunk_store.hpp"
#include "receiver_session.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <set>
#include <string>

class ReceiverApp {
public:
    ReceiverApp(TransferConfig config, const crypto::Key& key, std::string out_dir);
    ~ReceiverApp();

    // Bind and listen only; port() is valid afterwards
    void listen();

    // Serve connections until stop() is called
    int serve();

    // listen() + serve()
    int run();

    // Call from signal handler to shut down gracefully
    void stop();

    u16 port() const { return port_; }
    u32 sessions_completed() const { return completed_.load(); }
    u32 sessions_failed() const { return failed_.load(); }

private:
    TransferConfig                  config_;
    crypto::Key                     key_;
    ReceiverOptions                 opts_;
    TcpSocket                       listen_sock_;
    u16                             port_{0};
    std::atomic<bool>               running_{false};

    FileLockRegistry                locks_;
    std::unique_ptr<StatusReporter> status_;
    std::unique_ptr<Tui>            tui_;

    // --- Session threads (one per accepted connection, detached) ---
    std::mutex                      session_mutex_;
    std::condition_variable         session_cv_;
    std::set<TcpSocket*>            active_socks_;
    int                             active_{0};
    std::atomic<u32>                completed_{0};
    std::atomic<u32>                failed_{0};

    void accept_loop();
    void handle_connection(std::shared_ptr<TcpSocket> sock);
    // Block until every session thread has exited
    void wait_sessions();
};
