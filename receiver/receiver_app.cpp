// ============================================================
// receiver_app.cpp -- chunkcp receiver daemon implementation
// ============================================================

#include "receiver_app.hpp"
#include "../common/logger.hpp"
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

ReceiverApp::ReceiverApp(TransferConfig config, const crypto::Key& key, std::string out_dir)
    : config_(std::move(config))
    , key_(key)
{
    opts_.out_dir     = std::move(out_dir);
    opts_.resume      = config_.transfer.enable_resume;
    opts_.keep_chunks = config_.transfer.keep_chunks;
    status_ = std::make_unique<StatusReporter>(Role::RECEIVER, config_.monitoring.status_file);
}

ReceiverApp::~ReceiverApp() {
    stop();
    wait_sessions();
}

void ReceiverApp::listen() {
    std::error_code ec;
    fs::create_directories(opts_.out_dir, ec);
    if (ec) {
        throw std::runtime_error("Cannot create output directory " + opts_.out_dir +
                                 ": " + ec.message());
    }

    std::string host = config_.network.host.empty() ? "0.0.0.0" : config_.network.host;
    listen_sock_.bind_and_listen(host, config_.network.port);
    port_ = listen_sock_.local_port();
    running_.store(true);

    LOG_INFO("chunkcp receiver listening on " + host + ":" + std::to_string(port_) +
             "  (output: " + opts_.out_dir + ", resume " +
             (opts_.resume ? "on" : "off") + ")");
}

int ReceiverApp::serve() {
    if (config_.monitoring.show_progress && Tui::is_tty()) {
        tui_ = std::make_unique<Tui>(status_->progress());
        tui_->start();
    }

    accept_loop();
    // Only this thread touches the listening fd
    listen_sock_.close();

    wait_sessions();
    if (tui_) tui_->stop();
    LOG_INFO("Receiver stopped: " + std::to_string(completed_.load()) + " completed, " +
             std::to_string(failed_.load()) + " failed");
    return 0;
}

int ReceiverApp::run() {
    listen();
    return serve();
}

void ReceiverApp::stop() {
    if (!running_.exchange(false)) return;
    // Wakes accept(); serve() closes the socket once accept_loop() returns
    listen_sock_.shutdown();

    // Wake every session blocked in recv(); artifacts already verified stay on disk
    std::lock_guard<std::mutex> lk(session_mutex_);
    for (TcpSocket* s : active_socks_) s->shutdown();
}

// ---------------------------------------------------------------
// accept_loop
//   Pure accept() loop. Each accepted socket gets its own session
//   thread; connections past max_sessions are refused by closing.
// ---------------------------------------------------------------
void ReceiverApp::accept_loop() {
    while (running_.load()) {
        try {
            TcpSocket sock = listen_sock_.accept();
            sock.tune();
            std::string peer = sock.peer_addr();

            auto shared = std::make_shared<TcpSocket>(std::move(sock));
            {
                std::lock_guard<std::mutex> lk(session_mutex_);
                if (active_ >= config_.network.max_sessions) {
                    LOG_WARN("Refusing " + peer + ": " +
                             std::to_string(config_.network.max_sessions) + " sessions active");
                    continue;
                }
                ++active_;
                active_socks_.insert(shared.get());
            }
            LOG_DEBUG("Accepted connection from " + peer);

            std::thread([this, shared]() {
                handle_connection(shared);
            }).detach();
        } catch (const std::exception& e) {
            if (!running_.load()) break;
            LOG_ERROR("accept_loop: " + std::string(e.what()));
        }
    }
}

// ---------------------------------------------------------------
// handle_connection
//   Blocking frame pump for one session. Socket failures surface
//   here as std::runtime_error and are reported to the session as a
//   lost connection.
// ---------------------------------------------------------------
void ReceiverApp::handle_connection(std::shared_ptr<TcpSocket> sock) {
    std::string peer = sock->peer_addr();
    {
        SocketFrameSink sink(*sock);
        ReceiverSession session(opts_, key_, locks_, sink, status_.get());

        try {
            sock->set_recv_timeout_ms(config_.network.timeout_s * 1000);

            FrameHeader hdr{};
            std::vector<u8> payload;
            while (!session.finished()) {
                ReadResult rr = sock->read_frame(hdr, payload);
                if (rr == ReadResult::CLOSED) {
                    session.on_connection_lost(running_.load() ? "peer closed the connection"
                                                               : "receiver shutting down");
                    break;
                }
                if (rr == ReadResult::TIMEOUT) {
                    session.on_connection_lost("no frame for " +
                                               std::to_string(config_.network.timeout_s) + "s");
                    break;
                }
                session.on_frame(hdr, payload);
            }
        } catch (const std::exception& e) {
            session.on_connection_lost(peer + ": " + e.what());
        }

        if (session.state() == ReceiverState::COMPLETED) {
            completed_.fetch_add(1);
        } else {
            failed_.fetch_add(1);
            LOG_WARN("Session from " + peer + " ended in state " +
                     receiver_state_name(session.state()) + ": " + session.error());
        }
    }

    // Last touch of 'this': wait_sessions() may return as soon as the lock drops
    std::lock_guard<std::mutex> lk(session_mutex_);
    active_socks_.erase(sock.get());
    --active_;
    session_cv_.notify_all();
}

void ReceiverApp::wait_sessions() {
    std::unique_lock<std::mutex> lk(session_mutex_);
    session_cv_.wait(lk, [this] { return active_ == 0; });
}
