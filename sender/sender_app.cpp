// ============================================================
// sender_app.cpp -- chunkcp sender implementation
// ============================================================

#include "sender_app.hpp"
#include "sender_session.hpp"
#include "../common/chunk_codec.hpp"
#include "../common/chunk_source.hpp"
#include "../common/compress.hpp"
#include "../common/errors.hpp"
#include "../common/file_io.hpp"
#include "../common/frame_sink.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/tui.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;

namespace {

std::string canonical_source(const std::string& path) {
    std::error_code ec;
    fs::path canon = fs::weakly_canonical(path, ec);
    return ec ? fs::absolute(path).string() : canon.string();
}

} // namespace

SenderApp::SenderApp(TransferConfig config, const crypto::Key& key)
    : config_(std::move(config))
    , key_(key)
{
    status_ = std::make_unique<StatusReporter>(Role::SENDER, config_.monitoring.status_file);
}

SenderApp::~SenderApp() {
    stop();
}

std::string SenderApp::prepared_dir_for(const std::string& work_dir, const std::string& source) {
    // Same base name in different directories must not share artifacts
    std::string id = canonical_source(source);
    std::string tag = hash::to_hex(hash::sha256(id.data(), id.size())).substr(0, 12);
    return (fs::path(work_dir) /
            (fs::path(source).filename().string() + "." + tag + ".chunks")).string();
}

std::string SenderApp::job_file(const TransferJob& job) {
    return fs::path(job.source_path).filename().string();
}

u32 SenderApp::add_file(const std::string& path, Priority priority) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw std::runtime_error("Not a regular file: " + path);
    }
    TransferJob job;
    job.id           = next_id_++;
    job.source_path  = path;
    job.prepared_dir = prepared_dir_for(config_.transfer.work_dir, path);
    job.priority     = priority;
    publish(job);
    scheduler_.enqueue(job);
    return job.id;
}

void SenderApp::stop() {
    stop_.store(true);
    std::lock_guard<std::mutex> lk(sock_mutex_);
    if (active_sock_) active_sock_->shutdown();
}

// ---------------------------------------------------------------
// Preparation
// ---------------------------------------------------------------

// <prepared_dir>/source.json: which file the artifacts were cut from
nlohmann::json SenderApp::source_record(const std::string& source_path) {
    return nlohmann::json{
        {"path",     canonical_source(source_path)},
        {"size",     file_io::get_file_size(source_path)},
        {"mtime_ns", file_io::get_mtime_ns(source_path)},
    };
}

bool SenderApp::prepared_is_current(const TransferJob& job, Manifest& out) const {
    std::string mpath = (fs::path(job.prepared_dir) / manifest::FILE_NAME).string();
    std::string spath = (fs::path(job.prepared_dir) / SOURCE_FILE).string();
    std::error_code ec;
    if (!fs::exists(mpath, ec) || !fs::exists(spath, ec)) return false;

    try {
        out = manifest::load(mpath);
        std::vector<u8> raw = file_io::read_file(spath);
        if (nlohmann::json::parse(raw.begin(), raw.end()) != source_record(job.source_path)) {
            LOG_INFO("Source changed since preparation: " + job.source_path);
            return false;
        }
    } catch (const std::exception& e) {
        LOG_WARN("Prepared directory unusable, rebuilding: " + std::string(e.what()));
        return false;
    }

    CompressAlgo want = (config_.compression.enabled && compress::should_compress(job.source_path))
                        ? CompressAlgo::ZSTD : CompressAlgo::NONE;
    if (out.original_size != file_io::get_file_size(job.source_path) ||
        out.chunk_size != config_.chunk_size_bytes() ||
        out.compression != want ||
        out.original_filename != job_file(job)) {
        return false;
    }

    // Every artifact must still hash to its manifest entry
    DirChunkSource dir(job.prepared_dir);
    for (const auto& d : out.chunks) {
        try {
            std::vector<u8> token = dir.load_chunk(d.index);
            if (token.size() != d.size || hash::sha256(token.data(), token.size()) != d.hash) {
                LOG_WARN("Prepared chunk " + std::to_string(d.index) + " of " + job_file(job) +
                         " is damaged, rebuilding");
                return false;
            }
        } catch (const std::exception& e) {
            LOG_WARN("Prepared chunk " + std::to_string(d.index) + " unreadable: " + e.what());
            return false;
        }
    }
    return true;
}

void SenderApp::discard_prepared(const TransferJob& job) {
    std::error_code ec;
    fs::remove((fs::path(job.prepared_dir) / manifest::FILE_NAME), ec);
    fs::remove((fs::path(job.prepared_dir) / SOURCE_FILE), ec);
    LOG_WARN("Discarded prepared chunks of " + job_file(job));
}

Manifest SenderApp::prepare(const TransferJob& job) {
    Manifest m;
    if (prepared_is_current(job, m)) {
        LOG_INFO("Reusing prepared chunks in " + job.prepared_dir);
        if (m.priority != job.priority) {
            // Tokens are unchanged; only the recorded priority moves
            m.priority = job.priority;
            manifest::save(m, (fs::path(job.prepared_dir) / manifest::FILE_NAME).string());
        }
        return m;
    }

    PrepareOptions opts;
    opts.chunk_size          = config_.chunk_size_bytes();
    opts.priority            = job.priority;
    opts.compression_enabled = config_.compression.enabled;
    opts.compress_level      = config_.compression.level;
    opts.threads             = config_.prepare_threads();
    Manifest built = codec::prepare_to_dir(job.source_path, job.prepared_dir, key_, opts);
    file_io::write_file_atomic((fs::path(job.prepared_dir) / SOURCE_FILE).string(),
                               source_record(job.source_path).dump(2));
    return built;
}

// ---------------------------------------------------------------
// connect_with_retry
// ---------------------------------------------------------------

bool SenderApp::connect_with_retry(TcpSocket& sock, std::string& last_error) {
    using clock = std::chrono::steady_clock;
    int retry_secs = config_.network.connect_retry_s;
    auto deadline = clock::now() + std::chrono::seconds(retry_secs > 0 ? retry_secs : 1);

    int delay_ms = 500;
    const int max_delay_ms = 8000;

    while (!stop_.load()) {
        try {
            TcpSocket s;
            s.connect(config_.network.host, config_.network.port);
            s.tune();
            sock = std::move(s);
            return true;
        } catch (const std::exception& e) {
            last_error = e.what();
            if (clock::now() >= deadline) {
                LOG_ERROR("connect_with_retry: timed out (" + last_error + ")");
                return false;
            }
            LOG_WARN("Receiver not ready, retry in " + std::to_string(delay_ms) + " ms");
            std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
            delay_ms = std::min(delay_ms * 2, max_delay_ms);
        }
    }
    last_error = "stopped";
    return false;
}

// ---------------------------------------------------------------
// run
// ---------------------------------------------------------------

int SenderApp::run() {
    status_->set_files_total((u32)scheduler_.size());

    std::unique_ptr<Tui> tui;
    if (config_.monitoring.show_progress && Tui::is_tty()) {
        tui = std::make_unique<Tui>(status_->progress());
        tui->start();
    }

    while (!stop_.load()) {
        std::optional<TransferJob> next = scheduler_.next_job();
        if (!next) break;
        TransferJob job = std::move(*next);

        // Back off before re-attempting a job that already failed once
        if (job.attempts > 0) {
            int wait_ms = std::min(1000 * job.attempts, 8000);
            for (int waited = 0; waited < wait_ms && !stop_.load(); waited += 100) {
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }

        run_attempt(job);

        if (job.state == JobState::COMPLETED) {
            finished_.push_back(job);
        } else if (job.state == JobState::PENDING) {
            scheduler_.requeue(job);
        } else {
            finished_.push_back(job);
        }
        publish(job);
    }

    if (tui) tui->stop();

    // Whatever is still queued was cut short by stop()
    while (auto left = scheduler_.next_job()) {
        left->state      = JobState::FAILED;
        left->last_error = "sender stopped";
        publish(*left);
        finished_.push_back(*left);
    }

    int completed = 0;
    for (const auto& j : finished_) {
        if (j.state == JobState::COMPLETED) {
            ++completed;
            LOG_INFO("COMPLETED " + j.source_path + " (" + priority_name(j.priority) + ", " +
                     std::to_string(j.attempts) + " attempt(s))");
        } else {
            LOG_ERROR("FAILED    " + j.source_path + " at " + j.failed_stage + ": " +
                      j.last_error + " (" + std::to_string(j.chunks_done) + "/" +
                      std::to_string(j.chunks_total) + " chunks)");
        }
    }
    LOG_INFO(std::to_string(completed) + "/" + std::to_string(finished_.size()) +
             " file(s) transferred");
    return completed == (int)finished_.size() ? 0 : 1;
}

// ---------------------------------------------------------------
// run_attempt
//   One connection: prepare (or reuse), connect, then pump frames
//   into a SenderSession until it completes or fails. Socket errors
//   reach the session as a lost connection.
// ---------------------------------------------------------------
void SenderApp::run_attempt(TransferJob& job) {
    const std::string file = job_file(job);
    ++job.attempts;
    job.state = JobState::IN_PROGRESS;
    publish(job);

    Manifest m;
    try {
        m = prepare(job);
    } catch (const std::exception& e) {
        job.state        = JobState::FAILED;
        job.failed_stage = "preparing";
        job.last_error   = e.what();
        Logger::get().transfer_error(file + ": preparation failed: " + e.what());
        status_->set_error(file, job.last_error);
        return;
    }
    job.chunks_total = m.chunk_count();

    DirChunkSource src(job.prepared_dir);
    TcpSocket sock;
    SocketFrameSink sink(sock);
    SenderOptions opts;
    opts.max_retries      = config_.transfer.max_retries;
    opts.verdict_timeouts = verdict_wait_periods(m.original_size, config_.network.timeout_s);
    SenderSession session(m, src, sink, opts, status_.get());

    status_->begin(file, m.chunk_count(), m.original_size);
    LOG_INFO("Sending " + file + " (" + priority_name(job.priority) + ", attempt " +
             std::to_string(job.attempts) + "/" +
             std::to_string(config_.transfer.max_job_attempts) + ") to " +
             config_.network.host + ":" + std::to_string(config_.network.port));

    std::string conn_err;
    if (!connect_with_retry(sock, conn_err)) {
        session.on_connect_failed(conn_err);
    } else {
        {
            std::lock_guard<std::mutex> lk(sock_mutex_);
            active_sock_ = &sock;
        }
        try {
            sock.set_recv_timeout_ms(config_.network.timeout_s * 1000);
            session.on_connected();

            FrameHeader hdr{};
            std::vector<u8> payload;
            while (!session.finished()) {
                ReadResult rr = sock.read_frame(hdr, payload);
                if (rr == ReadResult::OK) {
                    session.on_frame(hdr, payload);
                } else if (rr == ReadResult::TIMEOUT) {
                    session.on_timeout();
                } else {
                    session.on_connection_lost(stop_.load() ? "sender stopped"
                                                            : "receiver closed the connection");
                }
            }
        } catch (const std::exception& e) {
            session.on_connection_lost(e.what());
        }
        {
            std::lock_guard<std::mutex> lk(sock_mutex_);
            active_sock_ = nullptr;
        }
        sock.close();
    }

    job.chunks_done = session.chunks_done();
    if (session.state() == SenderState::COMPLETED) {
        job.state = JobState::COMPLETED;
        job.last_error.clear();
        job.failed_stage.clear();
        status_->end(file, true);
        LOG_INFO("Transfer of " + file + " verified by receiver (" +
                 std::to_string(session.chunks_sent()) + " chunk frame(s) sent, " +
                 std::to_string(session.chunks_held()) + " already held)");
        return;
    }

    job.failed_stage = sender_state_name(session.failed_stage());
    job.last_error   = std::string(error_code_name(session.error_code())) + ": " + session.error();
    Logger::get().transfer_error(file + ": attempt " + std::to_string(job.attempts) +
                                 " failed at " + job.failed_stage + ": " + job.last_error);
    status_->end(file, false);

    // Bad tokens are never resent as they are; one rebuild from the source is allowed
    bool rebuild = session.error_code() == ErrorCode::INTEGRITY &&
                   session.failed_stage() == SenderState::SENDING_CHUNKS &&
                   !job.rebuilt;
    if (rebuild) {
        discard_prepared(job);
        job.rebuilt = true;
    }

    if ((session.retryable() || rebuild) &&
        job.attempts < config_.transfer.max_job_attempts && !stop_.load()) {
        job.state = JobState::PENDING;
    } else {
        job.state = JobState::FAILED;
    }
}

void SenderApp::publish(const TransferJob& job) {
    JobStatus js;
    js.file             = job_file(job);
    js.priority         = job.priority;
    js.state            = job_state_name(job.state);
    js.chunks_completed = job.chunks_done;
    js.chunks_total     = job.chunks_total;
    js.attempts         = job.attempts;
    js.error            = job.last_error;
    status_->update_job(js);
}
