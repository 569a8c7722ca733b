#pragma once

// ============================================================
// sender_app.hpp -- chunkcp sender: prepares files and pushes them
//   to a receiver in priority order, with connect retry and
//   job-level requeue.
// ============================================================

#include "../common/platform.hpp"
#include "../common/config.hpp"
#include "../common/crypto.hpp"
#include "../common/manifest.hpp"
#include "../common/socket.hpp"
#include "../common/status.hpp"
#include "scheduler.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class SenderApp {
public:
    SenderApp(TransferConfig config, const crypto::Key& key);
    ~SenderApp();

    // Queue a file; throws std::runtime_error if it is not a regular file
    u32 add_file(const std::string& path, Priority priority);

    // Process every queued job. Returns 0 only if all of them completed.
    int run();

    // Call from signal handler: abort the current attempt, run no further jobs
    void stop();

    // Build or reuse the prepared directory of 'job'
    Manifest prepare(const TransferJob& job);

    // Final record of every job that left the queue
    const std::vector<TransferJob>& finished_jobs() const { return finished_; }

    // <work_dir>/<filename>.<path tag>.chunks, one per canonical source path
    static std::string prepared_dir_for(const std::string& work_dir, const std::string& source);

    static constexpr const char* SOURCE_FILE = "source.json";

private:
    TransferConfig                  config_;
    crypto::Key                     key_;
    PriorityScheduler               scheduler_;
    std::unique_ptr<StatusReporter> status_;
    std::vector<TransferJob>        finished_;
    u32                             next_id_{1};

    std::atomic<bool>               stop_{false};
    std::mutex                      sock_mutex_;
    TcpSocket*                      active_sock_{nullptr};

    // One connection attempt for 'job'; fills its outcome fields
    void run_attempt(TransferJob& job);

    // Exponential back-off connect, bounded by network.connect_retry_s
    bool connect_with_retry(TcpSocket& sock, std::string& last_error);

    // Prepared directory is current for the source and settings, and
    // every artifact still matches its manifest digest
    bool prepared_is_current(const TransferJob& job, Manifest& out) const;
    // Force the next prepare() to rebuild
    void discard_prepared(const TransferJob& job);
    static nlohmann::json source_record(const std::string& source_path);

    void publish(const TransferJob& job);
    static std::string job_file(const TransferJob& job);
};
