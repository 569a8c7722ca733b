#pragma once

// ============================================================
// status.hpp -- Progress snapshot for external monitors
//
// A JSON document per role, rewritten atomically (tmp + rename) on every
// state transition and chunk completion. Thread-safe; the receiver shares
// one reporter across concurrent sessions.
// ============================================================

#include "platform.hpp"
#include "config.hpp"
#include "priority.hpp"
#include "tui.hpp"
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

struct JobStatus {
    std::string file;
    Priority    priority{Priority::NORMAL};
    std::string state;
    u32         chunks_completed{0};
    u32         chunks_total{0};
    int         attempts{0};
    std::string error;
};

class StatusReporter {
public:
    // An empty path disables the snapshot file; counters still feed progress()
    StatusReporter(Role role, std::string path);

    StatusReporter(const StatusReporter&) = delete;
    StatusReporter& operator=(const StatusReporter&) = delete;

    // A session starts work on one file
    void begin(const std::string& file, u32 chunks_total, u64 bytes_total);

    // Session state machine moved to 'state'
    void set_state(const std::string& file, const std::string& state);

    // Chunks already held at the start count as completed without moving bytes
    void chunks_skipped(const std::string& file, u32 count, u64 bytes);

    // One chunk acknowledged / verified
    void chunk_done(const std::string& file, u64 bytes);

    void set_error(const std::string& file, const std::string& msg);

    // Upsert one entry of the job table
    void update_job(const JobStatus& job);
    void set_files_total(u32 n);

    // Session over: reset current-file counters and report 'idle'
    void end(const std::string& file, bool success);

    std::string snapshot_json() const;

    ProgressState& progress() { return progress_; }
    const std::string& path() const { return path_; }

private:
    struct Current {
        std::string file;
        std::string state{"idle"};
        u32 chunks_completed{0};
        u32 chunks_total{0};
        u64 bytes_done{0};
        u64 bytes_total{0};
    };

    Role                 role_;
    std::string          path_;
    mutable std::mutex   mutex_;
    Current              cur_;
    std::vector<JobStatus> jobs_;
    std::string          last_error_;
    ProgressState        progress_;

    // Transfer-rate estimate (EWMA over chunk completions)
    std::chrono::steady_clock::time_point last_tick_;
    double               speed_bps_{0.0};

    void write_locked();
    std::string snapshot_locked() const;
    void sync_progress_locked();
    JobStatus* find_job_locked(const std::string& file);
};
