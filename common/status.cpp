// ============================================================
// status.cpp -- Progress snapshot implementation
// ============================================================

#include "status.hpp"
#include "file_io.hpp"
#include "logger.hpp"
#include "utils.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

StatusReporter::StatusReporter(Role role, std::string path)
    : role_(role)
    , path_(std::move(path))
    , last_tick_(std::chrono::steady_clock::now())
{
    progress_.transfer_label = role == Role::SENDER ? "Sent" : "Recv";
    std::lock_guard<std::mutex> lk(mutex_);
    write_locked();
}

void StatusReporter::begin(const std::string& file, u32 chunks_total, u64 bytes_total) {
    std::lock_guard<std::mutex> lk(mutex_);
    cur_ = Current{};
    cur_.file         = file;
    cur_.state        = "starting";
    cur_.chunks_total = chunks_total;
    cur_.bytes_total  = bytes_total;
    last_error_.clear();
    last_tick_ = std::chrono::steady_clock::now();
    speed_bps_ = 0.0;
    if (JobStatus* j = find_job_locked(file)) {
        j->chunks_total = chunks_total;
        j->error.clear();
    }
    sync_progress_locked();
    write_locked();
}

void StatusReporter::set_state(const std::string& file, const std::string& state) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (cur_.file == file) cur_.state = state;
    if (JobStatus* j = find_job_locked(file)) j->state = state;
    sync_progress_locked();
    write_locked();
}

void StatusReporter::chunks_skipped(const std::string& file, u32 count, u64 bytes) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (cur_.file == file) {
        cur_.chunks_completed += count;
        cur_.bytes_done       += bytes;
    }
    if (JobStatus* j = find_job_locked(file)) j->chunks_completed += count;
    sync_progress_locked();
    write_locked();
}

void StatusReporter::chunk_done(const std::string& file, u64 bytes) {
    std::lock_guard<std::mutex> lk(mutex_);
    auto now = std::chrono::steady_clock::now();
    double dt = std::chrono::duration<double>(now - last_tick_).count();
    if (dt > 0.0) {
        double instant = (double)bytes / dt;
        speed_bps_ = speed_bps_ == 0.0 ? instant : 0.7 * speed_bps_ + 0.3 * instant;
    }
    last_tick_ = now;

    if (cur_.file == file) {
        cur_.chunks_completed += 1;
        cur_.bytes_done       += bytes;
    }
    if (JobStatus* j = find_job_locked(file)) j->chunks_completed += 1;
    sync_progress_locked();
    write_locked();
}

void StatusReporter::set_error(const std::string& file, const std::string& msg) {
    std::lock_guard<std::mutex> lk(mutex_);
    last_error_ = msg;
    if (JobStatus* j = find_job_locked(file)) j->error = msg;
    write_locked();
}

void StatusReporter::update_job(const JobStatus& job) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (JobStatus* j = find_job_locked(job.file)) {
        *j = job;
    } else {
        jobs_.push_back(job);
    }
    write_locked();
}

void StatusReporter::set_files_total(u32 n) {
    std::lock_guard<std::mutex> lk(mutex_);
    progress_.files_total.store(n);
    write_locked();
}

void StatusReporter::end(const std::string& file, bool success) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (success) progress_.files_done.fetch_add(1);
    if (cur_.file == file) {
        cur_ = Current{};
        speed_bps_ = 0.0;
    }
    sync_progress_locked();
    write_locked();
}

std::string StatusReporter::snapshot_json() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return snapshot_locked();
}

std::string StatusReporter::snapshot_locked() const {
    json jobs = json::array();
    for (const auto& j : jobs_) {
        jobs.push_back(json{
            {"file",             j.file},
            {"priority",         priority_name(j.priority)},
            {"state",            j.state},
            {"chunks_completed", j.chunks_completed},
            {"chunks_total",     j.chunks_total},
            {"attempts",         j.attempts},
            {"error",            j.error},
        });
    }

    json eta = nullptr;
    if (speed_bps_ > 0.0 && cur_.bytes_total > cur_.bytes_done) {
        eta = (u64)((double)(cur_.bytes_total - cur_.bytes_done) / speed_bps_);
    }

    json doc = {
        {"role",              role_name(role_)},
        {"state",             cur_.state},
        {"current_file",      cur_.file},
        {"chunks_completed",  cur_.chunks_completed},
        {"chunks_total",      cur_.chunks_total},
        {"bytes_transferred", cur_.bytes_done},
        {"bytes_total",       cur_.bytes_total},
        {"speed_bps",         speed_bps_},
        {"eta_seconds",       eta},
        {"error_message",     last_error_},
        {"jobs",              jobs},
        {"last_update",       utils::iso8601_now()},
    };
    return doc.dump(2);
}

void StatusReporter::write_locked() {
    if (path_.empty()) return;
    try {
        file_io::write_file_atomic(path_, snapshot_locked());
    } catch (const std::exception& e) {
        // A failed snapshot never fails a transfer
        LOG_WARN("Status snapshot not written: " + std::string(e.what()));
    }
}

void StatusReporter::sync_progress_locked() {
    progress_.bytes_done.store(cur_.bytes_done);
    progress_.bytes_total.store(cur_.bytes_total);
    progress_.chunks_done.store(cur_.chunks_completed);
    progress_.chunks_total.store(cur_.chunks_total);
    std::lock_guard<std::mutex> lk(progress_.current_file_mutex);
    progress_.current_file  = cur_.file;
    progress_.current_state = cur_.state;
}

JobStatus* StatusReporter::find_job_locked(const std::string& file) {
    for (auto& j : jobs_) {
        if (j.file == file) return &j;
    }
    return nullptr;
}
