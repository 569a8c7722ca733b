// ============================================================
// scheduler.cpp -- Priority scheduler
// ============================================================

#include "scheduler.hpp"
#include "../common/logger.hpp"

const char* job_state_name(JobState s) {
    switch (s) {
        case JobState::PENDING:     return "pending";
        case JobState::IN_PROGRESS: return "in_progress";
        case JobState::COMPLETED:   return "completed";
        case JobState::FAILED:      return "failed";
    }
    return "?";
}

void PriorityScheduler::enqueue(TransferJob job) {
    job.state = JobState::PENDING;
    Priority p = job.priority;
    LOG_DEBUG("Queued job " + std::to_string(job.id) + " (" + job.source_path +
              ", " + priority_name(p) + ")");
    queue_.push(Entry{p, next_seq_++, std::move(job)});
}

std::optional<TransferJob> PriorityScheduler::next_job() {
    if (queue_.empty()) return std::nullopt;
    // top() is const; the entry is discarded right after the copy
    TransferJob job = queue_.top().job;
    queue_.pop();
    job.state = JobState::IN_PROGRESS;
    return job;
}

void PriorityScheduler::requeue(TransferJob job) {
    LOG_DEBUG("Requeue job " + std::to_string(job.id) + " after attempt " +
              std::to_string(job.attempts));
    enqueue(std::move(job));
}
