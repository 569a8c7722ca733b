#pragma once

// ============================================================
// scheduler.hpp -- Priority queue of transfer jobs
//
// Strict priority (CRITICAL first), FIFO within a tier. Jobs are never
// preempted: the sending loop takes one job, runs it to completion or
// definitive failure, then asks for the next. Priority orders whole
// files only; chunks of a file always go out in index order.
// ============================================================

#include "../common/platform.hpp"
#include "../common/priority.hpp"
#include <optional>
#include <queue>
#include <string>
#include <vector>

enum class JobState {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED,
};

const char* job_state_name(JobState s);

struct TransferJob {
    u32         id{0};
    std::string source_path;
    std::string prepared_dir;
    Priority    priority{Priority::NORMAL};
    JobState    state{JobState::PENDING};
    int         attempts{0};
    bool        rebuilt{false};   // prepared chunks already rebuilt once

    // Failure record of the last attempt
    std::string last_error;
    std::string failed_stage;

    u32         chunks_done{0};
    u32         chunks_total{0};
};

class PriorityScheduler {
public:
    // Assigns the FIFO sequence; the job becomes PENDING
    void enqueue(TransferJob job);

    // Highest-priority, oldest job; nullopt when empty
    std::optional<TransferJob> next_job();

    // Back into the queue behind jobs already waiting in the same tier
    void requeue(TransferJob job);

    size_t size() const { return queue_.size(); }
    bool empty() const { return queue_.empty(); }

private:
    struct Entry {
        Priority    priority;
        u64         seq;
        TransferJob job;
    };

    // std::priority_queue is a max-heap; "greater" entries come out last
    struct Later {
        bool operator()(const Entry& a, const Entry& b) const {
            if (a.priority != b.priority) return a.priority > b.priority;
            return a.seq > b.seq;
        }
    };

    std::priority_queue<Entry, std::vector<Entry>, Later> queue_;
    u64 next_seq_{0};
};
