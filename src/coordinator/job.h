/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: job.h

    Description:
        The unit of work handed from the coordinator to a worker, plus the
        worker liveness record and the statistics snapshot. All types are
        value-like: the job store copies them in and out under its lock and
        never hands out references into its tables.

    Job Lifecycle:

        create_jobs()                lease_next_job()
        ──────────► PENDING ──────────────────► IN_PROGRESS
                       ▲                           │   │
                       │ sweep(): replacement job  │   │ complete_job()
                       │ (new id, same targets)    │   ▼
                       └───────────────────────────┘  COMPLETED / FAILED

        A lease that outlives timeout_seconds is retired by the sweep: the
        old Job is marked FAILED ("lease expired") and dropped, and a new
        PENDING Job carrying the same targets goes to the queue tail.

    Invariants:
        - worker_id is non-empty exactly while status == IN_PROGRESS or after
          the job reached a terminal state through its owner
        - results has a value iff status is COMPLETED or FAILED

    Template Parameters:
        Target - record handed to the prober (ProxyRecord in this project)
        Result - record produced by the prober (ProbeResult in this project)
*******************************************************************************/

#ifndef JOB_H
#define JOB_H

#include "common/time_utils.h"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace proxypool {

//==============================================================================
// JOB STATUS
//==============================================================================

enum class JobStatus {
    PENDING,
    IN_PROGRESS,
    COMPLETED,
    FAILED
};

inline const char* job_status_to_string(JobStatus status) {
    switch (status) {
        case JobStatus::PENDING:     return "pending";
        case JobStatus::IN_PROGRESS: return "in_progress";
        case JobStatus::COMPLETED:   return "completed";
        case JobStatus::FAILED:      return "failed";
    }
    return "unknown";
}

// Returns false for unknown names; `out` is left untouched in that case
inline bool job_status_from_string(const std::string& name, JobStatus& out) {
    if (name == "pending")     { out = JobStatus::PENDING;     return true; }
    if (name == "in_progress") { out = JobStatus::IN_PROGRESS; return true; }
    if (name == "completed")   { out = JobStatus::COMPLETED;   return true; }
    if (name == "failed")      { out = JobStatus::FAILED;      return true; }
    return false;
}

// Lease length used when the coordinator config does not override it
constexpr int DEFAULT_JOB_TIMEOUT_SEC = 300;

//==============================================================================
// JOB
//==============================================================================

template <typename Target, typename Result>
struct Job {
    std::string job_id;
    std::vector<Target> targets;
    JobStatus status;

    // Set by the lease; kept once the owner completes the job. Empty while PENDING
    std::string worker_id;

    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;

    std::optional<std::vector<Result>> results;

    // Empty means "no error"
    std::string error_message;

    int timeout_seconds;

    Job() : status(JobStatus::PENDING), created_at(system_now()),
            timeout_seconds(DEFAULT_JOB_TIMEOUT_SEC) {}

    bool is_terminal() const {
        return status == JobStatus::COMPLETED || status == JobStatus::FAILED;
    }
};

//==============================================================================
// WORKER RECORD
//==============================================================================
//
// Created on the first registration, heartbeat or lease request from a
// worker id; removed by the liveness sweep once last_heartbeat is older than
// the configured worker timeout.
//
//------------------------------------------------------------------------------

using WorkerInfo = std::map<std::string, std::string>;

struct WorkerRecord {
    std::string worker_id;
    TimePoint last_heartbeat;
    TimePoint registered_at;

    // Monotonic counters, never reset while the record lives
    uint64_t jobs_completed;
    uint64_t targets_processed;

    // Free-form registration metadata (hostname, version, limits)
    WorkerInfo registration_info;

    WorkerRecord() : jobs_completed(0), targets_processed(0) {}

    std::string hostname() const {
        auto it = registration_info.find("hostname");
        return it != registration_info.end() ? it->second : "unknown";
    }
};

//==============================================================================
// STATISTICS SNAPSHOT
//==============================================================================

struct CoordinatorStats {
    size_t queued;
    size_t active;
    size_t workers;

    // worker_id -> copy of the record at snapshot time
    std::map<std::string, WorkerRecord> per_worker;

    // Running totals since the coordinator was constructed
    uint64_t total_jobs_created;
    uint64_t total_jobs_completed;
    uint64_t total_jobs_failed;
    uint64_t total_jobs_requeued;
    uint64_t total_results_received;
    TimePoint start_time;

    CoordinatorStats() : queued(0), active(0), workers(0),
                         total_jobs_created(0), total_jobs_completed(0),
                         total_jobs_failed(0), total_jobs_requeued(0),
                         total_results_received(0) {}

    bool drained() const { return queued == 0 && active == 0; }
};

} // namespace proxypool

#endif // JOB_H
