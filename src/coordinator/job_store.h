/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: job_store.h

    Description:
        The coordinator's in-memory state: the FIFO queue of PENDING jobs, the
        table of IN_PROGRESS leases, a bounded history of finished jobs and
        the worker liveness table. Every member function takes the single
        store mutex for a short critical section; nothing in here probes,
        performs I/O or calls the result sink.

    Data Structures:

        queue_      std::deque<Job>            PENDING, FIFO, requeues at tail
        active_     std::map<id, Job>          IN_PROGRESS leases
        completed_  std::map<id, Job>          COMPLETED / FAILED, bounded
        workers_    std::map<id, WorkerRecord> liveness table

        A job lives in exactly one of queue_, active_ and completed_.

    Admission Control:
        lease_next_job() refuses to hand out work once active_ holds
        max_concurrent_jobs leases. The ceiling is global, not per worker.

    Recovery Semantics (at-least-once):
        reclaim_expired_jobs() retires a lease that outlived its timeout and
        appends a replacement job with a new id and the same targets. The
        original owner may still finish; its complete_job() call names an id
        that is no longer in active_ and is ignored. The result sink can
        therefore see the same targets twice, never the same job twice.

    Thread Safety:
        All public member functions are safe to call concurrently.

    Template Parameters:
        Target, Result - see coordinator/job.h
*******************************************************************************/

#ifndef JOB_STORE_H
#define JOB_STORE_H

#include "coordinator/job.h"
#include "common/id_generator.h"
#include "common/time_utils.h"

#include <chrono>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace proxypool {

// One retired lease and the job that replaced it
struct ExpiredLease {
    std::string old_job_id;
    std::string new_job_id;
    std::string worker_id;
    size_t target_count;
    long long held_ms;
};

template <typename Target, typename Result>
class JobStore {
public:
    using JobType = Job<Target, Result>;

    explicit JobStore(size_t max_concurrent_jobs,
                      size_t completed_history_limit = 1000,
                      ClockFn clock = system_now)
        : max_concurrent_jobs_(max_concurrent_jobs),
          completed_history_limit_(completed_history_limit),
          clock_(std::move(clock)) {
        totals_.start_time = clock_();
    }

    JobStore(const JobStore&) = delete;
    JobStore& operator=(const JobStore&) = delete;

    //--------------------------------------------------------------------------
    // Queue
    //--------------------------------------------------------------------------

    void enqueue(std::vector<JobType> jobs) {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& job : jobs) {
            job.status = JobStatus::PENDING;
            job.worker_id.clear();
            job.started_at.reset();
            queue_.push_back(std::move(job));
        }
        totals_.total_jobs_created += jobs.size();
    }

    //--------------------------------------------------------------------------
    // lease_next_job
    //
    // Refreshes (or creates) the caller's worker record, then hands out the
    // queue head unless the queue is empty or the concurrency ceiling is
    // reached. Returns false for "no job available"; that is not an error.
    //--------------------------------------------------------------------------
    bool lease_next_job(const std::string& worker_id, JobType& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = clock_();

        touch_worker_locked(worker_id, now);

        if (queue_.empty() || active_.size() >= max_concurrent_jobs_) {
            return false;
        }

        JobType job = std::move(queue_.front());
        queue_.pop_front();

        job.status = JobStatus::IN_PROGRESS;
        job.worker_id = worker_id;
        job.started_at = now;

        out = job;
        active_.emplace(job.job_id, std::move(job));
        return true;
    }

    //--------------------------------------------------------------------------
    // complete_job
    //
    // The presence check against active_ is what makes completion
    // idempotent: the first call moves the job out, every later call (and
    // every call for a lease the sweep already retired) finds nothing and
    // returns false. On success `completed` receives a copy of the finished
    // job, results included, for the caller to persist outside the lock.
    //--------------------------------------------------------------------------
    bool complete_job(const std::string& job_id,
                      std::vector<Result> results,
                      const std::string& error_message,
                      JobType& completed) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = active_.find(job_id);
        if (it == active_.end()) {
            return false;
        }

        JobType job = std::move(it->second);
        active_.erase(it);

        size_t result_count = results.size();
        job.completed_at = clock_();
        job.error_message = error_message;
        job.status = error_message.empty() ? JobStatus::COMPLETED : JobStatus::FAILED;
        job.results = std::move(results);

        auto worker_it = workers_.find(job.worker_id);
        if (worker_it != workers_.end()) {
            worker_it->second.jobs_completed++;
            worker_it->second.targets_processed += result_count;
        }

        if (job.status == JobStatus::COMPLETED) {
            totals_.total_jobs_completed++;
        } else {
            totals_.total_jobs_failed++;
        }
        totals_.total_results_received += result_count;

        completed = job;
        remember_completed_locked(std::move(job));
        return true;
    }

    //--------------------------------------------------------------------------
    // Workers
    //--------------------------------------------------------------------------

    void heartbeat(const std::string& worker_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        touch_worker_locked(worker_id, clock_());
    }

    // Replaces the registration metadata but keeps the counters of a worker
    // that re-registers under the same id
    void register_worker(const std::string& worker_id, const WorkerInfo& info) {
        std::lock_guard<std::mutex> lock(mutex_);
        WorkerRecord& record = touch_worker_locked(worker_id, clock_());
        record.registration_info = info;
    }

    //--------------------------------------------------------------------------
    // Sweep
    //--------------------------------------------------------------------------

    std::vector<ExpiredLease> reclaim_expired_jobs() {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = clock_();
        std::vector<ExpiredLease> expired;

        for (auto it = active_.begin(); it != active_.end();) {
            JobType& job = it->second;
            if (!job.started_at ||
                now - *job.started_at <= std::chrono::seconds(job.timeout_seconds)) {
                ++it;
                continue;
            }

            // The retired lease is discarded, so its FAILED state is only
            // ever visible through the returned record and the log.
            job.status = JobStatus::FAILED;
            job.error_message = "lease expired";
            job.completed_at = now;
            job.results = std::vector<Result>();

            JobType replacement;
            replacement.job_id = generate_uuid4();
            replacement.targets = job.targets;
            replacement.status = JobStatus::PENDING;
            replacement.created_at = now;
            replacement.timeout_seconds = job.timeout_seconds;

            ExpiredLease lease;
            lease.old_job_id = job.job_id;
            lease.new_job_id = replacement.job_id;
            lease.worker_id = job.worker_id;
            lease.target_count = job.targets.size();
            lease.held_ms = elapsed_ms(*job.started_at, now);
            expired.push_back(lease);

            queue_.push_back(std::move(replacement));
            it = active_.erase(it);
        }

        totals_.total_jobs_requeued += expired.size();
        return expired;
    }

    std::vector<std::string> evict_dead_workers(std::chrono::seconds worker_timeout) {
        std::lock_guard<std::mutex> lock(mutex_);
        TimePoint now = clock_();
        std::vector<std::string> evicted;

        for (auto it = workers_.begin(); it != workers_.end();) {
            if (now - it->second.last_heartbeat > worker_timeout) {
                evicted.push_back(it->first);
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
        return evicted;
    }

    //--------------------------------------------------------------------------
    // Queries
    //--------------------------------------------------------------------------

    CoordinatorStats snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CoordinatorStats stats = totals_;
        stats.queued = queue_.size();
        stats.active = active_.size();
        stats.workers = workers_.size();
        stats.per_worker = workers_;
        return stats;
    }

    bool find_completed_job(const std::string& job_id, JobType& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = completed_.find(job_id);
        if (it == completed_.end()) return false;
        out = it->second;
        return true;
    }

    bool find_active_job(const std::string& job_id, JobType& out) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = active_.find(job_id);
        if (it == active_.end()) return false;
        out = it->second;
        return true;
    }

    // Copy of the queue in lease order
    std::vector<JobType> queued_jobs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<JobType>(queue_.begin(), queue_.end());
    }

    bool drained() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty() && active_.empty();
    }

    size_t max_concurrent_jobs() const { return max_concurrent_jobs_; }

    TimePoint now() const { return clock_(); }

private:
    WorkerRecord& touch_worker_locked(const std::string& worker_id, TimePoint now) {
        auto it = workers_.find(worker_id);
        if (it == workers_.end()) {
            WorkerRecord record;
            record.worker_id = worker_id;
            record.registered_at = now;
            it = workers_.emplace(worker_id, record).first;
        }
        it->second.last_heartbeat = now;
        return it->second;
    }

    void remember_completed_locked(JobType job) {
        if (completed_history_limit_ == 0) return;

        completed_order_.push_back(job.job_id);
        completed_[job.job_id] = std::move(job);

        while (completed_order_.size() > completed_history_limit_) {
            completed_.erase(completed_order_.front());
            completed_order_.pop_front();
        }
    }

    const size_t max_concurrent_jobs_;
    const size_t completed_history_limit_;
    ClockFn clock_;

    mutable std::mutex mutex_;

    std::deque<JobType> queue_;
    std::map<std::string, JobType> active_;
    std::map<std::string, JobType> completed_;
    std::deque<std::string> completed_order_;
    std::map<std::string, WorkerRecord> workers_;

    CoordinatorStats totals_;
};

} // namespace proxypool

#endif // JOB_STORE_H
