/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: coordinator.h

    Description:
        The central authority of a validation run. The Coordinator owns the
        job store, turns target lists into jobs, leases them to workers,
        accepts completions, forwards results to the result sink and runs the
        background sweep that recovers abandoned leases and forgets silent
        workers.

        Both transport bindings drive the same Coordinator instance:
        - LocalTransport calls it directly from worker threads
        - ControlPlaneServer calls it from HTTP handler threads

    Concurrency Model:

        BACKGROUND THREADS (1):
        1. Sweep Thread: every sweep_interval_sec, reclaim expired leases and
           evict workers whose heartbeat is older than worker_timeout_sec

        SYNCHRONIZATION:
        - JobStore mutex: every queue / lease / worker mutation
        - sweep_mutex_ + sweep_cv_: lets stop() wake the sweep thread early
        - running_: atomic lifecycle flag

        The result sink is always called without the store lock held, so a
        slow sink delays only the completing caller, never a lease request.

    Fault Tolerance:

        WORKER FAILURE:
        - Leases are bounded by job.timeout_seconds (wall clock, measured from
          started_at)
        - An expired lease is retired and its targets requeued as a new job
        - Workers that stop heartbeating are dropped from the worker table

        BAD SUBMISSIONS:
        - Completion for an unknown or already-retired job id: WARNING + no-op
        - Result sink failure: ERROR, the job still counts as completed

    Configuration:
        CoordinatorConfig below; defaults match a long-running service with a
        five minute lease and a thirty second sweep.
*******************************************************************************/

#ifndef COORDINATOR_H
#define COORDINATOR_H

#include "coordinator/job.h"
#include "coordinator/job_store.h"
#include "coordinator/result_sink.h"
#include "coordinator/target_batcher.h"
#include "common/logger.h"
#include "common/time_utils.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace proxypool {

//==============================================================================
// CONFIGURATION
//==============================================================================

struct CoordinatorConfig {
    // Targets per job when create_jobs() is called without an explicit size
    size_t batch_size;

    // Global lease ceiling; lease requests beyond it get "no job"
    size_t max_concurrent_jobs;

    // Lease length stamped on every job this coordinator creates
    int job_timeout_sec;

    // A worker silent for longer than this is removed from the worker table
    int worker_timeout_sec;

    // Period of the background sweep
    int sweep_interval_sec;

    // Finished jobs kept for find_completed_job()
    size_t completed_history_limit;

    CoordinatorConfig() : batch_size(50),
                          max_concurrent_jobs(10),
                          job_timeout_sec(DEFAULT_JOB_TIMEOUT_SEC),
                          worker_timeout_sec(300),
                          sweep_interval_sec(30),
                          completed_history_limit(1000) {}
};

//==============================================================================
// COORDINATOR
//==============================================================================

template <typename Target, typename Result>
class Coordinator {
public:
    using JobType = Job<Target, Result>;

    explicit Coordinator(const CoordinatorConfig& config = CoordinatorConfig(),
                         ResultSink<Result>* sink = nullptr,
                         ClockFn clock = system_now)
        : config_(config),
          sink_(sink),
          store_(config.max_concurrent_jobs, config.completed_history_limit, std::move(clock)),
          running_(false) {
    }

    virtual ~Coordinator() {
        stop();
    }

    Coordinator(const Coordinator&) = delete;
    Coordinator& operator=(const Coordinator&) = delete;

    //--------------------------------------------------------------------------
    // Lifecycle
    //--------------------------------------------------------------------------

    bool start() {
        if (running_) {
            Logger::warning("Coordinator already running");
            return false;
        }

        Logger::info("Starting coordinator (batch_size=" + std::to_string(config_.batch_size) +
                     ", max_concurrent_jobs=" + std::to_string(config_.max_concurrent_jobs) +
                     ", job_timeout=" + std::to_string(config_.job_timeout_sec) + "s" +
                     ", worker_timeout=" + std::to_string(config_.worker_timeout_sec) + "s)");

        running_ = true;
        sweep_thread_ = std::thread(&Coordinator::sweep_loop, this);

        Logger::info("Coordinator started, sweeping every " +
                     std::to_string(config_.sweep_interval_sec) + "s");
        return true;
    }

    void stop() {
        if (!running_) return;

        Logger::info("Stopping coordinator...");
        {
            std::lock_guard<std::mutex> lock(sweep_mutex_);
            running_ = false;
        }
        sweep_cv_.notify_all();

        if (sweep_thread_.joinable()) {
            sweep_thread_.join();
        }
        Logger::info("Coordinator stopped");
    }

    bool is_running() const { return running_; }

    //--------------------------------------------------------------------------
    // Job creation
    //--------------------------------------------------------------------------

    // Batches of config_.batch_size. Empty input enqueues nothing.
    std::vector<std::string> create_jobs(const std::vector<Target>& targets) {
        return create_jobs(targets, config_.batch_size);
    }

    // Throws std::invalid_argument for a batch size of 0
    std::vector<std::string> create_jobs(const std::vector<Target>& targets,
                                         size_t batch_size) {
        std::vector<JobType> jobs = make_batches<Target, Result>(
            targets, batch_size, config_.job_timeout_sec, store_.now());

        std::vector<std::string> ids;
        ids.reserve(jobs.size());
        for (const auto& job : jobs) {
            ids.push_back(job.job_id);
        }

        if (jobs.empty()) {
            Logger::info("No targets supplied, no jobs created");
            return ids;
        }

        enqueue(std::move(jobs));
        Logger::info("Created " + std::to_string(ids.size()) + " jobs for " +
                     std::to_string(targets.size()) + " targets (batch size " +
                     std::to_string(batch_size) + ")");
        return ids;
    }

    void enqueue(std::vector<JobType> jobs) {
        size_t count = jobs.size();
        store_.enqueue(std::move(jobs));
        Logger::debug("Enqueued " + std::to_string(count) + " jobs");
    }

    //--------------------------------------------------------------------------
    // Leasing and completion
    //--------------------------------------------------------------------------

    bool lease_next_job(const std::string& worker_id, JobType& job) {
        if (!store_.lease_next_job(worker_id, job)) {
            return false;
        }
        Logger::info("Assigned job " + short_id(job.job_id) + " to worker " + worker_id +
                     " (" + std::to_string(job.targets.size()) + " targets)");
        return true;
    }

    // Returns true when this call was the effective completion of job_id
    bool complete_job(const std::string& job_id,
                      std::vector<Result> results,
                      const std::string& error_message = "") {
        JobType finished;
        if (!store_.complete_job(job_id, std::move(results), error_message, finished)) {
            Logger::warning("Ignoring completion for unknown job " + short_id(job_id) +
                            " (already completed or lease expired)");
            return false;
        }

        const std::vector<Result>& job_results = *finished.results;
        long long duration_ms = 0;
        if (finished.started_at && finished.completed_at) {
            duration_ms = elapsed_ms(*finished.started_at, *finished.completed_at);
        }

        if (finished.status == JobStatus::COMPLETED) {
            Logger::info("Job " + short_id(job_id) + " completed by " + finished.worker_id +
                         " in " + std::to_string(duration_ms) + " ms - " +
                         std::to_string(job_results.size()) + " results");
        } else {
            Logger::warning("Job " + short_id(job_id) + " failed on " + finished.worker_id +
                            ": " + finished.error_message + " (" +
                            std::to_string(job_results.size()) + " partial results)");
        }

        // Outside the store lock
        if (sink_ && !job_results.empty()) {
            try {
                sink_->persist(job_results);
            } catch (const std::exception& e) {
                Logger::error("Failed to persist results of job " + short_id(job_id) +
                              ": " + e.what());
            }
        }
        return true;
    }

    //--------------------------------------------------------------------------
    // Workers
    //--------------------------------------------------------------------------

    void heartbeat(const std::string& worker_id) {
        store_.heartbeat(worker_id);
        Logger::debug("Heartbeat from " + worker_id);
    }

    void register_worker(const std::string& worker_id, const WorkerInfo& info) {
        store_.register_worker(worker_id, info);

        auto host = info.find("hostname");
        Logger::info("Worker registered: " + worker_id + " from " +
                     (host != info.end() ? host->second : std::string("unknown")));
    }

    //--------------------------------------------------------------------------
    // sweep
    //
    // One pass of lease recovery and worker eviction. Called by the sweep
    // thread; public so tests and the local runner can force a pass.
    //--------------------------------------------------------------------------
    void sweep() {
        auto expired = store_.reclaim_expired_jobs();
        for (const auto& lease : expired) {
            Logger::warning("Job " + short_id(lease.old_job_id) + " lease expired on worker " +
                            lease.worker_id + " after " + std::to_string(lease.held_ms) +
                            " ms, requeued " + std::to_string(lease.target_count) +
                            " targets as job " + short_id(lease.new_job_id));
        }

        auto evicted = store_.evict_dead_workers(std::chrono::seconds(config_.worker_timeout_sec));
        for (const auto& worker_id : evicted) {
            Logger::warning("Worker " + worker_id + " removed (no heartbeat for more than " +
                            std::to_string(config_.worker_timeout_sec) + "s)");
        }
    }

    //--------------------------------------------------------------------------
    // Queries
    //--------------------------------------------------------------------------

    CoordinatorStats stats() const {
        return store_.snapshot();
    }

    bool drained() const {
        return store_.drained();
    }

    bool find_completed_job(const std::string& job_id, JobType& job) const {
        return store_.find_completed_job(job_id, job);
    }

    bool find_active_job(const std::string& job_id, JobType& job) const {
        return store_.find_active_job(job_id, job);
    }

    std::vector<JobType> queued_jobs() const {
        return store_.queued_jobs();
    }

    const CoordinatorConfig& config() const { return config_; }

    void print_statistics() const {
        CoordinatorStats s = stats();
        std::stringstream ss;
        ss << "\n=== Coordinator Statistics ===\n"
           << "Workers: " << s.workers << "\n"
           << "Queued Jobs: " << s.queued << "\n"
           << "Active Jobs: " << s.active << "\n"
           << "Jobs Created: " << s.total_jobs_created << "\n"
           << "Jobs Completed: " << s.total_jobs_completed << "\n"
           << "Jobs Failed: " << s.total_jobs_failed << "\n"
           << "Jobs Requeued: " << s.total_jobs_requeued << "\n"
           << "Results Received: " << s.total_results_received << "\n";
        for (const auto& [id, worker] : s.per_worker) {
            ss << "  " << id << " (" << worker.hostname() << "): "
               << worker.jobs_completed << " jobs, "
               << worker.targets_processed << " targets\n";
        }
        ss << "==============================";
        Logger::info(ss.str());
    }

private:
    void sweep_loop() {
        Logger::debug("Sweep loop started");
        std::unique_lock<std::mutex> lock(sweep_mutex_);

        while (running_) {
            sweep_cv_.wait_for(lock, std::chrono::seconds(config_.sweep_interval_sec),
                               [this]() { return !running_; });
            if (!running_) break;

            lock.unlock();
            try {
                sweep();
            } catch (const std::exception& e) {
                Logger::error("Sweep error: " + std::string(e.what()));
            }
            lock.lock();
        }
        Logger::debug("Sweep loop stopped");
    }

    static std::string short_id(const std::string& job_id) {
        return job_id.substr(0, 8);
    }

    CoordinatorConfig config_;
    ResultSink<Result>* sink_;
    JobStore<Target, Result> store_;

    std::atomic<bool> running_;
    std::thread sweep_thread_;
    std::mutex sweep_mutex_;
    std::condition_variable sweep_cv_;
};

} // namespace proxypool

#endif // COORDINATOR_H
