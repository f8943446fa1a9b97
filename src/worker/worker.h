/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: worker.h

    Description:
        The Worker pulls jobs from the coordinator, probes every target of a
        job with bounded concurrency and reports the results back. It talks
        to the coordinator only through a CoordinatorTransport, so the same
        class runs as a thread of the local validator or as the body of the
        networked proxypool_worker executable.

        Workers are autonomous agents that:
        - Register once on start()
        - Send periodic heartbeats to prove liveness
        - Lease one job at a time, probe it, submit the results
        - Give up after too many consecutive loop failures

    Thread Model:

        Main thread + 2 background threads + a per-job probe pool:
        - worker_thread_:    heartbeat -> lease -> probe -> submit loop
        - heartbeat_thread_: heartbeat every heartbeat_interval_sec, keeps
                             the worker alive while a long job is probing
        - probe pool:        min(max_concurrent, targets) threads created by
                             run_job() and joined before it returns

    Failure Handling:

        Per target:  probe() throwing becomes probe_failed(); one Result per
                     target no matter what happens to the probe.
        Per job:     only an exception escaping the pool machinery itself
                     fails the batch; the results gathered so far are
                     submitted with the error message.
        Per loop:    submit and heartbeat failures are logged and swallowed.
                     A lease failure (or anything else escaping one loop
                     iteration) increments consecutive_failures_; the loop
                     then sleeps poll_interval * 2^(n-1), capped at
                     max_backoff_ms. At max_consecutive_failures the worker
                     stops itself. Any clean iteration resets the counter.

    Example Usage:

        WorkerConfig config;
        config.max_concurrent = 20;

        HttpCoordinatorClient client("coord", 8000);
        ProxyProber prober(ProberConfig());
        Worker<ProxyRecord, ProbeResult> worker(config, client, prober);

        if (!worker.start()) return 1;
        while (worker.is_running()) sleep(1);
        worker.stop();
*******************************************************************************/

#ifndef WORKER_H
#define WORKER_H

#include "coordinator/job.h"
#include "transport/transport.h"
#include "worker/prober.h"
#include "common/id_generator.h"
#include "common/logger.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace proxypool {

//==============================================================================
// CONFIGURATION
//==============================================================================

struct WorkerConfig {
    // Generated as worker-<hostname>-<8 hex> when left empty
    std::string worker_id;

    // Probe pool size per job
    size_t max_concurrent;

    // Sleep after an empty lease, and the base of the failure backoff
    int poll_interval_ms;

    int heartbeat_interval_sec;

    // The worker stops itself after this many failed loop iterations in a row
    int max_consecutive_failures;

    int max_backoff_ms;

    // Sent with the registration; "hostname" is filled in if missing
    WorkerInfo worker_info;

    WorkerConfig() : max_concurrent(20),
                     poll_interval_ms(5000),
                     heartbeat_interval_sec(30),
                     max_consecutive_failures(5),
                     max_backoff_ms(60000) {}
};

inline std::string generate_worker_id() {
    return "worker-" + local_hostname() + "-" + short_hex_id(8);
}

// What run_job() hands to submit_result()
template <typename Result>
struct JobOutcome {
    std::vector<Result> results;
    std::string error_message;
};

//==============================================================================
// WORKER
//==============================================================================

template <typename Target, typename Result>
class Worker {
public:
    using JobType = Job<Target, Result>;

    Worker(const WorkerConfig& config,
           CoordinatorTransport<Target, Result>& transport,
           Prober<Target, Result>& prober)
        : config_(config),
          transport_(transport),
          prober_(prober),
          running_(false),
          terminated_(false),
          consecutive_failures_(0),
          jobs_processed_(0),
          targets_processed_(0) {
        if (config_.worker_id.empty()) {
            config_.worker_id = generate_worker_id();
        }
        if (config_.max_concurrent == 0) {
            config_.max_concurrent = 1;
        }
        if (config_.worker_info.find("hostname") == config_.worker_info.end()) {
            config_.worker_info["hostname"] = local_hostname();
        }
        config_.worker_info["max_concurrent"] = std::to_string(config_.max_concurrent);
    }

    ~Worker() {
        stop();
    }

    Worker(const Worker&) = delete;
    Worker& operator=(const Worker&) = delete;

    /* =========================================================================
       Function: start
       Purpose : Register with the coordinator and launch the worker and
                 heartbeat threads. Returns false when already running or when
                 the registration cannot be delivered.
       ========================================================================= */
    bool start() {
        if (running_) {
            Logger::warning("Worker " + config_.worker_id + " already running");
            return false;
        }

        // Threads of a previous run that stopped itself
        join_threads();

        Logger::info("Starting worker " + config_.worker_id);

        try {
            transport_.register_worker(config_.worker_id, config_.worker_info);
        } catch (const std::exception& e) {
            Logger::error("Failed to register worker " + config_.worker_id + ": " + e.what());
            return false;
        }

        running_ = true;
        terminated_ = false;
        consecutive_failures_ = 0;

        worker_thread_ = std::thread(&Worker::worker_loop, this);
        heartbeat_thread_ = std::thread(&Worker::heartbeat_loop, this);

        Logger::info("Worker " + config_.worker_id + " started (max_concurrent=" +
                     std::to_string(config_.max_concurrent) + ")");
        return true;
    }

    /* =========================================================================
       Function: stop
       Purpose : Signal both loops, wake any sleeping thread and join. A job
                 already being probed is finished and submitted first.
       ========================================================================= */
    void stop() {
        {
            std::lock_guard<std::mutex> lock(wait_mutex_);
            running_ = false;
        }
        wait_cv_.notify_all();

        if (join_threads()) {
            Logger::info("Worker " + config_.worker_id + " stopped (" +
                         std::to_string(jobs_processed_.load()) + " jobs, " +
                         std::to_string(targets_processed_.load()) + " targets)");
        }
    }

    bool is_running() const { return running_; }

    // True once the failure breaker has stopped the worker
    bool terminated() const { return terminated_; }

    const std::string& worker_id() const { return config_.worker_id; }

    int consecutive_failures() const { return consecutive_failures_; }
    uint64_t jobs_processed() const { return jobs_processed_; }
    uint64_t targets_processed() const { return targets_processed_; }

    //--------------------------------------------------------------------------
    // Protocol steps
    //--------------------------------------------------------------------------

    // Transport errors propagate to the caller
    bool request_job(JobType& job) {
        return transport_.lease_job(config_.worker_id, job);
    }

    /* =========================================================================
       Function: run_job
       Purpose : Probe every target of `job` on a pool of
                 min(max_concurrent, targets) threads. Result i belongs to
                 target i. A probe that throws is replaced by
                 prober.probe_failed(); if even that throws, the batch is
                 failed and only the results collected so far are returned.
       ========================================================================= */
    JobOutcome<Result> run_job(const JobType& job) {
        JobOutcome<Result> outcome;
        const std::vector<Target>& targets = job.targets;
        if (targets.empty()) {
            return outcome;
        }

        std::vector<std::optional<Result>> slots(targets.size());
        std::atomic<size_t> next_index(0);
        std::atomic<bool> aborted(false);
        std::mutex error_mutex;
        std::string batch_error;

        auto fail_batch = [&](const std::string& reason) {
            std::lock_guard<std::mutex> lock(error_mutex);
            if (batch_error.empty()) batch_error = reason;
            aborted = true;
        };

        auto probe_loop = [&]() {
            while (!aborted) {
                size_t index = next_index.fetch_add(1);
                if (index >= targets.size()) break;

                try {
                    try {
                        slots[index] = prober_.probe(targets[index]);
                    } catch (const std::exception& e) {
                        Logger::debug("Probe raised: " + std::string(e.what()));
                        slots[index] = prober_.probe_failed(targets[index], e.what());
                    }
                } catch (const std::exception& e) {
                    fail_batch(e.what());
                }
            }
        };

        size_t pool_size = std::min(config_.max_concurrent, targets.size());
        std::vector<std::thread> pool;
        pool.reserve(pool_size);

        try {
            for (size_t i = 0; i < pool_size; ++i) {
                pool.emplace_back(probe_loop);
            }
        } catch (const std::exception& e) {
            fail_batch(std::string("failed to start probe threads: ") + e.what());
        }

        for (auto& t : pool) {
            t.join();
        }

        outcome.results.reserve(targets.size());
        for (auto& slot : slots) {
            if (slot) outcome.results.push_back(std::move(*slot));
        }
        outcome.error_message = batch_error;
        return outcome;
    }

    // Delivery failures are logged and dropped; the lease will expire and
    // the targets will be retried under a new job
    void submit_result(const std::string& job_id,
                       const std::vector<Result>& results,
                       const std::string& error_message) {
        try {
            transport_.complete_job(job_id, results, error_message);
        } catch (const std::exception& e) {
            Logger::warning("Failed to submit results for job " + job_id.substr(0, 8) +
                            ": " + e.what());
        }
    }

    /* =========================================================================
       Function: process_next_job
       Purpose : One lease -> probe -> submit round. Returns false when the
                 coordinator had nothing to hand out. Lease failures throw.
       ========================================================================= */
    bool process_next_job() {
        JobType job;
        if (!request_job(job)) {
            return false;
        }

        Logger::info("Worker " + config_.worker_id + " processing job " +
                     job.job_id.substr(0, 8) + " with " +
                     std::to_string(job.targets.size()) + " targets");

        auto start = std::chrono::steady_clock::now();
        JobOutcome<Result> outcome = run_job(job);
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();

        if (outcome.error_message.empty()) {
            Logger::info("Job " + job.job_id.substr(0, 8) + " probed in " +
                         std::to_string(elapsed) + " ms (" +
                         std::to_string(outcome.results.size()) + " results)");
        } else {
            Logger::warning("Job " + job.job_id.substr(0, 8) + " failed after " +
                            std::to_string(outcome.results.size()) + " results: " +
                            outcome.error_message);
        }

        submit_result(job.job_id, outcome.results, outcome.error_message);

        jobs_processed_++;
        targets_processed_ += outcome.results.size();
        return true;
    }

    // Sleep after the n-th consecutive failure
    std::chrono::milliseconds backoff_delay(int failures) const {
        long long delay = config_.poll_interval_ms;
        for (int i = 1; i < failures && delay < config_.max_backoff_ms; ++i) {
            delay *= 2;
        }
        return std::chrono::milliseconds(std::min<long long>(delay, config_.max_backoff_ms));
    }

private:
    void worker_loop() {
        Logger::info("Worker loop started");

        while (running_) {
            try {
                send_heartbeat();

                bool processed = process_next_job();
                consecutive_failures_ = 0;

                if (!processed) {
                    wait_while_running(std::chrono::milliseconds(config_.poll_interval_ms));
                }
            } catch (const std::exception& e) {
                int failures = ++consecutive_failures_;
                Logger::warning("Worker loop error (" + std::to_string(failures) + "/" +
                                std::to_string(config_.max_consecutive_failures) + "): " +
                                e.what());

                if (failures >= config_.max_consecutive_failures) {
                    Logger::error("Worker " + config_.worker_id + " giving up after " +
                                  std::to_string(failures) + " consecutive failures");
                    terminated_ = true;
                    {
                        std::lock_guard<std::mutex> lock(wait_mutex_);
                        running_ = false;
                    }
                    wait_cv_.notify_all();
                    break;
                }

                wait_while_running(backoff_delay(failures));
            }
        }

        Logger::info("Worker loop stopped");
    }

    void heartbeat_loop() {
        while (wait_while_running(std::chrono::seconds(config_.heartbeat_interval_sec))) {
            send_heartbeat();
        }
    }

    void send_heartbeat() {
        try {
            transport_.heartbeat(config_.worker_id);
        } catch (const std::exception& e) {
            Logger::warning("Failed to send heartbeat: " + std::string(e.what()));
        }
    }

    // Returns false if the worker was stopped during the wait
    template <typename Duration>
    bool wait_while_running(Duration duration) {
        std::unique_lock<std::mutex> lock(wait_mutex_);
        wait_cv_.wait_for(lock, duration, [this]() { return !running_; });
        return running_;
    }

    bool join_threads() {
        bool joined = false;
        if (worker_thread_.joinable()) {
            worker_thread_.join();
            joined = true;
        }
        if (heartbeat_thread_.joinable()) {
            heartbeat_thread_.join();
            joined = true;
        }
        return joined;
    }

    WorkerConfig config_;
    CoordinatorTransport<Target, Result>& transport_;
    Prober<Target, Result>& prober_;

    std::atomic<bool> running_;
    std::atomic<bool> terminated_;
    std::atomic<int> consecutive_failures_;
    std::atomic<uint64_t> jobs_processed_;
    std::atomic<uint64_t> targets_processed_;

    std::thread worker_thread_;
    std::thread heartbeat_thread_;

    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;
};

} // namespace proxypool

#endif // WORKER_H
