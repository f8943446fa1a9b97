/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: local_validator.cpp

    Description:
        LocalValidator implementation.
*******************************************************************************/

#include "local/local_validator.h"
#include "coordinator/coordinator.h"
#include "transport/local_transport.h"
#include "worker/worker.h"
#include "common/logger.h"

#include <atomic>
#include <chrono>
#include <iomanip>
#include <memory>
#include <sstream>
#include <thread>
#include <vector>

namespace proxypool {

namespace {

// Counts what flows to the real sink
class CountingSink : public ResultSink<ProbeResult> {
public:
    explicit CountingSink(ResultSink<ProbeResult>* inner)
        : inner_(inner), tested_(0), working_(0) {}

    void persist(const std::vector<ProbeResult>& results) override {
        size_t working = 0;
        for (const auto& result : results) {
            if (result.is_working) working++;
        }
        tested_ += results.size();
        working_ += working;

        if (inner_) {
            inner_->persist(results);
        }
    }

    size_t tested() const { return tested_; }
    size_t working() const { return working_; }

private:
    ResultSink<ProbeResult>* inner_;
    std::atomic<size_t> tested_;
    std::atomic<size_t> working_;
};

} // namespace

LocalValidator::LocalValidator(const LocalValidatorConfig& config,
                               ProxySource& source,
                               ResultSink<ProbeResult>* sink)
    : config_(config), source_(source), sink_(sink) {
    if (config_.num_workers == 0) {
        config_.num_workers = 1;
    }

    ProberConfig prober_template = config_.prober;
    prober_factory_ = [prober_template](const std::string& worker_id) {
        ProberConfig prober_config = prober_template;
        prober_config.worker_id = worker_id;
        return std::unique_ptr<Prober<ProxyRecord, ProbeResult>>(
            std::make_unique<ProxyProber>(prober_config));
    };
}

void LocalValidator::set_prober_factory(ProberFactory factory) {
    prober_factory_ = std::move(factory);
}

/* =============================================================================
   Function: run
   Purpose : One complete validation pass; returns when every job created for
             the fetched targets has been completed, or when every worker has
             given up.
   ============================================================================= */
ValidationSummary LocalValidator::run(const ProxyFilter& filter, size_t limit) {
    auto start = std::chrono::steady_clock::now();
    ValidationSummary summary;

    std::vector<ProxyRecord> targets = source_.fetch(filter, limit);
    if (targets.empty()) {
        Logger::info("No proxies to validate");
        return summary;
    }

    Logger::info("Starting local validation of " + std::to_string(targets.size()) +
                 " proxies with " + std::to_string(config_.num_workers) + " workers");

    CountingSink counting(sink_);

    CoordinatorConfig coordinator_config;
    coordinator_config.batch_size = config_.batch_size;
    coordinator_config.max_concurrent_jobs = config_.num_workers;
    coordinator_config.job_timeout_sec = config_.job_timeout_sec;
    coordinator_config.sweep_interval_sec = config_.sweep_interval_sec;

    Coordinator<ProxyRecord, ProbeResult> coordinator(coordinator_config, &counting);
    summary.jobs = coordinator.create_jobs(targets).size();
    coordinator.start();

    LocalTransport<ProxyRecord, ProbeResult> transport(coordinator);

    std::vector<std::unique_ptr<Prober<ProxyRecord, ProbeResult>>> probers;
    std::vector<std::unique_ptr<Worker<ProxyRecord, ProbeResult>>> workers;

    for (size_t i = 0; i < config_.num_workers; ++i) {
        WorkerConfig worker_config;
        worker_config.worker_id = "local-worker-" + std::to_string(i + 1);
        worker_config.max_concurrent = config_.max_concurrent;
        worker_config.poll_interval_ms = config_.poll_interval_ms;
        worker_config.worker_info["mode"] = "local";

        probers.push_back(prober_factory_(worker_config.worker_id));
        workers.push_back(std::make_unique<Worker<ProxyRecord, ProbeResult>>(
            worker_config, transport, *probers.back()));

        if (workers.back()->start()) {
            summary.workers++;
        }
    }

    while (!coordinator.drained()) {
        bool any_running = false;
        for (const auto& worker : workers) {
            if (worker->is_running()) any_running = true;
        }
        if (!any_running) {
            Logger::error("All workers stopped before the queue drained");
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    for (auto& worker : workers) {
        worker->stop();
    }
    coordinator.stop();
    coordinator.print_statistics();

    summary.tested = counting.tested();
    summary.working = counting.working();
    summary.duration_sec = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - start).count();

    std::stringstream ss;
    ss << "Local validation finished: " << summary.working << "/" << summary.tested
       << " working, " << summary.jobs << " jobs in "
       << std::fixed << std::setprecision(2) << summary.duration_sec << "s";
    Logger::info(ss.str());
    return summary;
}

} // namespace proxypool
