/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: local_validator.h

    Description:
        Single-process validation run: one Coordinator, num_workers Workers
        on the in-process transport, one run over whatever the proxy source
        returns.

        run():
            1. fetch targets from the source
            2. create jobs (batch_size each), start the sweep
            3. start the workers, each with its own prober
            4. wait until queue and active table are both empty
            5. stop workers and coordinator, report the summary

        The coordinator's lease ceiling is num_workers, so each worker holds
        at most one job at a time.
*******************************************************************************/

#ifndef LOCAL_VALIDATOR_H
#define LOCAL_VALIDATOR_H

#include "coordinator/result_sink.h"
#include "proxy/proxy_prober.h"
#include "proxy/proxy_source.h"
#include "proxy/proxy_types.h"
#include "worker/prober.h"

#include <functional>
#include <memory>
#include <string>

namespace proxypool {

struct LocalValidatorConfig {
    size_t num_workers;
    size_t batch_size;

    // Probe pool size of each worker
    size_t max_concurrent;

    int poll_interval_ms;
    int job_timeout_sec;
    int sweep_interval_sec;

    // Template for the default per-worker ProxyProber
    ProberConfig prober;

    LocalValidatorConfig() : num_workers(4),
                             batch_size(50),
                             max_concurrent(20),
                             poll_interval_ms(1000),
                             job_timeout_sec(300),
                             sweep_interval_sec(30) {}
};

struct ValidationSummary {
    size_t tested;
    size_t working;
    size_t jobs;
    size_t workers;
    double duration_sec;

    ValidationSummary() : tested(0), working(0), jobs(0), workers(0), duration_sec(0.0) {}
};

using ProberFactory =
    std::function<std::unique_ptr<Prober<ProxyRecord, ProbeResult>>(const std::string& worker_id)>;

class LocalValidator {
public:
    // `sink` may be null; results are then only counted
    LocalValidator(const LocalValidatorConfig& config,
                   ProxySource& source,
                   ResultSink<ProbeResult>* sink);

    // Replaces the default ProxyProber (tests)
    void set_prober_factory(ProberFactory factory);

    ValidationSummary run(const ProxyFilter& filter = ProxyFilter(), size_t limit = 0);

private:
    LocalValidatorConfig config_;
    ProxySource& source_;
    ResultSink<ProbeResult>* sink_;
    ProberFactory prober_factory_;
};

} // namespace proxypool

#endif // LOCAL_VALIDATOR_H
