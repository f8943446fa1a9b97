/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: transport.h

    Description:
        The request/response contract between a Worker and the Coordinator.
        A Worker only ever talks to a CoordinatorTransport; which binding
        sits behind it decides whether the coordinator lives in the same
        process (LocalTransport) or behind the HTTP control plane
        (HttpCoordinatorClient).

        Operation          Local binding               HTTP binding
        ---------          -------------               ------------
        register_worker    Coordinator::register_...   POST /register_worker
        heartbeat          Coordinator::heartbeat      POST /heartbeat/{id}
        lease_job          Coordinator::lease_next_... GET  /get_job/{id}
        complete_job       Coordinator::complete_job   POST /complete_job

    Error Contract:
        lease_job() returning false means "no job right now" and is not an
        error. A binding that cannot reach the coordinator throws
        TransportError; the Worker decides which failures to swallow.
*******************************************************************************/

#ifndef TRANSPORT_H
#define TRANSPORT_H

#include "coordinator/job.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace proxypool {

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& what) : std::runtime_error(what) {}
};

template <typename Target, typename Result>
class CoordinatorTransport {
public:
    using JobType = Job<Target, Result>;

    virtual ~CoordinatorTransport() = default;

    virtual void register_worker(const std::string& worker_id, const WorkerInfo& info) = 0;

    virtual void heartbeat(const std::string& worker_id) = 0;

    // Fills `job` and returns true when a lease was granted
    virtual bool lease_job(const std::string& worker_id, JobType& job) = 0;

    virtual void complete_job(const std::string& job_id,
                              const std::vector<Result>& results,
                              const std::string& error_message) = 0;
};

} // namespace proxypool

#endif // TRANSPORT_H
