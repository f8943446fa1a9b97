/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: local_transport.h

    Description:
        In-process binding: every call goes straight into a Coordinator that
        lives in the same address space. Workers using it are plain threads
        sharing the job store mutex with each other and with the sweep.

        The transport does not own the coordinator; the coordinator must
        outlive every worker holding a LocalTransport to it.
*******************************************************************************/

#ifndef LOCAL_TRANSPORT_H
#define LOCAL_TRANSPORT_H

#include "coordinator/coordinator.h"
#include "transport/transport.h"

namespace proxypool {

template <typename Target, typename Result>
class LocalTransport : public CoordinatorTransport<Target, Result> {
public:
    using JobType = Job<Target, Result>;

    explicit LocalTransport(Coordinator<Target, Result>& coordinator)
        : coordinator_(coordinator) {}

    void register_worker(const std::string& worker_id, const WorkerInfo& info) override {
        coordinator_.register_worker(worker_id, info);
    }

    void heartbeat(const std::string& worker_id) override {
        coordinator_.heartbeat(worker_id);
    }

    bool lease_job(const std::string& worker_id, JobType& job) override {
        return coordinator_.lease_next_job(worker_id, job);
    }

    void complete_job(const std::string& job_id,
                      const std::vector<Result>& results,
                      const std::string& error_message) override {
        coordinator_.complete_job(job_id, results, error_message);
    }

private:
    Coordinator<Target, Result>& coordinator_;
};

} // namespace proxypool

#endif // LOCAL_TRANSPORT_H
