/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: http_transport.h

    Description:
        Networked binding of the coordinator contract: the client side used
        by proxypool_worker and proxypool_submit. Every call opens its own
        httplib::Client, so one HttpCoordinatorClient can be shared by the
        worker loop and the heartbeat thread.

    Status Handling:
        200             success, body decoded where there is one
        204             lease_job(): no job available, returns false
        anything else   TransportError("<METHOD> <path>: HTTP <code> ...")
        no response     TransportError with the httplib error name
*******************************************************************************/

#ifndef HTTP_TRANSPORT_H
#define HTTP_TRANSPORT_H

#include "proxy/proxy_types.h"
#include "transport/transport.h"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace proxypool {

class HttpCoordinatorClient : public CoordinatorTransport<ProxyRecord, ProbeResult> {
public:
    HttpCoordinatorClient(const std::string& host, int port, int timeout_sec = 30);

    void register_worker(const std::string& worker_id, const WorkerInfo& info) override;

    void heartbeat(const std::string& worker_id) override;

    bool lease_job(const std::string& worker_id, ValidationJob& job) override;

    void complete_job(const std::string& job_id,
                      const std::vector<ProbeResult>& results,
                      const std::string& error_message) override;

    nlohmann::json health();

    nlohmann::json fetch_stats();

    // Asks the coordinator to fetch matching proxies and queue them;
    // returns the number of jobs it created
    int submit_validation(const ProxyFilter& filter, size_t limit);

    std::string base_url() const;

private:
    nlohmann::json get_json(const std::string& path);
    nlohmann::json post_json(const std::string& path, const nlohmann::json& body);

    std::string host_;
    int port_;
    int timeout_sec_;
};

} // namespace proxypool

#endif // HTTP_TRANSPORT_H
