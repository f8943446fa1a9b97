/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: control_plane_server.h

    Description:
        HTTP front end of a Coordinator. Each route is a thin adapter: decode
        the request, make one Coordinator call, encode the reply. The server
        runs its own listener thread; cpp-httplib dispatches requests on its
        worker pool, so handlers run concurrently and rely on the
        coordinator's locking.

    Routes:

        GET  /health                  {"status": "healthy", "timestamp"}
        POST /register_worker         {"status": "registered", "worker_id"}
        GET  /get_job/{worker_id}     200 job JSON | 204 no job
        POST /complete_job            {"status": "completed"}
        POST /heartbeat/{worker_id}   {"status": "acknowledged"}
        GET  /stats                   see wire_format.h
        POST /submit_validation_job   {"status": "submitted", "jobs_created",
                                       "message"}

    Errors:
        malformed body / bad filter   400 {"status": "error", "message"}
        no proxy source configured    503 {"status": "error", "message"}
        anything else thrown          500 {"status": "error", "message"}
*******************************************************************************/

#ifndef CONTROL_PLANE_SERVER_H
#define CONTROL_PLANE_SERVER_H

#include "coordinator/coordinator.h"
#include "proxy/proxy_source.h"
#include "proxy/proxy_types.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

namespace httplib {
class Server;
}

namespace proxypool {

struct ControlPlaneConfig {
    std::string host;

    // 0 binds an ephemeral port; see ControlPlaneServer::port()
    int port;

    ControlPlaneConfig() : host("0.0.0.0"), port(8000) {}
};

using ValidationCoordinator = Coordinator<ProxyRecord, ProbeResult>;

class ControlPlaneServer {
public:
    // `source` may be null; /submit_validation_job then answers 503
    ControlPlaneServer(const ControlPlaneConfig& config,
                       ValidationCoordinator& coordinator,
                       ProxySource* source = nullptr);
    ~ControlPlaneServer();

    ControlPlaneServer(const ControlPlaneServer&) = delete;
    ControlPlaneServer& operator=(const ControlPlaneServer&) = delete;

    // Binds and starts the listener thread; false if the bind fails
    bool start();
    void stop();

    bool is_running() const { return running_; }

    // Bound port once started
    int port() const { return bound_port_; }

    // Fetches matching proxies and queues them as jobs
    int submit_validation(const ProxyFilter& filter, size_t limit);

private:
    void setup_routes();

    ControlPlaneConfig config_;
    ValidationCoordinator& coordinator_;
    ProxySource* source_;

    std::unique_ptr<httplib::Server> server_;
    std::thread listen_thread_;
    std::atomic<bool> running_;
    int bound_port_;
};

} // namespace proxypool

#endif // CONTROL_PLANE_SERVER_H
