/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: http_transport.cpp

    Description:
        HttpCoordinatorClient implementation on top of cpp-httplib.
*******************************************************************************/

#include "transport/http_transport.h"
#include "transport/wire_format.h"

#include <httplib.h>

namespace proxypool {

using nlohmann::json;

namespace {

void apply_timeouts(httplib::Client& client, int timeout_sec) {
    client.set_connection_timeout(timeout_sec, 0);
    client.set_read_timeout(timeout_sec, 0);
    client.set_write_timeout(timeout_sec, 0);
}

std::string describe_failure(const std::string& request, const httplib::Result& res) {
    if (!res) {
        return request + ": " + httplib::to_string(res.error());
    }
    std::string body = res->body.size() > 200 ? res->body.substr(0, 200) + "..." : res->body;
    return request + ": HTTP " + std::to_string(res->status) + " " + body;
}

} // namespace

HttpCoordinatorClient::HttpCoordinatorClient(const std::string& host, int port, int timeout_sec)
    : host_(host), port_(port), timeout_sec_(timeout_sec) {
}

std::string HttpCoordinatorClient::base_url() const {
    return "http://" + host_ + ":" + std::to_string(port_);
}

//------------------------------------------------------------------------------
// Coordinator contract
//------------------------------------------------------------------------------

void HttpCoordinatorClient::register_worker(const std::string& worker_id, const WorkerInfo& info) {
    json body;
    body["worker_id"] = worker_id;
    body["worker_info"] = info;
    post_json("/register_worker", body);
}

void HttpCoordinatorClient::heartbeat(const std::string& worker_id) {
    post_json("/heartbeat/" + worker_id, json::object());
}

bool HttpCoordinatorClient::lease_job(const std::string& worker_id, ValidationJob& job) {
    std::string path = "/get_job/" + worker_id;
    httplib::Client client(host_, port_);
    apply_timeouts(client, timeout_sec_);
    auto res = client.Get(path);

    if (res && res->status == 204) {
        return false;
    }
    if (!res || res->status != 200) {
        throw TransportError(describe_failure("GET " + path, res));
    }

    job = job_from_json<ProxyRecord, ProbeResult>(parse_json_body(res->body));
    return true;
}

void HttpCoordinatorClient::complete_job(const std::string& job_id,
                                         const std::vector<ProbeResult>& results,
                                         const std::string& error_message) {
    post_json("/complete_job", completion_to_json(job_id, results, error_message));
}

//------------------------------------------------------------------------------
// Operator calls
//------------------------------------------------------------------------------

json HttpCoordinatorClient::health() {
    return get_json("/health");
}

json HttpCoordinatorClient::fetch_stats() {
    return get_json("/stats");
}

int HttpCoordinatorClient::submit_validation(const ProxyFilter& filter, size_t limit) {
    json body;
    body["proxy_filter"] = filter;
    if (limit > 0) {
        body["limit"] = limit;
    }

    json reply = post_json("/submit_validation_job", body);
    try {
        return reply.at("jobs_created").get<int>();
    } catch (const json::exception& e) {
        throw WireFormatError(std::string("bad submit reply: ") + e.what());
    }
}

//------------------------------------------------------------------------------
// Helpers
//------------------------------------------------------------------------------

json HttpCoordinatorClient::get_json(const std::string& path) {
    httplib::Client client(host_, port_);
    apply_timeouts(client, timeout_sec_);
    auto res = client.Get(path);
    if (!res || res->status != 200) {
        throw TransportError(describe_failure("GET " + path, res));
    }
    return parse_json_body(res->body);
}

json HttpCoordinatorClient::post_json(const std::string& path, const json& body) {
    httplib::Client client(host_, port_);
    apply_timeouts(client, timeout_sec_);
    auto res = client.Post(path, body.dump(), "application/json");
    if (!res || res->status != 200) {
        throw TransportError(describe_failure("POST " + path, res));
    }
    if (res->body.empty()) {
        return json::object();
    }
    return parse_json_body(res->body);
}

} // namespace proxypool
