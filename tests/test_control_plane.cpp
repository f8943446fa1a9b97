/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: test_control_plane.cpp

    Description:
        Integration tests for the HTTP control plane: ControlPlaneServer on
        an ephemeral loopback port, driven by HttpCoordinatorClient, a raw
        cpp-httplib client for malformed requests, and finally a Worker
        running over HTTP until the queue drains.

    Expected Output:
        Test 1: Health check... PASSED
        Test 2: Registration, heartbeat and stats... PASSED
        Test 3: Empty queue answers 204... PASSED
        Test 4: Submit, lease and complete over HTTP... PASSED
        Test 5: Malformed requests answer 400... PASSED
        Test 6: Submission without a proxy source... PASSED
        Test 7: Worker drains the queue over HTTP... PASSED
*******************************************************************************/

#include "transport/control_plane_server.h"
#include "transport/http_transport.h"
#include "worker/worker.h"
#include "common/logger.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cassert>
#include <chrono>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace proxypool;
using nlohmann::json;

class MemorySource : public ProxySource {
public:
    explicit MemorySource(int count) {
        for (int i = 1; i <= count; ++i) {
            ProxyRecord proxy;
            proxy.id = i;
            proxy.ip = "192.0.2." + std::to_string(i);
            proxy.port = 3128;
            proxy.type = "http";
            proxy.country = i % 2 ? "FR" : "JP";
            proxies_.push_back(proxy);
        }
    }

    std::vector<ProxyRecord> fetch(const ProxyFilter& filter, size_t limit) override {
        std::vector<ProxyRecord> out;
        for (const auto& proxy : proxies_) {
            if (!filter.matches(proxy, system_now())) continue;
            out.push_back(proxy);
            if (limit > 0 && out.size() == limit) break;
        }
        return out;
    }

private:
    std::vector<ProxyRecord> proxies_;
};

class RecordingSink : public ResultSink<ProbeResult> {
public:
    void persist(const std::vector<ProbeResult>& results) override {
        std::lock_guard<std::mutex> lock(mutex_);
        received_.insert(received_.end(), results.begin(), results.end());
    }

    std::vector<ProbeResult> received() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return received_;
    }

private:
    mutable std::mutex mutex_;
    std::vector<ProbeResult> received_;
};

class EchoProber : public Prober<ProxyRecord, ProbeResult> {
public:
    ProbeResult probe(const ProxyRecord& proxy) override {
        ProbeResult result;
        result.proxy_id = proxy.id;
        result.ip = proxy.ip;
        result.port = proxy.port;
        result.type = proxy.type;
        result.is_working = true;
        result.response_time_ms = 1.0;
        result.check_method = "scripted";
        return result;
    }

    ProbeResult probe_failed(const ProxyRecord& proxy, const std::string& reason) override {
        ProbeResult result;
        result.proxy_id = proxy.id;
        result.error_kind = ProbeErrorKind::NETWORK_ERROR;
        result.error_message = reason;
        return result;
    }
};

static ControlPlaneConfig loopback() {
    ControlPlaneConfig config;
    config.host = "127.0.0.1";
    config.port = 0;
    return config;
}

static ProbeResult result_for(const ProxyRecord& proxy) {
    ProbeResult result;
    result.proxy_id = proxy.id;
    result.ip = proxy.ip;
    result.port = proxy.port;
    result.type = proxy.type;
    result.is_working = proxy.id % 2 == 0;
    result.worker_id = "http-worker";
    return result;
}

int main() {
    Logger::set_level(LogLevel::WARNING);
    Logger::info("Running control plane tests...");

    int passed = 0;
    int failed = 0;

    MemorySource source(7);
    RecordingSink sink;
    CoordinatorConfig coordinator_config;
    coordinator_config.batch_size = 3;
    ValidationCoordinator coordinator(coordinator_config, &sink);
    ControlPlaneServer server(loopback(), coordinator, &source);

    if (!coordinator.start() || !server.start()) {
        std::cout << "Cannot start the control plane on loopback\n";
        return 1;
    }
    HttpCoordinatorClient client("127.0.0.1", server.port(), 5);

    {
        std::cout << "Test 1: Health check... ";
        try {
            json health = client.health();
            assert(health["status"] == "healthy");
            assert(health["timestamp"].is_string());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Registration, heartbeat and stats... ";
        try {
            WorkerInfo info;
            info["hostname"] = "edge-7";
            info["max_concurrent"] = "20";
            client.register_worker("edge-worker", info);
            client.heartbeat("edge-worker");

            json stats = client.fetch_stats();
            assert(stats["worker_count"] == 1);
            assert(stats["queue_size"] == 0);
            assert(stats["active_jobs"] == 0);
            assert(stats["workers"]["edge-worker"]["hostname"] == "edge-7");
            assert(stats["workers"]["edge-worker"]["jobs_completed"] == 0);
            assert(stats["server_stats"]["total_jobs_created"] == 0);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Empty queue answers 204... ";
        try {
            ValidationJob job;
            assert(!client.lease_job("edge-worker", job));

            httplib::Client raw("127.0.0.1", server.port());
            auto res = raw.Get("/get_job/edge-worker");
            assert(res);
            assert(res->status == 204);
            assert(res->body.empty());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Submit, lease and complete over HTTP... ";
        try {
            ProxyFilter filter;
            filter.country = "FR";
            int created = client.submit_validation(filter, 0);
            // Ids 1, 3, 5, 7 in batches of 3
            assert(created == 2);

            ValidationJob first;
            assert(client.lease_job("edge-worker", first));
            assert(first.status == JobStatus::IN_PROGRESS);
            assert(first.worker_id == "edge-worker");
            assert(first.targets.size() == 3);
            assert(first.targets[0].id == 1);
            assert(first.targets[2].id == 5);
            assert(first.started_at);

            std::vector<ProbeResult> results;
            for (const auto& proxy : first.targets) results.push_back(result_for(proxy));
            client.complete_job(first.job_id, results, "");

            // Duplicate completion is accepted and ignored
            client.complete_job(first.job_id, results, "");

            ValidationJob second;
            assert(client.lease_job("edge-worker", second));
            assert(second.targets.size() == 1);
            client.complete_job(second.job_id, {}, "proxy list unreachable");

            json stats = client.fetch_stats();
            assert(stats["queue_size"] == 0);
            assert(stats["active_jobs"] == 0);
            assert(stats["server_stats"]["total_jobs_created"] == 2);
            assert(stats["server_stats"]["total_jobs_completed"] == 1);
            assert(stats["server_stats"]["total_jobs_failed"] == 1);
            assert(stats["server_stats"]["total_results_received"] == 3);
            assert(stats["workers"]["edge-worker"]["targets_processed"] == 3);

            auto received = sink.received();
            assert(received.size() == 3);
            assert(received[0].proxy_id == 1);
            assert(received[0].worker_id == "http-worker");

            ValidationJob finished;
            assert(coordinator.find_completed_job(second.job_id, finished));
            assert(finished.status == JobStatus::FAILED);
            assert(finished.error_message == "proxy list unreachable");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Malformed requests answer 400... ";
        try {
            httplib::Client raw("127.0.0.1", server.port());

            auto not_json = raw.Post("/complete_job", "{oops", "application/json");
            assert(not_json && not_json->status == 400);
            json error = json::parse(not_json->body);
            assert(error["status"] == "error");
            assert(error["message"].is_string());

            auto no_id = raw.Post("/complete_job", R"({"results": []})", "application/json");
            assert(no_id && no_id->status == 400);

            auto no_worker = raw.Post("/register_worker", R"({"worker_info": {}})",
                                      "application/json");
            assert(no_worker && no_worker->status == 400);

            auto bad_filter = raw.Post("/submit_validation_job",
                                       R"({"proxy_filter": {"older_than_minutes": -1}})",
                                       "application/json");
            assert(bad_filter && bad_filter->status == 400);

            // Unknown job ids are not an error on the wire
            auto unknown = raw.Post("/complete_job", R"({"job_id": "nope", "results": []})",
                                    "application/json");
            assert(unknown && unknown->status == 200);
            assert(json::parse(unknown->body)["status"] == "completed");

            // Empty body submits everything
            auto everything = raw.Post("/submit_validation_job", "", "application/json");
            assert(everything && everything->status == 200);
            json submitted = json::parse(everything->body);
            assert(submitted["status"] == "submitted");
            assert(submitted["jobs_created"] == 3);
            assert(submitted["message"] == "Created 3 validation jobs");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: Submission without a proxy source... ";
        try {
            ValidationCoordinator bare(coordinator_config);
            ControlPlaneServer sourceless(loopback(), bare);
            assert(sourceless.start());

            HttpCoordinatorClient other("127.0.0.1", sourceless.port(), 5);
            bool rejected = false;
            try {
                other.submit_validation(ProxyFilter(), 0);
            } catch (const TransportError& e) {
                rejected = std::string(e.what()).find("503") != std::string::npos;
            }
            sourceless.stop();
            assert(rejected);

            // Nothing listens there any more
            bool unreachable = false;
            try {
                other.health();
            } catch (const TransportError&) {
                unreachable = true;
            }
            assert(unreachable);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: Worker drains the queue over HTTP... ";
        try {
            // Test 5 left 7 proxies queued in 3 jobs
            assert(coordinator.stats().queued == 3);
            size_t before = sink.received().size();

            HttpCoordinatorClient worker_client("127.0.0.1", server.port(), 5);
            EchoProber prober;
            WorkerConfig config;
            config.worker_id = "http-worker-1";
            config.poll_interval_ms = 50;
            config.max_concurrent = 2;
            Worker<ProxyRecord, ProbeResult> worker(config, worker_client, prober);

            assert(worker.start());
            for (int i = 0; i < 500 && !coordinator.drained(); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            worker.stop();

            assert(coordinator.drained());
            assert(worker.jobs_processed() == 3);
            assert(sink.received().size() == before + 7);

            json stats = client.fetch_stats();
            assert(stats["workers"]["http-worker-1"]["jobs_completed"] == 3);
            assert(stats["workers"]["http-worker-1"]["hostname"].is_string());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    server.stop();
    coordinator.stop();

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
