/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: control_plane_server.cpp

    Description:
        Route handlers of the HTTP control plane.
*******************************************************************************/

#include "transport/control_plane_server.h"
#include "transport/wire_format.h"
#include "common/logger.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <stdexcept>

namespace proxypool {

using nlohmann::json;

namespace {

void reply_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(body.dump(), "application/json");
}

void reply_error(httplib::Response& res, int status, const std::string& message) {
    reply_json(res, status, json{{"status", "error"}, {"message", message}});
}

// Runs a handler body and maps exceptions to error replies
void guarded(const httplib::Request& req, httplib::Response& res,
             const std::function<void()>& body) {
    try {
        body();
    } catch (const WireFormatError& e) {
        Logger::warning("Bad request to " + req.path + ": " + e.what());
        reply_error(res, 400, e.what());
    } catch (const std::invalid_argument& e) {
        Logger::warning("Bad request to " + req.path + ": " + e.what());
        reply_error(res, 400, e.what());
    } catch (const json::exception& e) {
        Logger::warning("Bad request to " + req.path + ": " + e.what());
        reply_error(res, 400, e.what());
    } catch (const std::exception& e) {
        Logger::error("Error handling " + req.path + ": " + e.what());
        reply_error(res, 500, e.what());
    }
}

} // namespace

ControlPlaneServer::ControlPlaneServer(const ControlPlaneConfig& config,
                                       ValidationCoordinator& coordinator,
                                       ProxySource* source)
    : config_(config),
      coordinator_(coordinator),
      source_(source),
      server_(std::make_unique<httplib::Server>()),
      running_(false),
      bound_port_(0) {
    setup_routes();
}

ControlPlaneServer::~ControlPlaneServer() {
    stop();
}

/* =============================================================================
   Function: start
   Purpose : Bind the listening socket on the calling thread so bind errors
             are reported synchronously, then accept on a background thread.
   ============================================================================= */
bool ControlPlaneServer::start() {
    if (running_) {
        Logger::warning("Control plane already running");
        return false;
    }

    if (config_.port == 0) {
        bound_port_ = server_->bind_to_any_port(config_.host);
        if (bound_port_ <= 0) {
            Logger::error("Failed to bind control plane on " + config_.host);
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.host, config_.port)) {
            Logger::error("Failed to bind control plane on " + config_.host + ":" +
                          std::to_string(config_.port));
            return false;
        }
        bound_port_ = config_.port;
    }

    running_ = true;
    listen_thread_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            Logger::error("Control plane listener exited with an error");
        }
    });

    // stop() is a no-op until the listener loop is up
    for (int i = 0; i < 500 && !server_->is_running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    Logger::info("Control plane listening on http://" + config_.host + ":" +
                 std::to_string(bound_port_));
    return true;
}

void ControlPlaneServer::stop() {
    if (!running_) return;

    running_ = false;
    server_->stop();
    if (listen_thread_.joinable()) {
        listen_thread_.join();
    }
    Logger::info("Control plane stopped");
}

int ControlPlaneServer::submit_validation(const ProxyFilter& filter, size_t limit) {
    if (!source_) {
        throw std::runtime_error("no proxy source configured");
    }
    std::vector<ProxyRecord> proxies = source_->fetch(filter, limit);
    if (proxies.empty()) {
        Logger::info("No proxies found matching the filter criteria");
        return 0;
    }

    std::vector<std::string> ids = coordinator_.create_jobs(proxies);
    return static_cast<int>(ids.size());
}

//==============================================================================
// ROUTES
//==============================================================================

void ControlPlaneServer::setup_routes() {
    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        reply_json(res, 200, json{{"status", "healthy"},
                                  {"timestamp", format_iso8601(system_now())}});
    });

    server_->Post("/register_worker", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&]() {
            json body = parse_json_body(req.body);
            std::string worker_id = body.value("worker_id", "");
            if (worker_id.empty()) {
                throw WireFormatError("worker_id is required");
            }

            WorkerInfo info;
            if (body.contains("worker_info")) {
                info = worker_info_from_json(body["worker_info"]);
            }

            coordinator_.register_worker(worker_id, info);
            reply_json(res, 200, json{{"status", "registered"}, {"worker_id", worker_id}});
        });
    });

    server_->Get(R"(/get_job/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&]() {
            std::string worker_id = req.matches[1].str();

            ValidationJob job;
            if (!coordinator_.lease_next_job(worker_id, job)) {
                res.status = 204;
                return;
            }
            reply_json(res, 200, job_to_json(job));
        });
    });

    server_->Post("/complete_job", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&]() {
            auto completion = completion_from_json<ProbeResult>(parse_json_body(req.body));
            coordinator_.complete_job(completion.job_id,
                                      std::move(completion.results),
                                      completion.error_message);
            reply_json(res, 200, json{{"status", "completed"}});
        });
    });

    server_->Post(R"(/heartbeat/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&]() {
            coordinator_.heartbeat(req.matches[1].str());
            reply_json(res, 200, json{{"status", "acknowledged"}});
        });
    });

    server_->Get("/stats", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&]() {
            reply_json(res, 200, stats_to_json(coordinator_.stats()));
        });
    });

    server_->Post("/submit_validation_job", [this](const httplib::Request& req, httplib::Response& res) {
        guarded(req, res, [&]() {
            if (!source_) {
                reply_error(res, 503, "no proxy source configured");
                return;
            }

            json body = req.body.empty() ? json::object() : parse_json_body(req.body);

            ProxyFilter filter;
            if (body.contains("proxy_filter") && !body["proxy_filter"].is_null()) {
                filter = body["proxy_filter"].get<ProxyFilter>();
            } else if (body.contains("filter") && !body["filter"].is_null()) {
                filter = body["filter"].get<ProxyFilter>();
            }

            size_t limit = 0;
            if (body.contains("limit") && !body["limit"].is_null()) {
                long long requested = body["limit"].get<long long>();
                if (requested < 0) {
                    throw std::invalid_argument("limit must not be negative");
                }
                limit = static_cast<size_t>(requested);
            }

            int jobs_created = submit_validation(filter, limit);
            reply_json(res, 200, json{{"status", "submitted"},
                                      {"jobs_created", jobs_created},
                                      {"message", "Created " + std::to_string(jobs_created) +
                                                  " validation jobs"}});
        });
    });
}

} // namespace proxypool
