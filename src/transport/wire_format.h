/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: wire_format.h

    Description:
        JSON encoding of everything that crosses the HTTP control plane.

    Message Formats:

        Job (GET /get_job/{worker_id} response body):
            {
              "job_id": "0f8fad5b-d9cb-469f-a165-70867728950e",
              "proxies": [ <Target JSON>, ... ],
              "status": "in_progress",
              "worker_id": "worker-host-1a2b3c4d",
              "created_at": "2025-01-01T00:00:00.000Z",
              "started_at": "2025-01-01T00:00:05.000Z",
              "completed_at": null,
              "results": null,
              "error_message": null,
              "timeout_seconds": 300
            }

        Completion (POST /complete_job request body):
            {"job_id": "...", "results": [ <Result JSON>, ... ],
             "error_message": "..." }          error_message optional

        Registration (POST /register_worker request body):
            {"worker_id": "...", "worker_info": {"hostname": "...", ...}}

        Statistics (GET /stats response body):
            {
              "server_stats": {"total_jobs_created": 3, ...,
                               "server_start_time": "...Z"},
              "worker_count": 1, "queue_size": 0, "active_jobs": 1,
              "workers": {"worker-a": {"last_seen": "...Z",
                                       "jobs_completed": 2,
                                       "targets_processed": 100,
                                       "hostname": "node1"}}
            }

    Error Handling:
        Every decoder throws WireFormatError for a payload that is not JSON,
        lacks a required key or carries a value of the wrong type.
*******************************************************************************/

#ifndef WIRE_FORMAT_H
#define WIRE_FORMAT_H

#include "coordinator/job.h"
#include "common/time_utils.h"

#include <nlohmann/json.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace proxypool {

class WireFormatError : public std::runtime_error {
public:
    explicit WireFormatError(const std::string& what) : std::runtime_error(what) {}
};

//==============================================================================
// GENERIC HELPERS (non-template, wire_format.cpp)
//==============================================================================

// Throws WireFormatError on a parse failure
nlohmann::json parse_json_body(const std::string& body);

nlohmann::json stats_to_json(const CoordinatorStats& stats);

// Non-string values are stored in their JSON text form
WorkerInfo worker_info_from_json(const nlohmann::json& j);

nlohmann::json time_or_null(const std::optional<TimePoint>& tp);

std::optional<TimePoint> time_from_field(const nlohmann::json& j, const char* key);

//==============================================================================
// JOB
//==============================================================================

template <typename Target, typename Result>
nlohmann::json job_to_json(const Job<Target, Result>& job) {
    nlohmann::json j;
    j["job_id"] = job.job_id;
    j["proxies"] = job.targets;
    j["status"] = job_status_to_string(job.status);
    j["worker_id"] = job.worker_id.empty() ? nlohmann::json(nullptr)
                                           : nlohmann::json(job.worker_id);
    j["created_at"] = format_iso8601(job.created_at);
    j["started_at"] = time_or_null(job.started_at);
    j["completed_at"] = time_or_null(job.completed_at);
    j["results"] = job.results ? nlohmann::json(*job.results) : nlohmann::json(nullptr);
    j["error_message"] = job.error_message.empty() ? nlohmann::json(nullptr)
                                                   : nlohmann::json(job.error_message);
    j["timeout_seconds"] = job.timeout_seconds;
    return j;
}

template <typename Target, typename Result>
Job<Target, Result> job_from_json(const nlohmann::json& j) {
    Job<Target, Result> job;
    try {
        j.at("job_id").get_to(job.job_id);
        job.targets = j.at("proxies").get<std::vector<Target>>();

        std::string status = j.value("status", "pending");
        if (!job_status_from_string(status, job.status)) {
            throw WireFormatError("unknown job status '" + status + "'");
        }

        if (j.contains("worker_id") && !j["worker_id"].is_null()) {
            j["worker_id"].get_to(job.worker_id);
        }

        auto created = time_from_field(j, "created_at");
        if (created) job.created_at = *created;
        job.started_at = time_from_field(j, "started_at");
        job.completed_at = time_from_field(j, "completed_at");

        if (j.contains("results") && !j["results"].is_null()) {
            job.results = j["results"].get<std::vector<Result>>();
        }
        if (j.contains("error_message") && !j["error_message"].is_null()) {
            j["error_message"].get_to(job.error_message);
        }
        job.timeout_seconds = j.value("timeout_seconds", DEFAULT_JOB_TIMEOUT_SEC);
    } catch (const nlohmann::json::exception& e) {
        throw WireFormatError(std::string("malformed job: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw WireFormatError(std::string("malformed job: ") + e.what());
    }

    if (job.job_id.empty()) {
        throw WireFormatError("malformed job: empty job_id");
    }
    return job;
}

//==============================================================================
// COMPLETION
//==============================================================================

template <typename Result>
struct Completion {
    std::string job_id;
    std::vector<Result> results;
    std::string error_message;
};

template <typename Result>
nlohmann::json completion_to_json(const std::string& job_id,
                                  const std::vector<Result>& results,
                                  const std::string& error_message) {
    nlohmann::json j;
    j["job_id"] = job_id;
    j["results"] = results;
    if (!error_message.empty()) {
        j["error_message"] = error_message;
    }
    return j;
}

template <typename Result>
Completion<Result> completion_from_json(const nlohmann::json& j) {
    Completion<Result> completion;
    try {
        j.at("job_id").get_to(completion.job_id);
        if (j.contains("results") && !j["results"].is_null()) {
            completion.results = j["results"].get<std::vector<Result>>();
        }
        if (j.contains("error_message") && !j["error_message"].is_null()) {
            j["error_message"].get_to(completion.error_message);
        }
    } catch (const nlohmann::json::exception& e) {
        throw WireFormatError(std::string("malformed completion: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw WireFormatError(std::string("malformed completion: ") + e.what());
    }
    return completion;
}

} // namespace proxypool

#endif // WIRE_FORMAT_H
