/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: wire_format.cpp

    Description:
        Non-template half of the control plane wire format: body parsing,
        timestamp fields, worker registration metadata and the /stats
        document.
*******************************************************************************/

#include "transport/wire_format.h"

namespace proxypool {

using nlohmann::json;

json parse_json_body(const std::string& body) {
    if (body.empty()) {
        throw WireFormatError("empty request body");
    }
    try {
        return json::parse(body);
    } catch (const json::parse_error& e) {
        throw WireFormatError(std::string("invalid JSON: ") + e.what());
    }
}

json time_or_null(const std::optional<TimePoint>& tp) {
    if (!tp) return nullptr;
    return format_iso8601(*tp);
}

std::optional<TimePoint> time_from_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw std::invalid_argument(std::string("'") + key + "' is not a timestamp string");
    }

    TimePoint tp;
    if (!parse_iso8601(it->get<std::string>(), tp)) {
        throw std::invalid_argument(std::string("bad timestamp in '") + key + "'");
    }
    return tp;
}

WorkerInfo worker_info_from_json(const json& j) {
    WorkerInfo info;
    if (j.is_null()) {
        return info;
    }
    if (!j.is_object()) {
        throw WireFormatError("worker_info must be an object");
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.value().is_string()) {
            info[it.key()] = it.value().get<std::string>();
        } else {
            info[it.key()] = it.value().dump();
        }
    }
    return info;
}

json stats_to_json(const CoordinatorStats& stats) {
    json server_stats;
    server_stats["total_jobs_created"] = stats.total_jobs_created;
    server_stats["total_jobs_completed"] = stats.total_jobs_completed;
    server_stats["total_jobs_failed"] = stats.total_jobs_failed;
    server_stats["total_jobs_requeued"] = stats.total_jobs_requeued;
    server_stats["total_results_received"] = stats.total_results_received;
    server_stats["server_start_time"] = format_iso8601(stats.start_time);

    json workers = json::object();
    for (const auto& entry : stats.per_worker) {
        const WorkerRecord& record = entry.second;
        workers[entry.first] = {
            {"last_seen", format_iso8601(record.last_heartbeat)},
            {"registered_at", format_iso8601(record.registered_at)},
            {"jobs_completed", record.jobs_completed},
            {"targets_processed", record.targets_processed},
            {"hostname", record.hostname()}
        };
    }

    json j;
    j["server_stats"] = server_stats;
    j["worker_count"] = stats.workers;
    j["queue_size"] = stats.queued;
    j["active_jobs"] = stats.active;
    j["workers"] = workers;
    return j;
}

} // namespace proxypool
