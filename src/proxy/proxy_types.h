/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: proxy_types.h

    Description:
        The concrete payload of a validation job. A ProxyRecord is the target
        handed to the prober; a ProbeResult is what comes back and what the
        proxy store folds into the record's health columns.

        JSON codecs (nlohmann::json ADL hooks) are declared here so that
        Job<ProxyRecord, ProbeResult> can be encoded by the generic wire
        format functions without knowing the payload.

    JSON Shapes:

        ProxyRecord:
            {"id": 17, "ip": "1.2.3.4", "port": 8080, "type": "http",
             "country": "US", "status": "active",
             "last_checked": "2025-01-01T00:00:00.000Z" | null}

        ProbeResult:
            {"proxy_id": 17, "ip": "1.2.3.4", "port": 8080, "type": "http",
             "is_working": true, "response_time": 312.5 | null,
             "error_kind": "none", "error_message": "",
             "supports_https": true | null, "https_response_time": 401.0 | null,
             "check_time": "...Z", "check_method": "http_get",
             "target_url": "http://httpbin.org/ip", "worker_id": "worker-..."}
*******************************************************************************/

#ifndef PROXY_TYPES_H
#define PROXY_TYPES_H

#include "coordinator/job.h"
#include "common/time_utils.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace proxypool {

//==============================================================================
// TARGET
//==============================================================================

struct ProxyRecord {
    int64_t id;
    std::string ip;
    uint16_t port;

    // http | https | socks4 | socks5
    std::string type;

    std::string country;

    // active | inactive | unknown
    std::string status;

    std::optional<TimePoint> last_checked;

    ProxyRecord() : id(0), port(0), status("unknown") {}

    std::string address() const { return ip + ":" + std::to_string(port); }
};

//==============================================================================
// RESULT
//==============================================================================

enum class ProbeErrorKind {
    NONE,
    TIMEOUT,
    CONNECTION_REFUSED,
    PROTOCOL_MISMATCH,
    UNSUPPORTED_SCHEME,
    NETWORK_ERROR
};

const char* probe_error_kind_to_string(ProbeErrorKind kind);

// Unknown names map to NETWORK_ERROR
ProbeErrorKind probe_error_kind_from_string(const std::string& name);

struct ProbeResult {
    int64_t proxy_id;
    std::string ip;
    uint16_t port;
    std::string type;

    bool is_working;
    std::optional<double> response_time_ms;

    ProbeErrorKind error_kind;
    std::string error_message;

    // Only set once the HTTPS (CONNECT) check has been attempted
    std::optional<bool> supports_https;
    std::optional<double> https_response_time_ms;

    TimePoint check_time;
    std::string check_method;
    std::string target_url;
    std::string worker_id;

    ProbeResult() : proxy_id(0), port(0), is_working(false),
                    error_kind(ProbeErrorKind::NONE), check_time(system_now()) {}
};

using ValidationJob = Job<ProxyRecord, ProbeResult>;

//==============================================================================
// FILTER
//==============================================================================

// Selection passed to a ProxySource; empty fields do not filter
struct ProxyFilter {
    std::string status;
    std::string type;
    std::string country;

    // Only proxies not checked within this many minutes (0 = any)
    int older_than_minutes;

    ProxyFilter() : older_than_minutes(0) {}

    bool matches(const ProxyRecord& proxy, TimePoint now) const;
};

//==============================================================================
// JSON
//==============================================================================

void to_json(nlohmann::json& j, const ProxyRecord& proxy);
void from_json(const nlohmann::json& j, ProxyRecord& proxy);

void to_json(nlohmann::json& j, const ProbeResult& result);
void from_json(const nlohmann::json& j, ProbeResult& result);

void to_json(nlohmann::json& j, const ProxyFilter& filter);
void from_json(const nlohmann::json& j, ProxyFilter& filter);

} // namespace proxypool

#endif // PROXY_TYPES_H
