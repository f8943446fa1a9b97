/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: proxy_types.cpp

    Description:
        Filter matching and JSON codecs for the proxy payload types.
        Decoders throw nlohmann::json exceptions (or std::invalid_argument
        for a malformed timestamp or port); the wire format layer turns those into
        WireFormatError. Timestamps use the wire format helpers.
*******************************************************************************/

#include "proxy/proxy_types.h"
#include "transport/wire_format.h"

#include <stdexcept>

namespace proxypool {

using nlohmann::json;

namespace {

// Range-checked so that a bad row never wraps into a different port
uint16_t port_from_json(const json& value, int64_t lowest) {
    if (!value.is_number_integer()) {
        throw std::invalid_argument("port must be an integer");
    }
    int64_t port = value.get<int64_t>();
    if (port < lowest || port > 65535) {
        throw std::invalid_argument("port " + std::to_string(port) + " out of range");
    }
    return static_cast<uint16_t>(port);
}

}  // namespace

const char* probe_error_kind_to_string(ProbeErrorKind kind) {
    switch (kind) {
        case ProbeErrorKind::NONE:               return "none";
        case ProbeErrorKind::TIMEOUT:            return "timeout";
        case ProbeErrorKind::CONNECTION_REFUSED: return "connection_refused";
        case ProbeErrorKind::PROTOCOL_MISMATCH:  return "protocol_mismatch";
        case ProbeErrorKind::UNSUPPORTED_SCHEME: return "unsupported_scheme";
        case ProbeErrorKind::NETWORK_ERROR:      return "network_error";
    }
    return "network_error";
}

ProbeErrorKind probe_error_kind_from_string(const std::string& name) {
    if (name == "none")               return ProbeErrorKind::NONE;
    if (name == "timeout")            return ProbeErrorKind::TIMEOUT;
    if (name == "connection_refused") return ProbeErrorKind::CONNECTION_REFUSED;
    if (name == "protocol_mismatch")  return ProbeErrorKind::PROTOCOL_MISMATCH;
    if (name == "unsupported_scheme") return ProbeErrorKind::UNSUPPORTED_SCHEME;
    return ProbeErrorKind::NETWORK_ERROR;
}

bool ProxyFilter::matches(const ProxyRecord& proxy, TimePoint now) const {
    if (!status.empty() && proxy.status != status) return false;
    if (!type.empty() && proxy.type != type) return false;
    if (!country.empty() && proxy.country != country) return false;

    if (older_than_minutes > 0 && proxy.last_checked) {
        if (now - *proxy.last_checked < std::chrono::minutes(older_than_minutes)) {
            return false;
        }
    }
    return true;
}

//------------------------------------------------------------------------------
// ProxyRecord
//------------------------------------------------------------------------------

void to_json(json& j, const ProxyRecord& proxy) {
    j = json{{"id", proxy.id},
             {"ip", proxy.ip},
             {"port", proxy.port},
             {"type", proxy.type},
             {"country", proxy.country},
             {"status", proxy.status},
             {"last_checked", time_or_null(proxy.last_checked)}};
}

void from_json(const json& j, ProxyRecord& proxy) {
    j.at("id").get_to(proxy.id);
    j.at("ip").get_to(proxy.ip);
    proxy.port = port_from_json(j.at("port"), 1);
    j.at("type").get_to(proxy.type);
    proxy.country = j.value("country", "");
    proxy.status = j.value("status", "unknown");
    proxy.last_checked = time_from_field(j, "last_checked");
}

//------------------------------------------------------------------------------
// ProbeResult
//------------------------------------------------------------------------------

void to_json(json& j, const ProbeResult& result) {
    j = json{{"proxy_id", result.proxy_id},
             {"ip", result.ip},
             {"port", result.port},
             {"type", result.type},
             {"is_working", result.is_working},
             {"response_time", nullptr},
             {"error_kind", probe_error_kind_to_string(result.error_kind)},
             {"error_message", result.error_message},
             {"supports_https", nullptr},
             {"https_response_time", nullptr},
             {"check_time", format_iso8601(result.check_time)},
             {"check_method", result.check_method},
             {"target_url", result.target_url},
             {"worker_id", result.worker_id}};

    if (result.response_time_ms) j["response_time"] = *result.response_time_ms;
    if (result.supports_https) j["supports_https"] = *result.supports_https;
    if (result.https_response_time_ms) j["https_response_time"] = *result.https_response_time_ms;
}

void from_json(const json& j, ProbeResult& result) {
    j.at("proxy_id").get_to(result.proxy_id);
    j.at("is_working").get_to(result.is_working);
    result.ip = j.value("ip", "");
    result.port = 0;
    if (j.contains("port") && !j["port"].is_null()) {
        // 0 marks a result that never learned its port
        result.port = port_from_json(j["port"], 0);
    }
    result.type = j.value("type", "");
    result.error_kind = probe_error_kind_from_string(j.value("error_kind", "none"));
    result.error_message = j.value("error_message", "");
    result.check_method = j.value("check_method", "");
    result.target_url = j.value("target_url", "");
    result.worker_id = j.value("worker_id", "");

    result.response_time_ms.reset();
    if (j.contains("response_time") && !j["response_time"].is_null()) {
        result.response_time_ms = j["response_time"].get<double>();
    }
    result.supports_https.reset();
    if (j.contains("supports_https") && !j["supports_https"].is_null()) {
        result.supports_https = j["supports_https"].get<bool>();
    }
    result.https_response_time_ms.reset();
    if (j.contains("https_response_time") && !j["https_response_time"].is_null()) {
        result.https_response_time_ms = j["https_response_time"].get<double>();
    }

    auto check_time = time_from_field(j, "check_time");
    result.check_time = check_time ? *check_time : system_now();
}

//------------------------------------------------------------------------------
// ProxyFilter
//------------------------------------------------------------------------------

void to_json(json& j, const ProxyFilter& filter) {
    j = json::object();
    if (!filter.status.empty()) j["status"] = filter.status;
    if (!filter.type.empty()) j["type"] = filter.type;
    if (!filter.country.empty()) j["country"] = filter.country;
    if (filter.older_than_minutes > 0) j["older_than_minutes"] = filter.older_than_minutes;
}

void from_json(const json& j, ProxyFilter& filter) {
    if (!j.is_object()) {
        throw std::invalid_argument("filter must be a JSON object");
    }
    filter.status = j.value("status", "");
    filter.type = j.value("type", "");
    filter.country = j.value("country", "");
    filter.older_than_minutes = j.value("older_than_minutes", 0);
    if (filter.older_than_minutes < 0) {
        throw std::invalid_argument("older_than_minutes must not be negative");
    }
}

} // namespace proxypool
