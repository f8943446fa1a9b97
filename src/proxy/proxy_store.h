/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: proxy_store.h

    Description:
        File-backed proxy table. It is both the target source of a validation
        run and the sink its results flow into:

            ProxyStore::fetch()    -> Coordinator::create_jobs()
            Coordinator::complete_job() -> ProxyStore::persist()

    Files:

        proxies file (JSON array, rewritten on every persist):
            [{"id": 1, "ip": "1.2.3.4", "port": 8080, "type": "http",
              "country": "US", "status": "active",
              "last_checked": "...Z", "is_working": true,
              "response_time": 310.2, "last_working": "...Z",
              "success_count": 4, "failure_count": 0,
              "supports_https": false, "https_response_time": null}, ...]

        history file (JSON lines, append only, optional):
            one ProbeResult object per line

        The proxies file is written to "<path>.tmp" and renamed over the
        original, so a reader never observes a half-written table.

    Health Update Rules (per ProbeResult):
        working      status=active,   success_count+1, failure_count=0,
                     last_working=check_time
        not working  status=inactive, failure_count+1
        always       last_checked=check_time, is_working, response_time,
                     HTTPS columns when the result carries them

    Thread Safety:
        All public member functions lock one mutex; persist() may be called
        from several coordinator threads at once.
*******************************************************************************/

#ifndef PROXY_STORE_H
#define PROXY_STORE_H

#include "coordinator/result_sink.h"
#include "proxy/proxy_source.h"
#include "proxy/proxy_types.h"
#include "common/time_utils.h"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace proxypool {

class ProxyStore : public ProxySource, public ResultSink<ProbeResult> {
public:
    // history_path may be empty to disable the check history
    explicit ProxyStore(const std::string& proxies_path,
                        const std::string& history_path = "",
                        ClockFn clock = system_now);

    // Reads the proxies file. A missing file leaves the store empty and
    // returns false; a file that is not a JSON array of proxies throws.
    bool load();

    // Writes the proxies file; throws std::runtime_error on I/O failure
    void save();

    // Inserts or replaces by id; does not save
    void upsert(const ProxyRecord& proxy);

    std::vector<ProxyRecord> fetch(const ProxyFilter& filter, size_t limit) override;

    void persist(const std::vector<ProbeResult>& results) override;

    bool get(int64_t id, ProxyRecord& out) const;

    // Full stored row, health columns included; null when unknown
    nlohmann::json row(int64_t id) const;

    size_t size() const;

    const std::string& proxies_path() const { return proxies_path_; }

private:
    void save_locked() const;
    void append_history_locked(const std::vector<ProbeResult>& results) const;
    static void apply_result(nlohmann::json& row, const ProbeResult& result);

    std::string proxies_path_;
    std::string history_path_;
    ClockFn clock_;

    mutable std::mutex mutex_;

    // id -> stored row; the file is written in id order
    std::map<int64_t, nlohmann::json> rows_;
};

} // namespace proxypool

#endif // PROXY_STORE_H
