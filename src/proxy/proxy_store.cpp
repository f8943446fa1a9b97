/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: proxy_store.cpp

    Description:
        Implementation of the file-backed proxy table. See proxy_store.h for
        the file formats and the health update rules.
*******************************************************************************/

#include "proxy/proxy_store.h"
#include "transport/wire_format.h"
#include "common/logger.h"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <stdexcept>

namespace proxypool {

using nlohmann::json;

ProxyStore::ProxyStore(const std::string& proxies_path,
                       const std::string& history_path,
                       ClockFn clock)
    : proxies_path_(proxies_path),
      history_path_(history_path),
      clock_(std::move(clock)) {
}

/* =============================================================================
   Function: load
   Purpose : Replace the in-memory table with the contents of the proxies
             file. Rows keep every column found in the file, known or not.
   ============================================================================= */
bool ProxyStore::load() {
    std::ifstream in(proxies_path_);
    if (!in.is_open()) {
        Logger::warning("Proxies file not found: " + proxies_path_);
        std::lock_guard<std::mutex> lock(mutex_);
        rows_.clear();
        return false;
    }

    json doc;
    try {
        doc = json::parse(in);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("cannot parse " + proxies_path_ + ": " + e.what());
    }
    if (!doc.is_array()) {
        throw std::runtime_error(proxies_path_ + ": expected a JSON array of proxies");
    }

    std::map<int64_t, json> rows;
    for (const auto& row : doc) {
        ProxyRecord proxy;
        try {
            proxy = row.get<ProxyRecord>();
        } catch (const std::exception& e) {
            throw std::runtime_error(proxies_path_ + ": bad proxy row: " + e.what());
        }
        rows[proxy.id] = row;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    rows_.swap(rows);
    Logger::info("Loaded " + std::to_string(rows_.size()) + " proxies from " + proxies_path_);
    return true;
}

void ProxyStore::save() {
    std::lock_guard<std::mutex> lock(mutex_);
    save_locked();
}

void ProxyStore::upsert(const ProxyRecord& proxy) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(proxy.id);
    if (it == rows_.end()) {
        rows_[proxy.id] = json(proxy);
        return;
    }

    // Keep the health columns of an existing row
    json fresh = proxy;
    for (auto field = fresh.begin(); field != fresh.end(); ++field) {
        it->second[field.key()] = field.value();
    }
}

/* =============================================================================
   Function: fetch
   Purpose : Select proxies for a validation run. Never-checked proxies come
             first, then the rest by last_checked ascending; ties keep id
             order.
   ============================================================================= */
std::vector<ProxyRecord> ProxyStore::fetch(const ProxyFilter& filter, size_t limit) {
    TimePoint now = clock_();
    std::vector<ProxyRecord> selected;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& entry : rows_) {
            ProxyRecord proxy = entry.second.get<ProxyRecord>();
            if (filter.matches(proxy, now)) {
                selected.push_back(std::move(proxy));
            }
        }
    }

    std::stable_sort(selected.begin(), selected.end(),
                     [](const ProxyRecord& a, const ProxyRecord& b) {
                         if (!a.last_checked || !b.last_checked) {
                             return !a.last_checked && b.last_checked;
                         }
                         return *a.last_checked < *b.last_checked;
                     });

    if (limit > 0 && selected.size() > limit) {
        selected.resize(limit);
    }

    Logger::debug("Fetched " + std::to_string(selected.size()) + " proxies for validation");
    return selected;
}

/* =============================================================================
   Function: persist
   Purpose : Fold a batch of probe results into the table, append them to the
             check history and rewrite the proxies file. Results for unknown
             ids are skipped.
   ============================================================================= */
void ProxyStore::persist(const std::vector<ProbeResult>& results) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t updated = 0;
    size_t working = 0;
    for (const auto& result : results) {
        auto it = rows_.find(result.proxy_id);
        if (it == rows_.end()) {
            Logger::warning("Result for unknown proxy id " + std::to_string(result.proxy_id) +
                            " skipped");
            continue;
        }
        apply_result(it->second, result);
        updated++;
        if (result.is_working) working++;
    }

    append_history_locked(results);
    save_locked();

    Logger::info("Saved " + std::to_string(updated) + " results (" +
                 std::to_string(working) + " working)");
}

bool ProxyStore::get(int64_t id, ProxyRecord& out) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end()) return false;
    out = it->second.get<ProxyRecord>();
    return true;
}

json ProxyStore::row(int64_t id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rows_.find(id);
    if (it == rows_.end()) return nullptr;
    return it->second;
}

size_t ProxyStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return rows_.size();
}

//------------------------------------------------------------------------------
// Private helpers
//------------------------------------------------------------------------------

void ProxyStore::apply_result(json& row, const ProbeResult& result) {
    std::string checked = format_iso8601(result.check_time);

    row["last_checked"] = checked;
    row["is_working"] = result.is_working;
    row["response_time"] = result.response_time_ms ? json(*result.response_time_ms) : json(nullptr);

    int64_t success = row.value("success_count", static_cast<int64_t>(0));
    int64_t failure = row.value("failure_count", static_cast<int64_t>(0));

    if (result.is_working) {
        row["status"] = "active";
        row["last_working"] = checked;
        row["success_count"] = success + 1;
        row["failure_count"] = 0;
    } else {
        row["status"] = "inactive";
        row["success_count"] = success;
        row["failure_count"] = failure + 1;
    }

    if (result.supports_https) {
        row["supports_https"] = *result.supports_https;
        row["https_response_time"] = result.https_response_time_ms
                                         ? json(*result.https_response_time_ms)
                                         : json(nullptr);
    }
}

void ProxyStore::save_locked() const {
    json doc = json::array();
    for (const auto& entry : rows_) {
        doc.push_back(entry.second);
    }

    std::string tmp_path = proxies_path_ + ".tmp";
    {
        std::ofstream out(tmp_path, std::ios::trunc);
        if (!out.is_open()) {
            throw std::runtime_error("cannot open " + tmp_path + " for writing");
        }
        out << doc.dump(2) << "\n";
        out.flush();
        if (!out) {
            throw std::runtime_error("write to " + tmp_path + " failed");
        }
    }

    if (std::rename(tmp_path.c_str(), proxies_path_.c_str()) != 0) {
        std::remove(tmp_path.c_str());
        throw std::runtime_error("cannot replace " + proxies_path_);
    }
}

void ProxyStore::append_history_locked(const std::vector<ProbeResult>& results) const {
    if (history_path_.empty() || results.empty()) return;

    std::ofstream out(history_path_, std::ios::app);
    if (!out.is_open()) {
        Logger::error("Cannot open check history " + history_path_);
        return;
    }
    for (const auto& result : results) {
        out << json(result).dump() << "\n";
    }
}

} // namespace proxypool
