/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: time_utils.h

    Description:
        Wall-clock helpers shared by the job store, the wire format and the
        proxy store. Lease deadlines and heartbeat ages are compared on
        std::chrono::system_clock because the same instants are reported to
        workers and written to the proxy store as ISO-8601 strings.

        Format: "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC). The parser also accepts the
        form without milliseconds and an explicit "+00:00" suffix.
*******************************************************************************/

#ifndef TIME_UTILS_H
#define TIME_UTILS_H

#include <chrono>
#include <ctime>
#include <cstdio>
#include <string>
#include <functional>

namespace proxypool {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// Injected into the job store so tests can move time forward without sleeping
using ClockFn = std::function<TimePoint()>;

inline TimePoint system_now() {
    return Clock::now();
}

inline std::string format_iso8601(TimePoint tp) {
    auto since_epoch = tp.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch - secs);
    long long ms_count = ms.count();
    if (ms_count < 0) {
        ms_count += 1000;
        secs -= std::chrono::seconds(1);
    }

    std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm utc_tm;
    gmtime_r(&t, &utc_tm);

    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &utc_tm);

    char out[48];
    std::snprintf(out, sizeof(out), "%s.%03lldZ", buf, ms_count);
    return std::string(out);
}

//------------------------------------------------------------------------------
// parse_iso8601
//
// Returns false (and leaves `out` untouched) when the text is not a UTC
// timestamp in one of the accepted forms.
//------------------------------------------------------------------------------
inline bool parse_iso8601(const std::string& text, TimePoint& out) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                    &year, &month, &day, &hour, &minute, &second, &consumed) != 6) {
        return false;
    }

    int millis = 0;
    size_t pos = static_cast<size_t>(consumed);
    if (pos < text.size() && text[pos] == '.') {
        ++pos;
        int digits = 0;
        while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
            if (digits < 3) {
                millis = millis * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0) return false;
        for (int i = digits; i < 3; ++i) millis *= 10;
    }

    std::string suffix = text.substr(pos);
    if (!suffix.empty() && suffix != "Z" && suffix != "+00:00") {
        return false;
    }

    // timegm() would normalize 2024-13-40 into a different valid date
    static const int kDaysInMonth[] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12 || day < 1 || day > kDaysInMonth[month - 1] ||
        hour > 23 || minute > 59 || second > 60 ||
        hour < 0 || minute < 0 || second < 0) {
        return false;
    }
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    if (month == 2 && day == 29 && !leap) {
        return false;
    }

    std::tm utc_tm{};
    utc_tm.tm_year = year - 1900;
    utc_tm.tm_mon = month - 1;
    utc_tm.tm_mday = day;
    utc_tm.tm_hour = hour;
    utc_tm.tm_min = minute;
    utc_tm.tm_sec = second;

    std::time_t t = timegm(&utc_tm);
    if (t == static_cast<std::time_t>(-1)) return false;

    out = Clock::from_time_t(t) + std::chrono::milliseconds(millis);
    return true;
}

inline long long elapsed_ms(TimePoint from, TimePoint to) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(to - from).count();
}

} // namespace proxypool

#endif // TIME_UTILS_H
