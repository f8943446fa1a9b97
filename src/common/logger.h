/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: logger.h

    Description:
        Thread-safe, level-filtered logging shared by the coordinator, the
        workers and the command-line tools. Every line carries a local
        timestamp with millisecond precision so that coordinator and worker
        logs can be lined up when a lease expires or a worker is evicted.

        Core Features:
        - One static mutex around the output stream
        - Levels DEBUG < INFO < WARNING < ERROR
        - Level check happens before any formatting or locking
        - Level names can be parsed from command-line flags (--log-level)

    Thread Safety Model:
        - current_level_ is read without the lock (a stale read only changes
          whether one message is filtered)
        - Output is serialized by mutex_ so lines never interleave

    Related Files:
        - common/logger.cpp: static member definitions

    Typical Usage:
        #include "common/logger.h"
        using namespace proxypool;

        Logger::set_level(LogLevel::INFO);
        Logger::info("Coordinator started on port 8000");
        Logger::warning("Job 3f2a... lease expired");

*******************************************************************************/

#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <chrono>
#include <ctime>
#include <mutex>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace proxypool {

//==============================================================================
// LOG LEVELS
//==============================================================================
//
// Ordered by severity; a message is printed when its level is >= the
// configured level.
//
//------------------------------------------------------------------------------

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3
};

//==============================================================================
// LOGGER
//==============================================================================

class Logger {
private:
    static LogLevel current_level_;
    static std::mutex mutex_;

    // "YYYY-MM-DD HH:MM:SS.mmm" in local time
    static std::string get_timestamp() {
        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm;
        localtime_r(&time, &local_tm);

        std::stringstream ss;
        ss << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
        ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return ss.str();
    }

    static std::string level_to_string(LogLevel level) {
        switch (level) {
            case LogLevel::DEBUG:
                return "DEBUG";
            case LogLevel::INFO:
                return "INFO";
            case LogLevel::WARNING:
                return "WARN";
            case LogLevel::ERROR:
                return "ERROR";
            default:
                return "UNKNOWN";
        }
    }

public:
    static void set_level(LogLevel level) {
        current_level_ = level;
    }

    static LogLevel get_level() {
        return current_level_;
    }

    //--------------------------------------------------------------------------
    // parse_level
    //
    // Accepts "debug", "info", "warning"/"warn" and "error" in any case.
    // Throws std::invalid_argument for anything else so that a typo on the
    // command line stops the program instead of silently logging at INFO.
    //--------------------------------------------------------------------------
    static LogLevel parse_level(const std::string& name) {
        std::string lower = name;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

        if (lower == "debug") return LogLevel::DEBUG;
        if (lower == "info") return LogLevel::INFO;
        if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
        if (lower == "error") return LogLevel::ERROR;

        throw std::invalid_argument("Unknown log level: " + name);
    }

    static void log(LogLevel level, const std::string& message) {
        if (level < current_level_) return;

        std::lock_guard<std::mutex> lock(mutex_);
        std::ostream& out = (level >= LogLevel::WARNING) ? std::cerr : std::cout;
        out << "[" << get_timestamp() << "] "
            << "[" << level_to_string(level) << "] "
            << message << std::endl;
    }

    static void debug(const std::string& message) {
        log(LogLevel::DEBUG, message);
    }

    static void info(const std::string& message) {
        log(LogLevel::INFO, message);
    }

    static void warning(const std::string& message) {
        log(LogLevel::WARNING, message);
    }

    static void error(const std::string& message) {
        log(LogLevel::ERROR, message);
    }
};

} // namespace proxypool

#endif // LOGGER_H
