/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: logger.cpp

    Description:
        Static member definitions for Logger. Compiled once into
        proxypool_core so the coordinator, the workers and the control plane
        share a single level and a single output mutex.
*******************************************************************************/

#include "common/logger.h"

namespace proxypool {

// INFO by default; executables override it from --log-level
LogLevel Logger::current_level_ = LogLevel::INFO;

std::mutex Logger::mutex_;

} // namespace proxypool
