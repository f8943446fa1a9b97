/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: main_coordinator.cpp

    Description:
        Entry point of proxypool_coordinator: a Coordinator behind the HTTP
        control plane, with the proxy file store as both target source and
        result sink.

    Lifecycle Stages:
        1. STARTUP:
           - Parse command-line arguments
           - Load the proxies file
           - Start the coordinator sweep and the control plane
        2. RUNNING:
           - Workers register, lease, heartbeat and complete over HTTP
           - proxypool_submit (or any client) queues validation runs
           - Statistics are printed every 30 seconds
        3. SHUTDOWN:
           - SIGINT / SIGTERM sets the shutdown flag
           - Stop the control plane, then the coordinator

    Command-Line Interface:

        $ ./proxypool_coordinator --proxies proxies.json --port 8000
        $ ./proxypool_coordinator --batch-size 25 --max-concurrent-jobs 4 \
              --job-timeout 120 --history checks.jsonl --log-level debug

    Exit Codes:
        0: clean shutdown
        1: bad arguments, unreadable proxies file or port already in use
*******************************************************************************/

#include "coordinator/coordinator.h"
#include "proxy/proxy_store.h"
#include "transport/control_plane_server.h"
#include "common/logger.h"

#include <signal.h>

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace proxypool;

std::atomic<bool> shutdown_requested(false);

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        shutdown_requested = true;
    }
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --host HOST               Bind address (default: 0.0.0.0)\n"
              << "  --port PORT               Listen port (default: 8000)\n"
              << "  --batch-size N            Proxies per job (default: 50)\n"
              << "  --max-concurrent-jobs N   Lease ceiling (default: 10)\n"
              << "  --job-timeout SEC         Lease length (default: 300)\n"
              << "  --worker-timeout SEC      Heartbeat timeout (default: 300)\n"
              << "  --sweep-interval SEC      Sweep period (default: 30)\n"
              << "  --proxies FILE            Proxies JSON file (default: proxies.json)\n"
              << "  --history FILE            Append check history (JSON lines)\n"
              << "  --log-level LEVEL         debug|info|warning|error (default: info)\n"
              << "  --help                    Show this help message\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    CoordinatorConfig config;
    ControlPlaneConfig server_config;
    std::string proxies_path = "proxies.json";
    std::string history_path;
    LogLevel log_level = LogLevel::INFO;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--host" && i + 1 < argc) {
                server_config.host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                server_config.port = std::stoi(argv[++i]);
            } else if (arg == "--batch-size" && i + 1 < argc) {
                config.batch_size = std::stoul(argv[++i]);
            } else if (arg == "--max-concurrent-jobs" && i + 1 < argc) {
                config.max_concurrent_jobs = std::stoul(argv[++i]);
            } else if (arg == "--job-timeout" && i + 1 < argc) {
                config.job_timeout_sec = std::stoi(argv[++i]);
            } else if (arg == "--worker-timeout" && i + 1 < argc) {
                config.worker_timeout_sec = std::stoi(argv[++i]);
            } else if (arg == "--sweep-interval" && i + 1 < argc) {
                config.sweep_interval_sec = std::stoi(argv[++i]);
            } else if (arg == "--proxies" && i + 1 < argc) {
                proxies_path = argv[++i];
            } else if (arg == "--history" && i + 1 < argc) {
                history_path = argv[++i];
            } else if (arg == "--log-level" && i + 1 < argc) {
                log_level = Logger::parse_level(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                print_usage(argv[0]);
                return 1;
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (config.batch_size == 0 || config.max_concurrent_jobs == 0 ||
        config.sweep_interval_sec <= 0) {
        std::cerr << "Batch size, job ceiling and sweep interval must be positive\n";
        return 1;
    }

    Logger::set_level(log_level);
    Logger::info("=== Proxy Pool Validation Coordinator ===");

    ProxyStore store(proxies_path, history_path);
    try {
        if (!store.load()) {
            Logger::warning("Starting with an empty proxy table");
        }
    } catch (const std::exception& e) {
        Logger::error(std::string("Cannot load proxies: ") + e.what());
        return 1;
    }

    Coordinator<ProxyRecord, ProbeResult> coordinator(config, &store);
    ControlPlaneServer server(server_config, coordinator, &store);

    if (!coordinator.start()) {
        Logger::error("Failed to start coordinator");
        return 1;
    }
    if (!server.start()) {
        Logger::error("Failed to start control plane");
        coordinator.stop();
        return 1;
    }

    Logger::info("Coordinator running. Press Ctrl+C to stop.");

    auto last_report = std::chrono::steady_clock::now();
    while (!shutdown_requested && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));

        if (std::chrono::steady_clock::now() - last_report >= std::chrono::seconds(30)) {
            coordinator.print_statistics();
            last_report = std::chrono::steady_clock::now();
        }
    }

    Logger::info("Shutting down...");
    server.stop();
    coordinator.stop();
    coordinator.print_statistics();
    Logger::info("Coordinator shutdown complete");
    return 0;
}
