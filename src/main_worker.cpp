/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: main_worker.cpp

    Description:
        Entry point of proxypool_worker: one Worker talking to a remote
        coordinator over the HTTP control plane, probing with ProxyProber.

    Command-Line Interface:

        $ ./proxypool_worker --server coord.internal --port 8000
        $ ./proxypool_worker --server 10.0.0.5 --concurrent 50 --timeout 5 \
              --worker-id edge-1 --log-level debug

    Exit Codes:
        0: stopped by signal
        1: bad arguments or registration failed
        2: stopped itself after repeated failures
*******************************************************************************/

#include "worker/worker.h"
#include "proxy/proxy_prober.h"
#include "transport/http_transport.h"
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
              << "  --server HOST        Coordinator host (default: localhost)\n"
              << "  --port PORT          Coordinator port (default: 8000)\n"
              << "  --worker-id ID       Worker id (default: worker-<host>-<random>)\n"
              << "  --concurrent N       Parallel probes per job (default: 20)\n"
              << "  --timeout SEC        Probe timeout (default: 10)\n"
              << "  --poll-interval SEC  Wait after an empty lease (default: 5)\n"
              << "  --log-level LEVEL    debug|info|warning|error (default: info)\n"
              << "  --help               Show this help message\n";
}

int main(int argc, char* argv[]) {
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);
    signal(SIGPIPE, SIG_IGN);

    std::string server_host = "localhost";
    int server_port = 8000;
    WorkerConfig config;
    ProberConfig prober_config;
    LogLevel log_level = LogLevel::INFO;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--server" && i + 1 < argc) {
                server_host = argv[++i];
            } else if (arg == "--port" && i + 1 < argc) {
                server_port = std::stoi(argv[++i]);
            } else if (arg == "--worker-id" && i + 1 < argc) {
                config.worker_id = argv[++i];
            } else if (arg == "--concurrent" && i + 1 < argc) {
                config.max_concurrent = std::stoul(argv[++i]);
            } else if (arg == "--timeout" && i + 1 < argc) {
                prober_config.timeout_ms = std::stoi(argv[++i]) * 1000;
            } else if (arg == "--poll-interval" && i + 1 < argc) {
                config.poll_interval_ms = std::stoi(argv[++i]) * 1000;
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

    Logger::set_level(log_level);
    Logger::info("=== Proxy Pool Validation Worker ===");

    if (config.worker_id.empty()) {
        config.worker_id = generate_worker_id();
    }
    config.worker_info["version"] = "1.0";
    prober_config.worker_id = config.worker_id;

    HttpCoordinatorClient client(server_host, server_port);
    ProxyProber prober(prober_config);
    Worker<ProxyRecord, ProbeResult> worker(config, client, prober);

    Logger::info("Connecting to coordinator at " + client.base_url());
    if (!worker.start()) {
        Logger::error("Failed to start worker");
        return 1;
    }

    Logger::info("Worker running. Press Ctrl+C to stop.");
    while (!shutdown_requested && worker.is_running()) {
        std::this_thread::sleep_for(std::chrono::seconds(1));
    }

    Logger::info("Shutting down...");
    worker.stop();

    if (worker.terminated()) {
        Logger::error("Worker stopped after repeated failures");
        return 2;
    }
    Logger::info("Worker shutdown complete");
    return 0;
}
