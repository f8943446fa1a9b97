/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: submit_validation.cpp

    Description:
        Entry point of proxypool_submit: asks a running coordinator to queue
        a validation run, then follows /stats until the queue and the active
        table are both empty and prints the final server statistics.

    Command-Line Interface:

        $ ./proxypool_submit --server localhost --port 8000
        $ ./proxypool_submit --status inactive --older-than 60 --limit 500
        $ ./proxypool_submit --type socks5 --country DE --no-wait

    Exit Codes:
        0: run submitted (and finished, unless --no-wait)
        1: bad arguments or coordinator unreachable
*******************************************************************************/

#include "proxy/proxy_types.h"
#include "transport/http_transport.h"
#include "common/logger.h"

#include <nlohmann/json.hpp>

#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

using namespace proxypool;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --server HOST       Coordinator host (default: localhost)\n"
              << "  --port PORT         Coordinator port (default: 8000)\n"
              << "  --status STATUS     Only proxies with this status\n"
              << "  --type TYPE         Only proxies of this type\n"
              << "  --country CODE      Only proxies from this country\n"
              << "  --older-than MIN    Only proxies not checked for MIN minutes\n"
              << "  --limit N           At most N proxies (default: all)\n"
              << "  --no-wait           Return right after submitting\n"
              << "  --log-level LEVEL   debug|info|warning|error (default: info)\n"
              << "  --help              Show this help message\n";
}

int main(int argc, char* argv[]) {
    std::string server_host = "localhost";
    int server_port = 8000;
    ProxyFilter filter;
    size_t limit = 0;
    bool wait = true;
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
            } else if (arg == "--status" && i + 1 < argc) {
                filter.status = argv[++i];
            } else if (arg == "--type" && i + 1 < argc) {
                filter.type = argv[++i];
            } else if (arg == "--country" && i + 1 < argc) {
                filter.country = argv[++i];
            } else if (arg == "--older-than" && i + 1 < argc) {
                filter.older_than_minutes = std::stoi(argv[++i]);
            } else if (arg == "--limit" && i + 1 < argc) {
                limit = std::stoul(argv[++i]);
            } else if (arg == "--no-wait") {
                wait = false;
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
    Logger::info("=== Validation Job Submission ===");

    HttpCoordinatorClient client(server_host, server_port);
    auto start = std::chrono::steady_clock::now();

    int jobs_created = 0;
    try {
        jobs_created = client.submit_validation(filter, limit);
    } catch (const std::exception& e) {
        Logger::error(std::string("Failed to submit validation job: ") + e.what());
        return 1;
    }

    Logger::info("Coordinator created " + std::to_string(jobs_created) + " validation jobs");
    if (jobs_created == 0 || !wait) {
        return 0;
    }

    nlohmann::json stats;
    while (true) {
        std::this_thread::sleep_for(std::chrono::seconds(5));

        try {
            stats = client.fetch_stats();
        } catch (const std::exception& e) {
            Logger::warning(std::string("Cannot read coordinator stats: ") + e.what());
            continue;
        }

        long long queued = stats.value("queue_size", 0LL);
        long long active = stats.value("active_jobs", 0LL);
        Logger::info("Progress: " + std::to_string(queued) + " queued, " +
                     std::to_string(active) + " active, " +
                     std::to_string(stats.value("worker_count", 0LL)) + " workers");

        if (queued == 0 && active == 0) {
            break;
        }
    }

    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

    std::cout << "\n=== Validation Run Complete ===\n"
              << "Elapsed: " << elapsed << " seconds\n"
              << stats.dump(2) << "\n";
    return 0;
}
