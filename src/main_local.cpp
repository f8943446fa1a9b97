/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: main_local.cpp

    Description:
        Entry point of proxypool_local: validates a proxies file in one
        process (coordinator and workers on the in-process transport) and
        writes the results back into the same file.

    Command-Line Interface:

        $ ./proxypool_local --proxies proxies.json
        $ ./proxypool_local --proxies proxies.json --workers 8 --batch-size 25 \
              --type http --limit 200 --history checks.jsonl
*******************************************************************************/

#include "local/local_validator.h"
#include "proxy/proxy_store.h"
#include "common/logger.h"

#include <signal.h>

#include <iostream>
#include <stdexcept>

using namespace proxypool;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [options]\n"
              << "Options:\n"
              << "  --proxies FILE      Proxies JSON file (default: proxies.json)\n"
              << "  --history FILE      Append check history (JSON lines)\n"
              << "  --workers N         Worker threads (default: 4)\n"
              << "  --batch-size N      Proxies per job (default: 50)\n"
              << "  --concurrent N      Parallel probes per worker (default: 20)\n"
              << "  --timeout SEC       Probe timeout (default: 10)\n"
              << "  --status STATUS     Only proxies with this status\n"
              << "  --type TYPE         Only proxies of this type\n"
              << "  --country CODE      Only proxies from this country\n"
              << "  --older-than MIN    Only proxies not checked for MIN minutes\n"
              << "  --limit N           At most N proxies (default: all)\n"
              << "  --log-level LEVEL   debug|info|warning|error (default: info)\n"
              << "  --help              Show this help message\n";
}

int main(int argc, char* argv[]) {
    signal(SIGPIPE, SIG_IGN);

    LocalValidatorConfig config;
    std::string proxies_path = "proxies.json";
    std::string history_path;
    ProxyFilter filter;
    size_t limit = 0;
    LogLevel log_level = LogLevel::INFO;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "--help") {
                print_usage(argv[0]);
                return 0;
            } else if (arg == "--proxies" && i + 1 < argc) {
                proxies_path = argv[++i];
            } else if (arg == "--history" && i + 1 < argc) {
                history_path = argv[++i];
            } else if (arg == "--workers" && i + 1 < argc) {
                config.num_workers = std::stoul(argv[++i]);
            } else if (arg == "--batch-size" && i + 1 < argc) {
                config.batch_size = std::stoul(argv[++i]);
            } else if (arg == "--concurrent" && i + 1 < argc) {
                config.max_concurrent = std::stoul(argv[++i]);
            } else if (arg == "--timeout" && i + 1 < argc) {
                config.prober.timeout_ms = std::stoi(argv[++i]) * 1000;
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

    if (config.batch_size == 0) {
        std::cerr << "Batch size must be positive\n";
        return 1;
    }

    Logger::set_level(log_level);
    Logger::info("=== Local Proxy Validation ===");

    ProxyStore store(proxies_path, history_path);
    try {
        if (!store.load()) {
            return 1;
        }
    } catch (const std::exception& e) {
        Logger::error(std::string("Cannot load proxies: ") + e.what());
        return 1;
    }

    LocalValidator validator(config, store, &store);
    ValidationSummary summary = validator.run(filter, limit);

    std::cout << "\n=== Validation Summary ===\n"
              << "Proxies tested: " << summary.tested << "\n"
              << "Working: " << summary.working << "\n"
              << "Jobs: " << summary.jobs << "\n"
              << "Workers: " << summary.workers << "\n"
              << "Duration: " << summary.duration_sec << " seconds\n";
    return 0;
}
