/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: test_target_batcher.cpp

    Description:
        Unit tests for make_batches(): batch count and sizes, order
        preservation, empty input and the zero batch size guard.

    Expected Output:
        Test 1: 125 targets in batches of 50... PASSED
        Test 2: Exact multiple of the batch size... PASSED
        Test 3: Empty target list... PASSED
        Test 4: Batch size of zero is rejected... PASSED
        Test 5: Job fields and unique ids... PASSED
*******************************************************************************/

#include "coordinator/target_batcher.h"
#include "common/logger.h"

#include <cassert>
#include <iostream>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

using namespace proxypool;

using IntJob = Job<int, int>;

static std::vector<int> make_targets(int count) {
    std::vector<int> targets;
    for (int i = 0; i < count; ++i) targets.push_back(i);
    return targets;
}

int main() {
    Logger::set_level(LogLevel::WARNING);
    Logger::info("Running TargetBatcher tests...");

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: 125 targets in batches of 50... ";
        try {
            std::vector<int> targets = make_targets(125);
            auto jobs = make_batches<int, int>(targets, 50);

            assert(jobs.size() == 3);
            assert(jobs[0].targets.size() == 50);
            assert(jobs[1].targets.size() == 50);
            assert(jobs[2].targets.size() == 25);

            // Concatenation gives back the input in order
            std::vector<int> joined;
            for (const auto& job : jobs) {
                joined.insert(joined.end(), job.targets.begin(), job.targets.end());
            }
            assert(joined == targets);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Exact multiple of the batch size... ";
        try {
            auto jobs = make_batches<int, int>(make_targets(100), 50);
            assert(jobs.size() == 2);
            assert(jobs[0].targets.front() == 0);
            assert(jobs[1].targets.front() == 50);
            assert(jobs[1].targets.back() == 99);

            auto singles = make_batches<int, int>(make_targets(3), 1);
            assert(singles.size() == 3);

            auto one = make_batches<int, int>(make_targets(7), 1000);
            assert(one.size() == 1);
            assert(one[0].targets.size() == 7);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: Empty target list... ";
        try {
            auto jobs = make_batches<int, int>(std::vector<int>(), 50);
            assert(jobs.empty());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: Batch size of zero is rejected... ";
        try {
            bool threw = false;
            try {
                make_batches<int, int>(make_targets(10), 0);
            } catch (const std::invalid_argument&) {
                threw = true;
            }
            assert(threw);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: Job fields and unique ids... ";
        try {
            TimePoint now = system_now();
            auto jobs = make_batches<int, int>(make_targets(40), 4, 120, now);

            std::set<std::string> ids;
            for (const IntJob& job : jobs) {
                assert(job.status == JobStatus::PENDING);
                assert(job.worker_id.empty());
                assert(!job.started_at);
                assert(!job.completed_at);
                assert(!job.results);
                assert(job.error_message.empty());
                assert(job.timeout_seconds == 120);
                assert(job.created_at == now);
                assert(job.job_id.size() == 36);
                ids.insert(job.job_id);
            }
            assert(ids.size() == jobs.size());

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    std::cout << "\n=== Results ===\n";
    std::cout << "Passed: " << passed << "\n";
    std::cout << "Failed: " << failed << "\n";

    return (failed == 0) ? 0 : 1;
}
