/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: target_batcher.h

    Description:
        Splits an ordered target list into contiguous, fixed-size batches and
        wraps each batch as a PENDING Job with a fresh id.

        For N targets and batch size B the result holds ceil(N/B) jobs; every
        job but the last carries exactly B targets, and concatenating the
        jobs' targets in order reproduces the input list.
*******************************************************************************/

#ifndef TARGET_BATCHER_H
#define TARGET_BATCHER_H

#include "coordinator/job.h"
#include "common/id_generator.h"

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace proxypool {

template <typename Target, typename Result>
std::vector<Job<Target, Result>> make_batches(const std::vector<Target>& targets,
                                              size_t batch_size,
                                              int timeout_seconds = DEFAULT_JOB_TIMEOUT_SEC,
                                              TimePoint now = system_now()) {
    if (batch_size == 0) {
        throw std::invalid_argument("batch_size must be greater than zero");
    }

    std::vector<Job<Target, Result>> jobs;
    if (targets.empty()) {
        return jobs;
    }

    jobs.reserve((targets.size() + batch_size - 1) / batch_size);

    for (size_t begin = 0; begin < targets.size(); begin += batch_size) {
        size_t end = std::min(begin + batch_size, targets.size());

        Job<Target, Result> job;
        job.job_id = generate_uuid4();
        job.targets.assign(targets.begin() + begin, targets.begin() + end);
        job.status = JobStatus::PENDING;
        job.created_at = now;
        job.timeout_seconds = timeout_seconds;
        jobs.push_back(std::move(job));
    }

    return jobs;
}

} // namespace proxypool

#endif // TARGET_BATCHER_H
