/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: result_sink.h

    Description:
        Destination for the results of a completed job. The coordinator calls
        persist() after it has released the job store lock, once per effective
        completion, possibly from several HTTP handler or worker threads at
        the same time.

        Implementations must:
        - tolerate concurrent persist() calls
        - tolerate results for a proxy id they have already updated (a job
          retried after a lease expiry can deliver the same targets twice)
        - report failure by throwing; the coordinator logs and carries on
*******************************************************************************/

#ifndef RESULT_SINK_H
#define RESULT_SINK_H

#include <vector>

namespace proxypool {

template <typename Result>
class ResultSink {
public:
    virtual ~ResultSink() = default;

    virtual void persist(const std::vector<Result>& results) = 0;
};

} // namespace proxypool

#endif // RESULT_SINK_H
