/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: prober.h

    Description:
        The probe seam of the Worker. probe() checks one target and reports
        the outcome as data: an unreachable target is a Result with its
        failure recorded, not an exception. probe_failed() builds the Result
        the Worker substitutes when probe() throws anyway.

        Implementations are called from several pool threads at once and
        must apply their own network timeouts.
*******************************************************************************/

#ifndef PROBER_H
#define PROBER_H

#include <string>

namespace proxypool {

template <typename Target, typename Result>
class Prober {
public:
    virtual ~Prober() = default;

    virtual Result probe(const Target& target) = 0;

    virtual Result probe_failed(const Target& target, const std::string& reason) = 0;
};

} // namespace proxypool

#endif // PROBER_H
