/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: proxy_source.h

    Description:
        Where the targets of a validation run come from. fetch() returns the
        proxies matching `filter`, the ones checked longest ago first, at most
        `limit` of them (0 = no limit).
*******************************************************************************/

#ifndef PROXY_SOURCE_H
#define PROXY_SOURCE_H

#include "proxy/proxy_types.h"

#include <vector>

namespace proxypool {

class ProxySource {
public:
    virtual ~ProxySource() = default;

    virtual std::vector<ProxyRecord> fetch(const ProxyFilter& filter, size_t limit) = 0;
};

} // namespace proxypool

#endif // PROXY_SOURCE_H
