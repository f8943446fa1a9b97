/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: proxy_prober.h

    Description:
        Reference Prober for ProxyRecord targets.

    Probe Sequence:

        http / https proxy:
            1. TCP connect to the proxy (classifies refused / timeout)
            2. GET each HTTP test URL through the proxy until one answers
               200 and reports the proxy's address as the origin IP
               (a 200 whose body is not JSON also counts as working)
            3. if working: CONNECT https_check_host:443 over a raw socket;
               "HTTP/1.x 200" means the proxy supports HTTPS tunnelling

        socks5 proxy:
            greeting 05 01 00 -> 05 00, then CONNECT socks_check_host:port,
            reply code 00 means working
            (if working, the same CONNECT to the HTTPS check host decides
             supports_https)

        socks4 proxy:
            SOCKS4 CONNECT (SOCKS4a for host names), reply 00 5A means working

        anything else:
            not working, error kind unsupported_scheme, no network traffic

    Error Classification:
        timeout              connect or read deadline passed
        connection_refused   proxy port closed
        protocol_mismatch    the peer does not speak the expected protocol,
                             or HTTP answered but not as a working proxy
        network_error        resolution failure, reset, rejected CONNECT

        Network failures never escape probe(); they become the error_kind and
        error_message of a non-working ProbeResult.
*******************************************************************************/

#ifndef PROXY_PROBER_H
#define PROXY_PROBER_H

#include "proxy/proxy_types.h"
#include "worker/prober.h"

#include <cstdint>
#include <string>
#include <vector>

namespace proxypool {

struct ProberConfig {
    // Timeout for each network step (connect, request, handshake)
    int timeout_ms;

    std::vector<std::string> http_test_urls;

    std::string https_check_host;
    uint16_t https_check_port;

    std::string socks_check_host;
    uint16_t socks_check_port;

    // Run the HTTPS capability check on working proxies
    bool check_https;

    // Stamped into every result
    std::string worker_id;

    ProberConfig() : timeout_ms(10000),
                     http_test_urls{"http://httpbin.org/ip", "http://ip-api.com/json"},
                     https_check_host("api.ipify.org"),
                     https_check_port(443),
                     socks_check_host("8.8.8.8"),
                     socks_check_port(53),
                     check_https(true) {}
};

class ProxyProber : public Prober<ProxyRecord, ProbeResult> {
public:
    explicit ProxyProber(const ProberConfig& config = ProberConfig());

    ProbeResult probe(const ProxyRecord& proxy) override;

    ProbeResult probe_failed(const ProxyRecord& proxy, const std::string& reason) override;

    const ProberConfig& config() const { return config_; }

private:
    ProbeResult blank_result(const ProxyRecord& proxy) const;

    void probe_http(const ProxyRecord& proxy, ProbeResult& result);
    void probe_socks(const ProxyRecord& proxy, ProbeResult& result, int version);

    void check_https_connect(const ProxyRecord& proxy, ProbeResult& result);
    void check_https_socks(const ProxyRecord& proxy, ProbeResult& result, int version);

    ProberConfig config_;
};

} // namespace proxypool

#endif // PROXY_PROBER_H
