/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: proxy_prober.cpp

    Description:
        Implementation of the reference proxy prober. HTTP requests through
        a proxy go through cpp-httplib; the handshakes that need byte-level
        control (SOCKS, HTTP CONNECT) use a small non-blocking socket layer
        with poll()-based deadlines.
*******************************************************************************/

#include "proxy/proxy_prober.h"
#include "common/logger.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <arpa/inet.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <memory>
#include <stdexcept>

namespace proxypool {

namespace {

using SteadyClock = std::chrono::steady_clock;

//==============================================================================
// SOCKET LAYER
//==============================================================================

struct ProbeFailure : public std::runtime_error {
    ProbeFailure(ProbeErrorKind k, const std::string& what)
        : std::runtime_error(what), kind(k) {}

    ProbeErrorKind kind;
};

// Owns one file descriptor
class Socket {
public:
    explicit Socket(int fd = -1) : fd_(fd) {}
    ~Socket() { reset(); }

    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Socket& operator=(Socket&& other) noexcept {
        if (this != &other) {
            reset();
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    void reset() {
        if (fd_ >= 0) ::close(fd_);
        fd_ = -1;
    }

private:
    int fd_;
};

int remaining_ms(SteadyClock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - SteadyClock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

double elapsed_since_ms(SteadyClock::time_point start) {
    return std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
}

void wait_ready(int fd, short events, SteadyClock::time_point deadline, const char* step) {
    while (true) {
        int left = remaining_ms(deadline);
        if (left <= 0) {
            throw ProbeFailure(ProbeErrorKind::TIMEOUT, std::string(step) + " timed out");
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = events;

        int rc = ::poll(&pfd, 1, left);
        if (rc > 0) return;
        if (rc == 0) {
            throw ProbeFailure(ProbeErrorKind::TIMEOUT, std::string(step) + " timed out");
        }
        if (errno != EINTR) {
            throw ProbeFailure(ProbeErrorKind::NETWORK_ERROR,
                               std::string("poll: ") + std::strerror(errno));
        }
    }
}

Socket connect_with_deadline(const std::string& host, uint16_t port,
                             SteadyClock::time_point deadline) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res);
    if (rc != 0 || !res) {
        throw ProbeFailure(ProbeErrorKind::NETWORK_ERROR,
                           "cannot resolve " + host + ": " +
                           (rc != 0 ? ::gai_strerror(rc) : "no address"));
    }
    std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)> guard(res, &::freeaddrinfo);

    Socket sock(::socket(res->ai_family, res->ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC,
                         res->ai_protocol));
    if (!sock) {
        throw ProbeFailure(ProbeErrorKind::NETWORK_ERROR,
                           std::string("socket: ") + std::strerror(errno));
    }

    if (::connect(sock.get(), res->ai_addr, res->ai_addrlen) == 0) {
        return sock;
    }
    if (errno == ECONNREFUSED) {
        throw ProbeFailure(ProbeErrorKind::CONNECTION_REFUSED, "connection refused");
    }
    if (errno != EINPROGRESS) {
        throw ProbeFailure(ProbeErrorKind::NETWORK_ERROR,
                           std::string("connect: ") + std::strerror(errno));
    }

    wait_ready(sock.get(), POLLOUT, deadline, "connect");

    int err = 0;
    socklen_t len = sizeof(err);
    if (::getsockopt(sock.get(), SOL_SOCKET, SO_ERROR, &err, &len) < 0) {
        err = errno;
    }
    if (err == ECONNREFUSED) {
        throw ProbeFailure(ProbeErrorKind::CONNECTION_REFUSED, "connection refused");
    }
    if (err == ETIMEDOUT) {
        throw ProbeFailure(ProbeErrorKind::TIMEOUT, "connect timed out");
    }
    if (err != 0) {
        throw ProbeFailure(ProbeErrorKind::NETWORK_ERROR,
                           std::string("connect: ") + std::strerror(err));
    }
    return sock;
}

void send_all(const Socket& sock, const std::string& data, SteadyClock::time_point deadline) {
    size_t offset = 0;
    while (offset < data.size()) {
        ssize_t n = ::send(sock.get(), data.data() + offset, data.size() - offset, MSG_NOSIGNAL);
        if (n > 0) {
            offset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            wait_ready(sock.get(), POLLOUT, deadline, "send");
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        throw ProbeFailure(ProbeErrorKind::NETWORK_ERROR,
                           std::string("send: ") + std::strerror(errno));
    }
}

// Reads until `buffer` holds at least `count` bytes
void recv_at_least(const Socket& sock, std::string& buffer, size_t count,
                   SteadyClock::time_point deadline) {
    char chunk[512];
    while (buffer.size() < count) {
        wait_ready(sock.get(), POLLIN, deadline, "read");
        ssize_t n = ::recv(sock.get(), chunk, sizeof(chunk), 0);
        if (n > 0) {
            buffer.append(chunk, static_cast<size_t>(n));
        } else if (n == 0) {
            throw ProbeFailure(ProbeErrorKind::PROTOCOL_MISMATCH, "connection closed by proxy");
        } else if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            throw ProbeFailure(ProbeErrorKind::NETWORK_ERROR,
                               std::string("recv: ") + std::strerror(errno));
        }
    }
}

std::string recv_status_line(const Socket& sock, SteadyClock::time_point deadline) {
    std::string buffer;
    size_t end;
    while ((end = buffer.find("\r\n")) == std::string::npos) {
        if (buffer.size() > 16384) {
            throw ProbeFailure(ProbeErrorKind::PROTOCOL_MISMATCH, "no status line from proxy");
        }
        recv_at_least(sock, buffer, buffer.size() + 1, deadline);
    }
    return buffer.substr(0, end);
}

//==============================================================================
// HANDSHAKES
//==============================================================================

void push_port(std::string& out, uint16_t port) {
    out.push_back(static_cast<char>((port >> 8) & 0xFF));
    out.push_back(static_cast<char>(port & 0xFF));
}

void socks5_connect(const Socket& sock, const std::string& host, uint16_t port,
                    SteadyClock::time_point deadline) {
    // Greeting: version 5, one method, no authentication
    send_all(sock, std::string("\x05\x01\x00", 3), deadline);

    std::string reply;
    recv_at_least(sock, reply, 2, deadline);
    if (static_cast<unsigned char>(reply[0]) != 0x05) {
        throw ProbeFailure(ProbeErrorKind::PROTOCOL_MISMATCH, "not a SOCKS5 proxy");
    }
    if (static_cast<unsigned char>(reply[1]) != 0x00) {
        throw ProbeFailure(ProbeErrorKind::PROTOCOL_MISMATCH,
                           "SOCKS5 proxy requires authentication");
    }

    std::string request("\x05\x01\x00", 3);
    in_addr ipv4{};
    if (::inet_pton(AF_INET, host.c_str(), &ipv4) == 1) {
        request.push_back('\x01');
        request.append(reinterpret_cast<const char*>(&ipv4), 4);
    } else {
        if (host.size() > 255) {
            throw ProbeFailure(ProbeErrorKind::NETWORK_ERROR, "SOCKS5 host name too long");
        }
        request.push_back('\x03');
        request.push_back(static_cast<char>(host.size()));
        request.append(host);
    }
    push_port(request, port);
    send_all(sock, request, deadline);

    reply.clear();
    recv_at_least(sock, reply, 2, deadline);
    if (static_cast<unsigned char>(reply[0]) != 0x05) {
        throw ProbeFailure(ProbeErrorKind::PROTOCOL_MISMATCH, "bad SOCKS5 CONNECT reply");
    }
    int code = static_cast<unsigned char>(reply[1]);
    if (code != 0x00) {
        throw ProbeFailure(ProbeErrorKind::NETWORK_ERROR,
                           "SOCKS5 CONNECT rejected (reply " + std::to_string(code) + ")");
    }
}

void socks4_connect(const Socket& sock, const std::string& host, uint16_t port,
                    SteadyClock::time_point deadline) {
    std::string request("\x04\x01", 2);
    push_port(request, port);

    in_addr ipv4{};
    bool literal = ::inet_pton(AF_INET, host.c_str(), &ipv4) == 1;
    if (literal) {
        request.append(reinterpret_cast<const char*>(&ipv4), 4);
        request.push_back('\0');
    } else {
        // SOCKS4a: 0.0.0.1 followed by the host name
        request.append("\x00\x00\x00\x01", 4);
        request.push_back('\0');
        request.append(host);
        request.push_back('\0');
    }
    send_all(sock, request, deadline);

    std::string reply;
    recv_at_least(sock, reply, 2, deadline);
    if (reply[0] != 0x00) {
        throw ProbeFailure(ProbeErrorKind::PROTOCOL_MISMATCH, "not a SOCKS4 proxy");
    }
    int code = static_cast<unsigned char>(reply[1]);
    if (code != 0x5A) {
        throw ProbeFailure(ProbeErrorKind::NETWORK_ERROR,
                           "SOCKS4 CONNECT rejected (reply " + std::to_string(code) + ")");
    }
}

void http_connect(const Socket& sock, const std::string& host, uint16_t port,
                  SteadyClock::time_point deadline) {
    std::string target = host + ":" + std::to_string(port);
    send_all(sock, "CONNECT " + target + " HTTP/1.1\r\nHost: " + target +
                   "\r\nProxy-Connection: keep-alive\r\n\r\n", deadline);

    std::string line = recv_status_line(sock, deadline);
    if (line.compare(0, 5, "HTTP/") != 0) {
        throw ProbeFailure(ProbeErrorKind::PROTOCOL_MISMATCH, "not an HTTP proxy");
    }

    size_t space = line.find(' ');
    int code = 0;
    if (space != std::string::npos && line.size() >= space + 4) {
        code = std::atoi(line.substr(space + 1, 3).c_str());
    }
    if (code != 200) {
        throw ProbeFailure(ProbeErrorKind::NETWORK_ERROR,
                           "CONNECT answered " + std::to_string(code));
    }
}

//==============================================================================
// HTTP THROUGH PROXY
//==============================================================================

struct UrlParts {
    std::string origin;   // scheme://host[:port]
    std::string path;
};

UrlParts split_url(const std::string& url) {
    UrlParts parts;
    size_t scheme_end = url.find("://");
    size_t host_begin = scheme_end == std::string::npos ? 0 : scheme_end + 3;
    size_t slash = url.find('/', host_begin);

    if (slash == std::string::npos) {
        parts.origin = url;
        parts.path = "/";
    } else {
        parts.origin = url.substr(0, slash);
        parts.path = url.substr(slash);
    }
    return parts;
}

// The origin IP the echo service saw, or empty if the body names none
std::string reported_origin(const nlohmann::json& body) {
    for (const char* key : {"origin", "ip", "query"}) {
        auto it = body.find(key);
        if (it != body.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

} // namespace

//==============================================================================
// ProxyProber
//==============================================================================

ProxyProber::ProxyProber(const ProberConfig& config) : config_(config) {
}

ProbeResult ProxyProber::blank_result(const ProxyRecord& proxy) const {
    ProbeResult result;
    result.proxy_id = proxy.id;
    result.ip = proxy.ip;
    result.port = proxy.port;
    result.type = proxy.type;
    result.is_working = false;
    result.check_time = system_now();
    result.worker_id = config_.worker_id;
    return result;
}

ProbeResult ProxyProber::probe(const ProxyRecord& proxy) {
    ProbeResult result = blank_result(proxy);

    if (proxy.type == "http" || proxy.type == "https") {
        probe_http(proxy, result);
    } else if (proxy.type == "socks5") {
        probe_socks(proxy, result, 5);
    } else if (proxy.type == "socks4") {
        probe_socks(proxy, result, 4);
    } else {
        result.check_method = "none";
        result.error_kind = ProbeErrorKind::UNSUPPORTED_SCHEME;
        result.error_message = "unsupported proxy type '" + proxy.type + "'";
    }

    Logger::debug("Probed " + proxy.address() + " (" + proxy.type + "): " +
                  (result.is_working ? "working" : result.error_message));
    return result;
}

ProbeResult ProxyProber::probe_failed(const ProxyRecord& proxy, const std::string& reason) {
    ProbeResult result = blank_result(proxy);
    result.check_method = "none";
    result.error_kind = ProbeErrorKind::NETWORK_ERROR;
    result.error_message = "probe error: " + reason;
    return result;
}

/* =============================================================================
   Function: probe_http
   Purpose : Reachability check, then GET the test URLs through the proxy
             until one confirms the proxy's address as origin.
   ============================================================================= */
void ProxyProber::probe_http(const ProxyRecord& proxy, ProbeResult& result) {
    result.check_method = "http_get";
    result.target_url = config_.http_test_urls.empty() ? "" : config_.http_test_urls.front();

    try {
        auto deadline = SteadyClock::now() + std::chrono::milliseconds(config_.timeout_ms);
        connect_with_deadline(proxy.ip, proxy.port, deadline);
    } catch (const ProbeFailure& e) {
        result.error_kind = e.kind;
        result.error_message = e.what();
        return;
    }

    time_t timeout_sec = config_.timeout_ms / 1000;
    time_t timeout_usec = (config_.timeout_ms % 1000) * 1000;

    ProbeErrorKind last_kind = ProbeErrorKind::NETWORK_ERROR;
    std::string last_error = "no test URL configured";

    for (const auto& url : config_.http_test_urls) {
        UrlParts parts = split_url(url);

        httplib::Client client(parts.origin);
        client.set_proxy(proxy.ip, proxy.port);
        client.set_connection_timeout(timeout_sec, timeout_usec);
        client.set_read_timeout(timeout_sec, timeout_usec);
        client.set_write_timeout(timeout_sec, timeout_usec);

        httplib::Headers headers = {
            {"User-Agent", "Mozilla/5.0 (X11; Linux x86_64) proxypool-prober"},
            {"Accept", "application/json, text/plain, */*"}
        };

        auto start = SteadyClock::now();
        auto res = client.Get(parts.path, headers);
        double took_ms = elapsed_since_ms(start);

        if (!res) {
            last_kind = ProbeErrorKind::NETWORK_ERROR;
            last_error = "request via proxy failed: " + httplib::to_string(res.error());
            continue;
        }
        if (res->status != 200) {
            last_kind = ProbeErrorKind::PROTOCOL_MISMATCH;
            last_error = "HTTP " + std::to_string(res->status);
            continue;
        }

        nlohmann::json body = nlohmann::json::parse(res->body, nullptr, false);
        if (body.is_discarded() || !body.is_object()) {
            // 200 without a JSON echo: working, origin not verified
            result.is_working = true;
            result.response_time_ms = took_ms;
            result.target_url = url;
            break;
        }

        std::string origin = reported_origin(body);
        if (!origin.empty() && origin.find(proxy.ip) != std::string::npos) {
            result.is_working = true;
            result.response_time_ms = took_ms;
            result.target_url = url;
            break;
        }

        last_kind = ProbeErrorKind::PROTOCOL_MISMATCH;
        last_error = "origin IP mismatch (" + (origin.empty() ? std::string("none") : origin) + ")";
    }

    if (!result.is_working) {
        result.error_kind = last_kind;
        result.error_message = last_error;
        return;
    }

    if (config_.check_https) {
        check_https_connect(proxy, result);
    }
}

void ProxyProber::probe_socks(const ProxyRecord& proxy, ProbeResult& result, int version) {
    result.check_method = version == 5 ? "socks5_connect" : "socks4_connect";
    result.target_url = config_.socks_check_host + ":" + std::to_string(config_.socks_check_port);

    auto start = SteadyClock::now();
    auto deadline = start + std::chrono::milliseconds(config_.timeout_ms);
    try {
        Socket sock = connect_with_deadline(proxy.ip, proxy.port, deadline);
        if (version == 5) {
            socks5_connect(sock, config_.socks_check_host, config_.socks_check_port, deadline);
        } else {
            socks4_connect(sock, config_.socks_check_host, config_.socks_check_port, deadline);
        }
    } catch (const ProbeFailure& e) {
        result.error_kind = e.kind;
        result.error_message = e.what();
        return;
    }

    result.is_working = true;
    result.response_time_ms = elapsed_since_ms(start);

    if (config_.check_https) {
        check_https_socks(proxy, result, version);
    }
}

void ProxyProber::check_https_connect(const ProxyRecord& proxy, ProbeResult& result) {
    auto start = SteadyClock::now();
    auto deadline = start + std::chrono::milliseconds(config_.timeout_ms);
    try {
        Socket sock = connect_with_deadline(proxy.ip, proxy.port, deadline);
        http_connect(sock, config_.https_check_host, config_.https_check_port, deadline);
        result.supports_https = true;
        result.https_response_time_ms = elapsed_since_ms(start);
    } catch (const ProbeFailure& e) {
        result.supports_https = false;
        Logger::debug("HTTPS check failed for " + proxy.address() + ": " + e.what());
    }
}

void ProxyProber::check_https_socks(const ProxyRecord& proxy, ProbeResult& result, int version) {
    auto start = SteadyClock::now();
    auto deadline = start + std::chrono::milliseconds(config_.timeout_ms);
    try {
        Socket sock = connect_with_deadline(proxy.ip, proxy.port, deadline);
        if (version == 5) {
            socks5_connect(sock, config_.https_check_host, config_.https_check_port, deadline);
        } else {
            socks4_connect(sock, config_.https_check_host, config_.https_check_port, deadline);
        }
        result.supports_https = true;
        result.https_response_time_ms = elapsed_since_ms(start);
    } catch (const ProbeFailure& e) {
        result.supports_https = false;
        Logger::debug("HTTPS check failed for " + proxy.address() + ": " + e.what());
    }
}

} // namespace proxypool
