/*******************************************************************************
    Project: Proxy Pool Validation Coordinator

    File: test_proxy_prober.cpp

    Description:
        Tests for ProxyProber against scripted proxies on 127.0.0.1. The
        SOCKS proxies are raw socket servers that speak just enough of the
        handshake; the HTTP proxy is a cpp-httplib server that answers every
        absolute-form GET like an echo service behind a forwarding proxy.
        Nothing here leaves the loopback interface.

    Expected Output:
        Test 1: Unsupported proxy type... PASSED
        Test 2: Refused connection... PASSED
        Test 3: SOCKS5 handshake... PASSED
        Test 4: SOCKS5 HTTPS capability check... PASSED
        Test 5: SOCKS4 handshake... PASSED
        Test 6: SOCKS failures are classified... PASSED
        Test 7: HTTP proxy origin check... PASSED
        Test 8: probe_failed result... PASSED
*******************************************************************************/

#include "proxy/proxy_prober.h"
#include "common/logger.h"

#include <httplib.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <signal.h>
#include <sys/socket.h>
#include <unistd.h>

#include <algorithm>
#include <cassert>
#include <chrono>
#include <functional>
#include <iostream>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace proxypool;

//==============================================================================
// SCRIPTED TCP SERVER
//==============================================================================

static std::string read_exact(int fd, size_t count) {
    std::string out;
    char buf[256];
    while (out.size() < count) {
        size_t want = std::min(sizeof(buf), count - out.size());
        ssize_t n = ::recv(fd, buf, want, 0);
        if (n <= 0) break;
        out.append(buf, static_cast<size_t>(n));
    }
    return out;
}

static std::string read_until_nul(int fd) {
    std::string out;
    char c = 0;
    while (::recv(fd, &c, 1, 0) == 1 && c != '\0') {
        out.push_back(c);
    }
    return out;
}

static void write_all(int fd, const std::string& data) {
    ::send(fd, data.data(), data.size(), MSG_NOSIGNAL);
}

// Accepts up to `connections` clients on 127.0.0.1 and runs `handler` on each
class ScriptedServer {
public:
    using Handler = std::function<void(int fd)>;

    ScriptedServer(Handler handler, int connections = 1)
        : handler_(std::move(handler)), listen_fd_(-1), port_(0) {
        listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd_ < 0) throw std::runtime_error("socket failed");

        int yes = 1;
        ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listen_fd_, 8) != 0) {
            ::close(listen_fd_);
            throw std::runtime_error("bind/listen failed");
        }

        socklen_t len = sizeof(addr);
        ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);

        thread_ = std::thread([this, connections]() {
            for (int i = 0; i < connections; ++i) {
                pollfd pfd{};
                pfd.fd = listen_fd_;
                pfd.events = POLLIN;
                if (::poll(&pfd, 1, 5000) <= 0) break;

                int client = ::accept(listen_fd_, nullptr, nullptr);
                if (client < 0) break;
                handler_(client);
                ::close(client);
            }
        });
    }

    ~ScriptedServer() {
        if (thread_.joinable()) thread_.join();
        ::close(listen_fd_);
    }

    uint16_t port() const { return port_; }

private:
    Handler handler_;
    int listen_fd_;
    uint16_t port_;
    std::thread thread_;
};

// Minimal SOCKS5 proxy; records each CONNECT request after the greeting
struct Socks5Script {
    std::mutex mutex;
    std::vector<std::string> requests;
    std::string method_reply = std::string("\x05\x00", 2);

    void handle(int fd) {
        std::string greeting = read_exact(fd, 3);
        write_all(fd, method_reply);
        if (method_reply[1] != '\x00') return;

        std::string request = read_exact(fd, 4);
        if (request.size() < 4) return;
        if (request[3] == '\x01') {
            request += read_exact(fd, 6);
        } else if (request[3] == '\x03') {
            std::string len = read_exact(fd, 1);
            request += len;
            request += read_exact(fd, static_cast<unsigned char>(len[0]) + 2);
        }
        {
            std::lock_guard<std::mutex> lock(mutex);
            requests.push_back(request);
        }
        write_all(fd, std::string("\x05\x00\x00\x01\x00\x00\x00\x00\x00\x00", 10));
    }
};

static ProxyRecord loopback_proxy(const std::string& type, uint16_t port) {
    ProxyRecord proxy;
    proxy.id = 42;
    proxy.ip = "127.0.0.1";
    proxy.port = port;
    proxy.type = type;
    return proxy;
}

static uint16_t closed_port() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    socklen_t len = sizeof(addr);
    ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    ::close(fd);
    return ntohs(addr.sin_port);
}

static ProberConfig quick_config() {
    ProberConfig config;
    config.timeout_ms = 2000;
    config.check_https = false;
    config.worker_id = "test-worker";
    return config;
}

int main() {
    signal(SIGPIPE, SIG_IGN);
    Logger::set_level(LogLevel::WARNING);
    Logger::info("Running ProxyProber tests...");

    int passed = 0;
    int failed = 0;

    {
        std::cout << "Test 1: Unsupported proxy type... ";
        try {
            ProxyProber prober(quick_config());
            ProbeResult result = prober.probe(loopback_proxy("ftp", 21));

            assert(!result.is_working);
            assert(result.error_kind == ProbeErrorKind::UNSUPPORTED_SCHEME);
            assert(result.check_method == "none");
            assert(result.proxy_id == 42);
            assert(result.worker_id == "test-worker");
            assert(!result.response_time_ms);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 2: Refused connection... ";
        try {
            ProxyProber prober(quick_config());
            uint16_t port = closed_port();

            ProbeResult http = prober.probe(loopback_proxy("http", port));
            assert(!http.is_working);
            assert(http.error_kind == ProbeErrorKind::CONNECTION_REFUSED);
            assert(http.check_method == "http_get");

            ProbeResult socks = prober.probe(loopback_proxy("socks5", port));
            assert(!socks.is_working);
            assert(socks.error_kind == ProbeErrorKind::CONNECTION_REFUSED);
            assert(socks.check_method == "socks5_connect");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 3: SOCKS5 handshake... ";
        try {
            Socks5Script script;
            ProbeResult result;
            {
                ScriptedServer server([&](int fd) { script.handle(fd); });
                ProxyProber prober(quick_config());
                result = prober.probe(loopback_proxy("socks5", server.port()));
            }

            assert(result.is_working);
            assert(result.error_kind == ProbeErrorKind::NONE);
            assert(result.response_time_ms && *result.response_time_ms >= 0.0);
            assert(result.check_method == "socks5_connect");
            assert(result.target_url == "8.8.8.8:53");
            assert(!result.supports_https);

            // VER CMD RSV ATYP=1 8.8.8.8 port 53
            assert(script.requests.size() == 1);
            assert(script.requests[0] ==
                   std::string("\x05\x01\x00\x01\x08\x08\x08\x08\x00\x35", 10));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 4: SOCKS5 HTTPS capability check... ";
        try {
            Socks5Script script;
            ProbeResult result;
            {
                ScriptedServer server([&](int fd) { script.handle(fd); }, 2);
                ProberConfig config = quick_config();
                config.check_https = true;
                config.https_check_host = "api.ipify.org";
                ProxyProber prober(config);
                result = prober.probe(loopback_proxy("socks5", server.port()));
            }

            assert(result.is_working);
            assert(result.supports_https && *result.supports_https);
            assert(result.https_response_time_ms);

            // Second CONNECT names the host: ATYP=3, length, name, port 443
            assert(script.requests.size() == 2);
            const std::string& second = script.requests[1];
            assert(second[3] == '\x03');
            assert(static_cast<unsigned char>(second[4]) == 13);
            assert(second.substr(5, 13) == "api.ipify.org");
            assert(static_cast<unsigned char>(second[18]) == 0x01);
            assert(static_cast<unsigned char>(second[19]) == 0xBB);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 5: SOCKS4 handshake... ";
        try {
            std::string request;
            ProbeResult result;
            {
                ScriptedServer server([&](int fd) {
                    request = read_exact(fd, 8);
                    read_until_nul(fd);
                    write_all(fd, std::string("\x00\x5A\x00\x00\x00\x00\x00\x00", 8));
                });
                ProxyProber prober(quick_config());
                result = prober.probe(loopback_proxy("socks4", server.port()));
            }

            assert(result.is_working);
            assert(result.check_method == "socks4_connect");
            assert(request == std::string("\x04\x01\x00\x35\x08\x08\x08\x08", 8));

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 6: SOCKS failures are classified... ";
        try {
            // Proxy insists on authentication
            Socks5Script auth;
            auth.method_reply = std::string("\x05\xFF", 2);
            ProbeResult needs_auth;
            {
                ScriptedServer server([&](int fd) { auth.handle(fd); });
                ProxyProber prober(quick_config());
                needs_auth = prober.probe(loopback_proxy("socks5", server.port()));
            }
            assert(!needs_auth.is_working);
            assert(needs_auth.error_kind == ProbeErrorKind::PROTOCOL_MISMATCH);

            // Reads the greeting, then hangs up
            ProbeResult hung_up;
            {
                ScriptedServer server([](int fd) { read_exact(fd, 3); });
                ProxyProber prober(quick_config());
                hung_up = prober.probe(loopback_proxy("socks5", server.port()));
            }
            assert(!hung_up.is_working);
            assert(hung_up.error_kind == ProbeErrorKind::PROTOCOL_MISMATCH);

            // SOCKS4 rejection code
            ProbeResult rejected;
            {
                ScriptedServer server([](int fd) {
                    read_exact(fd, 8);
                    read_until_nul(fd);
                    write_all(fd, std::string("\x00\x5B\x00\x00\x00\x00\x00\x00", 8));
                });
                ProxyProber prober(quick_config());
                rejected = prober.probe(loopback_proxy("socks4", server.port()));
            }
            assert(!rejected.is_working);
            assert(rejected.error_kind == ProbeErrorKind::NETWORK_ERROR);

            // Accepts but never answers
            ProbeResult silent;
            {
                ScriptedServer server([](int) {
                    std::this_thread::sleep_for(std::chrono::milliseconds(800));
                });
                ProberConfig config = quick_config();
                config.timeout_ms = 200;
                ProxyProber prober(config);
                silent = prober.probe(loopback_proxy("socks5", server.port()));
            }
            assert(!silent.is_working);
            assert(silent.error_kind == ProbeErrorKind::TIMEOUT);

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 7: HTTP proxy origin check... ";
        try {
            httplib::Server proxy;
            proxy.Get(".*/ip", [](const httplib::Request&, httplib::Response& res) {
                res.set_content(R"({"origin": "127.0.0.1"})", "application/json");
            });
            proxy.Get(".*/elsewhere", [](const httplib::Request&, httplib::Response& res) {
                res.set_content(R"({"ip": "203.0.113.7"})", "application/json");
            });
            proxy.Get(".*/plain", [](const httplib::Request&, httplib::Response& res) {
                res.set_content("hello", "text/plain");
            });
            proxy.Get(".*/down", [](const httplib::Request&, httplib::Response& res) {
                res.status = 503;
            });

            int port = proxy.bind_to_any_port("127.0.0.1");
            assert(port > 0);
            std::thread listener([&]() { proxy.listen_after_bind(); });
            for (int i = 0; i < 200 && !proxy.is_running(); ++i) {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }

            ProberConfig config = quick_config();
            ProxyRecord record = loopback_proxy("http", static_cast<uint16_t>(port));

            config.http_test_urls = {"http://echo.test/ip"};
            ProbeResult echoed = ProxyProber(config).probe(record);

            config.http_test_urls = {"http://echo.test/elsewhere"};
            ProbeResult mismatch = ProxyProber(config).probe(record);

            config.http_test_urls = {"http://echo.test/plain"};
            ProbeResult plain = ProxyProber(config).probe(record);

            config.http_test_urls = {"http://echo.test/down", "http://echo.test/ip"};
            ProbeResult fallback = ProxyProber(config).probe(record);

            proxy.stop();
            listener.join();

            assert(echoed.is_working);
            assert(echoed.error_kind == ProbeErrorKind::NONE);
            assert(echoed.response_time_ms);
            assert(echoed.check_method == "http_get");
            assert(echoed.target_url == "http://echo.test/ip");

            assert(!mismatch.is_working);
            assert(mismatch.error_kind == ProbeErrorKind::PROTOCOL_MISMATCH);
            assert(mismatch.error_message.find("203.0.113.7") != std::string::npos);

            assert(plain.is_working);

            assert(fallback.is_working);
            assert(fallback.target_url == "http://echo.test/ip");

            std::cout << "PASSED\n";
            passed++;
        } catch (const std::exception& e) {
            std::cout << "FAILED: " << e.what() << "\n";
            failed++;
        }
    }

    {
        std::cout << "Test 8: probe_failed result... ";
        try {
            ProxyProber prober(quick_config());
            ProbeResult result = prober.probe_failed(loopback_proxy("http", 8080), "boom");

            assert(!result.is_working);
            assert(result.error_kind == ProbeErrorKind::NETWORK_ERROR);
            assert(result.error_message == "probe error: boom");
            assert(result.ip == "127.0.0.1");
            assert(result.port == 8080);
            assert(result.worker_id == "test-worker");

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
