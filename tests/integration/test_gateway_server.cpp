#include "llmrouter/GatewayServer.h"
#include "llmrouter/common/Config.h"
#include "llmrouter/common/Logger.h"
#include "llmrouter/protocol/HttpServer.h"
#include "llmrouter/network/EventLoop.h"
#include "llmrouter/network/InetAddress.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace llmrouter;
using namespace llmrouter::network;
using namespace llmrouter::protocol;
using llmrouter::common::Config;
using llmrouter::common::GatewaySettings;
using llmrouter::common::Logger;
using llmrouter::common::LogLevel;

static int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);

    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

static std::string recvUntilClose(int fd, int timeoutMs = 3000) {
    std::string out;
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    while (true) {
        int pret = ::poll(&pfd, 1, timeoutMs);
        assert(pret == 1);
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n > 0) {
            out.append(buf, buf + n);
            continue;
        }
        break;
    }
    return out;
}

static uint16_t pickFreePort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    uint16_t port = ntohs(addr.sin_port);
    ::close(fd);
    assert(port != 0);
    return port;
}

// One request per connection; returns the raw response.
static std::string roundTrip(uint16_t port, const std::string& method, const std::string& path,
                             const std::string& extraHeaders = "", const std::string& body = "") {
    int fd = connectTo(port);
    std::string req = method + " " + path + " HTTP/1.1\r\n"
                      "Host: test\r\n"
                      "Connection: close\r\n" +
                      extraHeaders;
    if (!body.empty()) {
        req += "Content-Type: application/json\r\nContent-Length: " + std::to_string(body.size()) + "\r\n";
    }
    req += "\r\n" + body;
    ssize_t n = ::send(fd, req.data(), req.size(), 0);
    assert(n == static_cast<ssize_t>(req.size()));
    std::string resp = recvUntilClose(fd);
    ::close(fd);
    return resp;
}

static bool hasLine(const std::string& resp, const std::string& line) {
    return resp.find("\r\n" + line + "\r\n") != std::string::npos;
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    const uint16_t backendPort = pickFreePort();
    const uint16_t gatewayPort = pickFreePort();
    const uint16_t metricsPort = pickFreePort();

    const std::string conf =
        "[policy:plain]\n"
        "type = static\n"
        "[llm:plain:only]\n"
        "name = Plain Backend\n"
        "api_base = http://127.0.0.1:" + std::to_string(backendPort) + "/v1\n"
        "api_key = backend-key\n"
        "model = plain-model\n";
    assert(Config::Instance().LoadFromString(conf));
    std::vector<std::string> errors;
    auto policies = balancer::PolicyRegistry::FromConfig(Config::Instance(), "plain", true, &errors);
    assert(errors.empty());
    assert(policies);

    GatewaySettings settings;
    settings.defaultPolicy = "plain";
    settings.service.host = "127.0.0.1";
    settings.service.port = gatewayPort;
    settings.service.threads = 0;
    settings.service.requestTimeoutSec = 2.0;
    settings.security.apiKeys = {"secret"};
    settings.rateLimit.enabled = false;
    settings.retry.initialBackoffMs = 0;
    settings.metrics.host = "127.0.0.1";
    settings.metrics.port = metricsPort;

    EventLoop loop;

    std::atomic<int> backendHits{0};
    std::mutex seenMutex;
    std::string seenAuth;
    std::string seenBody;
    HttpServer backend(&loop, InetAddress("127.0.0.1", backendPort), "FakeLlm");
    backend.setHandler([&](const HttpExchangePtr& ex) {
        const HttpRequest& req = ex->request();
        HttpResponse resp;
        if (req.path() != "/v1/chat/completions") {
            resp.setStatusCode(HttpResponse::k404NotFound);
            ex->Reply(resp);
            return;
        }
        ++backendHits;
        {
            std::lock_guard<std::mutex> lock(seenMutex);
            seenAuth = req.getHeader("Authorization");
            seenBody = req.body();
        }
        resp.setStatusCode(HttpResponse::k200Ok);
        resp.setContentType("application/json");
        resp.setBody("{\"id\":\"c1\",\"choices\":[{\"message\":{\"role\":\"assistant\",\"content\":\"hi\"}}],"
                     "\"usage\":{\"prompt_tokens\":2,\"completion_tokens\":1,\"total_tokens\":3}}");
        ex->Reply(resp);
    });
    backend.start();

    GatewayServer gateway(&loop, settings, std::move(policies));
    gateway.Start();

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        std::string resp = roundTrip(gatewayPort, "GET", "/health");
        assert(resp.find("HTTP/1.1 200") == 0);
        assert(resp.find("{\"status\":\"ok\"}") != std::string::npos);

        resp = roundTrip(gatewayPort, "GET", "/health/readiness");
        assert(resp.find("HTTP/1.1 200") == 0);
        assert(resp.find("\"circuit_breakers\"") != std::string::npos);
        assert(resp.find("\"status\":\"ok\"") != std::string::npos);

        resp = roundTrip(gatewayPort, "GET", "/nowhere");
        assert(resp.find("HTTP/1.1 404") == 0);

        resp = roundTrip(gatewayPort, "GET", "/v1/chat/completions", "Authorization: Bearer secret\r\n");
        assert(resp.find("HTTP/1.1 405") == 0);

        const std::string chat = "{\"messages\":[{\"role\":\"user\",\"content\":\"hello\"}]}";
        resp = roundTrip(gatewayPort, "POST", "/v1/chat/completions", "", chat);
        assert(resp.find("HTTP/1.1 401") == 0);
        resp = roundTrip(gatewayPort, "POST", "/v1/chat/completions", "Authorization: Bearer wrong\r\n", chat);
        assert(resp.find("HTTP/1.1 401") == 0);
        assert(backendHits.load() == 0);

        resp = roundTrip(gatewayPort, "POST", "/v1/chat/completions", "Authorization: Bearer secret\r\n", chat);
        assert(resp.find("HTTP/1.1 200") == 0);
        assert(hasLine(resp, "X-LLM-Router-Policy: plain"));
        assert(hasLine(resp, "X-LLM-Router-Backend: Plain Backend"));
        assert(hasLine(resp, "X-LLM-Router-Cache: MISS"));
        assert(resp.find("\"content\":\"hi\"") != std::string::npos);
        assert(backendHits.load() == 1);
        {
            std::lock_guard<std::mutex> lock(seenMutex);
            assert(seenAuth == "Bearer backend-key");
            assert(seenBody.find("\"model\":\"plain-model\"") != std::string::npos);
        }

        // Same request again is served from the cache; the key may also come as a query parameter.
        resp = roundTrip(gatewayPort, "POST", "/v1/chat/completions?api_key=secret", "", chat);
        assert(resp.find("HTTP/1.1 200") == 0);
        assert(hasLine(resp, "X-LLM-Router-Cache: HIT"));
        assert(backendHits.load() == 1);

        resp = roundTrip(gatewayPort, "POST", "/v1/chat/completions", "Authorization: Bearer secret\r\n",
                         "{\"messages\":\"nope\"}");
        assert(resp.find("HTTP/1.1 400") == 0);
        assert(resp.find("\"source\":\"llm-router\"") != std::string::npos);

        resp = roundTrip(metricsPort, "GET", "/metrics");
        assert(resp.find("HTTP/1.1 200") == 0);
        assert(resp.find("num_requests") != std::string::npos);
        assert(resp.find("cache_hit_count") != std::string::npos);

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    LOG_WARN << "gateway server tests PASS";
    return 0;
}
