#pragma once

#include "llmrouter/balancer/Balancer.h"
#include "llmrouter/balancer/CircuitBreaker.h"
#include "llmrouter/balancer/PolicyRegistry.h"
#include "llmrouter/common/Settings.h"
#include "llmrouter/common/noncopyable.h"
#include "llmrouter/monitor/RateLimiter.h"
#include "llmrouter/network/EventLoop.h"
#include "llmrouter/network/TlsContext.h"
#include "llmrouter/protocol/HttpClient.h"
#include "llmrouter/protocol/HttpServer.h"
#include "llmrouter/protocol/ResponseCache.h"
#include "llmrouter/router/Classifier.h"
#include "llmrouter/router/Gateway.h"
#include "llmrouter/router/Upstream.h"

#include <memory>
#include <string>

namespace llmrouter {

// Wires the gateway components together and serves them over HTTP:
//   POST /v1/chat/completions, /chat/completions  -> Gateway
//   GET  /health, /health/readiness
//   GET  /metrics on the separate metrics listener
class GatewayServer : common::noncopyable {
public:
    GatewayServer(network::EventLoop* loop,
                  const common::GatewaySettings& settings,
                  std::unique_ptr<balancer::PolicyRegistry> policies);
    ~GatewayServer();

    void Start();

    // {"status":"ok"|"degraded","circuit_breakers":{...}}
    std::string ReadinessJson() const;

    router::Gateway& gateway() { return *gateway_; }
    const balancer::CircuitBreakerRegistry& breakers() const { return *breakers_; }

private:
    void HandleRequest(const protocol::HttpExchangePtr& exchange);
    void HandleMetrics(const protocol::HttpExchangePtr& exchange);
    bool Authorized(const protocol::HttpRequest& request) const;
    void AddCorsHeaders(const protocol::HttpRequest& request, protocol::HttpResponse* response) const;
    void ReplyJson(const protocol::HttpExchangePtr& exchange, int status, const std::string& body);
    void ScheduleCacheSweep();

    network::EventLoop* loop_;
    const common::GatewaySettings settings_;
    std::unique_ptr<balancer::PolicyRegistry> policies_;

    network::TlsContext tls_;
    std::unique_ptr<protocol::HttpClient> client_;
    std::unique_ptr<balancer::Balancer> balancer_;
    std::unique_ptr<balancer::CircuitBreakerRegistry> breakers_;
    std::unique_ptr<protocol::ResponseCache> cache_;
    std::unique_ptr<monitor::RateLimiter> rateLimiter_;
    std::unique_ptr<router::Classifier> classifier_;
    std::unique_ptr<router::Upstream> upstream_;
    std::unique_ptr<router::Gateway> gateway_;

    std::unique_ptr<protocol::HttpServer> server_;
    std::unique_ptr<protocol::HttpServer> metricsServer_;
};

} // namespace llmrouter
