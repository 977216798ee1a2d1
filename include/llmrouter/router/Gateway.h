#pragma once

#include "llmrouter/common/GatewayError.h"
#include "llmrouter/common/Settings.h"
#include "llmrouter/common/noncopyable.h"
#include "llmrouter/protocol/HttpRequest.h"
#include "llmrouter/router/RetryOrchestrator.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace llmrouter {
namespace network {
class EventLoop;
}
namespace balancer {
class Balancer;
class CircuitBreakerRegistry;
class PolicyRegistry;
}
namespace monitor {
class RateLimiter;
}
namespace protocol {
class ResponseCache;
}

namespace router {

class Classifier;
class Upstream;

using HeaderList = std::vector<std::pair<std::string, std::string>>;

// Where the gateway delivers a response. Either OnComplete once, or
// OnStreamStart, any number of OnStreamData, then OnStreamEnd.
class ResponseSink {
public:
    virtual ~ResponseSink() = default;

    // False once the client is gone; the pipeline still runs to completion.
    virtual bool Alive() const = 0;

    virtual void OnComplete(int status, const HeaderList& headers, const std::string& contentType,
                            const std::string& body) = 0;

    virtual void OnStreamStart(int status, const HeaderList& headers, const std::string& contentType) = 0;
    virtual void OnStreamData(const char* data, size_t len) = 0;
    // ok=false when the upstream broke off mid-stream.
    virtual void OnStreamEnd(bool ok) = 0;
};

using ResponseSinkPtr = std::shared_ptr<ResponseSink>;

struct RequestInput {
    llmrouter::network::EventLoop* loop{nullptr};
    std::string clientIp;
    std::string path;
    llmrouter::protocol::HeaderMap headers;
    std::string body;
};

// Sequences one chat completion through admission, policy resolution,
// cache lookup, classification, retried upstream calls and cache
// population. Shared by every I/O loop; all members are read-only or
// synchronize themselves.
class Gateway : llmrouter::common::noncopyable {
public:
    static constexpr const char* kPolicyHeader = "X-LLM-Router-Policy";
    static constexpr const char* kBackendHeader = "X-LLM-Router-Backend";
    static constexpr const char* kCacheHeader = "X-LLM-Router-Cache";

    Gateway(const llmrouter::common::GatewaySettings& settings,
            const llmrouter::balancer::PolicyRegistry& policies,
            llmrouter::balancer::Balancer* balancer,
            llmrouter::balancer::CircuitBreakerRegistry* breakers,
            llmrouter::protocol::ResponseCache* cache,
            llmrouter::monitor::RateLimiter* rateLimiter,
            Classifier* classifier,
            Upstream* upstream);

    // Runs on input.loop's thread.
    void Process(RequestInput input, const ResponseSinkPtr& sink);

    const llmrouter::common::GatewaySettings& settings() const { return settings_; }

private:
    struct RequestContext;
    using ContextPtr = std::shared_ptr<RequestContext>;

    bool CacheUsable(const RequestContext& ctx) const;
    bool LookupCache(const ContextPtr& ctx);
    void Route(const ContextPtr& ctx);
    void Dispatch(const ContextPtr& ctx, std::vector<llmrouter::balancer::BackendPtr> candidates,
                  const std::string& cursorLabel, const std::string& strategy);
    void OnOutcome(const ContextPtr& ctx, RetryOrchestrator::Outcome outcome);
    void StoreInCache(const ContextPtr& ctx, const RetryOrchestrator::Outcome& outcome);
    void RecordUsage(const llmrouter::balancer::Backend& backend, const std::string& body);
    void Fail(const ContextPtr& ctx, const llmrouter::common::GatewayError& error);
    HeaderList ResponseHeaders(const RequestContext& ctx, const std::string& backend) const;
    void ObserveLatency(const RequestContext& ctx, double upstreamSeconds);

    const llmrouter::common::GatewaySettings settings_;
    const llmrouter::balancer::PolicyRegistry& policies_;
    llmrouter::protocol::ResponseCache* cache_;
    llmrouter::monitor::RateLimiter* rateLimiter_;
    Classifier* classifier_;
    RetryOrchestrator retry_;
};

} // namespace router
} // namespace llmrouter
