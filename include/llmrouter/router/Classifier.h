#pragma once

#include "llmrouter/common/noncopyable.h"

#include <functional>
#include <string>

namespace llmrouter {
namespace network {
class EventLoop;
}
namespace balancer {
class Policy;
}
namespace protocol {
class HttpClient;
}

namespace router {

struct Classification {
    bool ok{false};
    std::string label;     // canonical label of the policy when ok
    double confidence{0.0};
    std::string error;     // why classification is unavailable
};

using ClassifyCallback = std::function<void(Classification)>;

// Maps request text to one of a policy's labels. One bounded attempt, no
// retries; the callback runs exactly once on the given loop.
class Classifier : llmrouter::common::noncopyable {
public:
    virtual ~Classifier() = default;

    virtual void Classify(llmrouter::network::EventLoop* loop,
                          const llmrouter::balancer::Policy& policy,
                          const std::string& text,
                          ClassifyCallback done) = 0;
};

// kClassifier policies: KServe v2 inference request to the policy url.
// kAgentic policies: chat completion asking the agent model for an identifier.
class RemoteClassifier : public Classifier {
public:
    RemoteClassifier(llmrouter::protocol::HttpClient* client, double timeoutSec);

    void Classify(llmrouter::network::EventLoop* loop,
                  const llmrouter::balancer::Policy& policy,
                  const std::string& text,
                  ClassifyCallback done) override;

    // Both return a Classification whose label is already validated against the policy.
    static Classification ParseInferResponse(const llmrouter::balancer::Policy& policy, const std::string& body);
    static Classification ParseAgentResponse(const llmrouter::balancer::Policy& policy, const std::string& body);

    static std::string BuildInferRequest(const std::string& text);
    static std::string BuildAgentRequest(const llmrouter::balancer::Policy& policy, const std::string& text);

private:
    llmrouter::protocol::HttpClient* client_;
    double timeoutSec_;
};

} // namespace router
} // namespace llmrouter
