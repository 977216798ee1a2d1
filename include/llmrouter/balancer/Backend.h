#pragma once

#include "llmrouter/network/InetAddress.h"
#include "llmrouter/protocol/Url.h"

#include <memory>
#include <string>

namespace llmrouter {
namespace balancer {

// One LLM endpoint of a policy. Immutable after load.
struct Backend {
    std::string policy;
    std::string id;    // unique within the policy
    std::string name;  // display name
    std::string label; // classifier label / agent identifier; defaults to name
    std::string apiBase;
    std::string apiKey;
    std::string model;
    int weight{1};

    protocol::Url endpoint; // chat completion URL derived from apiBase
    network::InetAddress address;

    // Circuit breaker and metrics key.
    std::string Key() const { return policy + "/" + id; }
};

using BackendPtr = std::shared_ptr<const Backend>;

// api_base + "/v1/chat/completions", or + "/chat/completions" when api_base already ends in /v1.
std::string ChatCompletionsUrl(const std::string& apiBase);

} // namespace balancer
} // namespace llmrouter
