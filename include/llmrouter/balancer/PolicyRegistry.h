#pragma once

#include "llmrouter/balancer/Backend.h"
#include "llmrouter/common/noncopyable.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace llmrouter {
namespace common {
class Config;
}

namespace balancer {

enum class PolicyKind {
    kClassifier, // remote KServe v2 classifier returns a label
    kAgentic,    // an agent model picks an identifier
    kStatic,     // no classification, the whole pool is eligible
};

const char* PolicyKindName(PolicyKind kind);

struct AgentSettings {
    std::string apiBase;
    std::string apiKey;
    std::string model;
    protocol::Url endpoint;
    network::InetAddress address;
};

class Policy : llmrouter::common::noncopyable {
public:
    Policy(std::string name, PolicyKind kind) : name_(std::move(name)), kind_(kind) {}

    const std::string& name() const { return name_; }
    PolicyKind kind() const { return kind_; }

    // Classifier endpoint (kClassifier).
    const protocol::Url& url() const { return url_; }
    const network::InetAddress& urlAddress() const { return urlAddress_; }
    // Agent model (kAgentic).
    const AgentSettings& agent() const { return agent_; }

    // Empty when the policy has none.
    const std::string& fallbackLabel() const { return fallbackLabel_; }

    const std::vector<BackendPtr>& backends() const { return backends_; }
    // Distinct labels in declaration order.
    const std::vector<std::string>& labels() const { return labels_; }

    // Canonical spelling of a label, matched case-insensitively; empty if unknown.
    std::string CanonicalLabel(const std::string& label) const;
    std::vector<BackendPtr> BackendsForLabel(const std::string& label) const;
    // Backends whose label or model id equals name.
    std::vector<BackendPtr> BackendsForModel(const std::string& name) const;

    // Round-robin cursor for a candidate set; "" is the whole pool.
    std::atomic<size_t>& Cursor(const std::string& label) const;

private:
    friend class PolicyRegistry;

    std::string name_;
    PolicyKind kind_;
    protocol::Url url_;
    network::InetAddress urlAddress_;
    AgentSettings agent_;
    std::string fallbackLabel_;
    std::vector<BackendPtr> backends_;
    std::vector<std::string> labels_;
    // Filled during load, read-only afterwards.
    std::map<std::string, std::unique_ptr<std::atomic<size_t>>> cursors_;
};

// Static catalogue of policies built from [policy:<name>] and
// [llm:<policy>:<id>] sections. Read-only after startup.
class PolicyRegistry : llmrouter::common::noncopyable {
public:
    // Appends every problem found to errors and returns nullptr if there is
    // any. With resolveHosts off, backend addresses are left unresolved.
    static std::unique_ptr<PolicyRegistry> FromConfig(const llmrouter::common::Config& conf,
                                                      const std::string& defaultPolicy,
                                                      bool resolveHosts,
                                                      std::vector<std::string>* errors);

    const Policy* Find(const std::string& name) const;

    // Empty name means the default policy. Throws GatewayException(kPolicyNotFound).
    const Policy& Resolve(const std::string& name) const;

    const std::string& defaultPolicy() const { return defaultPolicy_; }
    std::vector<const Policy*> policies() const;
    std::vector<BackendPtr> AllBackends() const;

private:
    PolicyRegistry() = default;

    std::string defaultPolicy_;
    std::vector<std::unique_ptr<Policy>> policies_;
    std::map<std::string, Policy*> byName_;
};

} // namespace balancer
} // namespace llmrouter
