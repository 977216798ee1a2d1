#include "llmrouter/balancer/PolicyRegistry.h"
#include "llmrouter/common/Config.h"
#include "llmrouter/common/GatewayError.h"
#include "llmrouter/common/Logger.h"

#include <algorithm>
#include <cctype>

namespace llmrouter {
namespace balancer {

using llmrouter::common::Config;
using llmrouter::common::ErrorKind;
using llmrouter::common::GatewayException;

namespace {

const char* const kPolicyPrefix = "policy:";
const char* const kLlmPrefix = "llm:";

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string Get(const Config::Section& section, const std::string& key) {
    auto it = section.find(key);
    return it != section.end() ? it->second : std::string();
}

bool ResolveUrl(const std::string& text, bool resolveHosts, protocol::Url* url, network::InetAddress* addr,
                const std::string& what, std::vector<std::string>* errors) {
    if (!protocol::Url::Parse(text, url)) {
        errors->push_back(what + ": invalid url '" + text + "'");
        return false;
    }
    if (resolveHosts && !network::InetAddress::Resolve(url->host, url->port, addr)) {
        errors->push_back(what + ": cannot resolve host '" + url->host + "'");
        return false;
    }
    return true;
}

} // namespace

const char* PolicyKindName(PolicyKind kind) {
    switch (kind) {
        case PolicyKind::kClassifier: return "classifier";
        case PolicyKind::kAgentic: return "agentic";
        case PolicyKind::kStatic: return "static";
    }
    return "unknown";
}

std::string ChatCompletionsUrl(const std::string& apiBase) {
    std::string base = apiBase;
    while (!base.empty() && base.back() == '/') base.pop_back();
    if (base.size() >= 3 && base.compare(base.size() - 3, 3, "/v1") == 0) {
        return base + "/chat/completions";
    }
    return base + "/v1/chat/completions";
}

std::string Policy::CanonicalLabel(const std::string& label) const {
    const std::string wanted = Lower(label);
    for (const auto& l : labels_) {
        if (Lower(l) == wanted) return l;
    }
    return std::string();
}

std::vector<BackendPtr> Policy::BackendsForLabel(const std::string& label) const {
    std::vector<BackendPtr> out;
    const std::string canonical = CanonicalLabel(label);
    if (canonical.empty()) return out;
    for (const auto& b : backends_) {
        if (b->label == canonical) out.push_back(b);
    }
    return out;
}

std::vector<BackendPtr> Policy::BackendsForModel(const std::string& name) const {
    std::vector<BackendPtr> out = BackendsForLabel(name);
    if (!out.empty()) return out;
    for (const auto& b : backends_) {
        if (b->model == name) out.push_back(b);
    }
    return out;
}

std::atomic<size_t>& Policy::Cursor(const std::string& label) const {
    auto it = cursors_.find(label);
    if (it == cursors_.end()) it = cursors_.find(std::string());
    return *it->second;
}

std::unique_ptr<PolicyRegistry> PolicyRegistry::FromConfig(const Config& conf,
                                                           const std::string& defaultPolicy,
                                                           bool resolveHosts,
                                                           std::vector<std::string>* errors) {
    const size_t errorsBefore = errors->size();
    std::unique_ptr<PolicyRegistry> reg(new PolicyRegistry());
    reg->defaultPolicy_ = defaultPolicy;

    for (const auto& entry : conf.GetSectionsWithPrefix(kPolicyPrefix)) {
        const std::string name = entry.first.substr(std::char_traits<char>::length(kPolicyPrefix));
        const Config::Section& sec = entry.second;
        const std::string what = "[" + entry.first + "]";
        if (name.empty()) {
            errors->push_back(what + ": policy name is empty");
            continue;
        }

        std::string type = Lower(Get(sec, "type"));
        if (type.empty()) {
            type = !Get(sec, "url").empty() ? "classifier" : !Get(sec, "agent_model").empty() ? "agentic" : "static";
        }
        PolicyKind kind;
        if (type == "classifier" || type == "triton") {
            kind = PolicyKind::kClassifier;
        } else if (type == "agentic" || type == "agent") {
            kind = PolicyKind::kAgentic;
        } else if (type == "static") {
            kind = PolicyKind::kStatic;
        } else {
            errors->push_back(what + ": unknown type '" + type + "'");
            continue;
        }

        auto policy = std::make_unique<Policy>(name, kind);
        if (kind == PolicyKind::kClassifier) {
            const std::string url = Get(sec, "url");
            if (url.empty()) {
                errors->push_back(what + ": classifier policy needs a url");
            } else {
                ResolveUrl(url, resolveHosts, &policy->url_, &policy->urlAddress_, what, errors);
            }
        } else if (kind == PolicyKind::kAgentic) {
            AgentSettings& agent = policy->agent_;
            agent.apiBase = Get(sec, "agent_api_base");
            agent.apiKey = Get(sec, "agent_api_key");
            agent.model = Get(sec, "agent_model");
            if (agent.model.empty()) errors->push_back(what + ": agentic policy needs agent_model");
            if (agent.apiBase.empty()) {
                errors->push_back(what + ": agentic policy needs agent_api_base");
            } else {
                ResolveUrl(ChatCompletionsUrl(agent.apiBase), resolveHosts, &agent.endpoint, &agent.address,
                           what, errors);
            }
        }
        policy->fallbackLabel_ = Get(sec, "fallback_label");

        if (reg->byName_.count(name)) {
            errors->push_back(what + ": duplicate policy");
            continue;
        }
        reg->byName_[name] = policy.get();
        reg->policies_.push_back(std::move(policy));
    }

    for (const auto& entry : conf.GetSectionsWithPrefix(kLlmPrefix)) {
        const std::string rest = entry.first.substr(std::char_traits<char>::length(kLlmPrefix));
        const Config::Section& sec = entry.second;
        const std::string what = "[" + entry.first + "]";
        const size_t colon = rest.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= rest.size()) {
            errors->push_back(what + ": expected [llm:<policy>:<id>]");
            continue;
        }
        const std::string policyName = rest.substr(0, colon);
        auto pit = reg->byName_.find(policyName);
        if (pit == reg->byName_.end()) {
            errors->push_back(what + ": unknown policy '" + policyName + "'");
            continue;
        }

        auto backend = std::make_shared<Backend>();
        backend->policy = policyName;
        backend->id = rest.substr(colon + 1);
        backend->name = Get(sec, "name");
        if (backend->name.empty()) backend->name = backend->id;
        backend->label = Get(sec, "identifier");
        if (backend->label.empty()) backend->label = backend->name;
        backend->apiBase = Get(sec, "api_base");
        backend->apiKey = Get(sec, "api_key");
        backend->model = Get(sec, "model");

        const std::string weight = Get(sec, "weight");
        if (!weight.empty()) {
            try {
                backend->weight = std::stoi(weight);
            } catch (const std::exception&) {
                backend->weight = -1;
            }
            if (backend->weight < 0) errors->push_back(what + ": weight must be an integer >= 0");
        }
        if (backend->model.empty()) errors->push_back(what + ": model is required");
        if (backend->apiKey.empty()) errors->push_back(what + ": api_key is required");
        if (backend->apiBase.empty()) {
            errors->push_back(what + ": api_base is required");
        } else {
            ResolveUrl(ChatCompletionsUrl(backend->apiBase), resolveHosts, &backend->endpoint, &backend->address,
                       what, errors);
        }

        Policy* policy = pit->second;
        // Labels differing only in case are one label, spelled as first declared.
        const std::string canonical = policy->CanonicalLabel(backend->label);
        if (canonical.empty()) {
            policy->labels_.push_back(backend->label);
        } else {
            backend->label = canonical;
        }
        policy->backends_.push_back(std::move(backend));
    }

    for (auto& policy : reg->policies_) {
        const std::string what = "[policy:" + policy->name() + "]";
        if (policy->backends_.empty()) {
            errors->push_back(what + ": no [llm:" + policy->name() + ":<id>] backends");
        }
        if (!policy->fallbackLabel_.empty()) {
            const std::string canonical = policy->CanonicalLabel(policy->fallbackLabel_);
            if (canonical.empty()) {
                errors->push_back(what + ": fallback_label '" + policy->fallbackLabel_ + "' matches no backend");
            }
            policy->fallbackLabel_ = canonical;
        } else {
            for (const char* candidate : {"unknown", "other", "default"}) {
                const std::string canonical = policy->CanonicalLabel(candidate);
                if (!canonical.empty()) {
                    policy->fallbackLabel_ = canonical;
                    break;
                }
            }
        }

        policy->cursors_[std::string()] = std::make_unique<std::atomic<size_t>>(0);
        for (const auto& label : policy->labels_) {
            policy->cursors_[label] = std::make_unique<std::atomic<size_t>>(0);
        }
    }

    if (defaultPolicy.empty()) {
        errors->push_back("global.default_policy is required");
    } else if (!reg->byName_.count(defaultPolicy)) {
        errors->push_back("global.default_policy '" + defaultPolicy + "' is not a configured policy");
    }

    if (errors->size() != errorsBefore) return nullptr;

    for (const auto& policy : reg->policies_) {
        LOG_INFO << "policy " << policy->name() << " (" << PolicyKindName(policy->kind()) << "): "
                 << policy->backends().size() << " backends, " << policy->labels().size() << " labels"
                 << (policy->fallbackLabel().empty() ? "" : ", fallback " + policy->fallbackLabel());
    }
    return reg;
}

const Policy* PolicyRegistry::Find(const std::string& name) const {
    auto it = byName_.find(name);
    return it != byName_.end() ? it->second : nullptr;
}

const Policy& PolicyRegistry::Resolve(const std::string& name) const {
    const std::string& wanted = name.empty() ? defaultPolicy_ : name;
    const Policy* policy = Find(wanted);
    if (!policy) {
        throw GatewayException(ErrorKind::kPolicyNotFound, "policy '" + wanted + "' not found");
    }
    return *policy;
}

std::vector<const Policy*> PolicyRegistry::policies() const {
    std::vector<const Policy*> out;
    out.reserve(policies_.size());
    for (const auto& p : policies_) out.push_back(p.get());
    return out;
}

std::vector<BackendPtr> PolicyRegistry::AllBackends() const {
    std::vector<BackendPtr> out;
    for (const auto& p : policies_) {
        out.insert(out.end(), p->backends().begin(), p->backends().end());
    }
    return out;
}

} // namespace balancer
} // namespace llmrouter
