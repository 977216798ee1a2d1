#include "llmrouter/router/Classifier.h"
#include "llmrouter/balancer/PolicyRegistry.h"
#include "llmrouter/common/Logger.h"
#include "llmrouter/protocol/ChatRequest.h"
#include "llmrouter/protocol/Compression.h"
#include "llmrouter/protocol/HttpClient.h"

#include <cctype>
#include <exception>

namespace llmrouter {
namespace router {

using llmrouter::balancer::Policy;
using llmrouter::balancer::PolicyKind;
using llmrouter::protocol::HttpClient;

namespace {

Classification Unavailable(const std::string& why) {
    Classification c;
    c.error = why;
    return c;
}

Classification Matched(const Policy& policy, const std::string& raw, double confidence) {
    const std::string label = policy.CanonicalLabel(raw);
    if (label.empty()) return Unavailable("label '" + raw + "' is not configured in policy " + policy.name());
    Classification c;
    c.ok = true;
    c.label = label;
    c.confidence = confidence;
    return c;
}

// Flattens nested "data" arrays ([[..]] for shape [1, N]).
void Flatten(const Json::Value& v, std::vector<const Json::Value*>* out) {
    if (v.isArray()) {
        for (const auto& item : v) Flatten(item, out);
    } else {
        out->push_back(&v);
    }
}

std::string NormalizeAnswer(std::string s) {
    auto strip = [&s](const std::string& chars) {
        while (!s.empty() && (std::isspace(static_cast<unsigned char>(s.front())) || chars.find(s.front()) != std::string::npos)) {
            s.erase(s.begin());
        }
        while (!s.empty() && (std::isspace(static_cast<unsigned char>(s.back())) || chars.find(s.back()) != std::string::npos)) {
            s.pop_back();
        }
    };
    strip("\"'`*");
    // Trailing punctuation, then any quote it was hiding.
    while (!s.empty() && std::string(".,;:!?").find(s.back()) != std::string::npos) s.pop_back();
    strip("\"'`*");
    return s;
}

} // namespace

RemoteClassifier::RemoteClassifier(HttpClient* client, double timeoutSec)
    : client_(client), timeoutSec_(timeoutSec) {
}

std::string RemoteClassifier::BuildInferRequest(const std::string& text) {
    Json::Value input(Json::objectValue);
    input["name"] = "INPUT";
    input["datatype"] = "BYTES";
    input["shape"].append(1);
    input["shape"].append(1);
    Json::Value row(Json::arrayValue);
    row.append(text);
    input["data"].append(row);

    Json::Value req(Json::objectValue);
    req["inputs"].append(input);
    return protocol::WriteJson(req);
}

std::string RemoteClassifier::BuildAgentRequest(const Policy& policy, const std::string& text) {
    std::string system =
        "You route user requests to the most suitable model. "
        "Answer with exactly one identifier from this list and nothing else:\n";
    for (const auto& label : policy.labels()) {
        const auto backends = policy.BackendsForLabel(label);
        system += label + ": " + (backends.empty() ? label : backends.front()->name) + "\n";
    }

    Json::Value req(Json::objectValue);
    req["model"] = policy.agent().model;
    Json::Value sys(Json::objectValue);
    sys["role"] = "system";
    sys["content"] = system;
    Json::Value user(Json::objectValue);
    user["role"] = "user";
    user["content"] = text;
    req["messages"].append(sys);
    req["messages"].append(user);
    req["temperature"] = 0.0;
    req["max_tokens"] = 32;
    req["stream"] = false;
    return protocol::WriteJson(req);
}

Classification RemoteClassifier::ParseInferResponse(const Policy& policy, const std::string& body) {
    Json::Value doc;
    if (!protocol::ReadJson(body, &doc) || !doc.isObject()) return Unavailable("classifier response is not JSON");
    const Json::Value& outputs = doc["outputs"];
    if (!outputs.isArray() || outputs.empty() || !outputs[0].isObject()) {
        return Unavailable("classifier response has no outputs");
    }
    const Json::Value& output = outputs[0];
    std::vector<const Json::Value*> data;
    Flatten(output["data"], &data);
    if (data.empty()) return Unavailable("classifier output is empty");

    const Json::Value& datatype = output["datatype"];
    const bool bytes = datatype.isString() && datatype.asString() == "BYTES";
    if (bytes || data.front()->isString()) {
        if (!data.front()->isString()) return Unavailable("classifier BYTES output is not a string");
        return Matched(policy, NormalizeAnswer(data.front()->asString()), 1.0);
    }

    size_t best = 0;
    double bestScore = 0.0;
    for (size_t i = 0; i < data.size(); ++i) {
        if (!data[i]->isNumeric()) return Unavailable("classifier output mixes numbers and strings");
        const double score = data[i]->asDouble();
        if (i == 0 || score > bestScore) {
            best = i;
            bestScore = score;
        }
    }
    if (best >= policy.labels().size()) {
        return Unavailable("classifier index " + std::to_string(best) + " has no label in policy " + policy.name());
    }
    return Matched(policy, policy.labels()[best], bestScore);
}

Classification RemoteClassifier::ParseAgentResponse(const Policy& policy, const std::string& body) {
    Json::Value doc;
    if (!protocol::ReadJson(body, &doc) || !doc.isObject()) return Unavailable("agent response is not JSON");
    const Json::Value& choices = doc["choices"];
    if (!choices.isArray() || choices.empty()) return Unavailable("agent response has no choices");
    const Json::Value& choice = choices[0];
    if (!choice.isObject() || !choice["message"].isObject()) return Unavailable("agent response has no message");
    const Json::Value& content = choice["message"]["content"];
    if (!content.isString()) return Unavailable("agent response has no message content");
    return Matched(policy, NormalizeAnswer(content.asString()), 1.0);
}

void RemoteClassifier::Classify(llmrouter::network::EventLoop* loop,
                                const Policy& policy,
                                const std::string& text,
                                ClassifyCallback done) {
    HttpClient::Request req;
    req.timeoutSec = timeoutSec_;
    req.headers.emplace_back("Content-Type", "application/json");
    req.headers.emplace_back("Accept", "application/json");

    const bool agentic = policy.kind() == PolicyKind::kAgentic;
    if (agentic) {
        req.url = policy.agent().endpoint;
        req.address = policy.agent().address;
        if (!policy.agent().apiKey.empty()) {
            req.headers.emplace_back("Authorization", "Bearer " + policy.agent().apiKey);
        }
        req.body = BuildAgentRequest(policy, text);
    } else if (policy.kind() == PolicyKind::kClassifier) {
        req.url = policy.url();
        req.address = policy.urlAddress();
        req.body = BuildInferRequest(text);
    } else {
        done(Unavailable("policy " + policy.name() + " does not classify"));
        return;
    }

    const Policy* p = &policy;
    HttpClient::Handlers handlers;
    handlers.onComplete = [p, agentic, done](HttpClient::Failure failure, HttpClient::Response resp) {
        if (failure != HttpClient::Failure::kNone) {
            done(Unavailable(std::string("classifier call failed: ") + HttpClient::FailureName(failure)));
            return;
        }
        if (resp.status < 200 || resp.status >= 300) {
            done(Unavailable("classifier returned HTTP " + std::to_string(resp.status)));
            return;
        }
        std::string body;
        const auto enc = protocol::Compression::ParseContentEncoding(resp.header("Content-Encoding"));
        if (!protocol::Compression::Decompress(enc, resp.body, &body)) {
            done(Unavailable("cannot decode classifier response"));
            return;
        }
        Classification c;
        try {
            c = agentic ? ParseAgentResponse(*p, body) : ParseInferResponse(*p, body);
        } catch (const std::exception& e) {
            c = Unavailable(std::string("malformed classifier response: ") + e.what());
        }
        if (!c.ok) {
            LOG_WARN << "policy " << p->name() << ": " << c.error;
        } else {
            LOG_DEBUG << "policy " << p->name() << " classified as " << c.label << " (" << c.confidence << ")";
        }
        done(std::move(c));
    };
    client_->Fetch(loop, std::move(req), std::move(handlers));
}

} // namespace router
} // namespace llmrouter
