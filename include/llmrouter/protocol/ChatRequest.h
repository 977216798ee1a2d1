#pragma once

#include <json/json.h>

#include <cstdint>
#include <string>

namespace llmrouter {
namespace protocol {

// The "nim-llm-router" extension object of a chat completion request.
struct RoutingHints {
    std::string policy;
    std::string routingStrategy; // "manual" pins hints.model as the label
    std::string model;
};

// OpenAI-style chat completion body plus the router's extension field.
class ChatRequest {
public:
    // Throws GatewayException(kInvalidRequest) for anything that is not a
    // JSON object with a "messages" array.
    static ChatRequest Parse(const std::string& body);

    const Json::Value& payload() const { return payload_; }
    const RoutingHints& hints() const { return hints_; }

    bool stream() const { return stream_; }
    // "cache": false in the body.
    bool cacheOptOut() const { return cacheOptOut_; }
    // temperature <= 0.01 and top_p >= 0.999; absent values count as deterministic.
    bool Deterministic() const;

    // Top-level "model", may be empty.
    std::string model() const;

    // Text used for classification: the last user message, array parts
    // joined; without a user message every message's content.
    std::string PromptText() const;

    // SHA-256 hex over policy, path, routing hints and the response-relevant
    // payload fields serialized with sorted keys.
    std::string Fingerprint(const std::string& policy, const std::string& path) const;

    // Body forwarded to a backend: extension field removed, model replaced,
    // message text sanitized.
    std::string BuildUpstreamBody(const std::string& backendModel) const;

    // Typographic quotes, dashes and ellipsis to ASCII; Unicode tag
    // characters U+E0020..U+E007F removed.
    static std::string Sanitize(const std::string& text);

private:
    Json::Value payload_;
    RoutingHints hints_;
    bool stream_{false};
    bool cacheOptOut_{false};
};

struct TokenUsage {
    bool present{false};
    int64_t promptTokens{0};
    int64_t completionTokens{0};
    int64_t totalTokens{0};
};

// Reads "usage" from a JSON completion or, for an event stream, from the
// last data event that carries one.
TokenUsage ParseUsage(const std::string& body);

// Compact serialization; object keys come out sorted.
std::string WriteJson(const Json::Value& value);
bool ReadJson(const std::string& text, Json::Value* out, std::string* errors = nullptr);

std::string Sha256Hex(const std::string& data);

} // namespace protocol
} // namespace llmrouter
