#include "llmrouter/protocol/ChatRequest.h"
#include "llmrouter/common/GatewayError.h"
#include "llmrouter/common/Logger.h"

#include <openssl/evp.h>

#include <memory>
#include <sstream>

namespace llmrouter {
namespace protocol {

using llmrouter::common::ErrorKind;
using llmrouter::common::GatewayException;

namespace {

const char* const kExtensionField = "nim-llm-router";

const char* const kFingerprintFields[] = {
    "messages", "model", "temperature", "top_p", "max_tokens",
    "frequency_penalty", "presence_penalty", "stop", "stream",
};

std::string ContentText(const Json::Value& content) {
    if (content.isString()) return content.asString();
    std::string out;
    if (content.isArray()) {
        for (const auto& part : content) {
            std::string text;
            if (part.isString()) {
                text = part.asString();
            } else if (part.isObject() && part["text"].isString()) {
                text = part["text"].asString();
            }
            if (text.empty()) continue;
            if (!out.empty()) out += "\n";
            out += text;
        }
    }
    return out;
}

// A routing hint is absent, null or a string; anything else is a client error.
std::string HintField(const Json::Value& ext, const char* key) {
    const Json::Value& v = ext[key];
    if (v.isNull()) return std::string();
    if (!v.isString()) {
        throw GatewayException(ErrorKind::kInvalidRequest,
                               std::string("\"") + kExtensionField + "." + key + "\" must be a string");
    }
    return v.asString();
}

void SanitizeContent(Json::Value* content) {
    if (content->isString()) {
        *content = ChatRequest::Sanitize(content->asString());
    } else if (content->isArray()) {
        for (auto& part : *content) {
            if (part.isObject() && part["text"].isString()) {
                part["text"] = ChatRequest::Sanitize(part["text"].asString());
            }
        }
    }
}

} // namespace

std::string WriteJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

bool ReadJson(const std::string& text, Json::Value* out, std::string* errors) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errs;
    const bool ok = reader->parse(text.data(), text.data() + text.size(), out, &errs);
    if (errors) *errors = errs;
    return ok;
}

std::string Sha256Hex(const std::string& data) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int len = 0;
    if (EVP_Digest(data.data(), data.size(), md, &len, EVP_sha256(), nullptr) != 1) {
        throw GatewayException(ErrorKind::kCacheUnavailable, "SHA-256 digest failed");
    }
    static const char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);
    for (unsigned int i = 0; i < len; ++i) {
        hex.push_back(kHex[md[i] >> 4]);
        hex.push_back(kHex[md[i] & 0x0f]);
    }
    return hex;
}

ChatRequest ChatRequest::Parse(const std::string& body) {
    ChatRequest req;
    std::string errs;
    if (!ReadJson(body, &req.payload_, &errs)) {
        throw GatewayException(ErrorKind::kInvalidRequest, "request body is not valid JSON: " + errs);
    }
    if (!req.payload_.isObject()) {
        throw GatewayException(ErrorKind::kInvalidRequest, "request body must be a JSON object");
    }
    const Json::Value& messages = req.payload_["messages"];
    if (!messages.isArray() || messages.empty()) {
        throw GatewayException(ErrorKind::kInvalidRequest, "\"messages\" must be a non-empty array");
    }

    if (req.payload_.isMember(kExtensionField)) {
        const Json::Value& ext = req.payload_[kExtensionField];
        if (!ext.isObject()) {
            throw GatewayException(ErrorKind::kInvalidRequest,
                                   std::string("\"") + kExtensionField + "\" must be an object");
        }
        req.hints_.policy = HintField(ext, "policy");
        req.hints_.routingStrategy = HintField(ext, "routing_strategy");
        req.hints_.model = HintField(ext, "model");
    }

    const Json::Value& stream = req.payload_["stream"];
    req.stream_ = stream.isBool() && stream.asBool();
    const Json::Value& cache = req.payload_["cache"];
    req.cacheOptOut_ = cache.isBool() && !cache.asBool();
    return req;
}

bool ChatRequest::Deterministic() const {
    const Json::Value& temperature = payload_["temperature"];
    if (temperature.isNumeric() && temperature.asDouble() > 0.01) return false;
    const Json::Value& topP = payload_["top_p"];
    if (topP.isNumeric() && topP.asDouble() < 0.999) return false;
    return true;
}

std::string ChatRequest::model() const {
    const Json::Value& m = payload_["model"];
    return m.isString() ? m.asString() : std::string();
}

std::string ChatRequest::PromptText() const {
    const Json::Value& messages = payload_["messages"];
    for (Json::ArrayIndex i = messages.size(); i > 0; --i) {
        const Json::Value& msg = messages[i - 1];
        if (msg.isObject() && msg["role"].isString() && msg["role"].asString() == "user") {
            return ContentText(msg["content"]);
        }
    }
    std::string all;
    for (const auto& msg : messages) {
        if (!msg.isObject()) continue;
        const std::string text = ContentText(msg["content"]);
        if (text.empty()) continue;
        if (!all.empty()) all += "\n";
        all += text;
    }
    return all;
}

std::string ChatRequest::Fingerprint(const std::string& policy, const std::string& path) const {
    Json::Value normalized(Json::objectValue);
    for (const char* field : kFingerprintFields) {
        if (payload_.isMember(field)) normalized[field] = payload_[field];
    }
    std::ostringstream key;
    key << policy << '\n'
        << path << '\n'
        << hints_.policy << '|' << hints_.routingStrategy << '|' << hints_.model << '\n'
        << WriteJson(normalized);
    return Sha256Hex(key.str());
}

std::string ChatRequest::BuildUpstreamBody(const std::string& backendModel) const {
    Json::Value body = payload_;
    body.removeMember(kExtensionField);
    body.removeMember("cache");
    if (!backendModel.empty()) body["model"] = backendModel;

    Json::Value& messages = body["messages"];
    for (auto& msg : messages) {
        if (msg.isObject() && msg.isMember("content")) SanitizeContent(&msg["content"]);
    }
    if (body["prompt"].isString()) {
        body["prompt"] = Sanitize(body["prompt"].asString());
    }
    return WriteJson(body);
}

std::string ChatRequest::Sanitize(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    const size_t n = text.size();
    size_t i = 0;
    while (i < n) {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        // U+2013, U+2014, U+2018, U+2019, U+201C, U+201D, U+2026 are E2 80 xx.
        if (c == 0xE2 && i + 2 < n && static_cast<unsigned char>(text[i + 1]) == 0x80) {
            const char* replacement = nullptr;
            switch (static_cast<unsigned char>(text[i + 2])) {
                case 0x93: replacement = "-"; break;
                case 0x94: replacement = "--"; break;
                case 0x98:
                case 0x99: replacement = "'"; break;
                case 0x9C:
                case 0x9D: replacement = "\""; break;
                case 0xA6: replacement = "..."; break;
                default: break;
            }
            if (replacement) {
                out += replacement;
                i += 3;
                continue;
            }
        }
        // Tag block: F3 A0 80 A0 (U+E0020) .. F3 A0 81 BF (U+E007F).
        if (c == 0xF3 && i + 3 < n && static_cast<unsigned char>(text[i + 1]) == 0xA0) {
            const unsigned char b2 = static_cast<unsigned char>(text[i + 2]);
            const unsigned char b3 = static_cast<unsigned char>(text[i + 3]);
            const bool tag = (b2 == 0x80 && b3 >= 0xA0 && b3 <= 0xBF) || (b2 == 0x81 && b3 >= 0x80 && b3 <= 0xBF);
            if (tag) {
                i += 4;
                continue;
            }
        }
        out.push_back(static_cast<char>(c));
        ++i;
    }
    return out;
}

static bool TokenCount(const Json::Value& v, int64_t fallback, int64_t* out) {
    if (v.isNull()) {
        *out = fallback;
        return true;
    }
    if (!v.isInt64() || v.asInt64() < 0) return false;
    *out = v.asInt64();
    return true;
}

// Counts that are not non-negative integers leave the usage unreported.
static bool UsageFrom(const Json::Value& doc, TokenUsage* usage) {
    if (!doc.isObject()) return false;
    const Json::Value& u = doc["usage"];
    if (!u.isObject()) return false;
    int64_t prompt = 0;
    int64_t completion = 0;
    int64_t total = 0;
    if (!TokenCount(u["prompt_tokens"], 0, &prompt) || !TokenCount(u["completion_tokens"], 0, &completion) ||
        !TokenCount(u["total_tokens"], prompt + completion, &total)) {
        LOG_DEBUG << "ignoring malformed token usage in upstream response";
        return false;
    }
    usage->present = true;
    usage->promptTokens = prompt;
    usage->completionTokens = completion;
    usage->totalTokens = total;
    return true;
}

TokenUsage ParseUsage(const std::string& body) {
    TokenUsage usage;
    Json::Value doc;
    const size_t first = body.find_first_not_of(" \t\r\n");
    if (first != std::string::npos && body[first] == '{') {
        if (ReadJson(body, &doc)) UsageFrom(doc, &usage);
        return usage;
    }

    std::istringstream in(body);
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.compare(0, 5, "data:") != 0) continue;
        const std::string data = line.substr(line.find_first_not_of(' ', 5) == std::string::npos
                                                 ? line.size()
                                                 : line.find_first_not_of(' ', 5));
        if (data.empty() || data == "[DONE]") continue;
        Json::Value event;
        if (ReadJson(data, &event)) UsageFrom(event, &usage);
    }
    if (!usage.present) LOG_DEBUG << "no token usage in upstream response";
    return usage;
}

} // namespace protocol
} // namespace llmrouter
