#include "llmrouter/protocol/ChatRequest.h"
#include "llmrouter/common/GatewayError.h"
#include "llmrouter/common/Logger.h"

#include <cassert>
#include <string>

using llmrouter::common::ErrorKind;
using llmrouter::common::GatewayException;
using llmrouter::common::Logger;
using llmrouter::common::LogLevel;
using namespace llmrouter::protocol;

static bool rejects(const std::string& body) {
    try {
        ChatRequest::Parse(body);
    } catch (const GatewayException& e) {
        assert(e.error().kind == ErrorKind::kInvalidRequest);
        assert(e.error().HttpStatus() == 400);
        return true;
    }
    return false;
}

static void testParseValidation() {
    assert(rejects("not json"));
    assert(rejects("[1,2]"));
    assert(rejects("{\"model\":\"x\"}"));
    assert(rejects("{\"messages\":[]}"));
    assert(rejects("{\"messages\":\"hi\"}"));
    assert(rejects("{\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}],\"nim-llm-router\":\"task_router\"}"));
    // Hint values must be strings.
    assert(rejects("{\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}],\"nim-llm-router\":{\"policy\":{}}}"));
    assert(rejects("{\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}],\"nim-llm-router\":{\"model\":[1]}}"));
    assert(rejects("{\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}],"
                   "\"nim-llm-router\":{\"routing_strategy\":true}}"));
    assert(!rejects("{\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}],\"nim-llm-router\":{\"policy\":null}}"));
}

static void testHintsAndFlags() {
    auto req = ChatRequest::Parse(
        "{\"model\":\"\",\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}],"
        "\"stream\":true,\"cache\":false,"
        "\"nim-llm-router\":{\"policy\":\"task_router\",\"routing_strategy\":\"manual\",\"model\":\"Chatbot\"}}");
    assert(req.hints().policy == "task_router");
    assert(req.hints().routingStrategy == "manual");
    assert(req.hints().model == "Chatbot");
    assert(req.stream());
    assert(req.cacheOptOut());
    assert(req.model().empty());

    auto plain = ChatRequest::Parse("{\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}]}");
    assert(!plain.stream());
    assert(!plain.cacheOptOut());
    assert(plain.hints().policy.empty());
}

static void testDeterministic() {
    auto absent = ChatRequest::Parse("{\"messages\":[{\"role\":\"user\",\"content\":\"a\"}]}");
    assert(absent.Deterministic());
    auto zero = ChatRequest::Parse("{\"messages\":[{\"role\":\"user\",\"content\":\"a\"}],\"temperature\":0}");
    assert(zero.Deterministic());
    auto warm = ChatRequest::Parse("{\"messages\":[{\"role\":\"user\",\"content\":\"a\"}],\"temperature\":0.7}");
    assert(!warm.Deterministic());
    auto nucleus = ChatRequest::Parse("{\"messages\":[{\"role\":\"user\",\"content\":\"a\"}],\"top_p\":0.9}");
    assert(!nucleus.Deterministic());
}

static void testPromptText() {
    auto req = ChatRequest::Parse(
        "{\"messages\":["
        "{\"role\":\"system\",\"content\":\"be brief\"},"
        "{\"role\":\"user\",\"content\":\"first\"},"
        "{\"role\":\"assistant\",\"content\":\"ok\"},"
        "{\"role\":\"user\",\"content\":[{\"type\":\"text\",\"text\":\"write\"},{\"type\":\"text\",\"text\":\"code\"}]}"
        "]}");
    assert(req.PromptText() == "write\ncode");

    auto noUser = ChatRequest::Parse(
        "{\"messages\":[{\"role\":\"system\",\"content\":\"a\"},{\"role\":\"assistant\",\"content\":\"b\"}]}");
    assert(noUser.PromptText() == "a\nb");
}

static void testFingerprint() {
    auto a = ChatRequest::Parse(
        "{\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}],\"temperature\":0,\"user\":\"alice\"}");
    // Same content, keys reordered, different non-semantic field.
    auto b = ChatRequest::Parse(
        "{\"user\":\"bob\",\"temperature\":0,\"messages\":[{\"content\":\"hi\",\"role\":\"user\"}]}");
    const std::string fa = a.Fingerprint("task_router", "/v1/chat/completions");
    assert(fa.size() == 64);
    assert(fa == b.Fingerprint("task_router", "/v1/chat/completions"));
    assert(fa != a.Fingerprint("other", "/v1/chat/completions"));
    assert(fa != a.Fingerprint("task_router", "/chat/completions"));

    auto c = ChatRequest::Parse("{\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}],\"temperature\":0,\"max_tokens\":5}");
    assert(fa != c.Fingerprint("task_router", "/v1/chat/completions"));

    auto streamed = ChatRequest::Parse("{\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}],\"temperature\":0,\"stream\":true}");
    assert(fa != streamed.Fingerprint("task_router", "/v1/chat/completions"));

    auto pinned = ChatRequest::Parse(
        "{\"messages\":[{\"role\":\"user\",\"content\":\"hi\"}],\"temperature\":0,"
        "\"nim-llm-router\":{\"routing_strategy\":\"manual\",\"model\":\"Chatbot\"}}");
    assert(fa != pinned.Fingerprint("task_router", "/v1/chat/completions"));
}

static void testSanitize() {
    assert(ChatRequest::Sanitize("a\xE2\x80\x94" "b") == "a--b");
    assert(ChatRequest::Sanitize("1\xE2\x80\x93" "2") == "1-2");
    assert(ChatRequest::Sanitize("\xE2\x80\x9Cq\xE2\x80\x9D") == "\"q\"");
    assert(ChatRequest::Sanitize("it\xE2\x80\x99s") == "it's");
    assert(ChatRequest::Sanitize("wait\xE2\x80\xA6") == "wait...");
    // U+E0041 (tag A) and U+E007F (cancel tag) are dropped.
    assert(ChatRequest::Sanitize("x\xF3\xA0\x81\x81y\xF3\xA0\x81\xBF") == "xy");
    // Other multi-byte text is untouched.
    assert(ChatRequest::Sanitize("caf\xC3\xA9 \xE2\x82\xAC") == "caf\xC3\xA9 \xE2\x82\xAC");
}

static void testUpstreamBody() {
    auto req = ChatRequest::Parse(
        "{\"model\":\"\",\"messages\":[{\"role\":\"user\",\"content\":\"a\xE2\x80\x94" "b\"}],"
        "\"cache\":false,\"nim-llm-router\":{\"policy\":\"p\"}}");
    Json::Value body;
    assert(ReadJson(req.BuildUpstreamBody("meta/llama"), &body));
    assert(!body.isMember("nim-llm-router"));
    assert(!body.isMember("cache"));
    assert(body["model"].asString() == "meta/llama");
    assert(body["messages"][0]["content"].asString() == "a--b");
}

static void testUsage() {
    TokenUsage u = ParseUsage("{\"choices\":[],\"usage\":{\"prompt_tokens\":3,\"completion_tokens\":4,\"total_tokens\":7}}");
    assert(u.present);
    assert(u.promptTokens == 3 && u.completionTokens == 4 && u.totalTokens == 7);

    const std::string sse =
        "data: {\"choices\":[{\"delta\":{\"content\":\"hi\"}}]}\n\n"
        "data: {\"choices\":[],\"usage\":{\"prompt_tokens\":5,\"completion_tokens\":2}}\n\n"
        "data: [DONE]\n\n";
    TokenUsage s = ParseUsage(sse);
    assert(s.present);
    assert(s.promptTokens == 5 && s.completionTokens == 2 && s.totalTokens == 7);

    assert(!ParseUsage("{\"choices\":[]}").present);
    assert(!ParseUsage("garbage").present);

    // Counts of the wrong type leave usage unreported instead of failing the reply.
    assert(!ParseUsage("{\"usage\":{\"prompt_tokens\":\"3\",\"completion_tokens\":4}}").present);
    assert(!ParseUsage("{\"usage\":{\"prompt_tokens\":3,\"completion_tokens\":1e30}}").present);
    assert(!ParseUsage("{\"usage\":{\"prompt_tokens\":-1}}").present);
    assert(!ParseUsage("data: {\"usage\":{\"total_tokens\":{}}}\n\ndata: [DONE]\n\n").present);
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    testParseValidation();
    testHintsAndFlags();
    testDeterministic();
    testPromptText();
    testFingerprint();
    testSanitize();
    testUpstreamBody();
    testUsage();
    LOG_WARN << "ChatRequest tests PASS";
    return 0;
}
