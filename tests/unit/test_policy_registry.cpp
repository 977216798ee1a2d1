#include "llmrouter/balancer/PolicyRegistry.h"
#include "llmrouter/common/Config.h"
#include "llmrouter/common/GatewayError.h"
#include "llmrouter/common/Logger.h"

#include <cassert>
#include <memory>
#include <string>
#include <vector>

using namespace llmrouter::balancer;
using llmrouter::common::Config;
using llmrouter::common::ErrorKind;
using llmrouter::common::GatewayException;
using llmrouter::common::Logger;
using llmrouter::common::LogLevel;

static std::unique_ptr<PolicyRegistry> load(const std::string& ini, const std::string& defaultPolicy,
                                            std::vector<std::string>* errors) {
    auto& conf = Config::Instance();
    assert(conf.LoadFromString(ini));
    return PolicyRegistry::FromConfig(conf, defaultPolicy, false, errors);
}

static bool hasError(const std::vector<std::string>& errors, const std::string& needle) {
    for (const auto& e : errors) {
        if (e.find(needle) != std::string::npos) return true;
    }
    return false;
}

static const char* kValid =
    "[policy:task_router]\n"
    "type = classifier\n"
    "url = http://router-server:8000/v2/models/task_router_ensemble/infer\n"
    "[llm:task_router:code]\n"
    "name = Code Generation\n"
    "api_base = https://api.example.com/v1\n"
    "api_key = k1\n"
    "model = meta/llama-3.1-70b-instruct\n"
    "weight = 3\n"
    "[llm:task_router:code2]\n"
    "name = Code Generation Backup\n"
    "identifier = code generation\n"
    "api_base = https://backup.example.com\n"
    "api_key = k2\n"
    "model = meta/llama-3.1-70b-instruct\n"
    "[llm:task_router:other]\n"
    "name = Other\n"
    "api_base = http://local:8000/\n"
    "api_key = k3\n"
    "model = small\n"
    "[policy:pool]\n"
    "[llm:pool:a]\n"
    "api_base = http://a:1\n"
    "api_key = k\n"
    "model = m\n";

static void testLoadValid() {
    std::vector<std::string> errors;
    auto reg = load(kValid, "task_router", &errors);
    assert(errors.empty());
    assert(reg);
    assert(reg->policies().size() == 2);
    assert(reg->AllBackends().size() == 4);

    const Policy* task = reg->Find("task_router");
    assert(task);
    assert(task->kind() == PolicyKind::kClassifier);
    assert(task->url().host == "router-server" && task->url().port == 8000);
    // Labels are case-insensitively merged into the first spelling.
    assert(task->labels().size() == 2);
    assert(task->labels()[0] == "Code Generation");
    assert(task->labels()[1] == "Other");
    assert(task->fallbackLabel() == "Other");
    assert(task->BackendsForLabel("CODE GENERATION").size() == 2);
    assert(task->BackendsForModel("small").size() == 1);
    assert(task->BackendsForModel("nope").empty());

    const BackendPtr& code = task->backends()[0];
    assert(code->Key() == "task_router/code");
    assert(code->weight == 3);
    assert(code->endpoint.ToString() == "https://api.example.com/v1/chat/completions");
    assert(task->backends()[1]->endpoint.ToString() == "https://backup.example.com/v1/chat/completions");
    assert(task->backends()[2]->endpoint.ToString() == "http://local:8000/v1/chat/completions");

    const Policy* pool = reg->Find("pool");
    assert(pool->kind() == PolicyKind::kStatic);
    assert(pool->backends()[0]->name == "a");
    assert(pool->backends()[0]->label == "a");
    assert(pool->fallbackLabel().empty());

    // Cursors exist per label and for the whole pool.
    task->Cursor("Other").fetch_add(1);
    assert(task->Cursor("Other").load() == 1);
    assert(&task->Cursor("no-such-label") == &task->Cursor(""));
}

static void testResolve() {
    std::vector<std::string> errors;
    auto reg = load(kValid, "task_router", &errors);
    assert(reg);
    assert(reg->Resolve("").name() == "task_router");
    assert(reg->Resolve("pool").name() == "pool");
    bool threw = false;
    try {
        reg->Resolve("missing");
    } catch (const GatewayException& e) {
        threw = true;
        assert(e.error().kind == ErrorKind::kPolicyNotFound);
        assert(e.error().HttpStatus() == 400);
    }
    assert(threw);
}

static void testValidationErrors() {
    std::vector<std::string> errors;
    auto reg = load(
        "[policy:a]\n"
        "type = classifier\n"
        "fallback_label = Nope\n"
        "[policy:b]\n"
        "type = magic\n"
        "[policy:c]\n"
        "type = agentic\n"
        "[llm:a:x]\n"
        "api_base = ftp://bad\n"
        "model = m\n"
        "weight = -2\n"
        "[llm:zzz:y]\n"
        "api_base = http://h\n"
        "api_key = k\n"
        "model = m\n"
        "[llm:broken]\n",
        "missing", &errors);
    assert(!reg);
    assert(hasError(errors, "needs a url"));
    assert(hasError(errors, "unknown type 'magic'"));
    assert(hasError(errors, "agent_model"));
    assert(hasError(errors, "api_key is required"));
    assert(hasError(errors, "invalid url"));
    assert(hasError(errors, "weight"));
    assert(hasError(errors, "unknown policy 'zzz'"));
    assert(hasError(errors, "expected [llm:<policy>:<id>]"));
    assert(hasError(errors, "fallback_label 'Nope'"));
    assert(hasError(errors, "default_policy 'missing'"));
}

static void testApiBaseJoin() {
    assert(ChatCompletionsUrl("https://x/v1") == "https://x/v1/chat/completions");
    assert(ChatCompletionsUrl("https://x/v1/") == "https://x/v1/chat/completions");
    assert(ChatCompletionsUrl("https://x") == "https://x/v1/chat/completions");
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    testLoadValid();
    testResolve();
    testValidationErrors();
    testApiBaseJoin();
    LOG_ERROR << "PolicyRegistry tests PASS";
    return 0;
}
