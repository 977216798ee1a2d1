#include "llmrouter/router/Classifier.h"
#include "llmrouter/balancer/PolicyRegistry.h"
#include "llmrouter/common/Config.h"
#include "llmrouter/common/Logger.h"
#include "llmrouter/protocol/ChatRequest.h"

#include <cassert>
#include <memory>
#include <string>
#include <vector>

using llmrouter::balancer::Policy;
using llmrouter::balancer::PolicyRegistry;
using llmrouter::common::Config;
using llmrouter::common::Logger;
using llmrouter::common::LogLevel;
using llmrouter::router::Classification;
using llmrouter::router::RemoteClassifier;

static const char* kConfig =
    "[policy:task_router]\n"
    "url = http://router-server:8000/v2/models/task_router_ensemble/infer\n"
    "[llm:task_router:code]\n"
    "name = Code Generation\n"
    "api_base = http://llm-a:9000\n"
    "api_key = k\n"
    "model = code-model\n"
    "[llm:task_router:chat]\n"
    "name = Chatbot\n"
    "api_base = http://llm-b:9000\n"
    "api_key = k\n"
    "model = chat-model\n"
    "[llm:task_router:other]\n"
    "name = Other\n"
    "api_base = http://llm-b:9000\n"
    "api_key = k\n"
    "model = chat-model\n"
    "[policy:agent_router]\n"
    "agent_api_base = http://agent:8080/v1\n"
    "agent_api_key = secret\n"
    "agent_model = small-agent\n"
    "[llm:agent_router:fast]\n"
    "name = Fast Model\n"
    "identifier = Fast\n"
    "api_base = http://llm-c:9000\n"
    "api_key = k\n"
    "model = fast\n"
    "[llm:agent_router:smart]\n"
    "name = Smart Model\n"
    "identifier = Smart\n"
    "api_base = http://llm-d:9000\n"
    "api_key = k\n"
    "model = smart\n";

static std::unique_ptr<PolicyRegistry> loadRegistry() {
    auto& conf = Config::Instance();
    assert(conf.LoadFromString(kConfig));
    std::vector<std::string> errors;
    auto reg = PolicyRegistry::FromConfig(conf, "task_router", false, &errors);
    assert(errors.empty());
    assert(reg);
    return reg;
}

static void testInferRequestShape() {
    Json::Value doc;
    assert(llmrouter::protocol::ReadJson(RemoteClassifier::BuildInferRequest("write a sort"), &doc));
    const Json::Value& input = doc["inputs"][0];
    assert(input["name"].asString() == "INPUT");
    assert(input["datatype"].asString() == "BYTES");
    assert(input["shape"][0].asInt() == 1 && input["shape"][1].asInt() == 1);
    assert(input["data"][0][0].asString() == "write a sort");
}

static void testInferResponseBytes(const Policy& policy) {
    Classification c = RemoteClassifier::ParseInferResponse(
        policy, "{\"outputs\":[{\"name\":\"OUTPUT\",\"datatype\":\"BYTES\",\"shape\":[1],\"data\":[\"chatbot\"]}]}");
    assert(c.ok);
    assert(c.label == "Chatbot");

    Classification unknown = RemoteClassifier::ParseInferResponse(
        policy, "{\"outputs\":[{\"datatype\":\"BYTES\",\"data\":[\"Poetry\"]}]}");
    assert(!unknown.ok);
    assert(!unknown.error.empty());
}

static void testInferResponseScores(const Policy& policy) {
    // Scores index into the labels in declaration order.
    Classification c = RemoteClassifier::ParseInferResponse(
        policy, "{\"outputs\":[{\"datatype\":\"FP32\",\"shape\":[1,3],\"data\":[[0.1,0.7,0.2]]}]}");
    assert(c.ok);
    assert(c.label == "Chatbot");
    assert(c.confidence > 0.69 && c.confidence < 0.71);

    Classification tooMany = RemoteClassifier::ParseInferResponse(
        policy, "{\"outputs\":[{\"datatype\":\"FP32\",\"data\":[0.1,0.1,0.1,0.9]}]}");
    assert(!tooMany.ok);

    assert(!RemoteClassifier::ParseInferResponse(policy, "{}").ok);
    assert(!RemoteClassifier::ParseInferResponse(policy, "<html>").ok);
    assert(!RemoteClassifier::ParseInferResponse(policy, "{\"outputs\":[{\"data\":[]}]}").ok);
}

static void testAgentRequestAndResponse(const Policy& policy) {
    Json::Value doc;
    assert(llmrouter::protocol::ReadJson(RemoteClassifier::BuildAgentRequest(policy, "prove a theorem"), &doc));
    assert(doc["model"].asString() == "small-agent");
    assert(doc["temperature"].asDouble() == 0.0);
    const std::string system = doc["messages"][0]["content"].asString();
    assert(system.find("Fast: Fast Model") != std::string::npos);
    assert(system.find("Smart: Smart Model") != std::string::npos);
    assert(doc["messages"][1]["content"].asString() == "prove a theorem");

    Classification c = RemoteClassifier::ParseAgentResponse(
        policy, "{\"choices\":[{\"message\":{\"role\":\"assistant\",\"content\":\" \\\"smart\\\".\"}}]}");
    assert(c.ok);
    assert(c.label == "Smart");

    Classification rambling = RemoteClassifier::ParseAgentResponse(
        policy, "{\"choices\":[{\"message\":{\"content\":\"I think the Smart one\"}}]}");
    assert(!rambling.ok);
    assert(!RemoteClassifier::ParseAgentResponse(policy, "{\"choices\":[]}").ok);
}

// Well-formed JSON of the wrong shape is a classification failure, not a crash.
static void testMistypedResponses(const Policy& task, const Policy& agent) {
    Classification bare = RemoteClassifier::ParseAgentResponse(agent, "{\"choices\":[\"Fast\"]}");
    assert(!bare.ok);
    assert(!bare.error.empty());
    assert(!RemoteClassifier::ParseAgentResponse(agent, "{\"choices\":[{\"message\":\"Fast\"}]}").ok);
    assert(!RemoteClassifier::ParseAgentResponse(agent, "{\"choices\":{\"0\":1}}").ok);
    assert(!RemoteClassifier::ParseAgentResponse(agent, "[\"Fast\"]").ok);

    Classification typed = RemoteClassifier::ParseInferResponse(
        task, "{\"outputs\":[{\"datatype\":{\"kind\":\"BYTES\"},\"data\":[\"chatbot\"]}]}");
    assert(typed.ok);
    assert(typed.label == "Chatbot");
    assert(!RemoteClassifier::ParseInferResponse(task, "{\"outputs\":[\"chatbot\"]}").ok);
    assert(!RemoteClassifier::ParseInferResponse(task, "{\"outputs\":[{\"data\":[{\"x\":1}]}]}").ok);
}

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);
    auto reg = loadRegistry();
    const Policy* task = reg->Find("task_router");
    const Policy* agent = reg->Find("agent_router");
    assert(task && agent);

    testInferRequestShape();
    testInferResponseBytes(*task);
    testInferResponseScores(*task);
    testAgentRequestAndResponse(*agent);
    testMistypedResponses(*task, *agent);
    LOG_ERROR << "Classifier tests PASS";
    return 0;
}
