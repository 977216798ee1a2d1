#pragma once

#include "llmrouter/balancer/Backend.h"
#include "llmrouter/common/noncopyable.h"
#include "llmrouter/protocol/HttpClient.h"

#include <functional>
#include <string>

namespace llmrouter {
namespace network {
class EventLoop;
}

namespace router {

struct UpstreamResult {
    llmrouter::protocol::HttpClient::Failure failure{llmrouter::protocol::HttpClient::Failure::kNone};
    int status{0};
    std::string contentType;
    std::string body;    // decoded; for a relayed stream, the bytes relayed so far
    bool streamed{false}; // body was relayed through StreamHandlers
    double seconds{0.0};  // time spent on the call
};

// Relay hooks for streamed completions. onStart sees a 2xx status first and
// returns true to take the body as it arrives.
struct StreamHandlers {
    std::function<bool(const llmrouter::balancer::Backend& backend, int status, const std::string& contentType)> onStart;
    std::function<void(const char* data, size_t len)> onData;
};

// Sends one chat completion to one backend.
class Upstream : llmrouter::common::noncopyable {
public:
    using DoneCallback = std::function<void(UpstreamResult)>;

    virtual ~Upstream() = default;

    virtual void Send(llmrouter::network::EventLoop* loop,
                      const llmrouter::balancer::BackendPtr& backend,
                      const std::string& body,
                      bool stream,
                      const StreamHandlers& relay,
                      DoneCallback done) = 0;
};

class HttpUpstream : public Upstream {
public:
    HttpUpstream(llmrouter::protocol::HttpClient* client, double timeoutSec);

    void Send(llmrouter::network::EventLoop* loop,
              const llmrouter::balancer::BackendPtr& backend,
              const std::string& body,
              bool stream,
              const StreamHandlers& relay,
              DoneCallback done) override;

private:
    llmrouter::protocol::HttpClient* client_;
    double timeoutSec_;
};

} // namespace router
} // namespace llmrouter
