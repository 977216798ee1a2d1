#include "llmrouter/router/Upstream.h"
#include "llmrouter/common/Logger.h"
#include "llmrouter/protocol/Compression.h"

#include <chrono>
#include <memory>

namespace llmrouter {
namespace router {

using llmrouter::protocol::Compression;
using llmrouter::protocol::HttpClient;

HttpUpstream::HttpUpstream(HttpClient* client, double timeoutSec)
    : client_(client), timeoutSec_(timeoutSec) {
}

void HttpUpstream::Send(llmrouter::network::EventLoop* loop,
                        const llmrouter::balancer::BackendPtr& backend,
                        const std::string& body,
                        bool stream,
                        const StreamHandlers& relay,
                        DoneCallback done) {
    HttpClient::Request req;
    req.url = backend->endpoint;
    req.address = backend->address;
    req.timeoutSec = timeoutSec_;
    req.body = body;
    req.headers.emplace_back("Content-Type", "application/json");
    req.headers.emplace_back("Accept", stream ? "text/event-stream" : "application/json");
    if (!stream) req.headers.emplace_back("Accept-Encoding", "gzip, deflate");
    if (!backend->apiKey.empty()) req.headers.emplace_back("Authorization", "Bearer " + backend->apiKey);

    struct State {
        std::chrono::steady_clock::time_point start;
        bool relaying{false};
        std::string relayed;
    };
    auto state = std::make_shared<State>();
    state->start = std::chrono::steady_clock::now();

    HttpClient::Handlers handlers;
    handlers.onHeaders = [state, stream, relay, backend](const HttpClient::Response& resp) {
        if (!stream || resp.status < 200 || resp.status >= 300 || !relay.onStart) return false;
        state->relaying = relay.onStart(*backend, resp.status, resp.header("Content-Type"));
        return state->relaying;
    };
    handlers.onData = [state, relay](const char* data, size_t len) {
        state->relayed.append(data, len);
        if (relay.onData) relay.onData(data, len);
    };
    const std::string key = backend->Key();
    handlers.onComplete = [state, key, done](HttpClient::Failure failure, HttpClient::Response resp) {
        UpstreamResult result;
        result.failure = failure;
        result.status = resp.status;
        result.contentType = resp.header("Content-Type");
        result.streamed = state->relaying;
        result.seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - state->start).count();
        if (state->relaying) {
            result.body = std::move(state->relayed);
        } else if (failure == HttpClient::Failure::kNone) {
            const auto enc = Compression::ParseContentEncoding(resp.header("Content-Encoding"));
            if (!Compression::Decompress(enc, resp.body, &result.body)) {
                LOG_WARN << "backend " << key << ": cannot decode Content-Encoding '"
                         << resp.header("Content-Encoding") << "'";
                result.failure = HttpClient::Failure::kProtocol;
            }
        }
        done(std::move(result));
    };
    client_->Fetch(loop, std::move(req), std::move(handlers));
}

} // namespace router
} // namespace llmrouter
