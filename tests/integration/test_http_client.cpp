#include "llmrouter/protocol/HttpClient.h"
#include "llmrouter/protocol/HttpServer.h"
#include "llmrouter/protocol/HttpResponse.h"
#include "llmrouter/network/EventLoop.h"
#include "llmrouter/network/InetAddress.h"
#include "llmrouter/common/Logger.h"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <cstring>
#include <string>
#include <vector>

using namespace llmrouter::protocol;
using namespace llmrouter::network;
using namespace llmrouter::common;

static uint16_t pickFreePort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    uint16_t port = ntohs(addr.sin_port);
    ::close(fd);
    assert(port != 0);
    return port;
}

static HttpClient::Request makeRequest(uint16_t port, const std::string& path, double timeoutSec = 2.0) {
    HttpClient::Request req;
    const std::string text = "http://127.0.0.1:" + std::to_string(port) + path;
    assert(Url::Parse(text, &req.url));
    req.address = InetAddress("127.0.0.1", port);
    req.headers.emplace_back("Content-Type", "application/json");
    req.body = "{\"q\":1}";
    req.timeoutSec = timeoutSec;
    return req;
}

struct Result {
    bool done{false};
    HttpClient::Failure failure{HttpClient::Failure::kNone};
    HttpClient::Response response;
    std::string streamed;
    bool headersSeen{false};
};

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    const uint16_t port = pickFreePort();
    const uint16_t closedPort = pickFreePort();

    EventLoop loop;
    HttpServer server(&loop, InetAddress("127.0.0.1", port), "TestBackend");
    std::vector<HttpExchangePtr> held;
    std::string seenBody;
    std::string seenHost;
    server.setHandler([&](const HttpExchangePtr& ex) {
        const HttpRequest& req = ex->request();
        HttpResponse resp;
        resp.setStatusCode(HttpResponse::k200Ok);
        if (req.path() == "/json") {
            seenBody = req.body();
            seenHost = req.getHeader("Host");
            resp.setContentType("application/json");
            resp.setBody("{\"ok\":true}");
            ex->Reply(resp);
        } else if (req.path() == "/chunked") {
            resp.setContentType("text/event-stream");
            ex->BeginStream(resp);
            ex->SendChunk("data: one\n\n");
            ex->SendChunk("data: two\n\n");
            ex->EndStream();
        } else if (req.path() == "/slow") {
            HttpExchangePtr later = ex;
            loop.RunAfter(0.05, [later]() {
                HttpResponse r;
                r.setStatusCode(HttpResponse::k200Ok);
                r.setBody("slow");
                later->Reply(r);
            });
        } else if (req.path() == "/hang") {
            held.push_back(ex);
        } else {
            resp.setStatusCode(HttpResponse::k404NotFound);
            ex->Reply(resp);
        }
    });
    server.start();

    const int kCalls = 7;
    int completed = 0;
    auto finish = [&](Result* r) {
        return [&, r](HttpClient::Failure f, HttpClient::Response resp) {
            assert(!r->done);
            r->done = true;
            r->failure = f;
            r->response = std::move(resp);
            if (++completed == kCalls) loop.Quit();
        };
    };

    HttpClient client(nullptr, 0);
    HttpClient capped(nullptr, 1);

    Result json, stream, buffered, timeout, refused, first, rejected;

    HttpClient::Handlers h;
    h.onComplete = finish(&json);
    client.Fetch(&loop, makeRequest(port, "/json"), h);

    HttpClient::Handlers hs;
    hs.onHeaders = [&](const HttpClient::Response& resp) {
        stream.headersSeen = true;
        assert(resp.status == 200);
        assert(resp.header("content-type") == "text/event-stream");
        return true;
    };
    hs.onData = [&](const char* data, size_t len) { stream.streamed.append(data, len); };
    hs.onComplete = finish(&stream);
    client.Fetch(&loop, makeRequest(port, "/chunked"), hs);

    HttpClient::Handlers hb;
    hb.onHeaders = [](const HttpClient::Response&) { return false; };
    hb.onData = [&](const char*, size_t) { assert(false); };
    hb.onComplete = finish(&buffered);
    client.Fetch(&loop, makeRequest(port, "/chunked"), hb);

    HttpClient::Handlers ht;
    ht.onComplete = finish(&timeout);
    client.Fetch(&loop, makeRequest(port, "/hang", 0.2), ht);

    HttpClient::Handlers hr;
    hr.onComplete = finish(&refused);
    client.Fetch(&loop, makeRequest(closedPort, "/json"), hr);

    // The second call is over the cap while the first is still waiting.
    HttpClient::Handlers h1;
    h1.onComplete = finish(&first);
    capped.Fetch(&loop, makeRequest(port, "/slow"), h1);
    HttpClient::Handlers h2;
    h2.onComplete = finish(&rejected);
    capped.Fetch(&loop, makeRequest(port, "/slow"), h2);
    assert(rejected.done);
    assert(rejected.failure == HttpClient::Failure::kPoolExhausted);
    assert(capped.inflight() == 1);

    loop.RunAfter(5.0, [&]() {
        LOG_ERROR << "http client test timed out";
        loop.Quit();
    });
    loop.Loop();
    assert(completed == kCalls);

    assert(json.failure == HttpClient::Failure::kNone);
    assert(json.response.status == 200);
    assert(json.response.body == "{\"ok\":true}");
    assert(seenBody == "{\"q\":1}");
    assert(seenHost == "127.0.0.1:" + std::to_string(port));

    assert(stream.failure == HttpClient::Failure::kNone);
    assert(stream.headersSeen);
    assert(stream.streamed == "data: one\n\ndata: two\n\n");
    assert(stream.response.body.empty());

    assert(buffered.failure == HttpClient::Failure::kNone);
    assert(buffered.response.body == "data: one\n\ndata: two\n\n");

    assert(timeout.failure == HttpClient::Failure::kTimeout);
    assert(refused.failure == HttpClient::Failure::kConnect);

    assert(first.failure == HttpClient::Failure::kNone);
    assert(first.response.body == "slow");

    assert(client.inflight() == 0);
    assert(capped.inflight() == 0);
    held.clear();

    LOG_WARN << "http client tests PASS";
    return 0;
}
