#pragma once

#include "llmrouter/common/noncopyable.h"
#include "llmrouter/network/InetAddress.h"
#include "llmrouter/protocol/HttpRequest.h"
#include "llmrouter/protocol/Url.h"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace llmrouter {
namespace network {
class EventLoop;
class TlsContext;
}

namespace protocol {

// Non-blocking HTTP/1.1 client for outbound calls. Each Fetch opens one
// connection (plain or TLS), sends one request and reads one response on the
// given loop, guarded by a timerfd. The client must outlive its calls.
class HttpClient : llmrouter::common::noncopyable {
public:
    enum class Failure {
        kNone,
        kConnect,
        kTimeout,
        kTls,
        kProtocol,
        kPoolExhausted,
    };

    struct Request {
        std::string method{"POST"};
        Url url;
        llmrouter::network::InetAddress address; // resolved url.host
        std::vector<std::pair<std::string, std::string>> headers;
        std::string body;
        // Whole-call deadline; once a body is streamed it becomes an inactivity timeout.
        double timeoutSec{60.0};
    };

    struct Response {
        int status{0};
        HeaderMap headers;
        std::string body; // empty when streamed

        std::string header(const std::string& name) const {
            auto it = headers.find(name);
            return it != headers.end() ? it->second : std::string();
        }
    };

    struct Handlers {
        // Called once the status line and headers arrived. Return true to
        // receive the body through onData instead of Response::body.
        std::function<bool(const Response&)> onHeaders;
        std::function<void(const char* data, size_t len)> onData;
        // Called exactly once.
        std::function<void(Failure, Response)> onComplete;
    };

    // tls may be null when only plain http is used. maxInflight <= 0: unlimited.
    HttpClient(llmrouter::network::TlsContext* tls, int maxInflight);
    ~HttpClient();

    void Fetch(llmrouter::network::EventLoop* loop, Request request, Handlers handlers);

    int inflight() const { return inflight_.load(std::memory_order_relaxed); }

    static const char* FailureName(Failure f);

private:
    struct CallContext;
    using CallPtr = std::shared_ptr<CallContext>;

    void Start(const CallPtr& call);
    void OnWritable(const CallPtr& call);
    void OnReadable(const CallPtr& call);
    void OnTimeout(const CallPtr& call);
    bool DoHandshake(const CallPtr& call);
    void FlushRequest(const CallPtr& call);
    void NotifyHeaders(const CallPtr& call);
    void OnBody(const CallPtr& call, const char* data, size_t len);
    void ArmTimer(const CallPtr& call);
    void Fail(const CallPtr& call, Failure failure, const std::string& why);
    void Complete(const CallPtr& call);
    bool CleanUp(const CallPtr& call);

    llmrouter::network::TlsContext* tls_;
    const int maxInflight_;
    std::atomic<int> inflight_{0};
};

} // namespace protocol
} // namespace llmrouter
