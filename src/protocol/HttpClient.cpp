#include "llmrouter/protocol/HttpClient.h"
#include "llmrouter/protocol/HttpResponseParser.h"
#include "llmrouter/network/Channel.h"
#include "llmrouter/network/EventLoop.h"
#include "llmrouter/network/TlsContext.h"
#include "llmrouter/common/Logger.h"

#include <openssl/err.h>
#include <openssl/ssl.h>

#include <sys/socket.h>
#include <sys/timerfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>

namespace llmrouter {
namespace protocol {

using llmrouter::network::Channel;
using llmrouter::network::EventLoop;

enum class CallState { kConnecting, kHandshaking, kSending, kReading };

struct HttpClient::CallContext {
    EventLoop* loop{nullptr};
    Request request;
    Handlers handlers;

    int sockfd{-1};
    int timerfd{-1};
    std::shared_ptr<Channel> connChannel;
    std::shared_ptr<Channel> timerChannel;
    SSL* ssl{nullptr};

    CallState state{CallState::kConnecting};
    std::string out;
    size_t outOffset{0};

    HttpResponseParser parser;
    Response response;
    bool headersSeen{false};
    bool streaming{false};
    bool finished{false};
};

const char* HttpClient::FailureName(Failure f) {
    switch (f) {
        case Failure::kNone: return "none";
        case Failure::kConnect: return "connect";
        case Failure::kTimeout: return "timeout";
        case Failure::kTls: return "tls";
        case Failure::kProtocol: return "protocol";
        case Failure::kPoolExhausted: return "pool_exhausted";
    }
    return "unknown";
}

HttpClient::HttpClient(llmrouter::network::TlsContext* tls, int maxInflight)
    : tls_(tls), maxInflight_(maxInflight) {
}

HttpClient::~HttpClient() {
    const int pending = inflight();
    if (pending > 0) {
        LOG_WARN << "HttpClient destroyed with " << pending << " calls in flight";
    }
}

void HttpClient::Fetch(EventLoop* loop, Request request, Handlers handlers) {
    auto call = std::make_shared<CallContext>();
    call->loop = loop;
    call->request = std::move(request);
    call->handlers = std::move(handlers);
    loop->RunInLoop([this, call]() { Start(call); });
}

void HttpClient::Start(const CallPtr& call) {
    if (maxInflight_ > 0 && inflight_.fetch_add(1) >= maxInflight_) {
        inflight_.fetch_sub(1);
        call->finished = true;
        LOG_WARN << "HttpClient: " << maxInflight_ << " outbound calls in flight, rejecting "
                 << call->request.url.HostHeader();
        if (call->handlers.onComplete) call->handlers.onComplete(Failure::kPoolExhausted, Response{});
        return;
    }
    if (maxInflight_ <= 0) inflight_.fetch_add(1);

    const Request& req = call->request;
    if (req.url.tls && (tls_ == nullptr || !tls_->ok())) {
        Fail(call, Failure::kTls, "no TLS context for https url");
        return;
    }

    call->sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    call->timerfd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (call->sockfd < 0 || call->timerfd < 0) {
        Fail(call, Failure::kConnect, std::string("socket: ") + std::strerror(errno));
        return;
    }

    call->out = req.method + " " + req.url.path + " HTTP/1.1\r\n"
                "Host: " + req.url.HostHeader() + "\r\n"
                "Connection: close\r\n"
                "Content-Length: " + std::to_string(req.body.size()) + "\r\n";
    for (const auto& h : req.headers) {
        call->out += h.first + ": " + h.second + "\r\n";
    }
    call->out += "\r\n";
    call->out += req.body;

    call->connChannel = std::make_shared<Channel>(call->loop, call->sockfd);
    call->timerChannel = std::make_shared<Channel>(call->loop, call->timerfd);
    call->connChannel->SetWriteCallback([this, call]() { OnWritable(call); });
    call->connChannel->SetReadCallback([this, call](std::chrono::system_clock::time_point) { OnReadable(call); });
    call->connChannel->SetCloseCallback([this, call]() { OnReadable(call); });
    call->connChannel->SetErrorCallback([this, call]() {
        Fail(call, Failure::kConnect, "socket error");
    });
    call->timerChannel->SetReadCallback([this, call](std::chrono::system_clock::time_point) { OnTimeout(call); });
    call->timerChannel->EnableReading();
    ArmTimer(call);

    call->parser.setBodyCallback([this, call](const char* data, size_t len) { OnBody(call, data, len); });

    const int ret = ::connect(call->sockfd, req.address.getSockAddr(), sizeof(struct sockaddr_in));
    if (ret < 0 && errno != EINPROGRESS && errno != EALREADY) {
        Fail(call, Failure::kConnect, std::string("connect: ") + std::strerror(errno));
        return;
    }
    call->state = CallState::kConnecting;
    call->connChannel->EnableWriting();
}

void HttpClient::ArmTimer(const CallPtr& call) {
    const double sec = call->request.timeoutSec > 0.0 ? call->request.timeoutSec : 60.0;
    struct itimerspec howlong;
    std::memset(&howlong, 0, sizeof howlong);
    howlong.it_value.tv_sec = static_cast<time_t>(sec);
    howlong.it_value.tv_nsec = static_cast<long>((sec - static_cast<double>(howlong.it_value.tv_sec)) * 1e9);
    if (howlong.it_value.tv_sec == 0 && howlong.it_value.tv_nsec == 0) howlong.it_value.tv_nsec = 1000000;
    if (::timerfd_settime(call->timerfd, 0, &howlong, nullptr) != 0) {
        LOG_ERROR << "HttpClient timerfd_settime: " << std::strerror(errno);
    }
}

void HttpClient::OnWritable(const CallPtr& call) {
    if (call->finished) return;

    if (call->state == CallState::kConnecting) {
        int err = 0;
        socklen_t len = sizeof err;
        if (::getsockopt(call->sockfd, SOL_SOCKET, SO_ERROR, &err, &len) < 0 || err != 0) {
            Fail(call, Failure::kConnect, std::string("connect: ") + std::strerror(err ? err : errno));
            return;
        }
        if (call->request.url.tls) {
            SSL* ssl = SSL_new(tls_->ctx());
            if (!ssl) {
                Fail(call, Failure::kTls, "SSL_new: " + llmrouter::network::TlsContext::LastError());
                return;
            }
            call->ssl = ssl;
            SSL_set_fd(ssl, call->sockfd);
            SSL_set_connect_state(ssl);
            SSL_set_tlsext_host_name(ssl, call->request.url.host.c_str());
            if (tls_->verifyPeer()) {
                SSL_set1_host(ssl, call->request.url.host.c_str());
            }
            call->state = CallState::kHandshaking;
        } else {
            call->state = CallState::kSending;
        }
    }

    if (call->state == CallState::kHandshaking) {
        if (!DoHandshake(call)) return;
    }
    if (call->state == CallState::kSending) {
        FlushRequest(call);
    } else if (call->state == CallState::kReading && call->ssl) {
        // SSL_read asked for a write during renegotiation.
        call->connChannel->DisableWriting();
        OnReadable(call);
    }
}

bool HttpClient::DoHandshake(const CallPtr& call) {
    const int r = SSL_do_handshake(call->ssl);
    if (r == 1) {
        call->state = CallState::kSending;
        return true;
    }
    const int e = SSL_get_error(call->ssl, r);
    if (e == SSL_ERROR_WANT_READ) {
        call->connChannel->DisableWriting();
        call->connChannel->EnableReading();
        return false;
    }
    if (e == SSL_ERROR_WANT_WRITE) {
        call->connChannel->EnableWriting();
        return false;
    }
    std::string why = "handshake with " + call->request.url.host + " failed: " +
                      llmrouter::network::TlsContext::LastError();
    const long verify = SSL_get_verify_result(call->ssl);
    if (verify != X509_V_OK) {
        why += std::string(" (") + X509_verify_cert_error_string(verify) + ")";
    }
    Fail(call, Failure::kTls, why);
    return false;
}

void HttpClient::FlushRequest(const CallPtr& call) {
    while (call->outOffset < call->out.size()) {
        const char* p = call->out.data() + call->outOffset;
        const size_t left = call->out.size() - call->outOffset;
        if (call->ssl) {
            const int n = SSL_write(call->ssl, p, static_cast<int>(left));
            if (n > 0) {
                call->outOffset += static_cast<size_t>(n);
                continue;
            }
            const int e = SSL_get_error(call->ssl, n);
            if (e == SSL_ERROR_WANT_WRITE) {
                call->connChannel->EnableWriting();
                return;
            }
            if (e == SSL_ERROR_WANT_READ) {
                call->connChannel->EnableReading();
                return;
            }
            Fail(call, Failure::kTls, "SSL_write: " + llmrouter::network::TlsContext::LastError());
            return;
        }
        const ssize_t n = ::send(call->sockfd, p, left, MSG_NOSIGNAL);
        if (n > 0) {
            call->outOffset += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            call->connChannel->EnableWriting();
            return;
        }
        Fail(call, Failure::kConnect, std::string("send: ") + std::strerror(errno));
        return;
    }

    call->out.clear();
    call->state = CallState::kReading;
    call->connChannel->DisableWriting();
    call->connChannel->EnableReading();
}

void HttpClient::OnReadable(const CallPtr& call) {
    if (call->finished) return;
    if (call->state == CallState::kHandshaking) {
        if (DoHandshake(call)) FlushRequest(call);
        return;
    }
    if (call->state == CallState::kSending) {
        FlushRequest(call);
        return;
    }
    if (call->state != CallState::kReading) return;

    char buf[16384];
    while (!call->finished) {
        ssize_t n = 0;
        if (call->ssl) {
            const int r = SSL_read(call->ssl, buf, sizeof buf);
            if (r > 0) {
                n = r;
            } else {
                const int e = SSL_get_error(call->ssl, r);
                if (e == SSL_ERROR_WANT_READ) return;
                if (e == SSL_ERROR_WANT_WRITE) {
                    call->connChannel->EnableWriting();
                    return;
                }
                if (e != SSL_ERROR_ZERO_RETURN && !(e == SSL_ERROR_SYSCALL && ERR_peek_error() == 0)) {
                    Fail(call, Failure::kTls, "SSL_read: " + llmrouter::network::TlsContext::LastError());
                    return;
                }
                n = 0; // close_notify or unclean EOF
            }
        } else {
            n = ::recv(call->sockfd, buf, sizeof buf, 0);
            if (n < 0) {
                if (errno == EINTR) continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK) return;
                Fail(call, Failure::kConnect, std::string("recv: ") + std::strerror(errno));
                return;
            }
        }

        if (n == 0) {
            if (call->parser.finishOnClose()) {
                NotifyHeaders(call);
                Complete(call);
            } else {
                Fail(call, call->parser.headersComplete() ? Failure::kProtocol : Failure::kConnect,
                     "connection closed before the response completed");
            }
            return;
        }

        if (!call->parser.feed(buf, static_cast<size_t>(n))) {
            Fail(call, Failure::kProtocol, "malformed response from " + call->request.url.HostHeader());
            return;
        }
        if (call->finished) return;
        if (call->parser.headersComplete()) NotifyHeaders(call);
        if (call->parser.gotAll()) {
            Complete(call);
            return;
        }
    }
}

void HttpClient::NotifyHeaders(const CallPtr& call) {
    if (call->headersSeen || call->finished) return;
    call->headersSeen = true;
    call->response.status = call->parser.statusCode();
    call->response.headers = call->parser.headers();
    if (call->handlers.onHeaders) {
        call->streaming = call->handlers.onHeaders(call->response) && call->handlers.onData;
    }
}

void HttpClient::OnBody(const CallPtr& call, const char* data, size_t len) {
    if (call->finished) return;
    NotifyHeaders(call);
    if (call->streaming) {
        ArmTimer(call);
        call->handlers.onData(data, len);
    } else {
        call->response.body.append(data, len);
    }
}

void HttpClient::OnTimeout(const CallPtr& call) {
    uint64_t expirations = 0;
    if (::read(call->timerfd, &expirations, sizeof expirations) < 0 && errno == EAGAIN) return;
    Fail(call, Failure::kTimeout, "no response from " + call->request.url.HostHeader() + " within " +
                                      std::to_string(call->request.timeoutSec) + "s");
}

void HttpClient::Fail(const CallPtr& call, Failure failure, const std::string& why) {
    if (!CleanUp(call)) return;
    LOG_DEBUG << "HttpClient " << call->request.url.ToString() << " failed ("
              << FailureName(failure) << "): " << why;
    if (call->handlers.onComplete) {
        call->handlers.onComplete(failure, std::move(call->response));
    }
}

void HttpClient::Complete(const CallPtr& call) {
    if (!CleanUp(call)) return;
    if (call->handlers.onComplete) {
        call->handlers.onComplete(Failure::kNone, std::move(call->response));
    }
}

bool HttpClient::CleanUp(const CallPtr& call) {
    if (call->finished) return false;
    call->finished = true;
    inflight_.fetch_sub(1);

    if (call->connChannel) {
        call->connChannel->DisableAll();
        call->connChannel->Remove();
    }
    if (call->timerChannel) {
        call->timerChannel->DisableAll();
        call->timerChannel->Remove();
    }
    if (call->ssl) {
        SSL_free(call->ssl);
        call->ssl = nullptr;
    }
    if (call->sockfd >= 0) {
        ::close(call->sockfd);
        call->sockfd = -1;
    }
    if (call->timerfd >= 0) {
        ::close(call->timerfd);
        call->timerfd = -1;
    }

    // The channels' callbacks hold this call and may be running right now;
    // release them once the current event has been handled.
    call->loop->QueueInLoop([call]() {
        call->connChannel.reset();
        call->timerChannel.reset();
        call->parser.setBodyCallback(nullptr);
    });
    return true;
}

} // namespace protocol
} // namespace llmrouter
