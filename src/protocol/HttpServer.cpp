#include "llmrouter/protocol/HttpServer.h"
#include "llmrouter/protocol/HttpContext.h"
#include "llmrouter/network/EventLoop.h"
#include "llmrouter/common/Logger.h"

#include <cstdio>

namespace llmrouter {
namespace protocol {

using llmrouter::network::Buffer;
using llmrouter::network::TcpConnection;
using llmrouter::network::TcpConnectionPtr;

namespace {

struct ConnectionState {
    explicit ConnectionState(size_t maxBody) : parser(maxBody) {}
    HttpContext parser;
    bool busy{false};
};

using ConnectionStatePtr = std::shared_ptr<ConnectionState>;

bool SameToken(const std::string& a, const std::string& b) {
    HeaderLess less;
    return !less(a, b) && !less(b, a);
}

} // namespace

HttpExchange::HttpExchange(const TcpConnectionPtr& conn,
                           HttpRequest request,
                           bool closeAfter,
                           FinishCallback onFinish)
    : conn_(conn),
      loop_(conn->getLoop()),
      peerIp_(conn->peerAddress().toIp()),
      closeAfter_(closeAfter),
      onFinish_(std::move(onFinish)) {
    request_.swap(request);
}

HttpExchange::~HttpExchange() {
    if (!finished_) {
        LOG_WARN << "HttpExchange for " << request_.path() << " dropped without a response";
        if (auto conn = conn_.lock()) conn->ForceClose();
    }
}

bool HttpExchange::Alive() const {
    auto conn = conn_.lock();
    return conn && conn->connected();
}

void HttpExchange::Reply(HttpResponse& response) {
    if (finished_ || streaming_) return;
    response.setCloseConnection(closeAfter_);
    if (auto conn = conn_.lock()) {
        Buffer buf;
        response.appendToBuffer(&buf);
        conn->Send(buf.Peek(), buf.ReadableBytes());
    }
    Finish(closeAfter_);
}

void HttpExchange::BeginStream(HttpResponse& head) {
    if (finished_ || streaming_) return;
    streaming_ = true;
    head.setCloseConnection(closeAfter_);
    if (auto conn = conn_.lock()) {
        Buffer buf;
        head.appendStreamHeadToBuffer(&buf);
        conn->Send(buf.Peek(), buf.ReadableBytes());
    }
}

void HttpExchange::SendChunk(const std::string& data) {
    if (finished_ || !streaming_ || data.empty()) return;
    if (auto conn = conn_.lock()) {
        char size[24];
        const int n = std::snprintf(size, sizeof size, "%zx\r\n", data.size());
        Buffer buf;
        buf.Append(size, static_cast<size_t>(n));
        buf.Append(data);
        buf.Append("\r\n");
        conn->Send(buf.Peek(), buf.ReadableBytes());
    }
}

void HttpExchange::EndStream() {
    if (finished_ || !streaming_) return;
    if (auto conn = conn_.lock()) {
        conn->Send("0\r\n\r\n");
    }
    Finish(closeAfter_);
}

void HttpExchange::Abort() {
    if (finished_) return;
    if (auto conn = conn_.lock()) {
        conn->ForceClose();
    }
    Finish(true);
}

void HttpExchange::Finish(bool close) {
    finished_ = true;
    if (onFinish_) {
        FinishCallback cb;
        cb.swap(onFinish_);
        cb(close);
    }
}

HttpServer::HttpServer(llmrouter::network::EventLoop* loop,
                       const llmrouter::network::InetAddress& listenAddr,
                       const std::string& name,
                       llmrouter::network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option) {
    server_.SetConnectionCallback([this](const TcpConnectionPtr& conn) { onConnection(conn); });
    server_.SetMessageCallback(
        [this](const TcpConnectionPtr& conn, Buffer* buf, std::chrono::system_clock::time_point t) {
            onMessage(conn, buf, t);
        });
}

void HttpServer::start() {
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on " << server_.hostport();
    server_.Start();
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(std::make_shared<ConnectionState>(maxBodyBytes_));
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn,
                           Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    auto* statePtr = std::any_cast<ConnectionStatePtr>(conn->GetMutableContext());
    if (!statePtr || !*statePtr) return;
    ConnectionStatePtr state = *statePtr;
    // Pipelined bytes stay buffered until the current exchange finishes.
    if (state->busy) return;

    if (!state->parser.parseRequest(buf, receiveTime)) {
        const int status = state->parser.bodyTooLarge() ? HttpResponse::k413PayloadTooLarge
                                                        : HttpResponse::k400BadRequest;
        HttpResponse response(true);
        response.setStatusCode(status);
        response.setContentType("application/json");
        response.setBody(status == HttpResponse::k413PayloadTooLarge
                         ? "{\"error\":{\"type\":\"invalid_request\",\"message\":\"request body too large\",\"status\":413,\"source\":\"llm-router\"}}"
                         : "{\"error\":{\"type\":\"invalid_request\",\"message\":\"malformed HTTP request\",\"status\":400,\"source\":\"llm-router\"}}");
        Buffer out;
        response.appendToBuffer(&out);
        conn->Send(out.Peek(), out.ReadableBytes());
        conn->Shutdown();
        buf->RetrieveAll();
        return;
    }
    if (!state->parser.gotAll()) return;

    HttpRequest request;
    request.swap(state->parser.request());
    state->parser.reset();

    const std::string connection = request.getHeader("Connection");
    const bool close = SameToken(connection, "close") ||
                       (request.getVersion() == HttpRequest::kHttp10 && !SameToken(connection, "keep-alive"));

    state->busy = true;
    std::weak_ptr<TcpConnection> weakConn(conn);
    auto exchange = std::make_shared<HttpExchange>(
        conn, std::move(request), close,
        [this, weakConn](bool closeConn) { onExchangeFinished(weakConn, closeConn); });

    if (handler_) {
        handler_(exchange);
    } else {
        HttpResponse response;
        response.setStatusCode(HttpResponse::k404NotFound);
        exchange->Reply(response);
    }
}

void HttpServer::onExchangeFinished(const std::weak_ptr<TcpConnection>& weakConn, bool close) {
    TcpConnectionPtr conn = weakConn.lock();
    if (!conn) return;
    if (close) {
        conn->Shutdown();
        return;
    }
    conn->getLoop()->QueueInLoop([this, conn]() {
        auto* statePtr = std::any_cast<ConnectionStatePtr>(conn->GetMutableContext());
        if (!statePtr || !*statePtr) return;
        (*statePtr)->busy = false;
        if (conn->connected() && conn->inputBuffer()->ReadableBytes() > 0) {
            onMessage(conn, conn->inputBuffer(), std::chrono::system_clock::now());
        }
    });
}

} // namespace protocol
} // namespace llmrouter
