#pragma once

#include "llmrouter/common/noncopyable.h"
#include "llmrouter/network/TcpServer.h"
#include "llmrouter/protocol/HttpRequest.h"
#include "llmrouter/protocol/HttpResponse.h"

#include <functional>
#include <memory>
#include <string>

namespace llmrouter {
namespace protocol {

// One request awaiting its response. Handlers may answer immediately or
// later from the connection's loop; the connection processes no further
// requests until the exchange finishes.
class HttpExchange : llmrouter::common::noncopyable,
                     public std::enable_shared_from_this<HttpExchange> {
public:
    using FinishCallback = std::function<void(bool closeConnection)>;

    HttpExchange(const llmrouter::network::TcpConnectionPtr& conn,
                 HttpRequest request,
                 bool closeAfter,
                 FinishCallback onFinish);
    ~HttpExchange();

    const HttpRequest& request() const { return request_; }
    llmrouter::network::EventLoop* loop() const { return loop_; }
    const std::string& peerIp() const { return peerIp_; }

    // False once the client went away.
    bool Alive() const;
    bool finished() const { return finished_; }
    bool streaming() const { return streaming_; }

    void Reply(HttpResponse& response);

    void BeginStream(HttpResponse& head);
    void SendChunk(const std::string& data);
    void EndStream();

    // Drops the connection without a complete response.
    void Abort();

private:
    void Finish(bool close);

    std::weak_ptr<llmrouter::network::TcpConnection> conn_;
    llmrouter::network::EventLoop* loop_;
    std::string peerIp_;
    HttpRequest request_;
    bool closeAfter_;
    FinishCallback onFinish_;
    bool streaming_{false};
    bool finished_{false};
};

using HttpExchangePtr = std::shared_ptr<HttpExchange>;

class HttpServer : llmrouter::common::noncopyable {
public:
    using HttpHandler = std::function<void(const HttpExchangePtr&)>;

    HttpServer(llmrouter::network::EventLoop* loop,
               const llmrouter::network::InetAddress& listenAddr,
               const std::string& name,
               llmrouter::network::TcpServer::Option option = llmrouter::network::TcpServer::kNoReusePort);

    llmrouter::network::EventLoop* getLoop() const { return server_.getLoop(); }

    void setHandler(const HttpHandler& handler) { handler_ = handler; }
    void setThreadNum(int numThreads) { server_.SetThreadNum(numThreads); }
    void setMaxBodyBytes(size_t bytes) { maxBodyBytes_ = bytes; }
    void setMaxConnections(int n) { server_.SetMaxConnections(n); }
    void setIdleTimeout(double sec) { server_.SetIdleTimeout(sec); }

    void start();

private:
    void onConnection(const llmrouter::network::TcpConnectionPtr& conn);
    void onMessage(const llmrouter::network::TcpConnectionPtr& conn,
                   llmrouter::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void onExchangeFinished(const std::weak_ptr<llmrouter::network::TcpConnection>& weakConn, bool close);

    llmrouter::network::TcpServer server_;
    HttpHandler handler_;
    size_t maxBodyBytes_{0};
};

} // namespace protocol
} // namespace llmrouter
