#pragma once

#include "llmrouter/common/noncopyable.h"
#include "llmrouter/network/Callbacks.h"
#include "llmrouter/network/EventLoopThreadPool.h"
#include "llmrouter/network/InetAddress.h"
#include "llmrouter/network/TcpConnection.h"

#include <atomic>
#include <map>
#include <memory>
#include <string>

namespace llmrouter {
namespace network {

class Acceptor;
class EventLoop;

class TcpServer : llmrouter::common::noncopyable {
public:
    enum Option {
        kNoReusePort,
        kReusePort,
    };

    TcpServer(EventLoop* loop,
              const InetAddress& listenAddr,
              const std::string& nameArg,
              Option option = kNoReusePort);
    ~TcpServer();

    const std::string& hostport() const { return hostport_; }
    const std::string& name() const { return name_; }
    EventLoop* getLoop() const { return loop_; }

    // Must be called before Start(). 0 runs every connection on the base loop.
    void SetThreadNum(int numThreads);

    // 0 means unlimited.
    void SetMaxConnections(int maxConnections) { maxConnections_ = maxConnections; }
    // Closes connections with no traffic for idleTimeoutSec (0 disables).
    void SetIdleTimeout(double idleTimeoutSec) { idleTimeoutSec_ = idleTimeoutSec; }

    void Start();

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }

private:
    void NewConnection(int sockfd, const InetAddress& peerAddr);
    void RemoveConnection(const TcpConnectionPtr& conn);
    void RemoveConnectionInLoop(const TcpConnectionPtr& conn);
    void ScheduleIdleSweep();
    void CloseIdleConnections();

    using ConnectionMap = std::map<std::string, TcpConnectionPtr>;

    EventLoop* loop_;
    const std::string hostport_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    std::unique_ptr<EventLoopThreadPool> threadPool_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;

    std::atomic_int started_;
    int nextConnId_;
    ConnectionMap connections_;

    int maxConnections_{0};
    double idleTimeoutSec_{0.0};
    uint64_t idleTimer_{0};
};

} // namespace network
} // namespace llmrouter
