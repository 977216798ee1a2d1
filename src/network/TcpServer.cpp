#include "llmrouter/network/TcpServer.h"
#include "llmrouter/network/Acceptor.h"
#include "llmrouter/network/EventLoop.h"
#include "llmrouter/network/Socket.h"
#include "llmrouter/common/Logger.h"

#include <unistd.h>

#include <vector>

namespace llmrouter {
namespace network {

TcpServer::TcpServer(EventLoop* loop,
                     const InetAddress& listenAddr,
                     const std::string& nameArg,
                     Option option)
    : loop_(loop),
      hostport_(listenAddr.toIpPort()),
      name_(nameArg),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      threadPool_(new EventLoopThreadPool(loop, nameArg)),
      started_(0),
      nextConnId_(1) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peer) { NewConnection(sockfd, peer); });
}

TcpServer::~TcpServer() {
    if (idleTimer_ != 0) {
        loop_->Cancel(idleTimer_);
    }
    for (auto& item : connections_) {
        TcpConnectionPtr conn(item.second);
        item.second.reset();
        conn->getLoop()->RunInLoop([conn]() { conn->ConnectDestroyed(); });
    }
}

void TcpServer::SetThreadNum(int numThreads) {
    threadPool_->SetThreadNum(numThreads);
}

void TcpServer::Start() {
    if (started_++ == 0) {
        threadPool_->Start();
        loop_->RunInLoop([this]() {
            acceptor_->Listen();
            if (idleTimeoutSec_ > 0.0) ScheduleIdleSweep();
        });
        LOG_INFO << "TcpServer [" << name_ << "] listening on " << hostport_;
    }
}

void TcpServer::ScheduleIdleSweep() {
    const double interval = idleTimeoutSec_ < 2.0 ? idleTimeoutSec_ / 2.0 : 1.0;
    idleTimer_ = loop_->RunAfter(interval, [this]() {
        CloseIdleConnections();
        ScheduleIdleSweep();
    });
}

void TcpServer::CloseIdleConnections() {
    const auto now = std::chrono::steady_clock::now();
    const auto timeout = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double>(idleTimeoutSec_));

    std::vector<TcpConnectionPtr> toClose;
    for (const auto& item : connections_) {
        const TcpConnectionPtr& conn = item.second;
        if (conn && now - conn->LastActiveTime() > timeout) {
            toClose.push_back(conn);
        }
    }
    for (auto& conn : toClose) {
        LOG_DEBUG << "TcpServer [" << name_ << "] closing idle connection " << conn->name();
        conn->ForceClose();
    }
}

void TcpServer::NewConnection(int sockfd, const InetAddress& peerAddr) {
    if (maxConnections_ > 0 && static_cast<int>(connections_.size()) >= maxConnections_) {
        LOG_WARN << "TcpServer [" << name_ << "] reject " << peerAddr.toIpPort()
                 << ": max connections " << maxConnections_ << " reached";
        ::close(sockfd);
        return;
    }

    const std::string connName = name_ + "-" + hostport_ + "#" + std::to_string(nextConnId_++);
    LOG_DEBUG << "TcpServer [" << name_ << "] new connection [" << connName << "] from " << peerAddr.toIpPort();

    EventLoop* ioLoop = threadPool_->GetNextLoop();
    auto conn = std::make_shared<TcpConnection>(ioLoop, connName, sockfd,
                                                Socket::LocalAddress(sockfd), peerAddr);
    connections_[connName] = conn;
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { RemoveConnection(c); });

    ioLoop->RunInLoop([conn]() { conn->ConnectEstablished(); });
}

void TcpServer::RemoveConnection(const TcpConnectionPtr& conn) {
    loop_->QueueInLoop([this, conn]() { RemoveConnectionInLoop(conn); });
}

void TcpServer::RemoveConnectionInLoop(const TcpConnectionPtr& conn) {
    LOG_DEBUG << "TcpServer [" << name_ << "] remove connection " << conn->name();
    connections_.erase(conn->name());
    EventLoop* ioLoop = conn->getLoop();
    ioLoop->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace llmrouter
