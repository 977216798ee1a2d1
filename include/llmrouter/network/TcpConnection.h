#pragma once

#include "llmrouter/common/noncopyable.h"
#include "llmrouter/network/Buffer.h"
#include "llmrouter/network/Callbacks.h"
#include "llmrouter/network/InetAddress.h"

#include <any>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace llmrouter {
namespace network {

class Channel;
class EventLoop;
class Socket;

// An accepted, established TCP connection bound to one I/O loop.
class TcpConnection : llmrouter::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }
    bool disconnected() const { return state_ == kDisconnected; }

    void SetContext(const std::any& context) { context_ = context; }
    std::any* GetMutableContext() { return &context_; }

    Buffer* inputBuffer() { return &inputBuffer_; }

    // Thread safe
    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    void Shutdown();
    void ForceClose();

    std::chrono::steady_clock::time_point LastActiveTime() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }

    // Called by TcpServer once the connection is registered.
    void ConnectEstablished();
    // Called by TcpServer after removing it from its map.
    void ConnectDestroyed();

private:
    enum StateE { kDisconnected, kConnecting, kConnected, kDisconnecting };

    void HandleRead(std::chrono::system_clock::time_point receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void SendInLoop(const void* message, size_t len);
    void ShutdownInLoop();
    void ForceCloseInLoop();
    void Touch();

    void SetState(StateE s) { state_ = s; }

    EventLoop* loop_;
    const std::string name_;
    std::atomic<StateE> state_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    CloseCallback closeCallback_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;

    std::atomic<std::int64_t> lastActiveNs_;
};

} // namespace network
} // namespace llmrouter
