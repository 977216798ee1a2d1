#pragma once

#include "llmrouter/common/noncopyable.h"
#include "llmrouter/network/Channel.h"
#include "llmrouter/network/Socket.h"

#include <functional>

namespace llmrouter {
namespace network {

class EventLoop;
class InetAddress;

class Acceptor : llmrouter::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress&)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) {
        new_connection_callback_ = cb;
    }

    bool Listenning() const { return listenning_; }
    void Listen();

private:
    void HandleRead();

    EventLoop* loop_;
    Socket accept_socket_;
    Channel accept_channel_;
    NewConnectionCallback new_connection_callback_;
    bool listenning_;
};

} // namespace network
} // namespace llmrouter
