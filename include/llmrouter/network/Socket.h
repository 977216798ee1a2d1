#pragma once

#include "llmrouter/common/noncopyable.h"

namespace llmrouter {
namespace network {

class InetAddress;

// Owns a socket fd and closes it on destruction.
class Socket : llmrouter::common::noncopyable {
public:
    explicit Socket(int sockfd)
        : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    // Throw std::runtime_error on failure.
    void BindAddress(const InetAddress& localaddr);
    void Listen();

    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    static InetAddress LocalAddress(int sockfd);

private:
    const int sockfd_;
};

} // namespace network
} // namespace llmrouter
