#include "llmrouter/network/Socket.h"
#include "llmrouter/network/InetAddress.h"
#include "llmrouter/common/Logger.h"

#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace llmrouter {
namespace network {

Socket::~Socket() {
    ::close(sockfd_);
}

void Socket::BindAddress(const InetAddress& localaddr) {
    if (::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) != 0) {
        const std::string err = std::strerror(errno);
        LOG_FATAL << "bind " << localaddr.toIpPort() << ": " << err;
        throw std::runtime_error("bind " + localaddr.toIpPort() + ": " + err);
    }
}

void Socket::Listen() {
    if (::listen(sockfd_, SOMAXCONN) != 0) {
        const std::string err = std::strerror(errno);
        LOG_FATAL << "listen: " << err;
        throw std::runtime_error("listen: " + err);
    }
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr;
    socklen_t len = sizeof addr;
    std::memset(&addr, 0, sizeof addr);
    int connfd = ::accept4(sockfd_, reinterpret_cast<struct sockaddr*>(&addr), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) {
        peeraddr->setSockAddr(addr);
    }
    return connfd;
}

void Socket::ShutdownWrite() {
    if (::shutdown(sockfd_, SHUT_WR) < 0) {
        LOG_ERROR << "Socket::ShutdownWrite: " << std::strerror(errno);
    }
}

void Socket::SetTcpNoDelay(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, IPPROTO_TCP, TCP_NODELAY, &optval, sizeof optval);
}

void Socket::SetReuseAddr(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof optval);
}

void Socket::SetReusePort(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_REUSEPORT, &optval, sizeof optval);
}

void Socket::SetKeepAlive(bool on) {
    int optval = on ? 1 : 0;
    ::setsockopt(sockfd_, SOL_SOCKET, SO_KEEPALIVE, &optval, sizeof optval);
}

InetAddress Socket::LocalAddress(int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getsockname(sockfd, reinterpret_cast<struct sockaddr*>(&addr), &len) < 0) {
        LOG_ERROR << "getsockname: " << std::strerror(errno);
    }
    return InetAddress(addr);
}

} // namespace network
} // namespace llmrouter
