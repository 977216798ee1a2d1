#include "llmrouter/network/InetAddress.h"
#include "llmrouter/common/Logger.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>

#include <cstdio>
#include <cstring>

namespace llmrouter {
namespace network {

InetAddress::InetAddress(uint16_t port, bool loopbackOnly) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    in_addr_t ip = loopbackOnly ? INADDR_LOOPBACK : INADDR_ANY;
    addr_.sin_addr.s_addr = htonl(ip);
    addr_.sin_port = htons(port);
}

InetAddress::InetAddress(const std::string& ip, uint16_t port) {
    std::memset(&addr_, 0, sizeof addr_);
    addr_.sin_family = AF_INET;
    addr_.sin_port = htons(port);
    if (::inet_pton(AF_INET, ip.c_str(), &addr_.sin_addr) <= 0) {
        addr_.sin_addr.s_addr = htonl(INADDR_NONE);
    }
}

bool InetAddress::Resolve(const std::string& host, uint16_t port, InetAddress* out) {
    InetAddress literal(host, port);
    if (literal.valid()) {
        *out = literal;
        return true;
    }

    struct addrinfo hints;
    std::memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    struct addrinfo* res = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &res);
    if (rc != 0 || res == nullptr) {
        LOG_ERROR << "Resolve " << host << " failed: " << ::gai_strerror(rc);
        return false;
    }
    struct sockaddr_in addr;
    std::memcpy(&addr, res->ai_addr, sizeof addr);
    ::freeaddrinfo(res);
    addr.sin_port = htons(port);
    out->setSockAddr(addr);
    return true;
}

std::string InetAddress::toIp() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    return buf;
}

std::string InetAddress::toIpPort() const {
    char buf[64] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, buf, sizeof buf);
    size_t end = std::strlen(buf);
    uint16_t port = ntohs(addr_.sin_port);
    std::snprintf(buf + end, sizeof buf - end, ":%u", port);
    return buf;
}

uint16_t InetAddress::toPort() const {
    return ntohs(addr_.sin_port);
}

} // namespace network
} // namespace llmrouter
