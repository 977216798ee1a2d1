#pragma once

#include <netinet/in.h>
#include <string>

namespace llmrouter {
namespace network {

// IPv4 socket address.
class InetAddress {
public:
    explicit InetAddress(uint16_t port = 0, bool loopbackOnly = false);
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr)
        : addr_(addr) {}

    // Blocking getaddrinfo lookup; only used while loading settings.
    static bool Resolve(const std::string& host, uint16_t port, InetAddress* out);

    sa_family_t family() const { return addr_.sin_family; }
    std::string toIp() const;
    std::string toIpPort() const;
    uint16_t toPort() const;
    bool valid() const { return addr_.sin_addr.s_addr != htonl(INADDR_NONE); }

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }
    void setSockAddr(const struct sockaddr_in& addr) { addr_ = addr; }

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace llmrouter
