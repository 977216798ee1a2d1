#pragma once

#include <cstdint>
#include <string>

namespace llmrouter {
namespace protocol {

// http(s)://host[:port][/path][?query]
struct Url {
    std::string scheme;
    std::string host;
    uint16_t port{0};
    std::string path{"/"}; // includes the query string
    bool tls{false};

    static bool Parse(const std::string& text, Url* out);

    // "host" or "host:port" when the port is not the scheme default.
    std::string HostHeader() const;
    std::string ToString() const;
};

} // namespace protocol
} // namespace llmrouter
