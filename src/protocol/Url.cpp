#include "llmrouter/protocol/Url.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace llmrouter {
namespace protocol {

bool Url::Parse(const std::string& text, Url* out) {
    const size_t sep = text.find("://");
    if (sep == std::string::npos) return false;

    Url url;
    url.scheme = text.substr(0, sep);
    std::transform(url.scheme.begin(), url.scheme.end(), url.scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (url.scheme == "https") {
        url.tls = true;
        url.port = 443;
    } else if (url.scheme == "http") {
        url.port = 80;
    } else {
        return false;
    }

    const size_t hostStart = sep + 3;
    size_t hostEnd = text.find_first_of("/?", hostStart);
    if (hostEnd == std::string::npos) hostEnd = text.size();
    std::string authority = text.substr(hostStart, hostEnd - hostStart);
    const size_t at = authority.rfind('@');
    if (at != std::string::npos) authority.erase(0, at + 1);

    const size_t colon = authority.rfind(':');
    if (colon != std::string::npos) {
        const std::string portText = authority.substr(colon + 1);
        char* endp = nullptr;
        const long port = std::strtol(portText.c_str(), &endp, 10);
        if (portText.empty() || *endp != '\0' || port <= 0 || port > 65535) return false;
        url.port = static_cast<uint16_t>(port);
        authority.resize(colon);
    }
    if (authority.empty()) return false;
    url.host = authority;

    if (hostEnd < text.size()) {
        url.path = text.substr(hostEnd);
        if (url.path[0] == '?') url.path.insert(0, "/");
    }
    *out = url;
    return true;
}

std::string Url::HostHeader() const {
    const bool defaultPort = (tls && port == 443) || (!tls && port == 80);
    return defaultPort ? host : host + ":" + std::to_string(port);
}

std::string Url::ToString() const {
    return scheme + "://" + HostHeader() + path;
}

} // namespace protocol
} // namespace llmrouter
