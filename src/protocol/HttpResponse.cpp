#include "llmrouter/protocol/HttpResponse.h"

#include <cstdio>
#include <cstring>

namespace llmrouter {
namespace protocol {

const char* HttpResponse::ReasonPhrase(int code) {
    switch (code) {
        case 200: return "OK";
        case 201: return "Created";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 429: return "Too Many Requests";
        case 500: return "Internal Server Error";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "Unknown";
    }
}

void HttpResponse::appendHead(llmrouter::network::Buffer* output) const {
    char buf[32];
    std::snprintf(buf, sizeof buf, "HTTP/1.1 %d ", statusCode_);
    output->Append(buf, std::strlen(buf));
    output->Append(statusMessage_);
    output->Append("\r\n");
    output->Append(closeConnection_ ? "Connection: close\r\n" : "Connection: keep-alive\r\n");

    for (const auto& header : headers_) {
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }
}

void HttpResponse::appendToBuffer(llmrouter::network::Buffer* output) const {
    appendHead(output);
    char buf[48];
    std::snprintf(buf, sizeof buf, "Content-Length: %zu\r\n\r\n", body_.size());
    output->Append(buf, std::strlen(buf));
    output->Append(body_);
}

void HttpResponse::appendStreamHeadToBuffer(llmrouter::network::Buffer* output) const {
    appendHead(output);
    output->Append("Transfer-Encoding: chunked\r\n\r\n");
}

} // namespace protocol
} // namespace llmrouter
