#pragma once

#include "llmrouter/network/Buffer.h"
#include "llmrouter/protocol/HttpRequest.h"

#include <string>

namespace llmrouter {
namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k200Ok = 200,
        k204NoContent = 204,
        k400BadRequest = 400,
        k401Unauthorized = 401,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k413PayloadTooLarge = 413,
        k429TooManyRequests = 429,
        k500InternalServerError = 500,
        k502BadGateway = 502,
        k503ServiceUnavailable = 503,
        k504GatewayTimeout = 504,
    };

    explicit HttpResponse(bool close = false)
        : statusCode_(kUnknown), closeConnection_(close) {}

    // Sets the matching reason phrase as well.
    void setStatusCode(int code) {
        statusCode_ = code;
        statusMessage_ = ReasonPhrase(code);
    }
    int statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { addHeader("Content-Type", contentType); }

    void addHeader(const std::string& key, const std::string& value) { headers_[key] = value; }
    void removeHeader(const std::string& key) { headers_.erase(key); }
    std::string getHeader(const std::string& key) const {
        auto it = headers_.find(key);
        return it != headers_.end() ? it->second : std::string();
    }
    const HeaderMap& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void setBody(std::string&& body) { body_ = std::move(body); }
    const std::string& body() const { return body_; }

    // Status line, headers with Content-Length, and body.
    void appendToBuffer(llmrouter::network::Buffer* output) const;
    // Status line and headers for a chunked body; chunks follow separately.
    void appendStreamHeadToBuffer(llmrouter::network::Buffer* output) const;

    static const char* ReasonPhrase(int code);

private:
    void appendHead(llmrouter::network::Buffer* output) const;

    int statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    HeaderMap headers_;
    std::string body_;
};

} // namespace protocol
} // namespace llmrouter
