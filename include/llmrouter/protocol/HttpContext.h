#pragma once

#include "llmrouter/network/Buffer.h"
#include "llmrouter/protocol/HttpRequest.h"

#include <chrono>

namespace llmrouter {
namespace protocol {

// Incremental HTTP/1.x request parser; one per connection.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    explicit HttpContext(size_t maxBodyBytes = 0)
        : state_(kExpectRequestLine), maxBodyBytes_(maxBodyBytes) {}

    // Consumes what it can from buf. Returns false on malformed input or an
    // oversized body (see bodyTooLarge()).
    bool parseRequest(llmrouter::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    bool bodyTooLarge() const { return bodyTooLarge_; }

    void reset() {
        state_ = kExpectRequestLine;
        HttpRequest dummy;
        request_.swap(dummy);
        chunked_ = false;
        bodyRemaining_ = 0;
        chunkSize_ = 0;
        expectingChunkSize_ = true;
        bodyTooLarge_ = false;
    }

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    bool processRequestLine(const char* begin, const char* end);
    // Each returns false on error and sets *more=false when it needs more input.
    bool parseHeaderLine(llmrouter::network::Buffer* buf, bool* more);
    bool beginBody();
    bool parseChunkedBody(llmrouter::network::Buffer* buf, bool* more);
    bool parseFixedBody(llmrouter::network::Buffer* buf, bool* more);
    bool appendBody(const char* data, size_t len);

    HttpRequestParseState state_;
    HttpRequest request_;
    size_t maxBodyBytes_; // 0: unlimited

    bool chunked_{false};
    size_t bodyRemaining_{0};
    size_t chunkSize_{0};
    bool expectingChunkSize_{true};
    bool bodyTooLarge_{false};
};

} // namespace protocol
} // namespace llmrouter
