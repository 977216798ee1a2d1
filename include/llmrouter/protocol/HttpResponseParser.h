#pragma once

#include "llmrouter/protocol/HttpRequest.h"

#include <cstddef>
#include <functional>
#include <string>

namespace llmrouter {
namespace protocol {

// Incremental HTTP/1.x response parser for outbound calls.
// Handles Content-Length, chunked and read-until-close framing; body bytes
// are handed to the body callback already de-chunked.
class HttpResponseParser {
public:
    enum ParseState { kExpectHead, kExpectBody, kGotAll, kError };
    using BodyCallback = std::function<void(const char* data, size_t len)>;

    void setBodyCallback(BodyCallback cb) { onBody_ = std::move(cb); }

    // Returns false once the stream is malformed.
    bool feed(const char* data, size_t len);
    // Peer closed the connection. Returns true when that completes the response.
    bool finishOnClose();

    bool headersComplete() const { return state_ == kExpectBody || state_ == kGotAll; }
    bool gotAll() const { return state_ == kGotAll; }
    bool hasError() const { return state_ == kError; }

    int statusCode() const { return statusCode_; }
    const HeaderMap& headers() const { return headers_; }
    std::string header(const std::string& name) const {
        auto it = headers_.find(name);
        return it != headers_.end() ? it->second : std::string();
    }
    bool keepAlive() const { return keepAlive_; }

    void reset();

private:
    enum ChunkState { kChunkSize, kChunkData, kChunkDataEnd, kChunkTrailer };

    bool parseHead(const std::string& head);
    bool consumeChunked();
    void emit(const char* data, size_t len) {
        if (onBody_ && len > 0) onBody_(data, len);
    }
    void fail() { state_ = kError; }

    ParseState state_{kExpectHead};
    std::string pending_;
    BodyCallback onBody_;

    int statusCode_{0};
    HeaderMap headers_;
    bool keepAlive_{true};

    bool chunked_{false};
    bool untilClose_{false};
    size_t bodyRemaining_{0};
    ChunkState chunkState_{kChunkSize};
    size_t chunkRemaining_{0};
};

} // namespace protocol
} // namespace llmrouter
