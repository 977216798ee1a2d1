#include "llmrouter/protocol/HttpContext.h"
#include "llmrouter/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace llmrouter {
namespace protocol {

using llmrouter::network::Buffer;

namespace {

std::string TrimCopy(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

bool ContainsTokenCI(const std::string& value, const char* token) {
    std::string lower(value);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower.find(token) != std::string::npos;
}

} // namespace

bool HttpContext::processRequestLine(const char* begin, const char* end) {
    const char* start = begin;
    const char* space = std::find(start, end, ' ');
    if (space == end || !request_.setMethod(start, space)) return false;

    start = space + 1;
    space = std::find(start, end, ' ');
    if (space == end) return false;

    const char* question = std::find(start, space, '?');
    request_.setPath(start, question);
    if (question != space) {
        request_.setQuery(question + 1, space);
    }

    start = space + 1;
    if (end - start != 8 || !std::equal(start, end - 1, "HTTP/1.")) return false;
    if (*(end - 1) == '1') {
        request_.setVersion(HttpRequest::kHttp11);
    } else if (*(end - 1) == '0') {
        request_.setVersion(HttpRequest::kHttp10);
    } else {
        return false;
    }
    return true;
}

bool HttpContext::appendBody(const char* data, size_t len) {
    if (maxBodyBytes_ > 0 && request_.body().size() + len > maxBodyBytes_) {
        bodyTooLarge_ = true;
        return false;
    }
    request_.appendBody(data, len);
    return true;
}

bool HttpContext::beginBody() {
    chunked_ = ContainsTokenCI(request_.getHeader("Transfer-Encoding"), "chunked");
    bodyRemaining_ = 0;
    chunkSize_ = 0;
    expectingChunkSize_ = true;

    if (!chunked_) {
        const std::string cl = request_.getHeader("Content-Length");
        if (!cl.empty()) {
            char* endp = nullptr;
            const long long v = std::strtoll(cl.c_str(), &endp, 10);
            if (endp == cl.c_str() || v < 0) return false;
            if (maxBodyBytes_ > 0 && static_cast<unsigned long long>(v) > maxBodyBytes_) {
                bodyTooLarge_ = true;
                return false;
            }
            bodyRemaining_ = static_cast<size_t>(v);
        }
    }
    state_ = (chunked_ || bodyRemaining_ > 0) ? kExpectBody : kGotAll;
    return true;
}

bool HttpContext::parseHeaderLine(Buffer* buf, bool* more) {
    const char* crlf = buf->FindCRLF();
    if (!crlf) {
        *more = false;
        return true;
    }
    const char* colon = std::find(buf->Peek(), crlf, ':');
    if (colon != crlf) {
        request_.addHeader(buf->Peek(), colon, crlf);
        buf->RetrieveUntil(crlf + 2);
        return true;
    }
    if (crlf != buf->Peek()) return false; // header line without a colon
    buf->RetrieveUntil(crlf + 2);
    return beginBody();
}

bool HttpContext::parseFixedBody(Buffer* buf, bool* more) {
    const size_t n = std::min(bodyRemaining_, buf->ReadableBytes());
    if (n > 0) {
        if (!appendBody(buf->Peek(), n)) return false;
        buf->Retrieve(n);
        bodyRemaining_ -= n;
    }
    if (bodyRemaining_ == 0) {
        state_ = kGotAll;
    } else {
        *more = false;
    }
    return true;
}

bool HttpContext::parseChunkedBody(Buffer* buf, bool* more) {
    if (expectingChunkSize_) {
        const char* crlf = buf->FindCRLF();
        if (!crlf) {
            *more = false;
            return true;
        }
        std::string line(buf->Peek(), crlf);
        buf->RetrieveUntil(crlf + 2);
        const size_t semi = line.find(';');
        if (semi != std::string::npos) line.resize(semi);
        line = TrimCopy(line);
        if (line.empty()) return false;

        char* endp = nullptr;
        const long long sz = std::strtoll(line.c_str(), &endp, 16);
        if (endp == line.c_str() || sz < 0) return false;
        chunkSize_ = static_cast<size_t>(sz);
        expectingChunkSize_ = false;
    }

    if (chunkSize_ == 0) {
        // Trailer section: header lines until an empty one.
        const char* crlf = buf->FindCRLF();
        while (crlf && crlf != buf->Peek()) {
            buf->RetrieveUntil(crlf + 2);
            crlf = buf->FindCRLF();
        }
        if (!crlf) {
            *more = false;
            return true;
        }
        buf->RetrieveUntil(crlf + 2);
        state_ = kGotAll;
        return true;
    }

    if (buf->ReadableBytes() < chunkSize_ + 2) {
        *more = false;
        return true;
    }
    if (!appendBody(buf->Peek(), chunkSize_)) return false;
    buf->Retrieve(chunkSize_);
    const char* p = buf->Peek();
    if (p[0] != '\r' || p[1] != '\n') return false;
    buf->Retrieve(2);
    expectingChunkSize_ = true;
    return true;
}

bool HttpContext::parseRequest(Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    (void)receiveTime;
    bool more = true;
    while (more && state_ != kGotAll) {
        bool ok = true;
        switch (state_) {
            case kExpectRequestLine: {
                const char* crlf = buf->FindCRLF();
                if (!crlf) {
                    more = false;
                    break;
                }
                ok = processRequestLine(buf->Peek(), crlf);
                if (ok) {
                    buf->RetrieveUntil(crlf + 2);
                    state_ = kExpectHeaders;
                }
                break;
            }
            case kExpectHeaders:
                ok = parseHeaderLine(buf, &more);
                break;
            case kExpectBody:
                ok = chunked_ ? parseChunkedBody(buf, &more) : parseFixedBody(buf, &more);
                break;
            case kGotAll:
                break;
        }
        if (!ok) {
            LOG_DEBUG << "HttpContext: malformed request" << (bodyTooLarge_ ? " (body too large)" : "");
            return false;
        }
    }
    return true;
}

} // namespace protocol
} // namespace llmrouter
