#include "llmrouter/protocol/HttpResponseParser.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace llmrouter {
namespace protocol {

namespace {

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string Trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t' || s[e - 1] == '\r')) --e;
    return s.substr(b, e - b);
}

} // namespace

void HttpResponseParser::reset() {
    state_ = kExpectHead;
    pending_.clear();
    statusCode_ = 0;
    headers_.clear();
    keepAlive_ = true;
    chunked_ = false;
    untilClose_ = false;
    bodyRemaining_ = 0;
    chunkState_ = kChunkSize;
    chunkRemaining_ = 0;
}

bool HttpResponseParser::parseHead(const std::string& head) {
    headers_.clear();
    size_t lineEnd = head.find("\r\n");
    const std::string statusLine = head.substr(0, lineEnd);

    // HTTP/1.1 200 OK
    if (statusLine.compare(0, 7, "HTTP/1.") != 0 || statusLine.size() < 12) return false;
    const bool http10 = statusLine[7] == '0';
    char* endp = nullptr;
    const long code = std::strtol(statusLine.c_str() + 9, &endp, 10);
    if (endp == statusLine.c_str() + 9 || code < 100 || code > 999) return false;
    statusCode_ = static_cast<int>(code);

    size_t pos = lineEnd == std::string::npos ? head.size() : lineEnd + 2;
    while (pos < head.size()) {
        size_t next = head.find("\r\n", pos);
        if (next == std::string::npos) next = head.size();
        const std::string line = head.substr(pos, next - pos);
        pos = next + 2;
        const size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        headers_[Trim(line.substr(0, colon))] = Trim(line.substr(colon + 1));
    }

    const std::string connection = Lower(header("Connection"));
    keepAlive_ = http10 ? connection.find("keep-alive") != std::string::npos
                        : connection.find("close") == std::string::npos;

    chunked_ = Lower(header("Transfer-Encoding")).find("chunked") != std::string::npos;
    untilClose_ = false;
    bodyRemaining_ = 0;
    chunkState_ = kChunkSize;
    if (statusCode_ == 204 || statusCode_ == 304) {
        chunked_ = false;
    } else if (!chunked_) {
        const std::string cl = header("Content-Length");
        if (cl.empty()) {
            untilClose_ = true;
            keepAlive_ = false;
        } else {
            const long long n = std::strtoll(cl.c_str(), &endp, 10);
            if (endp == cl.c_str() || n < 0) return false;
            bodyRemaining_ = static_cast<size_t>(n);
        }
    }
    return true;
}

bool HttpResponseParser::consumeChunked() {
    size_t off = 0;
    bool ok = true;
    while (ok && state_ == kExpectBody && off < pending_.size()) {
        if (chunkState_ == kChunkSize || chunkState_ == kChunkTrailer) {
            const size_t crlf = pending_.find("\r\n", off);
            if (crlf == std::string::npos) break;
            std::string line = pending_.substr(off, crlf - off);
            off = crlf + 2;
            if (chunkState_ == kChunkTrailer) {
                if (line.empty()) state_ = kGotAll;
                continue;
            }
            const size_t semi = line.find(';');
            if (semi != std::string::npos) line.resize(semi);
            line = Trim(line);
            char* endp = nullptr;
            const unsigned long long n = std::strtoull(line.c_str(), &endp, 16);
            if (line.empty() || endp == line.c_str()) {
                ok = false;
                break;
            }
            chunkRemaining_ = static_cast<size_t>(n);
            chunkState_ = chunkRemaining_ == 0 ? kChunkTrailer : kChunkData;
        } else if (chunkState_ == kChunkData) {
            const size_t take = std::min(chunkRemaining_, pending_.size() - off);
            emit(pending_.data() + off, take);
            off += take;
            chunkRemaining_ -= take;
            if (chunkRemaining_ == 0) chunkState_ = kChunkDataEnd;
        } else {
            if (pending_.size() - off < 2) break;
            if (pending_[off] != '\r' || pending_[off + 1] != '\n') {
                ok = false;
                break;
            }
            off += 2;
            chunkState_ = kChunkSize;
        }
    }
    pending_.erase(0, off);
    return ok;
}

bool HttpResponseParser::feed(const char* data, size_t len) {
    if (state_ == kError) return false;
    if (state_ == kGotAll) return true; // trailing bytes are ignored
    pending_.append(data, len);

    while (state_ == kExpectHead) {
        const size_t end = pending_.find("\r\n\r\n");
        if (end == std::string::npos) return true;
        const std::string head = pending_.substr(0, end + 2);
        pending_.erase(0, end + 4);
        if (!parseHead(head)) {
            fail();
            return false;
        }
        if (statusCode_ >= 100 && statusCode_ < 200) {
            continue; // interim response, the real head follows
        }
        const bool empty = !chunked_ && !untilClose_ && bodyRemaining_ == 0;
        state_ = empty ? kGotAll : kExpectBody;
    }

    if (state_ != kExpectBody) return true;

    if (chunked_) {
        if (!consumeChunked()) {
            fail();
            return false;
        }
    } else if (untilClose_) {
        emit(pending_.data(), pending_.size());
        pending_.clear();
    } else {
        const size_t take = std::min(bodyRemaining_, pending_.size());
        emit(pending_.data(), take);
        pending_.erase(0, take);
        bodyRemaining_ -= take;
        if (bodyRemaining_ == 0) state_ = kGotAll;
    }
    return true;
}

bool HttpResponseParser::finishOnClose() {
    if (state_ == kExpectBody && untilClose_) {
        state_ = kGotAll;
    }
    return state_ == kGotAll;
}

} // namespace protocol
} // namespace llmrouter
