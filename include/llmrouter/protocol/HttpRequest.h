#pragma once

#include <cctype>
#include <cstddef>
#include <map>
#include <string>

namespace llmrouter {
namespace protocol {

// Case-insensitive ordering for header names.
struct HeaderLess {
    bool operator()(const std::string& a, const std::string& b) const {
        const size_t n = a.size() < b.size() ? a.size() : b.size();
        for (size_t i = 0; i < n; ++i) {
            const int ca = std::tolower(static_cast<unsigned char>(a[i]));
            const int cb = std::tolower(static_cast<unsigned char>(b[i]));
            if (ca != cb) return ca < cb;
        }
        return a.size() < b.size();
    }
};

using HeaderMap = std::map<std::string, std::string, HeaderLess>;

class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kOptions
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    bool setMethod(const char* start, const char* end) {
        const std::string m(start, end);
        if (m == "GET") method_ = kGet;
        else if (m == "POST") method_ = kPost;
        else if (m == "HEAD") method_ = kHead;
        else if (m == "PUT") method_ = kPut;
        else if (m == "DELETE") method_ = kDelete;
        else if (m == "OPTIONS") method_ = kOptions;
        else method_ = kInvalid;
        return method_ != kInvalid;
    }
    void setMethod(Method m) { method_ = m; }

    Method getMethod() const { return method_; }
    const char* methodString() const {
        switch (method_) {
            case kGet: return "GET";
            case kPost: return "POST";
            case kHead: return "HEAD";
            case kPut: return "PUT";
            case kDelete: return "DELETE";
            case kOptions: return "OPTIONS";
            default: return "UNKNOWN";
        }
    }

    void setPath(const char* start, const char* end) { path_.assign(start, end); }
    void setPath(const std::string& path) { path_ = path; }
    const std::string& path() const { return path_; }

    // Without the leading '?'.
    void setQuery(const char* start, const char* end) { query_.assign(start, end); }
    const std::string& query() const { return query_; }

    // Value of name in the query string, or "" when absent. No percent-decoding.
    std::string queryParam(const std::string& name) const {
        size_t pos = 0;
        while (pos <= query_.size()) {
            size_t amp = query_.find('&', pos);
            if (amp == std::string::npos) amp = query_.size();
            const std::string pair = query_.substr(pos, amp - pos);
            const size_t eq = pair.find('=');
            if (pair.substr(0, eq) == name) {
                return eq == std::string::npos ? std::string() : pair.substr(eq + 1);
            }
            pos = amp + 1;
        }
        return std::string();
    }

    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && std::isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
            value.pop_back();
        }
        headers_[field] = value;
    }

    // Case-insensitive.
    std::string getHeader(const std::string& field) const {
        auto it = headers_.find(field);
        return it != headers_.end() ? it->second : std::string();
    }
    bool hasHeader(const std::string& field) const { return headers_.count(field) != 0; }

    void setHeader(const std::string& field, const std::string& value) { headers_[field] = value; }
    void removeHeader(const std::string& field) { headers_.erase(field); }

    const HeaderMap& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
    }

private:
    Method method_;
    Version version_;
    std::string path_;
    std::string query_;
    HeaderMap headers_;
    std::string body_;
};

} // namespace protocol
} // namespace llmrouter
