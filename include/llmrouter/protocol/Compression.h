#pragma once

#include <string>

namespace llmrouter {
namespace protocol {

class Compression {
public:
    enum class Encoding {
        kIdentity,
        kGzip,
        kDeflate,
        kUnknown,
    };

    static Encoding ParseContentEncoding(const std::string& v);

    // True when an Accept-Encoding value allows gzip (q=0 excluded).
    static bool AcceptsGzip(const std::string& acceptEncoding);

    // Whole-buffer transforms. Identity copies; kUnknown and a build
    // without zlib fail.
    static bool Decompress(Encoding enc, const std::string& in, std::string* out);
    static bool Compress(Encoding enc, const std::string& in, std::string* out);
};

} // namespace protocol
} // namespace llmrouter
