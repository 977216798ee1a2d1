#include "llmrouter/protocol/Compression.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <sstream>

#if LLMROUTER_WITH_ZLIB
#include <zlib.h>
#endif

namespace llmrouter {
namespace protocol {

namespace {

std::string ToLowerTrimmed(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if (!std::isspace(c)) out.push_back(static_cast<char>(std::tolower(c)));
    }
    return out;
}

#if LLMROUTER_WITH_ZLIB
// gzip wraps deflate with a 16-bit flag on windowBits; inflate accepts both with +32.
int WindowBits(Compression::Encoding enc, bool inflating) {
    if (enc == Compression::Encoding::kGzip) return inflating ? 15 + 32 : 15 + 16;
    return 15;
}

bool Pump(z_stream* zs, bool inflating, std::string* out) {
    char buf[16384];
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        zs->next_out = reinterpret_cast<Bytef*>(buf);
        zs->avail_out = sizeof(buf);
        ret = inflating ? inflate(zs, Z_NO_FLUSH) : deflate(zs, Z_FINISH);
        if (ret != Z_OK && ret != Z_STREAM_END) return false;
        const size_t produced = sizeof(buf) - zs->avail_out;
        out->append(buf, produced);
        // Truncated input: inflate stalls with nothing left to consume.
        if (inflating && ret == Z_OK && zs->avail_in == 0 && produced == 0) return false;
    }
    return true;
}
#endif

bool Transform(Compression::Encoding enc, bool inflating, const std::string& in, std::string* out) {
    if (!out) return false;
    out->clear();
    if (enc == Compression::Encoding::kIdentity) {
        *out = in;
        return true;
    }
    if (enc == Compression::Encoding::kUnknown) return false;
#if LLMROUTER_WITH_ZLIB
    z_stream zs;
    std::memset(&zs, 0, sizeof(zs));
    zs.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    const int bits = WindowBits(enc, inflating);
    const int init = inflating ? inflateInit2(&zs, bits)
                               : deflateInit2(&zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, bits, 8, Z_DEFAULT_STRATEGY);
    if (init != Z_OK) return false;
    const bool ok = Pump(&zs, inflating, out);
    if (inflating) {
        inflateEnd(&zs);
    } else {
        deflateEnd(&zs);
    }
    if (!ok) out->clear();
    return ok;
#else
    (void)in;
    (void)inflating;
    return false;
#endif
}

} // namespace

Compression::Encoding Compression::ParseContentEncoding(const std::string& v) {
    const std::string lv = ToLowerTrimmed(v);
    if (lv.empty() || lv == "identity") return Encoding::kIdentity;
    if (lv == "gzip" || lv == "x-gzip") return Encoding::kGzip;
    if (lv == "deflate") return Encoding::kDeflate;
    return Encoding::kUnknown;
}

bool Compression::AcceptsGzip(const std::string& acceptEncoding) {
#if LLMROUTER_WITH_ZLIB
    std::istringstream in(ToLowerTrimmed(acceptEncoding));
    std::string item;
    while (std::getline(in, item, ',')) {
        const size_t semi = item.find(';');
        const std::string coding = item.substr(0, semi);
        if (coding != "gzip" && coding != "x-gzip" && coding != "*") continue;
        if (semi == std::string::npos) return true;
        const std::string params = item.substr(semi + 1);
        if (params.compare(0, 2, "q=") != 0) return true;
        return std::strtod(params.c_str() + 2, nullptr) > 0.0;
    }
#else
    (void)acceptEncoding;
#endif
    return false;
}

bool Compression::Decompress(Encoding enc, const std::string& in, std::string* out) {
    return Transform(enc, true, in, out);
}

bool Compression::Compress(Encoding enc, const std::string& in, std::string* out) {
    return Transform(enc, false, in, out);
}

} // namespace protocol
} // namespace llmrouter
