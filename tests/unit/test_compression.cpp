#include "llmrouter/protocol/Compression.h"
#include "llmrouter/common/Logger.h"

#include <cassert>
#include <string>

using llmrouter::common::Logger;
using llmrouter::common::LogLevel;
using llmrouter::protocol::Compression;

static void testParseContentEncoding() {
    assert(Compression::ParseContentEncoding("") == Compression::Encoding::kIdentity);
    assert(Compression::ParseContentEncoding("identity") == Compression::Encoding::kIdentity);
    assert(Compression::ParseContentEncoding(" GZIP ") == Compression::Encoding::kGzip);
    assert(Compression::ParseContentEncoding("deflate") == Compression::Encoding::kDeflate);
    assert(Compression::ParseContentEncoding("br") == Compression::Encoding::kUnknown);
}

static void testAcceptsGzip() {
    assert(Compression::AcceptsGzip("gzip, deflate, br"));
    assert(Compression::AcceptsGzip("br;q=1.0, gzip;q=0.8"));
    assert(Compression::AcceptsGzip("*"));
    assert(!Compression::AcceptsGzip("gzip;q=0"));
    assert(!Compression::AcceptsGzip("br"));
    assert(!Compression::AcceptsGzip(""));
}

static void testGzipAndDeflate() {
    std::string text;
    for (int i = 0; i < 200; ++i) text += "{\"choices\":[{\"message\":{\"content\":\"hello\"}}]}";

    for (auto enc : {Compression::Encoding::kGzip, Compression::Encoding::kDeflate}) {
        std::string packed;
        assert(Compression::Compress(enc, text, &packed));
        assert(packed.size() < text.size());
        std::string unpacked;
        assert(Compression::Decompress(enc, packed, &unpacked));
        assert(unpacked == text);
    }

    std::string gz;
    assert(Compression::Compress(Compression::Encoding::kGzip, text, &gz));
    // gzip magic
    assert(static_cast<unsigned char>(gz[0]) == 0x1f && static_cast<unsigned char>(gz[1]) == 0x8b);
}

static void testCorruptInput() {
    std::string out;
    assert(!Compression::Decompress(Compression::Encoding::kGzip, "definitely not gzip", &out));
    assert(out.empty());

    std::string gz;
    assert(Compression::Compress(Compression::Encoding::kGzip, std::string(5000, 'x'), &gz));
    assert(!Compression::Decompress(Compression::Encoding::kGzip, gz.substr(0, gz.size() / 2), &out));

    assert(!Compression::Decompress(Compression::Encoding::kUnknown, "x", &out));
    assert(Compression::Decompress(Compression::Encoding::kIdentity, "plain", &out));
    assert(out == "plain");
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseContentEncoding();
    testAcceptsGzip();
    testGzipAndDeflate();
    testCorruptInput();
    LOG_INFO << "Compression tests PASS";
    return 0;
}
