#include "llmrouter/protocol/HttpContext.h"
#include "llmrouter/protocol/HttpResponse.h"
#include "llmrouter/protocol/HttpResponseParser.h"
#include "llmrouter/protocol/Url.h"
#include "llmrouter/network/Buffer.h"
#include "llmrouter/common/Logger.h"

#include <cassert>
#include <string>

using namespace llmrouter::protocol;
using namespace llmrouter::network;
using namespace llmrouter::common;

void testParseRequest() {
    HttpContext context;
    Buffer buf;

    // Simulate partial arrival
    std::string inputPart1 = "POST /v1/chat/completions?api_key=k1&x=2 HTTP/1.1\r\nHost: ";
    std::string inputPart2 = "localhost\r\nauthorization: Bearer abc\r\nContent-Length: 2\r\n\r\n{}";

    buf.Append(inputPart1);
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(!context.gotAll());

    buf.Append(inputPart2);
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    const HttpRequest& req = context.request();
    assert(req.getMethod() == HttpRequest::kPost);
    assert(req.path() == "/v1/chat/completions");
    assert(req.query() == "api_key=k1&x=2");
    assert(req.queryParam("api_key") == "k1");
    assert(req.queryParam("x") == "2");
    assert(req.queryParam("missing").empty());
    // Header lookup ignores case.
    assert(req.getHeader("Authorization") == "Bearer abc");
    assert(req.getHeader("HOST") == "localhost");
    assert(req.body() == "{}");
    LOG_INFO << "Parse Request PASS";
}

void testParseChunkedBody() {
    HttpContext context;
    Buffer buf;
    std::string input =
        "POST /chat/completions HTTP/1.1\r\n"
        "Host: localhost\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5\r\n"
        "hello\r\n"
        "0\r\n"
        "\r\n";
    buf.Append(input);
    assert(context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.gotAll());
    assert(context.request().body() == "hello");
    LOG_INFO << "Parse Chunked Body PASS";
}

void testBodyLimit() {
    HttpContext context(4);
    Buffer buf;
    buf.Append("POST /v1/chat/completions HTTP/1.1\r\nContent-Length: 10\r\n\r\n0123456789");
    assert(!context.parseRequest(&buf, std::chrono::system_clock::now()));
    assert(context.bodyTooLarge());
    LOG_INFO << "Body Limit PASS";
}

void testResponseGen() {
    HttpResponse resp(true);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setContentType("application/json");
    resp.addHeader("X-LLM-Router-Backend", "Chatbot");
    resp.setBody("{\"ok\":true}");

    Buffer buf;
    resp.appendToBuffer(&buf);
    const std::string output = buf.RetrieveAllAsString();
    assert(output.compare(0, 17, "HTTP/1.1 200 OK\r\n") == 0);
    assert(output.find("Connection: close\r\n") != std::string::npos);
    assert(output.find("Content-Length: 11\r\n\r\n{\"ok\":true}") != std::string::npos);
    assert(output.find("X-LLM-Router-Backend: Chatbot\r\n") != std::string::npos);
    LOG_INFO << "Response Gen PASS";
}

void testResponseParserContentLength() {
    HttpResponseParser parser;
    std::string body;
    parser.setBodyCallback([&](const char* d, size_t n) { body.append(d, n); });
    const std::string wire = "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 7\r\n\r\n{\"a\":1}";
    // One byte at a time.
    for (char c : wire) assert(parser.feed(&c, 1));
    assert(parser.gotAll());
    assert(parser.statusCode() == 200);
    assert(parser.header("content-type") == "application/json");
    assert(body == "{\"a\":1}");
    LOG_INFO << "Response Parser Content-Length PASS";
}

void testResponseParserChunked() {
    HttpResponseParser parser;
    std::string body;
    parser.setBodyCallback([&](const char* d, size_t n) { body.append(d, n); });
    const std::string wire =
        "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\nTransfer-Encoding: chunked\r\n\r\n"
        "6\r\ndata: \r\n"
        "3;ext=1\r\nabc\r\n"
        "0\r\n\r\n";
    // Split inside the first chunk.
    const size_t split = wire.find("\r\n\r\n") + 4 + 6;
    assert(parser.feed(wire.data(), split));
    assert(parser.headersComplete());
    assert(!parser.gotAll());
    assert(parser.feed(wire.data() + split, wire.size() - split));
    assert(parser.gotAll());
    assert(body == "data: abc");
    LOG_INFO << "Response Parser Chunked PASS";
}

void testResponseParserUntilClose() {
    HttpResponseParser parser;
    std::string body;
    parser.setBodyCallback([&](const char* d, size_t n) { body.append(d, n); });
    const std::string wire = "HTTP/1.0 503 Service Unavailable\r\n\r\nbusy";
    assert(parser.feed(wire.data(), wire.size()));
    assert(!parser.gotAll());
    assert(!parser.keepAlive());
    assert(parser.finishOnClose());
    assert(parser.statusCode() == 503);
    assert(body == "busy");

    HttpResponseParser bad;
    const std::string junk = "SSH-2.0-OpenSSH\r\n\r\n";
    assert(!bad.feed(junk.data(), junk.size()));
    assert(bad.hasError());
    LOG_INFO << "Response Parser Until-Close PASS";
}

void testUrl() {
    Url u;
    assert(Url::Parse("https://integrate.api.nvidia.com/v1/chat/completions", &u));
    assert(u.tls && u.port == 443);
    assert(u.host == "integrate.api.nvidia.com");
    assert(u.path == "/v1/chat/completions");
    assert(u.HostHeader() == "integrate.api.nvidia.com");

    assert(Url::Parse("http://router-server:8000", &u));
    assert(!u.tls && u.port == 8000 && u.path == "/");
    assert(u.HostHeader() == "router-server:8000");
    assert(u.ToString() == "http://router-server:8000/");

    assert(!Url::Parse("ftp://x/", &u));
    assert(!Url::Parse("http://:80/", &u));
    assert(!Url::Parse("http://h:99999/", &u));
    assert(!Url::Parse("no-scheme", &u));
    LOG_INFO << "Url PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testParseRequest();
    testParseChunkedBody();
    testBodyLimit();
    testResponseGen();
    testResponseParserContentLength();
    testResponseParserChunked();
    testResponseParserUntilClose();
    testUrl();
    return 0;
}
