#include "llmrouter/GatewayServer.h"
#include "llmrouter/common/GatewayError.h"
#include "llmrouter/common/Logger.h"
#include "llmrouter/monitor/Metrics.h"
#include "llmrouter/protocol/ChatRequest.h"
#include "llmrouter/protocol/Compression.h"

#include <algorithm>
#include <functional>

namespace llmrouter {

using protocol::HttpExchangePtr;
using protocol::HttpRequest;
using protocol::HttpResponse;
using monitor::Metrics;
namespace metric = monitor::metric;

namespace {

const size_t kGzipMinBytes = 1024;
const double kCacheSweepIntervalSec = 60.0;

// Delivers gateway responses to one HTTP exchange.
class ExchangeSink : public router::ResponseSink {
public:
    using Decorate = std::function<void(HttpResponse*)>;

    ExchangeSink(HttpExchangePtr exchange, bool gzip, Decorate decorate)
        : exchange_(std::move(exchange)), gzip_(gzip), decorate_(std::move(decorate)) {}

    bool Alive() const override { return exchange_->Alive(); }

    void OnComplete(int status, const router::HeaderList& headers, const std::string& contentType,
                    const std::string& body) override {
        HttpResponse response;
        response.setStatusCode(status);
        response.setContentType(contentType);
        for (const auto& h : headers) response.addHeader(h.first, h.second);
        if (decorate_) decorate_(&response);

        std::string compressed;
        if (gzip_ && body.size() > kGzipMinBytes &&
            protocol::Compression::Compress(protocol::Compression::Encoding::kGzip, body, &compressed)) {
            response.addHeader("Content-Encoding", "gzip");
            const std::string vary = response.getHeader("Vary");
            response.addHeader("Vary", vary.empty() ? "Accept-Encoding" : vary + ", Accept-Encoding");
            response.setBody(std::move(compressed));
        } else {
            response.setBody(body);
        }
        exchange_->Reply(response);
    }

    void OnStreamStart(int status, const router::HeaderList& headers, const std::string& contentType) override {
        HttpResponse head;
        head.setStatusCode(status);
        head.setContentType(contentType);
        head.addHeader("Cache-Control", "no-cache");
        for (const auto& h : headers) head.addHeader(h.first, h.second);
        if (decorate_) decorate_(&head);
        exchange_->BeginStream(head);
    }

    void OnStreamData(const char* data, size_t len) override {
        if (!exchange_->Alive()) return;
        exchange_->SendChunk(std::string(data, len));
    }

    void OnStreamEnd(bool ok) override {
        if (ok) {
            exchange_->EndStream();
        } else {
            exchange_->Abort();
        }
    }

private:
    HttpExchangePtr exchange_;
    bool gzip_;
    Decorate decorate_;
};

bool IsChatPath(const std::string& path) {
    return path == "/v1/chat/completions" || path == "/chat/completions";
}

std::string SimpleError(const char* type, const std::string& message, int status) {
    Json::Value err(Json::objectValue);
    err["type"] = type;
    err["message"] = message;
    err["status"] = status;
    err["source"] = "llm-router";
    Json::Value doc(Json::objectValue);
    doc["error"] = err;
    return protocol::WriteJson(doc);
}

} // namespace

GatewayServer::GatewayServer(network::EventLoop* loop,
                             const common::GatewaySettings& settings,
                             std::unique_ptr<balancer::PolicyRegistry> policies)
    : loop_(loop), settings_(settings), policies_(std::move(policies)) {
    if (!tls_.InitClient(settings_.security.verifyPeer)) {
        LOG_WARN << "TLS client context unavailable, https backends will fail: "
                 << network::TlsContext::LastError();
    }
    client_ = std::make_unique<protocol::HttpClient>(tls_.ok() ? &tls_ : nullptr,
                                                     settings_.service.connectionPoolSize);
    balancer_ = balancer::Balancer::Create(settings_.loadBalancingStrategy);

    std::vector<std::string> keys;
    for (const auto& b : policies_->AllBackends()) keys.push_back(b->Key());
    balancer::CircuitBreaker::Options cbOpts;
    cbOpts.enabled = settings_.circuitBreaker.enabled;
    cbOpts.failureThreshold = settings_.circuitBreaker.failureThreshold;
    cbOpts.resetTimeout = std::chrono::seconds(settings_.circuitBreaker.resetTimeoutSecs);
    breakers_ = std::make_unique<balancer::CircuitBreakerRegistry>(
        cbOpts, keys,
        [](const std::string& key, balancer::CircuitState /*from*/, balancer::CircuitState to) {
            Metrics::Instance().Inc(metric::kBreakerTransitions,
                                    {{"endpoint", key}, {"to", balancer::CircuitStateName(to)}});
            Metrics::Instance().SetGauge(metric::kBreakerOpen, {{"endpoint", key}},
                                         to == balancer::CircuitState::kOpen ? 1.0 : 0.0);
        });

    if (settings_.cache.enabled) {
        protocol::ResponseCache::Config cacheCfg;
        cacheCfg.maxSize = settings_.cache.maxSize;
        cacheCfg.ttl = std::chrono::seconds(settings_.cache.ttlSeconds);
        cacheCfg.shards = settings_.cache.shards;
        cache_ = std::make_unique<protocol::ResponseCache>(cacheCfg);
    }
    rateLimiter_ = std::make_unique<monitor::RateLimiter>(settings_.rateLimit);
    classifier_ = std::make_unique<router::RemoteClassifier>(client_.get(), settings_.service.requestTimeoutSec);
    upstream_ = std::make_unique<router::HttpUpstream>(client_.get(), settings_.service.requestTimeoutSec);
    gateway_ = std::make_unique<router::Gateway>(settings_, *policies_, balancer_.get(), breakers_.get(),
                                                 cache_.get(), rateLimiter_.get(), classifier_.get(),
                                                 upstream_.get());

    server_ = std::make_unique<protocol::HttpServer>(
        loop_, network::InetAddress(settings_.service.host, settings_.service.port), "llm-router");
    server_->setThreadNum(settings_.service.threads);
    server_->setMaxBodyBytes(settings_.service.maxBodyBytes);
    server_->setMaxConnections(settings_.service.maxConnections);
    server_->setIdleTimeout(settings_.service.idleTimeoutSec);
    server_->setHandler([this](const HttpExchangePtr& ex) { HandleRequest(ex); });

    if (settings_.metrics.enabled) {
        metricsServer_ = std::make_unique<protocol::HttpServer>(
            loop_, network::InetAddress(settings_.metrics.host, settings_.metrics.port), "llm-router-metrics");
        metricsServer_->setHandler([this](const HttpExchangePtr& ex) { HandleMetrics(ex); });
    }
}

GatewayServer::~GatewayServer() = default;

void GatewayServer::Start() {
    server_->start();
    if (metricsServer_) metricsServer_->start();
    if (cache_) loop_->RunInLoop([this]() { ScheduleCacheSweep(); });
    LOG_INFO << "llm-router listening on " << settings_.service.host << ":" << settings_.service.port
             << " (default policy " << policies_->defaultPolicy() << ", strategy " << balancer_->name() << ")";
}

void GatewayServer::ScheduleCacheSweep() {
    loop_->RunAfter(kCacheSweepIntervalSec, [this]() {
        cache_->CleanExpired();
        Metrics::Instance().SetGauge(metric::kCacheSize, {}, static_cast<double>(cache_->Size()));
        ScheduleCacheSweep();
    });
}

bool GatewayServer::Authorized(const HttpRequest& request) const {
    const auto& keys = settings_.security.apiKeys;
    if (keys.empty()) return true;
    std::string presented;
    const std::string auth = request.getHeader("Authorization");
    if (auth.size() > 7 && (auth.compare(0, 7, "Bearer ") == 0 || auth.compare(0, 7, "bearer ") == 0)) {
        presented = auth.substr(7);
    } else {
        presented = request.queryParam("api_key");
    }
    if (presented.empty()) return false;
    return std::find(keys.begin(), keys.end(), presented) != keys.end();
}

void GatewayServer::AddCorsHeaders(const HttpRequest& request, HttpResponse* response) const {
    const auto& origins = settings_.service.corsOrigins;
    if (origins.empty()) return;
    const std::string origin = request.getHeader("Origin");
    if (std::find(origins.begin(), origins.end(), "*") != origins.end()) {
        response->addHeader("Access-Control-Allow-Origin", "*");
    } else if (!origin.empty() && std::find(origins.begin(), origins.end(), origin) != origins.end()) {
        response->addHeader("Access-Control-Allow-Origin", origin);
        response->addHeader("Vary", "Origin");
    } else {
        return;
    }
    response->addHeader("Access-Control-Expose-Headers",
                        "X-LLM-Router-Policy, X-LLM-Router-Backend, X-LLM-Router-Cache");
}

void GatewayServer::ReplyJson(const HttpExchangePtr& exchange, int status, const std::string& body) {
    HttpResponse response;
    response.setStatusCode(status);
    response.setContentType("application/json");
    AddCorsHeaders(exchange->request(), &response);
    response.setBody(body);
    exchange->Reply(response);
}

std::string GatewayServer::ReadinessJson() const {
    Json::Value doc(Json::objectValue);
    Json::Value breakers(Json::objectValue);
    bool degraded = false;
    for (const auto& snap : breakers_->Snapshot()) {
        Json::Value b(Json::objectValue);
        b["state"] = balancer::CircuitStateName(snap.state);
        b["consecutive_failures"] = snap.consecutiveFailures;
        if (snap.state == balancer::CircuitState::kOpen) {
            b["retry_in_seconds"] = snap.retryInSec;
            degraded = true;
        }
        breakers[snap.key] = b;
    }
    doc["status"] = degraded ? "degraded" : "ok";
    doc["circuit_breakers"] = breakers;
    return protocol::WriteJson(doc);
}

void GatewayServer::HandleRequest(const HttpExchangePtr& exchange) {
    const HttpRequest& req = exchange->request();
    const std::string& path = req.path();

    if (req.getMethod() == HttpRequest::kOptions) {
        HttpResponse response;
        response.setStatusCode(HttpResponse::k204NoContent);
        response.addHeader("Allow", "GET, POST, OPTIONS");
        AddCorsHeaders(req, &response);
        if (!response.getHeader("Access-Control-Allow-Origin").empty()) {
            response.addHeader("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
            response.addHeader("Access-Control-Allow-Headers", "Authorization, Content-Type, Cache-Control");
            response.addHeader("Access-Control-Max-Age", "86400");
        }
        exchange->Reply(response);
        return;
    }

    if (path == "/health" || path == "/health/readiness") {
        if (req.getMethod() != HttpRequest::kGet && req.getMethod() != HttpRequest::kHead) {
            ReplyJson(exchange, HttpResponse::k405MethodNotAllowed,
                      SimpleError("method_not_allowed", "use GET", HttpResponse::k405MethodNotAllowed));
            return;
        }
        ReplyJson(exchange, HttpResponse::k200Ok, path == "/health" ? "{\"status\":\"ok\"}" : ReadinessJson());
        return;
    }

    if (!IsChatPath(path)) {
        ReplyJson(exchange, HttpResponse::k404NotFound,
                  SimpleError("not_found", "no route for " + path, HttpResponse::k404NotFound));
        return;
    }
    if (req.getMethod() != HttpRequest::kPost) {
        ReplyJson(exchange, HttpResponse::k405MethodNotAllowed,
                  SimpleError("method_not_allowed", "use POST", HttpResponse::k405MethodNotAllowed));
        return;
    }
    if (!Authorized(req)) {
        common::GatewayError err(common::ErrorKind::kUnauthorized, "missing or invalid API key");
        Metrics::Instance().Inc(metric::kRequestFailure, {{"error_type", err.Reason()}});
        ReplyJson(exchange, err.HttpStatus(), err.ToJson());
        return;
    }

    const bool gzip = settings_.service.gzipResponses &&
                      protocol::Compression::AcceptsGzip(req.getHeader("Accept-Encoding"));
    auto sink = std::make_shared<ExchangeSink>(
        exchange, gzip, [this, exchange](HttpResponse* r) { AddCorsHeaders(exchange->request(), r); });

    router::RequestInput input;
    input.loop = exchange->loop();
    input.clientIp = exchange->peerIp();
    input.path = path;
    input.headers = req.headers();
    input.body = req.body();
    gateway_->Process(std::move(input), sink);
}

void GatewayServer::HandleMetrics(const HttpExchangePtr& exchange) {
    const HttpRequest& req = exchange->request();
    if (req.path() != "/metrics") {
        HttpResponse response;
        response.setStatusCode(HttpResponse::k404NotFound);
        exchange->Reply(response);
        return;
    }
    if (cache_) Metrics::Instance().SetGauge(metric::kCacheSize, {}, static_cast<double>(cache_->Size()));
    HttpResponse response;
    response.setStatusCode(HttpResponse::k200Ok);
    response.setContentType("text/plain; version=0.0.4");
    response.setBody(Metrics::Instance().RenderPrometheus());
    exchange->Reply(response);
}

} // namespace llmrouter
