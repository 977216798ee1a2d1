#include "llmrouter/router/Gateway.h"
#include "llmrouter/balancer/Balancer.h"
#include "llmrouter/balancer/CircuitBreaker.h"
#include "llmrouter/balancer/PolicyRegistry.h"
#include "llmrouter/common/Logger.h"
#include "llmrouter/monitor/Metrics.h"
#include "llmrouter/monitor/RateLimiter.h"
#include "llmrouter/protocol/ChatRequest.h"
#include "llmrouter/protocol/ResponseCache.h"
#include "llmrouter/router/Classifier.h"
#include "llmrouter/router/Upstream.h"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace llmrouter {
namespace router {

using llmrouter::balancer::BackendPtr;
using llmrouter::balancer::Policy;
using llmrouter::balancer::PolicyKind;
using llmrouter::common::ErrorKind;
using llmrouter::common::GatewayError;
using llmrouter::common::GatewayException;
using llmrouter::monitor::Metrics;
using llmrouter::protocol::CachedResponse;
using llmrouter::protocol::ChatRequest;
namespace metric = llmrouter::monitor::metric;

namespace {

using Clock = std::chrono::steady_clock;

double SecondsSince(Clock::time_point t) {
    return std::chrono::duration<double>(Clock::now() - t).count();
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // namespace

struct Gateway::RequestContext {
    RequestInput input;
    ResponseSinkPtr sink;
    Clock::time_point start;
    ChatRequest request;
    const Policy* policy{nullptr};
    std::string cacheStatus{"BYPASS"}; // HIT | MISS | BYPASS
    std::string fingerprint;           // empty: do not cache
    std::string strategy;
    bool finished{false};
};

Gateway::Gateway(const llmrouter::common::GatewaySettings& settings,
                 const llmrouter::balancer::PolicyRegistry& policies,
                 llmrouter::balancer::Balancer* balancer,
                 llmrouter::balancer::CircuitBreakerRegistry* breakers,
                 llmrouter::protocol::ResponseCache* cache,
                 llmrouter::monitor::RateLimiter* rateLimiter,
                 Classifier* classifier,
                 Upstream* upstream)
    : settings_(settings),
      policies_(policies),
      cache_(settings.cache.enabled ? cache : nullptr),
      rateLimiter_(rateLimiter),
      classifier_(classifier),
      retry_(RetryOrchestrator::Options{settings.retry.maxRetries, settings.retry.initialBackoffMs,
                                        settings.retry.maxBackoffMs, 0.05},
             balancer, breakers, upstream) {
}

void Gateway::Process(RequestInput input, const ResponseSinkPtr& sink) {
    auto ctx = std::make_shared<RequestContext>();
    ctx->input = std::move(input);
    ctx->sink = sink;
    ctx->start = Clock::now();
    Metrics::Instance().Inc(metric::kNumRequests);

    if (rateLimiter_ && !rateLimiter_->Admit(ctx->input.clientIp)) {
        Metrics::Instance().Inc(metric::kRateLimitRejections);
        Fail(ctx, GatewayError(ErrorKind::kRateLimited, "rate limit exceeded for " + ctx->input.clientIp));
        return;
    }

    try {
        ctx->request = ChatRequest::Parse(ctx->input.body);
        ctx->policy = &policies_.Resolve(ctx->request.hints().policy);
    } catch (const GatewayException& e) {
        Fail(ctx, e.error());
        return;
    } catch (const std::exception& e) {
        Fail(ctx, GatewayError(ErrorKind::kInvalidRequest, std::string("malformed request: ") + e.what()));
        return;
    }
    Metrics::Instance().Inc(metric::kRequestsPerPolicy, {{"policy", ctx->policy->name()}});

    if (LookupCache(ctx)) return;
    Route(ctx);
}

bool Gateway::CacheUsable(const RequestContext& ctx) const {
    if (!cache_) return false;
    if (ctx.request.cacheOptOut()) return false;
    auto it = ctx.input.headers.find("Cache-Control");
    if (it != ctx.input.headers.end()) {
        const std::string v = Lower(it->second);
        if (v.find("no-cache") != std::string::npos || v.find("no-store") != std::string::npos) return false;
    }
    if (settings_.cache.deterministicOnly && !ctx.request.Deterministic()) return false;
    return true;
}

bool Gateway::LookupCache(const ContextPtr& ctx) {
    if (!CacheUsable(*ctx)) return false;
    try {
        ctx->fingerprint = ctx->request.Fingerprint(ctx->policy->name(), ctx->input.path);
        auto hit = cache_->Get(ctx->fingerprint);
        if (!hit) {
            ctx->cacheStatus = "MISS";
            Metrics::Instance().Inc(metric::kCacheMisses);
            return false;
        }
        ctx->cacheStatus = "HIT";
        Metrics::Instance().Inc(metric::kCacheHits);
        Metrics::Instance().Inc(metric::kRequestSuccess);
        ObserveLatency(*ctx, 0.0);
        ctx->finished = true;
        LOG_DEBUG << "cache hit " << ctx->fingerprint.substr(0, 12) << " policy " << ctx->policy->name();
        ctx->sink->OnComplete(hit->status, ResponseHeaders(*ctx, hit->backend), hit->contentType, hit->body);
        return true;
    } catch (const GatewayException& e) {
        LOG_ERROR << "cache unavailable: " << e.error().message;
    } catch (const std::exception& e) {
        LOG_ERROR << "cache unavailable: " << e.what();
    }
    Metrics::Instance().Inc(metric::kCacheErrors);
    ctx->fingerprint.clear();
    ctx->cacheStatus = "BYPASS";
    return false;
}

void Gateway::Route(const ContextPtr& ctx) {
    const Policy& policy = *ctx->policy;
    const auto& hints = ctx->request.hints();

    if (Lower(hints.routingStrategy) == "manual" && !hints.model.empty()) {
        auto candidates = policy.BackendsForModel(hints.model);
        if (candidates.empty()) {
            Fail(ctx, GatewayError(ErrorKind::kUnresolvedLabel,
                                   "model '" + hints.model + "' is not configured in policy " + policy.name()));
            return;
        }
        const std::string label = policy.CanonicalLabel(hints.model);
        Dispatch(ctx, std::move(candidates), label, "manual");
        return;
    }

    const std::string model = ctx->request.model();
    if (!model.empty()) {
        auto candidates = policy.BackendsForModel(model);
        if (!candidates.empty()) {
            const std::string label = policy.CanonicalLabel(model);
            Dispatch(ctx, std::move(candidates), label, "manual");
            return;
        }
    }

    if (policy.kind() == PolicyKind::kStatic || !classifier_) {
        Dispatch(ctx, policy.backends(), "", "static");
        return;
    }

    const auto selectionStart = Clock::now();
    const std::string strategy = balancer::PolicyKindName(policy.kind());
    classifier_->Classify(ctx->input.loop, policy, ctx->request.PromptText(),
                          [this, ctx, selectionStart, strategy](Classification c) {
        Metrics::Instance().Observe(metric::kModelSelectionTime, {}, SecondsSince(selectionStart));
        const Policy& p = *ctx->policy;
        std::string label = c.label;
        std::string used = strategy;
        if (!c.ok) {
            if (p.fallbackLabel().empty()) {
                Fail(ctx, GatewayError(ErrorKind::kClassificationUnavailable, c.error));
                return;
            }
            LOG_WARN << "policy " << p.name() << ": classification unavailable (" << c.error
                     << "), using fallback label " << p.fallbackLabel();
            label = p.fallbackLabel();
            used = "fallback";
        }
        auto candidates = p.BackendsForLabel(label);
        if (candidates.empty()) {
            Fail(ctx, GatewayError(ErrorKind::kUnresolvedLabel,
                                   "label '" + label + "' has no backend in policy " + p.name()));
            return;
        }
        Dispatch(ctx, std::move(candidates), label, used);
    });
}

void Gateway::Dispatch(const ContextPtr& ctx, std::vector<BackendPtr> candidates,
                       const std::string& cursorLabel, const std::string& strategy) {
    ctx->strategy = strategy;
    Metrics::Instance().Inc(metric::kRoutingPolicyUsage, {{"strategy", strategy}});

    RetryOrchestrator::Job job;
    job.candidates = std::move(candidates);
    job.cursor = &ctx->policy->Cursor(cursorLabel);
    job.stream = ctx->request.stream();
    job.bodyFor = [ctx](const BackendPtr& b) { return ctx->request.BuildUpstreamBody(b->model); };
    if (job.stream) {
        job.relay.onStart = [this, ctx](const balancer::Backend& backend, int status, const std::string& contentType) {
            ctx->sink->OnStreamStart(status, ResponseHeaders(*ctx, backend.name),
                                     contentType.empty() ? "text/event-stream" : contentType);
            return true;
        };
        job.relay.onData = [ctx](const char* data, size_t len) { ctx->sink->OnStreamData(data, len); };
    }

    retry_.Run(ctx->input.loop, std::move(job),
               [this, ctx](RetryOrchestrator::Outcome outcome) { OnOutcome(ctx, std::move(outcome)); });
}

void Gateway::OnOutcome(const ContextPtr& ctx, RetryOrchestrator::Outcome outcome) {
    const double upstreamSeconds = outcome.result.seconds;

    if (outcome.committed) {
        ctx->finished = true;
        ctx->sink->OnStreamEnd(outcome.ok);
        if (!outcome.ok) {
            LOG_WARN << "stream from " << (outcome.backend ? outcome.backend->Key() : "?")
                     << " broke off: " << outcome.error.message;
            Metrics::Instance().Inc(metric::kRequestFailure, {{"error_type", outcome.error.Reason()}});
            ObserveLatency(*ctx, upstreamSeconds);
            return;
        }
    }

    if (!outcome.ok) {
        if (outcome.error.kind == ErrorKind::kUpstreamPermanent && !outcome.result.body.empty()) {
            outcome.error.message += ": " + outcome.result.body.substr(0, 512);
        }
        ObserveLatency(*ctx, upstreamSeconds);
        Fail(ctx, outcome.error);
        return;
    }

    const BackendPtr& backend = outcome.backend;
    Metrics::Instance().Inc(metric::kRequestsPerModel, {{"model", backend->model}});
    Metrics::Instance().Inc(metric::kRequestSuccess);
    RecordUsage(*backend, outcome.result.body);
    StoreInCache(ctx, outcome);
    ObserveLatency(*ctx, upstreamSeconds);
    LOG_INFO << ctx->input.clientIp << " " << ctx->input.path << " policy=" << ctx->policy->name()
             << " strategy=" << ctx->strategy << " backend=" << backend->Key() << " status=" << outcome.result.status
             << " attempts=" << outcome.attempts << " cache=" << ctx->cacheStatus;

    if (outcome.committed) return;
    ctx->finished = true;
    ctx->sink->OnComplete(outcome.result.status, ResponseHeaders(*ctx, backend->name),
                          outcome.result.contentType.empty() ? "application/json" : outcome.result.contentType,
                          outcome.result.body);
}

void Gateway::StoreInCache(const ContextPtr& ctx, const RetryOrchestrator::Outcome& outcome) {
    if (!cache_ || ctx->fingerprint.empty()) return;
    const int status = outcome.result.status;
    if (status < 200 || status >= 300) return;
    try {
        CachedResponse entry;
        entry.status = status;
        entry.contentType = outcome.result.contentType.empty()
                                ? (outcome.committed ? "text/event-stream" : "application/json")
                                : outcome.result.contentType;
        entry.body = outcome.result.body;
        entry.backend = outcome.backend->name;
        cache_->Put(ctx->fingerprint, std::move(entry));
        Metrics::Instance().SetGauge(metric::kCacheSize, {}, static_cast<double>(cache_->Size()));
    } catch (const std::exception& e) {
        LOG_ERROR << "cache unavailable: " << e.what();
        Metrics::Instance().Inc(metric::kCacheErrors);
    }
}

void Gateway::RecordUsage(const balancer::Backend& backend, const std::string& body) {
    const auto usage = protocol::ParseUsage(body);
    if (!usage.present) return;
    Metrics& m = Metrics::Instance();
    m.Inc(metric::kTokenUsage, {{"llm_name", backend.name}, {"category", "prompt"}},
          static_cast<double>(usage.promptTokens));
    m.Inc(metric::kTokenUsage, {{"llm_name", backend.name}, {"category", "completion"}},
          static_cast<double>(usage.completionTokens));
    m.Inc(metric::kTokenUsage, {{"llm_name", backend.name}, {"category", "total"}},
          static_cast<double>(usage.totalTokens));
}

void Gateway::Fail(const ContextPtr& ctx, const GatewayError& error) {
    Metrics::Instance().Inc(metric::kRequestFailure, {{"error_type", error.Reason()}});
    if (ctx->finished) return;
    ctx->finished = true;
    if (error.kind == ErrorKind::kRateLimited || error.kind == ErrorKind::kInvalidRequest) {
        LOG_DEBUG << ctx->input.clientIp << " " << error.Reason() << ": " << error.message;
    } else {
        LOG_WARN << ctx->input.clientIp << " " << ctx->input.path << " " << error.Reason() << ": " << error.message;
    }
    ctx->sink->OnComplete(error.HttpStatus(), ResponseHeaders(*ctx, ""), "application/json", error.ToJson());
}

HeaderList Gateway::ResponseHeaders(const RequestContext& ctx, const std::string& backend) const {
    HeaderList headers;
    if (ctx.policy) headers.emplace_back(kPolicyHeader, ctx.policy->name());
    if (!backend.empty()) headers.emplace_back(kBackendHeader, backend);
    if (ctx.policy) headers.emplace_back(kCacheHeader, ctx.cacheStatus);
    return headers;
}

void Gateway::ObserveLatency(const RequestContext& ctx, double upstreamSeconds) {
    const double total = SecondsSince(ctx.start);
    Metrics::Instance().Observe(metric::kRequestLatency, {}, total);
    Metrics::Instance().Observe(metric::kProxyOverhead, {}, std::max(0.0, total - upstreamSeconds));
}

} // namespace router
} // namespace llmrouter
