#include "llmrouter/router/RetryOrchestrator.h"
#include "llmrouter/balancer/Balancer.h"
#include "llmrouter/balancer/CircuitBreaker.h"
#include "llmrouter/common/Logger.h"
#include "llmrouter/monitor/Metrics.h"
#include "llmrouter/network/EventLoop.h"

#include <algorithm>
#include <random>
#include <set>

namespace llmrouter {
namespace router {

using llmrouter::balancer::BackendPtr;
using llmrouter::common::ErrorKind;
using llmrouter::common::GatewayError;
using llmrouter::monitor::Metrics;
using llmrouter::protocol::HttpClient;
namespace metric = llmrouter::monitor::metric;

struct RetryOrchestrator::RunState {
    llmrouter::network::EventLoop* loop{nullptr};
    Job job;
    DoneCallback done;
    std::set<std::string> tried;
    int attempts{0};
    std::atomic<size_t> localCursor{0};
    GatewayError lastError;
    BackendPtr lastBackend;
    UpstreamResult lastResult;
    bool finished{false};
};

RetryOrchestrator::RetryOrchestrator(const Options& opts,
                                     llmrouter::balancer::Balancer* balancer,
                                     llmrouter::balancer::CircuitBreakerRegistry* breakers,
                                     Upstream* upstream)
    : opts_(opts), balancer_(balancer), breakers_(breakers), upstream_(upstream) {
}

bool RetryOrchestrator::IsRetryableStatus(int status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

int RetryOrchestrator::BackoffMs(const Options& opts, int retry, double jitterSample) {
    if (retry < 1 || opts.initialBackoffMs <= 0) return 0;
    double ms = opts.initialBackoffMs;
    for (int i = 1; i < retry && ms < opts.maxBackoffMs; ++i) ms *= 2.0;
    if (opts.maxBackoffMs > 0) ms = std::min(ms, static_cast<double>(opts.maxBackoffMs));
    jitterSample = std::max(-1.0, std::min(1.0, jitterSample));
    ms *= 1.0 + opts.jitter * jitterSample;
    return std::max(0, static_cast<int>(ms + 0.5));
}

void RetryOrchestrator::Run(llmrouter::network::EventLoop* loop, Job job, DoneCallback done) {
    auto run = std::make_shared<RunState>();
    run->loop = loop;
    run->job = std::move(job);
    run->done = std::move(done);
    if (!run->job.cursor) run->job.cursor = &run->localCursor;
    Attempt(run);
}

void RetryOrchestrator::Attempt(const RunPtr& run) {
    auto breakerFor = [this](const BackendPtr& b) {
        return breakers_ ? breakers_->Get(b->Key()) : nullptr;
    };
    auto eligible = [&breakerFor](const BackendPtr& b) {
        auto* breaker = breakerFor(b);
        return !breaker || breaker->IsEligible();
    };
    auto untried = [&run, &eligible](const BackendPtr& b) {
        return !run->tried.count(b->Key()) && eligible(b);
    };

    // A HalfOpen trial may be claimed by another request between the
    // eligibility check and TryAcquire; such backends are skipped here.
    std::set<std::string> busy;
    BackendPtr backend;
    balancer::CircuitBreaker::Permit permit;
    for (size_t guard = 0; guard <= run->job.candidates.size(); ++guard) {
        auto notBusy = [&busy](const BackendPtr& b) { return !busy.count(b->Key()); };
        backend = balancer_->Select(run->job.candidates,
                                    [&](const BackendPtr& b) { return notBusy(b) && untried(b); },
                                    *run->job.cursor);
        if (!backend && !run->tried.empty()) {
            backend = balancer_->Select(run->job.candidates,
                                        [&](const BackendPtr& b) { return notBusy(b) && eligible(b); },
                                        *run->job.cursor);
        }
        if (!backend) break;
        auto* breaker = breakerFor(backend);
        if (!breaker || breaker->TryAcquire(&permit)) break;
        busy.insert(backend->Key());
        backend.reset();
    }

    if (!backend) {
        if (run->attempts == 0) {
            Outcome out;
            out.error = GatewayError(ErrorKind::kNoEligibleBackend, "no eligible backend among " +
                                                                        std::to_string(run->job.candidates.size()) +
                                                                        " candidates");
            Finish(run, std::move(out));
        } else {
            Outcome out;
            out.backend = run->lastBackend;
            out.result = std::move(run->lastResult);
            out.error = GatewayError(ErrorKind::kUpstreamExhausted,
                                     "no eligible backend left after " + std::to_string(run->attempts) +
                                         " attempts: " + run->lastError.message,
                                     run->lastError.upstreamStatus);
            Finish(run, std::move(out));
        }
        return;
    }

    run->attempts += 1;
    run->tried.insert(backend->Key());
    Metrics::Instance().Inc(metric::kLoadBalancerUsage, {{"llm_name", backend->name}, {"api_base", backend->apiBase}});
    if (run->attempts > 1) {
        Metrics::Instance().Inc(metric::kRetryCount, {{"llm_name", backend->name}});
    }
    LOG_DEBUG << "attempt " << run->attempts << " -> " << backend->Key() << " (" << balancer_->name() << ")";

    const std::string body = run->job.bodyFor ? run->job.bodyFor(backend) : std::string();
    upstream_->Send(run->loop, backend, body, run->job.stream, run->job.relay,
                    [this, run, backend, permit](UpstreamResult result) {
                        OnResult(run, backend, permit, std::move(result));
                    });
}

void RetryOrchestrator::OnResult(const RunPtr& run, const BackendPtr& backend,
                                 const balancer::CircuitBreaker::Permit& permit, UpstreamResult result) {
    auto* breaker = breakers_ ? breakers_->Get(backend->Key()) : nullptr;
    Metrics::Instance().Observe(metric::kLlmResponseTime, {{"llm", backend->name}}, result.seconds);

    run->lastBackend = backend;
    const bool committed = result.streamed;

    if (result.failure != HttpClient::Failure::kNone) {
        if (breaker) {
            if (result.failure == HttpClient::Failure::kPoolExhausted) {
                breaker->Release(permit);
            } else {
                breaker->RecordFailure(permit);
            }
        }
        GatewayError err(ErrorKind::kUpstreamTransient,
                         backend->Key() + ": " + HttpClient::FailureName(result.failure));
        run->lastResult = std::move(result);
        if (committed) {
            Outcome out;
            out.backend = backend;
            out.result = std::move(run->lastResult);
            out.error = err;
            out.committed = true;
            Finish(run, std::move(out));
            return;
        }
        RetryOrFinish(run, std::move(err));
        return;
    }

    const int status = result.status;
    if (status >= 200 && status < 300) {
        if (breaker) breaker->RecordSuccess(permit);
        Outcome out;
        out.ok = true;
        out.backend = backend;
        out.result = std::move(result);
        out.committed = committed;
        Finish(run, std::move(out));
        return;
    }

    if (IsRetryableStatus(status)) {
        if (breaker) breaker->RecordFailure(permit);
        GatewayError err(ErrorKind::kUpstreamTransient, backend->Key() + " returned HTTP " + std::to_string(status),
                         status);
        run->lastResult = std::move(result);
        RetryOrFinish(run, std::move(err));
        return;
    }

    // Permanent: client errors say nothing about backend health.
    if (breaker) {
        if (status >= 500) {
            breaker->RecordFailure(permit);
        } else {
            breaker->RecordSuccess(permit);
        }
    }
    Outcome out;
    out.backend = backend;
    out.error = GatewayError(ErrorKind::kUpstreamPermanent,
                             backend->Key() + " returned HTTP " + std::to_string(status), status);
    out.result = std::move(result);
    Finish(run, std::move(out));
}

void RetryOrchestrator::RetryOrFinish(const RunPtr& run, GatewayError error) {
    LOG_WARN << "attempt " << run->attempts << " failed: " << error.message;
    run->lastError = std::move(error);

    if (run->attempts > opts_.maxRetries) {
        Outcome out;
        out.backend = run->lastBackend;
        out.result = std::move(run->lastResult);
        out.error = GatewayError(ErrorKind::kUpstreamExhausted,
                                 "gave up after " + std::to_string(run->attempts) + " attempts: " +
                                     run->lastError.message,
                                 run->lastError.upstreamStatus);
        Finish(run, std::move(out));
        return;
    }

    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> jitter(-1.0, 1.0);
    const int delayMs = BackoffMs(opts_, run->attempts, jitter(rng));
    if (delayMs <= 0) {
        run->loop->QueueInLoop([this, run]() { Attempt(run); });
        return;
    }
    run->loop->RunAfter(delayMs / 1000.0, [this, run]() { Attempt(run); });
}

void RetryOrchestrator::Finish(const RunPtr& run, Outcome outcome) {
    if (run->finished) return;
    run->finished = true;
    outcome.attempts = run->attempts;
    DoneCallback done = std::move(run->done);
    if (done) done(std::move(outcome));
}

} // namespace router
} // namespace llmrouter
