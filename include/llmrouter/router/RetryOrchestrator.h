#pragma once

#include "llmrouter/balancer/Backend.h"
#include "llmrouter/balancer/CircuitBreaker.h"
#include "llmrouter/common/GatewayError.h"
#include "llmrouter/common/noncopyable.h"
#include "llmrouter/router/Upstream.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace llmrouter {
namespace balancer {
class Balancer;
}

namespace router {

// Runs attempts against freshly selected backends until one succeeds, a
// permanent error comes back, or retries run out.
// - Backends already tried are skipped while untried eligible ones remain.
// - Backoff doubles per retry up to maxBackoffMs, with jitter, on a loop timer.
// - A stream that already reached the client is never retried.
class RetryOrchestrator : llmrouter::common::noncopyable {
public:
    struct Options {
        int maxRetries{2};
        int initialBackoffMs{100};
        int maxBackoffMs{5000};
        double jitter{0.05}; // +/- fraction of the backoff
    };

    struct Job {
        std::vector<llmrouter::balancer::BackendPtr> candidates;
        std::atomic<size_t>* cursor{nullptr};
        std::function<std::string(const llmrouter::balancer::BackendPtr&)> bodyFor;
        bool stream{false};
        StreamHandlers relay;
    };

    struct Outcome {
        bool ok{false};
        llmrouter::balancer::BackendPtr backend; // last backend tried
        UpstreamResult result;                   // last upstream result
        llmrouter::common::GatewayError error;   // when !ok
        int attempts{0};
        bool committed{false}; // stream bytes reached the client
    };

    using DoneCallback = std::function<void(Outcome)>;

    RetryOrchestrator(const Options& opts,
                      llmrouter::balancer::Balancer* balancer,
                      llmrouter::balancer::CircuitBreakerRegistry* breakers,
                      Upstream* upstream);

    // Must be called on loop's thread; done runs there exactly once.
    void Run(llmrouter::network::EventLoop* loop, Job job, DoneCallback done);

    const Options& options() const { return opts_; }

    static bool IsRetryableStatus(int status);
    // Delay before retry number `retry` (1-based); jitterSample in [-1, 1].
    static int BackoffMs(const Options& opts, int retry, double jitterSample);

private:
    struct RunState;
    using RunPtr = std::shared_ptr<RunState>;

    void Attempt(const RunPtr& run);
    void OnResult(const RunPtr& run, const llmrouter::balancer::BackendPtr& backend,
                  const llmrouter::balancer::CircuitBreaker::Permit& permit, UpstreamResult result);
    void RetryOrFinish(const RunPtr& run, llmrouter::common::GatewayError error);
    void Finish(const RunPtr& run, Outcome outcome);

    Options opts_;
    llmrouter::balancer::Balancer* balancer_;
    llmrouter::balancer::CircuitBreakerRegistry* breakers_;
    Upstream* upstream_;
};

} // namespace router
} // namespace llmrouter
