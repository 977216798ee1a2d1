#include "llmrouter/balancer/CircuitBreaker.h"
#include "llmrouter/common/Logger.h"

#include <cassert>
#include <chrono>
#include <string>
#include <vector>

using llmrouter::balancer::CircuitBreaker;
using llmrouter::balancer::CircuitBreakerRegistry;
using llmrouter::balancer::CircuitState;
using llmrouter::common::Logger;
using llmrouter::common::LogLevel;

static CircuitBreaker::Options makeOptions(int threshold, int resetMs) {
    CircuitBreaker::Options o;
    o.enabled = true;
    o.failureThreshold = threshold;
    o.resetTimeout = std::chrono::milliseconds(resetMs);
    return o;
}

// One call admitted and failed at `now`.
static void failOnce(CircuitBreaker& cb, CircuitBreaker::Clock::time_point now) {
    CircuitBreaker::Permit permit;
    assert(cb.TryAcquire(&permit, now));
    cb.RecordFailure(permit, now);
}

static void succeedOnce(CircuitBreaker& cb, CircuitBreaker::Clock::time_point now) {
    CircuitBreaker::Permit permit;
    assert(cb.TryAcquire(&permit, now));
    cb.RecordSuccess(permit);
}

static void testOpensAfterThreshold() {
    std::vector<std::pair<CircuitState, CircuitState>> transitions;
    CircuitBreaker cb("p/a", makeOptions(3, 1000),
                      [&](const std::string& key, CircuitState from, CircuitState to) {
                          assert(key == "p/a");
                          transitions.push_back({from, to});
                      });
    auto t0 = CircuitBreaker::Clock::now();

    failOnce(cb, t0);
    failOnce(cb, t0);
    assert(cb.GetState(t0) == CircuitState::kClosed);
    assert(cb.IsEligible(t0));

    // A success resets the count.
    succeedOnce(cb, t0);
    failOnce(cb, t0);
    failOnce(cb, t0);
    assert(cb.GetState(t0) == CircuitState::kClosed);

    failOnce(cb, t0);
    assert(cb.GetState(t0) == CircuitState::kOpen);
    assert(!cb.IsEligible(t0));
    CircuitBreaker::Permit refused;
    assert(!cb.TryAcquire(&refused, t0));
    assert(transitions.size() == 1);
    assert(transitions[0].second == CircuitState::kOpen);

    auto snap = cb.GetSnapshot(t0 + std::chrono::milliseconds(400));
    assert(snap.state == CircuitState::kOpen);
    assert(snap.consecutiveFailures == 3);
    assert(snap.retryInSec > 0.5 && snap.retryInSec <= 0.6 + 1e-9);
}

static void testHalfOpenSingleTrial() {
    CircuitBreaker cb("p/b", makeOptions(1, 100));
    auto t0 = CircuitBreaker::Clock::now();
    failOnce(cb, t0);
    assert(cb.GetState(t0) == CircuitState::kOpen);

    auto t1 = t0 + std::chrono::milliseconds(150);
    assert(cb.IsEligible(t1));
    assert(cb.GetState(t1) == CircuitState::kHalfOpen);

    // Only one trial at a time.
    CircuitBreaker::Permit trial;
    CircuitBreaker::Permit second;
    assert(cb.TryAcquire(&trial, t1));
    assert(trial.trial);
    assert(!cb.TryAcquire(&second, t1));
    assert(!cb.IsEligible(t1));

    cb.RecordSuccess(trial);
    assert(cb.GetState(t1) == CircuitState::kClosed);
    CircuitBreaker::Permit a;
    CircuitBreaker::Permit b;
    assert(cb.TryAcquire(&a, t1));
    assert(cb.TryAcquire(&b, t1));
    assert(!a.trial && !b.trial);
}

static void testHalfOpenFailureReopens() {
    CircuitBreaker cb("p/c", makeOptions(2, 100));
    auto t0 = CircuitBreaker::Clock::now();
    failOnce(cb, t0);
    failOnce(cb, t0);

    auto t1 = t0 + std::chrono::milliseconds(200);
    failOnce(cb, t1);
    assert(cb.GetState(t1) == CircuitState::kOpen);
    // The timeout restarts from the failed trial.
    assert(cb.GetState(t1 + std::chrono::milliseconds(50)) == CircuitState::kOpen);
    assert(cb.GetState(t1 + std::chrono::milliseconds(120)) == CircuitState::kHalfOpen);
}

static void testReleaseReturnsTrial() {
    CircuitBreaker cb("p/d", makeOptions(1, 10));
    auto t0 = CircuitBreaker::Clock::now();
    failOnce(cb, t0);
    auto t1 = t0 + std::chrono::milliseconds(20);
    CircuitBreaker::Permit trial;
    CircuitBreaker::Permit other;
    assert(cb.TryAcquire(&trial, t1));
    assert(!cb.TryAcquire(&other, t1));
    cb.Release(trial);
    assert(cb.GetState(t1) == CircuitState::kHalfOpen);
    assert(cb.TryAcquire(&other, t1));
}

// A call admitted while Closed that finishes during the HalfOpen trial must
// not decide the breaker's state.
static void testLateOutcomesDoNotDecideTrial() {
    CircuitBreaker cb("p/f", makeOptions(1, 10));
    auto t0 = CircuitBreaker::Clock::now();

    CircuitBreaker::Permit early;
    CircuitBreaker::Permit lateFailure;
    assert(cb.TryAcquire(&early, t0));
    assert(cb.TryAcquire(&lateFailure, t0));
    failOnce(cb, t0);
    assert(cb.GetState(t0) == CircuitState::kOpen);

    auto t1 = t0 + std::chrono::milliseconds(20);
    CircuitBreaker::Permit trial;
    assert(cb.TryAcquire(&trial, t1));
    assert(trial.trial);

    cb.RecordSuccess(early);
    assert(cb.GetState(t1) == CircuitState::kHalfOpen);
    CircuitBreaker::Permit extra;
    assert(!cb.TryAcquire(&extra, t1));

    cb.RecordFailure(lateFailure, t1);
    assert(cb.GetState(t1) == CircuitState::kHalfOpen);

    // Releasing a stale permit does not free the running trial.
    cb.Release(early);
    assert(!cb.TryAcquire(&extra, t1));

    cb.RecordSuccess(trial);
    assert(cb.GetState(t1) == CircuitState::kClosed);

    // Still stale after the circuit closed again.
    cb.RecordFailure(lateFailure, t1);
    assert(cb.GetSnapshot(t1).consecutiveFailures == 0);
}

static void testDisabledPassThrough() {
    CircuitBreaker::Options o = makeOptions(1, 1000);
    o.enabled = false;
    CircuitBreaker cb("p/e", o);
    CircuitBreaker::Permit permit;
    for (int i = 0; i < 10; ++i) {
        assert(cb.TryAcquire(&permit));
        cb.RecordFailure(permit);
    }
    assert(cb.GetState() == CircuitState::kClosed);
    assert(cb.IsEligible());
    assert(cb.TryAcquire(&permit));
}

static void testRegistry() {
    int opened = 0;
    CircuitBreakerRegistry reg(makeOptions(1, 1000), {"p/a", "p/b", "p/a"},
                               [&](const std::string&, CircuitState, CircuitState to) {
                                   if (to == CircuitState::kOpen) ++opened;
                               });
    assert(reg.Get("p/a") != nullptr);
    assert(reg.Get("p/zzz") == nullptr);
    failOnce(*reg.Get("p/b"), CircuitBreaker::Clock::now());
    assert(opened == 1);

    auto snaps = reg.Snapshot();
    assert(snaps.size() == 2);
    assert(snaps[0].key == "p/a" && snaps[0].state == CircuitState::kClosed);
    assert(snaps[1].key == "p/b" && snaps[1].state == CircuitState::kOpen);
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    testOpensAfterThreshold();
    testHalfOpenSingleTrial();
    testHalfOpenFailureReopens();
    testReleaseReturnsTrial();
    testLateOutcomesDoNotDecideTrial();
    testDisabledPassThrough();
    testRegistry();
    LOG_WARN << "CircuitBreaker tests PASS";
    return 0;
}
