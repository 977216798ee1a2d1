#include "llmrouter/monitor/PerKeyRateLimiter.h"
#include "llmrouter/monitor/RateLimiter.h"
#include "llmrouter/common/Logger.h"

#include <cassert>
#include <chrono>
#include <string>

using llmrouter::common::Logger;
using llmrouter::common::LogLevel;
using llmrouter::common::RateLimitSettings;
using llmrouter::monitor::PerKeyRateLimiter;
using llmrouter::monitor::RateLimiter;

static void testPerKeyIsolation() {
    PerKeyRateLimiter::Config cfg;
    cfg.qps = 1.0;
    cfg.burst = 2.0;
    PerKeyRateLimiter limiter(cfg);
    auto t0 = PerKeyRateLimiter::Clock::now();

    assert(limiter.AllowAt("10.0.0.1", t0));
    assert(limiter.AllowAt("10.0.0.1", t0));
    assert(!limiter.AllowAt("10.0.0.1", t0));

    // Another key has its own bucket.
    assert(limiter.AllowAt("10.0.0.2", t0));
    assert(limiter.Size() == 2);

    // One second refills one token.
    assert(limiter.AllowAt("10.0.0.1", t0 + std::chrono::seconds(1)));
    assert(!limiter.AllowAt("10.0.0.1", t0 + std::chrono::seconds(1)));
}

static void testIdleBucketsReclaimed() {
    PerKeyRateLimiter::Config cfg;
    cfg.qps = 10.0;
    cfg.burst = 10.0;
    cfg.idleSec = 1.0;
    cfg.shards = 1;
    cfg.cleanupEvery = 1;
    PerKeyRateLimiter limiter(cfg);
    auto t0 = PerKeyRateLimiter::Clock::now();

    for (int i = 0; i < 5; ++i) {
        assert(limiter.AllowAt("ip-" + std::to_string(i), t0));
    }
    assert(limiter.Size() == 5);

    // A call far in the future sweeps the idle ones.
    assert(limiter.AllowAt("late", t0 + std::chrono::seconds(10)));
    assert(limiter.Size() == 1);
}

static void testEntryCap() {
    PerKeyRateLimiter::Config cfg;
    cfg.maxEntries = 4;
    cfg.shards = 1;
    cfg.cleanupEvery = 1000;
    PerKeyRateLimiter limiter(cfg);
    auto t0 = PerKeyRateLimiter::Clock::now();

    for (int i = 0; i < 20; ++i) {
        limiter.AllowAt("ip-" + std::to_string(i), t0 + std::chrono::milliseconds(i));
    }
    assert(limiter.Size() <= 4);
}

static void testBurstPlusOneRejectedPerIp() {
    RateLimitSettings s;
    s.enabled = true;
    s.requestsPerSecond = 1.0;
    s.burstSize = 3.0;
    s.perIp = true;
    RateLimiter limiter(s);
    auto t0 = RateLimiter::Clock::now();

    for (int i = 0; i < 3; ++i) assert(limiter.AdmitAt("1.1.1.1", t0));
    assert(!limiter.AdmitAt("1.1.1.1", t0));
    assert(limiter.AdmitAt("2.2.2.2", t0));
    assert(limiter.TrackedClients() == 2);
}

static void testGlobalBucketShared() {
    RateLimitSettings s;
    s.enabled = true;
    s.requestsPerSecond = 1.0;
    s.burstSize = 2.0;
    s.perIp = false;
    RateLimiter limiter(s);
    auto t0 = RateLimiter::Clock::now();

    assert(limiter.AdmitAt("1.1.1.1", t0));
    assert(limiter.AdmitAt("2.2.2.2", t0));
    assert(!limiter.AdmitAt("3.3.3.3", t0));
    assert(limiter.TrackedClients() == 0);
}

static void testDisabledAdmitsEverything() {
    RateLimitSettings s;
    s.enabled = false;
    s.requestsPerSecond = 1.0;
    s.burstSize = 1.0;
    RateLimiter limiter(s);
    for (int i = 0; i < 1000; ++i) assert(limiter.Admit("1.1.1.1"));
    assert(!limiter.enabled());
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    testPerKeyIsolation();
    testIdleBucketsReclaimed();
    testEntryCap();
    testBurstPlusOneRejectedPerIp();
    testGlobalBucketShared();
    testDisabledAdmitsEverything();
    LOG_WARN << "RateLimiter tests PASS";
    return 0;
}
