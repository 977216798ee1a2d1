#include "llmrouter/monitor/TokenBucket.h"
#include "llmrouter/common/Logger.h"

#include <cassert>
#include <chrono>
#include <stdexcept>

using llmrouter::common::Logger;
using llmrouter::monitor::TokenBucket;

static void testBurstAndRefill() {
    auto t0 = TokenBucket::Clock::now();
    TokenBucket bucket(/*rate*/ 10.0, /*capacity*/ 5.0, t0);

    // Burst: allow 5 immediately.
    for (int i = 0; i < 5; ++i) {
        assert(bucket.AllowAt(t0, 1.0));
    }
    assert(!bucket.AllowAt(t0, 1.0));

    // After 100ms at 10/s -> +1 token.
    auto t1 = t0 + std::chrono::milliseconds(100);
    assert(bucket.AllowAt(t1, 1.0));
    assert(!bucket.AllowAt(t1, 1.0));

    // After 5s more -> refilled but capped by capacity 5.
    auto t2 = t1 + std::chrono::seconds(5);
    int allowed = 0;
    for (int i = 0; i < 10; ++i) {
        if (bucket.AllowAt(t2, 1.0)) ++allowed;
    }
    assert(allowed == 5);
}

static void testClockGoingBackwardsDoesNotRefill() {
    auto t0 = TokenBucket::Clock::now();
    TokenBucket bucket(100.0, 1.0, t0);
    assert(bucket.AllowAt(t0));
    assert(!bucket.AllowAt(t0 - std::chrono::seconds(1)));
    assert(bucket.AvailableAt(t0) < 1.0);
}

static void testNonPositiveCostAllowed() {
    TokenBucket bucket(/*rate*/ 1.0, /*capacity*/ 1.0);
    assert(bucket.AllowAt(TokenBucket::Clock::now(), 0.0));
    assert(bucket.AllowAt(TokenBucket::Clock::now(), -1.0));
}

static void testInvalidParameters() {
    bool threw = false;
    try {
        TokenBucket bad(1.0, 0.0);
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
}

int main() {
    Logger::Instance().SetLevel(llmrouter::common::LogLevel::INFO);
    testBurstAndRefill();
    testClockGoingBackwardsDoesNotRefill();
    testNonPositiveCostAllowed();
    testInvalidParameters();
    LOG_INFO << "TokenBucket tests PASS";
    return 0;
}
