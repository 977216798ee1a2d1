#pragma once

#include <chrono>
#include <mutex>

namespace llmrouter {
namespace monitor {

// Token bucket: `capacity` tokens at most, refilled continuously at
// `refillRate` tokens per second. Starts full.
class TokenBucket {
public:
    using Clock = std::chrono::steady_clock;

    TokenBucket(double refillRate, double capacity, Clock::time_point now = Clock::now());

    bool Allow(double tokens = 1.0);
    bool AllowAt(Clock::time_point now, double tokens = 1.0);

    double AvailableAt(Clock::time_point now);

    double refillRate() const { return refillRate_; }
    double capacity() const { return capacity_; }

private:
    void RefillLocked(Clock::time_point now);

    const double refillRate_;
    const double capacity_;

    std::mutex mutex_;
    double tokens_;
    Clock::time_point lastRefill_;
};

} // namespace monitor
} // namespace llmrouter
