#include "llmrouter/monitor/TokenBucket.h"

#include <algorithm>
#include <stdexcept>

namespace llmrouter {
namespace monitor {

TokenBucket::TokenBucket(double refillRate, double capacity, Clock::time_point now)
    : refillRate_(refillRate), capacity_(capacity), tokens_(capacity), lastRefill_(now) {
    if (refillRate_ < 0.0) {
        throw std::invalid_argument("TokenBucket refill rate must be >= 0");
    }
    if (capacity_ <= 0.0) {
        throw std::invalid_argument("TokenBucket capacity must be > 0");
    }
}

void TokenBucket::RefillLocked(Clock::time_point now) {
    if (now <= lastRefill_) return;
    const std::chrono::duration<double> elapsed = now - lastRefill_;
    tokens_ = std::min(capacity_, tokens_ + elapsed.count() * refillRate_);
    lastRefill_ = now;
}

bool TokenBucket::Allow(double tokens) {
    return AllowAt(Clock::now(), tokens);
}

bool TokenBucket::AllowAt(Clock::time_point now, double tokens) {
    if (tokens <= 0.0) return true;
    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(now);
    if (tokens_ < tokens) return false;
    tokens_ -= tokens;
    return true;
}

double TokenBucket::AvailableAt(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    RefillLocked(now);
    return tokens_;
}

} // namespace monitor
} // namespace llmrouter
