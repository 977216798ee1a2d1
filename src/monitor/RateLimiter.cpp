#include "llmrouter/monitor/RateLimiter.h"
#include "llmrouter/common/Logger.h"

namespace llmrouter {
namespace monitor {

RateLimiter::RateLimiter(const llmrouter::common::RateLimitSettings& settings) : settings_(settings) {
    if (!settings_.enabled) {
        LOG_INFO << "rate limiting disabled";
        return;
    }
    if (settings_.perIp) {
        PerKeyRateLimiter::Config cfg;
        cfg.qps = settings_.requestsPerSecond;
        cfg.burst = settings_.burstSize;
        cfg.idleSec = settings_.idleSec;
        cfg.maxEntries = settings_.maxEntries;
        perKey_ = std::make_unique<PerKeyRateLimiter>(cfg);
    } else {
        global_ = std::make_unique<TokenBucket>(settings_.requestsPerSecond, settings_.burstSize);
    }
    LOG_INFO << "rate limiting " << settings_.requestsPerSecond << " req/s, burst " << settings_.burstSize
             << (settings_.perIp ? " per client IP" : " global");
}

bool RateLimiter::AdmitAt(const std::string& clientIp, Clock::time_point now) {
    if (!settings_.enabled) return true;
    if (global_) return global_->AllowAt(now);
    return perKey_->AllowAt(clientIp, now);
}

} // namespace monitor
} // namespace llmrouter
