#pragma once

#include "llmrouter/common/Settings.h"
#include "llmrouter/common/noncopyable.h"
#include "llmrouter/monitor/PerKeyRateLimiter.h"
#include "llmrouter/monitor/TokenBucket.h"

#include <memory>
#include <string>

namespace llmrouter {
namespace monitor {

// Admission control in front of the gateway: one bucket per client IP
// (per_ip) or a single bucket shared by everyone.
class RateLimiter : llmrouter::common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;

    explicit RateLimiter(const llmrouter::common::RateLimitSettings& settings);

    bool Admit(const std::string& clientIp) { return AdmitAt(clientIp, Clock::now()); }
    bool AdmitAt(const std::string& clientIp, Clock::time_point now);

    bool enabled() const { return settings_.enabled; }
    bool perIp() const { return settings_.perIp; }
    size_t TrackedClients() const { return perKey_ ? perKey_->Size() : 0; }

private:
    const llmrouter::common::RateLimitSettings settings_;
    std::unique_ptr<PerKeyRateLimiter> perKey_;
    std::unique_ptr<TokenBucket> global_;
};

} // namespace monitor
} // namespace llmrouter
