#include "llmrouter/balancer/CircuitBreaker.h"
#include "llmrouter/common/Logger.h"

namespace llmrouter {
namespace balancer {

const char* CircuitStateName(CircuitState state) {
    switch (state) {
        case CircuitState::kClosed: return "closed";
        case CircuitState::kOpen: return "open";
        case CircuitState::kHalfOpen: return "half_open";
    }
    return "unknown";
}

CircuitBreaker::CircuitBreaker(std::string key, const Options& opts, TransitionCallback onTransition)
    : key_(std::move(key)), opts_(opts), onTransition_(std::move(onTransition)) {
}

void CircuitBreaker::TransitionLocked(CircuitState to, Clock::time_point now) {
    const CircuitState from = state_;
    if (from == to) return;
    state_ = to;
    trialInFlight_ = false;
    if (to == CircuitState::kOpen) {
        openedAt_ = now;
        ++generation_;
    }
    if (to == CircuitState::kClosed) failures_ = 0;

    if (to == CircuitState::kOpen) {
        LOG_WARN << "circuit " << key_ << ": " << CircuitStateName(from) << " -> open after "
                 << failures_ << " consecutive failures";
    } else {
        LOG_INFO << "circuit " << key_ << ": " << CircuitStateName(from) << " -> " << CircuitStateName(to);
    }
    if (onTransition_) onTransition_(key_, from, to);
}

void CircuitBreaker::MaybeHalfOpenLocked(Clock::time_point now) {
    if (state_ == CircuitState::kOpen && now - openedAt_ >= opts_.resetTimeout) {
        TransitionLocked(CircuitState::kHalfOpen, now);
    }
}

bool CircuitBreaker::IsEligible(Clock::time_point now) {
    if (!opts_.enabled) return true;
    std::lock_guard<std::mutex> lock(mutex_);
    MaybeHalfOpenLocked(now);
    if (state_ == CircuitState::kOpen) return false;
    if (state_ == CircuitState::kHalfOpen) return !trialInFlight_;
    return true;
}

bool CircuitBreaker::TryAcquire(Permit* permit, Clock::time_point now) {
    if (!opts_.enabled) return true;
    std::lock_guard<std::mutex> lock(mutex_);
    MaybeHalfOpenLocked(now);
    permit->generation = generation_;
    permit->trial = false;
    switch (state_) {
        case CircuitState::kClosed:
            return true;
        case CircuitState::kHalfOpen:
            if (trialInFlight_) return false;
            trialInFlight_ = true;
            permit->trial = true;
            return true;
        case CircuitState::kOpen:
            return false;
    }
    return false;
}

// In HalfOpen only the trial speaks; a call admitted while Closed belongs to
// an older generation by then.
bool CircuitBreaker::CurrentLocked(const Permit& permit) const {
    if (permit.generation != generation_) return false;
    if (state_ == CircuitState::kHalfOpen) return permit.trial;
    return true;
}

void CircuitBreaker::RecordSuccess(const Permit& permit) {
    if (!opts_.enabled) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!CurrentLocked(permit)) {
        LOG_DEBUG << "circuit " << key_ << ": ignoring success of a call admitted before the last open";
        return;
    }
    if (state_ == CircuitState::kHalfOpen) {
        TransitionLocked(CircuitState::kClosed, Clock::now());
    } else if (state_ == CircuitState::kClosed) {
        failures_ = 0;
    }
}

void CircuitBreaker::RecordFailure(const Permit& permit, Clock::time_point now) {
    if (!opts_.enabled) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (!CurrentLocked(permit)) {
        LOG_DEBUG << "circuit " << key_ << ": ignoring failure of a call admitted before the last open";
        return;
    }
    ++failures_;
    if (state_ == CircuitState::kHalfOpen) {
        TransitionLocked(CircuitState::kOpen, now);
    } else if (state_ == CircuitState::kClosed && failures_ >= opts_.failureThreshold) {
        TransitionLocked(CircuitState::kOpen, now);
    }
}

void CircuitBreaker::Release(const Permit& permit) {
    if (!opts_.enabled) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CircuitState::kHalfOpen && permit.trial && permit.generation == generation_) {
        trialInFlight_ = false;
    }
}

CircuitState CircuitBreaker::GetState(Clock::time_point now) {
    if (!opts_.enabled) return CircuitState::kClosed;
    std::lock_guard<std::mutex> lock(mutex_);
    MaybeHalfOpenLocked(now);
    return state_;
}

CircuitBreaker::Snapshot CircuitBreaker::GetSnapshot(Clock::time_point now) {
    Snapshot s;
    s.key = key_;
    if (!opts_.enabled) return s;
    std::lock_guard<std::mutex> lock(mutex_);
    MaybeHalfOpenLocked(now);
    s.state = state_;
    s.consecutiveFailures = failures_;
    if (state_ == CircuitState::kOpen) {
        const auto left = opts_.resetTimeout - (now - openedAt_);
        s.retryInSec = std::chrono::duration<double>(left).count();
    }
    return s;
}

CircuitBreakerRegistry::CircuitBreakerRegistry(const CircuitBreaker::Options& opts,
                                               const std::vector<std::string>& keys,
                                               CircuitBreaker::TransitionCallback onTransition)
    : opts_(opts) {
    for (const auto& key : keys) {
        if (breakers_.count(key)) continue;
        breakers_.emplace(key, std::make_unique<CircuitBreaker>(key, opts, onTransition));
    }
    LOG_INFO << "circuit breakers " << (opts.enabled ? "enabled" : "disabled") << " for " << breakers_.size()
             << " backends (threshold " << opts.failureThreshold << ", reset "
             << std::chrono::duration<double>(opts.resetTimeout).count() << "s)";
}

CircuitBreaker* CircuitBreakerRegistry::Get(const std::string& key) const {
    auto it = breakers_.find(key);
    return it != breakers_.end() ? it->second.get() : nullptr;
}

std::vector<CircuitBreaker::Snapshot> CircuitBreakerRegistry::Snapshot() const {
    std::vector<CircuitBreaker::Snapshot> out;
    out.reserve(breakers_.size());
    const auto now = CircuitBreaker::Clock::now();
    for (const auto& kv : breakers_) {
        out.push_back(kv.second->GetSnapshot(now));
    }
    return out;
}

} // namespace balancer
} // namespace llmrouter
