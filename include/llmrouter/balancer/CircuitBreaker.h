#pragma once

#include "llmrouter/common/noncopyable.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace llmrouter {
namespace balancer {

enum class CircuitState {
    kClosed,
    kOpen,
    kHalfOpen,
};

const char* CircuitStateName(CircuitState state);

// Per-backend failure tracking.
//   Closed   --failure_threshold consecutive failures--> Open
//   Open     --reset_timeout elapsed, on next check----> HalfOpen
//   HalfOpen --trial succeeds--> Closed, --trial fails--> Open
// HalfOpen admits a single trial call at a time. Every call carries the
// Permit it was admitted with; outcomes of calls admitted before the latest
// Open transition are ignored.
class CircuitBreaker : llmrouter::common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;
    using TransitionCallback = std::function<void(const std::string& key, CircuitState from, CircuitState to)>;

    struct Options {
        bool enabled{true};
        int failureThreshold{5};
        std::chrono::milliseconds resetTimeout{std::chrono::seconds(30)};
    };

    struct Snapshot {
        std::string key;
        CircuitState state{CircuitState::kClosed};
        int consecutiveFailures{0};
        double retryInSec{0.0}; // time left in Open
    };

    struct Permit {
        uint64_t generation{0}; // count of Open transitions at admission
        bool trial{false};      // the HalfOpen trial call
    };

    CircuitBreaker(std::string key, const Options& opts, TransitionCallback onTransition = TransitionCallback());

    // Not Open, and when HalfOpen no trial is running. Does not claim the trial.
    bool IsEligible(Clock::time_point now = Clock::now());
    // Claims permission for one call: always in Closed, the single trial in HalfOpen.
    bool TryAcquire(Permit* permit, Clock::time_point now = Clock::now());

    void RecordSuccess(const Permit& permit);
    void RecordFailure(const Permit& permit, Clock::time_point now = Clock::now());
    // Gives back a claimed HalfOpen trial without an outcome (call never left the gateway).
    void Release(const Permit& permit);

    CircuitState GetState(Clock::time_point now = Clock::now());
    Snapshot GetSnapshot(Clock::time_point now = Clock::now());

    const std::string& key() const { return key_; }

private:
    bool CurrentLocked(const Permit& permit) const;
    void MaybeHalfOpenLocked(Clock::time_point now);
    void TransitionLocked(CircuitState to, Clock::time_point now);

    const std::string key_;
    const Options opts_;
    TransitionCallback onTransition_;

    std::mutex mutex_;
    CircuitState state_{CircuitState::kClosed};
    int failures_{0};
    bool trialInFlight_{false};
    uint64_t generation_{0};
    Clock::time_point openedAt_{};
};

// Breakers keyed by backend key ("policy/id"). The map is built once and
// never changes; each breaker synchronizes itself.
class CircuitBreakerRegistry : llmrouter::common::noncopyable {
public:
    CircuitBreakerRegistry(const CircuitBreaker::Options& opts,
                           const std::vector<std::string>& keys,
                           CircuitBreaker::TransitionCallback onTransition = CircuitBreaker::TransitionCallback());

    // nullptr for unknown keys.
    CircuitBreaker* Get(const std::string& key) const;

    bool enabled() const { return opts_.enabled; }
    std::vector<CircuitBreaker::Snapshot> Snapshot() const;

private:
    const CircuitBreaker::Options opts_;
    std::map<std::string, std::unique_ptr<CircuitBreaker>> breakers_;
};

} // namespace balancer
} // namespace llmrouter
