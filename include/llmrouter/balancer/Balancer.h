#pragma once

#include "llmrouter/balancer/Backend.h"
#include "llmrouter/common/noncopyable.h"

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace llmrouter {
namespace balancer {

using EligibleFn = std::function<bool(const BackendPtr&)>;

// Picks one backend from an ordered candidate set. Implementations are
// stateless apart from the caller-owned cursor, so one instance serves
// every policy and thread.
class Balancer : llmrouter::common::noncopyable {
public:
    virtual ~Balancer() = default;

    virtual const char* name() const = 0;

    // Returns nullptr when no candidate is eligible.
    virtual BackendPtr Select(const std::vector<BackendPtr>& candidates,
                              const EligibleFn& eligible,
                              std::atomic<size_t>& cursor) = 0;

    // round_robin | random | weighted_random | first. Unknown names log a
    // warning and fall back to round_robin.
    static std::unique_ptr<Balancer> Create(const std::string& strategy);
};

// First eligible candidate in declaration order.
class FirstBalancer : public Balancer {
public:
    const char* name() const override { return "first"; }
    BackendPtr Select(const std::vector<BackendPtr>& candidates,
                      const EligibleFn& eligible,
                      std::atomic<size_t>& cursor) override;
};

} // namespace balancer
} // namespace llmrouter
