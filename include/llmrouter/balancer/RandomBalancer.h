#pragma once

#include "llmrouter/balancer/Balancer.h"

namespace llmrouter {
namespace balancer {

// Uniform over the eligible candidates.
class RandomBalancer : public Balancer {
public:
    const char* name() const override { return "random"; }
    BackendPtr Select(const std::vector<BackendPtr>& candidates,
                      const EligibleFn& eligible,
                      std::atomic<size_t>& cursor) override;
};

// Cumulative-weight sampling over the eligible candidates; weight 0 is never picked.
class WeightedRandomBalancer : public Balancer {
public:
    const char* name() const override { return "weighted_random"; }
    BackendPtr Select(const std::vector<BackendPtr>& candidates,
                      const EligibleFn& eligible,
                      std::atomic<size_t>& cursor) override;
};

} // namespace balancer
} // namespace llmrouter
