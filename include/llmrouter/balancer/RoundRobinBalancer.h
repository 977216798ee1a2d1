#pragma once

#include "llmrouter/balancer/Balancer.h"

namespace llmrouter {
namespace balancer {

// Each selection advances the cursor once and takes the first eligible
// candidate at or after it; skipped candidates do not move the cursor.
class RoundRobinBalancer : public Balancer {
public:
    const char* name() const override { return "round_robin"; }
    BackendPtr Select(const std::vector<BackendPtr>& candidates,
                      const EligibleFn& eligible,
                      std::atomic<size_t>& cursor) override;
};

} // namespace balancer
} // namespace llmrouter
