#include "llmrouter/balancer/RoundRobinBalancer.h"

namespace llmrouter {
namespace balancer {

BackendPtr RoundRobinBalancer::Select(const std::vector<BackendPtr>& candidates,
                                      const EligibleFn& eligible,
                                      std::atomic<size_t>& cursor) {
    const size_t n = candidates.size();
    if (n == 0) return nullptr;

    const size_t start = cursor.fetch_add(1, std::memory_order_relaxed);
    for (size_t i = 0; i < n; ++i) {
        const BackendPtr& b = candidates[(start + i) % n];
        if (!eligible || eligible(b)) return b;
    }
    return nullptr;
}

} // namespace balancer
} // namespace llmrouter
