#include "llmrouter/balancer/Balancer.h"
#include "llmrouter/balancer/RandomBalancer.h"
#include "llmrouter/balancer/RoundRobinBalancer.h"
#include "llmrouter/common/Logger.h"

namespace llmrouter {
namespace balancer {

std::unique_ptr<Balancer> Balancer::Create(const std::string& strategy) {
    if (strategy == "round_robin" || strategy == "roundrobin") return std::make_unique<RoundRobinBalancer>();
    if (strategy == "random") return std::make_unique<RandomBalancer>();
    if (strategy == "weighted_random" || strategy == "weighted") return std::make_unique<WeightedRandomBalancer>();
    if (strategy == "first") return std::make_unique<FirstBalancer>();
    LOG_WARN << "Unknown load_balancing_strategy '" << strategy << "', using round_robin";
    return std::make_unique<RoundRobinBalancer>();
}

BackendPtr FirstBalancer::Select(const std::vector<BackendPtr>& candidates,
                                 const EligibleFn& eligible,
                                 std::atomic<size_t>& /*cursor*/) {
    for (const auto& b : candidates) {
        if (!eligible || eligible(b)) return b;
    }
    return nullptr;
}

} // namespace balancer
} // namespace llmrouter
