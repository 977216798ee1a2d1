#include "llmrouter/balancer/RandomBalancer.h"

#include <random>

namespace llmrouter {
namespace balancer {

namespace {

std::mt19937_64& Rng() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng;
}

} // namespace

BackendPtr RandomBalancer::Select(const std::vector<BackendPtr>& candidates,
                                  const EligibleFn& eligible,
                                  std::atomic<size_t>& /*cursor*/) {
    std::vector<const BackendPtr*> pool;
    pool.reserve(candidates.size());
    for (const auto& b : candidates) {
        if (!eligible || eligible(b)) pool.push_back(&b);
    }
    if (pool.empty()) return nullptr;
    std::uniform_int_distribution<size_t> dist(0, pool.size() - 1);
    return *pool[dist(Rng())];
}

BackendPtr WeightedRandomBalancer::Select(const std::vector<BackendPtr>& candidates,
                                          const EligibleFn& eligible,
                                          std::atomic<size_t>& /*cursor*/) {
    std::vector<const BackendPtr*> pool;
    long long total = 0;
    for (const auto& b : candidates) {
        if (b->weight <= 0) continue;
        if (eligible && !eligible(b)) continue;
        pool.push_back(&b);
        total += b->weight;
    }
    if (pool.empty()) return nullptr;

    std::uniform_int_distribution<long long> dist(0, total - 1);
    long long point = dist(Rng());
    for (const BackendPtr* b : pool) {
        point -= (*b)->weight;
        if (point < 0) return *b;
    }
    return *pool.back();
}

} // namespace balancer
} // namespace llmrouter
