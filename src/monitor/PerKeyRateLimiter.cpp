#include "llmrouter/monitor/PerKeyRateLimiter.h"
#include "llmrouter/common/Logger.h"

#include <algorithm>
#include <functional>

namespace llmrouter {
namespace monitor {

PerKeyRateLimiter::PerKeyRateLimiter(Config cfg) : cfg_(cfg) {
    if (cfg_.burst <= 0.0) cfg_.burst = cfg_.qps;
    if (cfg_.idleSec <= 0.0) cfg_.idleSec = 300.0;
    if (cfg_.shards == 0) cfg_.shards = 1;
    if (cfg_.maxEntries == 0) cfg_.maxEntries = 1;
    if (cfg_.cleanupEvery == 0) cfg_.cleanupEvery = 1;
    perShardCap_ = std::max<size_t>(1, cfg_.maxEntries / cfg_.shards);
    shards_.reserve(cfg_.shards);
    for (size_t i = 0; i < cfg_.shards; ++i) shards_.push_back(std::make_unique<Shard>());
}

PerKeyRateLimiter::Shard& PerKeyRateLimiter::ShardFor(const std::string& key) {
    return *shards_[std::hash<std::string>()(key) % shards_.size()];
}

size_t PerKeyRateLimiter::Size() const {
    size_t n = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        n += shard->map.size();
    }
    return n;
}

bool PerKeyRateLimiter::Allow(const std::string& key) {
    return AllowAt(key, Clock::now());
}

bool PerKeyRateLimiter::AllowAt(const std::string& key, Clock::time_point now) {
    Shard& shard = ShardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    ++shard.calls;

    auto it = shard.map.find(key);
    if (it == shard.map.end()) {
        it = shard.map.emplace(key, Entry{cfg_.burst, now, now}).first;
    }
    Entry& e = it->second;
    if (now > e.lastRefill) {
        const std::chrono::duration<double> elapsed = now - e.lastRefill;
        e.tokens = std::min(cfg_.burst, e.tokens + elapsed.count() * cfg_.qps);
        e.lastRefill = now;
    }
    e.lastActive = now;
    const bool ok = e.tokens >= 1.0;
    if (ok) e.tokens -= 1.0;

    if (shard.calls % cfg_.cleanupEvery == 0) {
        CleanupLocked(shard, now);
    }
    if (shard.map.size() > perShardCap_) {
        EnforceCapLocked(shard);
    }
    return ok;
}

void PerKeyRateLimiter::CleanupLocked(Shard& shard, Clock::time_point now) {
    const auto ttl = std::chrono::duration_cast<Clock::duration>(std::chrono::duration<double>(cfg_.idleSec));
    for (auto it = shard.map.begin(); it != shard.map.end();) {
        if (now - it->second.lastActive > ttl) {
            it = shard.map.erase(it);
        } else {
            ++it;
        }
    }
}

void PerKeyRateLimiter::EnforceCapLocked(Shard& shard) {
    std::vector<std::pair<Clock::time_point, std::string>> items;
    items.reserve(shard.map.size());
    for (const auto& kv : shard.map) {
        items.emplace_back(kv.second.lastActive, kv.first);
    }
    const size_t excess = shard.map.size() - perShardCap_;
    std::nth_element(items.begin(), items.begin() + static_cast<std::ptrdiff_t>(excess - 1), items.end());
    for (size_t i = 0; i < excess; ++i) {
        shard.map.erase(items[i].second);
    }
    LOG_DEBUG << "rate limiter: evicted " << excess << " least recently active buckets";
}

} // namespace monitor
} // namespace llmrouter
