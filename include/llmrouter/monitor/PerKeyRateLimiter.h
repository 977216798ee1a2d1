#pragma once

#include "llmrouter/common/noncopyable.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmrouter {
namespace monitor {

// Token bucket per key (client IP), created lazily. Keys are spread over
// independently locked shards; idle buckets are reclaimed and each shard
// is capped at maxEntries / shards.
class PerKeyRateLimiter : llmrouter::common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        double qps{50.0};
        double burst{100.0};        // <=0 defaults to qps
        double idleSec{300.0};
        size_t maxEntries{100000};
        size_t shards{16};
        size_t cleanupEvery{256};   // sweep a shard every N calls on it
    };

    explicit PerKeyRateLimiter(Config cfg);

    bool Allow(const std::string& key);
    bool AllowAt(const std::string& key, Clock::time_point now);

    size_t Size() const;
    const Config& config() const { return cfg_; }

private:
    struct Entry {
        double tokens;
        Clock::time_point lastRefill;
        Clock::time_point lastActive;
    };

    struct Shard {
        std::mutex mutex;
        std::unordered_map<std::string, Entry> map;
        size_t calls{0};
    };

    Shard& ShardFor(const std::string& key);
    void CleanupLocked(Shard& shard, Clock::time_point now);
    void EnforceCapLocked(Shard& shard);

    Config cfg_;
    size_t perShardCap_;
    std::vector<std::unique_ptr<Shard>> shards_;
};

} // namespace monitor
} // namespace llmrouter
