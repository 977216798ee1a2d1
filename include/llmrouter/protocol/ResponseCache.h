#pragma once

#include "llmrouter/common/noncopyable.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace llmrouter {
namespace protocol {

struct CachedResponse {
    int status{200};
    std::string contentType{"application/json"};
    std::string body;
    std::string backend; // name of the backend that produced it
};

// In-process response cache keyed by request fingerprint.
// - Sharded: each shard has its own mutex, LRU list and index.
// - Capacity is global; on overflow the entry with the smallest last-use
//   tick across all shard tails is evicted.
// - Entries older than ttl are misses and are dropped on access.
class ResponseCache : llmrouter::common::noncopyable {
public:
    using Clock = std::chrono::steady_clock;

    struct Config {
        size_t maxSize{1000};
        std::chrono::seconds ttl{300};
        size_t shards{16};
    };

    struct Stats {
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t evictions{0};
        uint64_t expirations{0};
        size_t size{0};
    };

    explicit ResponseCache(const Config& cfg);

    std::optional<CachedResponse> Get(const std::string& key);
    std::optional<CachedResponse> Get(const std::string& key, Clock::time_point now);

    void Put(const std::string& key, CachedResponse response);
    void Put(const std::string& key, CachedResponse response, Clock::time_point now);

    // Drops expired entries; returns how many were removed.
    size_t CleanExpired(Clock::time_point now = Clock::now());

    size_t Size() const { return size_.load(std::memory_order_relaxed); }
    Stats GetStats() const;
    const Config& config() const { return cfg_; }

private:
    struct Entry {
        std::string key;
        CachedResponse response;
        Clock::time_point created;
        size_t bytes{0};
        uint64_t tick{0};
    };

    struct Shard {
        std::mutex mutex;
        std::list<Entry> lru; // front = most recently used
        std::unordered_map<std::string, std::list<Entry>::iterator> index;
    };

    Shard& ShardFor(const std::string& key);
    bool Expired(const Entry& e, Clock::time_point now) const { return now - e.created >= cfg_.ttl; }
    bool EvictOne();

    Config cfg_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<size_t> size_{0};
    std::atomic<uint64_t> tick_{0};
    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
    std::atomic<uint64_t> expirations_{0};
};

} // namespace protocol
} // namespace llmrouter
