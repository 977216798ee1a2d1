#include "llmrouter/protocol/ResponseCache.h"
#include "llmrouter/common/Logger.h"

#include <functional>
#include <limits>

namespace llmrouter {
namespace protocol {

ResponseCache::ResponseCache(const Config& cfg) : cfg_(cfg) {
    if (cfg_.shards == 0) cfg_.shards = 1;
    if (cfg_.maxSize == 0) cfg_.maxSize = 1;
    shards_.reserve(cfg_.shards);
    for (size_t i = 0; i < cfg_.shards; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

ResponseCache::Shard& ResponseCache::ShardFor(const std::string& key) {
    return *shards_[std::hash<std::string>()(key) % shards_.size()];
}

std::optional<CachedResponse> ResponseCache::Get(const std::string& key) {
    return Get(key, Clock::now());
}

std::optional<CachedResponse> ResponseCache::Get(const std::string& key, Clock::time_point now) {
    Shard& shard = ShardFor(key);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.index.find(key);
    if (it == shard.index.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    if (Expired(*it->second, now)) {
        shard.lru.erase(it->second);
        shard.index.erase(it);
        size_.fetch_sub(1, std::memory_order_relaxed);
        expirations_.fetch_add(1, std::memory_order_relaxed);
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    it->second->tick = tick_.fetch_add(1, std::memory_order_relaxed) + 1;
    shard.lru.splice(shard.lru.begin(), shard.lru, it->second);
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second->response;
}

void ResponseCache::Put(const std::string& key, CachedResponse response) {
    Put(key, std::move(response), Clock::now());
}

void ResponseCache::Put(const std::string& key, CachedResponse response, Clock::time_point now) {
    bool inserted = false;
    {
        Shard& shard = ShardFor(key);
        std::lock_guard<std::mutex> lock(shard.mutex);
        const uint64_t tick = tick_.fetch_add(1, std::memory_order_relaxed) + 1;
        const size_t bytes = key.size() + response.body.size() + response.contentType.size() + response.backend.size();
        auto it = shard.index.find(key);
        if (it != shard.index.end()) {
            Entry& e = *it->second;
            e.response = std::move(response);
            e.created = now;
            e.bytes = bytes;
            e.tick = tick;
            shard.lru.splice(shard.lru.begin(), shard.lru, it->second);
        } else {
            shard.lru.push_front(Entry{key, std::move(response), now, bytes, tick});
            shard.index[key] = shard.lru.begin();
            size_.fetch_add(1, std::memory_order_relaxed);
            inserted = true;
        }
    }
    // Shard locks are taken one at a time below, never nested.
    while (inserted && Size() > cfg_.maxSize) {
        if (!EvictOne()) break;
    }
}

bool ResponseCache::EvictOne() {
    size_t victim = shards_.size();
    uint64_t oldest = std::numeric_limits<uint64_t>::max();
    for (size_t i = 0; i < shards_.size(); ++i) {
        std::lock_guard<std::mutex> lock(shards_[i]->mutex);
        if (shards_[i]->lru.empty()) continue;
        const uint64_t t = shards_[i]->lru.back().tick;
        if (t < oldest) {
            oldest = t;
            victim = i;
        }
    }
    if (victim == shards_.size()) return false;

    Shard& shard = *shards_[victim];
    std::lock_guard<std::mutex> lock(shard.mutex);
    // The tail may have been touched since the scan; evicting it is still LRU within the shard.
    if (shard.lru.empty()) return true;
    const Entry& tail = shard.lru.back();
    LOG_DEBUG << "cache evict " << tail.key.substr(0, 12) << " (" << tail.bytes << " bytes)";
    shard.index.erase(tail.key);
    shard.lru.pop_back();
    size_.fetch_sub(1, std::memory_order_relaxed);
    evictions_.fetch_add(1, std::memory_order_relaxed);
    return true;
}

size_t ResponseCache::CleanExpired(Clock::time_point now) {
    size_t removed = 0;
    for (auto& shardPtr : shards_) {
        Shard& shard = *shardPtr;
        std::lock_guard<std::mutex> lock(shard.mutex);
        for (auto it = shard.lru.begin(); it != shard.lru.end();) {
            if (Expired(*it, now)) {
                shard.index.erase(it->key);
                it = shard.lru.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }
    if (removed > 0) {
        size_.fetch_sub(removed, std::memory_order_relaxed);
        expirations_.fetch_add(removed, std::memory_order_relaxed);
        LOG_DEBUG << "cache: dropped " << removed << " expired entries";
    }
    return removed;
}

ResponseCache::Stats ResponseCache::GetStats() const {
    Stats s;
    s.hits = hits_.load(std::memory_order_relaxed);
    s.misses = misses_.load(std::memory_order_relaxed);
    s.evictions = evictions_.load(std::memory_order_relaxed);
    s.expirations = expirations_.load(std::memory_order_relaxed);
    s.size = Size();
    return s;
}

} // namespace protocol
} // namespace llmrouter
