#include "llmrouter/protocol/ResponseCache.h"
#include "llmrouter/common/Logger.h"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using llmrouter::common::Logger;
using llmrouter::common::LogLevel;
using llmrouter::protocol::CachedResponse;
using llmrouter::protocol::ResponseCache;

static CachedResponse makeResponse(const std::string& body) {
    CachedResponse r;
    r.status = 200;
    r.body = body;
    r.backend = "chat";
    return r;
}

static ResponseCache::Config makeConfig(size_t maxSize, int ttlSec, size_t shards = 4) {
    ResponseCache::Config cfg;
    cfg.maxSize = maxSize;
    cfg.ttl = std::chrono::seconds(ttlSec);
    cfg.shards = shards;
    return cfg;
}

static void testHitAndMiss() {
    ResponseCache cache(makeConfig(10, 60));
    assert(!cache.Get("k1"));
    cache.Put("k1", makeResponse("{\"a\":1}"));
    auto hit = cache.Get("k1");
    assert(hit);
    assert(hit->body == "{\"a\":1}");
    assert(hit->backend == "chat");

    auto stats = cache.GetStats();
    assert(stats.hits == 1);
    assert(stats.misses == 1);
    assert(stats.size == 1);
}

static void testTtlExpiry() {
    ResponseCache cache(makeConfig(10, 5));
    auto t0 = ResponseCache::Clock::now();
    cache.Put("k", makeResponse("x"), t0);
    assert(cache.Get("k", t0 + std::chrono::seconds(4)));
    assert(!cache.Get("k", t0 + std::chrono::seconds(5)));
    assert(cache.Size() == 0);
    assert(cache.GetStats().expirations == 1);
}

static void testCleanExpired() {
    ResponseCache cache(makeConfig(100, 10));
    auto t0 = ResponseCache::Clock::now();
    for (int i = 0; i < 6; ++i) cache.Put("old-" + std::to_string(i), makeResponse("x"), t0);
    for (int i = 0; i < 3; ++i) cache.Put("new-" + std::to_string(i), makeResponse("y"), t0 + std::chrono::seconds(8));
    assert(cache.Size() == 9);
    assert(cache.CleanExpired(t0 + std::chrono::seconds(11)) == 6);
    assert(cache.Size() == 3);
}

static void testLruEvictionAcrossShards() {
    ResponseCache cache(makeConfig(3, 60, 8));
    auto t0 = ResponseCache::Clock::now();
    cache.Put("a", makeResponse("a"), t0);
    cache.Put("b", makeResponse("b"), t0);
    cache.Put("c", makeResponse("c"), t0);

    // Touch a so b becomes the least recently used.
    assert(cache.Get("a", t0));
    cache.Put("d", makeResponse("d"), t0);

    assert(cache.Size() == 3);
    assert(cache.Get("a", t0));
    assert(!cache.Get("b", t0));
    assert(cache.Get("c", t0));
    assert(cache.Get("d", t0));
    assert(cache.GetStats().evictions == 1);
}

static void testOverwriteKeepsSize() {
    ResponseCache cache(makeConfig(2, 60));
    cache.Put("k", makeResponse("v1"));
    cache.Put("k", makeResponse("v2"));
    assert(cache.Size() == 1);
    assert(cache.Get("k")->body == "v2");
}

static void testConcurrentAccessStaysBounded() {
    ResponseCache cache(makeConfig(50, 60, 4));
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 500; ++i) {
                const std::string key = "t" + std::to_string(t) + "-" + std::to_string(i % 80);
                cache.Put(key, makeResponse("x"));
                cache.Get(key);
            }
        });
    }
    for (auto& th : threads) th.join();
    assert(cache.Size() <= 50);
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    testHitAndMiss();
    testTtlExpiry();
    testCleanExpired();
    testLruEvictionAcrossShards();
    testOverwriteKeepsSize();
    testConcurrentAccessStaysBounded();
    LOG_WARN << "ResponseCache tests PASS";
    return 0;
}
