#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace llmrouter {
namespace common {

class Config;

struct ServiceSettings {
    std::string host{"0.0.0.0"};
    uint16_t port{8084};
    int threads{4};
    std::vector<std::string> corsOrigins;
    int connectionPoolSize{100};
    double requestTimeoutSec{60.0};
    size_t maxBodyBytes{10 * 1024 * 1024};
    bool gzipResponses{true};
    int maxConnections{10000};    // 0: unlimited
    double idleTimeoutSec{120.0}; // 0: keep idle clients forever
};

struct SecuritySettings {
    std::vector<std::string> apiKeys; // empty: no auth
    bool verifyPeer{true};            // outbound TLS
};

struct RateLimitSettings {
    bool enabled{true};
    double requestsPerSecond{50.0};
    double burstSize{100.0};
    bool perIp{true};
    double idleSec{300.0};
    size_t maxEntries{100000};
};

struct CacheSettings {
    bool enabled{true};
    int ttlSeconds{300};
    size_t maxSize{1000};
    size_t shards{16};
    bool deterministicOnly{true};
};

struct RetrySettings {
    int maxRetries{2};
    int initialBackoffMs{100};
    int maxBackoffMs{5000};
};

struct CircuitBreakerSettings {
    bool enabled{true};
    int failureThreshold{5};
    int resetTimeoutSecs{30};
};

struct MetricsSettings {
    bool enabled{true};
    std::string host{"0.0.0.0"};
    uint16_t port{9090};
};

// Everything except the policy catalogue. Built once at startup and
// shared read-only afterwards.
struct GatewaySettings {
    std::string defaultPolicy;
    std::string loadBalancingStrategy{"round_robin"};
    std::string logLevel{"INFO"};
    bool jsonLogging{false};

    ServiceSettings service;
    SecuritySettings security;
    RateLimitSettings rateLimit;
    CacheSettings cache;
    RetrySettings retry;
    CircuitBreakerSettings circuitBreaker;
    MetricsSettings metrics;

    static GatewaySettings FromConfig(const Config& conf);

    // Appends human-readable problems to errors; returns true when none were found.
    bool Validate(std::vector<std::string>* errors) const;

    // INI-like dump with secrets redacted.
    std::string Sanitized() const;
};

std::vector<std::string> SplitCsv(const std::string& s);

} // namespace common
} // namespace llmrouter
