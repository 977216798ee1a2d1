#include "llmrouter/common/Settings.h"
#include "llmrouter/common/Config.h"
#include "llmrouter/common/Logger.h"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace llmrouter {
namespace common {

std::vector<std::string> SplitCsv(const std::string& s) {
    std::vector<std::string> out;
    std::string item;
    std::istringstream in(s);
    while (std::getline(in, item, ',')) {
        auto notSpace = [](unsigned char c) { return !std::isspace(c); };
        auto b = std::find_if(item.begin(), item.end(), notSpace);
        auto e = std::find_if(item.rbegin(), item.rend(), notSpace).base();
        if (b < e) out.emplace_back(b, e);
    }
    return out;
}

GatewaySettings GatewaySettings::FromConfig(const Config& conf) {
    GatewaySettings s;
    s.defaultPolicy = conf.GetString("global", "default_policy", "");
    s.loadBalancingStrategy = conf.GetString("global", "load_balancing_strategy", "round_robin");
    s.logLevel = conf.GetString("global", "log_level", "INFO");
    s.jsonLogging = conf.GetBool("global", "json_logging", false);

    s.service.host = conf.GetString("service", "host", s.service.host);
    s.service.port = static_cast<uint16_t>(conf.GetInt("service", "port", s.service.port));
    s.service.threads = conf.GetInt("service", "threads", s.service.threads);
    s.service.corsOrigins = SplitCsv(conf.GetString("service", "cors_origins", ""));
    s.service.connectionPoolSize = conf.GetInt("service", "connection_pool_size", s.service.connectionPoolSize);
    s.service.requestTimeoutSec = conf.GetDouble("service", "request_timeout", s.service.requestTimeoutSec);
    s.service.maxBodyBytes = static_cast<size_t>(conf.GetInt("service", "max_body_bytes", static_cast<int>(s.service.maxBodyBytes)));
    s.service.gzipResponses = conf.GetBool("service", "gzip_responses", s.service.gzipResponses);
    s.service.maxConnections = conf.GetInt("service", "max_connections", s.service.maxConnections);
    s.service.idleTimeoutSec = conf.GetDouble("service", "idle_timeout", s.service.idleTimeoutSec);

    s.security.apiKeys = SplitCsv(conf.GetString("security", "api_keys", ""));
    s.security.verifyPeer = conf.GetBool("tls", "verify_peer", s.security.verifyPeer);

    s.rateLimit.enabled = conf.GetBool("rate_limit", "enabled", s.rateLimit.enabled);
    s.rateLimit.requestsPerSecond = conf.GetDouble("rate_limit", "requests_per_second", s.rateLimit.requestsPerSecond);
    s.rateLimit.burstSize = conf.GetDouble("rate_limit", "burst_size", s.rateLimit.burstSize);
    s.rateLimit.perIp = conf.GetBool("rate_limit", "per_ip", s.rateLimit.perIp);
    s.rateLimit.idleSec = conf.GetDouble("rate_limit", "idle_sec", s.rateLimit.idleSec);
    s.rateLimit.maxEntries = static_cast<size_t>(conf.GetInt("rate_limit", "max_entries", static_cast<int>(s.rateLimit.maxEntries)));

    s.cache.enabled = conf.GetBool("cache", "enabled", s.cache.enabled);
    s.cache.ttlSeconds = conf.GetInt("cache", "ttl_seconds", s.cache.ttlSeconds);
    s.cache.maxSize = static_cast<size_t>(conf.GetInt("cache", "max_size", static_cast<int>(s.cache.maxSize)));
    s.cache.shards = static_cast<size_t>(conf.GetInt("cache", "shards", static_cast<int>(s.cache.shards)));
    s.cache.deterministicOnly = conf.GetBool("cache", "deterministic_only", s.cache.deterministicOnly);

    s.retry.maxRetries = conf.GetInt("retry", "max_retries", s.retry.maxRetries);
    s.retry.initialBackoffMs = conf.GetInt("retry", "initial_backoff_ms", s.retry.initialBackoffMs);
    s.retry.maxBackoffMs = conf.GetInt("retry", "max_backoff_ms", s.retry.maxBackoffMs);

    s.circuitBreaker.enabled = conf.GetBool("circuit_breaker", "enabled", s.circuitBreaker.enabled);
    s.circuitBreaker.failureThreshold = conf.GetInt("circuit_breaker", "failure_threshold", s.circuitBreaker.failureThreshold);
    s.circuitBreaker.resetTimeoutSecs = conf.GetInt("circuit_breaker", "reset_timeout_secs", s.circuitBreaker.resetTimeoutSecs);

    s.metrics.enabled = conf.GetBool("metrics", "enabled", s.metrics.enabled);
    s.metrics.host = conf.GetString("metrics", "host", s.metrics.host);
    s.metrics.port = static_cast<uint16_t>(conf.GetInt("metrics", "port", s.metrics.port));
    return s;
}

bool GatewaySettings::Validate(std::vector<std::string>* errors) const {
    const size_t before = errors->size();
    if (defaultPolicy.empty()) errors->push_back("global.default_policy is required");
    if (service.port == 0) errors->push_back("service.port must be > 0");
    if (service.threads < 0) errors->push_back("service.threads must be >= 0");
    if (service.requestTimeoutSec <= 0.0) errors->push_back("service.request_timeout must be > 0");
    if (service.connectionPoolSize <= 0) errors->push_back("service.connection_pool_size must be > 0");
    if (service.maxConnections < 0) errors->push_back("service.max_connections must be >= 0");
    if (service.idleTimeoutSec < 0.0) errors->push_back("service.idle_timeout must be >= 0");
    if (rateLimit.enabled) {
        if (rateLimit.requestsPerSecond <= 0.0) errors->push_back("rate_limit.requests_per_second must be > 0");
        if (rateLimit.burstSize < 1.0) errors->push_back("rate_limit.burst_size must be >= 1");
    }
    if (cache.enabled) {
        if (cache.ttlSeconds <= 0) errors->push_back("cache.ttl_seconds must be > 0");
        if (cache.maxSize == 0) errors->push_back("cache.max_size must be > 0");
    }
    if (retry.maxRetries < 0) errors->push_back("retry.max_retries must be >= 0");
    if (retry.initialBackoffMs < 0) errors->push_back("retry.initial_backoff_ms must be >= 0");
    if (circuitBreaker.enabled) {
        if (circuitBreaker.failureThreshold <= 0) errors->push_back("circuit_breaker.failure_threshold must be > 0");
        if (circuitBreaker.resetTimeoutSecs < 0) errors->push_back("circuit_breaker.reset_timeout_secs must be >= 0");
    }
    if (metrics.enabled && metrics.port == service.port && metrics.host == service.host) {
        errors->push_back("metrics.port must differ from service.port");
    }
    return errors->size() == before;
}

std::string GatewaySettings::Sanitized() const {
    std::ostringstream os;
    os << "[global]\n"
       << "default_policy = " << defaultPolicy << "\n"
       << "load_balancing_strategy = " << loadBalancingStrategy << "\n"
       << "log_level = " << logLevel << "\n"
       << "json_logging = " << jsonLogging << "\n\n";

    os << "[service]\n"
       << "host = " << service.host << "\n"
       << "port = " << service.port << "\n"
       << "threads = " << service.threads << "\n"
       << "cors_origins = ";
    for (size_t i = 0; i < service.corsOrigins.size(); ++i) {
        os << (i ? "," : "") << service.corsOrigins[i];
    }
    os << "\n"
       << "connection_pool_size = " << service.connectionPoolSize << "\n"
       << "request_timeout = " << service.requestTimeoutSec << "\n"
       << "max_body_bytes = " << service.maxBodyBytes << "\n"
       << "gzip_responses = " << service.gzipResponses << "\n"
       << "max_connections = " << service.maxConnections << "\n"
       << "idle_timeout = " << service.idleTimeoutSec << "\n\n";

    os << "[security]\n"
       << "api_keys = ";
    for (size_t i = 0; i < security.apiKeys.size(); ++i) {
        os << (i ? "," : "") << Logger::Redact(security.apiKeys[i]);
    }
    os << "\n\n";

    os << "[rate_limit]\n"
       << "enabled = " << rateLimit.enabled << "\n"
       << "requests_per_second = " << rateLimit.requestsPerSecond << "\n"
       << "burst_size = " << rateLimit.burstSize << "\n"
       << "per_ip = " << rateLimit.perIp << "\n\n";

    os << "[cache]\n"
       << "enabled = " << cache.enabled << "\n"
       << "ttl_seconds = " << cache.ttlSeconds << "\n"
       << "max_size = " << cache.maxSize << "\n\n";

    os << "[retry]\n"
       << "max_retries = " << retry.maxRetries << "\n"
       << "initial_backoff_ms = " << retry.initialBackoffMs << "\n\n";

    os << "[circuit_breaker]\n"
       << "enabled = " << circuitBreaker.enabled << "\n"
       << "failure_threshold = " << circuitBreaker.failureThreshold << "\n"
       << "reset_timeout_secs = " << circuitBreaker.resetTimeoutSecs << "\n\n";

    os << "[metrics]\n"
       << "enabled = " << metrics.enabled << "\n"
       << "port = " << metrics.port << "\n";
    return os.str();
}

} // namespace common
} // namespace llmrouter
