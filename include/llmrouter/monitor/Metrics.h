#pragma once

#include "prometheus/counter.h"
#include "prometheus/family.h"
#include "prometheus/gauge.h"
#include "prometheus/histogram.h"
#include "prometheus/registry.h"
#include "prometheus/serializer.h"

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace llmrouter {
namespace monitor {

// Metric family names exported on /metrics.
namespace metric {
constexpr const char* kNumRequests = "num_requests";
constexpr const char* kRequestsPerPolicy = "requests_per_policy";
constexpr const char* kRequestsPerModel = "requests_per_model";
constexpr const char* kRequestSuccess = "request_success_total";
constexpr const char* kRequestFailure = "request_failure_total";
constexpr const char* kRoutingPolicyUsage = "routing_policy_usage";
constexpr const char* kRateLimitRejections = "rate_limit_rejections_total";
constexpr const char* kCacheHits = "cache_hit_count";
constexpr const char* kCacheMisses = "cache_miss_count";
constexpr const char* kCacheSize = "cache_size";
constexpr const char* kCacheErrors = "cache_errors_total";
constexpr const char* kBreakerTransitions = "circuit_breaker_transitions_total";
constexpr const char* kBreakerOpen = "circuit_breaker_open";
constexpr const char* kRetryCount = "llm_retry_count";
constexpr const char* kLoadBalancerUsage = "load_balancer_usage";
constexpr const char* kTokenUsage = "llm_token_usage";
constexpr const char* kRequestLatency = "request_latency_seconds";
constexpr const char* kModelSelectionTime = "model_selection_time_seconds";
constexpr const char* kLlmResponseTime = "llm_response_time_seconds";
constexpr const char* kProxyOverhead = "proxy_overhead_latency_seconds";
} // namespace metric

// Process-wide counters, gauges and histograms held in a prometheus-cpp
// registry and rendered with its text serializer. Every family keeps at most
// kMaxSeriesPerFamily label sets; further label sets are folded into one whose
// values are all "OTHER".
class Metrics {
public:
    using Labels = std::vector<std::pair<std::string, std::string>>;

    static constexpr size_t kMaxSeriesPerFamily = 1024;

    static Metrics& Instance();

    void Inc(const std::string& name, const Labels& labels = Labels(), double value = 1.0);
    void SetGauge(const std::string& name, const Labels& labels, double value);
    void Observe(const std::string& name, const Labels& labels, double seconds);

    double CounterValue(const std::string& name, const Labels& labels = Labels()) const;
    double GaugeValue(const std::string& name, const Labels& labels = Labels()) const;
    uint64_t HistogramCount(const std::string& name, const Labels& labels = Labels()) const;

    std::string RenderPrometheus() const;

    // Drops every series and rebuilds the families on a fresh registry.
    // Callers must not record concurrently.
    void Reset();

private:
    template <typename T>
    struct Family {
        prometheus::Family<T>* family{nullptr};
        std::map<prometheus::Labels, T*> series;
    };

    Metrics();
    Metrics(const Metrics&) = delete;
    Metrics& operator=(const Metrics&) = delete;

    void BuildFamilies();
    void AddCounter(const std::string& name, const std::string& help, bool unlabelled = false);
    void AddGauge(const std::string& name, const std::string& help, bool unlabelled = false);
    void AddHistogram(const std::string& name, const std::string& help);

    template <typename T>
    T* SeriesLocked(std::map<std::string, Family<T>>& families, const std::string& name, const Labels& labels);
    template <typename T>
    const T* FindLocked(const std::map<std::string, Family<T>>& families, const std::string& name,
                        const Labels& labels) const;

    prometheus::Counter& NewSeries(prometheus::Family<prometheus::Counter>& f, const prometheus::Labels& l);
    prometheus::Gauge& NewSeries(prometheus::Family<prometheus::Gauge>& f, const prometheus::Labels& l);
    prometheus::Histogram& NewSeries(prometheus::Family<prometheus::Histogram>& f, const prometheus::Labels& l);

    mutable std::mutex mutex_;
    std::shared_ptr<prometheus::Registry> registry_;
    std::unique_ptr<prometheus::Serializer> serializer_;
    std::map<std::string, Family<prometheus::Counter>> counters_;
    std::map<std::string, Family<prometheus::Gauge>> gauges_;
    std::map<std::string, Family<prometheus::Histogram>> histograms_;
    prometheus::Histogram::BucketBoundaries bounds_;
};

} // namespace monitor
} // namespace llmrouter
