#include "llmrouter/monitor/Metrics.h"
#include "llmrouter/common/Logger.h"

#include <cassert>
#include <string>
#include <thread>
#include <vector>

using llmrouter::common::Logger;
using llmrouter::common::LogLevel;
using llmrouter::monitor::Metrics;
namespace metric = llmrouter::monitor::metric;

static bool contains(const std::string& text, const std::string& needle) {
    return text.find(needle) != std::string::npos;
}

static void testCountersAndGauges() {
    Metrics& m = Metrics::Instance();
    m.Reset();
    m.Inc(metric::kNumRequests);
    m.Inc(metric::kNumRequests);
    m.Inc(metric::kRequestFailure, {{"error_type", "rate_limited"}});
    m.Inc(metric::kTokenUsage, {{"llm", "chat"}, {"kind", "prompt"}}, 12);
    m.Inc(metric::kNumRequests, {}, -5); // counters never go down
    m.SetGauge(metric::kCacheSize, {}, 7);
    m.SetGauge(metric::kCacheSize, {}, 3);

    assert(m.CounterValue(metric::kNumRequests) == 2);
    assert(m.CounterValue(metric::kRequestFailure, {{"error_type", "rate_limited"}}) == 1);
    assert(m.CounterValue(metric::kRequestFailure, {{"error_type", "other"}}) == 0);
    assert(m.GaugeValue(metric::kCacheSize) == 3);

    const std::string text = m.RenderPrometheus();
    assert(contains(text, "# HELP num_requests Requests received\n"));
    assert(contains(text, "# TYPE num_requests counter\n"));
    assert(contains(text, "num_requests 2\n"));
    assert(contains(text, "request_failure_total{error_type=\"rate_limited\"} 1\n"));
    // Label names render sorted.
    assert(contains(text, "llm_token_usage{kind=\"prompt\",llm=\"chat\"} 12\n"));
    assert(contains(text, "# TYPE cache_size gauge\n"));
    assert(contains(text, "cache_size 3\n"));
    // Untouched unlabelled families still render.
    assert(contains(text, "cache_hit_count 0\n"));
}

static void testHistogram() {
    Metrics& m = Metrics::Instance();
    m.Reset();
    m.Observe(metric::kRequestLatency, {{"policy", "p"}}, 0.2);
    m.Observe(metric::kRequestLatency, {{"policy", "p"}}, 3.0);
    m.Observe(metric::kRequestLatency, {{"policy", "p"}}, 120.0);
    assert(m.HistogramCount(metric::kRequestLatency, {{"policy", "p"}}) == 3);

    const std::string text = m.RenderPrometheus();
    assert(contains(text, "# TYPE request_latency_seconds histogram\n"));
    assert(contains(text, "request_latency_seconds_bucket{policy=\"p\",le=\"0.1\"} 0\n"));
    assert(contains(text, "request_latency_seconds_bucket{policy=\"p\",le=\"0.25\"} 1\n"));
    assert(contains(text, "request_latency_seconds_bucket{policy=\"p\",le=\"5\"} 2\n"));
    assert(contains(text, "request_latency_seconds_bucket{policy=\"p\",le=\"60\"} 2\n"));
    assert(contains(text, "request_latency_seconds_bucket{policy=\"p\",le=\"+Inf\"} 3\n"));
    assert(contains(text, "request_latency_seconds_sum{policy=\"p\"} 123.2\n"));
    assert(contains(text, "request_latency_seconds_count{policy=\"p\"} 3\n"));
}

static void testLabelEscapingAndCardinality() {
    Metrics& m = Metrics::Instance();
    m.Reset();
    m.Inc(metric::kRequestsPerModel, {{"model", "a\"b"}});
    assert(contains(m.RenderPrometheus(), "requests_per_model{model=\"a\\\"b\"} 1\n"));

    for (size_t i = 0; i < Metrics::kMaxSeriesPerFamily + 10; ++i) {
        m.Inc(metric::kRequestsPerPolicy, {{"policy", "p" + std::to_string(i)}});
    }
    // Label sets past the cap fold into one series.
    assert(m.CounterValue(metric::kRequestsPerPolicy, {{"policy", "OTHER"}}) == 10);
    assert(m.CounterValue(metric::kRequestsPerPolicy, {{"policy", "p0"}}) == 1);
}

static void testConcurrentIncrements() {
    Metrics& m = Metrics::Instance();
    m.Reset();
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&m]() {
            for (int i = 0; i < 1000; ++i) m.Inc(metric::kNumRequests);
        });
    }
    for (auto& th : threads) th.join();
    assert(m.CounterValue(metric::kNumRequests) == 4000);
}

int main() {
    Logger::Instance().SetLevel(LogLevel::WARN);
    testCountersAndGauges();
    testHistogram();
    testLabelEscapingAndCardinality();
    testConcurrentIncrements();
    LOG_WARN << "Metrics tests PASS";
    return 0;
}
