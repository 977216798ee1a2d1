#include "llmrouter/monitor/Metrics.h"
#include "llmrouter/common/Logger.h"

#include "prometheus/text_serializer.h"

namespace llmrouter {
namespace monitor {

namespace {

prometheus::Labels ToPrometheus(const Metrics::Labels& labels) {
    prometheus::Labels out;
    for (const auto& kv : labels) out[kv.first] = kv.second;
    return out;
}

} // namespace

Metrics& Metrics::Instance() {
    static Metrics instance;
    return instance;
}

Metrics::Metrics()
    : serializer_(new prometheus::TextSerializer()),
      bounds_{0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0, 60.0} {
    BuildFamilies();
}

void Metrics::BuildFamilies() {
    registry_ = std::make_shared<prometheus::Registry>();
    counters_.clear();
    gauges_.clear();
    histograms_.clear();

    AddCounter(metric::kNumRequests, "Requests received", true);
    AddCounter(metric::kRequestsPerPolicy, "Requests per routing policy");
    AddCounter(metric::kRequestsPerModel, "Requests per selected model");
    AddCounter(metric::kRequestSuccess, "Requests answered successfully", true);
    AddCounter(metric::kRequestFailure, "Failed requests by error type");
    AddCounter(metric::kRoutingPolicyUsage, "Routing decisions by strategy");
    AddCounter(metric::kRateLimitRejections, "Requests rejected by the rate limiter", true);
    AddCounter(metric::kCacheHits, "Response cache hits", true);
    AddCounter(metric::kCacheMisses, "Response cache misses", true);
    AddGauge(metric::kCacheSize, "Entries in the response cache", true);
    AddCounter(metric::kCacheErrors, "Response cache faults", true);
    AddCounter(metric::kBreakerTransitions, "Circuit breaker state transitions");
    AddGauge(metric::kBreakerOpen, "1 while the backend circuit is open");
    AddCounter(metric::kRetryCount, "Retried upstream attempts per backend");
    AddCounter(metric::kLoadBalancerUsage, "Upstream attempts per backend");
    AddCounter(metric::kTokenUsage, "Tokens reported by backends");
    AddHistogram(metric::kRequestLatency, "End-to-end request latency");
    AddHistogram(metric::kModelSelectionTime, "Time spent choosing a backend");
    AddHistogram(metric::kLlmResponseTime, "Upstream response time per backend");
    AddHistogram(metric::kProxyOverhead, "Request latency not spent upstream");
}

// Unlabelled families get their single series up front so they render as 0.
void Metrics::AddCounter(const std::string& name, const std::string& help, bool unlabelled) {
    Family<prometheus::Counter>& f = counters_[name];
    f.family = &prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);
    if (unlabelled) f.series[{}] = &f.family->Add({});
}

void Metrics::AddGauge(const std::string& name, const std::string& help, bool unlabelled) {
    Family<prometheus::Gauge>& f = gauges_[name];
    f.family = &prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);
    if (unlabelled) f.series[{}] = &f.family->Add({});
}

void Metrics::AddHistogram(const std::string& name, const std::string& help) {
    Family<prometheus::Histogram>& f = histograms_[name];
    f.family = &prometheus::BuildHistogram().Name(name).Help(help).Register(*registry_);
}

prometheus::Counter& Metrics::NewSeries(prometheus::Family<prometheus::Counter>& f, const prometheus::Labels& l) {
    return f.Add(l);
}

prometheus::Gauge& Metrics::NewSeries(prometheus::Family<prometheus::Gauge>& f, const prometheus::Labels& l) {
    return f.Add(l);
}

prometheus::Histogram& Metrics::NewSeries(prometheus::Family<prometheus::Histogram>& f,
                                          const prometheus::Labels& l) {
    return f.Add(l, bounds_);
}

template <typename T>
T* Metrics::SeriesLocked(std::map<std::string, Family<T>>& families, const std::string& name,
                         const Labels& labels) {
    auto fit = families.find(name);
    if (fit == families.end()) {
        LOG_WARN << "metrics: unregistered family " << name;
        return nullptr;
    }
    Family<T>& f = fit->second;

    prometheus::Labels key = ToPrometheus(labels);
    auto sit = f.series.find(key);
    if (sit != f.series.end()) return sit->second;
    if (f.series.size() >= kMaxSeriesPerFamily) {
        for (auto& kv : key) kv.second = "OTHER";
        sit = f.series.find(key);
        if (sit != f.series.end()) return sit->second;
    }
    T* series = &NewSeries(*f.family, key);
    f.series.emplace(std::move(key), series);
    return series;
}

template <typename T>
const T* Metrics::FindLocked(const std::map<std::string, Family<T>>& families, const std::string& name,
                             const Labels& labels) const {
    auto fit = families.find(name);
    if (fit == families.end()) return nullptr;
    auto sit = fit->second.series.find(ToPrometheus(labels));
    return sit != fit->second.series.end() ? sit->second : nullptr;
}

void Metrics::Inc(const std::string& name, const Labels& labels, double value) {
    if (value < 0.0) return;
    prometheus::Counter* c = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        c = SeriesLocked(counters_, name, labels);
    }
    if (c) c->Increment(value);
}

void Metrics::SetGauge(const std::string& name, const Labels& labels, double value) {
    prometheus::Gauge* g = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        g = SeriesLocked(gauges_, name, labels);
    }
    if (g) g->Set(value);
}

void Metrics::Observe(const std::string& name, const Labels& labels, double seconds) {
    if (seconds < 0.0) seconds = 0.0;
    prometheus::Histogram* h = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        h = SeriesLocked(histograms_, name, labels);
    }
    if (h) h->Observe(seconds);
}

double Metrics::CounterValue(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const prometheus::Counter* c = FindLocked(counters_, name, labels);
    return c ? c->Value() : 0.0;
}

double Metrics::GaugeValue(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const prometheus::Gauge* g = FindLocked(gauges_, name, labels);
    return g ? g->Value() : 0.0;
}

uint64_t Metrics::HistogramCount(const std::string& name, const Labels& labels) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const prometheus::Histogram* h = FindLocked(histograms_, name, labels);
    return h ? h->Collect().histogram.sample_count : 0;
}

std::string Metrics::RenderPrometheus() const {
    std::shared_ptr<prometheus::Registry> registry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        registry = registry_;
    }
    return serializer_->Serialize(registry->Collect());
}

void Metrics::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    BuildFamilies();
}

} // namespace monitor
} // namespace llmrouter
