#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace countrydir {

struct MetricLabels {
    // Sorted so that a label set has exactly one text form.
    std::map<std::string, std::string> kv;

    std::string ToPrometheusLabelText() const;
};

class Counter {
public:
    // Thread-safe
    void Inc(std::int64_t v = 1) { value_.fetch_add(v, std::memory_order_relaxed); }
    std::int64_t Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<std::int64_t> value_{0};
};

class Gauge {
public:
    // Thread-safe
    void Set(double v);
    void Add(double delta);
    double Value() const;

private:
    mutable std::mutex mu_;
    double value_{0.0};
};

class Histogram {
public:
    // Thread-safe. Bucket bounds are upper-inclusive; +Inf is implicit.
    explicit Histogram(std::vector<double> buckets);

    void Observe(double v);
    const std::vector<double>& Buckets() const { return buckets_; }

    // Non-cumulative counts per bucket (same size as Buckets()), plus sum/total.
    void Snapshot(std::vector<std::uint64_t>& bucket_counts, double& sum, std::uint64_t& count) const;

private:
    const std::vector<double> buckets_;
    mutable std::mutex mu_;
    std::vector<std::uint64_t> bucket_counts_;
    double sum_{0.0};
    std::uint64_t count_{0};
};

// Metrics are grouped into families (one name, one type, one help text) holding
// one series per label set. Returned references stay valid for the registry lifetime.
class MetricsRegistry {
public:
    // Thread-safe
    Counter& CounterMetric(std::string_view name, std::string_view help, MetricLabels labels = {});
    Gauge& GaugeMetric(std::string_view name, std::string_view help, MetricLabels labels = {});
    Histogram& HistogramMetric(std::string_view name, std::string_view help, std::vector<double> buckets, MetricLabels labels = {});

    // Thread-safe. Prometheus text exposition format 0.0.4.
    std::string ToPrometheusText() const;

private:
    enum class Kind { counter, gauge, histogram };

    struct Series {
        MetricLabels labels;
        std::unique_ptr<Counter> counter;
        std::unique_ptr<Gauge> gauge;
        std::unique_ptr<Histogram> histogram;
    };

    struct Family {
        Kind kind = Kind::counter;
        std::string help;
        std::map<std::string, Series> series; // keyed by label text
    };

    static const char* KindName(Kind kind);

    Series& FindOrCreateLocked(std::string_view name, std::string_view help, Kind kind, MetricLabels labels);

    mutable std::mutex mu_;
    std::map<std::string, Family, std::less<>> families_;
};

// Process-wide registry (Thread-safe)
MetricsRegistry& DefaultMetrics();

} // namespace countrydir
