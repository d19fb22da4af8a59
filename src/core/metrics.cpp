#include <countrydir/core/metrics.h>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace countrydir {
namespace {

// Prometheus wants "0.5", "10", "+Inf"; std::to_string would print "0.500000".
std::string FormatNumber(double v) {
    if (std::isinf(v)) {
        return v > 0 ? "+Inf" : "-Inf";
    }
    std::ostringstream oss;
    oss.precision(15);
    oss << v;
    return oss.str();
}

std::vector<double> SortedUnique(std::vector<double> buckets) {
    std::sort(buckets.begin(), buckets.end());
    buckets.erase(std::unique(buckets.begin(), buckets.end()), buckets.end());
    return buckets;
}

} // namespace

std::string MetricLabels::ToPrometheusLabelText() const {
    if (kv.empty()) {
        return {};
    }
    std::string out = "{";
    bool first = true;
    for (const auto& [key, value] : kv) {
        if (!first) {
            out += ',';
        }
        first = false;
        out += key;
        out += "=\"";
        for (char c : value) {
            if (c == '\\' || c == '"') {
                out += '\\';
                out += c;
            } else if (c == '\n') {
                out += "\\n";
            } else {
                out += c;
            }
        }
        out += '"';
    }
    out += '}';
    return out;
}

void Gauge::Set(double v) {
    std::lock_guard<std::mutex> lk(mu_);
    value_ = v;
}

void Gauge::Add(double delta) {
    std::lock_guard<std::mutex> lk(mu_);
    value_ += delta;
}

double Gauge::Value() const {
    std::lock_guard<std::mutex> lk(mu_);
    return value_;
}

Histogram::Histogram(std::vector<double> buckets)
    : buckets_(SortedUnique(std::move(buckets))),
      bucket_counts_(buckets_.size(), 0) {}

void Histogram::Observe(double v) {
    auto it = std::lower_bound(buckets_.begin(), buckets_.end(), v);

    std::lock_guard<std::mutex> lk(mu_);
    sum_ += v;
    ++count_;
    if (it != buckets_.end()) {
        ++bucket_counts_[static_cast<std::size_t>(it - buckets_.begin())];
    }
}

void Histogram::Snapshot(std::vector<std::uint64_t>& bucket_counts, double& sum, std::uint64_t& count) const {
    std::lock_guard<std::mutex> lk(mu_);
    bucket_counts = bucket_counts_;
    sum = sum_;
    count = count_;
}

const char* MetricsRegistry::KindName(Kind kind) {
    switch (kind) {
        case Kind::counter: return "counter";
        case Kind::gauge: return "gauge";
        case Kind::histogram: return "histogram";
    }
    return "untyped";
}

MetricsRegistry::Series& MetricsRegistry::FindOrCreateLocked(std::string_view name, std::string_view help, Kind kind, MetricLabels labels) {
    auto fit = families_.find(name);
    if (fit == families_.end()) {
        Family family;
        family.kind = kind;
        family.help = std::string(help);
        fit = families_.emplace(std::string(name), std::move(family)).first;
    } else if (fit->second.kind != kind) {
        throw std::logic_error("metric '" + std::string(name) + "' already registered with type " +
                               KindName(fit->second.kind));
    }

    auto key = labels.ToPrometheusLabelText();
    auto& series = fit->second.series;
    auto sit = series.find(key);
    if (sit == series.end()) {
        Series s;
        s.labels = std::move(labels);
        sit = series.emplace(std::move(key), std::move(s)).first;
    }
    return sit->second;
}

Counter& MetricsRegistry::CounterMetric(std::string_view name, std::string_view help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& s = FindOrCreateLocked(name, help, Kind::counter, std::move(labels));
    if (!s.counter) {
        s.counter = std::make_unique<Counter>();
    }
    return *s.counter;
}

Gauge& MetricsRegistry::GaugeMetric(std::string_view name, std::string_view help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& s = FindOrCreateLocked(name, help, Kind::gauge, std::move(labels));
    if (!s.gauge) {
        s.gauge = std::make_unique<Gauge>();
    }
    return *s.gauge;
}

Histogram& MetricsRegistry::HistogramMetric(std::string_view name, std::string_view help, std::vector<double> buckets, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto& s = FindOrCreateLocked(name, help, Kind::histogram, std::move(labels));
    if (!s.histogram) {
        // An existing series keeps the buckets it was created with.
        s.histogram = std::make_unique<Histogram>(std::move(buckets));
    }
    return *s.histogram;
}

std::string MetricsRegistry::ToPrometheusText() const {
    std::lock_guard<std::mutex> lk(mu_);
    std::ostringstream oss;

    for (const auto& [name, family] : families_) {
        oss << "# HELP " << name << " " << family.help << "\n";
        oss << "# TYPE " << name << " " << KindName(family.kind) << "\n";

        for (const auto& [label_text, s] : family.series) {
            switch (family.kind) {
                case Kind::counter:
                    oss << name << label_text << " " << s.counter->Value() << "\n";
                    break;
                case Kind::gauge:
                    oss << name << label_text << " " << FormatNumber(s.gauge->Value()) << "\n";
                    break;
                case Kind::histogram: {
                    std::vector<std::uint64_t> counts;
                    double sum = 0.0;
                    std::uint64_t count = 0;
                    s.histogram->Snapshot(counts, sum, count);
                    const auto& bounds = s.histogram->Buckets();

                    std::uint64_t cumulative = 0;
                    for (std::size_t i = 0; i < bounds.size(); ++i) {
                        cumulative += counts[i];
                        MetricLabels le = s.labels;
                        le.kv["le"] = FormatNumber(bounds[i]);
                        oss << name << "_bucket" << le.ToPrometheusLabelText() << " " << cumulative << "\n";
                    }
                    MetricLabels inf = s.labels;
                    inf.kv["le"] = "+Inf";
                    oss << name << "_bucket" << inf.ToPrometheusLabelText() << " " << count << "\n";
                    oss << name << "_sum" << label_text << " " << FormatNumber(sum) << "\n";
                    oss << name << "_count" << label_text << " " << count << "\n";
                    break;
                }
            }
        }
    }

    return oss.str();
}

MetricsRegistry& DefaultMetrics() {
    static MetricsRegistry registry;
    return registry;
}

} // namespace countrydir
