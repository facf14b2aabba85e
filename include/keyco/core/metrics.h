#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace keyco {

// Sorted so that exposition order is deterministic.
using MetricLabels = std::map<std::string, std::string>;

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
    void Set(double v) { value_.store(v, std::memory_order_relaxed); }
    double Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<double> value_{0.0};
};

class Histogram {
public:
    struct Snapshot {
        std::vector<double> bounds;
        std::vector<std::uint64_t> counts; // per bucket, not cumulative
        double sum = 0.0;
        std::uint64_t count = 0;
    };

    explicit Histogram(std::vector<double> bounds);

    // Thread-safe
    void Observe(double v);
    Snapshot Take() const;

private:
    std::vector<double> bounds_;
    mutable std::mutex mu_;
    std::vector<std::uint64_t> counts_;
    double sum_ = 0.0;
    std::uint64_t count_ = 0;
};

// Owns every series it hands out; references stay valid for the registry's
// lifetime.
class MetricsRegistry {
public:
    // Thread-safe
    Counter& GetCounter(const std::string& name, const std::string& help, const MetricLabels& labels = {});
    Gauge& GetGauge(const std::string& name, const std::string& help, const MetricLabels& labels = {});
    Histogram& GetHistogram(const std::string& name, const std::string& help,
                            const std::vector<double>& bounds, const MetricLabels& labels = {});

    // Thread-safe. Prometheus text exposition format 0.0.4.
    std::string ToPrometheusText() const;

private:
    template <class Series>
    struct Family {
        std::string help;
        std::map<MetricLabels, std::unique_ptr<Series>> series;
    };

    mutable std::mutex mu_;
    std::map<std::string, Family<Counter>> counters_;
    std::map<std::string, Family<Gauge>> gauges_;
    std::map<std::string, Family<Histogram>> histograms_;
};

} // namespace keyco
