#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

namespace meshdest {

struct MetricLabels {
    // Sorted so that exposition is deterministic.
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
    void Set(std::int64_t v) { value_.store(v, std::memory_order_relaxed); }
    void Add(std::int64_t v) { value_.fetch_add(v, std::memory_order_relaxed); }
    std::int64_t Value() const { return value_.load(std::memory_order_relaxed); }

private:
    std::atomic<std::int64_t> value_{0};
};

// CounterMetric/GaugeMetric find-or-create process-wide series; the returned
// references stay valid for the registry's lifetime. Series owned by a
// shorter-lived object come from AddCounter/AddGauge and go away with
// RemoveCounter/RemoveGauge.
class MetricsRegistry {
public:
    // Thread-safe
    Counter& CounterMetric(std::string name, std::string help, MetricLabels labels = {});
    Gauge& GaugeMetric(std::string name, std::string help, MetricLabels labels = {});

    // Thread-safe. Registers a fresh series, replacing any with the same labels.
    std::shared_ptr<Counter> AddCounter(std::string name, std::string help, const MetricLabels& labels);
    std::shared_ptr<Gauge> AddGauge(std::string name, std::string help, const MetricLabels& labels);

    // Thread-safe. Drops the series only while it is still `series`, so an
    // owner cannot remove its replacement. A family left empty goes too.
    void RemoveCounter(const std::string& name, const MetricLabels& labels, const Counter* series);
    void RemoveGauge(const std::string& name, const MetricLabels& labels, const Gauge* series);

    // Thread-safe
    std::string ToPrometheusText() const;

private:
    enum class Kind { counter, gauge };

    struct Family {
        Kind kind;
        std::string help;
        std::map<std::string, std::shared_ptr<Counter>> counters; // keyed by label text
        std::map<std::string, std::shared_ptr<Gauge>> gauges;
    };

    Family& FamilyLocked(std::string name, std::string help, Kind kind);

    mutable std::mutex mu_;
    std::map<std::string, Family> families_;
};

// Global default registry (Thread-safe)
MetricsRegistry& DefaultMetrics();

} // namespace meshdest
