#pragma once

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace chroute {

struct MetricLabels {
    // Sorted so that exposition order is deterministic.
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

class MetricsRegistry {
public:
    // Thread-safe. Returns the same counter for the same name and labels; the
    // reference stays valid for the lifetime of the registry.
    Counter& CounterMetric(std::string name, std::string help, MetricLabels labels = {});

    // Thread-safe
    std::string ToPrometheusText() const;

private:
    struct CounterEntry {
        std::string name;
        std::string help;
        MetricLabels labels;
        Counter counter;

        CounterEntry(std::string name_, std::string help_, MetricLabels labels_)
            : name(std::move(name_)), help(std::move(help_)), labels(std::move(labels_)), counter() {}
    };

    static std::string Key(std::string_view name, const MetricLabels& labels);

    mutable std::mutex mu_;
    std::unordered_map<std::string, CounterEntry> counters_;
};

// Global default registry (Thread-safe)
MetricsRegistry& DefaultMetrics();

} // namespace chroute
