#include <chroute/core/metrics.h>

#include <algorithm>
#include <set>
#include <sstream>
#include <vector>

namespace chroute {

std::string MetricLabels::ToPrometheusLabelText() const {
    if (kv.empty()) {
        return {};
    }
    std::ostringstream oss;
    oss << "{";
    bool first = true;
    for (const auto& it : kv) {
        if (!first) {
            oss << ",";
        }
        first = false;
        oss << it.first << "=\"";
        for (char c : it.second) {
            if (c == '\\' || c == '"') {
                oss << '\\' << c;
            } else if (c == '\n') {
                oss << "\\n";
            } else {
                oss << c;
            }
        }
        oss << "\"";
    }
    oss << "}";
    return oss.str();
}

std::string MetricsRegistry::Key(std::string_view name, const MetricLabels& labels) {
    std::string key(name);
    key.push_back('\n');
    for (const auto& it : labels.kv) {
        key.append(it.first);
        key.push_back('=');
        key.append(it.second);
        key.push_back('\n');
    }
    return key;
}

Counter& MetricsRegistry::CounterMetric(std::string name, std::string help, MetricLabels labels) {
    std::lock_guard<std::mutex> lk(mu_);
    auto key = Key(name, labels);
    auto it = counters_.find(key);
    if (it == counters_.end()) {
        it = counters_.try_emplace(std::move(key), std::move(name), std::move(help), std::move(labels)).first;
    }
    return it->second.counter;
}

std::string MetricsRegistry::ToPrometheusText() const {
    std::lock_guard<std::mutex> lk(mu_);

    // Group series of the same metric under one HELP/TYPE header.
    std::vector<const CounterEntry*> entries;
    entries.reserve(counters_.size());
    for (const auto& kv : counters_) {
        entries.push_back(&kv.second);
    }
    std::sort(entries.begin(), entries.end(), [](const CounterEntry* a, const CounterEntry* b) {
        if (a->name != b->name) {
            return a->name < b->name;
        }
        return a->labels.kv < b->labels.kv;
    });

    std::ostringstream oss;
    std::set<std::string> headers;
    for (const auto* entry : entries) {
        if (headers.insert(entry->name).second) {
            oss << "# HELP " << entry->name << " " << entry->help << "\n";
            oss << "# TYPE " << entry->name << " counter\n";
        }
        oss << entry->name << entry->labels.ToPrometheusLabelText() << " " << entry->counter.Value() << "\n";
    }
    return oss.str();
}

MetricsRegistry& DefaultMetrics() {
    static MetricsRegistry registry;
    return registry;
}

} // namespace chroute
