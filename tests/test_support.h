#pragma once

#include <chroute/core/diagnostics.h>
#include <chroute/discovery/endpoint.h>

#include <atomic>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace chroute::testing {

class RecordingDiagnostics final : public chroute::IDiagnostics {
public:
    explicit RecordingDiagnostics(chroute::Severity min_severity = chroute::Severity::debug)
        : min_severity_(min_severity) {}

    void Emit(chroute::Severity severity, std::string_view message) noexcept override {
        std::lock_guard<std::mutex> lk(mu_);
        entries_.emplace_back(severity, std::string(message));
    }

    bool Enabled(chroute::Severity severity) const noexcept override {
        enabled_queries_.fetch_add(1, std::memory_order_relaxed);
        return severity >= min_severity_;
    }

    int EnabledQueries() const { return enabled_queries_.load(std::memory_order_relaxed); }

    std::size_t Count(chroute::Severity severity) const {
        std::lock_guard<std::mutex> lk(mu_);
        std::size_t n = 0;
        for (const auto& e : entries_) {
            if (e.first == severity) {
                ++n;
            }
        }
        return n;
    }

    bool Contains(std::string_view needle) const {
        std::lock_guard<std::mutex> lk(mu_);
        for (const auto& e : entries_) {
            if (e.second.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

private:
    const chroute::Severity min_severity_;
    mutable std::atomic<int> enabled_queries_{0};
    mutable std::mutex mu_;
    std::vector<std::pair<chroute::Severity, std::string>> entries_;
};

inline chroute::discovery::Endpoint MakeEndpoint(std::string id, std::map<std::string, std::string> metadata = {}) {
    chroute::discovery::Endpoint e;
    e.host = "10.0.0." + std::to_string(id.size());
    e.port = 8080;
    e.id = std::move(id);
    e.metadata = std::move(metadata);
    return e;
}

inline std::vector<chroute::discovery::Endpoint> WithMetadata(std::string_view key, std::vector<std::string> values) {
    std::vector<chroute::discovery::Endpoint> out;
    for (std::size_t i = 0; i < values.size(); ++i) {
        out.push_back(MakeEndpoint("ep" + std::to_string(i), {{std::string(key), values[i]}}));
    }
    return out;
}

inline bool IsMember(const chroute::discovery::Endpoint& e, const std::vector<chroute::discovery::Endpoint>& list) {
    for (const auto& x : list) {
        if (x == e) {
            return true;
        }
    }
    return false;
}

} // namespace chroute::testing
