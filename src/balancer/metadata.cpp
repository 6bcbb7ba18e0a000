#include <chroute/balancer/metadata.h>

#include <algorithm>
#include <charconv>
#include <format>
#include <optional>
#include <string>

namespace chroute::balancer {
namespace {

// Base-10 with an optional single leading '+'.
template <class T>
std::optional<T> ParseInteger(std::string_view text) {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (text.empty() || text.front() == '-' || text.front() == '+') {
            return std::nullopt;
        }
    }
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

void ReportMalformed(IDiagnostics& diagnostics, const discovery::Endpoint& endpoint,
                     std::string_view key, const std::string& raw, std::int64_t fallback) {
    diagnostics.Warn(std::format("endpoint {}: malformed metadata {}=\"{}\", using {}",
                                 endpoint.id, key, raw, fallback));
}

} // namespace

std::int32_t WeightOf(const discovery::Endpoint& endpoint, IDiagnostics& diagnostics) {
    const auto* raw = endpoint.Metadata(kWeightKey);
    if (raw == nullptr) {
        return kDefaultWeight;
    }
    auto v = ParseInteger<std::int32_t>(*raw);
    if (!v || *v < 0) {
        ReportMalformed(diagnostics, endpoint, kWeightKey, *raw, kDefaultWeight);
        return kDefaultWeight;
    }
    return *v;
}

std::int32_t ActiveConnectionsOf(const discovery::Endpoint& endpoint, IDiagnostics& diagnostics) {
    const auto* raw = endpoint.Metadata(kActiveConnectionsKey);
    if (raw == nullptr) {
        return kDefaultActiveConnections;
    }
    auto v = ParseInteger<std::int32_t>(*raw);
    if (!v || *v < 0) {
        ReportMalformed(diagnostics, endpoint, kActiveConnectionsKey, *raw, kDefaultActiveConnections);
        return kDefaultActiveConnections;
    }
    return *v;
}

std::int64_t AvgResponseTimeOf(const discovery::Endpoint& endpoint, IDiagnostics& diagnostics) {
    const auto* raw = endpoint.Metadata(kAvgResponseTimeKey);
    if (raw == nullptr) {
        return kDefaultAvgResponseTimeMs;
    }
    auto v = ParseInteger<std::int64_t>(*raw);
    if (!v) {
        ReportMalformed(diagnostics, endpoint, kAvgResponseTimeKey, *raw, kDefaultAvgResponseTimeMs);
        return kDefaultAvgResponseTimeMs;
    }
    return std::max<std::int64_t>(*v, 1);
}

} // namespace chroute::balancer
