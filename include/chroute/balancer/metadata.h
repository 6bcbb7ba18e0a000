#pragma once

#include <cstdint>
#include <string_view>

#include <chroute/core/diagnostics.h>
#include <chroute/discovery/endpoint.h>

namespace chroute::balancer {

inline constexpr std::string_view kWeightKey = "weight";
inline constexpr std::string_view kActiveConnectionsKey = "activeConnections";
inline constexpr std::string_view kAvgResponseTimeKey = "avgResponseTime";

inline constexpr std::int32_t kDefaultWeight = 1;
inline constexpr std::int32_t kDefaultActiveConnections = 0;
inline constexpr std::int64_t kDefaultAvgResponseTimeMs = 100;

// The parsers below never fail. A value that is present but not a
// non-negative base-10 integer of the target width is reported to
// `diagnostics` as a warning and replaced by the default.

std::int32_t WeightOf(const discovery::Endpoint& endpoint, IDiagnostics& diagnostics);

std::int32_t ActiveConnectionsOf(const discovery::Endpoint& endpoint, IDiagnostics& diagnostics);

// Always >= 1: parsed values <= 0 are clamped to 1 (a negative value is
// therefore clamped, not rejected).
std::int64_t AvgResponseTimeOf(const discovery::Endpoint& endpoint, IDiagnostics& diagnostics);

} // namespace chroute::balancer
