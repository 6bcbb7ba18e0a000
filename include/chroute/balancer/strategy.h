#pragma once

#include <memory>
#include <span>
#include <string_view>

#include <chroute/core/diagnostics.h>
#include <chroute/core/status.h>
#include <chroute/discovery/endpoint.h>

namespace chroute::balancer {

using discovery::Endpoint;

enum class StrategyKind {
    random = 0,
    round_robin,
    weighted_round_robin,
    least_connections,
    response_time_weighted,
};

class IStrategy {
public:
    virtual ~IStrategy() = default;

    // Thread-safe. A default-constructed span stands for an absent list.
    // Empty input yields StatusCode::unavailable and leaves the strategy
    // untouched; otherwise the result is one of `endpoints`.
    virtual chroute::Result<Endpoint> Pick(std::span<const Endpoint> endpoints) = 0;

    virtual std::string_view Name() const = 0;
};

// Accepts "round_robin" as well as "roundRobin".
chroute::Result<StrategyKind> ParseStrategyKind(std::string_view name);

std::string_view StrategyKindName(StrategyKind kind);

std::shared_ptr<IStrategy> MakeStrategy(StrategyKind kind,
                                        std::shared_ptr<IDiagnostics> diagnostics = DefaultDiagnostics());

} // namespace chroute::balancer
