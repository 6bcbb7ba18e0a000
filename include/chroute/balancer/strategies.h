#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>

#include <chroute/balancer/strategy.h>
#include <chroute/core/diagnostics.h>

namespace chroute::balancer {

// Uniform over [0, n).
class RandomStrategy final : public IStrategy {
public:
    chroute::Result<Endpoint> Pick(std::span<const Endpoint> endpoints) override;
    std::string_view Name() const override { return StrategyKindName(StrategyKind::random); }
};

class RoundRobinStrategy final : public IStrategy {
public:
    // Thread-safe: every call consumes exactly one counter value.
    chroute::Result<Endpoint> Pick(std::span<const Endpoint> endpoints) override;
    std::string_view Name() const override { return StrategyKindName(StrategyKind::round_robin); }

private:
    std::atomic<std::uint64_t> counter_{0};
};

// Rotates over the cumulative "weight" metadata: with weights [1,2,3] the
// counter values 0..5 map to [a,b,b,c,c,c]. Falls back to plain rotation when
// the weights sum to zero.
class WeightedRoundRobinStrategy final : public IStrategy {
public:
    explicit WeightedRoundRobinStrategy(std::shared_ptr<IDiagnostics> diagnostics = DefaultDiagnostics());

    chroute::Result<Endpoint> Pick(std::span<const Endpoint> endpoints) override;
    std::string_view Name() const override { return StrategyKindName(StrategyKind::weighted_round_robin); }

private:
    std::shared_ptr<IDiagnostics> diagnostics_;
    std::atomic<std::uint64_t> counter_{0};
};

// Minimum "activeConnections"; ties go to the earliest endpoint.
class LeastConnectionsStrategy final : public IStrategy {
public:
    explicit LeastConnectionsStrategy(std::shared_ptr<IDiagnostics> diagnostics = DefaultDiagnostics());

    chroute::Result<Endpoint> Pick(std::span<const Endpoint> endpoints) override;
    std::string_view Name() const override { return StrategyKindName(StrategyKind::least_connections); }

private:
    std::shared_ptr<IDiagnostics> diagnostics_;
};

// Random draw weighted by 1 / max(avgResponseTime, 1).
class ResponseTimeWeightedStrategy final : public IStrategy {
public:
    explicit ResponseTimeWeightedStrategy(std::shared_ptr<IDiagnostics> diagnostics = DefaultDiagnostics());

    chroute::Result<Endpoint> Pick(std::span<const Endpoint> endpoints) override;
    std::string_view Name() const override { return StrategyKindName(StrategyKind::response_time_weighted); }

private:
    std::shared_ptr<IDiagnostics> diagnostics_;
};

} // namespace chroute::balancer
