#pragma once

#include <atomic>
#include <memory>
#include <span>
#include <string>

#include <chroute/balancer/strategy.h>
#include <chroute/core/diagnostics.h>
#include <chroute/core/metrics.h>
#include <chroute/core/status.h>

namespace chroute::balancer {

struct RouterOptions {
    StrategyKind strategy = StrategyKind::round_robin;
    std::string log_level = "info";
};

// Delegates endpoint selection to the active strategy. Pick() never throws
// for a non-empty input: if the strategy throws or reports an error the first
// candidate is returned instead.
class Router {
public:
    // Round-robin.
    Router();

    // A null strategy is replaced by round-robin.
    explicit Router(std::shared_ptr<IStrategy> strategy,
                    std::shared_ptr<IDiagnostics> diagnostics = DefaultDiagnostics(),
                    MetricsRegistry& metrics = DefaultMetrics());

    Router(const Router&) = delete;
    Router& operator=(const Router&) = delete;

    static Router Random(std::shared_ptr<IDiagnostics> diagnostics = DefaultDiagnostics());
    static Router RoundRobin(std::shared_ptr<IDiagnostics> diagnostics = DefaultDiagnostics());
    static Router WeightedRoundRobin(std::shared_ptr<IDiagnostics> diagnostics = DefaultDiagnostics());
    static Router LeastConnections(std::shared_ptr<IDiagnostics> diagnostics = DefaultDiagnostics());
    static Router ResponseTimeWeighted(std::shared_ptr<IDiagnostics> diagnostics = DefaultDiagnostics());

    static Router FromOptions(const RouterOptions& options,
                              std::shared_ptr<IDiagnostics> diagnostics = DefaultDiagnostics());

    // Thread-safe. Empty input yields StatusCode::unavailable.
    chroute::Result<Endpoint> Pick(std::span<const Endpoint> endpoints);

    // Thread-safe. Picks already running may still use the previous strategy.
    chroute::Status SetStrategy(std::shared_ptr<IStrategy> strategy);

    // Thread-safe
    std::shared_ptr<IStrategy> strategy() const;

private:
    // Strategy plus its counters, swapped as one unit.
    struct Active {
        std::shared_ptr<IStrategy> strategy;
        Counter* picks = nullptr;
        Counter* empty_picks = nullptr;
        Counter* fallbacks = nullptr;
    };

    std::shared_ptr<const Active> MakeActive(std::shared_ptr<IStrategy> strategy) const;

    chroute::Result<Endpoint> Fallback(const Active& active, std::span<const Endpoint> endpoints);

    std::shared_ptr<IDiagnostics> diagnostics_;
    MetricsRegistry& metrics_;
    std::atomic<std::shared_ptr<const Active>> active_;
};

} // namespace chroute::balancer
