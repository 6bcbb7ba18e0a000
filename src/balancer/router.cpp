#include <chroute/balancer/router.h>

#include <chroute/balancer/strategies.h>

#include <exception>
#include <format>
#include <optional>
#include <string_view>
#include <utility>

namespace chroute::balancer {
namespace {

MetricLabels StrategyLabels(std::string_view name) {
    MetricLabels labels;
    labels.kv["strategy"] = std::string(name);
    return labels;
}

} // namespace

Router::Router() : Router(std::make_shared<RoundRobinStrategy>()) {}

Router::Router(std::shared_ptr<IStrategy> strategy, std::shared_ptr<IDiagnostics> diagnostics, MetricsRegistry& metrics)
    : diagnostics_(std::move(diagnostics)), metrics_(metrics) {
    if (!diagnostics_) {
        diagnostics_ = std::make_shared<NullDiagnostics>();
    }
    if (!strategy) {
        diagnostics_->Warn("router created without a strategy, using round_robin");
        strategy = std::make_shared<RoundRobinStrategy>();
    }
    active_.store(MakeActive(std::move(strategy)), std::memory_order_release);
}

Router Router::Random(std::shared_ptr<IDiagnostics> diagnostics) {
    return Router(MakeStrategy(StrategyKind::random, diagnostics), diagnostics);
}

Router Router::RoundRobin(std::shared_ptr<IDiagnostics> diagnostics) {
    return Router(MakeStrategy(StrategyKind::round_robin, diagnostics), diagnostics);
}

Router Router::WeightedRoundRobin(std::shared_ptr<IDiagnostics> diagnostics) {
    return Router(MakeStrategy(StrategyKind::weighted_round_robin, diagnostics), diagnostics);
}

Router Router::LeastConnections(std::shared_ptr<IDiagnostics> diagnostics) {
    return Router(MakeStrategy(StrategyKind::least_connections, diagnostics), diagnostics);
}

Router Router::ResponseTimeWeighted(std::shared_ptr<IDiagnostics> diagnostics) {
    return Router(MakeStrategy(StrategyKind::response_time_weighted, diagnostics), diagnostics);
}

Router Router::FromOptions(const RouterOptions& options, std::shared_ptr<IDiagnostics> diagnostics) {
    return Router(MakeStrategy(options.strategy, diagnostics), diagnostics);
}

std::shared_ptr<const Router::Active> Router::MakeActive(std::shared_ptr<IStrategy> strategy) const {
    auto labels = StrategyLabels(strategy->Name());

    auto active = std::make_shared<Active>();
    active->picks = &metrics_.CounterMetric("chroute_picks_total", "Endpoints picked by the active strategy", labels);
    active->empty_picks =
        &metrics_.CounterMetric("chroute_empty_picks_total", "Picks requested with no candidate endpoints", labels);
    active->fallbacks =
        &metrics_.CounterMetric("chroute_fallbacks_total", "Picks answered with the first candidate after a strategy failure", labels);
    active->strategy = std::move(strategy);
    return active;
}

chroute::Result<Endpoint> Router::Pick(std::span<const Endpoint> endpoints) {
    auto active = active_.load(std::memory_order_acquire);

    if (endpoints.empty()) {
        active->empty_picks->Inc();
        diagnostics_->Warn("no endpoints available");
        return chroute::Status(chroute::StatusCode::unavailable, "no endpoints");
    }

    std::optional<chroute::Result<Endpoint>> r;
    try {
        r.emplace(active->strategy->Pick(endpoints));
    } catch (const std::exception& e) {
        diagnostics_->Error(std::format("strategy {} threw: {}", active->strategy->Name(), e.what()));
    } catch (...) {
        diagnostics_->Error(std::format("strategy {} threw a non-standard exception", active->strategy->Name()));
    }

    if (r && r->ok()) {
        active->picks->Inc();
        if (diagnostics_->Enabled(Severity::debug)) {
            const auto& chosen = r->value();
            diagnostics_->Debug(std::format("picked endpoint {} ({}:{})", chosen.id, chosen.host, chosen.port));
        }
        return std::move(*r);
    }
    if (r) {
        diagnostics_->Error(std::format("strategy {} failed: {}", active->strategy->Name(), r->status().ToString()));
    }

    return Fallback(*active, endpoints);
}

chroute::Result<Endpoint> Router::Fallback(const Active& active, std::span<const Endpoint> endpoints) {
    active.fallbacks->Inc();
    const auto& first = endpoints.front();
    diagnostics_->Warn(std::format("falling back to first endpoint {} ({}:{})", first.id, first.host, first.port));
    return first;
}

chroute::Status Router::SetStrategy(std::shared_ptr<IStrategy> strategy) {
    if (!strategy) {
        return chroute::Status(chroute::StatusCode::invalid_argument, "strategy must not be null");
    }
    auto name = std::string(strategy->Name());
    active_.store(MakeActive(std::move(strategy)), std::memory_order_release);
    diagnostics_->Info(std::format("active strategy set to {}", name));
    return chroute::Status::Ok();
}

std::shared_ptr<IStrategy> Router::strategy() const {
    return active_.load(std::memory_order_acquire)->strategy;
}

} // namespace chroute::balancer
