#include <chroute/balancer/strategy.h>

#include <chroute/balancer/strategies.h>

#include <string>

namespace chroute::balancer {

chroute::Result<StrategyKind> ParseStrategyKind(std::string_view name) {
    if (name == "random") return StrategyKind::random;
    if (name == "round_robin" || name == "roundRobin") return StrategyKind::round_robin;
    if (name == "weighted_round_robin" || name == "weightedRoundRobin") return StrategyKind::weighted_round_robin;
    if (name == "least_connections" || name == "leastConnections") return StrategyKind::least_connections;
    if (name == "response_time_weighted" || name == "responseTimeWeighted") return StrategyKind::response_time_weighted;
    return chroute::Status(chroute::StatusCode::invalid_argument, "unknown strategy: " + std::string(name));
}

std::string_view StrategyKindName(StrategyKind kind) {
    switch (kind) {
        case StrategyKind::random: return "random";
        case StrategyKind::round_robin: return "round_robin";
        case StrategyKind::weighted_round_robin: return "weighted_round_robin";
        case StrategyKind::least_connections: return "least_connections";
        case StrategyKind::response_time_weighted: return "response_time_weighted";
    }
    return "unknown";
}

std::shared_ptr<IStrategy> MakeStrategy(StrategyKind kind, std::shared_ptr<IDiagnostics> diagnostics) {
    switch (kind) {
        case StrategyKind::random:
            return std::make_shared<RandomStrategy>();
        case StrategyKind::round_robin:
            return std::make_shared<RoundRobinStrategy>();
        case StrategyKind::weighted_round_robin:
            return std::make_shared<WeightedRoundRobinStrategy>(std::move(diagnostics));
        case StrategyKind::least_connections:
            return std::make_shared<LeastConnectionsStrategy>(std::move(diagnostics));
        case StrategyKind::response_time_weighted:
            return std::make_shared<ResponseTimeWeightedStrategy>(std::move(diagnostics));
    }
    return std::make_shared<RoundRobinStrategy>();
}

} // namespace chroute::balancer
