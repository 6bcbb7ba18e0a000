#include <chroute/balancer/strategies.h>

#include <chroute/balancer/metadata.h>

#include <cstddef>
#include <memory>
#include <random>
#include <utility>
#include <vector>

namespace chroute::balancer {
namespace {

chroute::Status NoEndpoints() {
    return chroute::Status(chroute::StatusCode::unavailable, "no endpoints");
}

std::mt19937_64& Engine() {
    thread_local std::mt19937_64 gen(std::random_device{}());
    return gen;
}

std::size_t UniformIndex(std::size_t n) {
    std::uniform_int_distribution<std::size_t> dist(0, n - 1);
    return dist(Engine());
}

std::shared_ptr<IDiagnostics> OrNull(std::shared_ptr<IDiagnostics> diagnostics) {
    if (!diagnostics) {
        return std::make_shared<NullDiagnostics>();
    }
    return diagnostics;
}

} // namespace

chroute::Result<Endpoint> RandomStrategy::Pick(std::span<const Endpoint> endpoints) {
    if (endpoints.empty()) {
        return NoEndpoints();
    }
    return endpoints[UniformIndex(endpoints.size())];
}

chroute::Result<Endpoint> RoundRobinStrategy::Pick(std::span<const Endpoint> endpoints) {
    if (endpoints.empty()) {
        return NoEndpoints();
    }
    auto idx = counter_.fetch_add(1, std::memory_order_relaxed) % endpoints.size();
    return endpoints[idx];
}

WeightedRoundRobinStrategy::WeightedRoundRobinStrategy(std::shared_ptr<IDiagnostics> diagnostics)
    : diagnostics_(OrNull(std::move(diagnostics))) {}

chroute::Result<Endpoint> WeightedRoundRobinStrategy::Pick(std::span<const Endpoint> endpoints) {
    if (endpoints.empty()) {
        return NoEndpoints();
    }

    // Parse once; the scan below must see the same weights as the total.
    std::vector<std::int64_t> weights;
    weights.reserve(endpoints.size());
    std::int64_t total = 0;
    for (const auto& e : endpoints) {
        weights.push_back(WeightOf(e, *diagnostics_));
        total += weights.back();
    }

    auto tick = counter_.fetch_add(1, std::memory_order_relaxed);
    if (total <= 0) {
        return endpoints[tick % endpoints.size()];
    }

    auto target = static_cast<std::int64_t>(tick % static_cast<std::uint64_t>(total));
    std::int64_t cumulative = 0;
    for (std::size_t i = 0; i < endpoints.size(); ++i) {
        cumulative += weights[i];
        if (cumulative > target) {
            return endpoints[i];
        }
    }

    // unreachable while target < total
    return endpoints.front();
}

LeastConnectionsStrategy::LeastConnectionsStrategy(std::shared_ptr<IDiagnostics> diagnostics)
    : diagnostics_(OrNull(std::move(diagnostics))) {}

chroute::Result<Endpoint> LeastConnectionsStrategy::Pick(std::span<const Endpoint> endpoints) {
    if (endpoints.empty()) {
        return NoEndpoints();
    }

    const Endpoint* chosen = nullptr;
    std::int32_t best = 0;
    for (const auto& e : endpoints) {
        auto connections = ActiveConnectionsOf(e, *diagnostics_);
        if (chosen == nullptr || connections < best) {
            best = connections;
            chosen = &e;
        }
    }

    if (chosen == nullptr) {
        return endpoints.front();
    }
    return *chosen;
}

ResponseTimeWeightedStrategy::ResponseTimeWeightedStrategy(std::shared_ptr<IDiagnostics> diagnostics)
    : diagnostics_(OrNull(std::move(diagnostics))) {}

chroute::Result<Endpoint> ResponseTimeWeightedStrategy::Pick(std::span<const Endpoint> endpoints) {
    if (endpoints.empty()) {
        return NoEndpoints();
    }

    std::vector<double> weights;
    weights.reserve(endpoints.size());
    double total = 0.0;
    for (const auto& e : endpoints) {
        auto response_time = AvgResponseTimeOf(e, *diagnostics_);
        weights.push_back(1.0 / static_cast<double>(response_time));
        total += weights.back();
    }

    if (!(total > 0.0)) {
        return endpoints[UniformIndex(endpoints.size())];
    }

    std::uniform_real_distribution<double> dist(0.0, total);
    auto r = dist(Engine());

    double cumulative = 0.0;
    for (std::size_t i = 0; i < endpoints.size(); ++i) {
        cumulative += weights[i];
        if (cumulative >= r) {
            return endpoints[i];
        }
    }

    // rounding left r above the last cumulative sum
    return endpoints.back();
}

} // namespace chroute::balancer
