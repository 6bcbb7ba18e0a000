#include <chroute/balancer/router.h>
#include <chroute/config/config.h>
#include <chroute/core/log.h>
#include <chroute/core/metrics.h>
#include <chroute/discovery/endpoint.h>
#include <chroute/discovery/service_discovery.h>

#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace {

using chroute::discovery::Endpoint;

Endpoint MakeEndpoint(std::string_view service, std::string host, std::uint16_t port, bool secure,
                      std::map<std::string, std::string> metadata) {
    Endpoint e;
    e.id = chroute::discovery::MakeInstanceId(service, host, port);
    e.host = std::move(host);
    e.port = port;
    e.secure = secure;
    e.metadata = std::move(metadata);
    return e;
}

void RegisterDemoService(chroute::discovery::InMemoryServiceDiscovery& discovery, const std::string& service) {
    discovery.Set(service, {
        MakeEndpoint(service, "10.0.0.1", 8080, false, {{"weight", "1"}, {"activeConnections", "12"}, {"avgResponseTime", "40"}}),
        MakeEndpoint(service, "10.0.0.2", 8080, false, {{"weight", "2"}, {"activeConnections", "3"}, {"avgResponseTime", "120"}}),
        MakeEndpoint(service, "10.0.0.3", 8443, true, {{"weight", "3"}, {"activeConnections", "7"}}),
        MakeEndpoint(service, "10.0.0.4", 8080, false, {{"weight", "abc"}}),
    });
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string strategy_name;
    std::string log_level;
    std::string service = "orders";
    int picks = 12;

    for (int i = 1; i < argc; ++i) {
        std::string_view a(argv[i]);
        if (a == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (a == "--strategy" && i + 1 < argc) {
            strategy_name = argv[++i];
        } else if (a == "--picks" && i + 1 < argc) {
            picks = std::atoi(argv[++i]);
        } else if (a == "--log" && i + 1 < argc) {
            log_level = argv[++i];
        } else if (a == "--service" && i + 1 < argc) {
            service = argv[++i];
        } else {
            std::cerr << "Usage: chroute_demo [--config file] [--strategy name] [--picks n] [--log level] [--service name]\n";
            return 2;
        }
    }
    if (picks <= 0) {
        std::cerr << "Invalid --picks, expected a positive integer\n";
        return 2;
    }

    chroute::balancer::RouterOptions options;
    if (!config_path.empty()) {
        auto cfg = chroute::config::Config::LoadFile(config_path);
        if (!cfg.ok()) {
            std::cerr << "Failed to load config: " << cfg.status().ToString() << "\n";
            return 2;
        }
        auto loaded = chroute::config::LoadRouterOptions(cfg.value());
        if (!loaded.ok()) {
            std::cerr << "Invalid config: " << loaded.status().ToString() << "\n";
            return 2;
        }
        options = std::move(loaded).value();
    }

    // Command line wins over the config file.
    if (!strategy_name.empty()) {
        auto kind = chroute::balancer::ParseStrategyKind(strategy_name);
        if (!kind.ok()) {
            std::cerr << "Invalid --strategy: " << kind.status().message() << "\n";
            return 2;
        }
        options.strategy = kind.value();
    }
    if (!log_level.empty()) {
        options.log_level = log_level;
    }

    chroute::log::Init(options.log_level);

    chroute::discovery::InMemoryServiceDiscovery discovery;
    RegisterDemoService(discovery, "orders");

    auto endpoints = discovery.Resolve(service);
    if (!endpoints.ok()) {
        chroute::log::error("resolve {} failed: {}", service, endpoints.status().ToString());
        return 1;
    }

    auto router = chroute::balancer::Router::FromOptions(options);
    chroute::log::info("routing {} picks for {} with {}", picks, service, router.strategy()->Name());

    std::map<std::string, int> hits;
    for (int i = 0; i < picks; ++i) {
        auto chosen = router.Pick(endpoints.value());
        if (!chosen.ok()) {
            chroute::log::warn("pick failed: {}", chosen.status().ToString());
            continue;
        }
        ++hits[chosen->id];
        std::cout << chroute::discovery::BuildServiceUrl(chosen.value(), "/api/v1/orders") << "\n";
    }

    std::cout << "\n";
    for (const auto& it : hits) {
        std::cout << it.first << " " << it.second << "\n";
    }
    std::cout << "\n" << chroute::DefaultMetrics().ToPrometheusText();
    return 0;
}
