#pragma once

#include <string>
#include <string_view>

#include <chroute/balancer/router.h>
#include <chroute/core/status.h>

#include <chjson/chjson.hpp>

namespace chroute::config {

class Config {
public:
    static chroute::Result<Config> LoadFile(std::string path);

    // Root must be a JSON object.
    static chroute::Result<Config> LoadString(std::string text);

    bool Has(std::string_view key) const;

    chroute::Result<std::string> GetString(std::string_view key) const;
    chroute::Result<int> GetInt(std::string_view key) const;

private:
    chjson::document doc_;
};

// Keys: "strategy" (default "round_robin"), "log_level" (default "info").
chroute::Result<balancer::RouterOptions> LoadRouterOptions(const Config& config);

} // namespace chroute::config
