#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <string_view>

#include <chroute/core/status.h>

namespace chroute::discovery {

struct Endpoint {
    std::string id;
    std::string host;
    std::uint16_t port = 0;
    bool secure = false;
    // Optional; absent keys are normal.
    std::map<std::string, std::string> metadata;

    // nullptr when the key is absent.
    const std::string* Metadata(std::string_view key) const;

    bool operator==(const Endpoint&) const = default;
};

// "https://host:port/path" when secure, "http://..." otherwise. A leading '/'
// is inserted when path is non-empty and lacks one.
std::string BuildServiceUrl(const Endpoint& endpoint, std::string_view path = {});

struct InstanceIdParts {
    std::string service;
    std::string host;
    std::uint16_t port = 0;
};

// "service:host:port"
std::string MakeInstanceId(std::string_view service, std::string_view host, std::uint16_t port);

chroute::Result<InstanceIdParts> ParseInstanceId(std::string_view id);

} // namespace chroute::discovery
