#pragma once

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <chroute/core/status.h>
#include <chroute/discovery/endpoint.h>

namespace chroute::discovery {

class IServiceDiscovery {
public:
    virtual ~IServiceDiscovery() = default;

    // Thread-safe
    virtual chroute::Result<std::vector<Endpoint>> Resolve(std::string_view service) const = 0;

    virtual std::vector<std::string> Services() const = 0;
};

// A simple in-process registry. Useful for tests / single-process demos.
class InMemoryServiceDiscovery final : public IServiceDiscovery {
public:
    // Requires external synchronization if called concurrently with Resolve()
    void Set(std::string service, std::vector<Endpoint> endpoints);

    // Returns false when the service was not registered.
    bool Remove(std::string_view service);

    chroute::Result<std::vector<Endpoint>> Resolve(std::string_view service) const override;

    // Sorted by name.
    std::vector<std::string> Services() const override;

private:
    std::map<std::string, std::vector<Endpoint>, std::less<>> table_;
};

} // namespace chroute::discovery
