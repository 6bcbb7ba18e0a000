#include <chroute/discovery/service_discovery.h>

namespace chroute::discovery {

void InMemoryServiceDiscovery::Set(std::string service, std::vector<Endpoint> endpoints) {
    table_[std::move(service)] = std::move(endpoints);
}

bool InMemoryServiceDiscovery::Remove(std::string_view service) {
    auto it = table_.find(service);
    if (it == table_.end()) {
        return false;
    }
    table_.erase(it);
    return true;
}

chroute::Result<std::vector<Endpoint>> InMemoryServiceDiscovery::Resolve(std::string_view service) const {
    auto it = table_.find(service);
    if (it == table_.end()) {
        return chroute::Status(chroute::StatusCode::not_found, "service not found");
    }
    return it->second;
}

std::vector<std::string> InMemoryServiceDiscovery::Services() const {
    std::vector<std::string> out;
    out.reserve(table_.size());
    for (const auto& it : table_) {
        out.push_back(it.first);
    }
    return out;
}

} // namespace chroute::discovery
