#include <chroute/discovery/endpoint.h>

#include <charconv>
#include <string>
#include <vector>

namespace chroute::discovery {

const std::string* Endpoint::Metadata(std::string_view key) const {
    auto it = metadata.find(std::string(key));
    if (it == metadata.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string BuildServiceUrl(const Endpoint& endpoint, std::string_view path) {
    std::string url = endpoint.secure ? "https://" : "http://";
    url.append(endpoint.host);
    url.push_back(':');
    url.append(std::to_string(endpoint.port));

    if (!path.empty()) {
        if (path.front() != '/') {
            url.push_back('/');
        }
        url.append(path);
    }
    return url;
}

std::string MakeInstanceId(std::string_view service, std::string_view host, std::uint16_t port) {
    std::string id(service);
    id.push_back(':');
    id.append(host);
    id.push_back(':');
    id.append(std::to_string(port));
    return id;
}

chroute::Result<InstanceIdParts> ParseInstanceId(std::string_view id) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = id.find(':', start);
        if (pos == std::string_view::npos) {
            parts.push_back(id.substr(start));
            break;
        }
        parts.push_back(id.substr(start, pos - start));
        start = pos + 1;
    }

    if (parts.size() < 3) {
        return chroute::Status(chroute::StatusCode::invalid_argument, "instance id must be service:host:port");
    }

    auto port_sv = parts[2];
    std::uint16_t port = 0;
    auto [ptr, ec] = std::from_chars(port_sv.data(), port_sv.data() + port_sv.size(), port);
    if (port_sv.empty() || ec != std::errc() || ptr != port_sv.data() + port_sv.size()) {
        return chroute::Status(chroute::StatusCode::invalid_argument, "invalid port in instance id");
    }

    InstanceIdParts out;
    out.service = std::string(parts[0]);
    out.host = std::string(parts[1]);
    out.port = port;
    return out;
}

} // namespace chroute::discovery
