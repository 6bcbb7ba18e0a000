#include <chroute/config/config.h>

#include <fstream>
#include <sstream>

namespace chroute::config {

namespace {

const char* ErrorCodeToString(chjson::error_code code) {
    switch (code) {
        case chjson::error_code::ok: return "ok";
        case chjson::error_code::unexpected_eof: return "unexpected_eof";
        case chjson::error_code::invalid_value: return "invalid_value";
        case chjson::error_code::invalid_number: return "invalid_number";
        case chjson::error_code::invalid_string: return "invalid_string";
        case chjson::error_code::invalid_escape: return "invalid_escape";
        case chjson::error_code::invalid_unicode_escape: return "invalid_unicode_escape";
        case chjson::error_code::invalid_utf16_surrogate: return "invalid_utf16_surrogate";
        case chjson::error_code::expected_colon: return "expected_colon";
        case chjson::error_code::expected_comma_or_end: return "expected_comma_or_end";
        case chjson::error_code::expected_key_string: return "expected_key_string";
        case chjson::error_code::trailing_characters: return "trailing_characters";
        case chjson::error_code::nesting_too_deep: return "nesting_too_deep";
        case chjson::error_code::out_of_memory: return "out_of_memory";
    }
    return "unknown";
}

std::string FormatParseError(const chjson::error& e) {
    std::ostringstream oss;
    oss << "invalid json: " << ErrorCodeToString(e.code)
        << " at line " << e.line << ", col " << e.column;
    return oss.str();
}

} // namespace

chroute::Result<Config> Config::LoadFile(std::string path) {
    std::ifstream ifs(path);
    if (!ifs.is_open()) {
        return chroute::Status(chroute::StatusCode::not_found, "config file not found: " + path);
    }

    std::ostringstream ss;
    ss << ifs.rdbuf();
    return LoadString(ss.str());
}

chroute::Result<Config> Config::LoadString(std::string text) {
    auto r = chjson::parse(text);
    if (r.err) {
        return chroute::Status(chroute::StatusCode::invalid_argument, FormatParseError(r.err));
    }

    if (!r.doc.root().is_object()) {
        return chroute::Status(chroute::StatusCode::invalid_argument, "config root must be a JSON object");
    }

    Config c;
    c.doc_ = std::move(r.doc);
    return c;
}

bool Config::Has(std::string_view key) const {
    return doc_.root().find(key) != nullptr;
}

chroute::Result<std::string> Config::GetString(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return chroute::Status(chroute::StatusCode::not_found, "missing key");
    }
    if (!v->is_string()) {
        return chroute::Status(chroute::StatusCode::invalid_argument, "not a string");
    }
    return std::string(v->as_string_view());
}

chroute::Result<int> Config::GetInt(std::string_view key) const {
    const auto* v = doc_.root().find(key);
    if (v == nullptr) {
        return chroute::Status(chroute::StatusCode::not_found, "missing key");
    }
    if (!v->is_number() || !v->is_int()) {
        return chroute::Status(chroute::StatusCode::invalid_argument, "not an int");
    }
    return static_cast<int>(v->as_int());
}

chroute::Result<balancer::RouterOptions> LoadRouterOptions(const Config& config) {
    balancer::RouterOptions options;

    if (config.Has("strategy")) {
        auto name = config.GetString("strategy");
        if (!name.ok()) {
            return chroute::Status(chroute::StatusCode::invalid_argument, "strategy: " + name.status().message());
        }
        auto kind = balancer::ParseStrategyKind(name.value());
        if (!kind.ok()) {
            return kind.status();
        }
        options.strategy = kind.value();
    }

    if (config.Has("log_level")) {
        auto level = config.GetString("log_level");
        if (!level.ok()) {
            return chroute::Status(chroute::StatusCode::invalid_argument, "log_level: " + level.status().message());
        }
        options.log_level = std::move(level).value();
    }

    return options;
}

} // namespace chroute::config
