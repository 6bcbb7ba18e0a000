#include <chroute/core/status.h>

namespace chroute {

std::string_view StatusCodeName(StatusCode code) {
    switch (code) {
        case StatusCode::ok: return "ok";
        case StatusCode::invalid_argument: return "invalid_argument";
        case StatusCode::not_found: return "not_found";
        case StatusCode::unavailable: return "unavailable";
        case StatusCode::internal_error: return "internal_error";
    }
    return "unknown";
}

std::string Status::ToString() const {
    std::string out(StatusCodeName(code_));
    if (!message_.empty()) {
        out.append(": ");
        out.append(message_);
    }
    return out;
}

} // namespace chroute
