#include <chroute/core/diagnostics.h>

#include <chroute/core/log.h>

#include <exception>
#include <iostream>

namespace chroute {
namespace {

chlog::level ToLogLevel(Severity severity) {
    switch (severity) {
        case Severity::debug: return chlog::level::debug;
        case Severity::info: return chlog::level::info;
        case Severity::warn: return chlog::level::warn;
        case Severity::error: return chlog::level::error;
    }
    return chlog::level::info;
}

} // namespace

void LogDiagnostics::Emit(Severity severity, std::string_view message) noexcept {
    try {
        switch (severity) {
            case Severity::debug:
                log::debug("{}", message);
                return;
            case Severity::info:
                log::info("{}", message);
                return;
            case Severity::warn:
                log::warn("{}", message);
                return;
            case Severity::error:
                log::error("{}", message);
                return;
        }
    } catch (const std::exception& e) {
        std::cerr << "chroute: log write failed: " << e.what() << ": " << message << "\n";
    }
}

bool LogDiagnostics::Enabled(Severity severity) const noexcept {
    return log::Enabled(ToLogLevel(severity));
}

std::shared_ptr<IDiagnostics> DefaultDiagnostics() {
    static const std::shared_ptr<IDiagnostics> diagnostics = std::make_shared<LogDiagnostics>();
    return diagnostics;
}

} // namespace chroute
