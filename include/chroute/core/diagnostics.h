#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace chroute {

enum class Severity {
    debug = 0,
    info,
    warn,
    error,
};

// Sink for diagnostics emitted while selecting endpoints. Injected into the
// router and the strategies so that callers decide where messages go.
class IDiagnostics {
public:
    virtual ~IDiagnostics() = default;

    // Thread-safe. Must not throw: the router emits from its fallback path.
    virtual void Emit(Severity severity, std::string_view message) noexcept = 0;

    // Callers check this before building an expensive message.
    virtual bool Enabled(Severity) const noexcept { return true; }

    void Debug(std::string_view message) noexcept { Emit(Severity::debug, message); }
    void Info(std::string_view message) noexcept { Emit(Severity::info, message); }
    void Warn(std::string_view message) noexcept { Emit(Severity::warn, message); }
    void Error(std::string_view message) noexcept { Emit(Severity::error, message); }
};

// Forwards to chroute::log; enabled per the level given to log::Init().
class LogDiagnostics final : public IDiagnostics {
public:
    void Emit(Severity severity, std::string_view message) noexcept override;
    bool Enabled(Severity severity) const noexcept override;
};

class NullDiagnostics final : public IDiagnostics {
public:
    void Emit(Severity, std::string_view) noexcept override {}
    bool Enabled(Severity) const noexcept override { return false; }
};

// Process-wide LogDiagnostics instance (Thread-safe)
std::shared_ptr<IDiagnostics> DefaultDiagnostics();

} // namespace chroute
