#include <chroute/core/log.h>

#include <atomic>
#include <memory>
#include <mutex>

namespace chroute::log {
namespace {

std::once_flag g_once;
std::unique_ptr<chlog::logger> g_logger;
std::atomic<chlog::level> g_level{chlog::level::info};

void CreateLogger() {
    chlog::logger_config cfg;
    cfg.name = "chroute";
    cfg.level = chlog::level::info;
    cfg.pattern = "[{date} {time}.{ms}][{lvl}][tid={tid}] {msg}";
    cfg.async.enabled = false;
    cfg.parallel_sinks = false;

    g_logger = std::make_unique<chlog::logger>(std::move(cfg));
    g_logger->add_sink(std::make_shared<chlog::console_sink>(chlog::console_sink::style::color));
}

} // namespace

chlog::level ParseLevel(std::string_view level) {
    if (level == "trace") return chlog::level::trace;
    if (level == "debug") return chlog::level::debug;
    if (level == "info") return chlog::level::info;
    if (level == "warn" || level == "warning") return chlog::level::warn;
    if (level == "error") return chlog::level::error;
    if (level == "critical") return chlog::level::critical;
    if (level == "off") return chlog::level::off;
    return chlog::level::info;
}

void Init(std::string_view level) {
    std::call_once(g_once, CreateLogger);
    auto lvl = ParseLevel(level);
    g_logger->set_level(lvl);
    g_level.store(lvl, std::memory_order_relaxed);
}

bool Enabled(chlog::level level) noexcept {
    auto current = g_level.load(std::memory_order_relaxed);
    if (current == chlog::level::off || level == chlog::level::off) {
        return false;
    }
    return static_cast<int>(level) >= static_cast<int>(current);
}

chlog::logger& Get() {
    std::call_once(g_once, CreateLogger);
    return *g_logger;
}

} // namespace chroute::log
