#pragma once

#include <format>
#include <string_view>
#include <utility>

#include <chlog/chlog.hpp>

namespace chroute::log {

// Thread-safe. Safe to call more than once; later calls only change the level.
void Init(std::string_view level);

// Thread-safe after Init(); always returns a valid logger.
chlog::logger& Get();

// Unknown names map to info.
chlog::level ParseLevel(std::string_view level);

// Thread-safe. True when a message at `level` passes the level set by Init().
bool Enabled(chlog::level level) noexcept;

template <class... Args>
inline void debug(std::format_string<Args...> fmt, Args&&... args) {
    Get().debug(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void info(std::format_string<Args...> fmt, Args&&... args) {
    Get().info(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void warn(std::format_string<Args...> fmt, Args&&... args) {
    Get().warn(fmt, std::forward<Args>(args)...);
}

template <class... Args>
inline void error(std::format_string<Args...> fmt, Args&&... args) {
    Get().error(fmt, std::forward<Args>(args)...);
}

} // namespace chroute::log
