#pragma once

#include <string_view>
#include <utility>

#include <chlog/chlog.hpp>

#include <meshdest/core/status.h>

namespace meshdest::log {

// Accepted names: trace, debug, info, warn (or warning), error, critical, off.
// Anything else is invalid_argument.
Result<chlog::level> ParseLevel(std::string_view name);

// Thread-safe. The first call creates the console logger; later calls only
// change the level. An unknown level name leaves the level at info and says so.
void Init(std::string_view level);

// Thread-safe after Init(); always returns a valid logger.
chlog::logger& Get();

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

} // namespace meshdest::log
