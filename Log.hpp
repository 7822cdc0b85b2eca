// Log.hpp
//
// Leveled logging for the core and host. Lines go to stderr through fmt,
// prefixed with the level and the emitting component, e.g.
//   [warn] [AudioGraphSync] connect failed for c1: node gone
#pragma once
#include <fmt/core.h>
#include <string>
#include <utility>

namespace BlockFlow {
namespace log {

enum class Level { Trace = 0, Debug, Info, Warn, Error, Off };

void setLevel(Level level);
Level level();
bool enabled(Level level);
Level parseLevel(const std::string& name);
void write(Level level, const char* component, const std::string& message);

template <typename... Args>
void trace(const char* component, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Trace)) write(Level::Trace, component, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void debug(const char* component, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Debug)) write(Level::Debug, component, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void info(const char* component, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Info)) write(Level::Info, component, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void warn(const char* component, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Warn)) write(Level::Warn, component, fmt::format(f, std::forward<Args>(args)...));
}

template <typename... Args>
void error(const char* component, fmt::format_string<Args...> f, Args&&... args) {
    if (enabled(Level::Error)) write(Level::Error, component, fmt::format(f, std::forward<Args>(args)...));
}

} // namespace log
} // namespace BlockFlow
