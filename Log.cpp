// Log.cpp
#include "Log.hpp"
#include <atomic>
#include <cstdio>
#include <stdexcept>

namespace BlockFlow {
namespace log {

namespace {
std::atomic<int> currentLevel{static_cast<int>(Level::Info)};

const char* levelTag(Level level) {
    switch (level) {
        case Level::Trace: return "trace";
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warn: return "warn";
        case Level::Error: return "error";
        case Level::Off: return "off";
    }
    return "?";
}
} // namespace

void setLevel(Level level) { currentLevel.store(static_cast<int>(level)); }

Level level() { return static_cast<Level>(currentLevel.load()); }

bool enabled(Level l) {
    return l != Level::Off && static_cast<int>(l) >= currentLevel.load();
}

Level parseLevel(const std::string& name) {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "info") return Level::Info;
    if (name == "warn" || name == "warning") return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "off") return Level::Off;
    throw std::invalid_argument("Unknown log level: " + name);
}

void write(Level l, const char* component, const std::string& message) {
    fmt::print(stderr, "[{}] [{}] {}\n", levelTag(l), component, message);
}

} // namespace log
} // namespace BlockFlow
