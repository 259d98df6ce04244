#pragma once

#include <sstream>
#include <string>
#include <utility>

// Leveled diagnostics written to stderr.
// The initial level comes from the HILEX_LOG environment variable
// ("off", "error", "warn", "info", "debug", "trace"); default is "warn".
namespace hilex {
namespace log {

enum class Level {
    OFF,
    ERROR,
    WARN,
    INFO,
    DEBUG,
    TRACE
};

Level level();
void set_level(Level lvl);

// Parses a level name (case-insensitive). Unknown names yield `fallback`.
Level parse_level(const std::string& name, Level fallback);
const char* level_name(Level lvl);

inline bool enabled(Level lvl) {
    return lvl != Level::OFF && static_cast<int>(lvl) <= static_cast<int>(level());
}

void write(Level lvl, const std::string& message);

template <typename... Args>
void emit(Level lvl, Args&&... args) {
    if (!enabled(lvl)) return;
    std::ostringstream ss;
    (ss << ... << std::forward<Args>(args));
    write(lvl, ss.str());
}

template <typename... Args>
void error(Args&&... args) { emit(Level::ERROR, std::forward<Args>(args)...); }
template <typename... Args>
void warn(Args&&... args) { emit(Level::WARN, std::forward<Args>(args)...); }
template <typename... Args>
void info(Args&&... args) { emit(Level::INFO, std::forward<Args>(args)...); }
template <typename... Args>
void debug(Args&&... args) { emit(Level::DEBUG, std::forward<Args>(args)...); }
template <typename... Args>
void trace(Args&&... args) { emit(Level::TRACE, std::forward<Args>(args)...); }

}  // namespace log
}  // namespace hilex
