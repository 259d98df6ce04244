#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <iostream>
#include <mutex>

#include "colors.hpp"

namespace hilex {
namespace log {

namespace {

Level level_from_env() {
    const char* env = std::getenv("HILEX_LOG");
    if (!env) return Level::WARN;
    return parse_level(env, Level::WARN);
}

std::atomic<Level>& current_level() {
    static std::atomic<Level> lvl{level_from_env()};
    return lvl;
}

// one whole line at a time
std::mutex& output_mutex() {
    static std::mutex m;
    return m;
}

const std::string& level_color(Level lvl) {
    switch (lvl) {
        case Level::ERROR:
            return Color::bright_red;
        case Level::WARN:
            return Color::yellow;
        case Level::INFO:
            return Color::green;
        case Level::DEBUG:
            return Color::cyan;
        default:
            return Color::bright_black;
    }
}

}  // namespace

Level level() {
    return current_level().load(std::memory_order_relaxed);
}

void set_level(Level lvl) {
    current_level().store(lvl, std::memory_order_relaxed);
}

Level parse_level(const std::string& name, Level fallback) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c) { return std::tolower(c); });
    if (n == "off" || n == "none") return Level::OFF;
    if (n == "error") return Level::ERROR;
    if (n == "warn" || n == "warning") return Level::WARN;
    if (n == "info") return Level::INFO;
    if (n == "debug") return Level::DEBUG;
    if (n == "trace") return Level::TRACE;
    return fallback;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Level::OFF:
            return "off";
        case Level::ERROR:
            return "error";
        case Level::WARN:
            return "warn";
        case Level::INFO:
            return "info";
        case Level::DEBUG:
            return "debug";
        case Level::TRACE:
            return "trace";
    }
    return "?";
}

void write(Level lvl, const std::string& message) {
    static const bool use_color = Color::supports_color();
    std::lock_guard<std::mutex> lock(output_mutex());
    if (use_color) {
        std::cerr << level_color(lvl) << "[hilex " << level_name(lvl) << "]" << Color::reset << " " << message << "\n";
    } else {
        std::cerr << "[hilex " << level_name(lvl) << "] " << message << "\n";
    }
}

}  // namespace log
}  // namespace hilex
