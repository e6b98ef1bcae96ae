/**
 * @file Log.cpp
 * @brief Implementation of the diagnostic stream
 */

#include "treelink/Log.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace treelink::log {

namespace {
    Level g_level = Level::Warning;
    std::ostream* g_sink = nullptr;

    std::string to_lower(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return std::tolower(c); });
        return s;
    }
}

void set_level(Level level) noexcept { g_level = level; }

Level level() noexcept { return g_level; }

void set_sink(std::ostream* sink) noexcept { g_sink = sink; }

Level parse_level(const std::string& name) {
    const std::string lower = to_lower(name);
    if (lower == "debug") return Level::Debug;
    if (lower == "info") return Level::Info;
    if (lower == "warning" || lower == "warn") return Level::Warning;
    if (lower == "error") return Level::Error;
    if (lower == "off") return Level::Off;
    throw std::invalid_argument("Unknown log level: " + name);
}

const char* level_name(Level level) noexcept {
    switch (level) {
        case Level::Debug: return "debug";
        case Level::Info: return "info";
        case Level::Warning: return "warning";
        case Level::Error: return "error";
        case Level::Off: return "off";
    }
    return "unknown";
}

Line::~Line() {
    if (!enabled_) return;
    std::ostream& out = g_sink ? *g_sink : std::cerr;
    out << "[treelink] " << level_name(level_) << ": " << buffer_.str() << '\n';
}

} // namespace treelink::log
