// log.cpp - Leveled console logging
// Part of rustimport - on-demand native extension builds

#include "core/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace rustimport::log {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_write_mutex;

} // namespace

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

LogLevel parse_level(std::string_view name) {
    if (name == "debug" || name == "DEBUG") return LogLevel::Debug;
    if (name == "info" || name == "INFO") return LogLevel::Info;
    if (name == "warning" || name == "WARNING" || name == "warn") return LogLevel::Warning;
    if (name == "error" || name == "ERROR") return LogLevel::Error;
    if (name == "critical" || name == "CRITICAL") return LogLevel::Critical;
    if (name == "off" || name == "OFF") return LogLevel::Off;
    return LogLevel::Info;
}

void set_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel level() {
    return static_cast<LogLevel>(g_level.load());
}

void write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(g_write_mutex);
    std::cerr << level_name(level) << ":rustimport: " << message << "\n";
}

} // namespace rustimport::log
