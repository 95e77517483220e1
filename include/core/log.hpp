// log.hpp - Leveled console logging for rustimport
// Part of rustimport - on-demand native extension builds
//
// Messages go to stderr. The minimum level is process-wide and is set once
// by the front-end (-v / -q); library code only emits. The stream-style
// macros build the message only when its level is enabled, so debug
// records cost nothing in normal runs.
//
// Usage:
//   RUSTIMPORT_LOG_DEBUG("Building in temporary directory " << path);
//   RUSTIMPORT_LOG_INFO("Cargo exited with code " << code << ".");

#ifndef RUSTIMPORT_LOG_HPP
#define RUSTIMPORT_LOG_HPP

#include <sstream>
#include <string>
#include <string_view>

namespace rustimport::log {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warning = 2,
    Error = 3,
    Critical = 4,
    Off = 5
};

const char* level_name(LogLevel level);

// Parses "debug", "info", "warning", "error", "critical" or "off".
// Unknown names map to Info.
LogLevel parse_level(std::string_view name);

void set_level(LogLevel level);
LogLevel level();

inline bool enabled(LogLevel lvl) {
    return static_cast<int>(lvl) >= static_cast<int>(level());
}

// Writes one already formatted record.
void write(LogLevel level, const std::string& message);

} // namespace rustimport::log

#define RUSTIMPORT_LOG_AT(lvl, expr)                                       \
    do {                                                                   \
        if (::rustimport::log::enabled(lvl)) {                             \
            std::ostringstream rustimport_log_oss_;                        \
            rustimport_log_oss_ << expr;                                   \
            ::rustimport::log::write(lvl, rustimport_log_oss_.str());      \
        }                                                                  \
    } while (0)

#define RUSTIMPORT_LOG_DEBUG(expr) RUSTIMPORT_LOG_AT(::rustimport::log::LogLevel::Debug, expr)
#define RUSTIMPORT_LOG_INFO(expr) RUSTIMPORT_LOG_AT(::rustimport::log::LogLevel::Info, expr)
#define RUSTIMPORT_LOG_WARN(expr) RUSTIMPORT_LOG_AT(::rustimport::log::LogLevel::Warning, expr)
#define RUSTIMPORT_LOG_ERROR(expr) RUSTIMPORT_LOG_AT(::rustimport::log::LogLevel::Error, expr)
#define RUSTIMPORT_LOG_CRITICAL(expr) RUSTIMPORT_LOG_AT(::rustimport::log::LogLevel::Critical, expr)

#endif // RUSTIMPORT_LOG_HPP
