/// @file logging.hpp
/// @brief Log level control for the library's internal logger.

#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace xpoint_cpp {

/// Severity threshold for library log output.
enum class LogLevel : std::uint8_t {
    trace,
    debug,
    info,
    warn,
    error,
    critical,
    off,
};

/// Convert a LogLevel to its string representation.
constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::trace:    return "trace";
        case LogLevel::debug:    return "debug";
        case LogLevel::info:     return "info";
        case LogLevel::warn:     return "warn";
        case LogLevel::error:    return "error";
        case LogLevel::critical: return "critical";
        case LogLevel::off:      return "off";
    }
    return "unknown";
}

/// Parse a level name ("trace" ... "off"); "warning" is accepted for warn.
auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/// Set the threshold of the library logger.
void set_log_level(LogLevel level);

/// Current threshold of the library logger.
auto log_level() -> LogLevel;

}  // namespace xpoint_cpp
