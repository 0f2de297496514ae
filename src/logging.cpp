#include <xpoint-cpp/logging.hpp>

#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <memory>

namespace xpoint_cpp {

namespace {

auto to_spdlog(LogLevel level) -> spdlog::level::level_enum {
    switch (level) {
        case LogLevel::trace:    return spdlog::level::trace;
        case LogLevel::debug:    return spdlog::level::debug;
        case LogLevel::info:     return spdlog::level::info;
        case LogLevel::warn:     return spdlog::level::warn;
        case LogLevel::error:    return spdlog::level::err;
        case LogLevel::critical: return spdlog::level::critical;
        case LogLevel::off:      return spdlog::level::off;
    }
    return spdlog::level::info;
}

auto from_spdlog(spdlog::level::level_enum level) -> LogLevel {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::trace;
        case spdlog::level::debug:    return LogLevel::debug;
        case spdlog::level::info:     return LogLevel::info;
        case spdlog::level::warn:     return LogLevel::warn;
        case spdlog::level::err:      return LogLevel::error;
        case spdlog::level::critical: return LogLevel::critical;
        default:                      return LogLevel::off;
    }
}

auto make_logger() -> std::shared_ptr<spdlog::logger> {
    auto sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("xpoint_cpp", sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // anonymous namespace

auto detail::logger() -> spdlog::logger& {
    static auto instance = make_logger();
    return *instance;
}

auto parse_log_level(std::string_view name) -> std::optional<LogLevel> {
    if (name == "trace") return LogLevel::trace;
    if (name == "debug") return LogLevel::debug;
    if (name == "info") return LogLevel::info;
    if (name == "warn" || name == "warning") return LogLevel::warn;
    if (name == "error") return LogLevel::error;
    if (name == "critical") return LogLevel::critical;
    if (name == "off") return LogLevel::off;
    return std::nullopt;
}

void set_log_level(LogLevel level) {
    detail::logger().set_level(to_spdlog(level));
}

auto log_level() -> LogLevel {
    return from_spdlog(detail::logger().level());
}

}  // namespace xpoint_cpp
