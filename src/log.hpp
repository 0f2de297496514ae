#pragma once

// Library-wide spdlog logger.
// Internal header — not installed.

#include <spdlog/spdlog.h>

namespace xpoint_cpp::detail {

// The "xpoint_cpp" logger, created on first use with a colour console sink.
auto logger() -> spdlog::logger&;

}  // namespace xpoint_cpp::detail
