/// @file config.hpp
/// @brief Library configuration loaded from JSON.

#pragma once

#include <xpoint-cpp/error.hpp>
#include <xpoint-cpp/logging.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace xpoint_cpp {

/// Tunables for ingestion, document loading and index snapshots.
///
/// @code
/// {
///   "minimum_session_duration_seconds": 120,
///   "max_document_depth": 256,
///   "snapshot_deflate_threshold": 256,
///   "log_level": "info"
/// }
/// @endcode
struct Config {
    /// Reading sessions shorter than this are dropped on ingestion.
    std::int64_t minimum_session_duration_seconds{120};
    /// Element nesting limit when loading document fragments.
    std::size_t max_document_depth{256};
    /// Index snapshots with a larger body are DEFLATE-compressed.
    std::size_t snapshot_deflate_threshold{256};
    /// Library logger threshold.
    LogLevel log_level{LogLevel::info};

    auto operator==(const Config&) const -> bool = default;
};

/// Read a Config from a JSON object. Missing keys keep their defaults,
/// unknown keys are ignored.
/// @return The config, or invalid_config naming the offending key.
auto load_config(const nlohmann::json& j) -> Result<Config>;

/// Read a Config from a JSON file.
auto load_config_file(const std::filesystem::path& path) -> Result<Config>;

/// Apply process-wide settings (currently the log level).
void apply_config(const Config& config);

/// Serialize a Config to JSON.
void to_json(nlohmann::json& j, const Config& config);

}  // namespace xpoint_cpp
