#include <xpoint-cpp/config.hpp>

#include <cstdint>
#include <fstream>
#include <limits>
#include <optional>
#include <string>

namespace xpoint_cpp {

namespace {

auto config_error(const std::string& key, const std::string& reason) -> Error {
    return Error{ErrorKind::invalid_config, "config key '" + key + "': " + reason};
}

// Read an unsigned integer key into `out`, leaving it untouched when absent.
template <typename T>
auto read_unsigned(const nlohmann::json& j, const std::string& key, T& out) -> std::optional<Error> {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    if (!it->is_number_integer()) return config_error(key, "expected an integer");
    auto v = std::uint64_t{0};
    if (it->is_number_unsigned()) {
        v = it->get<std::uint64_t>();
    } else {
        auto signed_v = it->get<std::int64_t>();
        if (signed_v < 0) return config_error(key, "must not be negative");
        v = static_cast<std::uint64_t>(signed_v);
    }
    if (v > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        return config_error(key, "must be at most " + std::to_string(std::numeric_limits<T>::max()));
    }
    out = static_cast<T>(v);
    return std::nullopt;
}

}  // anonymous namespace

auto load_config(const nlohmann::json& j) -> Result<Config> {
    if (!j.is_object()) return Error{ErrorKind::invalid_config, "config must be a JSON object"};

    auto config = Config{};

    if (auto err = read_unsigned(j, "minimum_session_duration_seconds",
                                 config.minimum_session_duration_seconds)) {
        return *err;
    }
    if (auto err = read_unsigned(j, "max_document_depth", config.max_document_depth)) return *err;
    if (config.max_document_depth == 0) {
        return config_error("max_document_depth", "must be at least 1");
    }
    if (auto err = read_unsigned(j, "snapshot_deflate_threshold",
                                 config.snapshot_deflate_threshold)) {
        return *err;
    }

    if (auto it = j.find("log_level"); it != j.end()) {
        if (!it->is_string()) return config_error("log_level", "expected a string");
        auto level = parse_log_level(it->get<std::string>());
        if (!level) return config_error("log_level", "unknown level '" + it->get<std::string>() + "'");
        config.log_level = *level;
    }

    return config;
}

auto load_config_file(const std::filesystem::path& path) -> Result<Config> {
    auto in = std::ifstream{path};
    if (!in) return Error{ErrorKind::invalid_config, "cannot open " + path.string()};

    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) {
        return Error{ErrorKind::invalid_config, path.string() + " is not valid JSON"};
    }
    return load_config(j);
}

void apply_config(const Config& config) {
    set_log_level(config.log_level);
}

void to_json(nlohmann::json& j, const Config& config) {
    j = nlohmann::json{
        {"minimum_session_duration_seconds", config.minimum_session_duration_seconds},
        {"max_document_depth", config.max_document_depth},
        {"snapshot_deflate_threshold", config.snapshot_deflate_threshold},
        {"log_level", std::string{to_string_view(config.log_level)}},
    };
}

}  // namespace xpoint_cpp
