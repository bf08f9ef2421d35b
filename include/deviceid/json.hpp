#pragma once

/**
 * @file json.hpp
 * @brief JSON serialization of the manager configuration
 *
 * Uses nlohmann/json for reading configuration files.
 */

#include "deviceid/deviceid.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <utility>

namespace deviceid {
namespace json {

using nlohmann::json;

/// Configuration keys
constexpr const char* KEY_STORAGE_DIR = "storage_dir";
constexpr const char* KEY_ID_FILE_NAME = "id_file_name";
constexpr const char* KEY_LOG_LEVEL = "log_level";

// Read an optional string member; null or missing leaves target unchanged
[[nodiscard]] inline bool read_string(const json& j, const char* key, std::string& target) {
    if (!j.contains(key) || j[key].is_null()) {
        return true;
    }
    if (!j[key].is_string()) {
        return false;
    }
    target = j[key].get<std::string>();
    return true;
}

/// Parse Config from a JSON object
[[nodiscard]] inline Result<Config> parse_config(const json& j) {
    if (!j.is_object()) {
        return Result<Config>::error(ErrorCode::ConfigError,
                                     "configuration must be a JSON object");
    }

    Config config;
    const std::pair<const char*, std::string*> fields[] = {
        {KEY_STORAGE_DIR, &config.storage_dir},
        {KEY_ID_FILE_NAME, &config.id_file_name},
        {KEY_LOG_LEVEL, &config.log_level},
    };

    for (const auto& [key, target] : fields) {
        if (!read_string(j, key, *target)) {
            return Result<Config>::error(ErrorCode::ConfigError,
                                         std::string("\"") + key + "\" must be a string");
        }
    }

    return Result<Config>::ok(std::move(config));
}

/// Convert Config to a JSON object (empty fields are omitted)
[[nodiscard]] inline json config_to_json(const Config& config) {
    json j = json::object();
    if (!config.storage_dir.empty()) {
        j[KEY_STORAGE_DIR] = config.storage_dir;
    }
    if (!config.id_file_name.empty()) {
        j[KEY_ID_FILE_NAME] = config.id_file_name;
    }
    if (!config.log_level.empty()) {
        j[KEY_LOG_LEVEL] = config.log_level;
    }
    return j;
}

}  // namespace json
}  // namespace deviceid
