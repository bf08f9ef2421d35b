#pragma once

/**
 * @file deviceid.hpp
 * @brief Persistent machine identifier library
 *
 * Derives a stable identifier for the running machine from platform metadata,
 * condenses it with SHA-256 and caches it in a local file so the same value is
 * returned across process restarts.
 */

#include "deviceid/events.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace deviceid {

/// Library version
constexpr const char* VERSION = "0.1.0";

/// Default name of the identifier file
constexpr const char* DEFAULT_ID_FILE_NAME = ".device_id";

/// Application directory created under the user's home when no storage dir is set
constexpr const char* DEFAULT_STORAGE_SUBDIR = ".parity";

/// Length of a hex-encoded SHA-256 digest
constexpr std::size_t DEVICE_ID_LENGTH = 64;

/// Error codes returned by library operations
enum class ErrorCode {
    Success = 0,

    // Platform probe
    ProbeError,

    // Storage
    PathResolutionError,
    StorageError,
    FileNotFound,

    // Input validation
    InvalidFormatError,

    // Configuration files
    ConfigError,

    Unknown
};

/// Convert error code to string
[[nodiscard]] constexpr const char* error_code_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return "Success";
        case ErrorCode::ProbeError:
            return "Platform probe failed";
        case ErrorCode::PathResolutionError:
            return "Path resolution failed";
        case ErrorCode::StorageError:
            return "Storage error";
        case ErrorCode::FileNotFound:
            return "File not found";
        case ErrorCode::InvalidFormatError:
            return "Invalid device ID format";
        case ErrorCode::ConfigError:
            return "Configuration error";
        case ErrorCode::Unknown:
            return "Unknown error";
    }
    return "Unknown error";
}

/**
 * @brief Result type for operations that can fail
 * @tparam T The success value type
 */
template <typename T> class Result {
  public:
    /// Construct a success result
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        r.error_ = ErrorCode::Success;
        return r;
    }

    /// Construct an error result
    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    /// Check if the result is successful
    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }

    /// Check if the result is an error
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }

    /// Get the value (undefined behavior if is_error())
    [[nodiscard]] const T& value() const& { return *value_; }
    [[nodiscard]] T& value() & { return *value_; }
    [[nodiscard]] T&& value() && { return std::move(*value_); }

    /// Get the error code
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }

    /// Get the error message
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    std::optional<T> value_;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Specialization for void results
template <> class Result<void> {
  public:
    static Result ok() {
        Result r;
        r.error_ = ErrorCode::Success;
        return r;
    }

    static Result error(ErrorCode code, std::string message = "") {
        Result r;
        r.error_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const noexcept { return error_ == ErrorCode::Success; }
    [[nodiscard]] bool is_error() const noexcept { return error_ != ErrorCode::Success; }
    [[nodiscard]] ErrorCode error_code() const noexcept { return error_; }
    [[nodiscard]] const std::string& error_message() const noexcept { return error_message_; }

  private:
    Result() = default;
    ErrorCode error_ = ErrorCode::Unknown;
    std::string error_message_;
};

/// Source of the raw platform text that gets hashed into an identifier
using ProbeFunction = std::function<Result<std::string>()>;

/**
 * @brief Configuration for the identifier manager
 */
struct Config {
    /// Directory holding the identifier file (empty: ~/.parity)
    std::string storage_dir;

    /// Name of the identifier file (empty: .device_id)
    std::string id_file_name;

    /// Logging level name ("error", "info", ...) applied when the manager is constructed, empty to keep the current filter
    std::string log_level;
};

/**
 * @brief Load a configuration from a JSON file
 *
 * Recognized keys are "storage_dir", "id_file_name" and "log_level".
 * Missing keys keep their defaults.
 *
 * @param path Path to the JSON file
 * @return The parsed configuration, or ConfigError
 */
[[nodiscard]] Result<Config> load_config(const std::string& path);

/**
 * @brief Check that a string is a hex-encoded SHA-256 digest
 *
 * @return true iff @p s is 64 characters long and only contains [0-9a-f]
 */
[[nodiscard]] bool is_valid_sha256(const std::string& s) noexcept;

/**
 * @brief Generates, persists and verifies the identifier of this machine
 *
 * ## Basic Usage
 *
 * ```cpp
 * deviceid::Config config;
 * config.storage_dir = "/var/lib/myapp";
 *
 * deviceid::Manager manager(config);
 * auto result = manager.verify_device_id();
 * if (result.is_ok()) {
 *     std::cout << "Device ID: " << result.value() << std::endl;
 * }
 * ```
 *
 * verify_device_id() reuses the stored identifier when the file holds a well
 * formed value, and otherwise probes the platform, hashes the probe output and
 * overwrites the file.
 *
 * The identifier file is not locked. Concurrent first runs may both write it,
 * but they write the same value.
 */
class Manager {
  public:
    /// Construct a manager using the probe for the running platform
    explicit Manager(Config config);

    /// Construct a manager with a custom platform probe
    Manager(Config config, ProbeFunction probe);

    ~Manager();

    // Non-copyable
    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    // Movable
    Manager(Manager&&) noexcept;
    Manager& operator=(Manager&&) noexcept;

    /// Compute an identifier from the platform probe (no storage access)
    [[nodiscard]] Result<std::string> generate_device_id() const;

    /// Validate and persist an identifier
    [[nodiscard]] Result<void> save_device_id(const std::string& device_id);

    /// Return the stored identifier, generating and saving one if absent or corrupt
    [[nodiscard]] Result<std::string> verify_device_id();

    /// Full path of the identifier file
    [[nodiscard]] Result<std::string> get_device_id_path() const;

    /// Subscribe to manager events (see deviceid::events)
    EventSubscription on(const std::string& event, EventHandler handler);

    /// Get the configuration
    [[nodiscard]] const Config& config() const noexcept;

  private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace deviceid
