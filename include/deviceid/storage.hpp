#pragma once

/**
 * @file storage.hpp
 * @brief Persistence of the device identifier file
 */

#include "deviceid/deviceid.hpp"

#include <filesystem>
#include <string>

namespace deviceid {

/**
 * @brief Read/write access to a single identifier file
 *
 * The file holds exactly the 64-character identifier with no trailing
 * newline. It is created with owner-only permissions (0600) and missing
 * parent directories are created owner-only (0700).
 */
class FileStore {
  public:
    /**
     * @brief Construct a store for an identifier file
     *
     * @param path Full path of the identifier file
     */
    explicit FileStore(std::filesystem::path path);

    /**
     * @brief Resolve the identifier file path for a configuration
     *
     * Uses config.storage_dir verbatim when set, otherwise <home>/.parity.
     * The file name is config.id_file_name, or .device_id when empty.
     *
     * @return The path, or PathResolutionError if the home directory is needed
     *         but cannot be determined
     */
    [[nodiscard]] static Result<std::filesystem::path> resolve_path(const Config& config);

    /**
     * @brief Current user's home directory
     *
     * HOME on Unix-like systems, USERPROFILE on Windows. An unset or empty
     * variable is a PathResolutionError.
     */
    [[nodiscard]] static Result<std::filesystem::path> home_directory();

    /**
     * @brief Read the raw file content
     *
     * @return The content, FileNotFound if the file does not exist, or
     *         StorageError for any other failure
     */
    [[nodiscard]] Result<std::string> read() const;

    /**
     * @brief Replace the file content with an identifier
     *
     * The value is validated before anything is touched on disk.
     *
     * @return InvalidFormatError for a malformed identifier, StorageError if
     *         the directory or file cannot be written
     */
    [[nodiscard]] Result<void> write(const std::string& device_id);

    /// Path of the identifier file
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  private:
    Result<void> ensure_directory() const;

    std::filesystem::path path_;
};

}  // namespace deviceid
