#pragma once

/**
 * @file platform.hpp
 * @brief Platform probes supplying the raw text a device ID is derived from
 *
 * Each OS family has one canonical source:
 * - Windows: `wmic csproduct get UUID` (SMBIOS system product UUID)
 * - Apple: `ioreg -d2 -c IOPlatformExpertDevice` (includes IOPlatformUUID)
 * - Other: contents of /etc/machine-id
 *
 * The output is returned verbatim. It is hashed rather than parsed, so labels,
 * whitespace and trailing newlines are part of the hashed input.
 */

#include "deviceid/deviceid.hpp"

#include <string>

namespace deviceid {
namespace platform {

/// Operating system families with distinct identity sources
enum class Platform { Windows, Apple, Other };

/// Convert platform to string
[[nodiscard]] constexpr const char* platform_to_string(Platform platform) noexcept {
    switch (platform) {
        case Platform::Windows:
            return "windows";
        case Platform::Apple:
            return "apple";
        case Platform::Other:
            return "other";
    }
    return "other";
}

/// Platform family this binary was built for
[[nodiscard]] Platform detect_platform() noexcept;

/// Select the probe for a platform family
[[nodiscard]] ProbeFunction make_probe(Platform platform);

/// Run `wmic csproduct get UUID` and return its output
[[nodiscard]] Result<std::string> probe_windows();

/// Run `ioreg -d2 -c IOPlatformExpertDevice` and return its output
[[nodiscard]] Result<std::string> probe_apple();

/// Read /etc/machine-id
[[nodiscard]] Result<std::string> probe_machine_id();

/**
 * @brief Run a command and capture its standard output
 *
 * @param command Command line passed to the shell
 * @return The captured output, or ProbeError if the command could not be
 *         started or exited with a non-zero status
 */
[[nodiscard]] Result<std::string> run_command(const std::string& command);

/**
 * @brief Read a whole file
 *
 * @return The file content, or ProbeError if it cannot be opened or read
 */
[[nodiscard]] Result<std::string> read_source_file(const std::string& path);

}  // namespace platform
}  // namespace deviceid
