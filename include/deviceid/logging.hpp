#pragma once

/**
 * @file logging.hpp
 * @brief Control of the Boost.Log severity filter used by the library
 *
 * Levels: 0 fatal, 1 error, 2 warning, 3 info, 4 debug, 5 trace.
 */

#include <string>

namespace deviceid {

/// Set the global logging level (0 fatal .. 5 trace)
void set_logging_level(unsigned int level);

/// Current logging level
[[nodiscard]] unsigned int get_logging_level();

/// Map a level name ("fatal", "error", "warning", "info", "debug", "trace") to its number
[[nodiscard]] unsigned int level_string_to_number(const std::string& level);

/// Name of a logging level
[[nodiscard]] std::string get_string_logging_level(unsigned int level);

}  // namespace deviceid
