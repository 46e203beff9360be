/**
 * @file logger.hpp
 * @brief spdlog setup for the sandcastle process
 *
 * @date 2025
 */

#pragma once

#include <spdlog/spdlog.h>

#include <string>
#include <cstddef>
#include <optional>

namespace sandcastle {
namespace utils {

/**
 * @struct LoggingConfig
 * @brief Log sinks and verbosity
 */
struct LoggingConfig {
    std::string level{"info"};              ///< trace, debug, info, warn, error, critical, off
    std::string log_file;                   ///< Empty = console only
    std::size_t max_file_size{10 * 1024 * 1024};  ///< Rotate at 10MB
    std::size_t backup_count{5};            ///< Rotated files kept
    bool console{true};                     ///< Colored stderr sink
};

/**
 * @brief Parse a level name, nullopt when unknown
 */
std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& name);

/**
 * @brief Install the "sandcastle" default logger
 *
 * Console output goes to stderr so JSON written by the CLI to stdout stays
 * machine-readable. Calling again replaces the previous logger.
 */
void InitLogger(const LoggingConfig& config);

} // namespace utils
} // namespace sandcastle
