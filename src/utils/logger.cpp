/**
 * @file logger.cpp
 * @brief Console and rotating-file sinks for the default logger
 *
 * @date 2025
 */

#include "sandcastle/utils/logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

#include <vector>
#include <memory>

namespace sandcastle {
namespace utils {

std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& name) {
    if (name == "trace") return spdlog::level::trace;
    if (name == "debug") return spdlog::level::debug;
    if (name == "info") return spdlog::level::info;
    if (name == "warn" || name == "warning") return spdlog::level::warn;
    if (name == "error") return spdlog::level::err;
    if (name == "critical") return spdlog::level::critical;
    if (name == "off") return spdlog::level::off;
    return std::nullopt;
}

void InitLogger(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    if (config.console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }
    if (!config.log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.log_file, config.max_file_size, config.backup_count));
    }

    auto logger = std::make_shared<spdlog::logger>("sandcastle", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    auto level = ParseLogLevel(config.level);
    spdlog::set_level(level.value_or(spdlog::level::info));
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");

    if (!level) {
        spdlog::warn("Unknown log level '{}', using info", config.level);
    }
}

} // namespace utils
} // namespace sandcastle
