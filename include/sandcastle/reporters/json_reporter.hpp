/**
 * @file json_reporter.hpp
 * @brief JSON views of sandboxes, task statuses and operation results
 *
 * Used by the command-line front end to print machine-readable output and by
 * anything else that needs a wire representation of engine objects. Timestamps
 * are ISO 8601 UTC, durations are milliseconds, error codes use their stable
 * lowercase names.
 *
 * @date 2025
 */

#pragma once

#include "sandcastle/core/types.hpp"
#include "sandcastle/core/errors.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <chrono>

namespace sandcastle {
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief Output formatting
 */
struct JsonReporterConfig {
    bool pretty_print{true};          ///< Pretty print JSON
    int indent_size{2};               ///< Indentation spaces
    bool include_file_content{true};  ///< Put downloaded bytes into FileContent views
};

/**
 * @class JsonReporter
 * @brief Converts engine objects to nlohmann::json
 *
 * **Usage Example**:
 * @code
 * JsonReporter reporter;
 * std::cout << reporter.Render(reporter.SandboxToJson(sandbox)) << std::endl;
 * @endcode
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = {});

    nlohmann::json SandboxToJson(const core::Sandbox& sandbox) const;
    nlohmann::json SandboxesToJson(const std::vector<core::Sandbox>& sandboxes) const;

    nlohmann::json TaskStatusToJson(const core::TaskStatus& status) const;

    /// One result alternative; monostate renders as null
    nlohmann::json OutputToJson(const core::TaskOutput& output) const;

    nlohmann::json ErrorToJson(const core::TaskError& error) const;
    nlohmann::json ExceptionToJson(const core::SandboxException& error) const;

    /**
     * @brief Serialize, replacing invalid UTF-8 (binary file content)
     */
    std::string Render(const nlohmann::json& document) const;

    /// ISO 8601 UTC ("2025-01-31T12:00:00Z")
    static std::string FormatTimestamp(const core::TimePoint& time);

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace sandcastle
