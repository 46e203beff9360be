/**
 * @file process_utils.hpp
 * @brief Host process execution with captured output, deadlines and cancellation
 *
 * Runs an argv vector (no shell) with separate stdout/stderr pipes and an
 * optional stdin payload. Output beyond the cap is drained and discarded so
 * the child never blocks on a full pipe. The child is SIGKILLed when the
 * deadline passes or the stop predicate turns true.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <chrono>
#include <cstddef>

namespace sandcastle {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief Execution limits for a host process
 */
struct ProcessOptions {
    std::chrono::milliseconds timeout{0};      ///< 0 = no deadline
    std::size_t max_output_bytes{0};           ///< Per stream, 0 = unlimited
    std::optional<std::string> stdin_data;     ///< Written then closed; stdin is /dev/null otherwise
    std::function<bool()> should_stop;         ///< Polled every ~50ms
};

/**
 * @struct ProcessResult
 * @brief Outcome of a host process
 */
struct ProcessResult {
    int exit_code{-1};             ///< Exit status, or 128+signal when signalled
    std::string stdout_output;
    std::string stderr_output;
    bool truncated{false};         ///< Either stream hit max_output_bytes
    bool timed_out{false};         ///< Killed at the deadline
    bool cancelled{false};         ///< Killed because should_stop() returned true
    std::string launch_error;      ///< Non-empty when the program could not be started
    std::chrono::milliseconds duration{0};

    bool Launched() const { return launch_error.empty(); }
};

/**
 * @class ProcessUtils
 * @brief fork/execvp based process runner
 *
 * @code
 * ProcessOptions options;
 * options.timeout = std::chrono::seconds(5);
 * auto result = ProcessUtils::Run({"docker", "ps", "-q"}, options);
 * if (!result.Launched()) { ... }
 * @endcode
 */
class ProcessUtils {
public:
    /**
     * @brief Run @p argv to completion (or deadline/cancellation)
     *
     * Never throws for child failures; those are reported in ProcessResult.
     * @throws std::runtime_error if pipes or fork cannot be created
     */
    static ProcessResult Run(const std::vector<std::string>& argv, const ProcessOptions& options = {});
};

} // namespace utils
} // namespace sandcastle
