/**
 * @file config.hpp
 * @brief Engine configuration: defaults, JSON loading, environment overrides
 *
 * **Example file**:
 * ```json
 * {
 *   "runtime":   { "default_image": "python-sandbox:latest", "network_mode": "bridge" },
 *   "lifecycle": { "max_sandboxes": 20, "max_sandboxes_per_owner": 3, "idle_threshold_seconds": 3600 },
 *   "tasks":     { "worker_count": 8, "default_timeout_ms": 60000 },
 *   "execution": { "max_output_bytes": 1048576, "index_url": "https://pypi.org/simple/" },
 *   "logging":   { "level": "info", "log_file": "sandcastle.log" }
 * }
 * ```
 * Missing keys keep their defaults. Unknown keys are logged and ignored.
 *
 * **Environment overrides** (applied after the file):
 * - SANDCASTLE_DOCKER            runtime.docker_binary
 * - SANDCASTLE_IMAGE             runtime.default_image
 * - SANDCASTLE_LOG_LEVEL         logging.level
 * - SANDCASTLE_PYPI_INDEX_URL    execution.index_url
 *
 * @date 2025
 */

#pragma once

#include "sandcastle/core/types.hpp"
#include "sandcastle/utils/logger.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <chrono>

namespace sandcastle {
namespace core {

/**
 * @struct RuntimeConfig
 * @brief How sandbox containers are created
 */
struct RuntimeConfig {
    std::string docker_binary{"docker"};
    std::string default_image{"python-sandbox:latest"};
    std::vector<std::string> container_command{"sleep", "infinity"};  ///< Keeps the container alive
    std::string container_prefix{"sandcastle-"};
    std::string label{"sandcastle.managed"};       ///< Marks containers this engine owns
    std::string working_dir{"/app/results"};
    std::string network_mode{"bridge"};
    ResourceLimits default_limits;
    bool mount_host_directory{false};              ///< Bind a per-sandbox host dir at working_dir
    std::filesystem::path data_root{"data"};
    std::chrono::seconds control_timeout{60};      ///< Limit for create/remove/cp calls
};

/**
 * @struct LifecycleConfig
 * @brief Quotas, retries and reclamation
 */
struct LifecycleConfig {
    std::size_t max_sandboxes{20};                 ///< Global live sandbox ceiling
    std::size_t max_sandboxes_per_owner{3};
    std::string default_owner{"root"};

    int retry_attempts{3};                         ///< RuntimeUnavailable retries on create/destroy
    std::chrono::milliseconds retry_backoff{200};  ///< Doubles per attempt

    std::chrono::seconds idle_threshold{3600};     ///< 0 disables idle reclamation
    std::chrono::seconds idle_report_threshold{300};  ///< ACTIVE listed as IDLE past this
    std::chrono::seconds reclaim_interval{60};
    std::chrono::seconds destroyed_retention{600};

    std::string destroy_policy{"grace"};           ///< "grace" (wait, then cancel) or "cancel"
    std::chrono::milliseconds destroy_grace_period{5000};

    bool reset_all_containers{false};              ///< Remove every managed container at startup
    bool destroy_on_shutdown{false};
};

/**
 * @struct TaskConfig
 * @brief Worker pool and task retention
 */
struct TaskConfig {
    std::size_t worker_count{4};
    std::size_t max_pending_tasks{256};
    std::chrono::milliseconds default_timeout{60000};
    std::chrono::seconds result_retention{600};
    std::chrono::milliseconds maintenance_interval{500};
};

/**
 * @struct InterpreterSpec
 * @brief How code for one language is run
 */
struct InterpreterSpec {
    std::vector<std::string> command;   ///< Script path is appended
    std::string extension;              ///< Scratch file extension
};

/**
 * @struct ExecutionConfig
 * @brief Operation limits and in-sandbox tooling
 */
struct ExecutionConfig {
    std::size_t max_output_bytes{1024 * 1024};     ///< Per stream
    std::uint64_t max_download_bytes{64ull * 1024 * 1024};
    std::string scratch_dir{"/tmp"};
    std::map<std::string, InterpreterSpec> interpreters{
        {"python", {{"python"}, ".py"}},
        {"python3", {{"python3"}, ".py"}},
        {"bash", {{"bash"}, ".sh"}},
        {"sh", {{"sh"}, ".sh"}},
        {"node", {{"node"}, ".js"}},
    };
    std::vector<std::string> install_command{"uv", "pip", "install", "--system"};
    std::vector<std::string> list_packages_command{"pip", "list", "--format=json"};
    std::string index_url{"https://pypi.org/simple/"};  ///< Empty = installer default
};

/**
 * @struct EngineConfig
 * @brief Complete configuration
 */
struct EngineConfig {
    RuntimeConfig runtime;
    LifecycleConfig lifecycle;
    TaskConfig tasks;
    ExecutionConfig execution;
    utils::LoggingConfig logging;
};

/**
 * @brief Overlay a parsed JSON document onto @p config
 * @throws SandboxException(INVALID_ARGUMENT) on type mismatches or invalid values
 */
void ApplyJson(EngineConfig& config, const nlohmann::json& document);

/**
 * @brief Defaults, then @p path (if it exists), then environment
 *
 * A missing file is not an error; it is logged and defaults are used.
 * @throws SandboxException(INVALID_ARGUMENT) for unreadable or malformed files
 */
EngineConfig LoadConfig(const std::optional<std::filesystem::path>& path);

void ApplyEnvironmentOverrides(EngineConfig& config);

/**
 * @brief Reject inconsistent values (zero workers, unknown destroy policy, ...)
 * @throws SandboxException(INVALID_ARGUMENT)
 */
void ValidateConfig(const EngineConfig& config);

nlohmann::json ConfigToJson(const EngineConfig& config);

} // namespace core
} // namespace sandcastle
