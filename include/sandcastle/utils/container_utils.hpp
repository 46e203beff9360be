/**
 * @file container_utils.hpp
 * @brief Container runtime client: interface and docker CLI implementation
 *
 * The lifecycle manager and execution engine talk to containers only through
 * ContainerRuntime. DockerRuntime drives the `docker` command-line client;
 * tests substitute an in-memory runtime.
 *
 * **Failure mapping** (all thrown as core::SandboxException):
 * - daemon unreachable, docker binary missing: RUNTIME_UNAVAILABLE
 * - container no longer exists or is not running: CONTAINER_GONE
 * - path missing on CopyIn/CopyOut (container still running): NOT_FOUND
 * - CopyOut of a file larger than CopyOptions::max_bytes: QUOTA_EXCEEDED
 * - exec or copy past its timeout: EXECUTION_TIMEOUT
 * - exec or copy stopped through should_stop: CANCELLED
 *
 * A failing exec is only attributed to the runtime once docker confirms it
 * (Ping/Inspect); the same text printed by the command inside the container
 * is returned as an ordinary non-zero exit.
 *
 * @date 2025
 */

#pragma once

#include "sandcastle/utils/process_utils.hpp"

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <chrono>
#include <cstdint>
#include <functional>

namespace sandcastle {
namespace utils {

/**
 * @enum ContainerState
 * @brief Container lifecycle states as reported by the runtime
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    PAUSED,    ///< Container paused
    EXITED,    ///< Container exited
    DEAD,      ///< Container is dead
    UNKNOWN    ///< Unknown state
};

/**
 * @struct BindMount
 * @brief Host directory mounted into a container
 */
struct BindMount {
    std::filesystem::path host_path;
    std::string container_path;
    bool read_only{false};
};

/**
 * @struct ContainerSpec
 * @brief Everything needed to create and start one sandbox container
 */
struct ContainerSpec {
    // Basic Settings
    std::string name;                           ///< Container name
    std::string image{"python-sandbox:latest"}; ///< Base image
    std::vector<std::string> command;           ///< Overrides the image CMD when set

    // Resource Limits
    std::size_t memory_limit_mb{1024};          ///< Memory limit (swap pinned to the same value)
    double cpu_limit{0.5};                      ///< CPU share
    int pids_limit{256};                        ///< Process limit

    // Network and Security
    std::string network_mode{"bridge"};         ///< "none", "bridge", or a named network
    std::vector<std::string> capabilities_drop{"ALL"};
    bool no_new_privileges{true};

    // Filesystem
    std::vector<BindMount> mounts;
    std::string working_dir{"/app/results"};

    std::map<std::string, std::string> labels;           ///< Used to find managed containers
    std::map<std::string, std::string> environment_vars;
};

/**
 * @struct ContainerInfo
 * @brief Container metadata from inspect or list
 */
struct ContainerInfo {
    std::string id;
    std::string name;
    std::string image;
    ContainerState state{ContainerState::UNKNOWN};
    std::map<std::string, std::string> labels;
    std::chrono::system_clock::time_point created_at;
};

/**
 * @struct ExecOptions
 * @brief Limits for one exec inside a container
 */
struct ExecOptions {
    std::chrono::milliseconds timeout{0};      ///< 0 = no deadline
    std::size_t max_output_bytes{0};           ///< Per stream, 0 = unlimited
    std::string working_dir;                   ///< Empty = container default
    std::optional<std::string> stdin_data;
    std::function<bool()> should_stop;
};

/**
 * @struct CopyOptions
 * @brief Limits for one file copy into or out of a container
 */
struct CopyOptions {
    std::chrono::milliseconds timeout{0};      ///< 0 = runtime's control timeout
    std::uint64_t max_bytes{0};                ///< CopyOut only, 0 = unlimited
    std::function<bool()> should_stop;
};

/**
 * @struct ContainerExecResult
 * @brief Result of command execution in container
 */
struct ContainerExecResult {
    int exit_code{0};              ///< Exit code of the command
    std::string stdout_output;     ///< Standard output
    std::string stderr_output;     ///< Standard error
    bool truncated{false};         ///< Output cap reached
    std::chrono::milliseconds duration{0};  ///< Execution duration
};

/**
 * @class ContainerRuntime
 * @brief Narrow interface over a container runtime
 *
 * Implementations must be safe to call from several threads at once.
 */
class ContainerRuntime {
public:
    virtual ~ContainerRuntime() = default;

    /// Runtime reachable
    virtual bool Ping() = 0;

    /// Create and start a container, returning its id
    virtual std::string CreateContainer(const ContainerSpec& spec) = 0;

    /// Force-remove. Returns false when the container did not exist.
    virtual bool RemoveContainer(const std::string& container_ref) = 0;

    virtual ContainerExecResult Exec(const std::string& container_ref,
                                     const std::vector<std::string>& command,
                                     const ExecOptions& options) = 0;

    /// Write @p content to @p path, creating parent directories
    virtual void CopyIn(const std::string& container_ref,
                        const std::string& path,
                        const std::string& content,
                        const CopyOptions& options) = 0;

    /// Read a regular file
    virtual std::string CopyOut(const std::string& container_ref,
                                const std::string& path,
                                const CopyOptions& options) = 0;

    virtual std::optional<ContainerInfo> Inspect(const std::string& container_ref) = 0;

    /// Containers carrying @p label ("key" or "key=value"), running or not
    virtual std::vector<ContainerInfo> ListContainers(const std::string& label) = 0;
};

/**
 * @class DockerRuntime
 * @brief ContainerRuntime over the docker command-line client
 *
 * Every call spawns one `docker` process through ProcessUtils; arguments are
 * passed as argv, never through a shell.
 *
 * **Usage Example**:
 * @code
 * DockerRuntime docker;
 * ContainerSpec spec;
 * spec.name = "sandcastle-sbx-1a2b3c";
 * spec.labels["sandcastle.managed"] = "true";
 *
 * auto id = docker.CreateContainer(spec);
 * auto result = docker.Exec(id, {"python", "-c", "print(1+1)"}, {});
 * docker.RemoveContainer(id);
 * @endcode
 */
class DockerRuntime : public ContainerRuntime {
public:
    explicit DockerRuntime(std::string docker_binary = "docker",
                           std::chrono::milliseconds control_timeout = std::chrono::seconds(60));
    ~DockerRuntime() override = default;

    bool Ping() override;
    std::string CreateContainer(const ContainerSpec& spec) override;
    bool RemoveContainer(const std::string& container_ref) override;
    ContainerExecResult Exec(const std::string& container_ref,
                             const std::vector<std::string>& command,
                             const ExecOptions& options) override;
    void CopyIn(const std::string& container_ref,
                const std::string& path,
                const std::string& content,
                const CopyOptions& options) override;
    std::string CopyOut(const std::string& container_ref,
                        const std::string& path,
                        const CopyOptions& options) override;
    std::optional<ContainerInfo> Inspect(const std::string& container_ref) override;
    std::vector<ContainerInfo> ListContainers(const std::string& label) override;

    /**
     * @brief Build `docker run` arguments (without the binary)
     */
    static std::vector<std::string> BuildRunCommand(const ContainerSpec& spec);

    /**
     * @brief Parse `docker inspect` JSON (array or single object)
     * @throws nlohmann::json::exception on malformed input
     */
    static ContainerInfo ParseInspectOutput(const std::string& json_str);

    /**
     * @brief Parse one `docker ps --format '{{json .}}'` line
     */
    static ContainerInfo ParseListLine(const std::string& line);

    static ContainerState ParseState(const std::string& state_str);

    /**
     * @brief Parse "k=v,k2=v2" label lists from `docker ps`
     */
    static std::map<std::string, std::string> ParseLabels(const std::string& labels);

private:
    ProcessResult RunDocker(const std::vector<std::string>& args,
                            const ProcessOptions& options) const;
    ProcessResult RunDocker(const std::vector<std::string>& args) const;

    /// Inspect confirms the container exists and is running
    bool IsRunning(const std::string& container_ref);

    /// Map a failed or interrupted `docker cp` onto the failure codes above
    void CheckCopy(const ProcessResult& result, const std::string& container_ref,
                   const std::string& path, std::chrono::milliseconds timeout);

    std::string docker_binary_;
    std::chrono::milliseconds control_timeout_;
};

} // namespace utils
} // namespace sandcastle
