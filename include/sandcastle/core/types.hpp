/**
 * @file types.hpp
 * @brief Sandbox and task data model
 *
 * Plain value types passed between the record store, the lifecycle manager,
 * the task manager and the execution engine. Records handed out by the store
 * are snapshots: mutating a returned Sandbox never changes the stored one.
 *
 * **Sandbox lifecycle**:
 * ```
 * CREATING -> ACTIVE -> DESTROYING -> DESTROYED
 *     |
 *     +-> FAILED
 * ```
 * IDLE is never stored. An ACTIVE sandbox is reported as IDLE when its last
 * activity is older than the configured idle-report threshold.
 *
 * **Task lifecycle**:
 * ```
 * PENDING -> RUNNING -> {COMPLETED, FAILED, CANCELLED, TIMED_OUT}
 * PENDING -> {CANCELLED, TIMED_OUT}
 * ```
 *
 * @date 2025
 */

#pragma once

#include "sandcastle/core/errors.hpp"

#include <string>
#include <vector>
#include <set>
#include <optional>
#include <variant>
#include <chrono>
#include <cstdint>
#include <filesystem>

namespace sandcastle {
namespace core {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// ============================================================================
// SANDBOX
// ============================================================================

/**
 * @enum SandboxState
 * @brief Lifecycle state of a sandbox record
 */
enum class SandboxState {
    CREATING,    ///< Record inserted, container being created
    ACTIVE,      ///< Container live, accepting work
    IDLE,        ///< Reporting-only view of a quiet ACTIVE sandbox
    DESTROYING,  ///< Teardown in progress, rejects new work
    DESTROYED,   ///< Container removed, record kept for audit
    FAILED       ///< Creation failed or container lost
};

const char* SandboxStateToString(SandboxState state);
std::optional<SandboxState> ParseSandboxState(const std::string& text);

/// True for DESTROYED and FAILED
bool IsTerminal(SandboxState state);

/**
 * @struct ResourceLimits
 * @brief Per-sandbox resource ceilings
 */
struct ResourceLimits {
    std::size_t memory_limit_mb{1024};  ///< Memory ceiling (1GB)
    double cpu_limit{0.5};              ///< CPU share (half a core)
    int pids_limit{256};                ///< Process count ceiling
    std::uint64_t disk_budget_mb{512};  ///< Bytes accepted through uploads
};

/**
 * @struct VolumeMount
 * @brief Host directory bind-mounted into a sandbox
 */
struct VolumeMount {
    std::filesystem::path host_path;
    std::string container_path;
    bool read_only{false};
};

/**
 * @struct Sandbox
 * @brief One tracked isolated environment
 */
struct Sandbox {
    std::string id;                      ///< Stable identifier ("sbx-...")
    std::optional<std::string> name;     ///< Human-chosen name, unique among live sandboxes
    std::string owner{"root"};           ///< Caller charged for quota
    std::string image;                   ///< Container image
    std::string container_ref;           ///< Backing container id (empty while CREATING)
    std::string container_name;          ///< Backing container name
    SandboxState state{SandboxState::CREATING};

    TimePoint created_at;                ///< Record creation
    TimePoint last_active_at;            ///< Last operation against the sandbox
    std::optional<TimePoint> destroyed_at;

    ResourceLimits limits;
    std::string working_dir{"/app/results"};
    std::vector<VolumeMount> mounts;
    std::set<std::string> installed_packages;  ///< Advisory, not authoritative
    std::uint64_t disk_used_bytes{0};          ///< Charged by uploads
};

// ============================================================================
// TASKS
// ============================================================================

/**
 * @enum TaskKind
 * @brief Closed set of operations a task can perform
 */
enum class TaskKind {
    RUN_CODE,
    RUN_COMMAND,
    INSTALL_PACKAGES,
    UPLOAD_FILE,
    DOWNLOAD_FILE,
    LIST_DIRECTORY,
    PACKAGE_STATUS
};

const char* TaskKindToString(TaskKind kind);

/**
 * @enum TaskState
 * @brief Task lifecycle state, monotonic
 */
enum class TaskState {
    PENDING,
    RUNNING,
    COMPLETED,
    FAILED,
    CANCELLED,
    TIMED_OUT
};

const char* TaskStateToString(TaskState state);
bool IsTerminal(TaskState state);

// Requests ------------------------------------------------------------------

struct RunCodeRequest {
    std::string code;
    std::string language{"python"};
};

struct RunCommandRequest {
    std::string command;                     ///< Passed to `sh -c`
    std::optional<std::string> working_dir;  ///< Defaults to the sandbox working dir
};

struct InstallPackagesRequest {
    std::vector<std::string> packages;
    std::optional<std::string> index_url;    ///< Mirror override
};

struct UploadFileRequest {
    std::string destination;                             ///< Path inside the sandbox
    std::optional<std::string> content;                  ///< Inline bytes
    std::optional<std::filesystem::path> local_path;     ///< Or a host file
};

struct DownloadFileRequest {
    std::string path;
};

struct ListDirectoryRequest {
    std::string path{"."};
};

struct PackageStatusRequest {
    std::vector<std::string> packages;
};

using TaskRequest = std::variant<RunCodeRequest,
                                 RunCommandRequest,
                                 InstallPackagesRequest,
                                 UploadFileRequest,
                                 DownloadFileRequest,
                                 ListDirectoryRequest,
                                 PackageStatusRequest>;

TaskKind KindOf(const TaskRequest& request);

// Results -------------------------------------------------------------------

/**
 * @struct ExecOutput
 * @brief Captured result of a process run inside a sandbox
 *
 * A non-zero exit code is a successful task carrying a failure result.
 */
struct ExecOutput {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code{0};
    bool truncated{false};                  ///< Output exceeded the cap
    std::chrono::milliseconds duration{0};
};

struct PackageFailure {
    std::string name;
    std::string reason;
};

/**
 * @struct InstallReport
 * @brief Per-package outcome of an install batch
 */
struct InstallReport {
    std::vector<std::string> succeeded;
    std::vector<PackageFailure> failed;
    std::optional<std::string> index_url;

    bool Partial() const { return !succeeded.empty() && !failed.empty(); }
};

struct UploadReport {
    std::string path;            ///< Resolved absolute path
    std::uint64_t bytes_written{0};
    std::string sha256;
};

struct FileContent {
    std::string path;
    std::string content;
    std::uint64_t size{0};
    std::string sha256;
};

struct DirectoryEntry {
    std::string name;
    bool is_directory{false};
    std::uint64_t size{0};
    TimePoint modified;
};

struct DirectoryListing {
    std::string path;
    std::vector<DirectoryEntry> entries;
};

struct PackageInfo {
    std::string name;
    bool installed{false};
    std::optional<std::string> version;
};

struct PackageStatusReport {
    std::vector<PackageInfo> packages;
};

using TaskOutput = std::variant<std::monostate,
                                ExecOutput,
                                InstallReport,
                                UploadReport,
                                FileContent,
                                DirectoryListing,
                                PackageStatusReport>;

/**
 * @struct TaskError
 * @brief Failure captured on a task record
 */
struct TaskError {
    ErrorCode code{ErrorCode::INTERNAL};
    std::string message;
    ErrorContext context;
};

/**
 * @struct TaskStatus
 * @brief Snapshot of a task as returned by poll and await
 */
struct TaskStatus {
    std::string id;
    std::string owner;                  ///< Sandbox id
    TaskKind kind{TaskKind::RUN_CODE};
    TaskState state{TaskState::PENDING};

    TimePoint submitted_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> finished_at;
    TimePoint deadline;

    std::optional<TaskOutput> output;   ///< Set when COMPLETED
    std::optional<TaskError> error;     ///< Set when FAILED, CANCELLED or TIMED_OUT
};

} // namespace core
} // namespace sandcastle
