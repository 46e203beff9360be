/**
 * @file execution_engine.hpp
 * @brief Sandbox operations (code, commands, packages, files) run as tasks
 *
 * Every operation is a TaskRequest variant alternative. Submit() validates the
 * request, pins the sandbox ACTIVE while the task is queued, and hands the
 * task manager a closure that dispatches on the request kind. Results come
 * back as TaskOutput alternatives on the task record.
 *
 * **Failure rules**:
 * - a process exiting non-zero is a COMPLETED task with that exit code
 * - a partially failed install is a COMPLETED task with per-package results
 * - a vanished container fails the task with CONTAINER_GONE and marks the
 *   sandbox FAILED
 *
 * @date 2025
 */

#pragma once

#include "sandcastle/core/types.hpp"
#include "sandcastle/core/config.hpp"
#include "sandcastle/core/lifecycle_manager.hpp"
#include "sandcastle/core/task_manager.hpp"
#include "sandcastle/utils/container_utils.hpp"

#include <string>
#include <vector>
#include <memory>
#include <chrono>

namespace sandcastle {
namespace core {

/**
 * @class ExecutionEngine
 * @brief Runs operations inside sandboxes through the task manager
 *
 * **Usage Example**:
 * @code
 * ExecutionEngine engine(config, lifecycle, tasks, runtime);
 *
 * // Asynchronous
 * auto task_id = engine.Submit("s1", RunCodeRequest{"print(1+1)"}, std::chrono::seconds(10));
 * auto status = engine.Await(task_id, std::chrono::seconds(10));
 *
 * // Synchronous
 * auto output = engine.RunCommand("s1", RunCommandRequest{"ls -la"});
 * @endcode
 */
class ExecutionEngine {
public:
    ExecutionEngine(const EngineConfig& config,
                    LifecycleManager& lifecycle,
                    TaskManager& tasks,
                    std::shared_ptr<utils::ContainerRuntime> runtime);
    ~ExecutionEngine() = default;

    ExecutionEngine(const ExecutionEngine&) = delete;
    ExecutionEngine& operator=(const ExecutionEngine&) = delete;

    // ========================================================================
    // Task API
    // ========================================================================

    /**
     * @brief Queue an operation against a sandbox
     *
     * @param timeout Task deadline; 0 uses the configured default
     * @return Task id, PENDING
     * @throws SandboxException NOT_FOUND, SANDBOX_NOT_ACTIVE, INVALID_ARGUMENT,
     *         PATH_CONFLICT, QUOTA_EXCEEDED
     */
    std::string Submit(const std::string& sandbox, const TaskRequest& request,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    TaskStatus Poll(const std::string& task_id) const { return tasks_.Poll(task_id); }

    TaskStatus Await(const std::string& task_id, std::chrono::milliseconds timeout) {
        return tasks_.Await(task_id, timeout);
    }

    bool Cancel(const std::string& task_id) { return tasks_.Cancel(task_id); }
    bool Acknowledge(const std::string& task_id) { return tasks_.Acknowledge(task_id); }

    // ========================================================================
    // Synchronous conveniences: submit, await, collect
    // ========================================================================

    ExecOutput RunCode(const std::string& sandbox, const RunCodeRequest& request,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    ExecOutput RunCommand(const std::string& sandbox, const RunCommandRequest& request,
                          std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    InstallReport InstallPackages(const std::string& sandbox, const InstallPackagesRequest& request,
                                  std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    UploadReport UploadFile(const std::string& sandbox, const UploadFileRequest& request,
                            std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    FileContent DownloadFile(const std::string& sandbox, const DownloadFileRequest& request,
                             std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    DirectoryListing ListDirectory(const std::string& sandbox, const ListDirectoryRequest& request,
                                   std::chrono::milliseconds timeout = std::chrono::milliseconds(0));
    PackageStatusReport PackageStatus(const std::string& sandbox, const PackageStatusRequest& request,
                                      std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /**
     * @brief Reject malformed requests before anything is queued
     * @throws SandboxException INVALID_ARGUMENT
     */
    void ValidateRequest(const TaskRequest& request) const;

private:
    template <typename Output>
    Output RunSync(const std::string& sandbox, const TaskRequest& request,
                   std::chrono::milliseconds timeout);

    /// Resolve @p path against the working dir or throw PATH_CONFLICT
    std::string ConfinePath(const Sandbox& sandbox, const std::string& path) const;

    TaskOutput Dispatch(const std::string& sandbox_id, const TaskRequest& request,
                        CancellationToken& token);

    ExecOutput DoRunCode(const Sandbox& sandbox, const RunCodeRequest& request, CancellationToken& token);
    ExecOutput DoRunCommand(const Sandbox& sandbox, const RunCommandRequest& request, CancellationToken& token);
    InstallReport DoInstallPackages(const Sandbox& sandbox, const InstallPackagesRequest& request,
                                    CancellationToken& token);
    UploadReport DoUploadFile(const Sandbox& sandbox, const UploadFileRequest& request, CancellationToken& token);
    FileContent DoDownloadFile(const Sandbox& sandbox, const DownloadFileRequest& request, CancellationToken& token);
    DirectoryListing DoListDirectory(const Sandbox& sandbox, const ListDirectoryRequest& request,
                                     CancellationToken& token);
    PackageStatusReport DoPackageStatus(const Sandbox& sandbox, const PackageStatusRequest& request,
                                        CancellationToken& token);

    utils::ContainerExecResult Exec(const Sandbox& sandbox, const std::vector<std::string>& command,
                                    const std::string& working_dir, CancellationToken& token);

    /// Copy limits bounded by the task's deadline and cancellation
    static utils::CopyOptions CopyLimits(CancellationToken& token, std::uint64_t max_bytes = 0);

    ExecutionConfig config_;
    std::chrono::milliseconds default_timeout_;
    LifecycleManager& lifecycle_;
    TaskManager& tasks_;
    std::shared_ptr<utils::ContainerRuntime> runtime_;
};

} // namespace core
} // namespace sandcastle
