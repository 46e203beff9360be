/**
 * @file execution_engine.cpp
 * @brief Implementation of sandbox operations
 *
 * @date 2025
 */

#include "sandcastle/core/execution_engine.hpp"
#include "sandcastle/core/errors.hpp"
#include "sandcastle/utils/string_utils.hpp"
#include "sandcastle/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sandcastle {
namespace core {

namespace {

constexpr std::size_t kFailureReasonLength = 500;
constexpr std::chrono::seconds kCleanupTimeout{10};

ExecOutput ToOutput(const utils::ContainerExecResult& result) {
    ExecOutput output;
    output.stdout_output = result.stdout_output;
    output.stderr_output = result.stderr_output;
    output.exit_code = result.exit_code;
    output.truncated = result.truncated;
    output.duration = result.duration;
    return output;
}

std::string FailureReason(const utils::ContainerExecResult& result) {
    auto text = utils::StringUtils::Trim(result.stderr_output.empty() ? result.stdout_output
                                                                      : result.stderr_output);
    if (text.empty()) {
        return "exit code " + std::to_string(result.exit_code);
    }
    return utils::StringUtils::Tail(text, kFailureReasonLength);
}

/**
 * @brief Parse one `find -printf '%y\t%s\t%T@\t%f\n'` line
 */
std::optional<DirectoryEntry> ParseFindLine(const std::string& line) {
    auto first = line.find('\t');
    auto second = first == std::string::npos ? first : line.find('\t', first + 1);
    auto third = second == std::string::npos ? second : line.find('\t', second + 1);
    if (third == std::string::npos) {
        return std::nullopt;
    }

    DirectoryEntry entry;
    entry.is_directory = line.substr(0, first) == "d";
    entry.name = line.substr(third + 1);
    try {
        entry.size = std::stoull(line.substr(first + 1, second - first - 1));
        double seconds = std::stod(line.substr(second + 1, third - second - 1));
        entry.modified = TimePoint(std::chrono::duration_cast<Clock::duration>(
            std::chrono::duration<double>(seconds)));
    }
    catch (const std::logic_error& e) {
        spdlog::debug("Unparseable listing line '{}': {}", line, e.what());
        return std::nullopt;
    }
    return entry;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

ExecutionEngine::ExecutionEngine(const EngineConfig& config,
                                 LifecycleManager& lifecycle,
                                 TaskManager& tasks,
                                 std::shared_ptr<utils::ContainerRuntime> runtime)
    : config_(config.execution)
    , default_timeout_(config.tasks.default_timeout)
    , lifecycle_(lifecycle)
    , tasks_(tasks)
    , runtime_(std::move(runtime)) {
    if (!runtime_) {
        throw SandboxException(ErrorCode::INVALID_ARGUMENT, "Execution engine needs a container runtime");
    }
}

// ============================================================================
// VALIDATION
// ============================================================================

void ExecutionEngine::ValidateRequest(const TaskRequest& request) const {
    auto invalid = [&request](const std::string& message) {
        return SandboxException(ErrorCode::INVALID_ARGUMENT, message,
                                ErrorContext{"", "", TaskKindToString(KindOf(request))});
    };
    auto check_packages = [&invalid](const std::vector<std::string>& packages) {
        if (packages.empty()) {
            throw invalid("No packages given");
        }
        for (const auto& package : packages) {
            if (!utils::StringUtils::IsValidPackageSpec(package)) {
                throw invalid("Invalid package specification: '" + package + "'");
            }
        }
    };

    if (const auto* run = std::get_if<RunCodeRequest>(&request)) {
        if (run->code.empty()) {
            throw invalid("No code given");
        }
        if (!config_.interpreters.count(utils::StringUtils::ToLower(run->language))) {
            throw invalid("Unsupported language: " + run->language);
        }
    } else if (const auto* command = std::get_if<RunCommandRequest>(&request)) {
        if (utils::StringUtils::Trim(command->command).empty()) {
            throw invalid("No command given");
        }
    } else if (const auto* install = std::get_if<InstallPackagesRequest>(&request)) {
        check_packages(install->packages);
        if (install->index_url &&
            !utils::StringUtils::StartsWith(*install->index_url, "https://") &&
            !utils::StringUtils::StartsWith(*install->index_url, "http://")) {
            throw invalid("Index URL must be http(s): " + *install->index_url);
        }
    } else if (const auto* upload = std::get_if<UploadFileRequest>(&request)) {
        if (upload->destination.empty()) {
            throw invalid("No destination path given");
        }
        if (upload->content.has_value() == upload->local_path.has_value()) {
            throw invalid("Upload needs exactly one of inline content or a local file");
        }
    } else if (const auto* download = std::get_if<DownloadFileRequest>(&request)) {
        if (download->path.empty()) {
            throw invalid("No path given");
        }
    } else if (const auto* status = std::get_if<PackageStatusRequest>(&request)) {
        check_packages(status->packages);
    }
}

std::string ExecutionEngine::ConfinePath(const Sandbox& sandbox, const std::string& path) const {
    auto resolved = utils::StringUtils::ResolveInside(sandbox.working_dir, path.empty() ? "." : path);
    if (!resolved) {
        spdlog::warn("Rejected path '{}' outside {} of sandbox {}", path, sandbox.working_dir, sandbox.id);
        throw SandboxException(ErrorCode::PATH_CONFLICT,
                               "Path '" + path + "' resolves outside " + sandbox.working_dir,
                               ErrorContext{sandbox.id, "", ""});
    }
    return *resolved;
}

// ============================================================================
// SUBMISSION
// ============================================================================

std::string ExecutionEngine::Submit(const std::string& sandbox, const TaskRequest& request,
                                    std::chrono::milliseconds timeout) {
    ValidateRequest(request);
    const TaskKind kind = KindOf(request);

    // Held until the task is queued so the sandbox cannot start DESTROYING
    // between the state check and the enqueue.
    auto guard = lifecycle_.AcquireActive(sandbox);
    const std::string sandbox_id = guard.Id();
    lifecycle_.Touch(sandbox_id);

    // Preflight: reject before anything is read or written
    if (const auto* upload = std::get_if<UploadFileRequest>(&request)) {
        ConfinePath(guard.Get(), upload->destination);
        if (upload->content) {
            const auto budget = guard.Get().limits.disk_budget_mb * 1024ull * 1024ull;
            if (guard.Get().disk_used_bytes + upload->content->size() > budget) {
                throw SandboxException(ErrorCode::QUOTA_EXCEEDED,
                                       "Upload would exceed the disk budget of " +
                                           std::to_string(guard.Get().limits.disk_budget_mb) + "MB",
                                       ErrorContext{sandbox_id, "", TaskKindToString(kind)});
            }
        }
    } else if (const auto* download = std::get_if<DownloadFileRequest>(&request)) {
        ConfinePath(guard.Get(), download->path);
    } else if (const auto* listing = std::get_if<ListDirectoryRequest>(&request)) {
        ConfinePath(guard.Get(), listing->path);
    } else if (const auto* command = std::get_if<RunCommandRequest>(&request)) {
        if (command->working_dir) {
            ConfinePath(guard.Get(), *command->working_dir);
        }
    }

    if (timeout.count() <= 0) {
        timeout = default_timeout_;
    }

    auto task_id = tasks_.Submit(sandbox_id, kind,
                                 [this, sandbox_id, request](CancellationToken& token) {
                                     return Dispatch(sandbox_id, request, token);
                                 },
                                 timeout);

    spdlog::info("Queued {} {} on sandbox {}", TaskKindToString(kind), task_id, sandbox_id);
    return task_id;
}

template <typename Output>
Output ExecutionEngine::RunSync(const std::string& sandbox, const TaskRequest& request,
                                std::chrono::milliseconds timeout) {
    auto task_id = Submit(sandbox, request, timeout);
    auto status = tasks_.Await(task_id, timeout.count() > 0 ? timeout : default_timeout_);
    if (!tasks_.Acknowledge(task_id)) {
        spdlog::debug("Task {} was not terminal when collected", task_id);
    }

    if (status.state == TaskState::COMPLETED && status.output) {
        if (const auto* output = std::get_if<Output>(&*status.output)) {
            return *output;
        }
    }
    if (status.error) {
        throw SandboxException(status.error->code, status.error->message, status.error->context);
    }
    throw SandboxException(ErrorCode::INTERNAL,
                           "Task ended " + std::string(TaskStateToString(status.state)) + " without a result",
                           ErrorContext{status.owner, status.id, TaskKindToString(status.kind)});
}

ExecOutput ExecutionEngine::RunCode(const std::string& sandbox, const RunCodeRequest& request,
                                    std::chrono::milliseconds timeout) {
    return RunSync<ExecOutput>(sandbox, request, timeout);
}

ExecOutput ExecutionEngine::RunCommand(const std::string& sandbox, const RunCommandRequest& request,
                                       std::chrono::milliseconds timeout) {
    return RunSync<ExecOutput>(sandbox, request, timeout);
}

InstallReport ExecutionEngine::InstallPackages(const std::string& sandbox,
                                               const InstallPackagesRequest& request,
                                               std::chrono::milliseconds timeout) {
    return RunSync<InstallReport>(sandbox, request, timeout);
}

UploadReport ExecutionEngine::UploadFile(const std::string& sandbox, const UploadFileRequest& request,
                                         std::chrono::milliseconds timeout) {
    return RunSync<UploadReport>(sandbox, request, timeout);
}

FileContent ExecutionEngine::DownloadFile(const std::string& sandbox, const DownloadFileRequest& request,
                                          std::chrono::milliseconds timeout) {
    return RunSync<FileContent>(sandbox, request, timeout);
}

DirectoryListing ExecutionEngine::ListDirectory(const std::string& sandbox,
                                                const ListDirectoryRequest& request,
                                                std::chrono::milliseconds timeout) {
    return RunSync<DirectoryListing>(sandbox, request, timeout);
}

PackageStatusReport ExecutionEngine::PackageStatus(const std::string& sandbox,
                                                   const PackageStatusRequest& request,
                                                   std::chrono::milliseconds timeout) {
    return RunSync<PackageStatusReport>(sandbox, request, timeout);
}

// ============================================================================
// DISPATCH
// ============================================================================

TaskOutput ExecutionEngine::Dispatch(const std::string& sandbox_id, const TaskRequest& request,
                                     CancellationToken& token) {
    token.ThrowIfStopped();

    auto sandbox = lifecycle_.GetSandbox(sandbox_id);
    if (sandbox.state != SandboxState::ACTIVE && sandbox.state != SandboxState::IDLE) {
        throw SandboxException(ErrorCode::SANDBOX_NOT_ACTIVE,
                               "Sandbox is " + std::string(SandboxStateToString(sandbox.state)),
                               ErrorContext{sandbox_id, "", TaskKindToString(KindOf(request))});
    }
    lifecycle_.Touch(sandbox_id);

    try {
        switch (KindOf(request)) {
            case TaskKind::RUN_CODE:
                return DoRunCode(sandbox, std::get<RunCodeRequest>(request), token);
            case TaskKind::RUN_COMMAND:
                return DoRunCommand(sandbox, std::get<RunCommandRequest>(request), token);
            case TaskKind::INSTALL_PACKAGES:
                return DoInstallPackages(sandbox, std::get<InstallPackagesRequest>(request), token);
            case TaskKind::UPLOAD_FILE:
                return DoUploadFile(sandbox, std::get<UploadFileRequest>(request), token);
            case TaskKind::DOWNLOAD_FILE:
                return DoDownloadFile(sandbox, std::get<DownloadFileRequest>(request), token);
            case TaskKind::LIST_DIRECTORY:
                return DoListDirectory(sandbox, std::get<ListDirectoryRequest>(request), token);
            case TaskKind::PACKAGE_STATUS:
                return DoPackageStatus(sandbox, std::get<PackageStatusRequest>(request), token);
        }
    }
    catch (const SandboxException& e) {
        if (e.Code() == ErrorCode::CONTAINER_GONE) {
            lifecycle_.MarkContainerLost(sandbox_id, token.TaskId());
        }
        throw;
    }

    throw SandboxException(ErrorCode::INTERNAL, "Unhandled task kind",
                           ErrorContext{sandbox_id, "", TaskKindToString(KindOf(request))});
}

utils::ContainerExecResult ExecutionEngine::Exec(const Sandbox& sandbox,
                                                 const std::vector<std::string>& command,
                                                 const std::string& working_dir,
                                                 CancellationToken& token) {
    token.ThrowIfStopped();

    utils::ExecOptions options;
    options.timeout = std::max(token.Remaining(), std::chrono::milliseconds(1));
    options.max_output_bytes = config_.max_output_bytes;
    options.working_dir = working_dir;
    options.should_stop = [&token]() { return token.IsCancelled(); };

    spdlog::debug("Sandbox {}: exec {}", sandbox.id,
                  utils::StringUtils::Truncate(utils::StringUtils::Join(command, " "), 200));
    return runtime_->Exec(sandbox.container_ref, command, options);
}

utils::CopyOptions ExecutionEngine::CopyLimits(CancellationToken& token, std::uint64_t max_bytes) {
    token.ThrowIfStopped();

    utils::CopyOptions options;
    options.timeout = std::max(token.Remaining(), std::chrono::milliseconds(1));
    options.max_bytes = max_bytes;
    options.should_stop = [&token]() { return token.IsCancelled(); };
    return options;
}

// ============================================================================
// OPERATIONS
// ============================================================================

ExecOutput ExecutionEngine::DoRunCode(const Sandbox& sandbox, const RunCodeRequest& request,
                                      CancellationToken& token) {
    const auto& interpreter = config_.interpreters.at(utils::StringUtils::ToLower(request.language));

    const std::string script = config_.scratch_dir + "/sandcastle-" +
                               utils::HashUtils::RandomHex(8) + interpreter.extension;
    runtime_->CopyIn(sandbox.container_ref, script, request.code, CopyLimits(token));

    auto command = interpreter.command;
    command.push_back(script);

    auto remove_script = [this, &sandbox, &script]() {
        utils::ExecOptions options;
        options.timeout = kCleanupTimeout;
        try {
            runtime_->Exec(sandbox.container_ref, {"rm", "-f", script}, options);
        }
        catch (const SandboxException& e) {
            spdlog::debug("Could not remove {} from {}: {}", script, sandbox.id, e.what());
        }
    };

    utils::ContainerExecResult result;
    try {
        result = Exec(sandbox, command, sandbox.working_dir, token);
    }
    catch (...) {
        remove_script();
        throw;
    }
    remove_script();

    return ToOutput(result);
}

ExecOutput ExecutionEngine::DoRunCommand(const Sandbox& sandbox, const RunCommandRequest& request,
                                         CancellationToken& token) {
    const std::string working_dir = request.working_dir ? ConfinePath(sandbox, *request.working_dir)
                                                        : sandbox.working_dir;
    return ToOutput(Exec(sandbox, {"sh", "-c", request.command}, working_dir, token));
}

InstallReport ExecutionEngine::DoInstallPackages(const Sandbox& sandbox,
                                                 const InstallPackagesRequest& request,
                                                 CancellationToken& token) {
    InstallReport report;
    const std::string index_url = request.index_url.value_or(config_.index_url);
    if (!index_url.empty()) {
        report.index_url = index_url;
    }

    for (const auto& package : request.packages) {
        auto command = config_.install_command;
        if (!index_url.empty()) {
            command.push_back("--index-url");
            command.push_back(index_url);
        }
        command.push_back(package);

        auto result = Exec(sandbox, command, sandbox.working_dir, token);
        if (result.exit_code == 0) {
            report.succeeded.push_back(package);
            spdlog::info("Sandbox {}: installed {}", sandbox.id, package);
        } else {
            report.failed.push_back(PackageFailure{package, FailureReason(result)});
            spdlog::warn("Sandbox {}: failed to install {} (exit {})", sandbox.id, package, result.exit_code);
        }
    }

    lifecycle_.RecordInstalledPackages(sandbox.id, report.succeeded);

    if (report.Partial()) {
        spdlog::warn("Sandbox {}: {} of {} package(s) failed", sandbox.id,
                     report.failed.size(), request.packages.size());
    }
    return report;
}

UploadReport ExecutionEngine::DoUploadFile(const Sandbox& sandbox, const UploadFileRequest& request,
                                           CancellationToken& token) {
    const std::string path = ConfinePath(sandbox, request.destination);
    token.ThrowIfStopped();

    std::uint64_t size = 0;
    if (request.content) {
        size = request.content->size();
    } else {
        std::error_code ec;
        size = fs::file_size(*request.local_path, ec);
        if (ec) {
            throw SandboxException(ErrorCode::NOT_FOUND,
                                   "Cannot read local file " + request.local_path->string() + ": " + ec.message(),
                                   ErrorContext{sandbox.id, "", "upload_file"});
        }
    }

    // Charged before any byte is read
    lifecycle_.ChargeDiskUsage(sandbox.id, static_cast<std::int64_t>(size));

    try {
        std::string data;
        if (request.content) {
            data = *request.content;
        } else {
            std::ifstream file(*request.local_path, std::ios::binary);
            if (!file) {
                throw SandboxException(ErrorCode::NOT_FOUND,
                                       "Cannot open local file " + request.local_path->string(),
                                       ErrorContext{sandbox.id, "", "upload_file"});
            }
            data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
            if (data.size() != size) {
                throw SandboxException(ErrorCode::INTERNAL,
                                       "Local file changed size while reading: " +
                                           request.local_path->string(),
                                       ErrorContext{sandbox.id, "", "upload_file"});
            }
        }

        runtime_->CopyIn(sandbox.container_ref, path, data, CopyLimits(token));

        UploadReport report;
        report.path = path;
        report.bytes_written = data.size();
        report.sha256 = utils::HashUtils::ComputeSHA256(data);

        spdlog::info("Sandbox {}: uploaded {} bytes to {}", sandbox.id, report.bytes_written, path);
        return report;
    }
    catch (...) {
        lifecycle_.ChargeDiskUsage(sandbox.id, -static_cast<std::int64_t>(size));
        throw;
    }
}

FileContent ExecutionEngine::DoDownloadFile(const Sandbox& sandbox, const DownloadFileRequest& request,
                                            CancellationToken& token) {
    const std::string path = ConfinePath(sandbox, request.path);
    token.ThrowIfStopped();

    // The runtime refuses files over the limit before reading them
    FileContent file;
    file.path = path;
    file.content = runtime_->CopyOut(sandbox.container_ref, path,
                                     CopyLimits(token, config_.max_download_bytes));
    file.size = file.content.size();

    file.sha256 = utils::HashUtils::ComputeSHA256(file.content);
    return file;
}

DirectoryListing ExecutionEngine::DoListDirectory(const Sandbox& sandbox,
                                                  const ListDirectoryRequest& request,
                                                  CancellationToken& token) {
    const std::string path = ConfinePath(sandbox, request.path);

    auto result = Exec(sandbox,
                       {"find", path, "-mindepth", "1", "-maxdepth", "1",
                        "-printf", "%y\\t%s\\t%T@\\t%f\\n"},
                       sandbox.working_dir, token);

    if (result.exit_code != 0) {
        if (utils::StringUtils::Contains(result.stderr_output, "No such file")) {
            throw SandboxException(ErrorCode::NOT_FOUND, "No such directory: " + path,
                                   ErrorContext{sandbox.id, "", "list_directory"});
        }
        throw SandboxException(ErrorCode::INTERNAL, "Listing failed: " + FailureReason(result),
                               ErrorContext{sandbox.id, "", "list_directory"});
    }

    DirectoryListing listing;
    listing.path = path;
    for (const auto& line : utils::StringUtils::SplitLines(result.stdout_output)) {
        if (auto entry = ParseFindLine(line)) {
            listing.entries.push_back(std::move(*entry));
        }
    }
    std::sort(listing.entries.begin(), listing.entries.end(),
              [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; });
    return listing;
}

PackageStatusReport ExecutionEngine::DoPackageStatus(const Sandbox& sandbox,
                                                     const PackageStatusRequest& request,
                                                     CancellationToken& token) {
    auto result = Exec(sandbox, config_.list_packages_command, sandbox.working_dir, token);
    if (result.exit_code != 0) {
        throw SandboxException(ErrorCode::INTERNAL, "Package listing failed: " + FailureReason(result),
                               ErrorContext{sandbox.id, "", "package_status"});
    }

    std::map<std::string, std::string> installed;
    try {
        auto listing = json::parse(result.stdout_output);
        for (const auto& item : listing) {
            installed[utils::StringUtils::NormalizePackageName(item.at("name").get<std::string>())] =
                item.value("version", "");
        }
    }
    catch (const json::exception& e) {
        throw SandboxException(ErrorCode::INTERNAL,
                               std::string("Unreadable package listing: ") + e.what(),
                               ErrorContext{sandbox.id, "", "package_status"});
    }

    PackageStatusReport report;
    for (const auto& package : request.packages) {
        PackageInfo info;
        info.name = package;
        auto it = installed.find(utils::StringUtils::NormalizePackageName(package));
        if (it != installed.end()) {
            info.installed = true;
            if (!it->second.empty()) {
                info.version = it->second;
            }
        }
        report.packages.push_back(std::move(info));
    }
    return report;
}

} // namespace core
} // namespace sandcastle
