/**
 * @file container_utils.cpp
 * @brief DockerRuntime: container lifecycle, exec and file copy over the docker CLI
 *
 * **Security Hardening** applied to every sandbox container:
 * 1. Capability Dropping: --cap-drop ALL
 * 2. No New Privileges: --security-opt no-new-privileges
 * 3. Resource Limits: --memory (swap pinned), --cpus, --pids-limit
 * 4. Labels: every managed container is labelled so startup recovery can find it
 *
 * **Container Lifecycle**:
 * ```
 * run -d -> exec ... -> cp in/out -> rm -f
 * ```
 *
 * **Error classification**: the docker client reports daemon-side failures on
 * stderr with exit status 1/125. For exec that stderr is shared with the
 * command running inside the container, so a daemon or missing-container
 * message only counts once Ping/Inspect confirms it. Exec exit codes otherwise
 * belong to the command and are returned untouched.
 *
 * @date 2025
 */

#include "sandcastle/utils/container_utils.hpp"
#include "sandcastle/utils/hash_utils.hpp"
#include "sandcastle/utils/string_utils.hpp"
#include "sandcastle/core/errors.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

using json = nlohmann::json;

namespace sandcastle {
namespace utils {

using core::ErrorCode;
using core::SandboxException;

namespace {

constexpr std::size_t kStderrTail = 512;

bool IsDaemonError(const std::string& stderr_output) {
    return StringUtils::Contains(stderr_output, "Cannot connect to the Docker daemon") ||
           StringUtils::Contains(stderr_output, "Is the docker daemon running") ||
           StringUtils::Contains(stderr_output, "error during connect");
}

bool IsMissingContainer(const std::string& stderr_output) {
    return StringUtils::Contains(stderr_output, "No such container") ||
           StringUtils::Contains(stderr_output, "is not running");
}

// Checked before IsMissingContainer: newer clients report a missing path as
// "No such container:path: <ref>:<path>"
bool IsMissingPath(const std::string& stderr_output) {
    return StringUtils::Contains(stderr_output, "No such container:path") ||
           StringUtils::Contains(stderr_output, "Could not find the file") ||
           StringUtils::Contains(stderr_output, "No such file or directory");
}

std::chrono::milliseconds Remaining(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    return std::max(left, std::chrono::milliseconds(1));
}

[[noreturn]] void ThrowUnavailable(const ProcessResult& result) {
    std::string reason = result.Launched() ? StringUtils::Trim(result.stderr_output) : result.launch_error;
    spdlog::error("Container runtime unavailable: {}", reason);
    throw SandboxException(ErrorCode::RUNTIME_UNAVAILABLE, "Container runtime unavailable");
}

// Parses "2024-05-01T10:00:00.123Z" and "2024-05-01 10:00:00 +0000 UTC" (seconds precision, UTC)
std::chrono::system_clock::time_point ParseTimestamp(const std::string& text) {
    std::tm tm{};
    std::istringstream stream(text);
    if (text.find('T') != std::string::npos) {
        stream >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    } else {
        stream >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
    }
    if (stream.fail()) {
        return std::chrono::system_clock::now();
    }
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

/// Host scratch file removed on scope exit
class ScratchPath {
public:
    ScratchPath()
        : path_(std::filesystem::temp_directory_path() /
                ("sandcastle-" + HashUtils::RandomHex(8))) {}

    ~ScratchPath() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
        if (ec) {
            spdlog::warn("Failed to remove scratch path {}: {}", path_.string(), ec.message());
        }
    }

    ScratchPath(const ScratchPath&) = delete;
    ScratchPath& operator=(const ScratchPath&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR
// ============================================================================

DockerRuntime::DockerRuntime(std::string docker_binary, std::chrono::milliseconds control_timeout)
    : docker_binary_(std::move(docker_binary))
    , control_timeout_(control_timeout) {
    spdlog::debug("Docker runtime using binary: {}", docker_binary_);
}

ProcessResult DockerRuntime::RunDocker(const std::vector<std::string>& args,
                                       const ProcessOptions& options) const {
    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(docker_binary_);
    argv.insert(argv.end(), args.begin(), args.end());

    spdlog::debug("Executing: {} {}", docker_binary_,
                  StringUtils::Truncate(StringUtils::Join(args, " "), 200));

    return ProcessUtils::Run(argv, options);
}

ProcessResult DockerRuntime::RunDocker(const std::vector<std::string>& args) const {
    ProcessOptions options;
    options.timeout = control_timeout_;
    return RunDocker(args, options);
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool DockerRuntime::Ping() {
    auto result = RunDocker({"version", "--format", "{{.Server.Version}}"});
    if (!result.Launched() || result.exit_code != 0) {
        spdlog::debug("Docker ping failed: {}",
                      result.Launched() ? StringUtils::Trim(result.stderr_output) : result.launch_error);
        return false;
    }
    spdlog::debug("Docker server version: {}", StringUtils::Trim(result.stdout_output));
    return true;
}

// ============================================================================
// CONTAINER CREATION AND REMOVAL
// ============================================================================

std::string DockerRuntime::CreateContainer(const ContainerSpec& spec) {
    spdlog::info("Creating container: {} (image: {})", spec.name, spec.image);

    auto result = RunDocker(BuildRunCommand(spec));

    if (!result.Launched() || IsDaemonError(result.stderr_output)) {
        ThrowUnavailable(result);
    }
    if (result.timed_out) {
        spdlog::error("docker run timed out for {}", spec.name);
        throw SandboxException(ErrorCode::RUNTIME_UNAVAILABLE, "Container creation timed out");
    }
    if (result.exit_code != 0) {
        spdlog::error("Failed to create container {}: {}", spec.name,
                      StringUtils::Trim(result.stderr_output));
        throw SandboxException(ErrorCode::CREATION_ERROR,
                               "Failed to create container: " +
                               StringUtils::Tail(StringUtils::Trim(result.stderr_output), kStderrTail));
    }

    // Remove trailing whitespace/newlines
    std::string container_id = result.stdout_output;
    container_id.erase(container_id.find_last_not_of(" \n\r\t") + 1);

    spdlog::info("Container created: {}", container_id.substr(0, 12));
    return container_id;
}

bool DockerRuntime::RemoveContainer(const std::string& container_ref) {
    spdlog::info("Removing container: {}", container_ref.substr(0, 12));

    auto result = RunDocker({"rm", "--force", "--volumes", container_ref});

    if (!result.Launched() || IsDaemonError(result.stderr_output)) {
        ThrowUnavailable(result);
    }
    if (result.exit_code == 0) {
        return true;
    }
    if (IsMissingContainer(result.stderr_output)) {
        spdlog::debug("Container {} already gone", container_ref.substr(0, 12));
        return false;
    }

    spdlog::error("Failed to remove container {}: {}", container_ref.substr(0, 12),
                  StringUtils::Trim(result.stderr_output));
    throw SandboxException(ErrorCode::INTERNAL, "Failed to remove container");
}

// ============================================================================
// CONTAINER COMMAND EXECUTION
// ============================================================================

ContainerExecResult DockerRuntime::Exec(const std::string& container_ref,
                                        const std::vector<std::string>& command,
                                        const ExecOptions& options) {
    std::vector<std::string> args = {"exec"};
    if (options.stdin_data) {
        args.push_back("-i");
    }
    if (!options.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(options.working_dir);
    }
    args.push_back(container_ref);
    args.insert(args.end(), command.begin(), command.end());

    ProcessOptions process_options;
    process_options.timeout = options.timeout;
    process_options.max_output_bytes = options.max_output_bytes;
    process_options.stdin_data = options.stdin_data;
    process_options.should_stop = options.should_stop;

    auto result = RunDocker(args, process_options);

    if (!result.Launched()) {
        ThrowUnavailable(result);
    }
    if (result.timed_out) {
        throw SandboxException(ErrorCode::EXECUTION_TIMEOUT,
                               "Execution exceeded " + std::to_string(options.timeout.count()) + "ms");
    }
    if (result.cancelled) {
        throw SandboxException(ErrorCode::CANCELLED, "Execution cancelled");
    }
    if (result.exit_code != 0 && IsDaemonError(result.stderr_output) && !Ping()) {
        ThrowUnavailable(result);
    }
    if (result.exit_code != 0 && IsMissingContainer(result.stderr_output) && !IsRunning(container_ref)) {
        spdlog::warn("Container {} is gone", container_ref.substr(0, 12));
        throw SandboxException(ErrorCode::CONTAINER_GONE, "Container no longer exists");
    }

    ContainerExecResult exec_result;
    exec_result.exit_code = result.exit_code;
    exec_result.stdout_output = std::move(result.stdout_output);
    exec_result.stderr_output = std::move(result.stderr_output);
    exec_result.truncated = result.truncated;
    exec_result.duration = result.duration;
    return exec_result;
}

// ============================================================================
// FILE OPERATIONS
// ============================================================================
// docker cp through a host scratch file

bool DockerRuntime::IsRunning(const std::string& container_ref) {
    auto info = Inspect(container_ref);
    return info && info->state == ContainerState::RUNNING;
}

void DockerRuntime::CheckCopy(const ProcessResult& result, const std::string& container_ref,
                              const std::string& path, std::chrono::milliseconds timeout) {
    if (!result.Launched() || IsDaemonError(result.stderr_output)) {
        ThrowUnavailable(result);
    }
    if (result.timed_out) {
        throw SandboxException(ErrorCode::EXECUTION_TIMEOUT,
                               "Copy of " + path + " exceeded " + std::to_string(timeout.count()) + "ms");
    }
    if (result.cancelled) {
        throw SandboxException(ErrorCode::CANCELLED, "Copy of " + path + " cancelled");
    }
    if (result.exit_code == 0) {
        return;
    }

    if (IsMissingPath(result.stderr_output) || IsMissingContainer(result.stderr_output)) {
        if (!IsRunning(container_ref)) {
            spdlog::warn("Container {} is gone", container_ref.substr(0, 12));
            throw SandboxException(ErrorCode::CONTAINER_GONE, "Container no longer exists");
        }
        if (IsMissingPath(result.stderr_output)) {
            throw SandboxException(ErrorCode::NOT_FOUND, "No such file: " + path);
        }
    }

    spdlog::error("docker cp failed for {}:{}: {}", container_ref.substr(0, 12), path,
                  StringUtils::Trim(result.stderr_output));
    throw SandboxException(ErrorCode::INTERNAL, "Failed to copy " + path);
}

void DockerRuntime::CopyIn(const std::string& container_ref,
                           const std::string& path,
                           const std::string& content,
                           const CopyOptions& options) {
    const auto timeout = options.timeout.count() > 0 ? options.timeout : control_timeout_;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    ScratchPath scratch;
    {
        std::ofstream out(scratch.Path(), std::ios::binary);
        out.write(content.data(), static_cast<std::streamsize>(content.size()));
        if (!out) {
            throw SandboxException(ErrorCode::INTERNAL, "Failed to stage upload on host");
        }
    }

    ExecOptions mkdir_options;
    mkdir_options.timeout = Remaining(deadline);
    mkdir_options.should_stop = options.should_stop;
    auto mkdir = Exec(container_ref, {"mkdir", "-p", StringUtils::ParentPath(path)}, mkdir_options);
    if (mkdir.exit_code != 0) {
        spdlog::warn("mkdir -p {} failed: {}", StringUtils::ParentPath(path),
                     StringUtils::Trim(mkdir.stderr_output));
    }

    ProcessOptions cp_options;
    cp_options.timeout = Remaining(deadline);
    cp_options.should_stop = options.should_stop;
    auto result = RunDocker({"cp", scratch.Path().string(), container_ref + ":" + path}, cp_options);
    CheckCopy(result, container_ref, path, timeout);

    spdlog::debug("Copied {} bytes to {}:{}", content.size(), container_ref.substr(0, 12), path);
}

std::string DockerRuntime::CopyOut(const std::string& container_ref,
                                   const std::string& path,
                                   const CopyOptions& options) {
    const auto timeout = options.timeout.count() > 0 ? options.timeout : control_timeout_;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto too_large = [&options]() {
        return SandboxException(ErrorCode::QUOTA_EXCEEDED,
                                "File is larger than the download limit (" +
                                    std::to_string(options.max_bytes) + " bytes)");
    };

    // Refuse oversized files before transferring them. A failed stat is left
    // to docker cp to classify.
    if (options.max_bytes > 0) {
        ExecOptions stat_options;
        stat_options.timeout = Remaining(deadline);
        stat_options.should_stop = options.should_stop;
        auto stat = Exec(container_ref, {"stat", "-c", "%s", path}, stat_options);
        if (stat.exit_code == 0) {
            try {
                if (std::stoull(StringUtils::Trim(stat.stdout_output)) > options.max_bytes) {
                    throw too_large();
                }
            }
            catch (const std::logic_error& e) {
                spdlog::debug("Unreadable stat output for {}: {}", path, e.what());
            }
        }
    }

    ScratchPath scratch;

    ProcessOptions cp_options;
    cp_options.timeout = Remaining(deadline);
    cp_options.should_stop = options.should_stop;
    auto result = RunDocker({"cp", container_ref + ":" + path, scratch.Path().string()}, cp_options);
    CheckCopy(result, container_ref, path, timeout);

    if (std::filesystem::is_directory(scratch.Path())) {
        throw SandboxException(ErrorCode::INVALID_ARGUMENT, path + " is a directory");
    }

    std::error_code ec;
    auto size = std::filesystem::file_size(scratch.Path(), ec);
    if (ec) {
        throw SandboxException(ErrorCode::INTERNAL, "Failed to read staged download: " + ec.message());
    }
    if (options.max_bytes > 0 && size > options.max_bytes) {
        throw too_large();
    }

    std::ifstream in(scratch.Path(), std::ios::binary);
    if (!in) {
        throw SandboxException(ErrorCode::INTERNAL, "Failed to read staged download");
    }
    std::ostringstream content;
    content << in.rdbuf();
    return content.str();
}

// ============================================================================
// CONTAINER INFORMATION RETRIEVAL
// ============================================================================

std::optional<ContainerInfo> DockerRuntime::Inspect(const std::string& container_ref) {
    auto result = RunDocker({"inspect", container_ref});

    if (!result.Launched() || IsDaemonError(result.stderr_output)) {
        ThrowUnavailable(result);
    }
    if (result.exit_code != 0) {
        return std::nullopt;
    }

    try {
        return ParseInspectOutput(result.stdout_output);
    }
    catch (const json::exception& e) {
        spdlog::error("Failed to parse inspect output: {}", e.what());
        throw SandboxException(ErrorCode::INTERNAL, "Unreadable inspect output");
    }
}

std::vector<ContainerInfo> DockerRuntime::ListContainers(const std::string& label) {
    auto result = RunDocker({"ps", "--all", "--no-trunc",
                             "--filter", "label=" + label,
                             "--format", "{{json .}}"});

    if (!result.Launched() || IsDaemonError(result.stderr_output) || result.exit_code != 0) {
        ThrowUnavailable(result);
    }

    std::vector<ContainerInfo> containers;
    for (const auto& line : StringUtils::SplitLines(result.stdout_output)) {
        try {
            containers.push_back(ParseListLine(line));
        }
        catch (const json::exception& e) {
            spdlog::warn("Failed to parse container info: {}", e.what());
        }
    }
    return containers;
}

// ============================================================================
// COMMAND BUILDING AND PARSING
// ============================================================================

std::vector<std::string> DockerRuntime::BuildRunCommand(const ContainerSpec& spec) {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");  // Detached mode

    if (!spec.name.empty()) {
        args.push_back("--name");
        args.push_back(spec.name);
    }

    // Memory limit, swap pinned so the ceiling is real
    if (spec.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(spec.memory_limit_mb) + "m");
        args.push_back("--memory-swap");
        args.push_back(std::to_string(spec.memory_limit_mb) + "m");
    }

    if (spec.cpu_limit > 0) {
        std::ostringstream cpus;
        cpus << std::fixed << std::setprecision(2) << spec.cpu_limit;
        args.push_back("--cpus");
        args.push_back(cpus.str());
    }

    if (spec.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(spec.pids_limit));
    }

    if (!spec.network_mode.empty()) {
        args.push_back("--network");
        args.push_back(spec.network_mode);
    }

    for (const auto& cap : spec.capabilities_drop) {
        args.push_back("--cap-drop");
        args.push_back(cap);
    }

    if (spec.no_new_privileges) {
        args.push_back("--security-opt");
        args.push_back("no-new-privileges");
    }

    for (const auto& mount : spec.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path.string() + ":" + mount.container_path +
                       (mount.read_only ? ":ro" : ":rw"));
    }

    for (const auto& [key, value] : spec.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    if (!spec.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(spec.working_dir);
    }

    // Image, then the optional command
    args.push_back(spec.image);
    args.insert(args.end(), spec.command.begin(), spec.command.end());

    return args;
}

ContainerInfo DockerRuntime::ParseInspectOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    // Docker inspect returns array with single object
    if (j.is_array() && !j.empty()) {
        j = j[0];
    }

    ContainerInfo info;
    info.id = j.value("Id", "");
    info.name = j.value("Name", "");
    if (!info.name.empty() && info.name.front() == '/') {
        info.name.erase(0, 1);
    }
    info.created_at = ParseTimestamp(j.value("Created", ""));

    if (j.contains("Config") && j["Config"].is_object()) {
        const auto& config = j["Config"];
        info.image = config.value("Image", "");
        if (config.contains("Labels") && config["Labels"].is_object()) {
            for (const auto& [key, value] : config["Labels"].items()) {
                if (value.is_string()) {
                    info.labels[key] = value.get<std::string>();
                }
            }
        }
    }
    if (j.contains("State") && j["State"].is_object()) {
        info.state = ParseState(j["State"].value("Status", ""));
    }

    return info;
}

ContainerInfo DockerRuntime::ParseListLine(const std::string& line) {
    json j = json::parse(line);

    ContainerInfo info;
    info.id = j.value("ID", "");
    info.name = j.value("Names", "");
    info.image = j.value("Image", "");
    info.state = ParseState(j.value("State", ""));
    info.labels = ParseLabels(j.value("Labels", ""));
    info.created_at = ParseTimestamp(j.value("CreatedAt", ""));
    return info;
}

ContainerState DockerRuntime::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "removing") return ContainerState::EXITED;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

std::map<std::string, std::string> DockerRuntime::ParseLabels(const std::string& labels) {
    std::map<std::string, std::string> parsed;
    for (const auto& pair : StringUtils::Split(labels, ',')) {
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            parsed[StringUtils::Trim(pair)] = "";
        } else {
            parsed[StringUtils::Trim(pair.substr(0, eq))] = pair.substr(eq + 1);
        }
    }
    return parsed;
}

} // namespace utils
} // namespace sandcastle
