/**
 * @file json_reporter.cpp
 * @brief Implementation of JSON views
 *
 * **Sandbox**:
 * ```json
 * {
 *   "id": "sbx-1a2b3c4d5e6f",
 *   "name": "s1",
 *   "owner": "root",
 *   "state": "active",
 *   "image": "python-sandbox:latest",
 *   "container": "sandcastle-sbx-1a2b3c4d5e6f",
 *   "limits": {"memory_mb": 1024, "cpus": 0.5, "pids": 256, "disk_budget_mb": 512},
 *   "created_at": "2025-01-31T12:00:00Z",
 *   "last_active_at": "2025-01-31T12:05:00Z"
 * }
 * ```
 *
 * **Task status**:
 * ```json
 * {
 *   "id": "task-...", "sandbox_id": "sbx-...", "kind": "run_code", "state": "completed",
 *   "result": {"stdout": "2\n", "stderr": "", "exit_code": 0, "truncated": false, "duration_ms": 41}
 * }
 * ```
 *
 * @date 2025
 */

#include "sandcastle/reporters/json_reporter.hpp"

#include <iomanip>
#include <sstream>
#include <ctime>

using json = nlohmann::json;

namespace sandcastle {
namespace reporters {

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

std::string JsonReporter::FormatTimestamp(const core::TimePoint& time) {
    auto t = core::Clock::to_time_t(time);
    std::tm utc{};
    gmtime_r(&t, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::string JsonReporter::Render(const json& document) const {
    return document.dump(config_.pretty_print ? config_.indent_size : -1, ' ', false,
                         json::error_handler_t::replace);
}

// ============================================================================
// SANDBOXES
// ============================================================================

json JsonReporter::SandboxToJson(const core::Sandbox& sandbox) const {
    json j = {
        {"id", sandbox.id},
        {"name", sandbox.name ? json(*sandbox.name) : json(nullptr)},
        {"owner", sandbox.owner},
        {"state", core::SandboxStateToString(sandbox.state)},
        {"image", sandbox.image},
        {"container", sandbox.container_name},
        {"working_dir", sandbox.working_dir},
        {"limits", {
            {"memory_mb", sandbox.limits.memory_limit_mb},
            {"cpus", sandbox.limits.cpu_limit},
            {"pids", sandbox.limits.pids_limit},
            {"disk_budget_mb", sandbox.limits.disk_budget_mb}
        }},
        {"disk_used_bytes", sandbox.disk_used_bytes},
        {"installed_packages", sandbox.installed_packages},
        {"created_at", FormatTimestamp(sandbox.created_at)},
        {"last_active_at", FormatTimestamp(sandbox.last_active_at)}
    };

    if (sandbox.destroyed_at) {
        j["destroyed_at"] = FormatTimestamp(*sandbox.destroyed_at);
    }
    if (!sandbox.mounts.empty()) {
        json mounts = json::array();
        for (const auto& mount : sandbox.mounts) {
            mounts.push_back({
                {"host_path", mount.host_path.string()},
                {"container_path", mount.container_path},
                {"read_only", mount.read_only}
            });
        }
        j["mounts"] = mounts;
    }
    return j;
}

json JsonReporter::SandboxesToJson(const std::vector<core::Sandbox>& sandboxes) const {
    json list = json::array();
    for (const auto& sandbox : sandboxes) {
        list.push_back(SandboxToJson(sandbox));
    }
    return {{"count", sandboxes.size()}, {"sandboxes", list}};
}

// ============================================================================
// TASKS
// ============================================================================

json JsonReporter::ErrorToJson(const core::TaskError& error) const {
    json j = {
        {"code", core::ErrorCodeToString(error.code)},
        {"message", error.message}
    };
    if (!error.context.sandbox_id.empty()) j["sandbox_id"] = error.context.sandbox_id;
    if (!error.context.task_id.empty()) j["task_id"] = error.context.task_id;
    if (!error.context.kind.empty()) j["kind"] = error.context.kind;
    return j;
}

json JsonReporter::ExceptionToJson(const core::SandboxException& error) const {
    return {{"error", ErrorToJson(core::TaskError{error.Code(), error.what(), error.Context()})}};
}

json JsonReporter::OutputToJson(const core::TaskOutput& output) const {
    if (const auto* exec = std::get_if<core::ExecOutput>(&output)) {
        return {
            {"stdout", exec->stdout_output},
            {"stderr", exec->stderr_output},
            {"exit_code", exec->exit_code},
            {"truncated", exec->truncated},
            {"duration_ms", exec->duration.count()}
        };
    }

    if (const auto* install = std::get_if<core::InstallReport>(&output)) {
        json failed = json::array();
        for (const auto& failure : install->failed) {
            failed.push_back({{"name", failure.name}, {"reason", failure.reason}});
        }
        json j = {
            {"succeeded", install->succeeded},
            {"failed", failed},
            {"partial_failure", install->Partial()}
        };
        if (install->index_url) {
            j["index_url"] = *install->index_url;
        }
        return j;
    }

    if (const auto* upload = std::get_if<core::UploadReport>(&output)) {
        return {
            {"path", upload->path},
            {"bytes_written", upload->bytes_written},
            {"sha256", upload->sha256}
        };
    }

    if (const auto* file = std::get_if<core::FileContent>(&output)) {
        json j = {
            {"path", file->path},
            {"size", file->size},
            {"sha256", file->sha256}
        };
        if (config_.include_file_content) {
            j["content"] = file->content;
        }
        return j;
    }

    if (const auto* listing = std::get_if<core::DirectoryListing>(&output)) {
        json entries = json::array();
        for (const auto& entry : listing->entries) {
            entries.push_back({
                {"name", entry.name},
                {"type", entry.is_directory ? "directory" : "file"},
                {"size", entry.size},
                {"modified", FormatTimestamp(entry.modified)}
            });
        }
        return {{"path", listing->path}, {"entries", entries}};
    }

    if (const auto* status = std::get_if<core::PackageStatusReport>(&output)) {
        json packages = json::array();
        for (const auto& package : status->packages) {
            packages.push_back({
                {"name", package.name},
                {"installed", package.installed},
                {"version", package.version ? json(*package.version) : json(nullptr)}
            });
        }
        return {{"packages", packages}};
    }

    return nullptr;
}

json JsonReporter::TaskStatusToJson(const core::TaskStatus& status) const {
    json j = {
        {"id", status.id},
        {"sandbox_id", status.owner},
        {"kind", core::TaskKindToString(status.kind)},
        {"state", core::TaskStateToString(status.state)},
        {"submitted_at", FormatTimestamp(status.submitted_at)},
        {"deadline", FormatTimestamp(status.deadline)}
    };

    if (status.started_at) j["started_at"] = FormatTimestamp(*status.started_at);
    if (status.finished_at) j["finished_at"] = FormatTimestamp(*status.finished_at);
    if (status.output) j["result"] = OutputToJson(*status.output);
    if (status.error) j["error"] = ErrorToJson(*status.error);
    return j;
}

} // namespace reporters
} // namespace sandcastle
