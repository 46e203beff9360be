/**
 * @file types.cpp
 * @brief Enum names and request kind mapping
 *
 * @date 2025
 */

#include "sandcastle/core/types.hpp"

namespace sandcastle {
namespace core {

const char* SandboxStateToString(SandboxState state) {
    switch (state) {
        case SandboxState::CREATING:   return "creating";
        case SandboxState::ACTIVE:     return "active";
        case SandboxState::IDLE:       return "idle";
        case SandboxState::DESTROYING: return "destroying";
        case SandboxState::DESTROYED:  return "destroyed";
        case SandboxState::FAILED:     return "failed";
    }
    return "failed";
}

std::optional<SandboxState> ParseSandboxState(const std::string& text) {
    if (text == "creating") return SandboxState::CREATING;
    if (text == "active") return SandboxState::ACTIVE;
    if (text == "idle") return SandboxState::IDLE;
    if (text == "destroying") return SandboxState::DESTROYING;
    if (text == "destroyed") return SandboxState::DESTROYED;
    if (text == "failed") return SandboxState::FAILED;
    return std::nullopt;
}

bool IsTerminal(SandboxState state) {
    return state == SandboxState::DESTROYED || state == SandboxState::FAILED;
}

const char* TaskKindToString(TaskKind kind) {
    switch (kind) {
        case TaskKind::RUN_CODE:         return "run_code";
        case TaskKind::RUN_COMMAND:      return "run_command";
        case TaskKind::INSTALL_PACKAGES: return "install_packages";
        case TaskKind::UPLOAD_FILE:      return "upload_file";
        case TaskKind::DOWNLOAD_FILE:    return "download_file";
        case TaskKind::LIST_DIRECTORY:   return "list_directory";
        case TaskKind::PACKAGE_STATUS:   return "package_status";
    }
    return "run_code";
}

const char* TaskStateToString(TaskState state) {
    switch (state) {
        case TaskState::PENDING:   return "pending";
        case TaskState::RUNNING:   return "running";
        case TaskState::COMPLETED: return "completed";
        case TaskState::FAILED:    return "failed";
        case TaskState::CANCELLED: return "cancelled";
        case TaskState::TIMED_OUT: return "timed_out";
    }
    return "failed";
}

bool IsTerminal(TaskState state) {
    return state != TaskState::PENDING && state != TaskState::RUNNING;
}

TaskKind KindOf(const TaskRequest& request) {
    // Variant alternatives are declared in TaskKind order
    static_assert(std::variant_size_v<TaskRequest> ==
                  static_cast<std::size_t>(TaskKind::PACKAGE_STATUS) + 1,
                  "TaskRequest alternatives must mirror TaskKind");
    return static_cast<TaskKind>(request.index());
}

} // namespace core
} // namespace sandcastle
