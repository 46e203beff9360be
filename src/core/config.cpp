/**
 * @file config.cpp
 * @brief JSON configuration loading with defaults and environment overrides
 *
 * @date 2025
 */

#include "sandcastle/core/config.hpp"
#include "sandcastle/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <set>

using json = nlohmann::json;

namespace sandcastle {
namespace core {

namespace {

/**
 * @brief Reads typed keys out of one config section
 *
 * Remembers which keys were consumed so leftovers can be reported.
 */
class SectionReader {
public:
    SectionReader(const json& document, std::string name)
        : name_(std::move(name)) {
        if (document.contains(name_)) {
            section_ = document.at(name_);
            if (!section_.is_object()) {
                throw SandboxException(ErrorCode::INVALID_ARGUMENT,
                                       "Config section '" + name_ + "' must be an object");
            }
        }
    }

    template <typename T>
    void Read(const char* key, T& target) {
        known_.insert(key);
        if (!section_.contains(key)) {
            return;
        }
        try {
            target = section_.at(key).get<T>();
        }
        catch (const json::exception& e) {
            throw SandboxException(ErrorCode::INVALID_ARGUMENT,
                                   "Invalid value for " + name_ + "." + key + ": " + e.what());
        }
    }

    template <typename Rep, typename Period>
    void ReadDuration(const char* key, std::chrono::duration<Rep, Period>& target) {
        long long count = static_cast<long long>(target.count());
        Read(key, count);
        if (count < 0) {
            throw SandboxException(ErrorCode::INVALID_ARGUMENT,
                                   name_ + "." + key + " must not be negative");
        }
        target = std::chrono::duration<Rep, Period>(static_cast<Rep>(count));
    }

    const json& Section() const { return section_; }

    void MarkKnown(const char* key) { known_.insert(key); }

    void WarnUnknown() const {
        if (!section_.is_object()) {
            return;
        }
        for (const auto& item : section_.items()) {
            if (!known_.count(item.key())) {
                spdlog::warn("Ignoring unknown config key {}.{}", name_, item.key());
            }
        }
    }

private:
    std::string name_;
    json section_ = json::object();
    std::set<std::string> known_;
};

void ApplyRuntime(RuntimeConfig& runtime, const json& document) {
    SectionReader reader(document, "runtime");
    reader.Read("docker_binary", runtime.docker_binary);
    reader.Read("default_image", runtime.default_image);
    reader.Read("container_command", runtime.container_command);
    reader.Read("container_prefix", runtime.container_prefix);
    reader.Read("label", runtime.label);
    reader.Read("working_dir", runtime.working_dir);
    reader.Read("network_mode", runtime.network_mode);
    reader.Read("memory_limit_mb", runtime.default_limits.memory_limit_mb);
    reader.Read("cpu_limit", runtime.default_limits.cpu_limit);
    reader.Read("pids_limit", runtime.default_limits.pids_limit);
    reader.Read("disk_budget_mb", runtime.default_limits.disk_budget_mb);
    reader.Read("mount_host_directory", runtime.mount_host_directory);

    std::string data_root = runtime.data_root.string();
    reader.Read("data_root", data_root);
    runtime.data_root = data_root;

    reader.ReadDuration("control_timeout_seconds", runtime.control_timeout);
    reader.WarnUnknown();
}

void ApplyLifecycle(LifecycleConfig& lifecycle, const json& document) {
    SectionReader reader(document, "lifecycle");
    reader.Read("max_sandboxes", lifecycle.max_sandboxes);
    reader.Read("max_sandboxes_per_owner", lifecycle.max_sandboxes_per_owner);
    reader.Read("default_owner", lifecycle.default_owner);
    reader.Read("retry_attempts", lifecycle.retry_attempts);
    reader.ReadDuration("retry_backoff_ms", lifecycle.retry_backoff);
    reader.ReadDuration("idle_threshold_seconds", lifecycle.idle_threshold);
    reader.ReadDuration("idle_report_threshold_seconds", lifecycle.idle_report_threshold);
    reader.ReadDuration("reclaim_interval_seconds", lifecycle.reclaim_interval);
    reader.ReadDuration("destroyed_retention_seconds", lifecycle.destroyed_retention);
    reader.Read("destroy_policy", lifecycle.destroy_policy);
    reader.ReadDuration("destroy_grace_period_ms", lifecycle.destroy_grace_period);
    reader.Read("reset_all_containers", lifecycle.reset_all_containers);
    reader.Read("destroy_on_shutdown", lifecycle.destroy_on_shutdown);
    reader.WarnUnknown();
}

void ApplyTasks(TaskConfig& tasks, const json& document) {
    SectionReader reader(document, "tasks");
    reader.Read("worker_count", tasks.worker_count);
    reader.Read("max_pending_tasks", tasks.max_pending_tasks);
    reader.ReadDuration("default_timeout_ms", tasks.default_timeout);
    reader.ReadDuration("result_retention_seconds", tasks.result_retention);
    reader.ReadDuration("maintenance_interval_ms", tasks.maintenance_interval);
    reader.WarnUnknown();
}

void ApplyExecution(ExecutionConfig& execution, const json& document) {
    SectionReader reader(document, "execution");
    reader.Read("max_output_bytes", execution.max_output_bytes);
    reader.Read("max_download_bytes", execution.max_download_bytes);
    reader.Read("scratch_dir", execution.scratch_dir);
    reader.Read("install_command", execution.install_command);
    reader.Read("list_packages_command", execution.list_packages_command);
    reader.Read("index_url", execution.index_url);

    // Interpreters merge per language so one entry can be added without restating the rest
    reader.MarkKnown("interpreters");
    const json& section = reader.Section();
    if (section.contains("interpreters")) {
        const json& interpreters = section.at("interpreters");
        if (!interpreters.is_object()) {
            throw SandboxException(ErrorCode::INVALID_ARGUMENT, "execution.interpreters must be an object");
        }
        for (const auto& [language, spec] : interpreters.items()) {
            try {
                InterpreterSpec interpreter;
                interpreter.command = spec.at("command").get<std::vector<std::string>>();
                interpreter.extension = spec.value("extension", "");
                if (interpreter.command.empty()) {
                    throw SandboxException(ErrorCode::INVALID_ARGUMENT,
                                           "execution.interpreters." + language + ".command is empty");
                }
                execution.interpreters[language] = interpreter;
            }
            catch (const json::exception& e) {
                throw SandboxException(ErrorCode::INVALID_ARGUMENT,
                                       "Invalid interpreter '" + language + "': " + e.what());
            }
        }
    }
    reader.WarnUnknown();
}

void ApplyLogging(utils::LoggingConfig& logging, const json& document) {
    SectionReader reader(document, "logging");
    reader.Read("level", logging.level);
    reader.Read("log_file", logging.log_file);
    reader.Read("max_file_size", logging.max_file_size);
    reader.Read("backup_count", logging.backup_count);
    reader.Read("console", logging.console);
    reader.WarnUnknown();
}

std::optional<std::string> GetEnv(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

} // anonymous namespace

// ============================================================================
// LOADING
// ============================================================================

void ApplyJson(EngineConfig& config, const json& document) {
    if (!document.is_object()) {
        throw SandboxException(ErrorCode::INVALID_ARGUMENT, "Config root must be an object");
    }

    static const std::set<std::string> kSections{"runtime", "lifecycle", "tasks", "execution", "logging"};
    for (const auto& item : document.items()) {
        if (!kSections.count(item.key())) {
            spdlog::warn("Ignoring unknown config section '{}'", item.key());
        }
    }

    ApplyRuntime(config.runtime, document);
    ApplyLifecycle(config.lifecycle, document);
    ApplyTasks(config.tasks, document);
    ApplyExecution(config.execution, document);
    ApplyLogging(config.logging, document);
}

EngineConfig LoadConfig(const std::optional<std::filesystem::path>& path) {
    EngineConfig config;

    if (path) {
        if (std::filesystem::exists(*path)) {
            std::ifstream file(*path);
            if (!file.is_open()) {
                throw SandboxException(ErrorCode::INVALID_ARGUMENT,
                                       "Cannot read config file: " + path->string());
            }
            json document;
            try {
                document = json::parse(file);
            }
            catch (const json::parse_error& e) {
                throw SandboxException(ErrorCode::INVALID_ARGUMENT,
                                       "Malformed config file " + path->string() + ": " + e.what());
            }
            ApplyJson(config, document);
            spdlog::info("Loaded configuration from {}", path->string());
        } else {
            spdlog::warn("Config file {} does not exist, using defaults", path->string());
        }
    }

    ApplyEnvironmentOverrides(config);
    ValidateConfig(config);
    return config;
}

void ApplyEnvironmentOverrides(EngineConfig& config) {
    if (auto docker = GetEnv("SANDCASTLE_DOCKER")) {
        config.runtime.docker_binary = *docker;
    }
    if (auto image = GetEnv("SANDCASTLE_IMAGE")) {
        config.runtime.default_image = *image;
    }
    if (auto level = GetEnv("SANDCASTLE_LOG_LEVEL")) {
        config.logging.level = *level;
    }
    if (auto index_url = GetEnv("SANDCASTLE_PYPI_INDEX_URL")) {
        config.execution.index_url = *index_url;
    }
}

void ValidateConfig(const EngineConfig& config) {
    auto fail = [](const std::string& message) {
        throw SandboxException(ErrorCode::INVALID_ARGUMENT, "Invalid configuration: " + message);
    };

    if (config.runtime.default_image.empty()) fail("runtime.default_image is empty");
    if (config.runtime.label.empty()) fail("runtime.label is empty");
    if (config.runtime.working_dir.empty() || config.runtime.working_dir.front() != '/') {
        fail("runtime.working_dir must be absolute");
    }
    if (config.lifecycle.max_sandboxes == 0) fail("lifecycle.max_sandboxes must be positive");
    if (config.lifecycle.max_sandboxes_per_owner == 0) fail("lifecycle.max_sandboxes_per_owner must be positive");
    if (config.lifecycle.retry_attempts < 1) fail("lifecycle.retry_attempts must be at least 1");
    if (config.lifecycle.destroy_policy != "grace" && config.lifecycle.destroy_policy != "cancel") {
        fail("lifecycle.destroy_policy must be 'grace' or 'cancel'");
    }
    if (config.tasks.worker_count == 0) fail("tasks.worker_count must be positive");
    if (config.tasks.max_pending_tasks == 0) fail("tasks.max_pending_tasks must be positive");
    if (config.tasks.default_timeout.count() <= 0) fail("tasks.default_timeout_ms must be positive");
    if (config.tasks.maintenance_interval.count() <= 0) fail("tasks.maintenance_interval_ms must be positive");
    if (config.execution.install_command.empty()) fail("execution.install_command is empty");
    if (config.execution.list_packages_command.empty()) fail("execution.list_packages_command is empty");
    if (!utils::ParseLogLevel(config.logging.level)) fail("logging.level '" + config.logging.level + "' is unknown");
}

json ConfigToJson(const EngineConfig& config) {
    json interpreters = json::object();
    for (const auto& [language, spec] : config.execution.interpreters) {
        interpreters[language] = {{"command", spec.command}, {"extension", spec.extension}};
    }

    const auto& runtime = config.runtime;
    const auto& lifecycle = config.lifecycle;
    const auto& tasks = config.tasks;
    const auto& execution = config.execution;
    const auto& logging = config.logging;

    return {
        {"runtime", {
            {"docker_binary", runtime.docker_binary},
            {"default_image", runtime.default_image},
            {"container_command", runtime.container_command},
            {"container_prefix", runtime.container_prefix},
            {"label", runtime.label},
            {"working_dir", runtime.working_dir},
            {"network_mode", runtime.network_mode},
            {"memory_limit_mb", runtime.default_limits.memory_limit_mb},
            {"cpu_limit", runtime.default_limits.cpu_limit},
            {"pids_limit", runtime.default_limits.pids_limit},
            {"disk_budget_mb", runtime.default_limits.disk_budget_mb},
            {"mount_host_directory", runtime.mount_host_directory},
            {"data_root", runtime.data_root.string()},
            {"control_timeout_seconds", runtime.control_timeout.count()}
        }},
        {"lifecycle", {
            {"max_sandboxes", lifecycle.max_sandboxes},
            {"max_sandboxes_per_owner", lifecycle.max_sandboxes_per_owner},
            {"default_owner", lifecycle.default_owner},
            {"retry_attempts", lifecycle.retry_attempts},
            {"retry_backoff_ms", lifecycle.retry_backoff.count()},
            {"idle_threshold_seconds", lifecycle.idle_threshold.count()},
            {"idle_report_threshold_seconds", lifecycle.idle_report_threshold.count()},
            {"reclaim_interval_seconds", lifecycle.reclaim_interval.count()},
            {"destroyed_retention_seconds", lifecycle.destroyed_retention.count()},
            {"destroy_policy", lifecycle.destroy_policy},
            {"destroy_grace_period_ms", lifecycle.destroy_grace_period.count()},
            {"reset_all_containers", lifecycle.reset_all_containers},
            {"destroy_on_shutdown", lifecycle.destroy_on_shutdown}
        }},
        {"tasks", {
            {"worker_count", tasks.worker_count},
            {"max_pending_tasks", tasks.max_pending_tasks},
            {"default_timeout_ms", tasks.default_timeout.count()},
            {"result_retention_seconds", tasks.result_retention.count()},
            {"maintenance_interval_ms", tasks.maintenance_interval.count()}
        }},
        {"execution", {
            {"max_output_bytes", execution.max_output_bytes},
            {"max_download_bytes", execution.max_download_bytes},
            {"scratch_dir", execution.scratch_dir},
            {"interpreters", interpreters},
            {"install_command", execution.install_command},
            {"list_packages_command", execution.list_packages_command},
            {"index_url", execution.index_url}
        }},
        {"logging", {
            {"level", logging.level},
            {"log_file", logging.log_file},
            {"max_file_size", logging.max_file_size},
            {"backup_count", logging.backup_count},
            {"console", logging.console}
        }}
    };
}

} // namespace core
} // namespace sandcastle
