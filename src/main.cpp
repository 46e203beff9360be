/**
 * @file main.cpp
 * @brief sandcastle - command-line front end for the sandbox engine
 *
 * Each invocation loads the configuration, reconciles with the containers
 * left by earlier invocations, runs one subcommand and prints its result as
 * JSON on stdout. Logs go to stderr.
 *
 * @code
 * sandcastle create --name s1
 * sandcastle run-code s1 --code 'print(1+1)'
 * sandcastle install s1 numpy requests
 * sandcastle destroy s1
 * @endcode
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include "sandcastle/core/config.hpp"
#include "sandcastle/core/errors.hpp"
#include "sandcastle/core/sandbox_store.hpp"
#include "sandcastle/core/task_manager.hpp"
#include "sandcastle/core/lifecycle_manager.hpp"
#include "sandcastle/core/execution_engine.hpp"
#include "sandcastle/reporters/json_reporter.hpp"
#include "sandcastle/utils/container_utils.hpp"
#include "sandcastle/utils/logger.hpp"

#include <iostream>
#include <fstream>
#include <iterator>
#include <optional>
#include <chrono>

using json = nlohmann::json;

namespace core = sandcastle::core;
namespace utils = sandcastle::utils;
namespace reporters = sandcastle::reporters;

namespace {

/*******************************************************************************
 * Engine wiring
 ******************************************************************************/

/**
 * @brief All engine components for one invocation
 *
 * Workers are joined before the execution engine they call into goes away.
 */
struct Engine {
    explicit Engine(const core::EngineConfig& config)
        : runtime(std::make_shared<utils::DockerRuntime>(
              config.runtime.docker_binary,
              std::chrono::duration_cast<std::chrono::milliseconds>(config.runtime.control_timeout)))
        , tasks(config.tasks)
        , lifecycle(config, store, tasks, runtime)
        , execution(config, lifecycle, tasks, runtime) {}

    ~Engine() {
        tasks.Shutdown();
        lifecycle.Shutdown();
    }

    std::shared_ptr<utils::ContainerRuntime> runtime;
    core::SandboxStore store;
    core::TaskManager tasks;
    core::LifecycleManager lifecycle;
    core::ExecutionEngine execution;
};

std::chrono::milliseconds Seconds(int seconds) {
    return std::chrono::milliseconds(static_cast<long long>(seconds) * 1000);
}

std::string ReadFile(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw core::SandboxException(core::ErrorCode::NOT_FOUND, "Cannot open " + path);
    }
    return std::string(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void WriteFile(const std::string& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        throw core::SandboxException(core::ErrorCode::INVALID_ARGUMENT, "Cannot write " + path);
    }
    file << content;
    if (!file) {
        throw core::SandboxException(core::ErrorCode::INTERNAL, "Write to " + path + " failed");
    }
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"sandcastle - disposable sandboxes for untrusted code"};
    app.require_subcommand(1);

    std::string config_path;
    bool verbose = false;
    app.add_option("-c,--config", config_path, "Configuration file (JSON)");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // create
    auto* create = app.add_subcommand("create", "Create a sandbox");
    std::string create_name, create_image, create_owner;
    std::size_t create_memory = 0;
    double create_cpus = 0.0;
    int create_pids = 0;
    std::uint64_t create_disk = 0;
    auto* name_opt = create->add_option("-n,--name", create_name, "Sandbox name");
    auto* image_opt = create->add_option("-i,--image", create_image, "Container image");
    auto* owner_opt = create->add_option("--owner", create_owner, "Owner charged for quota");
    auto* memory_opt = create->add_option("--memory", create_memory, "Memory limit in MB");
    auto* cpus_opt = create->add_option("--cpus", create_cpus, "CPU limit");
    auto* pids_opt = create->add_option("--pids", create_pids, "Process limit");
    auto* disk_opt = create->add_option("--disk", create_disk, "Upload budget in MB");

    // list
    auto* list = app.add_subcommand("list", "List sandboxes");
    std::string list_state, list_owner;
    bool list_all = false;
    list->add_option("--state", list_state, "Only sandboxes in this state");
    auto* list_owner_opt = list->add_option("--owner", list_owner, "Only sandboxes of this owner");
    list->add_flag("-a,--all", list_all, "Include destroyed and failed sandboxes");

    // destroy
    auto* destroy = app.add_subcommand("destroy", "Destroy a sandbox");
    std::string destroy_target;
    destroy->add_option("sandbox", destroy_target, "Sandbox id or name")->required();

    // run-code
    auto* run_code = app.add_subcommand("run-code", "Run source code in a sandbox");
    std::string code_target, code_text, code_file, code_language = "python";
    int code_timeout = 0;
    run_code->add_option("sandbox", code_target, "Sandbox id or name")->required();
    auto* code_source = run_code->add_option_group("source", "Code to run");
    code_source->add_option("--code", code_text, "Inline source");
    code_source->add_option("--file", code_file, "Source file")->check(CLI::ExistingFile);
    code_source->require_option(1);
    run_code->add_option("-l,--language", code_language, "Interpreter (python, bash, node, ...)");
    run_code->add_option("-t,--timeout", code_timeout, "Timeout in seconds");

    // run-command
    auto* run_command = app.add_subcommand("run-command", "Run a shell command in a sandbox");
    std::string command_target, command_text, command_workdir;
    int command_timeout = 0;
    run_command->add_option("sandbox", command_target, "Sandbox id or name")->required();
    run_command->add_option("command", command_text, "Shell command")->required();
    auto* workdir_opt = run_command->add_option("-w,--workdir", command_workdir, "Working directory");
    run_command->add_option("-t,--timeout", command_timeout, "Timeout in seconds");

    // install
    auto* install = app.add_subcommand("install", "Install packages in a sandbox");
    std::string install_target, install_index;
    std::vector<std::string> install_packages;
    int install_timeout = 0;
    install->add_option("sandbox", install_target, "Sandbox id or name")->required();
    install->add_option("packages", install_packages, "Package specifications")->required();
    auto* index_opt = install->add_option("--index-url", install_index, "Package index mirror");
    install->add_option("-t,--timeout", install_timeout, "Timeout in seconds");

    // packages
    auto* packages = app.add_subcommand("packages", "Show whether packages are installed");
    std::string packages_target;
    std::vector<std::string> packages_names;
    packages->add_option("sandbox", packages_target, "Sandbox id or name")->required();
    packages->add_option("packages", packages_names, "Package names")->required();

    // upload
    auto* upload = app.add_subcommand("upload", "Copy a local file into a sandbox");
    std::string upload_target, upload_local, upload_destination;
    upload->add_option("sandbox", upload_target, "Sandbox id or name")->required();
    upload->add_option("local", upload_local, "Local file")->required()->check(CLI::ExistingFile);
    upload->add_option("destination", upload_destination, "Path inside the sandbox")->required();

    // download
    auto* download = app.add_subcommand("download", "Read a file from a sandbox");
    std::string download_target, download_path, download_output;
    download->add_option("sandbox", download_target, "Sandbox id or name")->required();
    download->add_option("path", download_path, "Path inside the sandbox")->required();
    auto* output_opt = download->add_option("-o,--output", download_output, "Write content to this file");

    // ls
    auto* ls = app.add_subcommand("ls", "List a directory in a sandbox");
    std::string ls_target, ls_path = ".";
    ls->add_option("sandbox", ls_target, "Sandbox id or name")->required();
    ls->add_option("path", ls_path, "Directory inside the sandbox");

    // reclaim
    auto* reclaim = app.add_subcommand("reclaim", "Destroy idle sandboxes");
    int reclaim_seconds = -1;
    reclaim->add_option("--idle-seconds", reclaim_seconds, "Idle threshold (default from config)");

    // reset
    auto* reset = app.add_subcommand("reset", "Destroy every managed sandbox and container");

    // config
    auto* show_config = app.add_subcommand("config", "Print the effective configuration");

    try {
        app.parse(argc, argv);

        auto config = core::LoadConfig(config_path.empty()
                                           ? std::nullopt
                                           : std::optional<std::filesystem::path>(config_path));
        if (verbose) {
            config.logging.level = "debug";
        }
        utils::InitLogger(config.logging);

        reporters::JsonReporterConfig report_config;
        report_config.include_file_content = !output_opt->count();
        reporters::JsonReporter reporter(report_config);

        if (*show_config) {
            std::cout << reporter.Render(core::ConfigToJson(config)) << std::endl;
            return 0;
        }

        Engine engine(config);
        engine.lifecycle.Recover();

        json result;

        if (*create) {
            core::CreateSandboxRequest request;
            if (name_opt->count()) request.name = create_name;
            if (image_opt->count()) request.image = create_image;
            if (owner_opt->count()) request.owner = create_owner;
            if (memory_opt->count() || cpus_opt->count() || pids_opt->count() || disk_opt->count()) {
                core::ResourceLimits limits = config.runtime.default_limits;
                if (memory_opt->count()) limits.memory_limit_mb = create_memory;
                if (cpus_opt->count()) limits.cpu_limit = create_cpus;
                if (pids_opt->count()) limits.pids_limit = create_pids;
                if (disk_opt->count()) limits.disk_budget_mb = create_disk;
                request.limits = limits;
            }
            result = reporter.SandboxToJson(engine.lifecycle.CreateSandbox(request));
        }
        else if (*list) {
            core::SandboxFilter filter;
            filter.include_terminal = list_all;
            if (list_owner_opt->count()) {
                filter.owner = list_owner;
            }
            if (!list_state.empty()) {
                filter.state = core::ParseSandboxState(list_state);
                if (!filter.state) {
                    throw core::SandboxException(core::ErrorCode::INVALID_ARGUMENT,
                                                 "Unknown state: " + list_state);
                }
            }
            result = reporter.SandboxesToJson(engine.lifecycle.ListSandboxes(filter));
        }
        else if (*destroy) {
            auto sandbox = engine.lifecycle.GetSandbox(destroy_target);
            engine.lifecycle.DestroySandbox(sandbox.id);
            result = {{"id", sandbox.id}, {"destroyed", true}};
        }
        else if (*run_code) {
            core::RunCodeRequest request;
            request.code = code_file.empty() ? code_text : ReadFile(code_file);
            request.language = code_language;
            result = reporter.OutputToJson(
                engine.execution.RunCode(code_target, request, Seconds(code_timeout)));
        }
        else if (*run_command) {
            core::RunCommandRequest request;
            request.command = command_text;
            if (workdir_opt->count()) {
                request.working_dir = command_workdir;
            }
            result = reporter.OutputToJson(
                engine.execution.RunCommand(command_target, request, Seconds(command_timeout)));
        }
        else if (*install) {
            core::InstallPackagesRequest request;
            request.packages = install_packages;
            if (index_opt->count()) {
                request.index_url = install_index;
            }
            result = reporter.OutputToJson(
                engine.execution.InstallPackages(install_target, request, Seconds(install_timeout)));
        }
        else if (*packages) {
            core::PackageStatusRequest request;
            request.packages = packages_names;
            result = reporter.OutputToJson(engine.execution.PackageStatus(packages_target, request));
        }
        else if (*upload) {
            core::UploadFileRequest request;
            request.destination = upload_destination;
            request.local_path = upload_local;
            result = reporter.OutputToJson(engine.execution.UploadFile(upload_target, request));
        }
        else if (*download) {
            auto file = engine.execution.DownloadFile(download_target, core::DownloadFileRequest{download_path});
            if (output_opt->count()) {
                WriteFile(download_output, file.content);
                spdlog::info("Wrote {} bytes to {}", file.size, download_output);
            }
            result = reporter.OutputToJson(file);
        }
        else if (*ls) {
            result = reporter.OutputToJson(
                engine.execution.ListDirectory(ls_target, core::ListDirectoryRequest{ls_path}));
        }
        else if (*reclaim) {
            auto threshold = reclaim_seconds >= 0 ? std::chrono::seconds(reclaim_seconds)
                                                  : config.lifecycle.idle_threshold;
            result = {{"reclaimed", engine.lifecycle.ReclaimIdle(threshold)}};
        }
        else if (*reset) {
            result = {{"removed", engine.lifecycle.RemoveAllManaged()}};
        }

        std::cout << reporter.Render(result) << std::endl;
        return 0;

    } catch (const CLI::ParseError& e) {
        return app.exit(e);
    } catch (const core::SandboxException& e) {
        spdlog::error("{} ({})", e.what(), core::ErrorCodeToString(e.Code()));
        std::cout << reporters::JsonReporter().Render(reporters::JsonReporter().ExceptionToJson(e))
                  << std::endl;
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
