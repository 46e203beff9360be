/**
 * @file lifecycle_manager.cpp
 * @brief Implementation of sandbox creation, teardown and reclamation
 *
 * **Lock order**: create_mutex_ -> store locks. A record's transition lock is
 * taken exclusively only around the ACTIVE -> DESTROYING swap, never across a
 * runtime call.
 *
 * @date 2025
 */

#include "sandcastle/core/lifecycle_manager.hpp"
#include "sandcastle/core/errors.hpp"
#include "sandcastle/utils/hash_utils.hpp"
#include "sandcastle/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <filesystem>
#include <algorithm>
#include <sstream>
#include <iomanip>

namespace fs = std::filesystem;

namespace sandcastle {
namespace core {

namespace {

constexpr std::size_t kMaxTombstones = 4096;
constexpr std::chrono::seconds kMeasureTimeout{30};

// Container labels
const char* const kLabelId = "sandcastle.id";
const char* const kLabelOwner = "sandcastle.owner";
const char* const kLabelName = "sandcastle.name";
const char* const kLabelMemory = "sandcastle.memory_mb";
const char* const kLabelCpus = "sandcastle.cpus";

std::string FormatCpus(double cpus) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << cpus;
    return oss.str();
}

std::string LabelOr(const std::map<std::string, std::string>& labels,
                    const std::string& key, const std::string& fallback) {
    auto it = labels.find(key);
    return (it == labels.end() || it->second.empty()) ? fallback : it->second;
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

LifecycleManager::LifecycleManager(const EngineConfig& config,
                                   SandboxStore& store,
                                   TaskManager& tasks,
                                   std::shared_ptr<utils::ContainerRuntime> runtime)
    : config_(config)
    , store_(store)
    , tasks_(tasks)
    , runtime_(std::move(runtime)) {
    if (!runtime_) {
        throw SandboxException(ErrorCode::INVALID_ARGUMENT, "Lifecycle manager needs a container runtime");
    }
}

LifecycleManager::~LifecycleManager() {
    Stop();
}

// ============================================================================
// HELPERS
// ============================================================================

template <typename Fn>
auto LifecycleManager::WithRetry(const char* operation, const std::string& sandbox_id, Fn&& fn)
    -> decltype(fn()) {
    const int attempts = std::max(1, config_.lifecycle.retry_attempts);
    auto backoff = config_.lifecycle.retry_backoff;

    for (int attempt = 1;; ++attempt) {
        try {
            return fn();
        }
        catch (const SandboxException& e) {
            if (e.Code() != ErrorCode::RUNTIME_UNAVAILABLE || attempt >= attempts) {
                throw;
            }
            spdlog::warn("{} for {} failed (attempt {}/{}): {}; retrying in {}ms",
                         operation, sandbox_id, attempt, attempts, e.what(), backoff.count());
        }
        std::this_thread::sleep_for(backoff);
        backoff *= 2;
    }
}

utils::ContainerSpec LifecycleManager::BuildContainerSpec(const Sandbox& sandbox) const {
    utils::ContainerSpec spec;
    spec.name = sandbox.container_name;
    spec.image = sandbox.image;
    spec.command = config_.runtime.container_command;
    spec.memory_limit_mb = sandbox.limits.memory_limit_mb;
    spec.cpu_limit = sandbox.limits.cpu_limit;
    spec.pids_limit = sandbox.limits.pids_limit;
    spec.network_mode = config_.runtime.network_mode;
    spec.working_dir = sandbox.working_dir;

    for (const auto& mount : sandbox.mounts) {
        spec.mounts.push_back(utils::BindMount{mount.host_path, mount.container_path, mount.read_only});
    }

    spec.labels[config_.runtime.label] = "true";
    spec.labels[kLabelId] = sandbox.id;
    spec.labels[kLabelOwner] = sandbox.owner;
    spec.labels[kLabelMemory] = std::to_string(sandbox.limits.memory_limit_mb);
    spec.labels[kLabelCpus] = FormatCpus(sandbox.limits.cpu_limit);
    if (sandbox.name) {
        spec.labels[kLabelName] = *sandbox.name;
    }
    return spec;
}

Sandbox LifecycleManager::Displayed(Sandbox sandbox) const {
    if (sandbox.state == SandboxState::ACTIVE &&
        Clock::now() - sandbox.last_active_at > config_.lifecycle.idle_report_threshold) {
        sandbox.state = SandboxState::IDLE;
    }
    return sandbox;
}

void LifecycleManager::AddTombstone(const std::string& id) {
    std::lock_guard<std::mutex> lock(tombstones_mutex_);
    if (!tombstones_.insert(id).second) {
        return;
    }
    tombstone_order_.push_back(id);
    while (tombstone_order_.size() > kMaxTombstones) {
        tombstones_.erase(tombstone_order_.front());
        tombstone_order_.pop_front();
    }
}

bool LifecycleManager::IsTombstoned(const std::string& id) const {
    std::lock_guard<std::mutex> lock(tombstones_mutex_);
    return tombstones_.count(id) > 0;
}

void LifecycleManager::RemoveHostDirectory(const Sandbox& sandbox) const {
    for (const auto& mount : sandbox.mounts) {
        std::error_code ec;
        fs::remove_all(mount.host_path, ec);
        if (ec) {
            spdlog::warn("Could not remove host directory {} of {}: {}",
                         mount.host_path.string(), sandbox.id, ec.message());
        }
    }
}

std::uint64_t LifecycleManager::MeasureDiskUsage(const Sandbox& sandbox) const {
    utils::ExecOptions options;
    options.timeout = kMeasureTimeout;
    try {
        auto result = runtime_->Exec(sandbox.container_ref, {"du", "-sb", sandbox.working_dir}, options);
        if (result.exit_code == 0) {
            auto fields = utils::StringUtils::Split(utils::StringUtils::Trim(result.stdout_output), '\t');
            if (!fields.empty()) {
                return std::stoull(fields.front());
            }
        }
        spdlog::warn("Could not measure disk usage of {}: {}", sandbox.id,
                     utils::StringUtils::Trim(result.stderr_output));
    }
    catch (const SandboxException& e) {
        spdlog::warn("Could not measure disk usage of {}: {}", sandbox.id, e.what());
    }
    catch (const std::logic_error& e) {
        spdlog::warn("Unreadable disk usage for {}: {}", sandbox.id, e.what());
    }
    return 0;
}

// ============================================================================
// CREATE
// ============================================================================

Sandbox LifecycleManager::CreateSandbox(const CreateSandboxRequest& request) {
    const std::string owner = request.owner.value_or(config_.lifecycle.default_owner);

    if (request.name && !utils::StringUtils::IsValidSandboxName(*request.name)) {
        throw SandboxException(ErrorCode::INVALID_ARGUMENT,
                               "Invalid sandbox name: '" + *request.name + "'",
                               ErrorContext{"", "", "create"});
    }

    ResourceLimits limits = request.limits.value_or(config_.runtime.default_limits);
    if (limits.memory_limit_mb == 0 || limits.cpu_limit <= 0.0 || limits.pids_limit <= 0) {
        throw SandboxException(ErrorCode::INVALID_ARGUMENT, "Resource limits must be positive",
                               ErrorContext{"", "", "create"});
    }

    Sandbox sandbox;
    sandbox.id = utils::HashUtils::GenerateId("sbx");
    sandbox.name = request.name;
    sandbox.owner = owner;
    sandbox.image = request.image.value_or(config_.runtime.default_image);
    sandbox.container_name = config_.runtime.container_prefix + sandbox.id;
    sandbox.state = SandboxState::CREATING;
    sandbox.created_at = Clock::now();
    sandbox.last_active_at = sandbox.created_at;
    sandbox.limits = limits;
    sandbox.working_dir = config_.runtime.working_dir;

    if (config_.runtime.mount_host_directory) {
        sandbox.mounts.push_back(VolumeMount{
            fs::absolute(config_.runtime.data_root / sandbox.container_name),
            sandbox.working_dir, false});
    }

    // Quota check and insert are one step; nothing touches the runtime before
    // the record exists.
    {
        std::lock_guard<std::mutex> lock(create_mutex_);

        auto live = store_.Count([](const Sandbox& s) { return !IsTerminal(s.state); });
        if (live >= config_.lifecycle.max_sandboxes) {
            spdlog::warn("Sandbox quota reached ({}/{})", live, config_.lifecycle.max_sandboxes);
            throw SandboxException(ErrorCode::QUOTA_EXCEEDED,
                                   "Maximum number of sandboxes reached (" +
                                       std::to_string(config_.lifecycle.max_sandboxes) + ")",
                                   ErrorContext{"", "", "create"});
        }

        auto owned = store_.Count([&owner](const Sandbox& s) {
            return !IsTerminal(s.state) && s.owner == owner;
        });
        if (owned >= config_.lifecycle.max_sandboxes_per_owner) {
            spdlog::warn("Sandbox quota reached for owner {} ({}/{})",
                         owner, owned, config_.lifecycle.max_sandboxes_per_owner);
            throw SandboxException(ErrorCode::QUOTA_EXCEEDED,
                                   "Maximum number of sandboxes for '" + owner + "' reached (" +
                                       std::to_string(config_.lifecycle.max_sandboxes_per_owner) + ")",
                                   ErrorContext{"", "", "create"});
        }

        store_.Put(sandbox);
    }

    spdlog::info("Creating sandbox {}{} from {}", sandbox.id,
                 sandbox.name ? " (" + *sandbox.name + ")" : std::string(), sandbox.image);

    std::string container_ref;
    try {
        for (const auto& mount : sandbox.mounts) {
            std::error_code ec;
            fs::create_directories(mount.host_path, ec);
            if (ec) {
                throw SandboxException(ErrorCode::CREATION_ERROR,
                                       "Cannot create host directory " + mount.host_path.string() +
                                           ": " + ec.message());
            }
        }

        auto spec = BuildContainerSpec(sandbox);
        container_ref = WithRetry("create", sandbox.id, [this, &spec]() {
            return runtime_->CreateContainer(spec);
        });

        sandbox = store_.Update(sandbox.id, [&container_ref](Sandbox& s) {
            s.container_ref = container_ref;
            s.last_active_at = Clock::now();
        });

        if (!store_.CompareAndSwapState(sandbox.id, SandboxState::CREATING, SandboxState::ACTIVE)) {
            throw SandboxException(ErrorCode::CREATION_ERROR, "Sandbox left CREATING unexpectedly");
        }
        sandbox.state = SandboxState::ACTIVE;
    }
    catch (const SandboxException& e) {
        AbandonCreation(sandbox, container_ref);
        auto code = e.Code() == ErrorCode::RUNTIME_UNAVAILABLE ? ErrorCode::RUNTIME_UNAVAILABLE
                                                               : ErrorCode::CREATION_ERROR;
        throw SandboxException(code, std::string("Failed to create sandbox: ") + e.what(),
                               ErrorContext{sandbox.id, "", "create"});
    }
    catch (const std::exception& e) {
        AbandonCreation(sandbox, container_ref);
        throw SandboxException(ErrorCode::CREATION_ERROR,
                               std::string("Failed to create sandbox: ") + e.what(),
                               ErrorContext{sandbox.id, "", "create"});
    }

    spdlog::info("Sandbox {} active (container {})", sandbox.id,
                 utils::StringUtils::Truncate(sandbox.container_ref, 12, ""));
    return sandbox;
}

void LifecycleManager::AbandonCreation(const Sandbox& sandbox, const std::string& container_ref) {
    spdlog::error("Creation of sandbox {} failed, rolling back", sandbox.id);

    store_.CompareAndSwapState(sandbox.id, SandboxState::CREATING, SandboxState::FAILED);
    store_.Remove(sandbox.id);

    // The runtime may have created the container before reporting failure
    const std::string target = container_ref.empty() ? sandbox.container_name : container_ref;
    try {
        runtime_->RemoveContainer(target);
    }
    catch (const SandboxException& e) {
        spdlog::warn("Could not remove container {} of failed sandbox {}: {}",
                     target, sandbox.id, e.what());
    }

    RemoveHostDirectory(sandbox);
}

// ============================================================================
// DESTROY
// ============================================================================

void LifecycleManager::DestroySandbox(const std::string& id_or_name) {
    auto found = store_.Find(id_or_name);
    if (!found) {
        if (IsTombstoned(id_or_name)) {
            spdlog::debug("Sandbox {} already destroyed", id_or_name);
            return;
        }
        throw SandboxException(ErrorCode::NOT_FOUND, "Sandbox not found: " + id_or_name,
                               ErrorContext{id_or_name, "", "destroy"});
    }
    const std::string id = found->id;

    switch (found->state) {
        case SandboxState::DESTROYED:
        case SandboxState::DESTROYING:
            return;
        case SandboxState::CREATING:
            throw SandboxException(ErrorCode::CONFLICT, "Sandbox is still being created",
                                   ErrorContext{id, "", "destroy"});
        case SandboxState::FAILED:
            RetryFailedRemovals();
            return;
        case SandboxState::ACTIVE:
        case SandboxState::IDLE:
            break;
    }

    {
        auto transition = store_.TransitionLock(id);
        std::unique_lock<std::shared_mutex> lock(*transition);
        if (!store_.CompareAndSwapState(id, SandboxState::ACTIVE, SandboxState::DESTROYING)) {
            // Another caller got there first, or the container was lost
            spdlog::debug("Sandbox {} no longer ACTIVE, nothing to destroy", id);
            return;
        }
    }

    Teardown(store_.Get(id));
}

void LifecycleManager::DrainTasks(const std::string& id) {
    const auto grace = config_.lifecycle.destroy_grace_period;

    if (config_.lifecycle.destroy_policy == "cancel") {
        tasks_.CancelOwner(id);
        tasks_.AwaitOwner(id, grace);
        return;
    }

    if (!tasks_.AwaitOwner(id, grace)) {
        spdlog::info("Sandbox {} still busy after {}ms grace period, cancelling", id, grace.count());
        tasks_.CancelOwner(id);
    }
}

void LifecycleManager::Teardown(const Sandbox& sandbox) {
    spdlog::info("Destroying sandbox {}", sandbox.id);

    DrainTasks(sandbox.id);

    const std::string target = sandbox.container_ref.empty() ? sandbox.container_name
                                                             : sandbox.container_ref;
    try {
        bool existed = WithRetry("remove", sandbox.id, [this, &target]() {
            return runtime_->RemoveContainer(target);
        });
        if (!existed) {
            spdlog::info("Container of sandbox {} was already gone", sandbox.id);
        }
    }
    catch (const SandboxException& e) {
        spdlog::error("Could not remove container of sandbox {}: {}", sandbox.id, e.what());
        store_.CompareAndSwapState(sandbox.id, SandboxState::DESTROYING, SandboxState::FAILED);
        throw SandboxException(e.Code(), std::string("Failed to destroy sandbox: ") + e.what(),
                               ErrorContext{sandbox.id, "", "destroy"});
    }

    RemoveHostDirectory(sandbox);

    store_.Update(sandbox.id, [](Sandbox& s) { s.container_ref.clear(); });
    store_.CompareAndSwapState(sandbox.id, SandboxState::DESTROYING, SandboxState::DESTROYED);
    AddTombstone(sandbox.id);

    spdlog::info("Sandbox {} destroyed", sandbox.id);
}

// ============================================================================
// QUERIES
// ============================================================================

std::vector<Sandbox> LifecycleManager::ListSandboxes(const SandboxFilter& filter) const {
    SandboxFilter query = filter;
    query.state.reset();
    if (filter.state && IsTerminal(*filter.state)) {
        query.include_terminal = true;
    }

    std::vector<Sandbox> result;
    for (auto& sandbox : store_.List(query)) {
        auto shown = Displayed(std::move(sandbox));
        if (filter.state && shown.state != *filter.state) {
            continue;
        }
        result.push_back(std::move(shown));
    }
    return result;
}

Sandbox LifecycleManager::GetSandbox(const std::string& id_or_name) const {
    return Displayed(store_.Get(id_or_name));
}

SandboxGuard LifecycleManager::AcquireActive(const std::string& id_or_name) const {
    auto id = store_.Get(id_or_name).id;

    SandboxGuard guard(store_.TransitionLock(id));
    guard.sandbox_ = store_.Get(id);

    if (guard.sandbox_.state != SandboxState::ACTIVE) {
        throw SandboxException(ErrorCode::SANDBOX_NOT_ACTIVE,
                               "Sandbox is " + std::string(SandboxStateToString(guard.sandbox_.state)),
                               ErrorContext{id, "", ""});
    }
    return guard;
}

void LifecycleManager::Touch(const std::string& id) {
    store_.Update(id, [](Sandbox& s) { s.last_active_at = Clock::now(); });
}

// ============================================================================
// RECLAMATION
// ============================================================================

std::size_t LifecycleManager::ReclaimIdle(std::chrono::seconds threshold) {
    if (threshold.count() <= 0) {
        return 0;
    }

    std::size_t reclaimed = 0;
    SandboxFilter filter;
    filter.state = SandboxState::ACTIVE;

    for (const auto& candidate : store_.List(filter)) {
        if (Clock::now() - candidate.last_active_at <= threshold) {
            continue;
        }

        {
            std::shared_ptr<std::shared_mutex> transition;
            try {
                transition = store_.TransitionLock(candidate.id);
            }
            catch (const SandboxException& e) {
                spdlog::debug("Skipping reclaim of {}: {}", candidate.id, e.what());
                continue;
            }

            std::unique_lock<std::shared_mutex> lock(*transition, std::try_to_lock);
            if (!lock.owns_lock()) {
                continue;   // work being admitted right now
            }
            if (tasks_.OutstandingCount(candidate.id) > 0) {
                continue;
            }

            auto current = store_.Find(candidate.id);
            if (!current || current->state != SandboxState::ACTIVE ||
                Clock::now() - current->last_active_at <= threshold) {
                continue;
            }
            if (!store_.CompareAndSwapState(candidate.id, SandboxState::ACTIVE, SandboxState::DESTROYING)) {
                continue;
            }
        }

        spdlog::info("Reclaiming idle sandbox {}", candidate.id);
        try {
            Teardown(store_.Get(candidate.id));
            ++reclaimed;
        }
        catch (const SandboxException& e) {
            spdlog::error("Reclaim of {} failed: {}", candidate.id, e.what());
        }
    }

    if (reclaimed > 0) {
        spdlog::info("Reclaimed {} idle sandbox(es)", reclaimed);
    }
    return reclaimed;
}

std::size_t LifecycleManager::RetryFailedRemovals() {
    SandboxFilter filter;
    filter.state = SandboxState::FAILED;
    filter.include_terminal = true;

    std::size_t removed = 0;
    for (const auto& sandbox : store_.List(filter)) {
        if (sandbox.container_ref.empty()) {
            continue;
        }
        try {
            runtime_->RemoveContainer(sandbox.container_ref);
            store_.Update(sandbox.id, [](Sandbox& s) { s.container_ref.clear(); });
            RemoveHostDirectory(sandbox);
            ++removed;
            spdlog::info("Removed leftover container of failed sandbox {}", sandbox.id);
        }
        catch (const SandboxException& e) {
            spdlog::warn("Leftover container of {} still not removable: {}", sandbox.id, e.what());
        }
    }
    return removed;
}

// ============================================================================
// BOOKKEEPING
// ============================================================================

void LifecycleManager::RecordInstalledPackages(const std::string& id,
                                               const std::vector<std::string>& packages) {
    if (packages.empty()) {
        return;
    }
    store_.Update(id, [&packages](Sandbox& s) {
        for (const auto& package : packages) {
            s.installed_packages.insert(utils::StringUtils::NormalizePackageName(package));
        }
    });
}

void LifecycleManager::ChargeDiskUsage(const std::string& id, std::int64_t bytes) {
    store_.Update(id, [&id, bytes](Sandbox& s) {
        if (bytes < 0) {
            auto refund = static_cast<std::uint64_t>(-bytes);
            s.disk_used_bytes = refund > s.disk_used_bytes ? 0 : s.disk_used_bytes - refund;
            return;
        }
        const std::uint64_t budget = s.limits.disk_budget_mb * 1024ull * 1024ull;
        if (s.disk_used_bytes + static_cast<std::uint64_t>(bytes) > budget) {
            throw SandboxException(ErrorCode::QUOTA_EXCEEDED,
                                   "Disk budget of " + std::to_string(s.limits.disk_budget_mb) +
                                       "MB exceeded",
                                   ErrorContext{id, "", "upload_file"});
        }
        s.disk_used_bytes += static_cast<std::uint64_t>(bytes);
    });
}

bool LifecycleManager::MarkContainerLost(const std::string& id, const std::string& reporting_task) {
    if (!store_.CompareAndSwapState(id, SandboxState::ACTIVE, SandboxState::FAILED)) {
        return false;
    }
    spdlog::error("Container of sandbox {} is gone; sandbox marked FAILED", id);
    tasks_.CancelOwner(id, reporting_task);
    return true;
}

// ============================================================================
// RECOVERY
// ============================================================================

std::size_t LifecycleManager::Recover() {
    const std::string selector = config_.runtime.label + "=true";
    auto containers = WithRetry("list", "", [this, &selector]() {
        return runtime_->ListContainers(selector);
    });

    std::size_t adopted = 0;
    std::size_t removed = 0;

    for (const auto& container : containers) {
        const bool reset = config_.lifecycle.reset_all_containers;
        if (reset || container.state != utils::ContainerState::RUNNING) {
            try {
                runtime_->RemoveContainer(container.id);
                ++removed;
            }
            catch (const SandboxException& e) {
                spdlog::warn("Could not remove container {}: {}", container.name, e.what());
            }
            continue;
        }

        if (store_.FindByContainer(container.id)) {
            continue;
        }

        Sandbox sandbox;
        sandbox.id = LabelOr(container.labels, kLabelId, utils::HashUtils::GenerateId("sbx"));
        sandbox.owner = LabelOr(container.labels, kLabelOwner, config_.lifecycle.default_owner);
        auto name = LabelOr(container.labels, kLabelName, "");
        if (!name.empty()) {
            sandbox.name = name;
        }
        sandbox.image = container.image;
        sandbox.container_ref = container.id;
        sandbox.container_name = container.name;
        sandbox.state = SandboxState::ACTIVE;
        sandbox.created_at = container.created_at;
        // Activity before this process started is unknown
        sandbox.last_active_at = Clock::now();
        sandbox.limits = config_.runtime.default_limits;
        sandbox.working_dir = config_.runtime.working_dir;
        sandbox.disk_used_bytes = MeasureDiskUsage(sandbox);

        try {
            sandbox.limits.memory_limit_mb = std::stoul(
                LabelOr(container.labels, kLabelMemory, std::to_string(sandbox.limits.memory_limit_mb)));
            sandbox.limits.cpu_limit = std::stod(
                LabelOr(container.labels, kLabelCpus, FormatCpus(sandbox.limits.cpu_limit)));
        }
        catch (const std::exception& e) {
            spdlog::warn("Container {} carries malformed limit labels ({}), using defaults",
                         container.name, e.what());
            sandbox.limits = config_.runtime.default_limits;
        }

        if (config_.runtime.mount_host_directory) {
            sandbox.mounts.push_back(VolumeMount{
                fs::absolute(config_.runtime.data_root / sandbox.container_name),
                sandbox.working_dir, false});
        }

        try {
            store_.Put(sandbox);
            ++adopted;
        }
        catch (const SandboxException& e) {
            spdlog::warn("Not adopting container {}: {}", container.name, e.what());
        }
    }

    if (adopted > 0 || removed > 0) {
        spdlog::info("Recovered {} sandbox(es), removed {} container(s)", adopted, removed);
    }
    return adopted;
}

std::size_t LifecycleManager::RemoveAllManaged() {
    std::size_t removed = 0;

    for (const auto& sandbox : store_.List()) {
        if (sandbox.state != SandboxState::ACTIVE) {
            continue;
        }
        try {
            DestroySandbox(sandbox.id);
            ++removed;
        }
        catch (const SandboxException& e) {
            spdlog::error("Could not destroy {}: {}", sandbox.id, e.what());
        }
    }

    const std::string selector = config_.runtime.label + "=true";
    for (const auto& container : WithRetry("list", "", [this, &selector]() {
             return runtime_->ListContainers(selector);
         })) {
        if (runtime_->RemoveContainer(container.id)) {
            ++removed;
        }
    }

    spdlog::info("Removed {} managed container(s)", removed);
    return removed;
}

// ============================================================================
// MAINTENANCE
// ============================================================================

void LifecycleManager::Start() {
    if (running_.exchange(true)) {
        return;
    }
    maintenance_thread_ = std::thread([this]() { MaintenanceLoop(); });
    spdlog::debug("Lifecycle maintenance every {}s", config_.lifecycle.reclaim_interval.count());
}

void LifecycleManager::Stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
    }
    maintenance_wakeup_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
}

void LifecycleManager::MaintenanceLoop() {
    while (running_.load()) {
        {
            std::unique_lock<std::mutex> lock(maintenance_mutex_);
            maintenance_wakeup_.wait_for(lock, config_.lifecycle.reclaim_interval,
                                         [this]() { return !running_.load(); });
        }
        if (!running_.load()) {
            break;
        }

        try {
            ReclaimIdle(config_.lifecycle.idle_threshold);
            RetryFailedRemovals();
            store_.EvictTerminal(config_.lifecycle.destroyed_retention);
        }
        catch (const std::exception& e) {
            spdlog::error("Lifecycle maintenance pass failed: {}", e.what());
        }
    }
}

void LifecycleManager::Shutdown() {
    Stop();

    if (!config_.lifecycle.destroy_on_shutdown) {
        return;
    }

    spdlog::info("Destroying all sandboxes on shutdown");
    for (const auto& sandbox : store_.List()) {
        try {
            DestroySandbox(sandbox.id);
        }
        catch (const SandboxException& e) {
            spdlog::error("Could not destroy {} on shutdown: {}", sandbox.id, e.what());
        }
    }
}

} // namespace core
} // namespace sandcastle
