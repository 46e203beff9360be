/**
 * @file lifecycle_manager.hpp
 * @brief Sandbox creation, destruction, quotas and idle reclamation
 *
 * The lifecycle manager is the only component that creates or removes
 * containers. It keeps the record store and the container runtime in step:
 * a record is ACTIVE only while its container exists, and a container it
 * created is removed again if any later step of creation fails.
 *
 * **State transitions** (all through compare-and-swap on the record):
 * - CreateSandbox:  (new) CREATING -> ACTIVE, or CREATING -> FAILED + removed
 * - DestroySandbox: ACTIVE -> DESTROYING -> DESTROYED
 * - ReclaimIdle:    same path as DestroySandbox, skipped for busy sandboxes
 * - MarkContainerLost: ACTIVE -> FAILED
 *
 * @date 2025
 */

#pragma once

#include "sandcastle/core/types.hpp"
#include "sandcastle/core/config.hpp"
#include "sandcastle/core/sandbox_store.hpp"
#include "sandcastle/core/task_manager.hpp"
#include "sandcastle/utils/container_utils.hpp"

#include <string>
#include <vector>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <unordered_set>
#include <optional>
#include <thread>
#include <atomic>
#include <chrono>

namespace sandcastle {
namespace core {

/**
 * @struct CreateSandboxRequest
 * @brief Parameters of CreateSandbox; unset fields take configured defaults
 */
struct CreateSandboxRequest {
    std::optional<std::string> name;
    std::optional<ResourceLimits> limits;
    std::optional<std::string> image;
    std::optional<std::string> owner;
};

/**
 * @class SandboxGuard
 * @brief Shared hold on a sandbox's transition lock
 *
 * While a guard is alive the sandbox cannot start DESTROYING. Keep it only as
 * long as it takes to admit work, never across a remote call.
 */
class SandboxGuard {
public:
    SandboxGuard(SandboxGuard&&) = default;
    SandboxGuard& operator=(SandboxGuard&&) = default;

    const Sandbox& Get() const { return sandbox_; }
    const std::string& Id() const { return sandbox_.id; }

private:
    friend class LifecycleManager;

    explicit SandboxGuard(std::shared_ptr<std::shared_mutex> transition)
        : transition_(std::move(transition)), lock_(*transition_) {}

    std::shared_ptr<std::shared_mutex> transition_;
    std::shared_lock<std::shared_mutex> lock_;
    Sandbox sandbox_;
};

/**
 * @class LifecycleManager
 * @brief Creates, tracks and destroys sandboxes
 *
 * **Usage Example**:
 * @code
 * LifecycleManager lifecycle(config, store, tasks, runtime);
 * lifecycle.Recover();
 * lifecycle.Start();
 *
 * CreateSandboxRequest request;
 * request.name = "s1";
 * auto sandbox = lifecycle.CreateSandbox(request);
 * ...
 * lifecycle.DestroySandbox(sandbox.id);
 * lifecycle.Shutdown();
 * @endcode
 */
class LifecycleManager {
public:
    LifecycleManager(const EngineConfig& config,
                     SandboxStore& store,
                     TaskManager& tasks,
                     std::shared_ptr<utils::ContainerRuntime> runtime);
    ~LifecycleManager();

    LifecycleManager(const LifecycleManager&) = delete;
    LifecycleManager& operator=(const LifecycleManager&) = delete;

    // ========================================================================
    // Sandbox operations
    // ========================================================================

    /**
     * @brief Create a sandbox and its container
     *
     * @throws SandboxException INVALID_ARGUMENT (bad name or limits), CONFLICT
     *         (name in use), QUOTA_EXCEEDED (no side effects), RUNTIME_UNAVAILABLE
     *         (after retries), CREATION_ERROR (any other runtime failure)
     */
    Sandbox CreateSandbox(const CreateSandboxRequest& request);

    /**
     * @brief Tear a sandbox down; idempotent
     *
     * Destroying a DESTROYED, DESTROYING or recently evicted sandbox returns
     * without error.
     * @throws SandboxException NOT_FOUND (never known), CONFLICT (still
     *         CREATING), RUNTIME_UNAVAILABLE (record left FAILED for the sweep)
     */
    void DestroySandbox(const std::string& id_or_name);

    /**
     * @brief Snapshot of sandboxes; quiet ACTIVE sandboxes are reported IDLE
     */
    std::vector<Sandbox> ListSandboxes(const SandboxFilter& filter = {}) const;

    /**
     * @brief One sandbox by id or name, with the same IDLE view as ListSandboxes
     * @throws SandboxException NOT_FOUND
     */
    Sandbox GetSandbox(const std::string& id_or_name) const;

    /**
     * @brief Pin an ACTIVE sandbox against destruction while work is admitted
     * @throws SandboxException NOT_FOUND, SANDBOX_NOT_ACTIVE
     */
    SandboxGuard AcquireActive(const std::string& id_or_name) const;

    /// Refresh last activity
    void Touch(const std::string& id);

    /**
     * @brief Destroy sandboxes idle longer than @p threshold
     *
     * Sandboxes with outstanding tasks or a transition in progress are skipped.
     * @return Number of sandboxes destroyed
     */
    std::size_t ReclaimIdle(std::chrono::seconds threshold);

    // ========================================================================
    // Record bookkeeping for the execution engine
    // ========================================================================

    void RecordInstalledPackages(const std::string& id, const std::vector<std::string>& packages);

    /**
     * @brief Charge @p bytes against the disk budget (negative refunds)
     * @throws SandboxException QUOTA_EXCEEDED, leaving usage unchanged
     */
    void ChargeDiskUsage(const std::string& id, std::int64_t bytes);

    /**
     * @brief The backing container vanished: ACTIVE -> FAILED
     *
     * Outstanding tasks are cancelled, except @p reporting_task which is left
     * to fail with CONTAINER_GONE on its own.
     * @return true if this call made the transition
     */
    bool MarkContainerLost(const std::string& id, const std::string& reporting_task = "");

    // ========================================================================
    // Startup, maintenance, shutdown
    // ========================================================================

    /**
     * @brief Reconcile with containers already labelled as ours
     *
     * Running containers are adopted as ACTIVE records; stopped ones are
     * removed. With reset_all_containers every labelled container is removed.
     * @return Number of sandboxes adopted
     */
    std::size_t Recover();

    /**
     * @brief Destroy every live sandbox and remove any stray labelled container
     * @return Number of containers removed
     */
    std::size_t RemoveAllManaged();

    /// Retry container removal for FAILED records still holding a container
    std::size_t RetryFailedRemovals();

    /// Start the background sweep (reclaim, retry, evict)
    void Start();

    /// Stop the background sweep
    void Stop();

    /// Stop, then destroy everything when destroy_on_shutdown is set
    void Shutdown();

    const EngineConfig& Config() const { return config_; }

private:
    utils::ContainerSpec BuildContainerSpec(const Sandbox& sandbox) const;
    Sandbox Displayed(Sandbox sandbox) const;

    void AbandonCreation(const Sandbox& sandbox, const std::string& container_ref);
    void DrainTasks(const std::string& id);
    void Teardown(const Sandbox& sandbox);
    void RemoveHostDirectory(const Sandbox& sandbox) const;

    /// Bytes currently stored under the working directory, 0 if unknown
    std::uint64_t MeasureDiskUsage(const Sandbox& sandbox) const;

    void AddTombstone(const std::string& id);
    bool IsTombstoned(const std::string& id) const;

    template <typename Fn>
    auto WithRetry(const char* operation, const std::string& sandbox_id, Fn&& fn) -> decltype(fn());

    void MaintenanceLoop();

    EngineConfig config_;
    SandboxStore& store_;
    TaskManager& tasks_;
    std::shared_ptr<utils::ContainerRuntime> runtime_;

    std::mutex create_mutex_;        ///< Quota check + insert

    mutable std::mutex tombstones_mutex_;
    std::deque<std::string> tombstone_order_;
    std::unordered_set<std::string> tombstones_;

    std::atomic<bool> running_{false};
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_wakeup_;
    std::thread maintenance_thread_;
};

} // namespace core
} // namespace sandcastle
