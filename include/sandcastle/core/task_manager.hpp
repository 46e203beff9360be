/**
 * @file task_manager.hpp
 * @brief Asynchronous task framework: submit, poll, await, cancel
 *
 * Tasks run on a bounded worker pool. Each task carries an opaque owner key
 * (the sandbox id) used for fair scheduling and bulk cancellation; the task
 * manager knows nothing else about sandboxes.
 *
 * **Scheduling**: ready tasks are queued per owner. Workers take one task
 * from each owner in turn (round-robin across owners, FIFO within an owner),
 * so one busy sandbox cannot starve the others.
 *
 * **Terminal states are final**: the first transition into COMPLETED, FAILED,
 * CANCELLED or TIMED_OUT wins. A worker that finishes after its task was
 * cancelled or timed out has its result discarded.
 *
 * @date 2025
 */

#pragma once

#include "sandcastle/core/types.hpp"
#include "sandcastle/core/config.hpp"

#include <string>
#include <vector>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <condition_variable>
#include <functional>
#include <unordered_map>
#include <thread>
#include <atomic>
#include <chrono>
#include <utility>

namespace sandcastle {
namespace core {

/**
 * @class CancellationToken
 * @brief Cooperative stop signal plus deadline handed to task work
 */
class CancellationToken {
public:
    using SteadyClock = std::chrono::steady_clock;

    explicit CancellationToken(SteadyClock::time_point deadline, std::string task_id = "")
        : deadline_(deadline), task_id_(std::move(task_id)) {}

    /// Id of the task this token belongs to
    const std::string& TaskId() const { return task_id_; }

    void Cancel() noexcept { cancelled_.store(true); }
    bool IsCancelled() const noexcept { return cancelled_.load(); }

    SteadyClock::time_point Deadline() const { return deadline_; }
    bool DeadlineExceeded() const { return SteadyClock::now() >= deadline_; }

    /// Cancelled or past the deadline
    bool ShouldStop() const { return IsCancelled() || DeadlineExceeded(); }

    /// Time left before the deadline, never negative
    std::chrono::milliseconds Remaining() const;

    /**
     * @brief Throw CANCELLED or EXECUTION_TIMEOUT if work should stop
     */
    void ThrowIfStopped() const;

private:
    std::atomic<bool> cancelled_{false};
    SteadyClock::time_point deadline_;
    std::string task_id_;
};

/// Work run by a task. Throw SandboxException to fail with a specific code.
using TaskWork = std::function<TaskOutput(CancellationToken&)>;

/**
 * @class TaskManager
 * @brief Bounded worker pool with per-task records
 *
 * **Usage Example**:
 * @code
 * TaskManager tasks(config.tasks);
 * auto id = tasks.Submit("sbx-1", TaskKind::RUN_COMMAND,
 *                        [](CancellationToken& token) -> TaskOutput { ... },
 *                        std::chrono::seconds(30));
 * auto status = tasks.Await(id, std::chrono::seconds(5));
 * if (status.state == TaskState::TIMED_OUT) { ... }
 * tasks.Acknowledge(id);
 * @endcode
 */
class TaskManager {
public:
    explicit TaskManager(const TaskConfig& config);
    ~TaskManager();

    TaskManager(const TaskManager&) = delete;
    TaskManager& operator=(const TaskManager&) = delete;

    /**
     * @brief Queue @p work and return its task id immediately (PENDING)
     *
     * @param timeout Deadline measured from submission; 0 uses the default
     * @throws SandboxException QUOTA_EXCEEDED when max_pending_tasks are queued,
     *         INVALID_ARGUMENT after Shutdown()
     */
    std::string Submit(const std::string& owner, TaskKind kind, TaskWork work,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    /**
     * @brief Non-blocking snapshot
     * @throws SandboxException NOT_FOUND for unknown or purged tasks
     */
    TaskStatus Poll(const std::string& task_id) const;

    /**
     * @brief Block the caller until the task is terminal or @p timeout passes
     *
     * On timeout the task is marked TIMED_OUT and its work is signalled to stop.
     * @throws SandboxException NOT_FOUND
     */
    TaskStatus Await(const std::string& task_id, std::chrono::milliseconds timeout);

    /**
     * @brief Cooperative cancel; the task resolves to CANCELLED locally
     * @return true if this call moved the task to CANCELLED
     * @throws SandboxException NOT_FOUND
     */
    bool Cancel(const std::string& task_id);

    /**
     * @brief Collect a terminal task; later polls return NOT_FOUND
     * @return false if the task is not terminal yet
     */
    bool Acknowledge(const std::string& task_id);

    std::vector<TaskStatus> ListTasks(const std::string& owner) const;

    /// PENDING or RUNNING tasks of @p owner
    std::size_t OutstandingCount(const std::string& owner) const;

    /**
     * @brief Cancel every outstanding task of @p owner
     * @param except_task Task left running, e.g. the one reporting the failure
     * @return How many tasks moved to CANCELLED
     */
    std::size_t CancelOwner(const std::string& owner, const std::string& except_task = "");

    /**
     * @brief Wait up to @p grace for @p owner's tasks to finish on their own
     * @return true when none are outstanding
     */
    bool AwaitOwner(const std::string& owner, std::chrono::milliseconds grace);

    /// Time out outstanding tasks past their deadline
    std::size_t EnforceDeadlines();

    /// Drop terminal tasks older than the retention window
    std::size_t PurgeExpired();

    /// Cancel everything outstanding and join the workers. Idempotent.
    void Shutdown();

private:
    struct Task {
        std::string id;
        std::string owner;
        TaskKind kind{TaskKind::RUN_CODE};

        mutable std::mutex mutex;
        std::condition_variable changed;
        TaskState state{TaskState::PENDING};
        TimePoint submitted_at;
        std::optional<TimePoint> started_at;
        std::optional<TimePoint> finished_at;
        TimePoint deadline;
        std::optional<TaskOutput> output;
        std::optional<TaskError> error;

        std::shared_ptr<CancellationToken> token;
        TaskWork work;
    };

    std::shared_ptr<Task> FindTask(const std::string& task_id) const;
    std::shared_ptr<Task> RequireTask(const std::string& task_id) const;
    std::vector<std::shared_ptr<Task>> TasksOf(const std::string& owner) const;

    /// First terminal transition wins; returns false if already terminal
    bool Finish(Task& task, TaskState state, std::optional<TaskOutput> output,
                std::optional<TaskError> error);

    static TaskStatus Snapshot(const Task& task);   ///< Caller holds task.mutex

    std::shared_ptr<Task> NextReady();
    void Run(const std::shared_ptr<Task>& task);
    void WorkerLoop();
    void MaintenanceLoop();

    TaskConfig config_;

    mutable std::shared_mutex tasks_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Task>> tasks_;

    std::mutex queue_mutex_;
    std::condition_variable queue_ready_;
    std::map<std::string, std::deque<std::shared_ptr<Task>>> ready_;  ///< Per-owner FIFO
    std::deque<std::string> rotation_;                                 ///< Owners with queued work
    std::size_t queued_{0};

    std::atomic<bool> stopping_{false};
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_wakeup_;

    std::vector<std::thread> workers_;
    std::thread maintenance_thread_;
};

} // namespace core
} // namespace sandcastle
