/**
 * @file task_manager.cpp
 * @brief Implementation of the fair, bounded task worker pool
 *
 * **Threads**:
 * - N workers pull from the per-owner ready queues
 * - one maintenance thread times out tasks past their deadline and purges
 *   terminal tasks once the retention window has passed
 *
 * **Locks**: tasks_mutex_ (table) -> Task::mutex (record). queue_mutex_ is
 * never held together with either.
 *
 * @date 2025
 */

#include "sandcastle/core/task_manager.hpp"
#include "sandcastle/core/errors.hpp"
#include "sandcastle/utils/hash_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sandcastle {
namespace core {

namespace {

ErrorContext ContextOf(const std::string& owner, const std::string& task_id, TaskKind kind) {
    return ErrorContext{owner, task_id, TaskKindToString(kind)};
}

ErrorContext MergeContext(ErrorContext primary, const ErrorContext& fallback) {
    if (primary.sandbox_id.empty()) primary.sandbox_id = fallback.sandbox_id;
    if (primary.task_id.empty()) primary.task_id = fallback.task_id;
    if (primary.kind.empty()) primary.kind = fallback.kind;
    return primary;
}

bool FinishLocked(TaskState& current, TaskState next) {
    if (IsTerminal(current)) {
        return false;
    }
    current = next;
    return true;
}

} // anonymous namespace

// ============================================================================
// CANCELLATION TOKEN
// ============================================================================

std::chrono::milliseconds CancellationToken::Remaining() const {
    auto left = deadline_ - SteadyClock::now();
    if (left <= SteadyClock::duration::zero()) {
        return std::chrono::milliseconds(0);
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(left);
}

void CancellationToken::ThrowIfStopped() const {
    if (IsCancelled()) {
        throw SandboxException(ErrorCode::CANCELLED, "Task cancelled");
    }
    if (DeadlineExceeded()) {
        throw SandboxException(ErrorCode::EXECUTION_TIMEOUT, "Task deadline exceeded");
    }
}

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

TaskManager::TaskManager(const TaskConfig& config)
    : config_(config) {
    for (std::size_t i = 0; i < config_.worker_count; ++i) {
        workers_.emplace_back([this]() { WorkerLoop(); });
    }
    maintenance_thread_ = std::thread([this]() { MaintenanceLoop(); });

    spdlog::info("Task manager started with {} worker(s)", config_.worker_count);
}

TaskManager::~TaskManager() {
    Shutdown();
}

// ============================================================================
// SUBMISSION
// ============================================================================

std::string TaskManager::Submit(const std::string& owner, TaskKind kind, TaskWork work,
                                std::chrono::milliseconds timeout) {
    if (stopping_.load()) {
        throw SandboxException(ErrorCode::INVALID_ARGUMENT, "Task manager is shut down",
                               ErrorContext{owner, "", TaskKindToString(kind)});
    }
    if (!work) {
        throw SandboxException(ErrorCode::INVALID_ARGUMENT, "Task has no work",
                               ErrorContext{owner, "", TaskKindToString(kind)});
    }
    if (timeout.count() <= 0) {
        timeout = config_.default_timeout;
    }

    // Reserve a queue slot first so the bound holds under concurrent submits
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (queued_ >= config_.max_pending_tasks) {
            spdlog::warn("Rejecting {} task for {}: {} tasks pending",
                         TaskKindToString(kind), owner, queued_);
            throw SandboxException(ErrorCode::QUOTA_EXCEEDED, "Too many pending tasks",
                                   ErrorContext{owner, "", TaskKindToString(kind)});
        }
        ++queued_;
    }

    auto task = std::make_shared<Task>();
    task->id = utils::HashUtils::GenerateId("task", 8);
    task->owner = owner;
    task->kind = kind;
    task->submitted_at = Clock::now();
    task->deadline = task->submitted_at + timeout;
    task->token = std::make_shared<CancellationToken>(std::chrono::steady_clock::now() + timeout, task->id);
    task->work = std::move(work);

    {
        std::unique_lock<std::shared_mutex> lock(tasks_mutex_);
        tasks_.emplace(task->id, task);
    }
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        auto& queue = ready_[owner];
        if (queue.empty()) {
            rotation_.push_back(owner);
        }
        queue.push_back(task);
    }
    queue_ready_.notify_one();

    spdlog::debug("Submitted {} ({}) for {} with {}ms deadline",
                  task->id, TaskKindToString(kind), owner, timeout.count());
    return task->id;
}

// ============================================================================
// QUERIES
// ============================================================================

std::shared_ptr<TaskManager::Task> TaskManager::FindTask(const std::string& task_id) const {
    std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
    auto it = tasks_.find(task_id);
    return it == tasks_.end() ? nullptr : it->second;
}

std::shared_ptr<TaskManager::Task> TaskManager::RequireTask(const std::string& task_id) const {
    auto task = FindTask(task_id);
    if (!task) {
        throw SandboxException(ErrorCode::NOT_FOUND, "Task not found: " + task_id,
                               ErrorContext{"", task_id, ""});
    }
    return task;
}

std::vector<std::shared_ptr<TaskManager::Task>> TaskManager::TasksOf(const std::string& owner) const {
    std::vector<std::shared_ptr<Task>> owned;
    std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
    for (const auto& [id, task] : tasks_) {
        if (task->owner == owner) {
            owned.push_back(task);
        }
    }
    return owned;
}

TaskStatus TaskManager::Snapshot(const Task& task) {
    TaskStatus status;
    status.id = task.id;
    status.owner = task.owner;
    status.kind = task.kind;
    status.state = task.state;
    status.submitted_at = task.submitted_at;
    status.started_at = task.started_at;
    status.finished_at = task.finished_at;
    status.deadline = task.deadline;
    status.output = task.output;
    status.error = task.error;
    return status;
}

TaskStatus TaskManager::Poll(const std::string& task_id) const {
    auto task = RequireTask(task_id);
    std::lock_guard<std::mutex> lock(task->mutex);
    return Snapshot(*task);
}

std::vector<TaskStatus> TaskManager::ListTasks(const std::string& owner) const {
    std::vector<TaskStatus> statuses;
    for (const auto& task : TasksOf(owner)) {
        std::lock_guard<std::mutex> lock(task->mutex);
        statuses.push_back(Snapshot(*task));
    }
    std::sort(statuses.begin(), statuses.end(), [](const TaskStatus& a, const TaskStatus& b) {
        return a.submitted_at < b.submitted_at;
    });
    return statuses;
}

std::size_t TaskManager::OutstandingCount(const std::string& owner) const {
    std::size_t count = 0;
    for (const auto& task : TasksOf(owner)) {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (!IsTerminal(task->state)) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// STATE TRANSITIONS
// ============================================================================

bool TaskManager::Finish(Task& task, TaskState state, std::optional<TaskOutput> output,
                         std::optional<TaskError> error) {
    std::shared_ptr<CancellationToken> token;
    {
        std::lock_guard<std::mutex> lock(task.mutex);
        if (!FinishLocked(task.state, state)) {
            return false;
        }
        task.finished_at = Clock::now();
        task.output = std::move(output);
        task.error = std::move(error);
        token = task.token;
    }
    task.changed.notify_all();

    if (state == TaskState::CANCELLED || state == TaskState::TIMED_OUT) {
        token->Cancel();
    }

    if (state == TaskState::COMPLETED) {
        spdlog::debug("Task {} completed", task.id);
    } else {
        spdlog::info("Task {} ({}) {}", task.id, TaskKindToString(task.kind), TaskStateToString(state));
    }
    return true;
}

TaskStatus TaskManager::Await(const std::string& task_id, std::chrono::milliseconds timeout) {
    auto task = RequireTask(task_id);

    {
        std::unique_lock<std::mutex> lock(task->mutex);
        bool done = task->changed.wait_for(lock, timeout, [&task]() {
            return IsTerminal(task->state);
        });
        if (done) {
            return Snapshot(*task);
        }
    }

    Finish(*task, TaskState::TIMED_OUT, std::nullopt,
           TaskError{ErrorCode::EXECUTION_TIMEOUT,
                     "Task did not finish within " + std::to_string(timeout.count()) + "ms",
                     ContextOf(task->owner, task->id, task->kind)});

    std::lock_guard<std::mutex> lock(task->mutex);
    return Snapshot(*task);
}

bool TaskManager::Cancel(const std::string& task_id) {
    auto task = RequireTask(task_id);
    return Finish(*task, TaskState::CANCELLED, std::nullopt,
                  TaskError{ErrorCode::CANCELLED, "Task cancelled",
                            ContextOf(task->owner, task->id, task->kind)});
}

bool TaskManager::Acknowledge(const std::string& task_id) {
    auto task = RequireTask(task_id);
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (!IsTerminal(task->state)) {
            return false;
        }
    }
    std::unique_lock<std::shared_mutex> lock(tasks_mutex_);
    tasks_.erase(task_id);
    return true;
}

std::size_t TaskManager::CancelOwner(const std::string& owner, const std::string& except_task) {
    std::size_t cancelled = 0;
    for (const auto& task : TasksOf(owner)) {
        if (!except_task.empty() && task->id == except_task) {
            continue;
        }
        if (Finish(*task, TaskState::CANCELLED, std::nullopt,
                   TaskError{ErrorCode::CANCELLED, "Sandbox is being destroyed",
                             ContextOf(task->owner, task->id, task->kind)})) {
            ++cancelled;
        }
    }
    if (cancelled > 0) {
        spdlog::info("Cancelled {} task(s) of {}", cancelled, owner);
    }
    return cancelled;
}

bool TaskManager::AwaitOwner(const std::string& owner, std::chrono::milliseconds grace) {
    auto deadline = std::chrono::steady_clock::now() + grace;
    for (const auto& task : TasksOf(owner)) {
        std::unique_lock<std::mutex> lock(task->mutex);
        task->changed.wait_until(lock, deadline, [&task]() {
            return IsTerminal(task->state);
        });
    }
    return OutstandingCount(owner) == 0;
}

// ============================================================================
// WORKERS
// ============================================================================

std::shared_ptr<TaskManager::Task> TaskManager::NextReady() {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    queue_ready_.wait(lock, [this]() { return stopping_.load() || !rotation_.empty(); });
    if (stopping_.load()) {
        return nullptr;
    }

    std::string owner = rotation_.front();
    rotation_.pop_front();

    auto it = ready_.find(owner);
    auto task = it->second.front();
    it->second.pop_front();
    if (it->second.empty()) {
        ready_.erase(it);
    } else {
        rotation_.push_back(owner);
    }
    --queued_;
    return task;
}

void TaskManager::WorkerLoop() {
    while (auto task = NextReady()) {
        Run(task);
    }
}

void TaskManager::Run(const std::shared_ptr<Task>& task) {
    TaskWork work;
    std::shared_ptr<CancellationToken> token;
    bool expired = false;
    {
        std::lock_guard<std::mutex> lock(task->mutex);
        if (task->state != TaskState::PENDING) {
            task->work = nullptr;
            return;
        }
        work = std::move(task->work);
        task->work = nullptr;
        token = task->token;
        if (token->DeadlineExceeded()) {
            expired = true;
        } else {
            task->state = TaskState::RUNNING;
            task->started_at = Clock::now();
        }
    }

    auto context = ContextOf(task->owner, task->id, task->kind);

    if (expired) {
        Finish(*task, TaskState::TIMED_OUT, std::nullopt,
               TaskError{ErrorCode::EXECUTION_TIMEOUT, "Deadline passed before the task started", context});
        return;
    }
    task->changed.notify_all();

    try {
        TaskOutput output = work(*token);
        Finish(*task, TaskState::COMPLETED, std::move(output), std::nullopt);
    }
    catch (const SandboxException& e) {
        TaskState state = TaskState::FAILED;
        if (e.Code() == ErrorCode::CANCELLED) {
            state = TaskState::CANCELLED;
        } else if (e.Code() == ErrorCode::EXECUTION_TIMEOUT) {
            state = TaskState::TIMED_OUT;
        }
        Finish(*task, state, std::nullopt,
               TaskError{e.Code(), e.what(), MergeContext(e.Context(), context)});
    }
    catch (const std::exception& e) {
        spdlog::error("Task {} failed unexpectedly: {}", task->id, e.what());
        Finish(*task, TaskState::FAILED, std::nullopt,
               TaskError{ErrorCode::INTERNAL, e.what(), context});
    }
}

// ============================================================================
// MAINTENANCE
// ============================================================================

std::size_t TaskManager::EnforceDeadlines() {
    std::vector<std::shared_ptr<Task>> all;
    {
        std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
        for (const auto& [id, task] : tasks_) {
            all.push_back(task);
        }
    }

    std::size_t timed_out = 0;
    for (const auto& task : all) {
        if (!task->token->DeadlineExceeded()) {
            continue;
        }
        if (Finish(*task, TaskState::TIMED_OUT, std::nullopt,
                   TaskError{ErrorCode::EXECUTION_TIMEOUT, "Task deadline exceeded",
                             ContextOf(task->owner, task->id, task->kind)})) {
            ++timed_out;
        }
    }
    return timed_out;
}

std::size_t TaskManager::PurgeExpired() {
    auto cutoff = Clock::now() - config_.result_retention;
    std::size_t purged = 0;

    std::unique_lock<std::shared_mutex> lock(tasks_mutex_);
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        bool expired = false;
        {
            std::lock_guard<std::mutex> task_lock(it->second->mutex);
            expired = IsTerminal(it->second->state) &&
                      it->second->finished_at && *it->second->finished_at <= cutoff;
        }
        if (expired) {
            it = tasks_.erase(it);
            ++purged;
        } else {
            ++it;
        }
    }

    if (purged > 0) {
        spdlog::debug("Purged {} expired task(s)", purged);
    }
    return purged;
}

void TaskManager::MaintenanceLoop() {
    while (!stopping_.load()) {
        {
            std::unique_lock<std::mutex> lock(maintenance_mutex_);
            maintenance_wakeup_.wait_for(lock, config_.maintenance_interval,
                                         [this]() { return stopping_.load(); });
        }
        if (stopping_.load()) {
            break;
        }
        EnforceDeadlines();
        PurgeExpired();
    }
}

void TaskManager::Shutdown() {
    if (stopping_.exchange(true)) {
        return;
    }

    spdlog::info("Task manager shutting down");

    std::vector<std::shared_ptr<Task>> all;
    {
        std::shared_lock<std::shared_mutex> lock(tasks_mutex_);
        for (const auto& [id, task] : tasks_) {
            all.push_back(task);
        }
    }
    for (const auto& task : all) {
        Finish(*task, TaskState::CANCELLED, std::nullopt,
               TaskError{ErrorCode::CANCELLED, "Task manager shut down",
                         ContextOf(task->owner, task->id, task->kind)});
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        ready_.clear();
        rotation_.clear();
        queued_ = 0;
    }
    queue_ready_.notify_all();
    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
    }
    maintenance_wakeup_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }
}

} // namespace core
} // namespace sandcastle
