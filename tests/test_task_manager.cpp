/**
 * @file test_task_manager.cpp
 * @brief Task lifecycle, cancellation, deadlines, fairness and bounds
 */

#include "sandcastle/core/task_manager.hpp"
#include "sandcastle/core/errors.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace {

using namespace sandcastle::core;
using namespace std::chrono_literals;
using ::testing::ElementsAre;

TaskConfig SmallPool(std::size_t workers = 2) {
    TaskConfig config;
    config.worker_count = workers;
    config.max_pending_tasks = 16;
    config.default_timeout = 5000ms;
    config.maintenance_interval = 20ms;
    return config;
}

TaskOutput Echo(const std::string& text) {
    ExecOutput output;
    output.stdout_output = text;
    return output;
}

/// Work that spins until stopped
TaskWork Spin() {
    return [](CancellationToken& token) -> TaskOutput {
        while (!token.ShouldStop()) {
            std::this_thread::sleep_for(2ms);
        }
        token.ThrowIfStopped();
        return std::monostate{};
    };
}

TEST(TaskManagerTest, CompletesWithOutput) {
    TaskManager tasks(SmallPool());
    auto id = tasks.Submit("sbx-1", TaskKind::RUN_COMMAND,
                           [](CancellationToken&) { return Echo("hello"); });

    auto status = tasks.Await(id, 2s);
    ASSERT_EQ(status.state, TaskState::COMPLETED);
    ASSERT_TRUE(status.output.has_value());
    EXPECT_EQ(std::get<ExecOutput>(*status.output).stdout_output, "hello");
    EXPECT_TRUE(status.started_at.has_value());
    EXPECT_TRUE(status.finished_at.has_value());
    EXPECT_FALSE(status.error.has_value());
}

TEST(TaskManagerTest, SandboxExceptionFailsTaskWithItsCode) {
    TaskManager tasks(SmallPool());
    auto id = tasks.Submit("sbx-1", TaskKind::DOWNLOAD_FILE, [](CancellationToken&) -> TaskOutput {
        throw SandboxException(ErrorCode::NOT_FOUND, "No such file: /app/results/x");
    });

    auto status = tasks.Await(id, 2s);
    ASSERT_EQ(status.state, TaskState::FAILED);
    ASSERT_TRUE(status.error.has_value());
    EXPECT_EQ(status.error->code, ErrorCode::NOT_FOUND);
    EXPECT_EQ(status.error->context.task_id, id);
    EXPECT_EQ(status.error->context.sandbox_id, "sbx-1");
    EXPECT_EQ(status.error->context.kind, "download_file");
}

TEST(TaskManagerTest, UnexpectedExceptionIsInternal) {
    TaskManager tasks(SmallPool());
    auto id = tasks.Submit("sbx-1", TaskKind::RUN_CODE, [](CancellationToken&) -> TaskOutput {
        throw std::runtime_error("boom");
    });

    auto status = tasks.Await(id, 2s);
    ASSERT_EQ(status.state, TaskState::FAILED);
    EXPECT_EQ(status.error->code, ErrorCode::INTERNAL);
}

TEST(TaskManagerTest, AwaitTimeoutMarksTimedOutAndStopsWork) {
    TaskManager tasks(SmallPool());
    std::atomic<bool> stopped{false};
    auto id = tasks.Submit("sbx-1", TaskKind::RUN_CODE, [&stopped](CancellationToken& token) -> TaskOutput {
        while (!token.IsCancelled()) {
            std::this_thread::sleep_for(2ms);
        }
        stopped = true;
        return Echo("late");
    });

    auto status = tasks.Await(id, 100ms);
    EXPECT_EQ(status.state, TaskState::TIMED_OUT);
    EXPECT_EQ(status.error->code, ErrorCode::EXECUTION_TIMEOUT);

    // The late result is discarded
    for (int i = 0; i < 200 && !stopped; ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_TRUE(stopped.load());
    std::this_thread::sleep_for(20ms);
    auto later = tasks.Poll(id);
    EXPECT_EQ(later.state, TaskState::TIMED_OUT);
    EXPECT_FALSE(later.output.has_value());
}

TEST(TaskManagerTest, TerminalStateNeverChanges) {
    TaskManager tasks(SmallPool());
    auto id = tasks.Submit("sbx-1", TaskKind::RUN_COMMAND,
                           [](CancellationToken&) { return Echo("done"); });
    ASSERT_EQ(tasks.Await(id, 2s).state, TaskState::COMPLETED);

    EXPECT_FALSE(tasks.Cancel(id));
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(tasks.Poll(id).state, TaskState::COMPLETED);
        EXPECT_EQ(tasks.Await(id, 1ms).state, TaskState::COMPLETED);
    }
}

TEST(TaskManagerTest, CancelRunningTask) {
    TaskManager tasks(SmallPool());
    auto id = tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin());

    for (int i = 0; i < 200 && tasks.Poll(id).state == TaskState::PENDING; ++i) {
        std::this_thread::sleep_for(2ms);
    }
    EXPECT_TRUE(tasks.Cancel(id));
    EXPECT_FALSE(tasks.Cancel(id));

    auto status = tasks.Poll(id);
    EXPECT_EQ(status.state, TaskState::CANCELLED);
    EXPECT_EQ(status.error->code, ErrorCode::CANCELLED);
}

TEST(TaskManagerTest, CancelPendingTaskNeverRuns) {
    TaskManager tasks(SmallPool(1));
    auto blocker = tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin());

    std::atomic<bool> ran{false};
    auto queued = tasks.Submit("sbx-1", TaskKind::RUN_CODE, [&ran](CancellationToken&) -> TaskOutput {
        ran = true;
        return std::monostate{};
    });
    EXPECT_TRUE(tasks.Cancel(queued));
    tasks.Cancel(blocker);

    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(ran.load());
    EXPECT_EQ(tasks.Poll(queued).state, TaskState::CANCELLED);
}

TEST(TaskManagerTest, DeadlineEnforcedByMaintenance) {
    TaskManager tasks(SmallPool());
    auto id = tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin(), 50ms);

    for (int i = 0; i < 200 && !IsTerminal(tasks.Poll(id).state); ++i) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_EQ(tasks.Poll(id).state, TaskState::TIMED_OUT);
}

TEST(TaskManagerTest, PendingBoundIsEnforced) {
    TaskConfig config = SmallPool(1);
    config.max_pending_tasks = 2;
    TaskManager tasks(config);

    auto running = tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin());
    for (int i = 0; i < 200 && tasks.Poll(running).state == TaskState::PENDING; ++i) {
        std::this_thread::sleep_for(2ms);
    }

    tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin());
    tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin());
    try {
        tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin());
        FAIL() << "expected QUOTA_EXCEEDED";
    } catch (const SandboxException& e) {
        EXPECT_EQ(e.Code(), ErrorCode::QUOTA_EXCEEDED);
    }
    tasks.Shutdown();
}

TEST(TaskManagerTest, RoundRobinAcrossOwners) {
    TaskManager tasks(SmallPool(1));

    // Hold the only worker while the queue fills
    std::atomic<bool> release{false};
    auto gate = tasks.Submit("gate", TaskKind::RUN_CODE, [&release](CancellationToken&) -> TaskOutput {
        while (!release) {
            std::this_thread::sleep_for(1ms);
        }
        return std::monostate{};
    });
    for (int i = 0; i < 200 && tasks.Poll(gate).state == TaskState::PENDING; ++i) {
        std::this_thread::sleep_for(2ms);
    }

    std::mutex order_mutex;
    std::vector<std::string> order;
    auto record = [&](const std::string& label) {
        return [&, label](CancellationToken&) -> TaskOutput {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(label);
            return std::monostate{};
        };
    };

    std::vector<std::string> ids;
    ids.push_back(tasks.Submit("a", TaskKind::RUN_CODE, record("a1")));
    ids.push_back(tasks.Submit("a", TaskKind::RUN_CODE, record("a2")));
    ids.push_back(tasks.Submit("a", TaskKind::RUN_CODE, record("a3")));
    ids.push_back(tasks.Submit("b", TaskKind::RUN_CODE, record("b1")));
    ids.push_back(tasks.Submit("b", TaskKind::RUN_CODE, record("b2")));

    release = true;
    for (const auto& id : ids) {
        tasks.Await(id, 2s);
    }
    EXPECT_THAT(order, ElementsAre("a1", "b1", "a2", "b2", "a3"));
}

TEST(TaskManagerTest, AcknowledgeRemovesTerminalTasks) {
    TaskManager tasks(SmallPool());
    auto id = tasks.Submit("sbx-1", TaskKind::RUN_COMMAND,
                           [](CancellationToken&) { return Echo("x"); });
    tasks.Await(id, 2s);

    EXPECT_TRUE(tasks.Acknowledge(id));
    try {
        tasks.Poll(id);
        FAIL() << "expected NOT_FOUND";
    } catch (const SandboxException& e) {
        EXPECT_EQ(e.Code(), ErrorCode::NOT_FOUND);
    }
}

TEST(TaskManagerTest, ExpiredResultsArePurged) {
    TaskConfig config = SmallPool();
    config.result_retention = std::chrono::seconds(0);
    TaskManager tasks(config);

    auto id = tasks.Submit("sbx-1", TaskKind::RUN_COMMAND,
                           [](CancellationToken&) { return Echo("x"); });
    tasks.Await(id, 2s);
    std::this_thread::sleep_for(5ms);

    EXPECT_GE(tasks.PurgeExpired() + (tasks.ListTasks("sbx-1").empty() ? 1u : 0u), 1u);
    EXPECT_TRUE(tasks.ListTasks("sbx-1").empty());
}

TEST(TaskManagerTest, OwnerOperations) {
    TaskManager tasks(SmallPool(4));
    tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin());
    tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin());
    tasks.Submit("sbx-2", TaskKind::RUN_CODE, Spin());

    EXPECT_EQ(tasks.OutstandingCount("sbx-1"), 2u);
    EXPECT_FALSE(tasks.AwaitOwner("sbx-1", 30ms));
    EXPECT_EQ(tasks.CancelOwner("sbx-1"), 2u);
    EXPECT_EQ(tasks.OutstandingCount("sbx-1"), 0u);
    EXPECT_TRUE(tasks.AwaitOwner("sbx-1", 1ms));
    EXPECT_EQ(tasks.OutstandingCount("sbx-2"), 1u);
    EXPECT_EQ(tasks.ListTasks("sbx-1").size(), 2u);
}

TEST(TaskManagerTest, CancelOwnerSparesTheReportingTask) {
    TaskManager tasks(SmallPool(4));
    auto release = std::make_shared<std::atomic<bool>>(false);

    auto spared = tasks.Submit("sbx-1", TaskKind::RUN_COMMAND, [release](CancellationToken& token) {
        while (!release->load() && !token.ShouldStop()) {
            std::this_thread::sleep_for(2ms);
        }
        token.ThrowIfStopped();
        return Echo(token.TaskId());
    });
    auto other = tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin());

    EXPECT_EQ(tasks.CancelOwner("sbx-1", spared), 1u);
    EXPECT_EQ(tasks.Poll(other).state, TaskState::CANCELLED);

    release->store(true);
    auto status = tasks.Await(spared, 2s);
    ASSERT_EQ(status.state, TaskState::COMPLETED);
    EXPECT_EQ(std::get<ExecOutput>(*status.output).stdout_output, spared);
}

TEST(TaskManagerTest, SubmitAfterShutdownIsRejected) {
    TaskManager tasks(SmallPool());
    auto id = tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin());
    tasks.Shutdown();
    tasks.Shutdown();

    EXPECT_EQ(tasks.Poll(id).state, TaskState::CANCELLED);
    EXPECT_THROW(tasks.Submit("sbx-1", TaskKind::RUN_CODE, Spin()), SandboxException);
}

} // namespace
