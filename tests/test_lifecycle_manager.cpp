/**
 * @file test_lifecycle_manager.cpp
 * @brief Creation, quotas, destruction, reclamation and recovery
 */

#include "sandcastle/core/lifecycle_manager.hpp"
#include "fake_runtime.hpp"
#include "sandcastle/utils/hash_utils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

namespace {

using namespace sandcastle::core;
using sandcastle::test::FakeRuntime;
using namespace std::chrono_literals;
using ::testing::HasSubstr;
using ::testing::SizeIs;

class LifecycleManagerTest : public ::testing::Test {
protected:
    LifecycleManagerTest() : tasks_(MakeConfig().tasks) {}

    static EngineConfig MakeConfig() {
        EngineConfig config;
        config.tasks.worker_count = 2;
        config.tasks.maintenance_interval = 20ms;
        config.lifecycle.max_sandboxes = 5;
        config.lifecycle.max_sandboxes_per_owner = 5;
        config.lifecycle.retry_attempts = 3;
        config.lifecycle.retry_backoff = 1ms;
        config.lifecycle.destroy_grace_period = 50ms;
        return config;
    }

    void SetUp() override {
        runtime_ = std::make_shared<FakeRuntime>();
        Build(MakeConfig());
    }

    void TearDown() override {
        tasks_.Shutdown();
        lifecycle_.reset();
    }

    void Build(const EngineConfig& config) {
        lifecycle_ = std::make_unique<LifecycleManager>(config, store_, tasks_, runtime_);
    }

    Sandbox Create(const std::string& name, const std::string& owner = "root") {
        CreateSandboxRequest request;
        request.name = name;
        request.owner = owner;
        return lifecycle_->CreateSandbox(request);
    }

    template <typename Fn>
    ErrorCode CodeOf(Fn&& fn) {
        try {
            fn();
        } catch (const SandboxException& e) {
            return e.Code();
        }
        return ErrorCode::INTERNAL;
    }

    SandboxStore store_;
    TaskManager tasks_;
    std::shared_ptr<FakeRuntime> runtime_;
    std::unique_ptr<LifecycleManager> lifecycle_;
};

TEST_F(LifecycleManagerTest, CreateProducesActiveSandboxWithContainer) {
    auto sandbox = Create("s1");

    EXPECT_EQ(sandbox.state, SandboxState::ACTIVE);
    EXPECT_THAT(sandbox.id, ::testing::StartsWith("sbx-"));
    EXPECT_FALSE(sandbox.container_ref.empty());
    EXPECT_TRUE(runtime_->HasContainer(sandbox.container_ref));

    auto spec = runtime_->LastSpec();
    EXPECT_EQ(spec.name, "sandcastle-" + sandbox.id);
    EXPECT_EQ(spec.labels.at("sandcastle.managed"), "true");
    EXPECT_EQ(spec.labels.at("sandcastle.id"), sandbox.id);
    EXPECT_EQ(spec.labels.at("sandcastle.name"), "s1");
    EXPECT_EQ(spec.memory_limit_mb, 1024u);
    EXPECT_EQ(spec.working_dir, "/app/results");

    EXPECT_EQ(lifecycle_->GetSandbox("s1").id, sandbox.id);
}

TEST_F(LifecycleManagerTest, HostDirectoryIsMountedAndRemovedOnDestroy) {
    auto config = MakeConfig();
    config.runtime.mount_host_directory = true;
    config.runtime.data_root = std::filesystem::temp_directory_path() /
                               ("sandcastle-data-" + sandcastle::utils::HashUtils::RandomHex(6));
    Build(config);

    auto sandbox = Create("mounted");
    auto spec = runtime_->LastSpec();
    ASSERT_THAT(spec.mounts, SizeIs(1));
    EXPECT_EQ(spec.mounts[0].container_path, "/app/results");
    EXPECT_EQ(spec.mounts[0].host_path.filename(), sandbox.container_name);
    EXPECT_TRUE(std::filesystem::is_directory(spec.mounts[0].host_path));

    lifecycle_->DestroySandbox(sandbox.id);
    EXPECT_FALSE(std::filesystem::exists(spec.mounts[0].host_path));

    std::error_code ec;
    std::filesystem::remove_all(config.runtime.data_root, ec);
}

TEST_F(LifecycleManagerTest, ConcurrentCreatesOfDistinctNames) {
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};
    for (int i = 0; i < 5; ++i) {
        threads.emplace_back([this, i, &failures] {
            try {
                Create("c" + std::to_string(i));
            } catch (const SandboxException&) {
                ++failures;
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_THAT(lifecycle_->ListSandboxes(), SizeIs(5));
    EXPECT_EQ(runtime_->ContainerCount(), 5u);
    EXPECT_EQ(runtime_->ContainerNames().size(), 5u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_NO_THROW(lifecycle_->GetSandbox("c" + std::to_string(i)));
    }
}

TEST_F(LifecycleManagerTest, ConcurrentCreatesOfSameNameHaveOneWinner) {
    std::vector<std::thread> threads;
    std::atomic<int> conflicts{0};
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this, &conflicts] {
            try {
                Create("same");
            } catch (const SandboxException& e) {
                if (e.Code() == ErrorCode::CONFLICT) {
                    ++conflicts;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(conflicts.load(), 3);
    EXPECT_EQ(runtime_->ContainerCount(), 1u);
}

TEST_F(LifecycleManagerTest, InvalidRequestsAreRejectedWithoutSideEffects) {
    EXPECT_EQ(CodeOf([this] { Create("bad name"); }), ErrorCode::INVALID_ARGUMENT);

    CreateSandboxRequest request;
    ResourceLimits limits;
    limits.memory_limit_mb = 0;
    request.limits = limits;
    EXPECT_EQ(CodeOf([&] { lifecycle_->CreateSandbox(request); }), ErrorCode::INVALID_ARGUMENT);

    EXPECT_EQ(runtime_->CreateCalls(), 0);
    EXPECT_EQ(store_.Size(), 0u);
}

TEST_F(LifecycleManagerTest, GlobalQuotaLeavesCountUnchanged) {
    for (int i = 0; i < 5; ++i) {
        Create("q" + std::to_string(i), "owner" + std::to_string(i));
    }
    EXPECT_EQ(CodeOf([this] { Create("q5", "late"); }), ErrorCode::QUOTA_EXCEEDED);
    EXPECT_THAT(lifecycle_->ListSandboxes(), SizeIs(5));
    EXPECT_EQ(runtime_->CreateCalls(), 5);
}

TEST_F(LifecycleManagerTest, PerOwnerQuota) {
    auto config = MakeConfig();
    config.lifecycle.max_sandboxes_per_owner = 2;
    Build(config);

    Create("a1", "alice");
    Create("a2", "alice");
    EXPECT_EQ(CodeOf([this] { Create("a3", "alice"); }), ErrorCode::QUOTA_EXCEEDED);
    EXPECT_NO_THROW(Create("b1", "bob"));

    // Destroyed sandboxes no longer count
    lifecycle_->DestroySandbox("a1");
    EXPECT_NO_THROW(Create("a3", "alice"));
}

TEST_F(LifecycleManagerTest, FailedCreationRollsBack) {
    runtime_->failing_creates = 1;

    EXPECT_EQ(CodeOf([this] { Create("broken"); }), ErrorCode::CREATION_ERROR);
    EXPECT_EQ(store_.Size(), 0u);
    EXPECT_EQ(runtime_->ContainerCount(), 0u);
    EXPECT_EQ(runtime_->CreateCalls(), 1);

    // The name is free again
    EXPECT_NO_THROW(Create("broken"));
}

TEST_F(LifecycleManagerTest, RuntimeUnavailableIsRetried) {
    runtime_->create_error = ErrorCode::RUNTIME_UNAVAILABLE;
    runtime_->failing_creates = 2;

    auto sandbox = Create("flaky");
    EXPECT_EQ(sandbox.state, SandboxState::ACTIVE);
    EXPECT_EQ(runtime_->CreateCalls(), 3);
}

TEST_F(LifecycleManagerTest, RuntimeUnavailableAfterRetriesIsReported) {
    runtime_->available = false;

    EXPECT_EQ(CodeOf([this] { Create("down"); }), ErrorCode::RUNTIME_UNAVAILABLE);
    EXPECT_EQ(store_.Size(), 0u);
}

TEST_F(LifecycleManagerTest, DestroyIsIdempotent) {
    auto sandbox = Create("s1");

    lifecycle_->DestroySandbox("s1");
    EXPECT_FALSE(runtime_->HasContainer(sandbox.container_ref));
    EXPECT_EQ(store_.Get(sandbox.id).state, SandboxState::DESTROYED);
    EXPECT_TRUE(store_.Get(sandbox.id).destroyed_at.has_value());

    EXPECT_NO_THROW(lifecycle_->DestroySandbox(sandbox.id));
    EXPECT_EQ(runtime_->Removals(), 1);

    // Still fine once the record has been evicted
    store_.EvictTerminal(std::chrono::seconds(0));
    EXPECT_NO_THROW(lifecycle_->DestroySandbox(sandbox.id));

    EXPECT_EQ(CodeOf([this] { lifecycle_->DestroySandbox("never-existed"); }), ErrorCode::NOT_FOUND);
}

TEST_F(LifecycleManagerTest, ConcurrentDestroyRemovesContainerOnce) {
    auto sandbox = Create("s1");

    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([this, &sandbox] { lifecycle_->DestroySandbox(sandbox.id); });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(runtime_->Removals(), 1);
}

TEST_F(LifecycleManagerTest, NameIsReusableAfterDestroy) {
    auto first = Create("s1");
    lifecycle_->DestroySandbox("s1");

    auto second = Create("s1");
    EXPECT_NE(first.id, second.id);
    EXPECT_EQ(lifecycle_->GetSandbox("s1").id, second.id);
    EXPECT_EQ(CodeOf([this] { Create("s1"); }), ErrorCode::CONFLICT);
}

TEST_F(LifecycleManagerTest, DestroyFailureLeavesRecordFailedForTheSweep) {
    auto sandbox = Create("s1");
    runtime_->failing_removes = 3;

    EXPECT_EQ(CodeOf([&] { lifecycle_->DestroySandbox(sandbox.id); }), ErrorCode::RUNTIME_UNAVAILABLE);
    EXPECT_EQ(store_.Get(sandbox.id).state, SandboxState::FAILED);
    EXPECT_TRUE(runtime_->HasContainer(sandbox.container_ref));

    EXPECT_EQ(lifecycle_->RetryFailedRemovals(), 1u);
    EXPECT_FALSE(runtime_->HasContainer(sandbox.container_ref));
    EXPECT_TRUE(store_.Get(sandbox.id).container_ref.empty());
}

TEST_F(LifecycleManagerTest, DestroyWaitsForRunningWorkThenCancels) {
    auto sandbox = Create("s1");
    auto id = tasks_.Submit(sandbox.id, TaskKind::RUN_CODE, [](CancellationToken& token) -> TaskOutput {
        while (!token.ShouldStop()) {
            std::this_thread::sleep_for(2ms);
        }
        token.ThrowIfStopped();
        return std::monostate{};
    });

    lifecycle_->DestroySandbox(sandbox.id);
    EXPECT_EQ(tasks_.Poll(id).state, TaskState::CANCELLED);
    EXPECT_EQ(store_.Get(sandbox.id).state, SandboxState::DESTROYED);
}

TEST_F(LifecycleManagerTest, AcquireActiveRejectsInactiveSandboxes) {
    auto sandbox = Create("s1");
    {
        auto guard = lifecycle_->AcquireActive("s1");
        EXPECT_EQ(guard.Id(), sandbox.id);
    }
    lifecycle_->DestroySandbox("s1");
    EXPECT_EQ(CodeOf([&] { lifecycle_->AcquireActive(sandbox.id); }), ErrorCode::SANDBOX_NOT_ACTIVE);
}

TEST_F(LifecycleManagerTest, QuietSandboxIsListedIdle) {
    auto config = MakeConfig();
    config.lifecycle.idle_report_threshold = std::chrono::seconds(0);
    Build(config);
    Create("quiet");
    std::this_thread::sleep_for(5ms);

    SandboxFilter filter;
    filter.state = SandboxState::IDLE;
    EXPECT_THAT(lifecycle_->ListSandboxes(filter), SizeIs(1));
    EXPECT_EQ(lifecycle_->GetSandbox("quiet").state, SandboxState::IDLE);

    // Still operable
    EXPECT_NO_THROW(lifecycle_->AcquireActive("quiet"));
}

TEST_F(LifecycleManagerTest, ReclaimIdleSkipsBusyAndRecentSandboxes) {
    auto quiet = Create("quiet");
    auto busy = Create("busy");
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto work = tasks_.Submit(busy.id, TaskKind::RUN_CODE, [release](CancellationToken& token) -> TaskOutput {
        while (!release->load() && !token.IsCancelled()) {
            std::this_thread::sleep_for(1ms);
        }
        return std::monostate{};
    });

    std::this_thread::sleep_for(1100ms);
    auto fresh = Create("fresh");

    EXPECT_EQ(lifecycle_->ReclaimIdle(std::chrono::seconds(1)), 1u);
    EXPECT_EQ(store_.Get(quiet.id).state, SandboxState::DESTROYED);
    EXPECT_EQ(store_.Get(busy.id).state, SandboxState::ACTIVE);
    EXPECT_EQ(store_.Get(fresh.id).state, SandboxState::ACTIVE);

    release->store(true);
    EXPECT_EQ(tasks_.Await(work, 2s).state, TaskState::COMPLETED);

    EXPECT_EQ(lifecycle_->ReclaimIdle(std::chrono::seconds(0)), 0u);
}

TEST_F(LifecycleManagerTest, DiskBudget) {
    CreateSandboxRequest request;
    ResourceLimits limits;
    limits.disk_budget_mb = 1;
    request.limits = limits;
    auto sandbox = lifecycle_->CreateSandbox(request);

    lifecycle_->ChargeDiskUsage(sandbox.id, 600 * 1024);
    EXPECT_EQ(CodeOf([&] { lifecycle_->ChargeDiskUsage(sandbox.id, 600 * 1024); }),
              ErrorCode::QUOTA_EXCEEDED);
    EXPECT_EQ(store_.Get(sandbox.id).disk_used_bytes, 600u * 1024u);

    lifecycle_->ChargeDiskUsage(sandbox.id, -600 * 1024);
    EXPECT_EQ(store_.Get(sandbox.id).disk_used_bytes, 0u);
}

TEST_F(LifecycleManagerTest, InstalledPackagesAreNormalized) {
    auto sandbox = Create("s1");
    lifecycle_->RecordInstalledPackages(sandbox.id, {"NumPy>=1.26", "scikit_learn"});

    auto packages = store_.Get(sandbox.id).installed_packages;
    EXPECT_EQ(packages, (std::set<std::string>{"numpy", "scikit-learn"}));
}

TEST_F(LifecycleManagerTest, LostContainerMarksSandboxFailed) {
    auto sandbox = Create("s1");

    EXPECT_TRUE(lifecycle_->MarkContainerLost(sandbox.id));
    EXPECT_FALSE(lifecycle_->MarkContainerLost(sandbox.id));
    EXPECT_EQ(store_.Get(sandbox.id).state, SandboxState::FAILED);
    EXPECT_EQ(CodeOf([&] { lifecycle_->AcquireActive(sandbox.id); }), ErrorCode::SANDBOX_NOT_ACTIVE);
}

TEST_F(LifecycleManagerTest, RecoverAdoptsRunningAndRemovesStoppedContainers) {
    sandcastle::utils::ContainerInfo running;
    running.name = "sandcastle-sbx-aaaaaaaaaaaa";
    running.image = "python-sandbox:latest";
    running.state = sandcastle::utils::ContainerState::RUNNING;
    running.created_at = std::chrono::system_clock::now();
    running.labels = {{"sandcastle.managed", "true"},
                      {"sandcastle.id", "sbx-aaaaaaaaaaaa"},
                      {"sandcastle.owner", "alice"},
                      {"sandcastle.name", "kept"},
                      {"sandcastle.memory_mb", "2048"},
                      {"sandcastle.cpus", "1.50"}};
    auto running_id = runtime_->Adopt(running);

    auto stopped = running;
    stopped.name = "sandcastle-sbx-bbbbbbbbbbbb";
    stopped.state = sandcastle::utils::ContainerState::EXITED;
    stopped.labels["sandcastle.id"] = "sbx-bbbbbbbbbbbb";
    stopped.labels.erase("sandcastle.name");
    auto stopped_id = runtime_->Adopt(stopped);

    sandcastle::utils::ContainerInfo foreign;
    foreign.name = "someone-else";
    foreign.state = sandcastle::utils::ContainerState::RUNNING;
    auto foreign_id = runtime_->Adopt(foreign);

    EXPECT_EQ(lifecycle_->Recover(), 1u);

    auto adopted = lifecycle_->GetSandbox("kept");
    EXPECT_EQ(adopted.id, "sbx-aaaaaaaaaaaa");
    EXPECT_EQ(adopted.owner, "alice");
    EXPECT_EQ(adopted.container_ref, running_id);
    EXPECT_EQ(adopted.limits.memory_limit_mb, 2048u);
    EXPECT_DOUBLE_EQ(adopted.limits.cpu_limit, 1.5);
    EXPECT_FALSE(runtime_->HasContainer(stopped_id));
    EXPECT_TRUE(runtime_->HasContainer(foreign_id));

    // A second pass adopts nothing new
    EXPECT_EQ(lifecycle_->Recover(), 0u);
}

TEST_F(LifecycleManagerTest, RecoveredSandboxIsFreshAndKeepsItsDiskUsage) {
    sandcastle::utils::ContainerInfo old;
    old.name = "sandcastle-sbx-dddddddddddd";
    old.state = sandcastle::utils::ContainerState::RUNNING;
    old.created_at = std::chrono::system_clock::now() - std::chrono::hours(2);
    old.labels = {{"sandcastle.managed", "true"}, {"sandcastle.id", "sbx-dddddddddddd"}};
    auto id = runtime_->Adopt(old);
    runtime_->CopyIn(id, "/app/results/data.bin", std::string(1000, 'x'), {});
    runtime_->CopyIn(id, "/tmp/elsewhere.bin", std::string(50, 'x'), {});

    ASSERT_EQ(lifecycle_->Recover(), 1u);
    auto adopted = store_.Get("sbx-dddddddddddd");
    EXPECT_EQ(adopted.created_at, old.created_at);
    EXPECT_GT(adopted.last_active_at, Clock::now() - std::chrono::seconds(5));
    EXPECT_EQ(adopted.disk_used_bytes, 1000u);

    // Used moments ago as far as this process knows
    EXPECT_EQ(lifecycle_->ReclaimIdle(std::chrono::seconds(60)), 0u);
    EXPECT_EQ(store_.Get(adopted.id).state, SandboxState::ACTIVE);
}

TEST_F(LifecycleManagerTest, RecoverWithResetRemovesEverything) {
    auto config = MakeConfig();
    config.lifecycle.reset_all_containers = true;
    Build(config);

    sandcastle::utils::ContainerInfo leftover;
    leftover.name = "sandcastle-sbx-cccccccccccc";
    leftover.state = sandcastle::utils::ContainerState::RUNNING;
    leftover.labels = {{"sandcastle.managed", "true"}, {"sandcastle.id", "sbx-cccccccccccc"}};
    runtime_->Adopt(leftover);

    EXPECT_EQ(lifecycle_->Recover(), 0u);
    EXPECT_EQ(runtime_->ContainerCount(), 0u);
}

TEST_F(LifecycleManagerTest, RemoveAllManaged) {
    Create("a");
    Create("b");
    sandcastle::utils::ContainerInfo stray;
    stray.name = "sandcastle-stray";
    stray.state = sandcastle::utils::ContainerState::EXITED;
    stray.labels = {{"sandcastle.managed", "true"}};
    runtime_->Adopt(stray);

    EXPECT_EQ(lifecycle_->RemoveAllManaged(), 3u);
    EXPECT_EQ(runtime_->ContainerCount(), 0u);
    EXPECT_THAT(lifecycle_->ListSandboxes(), SizeIs(0));
}

TEST_F(LifecycleManagerTest, ShutdownDestroysWhenConfigured) {
    auto config = MakeConfig();
    config.lifecycle.destroy_on_shutdown = true;
    Build(config);
    Create("a");

    lifecycle_->Start();
    lifecycle_->Shutdown();
    EXPECT_EQ(runtime_->ContainerCount(), 0u);
}

TEST_F(LifecycleManagerTest, DestroyingCreatingSandboxConflicts) {
    runtime_->create_delay = 200ms;
    std::thread creator([this] { Create("slow"); });

    ErrorCode code = ErrorCode::INTERNAL;
    for (int i = 0; i < 100; ++i) {
        auto found = store_.Find("slow");
        if (found && found->state == SandboxState::CREATING) {
            code = CodeOf([this] { lifecycle_->DestroySandbox("slow"); });
            break;
        }
        std::this_thread::sleep_for(1ms);
    }
    creator.join();

    EXPECT_EQ(code, ErrorCode::CONFLICT);
    EXPECT_EQ(lifecycle_->GetSandbox("slow").state, SandboxState::ACTIVE);
}

} // namespace
