/**
 * @file test_json_reporter.cpp
 * @brief JSON views of sandboxes, tasks, results and errors
 */

#include "sandcastle/reporters/json_reporter.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace {

using namespace sandcastle::core;
using sandcastle::reporters::JsonReporter;
using sandcastle::reporters::JsonReporterConfig;
using json = nlohmann::json;
using ::testing::HasSubstr;
using ::testing::Not;

TimePoint At(std::time_t seconds) {
    return Clock::from_time_t(seconds);
}

TEST(JsonReporterTest, FormatTimestampIsUtc) {
    EXPECT_EQ(JsonReporter::FormatTimestamp(At(1740832245)), "2025-03-01T12:30:45Z");
}

TEST(JsonReporterTest, SandboxView) {
    Sandbox sandbox;
    sandbox.id = "sbx-0123456789ab";
    sandbox.name = "s1";
    sandbox.owner = "alice";
    sandbox.state = SandboxState::IDLE;
    sandbox.image = "python-sandbox:latest";
    sandbox.container_name = "sandcastle-sbx-0123456789ab";
    sandbox.created_at = At(1740832245);
    sandbox.last_active_at = At(1740832245);
    sandbox.installed_packages = {"numpy"};

    JsonReporter reporter;
    auto j = reporter.SandboxToJson(sandbox);
    EXPECT_EQ(j["id"], "sbx-0123456789ab");
    EXPECT_EQ(j["name"], "s1");
    EXPECT_EQ(j["state"], "idle");
    EXPECT_EQ(j["limits"]["memory_mb"], 1024);
    EXPECT_EQ(j["installed_packages"], json::array({"numpy"}));
    EXPECT_EQ(j["created_at"], "2025-03-01T12:30:45Z");
    EXPECT_FALSE(j.contains("destroyed_at"));
    EXPECT_FALSE(j.contains("mounts"));

    sandbox.name.reset();
    sandbox.destroyed_at = At(1740832300);
    auto list = reporter.SandboxesToJson({sandbox, sandbox});
    EXPECT_EQ(list["count"], 2);
    EXPECT_TRUE(list["sandboxes"][0]["name"].is_null());
    EXPECT_TRUE(list["sandboxes"][0].contains("destroyed_at"));
}

TEST(JsonReporterTest, CompletedTaskCarriesResult) {
    TaskStatus status;
    status.id = "task-0011223344556677";
    status.owner = "sbx-1";
    status.kind = TaskKind::INSTALL_PACKAGES;
    status.state = TaskState::COMPLETED;
    status.submitted_at = At(1740832245);
    status.finished_at = At(1740832246);

    InstallReport report;
    report.succeeded = {"pkgA"};
    report.failed = {PackageFailure{"doesnotexist123", "not found"}};
    status.output = report;

    JsonReporter reporter;
    auto j = reporter.TaskStatusToJson(status);
    EXPECT_EQ(j["kind"], "install_packages");
    EXPECT_EQ(j["state"], "completed");
    EXPECT_EQ(j["sandbox_id"], "sbx-1");
    EXPECT_EQ(j["result"]["succeeded"], json::array({"pkgA"}));
    EXPECT_EQ(j["result"]["failed"][0]["name"], "doesnotexist123");
    EXPECT_EQ(j["result"]["partial_failure"], true);
    EXPECT_FALSE(j.contains("error"));
    EXPECT_FALSE(j.contains("started_at"));
}

TEST(JsonReporterTest, FailedTaskCarriesError) {
    TaskStatus status;
    status.id = "task-1";
    status.state = TaskState::TIMED_OUT;
    status.error = TaskError{ErrorCode::EXECUTION_TIMEOUT, "Task exceeded its deadline",
                             ErrorContext{"sbx-1", "task-1", "run_code"}};

    auto j = JsonReporter().TaskStatusToJson(status);
    EXPECT_EQ(j["state"], "timed_out");
    EXPECT_EQ(j["error"]["code"], "execution_timeout");
    EXPECT_EQ(j["error"]["task_id"], "task-1");
    EXPECT_FALSE(j.contains("result"));
}

TEST(JsonReporterTest, ExceptionView) {
    SandboxException error(ErrorCode::QUOTA_EXCEEDED, "Maximum number of sandboxes reached (20)");
    auto j = JsonReporter().ExceptionToJson(error);
    EXPECT_EQ(j["error"]["code"], "quota_exceeded");
    EXPECT_EQ(j["error"]["message"], "Maximum number of sandboxes reached (20)");
    EXPECT_FALSE(j["error"].contains("sandbox_id"));
}

TEST(JsonReporterTest, ResultAlternatives) {
    JsonReporter reporter;

    EXPECT_TRUE(reporter.OutputToJson(std::monostate{}).is_null());

    ExecOutput exec;
    exec.stdout_output = "2\n";
    exec.truncated = true;
    auto e = reporter.OutputToJson(exec);
    EXPECT_EQ(e["stdout"], "2\n");
    EXPECT_EQ(e["exit_code"], 0);
    EXPECT_EQ(e["truncated"], true);

    DirectoryListing listing;
    listing.path = "/app/results";
    listing.entries.push_back(DirectoryEntry{"data", true, 4096, At(1740832245)});
    auto l = reporter.OutputToJson(listing);
    EXPECT_EQ(l["entries"][0]["type"], "directory");
    EXPECT_EQ(l["entries"][0]["modified"], "2025-03-01T12:30:45Z");

    PackageStatusReport packages;
    packages.packages.push_back(PackageInfo{"numpy", true, std::string("1.26.4")});
    packages.packages.push_back(PackageInfo{"torch", false, std::nullopt});
    auto p = reporter.OutputToJson(packages);
    EXPECT_EQ(p["packages"][0]["version"], "1.26.4");
    EXPECT_TRUE(p["packages"][1]["version"].is_null());
}

TEST(JsonReporterTest, FileContentCanBeOmitted) {
    FileContent file;
    file.path = "/app/results/out.bin";
    file.content = "bytes";
    file.size = 5;

    EXPECT_EQ(JsonReporter().OutputToJson(file)["content"], "bytes");

    JsonReporterConfig config;
    config.include_file_content = false;
    EXPECT_FALSE(JsonReporter(config).OutputToJson(file).contains("content"));
}

TEST(JsonReporterTest, RenderReplacesInvalidUtf8) {
    JsonReporterConfig config;
    config.pretty_print = false;
    JsonReporter reporter(config);

    json j = {{"content", std::string("ok\xff")}};
    std::string rendered;
    ASSERT_NO_THROW(rendered = reporter.Render(j));
    EXPECT_THAT(rendered, HasSubstr("ok"));
    EXPECT_THAT(rendered, Not(HasSubstr("\n")));
}

} // namespace
