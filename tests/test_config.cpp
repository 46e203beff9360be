/**
 * @file test_config.cpp
 * @brief Defaults, JSON overlay, validation and environment overrides
 */

#include "sandcastle/core/config.hpp"
#include "sandcastle/core/errors.hpp"
#include "sandcastle/utils/hash_utils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>

namespace {

using namespace sandcastle::core;
using json = nlohmann::json;
using ::testing::ElementsAre;

/// Temporary config file removed on scope exit
class TempConfigFile {
public:
    explicit TempConfigFile(const std::string& content)
        : path_(std::filesystem::temp_directory_path() /
                ("sandcastle-config-" + sandcastle::utils::HashUtils::RandomHex(6) + ".json")) {
        std::ofstream out(path_);
        out << content;
    }
    ~TempConfigFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

ErrorCode CodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const SandboxException& e) {
        return e.Code();
    }
    return ErrorCode::INTERNAL;
}

TEST(ConfigTest, DefaultsAreValid) {
    EngineConfig config;
    EXPECT_NO_THROW(ValidateConfig(config));
    EXPECT_EQ(config.runtime.working_dir, "/app/results");
    EXPECT_EQ(config.runtime.default_limits.memory_limit_mb, 1024u);
    EXPECT_DOUBLE_EQ(config.runtime.default_limits.cpu_limit, 0.5);
    EXPECT_EQ(config.lifecycle.destroy_policy, "grace");
    EXPECT_TRUE(config.execution.interpreters.count("python"));
}

TEST(ConfigTest, JsonOverlaysOnlyGivenKeys) {
    EngineConfig config;
    ApplyJson(config, json::parse(R"({
        "runtime": { "default_image": "custom:1", "memory_limit_mb": 2048, "network_mode": "none" },
        "lifecycle": { "max_sandboxes": 7, "idle_threshold_seconds": 120, "destroy_policy": "cancel" },
        "tasks": { "worker_count": 2, "default_timeout_ms": 1500 },
        "logging": { "level": "debug" }
    })"));

    EXPECT_EQ(config.runtime.default_image, "custom:1");
    EXPECT_EQ(config.runtime.default_limits.memory_limit_mb, 2048u);
    EXPECT_EQ(config.runtime.network_mode, "none");
    EXPECT_EQ(config.lifecycle.max_sandboxes, 7u);
    EXPECT_EQ(config.lifecycle.idle_threshold, std::chrono::seconds(120));
    EXPECT_EQ(config.lifecycle.destroy_policy, "cancel");
    EXPECT_EQ(config.tasks.worker_count, 2u);
    EXPECT_EQ(config.tasks.default_timeout, std::chrono::milliseconds(1500));
    EXPECT_EQ(config.logging.level, "debug");

    // Untouched keys keep their defaults
    EXPECT_EQ(config.lifecycle.max_sandboxes_per_owner, 3u);
    EXPECT_EQ(config.runtime.working_dir, "/app/results");
}

TEST(ConfigTest, InterpretersMergePerLanguage) {
    EngineConfig config;
    ApplyJson(config, json::parse(R"({
        "execution": { "interpreters": { "ruby": { "command": ["ruby"], "extension": ".rb" } } }
    })"));

    ASSERT_TRUE(config.execution.interpreters.count("ruby"));
    EXPECT_THAT(config.execution.interpreters.at("ruby").command, ElementsAre("ruby"));
    EXPECT_TRUE(config.execution.interpreters.count("python"));

    EXPECT_EQ(CodeOf([&] {
                  ApplyJson(config, json::parse(R"({"execution": {"interpreters": {"x": {"command": []}}}})"));
              }),
              ErrorCode::INVALID_ARGUMENT);
}

TEST(ConfigTest, TypeMismatchIsInvalid) {
    EngineConfig config;
    EXPECT_EQ(CodeOf([&] { ApplyJson(config, json::parse(R"({"tasks": {"worker_count": "many"}})")); }),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(CodeOf([&] { ApplyJson(config, json::parse(R"({"runtime": []})")); }),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(CodeOf([&] { ApplyJson(config, json::parse(R"({"lifecycle": {"retry_backoff_ms": -5}})")); }),
              ErrorCode::INVALID_ARGUMENT);
    EXPECT_EQ(CodeOf([&] { ApplyJson(config, json::parse("[1, 2]")); }), ErrorCode::INVALID_ARGUMENT);
}

TEST(ConfigTest, UnknownKeysAreIgnored) {
    EngineConfig config;
    EXPECT_NO_THROW(ApplyJson(config, json::parse(R"({"plugins": {}, "runtime": {"colour": "blue"}})")));
}

TEST(ConfigTest, ValidationRejectsInconsistentValues) {
    EngineConfig config;
    config.tasks.worker_count = 0;
    EXPECT_EQ(CodeOf([&] { ValidateConfig(config); }), ErrorCode::INVALID_ARGUMENT);

    config = EngineConfig{};
    config.lifecycle.destroy_policy = "later";
    EXPECT_EQ(CodeOf([&] { ValidateConfig(config); }), ErrorCode::INVALID_ARGUMENT);

    config = EngineConfig{};
    config.runtime.working_dir = "relative/dir";
    EXPECT_EQ(CodeOf([&] { ValidateConfig(config); }), ErrorCode::INVALID_ARGUMENT);

    config = EngineConfig{};
    config.logging.level = "loud";
    EXPECT_EQ(CodeOf([&] { ValidateConfig(config); }), ErrorCode::INVALID_ARGUMENT);
}

TEST(ConfigTest, LoadFromFile) {
    TempConfigFile file(R"({"lifecycle": {"max_sandboxes_per_owner": 9}})");
    auto config = LoadConfig(file.Path());
    EXPECT_EQ(config.lifecycle.max_sandboxes_per_owner, 9u);
}

TEST(ConfigTest, MissingFileFallsBackToDefaults) {
    auto config = LoadConfig(std::filesystem::path("/nonexistent/sandcastle.json"));
    EXPECT_EQ(config.lifecycle.max_sandboxes, 20u);
}

TEST(ConfigTest, MalformedFileIsInvalid) {
    TempConfigFile file("{ not json");
    EXPECT_EQ(CodeOf([&] { LoadConfig(file.Path()); }), ErrorCode::INVALID_ARGUMENT);
}

TEST(ConfigTest, EnvironmentOverridesFile) {
    TempConfigFile file(R"({"execution": {"index_url": "https://from-file/simple/"}})");
    setenv("SANDCASTLE_PYPI_INDEX_URL", "https://from-env/simple/", 1);
    setenv("SANDCASTLE_IMAGE", "env-image:2", 1);
    auto config = LoadConfig(file.Path());
    unsetenv("SANDCASTLE_PYPI_INDEX_URL");
    unsetenv("SANDCASTLE_IMAGE");

    EXPECT_EQ(config.execution.index_url, "https://from-env/simple/");
    EXPECT_EQ(config.runtime.default_image, "env-image:2");
}

TEST(ConfigTest, JsonRoundTripPreservesValues) {
    EngineConfig config;
    config.lifecycle.max_sandboxes = 11;
    config.tasks.default_timeout = std::chrono::milliseconds(2500);
    config.execution.interpreters["ruby"] = InterpreterSpec{{"ruby"}, ".rb"};

    EngineConfig copy;
    ApplyJson(copy, ConfigToJson(config));
    EXPECT_EQ(ConfigToJson(copy), ConfigToJson(config));
    EXPECT_EQ(copy.lifecycle.max_sandboxes, 11u);
}

} // namespace
