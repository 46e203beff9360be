/**
 * @file test_utils.cpp
 * @brief Hashing, id generation and the host process runner
 */

#include "sandcastle/utils/hash_utils.hpp"
#include "sandcastle/utils/process_utils.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <atomic>
#include <set>

namespace {

using namespace sandcastle::utils;
using namespace std::chrono_literals;
using ::testing::MatchesRegex;

TEST(HashUtilsTest, Sha256OfKnownInputs) {
    EXPECT_EQ(HashUtils::ComputeSHA256(std::string()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(HashUtils::ComputeSHA256(std::string("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashUtilsTest, GeneratedIdsAreDistinct) {
    std::set<std::string> ids;
    for (int i = 0; i < 1000; ++i) {
        ids.insert(HashUtils::GenerateId("sbx"));
    }
    EXPECT_EQ(ids.size(), 1000u);
    EXPECT_THAT(*ids.begin(), MatchesRegex("sbx-[0-9a-f]{12}"));
    EXPECT_EQ(HashUtils::RandomHex(8).size(), 16u);
}

TEST(ProcessUtilsTest, CapturesOutputAndExitCode) {
    auto result = ProcessUtils::Run({"sh", "-c", "echo out; echo err >&2; exit 3"});
    ASSERT_TRUE(result.Launched());
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_FALSE(result.timed_out);
}

TEST(ProcessUtilsTest, FeedsStdin) {
    ProcessOptions options;
    options.stdin_data = std::string("piped");
    auto result = ProcessUtils::Run({"cat"}, options);
    EXPECT_EQ(result.stdout_output, "piped");
    EXPECT_EQ(result.exit_code, 0);
}

TEST(ProcessUtilsTest, KillsAtDeadline) {
    ProcessOptions options;
    options.timeout = 200ms;
    auto started = std::chrono::steady_clock::now();
    auto result = ProcessUtils::Run({"sleep", "30"}, options);

    EXPECT_TRUE(result.timed_out);
    EXPECT_LT(std::chrono::steady_clock::now() - started, 5s);
}

TEST(ProcessUtilsTest, StopsOnRequest) {
    std::atomic<bool> stop{false};
    ProcessOptions options;
    options.should_stop = [&stop]() { return stop.load(); };
    stop = true;

    auto result = ProcessUtils::Run({"sleep", "30"}, options);
    EXPECT_TRUE(result.cancelled);
}

TEST(ProcessUtilsTest, TruncatesLargeOutput) {
    ProcessOptions options;
    options.max_output_bytes = 100;
    auto result = ProcessUtils::Run({"sh", "-c", "head -c 100000 /dev/zero"}, options);
    EXPECT_TRUE(result.truncated);
    EXPECT_EQ(result.stdout_output.size(), 100u);
}

TEST(ProcessUtilsTest, MissingProgramReportsLaunchError) {
    auto result = ProcessUtils::Run({"/nonexistent/sandcastle-binary"});
    EXPECT_FALSE(result.Launched());
}

} // namespace
