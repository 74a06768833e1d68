#include <gtest/gtest.h>
#include <chrono>
#include <thread>
#include "test_helpers.hpp"
#include "shadow/VerificationSuite.hpp"
#include "utils/SubProcess.hpp"

using namespace autopatch;

TEST(SubProcessTest, CapturesOutputAndExitCode) {
    auto r = SubProcess::run("echo hello; echo oops 1>&2; exit 3");
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_FALSE(r.success);
    EXPECT_NE(r.output.find("hello"), std::string::npos);
    EXPECT_NE(r.output.find("oops"), std::string::npos);
}

TEST(SubProcessTest, RunsInWorkingDirectory) {
    ProcessOptions opts;
    opts.working_dir = fs::temp_directory_path();
    auto r = SubProcess::run("pwd", opts);
    EXPECT_TRUE(r.success);
    EXPECT_NE(r.output.find(fs::canonical(fs::temp_directory_path()).string()), std::string::npos);
}

TEST(SubProcessTest, TimeoutKillsTheWholeGroup) {
    ProcessOptions opts;
    opts.timeout = std::chrono::milliseconds(300);
    auto start = std::chrono::steady_clock::now();
    auto r = SubProcess::run("sleep 30 & sleep 30", opts);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_TRUE(r.timed_out);
    EXPECT_FALSE(r.success);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}

TEST(SubProcessTest, CancellationStopsTheChild) {
    CancellationToken token;
    ProcessOptions opts;
    opts.cancel = &token;
    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        token.cancel();
    });
    auto r = SubProcess::run("sleep 30", opts);
    canceller.join();
    EXPECT_TRUE(r.cancelled);
    EXPECT_FALSE(r.success);
}

TEST(SubProcessTest, OutputIsCapped) {
    ProcessOptions opts;
    opts.max_output = 1024;
    auto r = SubProcess::run("head -c 100000 /dev/zero | tr '\\0' 'x'", opts);
    EXPECT_NE(r.output.find("[Output Truncated]"), std::string::npos);
    EXPECT_LT(r.output.size(), 2048u);
}

TEST(CommandVerificationSuiteTest, PassesOnCleanExit) {
    CommandVerificationSuite suite("echo all good", std::chrono::seconds(10));
    CancellationToken token;
    auto out = suite.run(fs::temp_directory_path(), token);
    EXPECT_TRUE(out.passed) << out.report;
    EXPECT_NE(out.report.find("Exit Code: 0"), std::string::npos);
}

TEST(CommandVerificationSuiteTest, NonZeroExitFails) {
    CommandVerificationSuite suite("exit 1", std::chrono::seconds(10));
    CancellationToken token;
    EXPECT_FALSE(suite.run(fs::temp_directory_path(), token).passed);
}

TEST(CommandVerificationSuiteTest, FailMarkerOverridesExitZero) {
    CommandVerificationSuite suite("echo 'FAILED: test_add'", std::chrono::seconds(10));
    CancellationToken token;
    auto out = suite.run(fs::temp_directory_path(), token);
    EXPECT_FALSE(out.passed);
}

TEST(CommandVerificationSuiteTest, TimeoutFails) {
    CommandVerificationSuite suite("sleep 30", std::chrono::seconds(1));
    CancellationToken token;
    auto out = suite.run(fs::temp_directory_path(), token);
    EXPECT_FALSE(out.passed);
    EXPECT_TRUE(out.timed_out);
}

TEST(CommandVerificationSuiteTest, EmptyCommandFails) {
    CommandVerificationSuite suite("", std::chrono::seconds(1));
    CancellationToken token;
    EXPECT_FALSE(suite.run(fs::temp_directory_path(), token).passed);
}

TEST(CommandVerificationSuiteTest, MarkerMatchingIsLineStartAndCaseInsensitive) {
    std::vector<std::string> markers = {"ERROR:", "FAILED:"};
    EXPECT_TRUE(CommandVerificationSuite::has_fail_marker("ok\n  error: boom\n", markers));
    EXPECT_TRUE(CommandVerificationSuite::has_fail_marker("Failed: 2 tests", markers));
    EXPECT_FALSE(CommandVerificationSuite::has_fail_marker("no ERROR: here at line start", markers));
    EXPECT_FALSE(CommandVerificationSuite::has_fail_marker("3 passed", markers));
}
