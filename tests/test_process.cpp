#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <chrono>

using namespace std::chrono_literals;

TEST(ProcessTest, CapturesOutputAndExitCode) {
    auto r = platform::run_captured("sh", {"-c", "echo out; echo err >&2; exit 3"}, 5000);

    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 3);
    EXPECT_EQ(r.stdout_data, "out\n");
    EXPECT_EQ(r.stderr_data, "err\n");
    EXPECT_TRUE(r.failed());
}

TEST(ProcessTest, HungChildIsKilledAtTheDeadline) {
    auto started = std::chrono::steady_clock::now();

    auto r = platform::run_captured("sh", {"-c", "echo hi; sleep 10"}, 500);

    auto took = std::chrono::steady_clock::now() - started;
    EXPECT_TRUE(r.timed_out);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_EQ(r.stdout_data, "hi\n");
    EXPECT_LT(took, 4s);
}

TEST(ProcessTest, MissingProgramFails) {
    auto r = platform::run_captured("/nonexistent/ec2ctl-no-such-binary", {}, 5000);

    EXPECT_FALSE(r.timed_out);
    EXPECT_EQ(r.exit_code, 127);
    EXPECT_TRUE(r.failed());
}
