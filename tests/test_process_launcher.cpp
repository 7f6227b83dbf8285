#include <gtest/gtest.h>

#include "common/process_launcher.h"

namespace {

TEST(ProcessLauncherTest, ReportsExitCode) {
    ProcessResult ok = ProcessLauncher::run("/bin/sh", {"-c", "exit 0"});
    EXPECT_TRUE(ok.launched);
    EXPECT_EQ(ok.exit_code, 0);
    EXPECT_TRUE(ok.succeeded());

    ProcessResult failed = ProcessLauncher::run("/bin/sh", {"-c", "exit 3"});
    EXPECT_TRUE(failed.launched);
    EXPECT_EQ(failed.exit_code, 3);
    EXPECT_FALSE(failed.succeeded());
}

TEST(ProcessLauncherTest, CapturesStdout) {
    ProcessResult result = ProcessLauncher::run("/bin/sh", {"-c", "echo out; echo err 1>&2"}, true, false);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "out\n");
}

TEST(ProcessLauncherTest, MergesStderrWhenAsked) {
    ProcessResult result = ProcessLauncher::run("/bin/sh", {"-c", "echo out; echo err 1>&2"}, true, true);
    ASSERT_TRUE(result.succeeded());
    EXPECT_NE(result.output.find("out\n"), std::string::npos);
    EXPECT_NE(result.output.find("err\n"), std::string::npos);
}

TEST(ProcessLauncherTest, ArgumentsAreNotShellExpanded) {
    ProcessResult result = ProcessLauncher::run("/bin/echo", {"$HOME; rm -rf x", "a b"}, true);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "$HOME; rm -rf x a b\n");
}

TEST(ProcessLauncherTest, MissingExecutableFails) {
    ProcessResult result = ProcessLauncher::run("/nonexistent/ytarchiver-tool", {}, true);
    EXPECT_FALSE(result.succeeded());
    EXPECT_TRUE(!result.launched || result.exit_code == 127);
}

TEST(ProcessLauncherTest, RunCommandSplitsLeadingArguments) {
    ProcessResult result = ProcessLauncher::runCommand("/bin/sh -c", {"echo hello"}, true);
    ASSERT_TRUE(result.succeeded());
    EXPECT_EQ(result.output, "hello\n");
}

TEST(ProcessLauncherTest, ParseCommand) {
    std::string executable;
    std::vector<std::string> arguments;

    ASSERT_TRUE(ProcessLauncher::parseCommand("python3 -m yt_dlp", executable, arguments));
    EXPECT_EQ(executable, "python3");
    EXPECT_EQ(arguments, std::vector<std::string>({"-m", "yt_dlp"}));

    ASSERT_TRUE(ProcessLauncher::parseCommand("\"/opt/my tools/yt-dlp\"  --verbose", executable, arguments));
    EXPECT_EQ(executable, "/opt/my tools/yt-dlp");
    EXPECT_EQ(arguments, std::vector<std::string>({"--verbose"}));

    EXPECT_FALSE(ProcessLauncher::parseCommand("   ", executable, arguments));
}

} // namespace
