#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>

#include "file/file_manager.h"
#include "notify/telegram_notifier.h"
#include "run/run_context.h"
#include "test_support.h"

using testsupport::TempDir;
using testsupport::readFile;
using testsupport::writeFile;

namespace {

TEST(RunContextTest, JoinWaitsForNestedWork) {
    RunContext context;
    std::atomic<int> finished{0};

    context.runBackground([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        // Work started while the coordinator is already waiting
        context.runBackground([&]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(30));
            finished++;
        });
        finished++;
    });

    context.joinBackgroundThreads();

    EXPECT_EQ(finished.load(), 2);
    EXPECT_EQ(context.backgroundThreadCount(), 0u);
}

TEST(RunContextTest, ConcurrentResultsAreAllKept) {
    RunContext context;
    for (int i = 0; i < 16; ++i) {
        context.runBackground([&context, i]() {
            if (i % 2 == 0) {
                context.recordSuccess("ok " + std::to_string(i));
            } else {
                context.recordFailure("bad " + std::to_string(i));
            }
        });
    }
    context.joinBackgroundThreads();

    RunSummary summary = context.summary();
    EXPECT_EQ(summary.succeeded.size(), 8u);
    EXPECT_EQ(summary.failed.size(), 8u);
    EXPECT_TRUE(context.hasResults());
}

TEST(RunContextTest, FormatSummary) {
    RunSummary summary;
    summary.succeeded = {"Foo - Bar (01-2023)"};
    summary.failed = {"PL1 (auth)", "Baz - Qux"};

    EXPECT_EQ(RunContext::formatSummary(summary),
              "YouTube Archiver Summary\n"
              "✔ Success: 1\n"
              "✖ Failed: 2\n"
              "\nDownloaded:\n"
              "• Foo - Bar (01-2023)\n"
              "\nFailed:\n"
              "• PL1 (auth)\n"
              "• Baz - Qux\n");
}

TEST(RunContextTest, EmptyContextHasNoResults) {
    RunContext context;
    EXPECT_FALSE(context.hasResults());
    EXPECT_EQ(RunContext::formatSummary(context.summary()),
              "YouTube Archiver Summary\n✔ Success: 0\n✖ Failed: 0\n");
}

TEST(TelegramNotifierTest, PostsUrlEncodedMessage) {
    TelegramNotifier notifier("123:abc", "-100200", 10);

    std::vector<std::string> args = notifier.buildArguments("hello & bye");

    EXPECT_EQ(args, std::vector<std::string>({
        "-s", "--fail", "--max-time", "10", "-X", "POST",
        "https://api.telegram.org/bot123:abc/sendMessage",
        "--data-urlencode", "chat_id=-100200",
        "--data-urlencode", "text=hello & bye"}));
}

TEST(FileManagerTest, CopiesIntoNewDirectories) {
    TempDir dir;
    ASSERT_TRUE(writeFile(dir.file("src.webm"), "media bytes"));

    ASSERT_TRUE(FileManager::copyFile(dir.file("src.webm"), dir.file("a/b/dst.webm")));

    EXPECT_EQ(readFile(dir.file("a/b/dst.webm")), "media bytes");
    EXPECT_EQ(readFile(dir.file("src.webm")), "media bytes");
}

TEST(FileManagerTest, MissingSourceFails) {
    TempDir dir;
    EXPECT_FALSE(FileManager::copyFile(dir.file("missing.webm"), dir.file("dst.webm")));
    EXPECT_TRUE(testsupport::listNames(dir.path()).empty());
}

} // namespace
