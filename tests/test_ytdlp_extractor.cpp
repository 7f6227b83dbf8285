#include <gtest/gtest.h>
#include <algorithm>

#include "download/ytdlp_extractor.h"

namespace {

bool contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

// Value following the first occurrence of option, or "" if absent
std::string valueOf(const std::vector<std::string>& args, const std::string& option) {
    auto it = std::find(args.begin(), args.end(), option);
    if (it == args.end() || it + 1 == args.end()) return "";
    return *(it + 1);
}

YtDlpExtractorOptions sampleOptions() {
    YtDlpExtractorOptions options;
    options.ffmpeg_path = "/usr/bin/ffmpeg";
    options.temp_path = "/data/tmp/yt-dlp";
    options.socket_timeout = 90;
    options.retries = 5;
    options.js_runtime = "deno:/usr/bin/deno";

    YtDlpOption limit;
    limit.name = "--limit-rate";
    limit.value = "2M";
    YtDlpOption no_mtime;
    no_mtime.name = "--no-mtime";
    no_mtime.is_flag = true;
    options.extra_options = {limit, no_mtime};
    return options;
}

ExtractionRequest makeRequest(const AttemptStep& step) {
    ExtractionRequest request;
    request.url = "https://www.youtube.com/watch?v=abc123";
    request.video_id = "abc123";
    request.output_dir = "/data/temp_downloads/abc123";
    request.step = step;
    return request;
}

TEST(YtDlpExtractorTest, HardenedStepCarriesProfileAndOptions) {
    AttemptStep step;
    step.profile = ExtractionProfiles::chain()[0];
    step.format = ExtractionProfiles::FORMAT_PREFERRED;

    std::vector<std::string> args = YtDlpExtractor::buildArguments(makeRequest(step), sampleOptions());

    EXPECT_EQ(valueOf(args, "-o"), "/data/temp_downloads/abc123/%(id)s.%(ext)s");
    EXPECT_EQ(valueOf(args, "--paths"), "temp:/data/tmp/yt-dlp");
    EXPECT_EQ(valueOf(args, "--ffmpeg-location"), "/usr/bin/ffmpeg");
    EXPECT_EQ(valueOf(args, "--print"), "after_move:filepath");
    EXPECT_EQ(valueOf(args, "-f"), ExtractionProfiles::FORMAT_PREFERRED);
    EXPECT_EQ(valueOf(args, "--socket-timeout"), "90");
    EXPECT_EQ(valueOf(args, "--retries"), "5");
    EXPECT_EQ(valueOf(args, "--extractor-args"), "youtube:player_client=android");
    EXPECT_EQ(valueOf(args, "--js-runtimes"), "deno:/usr/bin/deno");
    EXPECT_EQ(valueOf(args, "--add-header").compare(0, 11, "User-Agent:"), 0);
    EXPECT_TRUE(contains(args, "Accept-Language:en-US,en;q=0.9"));
    EXPECT_TRUE(contains(args, "--no-playlist"));

    // User options come right before the URL, which is always last
    ASSERT_GE(args.size(), 4u);
    EXPECT_EQ(args[args.size() - 4], "--limit-rate");
    EXPECT_EQ(args[args.size() - 3], "2M");
    EXPECT_EQ(args[args.size() - 2], "--no-mtime");
    EXPECT_EQ(args.back(), "https://www.youtube.com/watch?v=abc123");
}

TEST(YtDlpExtractorTest, DefaultStepHasNoClientHint) {
    AttemptStep step;
    step.profile = ExtractionProfiles::defaultProfile();
    step.format = ExtractionProfiles::FORMAT_BEST_FALLBACK;

    std::vector<std::string> args = YtDlpExtractor::buildArguments(makeRequest(step), sampleOptions());

    EXPECT_EQ(valueOf(args, "-f"), "bestvideo*+bestaudio/best");
    EXPECT_FALSE(contains(args, "--extractor-args"));
    EXPECT_FALSE(contains(args, "--add-header"));
    EXPECT_TRUE(contains(args, "--socket-timeout"));
}

TEST(YtDlpExtractorTest, NativeStepUsesToolDefaults) {
    AttemptPlan plan = ExtractionProfiles::buildAttemptPlan(DownloadMode::Lenient);
    ASSERT_TRUE(plan.front().native);

    std::vector<std::string> args = YtDlpExtractor::buildArguments(makeRequest(plan.front()), sampleOptions());

    for (const char* option : {"-f", "--add-header", "--extractor-args", "--socket-timeout", "--retries",
                               "--js-runtimes", "--limit-rate", "--no-mtime", "--remote-components"}) {
        EXPECT_FALSE(contains(args, option)) << option;
    }
    EXPECT_EQ(valueOf(args, "-o"), "/data/temp_downloads/abc123/%(id)s.%(ext)s");
    EXPECT_EQ(args.back(), "https://www.youtube.com/watch?v=abc123");
}

TEST(YtDlpExtractorTest, ParseReportedPathTakesLastLine) {
    EXPECT_EQ(YtDlpExtractor::parseReportedPath("/tmp/a/abc.webm\n"), "/tmp/a/abc.webm");
    EXPECT_EQ(YtDlpExtractor::parseReportedPath("noise\n/tmp/a/abc.mkv\r\n\n"), "/tmp/a/abc.mkv");
    EXPECT_EQ(YtDlpExtractor::parseReportedPath(""), "");
}

TEST(YtDlpExtractorTest, FailingToolIsAFailedAttempt) {
    YtDlpExtractorOptions options;
    options.ytdlp_command = "/bin/false";
    YtDlpExtractor extractor(options);

    AttemptStep step;
    step.profile = ExtractionProfiles::defaultProfile();
    ExtractionResult result = extractor.extract(makeRequest(step));

    EXPECT_FALSE(result.success);
    EXPECT_FALSE(result.error.empty());
}

} // namespace
