#include <gtest/gtest.h>

#include "common/errors.h"
#include "source/ytdlp_playlist_source.h"
#include "test_support.h"

using testsupport::TempDir;
using testsupport::writeFile;

namespace {

TEST(YtDlpPlaylistSourceTest, SeparatesJsonFromDiagnostics) {
    std::string output =
        "WARNING: [youtube] Falling back to generic n function search\n"
        "{\"id\": \"PL1\", \"entries\": [{\"id\": \"a\"}, {\"id\": \"b\"}, {\"title\": \"no id\"}]}\n"
        "ERROR: trailing\n";

    json document;
    std::string diagnostics;
    ASSERT_TRUE(YtDlpPlaylistSource::parseJsonOutput(output, document, diagnostics));

    EXPECT_EQ(JsonUtils::getString(document, "id"), "PL1");
    EXPECT_NE(diagnostics.find("Falling back"), std::string::npos);
    EXPECT_NE(diagnostics.find("ERROR: trailing"), std::string::npos);

    std::vector<PlaylistEntry> entries = YtDlpPlaylistSource::entriesFromJson(document);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].video_id, "a");
    EXPECT_EQ(entries[1].video_id, "b");
}

TEST(YtDlpPlaylistSourceTest, NoJsonDocument) {
    json document;
    std::string diagnostics;
    EXPECT_FALSE(YtDlpPlaylistSource::parseJsonOutput("ERROR: Video unavailable\n", document, diagnostics));
    EXPECT_FALSE(YtDlpPlaylistSource::parseJsonOutput("{ broken\n", document, diagnostics));
    EXPECT_TRUE(YtDlpPlaylistSource::entriesFromJson(json::object()).empty());
}

TEST(YtDlpPlaylistSourceTest, AuthProblemMarkers) {
    EXPECT_TRUE(YtDlpPlaylistSource::looksLikeAuthProblem(
        "ERROR: [youtube] abc: Sign in to confirm you're not a bot. Use --cookies-from-browser"));
    EXPECT_TRUE(YtDlpPlaylistSource::looksLikeAuthProblem("ERROR: unable to download: HTTP Error 403: Forbidden"));
    EXPECT_FALSE(YtDlpPlaylistSource::looksLikeAuthProblem("ERROR: [youtube] abc: Video unavailable"));
    EXPECT_FALSE(YtDlpPlaylistSource::looksLikeAuthProblem(""));
}

TEST(YtDlpPlaylistSourceTest, MissingCookiesFileIsAuthFailure) {
    TempDir dir;
    EXPECT_THROW(YtDlpPlaylistSource("yt-dlp", dir.file("cookies.txt"), 30), AuthFailure);

    ASSERT_TRUE(writeFile(dir.file("cookies.txt"), "# Netscape HTTP Cookie File\n"));
    EXPECT_NO_THROW(YtDlpPlaylistSource("yt-dlp", dir.file("cookies.txt"), 30));
    EXPECT_NO_THROW(YtDlpPlaylistSource("yt-dlp", "", 30));
}

TEST(YtDlpPlaylistSourceTest, FailingToolIsFetchFailure) {
    YtDlpPlaylistSource source("/bin/false", "", 30);
    EXPECT_FALSE(source.canRemoveItems());
    EXPECT_THROW(source.listItems("PL1"), SourceFetchFailure);

    VideoMetadata meta;
    EXPECT_THROW(source.getMetadata("abc123", meta), SourceFetchFailure);
}

TEST(YtDlpPlaylistSourceTest, Urls) {
    EXPECT_EQ(YtDlpPlaylistSource::playlistUrl("PL1"), "https://www.youtube.com/playlist?list=PL1");
    EXPECT_EQ(YtDlpPlaylistSource::watchUrl("abc123"), "https://www.youtube.com/watch?v=abc123");
}

} // namespace
