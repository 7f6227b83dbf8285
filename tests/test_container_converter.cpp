#include <gtest/gtest.h>

#include "common/path_utils.h"
#include "metadata/container_converter.h"
#include "test_support.h"

using testsupport::FakeMuxer;
using testsupport::TempDir;
using testsupport::listNames;
using testsupport::readFile;
using testsupport::writeFile;

namespace {

TEST(ContainerConverterTest, SameContainerIsNoOp) {
    TempDir dir;
    std::string media = dir.file("abc123.mkv");
    ASSERT_TRUE(writeFile(media, "media"));
    FakeMuxer muxer;
    ContainerConverter converter(muxer);

    EXPECT_EQ(converter.convert(media, "mkv"), media);
    EXPECT_EQ(converter.convert(media, ""), media);
    EXPECT_TRUE(muxer.remux_calls.empty());
}

TEST(ContainerConverterTest, Mp4ToWebmIsRefused) {
    TempDir dir;
    std::string media = dir.file("abc123.mp4");
    ASSERT_TRUE(writeFile(media, "media"));
    FakeMuxer muxer;
    ContainerConverter converter(muxer);

    EXPECT_EQ(converter.convert(media, "webm"), media);

    EXPECT_TRUE(muxer.remux_calls.empty());
    EXPECT_EQ(readFile(media), "media");
    EXPECT_EQ(listNames(dir.path()), std::vector<std::string>({"abc123.mp4"}));
}

TEST(ContainerConverterTest, RefusalIsDirectional) {
    EXPECT_TRUE(ContainerConverter::isRefused("mp4", "webm"));
    EXPECT_FALSE(ContainerConverter::isRefused("webm", "mp4"));
    EXPECT_FALSE(ContainerConverter::isRefused("mp4", "mkv"));
    EXPECT_FALSE(ContainerConverter::isRefused("webm", "mkv"));
}

TEST(ContainerConverterTest, SuccessReplacesOriginal) {
    TempDir dir;
    std::string media = dir.file("abc123.webm");
    ASSERT_TRUE(writeFile(media, "media"));
    FakeMuxer muxer;
    ContainerConverter converter(muxer);

    std::string converted = converter.convert(media, ".MKV");

    EXPECT_EQ(converted, dir.file("abc123.mkv"));
    EXPECT_EQ(readFile(converted), "media");
    EXPECT_EQ(listNames(dir.path()), std::vector<std::string>({"abc123.mkv"}));
    ASSERT_EQ(muxer.remux_calls.size(), 1u);
    EXPECT_EQ(muxer.remux_calls[0].first, media);
}

TEST(ContainerConverterTest, FailureKeepsOriginal) {
    TempDir dir;
    std::string media = dir.file("abc123.webm");
    ASSERT_TRUE(writeFile(media, "media"));
    FakeMuxer muxer;
    muxer.remux_result = false;
    ContainerConverter converter(muxer);

    EXPECT_EQ(converter.convert(media, "mp4"), media);

    EXPECT_EQ(readFile(media), "media");
    EXPECT_EQ(listNames(dir.path()), std::vector<std::string>({"abc123.webm"}));
}

} // namespace
