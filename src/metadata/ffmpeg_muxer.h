#pragma once

#include "muxer.h"
#include <string>
#include <vector>

class FfmpegMuxer : public Muxer {
public:
    explicit FfmpegMuxer(const std::string& ffmpeg_path);

    bool writeTags(const MuxJob& job) override;
    bool remux(const std::string& input_path, const std::string& output_path) override;

    // ffmpeg arguments for a tagging job. Matroska/WebM outputs carry the cover
    // as an attachment, MP4-family outputs as an attached picture stream.
    static std::vector<std::string> buildTagArguments(const MuxJob& job);
    static std::vector<std::string> buildRemuxArguments(const std::string& input_path,
                                                       const std::string& output_path);

private:
    bool runFfmpeg(const std::vector<std::string>& args, const std::string& what);

    std::string ffmpeg_path_;
};
