#include "ffmpeg_muxer.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/process_launcher.h"

static bool isMp4Family(const std::string& ext) {
    return ext == "mp4" || ext == "m4a" || ext == "m4v" || ext == "mov";
}

FfmpegMuxer::FfmpegMuxer(const std::string& ffmpeg_path)
    : ffmpeg_path_(ffmpeg_path.empty() ? "ffmpeg" : ffmpeg_path) {
}

std::vector<std::string> FfmpegMuxer::buildTagArguments(const MuxJob& job) {
    std::vector<std::string> args = {"-y", "-v", "error", "-i", job.input_path};
    bool mp4_output = isMp4Family(PathUtils::getExtension(job.output_path));

    if (!job.cover_path.empty() && mp4_output) {
        args.push_back("-i");
        args.push_back(job.cover_path);
    }

    args.push_back("-map");
    args.push_back("0");

    if (!job.cover_path.empty()) {
        if (mp4_output) {
            args.push_back("-map");
            args.push_back("1");
            args.push_back("-disposition:v:1");
            args.push_back("attached_pic");
        } else {
            args.push_back("-attach");
            args.push_back(job.cover_path);
            args.push_back("-metadata:s:t");
            args.push_back("mimetype=image/jpeg");
            args.push_back("-metadata:s:t");
            args.push_back("filename=cover.jpg");
        }
    }

    for (const auto& tag : job.tags) {
        args.push_back("-metadata");
        args.push_back(tag.first + "=" + tag.second);
    }

    args.push_back("-c");
    args.push_back("copy");
    args.push_back(job.output_path);
    return args;
}

std::vector<std::string> FfmpegMuxer::buildRemuxArguments(const std::string& input_path,
                                                          const std::string& output_path) {
    return {"-y", "-v", "error", "-i", input_path, "-map", "0", "-c", "copy", output_path};
}

bool FfmpegMuxer::runFfmpeg(const std::vector<std::string>& args, const std::string& what) {
    ProcessResult result = ProcessLauncher::run(ffmpeg_path_, args, true, true);
    if (!result.launched) {
        LOG_ERROR("FfmpegMuxer", "Failed to launch " << ffmpeg_path_);
        return false;
    }
    if (result.exit_code != 0) {
        LOG_WARN("FfmpegMuxer", what << " failed with status " << result.exit_code
                 << (result.output.empty() ? "" : ": " + result.output));
        return false;
    }
    return true;
}

bool FfmpegMuxer::writeTags(const MuxJob& job) {
    return runFfmpeg(buildTagArguments(job), "Tagging " + PathUtils::getFilename(job.input_path));
}

bool FfmpegMuxer::remux(const std::string& input_path, const std::string& output_path) {
    return runFfmpeg(buildRemuxArguments(input_path, output_path),
                     "Remux " + PathUtils::getFilename(input_path) + " -> " + PathUtils::getExtension(output_path));
}
