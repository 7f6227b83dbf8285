#include "ytdlp_extractor.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/process_launcher.h"

namespace YtDlpConfig {
    // Output template inside the per-video scratch directory
    const std::string OUTPUT_TEMPLATE = "%(id)s.%(ext)s";

    // Makes yt-dlp print the final path once all post-processing is done
    const std::string PRINT_FINAL_PATH = "after_move:filepath";

    // EJS challenge solver scripts for the JS runtime
    const std::string REMOTE_COMPONENTS = "ejs:github";
}

YtDlpExtractor::YtDlpExtractor(const YtDlpExtractorOptions& options)
    : options_(options) {
}

std::vector<std::string> YtDlpExtractor::buildArguments(const ExtractionRequest& request,
                                                        const YtDlpExtractorOptions& options) {
    std::vector<std::string> args;
    const AttemptStep& step = request.step;

    args.push_back("-o");
    args.push_back(PathUtils::joinPath(request.output_dir, YtDlpConfig::OUTPUT_TEMPLATE));

    if (!options.temp_path.empty()) {
        args.push_back("--paths");
        args.push_back("temp:" + options.temp_path);
    }

    if (!options.ffmpeg_path.empty()) {
        args.push_back("--ffmpeg-location");
        args.push_back(options.ffmpeg_path);
    }

    args.push_back("--no-playlist");
    args.push_back("--no-progress");
    args.push_back("--no-simulate");
    args.push_back("--print");
    args.push_back(YtDlpConfig::PRINT_FINAL_PATH);

    // Native attempts run with yt-dlp's own defaults only
    if (!step.native) {
        if (!step.format.empty()) {
            args.push_back("-f");
            args.push_back(step.format);
        }

        args.push_back("--socket-timeout");
        args.push_back(std::to_string(options.socket_timeout));
        args.push_back("--retries");
        args.push_back(std::to_string(options.retries));
        args.push_back("--force-ipv4");
        args.push_back("--continue");

        for (const auto& header : step.profile.headers) {
            args.push_back("--add-header");
            args.push_back(header.first + ":" + header.second);
        }

        if (!step.profile.player_client.empty()) {
            args.push_back("--extractor-args");
            args.push_back("youtube:player_client=" + step.profile.player_client);
        }

        args.push_back("--remote-components");
        args.push_back(YtDlpConfig::REMOTE_COMPONENTS);

        if (!options.js_runtime.empty()) {
            args.push_back("--js-runtimes");
            args.push_back(options.js_runtime);
        }

        // User overrides come last so they win over the defaults above
        for (const auto& option : options.extra_options) {
            args.push_back(option.name);
            if (!option.is_flag) {
                args.push_back(option.value);
            }
        }
    }

    args.push_back(request.url);
    return args;
}

std::string YtDlpExtractor::parseReportedPath(const std::string& output) {
    std::string last_line;
    size_t start = 0;
    while (start < output.size()) {
        size_t end = output.find('\n', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        std::string line = output.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            last_line = line;
        }
        start = end + 1;
    }
    return last_line;
}

ExtractionResult YtDlpExtractor::extract(const ExtractionRequest& request) {
    ExtractionResult result;
    std::vector<std::string> args = buildArguments(request, options_);

    LOG_DEBUG("YtDlpExtractor", "[" << request.video_id << "] yt-dlp with " << args.size() << " arguments, step "
              << request.step.describe());

    ProcessResult process = ProcessLauncher::runCommand(options_.ytdlp_command, args, true, false);
    if (!process.launched) {
        result.error = "failed to launch " + options_.ytdlp_command;
        return result;
    }
    if (process.exit_code != 0) {
        result.error = "yt-dlp exited with status " + std::to_string(process.exit_code);
        return result;
    }

    result.success = true;
    result.file_path = parseReportedPath(process.output);
    return result;
}
