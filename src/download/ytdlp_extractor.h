#pragma once

#include "extractor.h"
#include "../common/types.h"
#include <string>
#include <vector>

struct YtDlpExtractorOptions {
    std::string ytdlp_command = "yt-dlp";  // May be "python3 -m yt_dlp"
    std::string ffmpeg_path;
    std::string temp_path;                 // yt-dlp --paths temp:
    int socket_timeout = 120;
    int retries = 5;
    std::string js_runtime;                // "name:path", empty = none
    std::vector<YtDlpOption> extra_options;
};

// Extractor backed by the yt-dlp command-line tool
class YtDlpExtractor : public Extractor {
public:
    explicit YtDlpExtractor(const YtDlpExtractorOptions& options);

    ExtractionResult extract(const ExtractionRequest& request) override;

    // Command-line arguments (without the executable) for one attempt
    static std::vector<std::string> buildArguments(const ExtractionRequest& request,
                                                   const YtDlpExtractorOptions& options);

    // Last non-empty line of the --print after_move:filepath output
    static std::string parseReportedPath(const std::string& output);

private:
    YtDlpExtractorOptions options_;
};
