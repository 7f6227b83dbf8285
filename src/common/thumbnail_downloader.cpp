#include "thumbnail_downloader.h"
#include "logger.h"
#include "path_utils.h"
#include "process_launcher.h"
#include "../platform/path_finder.h"
#include <vector>

namespace ThumbnailDownloader {

bool downloadToFile(const std::string& thumbnail_url, const std::string& dest_path, int timeout_seconds) {
    if (thumbnail_url.empty()) {
        LOG_DEBUG("ThumbnailDownloader", "Empty URL");
        return false;
    }

    LOG_DEBUG("ThumbnailDownloader", "Downloading from: " << thumbnail_url);

    std::vector<std::string> args;
    args.push_back("-s");
    args.push_back("-L");
    args.push_back("--fail");
    args.push_back("--max-time");
    args.push_back(std::to_string(timeout_seconds));
    args.push_back("--connect-timeout");
    args.push_back("5");
    args.push_back("-o");
    args.push_back(dest_path);
    args.push_back(thumbnail_url);

    ProcessResult result = ProcessLauncher::run(PathFinder::findCurlPath(), args);

    int64_t size = 0;
    bool have_file = PathUtils::getFileSize(dest_path, size) && size > 0;
    if (!result.succeeded() || !have_file) {
        LOG_DEBUG("ThumbnailDownloader", "curl failed with status " << result.exit_code
                  << (have_file ? "" : ", no data received"));
        PathUtils::removeFile(dest_path);
        return false;
    }

    LOG_DEBUG("ThumbnailDownloader", "Downloaded " << size << " bytes to " << dest_path);
    return true;
}

} // namespace ThumbnailDownloader
