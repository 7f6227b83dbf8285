#include "platform_utils.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include <cstdlib>

namespace PlatformUtils {

std::string getDataDirectory() {
    const char* env_dir = getenv("YTARCHIVER_DATA_DIR");
    if (env_dir && env_dir[0] != '\0') {
        return PathUtils::normalizePath(env_dir);
    }
    return "data";
}

EnginePaths buildEnginePaths(const std::string& data_dir) {
    EnginePaths paths;
    paths.data_dir = PathUtils::normalizePath(data_dir);
    paths.database_path = PathUtils::joinPath(paths.data_dir, "database/db.sqlite");
    paths.temp_downloads = PathUtils::joinPath(paths.data_dir, "temp_downloads");
    paths.lock_path = PathUtils::joinPath(paths.data_dir, "tmp/ytarchiver.lock");
    paths.ytdlp_temp = PathUtils::joinPath(paths.data_dir, "tmp/yt-dlp");
    paths.thumbs_dir = PathUtils::joinPath(paths.ytdlp_temp, "thumbs");
    paths.logs_dir = PathUtils::joinPath(paths.data_dir, "logs");
    paths.config_dir = PathUtils::joinPath(paths.data_dir, "config");
    return paths;
}

std::string getConfigPath(const EnginePaths& paths) {
    return PathUtils::joinPath(paths.config_dir, "config.json");
}

std::string getLogPath(const EnginePaths& paths) {
    return PathUtils::joinPath(paths.logs_dir, "archiver.log");
}

bool ensureEngineDirectories(const EnginePaths& paths) {
    const std::string dirs[] = {
        PathUtils::getDirectory(paths.database_path),
        paths.temp_downloads,
        PathUtils::getDirectory(paths.lock_path),
        paths.ytdlp_temp,
        paths.thumbs_dir,
        paths.logs_dir,
        paths.config_dir
    };
    for (const auto& dir : dirs) {
        if (!PathUtils::createDirectories(dir)) {
            LOG_ERROR("PlatformUtils", "Cannot create directory: " << dir);
            return false;
        }
    }
    return true;
}

} // namespace PlatformUtils
