#ifndef PLATFORM_UTILS_H
#define PLATFORM_UTILS_H

#include <string>

// On-disk layout of the archiver's data directory
struct EnginePaths {
    std::string data_dir;
    std::string database_path;   // <data>/database/db.sqlite
    std::string temp_downloads;  // <data>/temp_downloads
    std::string lock_path;       // <data>/tmp/ytarchiver.lock
    std::string ytdlp_temp;      // <data>/tmp/yt-dlp
    std::string thumbs_dir;      // <data>/tmp/yt-dlp/thumbs
    std::string logs_dir;        // <data>/logs
    std::string config_dir;      // <data>/config
};

namespace PlatformUtils {

// Path functions
std::string getDataDirectory();  // YTARCHIVER_DATA_DIR or ./data
EnginePaths buildEnginePaths(const std::string& data_dir);
std::string getConfigPath(const EnginePaths& paths);
std::string getLogPath(const EnginePaths& paths);

// Create every directory in the layout. Returns false on the first failure.
bool ensureEngineDirectories(const EnginePaths& paths);

} // namespace PlatformUtils

#endif // PLATFORM_UTILS_H
