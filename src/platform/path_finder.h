#ifndef PATH_FINDER_H
#define PATH_FINDER_H

#include <string>

class PathFinder {
public:
    // Find yt-dlp executable. May return a command string ("python3 -m yt_dlp").
    static std::string findYtDlpPath();

    // Find ffmpeg executable
    static std::string findFfmpegPath();

    // Find curl executable
    static std::string findCurlPath();

    // JavaScript runtime hint for yt-dlp as "name:path".
    // Order: configured value, YT_DLP_JS_RUNTIME, deno on PATH, node on PATH.
    // Returns "" if none is available.
    static std::string resolveJsRuntime(const std::string& configured);

    // Look up an executable on PATH, "" if not found
    static std::string findInPath(const std::string& filename);

private:
    // Cached lookup: PATH, then common system directories, then the bare name
    static std::string findTool(const std::string& filename);
    static std::string findInSystemPaths(const std::string& filename);

    // Helper: Check if file exists and is executable
    static bool isExecutable(const std::string& path);
};

#endif // PATH_FINDER_H
