#include "path_finder.h"
#include "../common/logger.h"
#include "../common/process_launcher.h"
#include <cstdlib>
#include <map>
#include <mutex>
#include <vector>
#include <sys/stat.h>
#include <unistd.h>

// Tool locations don't change during a run; cache them
static std::mutex tool_cache_mutex;
static std::map<std::string, std::string> tool_cache;

std::string PathFinder::findYtDlpPath() {
    {
        std::lock_guard<std::mutex> lock(tool_cache_mutex);
        auto it = tool_cache.find("yt-dlp");
        if (it != tool_cache.end()) {
            return it->second;
        }
    }

    LOG_DEBUG("PathFinder", "Searching for yt-dlp (first call)...");
    std::string ytdlp_path = findInPath("yt-dlp");
    if (ytdlp_path.empty()) {
        ytdlp_path = findInSystemPaths("yt-dlp");
    }

    if (ytdlp_path.empty()) {
        // Try python module as fallback
        ProcessResult probe = ProcessLauncher::run("python3", {"-m", "yt_dlp", "--version"}, true);
        if (probe.succeeded() && !probe.output.empty()) {
            LOG_DEBUG("PathFinder", "Found yt-dlp as python module: python3 -m yt_dlp");
            ytdlp_path = "python3 -m yt_dlp";
        }
    }

    if (ytdlp_path.empty()) {
        LOG_DEBUG("PathFinder", "yt-dlp not found, relying on PATH at exec time");
        ytdlp_path = "yt-dlp";
    } else {
        LOG_INFO("PathFinder", "Using yt-dlp: " << ytdlp_path);
    }

    std::lock_guard<std::mutex> lock(tool_cache_mutex);
    tool_cache["yt-dlp"] = ytdlp_path;
    return ytdlp_path;
}

std::string PathFinder::findFfmpegPath() {
    return findTool("ffmpeg");
}

std::string PathFinder::findCurlPath() {
    return findTool("curl");
}

std::string PathFinder::findTool(const std::string& filename) {
    {
        std::lock_guard<std::mutex> lock(tool_cache_mutex);
        auto it = tool_cache.find(filename);
        if (it != tool_cache.end()) {
            return it->second;
        }
    }

    std::string path = findInPath(filename);
    if (path.empty()) {
        path = findInSystemPaths(filename);
    }
    if (path.empty()) {
        // Final fallback, execvp searches PATH itself
        path = filename;
    }

    std::lock_guard<std::mutex> lock(tool_cache_mutex);
    tool_cache[filename] = path;
    return path;
}

std::string PathFinder::resolveJsRuntime(const std::string& configured) {
    if (!configured.empty()) {
        return configured;
    }

    const char* env_runtime = getenv("YT_DLP_JS_RUNTIME");
    if (env_runtime && env_runtime[0] != '\0') {
        return env_runtime;
    }

    std::string deno = findInPath("deno");
    if (!deno.empty()) {
        return "deno:" + deno;
    }

    std::string node = findInPath("node");
    if (!node.empty()) {
        return "node:" + node;
    }

    return "";
}

std::string PathFinder::findInPath(const std::string& filename) {
    const char* path_env = getenv("PATH");
    if (!path_env) {
        return "";
    }

    std::string path_list = path_env;
    size_t start = 0;
    while (start <= path_list.size()) {
        size_t end = path_list.find(':', start);
        if (end == std::string::npos) {
            end = path_list.size();
        }
        std::string dir = path_list.substr(start, end - start);
        if (!dir.empty()) {
            std::string candidate = dir + "/" + filename;
            if (isExecutable(candidate)) {
                LOG_DEBUG("PathFinder", "Found " << filename << " in PATH: " << candidate);
                return candidate;
            }
        }
        start = end + 1;
    }
    return "";
}

std::string PathFinder::findInSystemPaths(const std::string& filename) {
    static const std::vector<std::string> paths = {
        "/usr/local/bin",
        "/usr/bin",
        "/bin",
        "/opt/homebrew/bin"
    };

    for (const auto& path : paths) {
        std::string full_path = path + "/" + filename;
        if (isExecutable(full_path)) {
            return full_path;
        }
    }

    return "";
}

bool PathFinder::isExecutable(const std::string& path) {
    if (path.empty()) {
        return false;
    }

    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }

    if (!S_ISREG(st.st_mode)) {
        return false;
    }

    return access(path.c_str(), X_OK) == 0;
}
