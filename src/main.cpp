#include "common/logger.h"
#include "common/thumbnail_downloader.h"
#include "download/ytdlp_extractor.h"
#include "metadata/ffmpeg_muxer.h"
#include "notify/telegram_notifier.h"
#include "platform/path_finder.h"
#include "platform/platform_utils.h"
#include "run/run_coordinator.h"
#include "settings/settings.h"
#include "source/ytdlp_playlist_source.h"
#include <cstring>
#include <iostream>
#include <memory>

static void printUsage(const char* program) {
    std::cout << "Usage: " << program << " [--config <path>]\n"
              << "\n"
              << "Archives new videos of the configured playlists.\n"
              << "Data directory: $YTARCHIVER_DATA_DIR (default ./data)\n";
}

int main(int argc, char** argv) {
    std::string config_path;
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
            printUsage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown argument: " << argv[i] << "\n";
            printUsage(argv[0]);
            return 2;
        }
    }

    EnginePaths paths = PlatformUtils::buildEnginePaths(PlatformUtils::getDataDirectory());
    if (!PlatformUtils::ensureEngineDirectories(paths)) {
        return 1;
    }
    std::string log_path = PlatformUtils::getLogPath(paths);
    if (!Logger::setLogFile(log_path)) {
        LOG_WARN("main", "Cannot open log file " << log_path);
    }

    if (config_path.empty()) {
        config_path = PlatformUtils::getConfigPath(paths);
    }

    Settings settings;
    std::string error;
    if (!settings.loadFromFile(config_path, error)) {
        LOG_ERROR("main", "Invalid configuration: " << error);
        return 2;
    }
    Logger::setLevel(Logger::parseLevel(settings.log_level));

    std::string ytdlp_command = PathFinder::findYtDlpPath();

    YtDlpExtractorOptions extractor_options;
    extractor_options.ytdlp_command = ytdlp_command;
    extractor_options.ffmpeg_path = PathFinder::findFfmpegPath();
    extractor_options.temp_path = paths.ytdlp_temp;
    extractor_options.socket_timeout = settings.socket_timeout;
    extractor_options.js_runtime = PathFinder::resolveJsRuntime(settings.js_runtime);
    extractor_options.extra_options = settings.yt_dlp_opts;
    if (extractor_options.js_runtime.empty()) {
        LOG_WARN("main", "No JavaScript runtime found; some formats may be unavailable");
    } else {
        LOG_INFO("main", "JavaScript runtime: " << extractor_options.js_runtime);
    }

    YtDlpExtractor extractor(extractor_options);
    FfmpegMuxer muxer(extractor_options.ffmpeg_path);

    std::unique_ptr<TelegramNotifier> notifier;
    if (settings.telegram.enabled()) {
        notifier = std::make_unique<TelegramNotifier>(settings.telegram.bot_token, settings.telegram.chat_id);
    }

    int socket_timeout = settings.socket_timeout;
    RunCollaborators collaborators;
    collaborators.extractor = &extractor;
    collaborators.muxer = &muxer;
    collaborators.source_factory = [ytdlp_command, socket_timeout](const AccountConfig& account) {
        return std::static_pointer_cast<PlaylistSource>(
            std::make_shared<YtDlpPlaylistSource>(ytdlp_command, account.cookies_path, socket_timeout));
    };
    collaborators.fetch_thumbnail = [](const std::string& url, const std::string& dest_path) {
        return ThumbnailDownloader::downloadToFile(url, dest_path);
    };
    collaborators.notifier = notifier.get();

    RunCoordinator coordinator(settings, paths, collaborators);
    RunResult result = coordinator.runOnce();

    switch (result.status) {
        case RunStatus::Completed:
            return result.summary.failed.empty() ? 0 : 3;
        case RunStatus::Locked:
            return 0;
        default:
            return 1;
    }
}
