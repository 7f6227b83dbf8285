#include "ytdlp_playlist_source.h"
#include "../common/errors.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/process_launcher.h"
#include <algorithm>
#include <cctype>

YtDlpPlaylistSource::YtDlpPlaylistSource(const std::string& ytdlp_command, const std::string& cookies_path,
                                         int socket_timeout)
    : ytdlp_command_(ytdlp_command)
    , cookies_path_(cookies_path)
    , socket_timeout_(socket_timeout) {
    if (!cookies_path_.empty() && !PathUtils::isRegularFile(cookies_path_)) {
        throw AuthFailure("cookies file not found: " + cookies_path_);
    }
}

std::string YtDlpPlaylistSource::playlistUrl(const std::string& playlist_id) {
    return "https://www.youtube.com/playlist?list=" + playlist_id;
}

std::string YtDlpPlaylistSource::watchUrl(const std::string& video_id) {
    return "https://www.youtube.com/watch?v=" + video_id;
}

bool YtDlpPlaylistSource::parseJsonOutput(const std::string& output, json& document, std::string& diagnostics) {
    bool found = false;
    size_t start = 0;
    while (start < output.size()) {
        size_t end = output.find('\n', start);
        if (end == std::string::npos) {
            end = output.size();
        }
        std::string line = output.substr(start, end - start);
        start = end + 1;

        if (!found && !line.empty() && line[0] == '{') {
            json parsed = json::parse(line, nullptr, false);
            if (!parsed.is_discarded() && parsed.is_object()) {
                document = parsed;
                found = true;
                continue;
            }
        }
        if (!line.empty()) {
            diagnostics += line;
            diagnostics += "\n";
        }
    }
    return found;
}

std::vector<PlaylistEntry> YtDlpPlaylistSource::entriesFromJson(const json& document) {
    std::vector<PlaylistEntry> entries;
    auto it = document.find("entries");
    if (it == document.end() || !it->is_array()) {
        return entries;
    }
    for (const auto& entry : *it) {
        std::string id = JsonUtils::getString(entry, "id");
        if (id.empty()) continue;
        PlaylistEntry item;
        item.video_id = id;
        entries.push_back(item);
    }
    return entries;
}

bool YtDlpPlaylistSource::looksLikeAuthProblem(const std::string& diagnostics) {
    std::string lower = diagnostics;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);
    static const char* const markers[] = {
        "sign in to confirm",
        "login required",
        "cookies are no longer valid",
        "use --cookies",
        "http error 401",
        "http error 403"
    };
    for (const char* marker : markers) {
        if (lower.find(marker) != std::string::npos) {
            return true;
        }
    }
    return false;
}

std::vector<std::string> YtDlpPlaylistSource::baseArguments() const {
    std::vector<std::string> args;
    args.push_back("--no-warnings");
    args.push_back("--socket-timeout");
    args.push_back(std::to_string(socket_timeout_));
    if (!cookies_path_.empty()) {
        args.push_back("--cookies");
        args.push_back(cookies_path_);
    }
    return args;
}

json YtDlpPlaylistSource::runJson(const std::vector<std::string>& args, const std::string& what) {
    ProcessResult result = ProcessLauncher::runCommand(ytdlp_command_, args, true, true);
    if (!result.launched) {
        throw SourceFetchFailure("failed to launch " + ytdlp_command_ + " for " + what);
    }

    json document;
    std::string diagnostics;
    bool have_json = parseJsonOutput(result.output, document, diagnostics);

    if (result.exit_code != 0 || !have_json) {
        if (!diagnostics.empty()) {
            LOG_DEBUG("YtDlpPlaylistSource", what << ": " << diagnostics);
        }
        if (looksLikeAuthProblem(diagnostics)) {
            throw AuthFailure(what + ": access denied");
        }
        throw SourceFetchFailure(what + ": yt-dlp exited with status " + std::to_string(result.exit_code));
    }
    return document;
}

std::vector<PlaylistEntry> YtDlpPlaylistSource::listItems(const std::string& playlist_id) {
    std::vector<std::string> args = baseArguments();
    args.push_back("--flat-playlist");
    args.push_back("-J");
    args.push_back(playlistUrl(playlist_id));

    json document = runJson(args, "playlist " + playlist_id);
    std::vector<PlaylistEntry> entries = entriesFromJson(document);
    LOG_INFO("YtDlpPlaylistSource", "Playlist " << playlist_id << ": " << entries.size() << " items");
    return entries;
}

bool YtDlpPlaylistSource::getMetadata(const std::string& video_id, VideoMetadata& metadata) {
    std::vector<std::string> args = baseArguments();
    args.push_back("-J");
    args.push_back("--skip-download");
    args.push_back("--no-playlist");
    args.push_back(watchUrl(video_id));

    json info = runJson(args, "video " + video_id);
    if (JsonUtils::getString(info, "id").empty() && JsonUtils::getString(info, "title").empty()) {
        return false;
    }
    metadata = JsonUtils::metadataFromInfo(info, video_id);
    return true;
}
