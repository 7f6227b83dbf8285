#pragma once

#include "playlist_source.h"
#include "../common/json_utils.h"
#include <string>
#include <vector>

// Playlist source that asks yt-dlp for listings (--flat-playlist -J) and
// metadata (-J --skip-download). Read-only: removal is not supported.
class YtDlpPlaylistSource : public PlaylistSource {
public:
    // Throws AuthFailure if a cookies file is configured but missing
    YtDlpPlaylistSource(const std::string& ytdlp_command, const std::string& cookies_path, int socket_timeout);

    std::vector<PlaylistEntry> listItems(const std::string& playlist_id) override;
    bool getMetadata(const std::string& video_id, VideoMetadata& metadata) override;

    static std::string playlistUrl(const std::string& playlist_id);
    static std::string watchUrl(const std::string& video_id);

    // Split yt-dlp output into the JSON document and the remaining (diagnostic) text
    static bool parseJsonOutput(const std::string& output, json& document, std::string& diagnostics);

    // Entries of a --flat-playlist -J document
    static std::vector<PlaylistEntry> entriesFromJson(const json& document);

    // Diagnostics that mean the account cannot see the content
    static bool looksLikeAuthProblem(const std::string& diagnostics);

private:
    std::vector<std::string> baseArguments() const;
    json runJson(const std::vector<std::string>& args, const std::string& what);

    std::string ytdlp_command_;
    std::string cookies_path_;
    int socket_timeout_;
};
