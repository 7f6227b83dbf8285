#pragma once

#include <string>
#include <vector>
#include <map>
#include "../common/json_utils.h"
#include "../common/types.h"
#include "../download/extraction_profile.h"

struct AccountConfig {
    std::string name;
    std::string cookies_path;
};

struct PlaylistConfig {
    std::string playlist_id;
    std::string folder;
    std::string account;
    bool remove_after_download = false;
};

struct TelegramConfig {
    std::string bot_token;
    std::string chat_id;

    bool enabled() const { return !bot_token.empty() && !chat_id.empty(); }
};

class Settings {
public:
    Settings();

    // Load settings from a JSON config file. On failure error holds the reason.
    bool loadFromFile(const std::string& config_path, std::string& error);
    bool loadFromJson(const json& root, std::string& error);

    // Checks cross-field constraints after loading
    bool validate(std::string& error) const;

    // nullptr if the account is not configured
    const AccountConfig* findAccount(const std::string& name) const;

    std::map<std::string, AccountConfig> accounts;
    std::vector<PlaylistConfig> playlists;

    std::string final_format;       // "", "mp4", "mkv", "webm"
    std::string filename_template;  // empty = default naming
    std::vector<YtDlpOption> yt_dlp_opts;
    std::string js_runtime;         // "name:path", empty = autodetect
    TelegramConfig telegram;

    DownloadMode download_mode;
    int max_attempts;
    int extractor_retries;
    int socket_timeout;
    std::string log_level;

private:
    void loadDefaults();
    bool parseYtDlpOptions(const json& opts, std::string& error);
};
