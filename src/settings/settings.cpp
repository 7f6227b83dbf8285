#include "settings.h"
#include "../common/logger.h"
#include "../common/validation_utils.h"
#include <cctype>
#include <fstream>

// chat ids are often written as numbers
static std::string chatIdString(const json& j, const std::string& key) {
    auto it = j.find(key);
    if (it != j.end() && it->is_number_integer()) {
        return std::to_string(it->get<long long>());
    }
    return JsonUtils::getString(j, key);
}

Settings::Settings() {
    loadDefaults();
}

void Settings::loadDefaults() {
    accounts.clear();
    playlists.clear();
    final_format = "";
    filename_template = "";
    yt_dlp_opts.clear();
    js_runtime = "";
    telegram = TelegramConfig();

    download_mode = DownloadMode::Strict;
    max_attempts = 4;
    extractor_retries = 2;
    socket_timeout = 120;
    log_level = "info";
}

bool Settings::loadFromFile(const std::string& config_path, std::string& error) {
    LOG_INFO("Settings", "Loading settings from: " << config_path);
    std::ifstream file(config_path);
    if (!file.is_open()) {
        error = "cannot open config file " + config_path;
        return false;
    }

    json root = json::parse(file, nullptr, false);
    if (root.is_discarded()) {
        error = "config file is not valid JSON: " + config_path;
        return false;
    }
    return loadFromJson(root, error);
}

bool Settings::loadFromJson(const json& root, std::string& error) {
    loadDefaults();

    if (!root.is_object()) {
        error = "config root must be a JSON object";
        return false;
    }

    auto accounts_it = root.find("accounts");
    if (accounts_it != root.end() && accounts_it->is_object()) {
        for (auto it = accounts_it->begin(); it != accounts_it->end(); ++it) {
            AccountConfig account;
            account.name = it.key();
            account.cookies_path = JsonUtils::getString(it.value(), "cookies");
            accounts[account.name] = account;
        }
    }

    auto playlists_it = root.find("playlists");
    if (playlists_it != root.end() && playlists_it->is_array()) {
        for (const auto& entry : *playlists_it) {
            PlaylistConfig playlist;
            playlist.playlist_id = JsonUtils::getString(entry, "playlist_id", JsonUtils::getString(entry, "id"));
            playlist.folder = JsonUtils::getString(entry, "folder", JsonUtils::getString(entry, "directory"));
            playlist.account = JsonUtils::getString(entry, "account");
            playlist.remove_after_download = JsonUtils::getBool(entry, "remove_after_download", false);
            playlists.push_back(playlist);
        }
    }

    final_format = JsonUtils::getString(root, "final_format");
    for (auto& c : final_format) {
        c = static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    filename_template = JsonUtils::getString(root, "filename_template");
    js_runtime = JsonUtils::getString(root, "js_runtime");

    auto opts_it = root.find("yt_dlp_opts");
    if (opts_it != root.end() && !opts_it->is_null()) {
        if (!parseYtDlpOptions(*opts_it, error)) {
            return false;
        }
    }

    auto telegram_it = root.find("telegram");
    if (telegram_it != root.end() && telegram_it->is_object()) {
        telegram.bot_token = JsonUtils::getString(*telegram_it, "bot_token");
        telegram.chat_id = chatIdString(*telegram_it, "chat_id");
    } else {
        telegram.bot_token = JsonUtils::getString(root, "telegram_bot_token");
        telegram.chat_id = chatIdString(root, "telegram_chat_id");
    }

    std::string mode = JsonUtils::getString(root, "download_mode", "strict");
    if (!parseDownloadMode(mode, download_mode)) {
        error = "unknown download_mode '" + mode + "' (expected strict or lenient)";
        return false;
    }

    max_attempts = JsonUtils::getInt(root, "max_attempts", 4, 1, 10);
    extractor_retries = JsonUtils::getInt(root, "extractor_retries", 2, 1, 5);
    socket_timeout = JsonUtils::getInt(root, "socket_timeout", 120, 10, 600);
    log_level = JsonUtils::getString(root, "log_level", "info");

    return validate(error);
}

bool Settings::parseYtDlpOptions(const json& opts, std::string& error) {
    if (!opts.is_object()) {
        error = "yt_dlp_opts must be a JSON object";
        return false;
    }

    for (auto it = opts.begin(); it != opts.end(); ++it) {
        YtDlpOption option;
        option.name = it.key();
        if (option.name.empty()) continue;
        if (option.name[0] != '-') {
            // Accept yt-dlp API style names: concurrent_fragment_downloads -> --concurrent-fragment-downloads
            for (auto& c : option.name) {
                if (c == '_') c = '-';
            }
            option.name = "--" + option.name;
        }

        const json& value = it.value();
        if (value.is_null() || (value.is_boolean() && !value.get<bool>())) {
            continue;
        }
        if (value.is_boolean()) {
            option.is_flag = true;
        } else if (value.is_string()) {
            option.value = value.get<std::string>();
        } else if (value.is_number_integer()) {
            option.value = std::to_string(value.get<long long>());
        } else if (value.is_number()) {
            option.value = value.dump();
        } else {
            LOG_WARN("Settings", "Ignoring yt_dlp_opts entry " << it.key() << ": unsupported value type");
            continue;
        }
        yt_dlp_opts.push_back(option);
    }
    return true;
}

bool Settings::validate(std::string& error) const {
    if (!final_format.empty() && !ValidationUtils::isSupportedContainer(final_format)) {
        error = "unsupported final_format '" + final_format + "' (expected mp4, mkv or webm)";
        return false;
    }

    for (size_t i = 0; i < playlists.size(); ++i) {
        const PlaylistConfig& playlist = playlists[i];
        if (playlist.playlist_id.empty()) {
            error = "playlist #" + std::to_string(i + 1) + " has no playlist_id";
            return false;
        }
        if (playlist.folder.empty()) {
            error = "playlist " + playlist.playlist_id + " has no folder";
            return false;
        }
    }

    static const char* known_levels[] = {"debug", "info", "warn", "warning", "error", "none"};
    bool known_level = false;
    for (const char* level : known_levels) {
        if (log_level == level) known_level = true;
    }
    if (!known_level) {
        error = "unknown log_level '" + log_level + "'";
        return false;
    }

    return true;
}

const AccountConfig* Settings::findAccount(const std::string& name) const {
    auto it = accounts.find(name);
    if (it == accounts.end()) {
        return nullptr;
    }
    return &it->second;
}
