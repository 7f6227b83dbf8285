#include "json_utils.h"
#include <algorithm>

namespace JsonUtils {

std::string getString(const json& j, const std::string& key, const std::string& fallback) {
    if (!j.is_object()) return fallback;
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return fallback;
    }
    return it->get<std::string>();
}

int getInt(const json& j, const std::string& key, int fallback, int min_val, int max_val) {
    if (!j.is_object()) return fallback;
    auto it = j.find(key);
    if (it == j.end() || !it->is_number()) {
        return fallback;
    }
    // Clamped before narrowing; doubles hold every int exactly
    double value = it->get<double>();
    if (value < min_val) return min_val;
    if (value > max_val) return max_val;
    return static_cast<int>(value);
}

bool getBool(const json& j, const std::string& key, bool fallback) {
    if (!j.is_object()) return fallback;
    auto it = j.find(key);
    if (it == j.end() || !it->is_boolean()) {
        return fallback;
    }
    return it->get<bool>();
}

std::vector<std::string> getStringList(const json& j, const std::string& key) {
    std::vector<std::string> values;
    if (!j.is_object()) return values;
    auto it = j.find(key);
    if (it == j.end() || !it->is_array()) {
        return values;
    }
    for (const auto& element : *it) {
        if (element.is_string()) {
            values.push_back(element.get<std::string>());
        }
    }
    return values;
}

std::string extractThumbnailUrl(const json& info) {
    auto it = info.find("thumbnails");
    if (it != info.end() && it->is_array()) {
        std::string best_url;
        long long best_preference = 0;
        bool have_best = false;
        for (const auto& thumb : *it) {
            std::string url = getString(thumb, "url");
            if (url.empty()) continue;
            long long preference = 0;
            auto pref_it = thumb.find("preference");
            if (pref_it != thumb.end() && pref_it->is_number_integer()) {
                preference = pref_it->get<long long>();
            }
            if (!have_best || preference >= best_preference) {
                best_url = url;
                best_preference = preference;
                have_best = true;
            }
        }
        if (have_best) {
            return best_url;
        }
    }
    return getString(info, "thumbnail");
}

VideoMetadata metadataFromInfo(const json& info, const std::string& video_id) {
    VideoMetadata meta;
    meta.title = getString(info, "title", getString(info, "fulltitle"));
    meta.channel = getString(info, "channel", getString(info, "uploader"));
    meta.upload_date = getString(info, "upload_date");
    meta.description = getString(info, "description");
    meta.tags = getStringList(info, "tags");
    meta.url = getString(info, "webpage_url");
    if (meta.url.empty()) {
        meta.url = "https://www.youtube.com/watch?v=" + video_id;
    }
    meta.thumbnail_url = extractThumbnailUrl(info);
    return meta;
}

} // namespace JsonUtils
