#pragma once

#include "types.h"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace JsonUtils {
    // String field, or fallback when missing, null or not a string
    std::string getString(const json& j, const std::string& key, const std::string& fallback = "");

    // Integer field clamped to [min_val, max_val], or fallback when missing or not a number
    int getInt(const json& j, const std::string& key, int fallback, int min_val, int max_val);

    bool getBool(const json& j, const std::string& key, bool fallback);

    // Array of strings; non-string elements are skipped
    std::vector<std::string> getStringList(const json& j, const std::string& key);

    // Best thumbnail URL of a yt-dlp info dict: the "thumbnails" entry with the
    // highest preference (last wins on ties, as yt-dlp orders them worst to best),
    // falling back to the "thumbnail" field. Empty if none.
    std::string extractThumbnailUrl(const json& info);

    // Build VideoMetadata from a yt-dlp info dict (-J output)
    VideoMetadata metadataFromInfo(const json& info, const std::string& video_id);
}
