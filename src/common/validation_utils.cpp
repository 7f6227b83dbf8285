#include "validation_utils.h"
#include <algorithm>
#include <cctype>

std::string ValidationUtils::sanitizeFilename(const std::string& name, size_t max_length) {
    static const std::string unsafe_chars = "\\/:*?\"<>|";

    std::string safe_name;
    safe_name.reserve(name.size());
    bool pending_space = false;
    for (char c : name) {
        if (unsafe_chars.find(c) != std::string::npos) {
            continue;
        }
        if (std::isspace(static_cast<unsigned char>(c))) {
            pending_space = !safe_name.empty();
            continue;
        }
        if (pending_space) {
            safe_name += ' ';
            pending_space = false;
        }
        safe_name += c;
    }

    if (safe_name.size() > max_length) {
        size_t cut = max_length;
        // Step back over UTF-8 continuation bytes so the last character stays whole
        while (cut > 0 && (static_cast<unsigned char>(safe_name[cut]) & 0xC0) == 0x80) {
            cut--;
        }
        safe_name.erase(cut);
        while (!safe_name.empty() && safe_name.back() == ' ') {
            safe_name.pop_back();
        }
    }

    return safe_name;
}

bool ValidationUtils::isCompactDate(const std::string& date) {
    if (date.length() != 8) {
        return false;
    }
    return std::all_of(date.begin(), date.end(), [](char c) {
        return c >= '0' && c <= '9';
    });
}

std::string ValidationUtils::normalizeUploadDate(const std::string& date) {
    if (!isCompactDate(date)) {
        return "";
    }
    return date.substr(0, 4) + "-" + date.substr(4, 2) + "-" + date.substr(6, 2);
}

bool ValidationUtils::isTemporaryFile(const std::string& file_name) {
    if (file_name.empty()) {
        return false;
    }

    std::string name_lower = file_name;
    std::transform(name_lower.begin(), name_lower.end(), name_lower.begin(), ::tolower);

    auto ends_with = [&name_lower](const std::string& suffix) {
        return name_lower.size() >= suffix.size() &&
               name_lower.compare(name_lower.size() - suffix.size(), suffix.size(), suffix) == 0;
    };

    // .part - yt-dlp partial downloads (also .f137.webm.part fragments)
    // .ytdl - yt-dlp resume state
    return ends_with(".part") || ends_with(".ytdl") || ends_with(".temp") || ends_with(".tmp");
}

bool ValidationUtils::isSupportedContainer(const std::string& extension) {
    return extension == "mp4" || extension == "mkv" || extension == "webm";
}
