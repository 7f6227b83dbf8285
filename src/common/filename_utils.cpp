#include "filename_utils.h"
#include "validation_utils.h"
#include "logger.h"

namespace FilenameUtils {

std::string prettyName(const std::string& title, const std::string& channel, const std::string& upload_date) {
    std::string title_s = ValidationUtils::sanitizeFilename(title);
    std::string channel_s = ValidationUtils::sanitizeFilename(channel);
    if (ValidationUtils::isCompactDate(upload_date)) {
        std::string mm = upload_date.substr(4, 2);
        std::string yyyy = upload_date.substr(0, 4);
        return title_s + " - " + channel_s + " (" + mm + "-" + yyyy + ")";
    }
    return title_s + " - " + channel_s;
}

bool expandTemplate(const std::string& filename_template, const VideoMetadata& metadata,
                    const std::string& video_id, const std::string& ext, std::string& result) {
    result.clear();
    size_t i = 0;
    while (i < filename_template.size()) {
        char c = filename_template[i];
        if (c != '%') {
            result += c;
            i++;
            continue;
        }
        if (i + 1 < filename_template.size() && filename_template[i + 1] == '%') {
            result += '%';
            i += 2;
            continue;
        }
        if (i + 1 >= filename_template.size() || filename_template[i + 1] != '(') {
            return false;
        }
        size_t close = filename_template.find(")s", i + 2);
        if (close == std::string::npos) {
            return false;
        }
        std::string key = filename_template.substr(i + 2, close - (i + 2));
        if (key == "title") {
            result += ValidationUtils::sanitizeFilename(metadata.title.empty() ? video_id : metadata.title);
        } else if (key == "uploader") {
            result += ValidationUtils::sanitizeFilename(metadata.channel);
        } else if (key == "upload_date") {
            result += metadata.upload_date;
        } else if (key == "ext") {
            result += ext;
        } else if (key == "id") {
            result += video_id;
        } else {
            return false;
        }
        i = close + 2;
    }
    return !result.empty();
}

std::string buildFinalFilename(const std::string& filename_template, const VideoMetadata& metadata,
                               const std::string& video_id, const std::string& ext) {
    if (!filename_template.empty()) {
        std::string expanded;
        if (expandTemplate(filename_template, metadata, video_id, ext, expanded)) {
            return expanded;
        }
        LOG_WARN("FilenameUtils", "Invalid filename_template '" << filename_template << "', using default naming");
    }
    return prettyName(metadata.title, metadata.channel, metadata.upload_date) + "_" +
           video_id.substr(0, 8) + "." + ext;
}

} // namespace FilenameUtils
