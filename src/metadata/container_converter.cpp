#include "container_converter.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include <cctype>

ContainerConverter::ContainerConverter(Muxer& muxer)
    : muxer_(muxer) {
}

bool ContainerConverter::isRefused(const std::string& from_ext, const std::string& to_ext) {
    return from_ext == "mp4" && to_ext == "webm";
}

std::string ContainerConverter::convert(const std::string& file_path, const std::string& target_ext) {
    std::string desired;
    for (char c : target_ext) {
        if (c == '.') continue;
        desired += static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    std::string current = PathUtils::getExtension(file_path);

    if (desired.empty() || desired == current) {
        return file_path;
    }

    if (isRefused(current, desired)) {
        LOG_WARN("ContainerConverter", "Skipping " << current << "->" << desired << " container copy of "
                 << PathUtils::getFilename(file_path) << " to avoid an invalid file; consider final_format="
                 << current);
        return file_path;
    }

    std::string converted = PathUtils::replaceExtension(file_path, desired);
    if (!muxer_.remux(file_path, converted) || !PathUtils::isRegularFile(converted)) {
        LOG_WARN("ContainerConverter", "Final format conversion failed for " << PathUtils::getFilename(file_path));
        PathUtils::removeFile(converted);
        return file_path;
    }

    if (!PathUtils::removeFile(file_path)) {
        LOG_WARN("ContainerConverter", "Cannot remove original " << file_path);
    }
    LOG_INFO("ContainerConverter", "Converted " << PathUtils::getFilename(file_path) << " -> "
             << PathUtils::getFilename(converted));
    return converted;
}
