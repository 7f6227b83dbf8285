#pragma once

#include <string>

namespace ThumbnailDownloader {
    /**
     * Downloads a thumbnail image from URL into dest_path using curl
     *
     * @param thumbnail_url The URL of the thumbnail image
     * @param dest_path File to write; removed again if the download fails
     * @param timeout_seconds Upper bound for the whole transfer
     * @return true if a non-empty file was written
     */
    bool downloadToFile(const std::string& thumbnail_url, const std::string& dest_path, int timeout_seconds = 15);
}
