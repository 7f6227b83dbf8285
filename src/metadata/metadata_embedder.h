#pragma once

#include "muxer.h"
#include "../common/types.h"
#include <functional>
#include <string>

// Fetches url into dest_path; false if nothing usable was written
typedef std::function<bool(const std::string& url, const std::string& dest_path)> ThumbnailFetcher;

// Rewrites a finished media file in place with tags and cover art.
// Failures are logged and leave the original file untouched.
class MetadataEmbedder {
public:
    MetadataEmbedder(Muxer& muxer, const std::string& thumbs_dir, ThumbnailFetcher fetch_thumbnail);

    // Returns true if the file was replaced by a tagged copy
    bool embed(const std::string& file_path, const VideoMetadata& metadata, const std::string& video_id);

    // title, artist, date (only for YYYYMMDD), description, keywords, comment
    static MetadataTags buildTags(const VideoMetadata& metadata, const std::string& video_id);

private:
    // Best effort, returns the cover path or "" when there is none
    std::string fetchCover(const VideoMetadata& metadata, const std::string& video_id);

    Muxer& muxer_;
    std::string thumbs_dir_;
    ThumbnailFetcher fetch_thumbnail_;
};
