#include "metadata_embedder.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/validation_utils.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <vector>
#include <unistd.h>

MetadataEmbedder::MetadataEmbedder(Muxer& muxer, const std::string& thumbs_dir, ThumbnailFetcher fetch_thumbnail)
    : muxer_(muxer)
    , thumbs_dir_(thumbs_dir)
    , fetch_thumbnail_(fetch_thumbnail) {
}

MetadataTags MetadataEmbedder::buildTags(const VideoMetadata& metadata, const std::string& video_id) {
    MetadataTags tags;

    std::string title = metadata.title.empty() ? video_id : metadata.title;
    tags.push_back(std::make_pair("title", title));

    if (!metadata.channel.empty()) {
        tags.push_back(std::make_pair("artist", metadata.channel));
    }

    std::string date = ValidationUtils::normalizeUploadDate(metadata.upload_date);
    if (!date.empty()) {
        tags.push_back(std::make_pair("date", date));
    }

    if (!metadata.description.empty()) {
        tags.push_back(std::make_pair("description", metadata.description));
    }

    if (!metadata.tags.empty()) {
        std::string keywords;
        for (size_t i = 0; i < metadata.tags.size(); ++i) {
            if (i > 0) keywords += ", ";
            keywords += metadata.tags[i];
        }
        tags.push_back(std::make_pair("keywords", keywords));
    }

    std::string url = metadata.url.empty() ? "https://www.youtube.com/watch?v=" + video_id : metadata.url;
    tags.push_back(std::make_pair("comment", "YouTubeID=" + video_id + " URL=" + url));
    return tags;
}

std::string MetadataEmbedder::fetchCover(const VideoMetadata& metadata, const std::string& video_id) {
    if (metadata.thumbnail_url.empty() || !fetch_thumbnail_) {
        return "";
    }
    if (!PathUtils::createDirectories(thumbs_dir_)) {
        LOG_WARN("MetadataEmbedder", "[" << video_id << "] Cannot create " << thumbs_dir_);
        return "";
    }

    std::string cover_path = PathUtils::joinPath(thumbs_dir_, video_id + ".jpg");
    bool fetched = false;
    try {
        fetched = fetch_thumbnail_(metadata.thumbnail_url, cover_path);
    } catch (const std::exception& e) {
        LOG_WARN("MetadataEmbedder", "[" << video_id << "] Thumbnail download failed: " << e.what());
    }

    if (!fetched || !PathUtils::isRegularFile(cover_path)) {
        LOG_DEBUG("MetadataEmbedder", "[" << video_id << "] No cover image");
        PathUtils::removeFile(cover_path);
        return "";
    }
    return cover_path;
}

bool MetadataEmbedder::embed(const std::string& file_path, const VideoMetadata& metadata, const std::string& video_id) {
    std::string cover_path = fetchCover(metadata, video_id);

    // Tagged copy goes next to the original so the final rename stays on one filesystem
    std::string ext = PathUtils::getExtension(file_path);
    if (ext.empty()) {
        ext = "webm";
    }
    std::string suffix = ".tagged." + ext;
    std::string pattern = PathUtils::joinPath(PathUtils::getDirectory(file_path), "tmpXXXXXX" + suffix);
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');

    bool replaced = false;
    int fd = mkstemps(buffer.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        LOG_WARN("MetadataEmbedder", "[" << video_id << "] Cannot create temp file: " << strerror(errno));
    } else {
        close(fd);
        std::string tmp_path = buffer.data();

        MuxJob job;
        job.input_path = file_path;
        job.output_path = tmp_path;
        job.cover_path = cover_path;
        job.tags = buildTags(metadata, video_id);

        if (!muxer_.writeTags(job)) {
            LOG_WARN("MetadataEmbedder", "[" << video_id << "] Metadata embed failed, keeping original");
        } else if (std::rename(tmp_path.c_str(), file_path.c_str()) != 0) {
            LOG_WARN("MetadataEmbedder", "[" << video_id << "] Cannot replace original: " << strerror(errno));
        } else {
            replaced = true;
            LOG_INFO("MetadataEmbedder", "[" << video_id << "] Embedded metadata"
                     << (cover_path.empty() ? "" : " and cover") << " into " << PathUtils::getFilename(file_path));
        }

        if (!replaced) {
            PathUtils::removeFile(tmp_path);
        }
    }

    if (!cover_path.empty()) {
        PathUtils::removeFile(cover_path);
    }
    return replaced;
}
