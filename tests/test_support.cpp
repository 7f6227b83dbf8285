#include "test_support.h"
#include "common/errors.h"
#include "common/path_utils.h"
#include "file/file_manager.h"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace testsupport {

TempDir::TempDir(const std::string& prefix) {
    std::string pattern = "/tmp/" + prefix + "_XXXXXX";
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data())) {
        throw std::runtime_error("mkdtemp failed for " + pattern);
    }
    path_ = buffer.data();
}

TempDir::~TempDir() {
    PathUtils::removeAll(path_);
}

std::string TempDir::file(const std::string& name) const {
    return PathUtils::joinPath(path_, name);
}

bool writeFile(const std::string& path, const std::string& content) {
    if (!PathUtils::createDirectories(PathUtils::getDirectory(path))) {
        return false;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
    return static_cast<bool>(out);
}

bool writeFileOfSize(const std::string& path, int64_t size) {
    return writeFile(path, std::string(static_cast<size_t>(size), 'x'));
}

std::string readFile(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    std::ostringstream oss;
    oss << in.rdbuf();
    return oss.str();
}

std::vector<std::string> listNames(const std::string& dir) {
    std::vector<std::string> names;
    PathUtils::listDirectory(dir, names);
    std::sort(names.begin(), names.end());
    return names;
}

FakeExtractor::FakeExtractor()
    : handler_(failing()) {
}

FakeExtractor::FakeExtractor(Handler handler)
    : handler_(handler) {
}

ExtractionResult FakeExtractor::extract(const ExtractionRequest& request) {
    requests_.push_back(request);
    return handler_(request);
}

FakeExtractor::Handler FakeExtractor::producing(const std::string& ext) {
    return [ext](const ExtractionRequest& request) {
        ExtractionResult result;
        std::string path = PathUtils::joinPath(request.output_dir, request.video_id + "." + ext);
        result.success = writeFile(path, "media:" + request.video_id);
        return result;
    };
}

FakeExtractor::Handler FakeExtractor::failing() {
    return [](const ExtractionRequest&) {
        ExtractionResult result;
        result.error = "blocked";
        return result;
    };
}

bool FakeMuxer::writeTags(const MuxJob& job) {
    tag_jobs.push_back(job);
    if (!job.cover_path.empty()) {
        cover_existed_during_tagging = PathUtils::isRegularFile(job.cover_path);
    }
    if (!tag_result) {
        return false;
    }
    return writeFile(job.output_path, readFile(job.input_path) + "+tags");
}

bool FakeMuxer::remux(const std::string& input_path, const std::string& output_path) {
    remux_calls.push_back(std::make_pair(input_path, output_path));
    if (!remux_result) {
        return false;
    }
    return FileManager::copyFile(input_path, output_path);
}

std::vector<PlaylistEntry> FakePlaylistSource::listItems(const std::string& playlist_id) {
    if (auth_failing_playlists.count(playlist_id)) {
        throw AuthFailure("token revoked");
    }
    if (fetch_failing_playlists.count(playlist_id)) {
        throw SourceFetchFailure("listing failed");
    }
    auto it = playlists.find(playlist_id);
    if (it == playlists.end()) {
        return std::vector<PlaylistEntry>();
    }
    return it->second;
}

bool FakePlaylistSource::getMetadata(const std::string& video_id, VideoMetadata& meta) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        metadata_calls_++;
    }
    if (auth_failing_videos.count(video_id)) {
        throw AuthFailure("token revoked");
    }
    auto it = metadata.find(video_id);
    if (it == metadata.end()) {
        return false;
    }
    meta = it->second;
    return true;
}

bool FakePlaylistSource::removeItem(const std::string& playlist_item_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    removed_.push_back(playlist_item_id);
    return true;
}

void FakePlaylistSource::addVideo(const std::string& playlist_id, const std::string& video_id,
                                  const std::string& title, const std::string& playlist_item_id) {
    PlaylistEntry entry;
    entry.video_id = video_id;
    entry.playlist_item_id = playlist_item_id;
    playlists[playlist_id].push_back(entry);

    VideoMetadata meta;
    meta.title = title;
    meta.channel = "Channel";
    meta.upload_date = "20230115";
    meta.url = "https://www.youtube.com/watch?v=" + video_id;
    metadata[video_id] = meta;
}

std::vector<std::string> FakePlaylistSource::removedItems() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return removed_;
}

size_t FakePlaylistSource::metadataCalls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_calls_;
}

} // namespace testsupport
