#pragma once

#include "common/types.h"
#include "download/extractor.h"
#include "metadata/muxer.h"
#include "source/playlist_source.h"
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

namespace testsupport {

// mkdtemp() directory under /tmp, removed recursively on destruction
class TempDir {
public:
    explicit TempDir(const std::string& prefix = "ytarchiver_test");
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }
    std::string file(const std::string& name) const;

private:
    std::string path_;
};

bool writeFile(const std::string& path, const std::string& content);
bool writeFileOfSize(const std::string& path, int64_t size);
std::string readFile(const std::string& path);

// Names in a directory, sorted; empty if it does not exist
std::vector<std::string> listNames(const std::string& dir);

// Extractor whose behaviour is a callback; records every request
class FakeExtractor : public Extractor {
public:
    typedef std::function<ExtractionResult(const ExtractionRequest&)> Handler;

    FakeExtractor();
    explicit FakeExtractor(Handler handler);

    ExtractionResult extract(const ExtractionRequest& request) override;

    // Writes <output_dir>/<id>.<ext> and reports success
    static Handler producing(const std::string& ext);
    static Handler failing();

    void setHandler(Handler handler) { handler_ = handler; }
    const std::vector<ExtractionRequest>& requests() const { return requests_; }
    size_t calls() const { return requests_.size(); }

private:
    Handler handler_;
    std::vector<ExtractionRequest> requests_;
};

// Muxer that copies input to output instead of running ffmpeg
class FakeMuxer : public Muxer {
public:
    bool writeTags(const MuxJob& job) override;
    bool remux(const std::string& input_path, const std::string& output_path) override;

    bool tag_result = true;
    bool remux_result = true;
    std::vector<MuxJob> tag_jobs;
    std::vector<std::pair<std::string, std::string>> remux_calls;
    bool cover_existed_during_tagging = false;
};

// In-memory playlist source
class FakePlaylistSource : public PlaylistSource {
public:
    std::vector<PlaylistEntry> listItems(const std::string& playlist_id) override;
    bool getMetadata(const std::string& video_id, VideoMetadata& metadata) override;
    bool canRemoveItems() const override { return removable; }
    bool removeItem(const std::string& playlist_item_id) override;

    void addVideo(const std::string& playlist_id, const std::string& video_id, const std::string& title,
                  const std::string& playlist_item_id = "");

    std::vector<std::string> removedItems() const;
    size_t metadataCalls() const;

    std::map<std::string, std::vector<PlaylistEntry>> playlists;
    std::map<std::string, VideoMetadata> metadata;
    std::set<std::string> auth_failing_playlists;
    std::set<std::string> fetch_failing_playlists;
    std::set<std::string> auth_failing_videos;
    bool removable = false;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> removed_;
    size_t metadata_calls_ = 0;
};

} // namespace testsupport
