#pragma once

#include "../common/types.h"
#include <string>
#include <vector>

// Supplies playlist contents and per-video metadata for one account.
// listItems() and getMetadata() may throw AuthFailure or SourceFetchFailure.
// removeItem() is called from copy worker threads.
class PlaylistSource {
public:
    virtual ~PlaylistSource() {}

    virtual std::vector<PlaylistEntry> listItems(const std::string& playlist_id) = 0;

    // false if the video has no metadata (deleted, private ...)
    virtual bool getMetadata(const std::string& video_id, VideoMetadata& metadata) = 0;

    virtual bool canRemoveItems() const { return false; }

    // Remove one entry from its playlist by its playlist_item_id
    virtual bool removeItem(const std::string& playlist_item_id) {
        (void)playlist_item_id;
        return false;
    }
};
