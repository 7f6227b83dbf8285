#pragma once

#include <string>
#include <vector>

// Descriptive metadata of one video, as returned by the playlist source
struct VideoMetadata {
    std::string title;
    std::string channel;
    std::string upload_date;    // YYYYMMDD or empty
    std::string description;
    std::vector<std::string> tags;
    std::string url;            // Canonical watch URL
    std::string thumbnail_url;  // Empty if the source has none
};

// One entry of a playlist listing
struct PlaylistEntry {
    std::string video_id;
    std::string playlist_item_id;  // Handle used to remove the entry, may be empty
};

// Item being archived during a run. Immutable once fetched.
struct VideoItem {
    std::string id;
    std::string playlist_id;
    std::string playlist_item_id;
    VideoMetadata metadata;
};

// Persisted ledger row; its presence for an id is the dedup signal
struct DownloadRecord {
    std::string video_id;
    std::string playlist_id;
    std::string downloaded_at;  // UTC, "YYYY-MM-DD HH:MM:SS"
    std::string filepath;
};

// Display names collected during one run (transient)
struct RunSummary {
    std::vector<std::string> succeeded;
    std::vector<std::string> failed;
};

// Extra yt-dlp command-line option from the "yt_dlp_opts" config object
struct YtDlpOption {
    std::string name;   // "--concurrent-fragments"
    std::string value;  // empty for bare flags
    bool is_flag = false;
};
