#pragma once

#include <cstdint>
#include <string>

// Detects in-progress downloads that stopped growing before they got anywhere.
// A tiny .part file almost always means YouTube is blocking the client, not
// that the network is slow, so the engine starts over with a clean directory.
class PartialFileMonitor {
public:
    static constexpr int64_t STUCK_THRESHOLD_BYTES = 512 * 1024;

    // True if temp_dir holds "<video_id>*.part" smaller than the threshold,
    // or if such a file cannot be inspected. A missing directory is not stuck.
    static bool isPartialFileStuck(const std::string& temp_dir, const std::string& video_id);
};
