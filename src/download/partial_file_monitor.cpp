#include "partial_file_monitor.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include <vector>

constexpr int64_t PartialFileMonitor::STUCK_THRESHOLD_BYTES;

bool PartialFileMonitor::isPartialFileStuck(const std::string& temp_dir, const std::string& video_id) {
    if (!PathUtils::isDirectory(temp_dir)) {
        return false;
    }

    std::vector<std::string> names;
    if (!PathUtils::listDirectory(temp_dir, names)) {
        LOG_WARN("PartialFileMonitor", "Cannot read " << temp_dir << ", treating as stuck");
        return true;
    }

    for (const auto& name : names) {
        if (!PathUtils::startsWith(name, video_id) || !PathUtils::endsWith(name, ".part")) {
            continue;
        }

        std::string path = PathUtils::joinPath(temp_dir, name);
        int64_t size = 0;
        if (!PathUtils::getFileSize(path, size)) {
            LOG_WARN("PartialFileMonitor", "Cannot stat " << path << ", treating as stuck");
            return true;
        }
        if (size < STUCK_THRESHOLD_BYTES) {
            LOG_DEBUG("PartialFileMonitor", "Stuck partial " << name << " (" << size << " bytes)");
            return true;
        }
    }
    return false;
}
