#include "run_lock.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include <cerrno>
#include <cstring>
#include <ctime>
#include <fcntl.h>
#include <sys/file.h>
#include <sys/stat.h>
#include <unistd.h>

RunLock::RunLock(const std::string& lock_path)
    : lock_path_(lock_path)
    , fd_(-1) {
}

RunLock::~RunLock() {
    release();
}

bool RunLock::acquire() {
    if (fd_ >= 0) return true;

    std::string parent = PathUtils::getDirectory(lock_path_);
    if (!PathUtils::createDirectories(parent)) {
        LOG_ERROR("RunLock", "Cannot create lock directory " << parent);
        return false;
    }

    int fd = -1;
    // A releasing holder unlinks the file; retry if we locked an unlinked inode
    for (int tries = 0; tries < 5 && fd < 0; ++tries) {
        int candidate = open(lock_path_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (candidate < 0) {
            LOG_ERROR("RunLock", "Cannot open " << lock_path_ << ": " << strerror(errno));
            return false;
        }

        if (flock(candidate, LOCK_EX | LOCK_NB) != 0) {
            int err = errno;
            close(candidate);
            if (err == EWOULDBLOCK) {
                LOG_INFO("RunLock", "Another run holds " << lock_path_);
            } else {
                LOG_ERROR("RunLock", "flock failed on " << lock_path_ << ": " << strerror(err));
            }
            return false;
        }

        struct stat locked_st;
        struct stat path_st;
        if (fstat(candidate, &locked_st) == 0 && stat(lock_path_.c_str(), &path_st) == 0 &&
            locked_st.st_ino == path_st.st_ino && locked_st.st_dev == path_st.st_dev) {
            fd = candidate;
        } else {
            close(candidate);
        }
    }
    if (fd < 0) {
        LOG_ERROR("RunLock", "Lock file " << lock_path_ << " keeps changing");
        return false;
    }

    // Informational only; the flock is what excludes other runs
    char started[32];
    std::time_t now = std::time(nullptr);
    std::tm utc_tm;
    gmtime_r(&now, &utc_tm);
    std::strftime(started, sizeof(started), "%Y-%m-%dT%H:%M:%SZ", &utc_tm);
    std::string content = "pid=" + std::to_string(getpid()) + "\nstarted=" + started + "\n";

    if (ftruncate(fd, 0) != 0 ||
        write(fd, content.data(), content.size()) != static_cast<ssize_t>(content.size())) {
        LOG_WARN("RunLock", "Cannot write owner info to " << lock_path_ << ": " << strerror(errno));
    }

    fd_ = fd;
    LOG_DEBUG("RunLock", "Acquired " << lock_path_);
    return true;
}

void RunLock::release() {
    if (fd_ < 0) return;

    // Unlink before unlocking; acquire() rejects a lock taken on an unlinked inode
    if (unlink(lock_path_.c_str()) != 0 && errno != ENOENT) {
        LOG_WARN("RunLock", "Cannot remove " << lock_path_ << ": " << strerror(errno));
    }
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
    LOG_DEBUG("RunLock", "Released " << lock_path_);
}
