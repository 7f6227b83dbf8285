#include "file_manager.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include <cerrno>
#include <cstring>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace {

// Closes the descriptor when leaving scope
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() { if (fd_ >= 0) close(fd_); }
    int get() const { return fd_; }
    int release() { int fd = fd_; fd_ = -1; return fd; }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
private:
    int fd_;
};

bool writeAll(int fd, const char* data, size_t size) {
    while (size > 0) {
        ssize_t written = write(fd, data, size);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        size -= static_cast<size_t>(written);
    }
    return true;
}

bool copyContents(int in_fd, int out_fd) {
    std::vector<char> buffer(1 << 20);
    while (true) {
        ssize_t count = read(in_fd, buffer.data(), buffer.size());
        if (count < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        if (count == 0) {
            return true;
        }
        if (!writeAll(out_fd, buffer.data(), static_cast<size_t>(count))) {
            return false;
        }
    }
}

} // namespace

bool FileManager::copyFile(const std::string& src, const std::string& dst) {
    std::string parent = PathUtils::getDirectory(dst);
    if (!PathUtils::createDirectories(parent)) {
        LOG_ERROR("FileManager", "Cannot create destination directory " << parent);
        return false;
    }

    FdGuard in(open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.get() < 0) {
        LOG_ERROR("FileManager", "Cannot open " << src << ": " << strerror(errno));
        return false;
    }

    struct stat st;
    if (fstat(in.get(), &st) != 0) {
        LOG_ERROR("FileManager", "Cannot stat " << src << ": " << strerror(errno));
        return false;
    }

    FdGuard out(open(dst.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, st.st_mode & 0777));
    if (out.get() < 0) {
        LOG_ERROR("FileManager", "Cannot create " << dst << ": " << strerror(errno));
        return false;
    }

    bool ok = copyContents(in.get(), out.get());
    if (ok) {
        // Mode and timestamps are best effort
        if (fchmod(out.get(), st.st_mode & 07777) != 0) {
            LOG_WARN("FileManager", "Cannot preserve mode of " << dst << ": " << strerror(errno));
        }
        struct timespec times[2] = {st.st_atim, st.st_mtim};
        if (futimens(out.get(), times) != 0) {
            LOG_WARN("FileManager", "Cannot preserve timestamps of " << dst << ": " << strerror(errno));
        }
    }

    if (close(out.release()) != 0) {
        ok = false;
    }
    if (!ok) {
        LOG_ERROR("FileManager", "Copy " << src << " -> " << dst << " failed: " << strerror(errno));
        PathUtils::removeFile(dst);
        return false;
    }
    return true;
}
