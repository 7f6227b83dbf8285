#pragma once

#include <string>

// Process-wide run lock: an exclusive flock() on a well-known file.
// The kernel drops the lock when the holder dies, so a crashed run never
// blocks the next one. The file carries the holder's pid and start time.
class RunLock {
public:
    explicit RunLock(const std::string& lock_path);
    ~RunLock();

    RunLock(const RunLock&) = delete;
    RunLock& operator=(const RunLock&) = delete;

    // Non-blocking. False if another process (or another RunLock) holds it.
    bool acquire();

    // Unlocks and removes the file. Safe to call more than once.
    void release();

    bool isHeld() const { return fd_ >= 0; }
    const std::string& path() const { return lock_path_; }

private:
    std::string lock_path_;
    int fd_;
};
