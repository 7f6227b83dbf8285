#pragma once

#include "../common/types.h"
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

// State of one archiver run, shared by the coordinator and the copy workers.
// Result lists are appended from worker threads; every access is locked.
class RunContext {
public:
    RunContext() = default;
    ~RunContext();

    RunContext(const RunContext&) = delete;
    RunContext& operator=(const RunContext&) = delete;

    void recordSuccess(const std::string& name);
    void recordFailure(const std::string& name);

    // Snapshot of the lists collected so far
    RunSummary summary() const;
    bool hasResults() const;

    // Start fn on its own thread. Threads are collected until joined.
    void runBackground(std::function<void()> fn);

    // Block until every thread started by runBackground() has finished,
    // including threads started while waiting
    void joinBackgroundThreads();

    size_t backgroundThreadCount() const;

    // Text sent at the end of a run
    static std::string formatSummary(const RunSummary& summary);

private:
    mutable std::mutex results_mutex_;
    RunSummary summary_;

    mutable std::mutex background_threads_mutex_;
    std::vector<std::thread> background_threads_;
};
