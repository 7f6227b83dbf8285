#include "run_context.h"
#include "../common/logger.h"

RunContext::~RunContext() {
    joinBackgroundThreads();
}

void RunContext::recordSuccess(const std::string& name) {
    std::lock_guard<std::mutex> lock(results_mutex_);
    summary_.succeeded.push_back(name);
}

void RunContext::recordFailure(const std::string& name) {
    std::lock_guard<std::mutex> lock(results_mutex_);
    summary_.failed.push_back(name);
}

RunSummary RunContext::summary() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return summary_;
}

bool RunContext::hasResults() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return !summary_.succeeded.empty() || !summary_.failed.empty();
}

void RunContext::runBackground(std::function<void()> fn) {
    if (!fn) return;
    std::lock_guard<std::mutex> lock(background_threads_mutex_);
    background_threads_.emplace_back(std::move(fn));
}

void RunContext::joinBackgroundThreads() {
    while (true) {
        std::vector<std::thread> to_join;
        {
            std::lock_guard<std::mutex> lock(background_threads_mutex_);
            to_join.swap(background_threads_);
        }
        if (to_join.empty()) {
            return;
        }
        LOG_DEBUG("RunContext", "Waiting for " << to_join.size() << " background thread(s)");
        for (auto& t : to_join) {
            if (t.joinable()) {
                t.join();
            }
        }
    }
}

size_t RunContext::backgroundThreadCount() const {
    std::lock_guard<std::mutex> lock(background_threads_mutex_);
    return background_threads_.size();
}

std::string RunContext::formatSummary(const RunSummary& summary) {
    std::string message = "YouTube Archiver Summary\n";
    message += "✔ Success: " + std::to_string(summary.succeeded.size()) + "\n";
    message += "✖ Failed: " + std::to_string(summary.failed.size()) + "\n";

    if (!summary.succeeded.empty()) {
        message += "\nDownloaded:\n";
        for (const auto& name : summary.succeeded) {
            message += "• " + name + "\n";
        }
    }
    if (!summary.failed.empty()) {
        message += "\nFailed:\n";
        for (const auto& name : summary.failed) {
            message += "• " + name + "\n";
        }
    }
    return message;
}
