#pragma once

#include "../common/types.h"
#include <cstddef>
#include <mutex>
#include <string>

struct sqlite3;

// SQLite table of archived videos. A row for a video id means "done, skip it".
//
// The instance connection serves lookups from the run loop. Inserts from copy
// workers go through insertRecord(), which opens its own connection per call,
// so concurrent completions never share a handle or a transaction.
class DownloadLedger {
public:
    explicit DownloadLedger(const std::string& db_path);
    ~DownloadLedger();

    DownloadLedger(const DownloadLedger&) = delete;
    DownloadLedger& operator=(const DownloadLedger&) = delete;

    // Open the database and create the schema if needed
    bool open();
    void close();
    bool isOpen() const { return db_ != nullptr; }

    bool contains(const std::string& video_id);
    bool getRecord(const std::string& video_id, DownloadRecord& record);
    size_t count();

    const std::string& path() const { return db_path_; }

    // Insert one row through a fresh connection. Safe to call from any thread.
    static bool insertRecord(const std::string& db_path, const DownloadRecord& record);

    // UTC "YYYY-MM-DD HH:MM:SS"
    static std::string currentTimestamp();

private:
    std::string db_path_;
    sqlite3* db_;
    std::mutex mutex_;
};
