#pragma once

#include "../common/types.h"
#include "../source/playlist_source.h"
#include <functional>
#include <memory>
#include <string>

class RunContext;

// Copies src to dst; false on any failure
typedef std::function<bool(const std::string& src, const std::string& dst)> FileCopier;

// A finished file ready to leave the scratch area
struct CopyJob {
    VideoItem item;
    std::string display_name;
    std::string source_path;
    std::string destination_path;
    std::string temp_dir;  // Per-video scratch directory, removed when the job ends
    bool remove_after_download = false;
    std::shared_ptr<PlaylistSource> source;  // For removal, may be null
};

// Moves finished files to the library on background threads and records them
// in the ledger once they have arrived.
class CopyLedgerWorker {
public:
    CopyLedgerWorker(RunContext& context, const std::string& db_path, FileCopier copier);
    // Joins every background copy; none may outlive the worker
    ~CopyLedgerWorker();

    CopyLedgerWorker(const CopyLedgerWorker&) = delete;
    CopyLedgerWorker& operator=(const CopyLedgerWorker&) = delete;

    // Returns immediately; the copy and its bookkeeping run on a background thread
    void dispatch(const CopyJob& job);

    // Bookkeeping after a copy: run summary, ledger row, playlist removal,
    // scratch cleanup (always last)
    void onCopyComplete(const CopyJob& job, bool success);

private:
    void run(const CopyJob& job);

    RunContext& context_;
    std::string db_path_;
    FileCopier copier_;
};
