#include "copy_ledger_worker.h"
#include "download_ledger.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../run/run_context.h"
#include <exception>

CopyLedgerWorker::CopyLedgerWorker(RunContext& context, const std::string& db_path, FileCopier copier)
    : context_(context)
    , db_path_(db_path)
    , copier_(copier) {
}

CopyLedgerWorker::~CopyLedgerWorker() {
    context_.joinBackgroundThreads();
}

void CopyLedgerWorker::dispatch(const CopyJob& job) {
    LOG_INFO("CopyLedgerWorker", "[" << job.item.id << "] Copy started in background -> " << job.destination_path);
    context_.runBackground([this, job]() {
        run(job);
    });
}

void CopyLedgerWorker::run(const CopyJob& job) {
    bool success = false;
    try {
        success = copier_ && copier_(job.source_path, job.destination_path);
    } catch (const std::exception& e) {
        LOG_ERROR("CopyLedgerWorker", "[" << job.item.id << "] Copy failed: " << e.what());
        success = false;
    }
    onCopyComplete(job, success);
}

void CopyLedgerWorker::onCopyComplete(const CopyJob& job, bool success) {
    const std::string& video_id = job.item.id;

    if (success) {
        LOG_INFO("CopyLedgerWorker", "[" << video_id << "] Copy complete: " << job.destination_path);
        context_.recordSuccess(job.display_name);

        DownloadRecord record;
        record.video_id = video_id;
        record.playlist_id = job.item.playlist_id;
        record.downloaded_at = DownloadLedger::currentTimestamp();
        record.filepath = job.destination_path;
        if (!DownloadLedger::insertRecord(db_path_, record)) {
            LOG_ERROR("CopyLedgerWorker", "[" << video_id << "] Could not record download; it may be fetched again");
        }

        if (job.remove_after_download && job.source && job.source->canRemoveItems() &&
            !job.item.playlist_item_id.empty()) {
            bool removed = false;
            try {
                removed = job.source->removeItem(job.item.playlist_item_id);
            } catch (const std::exception& e) {
                LOG_WARN("CopyLedgerWorker", "[" << video_id << "] Playlist removal error: " << e.what());
            }
            if (removed) {
                LOG_INFO("CopyLedgerWorker", "[" << video_id << "] Removed from playlist " << job.item.playlist_id);
            } else {
                LOG_WARN("CopyLedgerWorker", "[" << video_id << "] Failed to remove from playlist "
                         << job.item.playlist_id);
            }
        }
    } else {
        LOG_ERROR("CopyLedgerWorker", "[" << video_id << "] Copy failed -> " << job.destination_path);
        context_.recordFailure(job.display_name);
    }

    if (!PathUtils::removeAll(job.temp_dir)) {
        LOG_WARN("CopyLedgerWorker", "[" << video_id << "] Cannot remove scratch dir " << job.temp_dir);
    }
}
