#pragma once

#include "../common/types.h"
#include "../download/extractor.h"
#include "../history/copy_ledger_worker.h"
#include "../metadata/metadata_embedder.h"
#include "../metadata/muxer.h"
#include "../notify/notifier.h"
#include "../platform/platform_utils.h"
#include "../settings/settings.h"
#include "../source/playlist_source.h"
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>

class ContainerConverter;
class DownloadLedger;
class ExtractorFallbackEngine;
class RunContext;

// Builds the playlist source for an account. Throws AuthFailure if the account is unusable.
typedef std::function<std::shared_ptr<PlaylistSource>(const AccountConfig& account)> PlaylistSourceFactory;

// Everything the coordinator talks to outside its own process
struct RunCollaborators {
    Extractor* extractor = nullptr;
    Muxer* muxer = nullptr;
    PlaylistSourceFactory source_factory;
    ThumbnailFetcher fetch_thumbnail;  // May be empty: no cover art
    Notifier* notifier = nullptr;      // May be null: summary is only logged
    FileCopier copier;                 // Empty = FileManager::copyFile
};

enum class RunStatus {
    Completed,
    Locked,   // Another run holds the lock; nothing was done
    Failed    // The run could not start (ledger unavailable ...)
};

struct RunResult {
    RunStatus status = RunStatus::Failed;
    RunSummary summary;
};

// One archiver run: lock, walk every playlist, extract/tag/convert each new
// video one at a time, hand finished files to background copies, wait for
// all copies, report, unlock.
class RunCoordinator {
public:
    RunCoordinator(const Settings& settings, const EnginePaths& paths, const RunCollaborators& collaborators);

    RunResult runOnce();

private:
    // Per-run state, valid only inside runOnce()
    struct Pipeline {
        RunContext* context;
        DownloadLedger* ledger;
        ExtractorFallbackEngine* engine;
        MetadataEmbedder* embedder;
        ContainerConverter* converter;
        CopyLedgerWorker* worker;
        std::map<std::string, std::shared_ptr<PlaylistSource>> sources;  // null = account unusable
        std::set<std::string> dispatched;  // Video ids handed to a copy this run
    };

    void openSources(Pipeline& pipeline);
    void processPlaylist(Pipeline& pipeline, const PlaylistConfig& playlist);
    void processItem(Pipeline& pipeline, const PlaylistConfig& playlist, const VideoItem& item,
                     const std::shared_ptr<PlaylistSource>& source);
    bool extractAndDispatch(Pipeline& pipeline, const PlaylistConfig& playlist, const VideoItem& item,
                            const std::shared_ptr<PlaylistSource>& source, const std::string& temp_dir,
                            const std::string& display_name);

    const Settings& settings_;
    EnginePaths paths_;
    RunCollaborators collaborators_;
};
