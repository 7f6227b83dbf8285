#include "run_coordinator.h"
#include "run_context.h"
#include "run_lock.h"
#include "../common/errors.h"
#include "../common/filename_utils.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../download/extractor_fallback_engine.h"
#include "../file/file_manager.h"
#include "../history/download_ledger.h"
#include "../metadata/container_converter.h"
#include <exception>

RunCoordinator::RunCoordinator(const Settings& settings, const EnginePaths& paths,
                               const RunCollaborators& collaborators)
    : settings_(settings)
    , paths_(paths)
    , collaborators_(collaborators) {
    if (!collaborators_.copier) {
        collaborators_.copier = FileManager::copyFile;
    }
}

RunResult RunCoordinator::runOnce() {
    RunResult result;

    RunLock lock(paths_.lock_path);
    if (!lock.acquire()) {
        LOG_INFO("RunCoordinator", "Another run is in progress, skipping");
        result.status = RunStatus::Locked;
        return result;
    }

    if (!collaborators_.extractor || !collaborators_.muxer || !collaborators_.source_factory) {
        LOG_ERROR("RunCoordinator", "Run collaborators are not configured");
        return result;
    }

    if (!PathUtils::createDirectories(paths_.temp_downloads)) {
        LOG_ERROR("RunCoordinator", "Cannot create " << paths_.temp_downloads);
        return result;
    }

    DownloadLedger ledger(paths_.database_path);
    if (!ledger.open()) {
        LOG_ERROR("RunCoordinator", "Download ledger unavailable, aborting run");
        return result;
    }

    RunContext context;
    ExtractorFallbackEngine engine(*collaborators_.extractor, settings_.download_mode,
                                   settings_.max_attempts, settings_.extractor_retries);
    MetadataEmbedder embedder(*collaborators_.muxer, paths_.thumbs_dir, collaborators_.fetch_thumbnail);
    ContainerConverter converter(*collaborators_.muxer);
    CopyLedgerWorker worker(context, paths_.database_path, collaborators_.copier);

    Pipeline pipeline;
    pipeline.context = &context;
    pipeline.ledger = &ledger;
    pipeline.engine = &engine;
    pipeline.embedder = &embedder;
    pipeline.converter = &converter;
    pipeline.worker = &worker;

    LOG_INFO("RunCoordinator", "Run started: " << settings_.playlists.size() << " playlist(s)");
    openSources(pipeline);

    for (const auto& playlist : settings_.playlists) {
        processPlaylist(pipeline, playlist);
    }

    // Nothing is reported until every copy has landed
    context.joinBackgroundThreads();

    result.summary = context.summary();
    result.status = RunStatus::Completed;
    LOG_INFO("RunCoordinator", "Run complete: " << result.summary.succeeded.size() << " succeeded, "
             << result.summary.failed.size() << " failed");

    if (context.hasResults()) {
        std::string message = RunContext::formatSummary(result.summary);
        if (collaborators_.notifier) {
            collaborators_.notifier->send(message);
        } else {
            LOG_DEBUG("RunCoordinator", "No notifier configured, summary:\n" << message);
        }
    }

    lock.release();
    return result;
}

void RunCoordinator::openSources(Pipeline& pipeline) {
    for (const auto& playlist : settings_.playlists) {
        const std::string& name = playlist.account;
        if (pipeline.sources.count(name)) {
            continue;
        }

        AccountConfig account;
        account.name = name;
        if (!name.empty()) {
            const AccountConfig* configured = settings_.findAccount(name);
            if (!configured) {
                LOG_ERROR("RunCoordinator", "Account '" << name << "' is not configured");
                pipeline.sources[name] = nullptr;
                continue;
            }
            account = *configured;
        }

        try {
            pipeline.sources[name] = collaborators_.source_factory(account);
        } catch (const AuthFailure& e) {
            LOG_ERROR("RunCoordinator", "Account '" << name << "' unusable: " << e.what());
            pipeline.sources[name] = nullptr;
        } catch (const std::exception& e) {
            LOG_ERROR("RunCoordinator", "Cannot open playlist source for '" << name << "': " << e.what());
            pipeline.sources[name] = nullptr;
        }
    }
}

void RunCoordinator::processPlaylist(Pipeline& pipeline, const PlaylistConfig& playlist) {
    std::shared_ptr<PlaylistSource>& source = pipeline.sources[playlist.account];
    if (!source) {
        LOG_WARN("RunCoordinator", "Skipping playlist " << playlist.playlist_id << ": no usable account");
        pipeline.context->recordFailure(playlist.playlist_id + " (auth)");
        return;
    }

    LOG_INFO("RunCoordinator", "Processing playlist " << playlist.playlist_id);

    std::vector<PlaylistEntry> entries;
    try {
        entries = source->listItems(playlist.playlist_id);
    } catch (const AuthFailure& e) {
        LOG_ERROR("RunCoordinator", "Playlist " << playlist.playlist_id << ": " << e.what());
        pipeline.context->recordFailure(playlist.playlist_id + " (auth)");
        source = nullptr;
        return;
    } catch (const std::exception& e) {
        LOG_ERROR("RunCoordinator", "Playlist " << playlist.playlist_id << " fetch failed: " << e.what());
        pipeline.context->recordFailure(playlist.playlist_id + " (fetch)");
        return;
    }

    // Keep the source alive for copy workers even if the account is dropped below
    std::shared_ptr<PlaylistSource> playlist_source = source;

    for (const auto& entry : entries) {
        if (pipeline.ledger->contains(entry.video_id)) {
            LOG_DEBUG("RunCoordinator", "[" << entry.video_id << "] Already archived, skipping");
            continue;
        }
        if (pipeline.dispatched.count(entry.video_id)) {
            LOG_INFO("RunCoordinator", "[" << entry.video_id << "] Already archived by playlist earlier in this run, "
                     "skipping " << playlist.playlist_id);
            continue;
        }

        VideoItem item;
        item.id = entry.video_id;
        item.playlist_id = playlist.playlist_id;
        item.playlist_item_id = entry.playlist_item_id;

        try {
            if (!playlist_source->getMetadata(item.id, item.metadata)) {
                LOG_WARN("RunCoordinator", "[" << item.id << "] No metadata, skipping");
                continue;
            }
        } catch (const AuthFailure& e) {
            LOG_ERROR("RunCoordinator", "[" << item.id << "] " << e.what());
            pipeline.context->recordFailure(item.id + " (auth)");
            source = nullptr;
            break;
        } catch (const std::exception& e) {
            LOG_WARN("RunCoordinator", "[" << item.id << "] Metadata fetch failed, skipping: " << e.what());
            continue;
        }

        processItem(pipeline, playlist, item, playlist_source);
    }
}

void RunCoordinator::processItem(Pipeline& pipeline, const PlaylistConfig& playlist, const VideoItem& item,
                                 const std::shared_ptr<PlaylistSource>& source) {
    const VideoMetadata& meta = item.metadata;
    std::string temp_dir = PathUtils::joinPath(paths_.temp_downloads, item.id);
    std::string display_name = FilenameUtils::prettyName(meta.title.empty() ? item.id : meta.title,
                                                         meta.channel, meta.upload_date);

    LOG_INFO("RunCoordinator", "[" << item.id << "] " << display_name);

    bool dispatched = false;
    try {
        dispatched = extractAndDispatch(pipeline, playlist, item, source, temp_dir, display_name);
    } catch (const std::exception& e) {
        LOG_ERROR("RunCoordinator", "[" << item.id << "] Processing failed: " << e.what());
        dispatched = false;
    }

    if (dispatched) {
        pipeline.dispatched.insert(item.id);
        return;
    }

    pipeline.context->recordFailure(display_name);
    if (!PathUtils::removeAll(temp_dir)) {
        LOG_WARN("RunCoordinator", "[" << item.id << "] Cannot remove scratch dir " << temp_dir);
    }
}

// False if the item never reached a copy worker; the scratch dir then still belongs to the caller
bool RunCoordinator::extractAndDispatch(Pipeline& pipeline, const PlaylistConfig& playlist, const VideoItem& item,
                                        const std::shared_ptr<PlaylistSource>& source,
                                        const std::string& temp_dir, const std::string& display_name) {
    const VideoMetadata& meta = item.metadata;
    std::string url = meta.url.empty() ? "https://www.youtube.com/watch?v=" + item.id : meta.url;

    ExtractionOutcome outcome = pipeline.engine->download(url, item.id, temp_dir);
    if (!outcome.success) {
        return false;
    }

    pipeline.embedder->embed(outcome.file_path, meta, item.id);

    std::string file_path = outcome.file_path;
    if (!settings_.final_format.empty()) {
        file_path = pipeline.converter->convert(file_path, settings_.final_format);
    }

    std::string filename = FilenameUtils::buildFinalFilename(settings_.filename_template, meta, item.id,
                                                             PathUtils::getExtension(file_path));

    CopyJob job;
    job.item = item;
    job.display_name = display_name;
    job.source_path = file_path;
    job.destination_path = PathUtils::joinPath(playlist.folder, filename);
    job.temp_dir = temp_dir;
    job.remove_after_download = playlist.remove_after_download;
    job.source = source;
    pipeline.worker->dispatch(job);
    return true;
}
