#include "extractor_fallback_engine.h"
#include "partial_file_monitor.h"
#include "../common/logger.h"
#include "../common/path_utils.h"
#include "../common/validation_utils.h"
#include <exception>

ExtractorFallbackEngine::ExtractorFallbackEngine(Extractor& extractor, DownloadMode mode,
                                                 int max_passes, int retries_per_step)
    : extractor_(extractor)
    , mode_(mode)
    , max_passes_(max_passes < 1 ? 1 : max_passes)
    , retries_per_step_(retries_per_step < 1 ? 1 : retries_per_step) {
}

const std::vector<std::string>& ExtractorFallbackEngine::preferredExtensions() {
    static const std::vector<std::string> extensions = {"webm", "mp4", "mkv"};
    return extensions;
}

std::string ExtractorFallbackEngine::findOutputFile(const std::string& temp_dir, const std::string& video_id) {
    std::vector<std::string> names;
    if (!PathUtils::listDirectory(temp_dir, names)) {
        return "";
    }

    for (const auto& ext : preferredExtensions()) {
        for (const auto& name : names) {
            if (!PathUtils::startsWith(name, video_id) || ValidationUtils::isTemporaryFile(name)) {
                continue;
            }
            if (PathUtils::getExtension(name) != ext) {
                continue;
            }
            std::string path = PathUtils::joinPath(temp_dir, name);
            if (PathUtils::isRegularFile(path)) {
                return path;
            }
        }
    }
    return "";
}

bool ExtractorFallbackEngine::resetTempDir(const std::string& temp_dir, const std::string& video_id) {
    if (PartialFileMonitor::isPartialFileStuck(temp_dir, video_id)) {
        LOG_WARN("FallbackEngine", "[" << video_id << "] Stuck partial detected, wiping temp dir");
    }
    if (!PathUtils::removeAll(temp_dir)) {
        LOG_ERROR("FallbackEngine", "[" << video_id << "] Cannot remove " << temp_dir);
        return false;
    }
    if (!PathUtils::createDirectories(temp_dir)) {
        LOG_ERROR("FallbackEngine", "[" << video_id << "] Cannot create " << temp_dir);
        return false;
    }
    return true;
}

std::string ExtractorFallbackEngine::resolveOutput(const ExtractionResult& result, const std::string& temp_dir,
                                                   const std::string& video_id) {
    // Trust the reported path only if it really is a finished file in our scratch dir
    if (!result.file_path.empty()) {
        std::string reported = PathUtils::normalizePath(result.file_path);
        if (PathUtils::getDirectory(reported) == PathUtils::getDirectory(PathUtils::joinPath(temp_dir, video_id)) &&
            PathUtils::isRegularFile(reported) &&
            !ValidationUtils::isTemporaryFile(reported)) {
            return reported;
        }
        LOG_DEBUG("FallbackEngine", "[" << video_id << "] Ignoring reported path " << result.file_path);
    }
    return findOutputFile(temp_dir, video_id);
}

bool ExtractorFallbackEngine::attempt(const ExtractionRequest& request, std::string& file_path) {
    ExtractionResult result;
    try {
        result = extractor_.extract(request);
    } catch (const std::exception& e) {
        LOG_WARN("FallbackEngine", "[" << request.video_id << "] " << request.step.describe()
                 << " failed: " << e.what());
        return false;
    }

    if (!result.success) {
        LOG_WARN("FallbackEngine", "[" << request.video_id << "] " << request.step.describe() << " failed"
                 << (result.error.empty() ? "" : ": " + result.error));
        return false;
    }

    file_path = resolveOutput(result, request.output_dir, request.video_id);
    if (file_path.empty()) {
        LOG_WARN("FallbackEngine", "[" << request.video_id << "] " << request.step.describe()
                 << " produced no usable output");
        return false;
    }
    return true;
}

ExtractionOutcome ExtractorFallbackEngine::download(const std::string& url, const std::string& video_id,
                                                    const std::string& temp_dir) {
    ExtractionOutcome outcome;
    AttemptPlan plan = ExtractionProfiles::buildAttemptPlan(mode_);

    for (int pass = 0; pass < max_passes_; ++pass) {
        LOG_INFO("FallbackEngine", "[" << video_id << "] Download attempt " << (pass + 1) << "/" << max_passes_
                 << " (" << downloadModeName(mode_) << ")");

        for (const auto& step : plan) {
            LOG_DEBUG("FallbackEngine", "[" << video_id << "] Trying " << step.describe());

            for (int retry = 0; retry < retries_per_step_; ++retry) {
                if (!resetTempDir(temp_dir, video_id)) {
                    continue;
                }

                ExtractionRequest request;
                request.url = url;
                request.video_id = video_id;
                request.output_dir = temp_dir;
                request.step = step;

                outcome.attempts++;
                std::string file_path;
                if (attempt(request, file_path)) {
                    LOG_INFO("FallbackEngine", "[" << video_id << "] SUCCESS via " << step.describe()
                             << " -> " << PathUtils::getFilename(file_path));
                    outcome.success = true;
                    outcome.file_path = file_path;
                    outcome.step = step.describe();
                    return outcome;
                }
            }
        }

        LOG_WARN("FallbackEngine", "[" << video_id << "] All extractors failed this attempt");
    }

    LOG_ERROR("FallbackEngine", "[" << video_id << "] PERMANENT FAILURE after " << max_passes_ << " attempts");
    return outcome;
}
