#pragma once

#include "extractor.h"
#include "extraction_profile.h"
#include <string>
#include <vector>

struct ExtractionOutcome {
    bool success = false;
    std::string file_path;
    int attempts = 0;      // Extractor calls made
    std::string step;      // Description of the winning step
};

// Drives the extractor through passes x plan steps x retries until one
// attempt leaves a finished file in the scratch directory.
//
// Every attempt starts from a freshly recreated scratch directory; partial
// files are never resumed. The first file produced wins.
class ExtractorFallbackEngine {
public:
    ExtractorFallbackEngine(Extractor& extractor, DownloadMode mode, int max_passes, int retries_per_step);

    ExtractionOutcome download(const std::string& url, const std::string& video_id, const std::string& temp_dir);

    // Output file for video_id in temp_dir: .webm preferred, then .mp4, then .mkv.
    // In-progress files are ignored. Empty if nothing matches.
    static std::string findOutputFile(const std::string& temp_dir, const std::string& video_id);

    // Extensions accepted by findOutputFile(), in order of preference
    static const std::vector<std::string>& preferredExtensions();

private:
    bool resetTempDir(const std::string& temp_dir, const std::string& video_id);
    bool attempt(const ExtractionRequest& request, std::string& file_path);
    std::string resolveOutput(const ExtractionResult& result, const std::string& temp_dir,
                              const std::string& video_id);

    Extractor& extractor_;
    DownloadMode mode_;
    int max_passes_;
    int retries_per_step_;
};
