#pragma once

#include "extraction_profile.h"
#include <string>

// One call into the extraction layer
struct ExtractionRequest {
    std::string url;
    std::string video_id;
    std::string output_dir;  // Scratch directory, output goes to <output_dir>/<id>.<ext>
    AttemptStep step;
};

struct ExtractionResult {
    bool success = false;
    std::string file_path;  // Final output path as reported by the extractor, may be empty
    std::string error;
};

// Downloads one video into a scratch directory.
// Implementations may throw; the fallback engine counts that as a failed attempt.
class Extractor {
public:
    virtual ~Extractor() {}

    virtual ExtractionResult extract(const ExtractionRequest& request) = 0;
};
