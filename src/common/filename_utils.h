#pragma once

#include "types.h"
#include <string>

namespace FilenameUtils {
    // "Title - Channel (MM-YYYY)", or "Title - Channel" when the upload date
    // is not a compact YYYYMMDD date. Both parts are sanitized.
    std::string prettyName(const std::string& title, const std::string& channel, const std::string& upload_date);

    // Expand a filename template with %(title)s, %(uploader)s, %(upload_date)s,
    // %(ext)s and %(id)s placeholders ("%%" is a literal percent sign).
    // Returns false on unknown placeholders or malformed syntax.
    bool expandTemplate(const std::string& filename_template, const VideoMetadata& metadata,
                        const std::string& video_id, const std::string& ext, std::string& result);

    // Destination file name for an archived video: the expanded template when
    // one is configured and valid, otherwise "<pretty name>_<id[:8]>.<ext>"
    std::string buildFinalFilename(const std::string& filename_template, const VideoMetadata& metadata,
                                   const std::string& video_id, const std::string& ext);
}
