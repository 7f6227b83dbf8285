#pragma once

#include "muxer.h"
#include <string>

// Optional stream-copy repackaging into the configured final container
class ContainerConverter {
public:
    explicit ContainerConverter(Muxer& muxer);

    // Returns the canonical path afterwards: the converted file on success,
    // otherwise the unchanged input. target_ext is given without the dot.
    std::string convert(const std::string& file_path, const std::string& target_ext);

    // MP4 (H.264/AAC) cannot be stream-copied into WebM
    static bool isRefused(const std::string& from_ext, const std::string& to_ext);

private:
    Muxer& muxer_;
};
