#pragma once

#include <string>
#include <utility>
#include <vector>

typedef std::vector<std::pair<std::string, std::string>> MetadataTags;

// Stream-copy tagging job: input + tags (+ optional cover) -> output
struct MuxJob {
    std::string input_path;
    std::string output_path;
    std::string cover_path;  // JPEG cover image, empty for none
    MetadataTags tags;
};

// External muxing tool. Both operations copy streams, they never re-encode.
// Return true only if the tool reported success.
class Muxer {
public:
    virtual ~Muxer() {}

    virtual bool writeTags(const MuxJob& job) = 0;

    // Repackage input into the container implied by output's extension
    virtual bool remux(const std::string& input_path, const std::string& output_path) = 0;
};
