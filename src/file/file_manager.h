#pragma once

#include <string>

class FileManager {
public:
    // Copy src to dst, creating dst's parent directories and preserving
    // permission bits and timestamps. A partially written dst is removed on failure.
    static bool copyFile(const std::string& src, const std::string& dst);
};
