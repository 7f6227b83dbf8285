#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace PathUtils {
    // Convert backslashes to forward slashes and remove duplicate separators
    std::string normalizePath(const std::string& path);

    // Join two path components with a single separator
    std::string joinPath(const std::string& base, const std::string& part);

    // Directory part of a path ("." if there is none)
    std::string getDirectory(const std::string& path);

    // Last path component
    std::string getFilename(const std::string& path);

    // Extension without the dot, lowercased ("" if none)
    std::string getExtension(const std::string& path);

    // Replace (or append) the extension; new_ext is given without the dot
    std::string replaceExtension(const std::string& path, const std::string& new_ext);

    bool fileExists(const std::string& path);
    bool isDirectory(const std::string& path);
    bool isRegularFile(const std::string& path);

    // Returns false if the file cannot be stat'ed
    bool getFileSize(const std::string& path, int64_t& size);

    // mkdir -p. Returns true if the directory exists afterwards.
    bool createDirectories(const std::string& path);

    // rm -rf. Returns true if nothing is left at path afterwards.
    bool removeAll(const std::string& path);

    // Remove a single file, ignoring "does not exist"
    bool removeFile(const std::string& path);

    // Names of the entries in a directory (no "." / ".."), unsorted
    bool listDirectory(const std::string& path, std::vector<std::string>& names);

    // True if name starts with prefix
    bool startsWith(const std::string& name, const std::string& prefix);
    bool endsWith(const std::string& name, const std::string& suffix);
}
