#include "path_utils.h"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <string>
#include <dirent.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace PathUtils {

std::string normalizePath(const std::string& path) {
    if (path.empty()) return path;
    std::string normalized = path;

    std::replace(normalized.begin(), normalized.end(), '\\', '/');
    // Remove duplicate forward slashes
    std::string result;
    for (size_t i = 0; i < normalized.length(); i++) {
        if (normalized[i] != '/' || result.empty() || result.back() != '/') {
            result += normalized[i];
        }
    }
    return result;
}

std::string joinPath(const std::string& base, const std::string& part) {
    if (base.empty()) return normalizePath(part);
    if (part.empty()) return normalizePath(base);
    std::string normalized_base = normalizePath(base);
    std::string normalized_part = normalizePath(part);

    if (normalized_base.back() == '/') {
        return normalized_base + normalized_part;
    }
    return normalized_base + "/" + normalized_part;
}

std::string getDirectory(const std::string& path) {
    std::string normalized = normalizePath(path);
    size_t last_slash = normalized.find_last_of('/');
    if (last_slash == std::string::npos) {
        return ".";
    }
    if (last_slash == 0) {
        return "/";
    }
    return normalized.substr(0, last_slash);
}

std::string getFilename(const std::string& path) {
    std::string normalized = normalizePath(path);
    size_t last_slash = normalized.find_last_of('/');
    if (last_slash == std::string::npos) {
        return normalized;
    }
    return normalized.substr(last_slash + 1);
}

std::string getExtension(const std::string& path) {
    std::string name = getFilename(path);
    size_t last_dot = name.find_last_of('.');
    if (last_dot == std::string::npos || last_dot == 0 || last_dot == name.length() - 1) {
        return "";
    }
    std::string ext = name.substr(last_dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(), ::tolower);
    return ext;
}

std::string replaceExtension(const std::string& path, const std::string& new_ext) {
    std::string name = getFilename(path);
    size_t last_dot = name.find_last_of('.');
    std::string base = path;
    if (last_dot != std::string::npos && last_dot != 0) {
        base = path.substr(0, path.length() - (name.length() - last_dot));
    }
    return base + "." + new_ext;
}

bool fileExists(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0;
}

bool isDirectory(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool isRegularFile(const std::string& path) {
    struct stat st;
    return stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

bool getFileSize(const std::string& path, int64_t& size) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return false;
    }
    size = static_cast<int64_t>(st.st_size);
    return true;
}

bool createDirectories(const std::string& path) {
    if (path.empty()) return false;
    std::string normalized = normalizePath(path);

    std::string current;
    size_t pos = 0;
    while (pos != std::string::npos) {
        pos = normalized.find('/', pos + 1);
        current = normalized.substr(0, pos);
        if (current.empty() || current == ".") continue;
        if (mkdir(current.c_str(), 0755) != 0 && errno != EEXIST) {
            return false;
        }
    }
    return isDirectory(normalized);
}

bool removeAll(const std::string& path) {
    struct stat st;
    if (lstat(path.c_str(), &st) != 0) {
        return errno == ENOENT;
    }

    if (S_ISDIR(st.st_mode)) {
        std::vector<std::string> names;
        if (listDirectory(path, names)) {
            for (const auto& name : names) {
                removeAll(joinPath(path, name));
            }
        }
        if (rmdir(path.c_str()) != 0 && errno != ENOENT) {
            return false;
        }
        return true;
    }

    return removeFile(path);
}

bool removeFile(const std::string& path) {
    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        return false;
    }
    return true;
}

bool listDirectory(const std::string& path, std::vector<std::string>& names) {
    names.clear();
    DIR* dir = opendir(path.c_str());
    if (!dir) {
        return false;
    }
    struct dirent* entry;
    while ((entry = readdir(dir)) != nullptr) {
        std::string name = entry->d_name;
        if (name == "." || name == "..") continue;
        names.push_back(name);
    }
    closedir(dir);
    return true;
}

bool startsWith(const std::string& name, const std::string& prefix) {
    return name.size() >= prefix.size() && name.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(const std::string& name, const std::string& suffix) {
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace PathUtils
