#pragma once

#include <string>

class ValidationUtils {
public:
    // Maximum length (in bytes) of a sanitized filename component
    static constexpr size_t MAX_FILENAME_LENGTH = 180;

    // Remove characters unsafe for filenames (\ / : * ? " < > |), collapse
    // whitespace runs to one space, trim, and cap the length without cutting
    // a UTF-8 sequence in half
    static std::string sanitizeFilename(const std::string& name, size_t max_length = MAX_FILENAME_LENGTH);

    // True for exactly eight ASCII digits (YYYYMMDD)
    static bool isCompactDate(const std::string& date);

    // "20230115" -> "2023-01-15"; anything that is not a compact date -> ""
    static std::string normalizeUploadDate(const std::string& date);

    // Check if a file name is an in-progress download (.part, .ytdl, .temp ...)
    static bool isTemporaryFile(const std::string& file_name);

    // Container extensions accepted for final_format
    static bool isSupportedContainer(const std::string& extension);
};
