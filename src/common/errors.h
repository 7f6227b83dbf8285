#pragma once

#include <stdexcept>
#include <string>

// Failures raised by external collaborators (playlist source). The run
// coordinator catches these per playlist or per item; nothing inside the
// download pipeline throws them.
class ArchiverError : public std::runtime_error {
public:
    explicit ArchiverError(const std::string& message) : std::runtime_error(message) {}
};

// Account or credential unusable for this run
class AuthFailure : public ArchiverError {
public:
    explicit AuthFailure(const std::string& message) : ArchiverError(message) {}
};

// Playlist listing or metadata fetch failed
class SourceFetchFailure : public ArchiverError {
public:
    explicit SourceFetchFailure(const std::string& message) : ArchiverError(message) {}
};
