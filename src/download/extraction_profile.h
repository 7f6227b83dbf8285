#pragma once

#include <string>
#include <utility>
#include <vector>

// How hard the attempt plan insists on the preferred formats
enum class DownloadMode {
    Strict,   // preferred WebM/MP4 selectors first, best fallback last
    Lenient   // extractor defaults first, then best fallback everywhere
};

// "strict" / "lenient" (case-insensitive). Returns false for anything else.
bool parseDownloadMode(const std::string& name, DownloadMode& mode);
const char* downloadModeName(DownloadMode mode);

// Simulated client identity presented to YouTube
struct ExtractionProfile {
    std::string name;           // "android", "tv_embedded", "web" or "default"
    std::string player_client;  // youtube:player_client=<value>; empty = no override
    std::vector<std::pair<std::string, std::string>> headers;
};

// One extraction attempt of an AttemptPlan
struct AttemptStep {
    ExtractionProfile profile;
    std::string format;   // -f selector; empty = extractor default
    bool native = false;  // extractor defaults only: no headers, timeouts, retries or runtime hints

    bool isDefault() const { return profile.player_client.empty(); }
    bool isBestFallback() const;
    std::string describe() const;
};

typedef std::vector<AttemptStep> AttemptPlan;

namespace ExtractionProfiles {
    // Preferred selector: WebM up to 1080p, then 720p, then MP4/M4A at the same heights
    extern const char* const FORMAT_PREFERRED;
    // Generic best-quality fallback
    extern const char* const FORMAT_BEST_FALLBACK;

    // Fixed chain, most resilient client first
    const std::vector<ExtractionProfile>& chain();

    // Profile without any client override
    ExtractionProfile defaultProfile();

    // Every plan has at least one default step and one best-fallback step
    AttemptPlan buildAttemptPlan(DownloadMode mode);
}
