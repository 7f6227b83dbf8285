#include "extraction_profile.h"
#include <cctype>

namespace ExtractionProfiles {

const char* const FORMAT_PREFERRED =
    "bestvideo[ext=webm][height<=1080]+bestaudio[ext=webm]/"
    "bestvideo[ext=webm][height<=720]+bestaudio[ext=webm]/"
    "bestvideo[ext=mp4][height<=1080]+bestaudio[ext=m4a]/"
    "bestvideo[ext=mp4][height<=720]+bestaudio[ext=m4a]";

const char* const FORMAT_BEST_FALLBACK = "bestvideo*+bestaudio/best";

static const char* const ACCEPT_LANGUAGE = "en-US,en;q=0.9";

static ExtractionProfile makeProfile(const std::string& name, const std::string& user_agent) {
    ExtractionProfile profile;
    profile.name = name;
    profile.player_client = name;
    profile.headers.push_back(std::make_pair("User-Agent", user_agent));
    profile.headers.push_back(std::make_pair("Accept-Language", ACCEPT_LANGUAGE));
    return profile;
}

const std::vector<ExtractionProfile>& chain() {
    static const std::vector<ExtractionProfile> profiles = {
        makeProfile("android", "com.google.android.youtube/19.42.37 (Linux; Android 14)"),
        makeProfile("tv_embedded", "Mozilla/5.0 (SmartTV; Linux; Tizen 6.5) AppleWebKit/537.36"),
        makeProfile("web", "Mozilla/5.0 (Macintosh; Intel Mac OS X 10_15_7) "
                           "AppleWebKit/605.1.15 (KHTML, like Gecko) Safari/605.1.15")
    };
    return profiles;
}

ExtractionProfile defaultProfile() {
    ExtractionProfile profile;
    profile.name = "default";
    return profile;
}

static AttemptStep makeStep(const ExtractionProfile& profile, const std::string& format) {
    AttemptStep step;
    step.profile = profile;
    step.format = format;
    return step;
}

AttemptPlan buildAttemptPlan(DownloadMode mode) {
    AttemptPlan plan;

    if (mode == DownloadMode::Lenient) {
        AttemptStep native_step = makeStep(defaultProfile(), "");
        native_step.native = true;
        plan.push_back(native_step);
        for (const auto& profile : chain()) {
            plan.push_back(makeStep(profile, FORMAT_BEST_FALLBACK));
        }
    } else {
        for (const auto& profile : chain()) {
            plan.push_back(makeStep(profile, FORMAT_PREFERRED));
        }
        plan.push_back(makeStep(defaultProfile(), FORMAT_PREFERRED));
    }

    plan.push_back(makeStep(defaultProfile(), FORMAT_BEST_FALLBACK));
    return plan;
}

} // namespace ExtractionProfiles

bool AttemptStep::isBestFallback() const {
    return format == ExtractionProfiles::FORMAT_BEST_FALLBACK;
}

std::string AttemptStep::describe() const {
    std::string text = profile.name;
    if (native) {
        text += " (native)";
    } else if (isBestFallback()) {
        text += " (best)";
    } else if (!format.empty()) {
        text += " (preferred)";
    }
    return text;
}

bool parseDownloadMode(const std::string& name, DownloadMode& mode) {
    std::string lower;
    for (char c : name) {
        lower += static_cast<char>(tolower(static_cast<unsigned char>(c)));
    }
    if (lower == "strict") {
        mode = DownloadMode::Strict;
        return true;
    }
    if (lower == "lenient") {
        mode = DownloadMode::Lenient;
        return true;
    }
    return false;
}

const char* downloadModeName(DownloadMode mode) {
    return mode == DownloadMode::Lenient ? "lenient" : "strict";
}
