#include "telegram_notifier.h"
#include "../common/logger.h"
#include "../common/process_launcher.h"
#include "../platform/path_finder.h"

TelegramNotifier::TelegramNotifier(const std::string& bot_token, const std::string& chat_id, int timeout_seconds)
    : bot_token_(bot_token)
    , chat_id_(chat_id)
    , timeout_seconds_(timeout_seconds) {
}

std::vector<std::string> TelegramNotifier::buildArguments(const std::string& message) const {
    return {
        "-s",
        "--fail",
        "--max-time", std::to_string(timeout_seconds_),
        "-X", "POST",
        "https://api.telegram.org/bot" + bot_token_ + "/sendMessage",
        "--data-urlencode", "chat_id=" + chat_id_,
        "--data-urlencode", "text=" + message
    };
}

bool TelegramNotifier::send(const std::string& message) {
    ProcessResult result = ProcessLauncher::run(PathFinder::findCurlPath(), buildArguments(message));
    if (!result.succeeded()) {
        LOG_ERROR("TelegramNotifier", "Failed to send message (curl status " << result.exit_code << ")");
        return false;
    }
    LOG_DEBUG("TelegramNotifier", "Summary sent");
    return true;
}
