#pragma once

#include "notifier.h"
#include <string>
#include <vector>

// Posts messages to a Telegram chat through the Bot API, using curl
class TelegramNotifier : public Notifier {
public:
    TelegramNotifier(const std::string& bot_token, const std::string& chat_id, int timeout_seconds = 10);

    bool send(const std::string& message) override;

    std::vector<std::string> buildArguments(const std::string& message) const;

private:
    std::string bot_token_;
    std::string chat_id_;
    int timeout_seconds_;
};
