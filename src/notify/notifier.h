#pragma once

#include <string>

// Outbound channel for the end-of-run summary
class Notifier {
public:
    virtual ~Notifier() {}

    virtual bool send(const std::string& message) = 0;
};
