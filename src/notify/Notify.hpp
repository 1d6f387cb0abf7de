#pragma once

#include <string>

namespace NNotify {
    void send(const std::string& hexColor, const std::string& formattedColor);
    void sendError(const std::string& message);
};
