#pragma once

#include <string>

namespace NClipboard {
    void copy(const std::string& text);
};
