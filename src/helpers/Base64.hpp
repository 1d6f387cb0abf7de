#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace NBase64 {
    std::string encode(const uint8_t* data, size_t len);
    std::string encode(const std::vector<uint8_t>& data);
};
