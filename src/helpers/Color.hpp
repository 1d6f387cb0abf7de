#pragma once

#include "../picker/Types.hpp"

#include <cstdint>
#include <optional>
#include <string>

enum eOutputMode {
    OUTPUT_CMYK = 0,
    OUTPUT_HEX,
    OUTPUT_RGB,
    OUTPUT_RGBA,
    OUTPUT_HSL,
    OUTPUT_HSV,
    OUTPUT_CSS_VAR
};

class CColor {
  public:
    uint8_t       r = 0, g = 0, b = 0, a = 255;

    static CColor fromARGB(uint32_t argb);
    static CColor fromRGB(const RGB& rgb);

    uint32_t      toARGB() const;
    RGB           rgb() const;

    // all of these round to whole degrees / percent
    void          getCMYK(float& c, float& m, float& y, float& k) const;
    void          getHSV(float& h, float& s, float& v) const;
    void          getHSL(float& h, float& s, float& l) const;

    std::string   toHex(bool lowercase = false) const;

    // WCAG relative luminance, 0 - 1
    float         luminance() const;
};

std::string                formatColor(const CColor& col, eOutputMode mode, bool lowercase = false);
std::optional<eOutputMode> outputModeFromString(const std::string& str);
const char*                outputModeName(eOutputMode mode);
