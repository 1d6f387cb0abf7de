#include "Color.hpp"

#include <algorithm>
#include <cmath>
#include <format>

CColor CColor::fromARGB(uint32_t argb) {
    return CColor{.r = (uint8_t)((argb >> 16) & 0xFF), .g = (uint8_t)((argb >> 8) & 0xFF), .b = (uint8_t)(argb & 0xFF), .a = (uint8_t)((argb >> 24) & 0xFF)};
}

CColor CColor::fromRGB(const RGB& rgb) {
    return CColor{.r = rgb[0], .g = rgb[1], .b = rgb[2], .a = 0xFF};
}

uint32_t CColor::toARGB() const {
    return ((uint32_t)a << 24) | ((uint32_t)r << 16) | ((uint32_t)g << 8) | (uint32_t)b;
}

RGB CColor::rgb() const {
    return {r, g, b};
}

static float hueOf(float rf, float gf, float bf, float max, float delta) {
    if (delta == 0.F)
        return 0.F;

    float h = 0.F;
    if (max == rf)
        h = (gf - bf) / delta + (gf < bf ? 6.F : 0.F);
    else if (max == gf)
        h = (bf - rf) / delta + 2.F;
    else
        h = (rf - gf) / delta + 4.F;

    return std::round(h * 60.F);
}

void CColor::getCMYK(float& c, float& m, float& y, float& k) const {
    const float RF = r / 255.F, GF = g / 255.F, BF = b / 255.F;

    k = 1.F - std::max({RF, GF, BF});

    if (k >= 1.F) {
        c = m = y = 0.F;
        k         = 100.F;
        return;
    }

    c = std::round((1.F - RF - k) / (1.F - k) * 100.F);
    m = std::round((1.F - GF - k) / (1.F - k) * 100.F);
    y = std::round((1.F - BF - k) / (1.F - k) * 100.F);
    k = std::round(k * 100.F);
}

void CColor::getHSV(float& h, float& s, float& v) const {
    const float RF = r / 255.F, GF = g / 255.F, BF = b / 255.F;
    const float MAX = std::max({RF, GF, BF}), MIN = std::min({RF, GF, BF});
    const float DELTA = MAX - MIN;

    h = hueOf(RF, GF, BF, MAX, DELTA);
    s = MAX == 0.F ? 0.F : std::round(DELTA / MAX * 100.F);
    v = std::round(MAX * 100.F);
}

void CColor::getHSL(float& h, float& s, float& l) const {
    const float RF = r / 255.F, GF = g / 255.F, BF = b / 255.F;
    const float MAX = std::max({RF, GF, BF}), MIN = std::min({RF, GF, BF});
    const float DELTA = MAX - MIN;
    const float L     = (MAX + MIN) / 2.F;

    h = hueOf(RF, GF, BF, MAX, DELTA);

    if (DELTA == 0.F)
        s = 0.F;
    else
        s = std::round((L > 0.5F ? DELTA / (2.F - MAX - MIN) : DELTA / (MAX + MIN)) * 100.F);

    l = std::round(L * 100.F);

    // hue 360 is hue 0
    if (h >= 360.F)
        h -= 360.F;
}

std::string CColor::toHex(bool lowercase) const {
    if (lowercase)
        return std::format("#{:02x}{:02x}{:02x}", r, g, b);
    return std::format("#{:02X}{:02X}{:02X}", r, g, b);
}

float CColor::luminance() const {
    // relative brightness of a channel
    const auto FLUMI = [](const float& c) -> float { return c <= 0.03928 ? c / 12.92 : powf((c + 0.055) / 1.055, 2.4); };

    return 0.2126 * FLUMI(r / 255.0f) + 0.7152 * FLUMI(g / 255.0f) + 0.0722 * FLUMI(b / 255.0f);
}

std::string formatColor(const CColor& col, eOutputMode mode, bool lowercase) {
    switch (mode) {
        case OUTPUT_HEX: return col.toHex(lowercase);
        case OUTPUT_RGB: return std::format("rgb({}, {}, {})", col.r, col.g, col.b);
        case OUTPUT_RGBA: return std::format("rgba({}, {}, {}, 1)", col.r, col.g, col.b);
        case OUTPUT_HSL: {
            float h, s, l;
            col.getHSL(h, s, l);
            return std::format("hsl({}, {}%, {}%)", (int)h, (int)s, (int)l);
        }
        case OUTPUT_HSV: {
            float h, s, v;
            col.getHSV(h, s, v);
            return std::format("hsv({}, {}%, {}%)", (int)h, (int)s, (int)v);
        }
        case OUTPUT_CMYK: {
            float c, m, y, k;
            col.getCMYK(c, m, y, k);
            return std::format("cmyk({}%, {}%, {}%, {}%)", (int)c, (int)m, (int)y, (int)k);
        }
        case OUTPUT_CSS_VAR: return std::format("--color: {};", col.toHex(lowercase));
    }

    return col.toHex(lowercase);
}

std::optional<eOutputMode> outputModeFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(), ::tolower);

    if (lower == "hex")
        return OUTPUT_HEX;
    if (lower == "rgb")
        return OUTPUT_RGB;
    if (lower == "rgba")
        return OUTPUT_RGBA;
    if (lower == "hsl")
        return OUTPUT_HSL;
    if (lower == "hsv")
        return OUTPUT_HSV;
    if (lower == "cmyk")
        return OUTPUT_CMYK;
    if (lower == "css-var" || lower == "css")
        return OUTPUT_CSS_VAR;

    return std::nullopt;
}

const char* outputModeName(eOutputMode mode) {
    switch (mode) {
        case OUTPUT_CMYK: return "cmyk";
        case OUTPUT_HEX: return "hex";
        case OUTPUT_RGB: return "rgb";
        case OUTPUT_RGBA: return "rgba";
        case OUTPUT_HSL: return "hsl";
        case OUTPUT_HSV: return "hsv";
        case OUTPUT_CSS_VAR: return "css-var";
    }
    return "hex";
}
