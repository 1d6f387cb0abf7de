#include "helpers/Color.hpp"

#include <gtest/gtest.h>

TEST(Color, HexIsUppercaseByDefault) {
    const auto COL = CColor::fromRGB({0xAB, 0x0C, 0xFF});
    EXPECT_EQ(COL.toHex(), "#AB0CFF");
    EXPECT_EQ(COL.toHex(true), "#ab0cff");
    EXPECT_EQ(formatColor(COL, OUTPUT_HEX, true), "#ab0cff");
}

TEST(Color, FromARGBSplitsChannels) {
    const auto COL = CColor::fromARGB(0x80112233);
    EXPECT_EQ(COL.a, 0x80);
    EXPECT_EQ(COL.r, 0x11);
    EXPECT_EQ(COL.g, 0x22);
    EXPECT_EQ(COL.b, 0x33);
    EXPECT_EQ(COL.toARGB(), 0x80112233u);
    EXPECT_EQ(COL.rgb(), (RGB{0x11, 0x22, 0x33}));
}

TEST(Color, Formats) {
    const auto RED = CColor::fromRGB({255, 0, 0});
    EXPECT_EQ(formatColor(RED, OUTPUT_RGB), "rgb(255, 0, 0)");
    EXPECT_EQ(formatColor(RED, OUTPUT_RGBA), "rgba(255, 0, 0, 1)");
    EXPECT_EQ(formatColor(RED, OUTPUT_HSL), "hsl(0, 100%, 50%)");
    EXPECT_EQ(formatColor(RED, OUTPUT_HSV), "hsv(0, 100%, 100%)");
    EXPECT_EQ(formatColor(RED, OUTPUT_CMYK), "cmyk(0%, 100%, 100%, 0%)");
    EXPECT_EQ(formatColor(RED, OUTPUT_CSS_VAR), "--color: #FF0000;");

    EXPECT_EQ(formatColor(CColor::fromRGB({0, 0, 0}), OUTPUT_CMYK), "cmyk(0%, 0%, 0%, 100%)");
    EXPECT_EQ(formatColor(CColor::fromRGB({128, 128, 128}), OUTPUT_HSL), "hsl(0, 0%, 50%)");
    EXPECT_EQ(formatColor(CColor::fromRGB({0, 0, 255}), OUTPUT_HSV), "hsv(240, 100%, 100%)");
}

TEST(Color, OutputModeNames) {
    EXPECT_EQ(outputModeFromString("RGB"), OUTPUT_RGB);
    EXPECT_EQ(outputModeFromString("css"), OUTPUT_CSS_VAR);
    EXPECT_EQ(outputModeFromString("cmyk"), OUTPUT_CMYK);
    EXPECT_FALSE(outputModeFromString("lab").has_value());

    for (auto mode : {OUTPUT_CMYK, OUTPUT_HEX, OUTPUT_RGB, OUTPUT_RGBA, OUTPUT_HSL, OUTPUT_HSV, OUTPUT_CSS_VAR}) {
        EXPECT_EQ(outputModeFromString(outputModeName(mode)), mode);
    }
}

TEST(Color, Luminance) {
    EXPECT_NEAR(CColor::fromRGB({255, 255, 255}).luminance(), 1.0, 1e-4);
    EXPECT_NEAR(CColor::fromRGB({0, 0, 0}).luminance(), 0.0, 1e-6);
    EXPECT_GT(CColor::fromRGB({0, 255, 0}).luminance(), CColor::fromRGB({255, 0, 0}).luminance());
}
