#include "FakeScreen.hpp"
#include "picker/Sampler.hpp"

#include <gtest/gtest.h>

TEST(Sampler, SinglePixel) {
    auto           screen = makeShared<CFakeScreen>(64, 48, gradientPixel);
    CScreenSampler sampler(screen);

    const auto     SAMPLE = sampler.sample(SScreenPoint{.monitor = 3, .x = 17, .y = 5});
    ASSERT_TRUE(SAMPLE.has_value());
    EXPECT_EQ(SAMPLE->hex, "#110540");
    EXPECT_EQ(SAMPLE->rgb, (RGB{17, 5, 0x40}));
    EXPECT_EQ(SAMPLE->source, (SScreenPoint{.monitor = 3, .x = 17, .y = 5}));
    EXPECT_EQ(screen->m_iCaptures.load(), 1);
}

TEST(Sampler, BlockIsCenteredOnThePoint) {
    auto           screen = makeShared<CFakeScreen>(64, 48, gradientPixel);
    CScreenSampler sampler(screen);

    const auto     BLOCK = sampler.sampleBlock(SScreenPoint{.monitor = 0, .x = 30, .y = 20}, 3);
    ASSERT_TRUE(BLOCK.has_value());
    EXPECT_EQ(BLOCK->width, 7);
    EXPECT_EQ(BLOCK->height, 7);
    EXPECT_EQ(BLOCK->x, 27);
    EXPECT_EQ(BLOCK->y, 17);
    EXPECT_EQ(BLOCK->at(27, 17), gradientPixel(27, 17));
    EXPECT_EQ(BLOCK->at(33, 23), gradientPixel(33, 23));
    EXPECT_EQ(CScreenSampler::centerOf(*BLOCK).hex, "#1E1440");
    // one capture per block
    EXPECT_EQ(screen->m_iCaptures.load(), 1);
}

TEST(Sampler, EdgesRepeatTheClosestPixel) {
    auto           screen = makeShared<CFakeScreen>(64, 48, gradientPixel);
    CScreenSampler sampler(screen);

    const auto     BLOCK = sampler.sampleBlock(SScreenPoint{.monitor = 0, .x = 0, .y = 47}, 2);
    ASSERT_TRUE(BLOCK.has_value());
    EXPECT_EQ(BLOCK->pixels.size(), 25u);
    EXPECT_EQ(BLOCK->at(-2, 45), gradientPixel(0, 45));
    EXPECT_EQ(BLOCK->at(-1, 49), gradientPixel(0, 47));
    EXPECT_EQ(BLOCK->at(2, 49), gradientPixel(2, 47));
    EXPECT_EQ(CScreenSampler::centerOf(*BLOCK).source, (SScreenPoint{.monitor = 0, .x = 0, .y = 47}));
}

TEST(Sampler, AlphaIsForcedOpaque) {
    auto           screen = makeShared<CFakeScreen>(4, 4, [](int, int) { return 0x00123456u; });
    CScreenSampler sampler(screen);

    const auto     BLOCK = sampler.sampleBlock(SScreenPoint{.monitor = 0, .x = 1, .y = 1}, 1);
    ASSERT_TRUE(BLOCK.has_value());
    EXPECT_EQ(BLOCK->at(1, 1), 0xFF123456u);
}

TEST(Sampler, Errors) {
    auto           screen = makeShared<CFakeScreen>(8, 8, gradientPixel);
    CScreenSampler sampler(screen);

    const auto     NEGATIVE = sampler.sampleBlock(SScreenPoint{.monitor = 0, .x = 1, .y = 1}, -1);
    ASSERT_FALSE(NEGATIVE.has_value());
    EXPECT_EQ(NEGATIVE.error().kind, PICK_ERROR_INVALID_ARGUMENT);

    screen->m_iFailNext = 1;
    const auto FAILED   = sampler.sample(SScreenPoint{.monitor = 0, .x = 1, .y = 1});
    ASSERT_FALSE(FAILED.has_value());
    EXPECT_EQ(FAILED.error().kind, PICK_ERROR_CAPTURE_UNAVAILABLE);

    // the point itself is off the output
    const auto OUTSIDE = sampler.sample(SScreenPoint{.monitor = 0, .x = 40, .y = 1});
    ASSERT_FALSE(OUTSIDE.has_value());
    EXPECT_EQ(OUTSIDE.error().kind, PICK_ERROR_CAPTURE_UNAVAILABLE);

    CScreenSampler nothing(nullptr);
    EXPECT_FALSE(nothing.sample(SScreenPoint{.monitor = 0, .x = 1, .y = 1}).has_value());
}
