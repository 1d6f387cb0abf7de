#include "FakeScreen.hpp"
#include "picker/Preview.hpp"

#include <cairo/cairo.h>
#include <cstring>
#include <gtest/gtest.h>

struct SPNGReader {
    const std::vector<uint8_t>* data   = nullptr;
    size_t                      offset = 0;
};

static cairo_status_t readChunk(void* closure, unsigned char* out, unsigned int length) {
    auto* reader = (SPNGReader*)closure;
    if (reader->offset + length > reader->data->size())
        return CAIRO_STATUS_READ_ERROR;

    memcpy(out, reader->data->data() + reader->offset, length);
    reader->offset += length;
    return CAIRO_STATUS_SUCCESS;
}

// decodes the frame and returns 0xRRGGBB at x, y
static uint32_t pixelAt(const SPreviewFrame& frame, int x, int y) {
    SPNGReader reader  = {.data = &frame.image};
    const auto SURFACE = cairo_image_surface_create_from_png_stream(readChunk, &reader);
    EXPECT_EQ(cairo_surface_status(SURFACE), CAIRO_STATUS_SUCCESS);
    EXPECT_EQ(cairo_image_surface_get_width(SURFACE), frame.width);
    EXPECT_EQ(cairo_image_surface_get_height(SURFACE), frame.height);

    cairo_surface_flush(SURFACE);
    const auto     DATA   = cairo_image_surface_get_data(SURFACE);
    const auto     STRIDE = cairo_image_surface_get_stride(SURFACE);
    const uint32_t PX     = *(const uint32_t*)(DATA + (ptrdiff_t)y * STRIDE + (ptrdiff_t)x * 4);

    cairo_surface_destroy(SURFACE);
    return PX & 0xFFFFFF;
}

TEST(Preview, SizesAreClamped) {
    EXPECT_EQ(CPreviewRenderer(nullptr, 4, 10).blockSize(), 5);
    EXPECT_EQ(CPreviewRenderer(nullptr, 1, 10).blockSize(), PREVIEW_BLOCK_MIN);
    EXPECT_EQ(CPreviewRenderer(nullptr, 500, 10).blockSize(), PREVIEW_BLOCK_MAX);
    EXPECT_EQ(CPreviewRenderer(nullptr, 9, 1).magnification(), PREVIEW_MAG_MIN);
    EXPECT_EQ(CPreviewRenderer(nullptr, 9, 100).magnification(), PREVIEW_MAG_MAX);
    EXPECT_EQ(CPreviewRenderer(nullptr, 9, 10).radius(), 4);
}

TEST(Preview, NearestNeighbourUpscale) {
    SPixelBlock block = {.monitor = 1, .x = 10, .y = 10, .width = 3, .height = 3};
    for (int i = 0; i < 9; ++i) {
        block.pixels.push_back(0xFF000000 | (uint32_t)(i * 20) << 16 | 0x0000AA);
    }

    CPreviewRenderer renderer(nullptr, 3, 4);
    const auto       FRAME = renderer.renderBlock(block);
    ASSERT_TRUE(FRAME.has_value());

    EXPECT_EQ(FRAME->width, 12);
    EXPECT_EQ(FRAME->height, 12);
    ASSERT_GT(FRAME->image.size(), 8u);
    EXPECT_EQ(FRAME->image[1], 'P');
    EXPECT_EQ(FRAME->image[2], 'N');
    EXPECT_EQ(FRAME->image[3], 'G');

    // the center of every cell is the source pixel, untouched by grid and marker
    EXPECT_EQ(pixelAt(*FRAME, 2, 2), 0x0000AAu);
    EXPECT_EQ(pixelAt(*FRAME, 6, 2), (uint32_t)(20 << 16) | 0xAA);
    EXPECT_EQ(pixelAt(*FRAME, 6, 6), (uint32_t)(80 << 16) | 0xAA);
    EXPECT_EQ(pixelAt(*FRAME, 10, 10), (uint32_t)(160 << 16) | 0xAA);

    EXPECT_EQ(FRAME->center.hex, "#5000AA");
    EXPECT_EQ(FRAME->center.source, (SScreenPoint{.monitor = 1, .x = 11, .y = 11}));
}

TEST(Preview, RejectsEvenBlocks) {
    SPixelBlock block = {.monitor = 1, .x = 0, .y = 0, .width = 2, .height = 2, .pixels = {0, 0, 0, 0}};

    const auto  FRAME = CPreviewRenderer(nullptr, 3, 4).renderBlock(block);
    ASSERT_FALSE(FRAME.has_value());
    EXPECT_EQ(FRAME.error().kind, PICK_ERROR_INVALID_ARGUMENT);
}

TEST(Preview, RenderCapturesAroundTheCenter) {
    auto             screen = makeShared<CFakeScreen>(64, 64, gradientPixel);
    auto             sampler = makeShared<CScreenSampler>(screen);
    CPreviewRenderer renderer(sampler, 5, 8);

    const auto       FRAME = renderer.render(SScreenPoint{.monitor = 0, .x = 32, .y = 9});
    ASSERT_TRUE(FRAME.has_value());
    EXPECT_EQ(FRAME->width, 40);
    EXPECT_EQ(FRAME->center.hex, "#200940");
    EXPECT_EQ(pixelAt(*FRAME, 20, 20), 0x200940u);
    EXPECT_EQ(pixelAt(*FRAME, 4, 4), 0x1E0740u);

    screen->m_bAlwaysFail = true;
    EXPECT_FALSE(renderer.render(SScreenPoint{.monitor = 0, .x = 32, .y = 9}).has_value());
}
