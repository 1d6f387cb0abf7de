#include "Sampler.hpp"
#include "../debug/Log.hpp"
#include "../helpers/Color.hpp"

#include <algorithm>

bool SPixelBlock::contains(int px, int py) const {
    return px >= x && py >= y && px < x + width && py < y + height && pixels.size() >= (size_t)width * height;
}

uint32_t SPixelBlock::at(int px, int py) const {
    return pixels[(size_t)(py - y) * width + (px - x)];
}

CScreenSampler::CScreenSampler(CSharedPointer<IScreenSource> source) : m_pSource(source) {
    ;
}

SColorSample CScreenSampler::sampleFromPixel(uint32_t argb, const SScreenPoint& point) {
    const auto COL = CColor::fromARGB(argb);
    return SColorSample{.hex = COL.toHex(), .rgb = COL.rgb(), .source = point};
}

SColorSample CScreenSampler::centerOf(const SPixelBlock& block) {
    const int CX = block.x + block.width / 2;
    const int CY = block.y + block.height / 2;
    return sampleFromPixel(block.at(CX, CY), SScreenPoint{.monitor = block.monitor, .x = CX, .y = CY});
}

CPickResult<SPixelBlock> CScreenSampler::sampleBlock(const SScreenPoint& point, int radius) {
    if (radius < 0)
        return pickError(PICK_ERROR_INVALID_ARGUMENT, "negative sample radius");

    if (!m_pSource)
        return pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, "no screen source");

    const int SIZE     = radius * 2 + 1;
    auto      captured = m_pSource->capture(point.monitor, CBox{(double)(point.x - radius), (double)(point.y - radius), (double)SIZE, (double)SIZE});

    if (!captured) {
        Debug::log(TRACE, "sampleBlock: capture at %i, %i on %i failed: %s", point.x, point.y, point.monitor, captured.error().message.c_str());
        return std::unexpected(captured.error());
    }

    if (!captured->contains(point.x, point.y))
        return pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, "capture does not cover the sampled point");

    SPixelBlock block = {.monitor = point.monitor, .x = point.x - radius, .y = point.y - radius, .width = SIZE, .height = SIZE};
    block.pixels.resize((size_t)SIZE * SIZE);

    for (int y = 0; y < SIZE; ++y) {
        const int SRCY = std::clamp(block.y + y, captured->y, captured->y + captured->height - 1);
        for (int x = 0; x < SIZE; ++x) {
            const int SRCX = std::clamp(block.x + x, captured->x, captured->x + captured->width - 1);
            // screen content is opaque, some formats leave garbage in the X channel
            block.pixels[(size_t)y * SIZE + x] = captured->at(SRCX, SRCY) | 0xFF000000;
        }
    }

    return block;
}

CPickResult<SColorSample> CScreenSampler::sample(const SScreenPoint& point, int radius) {
    auto block = sampleBlock(point, radius);

    if (!block)
        return std::unexpected(block.error());

    return centerOf(*block);
}
