#pragma once

#include "Types.hpp"

#include <hyprutils/math/Box.hpp>
#include <hyprutils/memory/SharedPtr.hpp>
#include <cstdint>
#include <vector>

using namespace Hyprutils::Math;
using namespace Hyprutils::Memory;

// A rectangle of 8-bit 0xAARRGGBB pixels in device coordinates of one monitor
struct SPixelBlock {
    int                   monitor = -1;
    int                   x       = 0;
    int                   y       = 0;
    int                   width   = 0;
    int                   height  = 0;
    std::vector<uint32_t> pixels;

    bool                  contains(int px, int py) const;
    uint32_t              at(int px, int py) const; // device coordinates, must be inside
};

class IScreenSource {
  public:
    virtual ~IScreenSource() = default;

    // Reads the composited output right now. The result may be smaller than
    // the requested region where it crosses the monitor edge. Fails with
    // PICK_ERROR_CAPTURE_UNAVAILABLE when the compositor won't hand out pixels.
    virtual CPickResult<SPixelBlock> capture(int monitor, const CBox& region) = 0;
};

class CScreenSampler {
  public:
    CScreenSampler(CSharedPointer<IScreenSource> source);

    // radius 0 reads a single pixel
    CPickResult<SColorSample> sample(const SScreenPoint& point, int radius = 0);

    // A full (2 * radius + 1)^2 block centered on point, one capture.
    // Pixels past the monitor edge repeat the closest edge pixel.
    CPickResult<SPixelBlock>  sampleBlock(const SScreenPoint& point, int radius);

    static SColorSample       sampleFromPixel(uint32_t argb, const SScreenPoint& point);
    static SColorSample       centerOf(const SPixelBlock& block);

  private:
    CSharedPointer<IScreenSource> m_pSource;
};
