#pragma once

#include "Sampler.hpp"
#include "Types.hpp"

// block edge in source pixels, always odd so there is a true center pixel
constexpr int    PREVIEW_BLOCK_DEFAULT = 15;
constexpr int    PREVIEW_BLOCK_MIN     = 3;
constexpr int    PREVIEW_BLOCK_MAX     = 61;

// display pixels per source pixel
constexpr int    PREVIEW_MAG_DEFAULT = 10;
constexpr int    PREVIEW_MAG_MIN     = 4;
constexpr int    PREVIEW_MAG_MAX     = 40;

constexpr double PREVIEW_GRID_ALPHA = 0.12;

class CPreviewRenderer {
  public:
    CPreviewRenderer(CSharedPointer<CScreenSampler> sampler, int blockSize = PREVIEW_BLOCK_DEFAULT, int magnification = PREVIEW_MAG_DEFAULT);

    // captures the block around center and renders it
    CPickResult<SPreviewFrame> render(const SScreenPoint& center);

    // nearest neighbour upscale + grid + center marker, PNG encoded
    CPickResult<SPreviewFrame> renderBlock(const SPixelBlock& block) const;

    int                        blockSize() const;
    int                        radius() const;
    int                        magnification() const;

  private:
    CSharedPointer<CScreenSampler> m_pSampler;
    int                            m_iBlockSize     = PREVIEW_BLOCK_DEFAULT;
    int                            m_iMagnification = PREVIEW_MAG_DEFAULT;
};
