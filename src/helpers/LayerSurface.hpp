#pragma once

#include "../defines.hpp"
#include "PoolBuffer.hpp"

// Transparent full-output overlay, alive only while a pick is running. It takes
// pointer and keyboard focus and draws the latest preview next to the cursor.
class CLayerSurface {
  public:
    CLayerSurface(SMonitor*);
    ~CLayerSurface();

    SMonitor*                      m_pMonitor = nullptr;

    SP<CCZwlrLayerSurfaceV1>       pLayerSurface    = nullptr;
    SP<CCWlSurface>                pSurface         = nullptr;
    SP<CCWpFractionalScaleV1>      pFractionalScale = nullptr;
    SP<CCWpViewport>               pViewport        = nullptr;

    bool                           wantsACK    = false;
    bool                           wantsReload = false;
    uint32_t                       ACKSerial   = 0;
    bool                           configured  = false;

    Vector2D                       logicalSize;
    double                         fractionalScale = 1.0;

    std::array<SP<SPoolBuffer>, 2> buffers;

    bool                           dirty    = true;
    bool                           rendered = false;

    SP<CCWlCallback>               frameCallback = nullptr;

    void                           markDirty();
    void                           sendFrame(SP<SPoolBuffer> buffer);

    // buffer pixels per logical pixel
    double                         bufferScale() const;
};
