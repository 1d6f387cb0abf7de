#pragma once

#include "../includes.hpp"
#include "../picker/Coordinates.hpp"

class CLayerSurface;

struct SMonitor {
    SMonitor(SP<CCWlOutput> output_, uint32_t waylandName);
    ~SMonitor();

    void                 initXDGOutput(SP<CCZxdgOutputManagerV1> manager);

    // what the mapper and the capture service work with
    SMonitorGeometry     geometry() const;

    std::string          name = "";
    SP<CCWlOutput>       output;
    SP<CCZxdgOutputV1>   xdgOutput;
    uint32_t             wayland_name = 0;

    Vector2D             size; // current mode, untransformed
    int                  scale     = 1;
    wl_output_transform  transform = WL_OUTPUT_TRANSFORM_NORMAL;

    Vector2D             logicalPosition;
    Vector2D             logicalSize;
    bool                 hasLogicalGeometry = false;

    bool                 ready = false;

    CLayerSurface*       pLS = nullptr;
};
