#pragma once

#include "../defines.hpp"

struct SPoolBuffer {
    SPoolBuffer(const Vector2D& size, uint32_t format, uint32_t stride);
    ~SPoolBuffer();

    SP<CCWlBuffer>   buffer  = nullptr;
    cairo_surface_t* surface = nullptr;
    cairo_t*         cairo   = nullptr;
    void*            data    = nullptr;
    size_t           size    = 0;
    std::string      name    = "";

    uint32_t         format = 0;
    uint32_t         stride = 0;
    Vector2D         pixelSize;

    bool             busy = false;

    // false when the shm pool couldn't be set up
    bool             good() const;
};
