#include "Monitor.hpp"
#include "../hyprsnap.hpp"

SMonitor::SMonitor(SP<CCWlOutput> output_, uint32_t waylandName) : output(output_), wayland_name(waylandName) {
    output->setGeometry([this](CCWlOutput* r, int32_t x, int32_t y, int32_t width_mm, int32_t height_mm, int32_t subpixel, const char* make, const char* model,
                               int32_t transform_) {
        transform = (wl_output_transform)transform_;

        // compositors without xdg-output still tell us where the output sits
        if (!hasLogicalGeometry)
            logicalPosition = {(double)x, (double)y};
    });
    output->setDone([this](CCWlOutput* r) {
        ready = true;
        g_pHyprsnap->onMonitorsChanged();
    });
    output->setMode([this](CCWlOutput* r, uint32_t flags, int32_t width, int32_t height, int32_t refresh) {
        if (flags & WL_OUTPUT_MODE_CURRENT)
            size = Vector2D(width, height);
    });
    output->setScale([this](CCWlOutput* r, int32_t sc) { scale = sc; });
    output->setName([this](CCWlOutput* r, const char* name_) {
        if (name_)
            name = std::string{name_};
    });
}

SMonitor::~SMonitor() {
    xdgOutput.reset();
    output.reset();
}

void SMonitor::initXDGOutput(SP<CCZxdgOutputManagerV1> manager) {
    if (!manager || xdgOutput)
        return;

    xdgOutput = makeShared<CCZxdgOutputV1>(manager->sendGetXdgOutput(output->resource()));

    xdgOutput->setLogicalPosition([this](CCZxdgOutputV1* r, int32_t x, int32_t y) {
        logicalPosition    = {(double)x, (double)y};
        hasLogicalGeometry = true;
    });
    xdgOutput->setLogicalSize([this](CCZxdgOutputV1* r, int32_t w, int32_t h) {
        logicalSize        = {(double)w, (double)h};
        hasLogicalGeometry = true;
    });
    xdgOutput->setName([this](CCZxdgOutputV1* r, const char* name_) {
        if (name_ && name.empty())
            name = std::string{name_};
    });
}

SMonitorGeometry SMonitor::geometry() const {
    Vector2D pixels = size;

    // the mode is reported before the transform is applied
    if (transform % 2 == 1)
        pixels = {size.y, size.x};

    Vector2D logical = logicalSize;
    if (!hasLogicalGeometry || logical.x <= 0 || logical.y <= 0)
        logical = pixels / std::max(1, scale);

    return SMonitorGeometry{.id = (int)wayland_name, .name = name, .position = logicalPosition, .logicalSize = logical, .pixelSize = pixels};
}
