#include "PoolBuffer.hpp"
#include "../hyprsnap.hpp"

SPoolBuffer::SPoolBuffer(const Vector2D& size_, uint32_t format_, uint32_t stride_) : format(format_), stride(stride_), pixelSize(size_) {
    const size_t SIZE = (size_t)stride * (size_t)size_.y;

    if (SIZE == 0) {
        Debug::log(ERR, "SPoolBuffer: refusing to create an empty buffer");
        return;
    }

    const auto FD = g_pHyprsnap->createPoolFile(SIZE, name);

    if (FD == -1) {
        Debug::log(ERR, "SPoolBuffer: unable to create pool file");
        return;
    }

    const auto DATA = mmap(nullptr, SIZE, PROT_READ | PROT_WRITE, MAP_SHARED, FD, 0);
    if (DATA == MAP_FAILED) {
        Debug::log(ERR, "SPoolBuffer: mmap of %zu bytes failed: %s", SIZE, strerror(errno));
        close(FD);
        unlink(name.c_str());
        name = "";
        return;
    }

    auto POOL = makeShared<CCWlShmPool>(g_pHyprsnap->m_pSHM->sendCreatePool(FD, SIZE));
    buffer    = makeShared<CCWlBuffer>(POOL->sendCreateBuffer(0, size_.x, size_.y, stride, format));

    buffer->setRelease([this](CCWlBuffer* r) { busy = false; });

    POOL.reset();

    close(FD);

    data = DATA;
    size = SIZE;
}

SPoolBuffer::~SPoolBuffer() {
    buffer.reset();

    if (cairo)
        cairo_destroy(cairo);
    if (surface)
        cairo_surface_destroy(surface);
    if (data)
        munmap(data, size);
    if (!name.empty())
        unlink(name.c_str());
}

bool SPoolBuffer::good() const {
    return buffer && data;
}
