#include "Screencopy.hpp"
#include "../hyprsnap.hpp"

#include <format>

CScreencopySource::CScreencopySource(SP<CCZwlrScreencopyManagerV1> manager, std::function<void()> wake) : m_pManager(manager), m_wake(wake) {
    ;
}

CScreencopySource::~CScreencopySource() {
    shutdown();
}

CPickResult<SPixelBlock> CScreencopySource::capture(int monitor, const CBox& region) {
    return m_captures.submit(monitor, region, std::chrono::milliseconds(CAPTURE_TIMEOUT_MS), m_wake);
}

void CScreencopySource::shutdown() {
    m_captures.close("screen capture is shutting down");

    if (m_pInFlight)
        finishJob(pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, "screen capture is shutting down"));

    m_vFinished.clear();
}

void CScreencopySource::dispatchPending() {
    m_vFinished.clear();

    // the waiter gave up, stop reading the screen for it
    if (m_pInFlight && m_pInFlight->request->abandoned) {
        Debug::log(TRACE, "Screencopy: dropping an abandoned frame");
        finishJob(pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, "request abandoned"));
    }

    // one frame at a time
    if (m_pInFlight || m_captures.closed())
        return;

    auto next = m_captures.next();
    if (!next)
        return;

    start(std::move(next));
}

void CScreencopySource::finishJob(CPickResult<SPixelBlock> result) {
    if (!m_pInFlight || m_pInFlight->done)
        return;

    m_pInFlight->done = true;
    m_pInFlight->request->finish(std::move(result));
    m_vFinished.emplace_back(std::move(m_pInFlight));

    // there may be another request waiting behind this one
    if (m_wake)
        m_wake();
}

void CScreencopySource::start(std::shared_ptr<SCaptureRequest> request) {
    m_pInFlight          = std::make_unique<SCaptureJob>();
    m_pInFlight->request = std::move(request);

    const auto MONITORID = m_pInFlight->request->monitor;
    const auto PMONITOR  = g_pHyprsnap->monitorFromID(MONITORID);

    if (!m_pManager || !PMONITOR) {
        finishJob(pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, std::format("monitor {} is gone", MONITORID)));
        return;
    }

    const auto GEOMETRY = PMONITOR->geometry();
    const auto SCALE    = GEOMETRY.scale();
    const auto REGION   = m_pInFlight->request->region;

    // screencopy regions are logical, grow the box to whole logical pixels
    const int  LX0 = std::clamp((int)std::floor(REGION.x / SCALE.x), 0, (int)GEOMETRY.logicalSize.x);
    const int  LY0 = std::clamp((int)std::floor(REGION.y / SCALE.y), 0, (int)GEOMETRY.logicalSize.y);
    const int  LX1 = std::clamp((int)std::ceil((REGION.x + REGION.w) / SCALE.x), 0, (int)GEOMETRY.logicalSize.x);
    const int  LY1 = std::clamp((int)std::ceil((REGION.y + REGION.h) / SCALE.y), 0, (int)GEOMETRY.logicalSize.y);

    if (LX1 <= LX0 || LY1 <= LY0) {
        finishJob(pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, std::format("region {} {} {}x{} is outside {}", REGION.x, REGION.y, REGION.w, REGION.h, GEOMETRY.name)));
        return;
    }

    m_pInFlight->origin = {(double)std::lround(LX0 * SCALE.x), (double)std::lround(LY0 * SCALE.y)};

    Debug::log(TRACE, "Screencopy: %s region %i %i %ix%i (logical)", GEOMETRY.name.c_str(), LX0, LY0, LX1 - LX0, LY1 - LY0);

    m_pInFlight->frame = makeShared<CCZwlrScreencopyFrameV1>(m_pManager->sendCaptureOutputRegion(false, PMONITOR->output->resource(), LX0, LY0, LX1 - LX0, LY1 - LY0));

    const auto PJOB = m_pInFlight.get();

    PJOB->frame->setBuffer([this, PJOB](CCZwlrScreencopyFrameV1* r, uint32_t format, uint32_t width, uint32_t height, uint32_t stride) {
        if (PJOB != m_pInFlight.get())
            return;

        PJOB->buffer = makeShared<SPoolBuffer>(Vector2D{(double)width, (double)height}, format, stride);

        if (!PJOB->buffer->good()) {
            finishJob(pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, "couldn't allocate a capture buffer"));
            return;
        }

        PJOB->frame->sendCopy(PJOB->buffer->buffer->resource());
    });

    PJOB->frame->setFlags([this, PJOB](CCZwlrScreencopyFrameV1* r, uint32_t flags) {
        if (PJOB == m_pInFlight.get())
            PJOB->flags = flags;
    });

    PJOB->frame->setReady([this, PJOB](CCZwlrScreencopyFrameV1* r, uint32_t tv_sec_hi, uint32_t tv_sec_lo, uint32_t tv_nsec) {
        if (PJOB != m_pInFlight.get())
            return;

        finishJob(readBuffer(*PJOB));
    });

    PJOB->frame->setFailed([this, PJOB](CCZwlrScreencopyFrameV1* r) {
        if (PJOB != m_pInFlight.get())
            return;

        finishJob(pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, "the compositor failed the screencopy frame"));
    });
}

CPickResult<SPixelBlock> CScreencopySource::readBuffer(const SCaptureJob& job) {
    if (!job.buffer || !job.buffer->good())
        return pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, "frame is ready but has no buffer");

    const auto& BUFFER  = *job.buffer;
    const int   WIDTH   = BUFFER.pixelSize.x;
    const int   HEIGHT  = BUFFER.pixelSize.y;
    const bool  YINVERT = job.flags & ZWLR_SCREENCOPY_FRAME_V1_FLAGS_Y_INVERT;

    SPixelBlock block = {.monitor = job.request->monitor, .x = (int)job.origin.x, .y = (int)job.origin.y, .width = WIDTH, .height = HEIGHT};
    block.pixels.resize((size_t)WIDTH * HEIGHT);

    for (int y = 0; y < HEIGHT; ++y) {
        const uint8_t* row = (const uint8_t*)BUFFER.data + (size_t)(YINVERT ? HEIGHT - 1 - y : y) * BUFFER.stride;
        uint32_t*      dst = block.pixels.data() + (size_t)y * WIDTH;

        switch (BUFFER.format) {
            case WL_SHM_FORMAT_ARGB8888:
            case WL_SHM_FORMAT_XRGB8888: memcpy(dst, row, (size_t)WIDTH * 4); break;
            case WL_SHM_FORMAT_ABGR8888:
            case WL_SHM_FORMAT_XBGR8888: {
                for (int x = 0; x < WIDTH; ++x) {
                    struct SPixel {
                        // little-endian ABGR
                        unsigned char red;
                        unsigned char green;
                        unsigned char blue;
                        unsigned char alpha;
                    }* px = (struct SPixel*)(row + (ptrdiff_t)x * 4);

                    dst[x] = ((uint32_t)px->alpha << 24) | ((uint32_t)px->red << 16) | ((uint32_t)px->green << 8) | px->blue;
                }
            } break;
            case WL_SHM_FORMAT_XRGB2101010:
            case WL_SHM_FORMAT_XBGR2101010: {
                const bool FLIP = BUFFER.format == WL_SHM_FORMAT_XBGR2101010;

                for (int x = 0; x < WIDTH; ++x) {
                    const uint32_t PX = *(const uint32_t*)(row + (ptrdiff_t)x * 4);

                    // conv to 8 bit
                    const uint8_t LOW  = (uint8_t)std::round(255.0 * ((PX & 0b00000000000000000000001111111111) >> 0) / 1023.0);
                    const uint8_t G    = (uint8_t)std::round(255.0 * ((PX & 0b00000000000011111111110000000000) >> 10) / 1023.0);
                    const uint8_t HIGH = (uint8_t)std::round(255.0 * ((PX & 0b00111111111100000000000000000000) >> 20) / 1023.0);

                    const uint8_t R = FLIP ? LOW : HIGH;
                    const uint8_t B = FLIP ? HIGH : LOW;

                    dst[x] = 0xFF000000 | ((uint32_t)R << 16) | ((uint32_t)G << 8) | B;
                }
            } break;
            case WL_SHM_FORMAT_RGB888:
            case WL_SHM_FORMAT_BGR888: {
                const bool FLIP = BUFFER.format == WL_SHM_FORMAT_BGR888;

                for (int x = 0; x < WIDTH; ++x) {
                    struct SPixel3 {
                        // little-endian RGB888, BGR888 has red and blue the other way
                        unsigned char blue;
                        unsigned char green;
                        unsigned char red;
                    }* px = (struct SPixel3*)(row + (ptrdiff_t)x * 3);

                    const uint8_t R = FLIP ? px->blue : px->red;
                    const uint8_t B = FLIP ? px->red : px->blue;

                    dst[x] = 0xFF000000 | ((uint32_t)R << 16) | ((uint32_t)px->green << 8) | B;
                }
            } break;
            default: return pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, std::format("unsupported screencopy format {:#x}", BUFFER.format));
        }
    }

    return block;
}
