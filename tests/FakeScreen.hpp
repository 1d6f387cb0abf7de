#pragma once

#include "picker/PickMode.hpp"
#include "picker/Sampler.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>
#include <vector>

// An output of width x height device pixels whose content comes from a function
class CFakeScreen : public IScreenSource {
  public:
    CFakeScreen(int width, int height, std::function<uint32_t(int, int)> pixel) : m_iWidth(width), m_iHeight(height), m_pixel(pixel) {
        ;
    }

    virtual CPickResult<SPixelBlock> capture(int monitor, const CBox& region) {
        m_iCaptures++;

        if (m_bAlwaysFail || m_iFailNext > 0) {
            if (m_iFailNext > 0)
                m_iFailNext--;
            return pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, "fake capture failure");
        }

        const int X0 = std::max(0, (int)std::floor(region.x));
        const int Y0 = std::max(0, (int)std::floor(region.y));
        const int X1 = std::min(m_iWidth, (int)std::ceil(region.x + region.w));
        const int Y1 = std::min(m_iHeight, (int)std::ceil(region.y + region.h));

        if (X1 <= X0 || Y1 <= Y0)
            return pickError(PICK_ERROR_CAPTURE_UNAVAILABLE, "region outside the fake screen");

        SPixelBlock block = {.monitor = monitor, .x = X0, .y = Y0, .width = X1 - X0, .height = Y1 - Y0};
        for (int y = Y0; y < Y1; ++y) {
            for (int x = X0; x < X1; ++x) {
                block.pixels.push_back(m_pixel(x, y));
            }
        }

        return block;
    }

    std::atomic<int>  m_iFailNext   = 0;
    std::atomic<bool> m_bAlwaysFail = false;
    std::atomic<int>  m_iCaptures   = 0;

  private:
    int                               m_iWidth  = 0;
    int                               m_iHeight = 0;
    std::function<uint32_t(int, int)> m_pixel;
};

// one 100x100 output at 0,0, scale 1
class CFakeCursor : public ICursorSource {
  public:
    virtual std::optional<Vector2D> cursorPosition() {
        std::lock_guard<std::mutex> lg(m_mutex);
        return m_position;
    }

    virtual std::vector<SMonitorGeometry> monitorLayout() {
        return {SMonitorGeometry{.id = 1, .name = "FAKE-1", .position = {0, 0}, .logicalSize = {100, 100}, .pixelSize = {100, 100}}};
    }

    void moveTo(std::optional<Vector2D> pos) {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_position = pos;
    }

  private:
    std::mutex              m_mutex;
    std::optional<Vector2D> m_position = Vector2D{10.5, 20.5};
};

class CFakeSink : public IPickerSink {
  public:
    virtual void onPickArmed() {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_iArmed++;
    }

    virtual void onColorPicked(const SColorInfo& info) {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_vPicked.push_back(info);
        m_cv.notify_all();
    }

    virtual void onPickCancelled(const std::optional<SPickError>& error) {
        std::lock_guard<std::mutex> lg(m_mutex);
        m_vCancelled.push_back(error);
        m_cv.notify_all();
    }

    // waits for a pick or a cancel
    bool waitForOutcome(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lk(m_mutex);
        return m_cv.wait_for(lk, timeout, [this] { return !m_vPicked.empty() || !m_vCancelled.empty(); });
    }

    std::mutex                             m_mutex;
    std::condition_variable                m_cv;
    int                                    m_iArmed = 0;
    std::vector<SColorInfo>                m_vPicked;
    std::vector<std::optional<SPickError>> m_vCancelled;
};

// 0xFFRRGGBB with r = x, g = y, b = 0x40
inline uint32_t gradientPixel(int x, int y) {
    return 0xFF000000 | ((uint32_t)(x & 0xFF) << 16) | ((uint32_t)(y & 0xFF) << 8) | 0x40;
}
