#pragma once

#include "Coordinates.hpp"
#include "FrameChannel.hpp"
#include "Preview.hpp"
#include "Sampler.hpp"
#include "Types.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <vector>

enum ePickState : uint8_t {
    PICK_IDLE = 0,
    PICK_ARMED,
    PICK_SAMPLING,
    PICK_CONFIRMED,
    PICK_CANCELLED,
};

const char*   pickStateName(ePickState state);

constexpr int PICK_TICK_RATE_DEFAULT        = 30;
constexpr int PICK_TICK_RATE_MIN            = 1;
constexpr int PICK_TICK_RATE_MAX            = 60;
constexpr int PICK_MAX_CONSECUTIVE_FAILURES = 3;

class ICursorSource {
  public:
    virtual ~ICursorSource() = default;

    // global logical position, empty until the pointer has been seen
    virtual std::optional<Vector2D>       cursorPosition() = 0;
    virtual std::vector<SMonitorGeometry> monitorLayout()  = 0;
};

// Engine -> host events. onPickArmed comes from whoever armed, the other two
// from the tick thread.
class IPickerSink {
  public:
    virtual ~IPickerSink() = default;

    // the host should step out of the way, nobody waits for it
    virtual void onPickArmed() = 0;
    virtual void onColorPicked(const SColorInfo& info) = 0;
    // empty error means the user cancelled
    virtual void onPickCancelled(const std::optional<SPickError>& error) = 0;
};

struct SPickModeConfig {
    int tickRate               = PICK_TICK_RATE_DEFAULT;
    int previewSize            = PREVIEW_BLOCK_DEFAULT;
    int magnification          = PREVIEW_MAG_DEFAULT;
    int maxConsecutiveFailures = PICK_MAX_CONSECUTIVE_FAILURES;
};

class CPickModeEngine {
  public:
    CPickModeEngine(CSharedPointer<IScreenSource> source, ICursorSource* cursor, IPickerSink* sink, const SPickModeConfig& config = {});
    ~CPickModeEngine();

    // Idle -> Armed, starts the tick loop. False (and nothing happens) in any other state.
    bool                          arm();
    // Sampling -> Confirmed, the loop takes the final sample
    bool                          confirm();
    // Armed / Sampling -> Cancelled
    bool                          cancel();
    // what the global shortcut does: arm when idle, confirm when sampling
    void                          onHotkey();
    // cancel and wait for the loop to exit
    void                          stop();

    ePickState                    state() const;
    bool                          waitForIdle(std::chrono::milliseconds timeout);

    CFrameChannel<SPreviewFrame>& previews();
    std::chrono::milliseconds     tickPeriod() const;
    // half the preview block, in device pixels
    int                           previewRadius() const;
    uint64_t                      loopsStarted() const;
    uint64_t                      framesOverBudget() const;

  private:
    bool                           transition(ePickState from, ePickState to);
    void                           wake();
    void                           tickLoop();
    CPickResult<void>              tick(std::chrono::steady_clock::time_point started);
    void                           finishConfirmed();
    void                           finishCancelled(const std::optional<SPickError>& error);
    void                           becomeIdle();

    CSharedPointer<CScreenSampler>   m_pSampler;
    CSharedPointer<CPreviewRenderer> m_pRenderer;
    ICursorSource*                   m_pCursor = nullptr;
    IPickerSink*                     m_pSink   = nullptr;
    SPickModeConfig                  m_sConfig;

    std::atomic<ePickState>          m_eState = PICK_IDLE;

    std::mutex                       m_mtThread;
    std::thread                      m_tickThread;

    std::mutex                       m_mtWake;
    std::condition_variable          m_cvWake;

    CFrameChannel<SPreviewFrame>     m_previews;

    std::atomic<uint64_t>            m_iLoopsStarted     = 0;
    std::atomic<uint64_t>            m_iFramesOverBudget = 0;
};
