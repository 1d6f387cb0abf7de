#include "PickMode.hpp"
#include "../debug/Log.hpp"

#include <algorithm>

using namespace std::chrono;

const char* pickStateName(ePickState state) {
    switch (state) {
        case PICK_IDLE: return "idle";
        case PICK_ARMED: return "armed";
        case PICK_SAMPLING: return "sampling";
        case PICK_CONFIRMED: return "confirmed";
        case PICK_CANCELLED: return "cancelled";
    }
    return "unknown";
}

CPickModeEngine::CPickModeEngine(CSharedPointer<IScreenSource> source, ICursorSource* cursor, IPickerSink* sink, const SPickModeConfig& config) :
    m_pCursor(cursor), m_pSink(sink), m_sConfig(config) {
    m_sConfig.tickRate               = std::clamp(m_sConfig.tickRate, PICK_TICK_RATE_MIN, PICK_TICK_RATE_MAX);
    m_sConfig.maxConsecutiveFailures = std::max(1, m_sConfig.maxConsecutiveFailures);

    m_pSampler  = makeShared<CScreenSampler>(source);
    m_pRenderer = makeShared<CPreviewRenderer>(m_pSampler, m_sConfig.previewSize, m_sConfig.magnification);
}

CPickModeEngine::~CPickModeEngine() {
    stop();
}

ePickState CPickModeEngine::state() const {
    return m_eState.load();
}

CFrameChannel<SPreviewFrame>& CPickModeEngine::previews() {
    return m_previews;
}

milliseconds CPickModeEngine::tickPeriod() const {
    return milliseconds(1000 / m_sConfig.tickRate);
}

int CPickModeEngine::previewRadius() const {
    return m_pRenderer->radius();
}

uint64_t CPickModeEngine::loopsStarted() const {
    return m_iLoopsStarted.load();
}

uint64_t CPickModeEngine::framesOverBudget() const {
    return m_iFramesOverBudget.load();
}

bool CPickModeEngine::transition(ePickState from, ePickState to) {
    ePickState expected = from;
    if (!m_eState.compare_exchange_strong(expected, to))
        return false;

    Debug::log(TRACE, "Pick mode: %s -> %s", pickStateName(from), pickStateName(to));
    return true;
}

void CPickModeEngine::wake() {
    // take the lock so a waiter can't miss the change between its check and its sleep
    { std::lock_guard<std::mutex> lg(m_mtWake); }
    m_cvWake.notify_all();
}

bool CPickModeEngine::arm() {
    if (!transition(PICK_IDLE, PICK_ARMED)) {
        Debug::log(TRACE, "Pick mode: arm ignored, already %s", pickStateName(state()));
        return false;
    }

    if (m_pSink)
        m_pSink->onPickArmed();

    std::lock_guard<std::mutex> lg(m_mtThread);

    // a previous loop has already gone idle and is just returning
    if (m_tickThread.joinable()) {
        if (m_tickThread.get_id() == std::this_thread::get_id())
            m_tickThread.detach();
        else
            m_tickThread.join();
    }

    m_previews.clear();
    m_iLoopsStarted++;
    m_tickThread = std::thread([this]() { tickLoop(); });

    return true;
}

bool CPickModeEngine::confirm() {
    if (!transition(PICK_SAMPLING, PICK_CONFIRMED))
        return false;

    wake();
    return true;
}

bool CPickModeEngine::cancel() {
    if (!transition(PICK_SAMPLING, PICK_CANCELLED) && !transition(PICK_ARMED, PICK_CANCELLED))
        return false;

    wake();
    return true;
}

void CPickModeEngine::onHotkey() {
    switch (state()) {
        case PICK_IDLE: arm(); break;
        case PICK_SAMPLING: confirm(); break;
        default: Debug::log(TRACE, "Pick mode: shortcut ignored while %s", pickStateName(state())); break;
    }
}

void CPickModeEngine::stop() {
    cancel();

    std::lock_guard<std::mutex> lg(m_mtThread);
    if (!m_tickThread.joinable())
        return;

    if (m_tickThread.get_id() == std::this_thread::get_id())
        m_tickThread.detach();
    else
        m_tickThread.join();
}

bool CPickModeEngine::waitForIdle(milliseconds timeout) {
    std::unique_lock<std::mutex> lk(m_mtWake);
    return m_cvWake.wait_for(lk, timeout, [this] { return m_eState.load() == PICK_IDLE; });
}

void CPickModeEngine::becomeIdle() {
    m_previews.clear();
    m_eState.store(PICK_IDLE);
    Debug::log(TRACE, "Pick mode: back to idle");
    wake();
}

void CPickModeEngine::tickLoop() {
    // fails when a cancel beat us to it, the check below handles that
    transition(PICK_ARMED, PICK_SAMPLING);

    const auto PERIOD   = tickPeriod();
    int        failures = 0;

    Debug::log(LOG, "Pick mode: sampling every %lldms", (long long)PERIOD.count());

    while (true) {
        const auto STATE = m_eState.load();

        if (STATE == PICK_CONFIRMED) {
            finishConfirmed();
            return;
        }

        if (STATE == PICK_CANCELLED) {
            finishCancelled(std::nullopt);
            return;
        }

        if (STATE != PICK_SAMPLING) {
            Debug::log(ERR, "Pick mode: tick loop found itself %s", pickStateName(STATE));
            becomeIdle();
            return;
        }

        const auto STARTED = steady_clock::now();
        const auto RESULT  = tick(STARTED);

        if (RESULT)
            failures = 0;
        else if (RESULT.error().kind == PICK_ERROR_CAPTURE_UNAVAILABLE || RESULT.error().kind == PICK_ERROR_NO_MONITORS) {
            failures++;
            Debug::log(WARN, "Pick mode: tick skipped (%i/%i): %s", failures, m_sConfig.maxConsecutiveFailures, RESULT.error().message.c_str());

            if (failures >= m_sConfig.maxConsecutiveFailures) {
                if (transition(PICK_SAMPLING, PICK_CANCELLED)) {
                    finishCancelled(RESULT.error());
                    return;
                }

                // a confirm or cancel got in first
                continue;
            }
        } else
            Debug::log(ERR, "Pick mode: tick dropped: %s", RESULT.error().message.c_str());

        // one capture per tick, a slow tick doesn't get made up for
        std::unique_lock<std::mutex> lk(m_mtWake);
        m_cvWake.wait_until(lk, STARTED + PERIOD, [this] { return m_eState.load() != PICK_SAMPLING; });
    }
}

CPickResult<void> CPickModeEngine::tick(steady_clock::time_point started) {
    const auto CURSOR = m_pCursor ? m_pCursor->cursorPosition() : std::nullopt;

    // pointer hasn't shown up on any output yet
    if (!CURSOR)
        return {};

    const auto POINT = CCoordinateMapper::toSamplerSpace(*CURSOR, m_pCursor->monitorLayout());
    if (!POINT)
        return std::unexpected(POINT.error());

    auto frame = m_pRenderer->render(*POINT);
    if (!frame)
        return std::unexpected(frame.error());

    if (steady_clock::now() - started > tickPeriod()) {
        m_iFramesOverBudget++;
        Debug::log(TRACE, "Pick mode: preview took longer than a tick, dropped");
        return {};
    }

    m_previews.publish(std::move(*frame));
    return {};
}

void CPickModeEngine::finishConfirmed() {
    std::optional<SPickError> lastError;

    for (int attempt = 0; attempt < m_sConfig.maxConsecutiveFailures; ++attempt) {
        const auto CURSOR = m_pCursor ? m_pCursor->cursorPosition() : std::nullopt;
        if (!CURSOR) {
            lastError = SPickError{.kind = PICK_ERROR_CAPTURE_UNAVAILABLE, .message = "cursor position unknown"};
            break;
        }

        const auto LAYOUT = m_pCursor->monitorLayout();
        const auto POINT  = CCoordinateMapper::toSamplerSpace(*CURSOR, LAYOUT);
        if (!POINT) {
            lastError = POINT.error();
            break;
        }

        const auto SAMPLE = m_pSampler->sample(*POINT, 0);
        if (!SAMPLE) {
            lastError = SAMPLE.error();
            Debug::log(WARN, "Pick mode: final sample attempt %i failed: %s", attempt + 1, SAMPLE.error().message.c_str());
            continue;
        }

        // the pixel that was read, not where the pointer is
        const auto       POS  = CCoordinateMapper::toGlobalPixel(*POINT, LAYOUT);
        const SColorInfo INFO = {.hex = SAMPLE->hex, .rgb = SAMPLE->rgb, .x = (int)POS.x, .y = (int)POS.y};

        Debug::log(LOG, "Pick mode: picked %s at %i, %i (monitor %i, device %i, %i)", INFO.hex.c_str(), INFO.x, INFO.y, POINT->monitor, POINT->x, POINT->y);

        m_previews.clear();
        if (m_pSink)
            m_pSink->onColorPicked(INFO);

        becomeIdle();
        return;
    }

    Debug::log(ERR, "Pick mode: couldn't take the final sample: %s", lastError ? lastError->message.c_str() : "?");

    m_previews.clear();
    if (m_pSink)
        m_pSink->onPickCancelled(lastError);

    becomeIdle();
}

void CPickModeEngine::finishCancelled(const std::optional<SPickError>& error) {
    if (error)
        Debug::log(ERR, "Pick mode: cancelled, %s: %s", errorKindName(error->kind), error->message.c_str());
    else
        Debug::log(LOG, "Pick mode: cancelled");

    m_previews.clear();
    if (m_pSink)
        m_pSink->onPickCancelled(error);

    becomeIdle();
}
