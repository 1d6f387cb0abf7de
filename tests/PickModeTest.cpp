#include "FakeScreen.hpp"
#include "picker/PickMode.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <barrier>
#include <optional>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

static bool waitForState(CPickModeEngine& engine, ePickState state, std::chrono::milliseconds timeout = 2s) {
    const auto DEADLINE = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < DEADLINE) {
        if (engine.state() == state)
            return true;
        std::this_thread::sleep_for(1ms);
    }
    return engine.state() == state;
}

static uint32_t solidRed(int, int) {
    return 0xFFFF0000;
}

class PickModeTest : public ::testing::Test {
  protected:
    CSharedPointer<CFakeScreen> m_pScreen = makeShared<CFakeScreen>(100, 100, solidRed);
    CFakeCursor                 m_cursor;
    CFakeSink                   m_sink;
};

TEST_F(PickModeTest, ArmIsIdempotent) {
    CPickModeEngine engine(m_pScreen, &m_cursor, &m_sink);

    EXPECT_TRUE(engine.arm());
    EXPECT_FALSE(engine.arm());
    ASSERT_TRUE(waitForState(engine, PICK_SAMPLING));
    EXPECT_FALSE(engine.arm());
    EXPECT_EQ(engine.loopsStarted(), 1u);

    EXPECT_TRUE(engine.cancel());
    EXPECT_TRUE(engine.waitForIdle(2s));
    EXPECT_EQ(m_sink.m_iArmed, 1);
}

TEST_F(PickModeTest, ConcurrentArmStartsOneLoop) {
    constexpr int   THREADS = 8;
    constexpr int   ROUNDS  = 20;
    CPickModeEngine engine(m_pScreen, &m_cursor, &m_sink);

    for (int round = 0; round < ROUNDS; ++round) {
        std::barrier<>           start(THREADS);
        std::atomic<int>         won = 0;
        std::vector<std::thread> threads;

        for (int i = 0; i < THREADS; ++i) {
            threads.emplace_back([&]() {
                start.arrive_and_wait();
                if (engine.arm())
                    won++;
            });
        }

        for (auto& t : threads) {
            t.join();
        }

        EXPECT_EQ(won.load(), 1) << "round " << round;
        EXPECT_EQ(engine.loopsStarted(), (uint64_t)round + 1);

        ASSERT_TRUE(engine.cancel());
        ASSERT_TRUE(engine.waitForIdle(2s));
    }

    std::lock_guard<std::mutex> lg(m_sink.m_mutex);
    EXPECT_EQ(m_sink.m_iArmed, ROUNDS);
    EXPECT_EQ(m_sink.m_vCancelled.size(), (size_t)ROUNDS);
}

TEST_F(PickModeTest, ConfirmReportsTheColorUnderTheCursor) {
    CPickModeEngine engine(m_pScreen, &m_cursor, &m_sink);

    EXPECT_FALSE(engine.confirm());

    ASSERT_TRUE(engine.arm());
    ASSERT_TRUE(waitForState(engine, PICK_SAMPLING));
    ASSERT_TRUE(engine.confirm());
    ASSERT_TRUE(m_sink.waitForOutcome(2s));
    EXPECT_TRUE(engine.waitForIdle(2s));

    std::lock_guard<std::mutex> lg(m_sink.m_mutex);
    ASSERT_EQ(m_sink.m_vPicked.size(), 1u);
    EXPECT_EQ(m_sink.m_vPicked[0].hex, "#FF0000");
    EXPECT_EQ(m_sink.m_vPicked[0].rgb, (RGB{255, 0, 0}));
    EXPECT_EQ(m_sink.m_vPicked[0].x, 10);
    EXPECT_EQ(m_sink.m_vPicked[0].y, 20);
    EXPECT_TRUE(m_sink.m_vCancelled.empty());
}

TEST_F(PickModeTest, PickAndPreviewReportTheSamePixel) {
    auto            screen = makeShared<CFakeScreen>(100, 100, gradientPixel);
    CPickModeEngine engine(screen, &m_cursor, &m_sink);

    // right of the only output, the closest pixel is its last column
    m_cursor.moveTo(Vector2D{150.5, 20.5});

    ASSERT_TRUE(engine.arm());
    ASSERT_TRUE(waitForState(engine, PICK_SAMPLING));

    std::optional<SPreviewFrame> frame;
    const auto                   DEADLINE = std::chrono::steady_clock::now() + 2s;
    while (!frame && std::chrono::steady_clock::now() < DEADLINE) {
        frame = engine.previews().take();
        if (!frame)
            std::this_thread::sleep_for(1ms);
    }

    ASSERT_TRUE(engine.confirm());
    ASSERT_TRUE(m_sink.waitForOutcome(2s));
    EXPECT_TRUE(engine.waitForIdle(2s));
    ASSERT_TRUE(frame.has_value());

    const auto PREVIEWPOS = CCoordinateMapper::toGlobalPixel(frame->center.source, m_cursor.monitorLayout());

    std::lock_guard<std::mutex> lg(m_sink.m_mutex);
    ASSERT_EQ(m_sink.m_vPicked.size(), 1u);
    EXPECT_EQ(m_sink.m_vPicked[0].x, 99);
    EXPECT_EQ(m_sink.m_vPicked[0].y, 20);
    EXPECT_EQ(m_sink.m_vPicked[0].rgb, (RGB{99, 20, 0x40}));
    EXPECT_EQ(m_sink.m_vPicked[0].x, (int)PREVIEWPOS.x);
    EXPECT_EQ(m_sink.m_vPicked[0].y, (int)PREVIEWPOS.y);
}

TEST_F(PickModeTest, CancelDoesNotPick) {
    CPickModeEngine engine(m_pScreen, &m_cursor, &m_sink);

    EXPECT_FALSE(engine.cancel());

    ASSERT_TRUE(engine.arm());
    EXPECT_TRUE(engine.cancel());
    ASSERT_TRUE(m_sink.waitForOutcome(2s));
    EXPECT_TRUE(engine.waitForIdle(2s));

    // a late confirm is ignored
    EXPECT_FALSE(engine.confirm());

    std::lock_guard<std::mutex> lg(m_sink.m_mutex);
    EXPECT_TRUE(m_sink.m_vPicked.empty());
    ASSERT_EQ(m_sink.m_vCancelled.size(), 1u);
    EXPECT_FALSE(m_sink.m_vCancelled[0].has_value());
}

TEST_F(PickModeTest, RepeatedCaptureFailuresCancel) {
    m_pScreen->m_bAlwaysFail = true;
    CPickModeEngine engine(m_pScreen, &m_cursor, &m_sink);

    ASSERT_TRUE(engine.arm());
    ASSERT_TRUE(m_sink.waitForOutcome(3s));
    EXPECT_TRUE(engine.waitForIdle(2s));
    EXPECT_EQ(m_pScreen->m_iCaptures.load(), PICK_MAX_CONSECUTIVE_FAILURES);

    std::lock_guard<std::mutex> lg(m_sink.m_mutex);
    EXPECT_TRUE(m_sink.m_vPicked.empty());
    ASSERT_EQ(m_sink.m_vCancelled.size(), 1u);
    ASSERT_TRUE(m_sink.m_vCancelled[0].has_value());
    EXPECT_EQ(m_sink.m_vCancelled[0]->kind, PICK_ERROR_CAPTURE_UNAVAILABLE);
}

TEST_F(PickModeTest, TransientFailuresAreTolerated) {
    m_pScreen->m_iFailNext = PICK_MAX_CONSECUTIVE_FAILURES - 1;
    CPickModeEngine engine(m_pScreen, &m_cursor, &m_sink);

    ASSERT_TRUE(engine.arm());

    // a preview makes it through once the failures stop
    const auto DEADLINE = std::chrono::steady_clock::now() + 3s;
    while (engine.previews().published() == 0 && std::chrono::steady_clock::now() < DEADLINE) {
        std::this_thread::sleep_for(1ms);
    }
    ASSERT_GT(engine.previews().published(), 0u);
    EXPECT_EQ(engine.state(), PICK_SAMPLING);

    ASSERT_TRUE(engine.confirm());
    ASSERT_TRUE(m_sink.waitForOutcome(2s));

    std::lock_guard<std::mutex> lg(m_sink.m_mutex);
    EXPECT_EQ(m_sink.m_vPicked.size(), 1u);
    EXPECT_TRUE(m_sink.m_vCancelled.empty());
}

TEST_F(PickModeTest, PreviewsFollowTheCursor) {
    CPickModeEngine engine(m_pScreen, &m_cursor, &m_sink, SPickModeConfig{.tickRate = 60, .previewSize = 7, .magnification = 4});
    EXPECT_EQ(engine.previewRadius(), 3);
    EXPECT_EQ(engine.tickPeriod(), 16ms);

    ASSERT_TRUE(engine.arm());

    std::optional<SPreviewFrame> frame;
    const auto                   DEADLINE = std::chrono::steady_clock::now() + 2s;
    while (!frame && std::chrono::steady_clock::now() < DEADLINE) {
        frame = engine.previews().take();
        std::this_thread::sleep_for(1ms);
    }

    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->width, 28);
    EXPECT_EQ(frame->center.hex, "#FF0000");
    EXPECT_EQ(frame->center.source, (SScreenPoint{.monitor = 1, .x = 10, .y = 20}));

    engine.stop();
    EXPECT_EQ(engine.state(), PICK_IDLE);
}

TEST_F(PickModeTest, HotkeyArmsThenConfirms) {
    CPickModeEngine engine(m_pScreen, &m_cursor, &m_sink);

    engine.onHotkey();
    ASSERT_TRUE(waitForState(engine, PICK_SAMPLING));
    engine.onHotkey();

    ASSERT_TRUE(m_sink.waitForOutcome(2s));
    EXPECT_TRUE(engine.waitForIdle(2s));

    std::lock_guard<std::mutex> lg(m_sink.m_mutex);
    EXPECT_EQ(m_sink.m_vPicked.size(), 1u);
}

TEST_F(PickModeTest, ConfirmWithoutACursorReportsAnError) {
    m_cursor.moveTo(std::nullopt);
    CPickModeEngine engine(m_pScreen, &m_cursor, &m_sink);

    ASSERT_TRUE(engine.arm());
    ASSERT_TRUE(waitForState(engine, PICK_SAMPLING));
    ASSERT_TRUE(engine.confirm());
    ASSERT_TRUE(m_sink.waitForOutcome(2s));

    std::lock_guard<std::mutex> lg(m_sink.m_mutex);
    EXPECT_TRUE(m_sink.m_vPicked.empty());
    ASSERT_EQ(m_sink.m_vCancelled.size(), 1u);
    EXPECT_TRUE(m_sink.m_vCancelled[0].has_value());
}

TEST_F(PickModeTest, CanPickAgainAfterwards) {
    CPickModeEngine engine(m_pScreen, &m_cursor, &m_sink);

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(engine.arm());
        ASSERT_TRUE(waitForState(engine, PICK_SAMPLING));
        ASSERT_TRUE(engine.confirm());
        ASSERT_TRUE(engine.waitForIdle(2s));
    }

    EXPECT_EQ(engine.loopsStarted(), 3u);
    std::lock_guard<std::mutex> lg(m_sink.m_mutex);
    EXPECT_EQ(m_sink.m_vPicked.size(), 3u);
}
