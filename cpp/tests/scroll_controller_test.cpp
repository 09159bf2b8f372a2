#include <gtest/gtest.h>
#include "composer/view/scroll_controller.h"

using namespace composer;
using namespace composer::view;

namespace {

ViewportState makeViewport(float scrollTopPx) {
    ViewportState v;
    v.lineHeightPx = 20.0f;
    v.visibleLines = 10;
    v.scrollTopPx = scrollTopPx;
    return v;
}

constexpr float kRatio = 0.3f;
constexpr float kNoise = 2.0f;

} // namespace

// =============================================================================
// Scroll target math (20px lines, 10 visible lines, margin 3)
// =============================================================================

TEST(ScrollTargetTest, MarginIsFractionOfVisibleLines) {
    EXPECT_EQ(scrollMarginLines(makeViewport(0.0f), kRatio), 3u);

    ViewportState tiny = makeViewport(0.0f);
    tiny.visibleLines = 2;
    EXPECT_EQ(scrollMarginLines(tiny, kRatio), 0u);
}

TEST(ScrollTargetTest, CaretNearBottomScrollsDown) {
    EXPECT_FLOAT_EQ(computeScrollTarget(9, makeViewport(0.0f), 100, kRatio), 40.0f);
}

TEST(ScrollTargetTest, CaretNearTopScrollsUp) {
    EXPECT_FLOAT_EQ(computeScrollTarget(2, makeViewport(100.0f), 100, kRatio), 0.0f);
    EXPECT_FLOAT_EQ(computeScrollTarget(12, makeViewport(200.0f), 100, kRatio), 180.0f);
}

TEST(ScrollTargetTest, CaretInsideMarginsKeepsOffset) {
    EXPECT_FLOAT_EQ(computeScrollTarget(10, makeViewport(100.0f), 100, kRatio), 100.0f);
}

TEST(ScrollTargetTest, ShortDocumentNeverScrolls) {
    EXPECT_FLOAT_EQ(computeScrollTarget(9, makeViewport(0.0f), 9, kRatio), 0.0f);
}

TEST(ScrollTargetTest, TargetClampedToLastPage) {
    EXPECT_FLOAT_EQ(computeScrollTarget(100, makeViewport(0.0f), 100, kRatio), 1800.0f);
}

TEST(ScrollTargetTest, SmallCorrectionsAreFilteredUnlessForced) {
    const ViewportState v = makeViewport(39.0f);
    EXPECT_FLOAT_EQ(ensureCaretVisible(9, v, 100, false, kRatio, kNoise), 39.0f);
    EXPECT_FLOAT_EQ(ensureCaretVisible(9, v, 100, true, kRatio, kNoise), 40.0f);
}

TEST(ScrollTargetTest, CaretStaysInsideMarginsWhileWalking) {
    const std::uint32_t total = 100;
    const std::int64_t margin = 3;
    const std::int64_t visible = 10;

    ViewportState v = makeViewport(0.0f);
    for (std::uint32_t line = 1; line <= total; ++line) {
        v.scrollTopPx = ensureCaretVisible(line, v, total, false, kRatio, kNoise);
        if (line >= 3 && line <= 97) {
            const std::int64_t top = static_cast<std::int64_t>(v.scrollTopPx / v.lineHeightPx);
            EXPECT_GE(static_cast<std::int64_t>(line) - top, margin) << "down, line " << line;
            EXPECT_GE(top + visible - static_cast<std::int64_t>(line), margin) << "down, line " << line;
        }
    }

    for (std::uint32_t line = total; line >= 1; --line) {
        v.scrollTopPx = ensureCaretVisible(line, v, total, false, kRatio, kNoise);
        if (line >= 3 && line <= 97) {
            const std::int64_t top = static_cast<std::int64_t>(v.scrollTopPx / v.lineHeightPx);
            EXPECT_GE(static_cast<std::int64_t>(line) - top, margin) << "up, line " << line;
            EXPECT_GE(top + visible - static_cast<std::int64_t>(line), margin) << "up, line " << line;
        }
    }
}

// =============================================================================
// ScrollController
// =============================================================================

class ScrollControllerTest : public ::testing::Test {
protected:
    Scheduler scheduler;
    ComposerConfig config;
    int refreshCount = 0;
    ScrollController controller{scheduler, config, [this]() { ++refreshCount; }};

    void SetUp() override {
        controller.resize(200.0f);
    }
};

TEST_F(ScrollControllerTest, ResizeComputesVisibleLines) {
    EXPECT_EQ(controller.viewport().visibleLines, 10u);
    EXPECT_EQ(controller.margin(), 3u);

    controller.resize(0.0f);
    EXPECT_EQ(controller.viewport().visibleLines, 0u);

    controller.resize(95.0f);
    EXPECT_EQ(controller.viewport().visibleLines, 4u);
}

TEST_F(ScrollControllerTest, ProgrammaticScrollIgnoresEchoUntilNextTick) {
    float top = -1.0f;
    ASSERT_TRUE(controller.scrollToCaret(9, 100, false, top));
    EXPECT_FLOAT_EQ(top, 40.0f);
    EXPECT_EQ(controller.source(), ScrollSource::Programmatic);

    EXPECT_FALSE(controller.onScrollEvent(40.0f));
    EXPECT_EQ(controller.source(), ScrollSource::Programmatic);

    scheduler.runDeferred();
    EXPECT_EQ(controller.source(), ScrollSource::None);
    EXPECT_EQ(refreshCount, 0);
}

TEST_F(ScrollControllerTest, NoMoveWhenCaretAlreadyVisible) {
    float top = -1.0f;
    EXPECT_FALSE(controller.scrollToCaret(4, 100, false, top));
    EXPECT_FLOAT_EQ(top, -1.0f);
    EXPECT_EQ(controller.source(), ScrollSource::None);
    EXPECT_EQ(scheduler.pendingDeferredCount(), 0u);

    EXPECT_TRUE(controller.scrollToCaret(4, 100, true, top));
    EXPECT_FLOAT_EQ(top, 0.0f);
}

TEST_F(ScrollControllerTest, UserScrollSettlesThenRefreshesCaret) {
    EXPECT_TRUE(controller.onScrollEvent(80.0f));
    EXPECT_EQ(controller.source(), ScrollSource::User);
    EXPECT_FLOAT_EQ(controller.viewport().scrollTopPx, 80.0f);

    scheduler.advanceBy(30.0);
    EXPECT_TRUE(controller.onScrollEvent(120.0f));  // restarts the settle timer

    scheduler.advanceBy(49.0);
    EXPECT_EQ(refreshCount, 0);

    scheduler.advanceBy(1.0);
    EXPECT_EQ(refreshCount, 1);
    EXPECT_EQ(controller.source(), ScrollSource::None);
}

TEST_F(ScrollControllerTest, WheelOwnsViewportUntilSettled) {
    controller.onWheel();
    EXPECT_EQ(controller.source(), ScrollSource::Wheel);

    EXPECT_FALSE(controller.onScrollEvent(60.0f));
    EXPECT_FLOAT_EQ(controller.viewport().scrollTopPx, 60.0f);

    scheduler.advanceBy(99.0);
    EXPECT_EQ(refreshCount, 0);
    EXPECT_EQ(controller.source(), ScrollSource::Wheel);

    scheduler.advanceBy(1.0);
    EXPECT_EQ(refreshCount, 1);
    EXPECT_EQ(controller.source(), ScrollSource::None);
}

TEST_F(ScrollControllerTest, KeyboardNavigationSuppressesScrollEvents) {
    controller.beginKeyboardNavigation();
    EXPECT_FALSE(controller.onScrollEvent(20.0f));
    controller.endKeyboardNavigation();
    EXPECT_EQ(controller.source(), ScrollSource::None);
    EXPECT_TRUE(controller.onScrollEvent(20.0f));
}

TEST_F(ScrollControllerTest, ResetCancelsSettleTimers) {
    controller.onWheel();
    controller.reset();
    EXPECT_EQ(controller.source(), ScrollSource::None);

    scheduler.advanceBy(500.0);
    EXPECT_EQ(refreshCount, 0);
}
