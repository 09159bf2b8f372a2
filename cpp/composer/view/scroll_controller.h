#ifndef LINGUACOACH_COMPOSER_VIEW_SCROLL_CONTROLLER_H
#define LINGUACOACH_COMPOSER_VIEW_SCROLL_CONTROLLER_H

#include "composer/core/composer_config.h"
#include "composer/core/scheduler.h"

#include <cstdint>
#include <functional>

namespace composer::view {

/**
 * Who moved the viewport most recently. Scroll events that arrive while the
 * engine itself (or a keyboard/wheel gesture) owns the viewport are ignored.
 */
enum class ScrollSource : std::uint8_t {
    None = 0,
    User = 1,
    Wheel = 2,
    Keyboard = 3,
    Programmatic = 4,
};

const char* scrollSourceName(ScrollSource source) noexcept;

struct ViewportState {
    float lineHeightPx = 0.0f;
    std::uint32_t visibleLines = 0;
    float scrollTopPx = 0.0f;
};

/**
 * Margin kept between the caret and the viewport edges, in lines.
 */
std::uint32_t scrollMarginLines(const ViewportState& viewport, float marginRatio);

/**
 * Scroll offset that keeps visualLine at least `margin` lines away from both
 * edges. Documents shorter than the viewport never scroll past line 0.
 */
float computeScrollTarget(
    std::uint32_t visualLine,
    const ViewportState& viewport,
    std::uint32_t totalVisualLines,
    float marginRatio
);

/**
 * Target scroll offset after the noise filter: the current offset is kept
 * when the change is within noiseThresholdPx and forceScroll is false.
 */
float ensureCaretVisible(
    std::uint32_t visualLine,
    const ViewportState& viewport,
    std::uint32_t totalVisualLines,
    bool forceScroll,
    float marginRatio,
    float noiseThresholdPx
);

/**
 * ScrollController: owns the viewport state and the scroll source, and
 * settles wheel/scrollbar gestures before refreshing the caret.
 */
class ScrollController {
public:
    using CaretRefresh = std::function<void()>;

    ScrollController(Scheduler& scheduler, const ComposerConfig& config, CaretRefresh refreshCaret);

    // Non-copyable
    ScrollController(const ScrollController&) = delete;
    ScrollController& operator=(const ScrollController&) = delete;

    /**
     * Recompute visible lines for a new viewport height.
     */
    void resize(float viewportHeightPx);

    /**
     * Scroll so the caret line stays inside the margins.
     * @param outScrollTopPx Receives the applied offset when the call returns true
     * @return True if the viewport moved
     */
    bool scrollToCaret(std::uint32_t visualLine, std::uint32_t totalVisualLines, bool forceScroll, float& outScrollTopPx);

    /**
     * Scroll position reported by the host.
     * @return False if the event was ignored because another source owns the viewport
     */
    bool onScrollEvent(float scrollTopPx);

    void onWheel();

    void beginKeyboardNavigation();
    void endKeyboardNavigation();

    /** Cancel settle timers and return to ScrollSource::None. */
    void reset();

    ScrollSource source() const noexcept { return source_; }
    const ViewportState& viewport() const noexcept { return viewport_; }
    std::uint32_t margin() const;

private:
    Scheduler& scheduler_;
    const ComposerConfig& config_;
    CaretRefresh refreshCaret_;

    ViewportState viewport_{};
    ScrollSource source_ = ScrollSource::None;
    DebounceTimer wheelTimer_;
    DebounceTimer scrollbarTimer_;
};

} // namespace composer::view

#endif // LINGUACOACH_COMPOSER_VIEW_SCROLL_CONTROLLER_H
