#include "composer/view/scroll_controller.h"
#include "composer/core/logging.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace composer::view {

const char* scrollSourceName(ScrollSource source) noexcept {
    switch (source) {
        case ScrollSource::None: return "None";
        case ScrollSource::User: return "User";
        case ScrollSource::Wheel: return "Wheel";
        case ScrollSource::Keyboard: return "Keyboard";
        case ScrollSource::Programmatic: return "Programmatic";
    }
    return "Unknown";
}

std::uint32_t scrollMarginLines(const ViewportState& viewport, float marginRatio) {
    const float margin = std::floor(static_cast<float>(viewport.visibleLines) * marginRatio);
    return margin > 0.0f ? static_cast<std::uint32_t>(margin) : 0u;
}

float computeScrollTarget(
    std::uint32_t visualLine,
    const ViewportState& viewport,
    std::uint32_t totalVisualLines,
    float marginRatio
) {
    if (viewport.lineHeightPx <= 0.0f) {
        return viewport.scrollTopPx;
    }

    const std::int64_t line = visualLine;
    const std::int64_t visible = viewport.visibleLines;
    const std::int64_t total = totalVisualLines;
    const std::int64_t margin = scrollMarginLines(viewport, marginRatio);
    const std::int64_t currentLine = static_cast<std::int64_t>(std::floor(viewport.scrollTopPx / viewport.lineHeightPx));

    std::int64_t targetLine = currentLine;
    if (line - currentLine < margin) {
        targetLine = std::max<std::int64_t>(0, line - margin);
    } else if (currentLine + visible - line < margin) {
        targetLine = std::min(total - visible, line - visible + margin);
        targetLine = std::max<std::int64_t>(0, targetLine);
    } else {
        return viewport.scrollTopPx;
    }

    return static_cast<float>(targetLine) * viewport.lineHeightPx;
}

float ensureCaretVisible(
    std::uint32_t visualLine,
    const ViewportState& viewport,
    std::uint32_t totalVisualLines,
    bool forceScroll,
    float marginRatio,
    float noiseThresholdPx
) {
    const float target = computeScrollTarget(visualLine, viewport, totalVisualLines, marginRatio);
    if (forceScroll || std::fabs(target - viewport.scrollTopPx) > noiseThresholdPx) {
        return target;
    }
    return viewport.scrollTopPx;
}

// =============================================================================
// ScrollController
// =============================================================================

ScrollController::ScrollController(Scheduler& scheduler, const ComposerConfig& config, CaretRefresh refreshCaret)
    : scheduler_(scheduler)
    , config_(config)
    , refreshCaret_(std::move(refreshCaret))
    , wheelTimer_(scheduler)
    , scrollbarTimer_(scheduler) {
    viewport_.lineHeightPx = config_.lineHeightPx;
}

std::uint32_t ScrollController::margin() const {
    return scrollMarginLines(viewport_, config_.scrollMarginRatio);
}

void ScrollController::resize(float viewportHeightPx) {
    viewport_.lineHeightPx = config_.lineHeightPx;
    if (viewport_.lineHeightPx <= 0.0f || !(viewportHeightPx > 0.0f)) {
        viewport_.visibleLines = 0;
        return;
    }
    viewport_.visibleLines = static_cast<std::uint32_t>(std::floor(viewportHeightPx / viewport_.lineHeightPx));
}

bool ScrollController::scrollToCaret(
    std::uint32_t visualLine,
    std::uint32_t totalVisualLines,
    bool forceScroll,
    float& outScrollTopPx
) {
    const float target = ensureCaretVisible(
        visualLine, viewport_, totalVisualLines, forceScroll,
        config_.scrollMarginRatio, config_.scrollNoiseThresholdPx);

    if (!forceScroll && target == viewport_.scrollTopPx) {
        return false;
    }

    viewport_.scrollTopPx = target;
    outScrollTopPx = target;

    // The host echoes a scroll event for this move; ignore it until the next tick.
    source_ = ScrollSource::Programmatic;
    scheduler_.defer([this]() {
        if (source_ == ScrollSource::Programmatic) {
            source_ = ScrollSource::None;
        }
    });
    return true;
}

bool ScrollController::onScrollEvent(float scrollTopPx) {
    viewport_.scrollTopPx = scrollTopPx;

    if (source_ == ScrollSource::Programmatic
        || source_ == ScrollSource::Keyboard
        || source_ == ScrollSource::Wheel) {
        COMPOSER_LOG_DEBUG("ScrollController: scroll event ignored (%s)", scrollSourceName(source_));
        return false;
    }

    source_ = ScrollSource::User;
    scrollbarTimer_.restart(config_.scrollbarSettleMs, [this]() {
        if (source_ == ScrollSource::User) {
            source_ = ScrollSource::None;
        }
        if (refreshCaret_) refreshCaret_();
    });
    return true;
}

void ScrollController::onWheel() {
    source_ = ScrollSource::Wheel;
    scrollbarTimer_.cancel();
    wheelTimer_.restart(config_.wheelSettleMs, [this]() {
        if (source_ == ScrollSource::Wheel) {
            source_ = ScrollSource::None;
        }
        if (refreshCaret_) refreshCaret_();
    });
}

void ScrollController::beginKeyboardNavigation() {
    source_ = ScrollSource::Keyboard;
}

void ScrollController::endKeyboardNavigation() {
    if (source_ == ScrollSource::Keyboard) {
        source_ = ScrollSource::None;
    }
}

void ScrollController::reset() {
    wheelTimer_.cancel();
    scrollbarTimer_.cancel();
    source_ = ScrollSource::None;
}

} // namespace composer::view
