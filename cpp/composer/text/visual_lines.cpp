#include "composer/text/visual_lines.h"
#include "composer/core/logging.h"
#include "composer/core/string_utils.h"

#include <cmath>
#include <utility>

namespace composer::text {

VisualLineCalculator::VisualLineCalculator(const MetricsProvider& metrics, FontDescriptor font, float wrapPaddingPx)
    : metrics_(metrics)
    , font_(std::move(font))
    , wrapPaddingPx_(wrapPaddingPx) {}

float VisualLineCalculator::currentWrapWidth() const {
    return metrics_.viewportWidth() - wrapPaddingPx_;
}

std::uint32_t VisualLineCalculator::wrappedLineCount(std::string_view logicalLine, float wrapWidthPx) const {
    if (logicalLine.empty() || !(wrapWidthPx > 0.0f) || !std::isfinite(wrapWidthPx)) {
        return 1;
    }

    float width = 0.0f;
    if (!metrics_.measureWidth(logicalLine, font_, width) || !std::isfinite(width)) {
        COMPOSER_LOG_DEBUG("VisualLineCalculator: measurement failed for %zu bytes", logicalLine.size());
        return 1;
    }
    if (width <= 0.0f) {
        return 1;
    }

    const double lines = std::ceil(static_cast<double>(width) / static_cast<double>(wrapWidthPx));
    return lines < 1.0 ? 1u : static_cast<std::uint32_t>(lines);
}

std::uint32_t VisualLineCalculator::sumWrappedLines(std::string_view text, float wrapWidthPx) const {
    std::uint32_t total = 0;
    for (std::string_view line : splitLines(text)) {
        total += wrappedLineCount(line, wrapWidthPx);
    }
    return total;
}

std::uint32_t VisualLineCalculator::visualLineOf(std::string_view text, std::uint32_t offset, float wrapWidthPx) const {
    const std::uint32_t clamped = clampToCharBoundary(text, offset);
    return sumWrappedLines(text.substr(0, clamped), wrapWidthPx);
}

std::uint32_t VisualLineCalculator::totalVisualLines(std::string_view text, float wrapWidthPx) const {
    return sumWrappedLines(text, wrapWidthPx);
}

CaretInfo VisualLineCalculator::caretInfo(std::string_view text, std::uint32_t offset, float wrapWidthPx) const {
    const std::uint32_t clamped = clampToCharBoundary(text, offset);
    const std::string_view head = text.substr(0, clamped);
    const auto lines = splitLines(head);

    CaretInfo info;
    info.cursorPosition = clamped;
    info.logicalLine = static_cast<std::uint32_t>(lines.size());
    info.column = countCodepoints(lines.back()) + 1;
    info.visualLine = 0;
    for (std::string_view line : lines) {
        info.visualLine += wrappedLineCount(line, wrapWidthPx);
    }
    return info;
}

} // namespace composer::text
