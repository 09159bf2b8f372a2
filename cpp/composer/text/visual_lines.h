#ifndef LINGUACOACH_COMPOSER_TEXT_VISUAL_LINES_H
#define LINGUACOACH_COMPOSER_TEXT_VISUAL_LINES_H

#include "composer/core/types.h"
#include "composer/text/metrics_provider.h"

#include <cstdint>
#include <string_view>

namespace composer::text {

/**
 * VisualLineCalculator: maps buffer offsets to wrapped (visual) line numbers.
 *
 * Each logical line occupies max(1, ceil(width / wrapWidth)) visual lines.
 * Results are recomputed on every call; nothing is cached.
 */
class VisualLineCalculator {
public:
    VisualLineCalculator(const MetricsProvider& metrics, FontDescriptor font, float wrapPaddingPx);

    /**
     * Wrap width of the current viewport: viewport width minus horizontal padding.
     */
    float currentWrapWidth() const;

    /**
     * Number of visual lines a single logical line occupies. Never less than 1;
     * a failed measurement or a non-positive wrap width counts as one line.
     */
    std::uint32_t wrappedLineCount(std::string_view logicalLine, float wrapWidthPx) const;

    /**
     * 1-based visual line that contains offset.
     * @param offset Byte offset, clamped to the text
     */
    std::uint32_t visualLineOf(std::string_view text, std::uint32_t offset, float wrapWidthPx) const;

    /** Visual lines in the whole text, at least 1. */
    std::uint32_t totalVisualLines(std::string_view text, float wrapWidthPx) const;

    CaretInfo caretInfo(std::string_view text, std::uint32_t offset, float wrapWidthPx) const;

    void setFont(const FontDescriptor& font) { font_ = font; }
    const FontDescriptor& font() const { return font_; }
    void setWrapPadding(float paddingPx) { wrapPaddingPx_ = paddingPx; }

private:
    std::uint32_t sumWrappedLines(std::string_view text, float wrapWidthPx) const;

    const MetricsProvider& metrics_;
    FontDescriptor font_;
    float wrapPaddingPx_;
};

} // namespace composer::text

#endif // LINGUACOACH_COMPOSER_TEXT_VISUAL_LINES_H
