#include "composer/text/cell_metrics_provider.h"
#include "composer/core/string_utils.h"

namespace composer::text {

CellMetricsProvider::CellMetricsProvider(float cellWidthPx, float viewportWidthPx, float viewportHeightPx)
    : cellWidth_(cellWidthPx)
    , viewportWidth_(viewportWidthPx)
    , viewportHeight_(viewportHeightPx) {}

void CellMetricsProvider::setViewport(float widthPx, float heightPx) {
    viewportWidth_ = widthPx;
    viewportHeight_ = heightPx;
}

std::uint32_t CellMetricsProvider::cellsFor(std::uint32_t cp) {
    if (cp == '\t') return 4;
    // Hangul Jamo, CJK, Hangul syllables, compatibility ideographs, fullwidth forms
    if ((cp >= 0x1100 && cp <= 0x115F)
        || (cp >= 0x2E80 && cp <= 0xA4CF)
        || (cp >= 0xAC00 && cp <= 0xD7A3)
        || (cp >= 0xF900 && cp <= 0xFAFF)
        || (cp >= 0xFF00 && cp <= 0xFF60)
        || (cp >= 0xFFE0 && cp <= 0xFFE6)
        || (cp >= 0x1F300 && cp <= 0x1FAFF)
        || (cp >= 0x20000 && cp <= 0x3FFFD)) {
        return 2;
    }
    return 1;
}

bool CellMetricsProvider::measureWidth(std::string_view text, const FontDescriptor&, float& outWidthPx) const {
    if (cellWidth_ <= 0.0f) {
        return false;
    }
    std::uint32_t cells = 0;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::uint32_t len = 0;
        const std::uint32_t cp = decodeUtf8Codepoint(text, pos, len);
        if (len == 0) break;
        cells += cellsFor(cp);
        pos += len;
    }
    outWidthPx = static_cast<float>(cells) * cellWidth_;
    return true;
}

} // namespace composer::text
