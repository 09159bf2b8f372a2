#include "composer/text/shaping_metrics_provider.h"
#include "composer/text/font_manager.h"
#include "composer/core/logging.h"

#include <hb.h>
#include <hb-ft.h>

namespace composer::text {

ShapingMetricsProvider::ShapingMetricsProvider(FontManager& fonts)
    : fonts_(fonts)
    , hbBuffer_(hb_buffer_create()) {}

ShapingMetricsProvider::~ShapingMetricsProvider() {
    if (hbBuffer_) {
        hb_buffer_destroy(hbBuffer_);
        hbBuffer_ = nullptr;
    }
}

void ShapingMetricsProvider::setViewport(float widthPx, float heightPx) {
    viewportWidth_ = widthPx;
    viewportHeight_ = heightPx;
}

std::uint32_t ShapingMetricsProvider::resolveFont(const FontDescriptor& font) const {
    if (font.fontId != 0 && fonts_.hasFont(font.fontId)) {
        return font.fontId;
    }
    return fonts_.findFont(font.family);
}

bool ShapingMetricsProvider::measureWidth(std::string_view text, const FontDescriptor& font, float& outWidthPx) const {
    outWidthPx = 0.0f;
    if (text.empty()) {
        return true;
    }
    if (!hbBuffer_ || !hb_buffer_allocation_successful(hbBuffer_)) {
        return false;
    }

    const std::uint32_t fontId = resolveFont(font);
    const FontFace* face = fonts_.getFont(fontId);
    if (!face || !face->hbFont) {
        COMPOSER_LOG_DEBUG("ShapingMetricsProvider: no font for family '%s'", font.family.c_str());
        return false;
    }
    if (!fonts_.setFontSize(fontId, font.sizePx)) {
        return false;
    }

    hb_buffer_reset(hbBuffer_);
    hb_buffer_add_utf8(hbBuffer_, text.data(), static_cast<int>(text.size()), 0, -1);
    hb_buffer_guess_segment_properties(hbBuffer_);
    hb_shape(face->hbFont, hbBuffer_, nullptr, 0);

    unsigned int glyphCount = 0;
    hb_glyph_position_t* positions = hb_buffer_get_glyph_positions(hbBuffer_, &glyphCount);
    if (!positions && glyphCount > 0) {
        return false;
    }

    // 26.6 fixed point
    hb_position_t advance = 0;
    for (unsigned int i = 0; i < glyphCount; ++i) {
        advance += positions[i].x_advance;
    }
    outWidthPx = static_cast<float>(advance) / 64.0f;
    return true;
}

float ShapingMetricsProvider::lineHeight(const FontDescriptor& font) const {
    const FontMetrics metrics = fonts_.getScaledMetrics(resolveFont(font), font.sizePx);
    return metrics.ascender - metrics.descender + metrics.lineGap;
}

} // namespace composer::text
