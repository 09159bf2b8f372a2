#ifndef LINGUACOACH_COMPOSER_TEXT_CELL_METRICS_PROVIDER_H
#define LINGUACOACH_COMPOSER_TEXT_CELL_METRICS_PROVIDER_H

#include "composer/text/metrics_provider.h"

#include <cstdint>

namespace composer::text {

/**
 * CellMetricsProvider: fixed-advance measurement for terminal hosts.
 * Every code point takes one cell, East Asian wide code points take two.
 */
class CellMetricsProvider : public MetricsProvider {
public:
    CellMetricsProvider(float cellWidthPx, float viewportWidthPx, float viewportHeightPx);

    bool measureWidth(std::string_view text, const FontDescriptor& font, float& outWidthPx) const override;
    float viewportWidth() const override { return viewportWidth_; }
    float viewportHeight() const override { return viewportHeight_; }

    void setViewport(float widthPx, float heightPx);
    void setCellWidth(float cellWidthPx) { cellWidth_ = cellWidthPx; }
    float cellWidth() const { return cellWidth_; }

    static std::uint32_t cellsFor(std::uint32_t codepoint);

private:
    float cellWidth_;
    float viewportWidth_;
    float viewportHeight_;
};

} // namespace composer::text

#endif // LINGUACOACH_COMPOSER_TEXT_CELL_METRICS_PROVIDER_H
