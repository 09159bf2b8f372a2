#ifndef LINGUACOACH_COMPOSER_TEXT_METRICS_PROVIDER_H
#define LINGUACOACH_COMPOSER_TEXT_METRICS_PROVIDER_H

#include "composer/core/composer_constants.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace composer::text {

/**
 * FontDescriptor: which face and size a run of text is measured with.
 * fontId 0 selects the provider's default face.
 */
struct FontDescriptor {
    std::string family;
    float sizePx = composer_constants::DEFAULT_FONT_SIZE_PX;
    std::uint32_t fontId = 0;
};

/**
 * MetricsProvider: host-supplied measurement of rendered text and of the
 * visible text surface.
 */
class MetricsProvider {
public:
    virtual ~MetricsProvider() = default;

    /**
     * Measure the rendered width of a single line of text.
     * @param text UTF-8 text without newlines
     * @param font Face and size to measure with
     * @param outWidthPx Receives the width in pixels
     * @return False if the text could not be measured
     */
    virtual bool measureWidth(std::string_view text, const FontDescriptor& font, float& outWidthPx) const = 0;

    virtual float viewportWidth() const = 0;
    virtual float viewportHeight() const = 0;
};

} // namespace composer::text

#endif // LINGUACOACH_COMPOSER_TEXT_METRICS_PROVIDER_H
