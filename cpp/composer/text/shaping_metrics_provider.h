#ifndef LINGUACOACH_COMPOSER_TEXT_SHAPING_METRICS_PROVIDER_H
#define LINGUACOACH_COMPOSER_TEXT_SHAPING_METRICS_PROVIDER_H

#include "composer/text/metrics_provider.h"

typedef struct hb_buffer_t hb_buffer_t;

namespace composer::text {

class FontManager;

/**
 * ShapingMetricsProvider: measures text by shaping it with HarfBuzz and
 * summing the glyph advances. The viewport size is pushed in by the host.
 */
class ShapingMetricsProvider : public MetricsProvider {
public:
    explicit ShapingMetricsProvider(FontManager& fonts);
    ~ShapingMetricsProvider() override;

    // Non-copyable
    ShapingMetricsProvider(const ShapingMetricsProvider&) = delete;
    ShapingMetricsProvider& operator=(const ShapingMetricsProvider&) = delete;

    bool measureWidth(std::string_view text, const FontDescriptor& font, float& outWidthPx) const override;
    float viewportWidth() const override { return viewportWidth_; }
    float viewportHeight() const override { return viewportHeight_; }

    void setViewport(float widthPx, float heightPx);

    /**
     * Natural line height (ascent + descent + gap) of a font, in pixels.
     */
    float lineHeight(const FontDescriptor& font) const;

private:
    std::uint32_t resolveFont(const FontDescriptor& font) const;

    FontManager& fonts_;
    hb_buffer_t* hbBuffer_ = nullptr;
    float viewportWidth_ = 0.0f;
    float viewportHeight_ = 0.0f;
};

} // namespace composer::text

#endif // LINGUACOACH_COMPOSER_TEXT_SHAPING_METRICS_PROVIDER_H
