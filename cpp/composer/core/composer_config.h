#ifndef LINGUACOACH_COMPOSER_CONFIG_H
#define LINGUACOACH_COMPOSER_CONFIG_H

#include "composer/core/composer_constants.h"
#include "composer/text/metrics_provider.h"

#include <cstdint>
#include <string>

namespace composer {

struct ComposerConfig {
    std::uint32_t historyCharThreshold = composer_constants::HISTORY_CHAR_THRESHOLD;
    double historyDebounceMs = composer_constants::HISTORY_DEBOUNCE_MS;
    double autoTranslateDebounceMs = composer_constants::AUTO_TRANSLATE_DEBOUNCE_MS;

    float lineHeightPx = composer_constants::LINE_HEIGHT_PX;
    float scrollMarginRatio = composer_constants::SCROLL_MARGIN_RATIO;
    float scrollNoiseThresholdPx = composer_constants::SCROLL_NOISE_THRESHOLD_PX;
    float wrapPaddingPx = composer_constants::WRAP_PADDING_PX;
    double wheelSettleMs = composer_constants::WHEEL_SETTLE_MS;
    double scrollbarSettleMs = composer_constants::SCROLLBAR_SETTLE_MS;

    std::uint32_t indentWidth = composer_constants::INDENT_WIDTH;
    std::string defaultLanguage = composer_constants::DEFAULT_LANGUAGE;

    text::FontDescriptor font{};
};

} // namespace composer

#endif // LINGUACOACH_COMPOSER_CONFIG_H
