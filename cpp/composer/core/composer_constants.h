#pragma once

/**
 * @file composer_constants.h
 * @brief Default tuning values for the composer engine.
 *
 * Hosts override these through ComposerConfig; the values here are what a
 * default-constructed config carries.
 */

#include <cstdint>

namespace composer_constants {

// =============================================================================
// History coalescing
// =============================================================================

/// Accumulated character delta that forces an immediate checkpoint
constexpr std::uint32_t HISTORY_CHAR_THRESHOLD = 10;

/// Idle time before pending typing is checkpointed
constexpr double HISTORY_DEBOUNCE_MS = 800.0;

// =============================================================================
// Translation
// =============================================================================

/// Idle time after a selection change before the preview translation is requested
constexpr double AUTO_TRANSLATE_DEBOUNCE_MS = 700.0;

constexpr const char* DEFAULT_LANGUAGE = "en";

// =============================================================================
// Viewport / scrolling (screen pixels)
// =============================================================================

constexpr float LINE_HEIGHT_PX = 20.0f;

/// Fraction of the visible lines kept between the caret and the viewport edge
constexpr float SCROLL_MARGIN_RATIO = 0.3f;

/// Scroll deltas at or below this are not applied unless forced
constexpr float SCROLL_NOISE_THRESHOLD_PX = 2.0f;

/// Horizontal padding of the text surface, subtracted from the wrap width
constexpr float WRAP_PADDING_PX = 16.0f;

constexpr double WHEEL_SETTLE_MS = 100.0;
constexpr double SCROLLBAR_SETTLE_MS = 50.0;

// =============================================================================
// Editing
// =============================================================================

constexpr std::uint32_t INDENT_WIDTH = 4;

constexpr float DEFAULT_FONT_SIZE_PX = 14.0f;

} // namespace composer_constants
