#include "composer/composer_engine.h"
#include "composer/core/logging.h"
#include "composer/core/util.h"

#include <utility>

using composer::ComposerConfig;
using composer::SelectionRange;

ComposerEngine::ComposerEngine(
    const composer::text::MetricsProvider& metrics,
    composer::TranslationService* translation,
    ComposerConfig config
)
    : config_(std::move(config))
    , metrics_(metrics)
    , visualLines_(metrics, config_.font, config_.wrapPaddingPx)
    , scroll_(scheduler_, config_, [this]() { updateCaretInfo(); })
    , history_(scheduler_, config_)
    , translator_(scheduler_, config_, translation, *this) {
    scroll_.resize(metrics_.viewportHeight());
    updateCaretInfo();
}

ComposerEngine::~ComposerEngine() {
    scheduler_.cancelAll();
}

void ComposerEngine::setTranslationService(composer::TranslationService* service) {
    translator_.setService(service);
}

void ComposerEngine::setConfig(const ComposerConfig& config) {
    config_ = config;
    visualLines_.setFont(config_.font);
    visualLines_.setWrapPadding(config_.wrapPaddingPx);
    scroll_.resize(metrics_.viewportHeight());
    updateCaretInfo();
}

void ComposerEngine::setPreferredLanguage(const std::string& language) {
    translator_.setPreferredLanguage(language, true);
}

std::size_t ComposerEngine::pumpTimers() {
    const double wallMs = emscripten_get_now();
    if (realtimeOrigin_ < 0.0) {
        realtimeOrigin_ = wallMs - scheduler_.now();
    }
    return scheduler_.advanceTo(wallMs - realtimeOrigin_);
}

void ComposerEngine::notifyBufferChanged() {
    if (listener_) {
        listener_->onBufferChanged(buffer_, selection_);
    }
}

// =============================================================================
// SelectionTranslatorSink
// =============================================================================

void ComposerEngine::applyAnnotation(std::uint32_t start, std::uint32_t end, const std::string& replacement) {
    history_.beforeFormatting(buffer_, selection_.start, selection_.end);
    buffer_.replace(start, end - start, replacement);
    const auto caret = static_cast<std::uint32_t>(start + replacement.size());
    selection_ = SelectionRange{caret, caret};
    history_.push(buffer_, selection_.start, selection_.end, true);
    notifyBufferChanged();
    scheduleCaretUpdate(false);
}

void ComposerEngine::translationStateChanged(const composer::SelectionTranslationState& state) {
    if (listener_) {
        listener_->onTranslationStateChanged(state);
    }
}

void ComposerEngine::translationFailed(composer::ComposerError error, const std::string& message) {
    COMPOSER_LOG_WARN("ComposerEngine: %s: %s", composer::errorName(error), message.c_str());
    if (listener_) {
        listener_->onNotification(error, message);
    }
}

void ComposerEngine::preferredLanguageChanged(const std::string& language) {
    if (listener_) {
        listener_->onPreferredLanguageChanged(language);
    }
}
