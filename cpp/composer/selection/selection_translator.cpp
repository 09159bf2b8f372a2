#include "composer/selection/selection_translator.h"
#include "composer/annotation/annotation.h"
#include "composer/core/logging.h"
#include "composer/core/string_utils.h"

namespace composer {

SelectionTranslator::SelectionTranslator(
    Scheduler& scheduler,
    const ComposerConfig& config,
    TranslationService* service,
    SelectionTranslatorSink& sink
)
    : config_(config)
    , service_(service)
    , sink_(sink)
    , autoTimer_(scheduler)
    , alive_(std::make_shared<bool>(true)) {
    state_.preferredLanguage = config_.defaultLanguage;
}

void SelectionTranslator::onSelectionChanged(std::uint32_t start, std::uint32_t end, const std::string& text) {
    if (start == end || text.empty()) {
        if (state_.hasSelection() || state_.isTranslating) {
            clear();
        }
        return;
    }

    if (start == state_.selectionStart && end == state_.selectionEnd && text == state_.selectedText) {
        return;
    }

    ++generation_;
    autoTimer_.cancel();
    state_.selectedText = text;
    state_.translatedText.clear();
    state_.isTranslating = false;
    state_.selectionStart = start;
    state_.selectionEnd = end;

    if (!annotation::isMultiLine(text)
        && !annotation::hasDelimiter(text)
        && !state_.preferredLanguage.empty()
        && !isBlank(text)) {
        autoTimer_.restart(config_.autoTranslateDebounceMs, [this]() {
            request(Mode::Preview);
        });
    }

    notifyState();
}

bool SelectionTranslator::translateNow(const std::string& language) {
    if (!language.empty()) {
        setPreferredLanguage(language, true);
    }
    autoTimer_.cancel();

    if (isBlank(state_.selectedText) || state_.preferredLanguage.empty()) {
        return false;
    }

    const bool merge = annotation::isMultiLine(state_.selectedText)
        || annotation::hasDelimiter(state_.selectedText);
    request(merge ? Mode::Merge : Mode::Preview);
    return true;
}

void SelectionTranslator::clear() {
    ++generation_;
    autoTimer_.cancel();
    const std::string language = state_.preferredLanguage;
    state_ = SelectionTranslationState{};
    state_.preferredLanguage = language;
    notifyState();
}

void SelectionTranslator::setPreferredLanguage(const std::string& language, bool notify) {
    if (language == state_.preferredLanguage) {
        return;
    }
    state_.preferredLanguage = language;
    if (notify) {
        sink_.preferredLanguageChanged(language);
    }
}

std::string SelectionTranslator::displayText() const {
    const std::string& source = state_.translatedText.empty() ? state_.selectedText : state_.translatedText;
    if (annotation::isMultiLine(source) || annotation::hasDelimiter(source)) {
        return {};
    }
    return annotation::decodeServiceText(source);
}

void SelectionTranslator::request(Mode mode) {
    const std::uint64_t requestGeneration = ++generation_;

    if (!service_) {
        COMPOSER_LOG_WARN("SelectionTranslator: no translation service");
        sink_.translationFailed(ComposerError::ServiceUnavailable, "translation service unavailable");
        return;
    }

    const std::string source = mode == Mode::Merge
        ? annotation::extractOriginals(state_.selectedText)
        : state_.selectedText;

    state_.isTranslating = true;
    notifyState();

    std::weak_ptr<bool> alive = alive_;
    service_->translate(
        annotation::encodeForService(source),
        state_.preferredLanguage,
        [this, alive, requestGeneration, mode](const TranslationResult& result) {
            if (alive.expired()) {
                return;
            }
            handleResult(requestGeneration, mode, result);
        });
}

void SelectionTranslator::handleResult(std::uint64_t requestGeneration, Mode mode, const TranslationResult& result) {
    if (requestGeneration != generation_) {
        COMPOSER_LOG_DEBUG("SelectionTranslator: dropping stale response (gen %llu, current %llu)",
            static_cast<unsigned long long>(requestGeneration),
            static_cast<unsigned long long>(generation_));
        return;
    }

    state_.isTranslating = false;

    if (!result.ok) {
        COMPOSER_LOG_WARN("SelectionTranslator: translation failed: %s", result.error.c_str());
        notifyState();
        sink_.translationFailed(ComposerError::TranslationFailed, result.error);
        return;
    }

    if (mode == Mode::Preview) {
        state_.translatedText = result.text;
        notifyState();
        return;
    }

    const std::string& buffer = sink_.bufferText();
    const std::uint32_t start = state_.selectionStart;
    const std::uint32_t end = state_.selectionEnd;
    if (end > buffer.size() || start > end
        || buffer.compare(start, end - start, state_.selectedText) != 0) {
        COMPOSER_LOG_WARN("SelectionTranslator: buffer changed under selection [%u, %u), merge dropped", start, end);
        clear();
        return;
    }

    const std::string merged = annotation::mergeTranslation(
        state_.selectedText,
        annotation::decodeServiceText(result.text));
    clear();
    sink_.applyAnnotation(start, end, merged);
}

void SelectionTranslator::notifyState() {
    sink_.translationStateChanged(state_);
}

} // namespace composer
