#ifndef LINGUACOACH_COMPOSER_SELECTION_TRANSLATOR_H
#define LINGUACOACH_COMPOSER_SELECTION_TRANSLATOR_H

#include "composer/core/composer_config.h"
#include "composer/core/scheduler.h"
#include "composer/core/types.h"
#include "composer/translation/translation_service.h"

#include <cstdint>
#include <memory>
#include <string>

namespace composer {

struct SelectionTranslationState {
    std::string selectedText;
    std::string translatedText;
    std::string preferredLanguage;
    bool isTranslating = false;
    std::uint32_t selectionStart = 0;
    std::uint32_t selectionEnd = 0;

    bool hasSelection() const noexcept { return !selectedText.empty(); }
};

/**
 * Receives the effects of selection translation. Implemented by the engine.
 */
class SelectionTranslatorSink {
public:
    virtual ~SelectionTranslatorSink() = default;

    virtual const std::string& bufferText() const = 0;

    /** Replace [start, end) with annotated text as one undo step. */
    virtual void applyAnnotation(std::uint32_t start, std::uint32_t end, const std::string& replacement) = 0;

    virtual void translationStateChanged(const SelectionTranslationState& state) = 0;
    virtual void translationFailed(ComposerError error, const std::string& message) = 0;
    virtual void preferredLanguageChanged(const std::string& language) = 0;
};

/**
 * SelectionTranslator: tracks the current selection, requests debounced
 * preview translations, and merges translations into the buffer as inline
 * " :: " annotations.
 *
 * Every selection change, clear and request bumps a generation counter;
 * responses tagged with an older generation are dropped.
 */
class SelectionTranslator {
public:
    SelectionTranslator(
        Scheduler& scheduler,
        const ComposerConfig& config,
        TranslationService* service,
        SelectionTranslatorSink& sink
    );

    // Non-copyable
    SelectionTranslator(const SelectionTranslator&) = delete;
    SelectionTranslator& operator=(const SelectionTranslator&) = delete;

    /**
     * A collapsed or empty selection clears the state. Single-line, unannotated
     * selections start the auto-translate debounce.
     */
    void onSelectionChanged(std::uint32_t start, std::uint32_t end, const std::string& text);

    /**
     * Translate the current selection immediately.
     * Multi-line or annotated selections are merged into the buffer; anything
     * else becomes a preview in translatedText.
     * @param language Target language; becomes the preferred language when non-empty
     * @return False if there is nothing to translate
     */
    bool translateNow(const std::string& language);

    /** Forget the selection and any preview. The preferred language is kept. */
    void clear();

    /**
     * @param notify Report the change through preferredLanguageChanged
     */
    void setPreferredLanguage(const std::string& language, bool notify);

    void setService(TranslationService* service) { service_ = service; }

    /**
     * Text to show in the preview area: decoded translation, else the selection.
     * Empty for multi-line or annotated text.
     */
    std::string displayText() const;

    const SelectionTranslationState& state() const noexcept { return state_; }
    std::uint64_t generation() const noexcept { return generation_; }
    bool autoTranslatePending() const { return autoTimer_.pending(); }

private:
    enum class Mode : std::uint8_t {
        Preview,
        Merge,
    };

    void request(Mode mode);
    void handleResult(std::uint64_t generation, Mode mode, const TranslationResult& result);
    void notifyState();

    const ComposerConfig& config_;
    TranslationService* service_;
    SelectionTranslatorSink& sink_;
    DebounceTimer autoTimer_;

    SelectionTranslationState state_;
    std::uint64_t generation_ = 0;

    // Expires with this object so late service callbacks become no-ops
    std::shared_ptr<bool> alive_;
};

} // namespace composer

#endif // LINGUACOACH_COMPOSER_SELECTION_TRANSLATOR_H
