#pragma once

#include "composer/commands/formatting.h"
#include "composer/commands/keyboard_dispatcher.h"
#include "composer/composer_listener.h"
#include "composer/core/composer_config.h"
#include "composer/core/scheduler.h"
#include "composer/core/types.h"
#include "composer/history/history_manager.h"
#include "composer/selection/selection_translator.h"
#include "composer/text/metrics_provider.h"
#include "composer/text/visual_lines.h"
#include "composer/translation/translation_service.h"
#include "composer/view/scroll_controller.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

/**
 * ComposerEngine: editing engine behind one composer text surface.
 *
 * Owns the buffer, selection, undo history, viewport state and timers.
 * The metrics provider, translation service and listener are borrowed and
 * must outlive the engine. Everything runs on the caller's thread; the host
 * calls runDeferred() after each event and advanceTime()/tick() to move time.
 */
class ComposerEngine : private composer::SelectionTranslatorSink {
    friend class ComposerEngineTestAccessor;
public:
    ComposerEngine(
        const composer::text::MetricsProvider& metrics,
        composer::TranslationService* translation,
        composer::ComposerConfig config = {}
    );
    ~ComposerEngine() override;

    // Non-copyable
    ComposerEngine(const ComposerEngine&) = delete;
    ComposerEngine& operator=(const ComposerEngine&) = delete;

    void setListener(composer::ComposerListener* listener) { listener_ = listener; }
    void setTranslationService(composer::TranslationService* service);
    void setConfig(const composer::ComposerConfig& config);
    const composer::ComposerConfig& config() const noexcept { return config_; }

    // =========================================================================
    // Host mutation channel
    // =========================================================================

    const std::string& getBuffer() const noexcept { return buffer_; }

    /**
     * Text edited by the host widget. Recorded in history through coalescing;
     * not echoed back through onBufferChanged.
     */
    void setBuffer(const std::string& text);
    void setBuffer(const std::string& text, std::uint32_t selectionStart, std::uint32_t selectionEnd);

    composer::SelectionRange getSelection() const noexcept { return selection_; }

    /** Move the caret/selection without touching the translation state. Offsets are clamped. */
    void setSelection(std::uint32_t start, std::uint32_t end);

    /**
     * Replace [start, end) for hosts without a native text widget.
     * The caret lands after the inserted text.
     */
    void replaceRange(std::uint32_t start, std::uint32_t end, const std::string& text);
    void insertText(const std::string& text);

    // =========================================================================
    // Command surface
    // =========================================================================

    composer::commands::KeyDispatchResult handleKeyDown(const composer::commands::KeyEvent& event);

    /** Selection made by the user; drives the translation state. */
    void handleSelectionChange(std::uint32_t start, std::uint32_t end);

    /** Viewport size changed; re-read it from the metrics provider. */
    void handleResize();

    void handleScroll(float scrollTopPx);
    void handleWheel();

    bool undo();
    bool redo();

    /**
     * @param language Target language, or empty for the preferred one
     * @return False if nothing is selected
     */
    bool translateSelection(const std::string& language);
    void clearSelection();

    void applyMarkdownFormatting(std::string_view prefix, std::string_view suffix);
    void indent();

    /** Remove translations from the selected lines, keeping their originals. */
    bool revertAnnotations();

    /**
     * Hand the buffer to the host as a note and start a fresh draft.
     * @return False if the buffer is blank
     */
    bool sendAsNote();

    /**
     * Hand the selected text to the host as a question.
     * @return False if nothing is selected
     */
    bool sendSelection();

    /** Keyboard navigation is starting; the host performs the caret move. */
    void beginNavigation(composer::commands::Key key, bool shift);

    // =========================================================================
    // Event loop
    // =========================================================================

    std::size_t runDeferred() { return scheduler_.runDeferred(); }
    std::size_t advanceTime(double deltaMs) { return scheduler_.advanceBy(deltaMs); }
    std::size_t tick(double nowMs) { return scheduler_.advanceTo(nowMs); }

    /** Advance to the wall clock; for hosts without their own time source. */
    std::size_t pumpTimers();

    double now() const noexcept { return scheduler_.now(); }

    // =========================================================================
    // Queries
    // =========================================================================

    const composer::CaretInfo& caretInfo() const noexcept { return caret_; }
    std::uint32_t totalVisualLines() const;
    const composer::view::ViewportState& viewport() const noexcept { return scroll_.viewport(); }
    composer::view::ScrollSource scrollSource() const noexcept { return scroll_.source(); }

    const composer::SelectionTranslationState& translationState() const noexcept { return translator_.state(); }
    std::string displayText() const { return translator_.displayText(); }
    const std::string& preferredLanguage() const noexcept { return translator_.state().preferredLanguage; }
    void setPreferredLanguage(const std::string& language);

    bool canUndo() const noexcept { return history_.canUndo(); }
    bool canRedo() const noexcept { return history_.canRedo(); }
    std::size_t historySize() const noexcept { return history_.getHistorySize(); }

    // =========================================================================
    // Draft persistence
    // =========================================================================

    std::vector<std::uint8_t> saveDraft() const;

    /**
     * Restore a saved draft. History restarts from the loaded text.
     * @return ComposerError::Ok, or the decode error with the engine untouched
     */
    composer::ComposerError loadDraft(const std::uint8_t* data, std::size_t size);

private:
    // SelectionTranslatorSink
    const std::string& bufferText() const override { return buffer_; }
    void applyAnnotation(std::uint32_t start, std::uint32_t end, const std::string& replacement) override;
    void translationStateChanged(const composer::SelectionTranslationState& state) override;
    void translationFailed(composer::ComposerError error, const std::string& message) override;
    void preferredLanguageChanged(const std::string& language) override;

    void commitFormatting(composer::commands::EditResult&& result);
    void dropStaleTranslation();
    void restoreEntry(const composer::HistoryEntry& entry);
    void updateCaretInfo();
    void updateCaretAndScroll(bool forceScroll);
    void scheduleCaretUpdate(bool forceScroll);
    void notifyBufferChanged();

    composer::ComposerConfig config_;
    composer::Scheduler scheduler_;
    const composer::text::MetricsProvider& metrics_;
    composer::ComposerListener* listener_ = nullptr;

    std::string buffer_;
    composer::SelectionRange selection_{};
    composer::CaretInfo caret_{};

    composer::text::VisualLineCalculator visualLines_;
    composer::view::ScrollController scroll_;
    composer::HistoryManager history_;
    composer::SelectionTranslator translator_;

    double realtimeOrigin_ = -1.0;
};
