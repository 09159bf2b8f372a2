#include "composer/composer_engine.h"
#include "composer/core/logging.h"

using composer::SelectionRange;
using composer::commands::Key;

std::uint32_t ComposerEngine::totalVisualLines() const {
    return visualLines_.totalVisualLines(buffer_, visualLines_.currentWrapWidth());
}

void ComposerEngine::updateCaretInfo() {
    caret_ = visualLines_.caretInfo(buffer_, selection_.start, visualLines_.currentWrapWidth());
    if (listener_) {
        listener_->onCaretChanged(caret_);
    }
}

void ComposerEngine::updateCaretAndScroll(bool forceScroll) {
    updateCaretInfo();

    float scrollTop = 0.0f;
    if (scroll_.scrollToCaret(caret_.visualLine, totalVisualLines(), forceScroll, scrollTop)) {
        COMPOSER_LOG_DEBUG("ComposerEngine: scroll to %.1f (line %u)", scrollTop, caret_.visualLine);
        if (listener_) {
            listener_->onScrollRequested(scrollTop);
        }
    }
}

void ComposerEngine::scheduleCaretUpdate(bool forceScroll) {
    scheduler_.defer([this, forceScroll]() {
        updateCaretAndScroll(forceScroll);
    });
}

void ComposerEngine::handleResize() {
    scroll_.resize(metrics_.viewportHeight());
    updateCaretAndScroll(false);
}

void ComposerEngine::handleScroll(float scrollTopPx) {
    scroll_.onScrollEvent(scrollTopPx);
}

void ComposerEngine::handleWheel() {
    scroll_.onWheel();
}

void ComposerEngine::beginNavigation(Key key, bool shift) {
    scroll_.beginKeyboardNavigation();

    const bool vertical = key == Key::ArrowUp || key == Key::ArrowDown;
    if (vertical && !shift) {
        translator_.clear();
    }

    const std::uint32_t before = selection_.start;
    scheduler_.defer([this, vertical, before]() {
        if (!vertical || selection_.start != before) {
            updateCaretAndScroll(true);
        }
        scroll_.endKeyboardNavigation();
    });
}

composer::commands::KeyDispatchResult ComposerEngine::handleKeyDown(const composer::commands::KeyEvent& event) {
    return composer::commands::dispatchKey(*this, event);
}

// =============================================================================
// Undo / redo
// =============================================================================

void ComposerEngine::restoreEntry(const composer::HistoryEntry& entry) {
    buffer_ = entry.text;
    selection_ = composer::commands::normalizeSelection(buffer_, entry.caretStart, entry.caretEnd);
    if (translator_.state().hasSelection()) {
        translator_.clear();
    }
    notifyBufferChanged();
    // Selection and viewport settle after the host has re-rendered the text.
    scheduleCaretUpdate(true);
}

bool ComposerEngine::undo() {
    const composer::HistoryEntry* entry = history_.undo();
    if (!entry) {
        return false;
    }
    restoreEntry(*entry);
    return true;
}

bool ComposerEngine::redo() {
    const composer::HistoryEntry* entry = history_.redo();
    if (!entry) {
        return false;
    }
    restoreEntry(*entry);
    return true;
}
