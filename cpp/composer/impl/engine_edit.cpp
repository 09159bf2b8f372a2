#include "composer/composer_engine.h"
#include "composer/annotation/annotation.h"
#include "composer/core/string_utils.h"

#include <utility>

using composer::SelectionRange;
using composer::commands::EditResult;
using composer::commands::normalizeSelection;

void ComposerEngine::setBuffer(const std::string& text) {
    buffer_ = text;
    selection_ = normalizeSelection(buffer_, selection_.start, selection_.end);
    history_.recordChange(buffer_, selection_.start, selection_.end);
    dropStaleTranslation();
    scheduleCaretUpdate(false);
}

void ComposerEngine::setBuffer(const std::string& text, std::uint32_t selectionStart, std::uint32_t selectionEnd) {
    buffer_ = text;
    selection_ = normalizeSelection(buffer_, selectionStart, selectionEnd);
    history_.recordChange(buffer_, selection_.start, selection_.end);
    dropStaleTranslation();
    scheduleCaretUpdate(false);
}

void ComposerEngine::setSelection(std::uint32_t start, std::uint32_t end) {
    selection_ = normalizeSelection(buffer_, start, end);
    scheduleCaretUpdate(false);
}

void ComposerEngine::handleSelectionChange(std::uint32_t start, std::uint32_t end) {
    setSelection(start, end);
    translator_.onSelectionChanged(
        selection_.start,
        selection_.end,
        buffer_.substr(selection_.start, selection_.length()));
}

void ComposerEngine::replaceRange(std::uint32_t start, std::uint32_t end, const std::string& text) {
    const SelectionRange range = normalizeSelection(buffer_, start, end);
    buffer_.replace(range.start, range.length(), text);
    const auto caret = static_cast<std::uint32_t>(range.start + text.size());
    selection_ = SelectionRange{caret, caret};
    history_.recordChange(buffer_, selection_.start, selection_.end);
    dropStaleTranslation();
    notifyBufferChanged();
    scheduleCaretUpdate(false);
}

// Host edits that collapse or rewrite the translated selection end its state
// and cancel a pending auto-translate.
void ComposerEngine::dropStaleTranslation() {
    const composer::SelectionTranslationState& state = translator_.state();
    if (!state.hasSelection()) {
        return;
    }
    const bool unchanged = !selection_.collapsed()
        && selection_.start == state.selectionStart
        && selection_.end == state.selectionEnd
        && buffer_.compare(selection_.start, selection_.length(), state.selectedText) == 0;
    if (!unchanged) {
        translator_.clear();
    }
}

void ComposerEngine::insertText(const std::string& text) {
    replaceRange(selection_.start, selection_.end, text);
}

// =============================================================================
// Formatting
// =============================================================================

void ComposerEngine::commitFormatting(EditResult&& result) {
    history_.beforeFormatting(buffer_, selection_.start, selection_.end);
    buffer_ = std::move(result.text);
    selection_ = normalizeSelection(buffer_, result.selection.start, result.selection.end);
    history_.push(buffer_, selection_.start, selection_.end, true);

    // The selected text no longer matches what the translator saw.
    if (translator_.state().hasSelection()) {
        translator_.clear();
    }

    notifyBufferChanged();
    scheduleCaretUpdate(false);
}

void ComposerEngine::applyMarkdownFormatting(std::string_view prefix, std::string_view suffix) {
    commitFormatting(composer::commands::applyMarkdownWrap(buffer_, selection_, prefix, suffix));
}

void ComposerEngine::indent() {
    commitFormatting(composer::commands::indentSelection(buffer_, selection_, config_.indentWidth));
}

bool ComposerEngine::revertAnnotations() {
    if (selection_.collapsed()) {
        return false;
    }

    std::uint32_t lineStart = 0;
    if (selection_.start > 0) {
        const std::size_t nl = buffer_.rfind('\n', selection_.start - 1);
        lineStart = nl == std::string::npos ? 0u : static_cast<std::uint32_t>(nl + 1);
    }
    std::uint32_t lineEnd = selection_.end;
    if (lineEnd > 0 && buffer_[lineEnd - 1] != '\n') {
        const std::size_t nl = buffer_.find('\n', lineEnd);
        lineEnd = nl == std::string::npos ? static_cast<std::uint32_t>(buffer_.size()) : static_cast<std::uint32_t>(nl);
    }

    const std::string_view block(buffer_.data() + lineStart, lineEnd - lineStart);
    if (!composer::annotation::hasDelimiter(block)) {
        return false;
    }
    const std::string reverted = composer::annotation::extractOriginals(block);

    EditResult result;
    result.text = buffer_.substr(0, lineStart) + reverted + buffer_.substr(lineEnd);
    result.selection = SelectionRange{lineStart, lineStart + static_cast<std::uint32_t>(reverted.size())};
    commitFormatting(std::move(result));
    return true;
}

// =============================================================================
// Send
// =============================================================================

bool ComposerEngine::sendAsNote() {
    if (composer::isBlank(buffer_)) {
        return false;
    }

    const std::string note = buffer_;
    buffer_.clear();
    selection_ = SelectionRange{};
    history_.reset(buffer_);
    translator_.clear();
    scroll_.reset();

    if (listener_) {
        listener_->onSend(note, true);
    }
    notifyBufferChanged();
    scheduleCaretUpdate(true);
    return true;
}

bool ComposerEngine::sendSelection() {
    const std::string question = translator_.state().selectedText;
    if (composer::isBlank(question)) {
        return false;
    }

    translator_.clear();
    if (listener_) {
        listener_->onSend(question, false);
    }
    return true;
}

bool ComposerEngine::translateSelection(const std::string& language) {
    return translator_.translateNow(language);
}

void ComposerEngine::clearSelection() {
    translator_.clear();
}
