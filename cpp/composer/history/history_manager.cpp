#include "composer/history/history_manager.h"
#include "composer/core/logging.h"

namespace composer {

HistoryManager::HistoryManager(Scheduler& scheduler, const ComposerConfig& config)
    : config_(config)
    , debounce_(scheduler) {
    history_.push_back(HistoryEntry{});
}

void HistoryManager::reset(const std::string& text, std::uint32_t caretStart, std::uint32_t caretEnd) {
    cancelPending();
    history_.clear();
    history_.push_back(HistoryEntry{text, caretStart, caretEnd});
    cursor_ = 0;
}

bool HistoryManager::push(const std::string& text, std::uint32_t caretStart, std::uint32_t caretEnd, bool isFormatting) {
    const HistoryEntry& cur = history_[cursor_];
    if (cur.text == text) {
        if (!isFormatting || (cur.caretStart == caretStart && cur.caretEnd == caretEnd)) {
            return false;
        }
    }

    if (cursor_ + 1 < history_.size()) {
        history_.erase(history_.begin() + static_cast<std::ptrdiff_t>(cursor_ + 1), history_.end());
    }

    history_.push_back(HistoryEntry{text, caretStart, caretEnd});
    cursor_ = history_.size() - 1;
    return true;
}

void HistoryManager::recordChange(const std::string& text, std::uint32_t caretStart, std::uint32_t caretEnd) {
    const std::string& previous = hasPending_ ? pending_.text : history_[cursor_].text;
    if (previous == text) {
        return;
    }

    const std::size_t prevLen = previous.size();
    std::uint32_t delta = static_cast<std::uint32_t>(text.size() > prevLen ? text.size() - prevLen : prevLen - text.size());
    if (delta == 0) {
        delta = 1;
    }

    pending_ = HistoryEntry{text, caretStart, caretEnd};
    hasPending_ = true;
    charCounter_ += delta;

    if (charCounter_ >= config_.historyCharThreshold) {
        flushPending();
        return;
    }

    debounce_.restart(config_.historyDebounceMs, [this]() {
        flushPending();
    });
}

void HistoryManager::beforeFormatting(const std::string& text, std::uint32_t caretStart, std::uint32_t caretEnd) {
    cancelPending();
    push(text, caretStart, caretEnd, true);
}

bool HistoryManager::flushPending() {
    if (!hasPending_) {
        return false;
    }
    HistoryEntry entry = std::move(pending_);
    cancelPending();
    const bool pushed = push(entry.text, entry.caretStart, entry.caretEnd, false);
    COMPOSER_LOG_DEBUG("HistoryManager: checkpoint %s (size=%zu)", pushed ? "pushed" : "skipped", history_.size());
    return pushed;
}

void HistoryManager::cancelPending() {
    debounce_.cancel();
    hasPending_ = false;
    pending_ = HistoryEntry{};
    charCounter_ = 0;
}

const HistoryEntry* HistoryManager::undo() {
    flushPending();
    if (cursor_ == 0) {
        return nullptr;
    }
    --cursor_;
    return &history_[cursor_];
}

const HistoryEntry* HistoryManager::redo() {
    // Typing after an undo starts a new branch, which leaves nothing to redo.
    flushPending();
    if (cursor_ + 1 >= history_.size()) {
        return nullptr;
    }
    ++cursor_;
    return &history_[cursor_];
}

bool HistoryManager::canUndo() const noexcept {
    if (cursor_ > 0) {
        return true;
    }
    return hasPending_ && pending_.text != history_[cursor_].text;
}

bool HistoryManager::canRedo() const noexcept {
    if (hasPending_ && pending_.text != history_[cursor_].text) {
        return false;
    }
    return cursor_ + 1 < history_.size();
}

} // namespace composer
