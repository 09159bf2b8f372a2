#pragma once

#include "composer/core/composer_config.h"
#include "composer/core/scheduler.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace composer {

struct HistoryEntry {
    std::string text;
    std::uint32_t caretStart = 0;
    std::uint32_t caretEnd = 0;
};

/**
 * HistoryManager: linear undo/redo stack of buffer checkpoints.
 *
 * Typing is coalesced: changes accumulate into a pending checkpoint that is
 * pushed once the character delta reaches the threshold or after the
 * debounce interval. Formatting commands bracket themselves with explicit
 * checkpoints so each one is a single undo step.
 */
class HistoryManager {
public:
    HistoryManager(Scheduler& scheduler, const ComposerConfig& config);

    // Non-copyable
    HistoryManager(const HistoryManager&) = delete;
    HistoryManager& operator=(const HistoryManager&) = delete;

    /**
     * Drop all entries and start over from a single checkpoint.
     */
    void reset(const std::string& text, std::uint32_t caretStart = 0, std::uint32_t caretEnd = 0);

    /**
     * Push a checkpoint, truncating any redo entries.
     * Non-formatting pushes of the current text are skipped.
     * @return True if an entry was added
     */
    bool push(const std::string& text, std::uint32_t caretStart, std::uint32_t caretEnd, bool isFormatting);

    /**
     * Record a user edit through the coalescing rules.
     */
    void recordChange(const std::string& text, std::uint32_t caretStart, std::uint32_t caretEnd);

    /**
     * Checkpoint the state right before a formatting command. Cancels pending coalescing.
     */
    void beforeFormatting(const std::string& text, std::uint32_t caretStart, std::uint32_t caretEnd);

    /**
     * Push the pending coalesced change now.
     * @return True if an entry was added
     */
    bool flushPending();

    /**
     * Step back one checkpoint. Pending typing is pushed first.
     * @return Entry to restore, or nullptr at the oldest entry
     */
    const HistoryEntry* undo();

    /**
     * @return Entry to restore, or nullptr at the newest entry
     */
    const HistoryEntry* redo();

    bool canUndo() const noexcept;
    bool canRedo() const noexcept;
    bool hasPendingChange() const noexcept { return hasPending_; }

    const HistoryEntry& current() const noexcept { return history_[cursor_]; }
    std::size_t getHistorySize() const noexcept { return history_.size(); }
    std::uint32_t pendingCharCount() const noexcept { return charCounter_; }

private:
    void cancelPending();

    const ComposerConfig& config_;
    DebounceTimer debounce_;

    std::vector<HistoryEntry> history_;
    std::size_t cursor_ = 0;

    HistoryEntry pending_;
    bool hasPending_ = false;
    std::uint32_t charCounter_ = 0;
};

} // namespace composer
