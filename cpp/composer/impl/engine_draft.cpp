#include "composer/composer_engine.h"
#include "composer/core/logging.h"
#include "composer/persistence/draft_snapshot.h"

#include <utility>

using composer::ComposerError;
using composer::persistence::DraftData;

std::vector<std::uint8_t> ComposerEngine::saveDraft() const {
    DraftData data;
    data.text = buffer_;
    data.selection = selection_;
    data.preferredLanguage = translator_.state().preferredLanguage;
    return composer::persistence::buildDraftBytes(data);
}

ComposerError ComposerEngine::loadDraft(const std::uint8_t* data, std::size_t size) {
    DraftData draft;
    const ComposerError err = composer::persistence::parseDraft(data, size, draft);
    if (err != ComposerError::Ok) {
        COMPOSER_LOG_WARN("ComposerEngine: draft rejected (%s)", composer::errorName(err));
        return err;
    }

    buffer_ = std::move(draft.text);
    selection_ = composer::commands::normalizeSelection(buffer_, draft.selection.start, draft.selection.end);
    translator_.clear();
    if (!draft.preferredLanguage.empty()) {
        translator_.setPreferredLanguage(draft.preferredLanguage, false);
    }
    history_.reset(buffer_, selection_.start, selection_.end);
    scroll_.reset();

    notifyBufferChanged();
    scheduleCaretUpdate(true);
    return ComposerError::Ok;
}
