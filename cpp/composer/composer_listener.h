#pragma once

#include "composer/core/types.h"
#include "composer/selection/selection_translator.h"

#include <string>

namespace composer {

/**
 * ComposerListener: host-side receiver of engine notifications.
 * Every callback has an empty default so hosts override only what they render.
 */
class ComposerListener {
public:
    virtual ~ComposerListener() = default;

    /** Buffer changed by the engine (formatting, undo/redo, annotation, send, draft load). */
    virtual void onBufferChanged(const std::string& /*text*/, SelectionRange /*selection*/) {}

    virtual void onCaretChanged(const CaretInfo& /*caret*/) {}

    /** The host should move its scroll offset to scrollTopPx. */
    virtual void onScrollRequested(float /*scrollTopPx*/) {}

    virtual void onTranslationStateChanged(const SelectionTranslationState& /*state*/) {}

    /** Non-fatal problem worth showing to the user. */
    virtual void onNotification(ComposerError /*error*/, const std::string& /*message*/) {}

    /**
     * @param asNote True for a note, false for a question about the selection
     */
    virtual void onSend(const std::string& /*text*/, bool /*asNote*/) {}

    /** The preferred language changed and should be persisted. */
    virtual void onPreferredLanguageChanged(const std::string& /*language*/) {}
};

} // namespace composer
