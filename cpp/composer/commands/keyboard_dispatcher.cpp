#include "composer/commands/keyboard_dispatcher.h"
#include "composer/composer_engine.h"
#include "composer/core/logging.h"

namespace composer::commands {

namespace {

constexpr std::uint32_t kNone = 0;
constexpr std::uint32_t kCtrl = modifierBit(KeyModifier::Ctrl);
constexpr std::uint32_t kCtrlShift = KeyModifier::Ctrl | KeyModifier::Shift;
constexpr std::uint32_t kShiftAlt = KeyModifier::Shift | KeyModifier::Alt;
constexpr std::uint32_t kAlt = modifierBit(KeyModifier::Alt);
constexpr std::uint32_t kCtrlAltMeta = KeyModifier::Ctrl | KeyModifier::Alt | KeyModifier::Meta;

// Priority order: the first matching row wins.
constexpr ChordBinding kChordTable[] = {
    // Navigation: the host moves the caret, the engine follows with the viewport
    {Key::ArrowUp,    0, kNone, kNone, CommandAction::Navigate, false},
    {Key::ArrowDown,  0, kNone, kNone, CommandAction::Navigate, false},
    {Key::ArrowLeft,  0, kNone, kNone, CommandAction::Navigate, false},
    {Key::ArrowRight, 0, kNone, kNone, CommandAction::Navigate, false},
    {Key::Home,       0, kNone, kNone, CommandAction::Navigate, false},
    {Key::End,        0, kNone, kNone, CommandAction::Navigate, false},
    {Key::PageUp,     0, kNone, kNone, CommandAction::Navigate, false},
    {Key::PageDown,   0, kNone, kNone, CommandAction::Navigate, false},

    {Key::Tab, 0, kNone, kCtrlAltMeta, CommandAction::Indent, true},

    {Key::Character, U'z', kCtrl,      kShiftAlt, CommandAction::Undo, true},
    {Key::Character, U'y', kCtrl,      kAlt,      CommandAction::Redo, true},
    {Key::Character, U'z', kCtrlShift, kAlt,      CommandAction::Redo, true},

    {Key::Backspace, 0, kNone, kNone, CommandAction::ResetSelection, false},

    {Key::Character, U'e', kCtrl, kShiftAlt, CommandAction::ClearSelection, true},
    {Key::Enter,     0,    kCtrl, kAlt,      CommandAction::SendAsNote, true},

    {Key::Character, U'b', kCtrl, kShiftAlt, CommandAction::Bold, true},
    {Key::Character, U'i', kCtrl, kShiftAlt, CommandAction::Italic, true},
    {Key::Character, U'k', kCtrl, kShiftAlt, CommandAction::Code, true},

    {Key::Character, U't', kCtrlShift, kAlt, CommandAction::TranslateSelection, true},
};

char32_t foldCase(char32_t c) {
    return (c >= U'A' && c <= U'Z') ? c - U'A' + U'a' : c;
}

} // namespace

const char* actionName(CommandAction action) noexcept {
    switch (action) {
        case CommandAction::None: return "None";
        case CommandAction::Navigate: return "Navigate";
        case CommandAction::Indent: return "Indent";
        case CommandAction::Undo: return "Undo";
        case CommandAction::Redo: return "Redo";
        case CommandAction::ResetSelection: return "ResetSelection";
        case CommandAction::ClearSelection: return "ClearSelection";
        case CommandAction::SendAsNote: return "SendAsNote";
        case CommandAction::Bold: return "Bold";
        case CommandAction::Italic: return "Italic";
        case CommandAction::Code: return "Code";
        case CommandAction::TranslateSelection: return "TranslateSelection";
    }
    return "Unknown";
}

const ChordBinding* resolveChord(const KeyEvent& event) {
    const char32_t character = foldCase(event.character);
    for (const ChordBinding& binding : kChordTable) {
        if (binding.key != event.key) continue;
        if (binding.key == Key::Character && binding.character != character) continue;
        if ((event.modifiers & binding.required) != binding.required) continue;
        if ((event.modifiers & binding.forbidden) != 0) continue;
        return &binding;
    }
    return nullptr;
}

KeyDispatchResult dispatchKey(ComposerEngine& engine, const KeyEvent& event) {
    const ChordBinding* binding = resolveChord(event);
    if (!binding) {
        return {};
    }

    switch (binding->action) {
        case CommandAction::Navigate:
            engine.beginNavigation(event.key, event.shift());
            break;
        case CommandAction::Indent:
            engine.indent();
            break;
        case CommandAction::Undo:
            engine.undo();
            break;
        case CommandAction::Redo:
            engine.redo();
            break;
        case CommandAction::ResetSelection:
        case CommandAction::ClearSelection:
            engine.clearSelection();
            break;
        case CommandAction::SendAsNote:
            engine.sendAsNote();
            break;
        case CommandAction::Bold:
            engine.applyMarkdownFormatting("**", "**");
            break;
        case CommandAction::Italic:
            engine.applyMarkdownFormatting("*", "*");
            break;
        case CommandAction::Code:
            engine.applyMarkdownFormatting("`", "`");
            break;
        case CommandAction::TranslateSelection:
            engine.translateSelection("");
            break;
        case CommandAction::None:
            break;
    }

    COMPOSER_LOG_DEBUG("dispatchKey: %s", actionName(binding->action));
    return KeyDispatchResult{binding->action, binding->consumes};
}

} // namespace composer::commands
