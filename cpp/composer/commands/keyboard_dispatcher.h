#ifndef LINGUACOACH_COMPOSER_COMMANDS_KEYBOARD_DISPATCHER_H
#define LINGUACOACH_COMPOSER_COMMANDS_KEYBOARD_DISPATCHER_H

#include <cstdint>

class ComposerEngine;

namespace composer::commands {

enum class Key : std::uint8_t {
    Character = 0,
    Enter,
    Tab,
    Backspace,
    Delete,
    Escape,
    ArrowUp,
    ArrowDown,
    ArrowLeft,
    ArrowRight,
    Home,
    End,
    PageUp,
    PageDown,
    Other,
};

enum class KeyModifier : std::uint32_t {
    None = 0,
    Ctrl = 1 << 0,
    Shift = 1 << 1,
    Alt = 1 << 2,
    Meta = 1 << 3,
};

constexpr std::uint32_t operator|(KeyModifier a, KeyModifier b) {
    return static_cast<std::uint32_t>(a) | static_cast<std::uint32_t>(b);
}

constexpr std::uint32_t operator|(std::uint32_t a, KeyModifier b) {
    return a | static_cast<std::uint32_t>(b);
}

constexpr std::uint32_t modifierBit(KeyModifier m) {
    return static_cast<std::uint32_t>(m);
}

/**
 * A key press as reported by the host. `character` is the Unicode code point
 * for Key::Character and ignored otherwise.
 */
struct KeyEvent {
    Key key = Key::Other;
    char32_t character = 0;
    std::uint32_t modifiers = 0;

    bool has(KeyModifier m) const { return (modifiers & modifierBit(m)) != 0; }
    bool ctrl() const { return has(KeyModifier::Ctrl); }
    bool shift() const { return has(KeyModifier::Shift); }

    static KeyEvent of(Key key, std::uint32_t modifiers = 0) { return KeyEvent{key, 0, modifiers}; }
    static KeyEvent chord(char32_t character, std::uint32_t modifiers) {
        return KeyEvent{Key::Character, character, modifiers};
    }
};

enum class CommandAction : std::uint8_t {
    None = 0,
    Navigate,
    Indent,
    Undo,
    Redo,
    ResetSelection,
    ClearSelection,
    SendAsNote,
    Bold,
    Italic,
    Code,
    TranslateSelection,
};

const char* actionName(CommandAction action) noexcept;

/**
 * One row of the chord table. A binding matches when the key (and, for
 * Key::Character, the case-folded character) is equal, every `required`
 * modifier is held and no `forbidden` modifier is.
 */
struct ChordBinding {
    Key key;
    char32_t character;
    std::uint32_t required;
    std::uint32_t forbidden;
    CommandAction action;
    bool consumes;  // host must suppress its default handling
};

/**
 * First binding that matches the event, in table priority order.
 * @return nullptr if no binding matches
 */
const ChordBinding* resolveChord(const KeyEvent& event);

struct KeyDispatchResult {
    CommandAction action = CommandAction::None;
    bool consumed = false;
};

/**
 * Resolve the chord and run its command on the engine.
 */
KeyDispatchResult dispatchKey(ComposerEngine& engine, const KeyEvent& event);

} // namespace composer::commands

#endif // LINGUACOACH_COMPOSER_COMMANDS_KEYBOARD_DISPATCHER_H
