#ifndef LINGUACOACH_COMPOSER_COMMANDS_FORMATTING_H
#define LINGUACOACH_COMPOSER_COMMANDS_FORMATTING_H

#include "composer/core/types.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace composer::commands {

struct EditResult {
    std::string text;
    SelectionRange selection;
};

/**
 * Wrap the selection in prefix/suffix. A collapsed selection inserts both
 * markers and leaves the caret between them; otherwise the wrapped text,
 * markers included, is selected.
 */
EditResult applyMarkdownWrap(
    std::string_view text,
    SelectionRange selection,
    std::string_view prefix,
    std::string_view suffix
);

/**
 * Insert indentWidth spaces at a collapsed caret, or indent every line the
 * selection touches. The indented block is selected, starting after the
 * first line's new indentation.
 */
EditResult indentSelection(std::string_view text, SelectionRange selection, std::uint32_t indentWidth);

/**
 * Clamp both ends to the text, order them and snap them to code point boundaries.
 */
SelectionRange normalizeSelection(std::string_view text, std::uint32_t start, std::uint32_t end);

} // namespace composer::commands

#endif // LINGUACOACH_COMPOSER_COMMANDS_FORMATTING_H
