#include "composer/commands/formatting.h"
#include "composer/core/string_utils.h"

#include <utility>

namespace composer::commands {

SelectionRange normalizeSelection(std::string_view text, std::uint32_t start, std::uint32_t end) {
    if (start > end) {
        std::swap(start, end);
    }
    SelectionRange range;
    range.start = clampToCharBoundary(text, start);
    range.end = clampToCharBoundary(text, end);
    return range;
}

EditResult applyMarkdownWrap(
    std::string_view text,
    SelectionRange selection,
    std::string_view prefix,
    std::string_view suffix
) {
    const SelectionRange sel = normalizeSelection(text, selection.start, selection.end);
    const auto prefixLen = static_cast<std::uint32_t>(prefix.size());
    const auto suffixLen = static_cast<std::uint32_t>(suffix.size());

    EditResult result;
    result.text.reserve(text.size() + prefix.size() + suffix.size());
    result.text.append(text.substr(0, sel.start));
    result.text.append(prefix);
    result.text.append(text.substr(sel.start, sel.length()));
    result.text.append(suffix);
    result.text.append(text.substr(sel.end));

    if (sel.collapsed()) {
        result.selection = {sel.start + prefixLen, sel.start + prefixLen};
    } else {
        result.selection = {sel.start, sel.end + prefixLen + suffixLen};
    }
    return result;
}

EditResult indentSelection(std::string_view text, SelectionRange selection, std::uint32_t indentWidth) {
    const SelectionRange sel = normalizeSelection(text, selection.start, selection.end);
    const std::string indent(indentWidth, ' ');

    EditResult result;
    if (sel.collapsed()) {
        result.text.append(text.substr(0, sel.start));
        result.text.append(indent);
        result.text.append(text.substr(sel.start));
        result.selection = {sel.start + indentWidth, sel.start + indentWidth};
        return result;
    }

    std::uint32_t lineStart = 0;
    if (sel.start > 0) {
        const std::size_t nl = text.rfind('\n', sel.start - 1);
        lineStart = nl == std::string_view::npos ? 0u : static_cast<std::uint32_t>(nl + 1);
    }

    std::string indented = indent;
    for (char c : text.substr(lineStart, sel.end - lineStart)) {
        indented.push_back(c);
        if (c == '\n') {
            indented.append(indent);
        }
    }

    result.text.append(text.substr(0, lineStart));
    result.text.append(indented);
    result.text.append(text.substr(sel.end));
    result.selection = {lineStart + indentWidth, lineStart + static_cast<std::uint32_t>(indented.size())};
    return result;
}

} // namespace composer::commands
