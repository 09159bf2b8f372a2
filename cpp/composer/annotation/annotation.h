#ifndef LINGUACOACH_COMPOSER_ANNOTATION_H
#define LINGUACOACH_COMPOSER_ANNOTATION_H

#include <string>
#include <string_view>

namespace composer::annotation {

/// Separates an original line from its translation inside the buffer text
constexpr std::string_view kDelimiter = " :: ";

/// Stands in for '\n' in text sent to the translation service
constexpr std::string_view kLineBreakMarker = "<br/>";

bool isMultiLine(std::string_view text);
bool hasDelimiter(std::string_view text);

/**
 * Left-hand side of an annotated line, or the whole line when it has no delimiter.
 */
std::string_view originalOf(std::string_view line);

/**
 * Keep only the original side of every annotated line. Unannotated lines are unchanged.
 */
std::string extractOriginals(std::string_view text);

/** Replace newlines with the line-break marker. */
std::string encodeForService(std::string_view text);

/**
 * Decode service output: <br>, <br/> and <br /> (plus one trailing space)
 * become '\n', then HTML entities are decoded.
 */
std::string decodeServiceText(std::string_view text);

std::string decodeHtmlEntities(std::string_view text);

/**
 * Pair each line of a selection with the matching line of its translation.
 *
 * Selections that already carry annotations keep their originals and get a
 * fresh right-hand side on every annotated line; their unannotated lines are
 * paired only when both sides are non-blank. Plain selections pair every
 * non-blank line. Blank lines are kept as they are.
 *
 * @param selection Buffer text of the selection
 * @param translation Decoded service output, one line per original line
 */
std::string mergeTranslation(std::string_view selection, std::string_view translation);

} // namespace composer::annotation

#endif // LINGUACOACH_COMPOSER_ANNOTATION_H
