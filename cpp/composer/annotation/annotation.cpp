#include "composer/annotation/annotation.h"
#include "composer/core/string_utils.h"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <vector>

namespace composer::annotation {

namespace {

struct NamedEntity {
    std::string_view name;
    std::uint32_t codepoint;
};

constexpr NamedEntity kNamedEntities[] = {
    {"amp", '&'},
    {"lt", '<'},
    {"gt", '>'},
    {"quot", '"'},
    {"apos", '\''},
    {"nbsp", 0x00A0},
    {"iexcl", 0x00A1},
    {"iquest", 0x00BF},
    {"laquo", 0x00AB},
    {"raquo", 0x00BB},
    {"copy", 0x00A9},
    {"ndash", 0x2013},
    {"mdash", 0x2014},
    {"hellip", 0x2026},
    {"lsquo", 0x2018},
    {"rsquo", 0x2019},
    {"ldquo", 0x201C},
    {"rdquo", 0x201D},
};

bool isSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

char lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
}

// Length of a <br> tag starting at pos (including one trailing space), or 0.
std::size_t matchLineBreakTag(std::string_view text, std::size_t pos) {
    if (pos + 3 > text.size() || text[pos] != '<'
        || lower(text[pos + 1]) != 'b' || lower(text[pos + 2]) != 'r') {
        return 0;
    }
    std::size_t i = pos + 3;
    while (i < text.size() && isSpace(text[i])) ++i;
    if (i < text.size() && text[i] == '/') ++i;
    if (i >= text.size() || text[i] != '>') {
        return 0;
    }
    ++i;
    if (i < text.size() && text[i] == ' ') ++i;
    return i - pos;
}

bool decodeNumericEntity(std::string_view body, std::uint32_t& out) {
    if (body.size() < 2 || body[0] != '#') {
        return false;
    }
    const bool hex = body[1] == 'x' || body[1] == 'X';
    const std::string digits(body.substr(hex ? 2 : 1));
    if (digits.empty() || digits.size() > 8) {
        return false;
    }
    for (char c : digits) {
        const auto uc = static_cast<unsigned char>(c);
        if (hex ? !std::isxdigit(uc) : !std::isdigit(uc)) {
            return false;
        }
    }
    char* end = nullptr;
    const unsigned long value = std::strtoul(digits.c_str(), &end, hex ? 16 : 10);
    if (!end || *end != '\0') {
        return false;
    }
    out = value == 0 ? 0xFFFDu : static_cast<std::uint32_t>(value);
    return true;
}

} // namespace

bool isMultiLine(std::string_view text) {
    return text.find('\n') != std::string_view::npos;
}

bool hasDelimiter(std::string_view text) {
    return text.find(kDelimiter) != std::string_view::npos;
}

std::string_view originalOf(std::string_view line) {
    const std::size_t pos = line.find(kDelimiter);
    return pos == std::string_view::npos ? line : line.substr(0, pos);
}

std::string extractOriginals(std::string_view text) {
    std::vector<std::string> lines;
    for (std::string_view line : splitLines(text)) {
        lines.emplace_back(originalOf(line));
    }
    return joinLines(lines);
}

std::string encodeForService(std::string_view text) {
    std::vector<std::string> lines;
    for (std::string_view line : splitLines(text)) {
        lines.emplace_back(line);
    }
    return joinLines(lines, kLineBreakMarker);
}

std::string decodeHtmlEntities(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        const char c = text[pos];
        if (c != '&') {
            out.push_back(c);
            ++pos;
            continue;
        }

        const std::size_t semi = text.find(';', pos + 1);
        if (semi == std::string_view::npos || semi - pos > 12) {
            out.push_back(c);
            ++pos;
            continue;
        }

        const std::string_view body = text.substr(pos + 1, semi - pos - 1);
        std::uint32_t cp = 0;
        bool decoded = decodeNumericEntity(body, cp);
        if (!decoded) {
            for (const NamedEntity& entity : kNamedEntities) {
                if (entity.name == body) {
                    cp = entity.codepoint;
                    decoded = true;
                    break;
                }
            }
        }

        if (decoded) {
            appendUtf8(out, cp);
            pos = semi + 1;
        } else {
            out.push_back(c);
            ++pos;
        }
    }
    return out;
}

std::string decodeServiceText(std::string_view text) {
    std::string withBreaks;
    withBreaks.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size()) {
        const std::size_t tagLen = matchLineBreakTag(text, pos);
        if (tagLen > 0) {
            withBreaks.push_back('\n');
            pos += tagLen;
        } else {
            withBreaks.push_back(text[pos]);
            ++pos;
        }
    }
    return decodeHtmlEntities(withBreaks);
}

std::string mergeTranslation(std::string_view selection, std::string_view translation) {
    const std::vector<std::string_view> originals = splitLines(selection);
    const std::vector<std::string_view> translated = splitLines(translation);
    const bool reannotate = hasDelimiter(selection);

    std::vector<std::string> merged;
    merged.reserve(originals.size());

    for (std::size_t i = 0; i < originals.size(); ++i) {
        const std::string_view line = originals[i];
        const std::string_view tr = i < translated.size() ? translated[i] : std::string_view{};

        std::string result;
        if (reannotate && hasDelimiter(line)) {
            result.append(originalOf(line));
            result.append(kDelimiter);
            result.append(tr);
        } else if (!isBlank(line) && (!reannotate || !isBlank(tr))) {
            result.append(line);
            result.append(kDelimiter);
            result.append(tr);
        } else {
            result.append(line);
        }
        merged.push_back(std::move(result));
    }
    return joinLines(merged);
}

} // namespace composer::annotation
