#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace composer {

// =============================================================================
// UTF-8 helpers
// =============================================================================

inline std::uint32_t decodeUtf8Codepoint(std::string_view content, std::size_t pos, std::uint32_t& byteLen) {
    const std::size_t n = content.size();
    if (pos >= n) {
        byteLen = 0;
        return 0;
    }

    const unsigned char c0 = static_cast<unsigned char>(content[pos]);
    if ((c0 & 0x80) == 0) {
        byteLen = 1;
        return c0;
    }

    auto continuation = [&](std::size_t i) {
        return (static_cast<unsigned char>(content[i]) & 0xC0) == 0x80;
    };

    if ((c0 & 0xE0) == 0xC0 && pos + 1 < n && continuation(pos + 1)) {
        byteLen = 2;
        return ((c0 & 0x1F) << 6) | (static_cast<unsigned char>(content[pos + 1]) & 0x3F);
    }
    if ((c0 & 0xF0) == 0xE0 && pos + 2 < n && continuation(pos + 1) && continuation(pos + 2)) {
        byteLen = 3;
        return ((c0 & 0x0F) << 12)
            | ((static_cast<unsigned char>(content[pos + 1]) & 0x3F) << 6)
            | (static_cast<unsigned char>(content[pos + 2]) & 0x3F);
    }
    if ((c0 & 0xF8) == 0xF0 && pos + 3 < n
        && continuation(pos + 1) && continuation(pos + 2) && continuation(pos + 3)) {
        byteLen = 4;
        return ((c0 & 0x07) << 18)
            | ((static_cast<unsigned char>(content[pos + 1]) & 0x3F) << 12)
            | ((static_cast<unsigned char>(content[pos + 2]) & 0x3F) << 6)
            | (static_cast<unsigned char>(content[pos + 3]) & 0x3F);
    }

    byteLen = 1;
    return 0xFFFD;
}

inline void appendUtf8(std::string& out, std::uint32_t cp) {
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        cp = 0xFFFD;
    }
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline std::uint32_t countCodepoints(std::string_view content) {
    std::uint32_t count = 0;
    std::size_t pos = 0;
    while (pos < content.size()) {
        std::uint32_t len = 0;
        decodeUtf8Codepoint(content, pos, len);
        if (len == 0) break;
        pos += len;
        ++count;
    }
    return count;
}

/**
 * Clamp a byte offset to [0, size] and move it back onto a code point boundary.
 */
inline std::uint32_t clampToCharBoundary(std::string_view content, std::uint32_t offset) {
    std::size_t pos = offset > content.size() ? content.size() : offset;
    while (pos > 0 && pos < content.size()
           && (static_cast<unsigned char>(content[pos]) & 0xC0) == 0x80) {
        --pos;
    }
    return static_cast<std::uint32_t>(pos);
}

// =============================================================================
// Line helpers
// =============================================================================

inline bool isBlank(std::string_view text) {
    for (char c : text) {
        if (c != ' ' && c != '\t' && c != '\r' && c != '\n' && c != '\f' && c != '\v') {
            return false;
        }
    }
    return true;
}

/**
 * Split on '\n'. Always yields at least one element; a trailing newline yields a trailing empty line.
 */
inline std::vector<std::string_view> splitLines(std::string_view text) {
    std::vector<std::string_view> lines;
    std::size_t begin = 0;
    while (true) {
        const std::size_t nl = text.find('\n', begin);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(begin));
            break;
        }
        lines.push_back(text.substr(begin, nl - begin));
        begin = nl + 1;
    }
    return lines;
}

inline std::string joinLines(const std::vector<std::string>& lines, std::string_view separator = "\n") {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out.append(separator.data(), separator.size());
        out += lines[i];
    }
    return out;
}

} // namespace composer
