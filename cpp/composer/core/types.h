#ifndef LINGUACOACH_COMPOSER_TYPES_H
#define LINGUACOACH_COMPOSER_TYPES_H

#include <cstdint>

namespace composer {

enum class ComposerError : std::uint32_t {
    Ok = 0,
    InvalidRange = 1,
    InvalidMagic = 2,
    UnsupportedVersion = 3,
    BufferTruncated = 4,
    InvalidPayloadSize = 5,
    TranslationFailed = 6,
    ServiceUnavailable = 7,
};

const char* errorName(ComposerError error) noexcept;

/**
 * Half-open byte range into the buffer. Collapsed when start == end.
 */
struct SelectionRange {
    std::uint32_t start = 0;
    std::uint32_t end = 0;

    bool collapsed() const noexcept { return start == end; }
    std::uint32_t length() const noexcept { return end - start; }
};

inline bool operator==(const SelectionRange& a, const SelectionRange& b) {
    return a.start == b.start && a.end == b.end;
}

inline bool operator!=(const SelectionRange& a, const SelectionRange& b) {
    return !(a == b);
}

/**
 * Caret position derived from buffer + selection. Lines and columns are 1-based.
 */
struct CaretInfo {
    std::uint32_t logicalLine = 1;
    std::uint32_t column = 1;
    std::uint32_t visualLine = 1;
    std::uint32_t cursorPosition = 0;
};

} // namespace composer

#endif // LINGUACOACH_COMPOSER_TYPES_H
