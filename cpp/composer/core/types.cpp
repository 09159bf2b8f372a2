#include "composer/core/types.h"

namespace composer {

const char* errorName(ComposerError error) noexcept {
    switch (error) {
        case ComposerError::Ok: return "Ok";
        case ComposerError::InvalidRange: return "InvalidRange";
        case ComposerError::InvalidMagic: return "InvalidMagic";
        case ComposerError::UnsupportedVersion: return "UnsupportedVersion";
        case ComposerError::BufferTruncated: return "BufferTruncated";
        case ComposerError::InvalidPayloadSize: return "InvalidPayloadSize";
        case ComposerError::TranslationFailed: return "TranslationFailed";
        case ComposerError::ServiceUnavailable: return "ServiceUnavailable";
    }
    return "Unknown";
}

} // namespace composer
