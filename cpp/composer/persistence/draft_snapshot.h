#ifndef LINGUACOACH_COMPOSER_DRAFT_SNAPSHOT_H
#define LINGUACOACH_COMPOSER_DRAFT_SNAPSHOT_H

#include "composer/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace composer::persistence {

static constexpr std::uint32_t draftMagic = 0x5244434C; // "LCDR"
static constexpr std::uint32_t draftVersion = 1;
static constexpr std::size_t draftHeaderBytes = 4 * 4;       // magic + version + sectionCount + reserved
static constexpr std::size_t draftSectionEntryBytes = 4 * 4; // tag + offset + size + crc32

/**
 * Composer state that survives a reload: the unsent text, where the caret
 * was, and the language chosen for translations.
 */
struct DraftData {
    std::uint32_t version = draftVersion;
    std::string text;
    SelectionRange selection{};
    std::string preferredLanguage;
};

/**
 * Layout: header, section table, payloads. Sections are TEXT (required),
 * SELC and LANG (optional), each guarded by a CRC-32.
 */
std::vector<std::uint8_t> buildDraftBytes(const DraftData& data);

/**
 * @return ComposerError::Ok on success; `out` is only complete on success
 */
ComposerError parseDraft(const std::uint8_t* src, std::size_t byteCount, DraftData& out);

} // namespace composer::persistence

#endif // LINGUACOACH_COMPOSER_DRAFT_SNAPSHOT_H
