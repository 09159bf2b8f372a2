#include "composer/persistence/draft_snapshot.h"
#include "composer/persistence/snapshot_internal.h"
#include "composer/core/util.h"

#include <cstring>
#include <unordered_map>
#include <utility>

namespace {
struct SectionView {
    const std::uint8_t* data{nullptr};
    std::uint32_t size{0};
};
} // namespace

namespace composer::persistence {
using namespace detail;

std::vector<std::uint8_t> buildDraftBytes(const DraftData& data) {
    struct SectionBytes {
        std::uint32_t tag;
        std::vector<std::uint8_t> bytes;
    };

    std::vector<SectionBytes> sections;
    sections.reserve(3);

    sections.push_back(SectionBytes{TAG_TEXT, std::vector<std::uint8_t>(data.text.begin(), data.text.end())});

    {
        SectionBytes sec{TAG_SELC, {}};
        sec.bytes.resize(selectionSectionBytes);
        writeU32LE(sec.bytes.data(), 0, data.selection.start);
        writeU32LE(sec.bytes.data(), 4, data.selection.end);
        sections.push_back(std::move(sec));
    }

    if (!data.preferredLanguage.empty()) {
        sections.push_back(SectionBytes{
            TAG_LANG,
            std::vector<std::uint8_t>(data.preferredLanguage.begin(), data.preferredLanguage.end())});
    }

    const std::size_t tableBytes = sections.size() * draftSectionEntryBytes;
    std::size_t payloadBytes = 0;
    for (const auto& sec : sections) payloadBytes += sec.bytes.size();

    std::vector<std::uint8_t> out(draftHeaderBytes + tableBytes + payloadBytes);
    writeU32LE(out.data(), 0, draftMagic);
    writeU32LE(out.data(), 4, draftVersion);
    writeU32LE(out.data(), 8, static_cast<std::uint32_t>(sections.size()));
    writeU32LE(out.data(), 12, 0);

    std::size_t tableOffset = draftHeaderBytes;
    std::size_t dataOffset = draftHeaderBytes + tableBytes;
    for (const auto& sec : sections) {
        writeU32LE(out.data(), tableOffset + 0, sec.tag);
        writeU32LE(out.data(), tableOffset + 4, static_cast<std::uint32_t>(dataOffset));
        writeU32LE(out.data(), tableOffset + 8, static_cast<std::uint32_t>(sec.bytes.size()));
        writeU32LE(out.data(), tableOffset + 12, crc32(sec.bytes.data(), sec.bytes.size()));
        if (!sec.bytes.empty()) {
            std::memcpy(out.data() + dataOffset, sec.bytes.data(), sec.bytes.size());
        }
        tableOffset += draftSectionEntryBytes;
        dataOffset += sec.bytes.size();
    }
    return out;
}

ComposerError parseDraft(const std::uint8_t* src, std::size_t byteCount, DraftData& out) {
    if (!src || byteCount < draftHeaderBytes) {
        return ComposerError::BufferTruncated;
    }
    if (readU32(src, 0) != draftMagic) return ComposerError::InvalidMagic;

    const std::uint32_t version = readU32(src, 4);
    if (version != draftVersion) return ComposerError::UnsupportedVersion;

    const std::uint32_t sectionCount = readU32(src, 8);
    if (sectionCount > (byteCount - draftHeaderBytes) / draftSectionEntryBytes) {
        return ComposerError::BufferTruncated;
    }
    const std::size_t headerPlusTable = draftHeaderBytes + sectionCount * draftSectionEntryBytes;

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = draftHeaderBytes + i * draftSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(offset, size, end)) return ComposerError::InvalidPayloadSize;
        if (offset < headerPlusTable) return ComposerError::InvalidPayloadSize;
        if (end > byteCount) return ComposerError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        if (crc32(payload, size) != expectedCrc) return ComposerError::InvalidPayloadSize;

        // First occurrence wins; unknown tags are skipped for forward compatibility.
        sections.emplace(tag, SectionView{payload, size});
    }

    const auto findSection = [&](std::uint32_t tag) -> const SectionView* {
        auto it = sections.find(tag);
        return it == sections.end() ? nullptr : &it->second;
    };

    const SectionView* text = findSection(TAG_TEXT);
    if (!text) return ComposerError::InvalidPayloadSize;

    DraftData result;
    result.version = version;
    result.text.assign(reinterpret_cast<const char*>(text->data), text->size);

    if (const SectionView* selc = findSection(TAG_SELC)) {
        if (!requireBytes(0, selectionSectionBytes, selc->size)) return ComposerError::BufferTruncated;
        result.selection.start = readU32(selc->data, 0);
        result.selection.end = readU32(selc->data, 4);
    }

    if (const SectionView* lang = findSection(TAG_LANG)) {
        result.preferredLanguage.assign(reinterpret_cast<const char*>(lang->data), lang->size);
    }

    out = std::move(result);
    return ComposerError::Ok;
}

} // namespace composer::persistence
