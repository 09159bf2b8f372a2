#include "composer/text/font_manager.h"
#include "composer/core/logging.h"

#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_TRUETYPE_TABLES_H

#include <hb.h>
#include <hb-ft.h>

#include <fstream>

namespace composer::text {

FontManager::FontManager() = default;

FontManager::~FontManager() {
    shutdown();
}

bool FontManager::initialize() {
    if (initialized_) {
        return true;
    }

    FT_Error error = FT_Init_FreeType(&ftLibrary_);
    if (error) {
        COMPOSER_LOG_WARN("FontManager: FT_Init_FreeType failed (%d)", static_cast<int>(error));
        return false;
    }

    initialized_ = true;
    return true;
}

void FontManager::shutdown() {
    if (!initialized_) {
        return;
    }

    for (auto& entry : fonts_) {
        if (entry.second) {
            releaseFace(*entry.second);
        }
    }
    fonts_.clear();
    defaultFontId_ = 0;

    if (ftLibrary_) {
        FT_Done_FreeType(ftLibrary_);
        ftLibrary_ = nullptr;
    }

    initialized_ = false;
}

void FontManager::releaseFace(FontFace& face) {
    if (face.hbFont) {
        hb_font_destroy(face.hbFont);
        face.hbFont = nullptr;
    }
    if (face.ftFace) {
        FT_Done_Face(face.ftFace);
        face.ftFace = nullptr;
    }
}

std::uint32_t FontManager::loadFontFromMemory(
    const std::uint8_t* fontData,
    std::size_t dataSize,
    const std::string& familyName
) {
    if (!initialized_ || !fontData || dataSize == 0) {
        return 0;
    }

    auto face = std::make_unique<FontFace>();
    face->fontData.assign(fontData, fontData + dataSize);
    face->ftFace = nullptr;
    face->hbFont = nullptr;

    FT_Error error = FT_New_Memory_Face(
        ftLibrary_,
        face->fontData.data(),
        static_cast<FT_Long>(face->fontData.size()),
        0,
        &face->ftFace
    );
    if (error || !face->ftFace) {
        COMPOSER_LOG_WARN("FontManager: FT_New_Memory_Face failed (%d)", static_cast<int>(error));
        return 0;
    }

    face->hbFont = hb_ft_font_create(face->ftFace, nullptr);
    if (!face->hbFont) {
        releaseFace(*face);
        return 0;
    }

    face->familyName = familyName;
    if (face->familyName.empty() && face->ftFace->family_name) {
        face->familyName = face->ftFace->family_name;
    }
    face->metrics = extractMetrics(face->ftFace);

    const std::uint32_t fontId = nextFontId_++;
    face->id = fontId;
    fonts_[fontId] = std::move(face);

    if (defaultFontId_ == 0) {
        defaultFontId_ = fontId;
    }
    return fontId;
}

std::uint32_t FontManager::loadFontFromFile(const std::string& filePath, const std::string& familyName) {
    if (!initialized_) {
        return 0;
    }

    std::ifstream file(filePath, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return 0;
    }

    const std::streamsize size = file.tellg();
    if (size <= 0) {
        return 0;
    }
    file.seekg(0, std::ios::beg);

    std::vector<std::uint8_t> buffer(static_cast<std::size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        return 0;
    }

    return loadFontFromMemory(buffer.data(), buffer.size(), familyName);
}

const FontFace* FontManager::getFont(std::uint32_t fontId) const {
    const std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;
    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

FontFace* FontManager::getFontMutable(std::uint32_t fontId) {
    const std::uint32_t actualId = (fontId == 0) ? defaultFontId_ : fontId;
    auto it = fonts_.find(actualId);
    return (it != fonts_.end()) ? it->second.get() : nullptr;
}

std::uint32_t FontManager::findFont(const std::string& familyName) const {
    if (!familyName.empty()) {
        for (const auto& entry : fonts_) {
            if (entry.second && entry.second->familyName == familyName) {
                return entry.first;
            }
        }
    }
    return defaultFontId_;
}

bool FontManager::hasFont(std::uint32_t fontId) const {
    return getFont(fontId) != nullptr;
}

FontMetrics FontManager::getScaledMetrics(std::uint32_t fontId, float fontSizePx) const {
    const FontFace* face = getFont(fontId);
    if (!face || face->metrics.unitsPerEM <= 0.0f) {
        FontMetrics defaults{};
        defaults.unitsPerEM = 1000.0f;
        defaults.ascender = fontSizePx * 0.8f;
        defaults.descender = fontSizePx * -0.2f;
        defaults.lineGap = fontSizePx * 0.1f;
        return defaults;
    }

    const float scale = fontSizePx / face->metrics.unitsPerEM;
    FontMetrics scaled{};
    scaled.unitsPerEM = face->metrics.unitsPerEM;
    scaled.ascender = face->metrics.ascender * scale;
    scaled.descender = face->metrics.descender * scale;
    scaled.lineGap = face->metrics.lineGap * scale;
    return scaled;
}

bool FontManager::setFontSize(std::uint32_t fontId, float fontSizePx) {
    FontFace* face = getFontMutable(fontId);
    if (!face || !face->ftFace || fontSizePx <= 0.0f) {
        return false;
    }

    // 26.6 fixed point at 72 DPI, so one point is one pixel
    FT_Error error = FT_Set_Char_Size(
        face->ftFace,
        0,
        static_cast<FT_F26Dot6>(fontSizePx * 64),
        72,
        72
    );
    if (error) {
        return false;
    }

    if (face->hbFont) {
        hb_font_set_scale(
            face->hbFont,
            static_cast<int>(fontSizePx * 64),
            static_cast<int>(fontSizePx * 64)
        );
    }
    return true;
}

FontMetrics FontManager::extractMetrics(FT_Face face) {
    FontMetrics metrics{};
    metrics.unitsPerEM = static_cast<float>(face->units_per_EM);
    metrics.ascender = static_cast<float>(face->ascender);
    metrics.descender = static_cast<float>(face->descender);
    metrics.lineGap = static_cast<float>(face->height - face->ascender + face->descender);

    TT_OS2* os2 = static_cast<TT_OS2*>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
    if (os2 && (os2->sTypoAscender != 0 || os2->sTypoDescender != 0)) {
        metrics.ascender = static_cast<float>(os2->sTypoAscender);
        metrics.descender = static_cast<float>(os2->sTypoDescender);
        metrics.lineGap = static_cast<float>(os2->sTypoLineGap);
    }
    return metrics;
}

} // namespace composer::text
