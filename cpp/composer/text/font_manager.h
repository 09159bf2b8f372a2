#ifndef LINGUACOACH_COMPOSER_TEXT_FONT_MANAGER_H
#define LINGUACOACH_COMPOSER_TEXT_FONT_MANAGER_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

// Forward declarations for FreeType/HarfBuzz
typedef struct FT_LibraryRec_* FT_Library;
typedef struct FT_FaceRec_* FT_Face;
typedef struct hb_font_t hb_font_t;

namespace composer::text {

/**
 * Vertical font metrics in font units, or in pixels once scaled.
 */
struct FontMetrics {
    float unitsPerEM;
    float ascender;     // Positive, above baseline
    float descender;    // Negative, below baseline
    float lineGap;
};

/**
 * FontFace: one loaded face with its FreeType and HarfBuzz handles.
 */
struct FontFace {
    std::uint32_t id;
    std::string familyName;

    FT_Face ftFace;
    hb_font_t* hbFont;

    FontMetrics metrics;

    // FreeType reads from this buffer for the lifetime of the face
    std::vector<std::uint8_t> fontData;
};

/**
 * FontManager: owns the FreeType library and the faces used for measuring
 * composer text.
 */
class FontManager {
public:
    FontManager();
    ~FontManager();

    // Non-copyable
    FontManager(const FontManager&) = delete;
    FontManager& operator=(const FontManager&) = delete;

    /**
     * Initialize FreeType. Must be called before loading fonts.
     * @return True if initialization succeeded
     */
    bool initialize();

    void shutdown();

    bool isInitialized() const { return initialized_; }

    // =========================================================================
    // Loading
    // =========================================================================

    /**
     * Load a face from memory.
     * @param fontData Raw TTF/OTF data (copied)
     * @param dataSize Size of font data in bytes
     * @param familyName Optional family name override
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromMemory(
        const std::uint8_t* fontData,
        std::size_t dataSize,
        const std::string& familyName = ""
    );

    /**
     * Load a face from a TTF/OTF file.
     * @return Font ID, or 0 on failure
     */
    std::uint32_t loadFontFromFile(const std::string& filePath, const std::string& familyName = "");


    // =========================================================================
    // Access
    // =========================================================================

    /**
     * @param fontId Font ID (0 = default font)
     * @return Face, or nullptr if not loaded
     */
    const FontFace* getFont(std::uint32_t fontId) const;

    /**
     * Resolve a family name to a loaded face. Empty or unknown names resolve to the default font.
     */
    std::uint32_t findFont(const std::string& familyName) const;

    bool hasFont(std::uint32_t fontId) const;
    std::uint32_t getDefaultFontId() const { return defaultFontId_; }

    /**
     * Metrics scaled to a pixel size. Falls back to generic proportions if the font is missing.
     */
    FontMetrics getScaledMetrics(std::uint32_t fontId, float fontSizePx) const;

    /**
     * Set the pixel size on the FreeType face and the HarfBuzz scale.
     * @return True if successful
     */
    bool setFontSize(std::uint32_t fontId, float fontSizePx);

private:
    bool initialized_ = false;
    FT_Library ftLibrary_ = nullptr;

    std::unordered_map<std::uint32_t, std::unique_ptr<FontFace>> fonts_;
    std::uint32_t nextFontId_ = 1;
    std::uint32_t defaultFontId_ = 0;

    FontFace* getFontMutable(std::uint32_t fontId);
    static void releaseFace(FontFace& face);
    static FontMetrics extractMetrics(FT_Face face);
};

} // namespace composer::text

#endif // LINGUACOACH_COMPOSER_TEXT_FONT_MANAGER_H
