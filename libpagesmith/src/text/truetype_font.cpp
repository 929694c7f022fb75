#include "../../include/truetype_font.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <ft2build.h>
#include FT_FREETYPE_H
#include FT_ADVANCES_H
#include FT_TRUETYPE_TABLES_H
#include FT_TRUETYPE_TAGS_H
#include <fontconfig/fontconfig.h>
#include <unicode/utf8.h>

namespace pagesmith {

struct TrueTypeFont::FreeTypeHandles {
    FT_Library library = nullptr;
    FT_Face face = nullptr;

    ~FreeTypeHandles() {
        if (face) FT_Done_Face(face);
        if (library) FT_Done_FreeType(library);
    }
};

namespace {

    std::string ft_error_text(const FT_Error error) {
        const char *s = FT_Error_String(error);
        return s ? s : "FreeType error " + std::to_string(error);
    }

    bool has_truetype_outlines(const FT_Face face) {
        FT_ULong length = 0;
        return FT_IS_SFNT(face) && FT_Load_Sfnt_Table(face, TTAG_glyf, 0, nullptr, &length) == 0 && length > 0;
    }

    /// @return Matched file for @p family, only if fontconfig did not substitute another family.
    std::optional<std::filesystem::path> match_family(FcConfig *config, const std::string &family) {
        FcPattern *pattern = FcPatternCreate();
        if (!pattern) return std::nullopt;
        FcPatternAddString(pattern, FC_FAMILY, reinterpret_cast<const FcChar8 *>(family.c_str()));
        FcPatternAddInteger(pattern, FC_WEIGHT, FC_WEIGHT_REGULAR);
        FcPatternAddInteger(pattern, FC_SLANT, FC_SLANT_ROMAN);
        FcPatternAddBool(pattern, FC_OUTLINE, FcTrue);
        FcConfigSubstitute(config, pattern, FcMatchPattern);
        FcDefaultSubstitute(pattern);

        FcResult result;
        FcPattern *match = FcFontMatch(config, pattern, &result);
        FcPatternDestroy(pattern);
        if (!match) return std::nullopt;

        std::optional<std::filesystem::path> found;
        FcChar8 *matched_family = nullptr;
        FcChar8 *file = nullptr;
        if (result == FcResultMatch
            && FcPatternGetString(match, FC_FAMILY, 0, &matched_family) == FcResultMatch
            && FcStrCmpIgnoreCase(matched_family, reinterpret_cast<const FcChar8 *>(family.c_str())) == 0
            && FcPatternGetString(match, FC_FILE, 0, &file) == FcResultMatch) {
            found = std::filesystem::path(reinterpret_cast<const char *>(file));
        }
        FcPatternDestroy(match);
        return found;
    }

} // namespace

std::u32string utf8_to_codepoints(const std::string_view utf8) {
    std::u32string out;
    out.reserve(utf8.size());
    const auto *s = reinterpret_cast<const std::uint8_t *>(utf8.data());
    const auto length = static_cast<int32_t>(utf8.size());
    int32_t i = 0;
    while (i < length) {
        UChar32 c;
        U8_NEXT(s, i, length, c);
        out.push_back(c < 0 ? U'\uFFFD' : static_cast<char32_t>(c));
    }
    return out;
}

std::optional<std::filesystem::path> locate_font(const std::vector<std::string> &families) {
    FcConfig *config = FcInitLoadConfigAndFonts();
    if (!config) {
        Logger::log(LogLevel::Warning, "fontconfig could not be initialized", "font");
        return std::nullopt;
    }
    std::optional<std::filesystem::path> found;
    for (const auto &family : families) {
        found = match_family(config, family);
        if (found) {
            Logger::log(LogLevel::Debug, "Using " + family + " from " + found->string(), "font");
            break;
        }
    }
    FcConfigDestroy(config);
    return found;
}

std::shared_ptr<TrueTypeFont> TrueTypeFont::load(const std::filesystem::path &path) {
    std::shared_ptr<TrueTypeFont> font(new TrueTypeFont());
    font->path_ = path;
    try {
        font->data_ = read_file(path);
    } catch (const std::exception &e) {
        throw NoEmbeddableFontError(std::string("Cannot read font: ") + e.what());
    }

    font->ft_ = std::make_unique<FreeTypeHandles>();
    if (const FT_Error err = FT_Init_FreeType(&font->ft_->library)) {
        throw NoEmbeddableFontError("FreeType init failed: " + ft_error_text(err));
    }
    if (const FT_Error err = FT_New_Memory_Face(font->ft_->library, font->data_.data(),
                                                static_cast<FT_Long>(font->data_.size()), 0, &font->ft_->face)) {
        throw NoEmbeddableFontError("Cannot open font " + path.string() + ": " + ft_error_text(err));
    }

    const FT_Face face = font->ft_->face;
    if (!has_truetype_outlines(face)) {
        throw NoEmbeddableFontError(path.string() + " has no TrueType outlines");
    }
    if (const auto *os2 = static_cast<const TT_OS2 *>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
        os2 && (os2->fsType & 0x000F) == 0x0002) {
        throw NoEmbeddableFontError(path.string() + " does not permit embedding");
    }

    font->units_per_em_ = face->units_per_EM > 0 ? face->units_per_EM : 1000;
    font->ascender_ = face->ascender;
    font->descender_ = face->descender;
    font->bbox_ = {static_cast<int>(face->bbox.xMin), static_cast<int>(face->bbox.yMin),
                   static_cast<int>(face->bbox.xMax), static_cast<int>(face->bbox.yMax)};
    font->num_glyphs_ = static_cast<std::uint32_t>(face->num_glyphs);
    font->cap_height_ = face->ascender;
    if (const auto *os2 = static_cast<const TT_OS2 *>(FT_Get_Sfnt_Table(face, FT_SFNT_OS2));
        os2 && os2->version >= 2 && os2->sCapHeight > 0) {
        font->cap_height_ = os2->sCapHeight;
    }
    if (const auto *post = static_cast<const TT_Postscript *>(FT_Get_Sfnt_Table(face, FT_SFNT_POST))) {
        font->italic_angle_ = static_cast<double>(post->italicAngle) / 65536.0;
    }
    if (const char *ps = FT_Get_Postscript_Name(face)) {
        font->postscript_name_ = ps;
    } else {
        font->postscript_name_ = path.stem().string();
    }
    return font;
}

std::shared_ptr<TrueTypeFont> TrueTypeFont::load_default(const std::filesystem::path &explicit_path) {
    if (!explicit_path.empty()) {
        return load(explicit_path);
    }
    const auto located = locate_font(kOcrFontFamilies);
    if (!located) {
        throw NoEmbeddableFontError("No embeddable OCR font found (tried Times New Roman, Liberation Serif)");
    }
    return load(*located);
}

TrueTypeFont::~TrueTypeFont() = default;

std::uint32_t TrueTypeFont::glyph_for(const char32_t codepoint) const {
    std::lock_guard lock(mtx_);
    return FT_Get_Char_Index(ft_->face, codepoint);
}

int TrueTypeFont::glyph_advance(const std::uint32_t glyph) const {
    std::lock_guard lock(mtx_);
    if (const auto it = advances_.find(glyph); it != advances_.end()) {
        return it->second;
    }
    FT_Fixed advance = 0;
    if (FT_Get_Advance(ft_->face, glyph, FT_LOAD_NO_SCALE, &advance) != 0) {
        advance = 0;
    }
    const int value = static_cast<int>(advance);
    advances_.emplace(glyph, value);
    return value;
}

double TrueTypeFont::text_width(const std::string_view utf8, const double font_size) const {
    long total = 0;
    for (const char32_t c : utf8_to_codepoints(utf8)) {
        total += glyph_advance(glyph_for(c));
    }
    return static_cast<double>(total) * font_size / units_per_em_;
}

double TrueTypeFont::text_height(const double font_size) const {
    return static_cast<double>(ascender_ - descender_) * font_size / units_per_em_;
}

double TrueTypeFont::ascent(const double font_size) const {
    return static_cast<double>(ascender_) * font_size / units_per_em_;
}

} // namespace pagesmith
