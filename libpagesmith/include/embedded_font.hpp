#ifndef PAGESMITH_EMBEDDED_FONT_HPP
#define PAGESMITH_EMBEDDED_FONT_HPP

#include "export_params.hpp"
#include "truetype_font.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <string_view>

namespace pagesmith {

    /**
     * @brief A TrueType font embedded in one QPDF document as a Type0/CIDFontType2
     * font with Identity-H encoding.
     *
     * @details Text is shown as 2-byte glyph ids. Glyph widths and the
     * ToUnicode map only list the glyphs actually used, collected through
     * encode(). Archival documents get an explicit CIDToGIDMap stream and,
     * for PDF/A-1b, a CIDSet. Not thread-safe; callers serialize access
     * the same way they serialize access to the document.
     */
    class EmbeddedFont {
    public:
        EmbeddedFont(QPDF &pdf, std::shared_ptr<const TrueTypeFont> font, PdfCompat compat);

        /// @brief Indirect Type0 font object; complete after finalize().
        [[nodiscard]] QPDFObjectHandle font_object();

        /// @brief Encodes UTF-8 text as a hex string operand ("<0024...>") and records the glyphs.
        std::string encode(std::string_view utf8);

        [[nodiscard]] const TrueTypeFont &font() const noexcept { return *font_; }
        [[nodiscard]] bool used() const noexcept { return !font_object_.isNull() && !glyphs_.empty(); }

        /// @brief Writes the descendant font, descriptor, widths and ToUnicode map.
        void finalize();

    private:
        std::string to_unicode_cmap() const;
        QPDFObjectHandle widths() const;
        QPDFObjectHandle make_stream(const std::string &data) const;

        QPDF &pdf_;
        std::shared_ptr<const TrueTypeFont> font_;
        PdfCompat compat_;
        QPDFObjectHandle font_object_;
        std::map<std::uint32_t, char32_t> glyphs_;   ///< Used glyph -> first code point seen
        bool finalized_ = false;
    };

} // namespace pagesmith

#endif // PAGESMITH_EMBEDDED_FONT_HPP
