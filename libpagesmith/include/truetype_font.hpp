/**
 * @file truetype_font.hpp
 * @brief TrueType font used for the invisible OCR text layer.
 */

#ifndef PAGESMITH_TRUETYPE_FONT_HPP
#define PAGESMITH_TRUETYPE_FONT_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace pagesmith {

    /**
     * @brief Thrown when OCR text must be written but no font can be embedded.
     */
    class NoEmbeddableFontError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Measures text for layout. All values are in PDF points.
     */
    class TextMeasurer {
    public:
        virtual ~TextMeasurer() = default;

        /// @brief Advance width of a UTF-8 string at @p font_size.
        [[nodiscard]] virtual double text_width(std::string_view utf8, double font_size) const = 0;

        /// @brief Line height, (ascender - descender) scaled to @p font_size.
        [[nodiscard]] virtual double text_height(double font_size) const = 0;

        /// @brief Distance from the top of the line to the baseline.
        [[nodiscard]] virtual double ascent(double font_size) const = 0;
    };

    /// @brief Families tried, in order, when no font path is configured.
    inline const std::vector<std::string> kOcrFontFamilies = {"Times New Roman", "Liberation Serif"};

    /**
     * @brief Asks fontconfig for the first family that resolves to a TrueType file.
     * @return The font file, or std::nullopt when none of the families is installed.
     */
    std::optional<std::filesystem::path> locate_font(const std::vector<std::string> &families);

    /**
     * @brief A TrueType font loaded with FreeType.
     *
     * @details Holds the raw font program for embedding (FontFile2) and the
     * metrics needed by the text layout and the PDF font dictionaries.
     * Metric queries are thread-safe.
     */
    class TrueTypeFont final : public TextMeasurer {
    public:
        /**
         * @brief Loads a font file.
         * @throws NoEmbeddableFontError if the file is missing, unreadable or has no TrueType outlines.
         */
        static std::shared_ptr<TrueTypeFont> load(const std::filesystem::path &path);

        /**
         * @brief Loads @p explicit_path if given, otherwise the first of kOcrFontFamilies.
         * @throws NoEmbeddableFontError when no usable font exists.
         */
        static std::shared_ptr<TrueTypeFont> load_default(const std::filesystem::path &explicit_path = {});

        ~TrueTypeFont() override;
        TrueTypeFont(const TrueTypeFont &) = delete;
        TrueTypeFont &operator=(const TrueTypeFont &) = delete;

        [[nodiscard]] double text_width(std::string_view utf8, double font_size) const override;
        [[nodiscard]] double text_height(double font_size) const override;
        [[nodiscard]] double ascent(double font_size) const override;

        /// @brief Glyph id for a code point, 0 (.notdef) if unmapped.
        [[nodiscard]] std::uint32_t glyph_for(char32_t codepoint) const;

        /// @brief Advance of a glyph in font units.
        [[nodiscard]] int glyph_advance(std::uint32_t glyph) const;

        [[nodiscard]] int units_per_em() const noexcept { return units_per_em_; }
        [[nodiscard]] int ascender() const noexcept { return ascender_; }
        [[nodiscard]] int descender() const noexcept { return descender_; }
        [[nodiscard]] int cap_height() const noexcept { return cap_height_; }
        [[nodiscard]] double italic_angle() const noexcept { return italic_angle_; }
        [[nodiscard]] const std::vector<int> &bbox() const noexcept { return bbox_; }
        [[nodiscard]] std::uint32_t num_glyphs() const noexcept { return num_glyphs_; }
        [[nodiscard]] const std::string &postscript_name() const noexcept { return postscript_name_; }
        [[nodiscard]] const std::vector<std::uint8_t> &font_program() const noexcept { return data_; }
        [[nodiscard]] const std::filesystem::path &path() const noexcept { return path_; }

    private:
        struct FreeTypeHandles;

        TrueTypeFont() = default;

        std::filesystem::path path_;
        std::vector<std::uint8_t> data_;
        std::unique_ptr<FreeTypeHandles> ft_;
        mutable std::mutex mtx_;   ///< FT_Face is not thread-safe
        mutable std::unordered_map<std::uint32_t, int> advances_;

        int units_per_em_ = 1000;
        int ascender_ = 0;
        int descender_ = 0;
        int cap_height_ = 0;
        double italic_angle_ = 0.0;
        std::vector<int> bbox_;
        std::uint32_t num_glyphs_ = 0;
        std::string postscript_name_;
    };

    /// @brief Decodes UTF-8 to code points. Invalid sequences become U+FFFD.
    std::u32string utf8_to_codepoints(std::string_view utf8);

} // namespace pagesmith

#endif // PAGESMITH_TRUETYPE_FONT_HPP
