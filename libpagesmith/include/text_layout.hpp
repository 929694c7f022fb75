/**
 * @file text_layout.hpp
 * @brief Positions OCR words as invisible text over a page.
 */

#ifndef PAGESMITH_TEXT_LAYOUT_HPP
#define PAGESMITH_TEXT_LAYOUT_HPP

#include "ocr_result.hpp"
#include "truetype_font.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace pagesmith {

    /**
     * @brief One word ready to be drawn.
     *
     * Coordinates use a top-left origin in PDF points. (x, y) is the
     * top-left corner of the measured text, centred in the scaled OCR box.
     */
    struct TextPlacement {
        std::string text;       ///< UTF-8, already in drawing order
        int font_size = 0;
        double x = 0.0;
        double y = 0.0;
        double width = 0.0;     ///< Measured advance width
        double height = 0.0;    ///< Line height at font_size
        double ascent = 0.0;    ///< Top of line to baseline at font_size
    };

    /// @brief Font size above which a lone "-" or "_" is treated as a misread rule.
    inline constexpr int kMaxDashFontSize = 100;

    /// @brief Scales a pixel box to page units.
    Rect scale_bounds(const Rect &bounds, double scale_x, double scale_y);

    /**
     * @brief Finds the integral font size at which @p text spans the box width.
     *
     * The box height is the first guess; the guess is scaled by the ratio of
     * box width to measured width and floored, with a minimum of 1.
     */
    int fit_font_size(std::string_view text, const Rect &box, const TextMeasurer &measurer);

    /**
     * @brief Lays out one OCR element.
     * @return std::nullopt for empty text and for suppressed dash/underscore rules.
     */
    std::optional<TextPlacement> layout_text_element(const OcrTextElement &element,
                                                     double scale_x, double scale_y,
                                                     const TextMeasurer &measurer);

    /**
     * @brief Lays out every element of @p result on a page of the given size.
     */
    std::vector<TextPlacement> layout_ocr_text(const OcrResult &result,
                                               double page_width, double page_height,
                                               const TextMeasurer &measurer);

    /// @brief Splits UTF-8 text into extended grapheme clusters (ICU).
    std::vector<std::string> grapheme_clusters(std::string_view utf8);

    /// @brief Reverses UTF-8 text cluster by cluster, keeping each cluster intact.
    std::string reverse_graphemes(std::string_view utf8);

} // namespace pagesmith

#endif // PAGESMITH_TEXT_LAYOUT_HPP
