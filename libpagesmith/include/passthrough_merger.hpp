/**
 * @file passthrough_merger.hpp
 * @brief Replaces placeholder pages of a generated PDF with pages of their source PDFs.
 */

#ifndef PAGESMITH_PASSTHROUGH_MERGER_HPP
#define PAGESMITH_PASSTHROUGH_MERGER_HPP

#include "export_params.hpp"
#include "ocr_result.hpp"
#include "page_image.hpp"
#include "truetype_font.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <ostream>
#include <stop_token>
#include <vector>

namespace pagesmith {

    /// @brief One page slot to be taken from a source PDF.
    struct PassthroughPage {
        std::size_t index = 0;             ///< Output position
        const PageImage *image = nullptr;
        std::optional<OcrResult> ocr;      ///< Text to overlay, if the page was recognized
    };

    /**
     * @brief Writes the final document.
     *
     * Opens @p generated under the NativePdfLibrary lock, swaps every
     * passthrough placeholder for the referenced source page (in index
     * order), overlays OCR text where present and writes the result.
     * @param font Needed only when at least one page carries OCR text.
     * @return false if cancelled; nothing is written in that case.
     */
    bool merge_passthrough_pages(std::vector<std::uint8_t> generated,
                                 std::vector<PassthroughPage> pages,
                                 const PdfExportParams &params,
                                 const std::shared_ptr<const TrueTypeFont> &font,
                                 std::ostream &out,
                                 std::stop_token stop);

} // namespace pagesmith

#endif // PAGESMITH_PASSTHROUGH_MERGER_HPP
