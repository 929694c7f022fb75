/**
 * @file generated_document.hpp
 * @brief The PDF built page by page from encoded images.
 */

#ifndef PAGESMITH_GENERATED_DOCUMENT_HPP
#define PAGESMITH_GENERATED_DOCUMENT_HPP

#include "embedded_font.hpp"
#include "embedder.hpp"
#include "export_params.hpp"
#include "page_geometry.hpp"
#include "qpdf_log_bridge.hpp"
#include "text_layout.hpp"
#include "truetype_font.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace pagesmith {

    /// @brief Page size of placeholders that are never drawn (US Letter).
    inline constexpr double kPlaceholderWidth = 612.0;
    inline constexpr double kPlaceholderHeight = 792.0;

    /// @brief Producer written to the document information dictionary.
    inline constexpr const char *kProducer = "pagesmith";

    /**
     * @brief A single qpdf document holding one page slot per input page.
     *
     * @details Every slot is created up front as an empty placeholder so that
     * pages can be drawn in any order while keeping their final position.
     * The document is guarded by one mutex; drawing is only possible through
     * a Writer, which holds that mutex for its lifetime.
     */
    class GeneratedDocument {
    public:
        using PageHandle = std::size_t;

        /**
         * @param page_count Number of page slots.
         * @param compat Output flavour; affects image and font objects.
         * @param font Font for the OCR text layer, may be null when no text is drawn.
         */
        GeneratedDocument(std::size_t page_count, PdfCompat compat, std::shared_ptr<const TrueTypeFont> font);

        GeneratedDocument(const GeneratedDocument &) = delete;
        GeneratedDocument &operator=(const GeneratedDocument &) = delete;

        /**
         * @brief Exclusive access to the document.
         */
        class Writer {
        public:
            Writer(const Writer &) = delete;
            Writer &operator=(const Writer &) = delete;
            Writer(Writer &&) noexcept = default;

            /**
             * @brief Turns a placeholder into a real page.
             *
             * The invisible text (render mode 3) is written before the image,
             * the image fills the whole page box.
             * @throws std::logic_error for text without a font or an unknown handle.
             */
            void draw_page(PageHandle handle, const PdfImageData &image,
                           const PageGeometry &geometry,
                           const std::vector<TextPlacement> &text);

        private:
            friend class GeneratedDocument;
            explicit Writer(GeneratedDocument &doc) : lock_(doc.mtx_), doc_(&doc) {}

            std::unique_lock<std::mutex> lock_;
            GeneratedDocument *doc_;
        };

        [[nodiscard]] Writer writer() { return Writer(*this); }

        /// @brief Handle of the placeholder at output position @p index.
        [[nodiscard]] PageHandle page_handle(std::size_t index) const;

        [[nodiscard]] std::size_t page_count() const noexcept { return page_count_; }

        /// @brief True when the compat mode forbids transparency (alpha is flattened).
        [[nodiscard]] bool flattens_alpha() const noexcept { return compat_ == PdfCompat::PdfA1B; }

        /**
         * @brief Stamps the metadata, completes fonts and archival objects,
         * applies encryption and serializes the document.
         * @return The complete PDF file.
         */
        std::vector<std::uint8_t> finalize(const PdfExportParams &params);

    private:
        QPDFObjectHandle image_xobject(const PdfImageData &image);
        void write_info(const PdfMetadata &metadata, const std::string &now);

        QpdfLogBridge log_bridge_;
        QPDF pdf_;
        std::mutex mtx_;
        std::size_t page_count_;
        std::vector<QPDFObjectHandle> pages_;
        PdfCompat compat_;
        std::shared_ptr<const TrueTypeFont> font_;
        std::unique_ptr<EmbeddedFont> embedded_font_;
        bool finalized_ = false;
    };

    /**
     * @brief Content stream of one generated page.
     *
     * Text comes first, one BT/ET block per placement at render mode 3, with
     * the baseline at page_height - (y + ascent). The image follows, scaled
     * to the page box with the same rounded values as the MediaBox.
     * @param encode Turns UTF-8 into a hex string operand of font /F0.
     */
    template <typename Encode>
    std::string page_content(const PageGeometry &geometry,
                             const std::vector<TextPlacement> &text,
                             Encode &&encode) {
        std::string content;
        for (const auto &t : text) {
            content += "BT\n3 Tr\n/F0 " + std::to_string(t.font_size) + " Tf\n";
            content += "1 0 0 1 " + format_points(t.x) + " " + format_points(geometry.height - (t.y + t.ascent)) + " Tm\n";
            content += encode(t.text) + " Tj\nET\n";
        }
        content += "q\n" + format_points(geometry.width) + " 0 0 " + format_points(geometry.height) + " 0 0 cm\n/Im0 Do\nQ\n";
        return content;
    }

} // namespace pagesmith

#endif // PAGESMITH_GENERATED_DOCUMENT_HPP
