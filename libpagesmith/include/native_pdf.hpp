/**
 * @file native_pdf.hpp
 * @brief Page-level editing of finished PDF files (qpdf), behind a process-wide lock.
 */

#ifndef PAGESMITH_NATIVE_PDF_HPP
#define PAGESMITH_NATIVE_PDF_HPP

#include "embedded_font.hpp"
#include "export_params.hpp"
#include "page_image.hpp"
#include "qpdf_log_bridge.hpp"
#include "text_layout.hpp"
#include "truetype_font.hpp"
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <vector>

namespace pagesmith {

    /**
     * @brief Visible area of a page: its CropBox in user space and its /Rotate.
     *
     * Displayed coordinates are those of the page as a viewer (or a
     * rasterizer) shows it: origin top-left, y down, rotation applied.
     */
    struct PageView {
        double x = 0.0;             ///< CropBox lower-left, user space
        double y = 0.0;
        double box_width = 0.0;     ///< CropBox size, user space
        double box_height = 0.0;
        int rotate = 0;             ///< Clockwise, one of 0, 90, 180, 270

        /// @brief Displayed width in points.
        [[nodiscard]] double width() const noexcept { return rotate % 180 == 0 ? box_width : box_height; }
        /// @brief Displayed height in points.
        [[nodiscard]] double height() const noexcept { return rotate % 180 == 0 ? box_height : box_width; }

        /**
         * @brief Text matrix operands placing a baseline origin given in
         * displayed coordinates, with text running left to right on screen.
         */
        [[nodiscard]] std::string text_matrix(double dx, double dy) const;
    };

    /// @brief Normalizes a /Rotate value to 0, 90, 180 or 270.
    [[nodiscard]] int normalize_rotation(long long degrees);

    /**
     * @brief A PDF opened for page removal, page import and text overlay.
     *
     * @details Source documents of imported pages are kept open until the
     * document itself is destroyed, since qpdf copies foreign objects
     * lazily when writing.
     */
    class NativeDocument {
    public:
        NativeDocument(const NativeDocument &) = delete;
        NativeDocument &operator=(const NativeDocument &) = delete;
        ~NativeDocument();

        [[nodiscard]] int page_count() const;

        /// @throws std::out_of_range for a bad index.
        void remove_page(int index);

        /**
         * @brief Copies page @p source_index of @p source so that it ends up at @p index.
         * @throws std::out_of_range when either index is invalid.
         */
        void import_page(const PageImage &source, int source_index, int index);

        /// @brief CropBox (falling back to the MediaBox) and rotation of a page.
        [[nodiscard]] PageView page_view(int index) const;

        /**
         * @brief Adds invisible text on top of the existing content of a page.
         *
         * The existing content is wrapped in q/Q and the font is registered
         * under a key the page does not use yet. Placements are in displayed
         * coordinates of page_view(); baselines sit at y + ascent.
         * @throws std::logic_error when the document was opened without a font.
         */
        void add_text(int index, const std::vector<TextPlacement> &text);

        /**
         * @brief Serializes the document. Encryption of the opened file is kept.
         */
        void save(std::ostream &out);

    private:
        friend class NativePdfLibrary;
        NativeDocument(std::vector<std::uint8_t> data, const std::string &password,
                       PdfCompat compat, std::shared_ptr<const TrueTypeFont> font);

        QPDF &open_source(const PageImage &page);
        QPDFPageObjectHelper page(int index) const;

        QpdfLogBridge log_bridge_;
        std::vector<std::uint8_t> data_;
        std::unique_ptr<QPDF> pdf_;
        std::vector<std::shared_ptr<const std::vector<std::uint8_t>>> source_data_;
        std::map<std::string, std::unique_ptr<QPDF>> sources_;
        PdfCompat compat_;
        std::shared_ptr<const TrueTypeFont> font_;
        std::unique_ptr<EmbeddedFont> embedded_font_;
    };

    /**
     * @brief Process-wide gate in front of native PDF editing.
     *
     * Only one Session exists at a time; acquire() blocks until the previous
     * one is destroyed.
     */
    class NativePdfLibrary {
    public:
        static NativePdfLibrary &instance();

        NativePdfLibrary(const NativePdfLibrary &) = delete;
        NativePdfLibrary &operator=(const NativePdfLibrary &) = delete;

        class Session {
        public:
            Session(Session &&) noexcept = default;

            /**
             * @brief Opens a PDF held in memory.
             * @param password Owner or user password, empty for unencrypted files.
             * @param font Font for add_text(), may be null.
             * @throws std::runtime_error (QPDFExc) if the data cannot be parsed or the password is wrong.
             */
            std::unique_ptr<NativeDocument> open(std::vector<std::uint8_t> data,
                                                 const std::string &password,
                                                 PdfCompat compat,
                                                 std::shared_ptr<const TrueTypeFont> font = nullptr) const;

        private:
            friend class NativePdfLibrary;
            explicit Session(std::mutex &mtx) : lock_(mtx) {}

            std::unique_lock<std::mutex> lock_;
        };

        [[nodiscard]] Session acquire();

    private:
        NativePdfLibrary() = default;

        std::mutex mtx_;
    };

} // namespace pagesmith

#endif // PAGESMITH_NATIVE_PDF_HPP
