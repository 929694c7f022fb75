/**
 * @file source_pdf.hpp
 * @brief Read-only access to the PDF behind a passthrough page (poppler).
 */

#ifndef PAGESMITH_SOURCE_PDF_HPP
#define PAGESMITH_SOURCE_PDF_HPP

#include "memory_image.hpp"
#include "page_image.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace poppler {
    class document;
}

namespace pagesmith {

    /// @brief Resolution used when a PDF page is rasterized for OCR or re-encoding.
    inline constexpr double kRasterDpi = 300.0;

    /**
     * @brief True if @p utf8 contains a character other than Unicode white
     * space and invisible format characters (U+200B, U+FEFF, ...).
     */
    [[nodiscard]] bool has_visible_text(std::string_view utf8);

    /**
     * @brief An opened source PDF.
     *
     * @details Used to probe whether a page already carries text and to
     * render it to pixels. Memory-backed documents keep their bytes alive
     * for as long as the document is open.
     */
    class SourceDocument {
    public:
        /// @throws std::runtime_error if the file cannot be opened or is locked.
        explicit SourceDocument(const std::filesystem::path &path);

        /// @throws std::runtime_error if the data cannot be parsed or is locked.
        explicit SourceDocument(std::shared_ptr<const std::vector<std::uint8_t>> data);

        ~SourceDocument();
        SourceDocument(const SourceDocument &) = delete;
        SourceDocument &operator=(const SourceDocument &) = delete;

        /// @brief Opens the document behind a file or memory PDF page.
        static std::unique_ptr<SourceDocument> open(const PageImage &page);

        [[nodiscard]] int page_count() const;

        /// @brief Extracted text of a page, UTF-8.
        [[nodiscard]] std::string page_text(int index) const;

        /// @brief True if the extracted text of the page passes has_visible_text().
        [[nodiscard]] bool has_text(int index) const;

        /**
         * @brief Renders a page to RGB24 pixels.
         * @throws std::runtime_error if poppler returns no image.
         */
        [[nodiscard]] MemoryImage rasterize(int index, double dpi = kRasterDpi) const;

    private:
        void check_loaded(const std::string &what) const;
        void check_index(int index) const;

        std::shared_ptr<const std::vector<std::uint8_t>> data_;
        std::unique_ptr<poppler::document> doc_;
    };

} // namespace pagesmith

#endif // PAGESMITH_SOURCE_PDF_HPP
