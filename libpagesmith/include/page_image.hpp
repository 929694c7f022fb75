/**
 * @file page_image.hpp
 * @brief Immutable description of one input page.
 */

#ifndef PAGESMITH_PAGE_IMAGE_HPP
#define PAGESMITH_PAGE_IMAGE_HPP

#include "memory_image.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace pagesmith {

    /// @brief Colour depth the user asked for when the page was imported.
    enum class BitDepth {
        Color,
        Grayscale,
        BlackAndWhite
    };

    /// @brief Physical page size in inches.
    struct PageSize {
        double width = 0.0;
        double height = 0.0;
    };

    struct ImageMetadata {
        BitDepth bit_depth = BitDepth::Color;
        bool lossless = false;
        std::optional<PageSize> page_size;   ///< Expected physical size, if known
    };

    /// @brief Page backed by a file on disk (JPEG, PNG or PDF).
    struct ImageFileStorage {
        std::filesystem::path path;
    };

    /// @brief Page backed by encoded bytes in memory.
    struct ImageMemoryStorage {
        std::shared_ptr<const std::vector<std::uint8_t>> data;
        std::string type_hint;   ///< Extension of the encoded data, e.g. ".pdf"
    };

    /// @brief Page backed by decoded pixels, typically after a transform.
    struct RenderedImageStorage {
        std::shared_ptr<const MemoryImage> image;
    };

    using ImageStorage = std::variant<ImageFileStorage, ImageMemoryStorage, RenderedImageStorage>;

    /**
     * @brief One source page.
     *
     * @details A PageImage never changes after construction. It refers to the
     * page's content through its storage and carries the import metadata.
     * `transformed` is set when a pixel transform was applied after import,
     * in which case the original encoded bytes no longer match the page.
     */
    class PageImage {
    public:
        explicit PageImage(ImageStorage storage,
                           ImageMetadata metadata = {},
                           bool transformed = false,
                           int pdf_page_index = 0);

        static PageImage from_file(std::filesystem::path path, ImageMetadata metadata = {});
        static PageImage from_pdf_page(std::filesystem::path path, int page_index, ImageMetadata metadata = {});
        static PageImage from_memory(std::vector<std::uint8_t> data, std::string type_hint, ImageMetadata metadata = {});
        static PageImage from_rendered(MemoryImage image, ImageMetadata metadata = {});

        [[nodiscard]] const ImageStorage &storage() const noexcept { return storage_; }
        [[nodiscard]] const ImageMetadata &metadata() const noexcept { return metadata_; }
        [[nodiscard]] bool transformed() const noexcept { return transformed_; }
        [[nodiscard]] int pdf_page_index() const noexcept { return pdf_page_index_; }

        /// @brief True when the content is encoded as PDF (by extension or type hint).
        [[nodiscard]] bool is_pdf() const;

        /// @brief True for a JPEG file on disk that no transform has touched.
        [[nodiscard]] bool is_untransformed_jpeg_file() const;

        /**
         * @brief Stable identity of the page content, used as OCR cache key.
         *
         * Files are identified by path, size and modification time, memory
         * and rendered pages by a hash of their bytes.
         */
        [[nodiscard]] std::string content_identity() const;

        /// @brief Decodes the page pixels. Not valid for PDF pages.
        [[nodiscard]] MemoryImage load() const;

        /// @brief Encoded bytes of file or memory storage.
        [[nodiscard]] std::vector<std::uint8_t> encoded_bytes() const;

        /// @brief Short human readable description for log messages.
        [[nodiscard]] std::string describe() const;

    private:
        ImageStorage storage_;
        ImageMetadata metadata_;
        bool transformed_ = false;
        int pdf_page_index_ = 0;
    };

    /// @brief Lower-cased extension, including the dot.
    std::string lowercase_extension(const std::filesystem::path &path);

} // namespace pagesmith

#endif // PAGESMITH_PAGE_IMAGE_HPP
