/**
 * @file embedder.hpp
 * @brief Supplies the encoded image of one page to the PDF writer and the OCR queue.
 */

#ifndef PAGESMITH_EMBEDDER_HPP
#define PAGESMITH_EMBEDDER_HPP

#include "file_utils.hpp"
#include "jpeg_header.hpp"
#include "memory_image.hpp"
#include "page_image.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <ostream>
#include <string_view>
#include <vector>

namespace pagesmith {

    class SourceDocument;

    /// @brief JPEG quality of re-encoded pages.
    inline constexpr int kJpegQuality = 75;

    /**
     * @brief Image data ready to become a PDF image XObject.
     *
     * `encoding` is Jpeg for DCT data, Png for raw samples that the writer
     * Flate-compresses. `alpha` holds one 8 bit sample per pixel when the
     * image keeps its transparency, and is empty otherwise.
     */
    struct PdfImageData {
        int width = 0;
        int height = 0;
        ImageFileFormat encoding = ImageFileFormat::Unspecified;
        int components = 0;
        int bits_per_component = 8;
        std::vector<std::uint8_t> data;
        std::vector<std::uint8_t> alpha;
    };

    /**
     * @brief Source of one page's image content.
     *
     * An embedder owns the file handle or decoded image it wraps and
     * releases it exactly once, on release() or destruction, whichever
     * comes first.
     */
    class IEmbedder {
    public:
        virtual ~IEmbedder() = default;

        /**
         * @brief Chooses the file and pixel format the page is embedded with.
         * Applies the black/white reduction when the choice requires it.
         */
        virtual ImageExportFormat prepare_for_export(const ImageMetadata &metadata) = 0;

        /// @brief Writes an encoded image suitable as OCR input.
        virtual void copy_to_stream(std::ostream &out) = 0;

        /// @brief Extension matching the bytes written by copy_to_stream().
        [[nodiscard]] virtual std::string_view stream_extension() const = 0;

        /**
         * @brief Produces the data for the image XObject in the format chosen by
         * prepare_for_export() (which runs with default metadata if not called yet).
         * @param flatten_alpha Composite transparency over white instead of keeping an alpha channel.
         */
        virtual PdfImageData pdf_image(bool flatten_alpha) = 0;

        [[nodiscard]] virtual int width() const = 0;
        [[nodiscard]] virtual int height() const = 0;
        [[nodiscard]] virtual double dpi_x() const = 0;
        [[nodiscard]] virtual double dpi_y() const = 0;
        [[nodiscard]] virtual ImageFileFormat original_format() const = 0;

        /// @brief Releases the wrapped resource. Idempotent.
        virtual void release() noexcept = 0;
    };

    /**
     * @brief Embeds an untouched colour JPEG file byte for byte (DCTDecode).
     */
    class DirectJpegEmbedder final : public IEmbedder {
    public:
        /// @throws std::runtime_error if the file cannot be opened.
        DirectJpegEmbedder(const std::filesystem::path &path, const JpegHeader &header);
        ~DirectJpegEmbedder() override { release(); }

        ImageExportFormat prepare_for_export(const ImageMetadata &metadata) override;
        void copy_to_stream(std::ostream &out) override;
        [[nodiscard]] std::string_view stream_extension() const override { return ".jpg"; }
        PdfImageData pdf_image(bool flatten_alpha) override;

        [[nodiscard]] int width() const override { return header_.width; }
        [[nodiscard]] int height() const override { return header_.height; }
        [[nodiscard]] double dpi_x() const override { return header_.dpi_x; }
        [[nodiscard]] double dpi_y() const override { return header_.dpi_y; }
        [[nodiscard]] ImageFileFormat original_format() const override { return ImageFileFormat::Jpeg; }

        void release() noexcept override { file_.reset(); }

    private:
        std::vector<std::uint8_t> read_all();

        std::filesystem::path path_;
        JpegHeader header_;
        unique_FILE file_;
    };

    /**
     * @brief Re-encodes decoded pixels as JPEG or Flate data.
     */
    class RenderedImageEmbedder final : public IEmbedder {
    public:
        explicit RenderedImageEmbedder(MemoryImage image);
        explicit RenderedImageEmbedder(std::shared_ptr<const MemoryImage> image);
        ~RenderedImageEmbedder() override { release(); }

        ImageExportFormat prepare_for_export(const ImageMetadata &metadata) override;
        void copy_to_stream(std::ostream &out) override;
        [[nodiscard]] std::string_view stream_extension() const override;
        PdfImageData pdf_image(bool flatten_alpha) override;

        [[nodiscard]] int width() const override { return width_; }
        [[nodiscard]] int height() const override { return height_; }
        [[nodiscard]] double dpi_x() const override { return dpi_x_; }
        [[nodiscard]] double dpi_y() const override { return dpi_y_; }
        [[nodiscard]] ImageFileFormat original_format() const override { return original_format_; }

        void release() noexcept override { image_.reset(); }

    private:
        const MemoryImage &image() const;

        std::shared_ptr<const MemoryImage> image_;
        std::optional<ImageExportFormat> format_;
        int width_ = 0;
        int height_ = 0;
        double dpi_x_ = 0.0;
        double dpi_y_ = 0.0;
        ImageFileFormat original_format_ = ImageFileFormat::Unspecified;
    };

    /**
     * @brief Chooses the export format of a decoded image.
     *
     * First match wins: black/white depth or BW1 content gives PNG/BW1,
     * real transparency gives PNG/ARGB32, lossless gives PNG in the logical
     * format, grayscale depth or Gray8 content gives JPEG/Gray8, anything
     * else JPEG/RGB24.
     */
    ImageExportFormat choose_export_format(const MemoryImage &image, const ImageMetadata &metadata);

    /**
     * @brief The single place deciding how a page image is embedded.
     *
     * Direct copy is used only for an untransformed JPEG file whose header
     * reports three colour components; every other page is decoded and
     * re-encoded. PDF pages are rasterized at kRasterDpi, through @p source
     * when the caller already has the document open.
     * @throws std::runtime_error if the image cannot be read or decoded.
     */
    std::unique_ptr<IEmbedder> select_embedder(const PageImage &page, const SourceDocument *source = nullptr);

} // namespace pagesmith

#endif // PAGESMITH_EMBEDDER_HPP
