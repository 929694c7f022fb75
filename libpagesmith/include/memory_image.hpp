/**
 * @file memory_image.hpp
 * @brief Decoded raster image plus the JPEG/PNG codecs used by the exporter.
 */

#ifndef PAGESMITH_MEMORY_IMAGE_HPP
#define PAGESMITH_MEMORY_IMAGE_HPP

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <span>
#include <string_view>
#include <vector>

namespace pagesmith {

/**
 * @brief Pixel layouts understood by the exporter.
 *
 * Samples are always 8 bits per channel in memory. BW1 images keep one
 * byte per pixel (0 or 255) and are packed to 1 bit only when encoded.
 * ARGB32 pixels are stored in R, G, B, A byte order.
 */
enum class ImagePixelFormat {
    Unsupported,
    BW1,
    Gray8,
    RGB24,
    ARGB32
};

enum class ImageFileFormat {
    Unspecified,
    Jpeg,
    Png,
    Pdf
};

/**
 * @brief The file and pixel format an image will be embedded with.
 */
struct ImageExportFormat {
    ImageFileFormat file_format = ImageFileFormat::Unspecified;
    ImagePixelFormat pixel_format = ImagePixelFormat::Unsupported;

    bool operator==(const ImageExportFormat&) const = default;
};

/// @return Extension (".jpg", ".png", ".pdf") or an empty string.
std::string_view extension_for(ImageFileFormat format) noexcept;

/**
 * @brief A decoded image held in memory.
 *
 * @details MemoryImage is the image engine of the library: it decodes
 * JPEG (libjpeg) and PNG (libpng) input, reports its physical resolution,
 * detects the narrowest pixel format that represents its content
 * ("logical" format), applies the black/white reduction, and encodes
 * itself back to JPEG or PNG.
 */
class MemoryImage {
public:
    MemoryImage() = default;

    /**
     * @brief Creates a blank (white, opaque) image.
     * @throws std::invalid_argument for non-positive sizes or Unsupported.
     */
    MemoryImage(int width, int height, ImagePixelFormat format);

    /**
     * @brief Decodes a JPEG or PNG file.
     * @throws std::runtime_error if the file cannot be read or decoded.
     */
    static MemoryImage load(const std::filesystem::path& path);

    /**
     * @brief Decodes JPEG or PNG data held in memory.
     * The format is detected from the leading magic bytes.
     * @throws std::runtime_error on unknown or corrupt data.
     */
    static MemoryImage load(std::span<const std::uint8_t> data);

    [[nodiscard]] int width() const noexcept { return width_; }
    [[nodiscard]] int height() const noexcept { return height_; }
    [[nodiscard]] int channels() const noexcept { return channels_; }
    [[nodiscard]] std::size_t stride() const noexcept { return static_cast<std::size_t>(width_) * channels_; }
    [[nodiscard]] bool empty() const noexcept { return pixels_.empty(); }

    /// @brief Storage layout of the pixel buffer.
    [[nodiscard]] ImagePixelFormat pixel_format() const noexcept { return pixel_format_; }

    /// @brief Narrowest format able to represent the content (see update_logical_pixel_format()).
    [[nodiscard]] ImagePixelFormat logical_pixel_format() const noexcept { return logical_format_; }

    /// @brief Format the pixels were decoded from (Unspecified for synthetic images).
    [[nodiscard]] ImageFileFormat original_file_format() const noexcept { return original_format_; }
    void set_original_file_format(ImageFileFormat f) noexcept { original_format_ = f; }

    [[nodiscard]] double horizontal_dpi() const noexcept { return dpi_x_; }
    [[nodiscard]] double vertical_dpi() const noexcept { return dpi_y_; }
    void set_resolution(double dpi_x, double dpi_y) noexcept { dpi_x_ = dpi_x; dpi_y_ = dpi_y; }

    [[nodiscard]] std::uint8_t* row(int y) noexcept { return pixels_.data() + stride() * y; }
    [[nodiscard]] const std::uint8_t* row(int y) const noexcept { return pixels_.data() + stride() * y; }
    [[nodiscard]] const std::vector<std::uint8_t>& pixels() const noexcept { return pixels_; }

    /**
     * @brief Scans the pixels and recomputes the logical pixel format.
     *
     * Opaque alpha collapses ARGB32 to RGB24, equal channels collapse to
     * Gray8, and a Gray8 image that only contains 0 and 255 becomes BW1.
     */
    void update_logical_pixel_format();

    /**
     * @brief Black/white reduction.
     * @param threshold Luma (0-255) at or above which a pixel becomes white.
     * @return A new BW1 image with the same resolution.
     */
    [[nodiscard]] MemoryImage to_black_white(int threshold = 128) const;

    /**
     * @brief Converts the samples to another storage layout.
     * Alpha is composited over white when it is dropped.
     */
    [[nodiscard]] MemoryImage convert(ImagePixelFormat target) const;

    /// @return The alpha channel of an ARGB32 image, one byte per pixel.
    [[nodiscard]] std::vector<std::uint8_t> alpha_channel() const;

    /**
     * @brief Encodes the image.
     * @param format Jpeg or Png.
     * @param pixel_format_hint Layout to encode with; Unsupported keeps the current one.
     * @param jpeg_quality Quality used for JPEG output.
     * @throws std::runtime_error on encoder failure.
     */
    [[nodiscard]] std::vector<std::uint8_t> encode(ImageFileFormat format,
                                                   ImagePixelFormat pixel_format_hint = ImagePixelFormat::Unsupported,
                                                   int jpeg_quality = 75) const;

    /// @brief encode() written to a stream.
    void save(std::ostream& out,
              ImageFileFormat format,
              ImagePixelFormat pixel_format_hint = ImagePixelFormat::Unsupported,
              int jpeg_quality = 75) const;

    /**
     * @brief Packs a BW1 image to 1 bit per pixel, rows padded to a byte, 1 = white.
     */
    [[nodiscard]] std::vector<std::uint8_t> pack_bits() const;

private:
    int width_ = 0;
    int height_ = 0;
    int channels_ = 0;
    ImagePixelFormat pixel_format_ = ImagePixelFormat::Unsupported;
    ImagePixelFormat logical_format_ = ImagePixelFormat::Unsupported;
    ImageFileFormat original_format_ = ImageFileFormat::Unspecified;
    double dpi_x_ = 0.0;
    double dpi_y_ = 0.0;
    std::vector<std::uint8_t> pixels_;
};

// --- codecs (image/jpeg_codec.cpp, image/png_codec.cpp) ---

/// @brief Decodes a JPEG stream to Gray8 or RGB24.
MemoryImage decode_jpeg(std::span<const std::uint8_t> data);

/// @brief Encodes Gray8 or RGB24 samples as a baseline JPEG.
std::vector<std::uint8_t> encode_jpeg(const MemoryImage& image, int quality);

/// @brief Decodes a PNG stream to Gray8, RGB24 or ARGB32.
MemoryImage decode_png(std::span<const std::uint8_t> data);

/// @brief Encodes the image as PNG in its own pixel format (BW1 is written as 1-bit gray).
std::vector<std::uint8_t> encode_png(const MemoryImage& image);

} // namespace pagesmith

#endif // PAGESMITH_MEMORY_IMAGE_HPP
