#ifndef PAGESMITH_JPEG_HEADER_HPP
#define PAGESMITH_JPEG_HEADER_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>

namespace pagesmith {

    /**
     * @brief Frame information read from a JPEG header without decoding scan data.
     */
    struct JpegHeader {
        int width = 0;
        int height = 0;
        int components = 0;      ///< 1 for grayscale, 3 for YCbCr/RGB, 4 for CMYK
        double dpi_x = 0.0;      ///< 0 when the file carries no JFIF density
        double dpi_y = 0.0;
    };

    /**
     * @brief Parses the header of an in-memory JPEG stream.
     * @return std::nullopt if the data is not a readable JPEG.
     */
    std::optional<JpegHeader> read_jpeg_header(std::span<const std::uint8_t> data);

    /// @brief File variant of read_jpeg_header().
    std::optional<JpegHeader> read_jpeg_header(const std::filesystem::path &path);

} // namespace pagesmith

#endif // PAGESMITH_JPEG_HEADER_HPP
