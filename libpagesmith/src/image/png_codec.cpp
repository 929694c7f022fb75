#include "../../include/memory_image.hpp"
#include "../../include/logger.hpp"
#include <png.h>
#include <cstring>
#include <stdexcept>
#include <string>

namespace pagesmith {

namespace {

    /**
     * @brief libpng error handler that throws a C++ exception.
     * @param msg The error message from libpng.
     */
    void png_error_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Error, std::string("libpng: ") + msg, "libpng");
        throw std::runtime_error(msg);
    }

    void png_warning_fn(png_structp, const png_const_charp msg) {
        Logger::log(LogLevel::Warning, std::string("libpng: ") + msg, "libpng");
    }

    /**
     * @brief RAII wrapper for libpng read structs.
     */
    struct PngRead {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngRead() {
            if (png || info) png_destroy_read_struct(&png, &info, nullptr);
        }
    };

    /**
     * @brief RAII wrapper for libpng write structs.
     */
    struct PngWrite {
        png_structp png = nullptr;
        png_infop info = nullptr;

        ~PngWrite() {
            if (png || info) png_destroy_write_struct(&png, &info);
        }
    };

    struct MemoryReader {
        std::span<const std::uint8_t> data;
        std::size_t offset = 0;
    };

    void read_from_memory(const png_structp png, const png_bytep out, const png_size_t length) {
        auto* reader = static_cast<MemoryReader*>(png_get_io_ptr(png));
        if (reader->offset + length > reader->data.size()) {
            png_error(png, "Unexpected end of PNG data");
        }
        std::memcpy(out, reader->data.data() + reader->offset, length);
        reader->offset += length;
    }

    void write_to_memory(const png_structp png, const png_bytep in, const png_size_t length) {
        auto* out = static_cast<std::vector<std::uint8_t>*>(png_get_io_ptr(png));
        out->insert(out->end(), in, in + length);
    }

    void flush_memory(png_structp) {}

} // namespace

MemoryImage decode_png(const std::span<const std::uint8_t> data) {
    if (data.size() < 8 || png_sig_cmp(data.data(), 0, 8) != 0) {
        throw std::runtime_error("Not a PNG stream");
    }

    PngRead rd;
    rd.png = png_create_read_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!rd.png) throw std::runtime_error("png_create_read_struct failed");
    rd.info = png_create_info_struct(rd.png);
    if (!rd.info) throw std::runtime_error("png_create_info_struct failed");

    MemoryReader reader{data, 0};
    png_set_read_fn(rd.png, &reader, read_from_memory);
    png_read_info(rd.png, rd.info);

    png_uint_32 width = 0, height = 0;
    int bit_depth = 0, color_type = 0;
    png_get_IHDR(rd.png, rd.info, &width, &height, &bit_depth, &color_type, nullptr, nullptr, nullptr);

    if (bit_depth == 16) png_set_strip_16(rd.png);
    if (color_type == PNG_COLOR_TYPE_PALETTE) png_set_palette_to_rgb(rd.png);
    if (color_type == PNG_COLOR_TYPE_GRAY && bit_depth < 8) png_set_expand_gray_1_2_4_to_8(rd.png);
    const bool has_trns = png_get_valid(rd.png, rd.info, PNG_INFO_tRNS) != 0;
    if (has_trns) png_set_tRNS_to_alpha(rd.png);

    const bool has_alpha = has_trns || (color_type & PNG_COLOR_MASK_ALPHA) != 0;
    const bool is_gray = (color_type & PNG_COLOR_MASK_COLOR) == 0 && color_type != PNG_COLOR_TYPE_PALETTE;

    ImagePixelFormat format;
    if (has_alpha) {
        // gray+alpha is promoted so ARGB32 is the only layout with alpha
        if (is_gray) png_set_gray_to_rgb(rd.png);
        format = ImagePixelFormat::ARGB32;
    } else {
        format = is_gray ? ImagePixelFormat::Gray8 : ImagePixelFormat::RGB24;
    }
    png_set_interlace_handling(rd.png);
    png_read_update_info(rd.png, rd.info);

    MemoryImage image(static_cast<int>(width), static_cast<int>(height), format);
    if (png_get_rowbytes(rd.png, rd.info) != image.stride()) {
        throw std::runtime_error("Unexpected PNG row layout");
    }
    std::vector<png_bytep> rows(height);
    for (png_uint_32 y = 0; y < height; ++y) {
        rows[y] = image.row(static_cast<int>(y));
    }
    png_read_image(rd.png, rows.data());
    png_read_end(rd.png, nullptr);

    png_uint_32 xppu = 0, yppu = 0;
    int unit = 0;
    if (png_get_pHYs(rd.png, rd.info, &xppu, &yppu, &unit) && unit == PNG_RESOLUTION_METER && xppu > 0 && yppu > 0) {
        image.set_resolution(xppu * 0.0254, yppu * 0.0254);
    }
    image.set_original_file_format(ImageFileFormat::Png);
    image.update_logical_pixel_format();
    return image;
}

std::vector<std::uint8_t> encode_png(const MemoryImage& image) {
    if (image.empty()) {
        throw std::logic_error("Cannot encode an empty image");
    }

    PngWrite wr;
    wr.png = png_create_write_struct(PNG_LIBPNG_VER_STRING, nullptr, png_error_fn, png_warning_fn);
    if (!wr.png) throw std::runtime_error("png_create_write_struct failed");
    wr.info = png_create_info_struct(wr.png);
    if (!wr.info) throw std::runtime_error("png_create_info_struct failed");

    std::vector<std::uint8_t> out;
    png_set_write_fn(wr.png, &out, write_to_memory, flush_memory);

    const auto width = static_cast<png_uint_32>(image.width());
    const auto height = static_cast<png_uint_32>(image.height());
    int color_type = PNG_COLOR_TYPE_GRAY;
    int bit_depth = 8;
    switch (image.pixel_format()) {
        case ImagePixelFormat::BW1:    bit_depth = 1; break;
        case ImagePixelFormat::Gray8:  break;
        case ImagePixelFormat::RGB24:  color_type = PNG_COLOR_TYPE_RGB; break;
        case ImagePixelFormat::ARGB32: color_type = PNG_COLOR_TYPE_RGB_ALPHA; break;
        case ImagePixelFormat::Unsupported:
            throw std::invalid_argument("Unsupported pixel format for PNG");
    }

    png_set_IHDR(wr.png, wr.info, width, height, bit_depth, color_type,
                 PNG_INTERLACE_NONE, PNG_COMPRESSION_TYPE_DEFAULT, PNG_FILTER_TYPE_DEFAULT);
    if (image.horizontal_dpi() > 0 && image.vertical_dpi() > 0) {
        png_set_pHYs(wr.png, wr.info,
                     static_cast<png_uint_32>(image.horizontal_dpi() / 0.0254 + 0.5),
                     static_cast<png_uint_32>(image.vertical_dpi() / 0.0254 + 0.5),
                     PNG_RESOLUTION_METER);
    }
    png_write_info(wr.png, wr.info);

    if (bit_depth == 1) {
        const auto packed = image.pack_bits();
        const std::size_t packed_stride = (static_cast<std::size_t>(width) + 7) / 8;
        for (png_uint_32 y = 0; y < height; ++y) {
            png_write_row(wr.png, packed.data() + packed_stride * y);
        }
    } else {
        for (png_uint_32 y = 0; y < height; ++y) {
            png_write_row(wr.png, image.row(static_cast<int>(y)));
        }
    }
    png_write_end(wr.png, nullptr);
    return out;
}

} // namespace pagesmith
