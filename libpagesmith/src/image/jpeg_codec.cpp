#include "../../include/memory_image.hpp"
#include "../../include/logger.hpp"
#include <jpeglib.h>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

namespace {

// error manager (jpeg error -> c++ exception)
struct JpegErrorMgr {
    jpeg_error_mgr pub{};
    char msg[JMSG_LENGTH_MAX]{};
};

/**
 * @brief libjpeg error handler that throws a C++ exception.
 */
void jpeg_error_exit_throw(const j_common_ptr cinfo) {
    auto *err = reinterpret_cast<JpegErrorMgr *>(cinfo->err);
    (*cinfo->err->format_message)(cinfo, err->msg);
    Logger::log(LogLevel::Warning, std::string("libjpeg: ") + err->msg, "libjpeg");
    throw std::runtime_error(err->msg);
}

/**
 * @brief Keeps corrupt-data warnings in our log instead of stderr.
 */
void jpeg_output_message_log(const j_common_ptr cinfo) {
    char buffer[JMSG_LENGTH_MAX];
    (*cinfo->err->format_message)(cinfo, buffer);
    Logger::log(LogLevel::Debug, std::string("libjpeg: ") + buffer, "libjpeg");
}

struct DecompressGuard {
    jpeg_decompress_struct* cinfo;
    ~DecompressGuard() { jpeg_destroy_decompress(cinfo); }
};

struct CompressGuard {
    jpeg_compress_struct* cinfo;
    unsigned char** buffer;
    ~CompressGuard() {
        jpeg_destroy_compress(cinfo);
        if (*buffer) std::free(*buffer);
    }
};

} // namespace

namespace pagesmith {

MemoryImage decode_jpeg(const std::span<const std::uint8_t> data) {
    jpeg_decompress_struct cinfo{};
    JpegErrorMgr jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.output_message = jpeg_output_message_log;

    jpeg_create_decompress(&cinfo);
    DecompressGuard guard{&cinfo};

    jpeg_mem_src(&cinfo, data.data(), static_cast<unsigned long>(data.size()));
    if (jpeg_read_header(&cinfo, TRUE) != JPEG_HEADER_OK) {
        throw std::runtime_error("Invalid JPEG header");
    }

    // adobe CMYK/YCCK and everything else with more than one component becomes RGB
    cinfo.out_color_space = cinfo.num_components == 1 ? JCS_GRAYSCALE : JCS_RGB;
    if (cinfo.jpeg_color_space == JCS_CMYK || cinfo.jpeg_color_space == JCS_YCCK) {
        cinfo.out_color_space = JCS_CMYK;
    }
    jpeg_start_decompress(&cinfo);

    const int width = static_cast<int>(cinfo.output_width);
    const int height = static_cast<int>(cinfo.output_height);
    const bool gray = cinfo.output_components == 1;
    MemoryImage image(width, height, gray ? ImagePixelFormat::Gray8 : ImagePixelFormat::RGB24);

    std::vector<JSAMPLE> cmyk_row;
    if (cinfo.out_color_space == JCS_CMYK) {
        cmyk_row.resize(static_cast<std::size_t>(width) * 4);
    }
    while (cinfo.output_scanline < cinfo.output_height) {
        const int y = static_cast<int>(cinfo.output_scanline);
        if (cmyk_row.empty()) {
            JSAMPROW row_ptr = image.row(y);
            jpeg_read_scanlines(&cinfo, &row_ptr, 1);
            continue;
        }
        JSAMPROW row_ptr = cmyk_row.data();
        jpeg_read_scanlines(&cinfo, &row_ptr, 1);
        std::uint8_t* dst = image.row(y);
        for (int x = 0; x < width; ++x) {
            // adobe writes inverted CMYK
            const int k = cmyk_row[x * 4 + 3];
            dst[x * 3 + 0] = static_cast<std::uint8_t>(cmyk_row[x * 4 + 0] * k / 255);
            dst[x * 3 + 1] = static_cast<std::uint8_t>(cmyk_row[x * 4 + 1] * k / 255);
            dst[x * 3 + 2] = static_cast<std::uint8_t>(cmyk_row[x * 4 + 2] * k / 255);
        }
    }
    jpeg_finish_decompress(&cinfo);

    if (cinfo.saw_JFIF_marker && cinfo.X_density > 0 && cinfo.Y_density > 0) {
        if (cinfo.density_unit == 1) {
            image.set_resolution(cinfo.X_density, cinfo.Y_density);
        } else if (cinfo.density_unit == 2) {
            image.set_resolution(cinfo.X_density * 2.54, cinfo.Y_density * 2.54);
        }
    }
    image.set_original_file_format(ImageFileFormat::Jpeg);
    image.update_logical_pixel_format();
    return image;
}

std::vector<std::uint8_t> encode_jpeg(const MemoryImage& image, const int quality) {
    const bool gray = image.channels() == 1;
    if (!gray && image.channels() != 3) {
        throw std::invalid_argument("JPEG encoding requires Gray8 or RGB24 samples");
    }

    jpeg_compress_struct cinfo{};
    JpegErrorMgr jerr{};
    cinfo.err = jpeg_std_error(&jerr.pub);
    jerr.pub.error_exit = jpeg_error_exit_throw;
    jerr.pub.output_message = jpeg_output_message_log;

    unsigned char* out_buffer = nullptr;
    unsigned long out_size = 0;
    jpeg_create_compress(&cinfo);
    CompressGuard guard{&cinfo, &out_buffer};

    jpeg_mem_dest(&cinfo, &out_buffer, &out_size);
    cinfo.image_width = static_cast<JDIMENSION>(image.width());
    cinfo.image_height = static_cast<JDIMENSION>(image.height());
    cinfo.input_components = image.channels();
    cinfo.in_color_space = gray ? JCS_GRAYSCALE : JCS_RGB;
    jpeg_set_defaults(&cinfo);
    jpeg_set_quality(&cinfo, quality, TRUE);
    cinfo.optimize_coding = TRUE;

    if (image.horizontal_dpi() > 0 && image.vertical_dpi() > 0) {
        cinfo.write_JFIF_header = TRUE;
        cinfo.density_unit = 1;
        cinfo.X_density = static_cast<UINT16>(image.horizontal_dpi() + 0.5);
        cinfo.Y_density = static_cast<UINT16>(image.vertical_dpi() + 0.5);
    }

    jpeg_start_compress(&cinfo, TRUE);
    while (cinfo.next_scanline < cinfo.image_height) {
        auto row_ptr = const_cast<JSAMPROW>(image.row(static_cast<int>(cinfo.next_scanline)));
        jpeg_write_scanlines(&cinfo, &row_ptr, 1);
    }
    jpeg_finish_compress(&cinfo);

    return {out_buffer, out_buffer + out_size};
}

} // namespace pagesmith
