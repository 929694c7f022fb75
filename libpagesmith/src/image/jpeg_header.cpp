#include "../../include/jpeg_header.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <jpeglib.h>
#include <stdexcept>
#include <string>

namespace pagesmith {

namespace {

    void probe_error_exit(const j_common_ptr cinfo) {
        char buffer[JMSG_LENGTH_MAX];
        (*cinfo->err->format_message)(cinfo, buffer);
        throw std::runtime_error(buffer);
    }

    void probe_output_message(j_common_ptr) {}

    struct ProbeGuard {
        jpeg_decompress_struct *cinfo;
        ~ProbeGuard() { jpeg_destroy_decompress(cinfo); }
    };

} // namespace

std::optional<JpegHeader> read_jpeg_header(const std::span<const std::uint8_t> data) {
    if (data.size() < 3 || data[0] != 0xFF || data[1] != 0xD8 || data[2] != 0xFF) {
        return std::nullopt;
    }

    jpeg_decompress_struct cinfo{};
    jpeg_error_mgr jerr{};
    cinfo.err = jpeg_std_error(&jerr);
    jerr.error_exit = probe_error_exit;
    jerr.output_message = probe_output_message;

    jpeg_create_decompress(&cinfo);
    ProbeGuard guard{&cinfo};
    try {
        jpeg_mem_src(&cinfo, data.data(), static_cast<unsigned long>(data.size()));
        jpeg_read_header(&cinfo, TRUE);
    } catch (const std::exception &e) {
        Logger::log(LogLevel::Debug, std::string("Not a readable JPEG header: ") + e.what(), "jpeg_header");
        return std::nullopt;
    }

    JpegHeader header;
    header.width = static_cast<int>(cinfo.image_width);
    header.height = static_cast<int>(cinfo.image_height);
    header.components = cinfo.num_components;
    if (cinfo.saw_JFIF_marker && cinfo.X_density > 0 && cinfo.Y_density > 0) {
        if (cinfo.density_unit == 1) {
            header.dpi_x = cinfo.X_density;
            header.dpi_y = cinfo.Y_density;
        } else if (cinfo.density_unit == 2) {
            header.dpi_x = cinfo.X_density * 2.54;
            header.dpi_y = cinfo.Y_density * 2.54;
        }
    }
    return header;
}

std::optional<JpegHeader> read_jpeg_header(const std::filesystem::path &path) {
    std::vector<std::uint8_t> data;
    try {
        data = read_file(path);
    } catch (const std::exception &e) {
        Logger::log(LogLevel::Warning, std::string("Cannot probe JPEG header: ") + e.what(), "jpeg_header");
        return std::nullopt;
    }
    return read_jpeg_header(std::span<const std::uint8_t>(data));
}

} // namespace pagesmith
