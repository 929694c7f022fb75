#include "../../include/memory_image.hpp"
#include "../../include/file_utils.hpp"
#include "../../include/logger.hpp"
#include <stdexcept>
#include <string>

namespace pagesmith {

namespace {

int channels_for(const ImagePixelFormat format) {
    switch (format) {
        case ImagePixelFormat::BW1:
        case ImagePixelFormat::Gray8:  return 1;
        case ImagePixelFormat::RGB24:  return 3;
        case ImagePixelFormat::ARGB32: return 4;
        case ImagePixelFormat::Unsupported: break;
    }
    throw std::invalid_argument("Unsupported pixel format");
}

// standard weights for grayscale conversion, scaled by 1000
inline int luma1000(const std::uint8_t r, const std::uint8_t g, const std::uint8_t b) {
    return r * 299 + g * 587 + b * 114;
}

inline std::uint8_t over_white(const std::uint8_t c, const std::uint8_t a) {
    return static_cast<std::uint8_t>((c * a + 255 * (255 - a) + 127) / 255);
}

} // namespace

std::string_view extension_for(const ImageFileFormat format) noexcept {
    switch (format) {
        case ImageFileFormat::Jpeg: return ".jpg";
        case ImageFileFormat::Png:  return ".png";
        case ImageFileFormat::Pdf:  return ".pdf";
        case ImageFileFormat::Unspecified: break;
    }
    return "";
}

MemoryImage::MemoryImage(const int width, const int height, const ImagePixelFormat format)
    : width_(width),
      height_(height),
      channels_(channels_for(format)),
      pixel_format_(format),
      logical_format_(format) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Image dimensions must be positive");
    }
    pixels_.assign(stride() * height_, 0xFF);
}

MemoryImage MemoryImage::load(const std::filesystem::path& path) {
    const auto data = read_file(path);
    try {
        return load(std::span<const std::uint8_t>(data));
    } catch (const std::exception& e) {
        Logger::log(LogLevel::Error, "Cannot decode image " + path.string() + ": " + e.what(), "memory_image");
        throw;
    }
}

MemoryImage MemoryImage::load(const std::span<const std::uint8_t> data) {
    if (data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF) {
        return decode_jpeg(data);
    }
    if (data.size() >= 8 && data[0] == 0x89 && data[1] == 0x50 && data[2] == 0x4E && data[3] == 0x47) {
        return decode_png(data);
    }
    throw std::runtime_error("Unknown image format");
}

void MemoryImage::update_logical_pixel_format() {
    if (pixels_.empty()) {
        logical_format_ = ImagePixelFormat::Unsupported;
        return;
    }
    bool opaque = true;
    bool gray = true;
    bool bw = true;
    for (int y = 0; y < height_; ++y) {
        const std::uint8_t* p = row(y);
        for (int x = 0; x < width_; ++x, p += channels_) {
            if (channels_ == 4 && p[3] != 0xFF) opaque = false;
            if (channels_ >= 3 && (p[0] != p[1] || p[1] != p[2])) gray = false;
            if (p[0] != 0 && p[0] != 0xFF) bw = false;
        }
        if (!opaque && !gray) break;
    }
    if (channels_ == 4 && !opaque) {
        logical_format_ = ImagePixelFormat::ARGB32;
    } else if (!gray) {
        logical_format_ = ImagePixelFormat::RGB24;
    } else if (bw) {
        logical_format_ = ImagePixelFormat::BW1;
    } else {
        logical_format_ = ImagePixelFormat::Gray8;
    }
}

MemoryImage MemoryImage::to_black_white(const int threshold) const {
    MemoryImage out(width_, height_, ImagePixelFormat::BW1);
    out.set_resolution(dpi_x_, dpi_y_);
    out.original_format_ = original_format_;
    const MemoryImage rgb = pixel_format_ == ImagePixelFormat::RGB24 ? *this : convert(ImagePixelFormat::RGB24);
    for (int y = 0; y < height_; ++y) {
        const std::uint8_t* src = rgb.row(y);
        std::uint8_t* dst = out.row(y);
        for (int x = 0; x < width_; ++x, src += 3) {
            dst[x] = luma1000(src[0], src[1], src[2]) >= threshold * 1000 ? 0xFF : 0x00;
        }
    }
    return out;
}

MemoryImage MemoryImage::convert(const ImagePixelFormat target) const {
    if (target == pixel_format_) {
        return *this;
    }
    if (target == ImagePixelFormat::BW1) {
        return to_black_white();
    }
    MemoryImage out(width_, height_, target);
    out.set_resolution(dpi_x_, dpi_y_);
    out.original_format_ = original_format_;
    for (int y = 0; y < height_; ++y) {
        const std::uint8_t* src = row(y);
        std::uint8_t* dst = out.row(y);
        for (int x = 0; x < width_; ++x, src += channels_, dst += out.channels_) {
            std::uint8_t r, g, b, a = 0xFF;
            if (channels_ == 1) {
                r = g = b = src[0];
            } else {
                r = src[0];
                g = src[1];
                b = src[2];
                if (channels_ == 4) a = src[3];
            }
            if (target == ImagePixelFormat::ARGB32) {
                dst[0] = r;
                dst[1] = g;
                dst[2] = b;
                dst[3] = a;
                continue;
            }
            if (a != 0xFF) {
                r = over_white(r, a);
                g = over_white(g, a);
                b = over_white(b, a);
            }
            if (target == ImagePixelFormat::Gray8) {
                dst[0] = static_cast<std::uint8_t>((luma1000(r, g, b) + 500) / 1000);
            } else {
                dst[0] = r;
                dst[1] = g;
                dst[2] = b;
            }
        }
    }
    out.update_logical_pixel_format();
    return out;
}

std::vector<std::uint8_t> MemoryImage::alpha_channel() const {
    if (channels_ != 4) {
        throw std::logic_error("alpha_channel() requires an ARGB32 image");
    }
    std::vector<std::uint8_t> alpha;
    alpha.reserve(static_cast<std::size_t>(width_) * height_);
    for (int y = 0; y < height_; ++y) {
        const std::uint8_t* p = row(y);
        for (int x = 0; x < width_; ++x, p += 4) {
            alpha.push_back(p[3]);
        }
    }
    return alpha;
}

std::vector<std::uint8_t> MemoryImage::pack_bits() const {
    if (channels_ != 1) {
        throw std::logic_error("pack_bits() requires a single channel image");
    }
    const std::size_t packed_stride = (static_cast<std::size_t>(width_) + 7) / 8;
    std::vector<std::uint8_t> packed(packed_stride * height_, 0);
    for (int y = 0; y < height_; ++y) {
        const std::uint8_t* src = row(y);
        std::uint8_t* dst = packed.data() + packed_stride * y;
        for (int x = 0; x < width_; ++x) {
            if (src[x] >= 0x80) {
                dst[x >> 3] |= static_cast<std::uint8_t>(0x80 >> (x & 7));
            }
        }
    }
    return packed;
}

std::vector<std::uint8_t> MemoryImage::encode(const ImageFileFormat format,
                                              const ImagePixelFormat pixel_format_hint,
                                              const int jpeg_quality) const {
    if (pixels_.empty()) {
        throw std::logic_error("Cannot encode an empty image");
    }
    ImagePixelFormat target = pixel_format_hint == ImagePixelFormat::Unsupported ? pixel_format_ : pixel_format_hint;
    switch (format) {
        case ImageFileFormat::Jpeg: {
            // JPEG has no alpha or 1-bit mode
            if (target == ImagePixelFormat::ARGB32) target = ImagePixelFormat::RGB24;
            if (target == ImagePixelFormat::BW1) target = ImagePixelFormat::Gray8;
            if (target == pixel_format_ ||
                (pixel_format_ == ImagePixelFormat::BW1 && target == ImagePixelFormat::Gray8)) {
                return encode_jpeg(*this, jpeg_quality);
            }
            return encode_jpeg(convert(target), jpeg_quality);
        }
        case ImageFileFormat::Png:
            return target == pixel_format_ ? encode_png(*this) : encode_png(convert(target));
        default:
            break;
    }
    throw std::invalid_argument("Images can only be encoded as JPEG or PNG");
}

void MemoryImage::save(std::ostream& out,
                       const ImageFileFormat format,
                       const ImagePixelFormat pixel_format_hint,
                       const int jpeg_quality) const {
    const auto data = encode(format, pixel_format_hint, jpeg_quality);
    out.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("Failed to write encoded image");
    }
}

} // namespace pagesmith
