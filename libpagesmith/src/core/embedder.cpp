#include "../../include/embedder.hpp"
#include "../../include/logger.hpp"
#include "../../include/source_pdf.hpp"
#include <stdexcept>
#include <string>

namespace pagesmith {

ImageExportFormat choose_export_format(const MemoryImage &image, const ImageMetadata &metadata) {
    const auto logical = image.logical_pixel_format();
    if (metadata.bit_depth == BitDepth::BlackAndWhite || logical == ImagePixelFormat::BW1) {
        return {ImageFileFormat::Png, ImagePixelFormat::BW1};
    }
    if (logical == ImagePixelFormat::ARGB32) {
        return {ImageFileFormat::Png, ImagePixelFormat::ARGB32};
    }
    if (metadata.lossless) {
        return {ImageFileFormat::Png, logical == ImagePixelFormat::Gray8 ? ImagePixelFormat::Gray8 : ImagePixelFormat::RGB24};
    }
    if (metadata.bit_depth == BitDepth::Grayscale || logical == ImagePixelFormat::Gray8) {
        return {ImageFileFormat::Jpeg, ImagePixelFormat::Gray8};
    }
    return {ImageFileFormat::Jpeg, ImagePixelFormat::RGB24};
}

std::unique_ptr<IEmbedder> select_embedder(const PageImage &page, const SourceDocument *source) {
    if (page.is_untransformed_jpeg_file()) {
        const auto &path = std::get<ImageFileStorage>(page.storage()).path;
        if (const auto header = read_jpeg_header(path)) {
            if (header->components == 3) {
                return std::make_unique<DirectJpegEmbedder>(path, *header);
            }
            Logger::log(LogLevel::Debug,
                        path.filename().string() + " has " + std::to_string(header->components)
                        + " component(s), re-encoding", "embedder");
        }
    }
    if (const auto *rendered = std::get_if<RenderedImageStorage>(&page.storage())) {
        return std::make_unique<RenderedImageEmbedder>(rendered->image);
    }
    if (page.is_pdf()) {
        if (source) {
            return std::make_unique<RenderedImageEmbedder>(source->rasterize(page.pdf_page_index()));
        }
        const auto opened = SourceDocument::open(page);
        return std::make_unique<RenderedImageEmbedder>(opened->rasterize(page.pdf_page_index()));
    }
    return std::make_unique<RenderedImageEmbedder>(page.load());
}

// --- DirectJpegEmbedder ---

DirectJpegEmbedder::DirectJpegEmbedder(const std::filesystem::path &path, const JpegHeader &header)
    : path_(path), header_(header), file_(open_file(path, "rb")) {
    if (!file_) {
        throw std::runtime_error("Cannot open JPEG file: " + path.string());
    }
}

std::vector<std::uint8_t> DirectJpegEmbedder::read_all() {
    if (!file_) {
        throw std::logic_error("Embedder already released: " + path_.string());
    }
    if (std::fseek(file_.get(), 0, SEEK_END) != 0) {
        throw std::runtime_error("Cannot seek in " + path_.string());
    }
    const long size = std::ftell(file_.get());
    if (size < 0 || std::fseek(file_.get(), 0, SEEK_SET) != 0) {
        throw std::runtime_error("Cannot seek in " + path_.string());
    }
    std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
    if (size > 0 && std::fread(data.data(), 1, data.size(), file_.get()) != data.size()) {
        throw std::runtime_error("Short read from " + path_.string());
    }
    return data;
}

ImageExportFormat DirectJpegEmbedder::prepare_for_export(const ImageMetadata &) {
    return {ImageFileFormat::Jpeg, ImagePixelFormat::RGB24};
}

void DirectJpegEmbedder::copy_to_stream(std::ostream &out) {
    const auto data = read_all();
    out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    if (!out) {
        throw std::runtime_error("Failed to copy " + path_.string());
    }
}

PdfImageData DirectJpegEmbedder::pdf_image(bool) {
    PdfImageData img;
    img.width = header_.width;
    img.height = header_.height;
    img.encoding = ImageFileFormat::Jpeg;
    img.components = header_.components;
    img.data = read_all();
    return img;
}

// --- RenderedImageEmbedder ---

RenderedImageEmbedder::RenderedImageEmbedder(MemoryImage image)
    : RenderedImageEmbedder(std::make_shared<const MemoryImage>(std::move(image))) {
}

RenderedImageEmbedder::RenderedImageEmbedder(std::shared_ptr<const MemoryImage> image)
    : image_(std::move(image)) {
    if (!image_ || image_->empty()) {
        throw std::invalid_argument("RenderedImageEmbedder needs pixels");
    }
    width_ = image_->width();
    height_ = image_->height();
    dpi_x_ = image_->horizontal_dpi();
    dpi_y_ = image_->vertical_dpi();
    original_format_ = image_->original_file_format();
}

const MemoryImage &RenderedImageEmbedder::image() const {
    if (!image_) {
        throw std::logic_error("Embedder already released");
    }
    return *image_;
}

ImageExportFormat RenderedImageEmbedder::prepare_for_export(const ImageMetadata &metadata) {
    const auto format = choose_export_format(image(), metadata);
    if (format.pixel_format == ImagePixelFormat::BW1 && image().pixel_format() != ImagePixelFormat::BW1) {
        image_ = std::make_shared<const MemoryImage>(image().to_black_white());
    }
    format_ = format;
    return format;
}

std::string_view RenderedImageEmbedder::stream_extension() const {
    return original_format_ == ImageFileFormat::Png ? ".png" : ".jpg";
}

void RenderedImageEmbedder::copy_to_stream(std::ostream &out) {
    if (original_format_ == ImageFileFormat::Png) {
        image().save(out, ImageFileFormat::Png);
    } else {
        image().save(out, ImageFileFormat::Jpeg, ImagePixelFormat::RGB24, kJpegQuality);
    }
}

PdfImageData RenderedImageEmbedder::pdf_image(const bool flatten_alpha) {
    if (!format_) {
        prepare_for_export({});
    }
    const auto &src = image();
    PdfImageData img;
    img.width = src.width();
    img.height = src.height();

    if (format_->file_format == ImageFileFormat::Jpeg) {
        img.encoding = ImageFileFormat::Jpeg;
        img.components = format_->pixel_format == ImagePixelFormat::Gray8 ? 1 : 3;
        img.data = src.encode(ImageFileFormat::Jpeg, format_->pixel_format, kJpegQuality);
        return img;
    }

    img.encoding = ImageFileFormat::Png;
    switch (format_->pixel_format) {
        case ImagePixelFormat::BW1:
            img.components = 1;
            img.bits_per_component = 1;
            img.data = src.pack_bits();
            break;
        case ImagePixelFormat::Gray8:
            img.components = 1;
            img.data = src.convert(ImagePixelFormat::Gray8).pixels();
            break;
        case ImagePixelFormat::ARGB32:
            img.components = 3;
            if (flatten_alpha) {
                img.data = src.convert(ImagePixelFormat::RGB24).pixels();
                break;
            }
            // an SMask needs the colour samples without premultiplication
            img.alpha = src.alpha_channel();
            img.data.reserve(static_cast<std::size_t>(src.width()) * src.height() * 3);
            for (int y = 0; y < src.height(); ++y) {
                const std::uint8_t *p = src.row(y);
                for (int x = 0; x < src.width(); ++x, p += 4) {
                    img.data.insert(img.data.end(), p, p + 3);
                }
            }
            break;
        default:
            img.components = 3;
            img.data = src.convert(ImagePixelFormat::RGB24).pixels();
            break;
    }
    return img;
}

} // namespace pagesmith
