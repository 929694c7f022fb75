#include "../../include/page_image.hpp"
#include "../../include/file_utils.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <stdexcept>

namespace pagesmith {

namespace {

    // FNV-1a, 64 bit
    std::uint64_t hash_bytes(const std::uint8_t *data, const std::size_t size, std::uint64_t h = 1469598103934665603ULL) {
        for (std::size_t i = 0; i < size; ++i) {
            h ^= data[i];
            h *= 1099511628211ULL;
        }
        return h;
    }

    std::string hex64(const std::uint64_t v) {
        char buf[17];
        std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(v));
        return buf;
    }

    std::string lowercase(std::string s) {
        std::ranges::transform(s, s.begin(), [](const unsigned char c) { return static_cast<char>(std::tolower(c)); });
        return s;
    }

} // namespace

std::string lowercase_extension(const std::filesystem::path &path) {
    return lowercase(path.extension().string());
}

PageImage::PageImage(ImageStorage storage, ImageMetadata metadata, const bool transformed, const int pdf_page_index)
    : storage_(std::move(storage)),
      metadata_(std::move(metadata)),
      transformed_(transformed),
      pdf_page_index_(pdf_page_index) {
    if (pdf_page_index_ < 0) {
        throw std::invalid_argument("PDF page index must not be negative");
    }
    if (const auto *mem = std::get_if<ImageMemoryStorage>(&storage_); mem && !mem->data) {
        throw std::invalid_argument("Memory storage without data");
    }
    if (const auto *ren = std::get_if<RenderedImageStorage>(&storage_); ren && (!ren->image || ren->image->empty())) {
        throw std::invalid_argument("Rendered storage without pixels");
    }
}

PageImage PageImage::from_file(std::filesystem::path path, ImageMetadata metadata) {
    return PageImage(ImageFileStorage{std::move(path)}, std::move(metadata));
}

PageImage PageImage::from_pdf_page(std::filesystem::path path, const int page_index, ImageMetadata metadata) {
    return PageImage(ImageFileStorage{std::move(path)}, std::move(metadata), false, page_index);
}

PageImage PageImage::from_memory(std::vector<std::uint8_t> data, std::string type_hint, ImageMetadata metadata) {
    return PageImage(ImageMemoryStorage{std::make_shared<const std::vector<std::uint8_t>>(std::move(data)),
                                        lowercase(std::move(type_hint))},
                     std::move(metadata));
}

PageImage PageImage::from_rendered(MemoryImage image, ImageMetadata metadata) {
    return PageImage(RenderedImageStorage{std::make_shared<const MemoryImage>(std::move(image))},
                     std::move(metadata), true);
}

bool PageImage::is_pdf() const {
    if (const auto *file = std::get_if<ImageFileStorage>(&storage_)) {
        return lowercase_extension(file->path) == ".pdf";
    }
    if (const auto *mem = std::get_if<ImageMemoryStorage>(&storage_)) {
        return mem->type_hint == ".pdf";
    }
    return false;
}

bool PageImage::is_untransformed_jpeg_file() const {
    if (transformed_) return false;
    const auto *file = std::get_if<ImageFileStorage>(&storage_);
    if (!file) return false;
    const auto ext = lowercase_extension(file->path);
    return ext == ".jpg" || ext == ".jpeg";
}

std::string PageImage::content_identity() const {
    std::string id;
    if (const auto *file = std::get_if<ImageFileStorage>(&storage_)) {
        std::error_code ec;
        const auto canonical = std::filesystem::weakly_canonical(file->path, ec);
        const auto size = std::filesystem::file_size(file->path, ec);
        const auto mtime = std::filesystem::last_write_time(file->path, ec);
        id = "file:" + (canonical.empty() ? file->path : canonical).string()
             + ":" + std::to_string(ec ? 0 : size)
             + ":" + std::to_string(ec ? 0 : mtime.time_since_epoch().count());
    } else if (const auto *mem = std::get_if<ImageMemoryStorage>(&storage_)) {
        id = "mem:" + hex64(hash_bytes(mem->data->data(), mem->data->size())) + ":" + std::to_string(mem->data->size());
    } else {
        const auto &img = *std::get<RenderedImageStorage>(storage_).image;
        auto h = hash_bytes(img.pixels().data(), img.pixels().size());
        id = "px:" + hex64(h) + ":" + std::to_string(img.width()) + "x" + std::to_string(img.height())
             + ":" + std::to_string(static_cast<int>(img.pixel_format()));
    }
    if (transformed_) id += ":t";
    return id + "#" + std::to_string(pdf_page_index_);
}

MemoryImage PageImage::load() const {
    if (is_pdf()) {
        throw std::logic_error("PDF pages are rasterized through SourceDocument, not decoded");
    }
    if (const auto *ren = std::get_if<RenderedImageStorage>(&storage_)) {
        return *ren->image;
    }
    const auto data = encoded_bytes();
    try {
        return MemoryImage::load(std::span<const std::uint8_t>(data));
    } catch (const std::exception &e) {
        throw std::runtime_error("Cannot decode " + describe() + ": " + e.what());
    }
}

std::vector<std::uint8_t> PageImage::encoded_bytes() const {
    if (const auto *file = std::get_if<ImageFileStorage>(&storage_)) {
        return read_file(file->path);
    }
    if (const auto *mem = std::get_if<ImageMemoryStorage>(&storage_)) {
        return *mem->data;
    }
    throw std::logic_error("Rendered pages have no encoded bytes");
}

std::string PageImage::describe() const {
    if (const auto *file = std::get_if<ImageFileStorage>(&storage_)) {
        return is_pdf() ? file->path.string() + " (page " + std::to_string(pdf_page_index_ + 1) + ")"
                        : file->path.string();
    }
    if (const auto *mem = std::get_if<ImageMemoryStorage>(&storage_)) {
        return "<memory" + mem->type_hint + ", " + std::to_string(mem->data->size()) + " bytes>";
    }
    const auto &img = *std::get<RenderedImageStorage>(storage_).image;
    return "<rendered " + std::to_string(img.width()) + "x" + std::to_string(img.height()) + ">";
}

} // namespace pagesmith
