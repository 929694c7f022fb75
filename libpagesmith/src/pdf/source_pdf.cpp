#include "../../include/source_pdf.hpp"
#include "../../include/logger.hpp"
#include "../../include/truetype_font.hpp"
#include <poppler-document.h>
#include <poppler-image.h>
#include <poppler-page-renderer.h>
#include <poppler-page.h>
#include <unicode/uchar.h>
#include <algorithm>
#include <stdexcept>

namespace pagesmith {

bool has_visible_text(const std::string_view utf8) {
    const auto codepoints = utf8_to_codepoints(utf8);
    return std::any_of(codepoints.begin(), codepoints.end(), [](const char32_t c) {
        const auto cp = static_cast<UChar32>(c);
        return !u_isUWhiteSpace(cp) && u_charType(cp) != U_FORMAT_CHAR && u_charType(cp) != U_CONTROL_CHAR;
    });
}

SourceDocument::SourceDocument(const std::filesystem::path &path)
    : doc_(poppler::document::load_from_file(path.string())) {
    check_loaded(path.string());
}

SourceDocument::SourceDocument(std::shared_ptr<const std::vector<std::uint8_t>> data)
    : data_(std::move(data)) {
    if (!data_ || data_->empty()) {
        throw std::runtime_error("Empty PDF data");
    }
    doc_.reset(poppler::document::load_from_raw_data(reinterpret_cast<const char *>(data_->data()),
                                                     static_cast<int>(data_->size())));
    check_loaded("in-memory PDF");
}

SourceDocument::~SourceDocument() = default;

std::unique_ptr<SourceDocument> SourceDocument::open(const PageImage &page) {
    if (const auto *file = std::get_if<ImageFileStorage>(&page.storage())) {
        return std::make_unique<SourceDocument>(file->path);
    }
    if (const auto *memory = std::get_if<ImageMemoryStorage>(&page.storage())) {
        return std::make_unique<SourceDocument>(memory->data);
    }
    throw std::invalid_argument("Rendered pages have no source PDF");
}

void SourceDocument::check_loaded(const std::string &what) const {
    if (!doc_) {
        throw std::runtime_error("Failed to load PDF: " + what);
    }
    if (doc_->is_locked()) {
        throw std::runtime_error("PDF is password protected: " + what);
    }
}

void SourceDocument::check_index(const int index) const {
    if (index < 0 || index >= doc_->pages()) {
        throw std::out_of_range("PDF page " + std::to_string(index) + " out of range (" +
                                std::to_string(doc_->pages()) + " pages)");
    }
}

int SourceDocument::page_count() const {
    return doc_->pages();
}

std::string SourceDocument::page_text(const int index) const {
    check_index(index);
    const std::unique_ptr<poppler::page> page(doc_->create_page(index));
    if (!page) {
        throw std::runtime_error("Failed to create PDF page " + std::to_string(index));
    }
    const poppler::byte_array utf8 = page->text().to_utf8();
    return {utf8.begin(), utf8.end()};
}

bool SourceDocument::has_text(const int index) const {
    return has_visible_text(page_text(index));
}

MemoryImage SourceDocument::rasterize(const int index, const double dpi) const {
    check_index(index);
    const std::unique_ptr<poppler::page> page(doc_->create_page(index));
    if (!page) {
        throw std::runtime_error("Failed to create PDF page " + std::to_string(index));
    }

    poppler::page_renderer renderer;
    renderer.set_render_hint(poppler::page_renderer::antialiasing, true);
    renderer.set_render_hint(poppler::page_renderer::text_antialiasing, true);
    renderer.set_image_format(poppler::image::format_argb32);

    const poppler::image rendered = renderer.render_page(page.get(), dpi, dpi);
    if (!rendered.is_valid() || rendered.width() <= 0 || rendered.height() <= 0) {
        throw std::runtime_error("Failed to render PDF page " + std::to_string(index));
    }

    // argb32 is stored as native-endian words, i.e. B, G, R, A bytes
    MemoryImage image(rendered.width(), rendered.height(), ImagePixelFormat::RGB24);
    for (int y = 0; y < rendered.height(); ++y) {
        const auto *src = reinterpret_cast<const std::uint8_t *>(rendered.const_data()) +
                          static_cast<std::size_t>(rendered.bytes_per_row()) * y;
        std::uint8_t *dst = image.row(y);
        for (int x = 0; x < rendered.width(); ++x, src += 4, dst += 3) {
            dst[0] = src[2];
            dst[1] = src[1];
            dst[2] = src[0];
        }
    }
    image.set_resolution(dpi, dpi);
    image.update_logical_pixel_format();
    Logger::log(LogLevel::Debug,
                "Rasterized PDF page " + std::to_string(index) + " at " + std::to_string(static_cast<int>(dpi)) + " dpi",
                "source_pdf");
    return image;
}

} // namespace pagesmith
