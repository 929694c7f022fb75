#include "../../include/passthrough_merger.hpp"
#include "../../include/logger.hpp"
#include "../../include/native_pdf.hpp"
#include "../../include/text_layout.hpp"
#include <algorithm>
#include <stdexcept>

namespace pagesmith {

bool merge_passthrough_pages(std::vector<std::uint8_t> generated,
                             std::vector<PassthroughPage> pages,
                             const PdfExportParams &params,
                             const std::shared_ptr<const TrueTypeFont> &font,
                             std::ostream &out,
                             const std::stop_token stop) {
    std::sort(pages.begin(), pages.end(),
              [](const PassthroughPage &a, const PassthroughPage &b) { return a.index < b.index; });

    const bool any_text = std::any_of(pages.begin(), pages.end(),
                                      [](const PassthroughPage &p) { return p.ocr.has_value(); });
    if (any_text && !font) {
        throw NoEmbeddableFontError("OCR text on imported pages needs an embeddable font");
    }

    const std::string password = params.encryption.enabled() ? params.encryption.edit_password() : std::string();

    auto session = NativePdfLibrary::instance().acquire();
    auto doc = session.open(std::move(generated), password, params.compat, any_text ? font : nullptr);

    for (const auto &p : pages) {
        if (stop.stop_requested()) {
            Logger::log(LogLevel::Info, "Merge cancelled", "passthrough_merger");
            return false;
        }
        if (!p.image) {
            throw std::invalid_argument("Passthrough page without image");
        }
        const int index = static_cast<int>(p.index);
        doc->remove_page(index);
        doc->import_page(*p.image, p.image->pdf_page_index(), index);

        if (p.ocr) {
            // OCR saw the page as rendered: cropped and rotated
            const auto view = doc->page_view(index);
            const auto text = layout_ocr_text(*p.ocr, view.width(), view.height(), *font);
            doc->add_text(index, text);
        }
        Logger::log(LogLevel::Debug, "Imported " + p.image->describe() + " as page " + std::to_string(index + 1),
                    "passthrough_merger");
    }
    if (stop.stop_requested()) {
        return false;
    }

    doc->save(out);
    return true;
}

} // namespace pagesmith
