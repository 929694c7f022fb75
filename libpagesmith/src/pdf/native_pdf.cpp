#include "../../include/native_pdf.hpp"
#include "../../include/logger.hpp"
#include "../../include/page_geometry.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>

namespace pagesmith {

int normalize_rotation(const long long degrees) {
    const long long quarter = ((degrees % 360) + 360) % 360;
    return static_cast<int>(quarter - quarter % 90);
}

std::string PageView::text_matrix(const double dx, const double dy) const {
    const double llx = x;
    const double lly = y;
    const double urx = x + box_width;
    const double ury = y + box_height;
    switch (rotate) {
        case 90:
            return "0 1 -1 0 " + format_points(llx + dy) + " " + format_points(lly + dx);
        case 180:
            return "-1 0 0 -1 " + format_points(urx - dx) + " " + format_points(lly + dy);
        case 270:
            return "0 -1 1 0 " + format_points(urx - dy) + " " + format_points(ury - dx);
        default:
            return "1 0 0 1 " + format_points(llx + dx) + " " + format_points(ury - dy);
    }
}

// --- NativePdfLibrary ---

NativePdfLibrary &NativePdfLibrary::instance() {
    static NativePdfLibrary library;
    return library;
}

NativePdfLibrary::Session NativePdfLibrary::acquire() {
    return Session(mtx_);
}

std::unique_ptr<NativeDocument> NativePdfLibrary::Session::open(std::vector<std::uint8_t> data,
                                                                const std::string &password,
                                                                const PdfCompat compat,
                                                                std::shared_ptr<const TrueTypeFont> font) const {
    return std::unique_ptr<NativeDocument>(new NativeDocument(std::move(data), password, compat, std::move(font)));
}

// --- NativeDocument ---

NativeDocument::NativeDocument(std::vector<std::uint8_t> data, const std::string &password,
                               const PdfCompat compat, std::shared_ptr<const TrueTypeFont> font)
    : data_(std::move(data)), pdf_(std::make_unique<QPDF>()), compat_(compat), font_(std::move(font)) {
    log_bridge_.attach(*pdf_);
    pdf_->processMemoryFile("generated document",
                            reinterpret_cast<const char *>(data_.data()), data_.size(),
                            password.empty() ? nullptr : password.c_str());
    if (font_) {
        embedded_font_ = std::make_unique<EmbeddedFont>(*pdf_, font_, compat_);
    }
}

NativeDocument::~NativeDocument() = default;

int NativeDocument::page_count() const {
    return static_cast<int>(QPDFPageDocumentHelper(*pdf_).getAllPages().size());
}

QPDFPageObjectHelper NativeDocument::page(const int index) const {
    auto pages = QPDFPageDocumentHelper(*pdf_).getAllPages();
    if (index < 0 || static_cast<std::size_t>(index) >= pages.size()) {
        throw std::out_of_range("Page " + std::to_string(index) + " out of range");
    }
    return pages[static_cast<std::size_t>(index)];
}

void NativeDocument::remove_page(const int index) {
    QPDFPageDocumentHelper(*pdf_).removePage(page(index));
}

QPDF &NativeDocument::open_source(const PageImage &page) {
    std::string key;
    if (const auto *file = std::get_if<ImageFileStorage>(&page.storage())) {
        key = "file:" + file->path.string();
    } else if (const auto *memory = std::get_if<ImageMemoryStorage>(&page.storage())) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%p", static_cast<const void *>(memory->data.get()));
        key = std::string("memory:") + buf;
    } else {
        throw std::invalid_argument("Rendered pages cannot be imported");
    }

    if (const auto it = sources_.find(key); it != sources_.end()) {
        return *it->second;
    }

    auto source = std::make_unique<QPDF>();
    log_bridge_.attach(*source);
    if (const auto *file = std::get_if<ImageFileStorage>(&page.storage())) {
        source->processFile(file->path.string().c_str());
    } else {
        const auto &memory = std::get<ImageMemoryStorage>(page.storage());
        source_data_.push_back(memory.data);
        source->processMemoryFile(page.describe().c_str(),
                                  reinterpret_cast<const char *>(memory.data->data()), memory.data->size());
    }
    return *sources_.emplace(key, std::move(source)).first->second;
}

void NativeDocument::import_page(const PageImage &source, const int source_index, const int index) {
    auto &src = open_source(source);
    auto src_pages = QPDFPageDocumentHelper(src).getAllPages();
    if (source_index < 0 || static_cast<std::size_t>(source_index) >= src_pages.size()) {
        throw std::out_of_range(source.describe() + ": page " + std::to_string(source_index + 1) +
                                " does not exist");
    }
    QPDFPageDocumentHelper helper(*pdf_);
    auto pages = helper.getAllPages();
    if (index < 0 || static_cast<std::size_t>(index) > pages.size()) {
        throw std::out_of_range("Insert position " + std::to_string(index) + " out of range");
    }
    // foreign pages are copied by addPage/addPageAt
    if (static_cast<std::size_t>(index) == pages.size()) {
        helper.addPage(src_pages[static_cast<std::size_t>(source_index)], false);
    } else {
        helper.addPageAt(src_pages[static_cast<std::size_t>(source_index)], true, pages[static_cast<std::size_t>(index)]);
    }
}

PageView NativeDocument::page_view(const int index) const {
    auto target = page(index);
    const auto rect = target.getCropBox().getArrayAsRectangle();
    PageView view;
    view.x = std::min(rect.llx, rect.urx);
    view.y = std::min(rect.lly, rect.ury);
    view.box_width = std::abs(rect.urx - rect.llx);
    view.box_height = std::abs(rect.ury - rect.lly);
    const auto rotate = target.getAttribute("/Rotate", false);
    if (rotate.isInteger()) {
        view.rotate = normalize_rotation(rotate.getIntValue());
    }
    return view;
}

void NativeDocument::add_text(const int index, const std::vector<TextPlacement> &text) {
    if (text.empty()) return;
    if (!embedded_font_) {
        throw std::logic_error("Text overlay requested without a font");
    }
    auto target = page(index);
    const auto view = page_view(index);
    auto page_object = target.getObjectHandle();

    // resources may be inherited or shared with other pages
    auto resources = target.getAttribute("/Resources", true);
    if (!resources.isDictionary()) {
        resources = QPDFObjectHandle::newDictionary();
    } else if (resources.isIndirect()) {
        resources = resources.shallowCopy();
    }
    auto fonts = resources.getKey("/Font");
    if (!fonts.isDictionary()) {
        fonts = QPDFObjectHandle::newDictionary();
    } else {
        fonts = fonts.shallowCopy();
    }
    std::string key = "/OcrF0";
    for (int n = 1; fonts.hasKey(key); ++n) {
        key = "/OcrF" + std::to_string(n);
    }
    fonts.replaceKey(key, embedded_font_->font_object());
    resources.replaceKey("/Font", fonts);
    page_object.replaceKey("/Resources", resources);

    std::string content;
    for (const auto &t : text) {
        content += "BT\n3 Tr\n" + key + " " + std::to_string(t.font_size) + " Tf\n";
        content += view.text_matrix(t.x, t.y + t.ascent) + " Tm\n";
        content += embedded_font_->encode(t.text) + " Tj\nET\n";
    }

    target.addPageContents(QPDFObjectHandle::newStream(pdf_.get(), "q\n"), true);
    target.addPageContents(QPDFObjectHandle::newStream(pdf_.get(), "\nQ\n"), false);
    target.addPageContents(QPDFObjectHandle::newStream(pdf_.get(), content), false);
}

void NativeDocument::save(std::ostream &out) {
    if (embedded_font_) {
        embedded_font_->finalize();
    }
    QPDFWriter writer(*pdf_);
    writer.setOutputMemory();
    if (compat_ == PdfCompat::PdfA1B) {
        writer.setObjectStreamMode(qpdf_o_disable);
    }
    writer.write();
    const auto buffer = writer.getBufferSharedPointer();
    out.write(reinterpret_cast<const char *>(buffer->getBuffer()), static_cast<std::streamsize>(buffer->getSize()));
    if (!out) {
        throw std::runtime_error("Failed to write merged PDF");
    }
}

} // namespace pagesmith
