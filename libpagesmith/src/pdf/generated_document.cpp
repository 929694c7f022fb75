#include "../../include/generated_document.hpp"
#include "../../include/logger.hpp"
#include "../../include/pdfa_helper.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <qpdf/QUtil.hh>
#include <zlib.h>
#include <stdexcept>
#include <string>

namespace pagesmith {

namespace {

    std::string deflate(const std::vector<std::uint8_t> &data) {
        uLongf size = compressBound(static_cast<uLong>(data.size()));
        std::string out(size, '\0');
        const int rc = compress2(reinterpret_cast<Bytef *>(out.data()), &size,
                                 data.data(), static_cast<uLong>(data.size()), Z_DEFAULT_COMPRESSION);
        if (rc != Z_OK) {
            throw std::runtime_error("zlib compress2 failed: " + std::to_string(rc));
        }
        out.resize(size);
        return out;
    }

    QPDFObjectHandle media_box(const double width, const double height) {
        return QPDFObjectHandle::parse("[0 0 " + format_points(width) + " " + format_points(height) + "]");
    }

    std::string color_space(const int components) {
        switch (components) {
            case 1: return "/DeviceGray";
            case 4: return "/DeviceCMYK";
            default: return "/DeviceRGB";
        }
    }

    void set_if_present(QPDFObjectHandle &info, const char *key, const std::string &value) {
        if (!value.empty()) {
            info.replaceKey(key, QPDFObjectHandle::newUnicodeString(value));
        }
    }

} // namespace

GeneratedDocument::GeneratedDocument(const std::size_t page_count, const PdfCompat compat,
                                     std::shared_ptr<const TrueTypeFont> font)
    : page_count_(page_count), compat_(compat), font_(std::move(font)) {
    log_bridge_.attach(pdf_);
    pdf_.emptyPDF();

    QPDFPageDocumentHelper helper(pdf_);
    pages_.reserve(page_count);
    for (std::size_t i = 0; i < page_count; ++i) {
        auto page = pdf_.makeIndirectObject(QPDFObjectHandle::newDictionary());
        page.replaceKey("/Type", QPDFObjectHandle::newName("/Page"));
        page.replaceKey("/MediaBox", media_box(kPlaceholderWidth, kPlaceholderHeight));
        page.replaceKey("/Resources", QPDFObjectHandle::newDictionary());
        helper.addPage(QPDFPageObjectHelper(page), false);
        // addPage may copy the object; keep what the page tree holds
        pages_.push_back(helper.getAllPages().back().getObjectHandle());
    }
    if (font_) {
        embedded_font_ = std::make_unique<EmbeddedFont>(pdf_, font_, compat_);
    }
}

GeneratedDocument::PageHandle GeneratedDocument::page_handle(const std::size_t index) const {
    if (index >= page_count_) {
        throw std::out_of_range("Page index " + std::to_string(index) + " out of range");
    }
    return index;
}

QPDFObjectHandle GeneratedDocument::image_xobject(const PdfImageData &image) {
    if (image.data.empty() || image.width <= 0 || image.height <= 0) {
        throw std::invalid_argument("Image data is empty");
    }
    auto xobject = QPDFObjectHandle::newStream(&pdf_);
    if (image.encoding == ImageFileFormat::Jpeg) {
        xobject.replaceStreamData(std::string(image.data.begin(), image.data.end()),
                                  QPDFObjectHandle::newName("/DCTDecode"), QPDFObjectHandle::newNull());
    } else {
        xobject.replaceStreamData(deflate(image.data),
                                  QPDFObjectHandle::newName("/FlateDecode"), QPDFObjectHandle::newNull());
    }

    auto dict = xobject.getDict();
    dict.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
    dict.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
    dict.replaceKey("/Width", QPDFObjectHandle::newInteger(image.width));
    dict.replaceKey("/Height", QPDFObjectHandle::newInteger(image.height));
    dict.replaceKey("/ColorSpace", QPDFObjectHandle::newName(color_space(image.components)));
    dict.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(image.bits_per_component));
    if (is_archival(compat_)) {
        dict.replaceKey("/Interpolate", QPDFObjectHandle::newBool(false));
    }
    if (!image.alpha.empty() && !flattens_alpha()) {
        auto smask = QPDFObjectHandle::newStream(&pdf_);
        smask.replaceStreamData(deflate(image.alpha),
                                QPDFObjectHandle::newName("/FlateDecode"), QPDFObjectHandle::newNull());
        auto sd = smask.getDict();
        sd.replaceKey("/Type", QPDFObjectHandle::newName("/XObject"));
        sd.replaceKey("/Subtype", QPDFObjectHandle::newName("/Image"));
        sd.replaceKey("/Width", QPDFObjectHandle::newInteger(image.width));
        sd.replaceKey("/Height", QPDFObjectHandle::newInteger(image.height));
        sd.replaceKey("/ColorSpace", QPDFObjectHandle::newName("/DeviceGray"));
        sd.replaceKey("/BitsPerComponent", QPDFObjectHandle::newInteger(8));
        dict.replaceKey("/SMask", smask);
    }
    return xobject;
}

void GeneratedDocument::Writer::draw_page(const PageHandle handle, const PdfImageData &image,
                                          const PageGeometry &geometry,
                                          const std::vector<TextPlacement> &text) {
    auto &doc = *doc_;
    if (doc.finalized_) {
        throw std::logic_error("Document already finalized");
    }
    if (handle >= doc.pages_.size()) {
        throw std::logic_error("Unknown page handle " + std::to_string(handle));
    }
    if (!text.empty() && !doc.embedded_font_) {
        throw std::logic_error("Text layer requested without a font");
    }

    auto page = doc.pages_[handle];
    page.replaceKey("/MediaBox", media_box(geometry.width, geometry.height));

    auto xobjects = QPDFObjectHandle::newDictionary();
    xobjects.replaceKey("/Im0", doc.image_xobject(image));
    auto resources = QPDFObjectHandle::newDictionary();
    resources.replaceKey("/XObject", xobjects);

    std::string content;
    if (!text.empty()) {
        auto fonts = QPDFObjectHandle::newDictionary();
        fonts.replaceKey("/F0", doc.embedded_font_->font_object());
        resources.replaceKey("/Font", fonts);
        content = page_content(geometry, text, [&](const std::string &s) { return doc.embedded_font_->encode(s); });
    } else {
        content = page_content(geometry, text, [](const std::string &) { return std::string(); });
    }
    page.replaceKey("/Resources", resources);
    page.replaceKey("/Contents", QPDFObjectHandle::newStream(&doc.pdf_, content));
}

void GeneratedDocument::write_info(const PdfMetadata &metadata, const std::string &now) {
    auto info = pdf_.makeIndirectObject(QPDFObjectHandle::newDictionary());
    set_if_present(info, "/Title", metadata.title);
    set_if_present(info, "/Author", metadata.author);
    set_if_present(info, "/Subject", metadata.subject);
    set_if_present(info, "/Keywords", metadata.keywords);
    info.replaceKey("/Creator", QPDFObjectHandle::newUnicodeString(metadata.creator.empty() ? kProducer : metadata.creator));
    info.replaceKey("/Producer", QPDFObjectHandle::newString(kProducer));
    info.replaceKey("/CreationDate", QPDFObjectHandle::newString(now));
    info.replaceKey("/ModDate", QPDFObjectHandle::newString(now));
    pdf_.getTrailer().replaceKey("/Info", info);
}

std::vector<std::uint8_t> GeneratedDocument::finalize(const PdfExportParams &params) {
    std::lock_guard lock(mtx_);
    if (finalized_) {
        throw std::logic_error("Document already finalized");
    }
    finalized_ = true;

    auto metadata = params.metadata;
    if (metadata.creator.empty()) metadata.creator = kProducer;

    const auto now = QUtil::get_current_qpdf_time();
    write_info(metadata, QUtil::qpdf_time_to_pdf_time(now));

    if (embedded_font_) {
        embedded_font_->finalize();
    }
    const auto iso_now = QUtil::qpdf_time_to_iso8601(now);
    pdfa::apply(pdf_, compat_, metadata, kProducer, iso_now, iso_now);

    QPDFWriter writer(pdf_);
    writer.setOutputMemory();
    if (compat_ == PdfCompat::PdfA1B) {
        writer.setObjectStreamMode(qpdf_o_disable);
        writer.forcePDFVersion("1.4");
    }

    const auto &enc = params.encryption;
    if (enc.enabled()) {
        if (is_archival(compat_)) {
            Logger::log(LogLevel::Warning,
                        "Encryption is not allowed in " + std::string(to_string(compat_)) + ", writing unencrypted",
                        "generated_document");
        } else {
            qpdf_r3_print_e print = qpdf_r3p_full;
            if (!enc.allow_printing) {
                print = qpdf_r3p_none;
            } else if (!enc.allow_full_quality_printing) {
                print = qpdf_r3p_low;
            }
            // an empty owner password would open the file without a password
            writer.setR6EncryptionParameters(enc.user_password.c_str(), enc.edit_password().c_str(),
                                             enc.allow_content_copying_for_accessibility,
                                             enc.allow_content_copying,
                                             enc.allow_document_assembly,
                                             enc.allow_annotations,
                                             enc.allow_form_filling,
                                             enc.allow_document_modification,
                                             print,
                                             true);
        }
    }

    writer.write();
    const auto buffer = writer.getBufferSharedPointer();
    const auto *bytes = buffer->getBuffer();
    Logger::log(LogLevel::Debug,
                "Serialized " + std::to_string(page_count_) + " page(s), " + std::to_string(buffer->getSize()) + " bytes",
                "generated_document");
    return {bytes, bytes + buffer->getSize()};
}

} // namespace pagesmith
