#include "../../include/pdfa_helper.hpp"
#include "../../include/logger.hpp"
#include <qpdf/QPDFObjectHandle.hh>
#include <cmath>
#include <string_view>

namespace pagesmith::pdfa {

namespace {

    // ICC data is big-endian
    struct IccWriter {
        std::vector<std::uint8_t> out;

        void u8(const std::uint8_t v) { out.push_back(v); }

        void u16(const std::uint16_t v) {
            u8(static_cast<std::uint8_t>(v >> 8));
            u8(static_cast<std::uint8_t>(v & 0xFF));
        }

        void u32(const std::uint32_t v) {
            u16(static_cast<std::uint16_t>(v >> 16));
            u16(static_cast<std::uint16_t>(v & 0xFFFF));
        }

        void sig(const char *s) { out.insert(out.end(), s, s + 4); }

        void s15f16(const double v) { u32(static_cast<std::uint32_t>(static_cast<std::int32_t>(std::lround(v * 65536.0)))); }

        void zeros(const std::size_t n) { out.insert(out.end(), n, 0); }

        void pad4() { while (out.size() % 4 != 0) u8(0); }

        void set_u32(const std::size_t at, const std::uint32_t v) {
            out[at] = static_cast<std::uint8_t>(v >> 24);
            out[at + 1] = static_cast<std::uint8_t>(v >> 16);
            out[at + 2] = static_cast<std::uint8_t>(v >> 8);
            out[at + 3] = static_cast<std::uint8_t>(v);
        }
    };

    struct Tag {
        const char *signature;
        std::vector<std::uint8_t> data;
    };

    std::vector<std::uint8_t> text_description(const std::string &text) {
        IccWriter w;
        w.sig("desc");
        w.zeros(4);
        w.u32(static_cast<std::uint32_t>(text.size() + 1));
        w.out.insert(w.out.end(), text.begin(), text.end());
        w.u8(0);
        w.u32(0);    // unicode language
        w.u32(0);    // unicode count
        w.u16(0);    // scriptcode code
        w.u8(0);     // scriptcode count
        w.zeros(67);
        return w.out;
    }

    std::vector<std::uint8_t> text_type(const std::string &text) {
        IccWriter w;
        w.sig("text");
        w.zeros(4);
        w.out.insert(w.out.end(), text.begin(), text.end());
        w.u8(0);
        return w.out;
    }

    std::vector<std::uint8_t> xyz(const double x, const double y, const double z) {
        IccWriter w;
        w.sig("XYZ ");
        w.zeros(4);
        w.s15f16(x);
        w.s15f16(y);
        w.s15f16(z);
        return w.out;
    }

    std::vector<std::uint8_t> gamma_curve() {
        IccWriter w;
        w.sig("curv");
        w.zeros(4);
        w.u32(1);
        w.u16(0x0233);   // u8Fixed8 2.2
        return w.out;
    }

} // namespace

std::vector<std::uint8_t> srgb_icc_profile() {
    const std::vector<Tag> tags = {
        {"desc", text_description("sRGB IEC61966-2.1")},
        {"wtpt", xyz(0.9642, 1.0, 0.8249)},
        {"rXYZ", xyz(0.4361, 0.2225, 0.0139)},
        {"gXYZ", xyz(0.3851, 0.7169, 0.0971)},
        {"bXYZ", xyz(0.1431, 0.0606, 0.7141)},
        {"rTRC", gamma_curve()},
        {"gTRC", {}},   // shares rTRC
        {"bTRC", {}},
        {"cprt", text_type("No copyright, use freely")},
    };

    IccWriter w;
    w.u32(0);                 // size, patched below
    w.u32(0);                 // preferred CMM
    w.u32(0x02100000);        // version 2.1
    w.sig("mntr");
    w.sig("RGB ");
    w.sig("XYZ ");
    w.u16(2000); w.u16(1); w.u16(1); w.u16(0); w.u16(0); w.u16(0);
    w.sig("acsp");
    w.zeros(4);               // platform
    w.u32(0);                 // flags
    w.zeros(4);               // manufacturer
    w.u32(0);                 // model
    w.zeros(8);               // attributes
    w.u32(0);                 // perceptual intent
    w.s15f16(0.9642);
    w.s15f16(1.0);
    w.s15f16(0.8249);
    w.zeros(4);               // creator
    w.zeros(44);

    w.u32(static_cast<std::uint32_t>(tags.size()));
    const std::size_t table = w.out.size();
    w.zeros(tags.size() * 12);

    std::uint32_t curve_offset = 0, curve_size = 0;
    for (std::size_t i = 0; i < tags.size(); ++i) {
        std::uint32_t offset, size;
        if (tags[i].data.empty()) {
            offset = curve_offset;
            size = curve_size;
        } else {
            w.pad4();
            offset = static_cast<std::uint32_t>(w.out.size());
            size = static_cast<std::uint32_t>(tags[i].data.size());
            w.out.insert(w.out.end(), tags[i].data.begin(), tags[i].data.end());
            if (std::string_view(tags[i].signature) == "rTRC") {
                curve_offset = offset;
                curve_size = size;
            }
        }
        const std::size_t entry = table + i * 12;
        for (int c = 0; c < 4; ++c) {
            w.out[entry + c] = static_cast<std::uint8_t>(tags[i].signature[c]);
        }
        w.set_u32(entry + 4, offset);
        w.set_u32(entry + 8, size);
    }
    w.pad4();
    w.set_u32(0, static_cast<std::uint32_t>(w.out.size()));
    return w.out;
}

std::string xml_escape(const std::string &text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&apos;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string xmp_metadata(const PdfMetadata &metadata, const PdfCompat compat,
                         const std::string &producer,
                         const std::string &create_date,
                         const std::string &modify_date) {
    std::string x;
    x += "<?xpacket begin=\"\xEF\xBB\xBF\" id=\"W5M0MpCehiHzreSzNTczkc9d\"?>\n";
    x += "<x:xmpmeta xmlns:x=\"adobe:ns:meta/\">\n";
    x += "<rdf:RDF xmlns:rdf=\"http://www.w3.org/1999/02/22-rdf-syntax-ns#\">\n";

    x += "<rdf:Description rdf:about=\"\" xmlns:pdfaid=\"http://www.aiim.org/pdfa/ns/id/\">\n";
    x += "<pdfaid:part>" + std::to_string(pdfa_part(compat)) + "</pdfaid:part>\n";
    x += "<pdfaid:conformance>" + std::string(pdfa_conformance(compat)) + "</pdfaid:conformance>\n";
    x += "</rdf:Description>\n";

    x += "<rdf:Description rdf:about=\"\" xmlns:dc=\"http://purl.org/dc/elements/1.1/\">\n";
    x += "<dc:format>application/pdf</dc:format>\n";
    if (!metadata.title.empty()) {
        x += "<dc:title><rdf:Alt><rdf:li xml:lang=\"x-default\">" + xml_escape(metadata.title) +
             "</rdf:li></rdf:Alt></dc:title>\n";
    }
    if (!metadata.author.empty()) {
        x += "<dc:creator><rdf:Seq><rdf:li>" + xml_escape(metadata.author) + "</rdf:li></rdf:Seq></dc:creator>\n";
    }
    if (!metadata.subject.empty()) {
        x += "<dc:description><rdf:Alt><rdf:li xml:lang=\"x-default\">" + xml_escape(metadata.subject) +
             "</rdf:li></rdf:Alt></dc:description>\n";
    }
    x += "</rdf:Description>\n";

    x += "<rdf:Description rdf:about=\"\" xmlns:xmp=\"http://ns.adobe.com/xap/1.0/\">\n";
    x += "<xmp:CreateDate>" + create_date + "</xmp:CreateDate>\n";
    x += "<xmp:ModifyDate>" + modify_date + "</xmp:ModifyDate>\n";
    if (!metadata.creator.empty()) {
        x += "<xmp:CreatorTool>" + xml_escape(metadata.creator) + "</xmp:CreatorTool>\n";
    }
    x += "</rdf:Description>\n";

    x += "<rdf:Description rdf:about=\"\" xmlns:pdf=\"http://ns.adobe.com/pdf/1.3/\">\n";
    x += "<pdf:Producer>" + xml_escape(producer) + "</pdf:Producer>\n";
    if (!metadata.keywords.empty()) {
        x += "<pdf:Keywords>" + xml_escape(metadata.keywords) + "</pdf:Keywords>\n";
    }
    x += "</rdf:Description>\n";

    x += "</rdf:RDF>\n</x:xmpmeta>\n";
    // room for in-place edits by other tools
    x += std::string(2000, ' ');
    x += "\n<?xpacket end=\"w\"?>";
    return x;
}

void apply(QPDF &pdf, const PdfCompat compat, const PdfMetadata &metadata,
           const std::string &producer,
           const std::string &create_date, const std::string &modify_date) {
    if (!is_archival(compat)) return;

    auto root = pdf.getRoot();

    const auto icc = srgb_icc_profile();
    auto profile = QPDFObjectHandle::newStream(&pdf, std::string(icc.begin(), icc.end()));
    profile.getDict().replaceKey("/N", QPDFObjectHandle::newInteger(3));

    auto intent = QPDFObjectHandle::newDictionary();
    intent.replaceKey("/Type", QPDFObjectHandle::newName("/OutputIntent"));
    intent.replaceKey("/S", QPDFObjectHandle::newName("/GTS_PDFA1"));
    intent.replaceKey("/OutputConditionIdentifier", QPDFObjectHandle::newString(kOutputCondition));
    intent.replaceKey("/Info", QPDFObjectHandle::newString(kOutputCondition));
    intent.replaceKey("/DestOutputProfile", profile);
    auto intents = QPDFObjectHandle::newArray();
    intents.appendItem(pdf.makeIndirectObject(intent));
    root.replaceKey("/OutputIntents", intents);

    auto xmp = QPDFObjectHandle::newStream(&pdf, xmp_metadata(metadata, compat, producer, create_date, modify_date));
    xmp.getDict().replaceKey("/Type", QPDFObjectHandle::newName("/Metadata"));
    xmp.getDict().replaceKey("/Subtype", QPDFObjectHandle::newName("/XML"));
    root.replaceKey("/Metadata", xmp);

    Logger::log(LogLevel::Debug, "Added output intent and XMP for " + std::string(to_string(compat)), "pdfa");
}

} // namespace pagesmith::pdfa
