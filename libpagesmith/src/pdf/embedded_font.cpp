#include "../../include/embedded_font.hpp"
#include "../../include/logger.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <stdexcept>
#include <vector>

namespace pagesmith {

namespace {

    std::string hex4(const unsigned v) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "%04X", v & 0xFFFFu);
        return buf;
    }

    std::string utf16_hex(const char32_t cp) {
        if (cp < 0x10000) return hex4(cp);
        const char32_t v = cp - 0x10000;
        return hex4(0xD800 + (v >> 10)) + hex4(0xDC00 + (v & 0x3FF));
    }

    int to_1000(const double units, const int upem) {
        return static_cast<int>(std::lround(units * 1000.0 / upem));
    }

} // namespace

EmbeddedFont::EmbeddedFont(QPDF &pdf, std::shared_ptr<const TrueTypeFont> font, const PdfCompat compat)
    : pdf_(pdf), font_(std::move(font)), compat_(compat), font_object_(QPDFObjectHandle::newNull()) {
}

QPDFObjectHandle EmbeddedFont::font_object() {
    if (font_object_.isNull()) {
        font_object_ = pdf_.makeIndirectObject(QPDFObjectHandle::newDictionary());
    }
    return font_object_;
}

std::string EmbeddedFont::encode(const std::string_view utf8) {
    if (finalized_) {
        throw std::logic_error("EmbeddedFont used after finalize()");
    }
    std::string hex = "<";
    for (const char32_t cp : utf8_to_codepoints(utf8)) {
        const auto glyph = font_->glyph_for(cp);
        glyphs_.try_emplace(glyph, cp);
        hex += hex4(glyph);
    }
    hex += ">";
    return hex;
}

QPDFObjectHandle EmbeddedFont::make_stream(const std::string &data) const {
    return QPDFObjectHandle::newStream(&pdf_, data);
}

QPDFObjectHandle EmbeddedFont::widths() const {
    auto w = QPDFObjectHandle::newArray();
    for (const auto &[glyph, cp] : glyphs_) {
        w.appendItem(QPDFObjectHandle::newInteger(glyph));
        auto one = QPDFObjectHandle::newArray();
        one.appendItem(QPDFObjectHandle::newInteger(to_1000(font_->glyph_advance(glyph), font_->units_per_em())));
        w.appendItem(one);
    }
    return w;
}

std::string EmbeddedFont::to_unicode_cmap() const {
    std::string cmap =
        "/CIDInit /ProcSet findresource begin\n"
        "12 dict begin\n"
        "begincmap\n"
        "/CIDSystemInfo << /Registry (Adobe) /Ordering (UCS) /Supplement 0 >> def\n"
        "/CMapName /Adobe-Identity-UCS def\n"
        "/CMapType 2 def\n"
        "1 begincodespacerange\n<0000> <FFFF>\nendcodespacerange\n";

    std::vector<std::pair<std::uint32_t, char32_t>> mappings;
    for (const auto &[glyph, cp] : glyphs_) {
        if (glyph != 0) mappings.emplace_back(glyph, cp);
    }
    // at most 100 entries per block
    for (std::size_t pos = 0; pos < mappings.size(); pos += 100) {
        const std::size_t n = std::min<std::size_t>(100, mappings.size() - pos);
        cmap += std::to_string(n) + " beginbfchar\n";
        for (std::size_t i = 0; i < n; ++i) {
            const auto &[glyph, cp] = mappings[pos + i];
            cmap += "<" + hex4(glyph) + "> <" + utf16_hex(cp) + ">\n";
        }
        cmap += "endbfchar\n";
    }
    cmap += "endcmap\n"
            "CMapName currentdict /CMap defineresource pop\n"
            "end\nend\n";
    return cmap;
}

void EmbeddedFont::finalize() {
    if (finalized_ || font_object_.isNull()) return;
    finalized_ = true;

    const auto &f = *font_;
    const int upem = f.units_per_em();
    const auto ps_name = QPDFObjectHandle::newName("/" + (f.postscript_name().empty() ? std::string("OcrFont") : f.postscript_name()));

    const auto &program = f.font_program();
    auto font_file = make_stream(std::string(program.begin(), program.end()));
    font_file.getDict().replaceKey("/Length1", QPDFObjectHandle::newInteger(static_cast<long long>(program.size())));

    auto bbox = QPDFObjectHandle::newArray();
    for (const int v : f.bbox()) {
        bbox.appendItem(QPDFObjectHandle::newInteger(to_1000(v, upem)));
    }

    auto descriptor = QPDFObjectHandle::newDictionary();
    descriptor.replaceKey("/Type", QPDFObjectHandle::newName("/FontDescriptor"));
    descriptor.replaceKey("/FontName", ps_name);
    descriptor.replaceKey("/Flags", QPDFObjectHandle::newInteger(34));   // serif, nonsymbolic
    descriptor.replaceKey("/FontBBox", bbox);
    descriptor.replaceKey("/ItalicAngle", QPDFObjectHandle::newReal(f.italic_angle(), 2));
    descriptor.replaceKey("/Ascent", QPDFObjectHandle::newInteger(to_1000(f.ascender(), upem)));
    descriptor.replaceKey("/Descent", QPDFObjectHandle::newInteger(to_1000(f.descender(), upem)));
    descriptor.replaceKey("/CapHeight", QPDFObjectHandle::newInteger(to_1000(f.cap_height(), upem)));
    descriptor.replaceKey("/StemV", QPDFObjectHandle::newInteger(80));
    descriptor.replaceKey("/FontFile2", font_file);

    if (compat_ == PdfCompat::PdfA1B) {
        // the whole font program is embedded, so every CID is present
        const std::uint32_t n = f.num_glyphs();
        std::string bits((n + 7) / 8, '\xFF');
        if (n % 8 != 0) {
            bits.back() = static_cast<char>(0xFF << (8 - n % 8));
        }
        descriptor.replaceKey("/CIDSet", make_stream(bits));
    }

    auto cid_font = QPDFObjectHandle::newDictionary();
    cid_font.replaceKey("/Type", QPDFObjectHandle::newName("/Font"));
    cid_font.replaceKey("/Subtype", QPDFObjectHandle::newName("/CIDFontType2"));
    cid_font.replaceKey("/BaseFont", ps_name);
    cid_font.replaceKey("/CIDSystemInfo",
                        QPDFObjectHandle::parse("<< /Registry (Adobe) /Ordering (Identity) /Supplement 0 >>"));
    cid_font.replaceKey("/FontDescriptor", pdf_.makeIndirectObject(descriptor));
    cid_font.replaceKey("/DW", QPDFObjectHandle::newInteger(1000));
    cid_font.replaceKey("/W", widths());
    if (is_archival(compat_)) {
        std::string map;
        map.reserve(static_cast<std::size_t>(f.num_glyphs()) * 2);
        for (std::uint32_t cid = 0; cid < f.num_glyphs(); ++cid) {
            map.push_back(static_cast<char>((cid >> 8) & 0xFF));
            map.push_back(static_cast<char>(cid & 0xFF));
        }
        cid_font.replaceKey("/CIDToGIDMap", make_stream(map));
    } else {
        cid_font.replaceKey("/CIDToGIDMap", QPDFObjectHandle::newName("/Identity"));
    }

    auto descendants = QPDFObjectHandle::newArray();
    descendants.appendItem(pdf_.makeIndirectObject(cid_font));

    font_object_.replaceKey("/Type", QPDFObjectHandle::newName("/Font"));
    font_object_.replaceKey("/Subtype", QPDFObjectHandle::newName("/Type0"));
    font_object_.replaceKey("/BaseFont", ps_name);
    font_object_.replaceKey("/Encoding", QPDFObjectHandle::newName("/Identity-H"));
    font_object_.replaceKey("/DescendantFonts", descendants);
    font_object_.replaceKey("/ToUnicode", make_stream(to_unicode_cmap()));

    Logger::log(LogLevel::Debug,
                "Embedded " + f.postscript_name() + " with " + std::to_string(glyphs_.size()) + " used glyphs",
                "embedded_font");
}

} // namespace pagesmith
