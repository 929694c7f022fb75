#ifndef PAGESMITH_TEST_HELPERS_HPP
#define PAGESMITH_TEST_HELPERS_HPP

#include "../libpagesmith/include/memory_image.hpp"
#include "../libpagesmith/include/random_utils.hpp"
#include "../libpagesmith/include/truetype_font.hpp"
#include <qpdf/Buffer.hh>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFWriter.hh>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace pagesmith::test_support {

    /// Every glyph is half an em wide; lines are 1.2 em with the baseline at 0.9 em.
    class FakeMeasurer final : public TextMeasurer {
    public:
        [[nodiscard]] double text_width(const std::string_view utf8, const double font_size) const override {
            return 0.5 * font_size * static_cast<double>(utf8.size());
        }
        [[nodiscard]] double text_height(const double font_size) const override { return 1.2 * font_size; }
        [[nodiscard]] double ascent(const double font_size) const override { return 0.9 * font_size; }
    };

    /// Scratch directory removed with everything in it.
    class ScratchDir {
    public:
        ScratchDir()
            : path_(std::filesystem::temp_directory_path() /
                    ("pagesmith_test_" + RandomUtils::random_suffix())) {
            std::filesystem::create_directories(path_);
        }
        ~ScratchDir() {
            std::error_code ec;
            std::filesystem::remove_all(path_, ec);
        }
        ScratchDir(const ScratchDir &) = delete;
        ScratchDir &operator=(const ScratchDir &) = delete;

        [[nodiscard]] const std::filesystem::path &path() const { return path_; }
        [[nodiscard]] std::filesystem::path operator/(const std::string &name) const { return path_ / name; }

    private:
        std::filesystem::path path_;
    };

    /// RGB image with a colour gradient, so it never collapses to gray or BW.
    inline MemoryImage colour_image(const int width, const int height, const double dpi = 0.0) {
        MemoryImage img(width, height, ImagePixelFormat::RGB24);
        for (int y = 0; y < height; ++y) {
            std::uint8_t *p = img.row(y);
            for (int x = 0; x < width; ++x, p += 3) {
                p[0] = static_cast<std::uint8_t>(x * 255 / width);
                p[1] = static_cast<std::uint8_t>(y * 255 / height);
                p[2] = 0x40;
            }
        }
        img.set_resolution(dpi, dpi);
        img.update_logical_pixel_format();
        return img;
    }

    inline void write_bytes(const std::filesystem::path &path, const std::vector<std::uint8_t> &data) {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
    }

    /// One page drawn by hand, for PDF inputs with known boxes and content.
    struct HandMadePage {
        std::string content;
        std::string media_box = "[0 0 400 200]";
        std::string crop_box;           ///< Empty: no CropBox
        int rotate = 0;
        bool helvetica = false;         ///< Registers the standard Helvetica font as /F1
    };

    inline std::vector<std::uint8_t> make_pdf(const HandMadePage &def) {
        QPDF pdf;
        pdf.emptyPDF();
        auto page = pdf.makeIndirectObject(QPDFObjectHandle::parse("<< /Type /Page >>"));
        page.replaceKey("/MediaBox", QPDFObjectHandle::parse(def.media_box));
        if (!def.crop_box.empty()) {
            page.replaceKey("/CropBox", QPDFObjectHandle::parse(def.crop_box));
        }
        if (def.rotate != 0) {
            page.replaceKey("/Rotate", QPDFObjectHandle::newInteger(def.rotate));
        }
        auto resources = QPDFObjectHandle::newDictionary();
        if (def.helvetica) {
            auto fonts = QPDFObjectHandle::newDictionary();
            fonts.replaceKey("/F1", QPDFObjectHandle::parse("<< /Type /Font /Subtype /Type1 /BaseFont /Helvetica >>"));
            resources.replaceKey("/Font", fonts);
        }
        page.replaceKey("/Resources", resources);
        page.replaceKey("/Contents", QPDFObjectHandle::newStream(&pdf, def.content));
        QPDFPageDocumentHelper(pdf).addPage(QPDFPageObjectHelper(page), false);

        QPDFWriter writer(pdf);
        writer.setOutputMemory();
        writer.write();
        const auto buffer = writer.getBufferSharedPointer();
        return {buffer->getBuffer(), buffer->getBuffer() + buffer->getSize()};
    }

} // namespace pagesmith::test_support

#endif // PAGESMITH_TEST_HELPERS_HPP
