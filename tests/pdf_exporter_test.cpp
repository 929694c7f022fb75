#include "../libpagesmith/include/pdf_exporter.hpp"
#include "../libpagesmith/include/events.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <qpdf/QPDF.hh>
#include <qpdf/QPDFPageDocumentHelper.hh>
#include <qpdf/QPDFPageObjectHelper.hh>
#include <qpdf/QPDFObjectHandle.hh>
#include <atomic>
#include <memory>
#include <sstream>

using namespace pagesmith;
using namespace pagesmith::test_support;

namespace {

    std::vector<std::uint8_t> png_page(const int width, const int height, const double dpi) {
        return colour_image(width, height, dpi).encode(ImageFileFormat::Png);
    }

    struct Exported {
        std::string bytes;
        std::unique_ptr<QPDF> pdf;

        [[nodiscard]] std::vector<QPDFPageObjectHelper> pages() const {
            return QPDFPageDocumentHelper(*pdf).getAllPages();
        }
    };

    Exported open_pdf(std::string bytes, const char *password = nullptr) {
        Exported e{std::move(bytes), std::make_unique<QPDF>()};
        e.pdf->processMemoryFile("exported.pdf", e.bytes.data(), e.bytes.size(), password);
        return e;
    }

    double box_width(QPDFPageObjectHelper page) {
        const auto r = page.getObjectHandle().getKey("/MediaBox").getArrayAsRectangle();
        return r.urx - r.llx;
    }

    double box_height(QPDFPageObjectHelper page) {
        const auto r = page.getObjectHandle().getKey("/MediaBox").getArrayAsRectangle();
        return r.ury - r.lly;
    }

    class FixedOcrEngine final : public IOcrEngine {
    public:
        std::atomic<int> calls{0};

        [[nodiscard]] std::string identity() const override { return "fixed"; }
        [[nodiscard]] bool is_available(const OcrParams &, std::string &) const override { return true; }
        std::optional<OcrResult> recognize(const std::filesystem::path &, const OcrParams &, std::stop_token) override {
            ++calls;
            OcrResult r;
            r.page_width = 200;
            r.page_height = 100;
            r.elements.push_back({Rect{10, 10, 80, 20}, "Hello", false});
            return r;
        }
    };

    // decoded content of a page, all streams concatenated
    std::string page_contents(QPDFPageObjectHelper page) {
        std::string text;
        auto contents = page.getObjectHandle().getKey("/Contents");
        std::vector<QPDFObjectHandle> streams;
        if (contents.isArray()) {
            for (int i = 0; i < contents.getArrayNItems(); ++i) streams.push_back(contents.getArrayItem(i));
        } else {
            streams.push_back(contents);
        }
        for (auto &stream : streams) {
            const auto data = stream.getStreamData();
            text.append(reinterpret_cast<const char *>(data->getBuffer()), data->getSize());
            text += "\n";
        }
        return text;
    }

    bool has_ocr_font(QPDFPageObjectHelper page) {
        auto fonts = page.getObjectHandle().getKey("/Resources").getKey("/Font");
        if (!fonts.isDictionary()) return false;
        for (const auto &key : fonts.getKeys()) {
            if (key.rfind("/OcrF", 0) == 0) return true;
        }
        return false;
    }

    PageImage pdf_page(const std::vector<std::uint8_t> &pdf) {
        return PageImage(ImageMemoryStorage{std::make_shared<const std::vector<std::uint8_t>>(pdf), ".pdf"}, {}, false, 0);
    }

} // namespace

class PdfExporterTest : public ::testing::Test {
protected:
    EventBus bus;
    std::vector<ExportProgressEvent> progress;
    std::vector<ExportCompleteEvent> complete;
    std::vector<ExportCancelledEvent> cancelled;
    std::vector<std::string> ocr_unavailable;

    void SetUp() override {
        bus.subscribe<ExportProgressEvent>([this](const ExportProgressEvent &e) { progress.push_back(e); });
        bus.subscribe<ExportCompleteEvent>([this](const ExportCompleteEvent &e) { complete.push_back(e); });
        bus.subscribe<ExportCancelledEvent>([this](const ExportCancelledEvent &e) { cancelled.push_back(e); });
        bus.subscribe<OcrUnavailableEvent>([this](const OcrUnavailableEvent &e) { ocr_unavailable.push_back(e.reason); });
    }

    ExportContext context(const unsigned threads = 2) {
        ExportContext ctx;
        ctx.temp_dir = scratch.path();
        ctx.threads = threads;
        ctx.events = &bus;
        return ctx;
    }

    std::string export_to_string(const std::vector<PageImage> &pages,
                                 const PdfExportParams &params = {},
                                 ExportContext ctx = {}) {
        if (!ctx.events) ctx = context();
        PdfExporter exporter(ctx);
        std::ostringstream out;
        EXPECT_TRUE(exporter.export_pdf(out, pages, params));
        return out.str();
    }

    ScratchDir scratch;
};

TEST_F(PdfExporterTest, WritesPagesInInputOrder) {
    std::vector<PageImage> pages;
    for (int i = 0; i < 6; ++i) {
        pages.push_back(PageImage::from_memory(png_page(100 + 50 * i, 100, 100), ".png"));
    }
    const auto out = open_pdf(export_to_string(pages, {}, context(4)));

    const auto all = out.pages();
    ASSERT_EQ(all.size(), pages.size());
    for (std::size_t i = 0; i < all.size(); ++i) {
        EXPECT_NEAR(box_width(all[i]), (100 + 50 * i) * 0.72, 0.05) << "page " << i;
        EXPECT_NEAR(box_height(all[i]), 72.0, 0.05);
    }
}

TEST_F(PdfExporterTest, ProgressIsMonotonicAndComplete) {
    const std::vector<PageImage> pages{
        PageImage::from_memory(png_page(40, 40, 72), ".png"),
        PageImage::from_memory(png_page(40, 40, 72), ".png"),
        PageImage::from_memory(png_page(40, 40, 72), ".png"),
    };
    const auto bytes = export_to_string(pages);

    ASSERT_EQ(progress.size(), 4u);
    EXPECT_EQ(progress.front().done, 0u);
    for (std::size_t i = 1; i < progress.size(); ++i) {
        EXPECT_EQ(progress[i].done, progress[i - 1].done + 1);
        EXPECT_EQ(progress[i].total, 3u);
    }
    ASSERT_EQ(complete.size(), 1u);
    EXPECT_EQ(complete[0].pages, 3u);
    EXPECT_EQ(complete[0].output_size, bytes.size());
    EXPECT_TRUE(cancelled.empty());
}

TEST_F(PdfExporterTest, SnapsToRequestedPageSize) {
    ImageMetadata meta;
    meta.page_size = PageSize{2.0, 1.0};
    const auto out = open_pdf(export_to_string({PageImage::from_memory(png_page(199, 100, 100), ".png", meta)}));
    EXPECT_DOUBLE_EQ(box_width(out.pages().at(0)), 144.0);
    EXPECT_DOUBLE_EQ(box_height(out.pages().at(0)), 72.0);
}

TEST_F(PdfExporterTest, ImportsPdfPagesUnchanged) {
    const auto source = export_to_string({
        PageImage::from_memory(png_page(200, 100, 100), ".png"),
        PageImage::from_memory(png_page(300, 100, 100), ".png"),
    });
    const std::vector<std::uint8_t> source_bytes(source.begin(), source.end());
    const auto shared = std::make_shared<const std::vector<std::uint8_t>>(source_bytes);

    const std::vector<PageImage> pages{
        PageImage::from_memory(png_page(100, 100, 100), ".png"),
        PageImage(ImageMemoryStorage{shared, ".pdf"}, {}, false, 1),
        PageImage(ImageMemoryStorage{shared, ".pdf"}, {}, false, 0),
    };
    const auto out = open_pdf(export_to_string(pages));

    const auto all = out.pages();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_NEAR(box_width(all[0]), 72.0, 0.05);
    EXPECT_NEAR(box_width(all[1]), 216.0, 0.05);
    EXPECT_NEAR(box_width(all[2]), 144.0, 0.05);
}

TEST_F(PdfExporterTest, EncryptsWithPasswords) {
    PdfExportParams params;
    params.encryption.encrypt = true;
    params.encryption.owner_password = "owner";
    params.encryption.user_password = "reader";
    params.encryption.allow_printing = false;

    const auto bytes = export_to_string({PageImage::from_memory(png_page(50, 50, 72), ".png")}, params);
    const auto out = open_pdf(bytes, "reader");
    EXPECT_TRUE(out.pdf->isEncrypted());
    EXPECT_FALSE(out.pdf->allowPrintLowRes());
    EXPECT_EQ(out.pages().size(), 1u);
}

TEST_F(PdfExporterTest, UserPasswordAloneProtectsTheFile) {
    PdfExportParams params;
    params.encryption.encrypt = true;
    params.encryption.user_password = "reader";

    const auto bytes = export_to_string({PageImage::from_memory(png_page(50, 50, 72), ".png")}, params);
    EXPECT_THROW(open_pdf(bytes), std::exception);
    const auto out = open_pdf(bytes, "reader");
    EXPECT_TRUE(out.pdf->isEncrypted());
    EXPECT_EQ(out.pages().size(), 1u);
}

TEST_F(PdfExporterTest, EncryptsOutputWithImportedPages) {
    HandMadePage def;
    def.content = "0 0 1 rg 20 20 100 100 re f";
    PdfExportParams params;
    params.encryption.encrypt = true;
    params.encryption.owner_password = "owner";
    params.encryption.user_password = "reader";

    const auto bytes = export_to_string({PageImage::from_memory(png_page(50, 50, 72), ".png"), pdf_page(make_pdf(def))},
                                        params);
    EXPECT_THROW(open_pdf(bytes), std::exception);
    const auto out = open_pdf(bytes, "reader");
    EXPECT_TRUE(out.pdf->isEncrypted());
    ASSERT_EQ(out.pages().size(), 2u);
    EXPECT_NEAR(box_width(out.pages()[1]), 400.0, 0.05);
}

TEST_F(PdfExporterTest, ArchivalOutputCarriesIntentAndXmp) {
    PdfExportParams params;
    params.compat = PdfCompat::PdfA2B;
    params.metadata.title = "Ledger";
    // ignored for archival output
    params.encryption.encrypt = true;
    params.encryption.owner_password = "owner";

    const auto out = open_pdf(export_to_string({PageImage::from_memory(png_page(50, 50, 72), ".png")}, params));
    EXPECT_FALSE(out.pdf->isEncrypted());
    const auto root = out.pdf->getRoot();
    EXPECT_TRUE(root.getKey("/OutputIntents").isArray());
    EXPECT_TRUE(root.getKey("/Metadata").isStream());
    EXPECT_EQ(out.pdf->getTrailer().getKey("/Info").getKey("/Title").getUTF8Value(), "Ledger");
}

TEST_F(PdfExporterTest, MissingOcrEngineIsReportedNotFatal) {
    PdfExporter exporter(context());
    std::ostringstream out;
    EXPECT_TRUE(exporter.export_pdf(out, {PageImage::from_memory(png_page(50, 50, 72), ".png")}, {}, OcrParams{}));
    EXPECT_EQ(ocr_unavailable.size(), 1u);
    EXPECT_EQ(open_pdf(out.str()).pages().size(), 1u);
}

TEST_F(PdfExporterTest, OcrTextIsDrawnInvisibly) {
    if (!locate_font(kOcrFontFamilies)) {
        GTEST_SKIP() << "no OCR font installed";
    }
    auto ctx = context();
    ctx.ocr_engine = std::make_shared<FixedOcrEngine>();
    PdfExporter exporter(ctx);
    std::ostringstream out;
    ASSERT_TRUE(exporter.export_pdf(out, {PageImage::from_memory(png_page(200, 100, 100), ".png")}, {}, OcrParams{}));

    const auto pdf = open_pdf(out.str());
    auto page = pdf.pages().at(0);
    const auto content = page.getObjectHandle().getKey("/Contents").getStreamData();
    const std::string text(reinterpret_cast<const char *>(content->getBuffer()), content->getSize());
    EXPECT_NE(text.find("3 Tr"), std::string::npos);
    EXPECT_TRUE(page.getObjectHandle().getKey("/Resources").getKey("/Font").isDictionary());
    EXPECT_TRUE(ocr_unavailable.empty());
}

TEST_F(PdfExporterTest, CancelledExportLeavesNoFile) {
    const auto target = scratch / "out" / "cancelled.pdf";
    std::stop_source stop;
    stop.request_stop();

    PdfExporter exporter(context());
    EXPECT_FALSE(exporter.export_pdf(target, {PageImage::from_memory(png_page(50, 50, 72), ".png")}, {},
                                     std::nullopt, stop.get_token()));
    EXPECT_FALSE(std::filesystem::exists(target));
    EXPECT_TRUE(std::filesystem::is_empty(target.parent_path()));
    ASSERT_EQ(cancelled.size(), 1u);
    EXPECT_EQ(cancelled[0].done, 0u);
    EXPECT_TRUE(complete.empty());
}

TEST_F(PdfExporterTest, WritesFileOnSuccess) {
    const auto target = scratch / "result.pdf";
    PdfExporter exporter(context());
    ASSERT_TRUE(exporter.export_pdf(target, {PageImage::from_memory(png_page(50, 50, 72), ".png")}, {}));
    const auto data = read_file(target);
    EXPECT_EQ(std::string(data.begin(), data.begin() + 5), "%PDF-");
}

TEST_F(PdfExporterTest, RejectsEmptyInput) {
    PdfExporter exporter(context());
    std::ostringstream out;
    EXPECT_THROW(exporter.export_pdf(out, {}, {}), std::invalid_argument);
}

TEST_F(PdfExporterTest, ImportedPageWithTextIsNotRecognizedAgain) {
    if (!locate_font(kOcrFontFamilies)) {
        GTEST_SKIP() << "no OCR font installed";
    }
    HandMadePage def;
    def.helvetica = true;
    def.content = "BT /F1 24 Tf 20 100 Td (Invoice) Tj ET";
    auto engine = std::make_shared<FixedOcrEngine>();
    auto ctx = context();
    ctx.ocr_engine = engine;

    PdfExporter exporter(ctx);
    std::ostringstream out;
    ASSERT_TRUE(exporter.export_pdf(out, {pdf_page(make_pdf(def))}, {}, OcrParams{}));

    EXPECT_EQ(engine->calls.load(), 0);
    const auto pdf = open_pdf(out.str());
    const auto page = pdf.pages().at(0);
    EXPECT_FALSE(has_ocr_font(page));
    EXPECT_EQ(page_contents(page).find("3 Tr"), std::string::npos);
}

TEST_F(PdfExporterTest, ImageOnlyImportedPageGetsTextLayer) {
    if (!locate_font(kOcrFontFamilies)) {
        GTEST_SKIP() << "no OCR font installed";
    }
    HandMadePage def;
    def.content = "0 0 1 rg 20 20 100 100 re f";
    auto engine = std::make_shared<FixedOcrEngine>();
    auto ctx = context();
    ctx.ocr_engine = engine;

    PdfExporter exporter(ctx);
    std::ostringstream out;
    ASSERT_TRUE(exporter.export_pdf(out, {PageImage::from_memory(png_page(50, 50, 72), ".png"), pdf_page(make_pdf(def))},
                                    {}, OcrParams{}));

    EXPECT_EQ(engine->calls.load(), 2);
    const auto pdf = open_pdf(out.str());
    const auto page = pdf.pages().at(1);
    EXPECT_TRUE(has_ocr_font(page));
    const auto text = page_contents(page);
    EXPECT_NE(text.find("3 Tr"), std::string::npos);
    EXPECT_NE(text.find("re f"), std::string::npos);
}

TEST_F(PdfExporterTest, TextLayerFollowsCropBoxAndRotation) {
    if (!locate_font(kOcrFontFamilies)) {
        GTEST_SKIP() << "no OCR font installed";
    }
    HandMadePage def;
    def.crop_box = "[100 50 300 150]";
    def.rotate = 90;
    def.content = "0 0 1 rg 120 60 50 50 re f";
    auto ctx = context();
    ctx.ocr_engine = std::make_shared<FixedOcrEngine>();

    PdfExporter exporter(ctx);
    std::ostringstream out;
    ASSERT_TRUE(exporter.export_pdf(out, {pdf_page(make_pdf(def))}, {}, OcrParams{}));

    const auto text = page_contents(open_pdf(out.str()).pages().at(0));
    // a quarter turn clockwise: text runs up the page, origin inside the CropBox
    const auto at = text.find("0 1 -1 0 ");
    ASSERT_NE(at, std::string::npos) << text;
    std::istringstream operands(text.substr(at + 9));
    double e = 0.0;
    double f = 0.0;
    operands >> e >> f;
    EXPECT_GE(e, 100.0);
    EXPECT_LE(e, 300.0);
    EXPECT_GE(f, 50.0);
    EXPECT_LE(f, 150.0);
}
