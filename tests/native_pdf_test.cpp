#include "../libpagesmith/include/native_pdf.hpp"
#include "../libpagesmith/include/source_pdf.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace pagesmith;
using namespace pagesmith::test_support;

namespace {

    PageView view(const int rotate) {
        PageView v;
        v.x = 100;
        v.y = 50;
        v.box_width = 200;
        v.box_height = 100;
        v.rotate = rotate;
        return v;
    }

} // namespace

TEST(PageView, DisplayedSizeSwapsForQuarterTurns) {
    EXPECT_DOUBLE_EQ(view(0).width(), 200.0);
    EXPECT_DOUBLE_EQ(view(0).height(), 100.0);
    EXPECT_DOUBLE_EQ(view(90).width(), 100.0);
    EXPECT_DOUBLE_EQ(view(90).height(), 200.0);
    EXPECT_DOUBLE_EQ(view(180).width(), 200.0);
    EXPECT_DOUBLE_EQ(view(270).height(), 200.0);
}

TEST(PageView, TextMatrixMapsDisplayedOriginIntoCropBox) {
    // displayed (10, 20), measured from the top-left corner of the view
    EXPECT_EQ(view(0).text_matrix(10, 20), "1 0 0 1 110 130");
    EXPECT_EQ(view(90).text_matrix(10, 20), "0 1 -1 0 120 60");
    EXPECT_EQ(view(180).text_matrix(10, 20), "-1 0 0 -1 290 70");
    EXPECT_EQ(view(270).text_matrix(10, 20), "0 -1 1 0 280 140");
}

TEST(PageView, NormalizesRotation) {
    EXPECT_EQ(normalize_rotation(0), 0);
    EXPECT_EQ(normalize_rotation(-90), 270);
    EXPECT_EQ(normalize_rotation(450), 90);
    EXPECT_EQ(normalize_rotation(-540), 180);
}

TEST(NativeDocument, PageViewUsesCropBoxAndRotate) {
    HandMadePage def;
    def.crop_box = "[100 50 300 150]";
    def.rotate = 90;
    def.content = "0 0 1 rg 120 60 50 50 re f";

    auto session = NativePdfLibrary::instance().acquire();
    const auto doc = session.open(make_pdf(def), "", PdfCompat::Default);
    const auto v = doc->page_view(0);
    EXPECT_DOUBLE_EQ(v.x, 100.0);
    EXPECT_DOUBLE_EQ(v.y, 50.0);
    EXPECT_DOUBLE_EQ(v.box_width, 200.0);
    EXPECT_DOUBLE_EQ(v.box_height, 100.0);
    EXPECT_EQ(v.rotate, 90);
    EXPECT_DOUBLE_EQ(v.width(), 100.0);
}

TEST(NativeDocument, PageViewFallsBackToMediaBox) {
    HandMadePage def;
    def.content = "0 0 1 rg 120 60 50 50 re f";

    auto session = NativePdfLibrary::instance().acquire();
    const auto doc = session.open(make_pdf(def), "", PdfCompat::Default);
    const auto v = doc->page_view(0);
    EXPECT_DOUBLE_EQ(v.box_width, 400.0);
    EXPECT_DOUBLE_EQ(v.box_height, 200.0);
    EXPECT_EQ(v.rotate, 0);
}

TEST(SourceText, BlankUnicodeIsNotText) {
    EXPECT_FALSE(has_visible_text(""));
    EXPECT_FALSE(has_visible_text(" \t\r\n"));
    EXPECT_FALSE(has_visible_text("\xC2\xA0"));                 // U+00A0 no-break space
    EXPECT_FALSE(has_visible_text("\xE3\x80\x80 \xE3\x80\x80")); // U+3000 ideographic space
    EXPECT_FALSE(has_visible_text("\xEF\xBB\xBF\xE2\x80\x8B"));  // U+FEFF, U+200B
    EXPECT_TRUE(has_visible_text("\xC2\xA0x"));
    EXPECT_TRUE(has_visible_text("\xD7\xAA"));                   // U+05EA
}
