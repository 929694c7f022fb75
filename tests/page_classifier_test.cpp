#include "../libpagesmith/include/page_classifier.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace pagesmith;

TEST(PageClassifier, UntransformedPdfPagesPassThrough) {
    EXPECT_TRUE(is_passthrough_eligible(PageImage::from_pdf_page("scan.PDF", 2)));
    EXPECT_TRUE(is_passthrough_eligible(PageImage::from_memory({'%', 'P', 'D', 'F'}, ".pdf")));
    EXPECT_FALSE(is_passthrough_eligible(PageImage::from_file("photo.jpg")));
    EXPECT_FALSE(is_passthrough_eligible(PageImage(ImageFileStorage{"scan.pdf"}, {}, true)));
    EXPECT_FALSE(is_passthrough_eligible(PageImage::from_rendered(test_support::colour_image(4, 4))));
}

TEST(PageClassifier, SplitsAndKeepsInputOrder) {
    const std::vector<PageImage> pages{
        PageImage::from_file("a.png"),
        PageImage::from_pdf_page("b.pdf", 0),
        PageImage::from_file("c.jpg"),
        PageImage::from_pdf_page("b.pdf", 1),
    };
    const auto c = classify_pages(pages);
    ASSERT_EQ(c.to_render.size(), 2u);
    ASSERT_EQ(c.passthrough.size(), 2u);
    EXPECT_EQ(c.to_render[0].index, 0u);
    EXPECT_EQ(c.to_render[1].index, 2u);
    EXPECT_EQ(c.passthrough[0].index, 1u);
    EXPECT_EQ(c.passthrough[1].index, 3u);
    EXPECT_EQ(c.passthrough[0].kind, PageKind::Passthrough);
    EXPECT_EQ(c.to_render[0].kind, PageKind::ToRender);
}

TEST(PageImage, ContentIdentityDistinguishesPagesAndTransforms) {
    const auto a = PageImage::from_memory({1, 2, 3}, ".png");
    const auto b = PageImage::from_memory({1, 2, 3}, ".png");
    const auto c = PageImage::from_memory({1, 2, 4}, ".png");
    EXPECT_EQ(a.content_identity(), b.content_identity());
    EXPECT_NE(a.content_identity(), c.content_identity());

    const auto p0 = PageImage::from_pdf_page("doc.pdf", 0);
    const auto p1 = PageImage::from_pdf_page("doc.pdf", 1);
    EXPECT_NE(p0.content_identity(), p1.content_identity());
}

TEST(PageImage, RejectsInvalidStorage) {
    EXPECT_THROW(PageImage::from_pdf_page("doc.pdf", -1), std::invalid_argument);
    EXPECT_THROW(PageImage(ImageMemoryStorage{nullptr, ".png"}), std::invalid_argument);
}

TEST(PageImage, PdfPagesAreNotDecoded) {
    EXPECT_THROW((void) PageImage::from_pdf_page("doc.pdf", 0).load(), std::logic_error);
}
