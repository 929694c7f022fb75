#include "../libpagesmith/include/pdfa_helper.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace pagesmith;

namespace {
    std::uint32_t be32(const std::vector<std::uint8_t> &d, const std::size_t at) {
        return static_cast<std::uint32_t>(d[at]) << 24 | static_cast<std::uint32_t>(d[at + 1]) << 16 |
               static_cast<std::uint32_t>(d[at + 2]) << 8 | d[at + 3];
    }

    std::string tag4(const std::vector<std::uint8_t> &d, const std::size_t at) {
        return {d.begin() + static_cast<std::ptrdiff_t>(at), d.begin() + static_cast<std::ptrdiff_t>(at + 4)};
    }
}

TEST(PdfA, IccProfileHeader) {
    const auto icc = pdfa::srgb_icc_profile();
    ASSERT_GE(icc.size(), 132u);
    EXPECT_EQ(be32(icc, 0), icc.size());
    EXPECT_EQ(tag4(icc, 12), "mntr");
    EXPECT_EQ(tag4(icc, 16), "RGB ");
    EXPECT_EQ(tag4(icc, 20), "XYZ ");
    EXPECT_EQ(tag4(icc, 36), "acsp");
    EXPECT_GT(be32(icc, 128), 0u);
}

TEST(PdfA, EscapesXml) {
    EXPECT_EQ(pdfa::xml_escape("a<b>&\"c'"), "a&lt;b&gt;&amp;&quot;c&apos;");
    EXPECT_EQ(pdfa::xml_escape("plain"), "plain");
}

TEST(PdfA, XmpDescribesConformanceAndMetadata) {
    PdfMetadata m;
    m.title = "Scans & Notes";
    m.author = "Archive";
    const auto xmp = pdfa::xmp_metadata(m, PdfCompat::PdfA3U, "pagesmith",
                                        "2024-01-02T03:04:05Z", "2024-01-02T03:04:05Z");
    EXPECT_NE(xmp.find("<pdfaid:part>3</pdfaid:part>"), std::string::npos);
    EXPECT_NE(xmp.find("<pdfaid:conformance>U</pdfaid:conformance>"), std::string::npos);
    EXPECT_NE(xmp.find("Scans &amp; Notes"), std::string::npos);
    EXPECT_NE(xmp.find("Archive"), std::string::npos);
    EXPECT_EQ(xmp.rfind("<?xpacket begin", 0), 0u);
    EXPECT_NE(xmp.find("<?xpacket end=\"w\"?>"), std::string::npos);
}
