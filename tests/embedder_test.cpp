#include "../libpagesmith/include/embedder.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <sstream>

using namespace pagesmith;
using namespace pagesmith::test_support;

TEST(ChooseExportFormat, FirstMatchingRuleWins) {
    const auto colour = colour_image(8, 8);
    EXPECT_EQ(choose_export_format(colour, {}), (ImageExportFormat{ImageFileFormat::Jpeg, ImagePixelFormat::RGB24}));

    ImageMetadata lossless;
    lossless.lossless = true;
    EXPECT_EQ(choose_export_format(colour, lossless), (ImageExportFormat{ImageFileFormat::Png, ImagePixelFormat::RGB24}));

    ImageMetadata gray;
    gray.bit_depth = BitDepth::Grayscale;
    EXPECT_EQ(choose_export_format(colour, gray), (ImageExportFormat{ImageFileFormat::Jpeg, ImagePixelFormat::Gray8}));

    ImageMetadata bw;
    bw.bit_depth = BitDepth::BlackAndWhite;
    bw.lossless = true;
    EXPECT_EQ(choose_export_format(colour, bw), (ImageExportFormat{ImageFileFormat::Png, ImagePixelFormat::BW1}));

    MemoryImage white(8, 8, ImagePixelFormat::RGB24);
    white.update_logical_pixel_format();
    EXPECT_EQ(choose_export_format(white, {}), (ImageExportFormat{ImageFileFormat::Png, ImagePixelFormat::BW1}));

    MemoryImage translucent(2, 2, ImagePixelFormat::ARGB32);
    translucent.row(0)[3] = 0x80;
    translucent.update_logical_pixel_format();
    EXPECT_EQ(choose_export_format(translucent, gray), (ImageExportFormat{ImageFileFormat::Png, ImagePixelFormat::ARGB32}));
}

TEST(SelectEmbedder, CopiesColourJpegFilesDirectly) {
    const ScratchDir dir;
    const auto path = dir / "colour.jpg";
    write_bytes(path, colour_image(32, 16, 300).encode(ImageFileFormat::Jpeg));

    const auto embedder = select_embedder(PageImage::from_file(path));
    ASSERT_NE(dynamic_cast<DirectJpegEmbedder *>(embedder.get()), nullptr);
    EXPECT_EQ(embedder->width(), 32);
    EXPECT_DOUBLE_EQ(embedder->dpi_x(), 300.0);

    const auto image = embedder->pdf_image(false);
    EXPECT_EQ(image.encoding, ImageFileFormat::Jpeg);
    EXPECT_EQ(image.components, 3);
    EXPECT_EQ(image.data, read_file(path));
}

TEST(SelectEmbedder, ReencodesGrayscaleJpegFiles) {
    const ScratchDir dir;
    const auto path = dir / "gray.JPG";
    write_bytes(path, colour_image(32, 16).encode(ImageFileFormat::Jpeg, ImagePixelFormat::Gray8));

    const auto embedder = select_embedder(PageImage::from_file(path));
    EXPECT_NE(dynamic_cast<RenderedImageEmbedder *>(embedder.get()), nullptr);
}

TEST(SelectEmbedder, TransformedJpegIsReencoded) {
    const ScratchDir dir;
    const auto path = dir / "colour.jpeg";
    write_bytes(path, colour_image(32, 16).encode(ImageFileFormat::Jpeg));

    const auto embedder = select_embedder(PageImage(ImageFileStorage{path}, {}, true));
    EXPECT_NE(dynamic_cast<RenderedImageEmbedder *>(embedder.get()), nullptr);
}

TEST(RenderedImageEmbedder, KeepsOrFlattensAlpha) {
    MemoryImage img(3, 2, ImagePixelFormat::ARGB32);
    img.row(1)[7] = 0x00;
    img.update_logical_pixel_format();

    RenderedImageEmbedder keep(img);
    const auto with_alpha = keep.pdf_image(false);
    EXPECT_EQ(with_alpha.encoding, ImageFileFormat::Png);
    EXPECT_EQ(with_alpha.components, 3);
    EXPECT_EQ(with_alpha.data.size(), 3u * 2u * 3u);
    ASSERT_EQ(with_alpha.alpha.size(), 6u);
    EXPECT_EQ(with_alpha.alpha[4], 0x00);

    RenderedImageEmbedder flatten(img);
    const auto flat = flatten.pdf_image(true);
    EXPECT_TRUE(flat.alpha.empty());
    EXPECT_EQ(flat.data.size(), 3u * 2u * 3u);
}

TEST(RenderedImageEmbedder, BlackWhiteIsPackedToOneBit) {
    RenderedImageEmbedder embedder(colour_image(16, 4));
    ImageMetadata bw;
    bw.bit_depth = BitDepth::BlackAndWhite;
    EXPECT_EQ(embedder.prepare_for_export(bw).pixel_format, ImagePixelFormat::BW1);

    const auto image = embedder.pdf_image(false);
    EXPECT_EQ(image.bits_per_component, 1);
    EXPECT_EQ(image.components, 1);
    EXPECT_EQ(image.data.size(), 2u * 4u);
}

TEST(RenderedImageEmbedder, CopiesDecodableStreamAndReleases) {
    RenderedImageEmbedder embedder(colour_image(8, 8));
    std::ostringstream out;
    embedder.copy_to_stream(out);
    const std::string bytes = out.str();
    ASSERT_GE(bytes.size(), 3u);
    EXPECT_EQ(static_cast<unsigned char>(bytes[0]), 0xFF);
    EXPECT_EQ(embedder.stream_extension(), ".jpg");

    embedder.release();
    embedder.release();
    EXPECT_THROW(embedder.pdf_image(false), std::logic_error);
}
