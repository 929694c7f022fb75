#include "../libpagesmith/include/memory_image.hpp"
#include "../libpagesmith/include/jpeg_header.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>

using namespace pagesmith;

TEST(MemoryImage, LogicalFormatNarrowsToContent) {
    MemoryImage img(4, 2, ImagePixelFormat::ARGB32);
    img.update_logical_pixel_format();
    EXPECT_EQ(img.logical_pixel_format(), ImagePixelFormat::BW1);

    img.row(0)[0] = img.row(0)[1] = img.row(0)[2] = 0x80;
    img.update_logical_pixel_format();
    EXPECT_EQ(img.logical_pixel_format(), ImagePixelFormat::Gray8);

    img.row(1)[4] = 0x10;
    img.update_logical_pixel_format();
    EXPECT_EQ(img.logical_pixel_format(), ImagePixelFormat::RGB24);

    img.row(1)[7] = 0x00;
    img.update_logical_pixel_format();
    EXPECT_EQ(img.logical_pixel_format(), ImagePixelFormat::ARGB32);
    EXPECT_EQ(img.pixel_format(), ImagePixelFormat::ARGB32);
}

TEST(MemoryImage, BlackWhiteThresholdAndPacking) {
    MemoryImage img(10, 1, ImagePixelFormat::Gray8);
    for (int x = 0; x < 10; ++x) img.row(0)[x] = x < 5 ? 0x20 : 0xF0;
    const auto bw = img.to_black_white();
    EXPECT_EQ(bw.pixel_format(), ImagePixelFormat::BW1);
    EXPECT_EQ(bw.row(0)[0], 0x00);
    EXPECT_EQ(bw.row(0)[9], 0xFF);

    // 1 = white, MSB first, rows padded to a byte
    EXPECT_EQ(bw.pack_bits(), (std::vector<std::uint8_t>{0x07, 0xC0}));
}

TEST(MemoryImage, TransparencyIsCompositedOverWhite) {
    MemoryImage img(1, 1, ImagePixelFormat::ARGB32);
    img.row(0)[0] = 0;
    img.row(0)[1] = 0;
    img.row(0)[2] = 0;
    img.row(0)[3] = 0;
    const auto rgb = img.convert(ImagePixelFormat::RGB24);
    EXPECT_EQ(rgb.row(0)[0], 0xFF);
    EXPECT_EQ(img.alpha_channel(), std::vector<std::uint8_t>{0});
}

TEST(MemoryImage, PngKeepsResolution) {
    const auto img = test_support::colour_image(20, 10, 150);
    const auto decoded = MemoryImage::load(std::span<const std::uint8_t>(img.encode(ImageFileFormat::Png)));
    EXPECT_EQ(decoded.width(), 20);
    EXPECT_EQ(decoded.height(), 10);
    EXPECT_NEAR(decoded.horizontal_dpi(), 150.0, 0.05);
    EXPECT_EQ(decoded.original_file_format(), ImageFileFormat::Png);
    EXPECT_EQ(decoded.pixels(), img.pixels());
}

TEST(MemoryImage, JpegHeaderReportsComponentsAndDensity) {
    const auto colour = test_support::colour_image(16, 8, 200).encode(ImageFileFormat::Jpeg);
    const auto header = read_jpeg_header(std::span<const std::uint8_t>(colour));
    ASSERT_TRUE(header.has_value());
    EXPECT_EQ(header->width, 16);
    EXPECT_EQ(header->height, 8);
    EXPECT_EQ(header->components, 3);
    EXPECT_DOUBLE_EQ(header->dpi_x, 200.0);

    const auto gray = test_support::colour_image(16, 8).encode(ImageFileFormat::Jpeg, ImagePixelFormat::Gray8);
    ASSERT_TRUE(read_jpeg_header(std::span<const std::uint8_t>(gray)).has_value());
    EXPECT_EQ(read_jpeg_header(std::span<const std::uint8_t>(gray))->components, 1);
}

TEST(MemoryImage, RejectsUnknownData) {
    const std::vector<std::uint8_t> junk{'G', 'I', 'F', '8', '9', 'a'};
    const std::span<const std::uint8_t> bytes(junk);
    EXPECT_THROW((void) MemoryImage::load(bytes), std::runtime_error);
    EXPECT_FALSE(read_jpeg_header(bytes).has_value());
}
