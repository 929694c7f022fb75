#include "../libpagesmith/include/page_geometry.hpp"
#include <gtest/gtest.h>

using namespace pagesmith;

namespace {
    const PageSize kA4{8.27, 11.69};
}

TEST(PageGeometry, SnapsToExpectedSizeWithinTolerance) {
    // 2480 px over 8.27 in implies 299.88 dpi
    const auto g = compute_page_size(299.4, 299.4, 2480, 3508, kA4);
    EXPECT_DOUBLE_EQ(g.width, 595.44);
    EXPECT_DOUBLE_EQ(g.height, 841.68);
}

TEST(PageGeometry, KeepsNativeSizeOutsideTolerance) {
    const auto g = compute_page_size(295, 295, 2480, 3508, kA4);
    EXPECT_NEAR(g.width, 2480 * 72.0 / 295, 0.001);
    EXPECT_NEAR(g.height, 3508 * 72.0 / 295, 0.001);
}

TEST(PageGeometry, NoExpectedSizeUsesResolution) {
    const auto g = compute_page_size(150, 300, 300, 600);
    EXPECT_DOUBLE_EQ(g.width, 144.0);
    EXPECT_DOUBLE_EQ(g.height, 144.0);
}

TEST(PageGeometry, MissingResolutionFallsBackTo96Dpi) {
    const auto g = compute_page_size(0, 0, 800, 600);
    EXPECT_DOUBLE_EQ(g.width, 800 * kFallbackAdjust);
    EXPECT_DOUBLE_EQ(g.height, 600 * kFallbackAdjust);
}

TEST(PageGeometry, RoundsToThreeDecimals) {
    EXPECT_DOUBLE_EQ(round_points(1.23456), 1.235);
    EXPECT_DOUBLE_EQ(round_points(-2.0004), -2.0);
}

TEST(PageGeometry, FormatsWithoutTrailingZeros) {
    EXPECT_EQ(format_points(612.0), "612");
    EXPECT_EQ(format_points(595.4401), "595.44");
    EXPECT_EQ(format_points(0.12351), "0.124");
    EXPECT_EQ(format_points(-0.0001), "0");
}
