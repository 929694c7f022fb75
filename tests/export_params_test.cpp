#include "../libpagesmith/include/export_params.hpp"
#include <gtest/gtest.h>

using namespace pagesmith;

TEST(PdfCompat, ParsesNamesLeniently) {
    EXPECT_EQ(parse_compat("default"), PdfCompat::Default);
    EXPECT_EQ(parse_compat("PDF/A-1b"), PdfCompat::PdfA1B);
    EXPECT_EQ(parse_compat("pdfa2b"), PdfCompat::PdfA2B);
    EXPECT_EQ(parse_compat("pdfa-3B"), PdfCompat::PdfA3B);
    EXPECT_EQ(parse_compat("pdfa-3u"), PdfCompat::PdfA3U);
    EXPECT_FALSE(parse_compat("pdfx-4").has_value());
}

TEST(PdfCompat, NamesRoundTrip) {
    for (const auto c : {PdfCompat::Default, PdfCompat::PdfA1B, PdfCompat::PdfA2B, PdfCompat::PdfA3B, PdfCompat::PdfA3U}) {
        EXPECT_EQ(parse_compat(to_string(c)), c);
    }
}

TEST(PdfCompat, PartAndConformance) {
    EXPECT_FALSE(is_archival(PdfCompat::Default));
    EXPECT_TRUE(is_archival(PdfCompat::PdfA1B));
    EXPECT_EQ(pdfa_part(PdfCompat::Default), 0);
    EXPECT_EQ(pdfa_part(PdfCompat::PdfA1B), 1);
    EXPECT_EQ(pdfa_part(PdfCompat::PdfA3U), 3);
    EXPECT_EQ(pdfa_conformance(PdfCompat::PdfA2B), "B");
    EXPECT_EQ(pdfa_conformance(PdfCompat::PdfA3U), "U");
    EXPECT_EQ(pdfa_conformance(PdfCompat::Default), "");
}

TEST(PdfEncryption, NeedsFlagAndPassword) {
    PdfEncryption e;
    EXPECT_FALSE(e.enabled());
    e.encrypt = true;
    EXPECT_FALSE(e.enabled());
    e.user_password = "reader";
    EXPECT_TRUE(e.enabled());
    EXPECT_EQ(e.edit_password(), "reader");
    e.owner_password = "owner";
    EXPECT_EQ(e.edit_password(), "owner");
}

TEST(OcrParams, CacheKeyIgnoresPriority) {
    OcrParams a;
    OcrParams b;
    b.priority = OcrPriority::Background;
    EXPECT_EQ(a.cache_key(), b.cache_key());
    b.mode = OcrMode::Best;
    EXPECT_NE(a.cache_key(), b.cache_key());
}
