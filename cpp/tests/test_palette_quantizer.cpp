#include <gtest/gtest.h>

#include "palette_quantizer.hpp"

using Fitcast::Color::PaletteQuantizer;

TEST(PaletteQuantizerTest, SolidImageYieldsOneSwatch) {
    cv::Mat rgb(20, 20, CV_8UC3, cv::Scalar(200, 30, 30));
    PaletteQuantizer quantizer(5, 1);

    auto palette = quantizer.quantize(rgb);
    ASSERT_EQ(palette.size(), 1u);
    EXPECT_EQ(palette[0].population, 400);
    EXPECT_NEAR(palette[0].rgb[0], 200, 8);
    EXPECT_NEAR(palette[0].rgb[1], 30, 8);
    EXPECT_NEAR(palette[0].rgb[2], 30, 8);
}

TEST(PaletteQuantizerTest, SeparatesTwoColorsAndSortsByPopulation) {
    cv::Mat rgb(20, 20, CV_8UC3, cv::Scalar(30, 30, 200));
    rgb(cv::Rect(0, 0, 15, 20)).setTo(cv::Scalar(200, 30, 30));

    PaletteQuantizer quantizer(5, 1);
    auto palette = quantizer.quantize(rgb);

    ASSERT_EQ(palette.size(), 2u);
    EXPECT_EQ(palette[0].population, 300);
    EXPECT_EQ(palette[1].population, 100);
    EXPECT_GT(palette[0].rgb[0], palette[0].rgb[2]);
    EXPECT_GT(palette[1].rgb[2], palette[1].rgb[0]);
}

TEST(PaletteQuantizerTest, NeverReturnsMoreThanRequested) {
    cv::Mat rgb(8, 64, CV_8UC3);
    for (int x = 0; x < rgb.cols; ++x) {
        rgb.col(x).setTo(cv::Scalar((x * 37) % 250, (x * 91) % 250, (x * 13) % 250));
    }

    PaletteQuantizer quantizer(3, 1);
    auto palette = quantizer.quantize(rgb);
    EXPECT_LE(palette.size(), 3u);
    EXPECT_FALSE(palette.empty());
    for (size_t i = 1; i < palette.size(); ++i) {
        EXPECT_GE(palette[i - 1].population, palette[i].population);
    }
}

TEST(PaletteQuantizerTest, IgnoresNearWhitePixels) {
    cv::Mat rgb(10, 10, CV_8UC3, cv::Scalar(253, 253, 253));
    PaletteQuantizer quantizer;
    EXPECT_TRUE(quantizer.quantize(rgb).empty());
}

TEST(PaletteQuantizerTest, QualitySkipsPixels) {
    cv::Mat rgb(10, 10, CV_8UC3, cv::Scalar(10, 120, 10));
    PaletteQuantizer quantizer(5, 4);
    auto palette = quantizer.quantize(rgb);
    ASSERT_EQ(palette.size(), 1u);
    EXPECT_EQ(palette[0].population, 25);
}

TEST(PaletteQuantizerTest, EmptyImageGivesEmptyPalette) {
    PaletteQuantizer quantizer;
    EXPECT_TRUE(quantizer.quantize(cv::Mat()).empty());
}

TEST(PaletteQuantizerTest, RejectsNonRgbInput) {
    PaletteQuantizer quantizer;
    cv::Mat gray(4, 4, CV_8UC1, cv::Scalar(10));
    EXPECT_THROW(quantizer.quantize(gray), std::invalid_argument);
}
