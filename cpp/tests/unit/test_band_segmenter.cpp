/**
 * @file test_band_segmenter.cpp
 * @brief Unit tests for splitting a strip into pad regions
 */

#include "band_segmenter.hpp"

#include <gtest/gtest.h>

#include <stdexcept>

using namespace StripSense;

class BandSegmenterTest : public ::testing::Test {};

TEST_F(BandSegmenterTest, VerticalBandsOrderedTopToBottom) {
    const cv::Rect strip(100, 50, 60, 420);
    const auto bands = BandSegmenter::segment(strip, true, 6);

    ASSERT_EQ(bands.size(), 6u);
    for (size_t i = 1; i < bands.size(); ++i) {
        EXPECT_GT(bands[i].y, bands[i - 1].y);
    }
    for (const auto& band : bands) {
        EXPECT_EQ(band.x, 106);
        EXPECT_EQ(band.width, 48);
        EXPECT_EQ(band.height, 24); // 0.4 * 420 / 7
        EXPECT_GE(band.y, strip.y);
        EXPECT_LE(band.y + band.height, strip.y + strip.height);
    }
}

TEST_F(BandSegmenterTest, BandsCenteredOnSliceBoundaries) {
    const auto bands = BandSegmenter::segment(cv::Rect(0, 0, 50, 700), true, 6);
    ASSERT_EQ(bands.size(), 6u);
    // Slice is 100 px, band 40 px centered on 100, 200, ...
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(bands[i].y, (i + 1) * 100 - 20);
        EXPECT_EQ(bands[i].height, 40);
    }
}

TEST_F(BandSegmenterTest, HorizontalBandsOrderedLeftToRight) {
    const auto bands = BandSegmenter::segment(cv::Rect(20, 200, 400, 80), false, 3);

    ASSERT_EQ(bands.size(), 3u);
    for (size_t i = 1; i < bands.size(); ++i) {
        EXPECT_GT(bands[i].x, bands[i - 1].x);
    }
    for (const auto& band : bands) {
        EXPECT_EQ(band.y, 208);
        EXPECT_EQ(band.height, 64);
        EXPECT_EQ(band.width, 40);
    }
}

TEST_F(BandSegmenterTest, NonPositiveCountReturnsEmpty) {
    EXPECT_TRUE(BandSegmenter::segment(cv::Rect(0, 0, 10, 100), true, 0).empty());
    EXPECT_TRUE(BandSegmenter::segment(cv::Rect(0, 0, 10, 100), true, -2).empty());
}

TEST_F(BandSegmenterTest, InvalidBoundsThrow) {
    EXPECT_THROW(BandSegmenter::segment(cv::Rect(0, 0, 0, 100), true, 6), std::invalid_argument);
    EXPECT_THROW(BandSegmenter::segment(cv::Rect(0, 0, 10, -5), false, 6), std::invalid_argument);
}

TEST_F(BandSegmenterTest, TinyStripStillYieldsPositiveBands) {
    const auto bands = BandSegmenter::segment(cv::Rect(0, 0, 1, 3), true, 6);
    ASSERT_EQ(bands.size(), 6u);
    for (size_t i = 0; i < bands.size(); ++i) {
        EXPECT_GE(bands[i].width, 1);
        EXPECT_GE(bands[i].height, 1);
        if (i > 0) {
            EXPECT_GT(bands[i].y, bands[i - 1].y);
        }
    }
}

TEST_F(BandSegmenterTest, ShortDetectorBoundsKeepStrictOrder) {
    // 4 px long: slice 0.57 px, so the rounded starts of bands 2 and 3 coincide
    const auto vertical = BandSegmenter::segment(cv::Rect(40, 100, 30, 4), true, 6);
    const auto horizontal = BandSegmenter::segment(cv::Rect(100, 40, 4, 30), false, 6);
    ASSERT_EQ(vertical.size(), 6u);
    ASSERT_EQ(horizontal.size(), 6u);
    for (size_t i = 1; i < vertical.size(); ++i) {
        EXPECT_GT(vertical[i].y, vertical[i - 1].y);
        EXPECT_GT(horizontal[i].x, horizontal[i - 1].x);
    }
}
