/**
 * @file test_strip_locator.cpp
 * @brief Unit tests for model-free strip localization
 */

#include "strip_locator.hpp"
#include "test_images.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace StripSense;

class StripLocatorTest : public ::testing::Test {
protected:
    StripLocator locator_;
};

TEST_F(StripLocatorTest, FindsVerticalStrip) {
    const cv::Rect strip(170, 120, 60, 240);
    const PixelBuffer buffer = PixelBuffer::fromMat(
        TestImages::stripPhoto(strip, true, TestImages::referencePads()));

    const auto found = locator_.locate(buffer, 6);
    ASSERT_TRUE(found.has_value());
    EXPECT_TRUE(found->isVertical);
    EXPECT_LE(std::abs(found->bounds.x - strip.x), 10);
    EXPECT_LE(std::abs(found->bounds.y - strip.y), 10);
    EXPECT_LE(std::abs(found->bounds.width - strip.width), 10);
    EXPECT_LE(std::abs(found->bounds.height - strip.height), 10);
    EXPECT_GE(found->confidence, 0.3);
    EXPECT_LE(found->confidence, 1.0);
    EXPECT_EQ(found->bandRegions.size(), 6u);
}

TEST_F(StripLocatorTest, FindsHorizontalStrip) {
    const cv::Rect strip(80, 170, 240, 60);
    const PixelBuffer buffer = PixelBuffer::fromMat(
        TestImages::stripPhoto(strip, false, TestImages::referencePads(), 400, 400));

    const auto found = locator_.locate(buffer, 6);
    ASSERT_TRUE(found.has_value());
    EXPECT_FALSE(found->isVertical);
    EXPECT_LE(std::abs(found->bounds.x - strip.x), 10);
    EXPECT_LE(std::abs(found->bounds.y - strip.y), 10);

    // Bands run left to right
    ASSERT_EQ(found->bandRegions.size(), 6u);
    for (size_t i = 1; i < found->bandRegions.size(); ++i) {
        EXPECT_GT(found->bandRegions[i].x, found->bandRegions[i - 1].x);
    }
}

TEST_F(StripLocatorTest, BlankImageHasNoStrip) {
    const PixelBuffer buffer = TestImages::solid(300, 400, {128, 128, 128});
    EXPECT_FALSE(locator_.locate(buffer, 6).has_value());
}

TEST_F(StripLocatorTest, TinyOrEmptyImageHasNoStrip) {
    EXPECT_FALSE(locator_.locate(PixelBuffer(), 6).has_value());
    EXPECT_FALSE(locator_.locate(TestImages::solid(2, 2, {10, 200, 10}), 6).has_value());
}

TEST_F(StripLocatorTest, PlainWhiteStripScoresBelowColoredStrip) {
    // Same outline without pads: edge score only, no color variation
    const cv::Rect strip(170, 120, 60, 240);
    const PixelBuffer plain = PixelBuffer::fromMat(TestImages::stripPhoto(strip, true, {}));
    const PixelBuffer colored = PixelBuffer::fromMat(
        TestImages::stripPhoto(strip, true, TestImages::referencePads()));

    const auto withPads = locator_.locate(colored, 6);
    ASSERT_TRUE(withPads.has_value());

    const auto withoutPads = locator_.locate(plain, 6);
    if (withoutPads) {
        EXPECT_LT(withoutPads->confidence, withPads->confidence);
    }
}

TEST_F(StripLocatorTest, EvaluationCapEndsSearchEarly) {
    LocatorConfig config;
    config.max_evaluations = 1;
    const StripLocator capped(config);

    const PixelBuffer buffer = PixelBuffer::fromMat(
        TestImages::stripPhoto(cv::Rect(170, 120, 60, 240), true, TestImages::referencePads()));
    // The single window scored sits in the top-left corner, away from the strip
    EXPECT_FALSE(capped.locate(buffer, 6).has_value());
}

TEST_F(StripLocatorTest, EdgeMapRespondsToStepEdges) {
    cv::Mat image = TestImages::canvas(20, 20, {0, 0, 0});
    TestImages::fillRect(image, cv::Rect(10, 0, 10, 20), {255, 255, 255});
    const cv::Mat edges = StripLocator::edgeMap(PixelBuffer::fromMat(image));

    ASSERT_EQ(edges.type(), CV_8U);
    EXPECT_EQ(edges.at<uchar>(5, 2), 0);
    EXPECT_EQ(edges.at<uchar>(5, 9), 255);
    EXPECT_EQ(edges.at<uchar>(5, 10), 255);
    EXPECT_EQ(edges.at<uchar>(5, 15), 0);
    EXPECT_EQ(edges.at<uchar>(0, 9), 0); // border rows are left at zero
}

TEST_F(StripLocatorTest, AspectScorePeaksAtIdealRatio) {
    EXPECT_DOUBLE_EQ(locator_.aspectScore(4.0), 1.0);
    EXPECT_DOUBLE_EQ(locator_.aspectScore(8.0), 0.5);
    EXPECT_LT(locator_.aspectScore(2.0), 1.0);
    EXPECT_GT(locator_.aspectScore(3.0), locator_.aspectScore(2.0));
}

TEST_F(StripLocatorTest, ColorVariation) {
    cv::Mat image = TestImages::canvas(100, 20, {255, 0, 0});
    TestImages::fillRect(image, cv::Rect(50, 0, 50, 20), {0, 0, 255});
    const PixelBuffer buffer = PixelBuffer::fromMat(image);

    const std::vector<cv::Rect> same = {cv::Rect(0, 0, 20, 20), cv::Rect(25, 0, 20, 20)};
    EXPECT_DOUBLE_EQ(StripLocator::colorVariation(buffer, same), 0.0);

    const std::vector<cv::Rect> different = {cv::Rect(0, 0, 20, 20), cv::Rect(60, 0, 20, 20)};
    EXPECT_DOUBLE_EQ(StripLocator::colorVariation(buffer, different), 1.0);

    EXPECT_DOUBLE_EQ(StripLocator::colorVariation(buffer, {}), 0.0);
}
