/**
 * @file test_image_loader.cpp
 * @brief Unit tests for decoding and working-size conversion
 */

#include "analysis_errors.hpp"
#include "image_loader.hpp"
#include "test_images.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgcodecs.hpp>

#include <cstdio>
#include <stdexcept>
#include <vector>

using namespace StripSense;

class ImageLoaderTest : public ::testing::Test {
protected:
    std::vector<uint8_t> encodePng(const cv::Mat& image) {
        std::vector<uchar> bytes;
        cv::imencode(".png", image, bytes);
        return std::vector<uint8_t>(bytes.begin(), bytes.end());
    }
};

TEST_F(ImageLoaderTest, DecodesPngIntoRgba) {
    const auto bytes = encodePng(TestImages::canvas(16, 8, {10, 20, 30}));
    const PixelBuffer buffer = ImageLoader::decodeImage(bytes);

    EXPECT_EQ(buffer.width(), 16);
    EXPECT_EQ(buffer.height(), 8);
    const cv::Vec4b& px = buffer.at(3, 3);
    EXPECT_EQ(px[0], 10);
    EXPECT_EQ(px[1], 20);
    EXPECT_EQ(px[2], 30);
    EXPECT_EQ(px[3], 255);
}

TEST_F(ImageLoaderTest, GarbageBytesThrowImageLoadError) {
    EXPECT_THROW(ImageLoader::decodeImage({1, 2, 3, 4, 5}), ImageLoadError);
    EXPECT_THROW(ImageLoader::decodeImage({}), ImageLoadError);
}

TEST_F(ImageLoaderTest, MissingFileThrowsImageLoadError) {
    EXPECT_THROW(ImageLoader::loadImage("/nonexistent/strip.jpg"), ImageLoadError);
}

TEST_F(ImageLoaderTest, LoadsFileFromDisk) {
    const std::string path = ::testing::TempDir() + "stripsense_loader.png";
    ASSERT_TRUE(cv::imwrite(path, TestImages::canvas(12, 20, {200, 100, 50})));

    const PixelBuffer buffer = ImageLoader::loadImage(path);
    EXPECT_EQ(buffer.width(), 12);
    EXPECT_EQ(buffer.height(), 20);
    EXPECT_EQ(buffer.at(0, 0)[0], 200);
    std::remove(path.c_str());
}

TEST_F(ImageLoaderTest, AsyncDecodeSurfacesErrorsFromGet) {
    auto good = ImageLoader::decodeImageAsync(encodePng(TestImages::canvas(4, 4, {1, 2, 3})));
    EXPECT_EQ(good.get().width(), 4);

    auto bad = ImageLoader::decodeImageAsync({9, 9, 9});
    EXPECT_THROW(bad.get(), ImageLoadError);

    auto missing = ImageLoader::loadImageAsync("/nonexistent/strip.png");
    EXPECT_THROW(missing.get(), ImageLoadError);
}

TEST_F(ImageLoaderTest, WorkingSizeDownscalesLongestSide) {
    const PixelBuffer large = TestImages::solid(1600, 1200, {50, 150, 250});
    const PixelBuffer working = ImageLoader::toWorkingSize(large, 800);

    EXPECT_EQ(working.width(), 800);
    EXPECT_EQ(working.height(), 600);
    EXPECT_EQ(working.at(400, 300)[2], 250);
}

TEST_F(ImageLoaderTest, WorkingSizeKeepsSmallImages) {
    const PixelBuffer small = TestImages::solid(300, 200, {1, 2, 3});
    const PixelBuffer working = ImageLoader::toWorkingSize(small, 800);
    EXPECT_EQ(working.width(), 300);
    EXPECT_EQ(working.height(), 200);
}

TEST_F(ImageLoaderTest, PixelBufferFromRgbaValidatesSize) {
    EXPECT_THROW(PixelBuffer::fromRgba(2, 2, std::vector<uint8_t>(15)), std::invalid_argument);
    EXPECT_THROW(PixelBuffer::fromRgba(0, 2, {}), std::invalid_argument);

    const PixelBuffer buffer = PixelBuffer::fromRgba(1, 1, {9, 8, 7, 6});
    EXPECT_EQ(buffer.at(0, 0)[3], 6);
    EXPECT_TRUE(buffer.contains(0, 0));
    EXPECT_FALSE(buffer.contains(1, 0));
}
