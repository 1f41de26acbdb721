#include "pixel_buffer.hpp"
#include <opencv2/imgproc.hpp>
#include <stdexcept>
#include <string>

namespace StripSense {

PixelBuffer PixelBuffer::fromMat(const cv::Mat& image) {
    if (image.empty()) {
        return PixelBuffer();
    }

    cv::Mat source = image;
    if (image.depth() == CV_16U) {
        image.convertTo(source, CV_8U, 1.0 / 257.0);
    } else if (image.depth() != CV_8U) {
        image.convertTo(source, CV_8U);
    }

    cv::Mat rgba;
    switch (source.channels()) {
        case 1:
            cv::cvtColor(source, rgba, cv::COLOR_GRAY2RGBA);
            break;
        case 3:
            cv::cvtColor(source, rgba, cv::COLOR_BGR2RGBA);
            break;
        case 4:
            cv::cvtColor(source, rgba, cv::COLOR_BGRA2RGBA);
            break;
        default:
            throw std::invalid_argument("Unsupported channel count: " + std::to_string(source.channels()));
    }

    return PixelBuffer(rgba);
}

PixelBuffer PixelBuffer::fromRgba(int width, int height, const std::vector<uint8_t>& rgba) {
    if (width <= 0 || height <= 0) {
        throw std::invalid_argument("Pixel buffer dimensions must be positive");
    }
    const size_t expected = static_cast<size_t>(width) * static_cast<size_t>(height) * 4;
    if (rgba.size() != expected) {
        throw std::invalid_argument("RGBA byte count " + std::to_string(rgba.size()) +
                                    " does not match " + std::to_string(width) + "x" +
                                    std::to_string(height));
    }

    cv::Mat wrapped(height, width, CV_8UC4, const_cast<uint8_t*>(rgba.data()));
    return PixelBuffer(wrapped.clone());
}

cv::Mat PixelBuffer::toBgr() const {
    cv::Mat bgr;
    if (!rgba_.empty()) {
        cv::cvtColor(rgba_, bgr, cv::COLOR_RGBA2BGR);
    }
    return bgr;
}

} // namespace StripSense
