#ifndef STRIPSENSE_PIXEL_BUFFER_HPP
#define STRIPSENSE_PIXEL_BUFFER_HPP

#include <opencv2/core.hpp>
#include <cstdint>
#include <utility>
#include <vector>

namespace StripSense {

/**
 * @brief Immutable RGBA pixel grid handed to the analysis core
 *
 * Backed by an 8UC4 cv::Mat in R,G,B,A channel order. The core only reads
 * from it; every accessor is const and out-of-bounds reads are reported
 * through contains() rather than errors.
 */
class PixelBuffer {
public:
    PixelBuffer() = default;

    /**
     * @brief Wrap a decoded OpenCV image (BGR, BGRA or grayscale)
     * The pixels are converted into a private RGBA copy.
     */
    static PixelBuffer fromMat(const cv::Mat& image);

    /**
     * @brief Build from raw RGBA bytes, row-major, 4 bytes per pixel
     * @throws std::invalid_argument when the byte count does not match
     */
    static PixelBuffer fromRgba(int width, int height, const std::vector<uint8_t>& rgba);

    int width() const { return rgba_.cols; }
    int height() const { return rgba_.rows; }
    bool empty() const { return rgba_.empty(); }

    bool contains(int x, int y) const {
        return x >= 0 && y >= 0 && x < rgba_.cols && y < rgba_.rows;
    }

    // Caller must check contains() first.
    const cv::Vec4b& at(int x, int y) const { return rgba_.at<cv::Vec4b>(y, x); }

    // Full-image rectangle, used for clipping.
    cv::Rect bounds() const { return cv::Rect(0, 0, rgba_.cols, rgba_.rows); }

    // Read-only view of the RGBA matrix.
    const cv::Mat& rgba() const { return rgba_; }

    // BGR copy for OpenCV routines and debug output.
    cv::Mat toBgr() const;

private:
    explicit PixelBuffer(cv::Mat rgba) : rgba_(std::move(rgba)) {}

    cv::Mat rgba_;
};

} // namespace StripSense

#endif // STRIPSENSE_PIXEL_BUFFER_HPP
