#ifndef STRIPSENSE_STRIP_LOCATOR_HPP
#define STRIPSENSE_STRIP_LOCATOR_HPP

#include "pixel_buffer.hpp"
#include <opencv2/core.hpp>
#include <optional>
#include <vector>

namespace StripSense {

struct StripCandidate {
    cv::Rect bounds;
    bool isVertical = true;
    double confidence = 0.0;
    std::vector<cv::Rect> bandRegions;
};

struct LocatorConfig {
    int window_step = 10;               // px between window positions and sizes
    double min_short_fraction = 0.10;   // of the short image dimension
    double max_short_fraction = 0.40;
    double min_long_fraction = 0.30;    // of the long image dimension
    double min_aspect = 2.0;
    double max_aspect = 8.0;
    double ideal_aspect = 4.0;
    double min_edge_score = 0.2;        // windows below this are not kept
    int top_candidates = 5;
    double confidence_threshold = 0.3;
    long max_evaluations = 4000000;     // hard cap on windows scored per call
};

/**
 * @brief Finds the test strip in a photo without any model
 *
 * Slides rectangular windows of strip-like proportions over a gradient map,
 * scores each by the edge strength along its border and by how close its
 * aspect ratio is to a real strip, then re-scores the best few by the color
 * variation between their pads.
 *
 * The buffer is expected at working size; the caller downscales first.
 */
class StripLocator {
public:
    StripLocator() = default;
    explicit StripLocator(const LocatorConfig& config) : config_(config) {}

    // nullopt when no candidate reaches the confidence threshold
    std::optional<StripCandidate> locate(const PixelBuffer& buffer, int padCount) const;

    // Gradient magnitude of the grayscale image, clamped to 255 (CV_8U)
    static cv::Mat edgeMap(const PixelBuffer& buffer);

    // 1 at the ideal aspect ratio, falling off linearly to 0.5 at its double
    double aspectScore(double aspectRatio) const;

    // Mean pairwise RGB distance between band means / 100, clamped to 1
    static double colorVariation(const PixelBuffer& buffer, const std::vector<cv::Rect>& bands);

    void setDebugMode(bool enabled) { debug_mode_ = enabled; }

private:
    LocatorConfig config_;
    bool debug_mode_ = false;
};

} // namespace StripSense

#endif // STRIPSENSE_STRIP_LOCATOR_HPP
