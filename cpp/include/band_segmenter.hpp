#ifndef STRIPSENSE_BAND_SEGMENTER_HPP
#define STRIPSENSE_BAND_SEGMENTER_HPP

#include <opencv2/core.hpp>
#include <vector>

namespace StripSense {

namespace BandSegmenter {

// Fraction of each slice kept along the strip axis (reduces cross-band bleed)
constexpr double BAND_LENGTH_FRACTION = 0.4;
// Fraction of the strip kept across the strip axis
constexpr double BAND_WIDTH_FRACTION = 0.8;

/**
 * @brief Split a strip into one region per reagent pad
 *
 * The strip is divided into count + 1 equal slices and each pad is centered
 * on an inner slice boundary. Regions are returned top-to-bottom for a
 * vertical strip and left-to-right for a horizontal one, each starting at
 * least one pixel after the previous; on very short strips the last bands
 * may therefore extend past the bounds.
 *
 * @throws std::invalid_argument if bounds has a non-positive size
 */
std::vector<cv::Rect> segment(const cv::Rect& bounds, bool isVertical, int count);

} // namespace BandSegmenter
} // namespace StripSense

#endif // STRIPSENSE_BAND_SEGMENTER_HPP
