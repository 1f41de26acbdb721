#include "band_segmenter.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace StripSense {
namespace BandSegmenter {

std::vector<cv::Rect> segment(const cv::Rect& bounds, bool isVertical, int count) {
    if (bounds.width <= 0 || bounds.height <= 0) {
        throw std::invalid_argument("Strip bounds must have a positive size");
    }

    std::vector<cv::Rect> bands;
    if (count <= 0) {
        return bands;
    }
    bands.reserve(count);

    // Work along the strip axis, then transpose for horizontal strips
    const double length = isVertical ? bounds.height : bounds.width;
    const double across = isVertical ? bounds.width : bounds.height;
    const int axisOrigin = isVertical ? bounds.y : bounds.x;
    const int crossOrigin = isVertical ? bounds.x : bounds.y;

    const double slice = length / (count + 1);
    // Small epsilon so exact products such as 60 * 0.4 do not floor one pixel short
    const int bandLength = std::max(1, static_cast<int>(std::floor(slice * BAND_LENGTH_FRACTION + 1e-9)));
    const int bandAcross = std::max(1, static_cast<int>(std::floor(across * BAND_WIDTH_FRACTION + 1e-9)));
    const int crossStart = crossOrigin + (static_cast<int>(across) - bandAcross) / 2;

    int previous = 0;
    for (int i = 0; i < count; ++i) {
        const double center = axisOrigin + (i + 1) * slice;
        int start = static_cast<int>(std::lround(center - bandLength / 2.0));
        // Strips shorter than the pad count would round several bands onto one pixel
        if (i > 0 && start <= previous) {
            start = previous + 1;
        }
        previous = start;

        if (isVertical) {
            bands.emplace_back(crossStart, start, bandAcross, bandLength);
        } else {
            bands.emplace_back(start, crossStart, bandLength, bandAcross);
        }
    }

    return bands;
}

} // namespace BandSegmenter
} // namespace StripSense
