#ifndef STRIPSENSE_COLOR_MATCHER_HPP
#define STRIPSENSE_COLOR_MATCHER_HPP

#include "calibration_table.hpp"
#include "color_space.hpp"
#include <memory>
#include <string>

namespace StripSense {

struct MatchResult {
    double value = 0.0;       // rounded to 1 decimal
    ReadingStatus status = ReadingStatus::OK;
    double confidence = 0.0;  // rounded to 2 decimals
    double distance = 0.0;    // distance to the closest reference
};

/**
 * @brief Maps a pad color onto a calibrated chemical value
 *
 * Colors close to a reference snap to that entry; anything further away is
 * interpolated between the two nearest references with inverse-distance
 * weights. The comparison space is fixed at construction.
 */
class ColorMatcher {
public:
    struct Thresholds {
        double snapDistance;
        double maxDistance;
        double confidenceFloor;
    };

    static constexpr Thresholds RGB_THRESHOLDS{50.0, ColorSpace::MAX_RGB_DISTANCE, 0.3};
    static constexpr Thresholds HSV_THRESHOLDS{30.0, ColorSpace::MAX_HSV_DISTANCE, 0.1};

    ColorMatcher(std::shared_ptr<const CalibrationSet> calibration,
                 ColorSpaceStrategy strategy = ColorSpaceStrategy::RGB);

    // @throws InvalidParameterKey for a key outside the calibration set
    MatchResult match(const RGBColor& color, const std::string& parameterKey) const;

    ColorSpaceStrategy strategy() const { return strategy_; }
    const Thresholds& thresholds() const { return thresholds_; }
    const CalibrationSet& calibration() const { return *calibration_; }

private:
    std::shared_ptr<const CalibrationSet> calibration_;
    ColorSpaceStrategy strategy_;
    Thresholds thresholds_;
};

} // namespace StripSense

#endif // STRIPSENSE_COLOR_MATCHER_HPP
