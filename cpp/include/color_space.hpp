#ifndef STRIPSENSE_COLOR_SPACE_HPP
#define STRIPSENSE_COLOR_SPACE_HPP

#include <string>

namespace StripSense {

struct RGBColor {
    int r = 0;
    int g = 0;
    int b = 0;

    bool operator==(const RGBColor& other) const {
        return r == other.r && g == other.g && b == other.b;
    }
    bool operator!=(const RGBColor& other) const { return !(*this == other); }
};

// h in [0,360), s and v in [0,100]. Kept as doubles so a round trip through
// hsvToRgb() lands within one unit of the source RGB.
struct HSVColor {
    double h = 0.0;
    double s = 0.0;
    double v = 0.0;
};

// Comparison space used by the matcher and the calibration lookup.
enum class ColorSpaceStrategy {
    RGB,
    HSV
};

std::string toString(ColorSpaceStrategy strategy);
// Accepts "rgb"/"hsv" in any case; throws std::invalid_argument otherwise.
ColorSpaceStrategy parseColorSpaceStrategy(const std::string& name);

namespace ColorSpace {

// Theoretical maximum of rgbDistance(): sqrt(3 * 255^2).
constexpr double MAX_RGB_DISTANCE = 441.67;
// Empirical ceiling used to normalise hsvDistance().
constexpr double MAX_HSV_DISTANCE = 200.0;

HSVColor rgbToHsv(const RGBColor& rgb);
RGBColor hsvToRgb(const HSVColor& hsv);

// Euclidean distance in RGB, in [0, 441.67].
double rgbDistance(const RGBColor& a, const RGBColor& b);

/**
 * @brief Perceptual distance in HSV space
 *
 * Circular hue difference weighted by min(s1, s2) / 100 so grays are not
 * penalised for hue, combined with saturation (x0.8) and value (x0.6)
 * differences.
 */
double hsvDistance(const HSVColor& a, const HSVColor& b);

// Dispatches on the strategy; both colors are given in RGB.
double distance(const RGBColor& a, const RGBColor& b, ColorSpaceStrategy strategy);

// 0.299r + 0.587g + 0.114b
double grayLevel(const RGBColor& rgb);

// (max - min) / max in [0,1]; 0 for black.
double saturation(const RGBColor& rgb);

RGBColor clampRgb(double r, double g, double b);

} // namespace ColorSpace
} // namespace StripSense

#endif // STRIPSENSE_COLOR_SPACE_HPP
