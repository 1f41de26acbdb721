#include "color_space.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace StripSense {

std::string toString(ColorSpaceStrategy strategy) {
    return strategy == ColorSpaceStrategy::HSV ? "hsv" : "rgb";
}

ColorSpaceStrategy parseColorSpaceStrategy(const std::string& name) {
    std::string lowered = name;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lowered == "rgb") return ColorSpaceStrategy::RGB;
    if (lowered == "hsv") return ColorSpaceStrategy::HSV;
    throw std::invalid_argument("Unknown color space strategy: " + name);
}

namespace ColorSpace {

HSVColor rgbToHsv(const RGBColor& rgb) {
    const double r = rgb.r / 255.0;
    const double g = rgb.g / 255.0;
    const double b = rgb.b / 255.0;

    const double max = std::max({r, g, b});
    const double min = std::min({r, g, b});
    const double diff = max - min;

    HSVColor hsv;
    hsv.v = max * 100.0;

    if (diff == 0.0) {
        // Achromatic
        return hsv;
    }

    hsv.s = diff / max * 100.0;

    double h;
    if (max == r) {
        h = (g - b) / diff + (g < b ? 6.0 : 0.0);
    } else if (max == g) {
        h = (b - r) / diff + 2.0;
    } else {
        h = (r - g) / diff + 4.0;
    }
    hsv.h = std::fmod(h * 60.0, 360.0);
    return hsv;
}

RGBColor hsvToRgb(const HSVColor& hsv) {
    double h = std::fmod(hsv.h, 360.0);
    if (h < 0.0) h += 360.0;
    const double s = std::clamp(hsv.s, 0.0, 100.0) / 100.0;
    const double v = std::clamp(hsv.v, 0.0, 100.0) / 100.0;

    const double c = v * s;
    const double x = c * (1.0 - std::abs(std::fmod(h / 60.0, 2.0) - 1.0));
    const double m = v - c;

    double r = 0.0, g = 0.0, b = 0.0;
    switch (static_cast<int>(h / 60.0)) {
        case 0: r = c; g = x; b = 0; break;
        case 1: r = x; g = c; b = 0; break;
        case 2: r = 0; g = c; b = x; break;
        case 3: r = 0; g = x; b = c; break;
        case 4: r = x; g = 0; b = c; break;
        default: r = c; g = 0; b = x; break;
    }

    return clampRgb((r + m) * 255.0, (g + m) * 255.0, (b + m) * 255.0);
}

double rgbDistance(const RGBColor& a, const RGBColor& b) {
    const double dr = a.r - b.r;
    const double dg = a.g - b.g;
    const double db = a.b - b.b;
    return std::sqrt(dr * dr + dg * dg + db * db);
}

double hsvDistance(const HSVColor& a, const HSVColor& b) {
    const double rawHue = std::abs(a.h - b.h);
    const double hueDiff = std::min(rawHue, 360.0 - rawHue);
    const double satDiff = std::abs(a.s - b.s);
    const double valDiff = std::abs(a.v - b.v);

    const double hueWeight = std::min(a.s, b.s) / 100.0;
    const double satWeight = 0.8;
    const double valWeight = 0.6;

    const double hueTerm = hueDiff * hueWeight;
    const double satTerm = satDiff * satWeight;
    const double valTerm = valDiff * valWeight;
    return std::sqrt(hueTerm * hueTerm + satTerm * satTerm + valTerm * valTerm);
}

double distance(const RGBColor& a, const RGBColor& b, ColorSpaceStrategy strategy) {
    if (strategy == ColorSpaceStrategy::HSV) {
        return hsvDistance(rgbToHsv(a), rgbToHsv(b));
    }
    return rgbDistance(a, b);
}

double grayLevel(const RGBColor& rgb) {
    return 0.299 * rgb.r + 0.587 * rgb.g + 0.114 * rgb.b;
}

double saturation(const RGBColor& rgb) {
    const int max = std::max({rgb.r, rgb.g, rgb.b});
    const int min = std::min({rgb.r, rgb.g, rgb.b});
    return max == 0 ? 0.0 : static_cast<double>(max - min) / max;
}

RGBColor clampRgb(double r, double g, double b) {
    auto channel = [](double value) {
        return static_cast<int>(std::lround(std::clamp(value, 0.0, 255.0)));
    };
    return RGBColor{channel(r), channel(g), channel(b)};
}

} // namespace ColorSpace
} // namespace StripSense
