#include "color_matcher.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

namespace StripSense {

namespace {

struct Candidate {
    const CalibrationEntry* entry;
    double distance;
};

double roundTo(double value, double scale) {
    return std::round(value * scale) / scale;
}

} // namespace

ColorMatcher::ColorMatcher(std::shared_ptr<const CalibrationSet> calibration, ColorSpaceStrategy strategy)
    : calibration_(std::move(calibration)),
      strategy_(strategy),
      thresholds_(strategy == ColorSpaceStrategy::HSV ? HSV_THRESHOLDS : RGB_THRESHOLDS) {
    if (!calibration_) {
        throw std::invalid_argument("ColorMatcher requires a calibration set");
    }
}

MatchResult ColorMatcher::match(const RGBColor& color, const std::string& parameterKey) const {
    const ParameterCalibration& table = calibration_->at(parameterKey);
    MatchResult result;
    if (table.entries.empty()) {
        return result;
    }

    std::vector<Candidate> candidates;
    candidates.reserve(table.entries.size());
    for (const auto& entry : table.entries) {
        candidates.push_back({&entry, ColorSpace::distance(color, entry.referenceColor, strategy_)});
    }

    // Stable so that ties keep table order
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.distance < b.distance; });

    const Candidate& closest = candidates.front();
    double value = closest.entry->representativeValue();

    if (candidates.size() > 1 && closest.distance >= thresholds_.snapDistance) {
        const Candidate& second = candidates[1];
        const double total = closest.distance + second.distance;
        const double wClosest = second.distance / total;
        const double wSecond = closest.distance / total;
        value = closest.entry->representativeValue() * wClosest +
                second.entry->representativeValue() * wSecond;
    }

    if (!std::isfinite(value) || value < 0.0) {
        value = closest.entry->representativeValue();
    }

    result.value = roundTo(value, 10.0);
    result.status = calibration_->statusForValue(parameterKey, result.value);
    result.distance = closest.distance;

    const double raw = 1.0 - closest.distance / thresholds_.maxDistance;
    result.confidence = roundTo(std::clamp(raw, thresholds_.confidenceFloor, 1.0), 100.0);
    return result;
}

} // namespace StripSense
