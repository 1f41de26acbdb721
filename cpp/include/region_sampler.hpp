#ifndef STRIPSENSE_REGION_SAMPLER_HPP
#define STRIPSENSE_REGION_SAMPLER_HPP

#include "color_space.hpp"
#include "pixel_buffer.hpp"
#include <opencv2/core.hpp>

namespace StripSense {

struct SamplerConfig {
    double window_fraction = 0.5; // central part of the region kept on both axes
    int stride = 2;               // sample every Nth pixel

    int alpha_min = 200;          // pixels with alpha <= this are skipped
    int white_threshold = 235;    // r,g,b all above -> background
    int black_threshold = 25;     // r,g,b all below -> shadow/text

    // Low-saturation bright pixels are only counted when they dominate.
    double gray_saturation_max = 15.0;
    double gray_value_min = 80.0;

    // HSV bucket widths
    double hue_bucket = 15.0;
    double saturation_bucket = 20.0;
    double value_bucket = 20.0;
};

struct SampleResult {
    RGBColor color{255, 255, 255};
    double confidence = 0.0;
    int pixelsAccepted = 0;
    int bucketCount = 0;
};

struct BandSample {
    cv::Rect region;
    RGBColor dominantColor{255, 255, 255};
    double sampleConfidence = 0.0;
};

/**
 * @brief Robust dominant-color extraction for a reagent pad
 *
 * Filters background, shadow and washed-out pixels, clusters the survivors in
 * HSV buckets and returns the representative of the best scoring bucket.
 * Never throws; an empty or fully filtered window yields white with
 * confidence 0.
 */
class RegionSampler {
public:
    RegionSampler() = default;
    explicit RegionSampler(const SamplerConfig& config) : config_(config) {}

    SampleResult sample(const PixelBuffer& buffer, const cv::Rect& region) const;

    BandSample sampleBand(const PixelBuffer& buffer, const cv::Rect& region) const;

    const SamplerConfig& config() const { return config_; }

private:
    SamplerConfig config_;
};

} // namespace StripSense

#endif // STRIPSENSE_REGION_SAMPLER_HPP
