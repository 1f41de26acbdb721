#include "region_sampler.hpp"
#include <algorithm>
#include <cmath>
#include <map>

namespace StripSense {

namespace {

struct Bucket {
    RGBColor rgb;
    HSVColor hsv;
    int count = 0;
};

using BucketMap = std::map<long, Bucket>;

void accumulate(BucketMap& buckets, long key, const RGBColor& rgb, const HSVColor& hsv, int count) {
    auto it = buckets.find(key);
    if (it == buckets.end()) {
        buckets.emplace(key, Bucket{rgb, hsv, count});
        return;
    }

    Bucket& bucket = it->second;
    bucket.count += count;
    // Keep the most saturated, then brightest, representative
    if (hsv.s > bucket.hsv.s || (hsv.s == bucket.hsv.s && hsv.v > bucket.hsv.v)) {
        bucket.rgb = rgb;
        bucket.hsv = hsv;
    }
}

double bucketScore(const Bucket& bucket) {
    return bucket.count * (1.0 + bucket.hsv.s / 100.0) * (0.5 + bucket.hsv.v / 200.0);
}

} // namespace

SampleResult RegionSampler::sample(const PixelBuffer& buffer, const cv::Rect& region) const {
    SampleResult result;
    if (buffer.empty() || region.width <= 0 || region.height <= 0) {
        return result;
    }

    const double fraction = std::clamp(config_.window_fraction, 0.0, 1.0);
    const double margin = (1.0 - fraction) / 2.0;
    const int startX = region.x + static_cast<int>(std::floor(region.width * margin));
    const int startY = region.y + static_cast<int>(std::floor(region.height * margin));
    const int windowWidth = std::max(1, static_cast<int>(std::floor(region.width * fraction)));
    const int windowHeight = std::max(1, static_cast<int>(std::floor(region.height * fraction)));
    const int stride = std::max(1, config_.stride);

    BucketMap chromatic;
    BucketMap washedOut;
    int chromaticPixels = 0;
    int washedOutPixels = 0;

    for (int py = startY; py < startY + windowHeight; py += stride) {
        for (int px = startX; px < startX + windowWidth; px += stride) {
            if (!buffer.contains(px, py)) continue;

            const cv::Vec4b& pixel = buffer.at(px, py);
            if (pixel[3] <= config_.alpha_min) continue;

            const RGBColor rgb{pixel[0], pixel[1], pixel[2]};

            if (rgb.r > config_.white_threshold && rgb.g > config_.white_threshold &&
                rgb.b > config_.white_threshold) {
                continue;
            }
            if (rgb.r < config_.black_threshold && rgb.g < config_.black_threshold &&
                rgb.b < config_.black_threshold) {
                continue;
            }

            const HSVColor hsv = ColorSpace::rgbToHsv(rgb);
            const long hueGroup = static_cast<long>(hsv.h / config_.hue_bucket);
            const long satGroup = static_cast<long>(hsv.s / config_.saturation_bucket);
            const long valGroup = static_cast<long>(hsv.v / config_.value_bucket);
            const long key = (hueGroup * 100 + satGroup) * 100 + valGroup;

            if (hsv.s < config_.gray_saturation_max && hsv.v > config_.gray_value_min) {
                accumulate(washedOut, key, rgb, hsv, 1);
                ++washedOutPixels;
            } else {
                accumulate(chromatic, key, rgb, hsv, 1);
                ++chromaticPixels;
            }
        }
    }

    // Gray pixels only count when they are the majority of the pad
    if (washedOutPixels > chromaticPixels) {
        for (const auto& [key, bucket] : washedOut) {
            accumulate(chromatic, key, bucket.rgb, bucket.hsv, bucket.count);
        }
        chromaticPixels += washedOutPixels;
    }

    if (chromatic.empty()) {
        return result;
    }

    const Bucket* best = nullptr;
    double bestScore = -1.0;
    for (const auto& [key, bucket] : chromatic) {
        const double score = bucketScore(bucket);
        if (score > bestScore) {
            bestScore = score;
            best = &bucket;
        }
    }

    result.color = best->rgb;
    result.confidence = std::min(1.0, best->count * (best->hsv.s / 100.0) * (best->hsv.v / 100.0) / 10.0);
    result.pixelsAccepted = chromaticPixels;
    result.bucketCount = static_cast<int>(chromatic.size());
    return result;
}

BandSample RegionSampler::sampleBand(const PixelBuffer& buffer, const cv::Rect& region) const {
    const SampleResult sampled = sample(buffer, region);
    BandSample band;
    band.region = region;
    band.dominantColor = sampled.color;
    band.sampleConfidence = sampled.confidence;
    return band;
}

} // namespace StripSense
