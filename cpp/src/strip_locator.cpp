#include "strip_locator.hpp"
#include "band_segmenter.hpp"
#include "color_space.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>

namespace StripSense {

namespace {

double rectSum(const cv::Mat& integral, int x, int y, int w, int h) {
    return integral.at<double>(y + h, x + w) - integral.at<double>(y, x + w) -
           integral.at<double>(y + h, x) + integral.at<double>(y, x);
}

// Mean edge strength along the one pixel ring of the window
double borderStrength(const cv::Mat& integral, int x, int y, int w, int h) {
    double sum = rectSum(integral, x, y, w, 1) + rectSum(integral, x, y + h - 1, w, 1);
    int count = 2 * w;
    if (h > 2) {
        sum += rectSum(integral, x, y + 1, 1, h - 2) + rectSum(integral, x + w - 1, y + 1, 1, h - 2);
        count += 2 * (h - 2);
    }
    return sum / count;
}

void keepTop(std::vector<StripCandidate>& top, const StripCandidate& candidate, int limit) {
    if (static_cast<int>(top.size()) >= limit && candidate.confidence <= top.back().confidence) {
        return;
    }
    auto pos = std::upper_bound(top.begin(), top.end(), candidate,
                                [](const StripCandidate& a, const StripCandidate& b) {
                                    return a.confidence > b.confidence;
                                });
    top.insert(pos, candidate);
    if (static_cast<int>(top.size()) > limit) {
        top.pop_back();
    }
}

} // namespace

cv::Mat StripLocator::edgeMap(const PixelBuffer& buffer) {
    cv::Mat edges = cv::Mat::zeros(buffer.height(), buffer.width(), CV_8U);
    if (buffer.width() < 3 || buffer.height() < 3) {
        return edges;
    }

    cv::Mat gray;
    cv::cvtColor(buffer.rgba(), gray, cv::COLOR_RGBA2GRAY);

    for (int y = 1; y < gray.rows - 1; ++y) {
        const uchar* above = gray.ptr<uchar>(y - 1);
        const uchar* row = gray.ptr<uchar>(y);
        const uchar* below = gray.ptr<uchar>(y + 1);
        uchar* out = edges.ptr<uchar>(y);
        for (int x = 1; x < gray.cols - 1; ++x) {
            const double gx = static_cast<double>(row[x + 1]) - row[x - 1];
            const double gy = static_cast<double>(below[x]) - above[x];
            out[x] = static_cast<uchar>(std::min(255.0, std::sqrt(gx * gx + gy * gy)));
        }
    }
    return edges;
}

double StripLocator::aspectScore(double aspectRatio) const {
    const double score = 1.0 - 0.5 * std::abs(aspectRatio - config_.ideal_aspect) / config_.ideal_aspect;
    return std::clamp(score, 0.0, 1.0);
}

double StripLocator::colorVariation(const PixelBuffer& buffer, const std::vector<cv::Rect>& bands) {
    std::vector<RGBColor> means;
    for (const auto& band : bands) {
        const cv::Rect clipped = band & buffer.bounds();
        if (clipped.area() <= 0) continue;
        const cv::Scalar mean = cv::mean(buffer.rgba()(clipped));
        means.push_back(ColorSpace::clampRgb(mean[0], mean[1], mean[2]));
    }

    double total = 0.0;
    int comparisons = 0;
    for (size_t i = 0; i + 1 < means.size(); ++i) {
        for (size_t j = i + 1; j < means.size(); ++j) {
            total += ColorSpace::rgbDistance(means[i], means[j]);
            ++comparisons;
        }
    }

    const double average = comparisons > 0 ? total / comparisons : 0.0;
    return std::min(1.0, average / 100.0);
}

std::optional<StripCandidate> StripLocator::locate(const PixelBuffer& buffer, int padCount) const {
    const int width = buffer.width();
    const int height = buffer.height();
    if (width < 3 || height < 3) {
        return std::nullopt;
    }

    const cv::Mat edges = edgeMap(buffer);
    cv::Mat integral;
    cv::integral(edges, integral, CV_64F);

    const int shortDim = std::min(width, height);
    const int longDim = std::max(width, height);
    const int minShort = std::max(3, static_cast<int>(std::ceil(shortDim * config_.min_short_fraction)));
    const int maxShort = static_cast<int>(std::floor(shortDim * config_.max_short_fraction));
    const int minLong = std::max(3, static_cast<int>(std::ceil(longDim * config_.min_long_fraction)));
    const int step = std::max(1, config_.window_step);
    const int limit = std::max(1, config_.top_candidates);

    std::vector<StripCandidate> top;
    long evaluations = 0;
    bool capped = false;

    for (int orientation = 0; orientation < 2 && !capped; ++orientation) {
        const bool vertical = (orientation == 0);
        // Short side runs across the strip, long side along it
        const int maxLong = vertical ? height : width;
        const int maxAcross = vertical ? width : height;

        for (int y = 0; y < height && !capped; y += step) {
            for (int x = 0; x < width && !capped; x += step) {
                for (int across = minShort; across <= std::min(maxShort, maxAcross) && !capped; across += step) {
                    for (int along = minLong; along <= maxLong && !capped; along += step) {
                        const int w = vertical ? across : along;
                        const int h = vertical ? along : across;
                        if (x + w > width || y + h > height) break;

                        const double aspect = static_cast<double>(along) / across;
                        if (aspect < config_.min_aspect) continue;
                        if (aspect > config_.max_aspect) break;

                        if (++evaluations > config_.max_evaluations) {
                            capped = true;
                            break;
                        }

                        const double edgeScore =
                            borderStrength(integral, x, y, w, h) / 255.0 * aspectScore(aspect);
                        if (edgeScore <= config_.min_edge_score) continue;

                        StripCandidate candidate;
                        candidate.bounds = cv::Rect(x, y, w, h);
                        candidate.isVertical = vertical;
                        candidate.confidence = edgeScore;
                        keepTop(top, candidate, limit);
                    }
                }
            }
        }
    }

    if (debug_mode_) {
        std::cout << "StripLocator: scored " << std::min(evaluations, config_.max_evaluations)
                  << " windows" << (capped ? " (evaluation cap reached)" : "")
                  << ", kept " << top.size() << " candidates" << std::endl;
    }

    if (top.empty()) {
        return std::nullopt;
    }

    const int bands = padCount > 0 ? padCount : 6;
    StripCandidate* best = nullptr;
    for (auto& candidate : top) {
        candidate.bandRegions = BandSegmenter::segment(candidate.bounds, candidate.isVertical, bands);
        const double variation = colorVariation(buffer, candidate.bandRegions);
        candidate.confidence = (candidate.confidence + variation) / 2.0;

        if (!best || candidate.confidence > best->confidence) {
            best = &candidate;
        }
    }

    if (best->confidence < config_.confidence_threshold) {
        if (debug_mode_) {
            std::cout << "StripLocator: best candidate confidence " << best->confidence
                      << " below threshold " << config_.confidence_threshold << std::endl;
        }
        return std::nullopt;
    }

    return *best;
}

} // namespace StripSense
