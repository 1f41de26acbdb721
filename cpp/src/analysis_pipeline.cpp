#include "analysis_pipeline.hpp"
#include "analysis_errors.hpp"
#include "band_segmenter.hpp"
#include "image_loader.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace StripSense {

namespace {

using Clock = std::chrono::steady_clock;

// Cooperative wall-clock budget shared by every stage of one analysis
class Deadline {
public:
    Deadline(Clock::time_point start, int budget_ms)
        : start_(start), budget_ms_(budget_ms), end_(start + std::chrono::milliseconds(budget_ms)) {}

    void check(AnalysisStage stage) const {
        if (budget_ms_ > 0 && Clock::now() > end_) {
            throw AnalysisTimeout(toString(stage), budget_ms_);
        }
    }

    Clock::duration remaining() const {
        return std::max(Clock::duration::zero(), end_ - Clock::now());
    }

    bool unlimited() const { return budget_ms_ <= 0; }

    double elapsedMs() const {
        return std::chrono::duration<double, std::milli>(Clock::now() - start_).count();
    }

private:
    Clock::time_point start_;
    int budget_ms_;
    Clock::time_point end_;
};

// Fixed band centers along the image height, top to bottom
const std::vector<double>& fallbackCenters(StripType type) {
    static const std::vector<double> sixInOne = {0.18, 0.28, 0.38, 0.52, 0.64, 0.78};
    static const std::vector<double> threeInOne = {0.25, 0.50, 0.75};
    return type == StripType::THREE_IN_ONE ? threeInOne : sixInOne;
}

// Floors so the combined confidence never exceeds its inputs
double floorTo2(double value) {
    return std::floor(value * 100.0 + 1e-9) / 100.0;
}

} // namespace

std::string toString(AnalysisStage stage) {
    switch (stage) {
        case AnalysisStage::IDLE: return "Idle";
        case AnalysisStage::LOCATING: return "Locating";
        case AnalysisStage::SEGMENTING: return "Segmenting";
        case AnalysisStage::SAMPLING: return "Sampling";
        case AnalysisStage::FALLBACK_SAMPLING: return "FallbackSampling";
        case AnalysisStage::MATCHING: return "Matching";
        case AnalysisStage::DONE: return "Done";
    }
    return "Unknown";
}

std::string toString(DetectionMethod method) {
    switch (method) {
        case DetectionMethod::STRIP_DETECTION: return "strip-detection";
        case DetectionMethod::AI_DETECTION: return "ai-detection";
        case DetectionMethod::FALLBACK_CENTER_SAMPLING: return "fallback-center-sampling";
    }
    return "unknown";
}

const ParameterReading* AnalysisResult::reading(const std::string& key) const {
    auto it = std::find_if(readings.begin(), readings.end(),
                           [&key](const ParameterReading& r) { return r.parameterKey == key; });
    return (it != readings.end()) ? &(*it) : nullptr;
}

nlohmann::json AnalysisResult::toJson() const {
    nlohmann::json doc;
    doc["stripType"] = toString(stripType);
    doc["stripDetected"] = stripDetected();
    doc["processingMethod"] = toString(processingMethod);
    doc["method"] = toString(method);

    if (strip) {
        doc["strip"] = {
            {"x", strip->bounds.x}, {"y", strip->bounds.y},
            {"width", strip->bounds.width}, {"height", strip->bounds.height},
            {"isVertical", strip->isVertical},
            {"confidence", strip->confidence}
        };
    }

    doc["readings"] = nlohmann::json::array();
    for (const auto& r : readings) {
        doc["readings"].push_back({
            {"parameterKey", r.parameterKey},
            {"name", r.name},
            {"value", r.value},
            {"status", toString(r.status)},
            {"unit", r.unit},
            {"confidence", r.confidence},
            {"detectedColor", {{"r", r.detectedColor.r}, {"g", r.detectedColor.g}, {"b", r.detectedColor.b}}},
            {"method", toString(r.method)}
        });
    }

    doc["stages"] = nlohmann::json::array();
    for (const auto stage : stageTrace) {
        doc["stages"].push_back(toString(stage));
    }
    doc["workingSize"] = {{"width", workingSize.width}, {"height", workingSize.height}};
    doc["elapsedMs"] = std::round(elapsedMs * 10.0) / 10.0;
    return doc;
}

AnalysisPipeline::AnalysisPipeline(std::shared_ptr<const CalibrationSet> calibration,
                                   const PipelineConfig& config,
                                   std::shared_ptr<StripDetector> detector)
    : calibration_(calibration),
      config_(config),
      detector_(std::move(detector)),
      matcher_(calibration, config.colorSpace),
      sampler_(config.sampler),
      locator_(config.locator) {
    locator_.setDebugMode(config_.debug_mode);

    if (config_.debug_mode) {
        std::cout << "AnalysisPipeline: " << calibration_->size() << " calibrated parameters, "
                  << toString(config_.colorSpace) << " matching, budget " << config_.timeout_ms << " ms"
                  << (detector_ ? ", detector " + detector_->name() : std::string()) << std::endl;
    }
}

AnalysisResult AnalysisPipeline::analyze(const PixelBuffer& image, StripType type) const {
    return analyzeWithin(image, type, Clock::now());
}

AnalysisResult AnalysisPipeline::analyzeFile(const std::string& path, StripType type) const {
    const auto start = Clock::now();
    return awaitAndAnalyze(ImageLoader::loadImageAsync(path), type, start);
}

AnalysisResult AnalysisPipeline::analyzeEncoded(std::vector<uint8_t> bytes, StripType type) const {
    const auto start = Clock::now();
    return awaitAndAnalyze(ImageLoader::decodeImageAsync(std::move(bytes)), type, start);
}

AnalysisResult AnalysisPipeline::awaitAndAnalyze(std::future<PixelBuffer> pending, StripType type,
                                                 Clock::time_point start) const {
    const Deadline deadline(start, config_.timeout_ms);
    if (!deadline.unlimited() && pending.wait_for(deadline.remaining()) != std::future_status::ready) {
        throw AnalysisTimeout("Decoding", config_.timeout_ms);
    }

    // Rethrows ImageLoadError from the worker
    PixelBuffer image = pending.get();
    return analyzeWithin(image, type, start);
}

std::vector<cv::Rect> AnalysisPipeline::fallbackRegions(const cv::Size& imageSize, StripType type) const {
    std::vector<cv::Rect> regions;
    if (imageSize.width <= 0 || imageSize.height <= 0) {
        return regions;
    }

    const int x0 = static_cast<int>(std::floor(imageSize.width * config_.fallback_x_start));
    const int x1 = static_cast<int>(std::floor(imageSize.width * config_.fallback_x_end));
    const int bandWidth = std::max(1, x1 - x0);
    const int bandHeight = std::max(1, static_cast<int>(std::floor(imageSize.height * config_.fallback_band_height)));

    for (double center : fallbackCenters(type)) {
        const int y = static_cast<int>(std::floor(imageSize.height * center)) - bandHeight / 2;
        const cv::Rect band(x0, std::max(0, y), bandWidth, bandHeight);
        regions.push_back(band & cv::Rect(0, 0, imageSize.width, imageSize.height));
    }
    return regions;
}

std::optional<StripCandidate> AnalysisPipeline::runDetector(const PixelBuffer& working,
                                                            AnalysisResult& result,
                                                            Clock::time_point deadline) const {
    if (!detector_) {
        return std::nullopt;
    }

    try {
        const RemoteDetection detection = detector_->detect(working, deadline);
        result.processingMethod = detection.processingMethod;

        if (!detection.stripDetected || !detection.stripBounds) {
            if (config_.debug_mode) {
                std::cout << "AnalysisPipeline: " << detector_->name() << " detector found no strip" << std::endl;
            }
            return std::nullopt;
        }

        const cv::Rect bounds = *detection.stripBounds & working.bounds();
        if (bounds.area() <= 0) {
            std::cerr << "AnalysisPipeline: detector bounds outside the image, ignoring" << std::endl;
            return std::nullopt;
        }

        StripCandidate candidate;
        candidate.bounds = bounds;
        candidate.isVertical = bounds.height >= bounds.width;
        candidate.confidence = std::clamp(detection.confidence, 0.0, 1.0);
        return candidate;
    } catch (const RemoteDetectionUnavailable& e) {
        result.processingMethod = ProcessingMethod::FAILED;
        std::cerr << "AnalysisPipeline: " << detector_->name() << " detector unavailable: " << e.what()
                  << " - using local strip locator" << std::endl;
        return std::nullopt;
    }
}

AnalysisResult AnalysisPipeline::analyzeWithin(const PixelBuffer& image, StripType type,
                                               Clock::time_point start) const {
    const Deadline deadline(start, config_.timeout_ms);
    AnalysisResult result;
    result.stripType = type;
    result.stageTrace.push_back(AnalysisStage::IDLE);

    auto enter = [&](AnalysisStage stage) {
        deadline.check(stage);
        result.stageTrace.push_back(stage);
        if (config_.debug_mode) {
            std::cout << "AnalysisPipeline: " << toString(stage) << " (" << deadline.elapsedMs() << " ms)" << std::endl;
        }
    };

    const int pads = padCount(type);

    // Locating
    enter(AnalysisStage::LOCATING);
    const PixelBuffer working = ImageLoader::toWorkingSize(image, config_.working_size);
    result.workingSize = cv::Size(working.width(), working.height());

    // The detector only gets part of what is left so the locator can still run after it gives up
    Clock::time_point detectorDeadline = Clock::time_point::max();
    if (!deadline.unlimited()) {
        const double fraction = std::clamp(config_.detector_budget_fraction, 0.0, 1.0);
        detectorDeadline = Clock::now() + std::chrono::duration_cast<Clock::duration>(deadline.remaining() * fraction);
    }

    std::optional<StripCandidate> strip = runDetector(working, result, detectorDeadline);
    if (strip) {
        result.method = DetectionMethod::AI_DETECTION;
    } else {
        deadline.check(AnalysisStage::LOCATING);
        strip = locator_.locate(working, pads);
        if (strip) {
            result.method = DetectionMethod::STRIP_DETECTION;
        }
    }

    std::vector<cv::Rect> regions;
    double stripConfidence = 1.0;
    double multiplier = 1.0;

    if (strip) {
        enter(AnalysisStage::SEGMENTING);
        regions = BandSegmenter::segment(strip->bounds, strip->isVertical, pads);
        strip->bandRegions = regions;
        stripConfidence = strip->confidence;
        enter(AnalysisStage::SAMPLING);
    } else {
        if (config_.debug_mode) {
            std::cout << "AnalysisPipeline: no strip found, sampling fixed bands" << std::endl;
        }
        result.method = DetectionMethod::FALLBACK_CENTER_SAMPLING;
        enter(AnalysisStage::FALLBACK_SAMPLING);
        regions = fallbackRegions(result.workingSize, type);
        multiplier = config_.fallback_confidence_multiplier;
    }
    result.strip = strip;

    std::vector<BandSample> samples;
    samples.reserve(regions.size());
    for (const auto& region : regions) {
        deadline.check(result.stageTrace.back());
        samples.push_back(sampler_.sampleBand(working, region));
    }

    enter(AnalysisStage::MATCHING);
    const std::vector<std::string> keys = parameterKeys(type);
    for (size_t i = 0; i < keys.size() && i < samples.size(); ++i) {
        deadline.check(AnalysisStage::MATCHING);
        const BandSample& sample = samples[i];

        MatchResult match;
        try {
            match = matcher_.match(sample.dominantColor, keys[i]);
        } catch (const InvalidParameterKey& e) {
            std::cerr << "AnalysisPipeline: skipping " << keys[i] << ": " << e.what() << std::endl;
            continue;
        }

        const ParameterCalibration& table = calibration_->at(keys[i]);
        ParameterReading reading;
        reading.parameterKey = keys[i];
        reading.name = table.name;
        reading.unit = table.unit;
        reading.value = match.value;
        reading.status = match.status;
        reading.detectedColor = sample.dominantColor;
        reading.method = result.method;
        reading.region = sample.region;

        const double combined = std::min({sample.sampleConfidence, match.confidence, stripConfidence});
        reading.confidence = floorTo2(combined * multiplier);

        if (config_.debug_mode) {
            std::cout << "AnalysisPipeline: " << keys[i] << " color (" << sample.dominantColor.r << ","
                      << sample.dominantColor.g << "," << sample.dominantColor.b << ") -> " << reading.value
                      << " " << toString(reading.status) << " conf " << reading.confidence << std::endl;
        }
        result.readings.push_back(reading);
    }

    enter(AnalysisStage::DONE);
    result.elapsedMs = deadline.elapsedMs();

    if (!config_.overlay_path.empty()) {
        writeOverlay(working, result);
    }
    return result;
}

cv::Mat AnalysisPipeline::renderOverlay(const PixelBuffer& workingImage, const AnalysisResult& result) {
    cv::Mat overlay = workingImage.toBgr();
    if (overlay.empty()) {
        return overlay;
    }

    if (result.strip) {
        cv::rectangle(overlay, result.strip->bounds, cv::Scalar(0, 255, 0), 2);
    }

    for (const auto& reading : result.readings) {
        const cv::Scalar color(reading.detectedColor.b, reading.detectedColor.g, reading.detectedColor.r);
        cv::rectangle(overlay, reading.region, cv::Scalar(255, 0, 255), 1);

        // Swatch of the detected color next to the pad
        const int size = std::max(8, reading.region.height);
        cv::Rect swatch(reading.region.x + reading.region.width + 4, reading.region.y, size, size);
        swatch &= cv::Rect(0, 0, overlay.cols, overlay.rows);
        if (swatch.area() > 0) {
            cv::rectangle(overlay, swatch, color, cv::FILLED);
            cv::rectangle(overlay, swatch, cv::Scalar(0, 0, 0), 1);
        }

        cv::putText(overlay, reading.parameterKey, cv::Point(reading.region.x, std::max(10, reading.region.y - 2)),
                    cv::FONT_HERSHEY_SIMPLEX, 0.35, cv::Scalar(0, 0, 0), 1);
    }
    return overlay;
}

void AnalysisPipeline::writeOverlay(const PixelBuffer& working, const AnalysisResult& result) const {
    try {
        const cv::Mat overlay = renderOverlay(working, result);
        if (!cv::imwrite(config_.overlay_path, overlay)) {
            std::cerr << "AnalysisPipeline: failed to write overlay " << config_.overlay_path << std::endl;
        } else if (config_.debug_mode) {
            std::cout << "AnalysisPipeline: overlay written to " << config_.overlay_path << std::endl;
        }
    } catch (const cv::Exception& e) {
        std::cerr << "Debug overlay save error: " << e.what() << std::endl;
    }
}

} // namespace StripSense
