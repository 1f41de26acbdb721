#ifndef STRIPSENSE_ANALYSIS_PIPELINE_HPP
#define STRIPSENSE_ANALYSIS_PIPELINE_HPP

#include "calibration_table.hpp"
#include "color_matcher.hpp"
#include "pixel_buffer.hpp"
#include "region_sampler.hpp"
#include "strip_detector.hpp"
#include "strip_locator.hpp"
#include <opencv2/core.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace StripSense {

enum class AnalysisStage {
    IDLE,
    LOCATING,
    SEGMENTING,
    SAMPLING,
    FALLBACK_SAMPLING,
    MATCHING,
    DONE
};

std::string toString(AnalysisStage stage);

// How the pad regions of a reading were found
enum class DetectionMethod {
    STRIP_DETECTION,          // local StripLocator
    AI_DETECTION,             // remote service or on-device model
    FALLBACK_CENTER_SAMPLING  // fixed bands, no strip found
};

std::string toString(DetectionMethod method);

struct ParameterReading {
    std::string parameterKey;
    std::string name;
    double value = 0.0;
    ReadingStatus status = ReadingStatus::OK;
    std::string unit;
    double confidence = 0.0;
    RGBColor detectedColor{255, 255, 255};
    DetectionMethod method = DetectionMethod::FALLBACK_CENTER_SAMPLING;
    cv::Rect region; // working-image coordinates
};

struct AnalysisResult {
    StripType stripType = StripType::SIX_IN_ONE;
    std::vector<ParameterReading> readings; // physical pad order
    std::vector<AnalysisStage> stageTrace;
    std::optional<StripCandidate> strip;    // working-image coordinates
    DetectionMethod method = DetectionMethod::FALLBACK_CENTER_SAMPLING;
    ProcessingMethod processingMethod = ProcessingMethod::FALLBACK;
    cv::Size workingSize;
    double elapsedMs = 0.0;

    bool stripDetected() const { return strip.has_value(); }
    // nullptr when the key was skipped or is not part of the strip type
    const ParameterReading* reading(const std::string& key) const;

    nlohmann::json toJson() const;
};

struct PipelineConfig {
    ColorSpaceStrategy colorSpace = ColorSpaceStrategy::RGB;
    int timeout_ms = 3000;
    int working_size = 800;

    // Fallback band layout, as fractions of the working image
    double fallback_x_start = 0.3;
    double fallback_x_end = 0.7;
    double fallback_band_height = 0.02;
    double fallback_confidence_multiplier = 0.7;

    // Share of the remaining budget a strip detector may use before the local locator takes over
    double detector_budget_fraction = 0.5;

    SamplerConfig sampler;
    LocatorConfig locator;

    bool debug_mode = false;
    std::string overlay_path; // written after every analysis when set
};

/**
 * @brief Image-to-readings state machine
 *
 * Locating -> Segmenting -> Sampling -> Matching -> Done, or
 * Locating -> FallbackSampling -> Matching -> Done when no strip is found.
 * Holds only read-only collaborators, so one pipeline may serve concurrent
 * analyses of different images.
 */
class AnalysisPipeline {
public:
    AnalysisPipeline(std::shared_ptr<const CalibrationSet> calibration,
                     const PipelineConfig& config,
                     std::shared_ptr<StripDetector> detector = nullptr);

    /**
     * @brief Analyze an already decoded image
     * @throws AnalysisTimeout when the wall-clock budget runs out
     */
    AnalysisResult analyze(const PixelBuffer& image, StripType type) const;

    /**
     * @brief Decode asynchronously, then analyze, all within one budget
     * @throws ImageLoadError, AnalysisTimeout
     */
    AnalysisResult analyzeFile(const std::string& path, StripType type) const;
    AnalysisResult analyzeEncoded(std::vector<uint8_t> bytes, StripType type) const;

    // Band regions used when no strip is found
    std::vector<cv::Rect> fallbackRegions(const cv::Size& imageSize, StripType type) const;

    // Copy of the image with strip bounds, pad regions and detected colors drawn on it (BGR)
    static cv::Mat renderOverlay(const PixelBuffer& workingImage, const AnalysisResult& result);

    const PipelineConfig& config() const { return config_; }

private:
    AnalysisResult analyzeWithin(const PixelBuffer& image, StripType type,
                                 std::chrono::steady_clock::time_point start) const;
    AnalysisResult awaitAndAnalyze(std::future<PixelBuffer> pending, StripType type,
                                   std::chrono::steady_clock::time_point start) const;
    std::optional<StripCandidate> runDetector(const PixelBuffer& working, AnalysisResult& result,
                                              std::chrono::steady_clock::time_point deadline) const;
    void writeOverlay(const PixelBuffer& working, const AnalysisResult& result) const;

    std::shared_ptr<const CalibrationSet> calibration_;
    PipelineConfig config_;
    std::shared_ptr<StripDetector> detector_;
    ColorMatcher matcher_;
    RegionSampler sampler_;
    StripLocator locator_;
};

} // namespace StripSense

#endif // STRIPSENSE_ANALYSIS_PIPELINE_HPP
