#pragma once

#include "strip_detector.hpp"
#include <opencv2/core.hpp>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace StripSense {

struct AiModelConfig {
    bool enabled = false;
    std::string modelPath;
    int inputWidth = 320;
    int inputHeight = 320;
    std::vector<std::string> inputNames = {"images"};
    std::vector<std::string> outputNames = {"boxes", "scores"};
    float meanValue = 0.0f;
    float scaleValue = 1.0f / 255.0f;
    bool normalizedBoxes = true;   // boxes in [0,1] rather than model input pixels
    double scoreThreshold = 0.3;
};

/**
 * On-device strip detector backed by an ONNX model
 *
 * Expects a single-class detector with a [N,4] xmin,ymin,xmax,ymax box output
 * and a [N] score output. Without ONNX Runtime compiled in, or without a
 * loaded model, detect() reports the backend as unavailable.
 */
class OnnxStripDetector : public StripDetector {
public:
    explicit OnnxStripDetector(const AiModelConfig& config);
    ~OnnxStripDetector() override;

    bool loadModel();
    bool isModelLoaded() const;
    bool isOnnxRuntimeAvailable() const;
    std::string getLastError() const;

    // A single inference call; deadline is checked before it starts
    RemoteDetection detect(const PixelBuffer& buffer,
                           std::chrono::steady_clock::time_point deadline) override;
    std::string name() const override { return "onnx"; }

    // Highest scoring box at or above threshold, mapped to imageSize
    static std::optional<std::pair<cv::Rect, double>> selectBestBox(
        const std::vector<float>& boxes, const std::vector<float>& scores,
        double threshold, const cv::Size& modelSize, const cv::Size& imageSize, bool normalized);

private:
    struct ModelInstance;
    std::unique_ptr<ModelInstance> impl_;

    AiModelConfig config_;
    std::string lastError_;

    // Resize, normalize and reorder to planar CHW float data
    std::vector<float> preprocessImage(const PixelBuffer& buffer) const;
};

} // namespace StripSense
