#include "ai_inference.hpp"
#include "analysis_errors.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <filesystem>
#include <iostream>

#ifdef HAVE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace StripSense {

struct OnnxStripDetector::ModelInstance {
#ifdef HAVE_ONNXRUNTIME
    std::unique_ptr<Ort::Session> session;
    std::unique_ptr<Ort::Env> env;
    Ort::MemoryInfo memoryInfo{nullptr};

    ModelInstance() : memoryInfo(Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault)) {
        env = std::make_unique<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "StripSense");
    }
#endif
    bool loaded = false;
};

OnnxStripDetector::OnnxStripDetector(const AiModelConfig& config)
    : impl_(std::make_unique<ModelInstance>()), config_(config) {}

OnnxStripDetector::~OnnxStripDetector() = default;

bool OnnxStripDetector::isOnnxRuntimeAvailable() const {
#ifdef HAVE_ONNXRUNTIME
    return true;
#else
    return false;
#endif
}

bool OnnxStripDetector::loadModel() {
#ifdef HAVE_ONNXRUNTIME
    try {
        if (!std::filesystem::exists(config_.modelPath)) {
            lastError_ = "Model file not found: " + config_.modelPath;
            return false;
        }

        Ort::SessionOptions sessionOptions;
        sessionOptions.SetIntraOpNumThreads(1);
        sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);

        impl_->session = std::make_unique<Ort::Session>(*impl_->env, config_.modelPath.c_str(), sessionOptions);
        impl_->loaded = true;

        std::cout << "OnnxStripDetector: loaded model " << config_.modelPath << std::endl;
        return true;
    }
    catch (const std::exception& e) {
        lastError_ = "Failed to load ONNX model: " + std::string(e.what());
        impl_->loaded = false;
        return false;
    }
#else
    lastError_ = "ONNX Runtime not available in this build";
    return false;
#endif
}

bool OnnxStripDetector::isModelLoaded() const {
    return impl_->loaded;
}

std::string OnnxStripDetector::getLastError() const {
    return lastError_;
}

RemoteDetection OnnxStripDetector::detect(const PixelBuffer& buffer,
                                          std::chrono::steady_clock::time_point deadline) {
    if (!impl_->loaded) {
        throw RemoteDetectionUnavailable(lastError_.empty() ? "Strip detection model not loaded" : lastError_);
    }
    if (buffer.empty()) {
        throw RemoteDetectionUnavailable("No image to run the detector on");
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        throw RemoteDetectionUnavailable("No time left for strip detection");
    }

#ifdef HAVE_ONNXRUNTIME
    try {
        std::vector<float> inputData = preprocessImage(buffer);
        std::vector<int64_t> inputShape = {1, 3, config_.inputHeight, config_.inputWidth};

        Ort::Value inputTensor = Ort::Value::CreateTensor<float>(
            impl_->memoryInfo,
            inputData.data(),
            inputData.size(),
            inputShape.data(),
            inputShape.size()
        );

        std::vector<const char*> inputNames;
        for (const auto& n : config_.inputNames) inputNames.push_back(n.c_str());
        std::vector<const char*> outputNames;
        for (const auto& n : config_.outputNames) outputNames.push_back(n.c_str());

        auto outputTensors = impl_->session->Run(
            Ort::RunOptions{nullptr},
            inputNames.data(),
            &inputTensor,
            1,
            outputNames.data(),
            outputNames.size()
        );

        if (outputTensors.size() < 2 || !outputTensors[0].IsTensor() || !outputTensors[1].IsTensor()) {
            throw RemoteDetectionUnavailable("Unexpected detector outputs");
        }

        const float* rawBoxes = outputTensors[0].GetTensorData<float>();
        const size_t boxCount = outputTensors[0].GetTensorTypeAndShapeInfo().GetElementCount();
        const float* rawScores = outputTensors[1].GetTensorData<float>();
        const size_t scoreCount = outputTensors[1].GetTensorTypeAndShapeInfo().GetElementCount();

        const auto best = selectBestBox(
            std::vector<float>(rawBoxes, rawBoxes + boxCount),
            std::vector<float>(rawScores, rawScores + scoreCount),
            config_.scoreThreshold,
            cv::Size(config_.inputWidth, config_.inputHeight),
            cv::Size(buffer.width(), buffer.height()),
            config_.normalizedBoxes);

        RemoteDetection detection;
        detection.processingMethod = ProcessingMethod::AI;
        if (best) {
            detection.stripDetected = true;
            detection.stripBounds = best->first;
            detection.confidence = best->second;
        }
        return detection;
    }
    catch (const Ort::Exception& e) {
        lastError_ = "Strip detection inference failed: " + std::string(e.what());
        throw RemoteDetectionUnavailable(lastError_);
    }
#else
    throw RemoteDetectionUnavailable("ONNX Runtime not available in this build");
#endif
}

std::optional<std::pair<cv::Rect, double>> OnnxStripDetector::selectBestBox(
    const std::vector<float>& boxes, const std::vector<float>& scores,
    double threshold, const cv::Size& modelSize, const cv::Size& imageSize, bool normalized) {

    const size_t count = std::min(boxes.size() / 4, scores.size());
    int bestIndex = -1;
    double bestScore = threshold;
    for (size_t i = 0; i < count; ++i) {
        if (scores[i] >= bestScore && (bestIndex < 0 || scores[i] > bestScore)) {
            bestScore = scores[i];
            bestIndex = static_cast<int>(i);
        }
    }
    if (bestIndex < 0) {
        return std::nullopt;
    }

    const double sx = normalized ? imageSize.width : static_cast<double>(imageSize.width) / modelSize.width;
    const double sy = normalized ? imageSize.height : static_cast<double>(imageSize.height) / modelSize.height;
    const float* b = &boxes[static_cast<size_t>(bestIndex) * 4];

    cv::Rect rect(cv::Point(static_cast<int>(b[0] * sx), static_cast<int>(b[1] * sy)),
                  cv::Point(static_cast<int>(b[2] * sx), static_cast<int>(b[3] * sy)));
    rect &= cv::Rect(0, 0, imageSize.width, imageSize.height);
    if (rect.area() <= 0) {
        return std::nullopt;
    }
    return std::make_pair(rect, bestScore);
}

std::vector<float> OnnxStripDetector::preprocessImage(const PixelBuffer& buffer) const {
    cv::Mat rgb;
    cv::cvtColor(buffer.rgba(), rgb, cv::COLOR_RGBA2RGB);
    cv::resize(rgb, rgb, cv::Size(config_.inputWidth, config_.inputHeight));

    // (pixel - mean) * scale on every channel
    cv::Mat normalized;
    rgb.convertTo(normalized, CV_32F, config_.scaleValue, -config_.meanValue * config_.scaleValue);

    std::vector<cv::Mat> planes;
    cv::split(normalized, planes);

    const size_t planeSize = static_cast<size_t>(config_.inputWidth) * config_.inputHeight;
    std::vector<float> chw(planeSize * 3);
    for (int c = 0; c < 3; ++c) {
        cv::Mat plane = planes[c].isContinuous() ? planes[c] : planes[c].clone();
        std::copy(plane.ptr<float>(), plane.ptr<float>() + planeSize, chw.begin() + c * planeSize);
    }
    return chw;
}

} // namespace StripSense
