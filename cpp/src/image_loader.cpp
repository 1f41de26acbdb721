#include "image_loader.hpp"
#include "analysis_errors.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <thread>
#include <utility>

namespace StripSense {
namespace ImageLoader {

namespace {

PixelBuffer toPixelBuffer(const cv::Mat& image) {
    try {
        return PixelBuffer::fromMat(image);
    } catch (const std::invalid_argument& e) {
        throw ImageLoadError(e.what());
    }
}

} // namespace

PixelBuffer loadImage(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        throw ImageLoadError("Image file not found: " + path);
    }

    cv::Mat image;
    try {
        image = cv::imread(path, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw ImageLoadError("Failed to decode " + path + ": " + e.what());
    }

    if (image.empty()) {
        throw ImageLoadError("Failed to decode image: " + path);
    }
    return toPixelBuffer(image);
}

PixelBuffer decodeImage(const std::vector<uint8_t>& bytes) {
    if (bytes.empty()) {
        throw ImageLoadError("Empty image data");
    }

    cv::Mat image;
    try {
        image = cv::imdecode(bytes, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception& e) {
        throw ImageLoadError(std::string("Failed to decode image data: ") + e.what());
    }

    if (image.empty()) {
        throw ImageLoadError("Unsupported or corrupt image data (" + std::to_string(bytes.size()) + " bytes)");
    }
    return toPixelBuffer(image);
}

namespace {

// Detached worker: an abandoned future (timeout) must not block the caller
std::future<PixelBuffer> runDetached(std::packaged_task<PixelBuffer()> task) {
    std::future<PixelBuffer> result = task.get_future();
    std::thread(std::move(task)).detach();
    return result;
}

} // namespace

std::future<PixelBuffer> loadImageAsync(const std::string& path) {
    return runDetached(std::packaged_task<PixelBuffer()>([path]() { return loadImage(path); }));
}

std::future<PixelBuffer> decodeImageAsync(std::vector<uint8_t> bytes) {
    return runDetached(std::packaged_task<PixelBuffer()>(
        [data = std::move(bytes)]() { return decodeImage(data); }));
}

PixelBuffer toWorkingSize(const PixelBuffer& buffer, int maxDimension) {
    const int longest = std::max(buffer.width(), buffer.height());
    if (buffer.empty() || maxDimension <= 0 || longest <= maxDimension) {
        return buffer;
    }

    const double scale = static_cast<double>(maxDimension) / longest;
    const cv::Size size(std::max(1, static_cast<int>(std::round(buffer.width() * scale))),
                        std::max(1, static_cast<int>(std::round(buffer.height() * scale))));

    cv::Mat resized;
    cv::resize(buffer.rgba(), resized, size, 0, 0, cv::INTER_AREA);

    cv::Mat bgra;
    cv::cvtColor(resized, bgra, cv::COLOR_RGBA2BGRA);
    return PixelBuffer::fromMat(bgra);
}

} // namespace ImageLoader
} // namespace StripSense
