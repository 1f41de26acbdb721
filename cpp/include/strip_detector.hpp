#ifndef STRIPSENSE_STRIP_DETECTOR_HPP
#define STRIPSENSE_STRIP_DETECTOR_HPP

#include "pixel_buffer.hpp"
#include <opencv2/core.hpp>
#include <chrono>
#include <optional>
#include <string>

namespace StripSense {

enum class ProcessingMethod {
    AI,
    FALLBACK,
    FAILED
};

// "ai" / "fallback" / "error", as exchanged with the detection service
std::string toString(ProcessingMethod method);
ProcessingMethod parseProcessingMethod(const std::string& name);

struct RemoteDetection {
    bool stripDetected = false;
    std::optional<cv::Rect> stripBounds; // in the coordinates of the submitted buffer
    ProcessingMethod processingMethod = ProcessingMethod::FALLBACK;
    double confidence = 1.0;
};

/**
 * @brief Optional assist that finds the strip before the local locator runs
 *
 * Implementations throw RemoteDetectionUnavailable when their backend is
 * absent or fails, or when the answer does not arrive before deadline; the
 * pipeline treats that the same as "no strip found".
 */
class StripDetector {
public:
    virtual ~StripDetector() = default;

    virtual RemoteDetection detect(const PixelBuffer& buffer,
                                   std::chrono::steady_clock::time_point deadline) = 0;

    // Short label for logs
    virtual std::string name() const = 0;
};

} // namespace StripSense

#endif // STRIPSENSE_STRIP_DETECTOR_HPP
