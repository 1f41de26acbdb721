#ifndef STRIPSENSE_REMOTE_STRIP_DETECTOR_HPP
#define STRIPSENSE_REMOTE_STRIP_DETECTOR_HPP

#include "strip_detector.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace StripSense {

struct RemoteDetectorConfig {
    bool enabled = false;
    std::string host = "localhost";
    int port = 8080;
    std::string path = "/api/analyze-strip";
    int timeout_ms = 2000;
    int jpeg_quality = 90;
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

/**
 * @brief Posts the image to a strip detection service over plain HTTP
 *
 * The image is JPEG encoded and sent as multipart field "image". The service
 * answers with {stripDetected, stripBounds{x,y,width,height}, processingMethod}.
 * Minimal HTTP/1.1 client on POSIX sockets, one connection per request.
 */
class RemoteStripDetector : public StripDetector {
public:
    explicit RemoteStripDetector(const RemoteDetectorConfig& config);

    // Waits at most min(timeout_ms, deadline) for the whole exchange
    RemoteDetection detect(const PixelBuffer& buffer,
                           std::chrono::steady_clock::time_point deadline) override;
    std::string name() const override { return "remote"; }

    // @throws RemoteDetectionUnavailable on a malformed status line
    static HttpResponse parseHttpResponse(const std::string& raw);

    // @throws RemoteDetectionUnavailable when the body is not a detection document
    static RemoteDetection parseDetection(const std::string& body);
    static RemoteDetection parseDetection(const nlohmann::json& document);

private:
    std::string buildRequest(const std::vector<uchar>& jpeg, const std::string& boundary) const;
    std::string exchange(const std::string& request, std::chrono::steady_clock::time_point deadline) const;

    RemoteDetectorConfig config_;
};

} // namespace StripSense

#endif // STRIPSENSE_REMOTE_STRIP_DETECTOR_HPP
