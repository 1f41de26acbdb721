/**
 * @file test_strip_detector.cpp
 * @brief Unit tests for the remote and on-device strip detectors
 */

#include "ai_inference.hpp"
#include "analysis_errors.hpp"
#include "remote_strip_detector.hpp"
#include "test_images.hpp"
#include "test_socket_server.hpp"

#include <gtest/gtest.h>

#include <chrono>

using namespace StripSense;

namespace {

using Clock = std::chrono::steady_clock;

Clock::time_point inMs(int ms) {
    return Clock::now() + std::chrono::milliseconds(ms);
}

} // namespace

// ============================================================================
// Remote detection service
// ============================================================================

class RemoteStripDetectorTest : public ::testing::Test {};

TEST_F(RemoteStripDetectorTest, ParsesContentLengthResponse) {
    const std::string raw =
        "HTTP/1.1 200 OK\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 2\r\n"
        "\r\n"
        "{}trailing";
    const HttpResponse response = RemoteStripDetector::parseHttpResponse(raw);
    EXPECT_EQ(response.status, 200);
    EXPECT_EQ(response.body, "{}");
}

TEST_F(RemoteStripDetectorTest, ParsesChunkedResponse) {
    const std::string raw =
        "HTTP/1.1 503 Service Unavailable\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "4\r\nbusy\r\n"
        "5\r\n, try\r\n"
        "0\r\n\r\n";
    const HttpResponse response = RemoteStripDetector::parseHttpResponse(raw);
    EXPECT_EQ(response.status, 503);
    EXPECT_EQ(response.body, "busy, try");
}

TEST_F(RemoteStripDetectorTest, RejectsMalformedResponse) {
    EXPECT_THROW(RemoteStripDetector::parseHttpResponse(""), RemoteDetectionUnavailable);
    EXPECT_THROW(RemoteStripDetector::parseHttpResponse("garbage\r\n\r\n"), RemoteDetectionUnavailable);
    EXPECT_THROW(RemoteStripDetector::parseHttpResponse("HTTP/1.1 200 OK\r\nNo-End: yes"),
                 RemoteDetectionUnavailable);
}

TEST_F(RemoteStripDetectorTest, ParsesDetectionDocument) {
    const RemoteDetection detection = RemoteStripDetector::parseDetection(
        R"({"stripDetected": true,
            "stripBounds": {"x": 120, "y": 40, "width": 60, "height": 300},
            "processingMethod": "ai",
            "confidence": 0.82})");

    EXPECT_TRUE(detection.stripDetected);
    ASSERT_TRUE(detection.stripBounds.has_value());
    EXPECT_EQ(*detection.stripBounds, cv::Rect(120, 40, 60, 300));
    EXPECT_EQ(detection.processingMethod, ProcessingMethod::AI);
    EXPECT_DOUBLE_EQ(detection.confidence, 0.82);
}

TEST_F(RemoteStripDetectorTest, DetectionWithoutBoundsIsNoDetection) {
    const RemoteDetection detection = RemoteStripDetector::parseDetection(
        R"({"stripDetected": true, "processingMethod": "fallback"})");
    EXPECT_FALSE(detection.stripDetected);
    EXPECT_EQ(detection.processingMethod, ProcessingMethod::FALLBACK);
    EXPECT_DOUBLE_EQ(detection.confidence, 1.0);

    const RemoteDetection empty = RemoteStripDetector::parseDetection(
        R"({"stripDetected": true, "stripBounds": {"x": 1, "y": 1, "width": 0, "height": 10}})");
    EXPECT_FALSE(empty.stripDetected);
}

TEST_F(RemoteStripDetectorTest, RejectsInvalidDetectionDocument) {
    EXPECT_THROW(RemoteStripDetector::parseDetection(std::string("not json")), RemoteDetectionUnavailable);
    EXPECT_THROW(RemoteStripDetector::parseDetection(std::string("[1, 2]")), RemoteDetectionUnavailable);
    EXPECT_THROW(RemoteStripDetector::parseDetection(std::string(R"({"processingMethod": "magic"})")),
                 RemoteDetectionUnavailable);
    EXPECT_THROW(RemoteStripDetector::parseDetection(std::string(R"({"stripDetected": "yes"})")),
                 RemoteDetectionUnavailable);
}

TEST_F(RemoteStripDetectorTest, ProcessingMethodNames) {
    EXPECT_EQ(toString(ProcessingMethod::AI), "ai");
    EXPECT_EQ(toString(ProcessingMethod::FALLBACK), "fallback");
    EXPECT_EQ(toString(ProcessingMethod::FAILED), "error");
    EXPECT_EQ(parseProcessingMethod("error"), ProcessingMethod::FAILED);
    EXPECT_THROW(parseProcessingMethod("unknown"), std::invalid_argument);
}

TEST_F(RemoteStripDetectorTest, UnreachableServiceIsUnavailable) {
    RemoteDetectorConfig config;
    config.enabled = true;
    config.host = "127.0.0.1";
    config.port = 1;
    config.timeout_ms = 200;
    RemoteStripDetector detector(config);

    EXPECT_THROW(detector.detect(TestImages::solid(64, 64, {200, 100, 50}), inMs(5000)), RemoteDetectionUnavailable);
    EXPECT_THROW(detector.detect(PixelBuffer(), inMs(5000)), RemoteDetectionUnavailable);
}

TEST_F(RemoteStripDetectorTest, TricklingServiceBoundedByOwnTimeout) {
    TestServer::LocalServer server(TestServer::LocalServer::Mode::TRICKLE);
    RemoteDetectorConfig config;
    config.enabled = true;
    config.host = "127.0.0.1";
    config.port = server.port();
    config.timeout_ms = 300;
    RemoteStripDetector detector(config);

    // Every single read succeeds, so only an overall limit ends the exchange
    const auto start = Clock::now();
    EXPECT_THROW(detector.detect(TestImages::solid(64, 64, {200, 100, 50}), inMs(60000)),
                 RemoteDetectionUnavailable);
    EXPECT_LT(Clock::now() - start, std::chrono::milliseconds(2000));
}

TEST_F(RemoteStripDetectorTest, SilentServiceBoundedByCallerDeadline) {
    TestServer::LocalServer server(TestServer::LocalServer::Mode::SILENT);
    RemoteDetectorConfig config;
    config.enabled = true;
    config.host = "127.0.0.1";
    config.port = server.port();
    config.timeout_ms = 60000;
    RemoteStripDetector detector(config);

    const auto start = Clock::now();
    EXPECT_THROW(detector.detect(TestImages::solid(64, 64, {200, 100, 50}), inMs(200)),
                 RemoteDetectionUnavailable);
    EXPECT_LT(Clock::now() - start, std::chrono::milliseconds(2000));

    // No time left at all
    EXPECT_THROW(detector.detect(TestImages::solid(64, 64, {200, 100, 50}), Clock::now()),
                 RemoteDetectionUnavailable);
}

// ============================================================================
// On-device model
// ============================================================================

class OnnxStripDetectorTest : public ::testing::Test {};

TEST_F(OnnxStripDetectorTest, UnloadedModelIsUnavailable) {
    AiModelConfig config;
    config.enabled = true;
    config.modelPath = "/nonexistent/strip_detector.onnx";
    OnnxStripDetector detector(config);

    EXPECT_FALSE(detector.loadModel());
    EXPECT_FALSE(detector.isModelLoaded());
    EXPECT_FALSE(detector.getLastError().empty());
    EXPECT_THROW(detector.detect(TestImages::solid(32, 32, {1, 2, 3}), inMs(5000)), RemoteDetectionUnavailable);
}

TEST_F(OnnxStripDetectorTest, SelectsHighestScoringNormalizedBox) {
    const std::vector<float> boxes = {
        0.10f, 0.10f, 0.20f, 0.20f,
        0.25f, 0.125f, 0.50f, 0.875f,
        0.00f, 0.00f, 1.00f, 1.00f,
    };
    const std::vector<float> scores = {0.40f, 0.90f, 0.20f};

    const auto best = OnnxStripDetector::selectBestBox(
        boxes, scores, 0.3, cv::Size(320, 320), cv::Size(400, 600), true);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->first, cv::Rect(100, 75, 100, 450));
    EXPECT_NEAR(best->second, 0.9, 1e-6);
}

TEST_F(OnnxStripDetectorTest, MapsPixelBoxesFromModelSize) {
    const std::vector<float> boxes = {80.0f, 40.0f, 160.0f, 280.0f};
    const std::vector<float> scores = {0.75f};

    const auto best = OnnxStripDetector::selectBestBox(
        boxes, scores, 0.3, cv::Size(320, 320), cv::Size(640, 320), false);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->first, cv::Rect(160, 40, 160, 240));
}

TEST_F(OnnxStripDetectorTest, NothingAboveThreshold) {
    const std::vector<float> boxes = {0.1f, 0.1f, 0.5f, 0.5f};
    EXPECT_FALSE(OnnxStripDetector::selectBestBox(
        boxes, {0.29f}, 0.3, cv::Size(320, 320), cv::Size(100, 100), true).has_value());
    EXPECT_FALSE(OnnxStripDetector::selectBestBox(
        {}, {}, 0.3, cv::Size(320, 320), cv::Size(100, 100), true).has_value());
}
