#include "remote_strip_detector.hpp"
#include "analysis_errors.hpp"

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <opencv2/imgcodecs.hpp>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace StripSense {

namespace {

using Clock = std::chrono::steady_clock;

// Re-arms a socket timeout with the time left before deadline
void arm_timeout(int fd, int option, Clock::time_point deadline) {
    const auto left = std::chrono::duration_cast<std::chrono::microseconds>(deadline - Clock::now());
    if (left.count() <= 0) {
        throw RemoteDetectionUnavailable("Detection service did not answer in time");
    }
    struct timeval tv{};
    tv.tv_sec = static_cast<time_t>(left.count() / 1000000);
    tv.tv_usec = static_cast<suseconds_t>(left.count() % 1000000);
    ::setsockopt(fd, SOL_SOCKET, option, &tv, sizeof(tv));
}

bool write_all(int fd, const void* data, size_t len, Clock::time_point deadline) {
    const uint8_t* ptr = static_cast<const uint8_t*>(data);
    size_t total = 0;
    while (total < len) {
        arm_timeout(fd, SO_SNDTIMEO, deadline);
        ssize_t n = ::send(fd, ptr + total, len - total, MSG_NOSIGNAL);
        if (n <= 0) return false;
        total += static_cast<size_t>(n);
    }
    return true;
}

// Closes the descriptor when the request scope ends
class SocketGuard {
public:
    explicit SocketGuard(int fd) : fd_(fd) {}
    ~SocketGuard() {
        if (fd_ != -1) ::close(fd_);
    }
    SocketGuard(const SocketGuard&) = delete;
    SocketGuard& operator=(const SocketGuard&) = delete;

    int fd() const { return fd_; }

private:
    int fd_;
};

// Name resolution itself is not bounded by the deadline; connect is, through SO_SNDTIMEO.
int connect_to(const std::string& host, int port, Clock::time_point deadline) {
    struct addrinfo hints{}; hints.ai_family = AF_UNSPEC; hints.ai_socktype = SOCK_STREAM; hints.ai_protocol = IPPROTO_TCP;
    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    if (::getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res) != 0) {
        throw RemoteDetectionUnavailable("Cannot resolve detection host " + host);
    }

    int fd = -1;
    try {
        for (auto p = res; p != nullptr; p = p->ai_next) {
            fd = ::socket(p->ai_family, p->ai_socktype, p->ai_protocol);
            if (fd == -1) continue;
            arm_timeout(fd, SO_SNDTIMEO, deadline);
            if (::connect(fd, p->ai_addr, p->ai_addrlen) == 0) break;
            ::close(fd);
            fd = -1;
        }
    } catch (const RemoteDetectionUnavailable&) {
        if (fd != -1) ::close(fd);
        ::freeaddrinfo(res);
        throw;
    }
    ::freeaddrinfo(res);

    if (fd == -1) {
        throw RemoteDetectionUnavailable("Cannot connect to detection service at " + host + ":" + port_str);
    }
    return fd;
}

std::string decode_chunked(const std::string& body) {
    std::string out;
    size_t pos = 0;
    while (pos < body.size()) {
        size_t line_end = body.find("\r\n", pos);
        if (line_end == std::string::npos) break;
        size_t chunk_size = 0;
        try {
            chunk_size = std::stoul(body.substr(pos, line_end - pos), nullptr, 16);
        } catch (const std::exception&) {
            throw RemoteDetectionUnavailable("Malformed chunked response");
        }
        if (chunk_size == 0) break;
        pos = line_end + 2;
        if (pos + chunk_size > body.size()) {
            throw RemoteDetectionUnavailable("Truncated chunked response");
        }
        out.append(body, pos, chunk_size);
        pos += chunk_size + 2;
    }
    return out;
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

RemoteStripDetector::RemoteStripDetector(const RemoteDetectorConfig& config) : config_(config) {}

RemoteDetection RemoteStripDetector::detect(const PixelBuffer& buffer, Clock::time_point deadline) {
    const Clock::time_point limit = std::min(deadline, Clock::now() + std::chrono::milliseconds(config_.timeout_ms));
    if (buffer.empty()) {
        throw RemoteDetectionUnavailable("No image to submit");
    }

    std::vector<uchar> jpeg;
    try {
        const std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, config_.jpeg_quality};
        if (!cv::imencode(".jpg", buffer.toBgr(), jpeg, params)) {
            throw RemoteDetectionUnavailable("JPEG encoding failed");
        }
    } catch (const cv::Exception& e) {
        throw RemoteDetectionUnavailable(std::string("JPEG encoding failed: ") + e.what());
    }

    const std::string request = buildRequest(jpeg, "----stripsense-boundary");
    const HttpResponse response = parseHttpResponse(exchange(request, limit));

    if (response.status != 200) {
        throw RemoteDetectionUnavailable("Detection service returned HTTP " + std::to_string(response.status));
    }
    return parseDetection(response.body);
}

std::string RemoteStripDetector::buildRequest(const std::vector<uchar>& jpeg, const std::string& boundary) const {
    std::string body;
    body += "--" + boundary + "\r\n";
    body += "Content-Disposition: form-data; name=\"image\"; filename=\"strip.jpg\"\r\n";
    body += "Content-Type: image/jpeg\r\n\r\n";
    body.append(reinterpret_cast<const char*>(jpeg.data()), jpeg.size());
    body += "\r\n--" + boundary + "--\r\n";

    std::ostringstream req;
    req << "POST " << config_.path << " HTTP/1.1\r\n"
        << "Host: " << config_.host << ":" << config_.port << "\r\n"
        << "User-Agent: stripsense\r\n"
        << "Accept: application/json\r\n"
        << "Content-Type: multipart/form-data; boundary=" << boundary << "\r\n"
        << "Content-Length: " << body.size() << "\r\n"
        << "Connection: close\r\n\r\n";
    return req.str() + body;
}

std::string RemoteStripDetector::exchange(const std::string& request, Clock::time_point deadline) const {
    SocketGuard sock(connect_to(config_.host, config_.port, deadline));

    if (!write_all(sock.fd(), request.data(), request.size(), deadline)) {
        throw RemoteDetectionUnavailable("Failed to send request to detection service");
    }

    // One deadline for the whole response, however slowly it trickles in
    std::string raw;
    char chunk[4096];
    while (true) {
        arm_timeout(sock.fd(), SO_RCVTIMEO, deadline);
        ssize_t n = ::recv(sock.fd(), chunk, sizeof(chunk), 0);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw RemoteDetectionUnavailable("Detection service did not answer in time");
            }
            throw RemoteDetectionUnavailable(std::string("Detection service read failed: ") + std::strerror(errno));
        }
        raw.append(chunk, static_cast<size_t>(n));
    }
    return raw;
}

HttpResponse RemoteStripDetector::parseHttpResponse(const std::string& raw) {
    const size_t header_end = raw.find("\r\n\r\n");
    if (raw.compare(0, 5, "HTTP/") != 0 || header_end == std::string::npos) {
        throw RemoteDetectionUnavailable("Malformed HTTP response");
    }

    HttpResponse response;
    std::istringstream status_line(raw.substr(0, raw.find("\r\n")));
    std::string version;
    if (!(status_line >> version >> response.status)) {
        throw RemoteDetectionUnavailable("Malformed HTTP status line");
    }

    const std::string headers = lower(raw.substr(0, header_end));
    std::string body = raw.substr(header_end + 4);

    if (headers.find("transfer-encoding: chunked") != std::string::npos) {
        body = decode_chunked(body);
    } else {
        const size_t cl = headers.find("content-length:");
        if (cl != std::string::npos) {
            const size_t length = std::strtoul(headers.c_str() + cl + 15, nullptr, 10);
            if (length < body.size()) body.resize(length);
        }
    }

    response.body = std::move(body);
    return response;
}

RemoteDetection RemoteStripDetector::parseDetection(const std::string& body) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(body);
    } catch (const nlohmann::json::exception& e) {
        throw RemoteDetectionUnavailable(std::string("Invalid detection response: ") + e.what());
    }
    return parseDetection(document);
}

RemoteDetection RemoteStripDetector::parseDetection(const nlohmann::json& document) {
    if (!document.is_object()) {
        throw RemoteDetectionUnavailable("Detection response is not a JSON object");
    }

    RemoteDetection detection;
    try {
        detection.stripDetected = document.value("stripDetected", false);
        detection.processingMethod = parseProcessingMethod(document.value("processingMethod", "fallback"));
        detection.confidence = document.value("confidence", 1.0);

        if (document.contains("stripBounds") && document["stripBounds"].is_object()) {
            const auto& b = document["stripBounds"];
            detection.stripBounds = cv::Rect(
                static_cast<int>(b.value("x", 0.0)),
                static_cast<int>(b.value("y", 0.0)),
                static_cast<int>(b.value("width", 0.0)),
                static_cast<int>(b.value("height", 0.0)));
        }
    } catch (const nlohmann::json::exception& e) {
        throw RemoteDetectionUnavailable(std::string("Invalid detection response: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw RemoteDetectionUnavailable(std::string("Invalid detection response: ") + e.what());
    }

    // A detection without usable bounds is no detection
    if (detection.stripDetected &&
        (!detection.stripBounds || detection.stripBounds->width <= 0 || detection.stripBounds->height <= 0)) {
        std::cerr << "RemoteStripDetector: stripDetected without valid bounds, ignoring" << std::endl;
        detection.stripDetected = false;
    }
    return detection;
}

} // namespace StripSense
