#include <opencv2/core.hpp>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>

#include "ai_inference.hpp"
#include "analysis_errors.hpp"
#include "analysis_pipeline.hpp"
#include "config_manager.hpp"
#include "remote_strip_detector.hpp"

using json = nlohmann::json;
using namespace StripSense;

namespace {

enum ExitCode {
    EXIT_OK = 0,
    EXIT_CONFIG_ERROR = 1,
    EXIT_IMAGE_ERROR = 2,
    EXIT_TIMEOUT = 3,
    EXIT_PROCESSING_ERROR = 4
};

struct CliOptions {
    std::string imagePath;
    std::string configPath;
    std::string stripType;
    std::string colorSpace;
    std::string overlayPath;
    std::string outputPath;
    bool debug = false;
};

int getenv_int(const char* key, int def) {
    const char* v = std::getenv(key);
    return v ? std::atoi(v) : def;
}

std::string getenv_str(const char* key, const char* def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : std::string(def);
}

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <image> [options]\n"
              << "  --strip-type 3-in-1|6-in-1   pads on the strip (default from config)\n"
              << "  --config FILE                JSON configuration\n"
              << "  --color-space rgb|hsv        matching color space\n"
              << "  --overlay FILE               write a debug overlay image\n"
              << "  --output FILE                write the JSON result to FILE instead of stdout\n"
              << "  --debug                      verbose stage logging\n"
              << "Environment: STRIPSENSE_CONFIG, STRIPSENSE_STRIP_TYPE, STRIPSENSE_TIMEOUT_MS,\n"
              << "             STRIPSENSE_DETECTOR_HOST" << std::endl;
}

bool parseArgs(int argc, char** argv, CliOptions& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        auto next = [&](std::string& target) {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << arg << std::endl;
                return false;
            }
            target = argv[++i];
            return true;
        };

        if (arg == "--strip-type") {
            if (!next(options.stripType)) return false;
        } else if (arg == "--config") {
            if (!next(options.configPath)) return false;
        } else if (arg == "--color-space") {
            if (!next(options.colorSpace)) return false;
        } else if (arg == "--overlay") {
            if (!next(options.overlayPath)) return false;
        } else if (arg == "--output") {
            if (!next(options.outputPath)) return false;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "-h" || arg == "--help") {
            return false;
        } else if (!arg.empty() && arg[0] == '-') {
            std::cerr << "Unknown option: " << arg << std::endl;
            return false;
        } else if (options.imagePath.empty()) {
            options.imagePath = arg;
        } else {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return false;
        }
    }
    return !options.imagePath.empty();
}

// Remote service first, then the on-device model; nullptr when neither is configured
std::shared_ptr<StripDetector> makeDetector(const ConfigManager& config) {
    const auto& remote = config.getRemoteDetectorConfig();
    if (remote.enabled) {
        std::cout << "Using remote strip detection at " << remote.host << ":" << remote.port << remote.path << std::endl;
        return std::make_shared<RemoteStripDetector>(remote);
    }

    const auto& model = config.getAiModelConfig();
    if (model.enabled) {
        auto detector = std::make_shared<OnnxStripDetector>(model);
        if (!detector->loadModel()) {
            std::cerr << "AI strip detection disabled: " << detector->getLastError() << std::endl;
            return nullptr;
        }
        return detector;
    }
    return nullptr;
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    if (!parseArgs(argc, argv, options)) {
        printUsage(argv[0]);
        return EXIT_CONFIG_ERROR;
    }

    ConfigManager config;
    const std::string configPath = options.configPath.empty()
        ? getenv_str("STRIPSENSE_CONFIG", "")
        : options.configPath;

    if (!configPath.empty() && !config.loadConfig(configPath)) {
        return EXIT_CONFIG_ERROR;
    }

    // Environment overrides, then command line
    try {
        const std::string envStripType = getenv_str("STRIPSENSE_STRIP_TYPE", "");
        if (!envStripType.empty()) config.setDefaultStripType(parseStripType(envStripType));
        if (!options.stripType.empty()) config.setDefaultStripType(parseStripType(options.stripType));
        if (!options.colorSpace.empty()) config.setColorSpace(parseColorSpaceStrategy(options.colorSpace));
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    config.setTimeoutMs(getenv_int("STRIPSENSE_TIMEOUT_MS", config.getPipelineConfig().timeout_ms));
    const std::string detectorHost = getenv_str("STRIPSENSE_DETECTOR_HOST", "");
    if (!detectorHost.empty()) config.setRemoteHost(detectorHost);
    if (options.debug) config.setDebugMode(true);
    if (!options.overlayPath.empty()) {
        config.setOverlayPath(options.overlayPath);
    } else if (config.isDebugMode() && !config.getDebugOutputPath().empty()) {
        config.setOverlayPath(config.getDebugOutputPath() + "/overlay.jpg");
    }

    if (!config.validateConfig()) {
        std::cerr << "Configuration validation failed:" << std::endl;
        for (const auto& error : config.getValidationErrors()) {
            std::cerr << "  - " << error << std::endl;
        }
        return EXIT_CONFIG_ERROR;
    }

    if (config.isDebugMode()) {
        std::cout << "Debug mode enabled (log level " << config.getLogLevel() << ")" << std::endl;
    }

    std::shared_ptr<const CalibrationSet> calibration;
    try {
        calibration = config.loadCalibration();
    } catch (const CalibrationError& e) {
        std::cerr << "Calibration error: " << e.what() << std::endl;
        return EXIT_CONFIG_ERROR;
    }

    try {
        AnalysisPipeline pipeline(calibration, config.getPipelineConfig(), makeDetector(config));
        const AnalysisResult result = pipeline.analyzeFile(options.imagePath, config.getDefaultStripType());

        json payload = result.toJson();
        payload["image"] = options.imagePath;

        if (options.outputPath.empty()) {
            std::cout << payload.dump(2) << std::endl;
        } else {
            std::ofstream out(options.outputPath);
            if (!out) {
                std::cerr << "Failed to open output file: " << options.outputPath << std::endl;
                return EXIT_PROCESSING_ERROR;
            }
            out << payload.dump(2) << std::endl;
        }
        return EXIT_OK;

    } catch (const ImageLoadError& e) {
        std::cerr << "Image error: " << e.what() << std::endl;
        return EXIT_IMAGE_ERROR;
    } catch (const AnalysisTimeout& e) {
        std::cerr << e.what() << std::endl;
        return EXIT_TIMEOUT;
    } catch (const cv::Exception& e) {
        std::cerr << "OpenCV error: " << e.what() << std::endl;
        return EXIT_PROCESSING_ERROR;
    } catch (const std::exception& e) {
        std::cerr << "Processing error: " << e.what() << std::endl;
        return EXIT_PROCESSING_ERROR;
    }
}
