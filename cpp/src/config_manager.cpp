#include "config_manager.hpp"
#include "analysis_errors.hpp"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace StripSense {

namespace {

const nlohmann::json& section(const nlohmann::json& root, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    if (root.is_object() && root.contains(name) && root[name].is_object()) {
        return root[name];
    }
    return empty;
}

} // namespace

ConfigManager::ConfigManager()
    : config_json(nlohmann::json::object()), default_strip_type(StripType::SIX_IN_ONE), is_loaded(false) {}

bool ConfigManager::loadConfig(const std::string& config_path) {
    config_file_path = config_path;

    try {
        std::ifstream config_file(config_path);
        if (!config_file.is_open()) {
            std::cerr << "Failed to open config file: " << config_path << std::endl;
            return false;
        }

        nlohmann::json document;
        config_file >> document;
        config_file.close();

        if (!loadFromJson(document)) {
            return false;
        }

        std::cout << "Configuration loaded successfully from: " << config_path << std::endl;
        return true;

    } catch (const std::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        return false;
    }
}

bool ConfigManager::loadFromJson(const nlohmann::json& document) {
    if (!document.is_object()) {
        std::cerr << "Error loading configuration: root must be a JSON object" << std::endl;
        return false;
    }

    try {
        config_json = document;
        parseConfig();
        is_loaded = true;
        return true;
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "Error loading configuration: " << e.what() << std::endl;
        is_loaded = false;
        return false;
    }
}

bool ConfigManager::reloadConfig() {
    if (config_file_path.empty()) {
        std::cerr << "No config file path set for reload" << std::endl;
        return false;
    }
    return loadConfig(config_file_path);
}

void ConfigManager::parseConfig() {
    pipeline_config = PipelineConfig();
    remote_config = RemoteDetectorConfig();
    ai_model_config = AiModelConfig();
    default_strip_type = StripType::SIX_IN_ONE;

    parseAnalysisConfig();
    parseSamplerConfig();
    parseLocatorConfig();
    parseRemoteDetectionConfig();
    parseAiModelConfig();

    pipeline_config.debug_mode = isDebugMode();
}

void ConfigManager::parseAnalysisConfig() {
    const auto& analysis = section(config_json, "analysis");

    // Unknown names are left at their default and reported by getValidationErrors()
    try {
        default_strip_type = parseStripType(analysis.value("strip_type", "6-in-1"));
    } catch (const std::invalid_argument&) {}
    try {
        pipeline_config.colorSpace = parseColorSpaceStrategy(analysis.value("color_space", "rgb"));
    } catch (const std::invalid_argument&) {}

    pipeline_config.timeout_ms = analysis.value("timeout_ms", 3000);
    pipeline_config.working_size = analysis.value("working_size", 800);
    pipeline_config.fallback_x_start = analysis.value("fallback_x_start", 0.3);
    pipeline_config.fallback_x_end = analysis.value("fallback_x_end", 0.7);
    pipeline_config.fallback_band_height = analysis.value("fallback_band_height", 0.02);
    pipeline_config.fallback_confidence_multiplier = analysis.value("fallback_confidence_multiplier", 0.7);
    pipeline_config.detector_budget_fraction = analysis.value("detector_budget_fraction", 0.5);
    pipeline_config.overlay_path = analysis.value("overlay_path", "");
}

void ConfigManager::parseSamplerConfig() {
    const auto& sampler = section(config_json, "sampler");
    SamplerConfig& cfg = pipeline_config.sampler;

    cfg.window_fraction = sampler.value("window_fraction", 0.5);
    cfg.stride = sampler.value("stride", 2);
    cfg.alpha_min = sampler.value("alpha_min", 200);
    cfg.white_threshold = sampler.value("white_threshold", 235);
    cfg.black_threshold = sampler.value("black_threshold", 25);
    cfg.gray_saturation_max = sampler.value("gray_saturation_max", 15.0);
    cfg.gray_value_min = sampler.value("gray_value_min", 80.0);
    cfg.hue_bucket = sampler.value("hue_bucket", 15.0);
    cfg.saturation_bucket = sampler.value("saturation_bucket", 20.0);
    cfg.value_bucket = sampler.value("value_bucket", 20.0);
}

void ConfigManager::parseLocatorConfig() {
    const auto& locator = section(config_json, "locator");
    LocatorConfig& cfg = pipeline_config.locator;

    cfg.window_step = locator.value("window_step", 10);
    cfg.min_short_fraction = locator.value("min_short_fraction", 0.10);
    cfg.max_short_fraction = locator.value("max_short_fraction", 0.40);
    cfg.min_long_fraction = locator.value("min_long_fraction", 0.30);
    cfg.min_aspect = locator.value("min_aspect", 2.0);
    cfg.max_aspect = locator.value("max_aspect", 8.0);
    cfg.ideal_aspect = locator.value("ideal_aspect", 4.0);
    cfg.min_edge_score = locator.value("min_edge_score", 0.2);
    cfg.top_candidates = locator.value("top_candidates", 5);
    cfg.confidence_threshold = locator.value("confidence_threshold", 0.3);
    cfg.max_evaluations = locator.value("max_evaluations", 4000000L);
}

void ConfigManager::parseRemoteDetectionConfig() {
    const auto& remote = section(config_json, "remote_detection");

    remote_config.enabled = remote.value("enabled", false);
    remote_config.host = remote.value("host", "localhost");
    remote_config.port = remote.value("port", 8080);
    remote_config.path = remote.value("path", "/api/analyze-strip");
    remote_config.timeout_ms = remote.value("timeout_ms", 2000);
    remote_config.jpeg_quality = remote.value("jpeg_quality", 90);
}

void ConfigManager::parseAiModelConfig() {
    const auto& model = section(config_json, "ai_model");

    ai_model_config.enabled = model.value("enabled", false);
    ai_model_config.modelPath = resolvePath(model.value("model_path", ""));
    ai_model_config.inputWidth = model.value("input_width", 320);
    ai_model_config.inputHeight = model.value("input_height", 320);
    ai_model_config.meanValue = model.value("mean", 0.0f);
    ai_model_config.scaleValue = model.value("scale", 1.0f / 255.0f);
    ai_model_config.normalizedBoxes = model.value("normalized_boxes", true);
    ai_model_config.scoreThreshold = model.value("score_threshold", 0.3);

    if (model.contains("input_names")) {
        ai_model_config.inputNames = model["input_names"].get<std::vector<std::string>>();
    }
    if (model.contains("output_names")) {
        ai_model_config.outputNames = model["output_names"].get<std::vector<std::string>>();
    }
}

std::string ConfigManager::resolvePath(const std::string& path) const {
    if (path.empty() || config_file_path.empty()) {
        return path;
    }
    std::filesystem::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    return (std::filesystem::path(config_file_path).parent_path() / p).string();
}

const PipelineConfig& ConfigManager::getPipelineConfig() const {
    return pipeline_config;
}

const RemoteDetectorConfig& ConfigManager::getRemoteDetectorConfig() const {
    return remote_config;
}

const AiModelConfig& ConfigManager::getAiModelConfig() const {
    return ai_model_config;
}

StripType ConfigManager::getDefaultStripType() const {
    return default_strip_type;
}

std::shared_ptr<const CalibrationSet> ConfigManager::loadCalibration() const {
    const auto& calibration = section(config_json, "calibration");

    if (calibration.contains("parameters")) {
        return std::make_shared<const CalibrationSet>(CalibrationSet::fromJson(calibration));
    }

    const std::string file = calibration.value("file", "");
    if (!file.empty()) {
        return std::make_shared<const CalibrationSet>(CalibrationSet::loadFromFile(resolvePath(file)));
    }

    return std::make_shared<const CalibrationSet>(CalibrationSet::defaults());
}

void ConfigManager::setDefaultStripType(StripType type) {
    default_strip_type = type;
}

void ConfigManager::setColorSpace(ColorSpaceStrategy strategy) {
    pipeline_config.colorSpace = strategy;
}

void ConfigManager::setTimeoutMs(int timeout_ms) {
    pipeline_config.timeout_ms = timeout_ms;
}

void ConfigManager::setDebugMode(bool enabled) {
    config_json["debug_mode"] = enabled;
    pipeline_config.debug_mode = enabled;
}

void ConfigManager::setOverlayPath(const std::string& path) {
    pipeline_config.overlay_path = path;
}

void ConfigManager::setRemoteHost(const std::string& host) {
    remote_config.host = host;
    remote_config.enabled = !host.empty();
}

bool ConfigManager::isDebugMode() const {
    return config_json.value("debug_mode", false);
}

std::string ConfigManager::getLogLevel() const {
    return config_json.value("log_level", "INFO");
}

std::string ConfigManager::getDebugOutputPath() const {
    return config_json.value("debug_output_path", "");
}

bool ConfigManager::validateConfig() const {
    return getValidationErrors().empty();
}

std::vector<std::string> ConfigManager::getValidationErrors() const {
    std::vector<std::string> errors;

    const auto& analysis = section(config_json, "analysis");
    if (analysis.contains("strip_type")) {
        try {
            parseStripType(analysis["strip_type"].get<std::string>());
        } catch (const std::exception&) {
            errors.push_back("analysis.strip_type must be '3-in-1' or '6-in-1'");
        }
    }
    if (analysis.contains("color_space")) {
        try {
            parseColorSpaceStrategy(analysis["color_space"].get<std::string>());
        } catch (const std::exception&) {
            errors.push_back("analysis.color_space must be 'rgb' or 'hsv'");
        }
    }

    const PipelineConfig& p = pipeline_config;
    if (p.timeout_ms <= 0) {
        errors.push_back("analysis.timeout_ms must be positive");
    }
    if (p.working_size < 64) {
        errors.push_back("analysis.working_size must be at least 64");
    }
    if (p.fallback_x_start < 0.0 || p.fallback_x_end > 1.0 || p.fallback_x_start >= p.fallback_x_end) {
        errors.push_back("analysis.fallback_x_start/fallback_x_end must satisfy 0 <= start < end <= 1");
    }
    if (p.fallback_band_height <= 0.0 || p.fallback_band_height > 0.2) {
        errors.push_back("analysis.fallback_band_height must be in (0, 0.2]");
    }
    if (p.fallback_confidence_multiplier < 0.0 || p.fallback_confidence_multiplier > 1.0) {
        errors.push_back("analysis.fallback_confidence_multiplier must be in [0, 1]");
    }

    if (p.detector_budget_fraction <= 0.0 || p.detector_budget_fraction >= 1.0) {
        errors.push_back("analysis.detector_budget_fraction must be in (0, 1)");
    }

    if (p.sampler.window_fraction < 0.4 || p.sampler.window_fraction > 0.5) {
        errors.push_back("sampler.window_fraction must be between 0.4 and 0.5");
    }
    if (p.sampler.stride < 1) {
        errors.push_back("sampler.stride must be at least 1");
    }
    if (p.sampler.hue_bucket <= 0.0 || p.sampler.saturation_bucket <= 0.0 || p.sampler.value_bucket <= 0.0) {
        errors.push_back("sampler bucket widths must be positive");
    }

    if (p.locator.window_step < 1) {
        errors.push_back("locator.window_step must be at least 1");
    }
    if (p.locator.min_short_fraction <= 0.0 || p.locator.min_short_fraction > p.locator.max_short_fraction) {
        errors.push_back("locator short side fractions must satisfy 0 < min <= max");
    }
    if (p.locator.min_aspect <= 0.0 || p.locator.min_aspect > p.locator.max_aspect) {
        errors.push_back("locator aspect bounds must satisfy 0 < min <= max");
    }
    if (p.locator.top_candidates < 1) {
        errors.push_back("locator.top_candidates must be at least 1");
    }
    if (p.locator.max_evaluations < 1) {
        errors.push_back("locator.max_evaluations must be at least 1");
    }

    if (remote_config.enabled) {
        if (remote_config.host.empty()) {
            errors.push_back("remote_detection enabled but no host specified");
        }
        if (remote_config.port <= 0 || remote_config.port > 65535) {
            errors.push_back("remote_detection.port out of range");
        }
    }

    if (ai_model_config.enabled && ai_model_config.modelPath.empty()) {
        errors.push_back("ai_model enabled but no model_path specified");
    }

    const auto& calibration = section(config_json, "calibration");
    const std::string file = calibration.value("file", "");
    if (!file.empty() && !std::filesystem::exists(resolvePath(file))) {
        errors.push_back("calibration file not found: " + resolvePath(file));
    }

    return errors;
}

} // namespace StripSense
