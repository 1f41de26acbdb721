#ifndef STRIPSENSE_CONFIG_MANAGER_HPP
#define STRIPSENSE_CONFIG_MANAGER_HPP

#include "ai_inference.hpp"
#include "analysis_pipeline.hpp"
#include "calibration_table.hpp"
#include "remote_strip_detector.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <string>
#include <vector>

namespace StripSense {

/**
 * @brief JSON configuration for the analyzer
 *
 * Sections: analysis, sampler, locator, remote_detection, ai_model,
 * calibration, plus the top-level debug_mode, debug_output_path and
 * log_level keys. Every key is optional and falls back to its default.
 */
class ConfigManager {
private:
    nlohmann::json config_json;
    std::string config_file_path;

    // Cached configurations
    PipelineConfig pipeline_config;
    RemoteDetectorConfig remote_config;
    AiModelConfig ai_model_config;
    StripType default_strip_type;

    bool is_loaded;

public:
    ConfigManager();

    // Configuration loading and validation
    bool loadConfig(const std::string& config_path);
    bool loadFromJson(const nlohmann::json& document);
    bool reloadConfig();
    bool isLoaded() const { return is_loaded; }
    bool validateConfig() const;
    std::vector<std::string> getValidationErrors() const;

    // Configuration access
    const PipelineConfig& getPipelineConfig() const;
    const RemoteDetectorConfig& getRemoteDetectorConfig() const;
    const AiModelConfig& getAiModelConfig() const;
    StripType getDefaultStripType() const;

    /**
     * @brief Calibration tables from the "calibration" section
     *
     * Inline "parameters", a "file" (relative to the config file), or the
     * built-in defaults when the section is absent.
     * @throws CalibrationError
     */
    std::shared_ptr<const CalibrationSet> loadCalibration() const;

    // Runtime overrides (command line / environment)
    void setDefaultStripType(StripType type);
    void setColorSpace(ColorSpaceStrategy strategy);
    void setTimeoutMs(int timeout_ms);
    void setDebugMode(bool enabled);
    void setOverlayPath(const std::string& path);
    void setRemoteHost(const std::string& host);

    // Utility methods
    bool isDebugMode() const;
    std::string getLogLevel() const;
    std::string getDebugOutputPath() const;

private:
    void parseConfig();
    void parseAnalysisConfig();
    void parseSamplerConfig();
    void parseLocatorConfig();
    void parseRemoteDetectionConfig();
    void parseAiModelConfig();

    std::string resolvePath(const std::string& path) const;
};

} // namespace StripSense

#endif // STRIPSENSE_CONFIG_MANAGER_HPP
