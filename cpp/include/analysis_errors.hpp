#ifndef STRIPSENSE_ANALYSIS_ERRORS_HPP
#define STRIPSENSE_ANALYSIS_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace StripSense {

// Base for every failure kind the analysis core reports.
class AnalysisError : public std::runtime_error {
public:
    explicit AnalysisError(const std::string& message) : std::runtime_error(message) {}
};

// Source image could not be fetched or decoded. Fatal to the call.
class ImageLoadError : public AnalysisError {
public:
    explicit ImageLoadError(const std::string& message) : AnalysisError(message) {}
};

// Wall-clock budget exceeded. Fatal to the call.
class AnalysisTimeout : public AnalysisError {
public:
    AnalysisTimeout(const std::string& stage, long long budget_ms)
        : AnalysisError("Analysis timeout during " + stage + " (budget " +
                        std::to_string(budget_ms) + " ms) - please try with a smaller or clearer image"),
          stage_(stage) {}

    const std::string& stage() const { return stage_; }

private:
    std::string stage_;
};

// Optional strip detector missing or failing. Absorbed by the pipeline.
class RemoteDetectionUnavailable : public AnalysisError {
public:
    explicit RemoteDetectionUnavailable(const std::string& message) : AnalysisError(message) {}
};

// Calibration lookup for a key outside the configured set.
class InvalidParameterKey : public AnalysisError {
public:
    explicit InvalidParameterKey(const std::string& key)
        : AnalysisError("Unknown parameter key: " + key), key_(key) {}

    const std::string& key() const { return key_; }

private:
    std::string key_;
};

// Malformed or inconsistent calibration data.
class CalibrationError : public AnalysisError {
public:
    explicit CalibrationError(const std::string& message) : AnalysisError(message) {}
};

} // namespace StripSense

#endif // STRIPSENSE_ANALYSIS_ERRORS_HPP
