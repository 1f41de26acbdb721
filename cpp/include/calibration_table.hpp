#ifndef STRIPSENSE_CALIBRATION_TABLE_HPP
#define STRIPSENSE_CALIBRATION_TABLE_HPP

#include "color_space.hpp"
#include <nlohmann/json.hpp>
#include <map>
#include <string>
#include <vector>

namespace StripSense {

enum class ReadingStatus {
    LOW,
    OK,
    HIGH
};

std::string toString(ReadingStatus status);
ReadingStatus parseReadingStatus(const std::string& name);

enum class StripType {
    THREE_IN_ONE,
    SIX_IN_ONE
};

std::string toString(StripType type);
// Accepts "3-in-1" / "6-in-1" (also "3" / "6"); throws std::invalid_argument.
StripType parseStripType(const std::string& name);
int padCount(StripType type);

// Pad order on the physical strip, truncated for the 3-in-1 product.
std::vector<std::string> parameterKeys(StripType type);

struct CalibrationEntry {
    double rangeLow = 0.0;
    double rangeHigh = 0.0; // +inf for an open-ended top band
    RGBColor referenceColor;
    ReadingStatus status = ReadingStatus::OK;

    bool openEnded() const;
    bool contains(double value) const;
    // Midpoint of the range; lower bound for an open-ended range.
    double representativeValue() const;
};

struct ParameterCalibration {
    std::string key;
    std::string name;
    std::string unit;
    std::vector<CalibrationEntry> entries; // ascending by range
};

/**
 * @brief Frozen set of per-parameter calibration tables
 *
 * Built once (built-in defaults or a JSON file for another strip brand) and
 * shared read-only by every analysis. Reference colors are stored in RGB; the
 * matcher converts them when comparing in HSV.
 */
class CalibrationSet {
public:
    CalibrationSet() = default;
    explicit CalibrationSet(std::vector<ParameterCalibration> parameters);

    // Reference tables shipped with the application
    static CalibrationSet defaults();

    /**
     * @brief Parse and validate a calibration document
     * @throws CalibrationError on malformed JSON structure or failed validation
     */
    static CalibrationSet fromJson(const nlohmann::json& document);
    static CalibrationSet loadFromFile(const std::string& path);

    bool contains(const std::string& key) const;
    const ParameterCalibration* find(const std::string& key) const;
    // @throws InvalidParameterKey
    const ParameterCalibration& at(const std::string& key) const;

    // Status of the range holding value, clamped to the first/last entry.
    ReadingStatus statusForValue(const std::string& key, double value) const;

    std::vector<std::string> keys() const;
    size_t size() const { return parameters_.size(); }

    // Empty when every table is non-empty, ascending, contiguous and non-overlapping.
    std::vector<std::string> validationErrors() const;
    bool isValid() const { return validationErrors().empty(); }

private:
    std::vector<ParameterCalibration> parameters_;
    std::map<std::string, size_t> index_;
};

} // namespace StripSense

#endif // STRIPSENSE_CALIBRATION_TABLE_HPP
