#include "calibration_table.hpp"
#include "analysis_errors.hpp"
#include <cmath>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace StripSense {

namespace {

constexpr double INF = std::numeric_limits<double>::infinity();

CalibrationEntry entry(double low, double high, int r, int g, int b, ReadingStatus status) {
    return CalibrationEntry{low, high, RGBColor{r, g, b}, status};
}

std::string formatBound(double value) {
    if (std::isinf(value)) return "inf";
    std::ostringstream out;
    out << value;
    return out.str();
}

double parseUpperBound(const nlohmann::json& bound) {
    if (bound.is_null()) return INF;
    if (bound.is_string()) {
        const std::string text = bound.get<std::string>();
        if (text == "inf" || text == "+inf" || text == "infinity") return INF;
        throw CalibrationError("Invalid range bound: " + text);
    }
    return bound.get<double>();
}

RGBColor parseReference(const nlohmann::json& item, const std::string& where) {
    if (item.contains("rgb")) {
        const auto& rgb = item["rgb"];
        if (!rgb.is_array() || rgb.size() != 3) {
            throw CalibrationError(where + ": 'rgb' must be [r, g, b]");
        }
        return ColorSpace::clampRgb(rgb[0].get<double>(), rgb[1].get<double>(), rgb[2].get<double>());
    }
    if (item.contains("hsv")) {
        const auto& hsv = item["hsv"];
        if (!hsv.is_array() || hsv.size() != 3) {
            throw CalibrationError(where + ": 'hsv' must be [h, s, v]");
        }
        return ColorSpace::hsvToRgb(HSVColor{hsv[0].get<double>(), hsv[1].get<double>(), hsv[2].get<double>()});
    }
    throw CalibrationError(where + ": entry needs an 'rgb' or 'hsv' reference color");
}

} // namespace

std::string toString(ReadingStatus status) {
    switch (status) {
        case ReadingStatus::LOW: return "low";
        case ReadingStatus::HIGH: return "high";
        default: return "ok";
    }
}

ReadingStatus parseReadingStatus(const std::string& name) {
    if (name == "low") return ReadingStatus::LOW;
    if (name == "ok") return ReadingStatus::OK;
    if (name == "high") return ReadingStatus::HIGH;
    throw std::invalid_argument("Unknown reading status: " + name);
}

std::string toString(StripType type) {
    return type == StripType::THREE_IN_ONE ? "3-in-1" : "6-in-1";
}

StripType parseStripType(const std::string& name) {
    if (name == "3-in-1" || name == "3") return StripType::THREE_IN_ONE;
    if (name == "6-in-1" || name == "6") return StripType::SIX_IN_ONE;
    throw std::invalid_argument("Unknown strip type: " + name);
}

int padCount(StripType type) {
    return type == StripType::THREE_IN_ONE ? 3 : 6;
}

std::vector<std::string> parameterKeys(StripType type) {
    std::vector<std::string> keys = {
        "freeChlorine", "ph", "totalAlkalinity", "totalChlorine", "totalHardness", "cyanuricAcid"
    };
    keys.resize(static_cast<size_t>(padCount(type)));
    return keys;
}

bool CalibrationEntry::openEnded() const {
    return std::isinf(rangeHigh);
}

bool CalibrationEntry::contains(double value) const {
    return value >= rangeLow && (value < rangeHigh || openEnded());
}

double CalibrationEntry::representativeValue() const {
    if (openEnded()) {
        return rangeLow;
    }
    return rangeLow + (rangeHigh - rangeLow) * 0.5;
}

CalibrationSet::CalibrationSet(std::vector<ParameterCalibration> parameters)
    : parameters_(std::move(parameters)) {
    for (size_t i = 0; i < parameters_.size(); ++i) {
        index_[parameters_[i].key] = i;
    }
}

CalibrationSet CalibrationSet::defaults() {
    using S = ReadingStatus;
    std::vector<ParameterCalibration> tables;

    tables.push_back({"freeChlorine", "Free Chlorine", "ppm", {
        entry(0.0, 0.5, 255, 255, 240, S::LOW),
        entry(0.5, 1.0, 255, 220, 200, S::LOW),
        entry(1.0, 3.0, 255, 240, 150, S::OK),
        entry(3.0, 5.0, 255, 220, 100, S::HIGH),
        entry(5.0, 10.0, 240, 180, 80, S::HIGH),
        entry(10.0, INF, 200, 140, 60, S::HIGH),
    }});

    tables.push_back({"ph", "pH", "", {
        entry(6.2, 6.8, 255, 255, 0, S::LOW),
        entry(6.8, 7.2, 255, 220, 50, S::OK),
        entry(7.2, 7.6, 255, 200, 100, S::OK),
        entry(7.6, 8.0, 255, 150, 120, S::HIGH),
        entry(8.0, 8.4, 240, 80, 160, S::HIGH),
        entry(8.4, 9.0, 200, 50, 150, S::HIGH),
    }});

    tables.push_back({"totalAlkalinity", "Total Alkalinity", "ppm", {
        entry(0, 60, 255, 255, 100, S::LOW),
        entry(60, 80, 220, 220, 80, S::LOW),
        entry(80, 120, 200, 200, 100, S::OK),
        entry(120, 150, 150, 180, 120, S::OK),
        entry(150, 180, 120, 160, 140, S::HIGH),
        entry(180, 240, 100, 140, 160, S::HIGH),
    }});

    tables.push_back({"totalChlorine", "Total Chlorine", "ppm", {
        entry(0.0, 1.0, 240, 200, 160, S::LOW),
        entry(1.0, 3.0, 255, 220, 200, S::OK),
        entry(3.0, 5.0, 255, 180, 180, S::HIGH),
        entry(5.0, 10.0, 255, 140, 160, S::HIGH),
        entry(10.0, INF, 220, 120, 150, S::HIGH),
    }});

    tables.push_back({"totalHardness", "Total Hardness", "ppm", {
        entry(0, 100, 150, 200, 255, S::LOW),
        entry(100, 200, 180, 180, 240, S::LOW),
        entry(200, 400, 200, 160, 220, S::OK),
        entry(400, 500, 180, 140, 200, S::HIGH),
        entry(500, 1000, 160, 120, 180, S::HIGH),
    }});

    tables.push_back({"cyanuricAcid", "Cyanuric Acid", "ppm", {
        entry(0, 20, 255, 255, 150, S::LOW),
        entry(20, 30, 255, 240, 120, S::LOW),
        entry(30, 50, 255, 200, 140, S::OK),
        entry(50, 80, 255, 160, 160, S::OK),
        entry(80, 100, 240, 140, 180, S::HIGH),
        entry(100, 240, 220, 120, 160, S::HIGH),
    }});

    return CalibrationSet(std::move(tables));
}

CalibrationSet CalibrationSet::fromJson(const nlohmann::json& document) {
    if (!document.is_object() || !document.contains("parameters") || !document["parameters"].is_array()) {
        throw CalibrationError("Calibration document needs a 'parameters' array");
    }

    std::vector<ParameterCalibration> tables;
    try {
        for (const auto& param : document["parameters"]) {
            ParameterCalibration table;
            table.key = param.value("key", "");
            table.name = param.value("name", table.key);
            table.unit = param.value("unit", "ppm");

            if (table.key.empty()) {
                throw CalibrationError("Calibration parameter without 'key'");
            }
            if (!param.contains("entries") || !param["entries"].is_array()) {
                throw CalibrationError(table.key + ": missing 'entries' array");
            }

            for (const auto& item : param["entries"]) {
                const std::string where = table.key + " entry " + std::to_string(table.entries.size());
                if (!item.contains("range") || !item["range"].is_array() || item["range"].size() != 2) {
                    throw CalibrationError(where + ": 'range' must be [low, high]");
                }

                CalibrationEntry e;
                e.rangeLow = item["range"][0].get<double>();
                e.rangeHigh = parseUpperBound(item["range"][1]);
                e.referenceColor = parseReference(item, where);
                e.status = parseReadingStatus(item.value("status", "ok"));
                table.entries.push_back(e);
            }

            tables.push_back(std::move(table));
        }
    } catch (const nlohmann::json::exception& e) {
        throw CalibrationError(std::string("Malformed calibration document: ") + e.what());
    } catch (const std::invalid_argument& e) {
        throw CalibrationError(e.what());
    }

    CalibrationSet set(std::move(tables));
    const auto errors = set.validationErrors();
    if (!errors.empty()) {
        std::string message = "Calibration validation failed:";
        for (const auto& error : errors) {
            message += "\n  - " + error;
        }
        throw CalibrationError(message);
    }
    return set;
}

CalibrationSet CalibrationSet::loadFromFile(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw CalibrationError("Failed to open calibration file: " + path);
    }

    nlohmann::json document;
    try {
        file >> document;
    } catch (const nlohmann::json::exception& e) {
        throw CalibrationError("Failed to parse calibration file " + path + ": " + e.what());
    }

    CalibrationSet set = fromJson(document);
    std::cout << "CalibrationSet: loaded " << set.size() << " parameter tables from " << path << std::endl;
    return set;
}

bool CalibrationSet::contains(const std::string& key) const {
    return index_.count(key) > 0;
}

const ParameterCalibration* CalibrationSet::find(const std::string& key) const {
    auto it = index_.find(key);
    return (it != index_.end()) ? &parameters_[it->second] : nullptr;
}

const ParameterCalibration& CalibrationSet::at(const std::string& key) const {
    const ParameterCalibration* table = find(key);
    if (!table) {
        throw InvalidParameterKey(key);
    }
    return *table;
}

ReadingStatus CalibrationSet::statusForValue(const std::string& key, double value) const {
    const auto& entries = at(key).entries;
    if (entries.empty()) {
        return ReadingStatus::OK;
    }

    for (const auto& e : entries) {
        if (e.contains(value)) {
            return e.status;
        }
    }

    // Below all ranges -> first status, above all ranges -> last status
    if (value < entries.front().rangeLow) {
        return entries.front().status;
    }
    return entries.back().status;
}

std::vector<std::string> CalibrationSet::keys() const {
    std::vector<std::string> result;
    result.reserve(parameters_.size());
    for (const auto& table : parameters_) {
        result.push_back(table.key);
    }
    return result;
}

std::vector<std::string> CalibrationSet::validationErrors() const {
    std::vector<std::string> errors;

    if (parameters_.empty()) {
        errors.push_back("No calibration parameters configured");
    }
    if (index_.size() != parameters_.size()) {
        errors.push_back("Duplicate calibration parameter keys");
    }

    for (const auto& table : parameters_) {
        if (table.entries.empty()) {
            errors.push_back(table.key + ": no calibration entries");
            continue;
        }

        for (size_t i = 0; i < table.entries.size(); ++i) {
            const auto& e = table.entries[i];
            const std::string label = table.key + " [" + formatBound(e.rangeLow) + ", " +
                                      formatBound(e.rangeHigh) + "]";

            if (!std::isfinite(e.rangeLow) || !(e.rangeLow < e.rangeHigh)) {
                errors.push_back(label + ": range must satisfy low < high");
            }
            if (e.openEnded() && i + 1 != table.entries.size()) {
                errors.push_back(label + ": only the top range may be open-ended");
            }

            if (i == 0) continue;
            const auto& previous = table.entries[i - 1];
            if (e.rangeLow < previous.rangeHigh) {
                errors.push_back(label + ": overlaps previous range ending at " + formatBound(previous.rangeHigh));
            } else if (e.rangeLow > previous.rangeHigh) {
                errors.push_back(label + ": gap after previous range ending at " + formatBound(previous.rangeHigh));
            }
        }
    }

    return errors;
}

} // namespace StripSense
