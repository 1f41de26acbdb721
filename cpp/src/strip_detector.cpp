#include "strip_detector.hpp"

namespace StripSense {

std::string toString(ProcessingMethod method) {
    switch (method) {
        case ProcessingMethod::AI: return "ai";
        case ProcessingMethod::FAILED: return "error";
        default: return "fallback";
    }
}

ProcessingMethod parseProcessingMethod(const std::string& name) {
    if (name == "ai") return ProcessingMethod::AI;
    if (name == "error") return ProcessingMethod::FAILED;
    return ProcessingMethod::FALLBACK;
}

} // namespace StripSense
