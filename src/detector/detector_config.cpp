#include "detector/detector_config.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>

Sensitivity parseSensitivity(const std::string& value) {
    std::string v = value;
    std::transform(v.begin(), v.end(), v.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (v == "low")    return Sensitivity::Low;
    if (v == "medium") return Sensitivity::Medium;
    if (v == "high")   return Sensitivity::High;

    throw std::invalid_argument("unknown sensitivity '" + value +
                                "' (expected low, medium or high)");
}

std::string sensitivityToString(Sensitivity s) {
    switch (s) {
    case Sensitivity::Low: return "low";
    case Sensitivity::Medium: return "medium";
    case Sensitivity::High: return "high";
    }
    return "unknown";
}

void validateDetectorConfig(const DetectorConfig& cfg) {
    if (cfg.sensitivity != Sensitivity::Low &&
        cfg.sensitivity != Sensitivity::Medium &&
        cfg.sensitivity != Sensitivity::High) {
        throw std::invalid_argument("invalid sensitivity value");
    }
    if (cfg.quarantineThreshold < 0 || cfg.quarantineThreshold > 100) {
        throw std::invalid_argument(
            "quarantine threshold must be between 0 and 100, got " +
            std::to_string(cfg.quarantineThreshold));
    }
    if (cfg.maxScanBytes == 0) {
        throw std::invalid_argument("max scan bytes must be greater than zero");
    }
}
