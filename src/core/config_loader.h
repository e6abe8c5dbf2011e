#pragma once

#include <cstddef>
#include <string>
#include <vector>
#include "detector/detector_config.h"

namespace YAML { class Node; }

struct AppConfig {
    // detector
    std::string sensitivity = "medium";
    bool checkBase64 = true;
    int quarantineThreshold = 50;
    size_t maxScanBytes = 1048576;
    std::vector<CustomPattern> customPatterns;

    // logging
    std::string logFile;            // empty: stderr
    std::string logLevel = "info";

    // Throws std::invalid_argument for an unknown sensitivity.
    DetectorConfig detectorConfig() const;
};

class ConfigLoader {
public:
    static AppConfig loadFromFile(const std::string& path);
    static AppConfig loadFromString(const std::string& yaml);
    static void validateConfig(const AppConfig& cfg);

private:
    static AppConfig fromNode(const YAML::Node& root);
};
