#pragma once
#include <cstddef>
#include <string>
#include <vector>

enum class Sensitivity {
    Low,
    Medium,
    High
};

// Throws std::invalid_argument for anything but low/medium/high.
Sensitivity parseSensitivity(const std::string& value);
std::string sensitivityToString(Sensitivity s);

struct CustomPattern {
    std::string pattern;  // ECMAScript syntax; a leading (?i) means case-insensitive
    std::string name;
};

struct DetectorConfig {
    Sensitivity sensitivity = Sensitivity::Medium;
    bool checkBase64 = true;
    int quarantineThreshold = 50;           // 0..100
    size_t maxScanBytes = 1024 * 1024;      // longer input is truncated
    std::vector<CustomPattern> customPatterns;
};

// Throws std::invalid_argument when a field is out of range.
void validateDetectorConfig(const DetectorConfig& cfg);
