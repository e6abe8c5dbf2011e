#include "core/config_loader.h"
#include "core/logger.h"

#include <yaml-cpp/yaml.h>
#include <algorithm>
#include <stdexcept>

DetectorConfig AppConfig::detectorConfig() const {
    DetectorConfig d;
    d.sensitivity = parseSensitivity(sensitivity);
    d.checkBase64 = checkBase64;
    d.quarantineThreshold = quarantineThreshold;
    d.maxScanBytes = maxScanBytes;
    d.customPatterns = customPatterns;
    return d;
}

AppConfig ConfigLoader::fromNode(const YAML::Node& root) {
    AppConfig cfg;

    if (root["detector"]) {
        auto d = root["detector"];
        if (d["sensitivity"])          cfg.sensitivity = d["sensitivity"].as<std::string>();
        if (d["check_base64"])         cfg.checkBase64 = d["check_base64"].as<bool>();
        if (d["quarantine_threshold"]) cfg.quarantineThreshold = d["quarantine_threshold"].as<int>();
        if (d["max_scan_bytes"])       cfg.maxScanBytes = d["max_scan_bytes"].as<size_t>();

        if (d["custom_patterns"]) {
            for (const auto& p : d["custom_patterns"]) {
                CustomPattern cp;
                if (p["pattern"]) cp.pattern = p["pattern"].as<std::string>();
                if (p["name"])    cp.name    = p["name"].as<std::string>();
                cfg.customPatterns.push_back(cp);
            }
        }
    }

    if (root["logging"]) {
        auto l = root["logging"];
        if (l["file"])  cfg.logFile  = l["file"].as<std::string>();
        if (l["level"]) cfg.logLevel = l["level"].as<std::string>();
    }

    return cfg;
}

AppConfig ConfigLoader::loadFromFile(const std::string& path) {
    AppConfig cfg;

    try {
        cfg = fromNode(YAML::LoadFile(path));
    } catch (const std::exception& ex) {
        Logger::instance().log(
            LogLevel::Error,
            std::string("Failed to load config: ") + ex.what());
        throw;
    }

    validateConfig(cfg);
    return cfg;
}

AppConfig ConfigLoader::loadFromString(const std::string& yaml) {
    AppConfig cfg;

    try {
        cfg = fromNode(YAML::Load(yaml));
    } catch (const std::exception& ex) {
        Logger::instance().log(
            LogLevel::Error,
            std::string("Failed to parse config: ") + ex.what());
        throw;
    }

    validateConfig(cfg);
    return cfg;
}

void ConfigLoader::validateConfig(const AppConfig& cfg) {
    std::vector<std::string> errors;

    try {
        parseSensitivity(cfg.sensitivity);
    } catch (const std::invalid_argument&) {
        errors.push_back("detector.sensitivity must be one of: low, medium, high");
    }

    if (cfg.quarantineThreshold < 0 || cfg.quarantineThreshold > 100) {
        errors.push_back("detector.quarantine_threshold must be between 0-100");
    }

    if (cfg.maxScanBytes == 0) {
        errors.push_back("detector.max_scan_bytes must be greater than 0");
    }

    for (size_t i = 0; i < cfg.customPatterns.size(); ++i) {
        const auto& cp = cfg.customPatterns[i];
        const std::string where = "detector.custom_patterns[" + std::to_string(i) + "]";
        if (cp.pattern.empty()) {
            errors.push_back(where + ".pattern is required");
        }
        if (cp.name.empty()) {
            errors.push_back(where + ".name is required");
        }
    }

    // Log level validation
    std::vector<std::string> validLevels = {"debug", "info", "warn", "warning", "error"};
    if (std::find(validLevels.begin(), validLevels.end(), cfg.logLevel) == validLevels.end()) {
        errors.push_back("logging.level must be one of: debug, info, warn, error");
    }

    if (!errors.empty()) {
        std::string errorMsg = "Configuration validation failed:\n";
        for (const auto& error : errors) {
            errorMsg += "  - " + error + "\n";
        }
        Logger::instance().log(LogLevel::Error, errorMsg);
        throw std::runtime_error("Invalid configuration: " + errorMsg);
    }

    Logger::instance().log(LogLevel::Info, "Configuration validation passed");
}
