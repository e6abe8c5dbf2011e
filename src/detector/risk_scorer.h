#pragma once
#include <optional>
#include <string>
#include "detector/detector_config.h"
#include "detector/encoded_payload_scanner.h"
#include "detector/pattern_registry.h"
#include "detector/scan_result.h"

// Runs every sub-scanner over one piece of content and turns the summed
// weights into a bounded risk score. Holds only immutable state; scan()
// may be called concurrently.
class RiskScorer {
public:
    // Throws std::invalid_argument for an invalid config.
    explicit RiskScorer(DetectorConfig config);

    ScanResult scan(const std::string& content,
                    const std::optional<std::string>& html = std::nullopt) const;

    // Truncating multiplier: x1.3 High, x0.7 Low.
    static int applySensitivity(int score, Sensitivity sensitivity);
    static int clampScore(int score);

    bool quarantineFor(int score) const { return score >= config_.quarantineThreshold; }

    const DetectorConfig& config() const { return config_; }
    const PatternRegistry& registry() const { return registry_; }

private:
    DetectorConfig config_;
    PatternRegistry registry_;
    EncodedPayloadScanner encoded_;
};
