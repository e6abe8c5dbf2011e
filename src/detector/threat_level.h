#pragma once
#include <string>

enum class ThreatLevel {
    None,
    Low,
    Medium,
    High,
    Critical
};

// Fixed boundaries relied on by the ingestion workflow.
inline ThreatLevel threatLevelFromScore(int score) {
    if (score >= 85) return ThreatLevel::Critical;
    if (score >= 65) return ThreatLevel::High;
    if (score >= 40) return ThreatLevel::Medium;
    if (score >= 15) return ThreatLevel::Low;
    return ThreatLevel::None;
}

inline std::string threatLevelToString(ThreatLevel t) {
    switch (t) {
    case ThreatLevel::None: return "none";
    case ThreatLevel::Low: return "low";
    case ThreatLevel::Medium: return "medium";
    case ThreatLevel::High: return "high";
    case ThreatLevel::Critical: return "critical";
    }
    return "unknown";
}
