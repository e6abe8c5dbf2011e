#include "detector/scan_result.h"

#include <algorithm>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

bool ScanResult::hasPattern(const std::string& name) const {
    return detectedPatterns.count(name) != 0;
}

bool ScanResult::hasPatternWithPrefix(const std::string& prefix) const {
    return std::any_of(detectedPatterns.begin(), detectedPatterns.end(),
                       [&](const std::string& p) { return p.compare(0, prefix.size(), prefix) == 0; });
}

json toJson(const ScanResult& r) {
    json hidden = json::array();
    for (const auto& f : r.details.hiddenText) {
        json h = {{"type", f.type}};
        if (f.type == "zero_width_chars") {
            h["count"] = f.count;
        } else {
            h["pattern"] = f.pattern;
            h["snippet"] = f.snippet;
        }
        hidden.push_back(std::move(h));
    }

    json b64 = json::array();
    for (const auto& f : r.details.base64Suspicious) {
        b64.push_back({
            {"pattern", f.pattern},
            {"decoded_snippet", f.decodedSnippet},
            {"matched", f.matched}
        });
    }

    json patterns = json::array();
    for (const auto& m : r.details.injectionPatterns) {
        patterns.push_back({
            {"pattern", m.pattern},
            {"count", m.count},
            {"weight", m.weight}
        });
    }

    json details = {
        {"hidden_text", hidden},
        {"base64_suspicious", b64},
        {"injection_patterns", patterns}
    };
    if (r.details.sender)
        details["sender"] = *r.details.sender;
    if (r.details.inputTruncated)
        details["input_truncated"] = true;

    return {
        {"risk_score", r.riskScore},
        {"detected_patterns", r.detectedPatterns},
        {"hidden_text_found", r.hiddenTextFound},
        {"clean_content", r.cleanContent},
        {"quarantine_recommended", r.quarantineRecommended},
        {"details", details}
    };
}
