#include "detector/risk_scorer.h"
#include "detector/content_sanitizer.h"
#include "detector/hidden_text_scanner.h"
#include "core/logger.h"
#include "core/utf8.h"

#include <algorithm>

namespace {

std::string boundedInput(const std::string& text, size_t maxBytes, bool& truncated) {
    if (text.size() <= maxBytes)
        return text;
    truncated = true;
    return text.substr(0, Utf8::boundary(text, maxBytes));
}

DetectorConfig validated(DetectorConfig config) {
    validateDetectorConfig(config);
    return config;
}

} // namespace

RiskScorer::RiskScorer(DetectorConfig config)
    : config_(validated(std::move(config))),
      registry_(PatternRegistry::withBuiltins(config_.customPatterns)) {}

int RiskScorer::applySensitivity(int score, Sensitivity sensitivity) {
    switch (sensitivity) {
    case Sensitivity::High: return score * 13 / 10;
    case Sensitivity::Low:  return score * 7 / 10;
    case Sensitivity::Medium: break;
    }
    return score;
}

int RiskScorer::clampScore(int score) {
    return std::clamp(score, 0, 100);
}

ScanResult RiskScorer::scan(const std::string& content,
                            const std::optional<std::string>& html) const {
    ScanResult result;
    int score = 0;

    const bool hasHtml = html && !html->empty();

    bool truncated = false;
    const std::string plain = boundedInput(content, config_.maxScanBytes, truncated);
    std::string htmlBody;
    if (hasHtml) {
        size_t remaining = config_.maxScanBytes > plain.size()
            ? config_.maxScanBytes - plain.size() : 0;
        htmlBody = boundedInput(*html, remaining, truncated);
    }
    if (truncated) {
        result.details.inputTruncated = true;
        Logger::instance().log(LogLevel::Warn,
            "RiskScorer: input exceeds " + std::to_string(config_.maxScanBytes) +
            " bytes, scanning truncated content");
    }

    std::string buffer = plain;
    if (hasHtml) {
        buffer += "\n";
        buffer += htmlBody;
    }

    auto merge = [&](const HiddenTextReport& report) {
        if (!report.found())
            return;
        result.hiddenTextFound = true;
        score += report.weight;
        result.detectedPatterns.insert(report.detections.begin(), report.detections.end());
        result.details.hiddenText.insert(result.details.hiddenText.end(),
                                         report.findings.begin(), report.findings.end());
    };

    /* ---------- ZERO-WIDTH ---------- */
    merge(HiddenTextScanner::checkZeroWidth(buffer));

    /* ---------- HTML COMMENTS ---------- */
    if (hasHtml)
        merge(HiddenTextScanner::checkComments(htmlBody, registry_));

    /* ---------- REGISTRY RULES ---------- */
    // ECMAScript \s is ASCII-only; NBSP and friends must not split a match
    const std::string bounded = PatternRule::boundRepeats(ContentSanitizer::foldSpaces(buffer));
    for (const auto& rule : registry_.rules()) {
        size_t count = rule.countIn(bounded);
        if (count == 0)
            continue;
        result.detectedPatterns.insert(rule.name());
        result.details.injectionPatterns.push_back({rule.name(), count, rule.weight()});
        score += rule.weight();
    }

    /* ---------- BASE64 PAYLOADS ---------- */
    if (config_.checkBase64) {
        auto findings = encoded_.scan(buffer);
        for (const auto& f : findings) {
            result.detectedPatterns.insert("base64_" + f.pattern);
            score += EncodedPayloadScanner::kFindingWeight;
        }
        result.details.base64Suspicious = std::move(findings);
    }

    score = clampScore(applySensitivity(score, config_.sensitivity));

    result.riskScore = score;
    result.quarantineRecommended = quarantineFor(score);
    result.cleanContent = ContentSanitizer::sanitize(
        plain, hasHtml ? std::optional<std::string>(htmlBody) : std::nullopt);

    if (Logger::instance().enabled(LogLevel::Debug)) {
        Logger::instance().log(LogLevel::Debug,
            "RiskScorer: score=" + std::to_string(score) +
            " patterns=" + std::to_string(result.detectedPatterns.size()) +
            " hidden=" + (result.hiddenTextFound ? "yes" : "no"));
    }
    return result;
}
