#include "detector/injection_detector.h"
#include "core/logger.h"

#include <algorithm>

InjectionDetector::InjectionDetector(DetectorConfig config)
    : scorer_(std::move(config)) {
    Logger::instance().log(LogLevel::Info,
        "InjectionDetector: sensitivity=" + sensitivityToString(scorer_.config().sensitivity) +
        " threshold=" + std::to_string(scorer_.config().quarantineThreshold) +
        " base64=" + (scorer_.config().checkBase64 ? "on" : "off") +
        " rules=" + std::to_string(scorer_.registry().size()));
}

ScanResult InjectionDetector::scan(const std::string& content,
                                   const std::optional<std::string>& html) const {
    return scorer_.scan(content, html);
}

ScanResult InjectionDetector::scanEmail(
    const std::string& subject,
    const std::string& bodyPlain,
    const std::optional<std::string>& bodyHtml,
    const std::optional<std::string>& sender
) const {
    const std::string fullPlain = "Subject: " + subject + "\n\n" + bodyPlain;

    ScanResult result = scorer_.scan(fullPlain, bodyHtml);

    if (sender)
        result.details.sender = *sender;

    // the subject is often the first field an automated pipeline surfaces
    ScanResult subjectResult = scorer_.scan(subject);
    if (!subjectResult.detectedPatterns.empty()) {
        result.riskScore = std::min(100, result.riskScore + kSubjectBonus);
        for (const auto& p : subjectResult.detectedPatterns)
            result.detectedPatterns.insert("subject_" + p);
    }

    result.quarantineRecommended = scorer_.quarantineFor(result.riskScore);
    return result;
}
