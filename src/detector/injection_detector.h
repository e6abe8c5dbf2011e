#pragma once
#include <optional>
#include <string>
#include "detector/i_email_scanner.h"
#include "detector/risk_scorer.h"

/**
 * Prompt-injection detector for email content.
 * Configured once; every scan is a const, independent call, so a single
 * instance can serve many threads.
 */
class InjectionDetector : public IEmailScanner {
public:
    static constexpr int kSubjectBonus = 15;

    // Throws std::invalid_argument for an invalid config.
    explicit InjectionDetector(DetectorConfig config = {});

    ScanResult scan(const std::string& content,
                    const std::optional<std::string>& html = std::nullopt) const;

    // Scans "Subject: <subject>\n\n<body>" with the HTML body, then the
    // subject alone; subject hits add kSubjectBonus and are merged with a
    // "subject_" prefix.
    ScanResult scanEmail(
        const std::string& subject,
        const std::string& bodyPlain,
        const std::optional<std::string>& bodyHtml = std::nullopt,
        const std::optional<std::string>& sender = std::nullopt
    ) const override;

    const DetectorConfig& config() const { return scorer_.config(); }
    const PatternRegistry& registry() const { return scorer_.registry(); }

private:
    RiskScorer scorer_;
};
