#include "ingest/email_assessment.h"
#include "core/logger.h"
#include "monitoring/metrics.h"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

std::string emailStatusToString(EmailStatus s) {
    switch (s) {
    case EmailStatus::Safe: return "safe";
    case EmailStatus::Suspicious: return "suspicious";
    case EmailStatus::Quarantined: return "quarantined";
    }
    return "unknown";
}

EmailStatus statusForThreat(ThreatLevel level) {
    switch (level) {
    case ThreatLevel::High:
    case ThreatLevel::Critical:
        return EmailStatus::Quarantined;
    case ThreatLevel::Medium:
        return EmailStatus::Suspicious;
    default:
        return EmailStatus::Safe;
    }
}

static EmailAssessment failSafe(const std::string& reason) {
    Logger::instance().log(LogLevel::Error,
        "EmailAssessment: scan failed, quarantining: " + reason);
    Metrics::instance().inc("emails_scan_errors_total");

    EmailAssessment a;
    a.status = EmailStatus::Quarantined;
    a.threatLevel = ThreatLevel::Medium;
    a.flags = {"scan_error"};
    a.scanError = true;
    return a;
}

EmailAssessment assessEmail(const IEmailScanner& scanner, const InboundEmail& email) {
    Metrics::instance().inc("emails_scanned_total");

    EmailAssessment a;
    try {
        ScanResult r = scanner.scanEmail(
            email.subject, email.bodyPlain, email.bodyHtml, email.sender);

        a.score = r.riskScore;
        a.threatLevel = threatLevelFromScore(r.riskScore);
        a.status = statusForThreat(a.threatLevel);
        a.flags.assign(r.detectedPatterns.begin(), r.detectedPatterns.end());
        a.result = std::move(r);
    } catch (const std::exception& e) {
        a = failSafe(e.what());
    }

    const std::string who = email.sender ? *email.sender : "unknown sender";
    switch (a.status) {
    case EmailStatus::Quarantined:
        Metrics::instance().inc("emails_quarantined_total");
        if (!a.scanError) {
            Logger::instance().log(LogLevel::Warn,
                "EmailAssessment: quarantined email from " + who +
                " (" + threatLevelToString(a.threatLevel) +
                ", score=" + std::to_string(a.score) + ")");
        }
        break;
    case EmailStatus::Suspicious:
        Metrics::instance().inc("emails_suspicious_total");
        Logger::instance().log(LogLevel::Info,
            "EmailAssessment: suspicious email from " + who +
            " (score=" + std::to_string(a.score) + ")");
        break;
    case EmailStatus::Safe:
        Metrics::instance().inc("emails_safe_total");
        break;
    }

    return a;
}

json toJson(const EmailAssessment& a) {
    json j = {
        {"status", emailStatusToString(a.status)},
        {"threat_level", threatLevelToString(a.threatLevel)},
        {"score", a.score},
        {"flags", a.flags},
        {"scan_error", a.scanError}
    };
    if (a.result)
        j["scan"] = toJson(*a.result);
    return j;
}
