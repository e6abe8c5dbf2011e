#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

#include "detector/i_email_scanner.h"
#include "detector/scan_result.h"
#include "detector/threat_level.h"
#include "ingest/inbound_email.h"

enum class EmailStatus {
    Safe,
    Suspicious,
    Quarantined
};

std::string emailStatusToString(EmailStatus s);

// High/Critical -> Quarantined, Medium -> Suspicious, otherwise Safe.
EmailStatus statusForThreat(ThreatLevel level);

struct EmailAssessment {
    EmailStatus status = EmailStatus::Safe;
    ThreatLevel threatLevel = ThreatLevel::None;
    int score = 0;
    std::vector<std::string> flags;      // sorted, unique
    bool scanError = false;
    std::optional<ScanResult> result;    // absent when the scan failed
};

// Scans one inbound email and maps the result onto the review workflow.
// Never throws for a failing scan: the email is quarantined with a
// "scan_error" flag instead.
EmailAssessment assessEmail(const IEmailScanner& scanner, const InboundEmail& email);

nlohmann::json toJson(const EmailAssessment& a);
