#pragma once
#include <optional>
#include <string>
#include "detector/scan_result.h"

class IEmailScanner {
public:
    virtual ~IEmailScanner() = default;

    virtual ScanResult scanEmail(
        const std::string& subject,
        const std::string& bodyPlain,
        const std::optional<std::string>& bodyHtml = std::nullopt,
        const std::optional<std::string>& sender = std::nullopt
    ) const = 0;
};
