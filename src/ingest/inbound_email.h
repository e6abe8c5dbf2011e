#pragma once
#include <optional>
#include <string>

struct InboundEmail {
    std::string subject;
    std::string bodyPlain;
    std::optional<std::string> bodyHtml;
    std::optional<std::string> sender;
};
