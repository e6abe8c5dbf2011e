#pragma once
#include <optional>
#include <string>

// Decodes standard (RFC 4648) Base64. Characters outside the alphabet are
// ignored; returns nullopt when the remaining input is not valid Base64.
std::optional<std::string> base64Decode(const std::string& input);

std::string base64Encode(const std::string& input);
