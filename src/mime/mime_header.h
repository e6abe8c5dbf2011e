#pragma once
#include <string>
#include <map>

using MimeHeaderMap = std::map<std::string, std::string>;

// Value of a "key=value" parameter in a structured header, unquoted.
std::string headerParam(const std::string& headerValue, const std::string& key);
