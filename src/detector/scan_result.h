#pragma once
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

struct HiddenTextFinding {
    std::string type;        // zero_width_chars | comment_injection
    size_t count = 0;        // zero_width_chars only
    std::string pattern;     // comment_injection only
    std::string snippet;     // comment_injection only
};

struct Base64Finding {
    std::string pattern = "encoded_injection";
    std::string decodedSnippet;
    std::string matched;
};

struct PatternMatch {
    std::string pattern;
    size_t count = 0;
    int weight = 0;
};

struct ScanDetails {
    std::vector<HiddenTextFinding> hiddenText;
    std::vector<Base64Finding> base64Suspicious;
    std::vector<PatternMatch> injectionPatterns;
    std::optional<std::string> sender;
    bool inputTruncated = false;
};

struct ScanResult {
    int riskScore = 0;                       // 0..100
    std::set<std::string> detectedPatterns;
    bool hiddenTextFound = false;
    std::string cleanContent;
    bool quarantineRecommended = false;      // riskScore >= threshold
    ScanDetails details;

    bool hasPattern(const std::string& name) const;
    bool hasPatternWithPrefix(const std::string& prefix) const;
};

nlohmann::json toJson(const ScanResult& r);
