#include "detector/pattern_rule.h"
#include "core/logger.h"

int categoryWeight(RuleCategory category) {
    switch (category) {
    case RuleCategory::DirectInjection:     return 40;
    case RuleCategory::Roleplay:            return 30;
    case RuleCategory::Delimiter:           return 35;
    case RuleCategory::Obfuscation:         return 35;
    case RuleCategory::Manipulation:        return 25;
    case RuleCategory::Extraction:          return 30;
    case RuleCategory::CssHiding:           return 20;
    case RuleCategory::HtmlAttributeHiding: return 25;
    case RuleCategory::Custom:              return 30;
    }
    return 0;
}

std::string categoryToString(RuleCategory category) {
    switch (category) {
    case RuleCategory::DirectInjection:     return "direct_injection";
    case RuleCategory::Roleplay:            return "roleplay";
    case RuleCategory::Delimiter:           return "delimiter";
    case RuleCategory::Obfuscation:         return "obfuscation";
    case RuleCategory::Manipulation:        return "manipulation";
    case RuleCategory::Extraction:          return "extraction";
    case RuleCategory::CssHiding:           return "css_hiding";
    case RuleCategory::HtmlAttributeHiding: return "html_attribute_hiding";
    case RuleCategory::Custom:              return "custom";
    }
    return "unknown";
}

PatternRule::PatternRule(std::regex re, std::string name, std::string source,
                         RuleCategory category, bool icase)
    : regex_(std::move(re)),
      name_(std::move(name)),
      source_(std::move(source)),
      category_(category),
      weight_(categoryWeight(category)),
      icase_(icase) {}

std::optional<PatternRule> PatternRule::compile(const std::string& pattern,
                                                const std::string& name,
                                                RuleCategory category,
                                                bool caseInsensitive) {
    if (name.empty()) {
        Logger::instance().log(LogLevel::Warn,
            "PatternRule: skipping unnamed " + categoryToString(category) + " pattern");
        return std::nullopt;
    }

    auto flags = std::regex::ECMAScript | std::regex::optimize;
    if (caseInsensitive)
        flags |= std::regex::icase;

    try {
        std::regex re(pattern, flags);
        return PatternRule(std::move(re), name, pattern, category, caseInsensitive);
    } catch (const std::regex_error& e) {
        Logger::instance().log(LogLevel::Warn,
            "PatternRule: skipping '" + name + "' (" + categoryToString(category) +
            "): " + e.what());
        return std::nullopt;
    }
}

bool PatternRule::matchesIn(const std::string& text) const {
    try {
        return std::regex_search(text, regex_);
    } catch (const std::regex_error& e) {
        Logger::instance().log(LogLevel::Warn,
            "PatternRule: evaluation of '" + name_ + "' failed: " + e.what());
        return false;
    }
}

size_t PatternRule::countIn(const std::string& text) const {
    try {
        auto begin = std::sregex_iterator(text.begin(), text.end(), regex_);
        return static_cast<size_t>(std::distance(begin, std::sregex_iterator()));
    } catch (const std::regex_error& e) {
        Logger::instance().log(LogLevel::Warn,
            "PatternRule: evaluation of '" + name_ + "' failed: " + e.what());
        return 0;
    }
}

static bool isAsciiSpace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

std::string PatternRule::boundRepeats(const std::string& text, size_t maxRun) {
    std::string out;
    out.reserve(text.size());

    size_t run = 0;        // same ASCII character
    size_t spaceRun = 0;   // any mix of ASCII whitespace
    char prev = '\0';
    for (char c : text) {
        const bool ascii = static_cast<unsigned char>(c) < 0x80;
        run = (ascii && run > 0 && c == prev) ? run + 1 : 1;
        spaceRun = isAsciiSpace(c) ? spaceRun + 1 : 0;
        prev = c;

        if (ascii && (run > maxRun || spaceRun > maxRun))
            continue;
        out.push_back(c);
    }
    return out;
}
