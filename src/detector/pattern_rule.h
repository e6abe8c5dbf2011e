#pragma once
#include <optional>
#include <regex>
#include <string>

enum class RuleCategory {
    DirectInjection,
    Roleplay,
    Delimiter,
    Obfuscation,
    Manipulation,
    Extraction,
    CssHiding,
    HtmlAttributeHiding,
    Custom
};

int categoryWeight(RuleCategory category);
std::string categoryToString(RuleCategory category);

// A compiled, weighted detection rule. Immutable once built; evaluation
// only reads the compiled expression, so one rule may be shared by
// concurrent scans.
class PatternRule {
public:
    // Returns nullopt (and logs) when the pattern does not compile.
    static std::optional<PatternRule> compile(const std::string& pattern,
                                              const std::string& name,
                                              RuleCategory category,
                                              bool caseInsensitive);

    const std::string& name() const { return name_; }
    const std::string& source() const { return source_; }
    int weight() const { return weight_; }
    RuleCategory category() const { return category_; }
    bool caseInsensitive() const { return icase_; }

    // Both expect text already passed through boundRepeats(). A regex
    // runtime failure is logged and reported as no match.
    bool matchesIn(const std::string& text) const;
    size_t countIn(const std::string& text) const;

    // Clamps every run of one repeated ASCII character, and every run of
    // mixed ASCII whitespace, to maxRun bytes. The matcher recurses once per
    // consumed character, so this bounds its stack depth.
    static std::string boundRepeats(const std::string& text, size_t maxRun = kMaxRepeatRun);

    static constexpr size_t kMaxRepeatRun = 64;

private:
    PatternRule(std::regex re, std::string name, std::string source,
                RuleCategory category, bool icase);

    std::regex regex_;
    std::string name_;
    std::string source_;
    RuleCategory category_;
    int weight_;
    bool icase_;
};
