#pragma once
#include <string>
#include <vector>
#include "detector/pattern_rule.h"

struct CatalogRule {
    RuleCategory category;
    std::string pattern;
    std::string name;
    bool caseInsensitive;
};

// Built-in detection rules in evaluation order. Every repetition is bounded
// (whitespace {0,64}/{1,64}, wildcards {0,256}/{1,512}) to match the run
// limit applied by PatternRule::boundRepeats; trailing open repetitions are
// reduced to a single element, since only presence and match counts are
// needed.
const std::vector<CatalogRule>& builtinRules();
