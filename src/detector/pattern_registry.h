#pragma once
#include <string>
#include <vector>
#include "detector/detector_config.h"
#include "detector/pattern_catalog.h"
#include "detector/pattern_rule.h"

// Ordered, immutable set of compiled rules: the catalog followed by any
// custom patterns. Rules that fail to compile are dropped; construction
// never throws because of a bad pattern.
class PatternRegistry {
public:
    PatternRegistry(const std::vector<CatalogRule>& builtins,
                    const std::vector<CustomPattern>& custom);

    // Registry built from builtinRules() plus custom patterns.
    static PatternRegistry withBuiltins(const std::vector<CustomPattern>& custom = {});

    const std::vector<PatternRule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

    const std::vector<std::string>& skipped() const { return skipped_; }
    bool contains(const std::string& name) const;

private:
    std::vector<PatternRule> rules_;
    std::vector<std::string> skipped_;
};
