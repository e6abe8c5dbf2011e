#include "detector/pattern_registry.h"
#include "core/logger.h"

#include <algorithm>

namespace {

// A custom pattern may carry a leading (?i); ECMAScript has no inline
// flags, so it becomes the icase compile flag.
bool takeInlineCaseFlag(std::string& pattern) {
    static const std::string flag = "(?i)";
    if (pattern.compare(0, flag.size(), flag) == 0) {
        pattern.erase(0, flag.size());
        return true;
    }
    return false;
}

} // namespace

PatternRegistry::PatternRegistry(const std::vector<CatalogRule>& builtins,
                                 const std::vector<CustomPattern>& custom) {
    rules_.reserve(builtins.size() + custom.size());

    for (const auto& raw : builtins) {
        auto rule = PatternRule::compile(raw.pattern, raw.name, raw.category,
                                         raw.caseInsensitive);
        if (rule)
            rules_.push_back(std::move(*rule));
        else
            skipped_.push_back(raw.name);
    }

    for (const auto& cp : custom) {
        std::string pattern = cp.pattern;
        bool icase = takeInlineCaseFlag(pattern);

        auto rule = PatternRule::compile(pattern, cp.name, RuleCategory::Custom, icase);
        if (rule)
            rules_.push_back(std::move(*rule));
        else
            skipped_.push_back(cp.name);
    }

    Logger::instance().log(LogLevel::Info,
        "PatternRegistry: " + std::to_string(rules_.size()) + " rules compiled, " +
        std::to_string(skipped_.size()) + " skipped");
}

PatternRegistry PatternRegistry::withBuiltins(const std::vector<CustomPattern>& custom) {
    return PatternRegistry(builtinRules(), custom);
}

bool PatternRegistry::contains(const std::string& name) const {
    return std::any_of(rules_.begin(), rules_.end(),
                       [&](const PatternRule& r) { return r.name() == name; });
}
