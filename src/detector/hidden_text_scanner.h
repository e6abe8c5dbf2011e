#pragma once
#include <string>
#include <vector>
#include "detector/pattern_registry.h"
#include "detector/scan_result.h"

// Weight and findings produced by one hidden-text check.
struct HiddenTextReport {
    int weight = 0;
    std::vector<std::string> detections;
    std::vector<HiddenTextFinding> findings;

    bool found() const { return !findings.empty(); }
};

class HiddenTextScanner {
public:
    static constexpr int kZeroWidthWeight = 15;
    static constexpr int kCommentBonus = 10;
    static constexpr size_t kSnippetChars = 100;

    static bool isZeroWidth(char32_t cp);

    // Number of maximal runs of zero-width/invisible code points.
    static size_t countZeroWidthRuns(const std::string& text);
    static std::string stripZeroWidth(const std::string& text);

    // Every complete <!-- ... --> block, delimiters included, in order.
    static std::vector<std::string> extractComments(const std::string& html);

    // Flat weight for any number of zero-width runs.
    static HiddenTextReport checkZeroWidth(const std::string& text);

    // Each comment is tested against every rule; the first rule that
    // matches scores the comment (rule weight plus kCommentBonus).
    static HiddenTextReport checkComments(const std::string& html,
                                          const PatternRegistry& registry);
};
