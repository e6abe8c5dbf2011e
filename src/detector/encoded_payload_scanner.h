#pragma once
#include <regex>
#include <string>
#include <vector>
#include "detector/scan_result.h"

// Finds Base64 runs, decodes them and looks for injection phrases in the
// decoded text.
class EncodedPayloadScanner {
public:
    static constexpr int kFindingWeight = 35;
    static constexpr size_t kMinCandidateLength = 20;
    static constexpr size_t kMaxCandidates = 256;
    static constexpr size_t kSnippetChars = 100;

    EncodedPayloadScanner();

    // Runs of the Base64 alphabet taken in groups of four (at least five
    // groups) plus an optional "XX==" or "XXX=" padding block.
    static std::vector<std::string> extractCandidates(const std::string& text,
                                                      size_t maxCandidates = kMaxCandidates);

    // One finding per candidate whose decoded text matches a phrase.
    std::vector<Base64Finding> scan(const std::string& text) const;

    size_t phraseCount() const { return phrases_.size(); }

private:
    struct Phrase {
        std::string source;
        std::regex regex;
    };
    std::vector<Phrase> phrases_;
};
