#include "detector/encoded_payload_scanner.h"
#include "detector/content_sanitizer.h"
#include "detector/pattern_rule.h"
#include "core/base64.h"
#include "core/logger.h"
#include "core/utf8.h"

namespace {

const char* const kSuspiciousPhrases[] = {
    R"(ignore\s+(?:previous|prior))",
    R"(system\s*prompt)",
    R"(you\s+are\s+now)",
    R"(new\s+instructions?)",
    R"(forget\s+(?:your|all))",
    R"(act\s+as)",
    R"(pretend)",
    R"(roleplay)",
};

bool isAlphabet(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
           (c >= '0' && c <= '9') || c == '+' || c == '/';
}

} // namespace

EncodedPayloadScanner::EncodedPayloadScanner() {
    for (const char* p : kSuspiciousPhrases) {
        try {
            phrases_.push_back({p, std::regex(p, std::regex::ECMAScript |
                                                 std::regex::icase |
                                                 std::regex::optimize)});
        } catch (const std::regex_error& e) {
            Logger::instance().log(LogLevel::Warn,
                std::string("EncodedPayloadScanner: skipping phrase ") + p + ": " + e.what());
        }
    }
}

std::vector<std::string> EncodedPayloadScanner::extractCandidates(const std::string& text,
                                                                  size_t maxCandidates) {
    std::vector<std::string> out;
    const size_t n = text.size();
    size_t i = 0;

    while (i < n) {
        if (!isAlphabet(text[i])) {
            ++i;
            continue;
        }

        size_t runEnd = i;
        while (runEnd < n && isAlphabet(text[runEnd]))
            ++runEnd;

        const size_t runLen = runEnd - i;
        const size_t groups = runLen / 4;
        if (groups < 5) {
            i = runEnd;
            continue;
        }

        size_t end = i + groups * 4;
        const size_t rest = runLen % 4;
        if (rest == 2 && end + 4 <= n && text[end + 2] == '=' && text[end + 3] == '=')
            end += 4;
        else if (rest == 3 && end + 4 <= n && text[end + 3] == '=')
            end += 4;

        if (end - i >= kMinCandidateLength) {
            if (out.size() >= maxCandidates) {
                Logger::instance().log(LogLevel::Debug,
                    "EncodedPayloadScanner: candidate limit reached");
                break;
            }
            out.push_back(text.substr(i, end - i));
        }

        // leftover alphabet chars (< 4) cannot start another candidate
        i = end < runEnd ? runEnd : end;
    }
    return out;
}

std::vector<Base64Finding> EncodedPayloadScanner::scan(const std::string& text) const {
    std::vector<Base64Finding> findings;

    for (const auto& candidate : extractCandidates(text)) {
        auto raw = base64Decode(candidate);
        if (!raw)
            continue;

        const std::string decoded = Utf8::sanitize(*raw);
        const std::string bounded = PatternRule::boundRepeats(ContentSanitizer::foldSpaces(decoded));

        for (const auto& phrase : phrases_) {
            bool hit = false;
            try {
                hit = std::regex_search(bounded, phrase.regex);
            } catch (const std::regex_error& e) {
                Logger::instance().log(LogLevel::Warn,
                    "EncodedPayloadScanner: phrase evaluation failed: " + std::string(e.what()));
            }
            if (!hit)
                continue;

            Base64Finding f;
            f.decodedSnippet = Utf8::truncate(decoded, kSnippetChars);
            f.matched = phrase.source;
            findings.push_back(std::move(f));
            break;
        }
    }
    return findings;
}
