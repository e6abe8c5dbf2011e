#include "detector/hidden_text_scanner.h"
#include "detector/content_sanitizer.h"
#include "core/utf8.h"

bool HiddenTextScanner::isZeroWidth(char32_t cp) {
    switch (cp) {
    case 0x200B:  // zero width space
    case 0x200C:  // zero width non-joiner
    case 0x200D:  // zero width joiner
    case 0xFEFF:  // BOM / zero width no-break space
    case 0x00AD:  // soft hyphen
    case 0x034F:  // combining grapheme joiner
    case 0x061C:  // arabic letter mark
    case 0x115F:  // hangul choseong filler
    case 0x1160:  // hangul jungseong filler
    case 0x17B4:  // khmer vowel inherent aq
    case 0x17B5:  // khmer vowel inherent aa
    case 0x180E:  // mongolian vowel separator
    case 0x202F:  // narrow no-break space
    case 0x205F:  // medium mathematical space
    case 0x3000:  // ideographic space
    case 0x3164:  // hangul filler
    case 0xFFA0:  // halfwidth hangul filler
        return true;
    default:
        break;
    }
    // word joiner and invisible operators
    if (cp >= 0x2060 && cp <= 0x2064) return true;
    // en quad .. hair space
    if (cp >= 0x2000 && cp <= 0x200A) return true;
    return false;
}

size_t HiddenTextScanner::countZeroWidthRuns(const std::string& text) {
    size_t runs = 0;
    bool inRun = false;
    size_t i = 0;
    while (i < text.size()) {
        char32_t cp;
        bool hidden = Utf8::next(text, i, cp) && isZeroWidth(cp);
        if (hidden && !inRun)
            ++runs;
        inRun = hidden;
    }
    return runs;
}

std::string HiddenTextScanner::stripZeroWidth(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        size_t start = i;
        char32_t cp;
        // malformed bytes are kept as-is
        if (Utf8::next(text, i, cp) && isZeroWidth(cp))
            continue;
        out.append(text, start, i - start);
    }
    return out;
}

std::vector<std::string> HiddenTextScanner::extractComments(const std::string& html) {
    static const std::string open = "<!--";
    static const std::string close = "-->";

    std::vector<std::string> comments;
    size_t pos = 0;
    while ((pos = html.find(open, pos)) != std::string::npos) {
        size_t end = html.find(close, pos + open.size());
        if (end == std::string::npos)
            break;  // unterminated
        end += close.size();
        comments.push_back(html.substr(pos, end - pos));
        pos = end;
    }
    return comments;
}

HiddenTextReport HiddenTextScanner::checkZeroWidth(const std::string& text) {
    HiddenTextReport report;
    size_t runs = countZeroWidthRuns(text);
    if (runs == 0)
        return report;

    HiddenTextFinding f;
    f.type = "zero_width_chars";
    f.count = runs;
    report.findings.push_back(std::move(f));
    report.detections.push_back("zero_width_characters");
    report.weight = kZeroWidthWeight;
    return report;
}

static std::string eraseAll(const std::string& text, const std::string& token) {
    std::string out;
    size_t pos = 0;
    size_t hit;
    while ((hit = text.find(token, pos)) != std::string::npos) {
        out.append(text, pos, hit - pos);
        pos = hit + token.size();
    }
    out.append(text, pos, std::string::npos);
    return out;
}

static std::string stripDelimiters(const std::string& comment) {
    return eraseAll(eraseAll(comment, "<!--"), "-->");
}

HiddenTextReport HiddenTextScanner::checkComments(const std::string& html,
                                                  const PatternRegistry& registry) {
    HiddenTextReport report;

    for (const auto& comment : extractComments(html)) {
        const std::string text = PatternRule::boundRepeats(
            ContentSanitizer::foldSpaces(stripDelimiters(comment)));

        for (const auto& rule : registry.rules()) {
            if (!rule.matchesIn(text))
                continue;

            HiddenTextFinding f;
            f.type = "comment_injection";
            f.pattern = rule.name();
            f.snippet = Utf8::truncate(comment, kSnippetChars);
            report.findings.push_back(std::move(f));
            report.detections.push_back("hidden_comment_" + rule.name());
            report.weight += rule.weight() + kCommentBonus;
            break;  // one match per comment
        }
    }
    return report;
}
