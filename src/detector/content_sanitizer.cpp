#include "detector/content_sanitizer.h"
#include "detector/hidden_text_scanner.h"
#include "core/utf8.h"

#include <cstdlib>
#include <unordered_map>

namespace {

const std::unordered_map<std::string, char32_t>& namedEntities() {
    static const std::unordered_map<std::string, char32_t> table = {
        {"amp", '&'}, {"lt", '<'}, {"gt", '>'}, {"quot", '"'}, {"apos", '\''},
        {"nbsp", 0x00A0}, {"shy", 0x00AD}, {"copy", 0x00A9}, {"reg", 0x00AE},
        {"trade", 0x2122}, {"hellip", 0x2026}, {"mdash", 0x2014}, {"ndash", 0x2013},
        {"lsquo", 0x2018}, {"rsquo", 0x2019}, {"ldquo", 0x201C}, {"rdquo", 0x201D},
        {"laquo", 0x00AB}, {"raquo", 0x00BB}, {"bull", 0x2022}, {"middot", 0x00B7},
        {"euro", 0x20AC}, {"pound", 0x00A3}, {"yen", 0x00A5}, {"cent", 0x00A2},
        {"sect", 0x00A7}, {"para", 0x00B6}, {"deg", 0x00B0}, {"times", 0x00D7},
        {"divide", 0x00F7}, {"zwsp", 0x200B}, {"zwnj", 0x200C}, {"zwj", 0x200D},
        {"lrm", 0x200E}, {"rlm", 0x200F}, {"ensp", 0x2002}, {"emsp", 0x2003},
        {"thinsp", 0x2009}, {"iexcl", 0x00A1}, {"iquest", 0x00BF},
    };
    return table;
}

// Replacements for numeric references that are not valid scalar values.
char32_t sanitizeNumericReference(unsigned long value) {
    if (value == 0 || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF))
        return 0xFFFD;
    return static_cast<char32_t>(value);
}

bool isAsciiAlnum(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
}

bool isHexDigit(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

std::string collapseRun(const std::string& text, char ch) {
    std::string out;
    out.reserve(text.size());
    size_t run = 0;
    for (char c : text) {
        run = (c == ch) ? run + 1 : 0;
        if (run > 3)
            continue;
        out.push_back(c);
    }
    return out;
}

} // namespace

bool ContentSanitizer::isSpace(char32_t cp) {
    switch (cp) {
    case ' ': case '\t': case '\n': case '\r': case '\v': case '\f':
    case 0x1C: case 0x1D: case 0x1E: case 0x1F:
    case 0x85: case 0xA0: case 0x1680:
    case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

std::string ContentSanitizer::removeComments(const std::string& html) {
    std::string out;
    size_t pos = 0;
    while (true) {
        size_t start = html.find("<!--", pos);
        if (start == std::string::npos)
            break;
        size_t end = html.find("-->", start + 4);
        if (end == std::string::npos)
            break;  // unterminated: leave for tag stripping
        out.append(html, pos, start - pos);
        pos = end + 3;
    }
    out.append(html, pos, std::string::npos);
    return out;
}

std::string ContentSanitizer::stripTags(const std::string& html) {
    std::string out;
    out.reserve(html.size());
    size_t i = 0;
    while (i < html.size()) {
        if (html[i] == '<') {
            size_t close = html.find('>', i + 1);
            // "<>" and an unclosed '<' are text
            if (close != std::string::npos && close > i + 1) {
                out.push_back(' ');
                i = close + 1;
                continue;
            }
        }
        out.push_back(html[i]);
        ++i;
    }
    return out;
}

std::string ContentSanitizer::decodeEntities(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;

    while (i < text.size()) {
        if (text[i] != '&') {
            out.push_back(text[i++]);
            continue;
        }

        // numeric: &#123; &#x1F; (terminating ';' optional)
        if (i + 2 < text.size() && text[i + 1] == '#') {
            size_t j = i + 2;
            bool hex = false;
            if (text[j] == 'x' || text[j] == 'X') {
                hex = true;
                ++j;
            }
            size_t digitsStart = j;
            while (j < text.size() && j - digitsStart < 8 &&
                   (hex ? isHexDigit(text[j]) : (text[j] >= '0' && text[j] <= '9')))
                ++j;

            if (j > digitsStart) {
                unsigned long value = std::strtoul(
                    text.substr(digitsStart, j - digitsStart).c_str(), nullptr, hex ? 16 : 10);
                Utf8::append(out, sanitizeNumericReference(value));
                if (j < text.size() && text[j] == ';')
                    ++j;
                i = j;
                continue;
            }
        }

        // named: &name;
        size_t j = i + 1;
        while (j < text.size() && j - i <= 32 && isAsciiAlnum(text[j]))
            ++j;
        if (j < text.size() && text[j] == ';' && j > i + 1) {
            auto it = namedEntities().find(text.substr(i + 1, j - i - 1));
            if (it != namedEntities().end()) {
                Utf8::append(out, it->second);
                i = j + 1;
                continue;
            }
        }

        out.push_back(text[i++]);
    }
    return out;
}

std::string ContentSanitizer::collapseWhitespace(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pendingSpace = false;
    size_t i = 0;
    while (i < text.size()) {
        size_t start = i;
        char32_t cp;
        bool valid = Utf8::next(text, i, cp);
        if (valid && isSpace(cp)) {
            pendingSpace = true;
            continue;
        }
        if (pendingSpace) {
            out.push_back(' ');
            pendingSpace = false;
        }
        out.append(text, start, i - start);
    }
    if (pendingSpace)
        out.push_back(' ');
    return out;
}

std::string ContentSanitizer::collapseDelimiters(const std::string& text) {
    return collapseRun(collapseRun(text, '-'), '`');
}

std::string ContentSanitizer::trim(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();

    size_t i = 0;
    while (i < text.size()) {
        size_t start = i;
        char32_t cp;
        if (!Utf8::next(text, i, cp) || !isSpace(cp)) {
            begin = start;
            break;
        }
        begin = i;
    }

    // walk back over trailing spaces one code point at a time
    while (end > begin) {
        size_t lead = end - 1;
        while (lead > begin && (static_cast<unsigned char>(text[lead]) & 0xC0) == 0x80)
            --lead;
        size_t k = lead;
        char32_t cp;
        if (!Utf8::next(text, k, cp) || k != end || !isSpace(cp))
            break;
        end = lead;
    }
    return text.substr(begin, end - begin);
}

std::string ContentSanitizer::foldSpaces(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    size_t i = 0;
    while (i < text.size()) {
        size_t start = i;
        char32_t cp;
        if (Utf8::next(text, i, cp) && cp >= 0x80 && isSpace(cp))
            out.push_back(' ');
        else
            out.append(text, start, i - start);
    }
    return out;
}

std::string ContentSanitizer::htmlToText(const std::string& html) {
    std::string text = removeComments(html);
    text = stripTags(text);
    text = decodeEntities(text);
    // Unicode spaces become ' ' first; the remaining invisibles are dropped
    text = collapseWhitespace(text);
    text = HiddenTextScanner::stripZeroWidth(text);
    return trim(text);
}

std::string ContentSanitizer::sanitize(const std::string& content,
                                       const std::optional<std::string>& html) {
    std::string sanitized = HiddenTextScanner::stripZeroWidth(content);

    if (html && !html->empty()) {
        std::string fromHtml = htmlToText(*html);
        if (!fromHtml.empty())
            sanitized = std::move(fromHtml);
    }

    sanitized = collapseDelimiters(sanitized);
    return trim(sanitized);
}
