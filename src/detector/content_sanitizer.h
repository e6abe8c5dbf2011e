#pragma once
#include <optional>
#include <string>

// Best-effort plain rendition of an email body with invisible characters,
// markup and repeated delimiters removed. Pattern based; never throws on
// malformed HTML.
class ContentSanitizer {
public:
    static std::string sanitize(const std::string& content,
                                const std::optional<std::string>& html = std::nullopt);

    // Comments removed, tags replaced by a space, entities decoded,
    // whitespace collapsed, invisible characters stripped, trimmed.
    static std::string htmlToText(const std::string& html);

    static std::string removeComments(const std::string& html);
    static std::string stripTags(const std::string& html);
    static std::string decodeEntities(const std::string& text);
    static std::string collapseWhitespace(const std::string& text);

    // "---+" -> "---", "```+" -> "```"
    static std::string collapseDelimiters(const std::string& text);
    static std::string trim(const std::string& text);
    // Every Unicode space (see isSpace) replaced by ' '; everything else,
    // malformed bytes included, is kept.
    static std::string foldSpaces(const std::string& text);

    static bool isSpace(char32_t cp);
};
