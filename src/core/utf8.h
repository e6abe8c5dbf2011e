#pragma once
#include <string>

class Utf8 {
public:
    // Decodes the code point starting at s[i] and advances i past it.
    // On an invalid or truncated sequence, advances i by one byte and
    // returns false.
    static bool next(const std::string& s, size_t& i, char32_t& cp);

    static void append(std::string& out, char32_t cp);

    // Drops every byte that is not part of a well-formed sequence.
    static std::string sanitize(const std::string& bytes);

    // First maxChars code points of s.
    static std::string truncate(const std::string& s, size_t maxChars);

    // Largest prefix length <= maxBytes that does not split a sequence.
    static size_t boundary(const std::string& s, size_t maxBytes);
};
