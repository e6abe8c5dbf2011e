#include "core/utf8.h"

bool Utf8::next(const std::string& s, size_t& i, char32_t& cp) {
    const auto lead = static_cast<unsigned char>(s[i]);

    if (lead < 0x80) {
        cp = lead;
        ++i;
        return true;
    }

    size_t len = 0;
    char32_t min = 0;
    if ((lead & 0xE0) == 0xC0) { len = 2; cp = lead & 0x1F; min = 0x80; }
    else if ((lead & 0xF0) == 0xE0) { len = 3; cp = lead & 0x0F; min = 0x800; }
    else if ((lead & 0xF8) == 0xF0) { len = 4; cp = lead & 0x07; min = 0x10000; }
    else {
        ++i;
        return false;
    }

    if (i + len > s.size()) {
        ++i;
        return false;
    }

    for (size_t k = 1; k < len; ++k) {
        const auto c = static_cast<unsigned char>(s[i + k]);
        if ((c & 0xC0) != 0x80) {
            ++i;
            return false;
        }
        cp = (cp << 6) | (c & 0x3F);
    }

    // overlong, surrogate or out of range
    if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        ++i;
        return false;
    }

    i += len;
    return true;
}

void Utf8::append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

std::string Utf8::sanitize(const std::string& bytes) {
    std::string out;
    out.reserve(bytes.size());
    size_t i = 0;
    while (i < bytes.size()) {
        size_t start = i;
        char32_t cp;
        if (next(bytes, i, cp))
            out.append(bytes, start, i - start);
    }
    return out;
}

std::string Utf8::truncate(const std::string& s, size_t maxChars) {
    size_t i = 0;
    size_t count = 0;
    while (i < s.size() && count < maxChars) {
        char32_t cp;
        next(s, i, cp);
        ++count;
    }
    return s.substr(0, i);
}

size_t Utf8::boundary(const std::string& s, size_t maxBytes) {
    if (maxBytes >= s.size()) return s.size();
    size_t end = maxBytes;
    // back off continuation bytes so the cut lands before a lead byte
    while (end > 0 && (static_cast<unsigned char>(s[end]) & 0xC0) == 0x80)
        --end;
    return end;
}
