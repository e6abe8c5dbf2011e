#include "mime_decoder.h"
#include "core/base64.h"
#include <algorithm>
#include <cctype>

static int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trimmed(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string MimeDecoder::decodeQuotedPrintable(const std::string& data, bool headerMode) {
    std::string out;
    out.reserve(data.size());

    for (size_t i = 0; i < data.size(); i++) {
        char c = data[i];

        if (headerMode && c == '_') {
            out.push_back(' ');
            continue;
        }
        if (c != '=') {
            out.push_back(c);
            continue;
        }

        // soft line break
        if (i + 1 < data.size() && data[i + 1] == '\n') {
            i += 1;
            continue;
        }
        if (i + 2 < data.size() && data[i + 1] == '\r' && data[i + 2] == '\n') {
            i += 2;
            continue;
        }

        if (i + 2 < data.size()) {
            int hi = hexValue(data[i + 1]);
            int lo = hexValue(data[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>((hi << 4) | lo));
                i += 2;
                continue;
            }
        }
        out.push_back(c);
    }
    return out;
}

std::string MimeDecoder::decodeTransferEncoding(
    const std::string& data,
    const std::string& encoding
) {
    std::string enc = toLower(trimmed(encoding));

    if (enc.empty() || enc == "7bit" || enc == "8bit" || enc == "binary") {
        return data;
    }

    if (enc == "quoted-printable") {
        return decodeQuotedPrintable(data);
    }

    if (enc == "base64") {
        auto decoded = base64Decode(data);
        return decoded ? *decoded : data;
    }

    return data;
}

std::string MimeDecoder::decodeHeaderValue(const std::string& value) {
    std::string out;
    size_t pos = 0;
    bool lastWasWord = false;

    while (pos < value.size()) {
        size_t start = value.find("=?", pos);
        if (start == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }

        size_t q1 = value.find('?', start + 2);
        size_t q2 = q1 == std::string::npos ? q1 : value.find('?', q1 + 1);
        size_t end = q2 == std::string::npos ? q2 : value.find("?=", q2 + 1);
        if (end == std::string::npos) {
            out.append(value, pos, std::string::npos);
            break;
        }

        std::string between = value.substr(pos, start - pos);
        // whitespace between adjacent encoded words is dropped
        if (!(lastWasWord && trimmed(between).empty()))
            out += between;

        std::string mode = toLower(value.substr(q1 + 1, q2 - q1 - 1));
        std::string text = value.substr(q2 + 1, end - q2 - 1);

        if (mode == "b") {
            auto decoded = base64Decode(text);
            if (decoded) {
                out += *decoded;
                lastWasWord = true;
            } else {
                out.append(value, start, end + 2 - start);
                lastWasWord = false;
            }
        } else if (mode == "q") {
            out += decodeQuotedPrintable(text, true);
            lastWasWord = true;
        } else {
            out.append(value, start, end + 2 - start);
            lastWasWord = false;
        }
        pos = end + 2;
    }
    return out;
}
