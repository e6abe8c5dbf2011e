#pragma once
#include <string>

class MimeDecoder {
public:
    static std::string decodeTransferEncoding(
        const std::string& data,
        const std::string& encoding
    );

    static std::string decodeQuotedPrintable(const std::string& data, bool headerMode = false);

    // RFC 2047 encoded words (=?charset?B|Q?text?=). The charset is not
    // converted; words that fail to decode are left as-is.
    static std::string decodeHeaderValue(const std::string& value);
};
