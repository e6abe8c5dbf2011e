#pragma once
#include <string>
#include <vector>
#include "mime_message.h"

class MimeParser {
public:
    // Lenient RFC 5322 / MIME parse; malformed input yields a best-effort
    // tree rather than an error.
    static MimeMessage parse(const std::string& raw);

    static constexpr int kMaxDepth = 16;

private:
    static void splitHeaderBlock(const std::string& data,
                                 std::string& headers,
                                 std::string& body);
    static MimeHeaderMap parseHeaders(const std::string& block);
    static MimePart parsePart(const std::string& data, int depth);
    static std::vector<std::string> splitMultipart(
        const std::string& body,
        const std::string& boundary
    );
};
