#include "mime_parser.h"
#include "mime_decoder.h"
#include <sstream>
#include <algorithm>
#include <cctype>

static std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    if (b == std::string::npos) return "";
    auto e = s.find_last_not_of(" \t\r\n");
    return s.substr(b, e - b + 1);
}

std::string headerParam(const std::string& headerValue, const std::string& key) {
    const std::string lower = toLower(headerValue);
    const std::string needle = toLower(key) + "=";

    size_t pos = 0;
    while ((pos = lower.find(needle, pos)) != std::string::npos) {
        // must start a parameter, not end another one ("xboundary=")
        if (pos == 0 || lower[pos - 1] == ';' || std::isspace(static_cast<unsigned char>(lower[pos - 1])))
            break;
        pos += needle.size();
    }
    if (pos == std::string::npos) return "";

    pos += needle.size();
    if (pos < headerValue.size() && headerValue[pos] == '"') {
        auto end = headerValue.find('"', pos + 1);
        if (end == std::string::npos) return headerValue.substr(pos + 1);
        return headerValue.substr(pos + 1, end - pos - 1);
    }
    auto end = headerValue.find(';', pos);
    return trim(headerValue.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
}

std::string MimeMessage::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it == headers.end() ? "" : it->second;
}

bool MimePart::isMultipart() const {
    return contentType().compare(0, 10, "multipart/") == 0;
}

bool MimePart::isAttachment() const {
    auto it = headers.find("content-disposition");
    if (it != headers.end() && toLower(trim(it->second)).compare(0, 10, "attachment") == 0)
        return true;
    return !filename().empty();
}

std::string MimePart::contentType() const {
    auto it = headers.find("content-type");
    if (it == headers.end()) return "";
    std::string value = it->second;
    auto semi = value.find(';');
    if (semi != std::string::npos) value = value.substr(0, semi);
    return toLower(trim(value));
}

std::string MimePart::filename() const {
    auto it = headers.find("content-disposition");
    if (it != headers.end()) {
        std::string name = headerParam(it->second, "filename");
        if (!name.empty()) return name;
    }
    it = headers.find("content-type");
    return it == headers.end() ? "" : headerParam(it->second, "name");
}

void MimeParser::splitHeaderBlock(const std::string& data,
                                  std::string& headers,
                                  std::string& body) {
    // part without headers
    if (data.compare(0, 2, "\r\n") == 0 || data.compare(0, 1, "\n") == 0) {
        headers.clear();
        body = data.substr(data[0] == '\r' ? 2 : 1);
        return;
    }

    size_t crlf = data.find("\r\n\r\n");
    size_t lf = data.find("\n\n");

    size_t split = std::string::npos;
    size_t sepLen = 0;
    if (crlf != std::string::npos && (lf == std::string::npos || crlf < lf)) {
        split = crlf;
        sepLen = 4;
    } else if (lf != std::string::npos) {
        split = lf;
        sepLen = 2;
    }

    if (split == std::string::npos) {
        headers = data;
        body.clear();
        return;
    }
    headers = data.substr(0, split);
    body = data.substr(split + sepLen);
}

MimeHeaderMap MimeParser::parseHeaders(const std::string& block) {
    MimeHeaderMap headers;
    std::istringstream iss(block);
    std::string line, lastKey;

    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        if (line[0] == ' ' || line[0] == '\t') {
            if (!lastKey.empty())
                headers[lastKey] += " " + trim(line);
            continue;
        }

        auto pos = line.find(':');
        if (pos == std::string::npos) {
            lastKey.clear();
            continue;
        }

        std::string key = toLower(trim(line.substr(0, pos)));
        // first occurrence wins; later duplicates are ignored
        auto inserted = headers.emplace(key, trim(line.substr(pos + 1)));
        lastKey = inserted.second ? key : std::string();
    }

    return headers;
}

std::vector<std::string> MimeParser::splitMultipart(
    const std::string& body,
    const std::string& boundary
) {
    std::vector<std::string> parts;
    const std::string delim = "--" + boundary;

    size_t pos = body.find(delim);
    while (pos != std::string::npos) {
        size_t after = pos + delim.size();
        if (body.compare(after, 2, "--") == 0)
            break;  // closing delimiter

        size_t start = body.find('\n', after);
        if (start == std::string::npos) break;
        ++start;

        size_t next = body.find(delim, start);
        size_t end = next == std::string::npos ? body.size() : next;

        // the line break before a delimiter belongs to the delimiter
        if (end > start && body[end - 1] == '\n') --end;
        if (end > start && body[end - 1] == '\r') --end;

        parts.push_back(body.substr(start, end - start));
        pos = next;
    }
    return parts;
}

MimePart MimeParser::parsePart(const std::string& data, int depth) {
    MimePart part;

    std::string headerBlock, body;
    splitHeaderBlock(data, headerBlock, body);
    part.headers = parseHeaders(headerBlock);

    if (part.isMultipart() && depth < kMaxDepth) {
        std::string boundary = headerParam(part.headers["content-type"], "boundary");
        if (!boundary.empty()) {
            for (const auto& child : splitMultipart(body, boundary))
                part.children.push_back(parsePart(child, depth + 1));
            return part;
        }
    }

    auto encIt = part.headers.find("content-transfer-encoding");
    std::string encoding = encIt == part.headers.end() ? "7bit" : encIt->second;
    part.body = MimeDecoder::decodeTransferEncoding(body, encoding);
    return part;
}

MimeMessage MimeParser::parse(const std::string& raw) {
    MimeMessage msg;
    msg.root = parsePart(raw, 0);
    msg.headers = msg.root.headers;
    return msg;
}
