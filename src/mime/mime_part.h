#pragma once
#include <string>
#include <vector>
#include "mime_header.h"

struct MimePart {
    MimeHeaderMap headers;
    std::string body;                 // decoded body
    std::vector<MimePart> children;   // multipart children

    bool isMultipart() const;
    bool isAttachment() const;
    std::string contentType() const;  // lower-cased media type, no parameters
    std::string filename() const;
};
