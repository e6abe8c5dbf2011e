#pragma once
#include "mime_part.h"

struct MimeMessage {
    MimeHeaderMap headers;   // top-level headers, lower-cased names
    MimePart root;

    std::string header(const std::string& name) const;
};
