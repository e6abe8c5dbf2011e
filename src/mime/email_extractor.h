#pragma once
#include "mime_message.h"
#include "ingest/inbound_email.h"

class EmailExtractor {
public:
    // Subject and From (RFC 2047 decoded), the first inline text/plain part
    // and the first inline text/html part. Attachments are skipped.
    static InboundEmail extract(const MimeMessage& message);

private:
    static void collectBodies(const MimePart& part,
                              InboundEmail& email,
                              bool& havePlain);
};
