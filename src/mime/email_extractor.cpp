#include "email_extractor.h"
#include "mime_decoder.h"

void EmailExtractor::collectBodies(const MimePart& part,
                                   InboundEmail& email,
                                   bool& havePlain) {
    if (part.isMultipart()) {
        for (const auto& child : part.children)
            collectBodies(child, email, havePlain);
        return;
    }
    if (part.isAttachment())
        return;

    const std::string type = part.contentType();
    if ((type.empty() || type == "text/plain") && !havePlain) {
        email.bodyPlain = part.body;
        havePlain = true;
    } else if (type == "text/html" && !email.bodyHtml) {
        email.bodyHtml = part.body;
    }
}

InboundEmail EmailExtractor::extract(const MimeMessage& message) {
    InboundEmail email;
    email.subject = MimeDecoder::decodeHeaderValue(message.header("subject"));

    std::string from = message.header("from");
    if (!from.empty())
        email.sender = MimeDecoder::decodeHeaderValue(from);

    bool havePlain = false;
    collectBodies(message.root, email, havePlain);
    return email;
}
